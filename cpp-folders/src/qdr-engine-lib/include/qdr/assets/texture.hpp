#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: texture.hpp
    МОДУЛЬ: assets
    ЗОРИЛГО: GPU дээр байрлах 2D texture asset, түүний UV тэгш өнцөгт болон
            sprite sheet-ийн UV grid.
*/


#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "qdr/core/result.hpp"
#include "qdr/rhi/core/gpu_backend.hpp"

namespace qdr
{
    // Эзэмшихгүй RGBA8 пикселийн харагдац. pixels.size() == width * height * 4.
    struct RawRgbaImageData
    {
        std::span<const uint8_t> pixels{};
        uint32_t width = 0;
        uint32_t height = 0;
    };

    // Decoder-ийн буцаадаг эзэмшигч RGBA8 зураг.
    struct RgbaImage
    {
        std::vector<uint8_t> pixels{};
        uint32_t width = 0;
        uint32_t height = 0;

        bool valid() const
        {
            return width > 0 && height > 0 && pixels.size() == (size_t)width * (size_t)height * 4u;
        }

        RawRgbaImageData view() const
        {
            return RawRgbaImageData{std::span<const uint8_t>(pixels.data(), pixels.size()), width, height};
        }
    };

    struct Texture2DCoordinates
    {
        glm::vec2 size{1.0f, 1.0f};
        glm::vec2 offset{0.0f, 0.0f};

        Texture2DCoordinates() = default;
        Texture2DCoordinates(glm::vec2 size_, glm::vec2 offset_) : size(size_), offset(offset_) {}

        // size = (right, bottom), offset = (left, top)
        Texture2DCoordinates(float top, float left, float bottom, float right)
            : size(right, bottom), offset(left, top)
        {}
    };

    class Texture2D
    {
    public:
        Texture2D() = default;

        static Result<Texture2D> from_memory(
            IGpuBackend& backend,
            const std::string& label,
            std::span<const uint8_t> pixels,
            uint32_t width,
            uint32_t height)
        {
            if (width == 0 || height == 0)
            {
                return Result<Texture2D>::failure(ErrorKind::InvalidSource,
                    "texture '" + label + "' has zero extent");
            }
            const size_t expected = (size_t)width * (size_t)height * 4u;
            if (pixels.size() != expected)
            {
                return Result<Texture2D>::failure(ErrorKind::InvalidSource,
                    "texture '" + label + "' expects " + std::to_string(expected) +
                    " bytes, got " + std::to_string(pixels.size()));
            }

            RHITextureDesc tdesc{};
            tdesc.width = width;
            tdesc.height = height;
            tdesc.format = RHIFormat::RGBA8_UNorm;
            tdesc.label = label.c_str();

            Texture2D out{};
            out.label_ = label;
            out.width_ = width;
            out.height_ = height;
            out.texture_ = backend.create_texture(tdesc, pixels);
            if (out.texture_ == kNullRHIHandle)
            {
                return Result<Texture2D>::failure(ErrorKind::BackendFailure,
                    "backend could not create texture '" + label + "'");
            }

            RHISamplerDesc sdesc{};
            sdesc.address_u = RHIAddressMode::ClampToEdge;
            sdesc.address_v = RHIAddressMode::ClampToEdge;
            sdesc.mag_filter = RHIFilter::Linear;
            sdesc.min_filter = RHIFilter::Nearest;
            out.sampler_ = backend.create_sampler(sdesc);
            if (out.sampler_ == kNullRHIHandle)
            {
                backend.destroy_texture(out.texture_);
                return Result<Texture2D>::failure(ErrorKind::BackendFailure,
                    "backend could not create sampler for texture '" + label + "'");
            }
            out.bind_group_ = backend.create_texture_bind_group(out.texture_, out.sampler_);
            if (out.bind_group_ == kNullRHIHandle)
            {
                backend.destroy_sampler(out.sampler_);
                backend.destroy_texture(out.texture_);
                return Result<Texture2D>::failure(ErrorKind::BackendFailure,
                    "backend could not create bind group for texture '" + label + "'");
            }
            return Result<Texture2D>::success(std::move(out));
        }

        const std::string& label() const { return label_; }
        uint32_t width() const { return width_; }
        uint32_t height() const { return height_; }
        RHITextureHandle texture() const { return texture_; }
        RHISamplerHandle sampler() const { return sampler_; }
        RHIBindGroupHandle bind_group() const { return bind_group_; }

    private:
        std::string label_{};
        uint32_t width_ = 0;
        uint32_t height_ = 0;
        RHITextureHandle texture_ = kNullRHIHandle;
        RHISamplerHandle sampler_ = kNullRHIHandle;
        RHIBindGroupHandle bind_group_ = kNullRHIHandle;
    };

    // Texture-ийг (sprite_w x sprite_h) хэмжээтэй нүднүүдэд мөрөөр нь хуваасан UV grid.
    class SpriteSheetCoordinates
    {
    public:
        SpriteSheetCoordinates(const Texture2D& texture, uint32_t sprite_w, uint32_t sprite_h)
            : SpriteSheetCoordinates(texture.width(), texture.height(), sprite_w, sprite_h)
        {}

        SpriteSheetCoordinates(uint32_t texture_w, uint32_t texture_h, uint32_t sprite_w, uint32_t sprite_h)
        {
            if (texture_w == 0 || texture_h == 0 || sprite_w == 0 || sprite_h == 0) return;

            const glm::vec2 size{
                (float)sprite_w / (float)texture_w,
                (float)sprite_h / (float)texture_h};
            const uint32_t rows = texture_h / sprite_h;
            cols_ = texture_w / sprite_w;
            coords_.reserve((size_t)rows * (size_t)cols_);
            for (uint32_t y = 0; y < rows; ++y)
            {
                for (uint32_t x = 0; x < cols_; ++x)
                {
                    const glm::vec2 offset{
                        (float)(x * sprite_w) / (float)texture_w,
                        (float)(y * sprite_h) / (float)texture_h};
                    coords_.emplace_back(size, offset);
                }
            }
        }

        std::optional<Texture2DCoordinates> get_coords(size_t x, size_t y) const
        {
            if (x >= cols_) return std::nullopt;
            return get_coords_by_index(y * cols_ + x);
        }

        std::optional<Texture2DCoordinates> get_coords_by_index(size_t index) const
        {
            if (index >= coords_.size()) return std::nullopt;
            return coords_[index];
        }

        size_t size() const { return coords_.size(); }
        size_t cols() const { return cols_; }

    private:
        std::vector<Texture2DCoordinates> coords_{};
        size_t cols_ = 0;
    };
}
