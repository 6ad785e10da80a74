#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: texture_loader.hpp
    МОДУЛЬ: assets/loaders
    ЗОРИЛГО: Texture2D asset-ийг санах ойн RGBA пиксел эсвэл файлын замаас үүсгэх loader.
            Хоёр source-ийн аль алинд нь default loader болно.
*/


#include <functional>
#include <string>
#include <utility>

#include "qdr/assets/asset_loader.hpp"
#include "qdr/assets/asset_registry.hpp"
#include "qdr/assets/loaders/image_decoder_sdl.hpp"
#include "qdr/assets/texture.hpp"
#include "qdr/core/result.hpp"
#include "qdr/rhi/core/gpu_backend.hpp"

namespace qdr
{
    class Texture2DLoader
    {
    public:
        using asset_type = Texture2D;
        using DecodeFn = std::function<Result<RgbaImage>(const std::string&)>;

        explicit Texture2DLoader(IGpuBackend& backend, DecodeFn decode = decode_rgba_image_sdl)
            : backend_(&backend), decode_(std::move(decode))
        {}

        Result<Texture2D> load(const RawRgbaImageData& source) const
        {
            return Texture2D::from_memory(*backend_, "raw_rgba", source.pixels, source.width, source.height);
        }

        Result<Texture2D> load(const std::string& path) const
        {
            if (path.empty())
            {
                return Result<Texture2D>::failure(ErrorKind::InvalidSource, "empty texture path");
            }
            Result<RgbaImage> image = decode_(path);
            if (!image.ok) return Result<Texture2D>::failure(image.kind, image.error);
            return Texture2D::from_memory(*backend_, path, image.value.view().pixels, image.value.width, image.value.height);
        }

    private:
        IGpuBackend* backend_ = nullptr;
        DecodeFn decode_{};
    };
}

QDR_DEFAULT_ASSET_LOADER(qdr::Texture2D, qdr::Texture2DLoader, qdr::RawRgbaImageData);
QDR_DEFAULT_ASSET_LOADER(qdr::Texture2D, qdr::Texture2DLoader, std::string);

namespace qdr
{
    // Texture2D төрөл болон хоёр source-ийн loader-ийг бүртгэнэ.
    inline Status register_texture_assets(AssetRegistry& registry, IGpuBackend& backend)
    {
        if (!registry.contains<Texture2D>())
        {
            const Status st = registry.register_type<Texture2D>();
            if (!st.ok) return st;
        }
        registry.register_loader<Texture2DLoader, RawRgbaImageData>(Texture2DLoader(backend));
        registry.register_loader<Texture2DLoader, std::string>(Texture2DLoader(backend));
        return Status::success();
    }
}
