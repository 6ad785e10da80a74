#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: sw_gpu_backend.hpp
    МОДУЛЬ: rhi/drivers/software
    ЗОРИЛГО: IGpuBackend-ийн CPU хэрэгжүүлэлт. Resource-ууд host санах ойд байрлана,
            фрэйм бүрийн командын лог болон статистик хөтөлнө, instanced quad-уудыг
            RGBA8 color target руу rasterize хийнэ (quad.vert/quad.frag-ийн CPU хувилбар).
            Тестэд зориулж дараагийн acquire/present төлөв болон resource/submit
            алдааг тарьж болно.
*/


#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/type_precision.hpp>

#include "qdr/core/log.hpp"
#include "qdr/graphics/camera2d.hpp"
#include "qdr/graphics/quad_geometry.hpp"
#include "qdr/rhi/core/gpu_backend.hpp"

namespace qdr
{
    enum class RecordedCommandType : uint8_t
    {
        BeginRenderPass = 0,
        BindPipeline = 1,
        BindGroup = 2,
        BindVertexBuffer = 3,
        BindIndexBuffer = 4,
        DrawIndexed = 5,
        EndRenderPass = 6
    };

    struct RecordedCommand
    {
        RecordedCommandType type = RecordedCommandType::BeginRenderPass;
        // BindGroup/BindVertexBuffer: slot
        uint32_t slot = 0;
        // pipeline, bind group эсвэл buffer handle
        uint64_t handle = 0;
        uint32_t index_count = 0;
        uint32_t instance_count = 0;
        RHIClearColor clear{};
    };

    // inject_failure()-ээр бүтэлгүйтүүлж болох цэгүүд.
    enum class SoftwareFailPoint : uint8_t
    {
        CreateBuffer = 0,
        WriteBuffer = 1,
        CreateSampler = 2,
        TextureBindGroup = 3,
        SubmitFrame = 4,
        Count = 5
    };

    struct SoftwareBackendStats
    {
        uint64_t buffers_created = 0;
        uint64_t buffer_writes = 0;
        uint64_t buffers_destroyed = 0;
        uint64_t textures_created = 0;
        uint64_t frames_acquired = 0;
        uint64_t frames_submitted = 0;
        uint64_t frames_presented = 0;
        uint64_t frames_aborted = 0;
        uint64_t surface_configures = 0;
        uint64_t draw_calls = 0;
    };

    class SoftwareGpuBackend final : public IGpuBackend
    {
    public:
        SoftwareGpuBackend(uint32_t width, uint32_t height, bool rasterize = true)
            : rasterize_(rasterize)
        {
            (void)configure_surface(width, height);
            stats_.surface_configures = 0;
        }

        RenderBackendType type() const override { return RenderBackendType::Software; }

        BackendCapabilities capabilities() const override
        {
            BackendCapabilities c{};
            c.features.cpu_readback = true;
            c.limits.max_frames_in_flight = 1;
            c.supports_present = false;
            return c;
        }

        RHIBufferHandle create_buffer(const RHIBufferDesc& desc, std::span<const uint8_t> initial_bytes) override
        {
            if (desc.size_bytes == 0 || consume_failure(SoftwareFailPoint::CreateBuffer)) return kNullRHIHandle;
            BufferSlot b{};
            b.desc = desc;
            b.bytes.assign((size_t)desc.size_bytes, 0u);
            const size_t n = std::min(initial_bytes.size(), b.bytes.size());
            if (n > 0) std::memcpy(b.bytes.data(), initial_bytes.data(), n);
            const uint64_t h = next_handle_++;
            buffers_.emplace(h, std::move(b));
            ++stats_.buffers_created;
            return h;
        }

        bool write_buffer(RHIBufferHandle buffer, uint64_t offset, std::span<const uint8_t> bytes) override
        {
            auto it = buffers_.find(buffer);
            if (it == buffers_.end() || consume_failure(SoftwareFailPoint::WriteBuffer)) return false;
            std::vector<uint8_t>& dst = it->second.bytes;
            if (offset + bytes.size() > dst.size()) return false;
            if (!bytes.empty()) std::memcpy(dst.data() + offset, bytes.data(), bytes.size());
            ++stats_.buffer_writes;
            return true;
        }

        void destroy_buffer(RHIBufferHandle buffer) override
        {
            if (buffers_.erase(buffer) > 0) ++stats_.buffers_destroyed;
        }

        RHITextureHandle create_texture(const RHITextureDesc& desc, std::span<const uint8_t> rgba_bytes) override
        {
            const size_t expected = (size_t)desc.width * (size_t)desc.height * 4u;
            if (expected == 0 || rgba_bytes.size() != expected) return kNullRHIHandle;
            TextureSlot t{};
            t.width = desc.width;
            t.height = desc.height;
            t.rgba.assign(rgba_bytes.begin(), rgba_bytes.end());
            const uint64_t h = next_handle_++;
            textures_.emplace(h, std::move(t));
            ++stats_.textures_created;
            return h;
        }

        void destroy_texture(RHITextureHandle texture) override
        {
            textures_.erase(texture);
        }

        RHISamplerHandle create_sampler(const RHISamplerDesc& desc) override
        {
            if (consume_failure(SoftwareFailPoint::CreateSampler)) return kNullRHIHandle;
            const uint64_t h = next_handle_++;
            samplers_.emplace(h, desc);
            return h;
        }

        void destroy_sampler(RHISamplerHandle sampler) override
        {
            samplers_.erase(sampler);
        }

        RHIBindGroupHandle create_texture_bind_group(RHITextureHandle texture, RHISamplerHandle sampler) override
        {
            if (textures_.find(texture) == textures_.end() || samplers_.find(sampler) == samplers_.end() ||
                consume_failure(SoftwareFailPoint::TextureBindGroup))
            {
                return kNullRHIHandle;
            }
            const uint64_t h = next_handle_++;
            groups_.emplace(h, BindGroupSlot{RHIBindGroupKind::SampledTexture, texture, sampler, kNullRHIHandle});
            return h;
        }

        RHIBindGroupHandle create_uniform_bind_group(RHIBufferHandle buffer) override
        {
            if (buffers_.find(buffer) == buffers_.end()) return kNullRHIHandle;
            const uint64_t h = next_handle_++;
            groups_.emplace(h, BindGroupSlot{RHIBindGroupKind::UniformBuffer, kNullRHIHandle, kNullRHIHandle, buffer});
            return h;
        }

        RHIPipelineHandle create_graphics_pipeline(const RHIGraphicsPipelineDesc& desc) override
        {
            if (desc.vertex_buffers.empty()) return kNullRHIHandle;
            const uint64_t h = next_handle_++;
            pipelines_.emplace(h, desc);
            return h;
        }

        SurfaceAcquireResult acquire_frame() override
        {
            commands_.clear();
            bound_ = BoundState{};
            in_pass_ = false;

            SurfaceAcquireResult out{};
            out.width = width_;
            out.height = height_;
            out.status = SurfaceStatus::Ok;
            if (injected_acquire_)
            {
                out.status = *injected_acquire_;
                injected_acquire_.reset();
            }
            if (out.status == SurfaceStatus::Ok) ++stats_.frames_acquired;
            return out;
        }

        void begin_render_pass(const RHICmdBeginPassDesc& desc) override
        {
            RecordedCommand c{};
            c.type = RecordedCommandType::BeginRenderPass;
            c.clear = desc.clear_value;
            commands_.push_back(c);
            in_pass_ = true;

            if (rasterize_ && desc.clear_color)
            {
                const uint8_t px[4] = {
                    to_u8(desc.clear_value.r), to_u8(desc.clear_value.g),
                    to_u8(desc.clear_value.b), to_u8(desc.clear_value.a)};
                for (size_t i = 0; i + 3 < color_.size(); i += 4)
                {
                    std::memcpy(color_.data() + i, px, 4);
                }
            }
        }

        void bind_pipeline(const RHICmdBindPipelineDesc& desc) override
        {
            RecordedCommand c{};
            c.type = RecordedCommandType::BindPipeline;
            c.handle = desc.pipeline;
            commands_.push_back(c);
            bound_.pipeline = desc.pipeline;
        }

        void bind_group(const RHICmdBindGroupDesc& desc) override
        {
            RecordedCommand c{};
            c.type = RecordedCommandType::BindGroup;
            c.slot = desc.slot;
            c.handle = desc.group;
            commands_.push_back(c);
            if (desc.slot < bound_.groups.size()) bound_.groups[desc.slot] = desc.group;
        }

        void bind_vertex_buffer(const RHICmdBindVertexBufferDesc& desc) override
        {
            RecordedCommand c{};
            c.type = RecordedCommandType::BindVertexBuffer;
            c.slot = desc.slot;
            c.handle = desc.buffer;
            commands_.push_back(c);
            if (desc.slot < bound_.vertex_buffers.size()) bound_.vertex_buffers[desc.slot] = desc.buffer;
        }

        void bind_index_buffer(const RHICmdBindIndexBufferDesc& desc) override
        {
            RecordedCommand c{};
            c.type = RecordedCommandType::BindIndexBuffer;
            c.handle = desc.buffer;
            commands_.push_back(c);
            bound_.index_buffer = desc.buffer;
            bound_.index_u32 = desc.index_u32;
        }

        void draw_indexed(const RHICmdDrawIndexedDesc& desc) override
        {
            RecordedCommand c{};
            c.type = RecordedCommandType::DrawIndexed;
            c.index_count = desc.index_count;
            c.instance_count = desc.instance_count;
            commands_.push_back(c);
            ++stats_.draw_calls;

            if (!in_pass_)
            {
                log_warn("[sw-backend] draw_indexed outside of a render pass");
                return;
            }
            if (rasterize_) raster_quad_instances(desc);
        }

        void end_render_pass() override
        {
            RecordedCommand c{};
            c.type = RecordedCommandType::EndRenderPass;
            commands_.push_back(c);
            in_pass_ = false;
        }

        bool submit_frame() override
        {
            if (consume_failure(SoftwareFailPoint::SubmitFrame)) return false;
            ++stats_.frames_submitted;
            return true;
        }

        SurfaceStatus present_frame() override
        {
            if (injected_present_)
            {
                const SurfaceStatus s = *injected_present_;
                injected_present_.reset();
                return s;
            }
            ++stats_.frames_presented;
            return SurfaceStatus::Ok;
        }

        // CPU дээр хүлээх sync объект байхгүй тул зөвхөн pass төлөвийг цэвэрлэнэ.
        void abort_frame() override
        {
            in_pass_ = false;
            bound_ = BoundState{};
            ++stats_.frames_aborted;
        }

        bool configure_surface(uint32_t width, uint32_t height) override
        {
            if (width == 0 || height == 0) return false;
            width_ = width;
            height_ = height;
            color_.assign((size_t)width_ * (size_t)height_ * 4u, 0u);
            ++stats_.surface_configures;
            return true;
        }

        uint32_t surface_width() const override { return width_; }
        uint32_t surface_height() const override { return height_; }

        // Тест болон SDL дэлгэцэнд зориулсан хандалт.
        void inject_acquire_status(SurfaceStatus s) { injected_acquire_ = s; }
        void inject_present_status(SurfaceStatus s) { injected_present_ = s; }
        void set_rasterize(bool enabled) { rasterize_ = enabled; }

        // after_calls удаа амжилттай ажилласны дараагийн дуудлага нэг удаа бүтэлгүйтнэ.
        void inject_failure(SoftwareFailPoint point, uint32_t after_calls = 0)
        {
            fail_after_[(size_t)point] = after_calls;
        }

        const std::vector<RecordedCommand>& commands() const { return commands_; }
        const SoftwareBackendStats& stats() const { return stats_; }
        size_t live_buffer_count() const { return buffers_.size(); }
        size_t live_texture_count() const { return textures_.size(); }
        size_t live_sampler_count() const { return samplers_.size(); }

        std::optional<uint64_t> buffer_size(RHIBufferHandle buffer) const
        {
            const auto it = buffers_.find(buffer);
            if (it == buffers_.end()) return std::nullopt;
            return it->second.desc.size_bytes;
        }

        const std::vector<uint8_t>& color_target() const { return color_; }

        glm::u8vec4 pixel(uint32_t x, uint32_t y) const
        {
            if (x >= width_ || y >= height_) return glm::u8vec4(0);
            const uint8_t* p = color_.data() + ((size_t)y * (size_t)width_ + (size_t)x) * 4u;
            return glm::u8vec4(p[0], p[1], p[2], p[3]);
        }

    private:
        struct BufferSlot
        {
            RHIBufferDesc desc{};
            std::vector<uint8_t> bytes{};
        };

        struct TextureSlot
        {
            uint32_t width = 0;
            uint32_t height = 0;
            std::vector<uint8_t> rgba{};
        };

        struct BindGroupSlot
        {
            RHIBindGroupKind kind = RHIBindGroupKind::UniformBuffer;
            RHITextureHandle texture = kNullRHIHandle;
            RHISamplerHandle sampler = kNullRHIHandle;
            RHIBufferHandle buffer = kNullRHIHandle;
        };

        struct BoundState
        {
            RHIPipelineHandle pipeline = kNullRHIHandle;
            std::array<RHIBindGroupHandle, 2> groups{};
            std::array<RHIBufferHandle, 2> vertex_buffers{};
            RHIBufferHandle index_buffer = kNullRHIHandle;
            bool index_u32 = false;
        };

        struct ScreenVertex
        {
            glm::vec2 pos{0.0f};
            glm::vec2 uv{0.0f};
        };

        bool consume_failure(SoftwareFailPoint point)
        {
            std::optional<uint32_t>& left = fail_after_[(size_t)point];
            if (!left) return false;
            if (*left > 0)
            {
                --*left;
                return false;
            }
            left.reset();
            return true;
        }

        static uint8_t to_u8(float v)
        {
            return (uint8_t)std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f);
        }

        template<typename T>
        const T* buffer_as(RHIBufferHandle h, size_t min_count) const
        {
            const auto it = buffers_.find(h);
            if (it == buffers_.end()) return nullptr;
            if (it->second.bytes.size() < min_count * sizeof(T)) return nullptr;
            return reinterpret_cast<const T*>(it->second.bytes.data());
        }

        const TextureSlot* bound_texture() const
        {
            const auto g = groups_.find(bound_.groups[1]);
            if (g == groups_.end() || g->second.kind != RHIBindGroupKind::SampledTexture) return nullptr;
            const auto t = textures_.find(g->second.texture);
            return t == textures_.end() ? nullptr : &t->second;
        }

        const CameraUniform* bound_camera() const
        {
            const auto g = groups_.find(bound_.groups[0]);
            if (g == groups_.end() || g->second.kind != RHIBindGroupKind::UniformBuffer) return nullptr;
            return buffer_as<CameraUniform>(g->second.buffer, 1u);
        }

        void raster_quad_instances(const RHICmdDrawIndexedDesc& desc)
        {
            if (bound_.index_u32) return;
            const CameraUniform* camera = bound_camera();
            const TextureSlot* tex = bound_texture();
            const QuadVertex* verts = buffer_as<QuadVertex>(bound_.vertex_buffers[0], kQuadVertices.size());
            const QuadInstanceData* inst = buffer_as<QuadInstanceData>(
                bound_.vertex_buffers[1], (size_t)desc.first_instance + desc.instance_count);
            const uint16_t* idx = buffer_as<uint16_t>(bound_.index_buffer, (size_t)desc.first_index + desc.index_count);
            if (!camera || !tex || !verts || !inst || !idx)
            {
                log_warn("[sw-backend] draw_indexed skipped: incomplete bindings");
                return;
            }

            for (uint32_t i = 0; i < desc.instance_count; ++i)
            {
                const QuadInstanceData& d = inst[desc.first_instance + i];
                const glm::mat4 mvp = camera->view_proj * d.model;
                for (uint32_t k = 0; k + 2 < desc.index_count; k += 3)
                {
                    ScreenVertex tri[3];
                    for (uint32_t v = 0; v < 3; ++v)
                    {
                        const QuadVertex& qv = verts[idx[desc.first_index + k + v] + desc.vertex_offset];
                        const glm::vec4 clip = mvp * glm::vec4(qv.position, 0.0f, 1.0f);
                        const glm::vec2 ndc = glm::vec2(clip) / clip.w;
                        tri[v].pos = glm::vec2(
                            (ndc.x * 0.5f + 0.5f) * (float)width_,
                            (0.5f - ndc.y * 0.5f) * (float)height_);
                        tri[v].uv = qv.tex_coords * d.tex_coords_size + d.tex_coords_offset;
                    }
                    raster_triangle(tri, *tex, d.color);
                }
            }
        }

        static float edge(const glm::vec2& a, const glm::vec2& b, const glm::vec2& p)
        {
            return (p.x - a.x) * (b.y - a.y) - (p.y - a.y) * (b.x - a.x);
        }

        void raster_triangle(const ScreenVertex (&tri)[3], const TextureSlot& tex, const glm::vec4& tint)
        {
            const float area = edge(tri[0].pos, tri[1].pos, tri[2].pos);
            if (std::abs(area) < 1e-8f) return;

            const float min_x = std::min({tri[0].pos.x, tri[1].pos.x, tri[2].pos.x});
            const float max_x = std::max({tri[0].pos.x, tri[1].pos.x, tri[2].pos.x});
            const float min_y = std::min({tri[0].pos.y, tri[1].pos.y, tri[2].pos.y});
            const float max_y = std::max({tri[0].pos.y, tri[1].pos.y, tri[2].pos.y});

            const int x0 = std::max(0, (int)std::floor(min_x));
            const int x1 = std::min((int)width_ - 1, (int)std::ceil(max_x));
            const int y0 = std::max(0, (int)std::floor(min_y));
            const int y1 = std::min((int)height_ - 1, (int)std::ceil(max_y));

            for (int y = y0; y <= y1; ++y)
            {
                for (int x = x0; x <= x1; ++x)
                {
                    const glm::vec2 p((float)x + 0.5f, (float)y + 0.5f);
                    const float w0 = edge(tri[1].pos, tri[2].pos, p) / area;
                    const float w1 = edge(tri[2].pos, tri[0].pos, p) / area;
                    const float w2 = edge(tri[0].pos, tri[1].pos, p) / area;
                    if (w0 < 0.0f || w1 < 0.0f || w2 < 0.0f) continue;

                    const glm::vec2 uv = tri[0].uv * w0 + tri[1].uv * w1 + tri[2].uv * w2;
                    const glm::vec4 src = sample_nearest(tex, uv) * tint;
                    blend_pixel((uint32_t)x, (uint32_t)y, src);
                }
            }
        }

        static glm::vec4 sample_nearest(const TextureSlot& tex, glm::vec2 uv)
        {
            const float u = std::clamp(uv.x, 0.0f, 1.0f);
            const float v = std::clamp(uv.y, 0.0f, 1.0f);
            const uint32_t tx = std::min(tex.width - 1u, (uint32_t)(u * (float)tex.width));
            const uint32_t ty = std::min(tex.height - 1u, (uint32_t)(v * (float)tex.height));
            const uint8_t* p = tex.rgba.data() + ((size_t)ty * (size_t)tex.width + (size_t)tx) * 4u;
            return glm::vec4(p[0], p[1], p[2], p[3]) / 255.0f;
        }

        void blend_pixel(uint32_t x, uint32_t y, const glm::vec4& src)
        {
            uint8_t* p = color_.data() + ((size_t)y * (size_t)width_ + (size_t)x) * 4u;
            const glm::vec4 dst = glm::vec4(p[0], p[1], p[2], p[3]) / 255.0f;
            const glm::vec3 rgb = glm::vec3(src) * src.a + glm::vec3(dst) * (1.0f - src.a);
            const float a = src.a + dst.a * (1.0f - src.a);
            p[0] = to_u8(rgb.r);
            p[1] = to_u8(rgb.g);
            p[2] = to_u8(rgb.b);
            p[3] = to_u8(a);
        }

        bool rasterize_ = true;
        uint32_t width_ = 0;
        uint32_t height_ = 0;
        std::vector<uint8_t> color_{};

        uint64_t next_handle_ = 1;
        std::unordered_map<uint64_t, BufferSlot> buffers_{};
        std::unordered_map<uint64_t, TextureSlot> textures_{};
        std::unordered_map<uint64_t, RHISamplerDesc> samplers_{};
        std::unordered_map<uint64_t, BindGroupSlot> groups_{};
        std::unordered_map<uint64_t, RHIGraphicsPipelineDesc> pipelines_{};

        std::vector<RecordedCommand> commands_{};
        BoundState bound_{};
        bool in_pass_ = false;
        std::optional<SurfaceStatus> injected_acquire_{};
        std::optional<SurfaceStatus> injected_present_{};
        std::array<std::optional<uint32_t>, (size_t)SoftwareFailPoint::Count> fail_after_{};
        SoftwareBackendStats stats_{};
    };
}
