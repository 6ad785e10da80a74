#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: batched_renderer.hpp
    МОДУЛЬ: graphics
    ЗОРИЛГО: Фрэйм бүрийн quad зурах хүсэлтүүдийг (texture, depth) түлхүүрээр
            бүлэглэж, batch бүрд нэг instanced draw call гаргадаг renderer.
            Төлөв: Idle -> begin() -> Recording -> submit() -> Idle.
*/


#include <array>
#include <cstdint>
#include <map>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>

#include <glm/glm.hpp>

#include "qdr/assets/asset_handle.hpp"
#include "qdr/assets/asset_registry.hpp"
#include "qdr/assets/loaders/texture_loader.hpp"
#include "qdr/assets/texture.hpp"
#include "qdr/core/log.hpp"
#include "qdr/graphics/camera2d.hpp"
#include "qdr/graphics/instance_batch.hpp"
#include "qdr/graphics/quad.hpp"
#include "qdr/graphics/quad_geometry.hpp"
#include "qdr/graphics/renderer_config.hpp"
#include "qdr/rhi/core/gpu_backend.hpp"

namespace qdr
{
    enum class RendererState : uint8_t
    {
        Idle = 0,
        Recording = 1
    };

    enum class FrameSubmitResult : uint8_t
    {
        Presented = 0,
        // Surface outdated/lost/suboptimal: дахин тохируулаад фрэймийг алгассан.
        SurfaceReconfigured = 1,
        // Acquire timeout: фрэймийг алгассан.
        Skipped = 2,
        Failed = 3,
        NotRecording = 4
    };

    inline const char* frame_submit_result_name(FrameSubmitResult r)
    {
        switch (r)
        {
            case FrameSubmitResult::Presented: return "presented";
            case FrameSubmitResult::SurfaceReconfigured: return "surface_reconfigured";
            case FrameSubmitResult::Skipped: return "skipped";
            case FrameSubmitResult::Failed: return "failed";
            case FrameSubmitResult::NotRecording: return "not_recording";
        }
        return "unknown";
    }

    struct FrameStats
    {
        uint32_t batches_drawn = 0;
        uint32_t batches_skipped = 0;
        uint32_t instances = 0;
        uint32_t draw_calls = 0;
        uint32_t buffer_reallocations = 0;
    };

    class BatchedRenderer
    {
    public:
        BatchedRenderer(IGpuBackend& backend, SharedAssetRegistry& assets, RendererConfig config = {})
            : backend_(&backend), assets_(&assets), config_(std::move(config))
        {
            // Constructor throw хийвэл destructor ажиллахгүй тул үүссэн buffer-уудыг энд чөлөөлнө.
            try
            {
                create_gpu_objects();
                white_texture_ = load_white_texture();
            }
            catch (const std::exception&)
            {
                release_gpu_objects();
                throw;
            }
        }

        ~BatchedRenderer()
        {
            release_gpu_objects();
        }

        BatchedRenderer(const BatchedRenderer&) = delete;
        BatchedRenderer& operator=(const BatchedRenderer&) = delete;

        void begin(const glm::vec4& clear_color, const Camera2D& camera)
        {
            if (state_ == RendererState::Recording)
            {
                log_warn("[renderer] begin() called while recording; previous frame abandoned");
            }
            clear_color_ = clear_color;
            camera_.view_proj = camera.to_matrix();
            for (auto& [key, batch] : batches_)
            {
                (void)key;
                batch.clear();
            }
            state_ = RendererState::Recording;
        }

        bool draw_quad(const Quad& quad)
        {
            return draw_quad_textured(quad, white_texture_, Texture2DCoordinates{});
        }

        bool draw_quad_textured(const Quad& quad, AssetHandle<Texture2D> texture, const Texture2DCoordinates& uv = {})
        {
            if (state_ != RendererState::Recording)
            {
                log_warn("[renderer] draw ignored: renderer is not recording");
                return false;
            }

            const BatchKey key{quad.depth_index(), texture.id()};
            auto it = batches_.find(key);
            if (it == batches_.end())
            {
                it = batches_.emplace(key, InstanceBatch(texture, quad.depth_index(), config_.batch_capacity_hint)).first;
            }

            QuadInstanceData inst{};
            inst.model = quad.get_transform();
            inst.color = quad.color;
            inst.tex_coords_size = uv.size;
            inst.tex_coords_offset = uv.offset;
            it->second.push(inst);
            return true;
        }

        FrameSubmitResult submit()
        {
            if (state_ != RendererState::Recording)
            {
                log_warn("[renderer] submit() called without begin()");
                return FrameSubmitResult::NotRecording;
            }
            state_ = RendererState::Idle;
            stats_ = FrameStats{};

            if (surface_needs_reconfigure_)
            {
                reconfigure_surface();
            }

            const SurfaceAcquireResult acquired = backend_->acquire_frame();
            if (surface_status_is_transient(acquired.status))
            {
                log_debug(std::string("[renderer] acquire reported ") + surface_status_name(acquired.status) +
                    ", reconfiguring surface");
                reconfigure_surface();
                return FrameSubmitResult::SurfaceReconfigured;
            }
            if (acquired.status == SurfaceStatus::Timeout)
            {
                return FrameSubmitResult::Skipped;
            }
            if (acquired.status != SurfaceStatus::Ok)
            {
                log_error(std::string("[renderer] acquire failed on backend '") + backend_->name() + "': " +
                    surface_status_name(acquired.status));
                return FrameSubmitResult::Failed;
            }

            RHICmdBeginPassDesc pass{};
            pass.clear_color = true;
            pass.clear_value = RHIClearColor{clear_color_.r, clear_color_.g, clear_color_.b, clear_color_.a};
            backend_->begin_render_pass(pass);
            backend_->bind_pipeline(RHICmdBindPipelineDesc{pipeline_});

            const auto camera_bytes = std::span<const uint8_t>(
                reinterpret_cast<const uint8_t*>(&camera_), sizeof(CameraUniform));
            if (!backend_->write_buffer(camera_buffer_, 0, camera_bytes))
            {
                log_error("[renderer] camera uniform upload failed (pipeline 'quad')");
                backend_->abort_frame();
                return FrameSubmitResult::Failed;
            }
            backend_->bind_group(RHICmdBindGroupDesc{0u, camera_group_});
            backend_->bind_vertex_buffer(RHICmdBindVertexBufferDesc{0u, vertex_buffer_, 0u});
            backend_->bind_index_buffer(RHICmdBindIndexBufferDesc{index_buffer_, 0u, false});

            // std::map нь BatchKey-ээр эрэмбэлэгдсэн тул шууд давтана.
            for (auto& [key, batch] : batches_)
            {
                if (batch.empty()) continue;

                RHIBindGroupHandle texture_group = kNullRHIHandle;
                {
                    const auto reg = assets_->read();
                    const Texture2D* tex = reg->try_get(batch.texture());
                    if (tex) texture_group = tex->bind_group();
                }
                if (texture_group == kNullRHIHandle)
                {
                    log_error("[renderer] batch " + key.to_string() + " skipped: texture is not resolvable");
                    ++stats_.batches_skipped;
                    continue;
                }

                bool reallocated = false;
                if (!batch.upload(*backend_, &reallocated))
                {
                    log_error("[renderer] batch " + key.to_string() + " skipped: instance buffer upload failed");
                    ++stats_.batches_skipped;
                    continue;
                }
                if (reallocated) ++stats_.buffer_reallocations;

                backend_->bind_group(RHICmdBindGroupDesc{1u, texture_group});
                backend_->bind_vertex_buffer(RHICmdBindVertexBufferDesc{1u, batch.gpu_buffer(), 0u});

                RHICmdDrawIndexedDesc draw{};
                draw.index_count = (uint32_t)kQuadIndices.size();
                draw.instance_count = batch.count();
                backend_->draw_indexed(draw);

                ++stats_.batches_drawn;
                ++stats_.draw_calls;
                stats_.instances += batch.count();
            }

            backend_->end_render_pass();
            if (!backend_->submit_frame())
            {
                log_error(std::string("[renderer] submit failed on backend '") + backend_->name() + "'");
                backend_->abort_frame();
                return FrameSubmitResult::Failed;
            }

            const SurfaceStatus presented = backend_->present_frame();
            if (surface_status_is_transient(presented))
            {
                surface_needs_reconfigure_ = true;
            }
            else if (presented != SurfaceStatus::Ok)
            {
                log_error(std::string("[renderer] present failed: ") + surface_status_name(presented));
                return FrameSubmitResult::Failed;
            }
            return FrameSubmitResult::Presented;
        }

        void on_resize(uint32_t width, uint32_t height)
        {
            if (width == 0 || height == 0) return;
            if (!backend_->configure_surface(width, height))
            {
                log_warn("[renderer] surface resize to " + std::to_string(width) + "x" +
                    std::to_string(height) + " failed; retrying on next submit");
                surface_needs_reconfigure_ = true;
                return;
            }
            surface_needs_reconfigure_ = false;
        }

        RendererState state() const { return state_; }
        const FrameStats& last_frame_stats() const { return stats_; }
        size_t batch_count() const { return batches_.size(); }
        AssetHandle<Texture2D> white_texture() const { return white_texture_; }
        const RendererConfig& config() const { return config_; }

        const InstanceBatch* find_batch(AssetHandle<Texture2D> texture, int32_t depth_index) const
        {
            const auto it = batches_.find(BatchKey{depth_index, texture.id()});
            return it == batches_.end() ? nullptr : &it->second;
        }

    private:
        void create_gpu_objects()
        {
            RHIGraphicsPipelineDesc pd{};
            pd.vs.stage = RHIShaderStage::Vertex;
            pd.vs.spirv_path = config_.quad_vert_spv;
            pd.fs.stage = RHIShaderStage::Fragment;
            pd.fs.spirv_path = config_.quad_frag_spv;
            pd.vertex_buffers = {quad_vertex_layout(), quad_instance_layout()};
            pd.bind_groups = {RHIBindGroupKind::UniformBuffer, RHIBindGroupKind::SampledTexture};
            pd.raster.cull = RHICullMode::None;
            pd.blend.alpha_blend = true;
            pd.label = "quad";
            pipeline_ = backend_->create_graphics_pipeline(pd);
            if (pipeline_ == kNullRHIHandle)
            {
                throw std::runtime_error("BatchedRenderer: failed to create quad pipeline");
            }

            RHIBufferDesc cam{};
            cam.size_bytes = sizeof(CameraUniform);
            cam.usage = RHIBufferUsage_Uniform | RHIBufferUsage_TransferDst;
            cam.label = "camera_uniform";
            camera_buffer_ = backend_->create_buffer(cam, std::span<const uint8_t>(
                reinterpret_cast<const uint8_t*>(&camera_), sizeof(CameraUniform)));
            camera_group_ = camera_buffer_ != kNullRHIHandle
                ? backend_->create_uniform_bind_group(camera_buffer_)
                : kNullRHIHandle;
            if (camera_group_ == kNullRHIHandle)
            {
                throw std::runtime_error("BatchedRenderer: failed to create camera uniform");
            }

            RHIBufferDesc vb{};
            vb.size_bytes = sizeof(QuadVertex) * kQuadVertices.size();
            vb.usage = RHIBufferUsage_Vertex;
            vb.label = "quad_vertices";
            vertex_buffer_ = backend_->create_buffer(vb, std::span<const uint8_t>(
                reinterpret_cast<const uint8_t*>(kQuadVertices.data()), vb.size_bytes));

            RHIBufferDesc ib{};
            ib.size_bytes = sizeof(uint16_t) * kQuadIndices.size();
            ib.usage = RHIBufferUsage_Index;
            ib.label = "quad_indices";
            index_buffer_ = backend_->create_buffer(ib, std::span<const uint8_t>(
                reinterpret_cast<const uint8_t*>(kQuadIndices.data()), ib.size_bytes));

            if (vertex_buffer_ == kNullRHIHandle || index_buffer_ == kNullRHIHandle)
            {
                throw std::runtime_error("BatchedRenderer: failed to create quad geometry buffers");
            }
        }

        void release_gpu_objects()
        {
            for (auto& [key, batch] : batches_)
            {
                (void)key;
                batch.release(*backend_);
            }
            if (camera_buffer_ != kNullRHIHandle) backend_->destroy_buffer(camera_buffer_);
            if (vertex_buffer_ != kNullRHIHandle) backend_->destroy_buffer(vertex_buffer_);
            if (index_buffer_ != kNullRHIHandle) backend_->destroy_buffer(index_buffer_);
            camera_buffer_ = kNullRHIHandle;
            vertex_buffer_ = kNullRHIHandle;
            index_buffer_ = kNullRHIHandle;
        }

        AssetHandle<Texture2D> load_white_texture()
        {
            static constexpr std::array<uint8_t, 4> kWhite = {255, 255, 255, 255};

            auto reg = assets_->write();
            if (!reg->contains<Texture2D>() || !reg->has_loader<Texture2DLoader, RawRgbaImageData>())
            {
                const Status st = register_texture_assets(*reg, *backend_);
                if (!st.ok) throw std::runtime_error("BatchedRenderer: " + st.error);
            }

            const RawRgbaImageData src{std::span<const uint8_t>(kWhite.data(), kWhite.size()), 1u, 1u};
            Result<AssetHandle<Texture2D>> h = reg->load<Texture2D, RawRgbaImageData>(src);
            if (!h.ok)
            {
                throw std::runtime_error("BatchedRenderer: failed to create white texture: " + h.error);
            }
            return h.value;
        }

        void reconfigure_surface()
        {
            const uint32_t w = backend_->surface_width();
            const uint32_t h = backend_->surface_height();
            surface_needs_reconfigure_ = !backend_->configure_surface(w, h);
        }

        IGpuBackend* backend_ = nullptr;
        SharedAssetRegistry* assets_ = nullptr;
        RendererConfig config_{};

        RendererState state_ = RendererState::Idle;
        glm::vec4 clear_color_{0.1f, 0.1f, 0.2f, 1.0f};
        CameraUniform camera_{};
        FrameStats stats_{};
        bool surface_needs_reconfigure_ = false;

        RHIPipelineHandle pipeline_ = kNullRHIHandle;
        RHIBufferHandle camera_buffer_ = kNullRHIHandle;
        RHIBindGroupHandle camera_group_ = kNullRHIHandle;
        RHIBufferHandle vertex_buffer_ = kNullRHIHandle;
        RHIBufferHandle index_buffer_ = kNullRHIHandle;

        std::map<BatchKey, InstanceBatch> batches_{};
        AssetHandle<Texture2D> white_texture_{};
    };
}
