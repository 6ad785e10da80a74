#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: gpu_backend.hpp
    МОДУЛЬ: rhi/core
    ЗОРИЛГО: Renderer-ийн ашигладаг GPU чадварын интерфэйс: resource үүсгэх,
            surface-ээс frame авах, command бичих, submit/present.
            Software болон Vulkan backend энэ интерфэйсийг хэрэгжүүлнэ.
*/


#include <cstdint>
#include <span>

#include "qdr/rhi/command/command_desc.hpp"
#include "qdr/rhi/core/capabilities.hpp"
#include "qdr/rhi/pipeline/pipeline_desc.hpp"
#include "qdr/rhi/resource/resource_desc.hpp"

namespace qdr
{
    enum class RenderBackendType : uint8_t
    {
        Software = 0,
        Vulkan = 1
    };

    inline const char* render_backend_type_name(RenderBackendType type)
    {
        switch (type)
        {
            case RenderBackendType::Software: return "software";
            case RenderBackendType::Vulkan: return "vulkan";
        }
        return "unknown";
    }

    enum class SurfaceStatus : uint8_t
    {
        Ok = 0,
        Suboptimal = 1,
        Outdated = 2,
        Lost = 3,
        Timeout = 4,
        DeviceLost = 5,
        Failed = 6
    };

    inline const char* surface_status_name(SurfaceStatus s)
    {
        switch (s)
        {
            case SurfaceStatus::Ok: return "ok";
            case SurfaceStatus::Suboptimal: return "suboptimal";
            case SurfaceStatus::Outdated: return "outdated";
            case SurfaceStatus::Lost: return "lost";
            case SurfaceStatus::Timeout: return "timeout";
            case SurfaceStatus::DeviceLost: return "device_lost";
            case SurfaceStatus::Failed: return "failed";
        }
        return "unknown";
    }

    // Surface-ийг дахин тохируулаад дараагийн tick-т үргэлжлүүлж болох төлөв.
    inline bool surface_status_is_transient(SurfaceStatus s)
    {
        return s == SurfaceStatus::Suboptimal ||
            s == SurfaceStatus::Outdated ||
            s == SurfaceStatus::Lost;
    }

    struct SurfaceAcquireResult
    {
        SurfaceStatus status = SurfaceStatus::Failed;
        uint32_t image_index = 0;
        uint32_t width = 0;
        uint32_t height = 0;
    };

    class IGpuBackend
    {
    public:
        virtual ~IGpuBackend() = default;

        virtual RenderBackendType type() const = 0;
        virtual const char* name() const { return render_backend_type_name(type()); }
        virtual BackendCapabilities capabilities() const { return BackendCapabilities{}; }

        // Resource-ууд. Алдаа гарвал 0 handle буцаана.
        virtual RHIBufferHandle create_buffer(const RHIBufferDesc& desc, std::span<const uint8_t> initial_bytes) = 0;
        virtual bool write_buffer(RHIBufferHandle buffer, uint64_t offset, std::span<const uint8_t> bytes) = 0;
        virtual void destroy_buffer(RHIBufferHandle buffer) = 0;
        virtual RHITextureHandle create_texture(const RHITextureDesc& desc, std::span<const uint8_t> rgba_bytes) = 0;
        virtual void destroy_texture(RHITextureHandle texture) = 0;
        virtual RHISamplerHandle create_sampler(const RHISamplerDesc& desc) = 0;
        virtual void destroy_sampler(RHISamplerHandle sampler) = 0;
        virtual RHIBindGroupHandle create_texture_bind_group(RHITextureHandle texture, RHISamplerHandle sampler) = 0;
        virtual RHIBindGroupHandle create_uniform_bind_group(RHIBufferHandle buffer) = 0;
        virtual RHIPipelineHandle create_graphics_pipeline(const RHIGraphicsPipelineDesc& desc) = 0;

        // Frame
        virtual SurfaceAcquireResult acquire_frame() = 0;
        virtual void begin_render_pass(const RHICmdBeginPassDesc& desc) = 0;
        virtual void bind_pipeline(const RHICmdBindPipelineDesc& desc) = 0;
        virtual void bind_group(const RHICmdBindGroupDesc& desc) = 0;
        virtual void bind_vertex_buffer(const RHICmdBindVertexBufferDesc& desc) = 0;
        virtual void bind_index_buffer(const RHICmdBindIndexBufferDesc& desc) = 0;
        virtual void draw_indexed(const RHICmdDrawIndexedDesc& desc) = 0;
        virtual void end_render_pass() = 0;
        virtual bool submit_frame() = 0;
        virtual SurfaceStatus present_frame() = 0;
        // Амжилттай acquire_frame()-ийн дараа submit/present хийгдэхгүй фрэймийг хаяна.
        // Дараагийн acquire_frame() хэвийн ажиллах төлөвт буцаана.
        virtual void abort_frame() = 0;

        // Surface
        virtual bool configure_surface(uint32_t width, uint32_t height) = 0;
        virtual uint32_t surface_width() const = 0;
        virtual uint32_t surface_height() const = 0;
    };
}
