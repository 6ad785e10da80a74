#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: backend_factory.hpp
    МОДУЛЬ: rhi/backend
    ЗОРИЛГО: IGpuBackend-ийг нэр/type-ээр үүсгэх helper. Vulkan боломжгүй
            (build-д ороогүй, эсвэл init амжилтгүй) бол software руу буцна.
*/


#include <cctype>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "qdr/core/log.hpp"
#include "qdr/rhi/core/gpu_backend.hpp"
#include "qdr/rhi/drivers/software/sw_gpu_backend.hpp"
#include "qdr/rhi/drivers/vulkan/vk_gpu_backend.hpp"

struct SDL_Window;

namespace qdr
{
    struct GpuBackendCreateDesc
    {
        SDL_Window* window = nullptr;
        uint32_t width = 800;
        uint32_t height = 600;
        bool vk_validation = false;
        std::string vk_present_mode = "fifo";
    };

    struct GpuBackendCreateResult
    {
        std::unique_ptr<IGpuBackend> backend{};
        RenderBackendType requested = RenderBackendType::Software;
        RenderBackendType active = RenderBackendType::Software;
        std::string note{};
    };

    inline std::string to_lower_ascii(std::string_view s)
    {
        std::string out{};
        out.reserve(s.size());
        for (const char c : s)
        {
            out.push_back((char)std::tolower((unsigned char)c));
        }
        return out;
    }

    inline RenderBackendType parse_render_backend_type(std::string_view text, RenderBackendType fallback = RenderBackendType::Software)
    {
        const std::string v = to_lower_ascii(text);
        if (v == "software" || v == "sw" || v == "cpu") return RenderBackendType::Software;
        if (v == "vulkan" || v == "vk") return RenderBackendType::Vulkan;
        return fallback;
    }

    inline bool vulkan_backend_compiled()
    {
#ifdef QDR_HAS_VULKAN
        return true;
#else
        return false;
#endif
    }

    inline GpuBackendCreateResult create_gpu_backend(RenderBackendType requested, const GpuBackendCreateDesc& desc)
    {
        GpuBackendCreateResult out{};
        out.requested = requested;

        if (requested == RenderBackendType::Vulkan)
        {
#ifdef QDR_HAS_VULKAN
            auto vk = std::make_unique<VulkanGpuBackend>();
            VulkanGpuBackend::InitDesc init{};
            init.window = desc.window;
            init.width = desc.width;
            init.height = desc.height;
            init.enable_validation = desc.vk_validation;
            init.present_mode = to_lower_ascii(desc.vk_present_mode) == "mailbox"
                ? VkPresentModePreference::Mailbox
                : VkPresentModePreference::Fifo;
            if (vk->init_sdl(init))
            {
                out.backend = std::move(vk);
                out.active = RenderBackendType::Vulkan;
                return out;
            }
            out.note = "Vulkan init failed. Falling back to software backend.";
#else
            out.note = "Vulkan backend is not compiled in. Falling back to software backend.";
#endif
            log_warn("[backend] " + out.note);
        }

        out.backend = std::make_unique<SoftwareGpuBackend>(desc.width, desc.height);
        out.active = RenderBackendType::Software;
        return out;
    }

    inline GpuBackendCreateResult create_gpu_backend(std::string_view requested_text, const GpuBackendCreateDesc& desc)
    {
        return create_gpu_backend(parse_render_backend_type(requested_text, RenderBackendType::Software), desc);
    }
}
