#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: engine_config.hpp
    МОДУЛЬ: app
    ЗОРИЛГО: Цонх, backend сонголт, renderer-ийн тохиргоог нэг дор барьж,
            QDR_* орчны хувьсагчаар дарж бичих боломж олгоно.
*/


#include <cstdint>
#include <cstdlib>
#include <string>

#include <glm/glm.hpp>

#include "qdr/core/env_config.hpp"
#include "qdr/core/log.hpp"
#include "qdr/graphics/renderer_config.hpp"
#include "qdr/rhi/backend/backend_factory.hpp"

namespace qdr
{
    constexpr uint32_t kMaxWindowExtent = 16384u;
    // Batch бүр hint * sizeof(QuadInstanceData) байт урьдчилан нөөцөлнө.
    constexpr uint32_t kMaxBatchCapacityHint = 1u << 20u;

    struct EngineConfig
    {
        std::string window_title = "qdr";
        uint32_t window_width = 800;
        uint32_t window_height = 600;
        RenderBackendType backend = RenderBackendType::Vulkan;
        bool vk_validation = false;
        // "fifo" эсвэл "mailbox"
        std::string vk_present_mode = "fifo";
        glm::vec4 clear_color{0.01f, 0.01f, 0.01f, 1.0f};
        RendererConfig renderer{};
    };

    // Хоосон эсвэл буруу утгатай хувьсагч байгаа утгыг өөрчлөхгүй.
    inline void apply_env_overrides(EngineConfig& cfg)
    {
        if (const char* v = std::getenv("QDR_LOG_LEVEL"))
        {
            set_log_level(parse_log_level(v, log_level()));
        }
        if (const char* v = std::getenv("QDR_BACKEND"))
        {
            cfg.backend = parse_render_backend_type(v, cfg.backend);
        }
        cfg.window_width = parse_env_u32(std::getenv("QDR_WINDOW_W"), cfg.window_width, 1u, kMaxWindowExtent);
        cfg.window_height = parse_env_u32(std::getenv("QDR_WINDOW_H"), cfg.window_height, 1u, kMaxWindowExtent);
        cfg.vk_validation = parse_env_bool(std::getenv("QDR_VK_VALIDATION"), cfg.vk_validation);
        cfg.vk_present_mode = env_string("QDR_VK_PRESENT_MODE", cfg.vk_present_mode);
        cfg.renderer.batch_capacity_hint = parse_env_u32(
            std::getenv("QDR_BATCH_CAPACITY_HINT"), cfg.renderer.batch_capacity_hint, 1u, kMaxBatchCapacityHint);
        cfg.renderer.quad_vert_spv = env_string("QDR_QUAD_VERT_SPV", cfg.renderer.quad_vert_spv);
        cfg.renderer.quad_frag_spv = env_string("QDR_QUAD_FRAG_SPV", cfg.renderer.quad_frag_spv);
    }

    inline EngineConfig load_engine_config_from_env(EngineConfig defaults = {})
    {
        apply_env_overrides(defaults);
        return defaults;
    }
}
