#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: capabilities.hpp
    МОДУЛЬ: rhi/core
    ЗОРИЛГО: Backend-ийн feature/limit мэдээллийг нэгэн жигд contract-оор илэрхийлнэ.
*/


#include <cstdint>

namespace qdr
{
    struct BackendFeatureCaps
    {
        bool validation_layers = false;
        bool instancing = true;
        bool alpha_blending = true;
        bool cpu_readback = false;
    };

    struct BackendLimitCaps
    {
        uint32_t max_frames_in_flight = 1;
        uint32_t max_texture_dimension_2d = 8192;
        uint32_t max_vertex_buffers = 2;
        uint32_t max_bind_groups = 2;
    };

    struct BackendCapabilities
    {
        BackendFeatureCaps features{};
        BackendLimitCaps limits{};
        bool supports_present = false;
    };
}
