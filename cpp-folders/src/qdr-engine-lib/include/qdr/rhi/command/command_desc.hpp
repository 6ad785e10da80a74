#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: command_desc.hpp
    МОДУЛЬ: rhi/command
    ЗОРИЛГО: Command recording contract.
            Render pass, bind, draw командуудыг backend-neutral байдлаар төлөөлнө.
*/


#include <cstdint>

#include "qdr/rhi/resource/resource_desc.hpp"

namespace qdr
{
    struct RHIClearColor
    {
        float r = 0.0f;
        float g = 0.0f;
        float b = 0.0f;
        float a = 1.0f;
    };

    struct RHICmdBeginPassDesc
    {
        bool clear_color = true;
        RHIClearColor clear_value{};
    };

    struct RHICmdBindPipelineDesc
    {
        RHIPipelineHandle pipeline = 0;
    };

    struct RHICmdBindGroupDesc
    {
        uint32_t slot = 0;
        RHIBindGroupHandle group = 0;
    };

    struct RHICmdBindVertexBufferDesc
    {
        uint32_t slot = 0;
        RHIBufferHandle buffer = 0;
        uint64_t offset = 0;
    };

    struct RHICmdBindIndexBufferDesc
    {
        RHIBufferHandle buffer = 0;
        uint64_t offset = 0;
        bool index_u32 = false;
    };

    struct RHICmdDrawIndexedDesc
    {
        uint32_t index_count = 0;
        uint32_t instance_count = 1;
        uint32_t first_index = 0;
        int32_t vertex_offset = 0;
        uint32_t first_instance = 0;
    };
}
