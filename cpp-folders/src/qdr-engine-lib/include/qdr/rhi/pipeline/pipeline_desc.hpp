#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: pipeline_desc.hpp
    МОДУЛЬ: rhi/pipeline
    ЗОРИЛГО: Graphics pipeline state descriptor-ууд: shader, vertex layout,
            raster/blend төлөв, bind group layout.
*/


#include <cstdint>
#include <string>
#include <vector>

#include "qdr/rhi/resource/resource_desc.hpp"

namespace qdr
{
    enum class RHIShaderStage : uint8_t
    {
        Vertex = 0,
        Fragment = 1
    };

    struct RHIShaderModuleDesc
    {
        RHIShaderStage stage = RHIShaderStage::Vertex;
        // SPIR-V файлын зам. Software backend shader ашиглахгүй тул хоосон байж болно.
        std::string spirv_path{};
        const char* entry = "main";
    };

    enum class RHIVertexFormat : uint8_t
    {
        Float2 = 0,
        Float3 = 1,
        Float4 = 2
    };

    inline uint32_t rhi_vertex_format_bytes(RHIVertexFormat f)
    {
        switch (f)
        {
            case RHIVertexFormat::Float2: return 8u;
            case RHIVertexFormat::Float3: return 12u;
            case RHIVertexFormat::Float4: return 16u;
        }
        return 0u;
    }

    enum class RHIVertexStepMode : uint8_t
    {
        Vertex = 0,
        Instance = 1
    };

    struct RHIVertexAttributeDesc
    {
        uint32_t location = 0;
        uint32_t offset = 0;
        RHIVertexFormat format = RHIVertexFormat::Float4;
    };

    struct RHIVertexBufferLayoutDesc
    {
        uint32_t stride = 0;
        RHIVertexStepMode step = RHIVertexStepMode::Vertex;
        std::vector<RHIVertexAttributeDesc> attributes{};
    };

    enum class RHICullMode : uint8_t
    {
        None = 0,
        Back = 1,
        Front = 2
    };

    enum class RHIFrontFace : uint8_t
    {
        CCW = 0,
        CW = 1
    };

    struct RHIRasterStateDesc
    {
        RHICullMode cull = RHICullMode::None;
        RHIFrontFace front_face = RHIFrontFace::CCW;
    };

    struct RHIBlendStateDesc
    {
        // src_alpha / one_minus_src_alpha
        bool alpha_blend = true;
    };

    enum class RHIBindGroupKind : uint8_t
    {
        UniformBuffer = 0,
        SampledTexture = 1
    };

    struct RHIGraphicsPipelineDesc
    {
        RHIShaderModuleDesc vs{};
        RHIShaderModuleDesc fs{};
        std::vector<RHIVertexBufferLayoutDesc> vertex_buffers{};
        // slot-ын дарааллаар
        std::vector<RHIBindGroupKind> bind_groups{};
        RHIRasterStateDesc raster{};
        RHIBlendStateDesc blend{};
        const char* label = "";
    };
}
