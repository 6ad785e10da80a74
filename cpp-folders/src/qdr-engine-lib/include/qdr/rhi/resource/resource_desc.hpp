#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: resource_desc.hpp
    МОДУЛЬ: rhi/resource
    ЗОРИЛГО: Buffer/Texture/Sampler resource descriptor-уудыг backend-neutral хэлбэрт оруулна.
            Backend бүр өөрийн handle-ийг uint64_t утгаар буцаана (0 = null).
*/


#include <cstdint>

namespace qdr
{
    using RHIBufferHandle = uint64_t;
    using RHITextureHandle = uint64_t;
    using RHISamplerHandle = uint64_t;
    using RHIBindGroupHandle = uint64_t;
    using RHIPipelineHandle = uint64_t;

    constexpr uint64_t kNullRHIHandle = 0;

    enum class RHIFormat : uint16_t
    {
        Unknown = 0,
        RGBA8_UNorm = 1,
        BGRA8_UNorm = 2,
        RGBA8_SRGB = 3,
        BGRA8_SRGB = 4
    };

    inline uint32_t rhi_format_bytes_per_pixel(RHIFormat format)
    {
        switch (format)
        {
            case RHIFormat::RGBA8_UNorm:
            case RHIFormat::BGRA8_UNorm:
            case RHIFormat::RGBA8_SRGB:
            case RHIFormat::BGRA8_SRGB: return 4u;
            case RHIFormat::Unknown: break;
        }
        return 0u;
    }

    enum class RHIMemoryClass : uint8_t
    {
        Auto = 0,
        CPUVisible = 1,
        GPUOnly = 2
    };

    enum RHIBufferUsageBits : uint32_t
    {
        RHIBufferUsage_None = 0,
        RHIBufferUsage_Vertex = 1u << 0u,
        RHIBufferUsage_Index = 1u << 1u,
        RHIBufferUsage_Uniform = 1u << 2u,
        RHIBufferUsage_TransferDst = 1u << 3u
    };

    struct RHIBufferDesc
    {
        uint64_t size_bytes = 0;
        uint32_t usage = RHIBufferUsage_None;
        RHIMemoryClass memory = RHIMemoryClass::CPUVisible;
        const char* label = "";
    };

    struct RHITextureDesc
    {
        uint32_t width = 0;
        uint32_t height = 0;
        RHIFormat format = RHIFormat::RGBA8_UNorm;
        const char* label = "";
    };

    enum class RHIFilter : uint8_t
    {
        Nearest = 0,
        Linear = 1
    };

    enum class RHIAddressMode : uint8_t
    {
        ClampToEdge = 0,
        Repeat = 1,
        MirrorRepeat = 2
    };

    struct RHISamplerDesc
    {
        RHIFilter min_filter = RHIFilter::Linear;
        RHIFilter mag_filter = RHIFilter::Linear;
        RHIAddressMode address_u = RHIAddressMode::ClampToEdge;
        RHIAddressMode address_v = RHIAddressMode::ClampToEdge;
    };
}
