#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: quad_geometry.hpp
    МОДУЛЬ: graphics
    ЗОРИЛГО: Бүх quad-ийн хуваалцдаг unit geometry (4 vertex, 6 index) болон
            instance бүрийн GPU record. Vertex layout нь shaders/quad.vert-тэй таарна.
*/


#include <array>
#include <cstddef>
#include <cstdint>

#include <glm/glm.hpp>

#include "qdr/rhi/pipeline/pipeline_desc.hpp"

namespace qdr
{
    struct QuadVertex
    {
        glm::vec2 position{0.0f};
        glm::vec2 tex_coords{0.0f};
    };
    static_assert(sizeof(QuadVertex) == 16, "QuadVertex layout");

    struct QuadInstanceData
    {
        glm::mat4 model{1.0f};
        glm::vec4 color{1.0f};
        glm::vec2 tex_coords_size{1.0f, 1.0f};
        glm::vec2 tex_coords_offset{0.0f, 0.0f};
    };
    static_assert(sizeof(QuadInstanceData) == 96, "QuadInstanceData must stay tightly packed");

    inline const std::array<QuadVertex, 4> kQuadVertices = {{
        {{0.0f, 0.0f}, {0.0f, 0.0f}},
        {{0.0f, 1.0f}, {0.0f, 1.0f}},
        {{1.0f, 1.0f}, {1.0f, 1.0f}},
        {{1.0f, 0.0f}, {1.0f, 0.0f}},
    }};

    inline constexpr std::array<uint16_t, 6> kQuadIndices = {0, 1, 2, 2, 3, 0};

    // location 0..1
    inline RHIVertexBufferLayoutDesc quad_vertex_layout()
    {
        RHIVertexBufferLayoutDesc l{};
        l.stride = sizeof(QuadVertex);
        l.step = RHIVertexStepMode::Vertex;
        l.attributes = {
            {0u, (uint32_t)offsetof(QuadVertex, position), RHIVertexFormat::Float2},
            {1u, (uint32_t)offsetof(QuadVertex, tex_coords), RHIVertexFormat::Float2},
        };
        return l;
    }

    // location 2..5 model багана, 6 color, 7 uv size, 8 uv offset
    inline RHIVertexBufferLayoutDesc quad_instance_layout()
    {
        RHIVertexBufferLayoutDesc l{};
        l.stride = sizeof(QuadInstanceData);
        l.step = RHIVertexStepMode::Instance;
        l.attributes = {
            {2u, 0u, RHIVertexFormat::Float4},
            {3u, 16u, RHIVertexFormat::Float4},
            {4u, 32u, RHIVertexFormat::Float4},
            {5u, 48u, RHIVertexFormat::Float4},
            {6u, (uint32_t)offsetof(QuadInstanceData, color), RHIVertexFormat::Float4},
            {7u, (uint32_t)offsetof(QuadInstanceData, tex_coords_size), RHIVertexFormat::Float2},
            {8u, (uint32_t)offsetof(QuadInstanceData, tex_coords_offset), RHIVertexFormat::Float2},
        };
        return l;
    }
}
