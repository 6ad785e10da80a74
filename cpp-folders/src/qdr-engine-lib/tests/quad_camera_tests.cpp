#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

#include <glm/glm.hpp>

#include "qdr/app/engine_config.hpp"
#include "qdr/core/env_config.hpp"
#include "qdr/core/log.hpp"
#include "qdr/core/result.hpp"
#include "qdr/graphics/camera2d.hpp"
#include "qdr/graphics/instance_batch.hpp"
#include "qdr/graphics/quad.hpp"
#include "qdr/graphics/quad_geometry.hpp"
#include "qdr/rhi/backend/backend_factory.hpp"

namespace
{
    bool approx_eq(float a, float b, float eps = 1e-4f)
    {
        return std::abs(a - b) <= eps;
    }

    bool approx_eq(glm::vec2 a, glm::vec2 b, float eps = 1e-4f)
    {
        return approx_eq(a.x, b.x, eps) && approx_eq(a.y, b.y, eps);
    }

    glm::vec2 apply(const glm::mat4& m, glm::vec2 local)
    {
        const glm::vec4 p = m * glm::vec4(local, 0.0f, 1.0f);
        return glm::vec2(p) / p.w;
    }

    bool test_quad_transform_unrotated()
    {
        const qdr::Quad q({10.0f, 20.0f}, {4.0f, 2.0f}, 0.0f);
        const glm::mat4& m = q.get_transform();
        return approx_eq(apply(m, {0.0f, 0.0f}), {10.0f, 20.0f}) &&
            approx_eq(apply(m, {1.0f, 0.0f}), {14.0f, 20.0f}) &&
            approx_eq(apply(m, {0.0f, 1.0f}), {10.0f, 22.0f}) &&
            approx_eq(apply(m, {1.0f, 1.0f}), {14.0f, 22.0f});
    }

    bool test_quad_rotates_about_center()
    {
        const qdr::Quad q({10.0f, 20.0f}, {4.0f, 2.0f}, 90.0f);
        const glm::mat4& m = q.get_transform();
        if (!approx_eq(apply(m, {0.0f, 0.0f}), {13.0f, 19.0f})) return false;
        if (!approx_eq(apply(m, {1.0f, 0.0f}), {13.0f, 23.0f})) return false;
        if (!approx_eq(apply(m, {0.0f, 1.0f}), {11.0f, 19.0f})) return false;
        if (!approx_eq(apply(m, {1.0f, 1.0f}), {11.0f, 23.0f})) return false;

        // Төв байрандаа үлдэнэ.
        return approx_eq(apply(m, {0.5f, 0.5f}), {12.0f, 21.0f});
    }

    bool test_quad_transform_cache()
    {
        qdr::Quad q({0.0f, 0.0f}, {2.0f, 2.0f}, 0.0f);
        if (q.is_dirty()) return false;

        q.set_position({5.0f, 6.0f});
        if (!q.is_dirty()) return false;
        if (!approx_eq(apply(q.get_transform(), {0.0f, 0.0f}), {5.0f, 6.0f})) return false;
        if (q.is_dirty()) return false;

        // Mutator дуудаагүй бол дахин дуудалт яг ижил matrix буцаана.
        const glm::mat4 first = q.get_transform();
        const glm::mat4* first_addr = &q.get_transform();
        for (int i = 0; i < 3; ++i)
        {
            if (q.get_transform() != first || &q.get_transform() != first_addr) return false;
        }
        q.set_position({5.0f, 7.0f});
        if (q.get_transform() == first) return false;
        const glm::mat4 second = q.get_transform();
        if (q.get_transform() != second) return false;
        q.set_position({5.0f, 6.0f});

        q.rotate(45.0f);
        q.rotate(45.0f);
        if (!approx_eq(q.rotation(), 90.0f)) return false;
        const glm::mat4 expected = qdr::Quad::compute_transform({5.0f, 6.0f}, {2.0f, 2.0f}, 90.0f);
        if (!approx_eq(apply(q.get_transform(), {1.0f, 0.0f}), apply(expected, {1.0f, 0.0f}))) return false;

        q.set_size({8.0f, 2.0f});
        q.set_rotation(0.0f);
        if (!approx_eq(apply(q.get_transform(), {1.0f, 1.0f}), {13.0f, 8.0f})) return false;

        q.set_depth_index(3);
        return q.depth_index() == 3 && q.is_dirty();
    }

    bool test_camera_maps_pixels_to_ndc()
    {
        const qdr::Camera2D cam(800.0f, 600.0f);
        const glm::mat4& m = cam.to_matrix();
        if (!approx_eq(apply(m, {0.0f, 0.0f}), {-1.0f, 1.0f})) return false;
        if (!approx_eq(apply(m, {800.0f, 600.0f}), {1.0f, -1.0f})) return false;
        if (!approx_eq(apply(m, {400.0f, 300.0f}), {0.0f, 0.0f})) return false;

        const glm::vec4 z = m * glm::vec4(10.0f, 10.0f, 0.0f, 1.0f);
        if (!approx_eq(z.z, 0.0f)) return false;

        qdr::Camera2D resized(800.0f, 600.0f);
        resized.resize(200.0f, 100.0f);
        return approx_eq(resized.width(), 200.0f) && approx_eq(resized.height(), 100.0f) &&
            approx_eq(apply(resized.to_matrix(), {200.0f, 100.0f}), {1.0f, -1.0f});
    }

    bool test_quad_geometry_layout()
    {
        const qdr::RHIVertexBufferLayoutDesc v = qdr::quad_vertex_layout();
        const qdr::RHIVertexBufferLayoutDesc i = qdr::quad_instance_layout();
        if (v.stride != sizeof(qdr::QuadVertex) || v.step != qdr::RHIVertexStepMode::Vertex) return false;
        if (i.stride != sizeof(qdr::QuadInstanceData) || i.step != qdr::RHIVertexStepMode::Instance) return false;
        if (v.attributes.size() != 2u || i.attributes.size() != 7u) return false;

        uint32_t expected_location = 2u;
        for (const auto& a : i.attributes)
        {
            if (a.location != expected_location++) return false;
        }
        if (i.attributes[4].offset != 64u || i.attributes[5].offset != 80u || i.attributes[6].offset != 88u) return false;

        // Хоёр гурвалжин ижил чиглэлтэй.
        const auto& vx = qdr::kQuadVertices;
        const auto& ix = qdr::kQuadIndices;
        auto cross = [&](size_t t) {
            const glm::vec2 a = vx[ix[t]].position;
            const glm::vec2 b = vx[ix[t + 1]].position;
            const glm::vec2 c = vx[ix[t + 2]].position;
            return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
        };
        return (cross(0) > 0.0f) == (cross(3) > 0.0f);
    }

    bool test_batch_key_order()
    {
        const qdr::BatchKey a{0, 5u};
        const qdr::BatchKey b{0, 7u};
        const qdr::BatchKey c{1, 0u};
        const qdr::BatchKey d{-2, 9u};
        return a < b && b < c && d < a && !(b < a) && a == qdr::BatchKey{0, 5u};
    }

    bool test_env_parsers()
    {
        if (!qdr::parse_env_bool("On", false) || qdr::parse_env_bool("no", true)) return false;
        if (qdr::parse_env_bool("maybe", true) != true || qdr::parse_env_bool(nullptr, false)) return false;
        if (qdr::parse_env_u32("256", 1u) != 256u || qdr::parse_env_u32("abc", 7u) != 7u) return false;
        if (qdr::parse_env_u32("0", 7u, 1u) != 1u) return false;

        // Сөрөг, илүү тэмдэгттэй, хэт том утгууд default-аа хадгална.
        if (qdr::parse_env_u32("-5", 1024u, 1u) != 1024u) return false;
        if (qdr::parse_env_u32("-1", 800u, 1u) != 800u) return false;
        if (qdr::parse_env_u32(" -3", 800u, 1u) != 800u) return false;
        if (qdr::parse_env_u32("+12", 800u, 1u) != 800u) return false;
        if (qdr::parse_env_u32("12px", 800u, 1u) != 800u) return false;
        if (qdr::parse_env_u32("4294967296", 9u, 1u) != 9u) return false;
        if (qdr::parse_env_u32("99999999999999999999999", 9u, 1u) != 9u) return false;
        if (qdr::parse_env_u32("2048", 64u, 1u, 1024u) != 64u) return false;
        if (qdr::parse_env_u32(" 42", 1u) != 42u) return false;
        if (qdr::parse_env_u32("4294967295", 1u) != 4294967295u) return false;

        if (qdr::parse_log_level("WARN", qdr::LogLevel::Info) != qdr::LogLevel::Warn) return false;
        if (qdr::parse_log_level("loud", qdr::LogLevel::Info) != qdr::LogLevel::Info) return false;

        if (qdr::parse_render_backend_type("VK") != qdr::RenderBackendType::Vulkan) return false;
        if (qdr::parse_render_backend_type("cpu", qdr::RenderBackendType::Vulkan) != qdr::RenderBackendType::Software) return false;
        return qdr::parse_render_backend_type("metal", qdr::RenderBackendType::Vulkan) == qdr::RenderBackendType::Vulkan;
    }

    bool test_engine_config_env_overrides()
    {
        ::setenv("QDR_BACKEND", "software", 1);
        ::setenv("QDR_WINDOW_W", "1280", 1);
        ::setenv("QDR_WINDOW_H", "bogus", 1);
        ::setenv("QDR_BATCH_CAPACITY_HINT", "64", 1);
        ::setenv("QDR_VK_PRESENT_MODE", "mailbox", 1);
        ::setenv("QDR_LOG_LEVEL", "off", 1);

        const qdr::EngineConfig cfg = qdr::load_engine_config_from_env();

        ::setenv("QDR_WINDOW_W", "-1", 1);
        ::setenv("QDR_WINDOW_H", "100000", 1);
        ::setenv("QDR_BATCH_CAPACITY_HINT", "-5", 1);
        const qdr::EngineConfig bad = qdr::load_engine_config_from_env();

        ::unsetenv("QDR_BACKEND");
        ::unsetenv("QDR_WINDOW_W");
        ::unsetenv("QDR_WINDOW_H");
        ::unsetenv("QDR_BATCH_CAPACITY_HINT");
        ::unsetenv("QDR_VK_PRESENT_MODE");
        ::unsetenv("QDR_LOG_LEVEL");

        return cfg.backend == qdr::RenderBackendType::Software &&
            cfg.window_width == 1280u &&
            cfg.window_height == 600u &&
            cfg.renderer.batch_capacity_hint == 64u &&
            cfg.vk_present_mode == "mailbox" &&
            qdr::log_level() == qdr::LogLevel::Off &&
            bad.window_width == 800u &&
            bad.window_height == 600u &&
            bad.renderer.batch_capacity_hint == qdr::RendererConfig{}.batch_capacity_hint;
    }

    bool test_software_factory_fallback()
    {
        qdr::GpuBackendCreateDesc desc{};
        desc.width = 32;
        desc.height = 16;

        const qdr::GpuBackendCreateResult sw = qdr::create_gpu_backend(qdr::RenderBackendType::Software, desc);
        if (!sw.backend || sw.active != qdr::RenderBackendType::Software) return false;
        if (sw.backend->surface_width() != 32u || sw.backend->surface_height() != 16u) return false;

        // Цонхгүй үед Vulkan init бүтэлгүйтэж software руу буцна.
        const qdr::GpuBackendCreateResult vk = qdr::create_gpu_backend("vulkan", desc);
        return vk.backend && vk.requested == qdr::RenderBackendType::Vulkan &&
            vk.active == qdr::RenderBackendType::Software && !vk.note.empty();
    }

    bool test_error_kind_names()
    {
        return std::string(qdr::error_kind_name(qdr::ErrorKind::UnregisteredLoader)) == "unregistered_loader" &&
            qdr::error_category(qdr::ErrorKind::DecodeFailed) == qdr::ErrorCategory::Load &&
            std::string(qdr::surface_status_name(qdr::SurfaceStatus::Outdated)) == "outdated" &&
            qdr::surface_status_is_transient(qdr::SurfaceStatus::Suboptimal) &&
            !qdr::surface_status_is_transient(qdr::SurfaceStatus::Timeout);
    }
}

int main()
{
    qdr::set_log_level(qdr::LogLevel::Off);

    const bool ok_plain = test_quad_transform_unrotated();
    const bool ok_rot = test_quad_rotates_about_center();
    const bool ok_cache = test_quad_transform_cache();
    const bool ok_cam = test_camera_maps_pixels_to_ndc();
    const bool ok_geo = test_quad_geometry_layout();
    const bool ok_key = test_batch_key_order();
    const bool ok_env = test_env_parsers();
    const bool ok_cfg = test_engine_config_env_overrides();
    const bool ok_factory = test_software_factory_fallback();
    const bool ok_names = test_error_kind_names();

    if (!ok_plain) std::fprintf(stderr, "[quad-tests] unrotated transform failed\n");
    if (!ok_rot) std::fprintf(stderr, "[quad-tests] centered rotation failed\n");
    if (!ok_cache) std::fprintf(stderr, "[quad-tests] transform cache failed\n");
    if (!ok_cam) std::fprintf(stderr, "[quad-tests] camera projection failed\n");
    if (!ok_geo) std::fprintf(stderr, "[quad-tests] quad geometry layout failed\n");
    if (!ok_key) std::fprintf(stderr, "[quad-tests] batch key order failed\n");
    if (!ok_env) std::fprintf(stderr, "[quad-tests] env parsers failed\n");
    if (!ok_cfg) std::fprintf(stderr, "[quad-tests] engine config overrides failed\n");
    if (!ok_factory) std::fprintf(stderr, "[quad-tests] backend factory fallback failed\n");
    if (!ok_names) std::fprintf(stderr, "[quad-tests] error/status names failed\n");

    if (!(ok_plain && ok_rot && ok_cache && ok_cam && ok_geo && ok_key && ok_env && ok_cfg &&
          ok_factory && ok_names)) return 1;
    std::fprintf(stderr, "[quad-tests] all tests passed\n");
    return 0;
}
