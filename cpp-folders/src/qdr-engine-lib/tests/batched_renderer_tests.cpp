#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "qdr/assets/asset_registry.hpp"
#include "qdr/assets/texture.hpp"
#include "qdr/core/log.hpp"
#include "qdr/graphics/batched_renderer.hpp"
#include "qdr/graphics/camera2d.hpp"
#include "qdr/graphics/quad.hpp"
#include "qdr/rhi/drivers/software/sw_gpu_backend.hpp"

namespace
{
    constexpr uint32_t kW = 64;
    constexpr uint32_t kH = 64;
    const glm::vec4 kBlack{0.0f, 0.0f, 0.0f, 1.0f};

    qdr::AssetHandle<qdr::Texture2D> load_rgba(
        qdr::SharedAssetRegistry& assets,
        const std::vector<uint8_t>& px,
        uint32_t w,
        uint32_t h)
    {
        auto reg = assets.write();
        const auto r = reg->load<qdr::Texture2D, qdr::RawRgbaImageData>(qdr::RawRgbaImageData{px, w, h});
        return r.ok ? r.value : qdr::AssetHandle<qdr::Texture2D>(0xffffffffu);
    }

    qdr::RHIBindGroupHandle bind_group_of(qdr::SharedAssetRegistry& assets, qdr::AssetHandle<qdr::Texture2D> h)
    {
        const auto reg = assets.read();
        const qdr::Texture2D* tex = reg->try_get(h);
        return tex ? tex->bind_group() : qdr::kNullRHIHandle;
    }

    bool px_eq(glm::u8vec4 got, glm::u8vec4 want, int tol = 1)
    {
        for (int i = 0; i < 4; ++i)
        {
            if (std::abs((int)got[i] - (int)want[i]) > tol) return false;
        }
        return true;
    }

    bool test_construction_creates_shared_objects()
    {
        qdr::SoftwareGpuBackend backend(kW, kH, false);
        qdr::SharedAssetRegistry assets{};
        {
            qdr::BatchedRenderer renderer(backend, assets);
            if (renderer.state() != qdr::RendererState::Idle) return false;
            // camera uniform, quad vertices, quad indices
            if (backend.live_buffer_count() != 3u) return false;

            const auto reg = assets.read();
            if (!reg->contains<qdr::Texture2D>()) return false;
            const qdr::Texture2D* white = reg->try_get(renderer.white_texture());
            if (!white || white->width() != 1u || white->height() != 1u) return false;
        }
        return backend.live_buffer_count() == 0u;
    }

    bool test_recording_state_machine()
    {
        qdr::SoftwareGpuBackend backend(kW, kH, false);
        qdr::SharedAssetRegistry assets{};
        qdr::BatchedRenderer renderer(backend, assets);
        const qdr::Camera2D camera((float)kW, (float)kH);
        const qdr::Quad quad({0.0f, 0.0f}, {8.0f, 8.0f}, 0.0f);

        if (renderer.draw_quad(quad)) return false;
        if (renderer.submit() != qdr::FrameSubmitResult::NotRecording) return false;
        if (backend.stats().frames_acquired != 0u) return false;

        renderer.begin(kBlack, camera);
        if (renderer.state() != qdr::RendererState::Recording) return false;
        if (!renderer.draw_quad(quad) || !renderer.draw_quad(quad)) return false;

        // Дахин begin хийвэл өмнөх хүсэлтүүд хаягдана.
        renderer.begin(kBlack, camera);
        if (!renderer.draw_quad(quad)) return false;
        if (renderer.submit() != qdr::FrameSubmitResult::Presented) return false;
        if (renderer.state() != qdr::RendererState::Idle) return false;
        if (renderer.last_frame_stats().instances != 1u) return false;

        return !renderer.draw_quad(quad) && renderer.submit() == qdr::FrameSubmitResult::NotRecording;
    }

    bool test_batches_follow_depth_then_texture()
    {
        qdr::SoftwareGpuBackend backend(kW, kH, false);
        qdr::SharedAssetRegistry assets{};
        qdr::BatchedRenderer renderer(backend, assets);
        const qdr::Camera2D camera((float)kW, (float)kH);

        const std::vector<uint8_t> red = {255, 0, 0, 255};
        const std::vector<uint8_t> green = {0, 255, 0, 255};
        const auto tex_a = load_rgba(assets, red, 1, 1);
        const auto tex_b = load_rgba(assets, green, 1, 1);
        const auto white = renderer.white_texture();
        if (!(white < tex_a) || !(tex_a < tex_b)) return false;

        renderer.begin(kBlack, camera);
        renderer.draw_quad_textured(qdr::Quad({0.0f, 0.0f}, {4.0f, 4.0f}, 0.0f, 0), tex_b);
        renderer.draw_quad_textured(qdr::Quad({0.0f, 0.0f}, {4.0f, 4.0f}, 0.0f, 1), tex_a);
        renderer.draw_quad(qdr::Quad({0.0f, 0.0f}, {4.0f, 4.0f}, 0.0f, 0));
        renderer.draw_quad_textured(qdr::Quad({0.0f, 0.0f}, {4.0f, 4.0f}, 0.0f, 0), tex_a);
        renderer.draw_quad_textured(qdr::Quad({8.0f, 0.0f}, {4.0f, 4.0f}, 0.0f, 0), tex_a);
        if (renderer.batch_count() != 4u) return false;
        if (renderer.submit() != qdr::FrameSubmitResult::Presented) return false;

        const qdr::FrameStats& st = renderer.last_frame_stats();
        if (st.batches_drawn != 4u || st.draw_calls != 4u || st.instances != 5u || st.batches_skipped != 0u) return false;

        std::vector<qdr::RHIBindGroupHandle> groups{};
        std::vector<uint32_t> instance_counts{};
        const auto& cmds = backend.commands();
        if (cmds.empty() || cmds.front().type != qdr::RecordedCommandType::BeginRenderPass) return false;
        if (cmds.back().type != qdr::RecordedCommandType::EndRenderPass) return false;
        for (const qdr::RecordedCommand& c : cmds)
        {
            if (c.type == qdr::RecordedCommandType::BindGroup && c.slot == 1u) groups.push_back(c.handle);
            if (c.type == qdr::RecordedCommandType::DrawIndexed)
            {
                if (c.index_count != 6u) return false;
                instance_counts.push_back(c.instance_count);
            }
        }

        const std::vector<qdr::RHIBindGroupHandle> want_groups = {
            bind_group_of(assets, white),
            bind_group_of(assets, tex_a),
            bind_group_of(assets, tex_b),
            bind_group_of(assets, tex_a)};
        const std::vector<uint32_t> want_counts = {1u, 2u, 1u, 1u};
        if (groups != want_groups || instance_counts != want_counts) return false;

        const qdr::InstanceBatch* a0 = renderer.find_batch(tex_a, 0);
        return a0 && a0->count() == 2u && renderer.find_batch(tex_b, 1) == nullptr;
    }

    bool test_instance_buffer_reuse()
    {
        qdr::SoftwareGpuBackend backend(kW, kH, false);
        qdr::SharedAssetRegistry assets{};
        qdr::BatchedRenderer renderer(backend, assets);
        const qdr::Camera2D camera((float)kW, (float)kH);
        const auto white = renderer.white_texture();

        auto frame = [&](int n) {
            renderer.begin(kBlack, camera);
            for (int i = 0; i < n; ++i)
            {
                renderer.draw_quad(qdr::Quad({(float)i, 0.0f}, {1.0f, 1.0f}, 0.0f));
            }
            return renderer.submit();
        };

        if (frame(3) != qdr::FrameSubmitResult::Presented) return false;
        const qdr::InstanceBatch* batch = renderer.find_batch(white, 0);
        if (!batch || renderer.last_frame_stats().buffer_reallocations != 1u) return false;
        const qdr::RHIBufferHandle first = batch->gpu_buffer();
        if (batch->gpu_capacity() != 3u || backend.buffer_size(first) != 3u * sizeof(qdr::QuadInstanceData)) return false;

        // Багтаж байвал ижил buffer дээр дарж бичнэ.
        if (frame(2) != qdr::FrameSubmitResult::Presented) return false;
        if (renderer.last_frame_stats().buffer_reallocations != 0u) return false;
        if (batch->gpu_buffer() != first || batch->gpu_capacity() != 3u) return false;

        if (frame(5) != qdr::FrameSubmitResult::Presented) return false;
        if (renderer.last_frame_stats().buffer_reallocations != 1u) return false;
        if (batch->gpu_capacity() != 5u) return false;
        if (backend.buffer_size(batch->gpu_buffer()) != 5u * sizeof(qdr::QuadInstanceData)) return false;
        // Хуучин buffer чөлөөлөгдсөн.
        if (backend.buffer_size(first).has_value()) return false;
        if (backend.live_buffer_count() != 4u) return false;

        // Хоосон batch draw call гаргахгүй, buffer-ээ хадгална.
        renderer.begin(kBlack, camera);
        if (renderer.submit() != qdr::FrameSubmitResult::Presented) return false;
        return renderer.last_frame_stats().draw_calls == 0u && batch->gpu_capacity() == 5u;
    }

    bool test_unresolvable_texture_is_skipped()
    {
        qdr::SoftwareGpuBackend backend(kW, kH, false);
        qdr::SharedAssetRegistry assets{};
        qdr::BatchedRenderer renderer(backend, assets);
        const qdr::Camera2D camera((float)kW, (float)kH);

        renderer.begin(kBlack, camera);
        renderer.draw_quad_textured(qdr::Quad({0.0f, 0.0f}, {4.0f, 4.0f}, 0.0f), qdr::AssetHandle<qdr::Texture2D>(999u));
        renderer.draw_quad(qdr::Quad({0.0f, 0.0f}, {4.0f, 4.0f}, 0.0f));
        if (renderer.submit() != qdr::FrameSubmitResult::Presented) return false;

        const qdr::FrameStats& st = renderer.last_frame_stats();
        return st.batches_skipped == 1u && st.batches_drawn == 1u && st.instances == 1u;
    }

    bool test_surface_status_handling()
    {
        qdr::SoftwareGpuBackend backend(kW, kH, false);
        qdr::SharedAssetRegistry assets{};
        qdr::BatchedRenderer renderer(backend, assets);
        const qdr::Camera2D camera((float)kW, (float)kH);

        auto frame = [&]() {
            renderer.begin(kBlack, camera);
            renderer.draw_quad(qdr::Quad({0.0f, 0.0f}, {4.0f, 4.0f}, 0.0f));
            return renderer.submit();
        };

        backend.inject_acquire_status(qdr::SurfaceStatus::Outdated);
        if (frame() != qdr::FrameSubmitResult::SurfaceReconfigured) return false;
        if (backend.stats().surface_configures != 1u || backend.stats().frames_presented != 0u) return false;

        backend.inject_acquire_status(qdr::SurfaceStatus::Lost);
        if (frame() != qdr::FrameSubmitResult::SurfaceReconfigured) return false;
        if (backend.stats().surface_configures != 2u) return false;

        backend.inject_acquire_status(qdr::SurfaceStatus::Timeout);
        if (frame() != qdr::FrameSubmitResult::Skipped) return false;

        backend.inject_acquire_status(qdr::SurfaceStatus::DeviceLost);
        if (frame() != qdr::FrameSubmitResult::Failed) return false;

        if (frame() != qdr::FrameSubmitResult::Presented) return false;
        if (backend.stats().frames_presented != 1u) return false;

        // Suboptimal present: фрэйм гарсан, дараагийн submit эхлээд surface-ээ тохируулна.
        backend.inject_present_status(qdr::SurfaceStatus::Suboptimal);
        if (frame() != qdr::FrameSubmitResult::Presented) return false;
        if (backend.stats().surface_configures != 2u) return false;
        if (frame() != qdr::FrameSubmitResult::Presented) return false;
        if (backend.stats().surface_configures != 3u) return false;

        backend.inject_present_status(qdr::SurfaceStatus::Failed);
        if (frame() != qdr::FrameSubmitResult::Failed) return false;

        renderer.on_resize(128u, 96u);
        if (backend.surface_width() != 128u || backend.surface_height() != 96u) return false;
        renderer.on_resize(0u, 96u);
        return backend.surface_width() == 128u && frame() == qdr::FrameSubmitResult::Presented;
    }

    bool test_rasterized_solid_quad()
    {
        qdr::SoftwareGpuBackend backend(kW, kH, true);
        qdr::SharedAssetRegistry assets{};
        qdr::BatchedRenderer renderer(backend, assets);
        const qdr::Camera2D camera((float)kW, (float)kH);

        qdr::Quad quad({16.0f, 16.0f}, {32.0f, 32.0f}, 0.0f);
        quad.color = glm::vec4(1.0f, 0.0f, 0.0f, 1.0f);

        renderer.begin(kBlack, camera);
        renderer.draw_quad(quad);
        if (renderer.submit() != qdr::FrameSubmitResult::Presented) return false;

        const glm::u8vec4 red(255, 0, 0, 255);
        const glm::u8vec4 black(0, 0, 0, 255);
        if (!px_eq(backend.pixel(32, 20), red)) return false;
        if (!px_eq(backend.pixel(17, 46), red)) return false;
        if (!px_eq(backend.pixel(4, 4), black)) return false;
        if (!px_eq(backend.pixel(60, 30), black)) return false;
        // y тэнхлэг доошоо: quad дээд хэсэгт байхгүй.
        return px_eq(backend.pixel(32, 8), black) && px_eq(backend.pixel(32, 56), black);
    }

    bool test_higher_depth_draws_on_top()
    {
        qdr::SoftwareGpuBackend backend(kW, kH, true);
        qdr::SharedAssetRegistry assets{};
        qdr::BatchedRenderer renderer(backend, assets);
        const qdr::Camera2D camera((float)kW, (float)kH);

        qdr::Quad front({0.0f, 0.0f}, {40.0f, 40.0f}, 0.0f, 1);
        front.color = glm::vec4(1.0f, 0.0f, 0.0f, 1.0f);
        qdr::Quad back({20.0f, 20.0f}, {40.0f, 40.0f}, 0.0f, 0);
        back.color = glm::vec4(0.0f, 0.0f, 1.0f, 1.0f);

        renderer.begin(kBlack, camera);
        renderer.draw_quad(front);
        renderer.draw_quad(back);
        if (renderer.submit() != qdr::FrameSubmitResult::Presented) return false;

        return px_eq(backend.pixel(30, 25), glm::u8vec4(255, 0, 0, 255)) &&
            px_eq(backend.pixel(50, 45), glm::u8vec4(0, 0, 255, 255)) &&
            px_eq(backend.pixel(5, 30), glm::u8vec4(255, 0, 0, 255));
    }

    bool test_textured_quad_uv_mapping()
    {
        qdr::SoftwareGpuBackend backend(kW, kH, true);
        qdr::SharedAssetRegistry assets{};
        qdr::BatchedRenderer renderer(backend, assets);
        const qdr::Camera2D camera((float)kW, (float)kH);

        // 2x2: дээд мөр улаан/ногоон, доод мөр цэнхэр/цагаан
        const std::vector<uint8_t> px = {
            255, 0, 0, 255,     0, 255, 0, 255,
            0, 0, 255, 255,     255, 255, 255, 255};
        const auto tex = load_rgba(assets, px, 2, 2);

        renderer.begin(kBlack, camera);
        renderer.draw_quad_textured(qdr::Quad({0.0f, 0.0f}, {64.0f, 64.0f}, 0.0f), tex);
        if (renderer.submit() != qdr::FrameSubmitResult::Presented) return false;

        if (!px_eq(backend.pixel(10, 20), glm::u8vec4(255, 0, 0, 255))) return false;
        if (!px_eq(backend.pixel(50, 10), glm::u8vec4(0, 255, 0, 255))) return false;
        if (!px_eq(backend.pixel(10, 50), glm::u8vec4(0, 0, 255, 255))) return false;
        if (!px_eq(backend.pixel(50, 40), glm::u8vec4(255, 255, 255, 255))) return false;

        // Sprite sheet-ийн (1,1) нүд: quad бүхэлдээ цагаан texel-ийг харуулна.
        const qdr::SpriteSheetCoordinates sheet(2u, 2u, 1u, 1u);
        const auto cell = sheet.get_coords(1u, 1u);
        if (!cell) return false;

        renderer.begin(kBlack, camera);
        renderer.draw_quad_textured(qdr::Quad({0.0f, 0.0f}, {64.0f, 64.0f}, 0.0f), tex, *cell);
        if (renderer.submit() != qdr::FrameSubmitResult::Presented) return false;
        return px_eq(backend.pixel(10, 20), glm::u8vec4(255, 255, 255, 255)) &&
            px_eq(backend.pixel(50, 10), glm::u8vec4(255, 255, 255, 255));
    }

    bool test_alpha_blending()
    {
        qdr::SoftwareGpuBackend backend(kW, kH, true);
        qdr::SharedAssetRegistry assets{};
        qdr::BatchedRenderer renderer(backend, assets);
        const qdr::Camera2D camera((float)kW, (float)kH);

        qdr::Quad quad({0.0f, 0.0f}, {64.0f, 64.0f}, 0.0f);
        quad.color = glm::vec4(1.0f, 1.0f, 1.0f, 0.5f);

        renderer.begin(kBlack, camera);
        renderer.draw_quad(quad);
        if (renderer.submit() != qdr::FrameSubmitResult::Presented) return false;
        return px_eq(backend.pixel(40, 20), glm::u8vec4(128, 128, 128, 255));
    }

    bool test_clear_color_applied()
    {
        qdr::SoftwareGpuBackend backend(kW, kH, true);
        qdr::SharedAssetRegistry assets{};
        qdr::BatchedRenderer renderer(backend, assets);
        const qdr::Camera2D camera((float)kW, (float)kH);

        renderer.begin(glm::vec4(0.0f, 1.0f, 0.0f, 1.0f), camera);
        if (renderer.submit() != qdr::FrameSubmitResult::Presented) return false;
        return px_eq(backend.pixel(0, 0), glm::u8vec4(0, 255, 0, 255)) &&
            px_eq(backend.pixel(63, 63), glm::u8vec4(0, 255, 0, 255)) &&
            renderer.last_frame_stats().draw_calls == 0u;
    }
    bool test_construction_failure_releases_buffers()
    {
        qdr::SoftwareGpuBackend backend(kW, kH, false);
        qdr::SharedAssetRegistry assets{};

        // Camera uniform үүснэ, vertex buffer бүтэлгүйтнэ.
        backend.inject_failure(qdr::SoftwareFailPoint::CreateBuffer, 1u);
        bool threw = false;
        try
        {
            qdr::BatchedRenderer renderer(backend, assets);
        }
        catch (const std::runtime_error&)
        {
            threw = true;
        }
        if (!threw || backend.live_buffer_count() != 0u) return false;

        // Бүх buffer үүссэний дараа цагаан texture-ийн sampler бүтэлгүйтнэ.
        backend.inject_failure(qdr::SoftwareFailPoint::CreateSampler);
        threw = false;
        try
        {
            qdr::BatchedRenderer renderer(backend, assets);
        }
        catch (const std::runtime_error&)
        {
            threw = true;
        }
        if (!threw || backend.live_buffer_count() != 0u || backend.live_texture_count() != 0u) return false;

        qdr::BatchedRenderer renderer(backend, assets);
        return backend.live_buffer_count() == 3u;
    }

    bool test_solid_quad_instance_data()
    {
        qdr::SoftwareGpuBackend backend(kW, kH, false);
        qdr::SharedAssetRegistry assets{};
        qdr::BatchedRenderer renderer(backend, assets);
        const qdr::Camera2D camera((float)kW, (float)kH);

        qdr::Quad quad({10.0f, 10.0f}, {20.0f, 20.0f}, 0.0f);
        quad.color = glm::vec4(1.0f, 0.0f, 0.0f, 1.0f);

        renderer.begin(kBlack, camera);
        if (!renderer.draw_quad(quad)) return false;

        const qdr::InstanceBatch* batch = renderer.find_batch(renderer.white_texture(), 0);
        if (!batch || batch->count() != 1u) return false;
        const qdr::QuadInstanceData& inst = batch->instances()[0];
        if (inst.tex_coords_offset != glm::vec2(0.0f, 0.0f)) return false;
        if (inst.tex_coords_size != glm::vec2(1.0f, 1.0f)) return false;
        if (inst.color != quad.color) return false;
        if (inst.model != quad.get_transform()) return false;

        return renderer.submit() == qdr::FrameSubmitResult::Presented &&
            renderer.last_frame_stats().instances == 1u;
    }

    bool test_negative_depth_drawn_first()
    {
        qdr::SoftwareGpuBackend backend(kW, kH, false);
        qdr::SharedAssetRegistry assets{};
        qdr::BatchedRenderer renderer(backend, assets);
        const qdr::Camera2D camera((float)kW, (float)kH);

        // depth 0 дээр хоёр, -100 дээр нэг quad; нэг ижил texture.
        renderer.begin(kBlack, camera);
        renderer.draw_quad(qdr::Quad({0.0f, 0.0f}, {4.0f, 4.0f}, 0.0f, 0));
        renderer.draw_quad(qdr::Quad({8.0f, 0.0f}, {4.0f, 4.0f}, 0.0f, 0));
        renderer.draw_quad(qdr::Quad({16.0f, 0.0f}, {4.0f, 4.0f}, 0.0f, -100));
        if (renderer.batch_count() != 2u) return false;
        if (renderer.submit() != qdr::FrameSubmitResult::Presented) return false;

        std::vector<uint32_t> instance_counts{};
        for (const qdr::RecordedCommand& c : backend.commands())
        {
            if (c.type == qdr::RecordedCommandType::DrawIndexed) instance_counts.push_back(c.instance_count);
        }
        const std::vector<uint32_t> want_counts = {1u, 2u};
        return instance_counts == want_counts && renderer.last_frame_stats().draw_calls == 2u;
    }

    bool test_failed_frame_releases_acquired_image()
    {
        qdr::SoftwareGpuBackend backend(kW, kH, false);
        qdr::SharedAssetRegistry assets{};
        qdr::BatchedRenderer renderer(backend, assets);
        const qdr::Camera2D camera((float)kW, (float)kH);

        auto frame = [&]() {
            renderer.begin(kBlack, camera);
            renderer.draw_quad(qdr::Quad({0.0f, 0.0f}, {4.0f, 4.0f}, 0.0f));
            return renderer.submit();
        };

        // Camera uniform upload бүтэлгүйтнэ.
        backend.inject_failure(qdr::SoftwareFailPoint::WriteBuffer);
        if (frame() != qdr::FrameSubmitResult::Failed) return false;
        if (renderer.state() != qdr::RendererState::Idle) return false;
        if (backend.stats().frames_aborted != 1u || backend.stats().frames_submitted != 0u) return false;
        if (frame() != qdr::FrameSubmitResult::Presented) return false;
        if (backend.stats().frames_presented != 1u) return false;

        backend.inject_failure(qdr::SoftwareFailPoint::SubmitFrame);
        if (frame() != qdr::FrameSubmitResult::Failed) return false;
        if (renderer.state() != qdr::RendererState::Idle) return false;
        if (backend.stats().frames_aborted != 2u || backend.stats().frames_presented != 1u) return false;
        if (frame() != qdr::FrameSubmitResult::Presented) return false;

        return backend.stats().frames_presented == 2u && backend.stats().frames_aborted == 2u;
    }
}

int main()
{
    qdr::set_log_level(qdr::LogLevel::Off);

    const bool ok_ctor = test_construction_creates_shared_objects();
    const bool ok_state = test_recording_state_machine();
    const bool ok_order = test_batches_follow_depth_then_texture();
    const bool ok_reuse = test_instance_buffer_reuse();
    const bool ok_skip = test_unresolvable_texture_is_skipped();
    const bool ok_surface = test_surface_status_handling();
    const bool ok_solid = test_rasterized_solid_quad();
    const bool ok_depth = test_higher_depth_draws_on_top();
    const bool ok_uv = test_textured_quad_uv_mapping();
    const bool ok_blend = test_alpha_blending();
    const bool ok_clear = test_clear_color_applied();
    const bool ok_ctor_fail = test_construction_failure_releases_buffers();
    const bool ok_inst = test_solid_quad_instance_data();
    const bool ok_neg_depth = test_negative_depth_drawn_first();
    const bool ok_abort = test_failed_frame_releases_acquired_image();

    if (!ok_ctor) std::fprintf(stderr, "[renderer-tests] construction failed\n");
    if (!ok_state) std::fprintf(stderr, "[renderer-tests] recording state machine failed\n");
    if (!ok_order) std::fprintf(stderr, "[renderer-tests] batch ordering failed\n");
    if (!ok_reuse) std::fprintf(stderr, "[renderer-tests] instance buffer reuse failed\n");
    if (!ok_skip) std::fprintf(stderr, "[renderer-tests] unresolvable texture skip failed\n");
    if (!ok_surface) std::fprintf(stderr, "[renderer-tests] surface status handling failed\n");
    if (!ok_solid) std::fprintf(stderr, "[renderer-tests] solid quad raster failed\n");
    if (!ok_depth) std::fprintf(stderr, "[renderer-tests] depth ordering failed\n");
    if (!ok_uv) std::fprintf(stderr, "[renderer-tests] uv mapping failed\n");
    if (!ok_blend) std::fprintf(stderr, "[renderer-tests] alpha blending failed\n");
    if (!ok_clear) std::fprintf(stderr, "[renderer-tests] clear color failed\n");
    if (!ok_ctor_fail) std::fprintf(stderr, "[renderer-tests] construction failure cleanup failed\n");
    if (!ok_inst) std::fprintf(stderr, "[renderer-tests] solid quad instance data failed\n");
    if (!ok_neg_depth) std::fprintf(stderr, "[renderer-tests] negative depth ordering failed\n");
    if (!ok_abort) std::fprintf(stderr, "[renderer-tests] failed frame recovery failed\n");

    if (!(ok_ctor && ok_state && ok_order && ok_reuse && ok_skip && ok_surface && ok_solid &&
          ok_depth && ok_uv && ok_blend && ok_clear && ok_ctor_fail && ok_inst && ok_neg_depth && ok_abort)) return 1;
    std::fprintf(stderr, "[renderer-tests] all tests passed\n");
    return 0;
}
