/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: hello_quads.cpp
    МОДУЛЬ: hello-quads
    ЗОРИЛГО: BatchedRenderer-ийн demo: эргэдэг өнгөт quad-ууд, sprite sheet анимац,
            хоёр өөр depth давхарга. QDR_BACKEND=software|vulkan.
            Эхний аргументаар sprite sheet зураг өгч болно.
*/

#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "qdr/app/engine_config.hpp"
#include "qdr/assets/asset_registry.hpp"
#include "qdr/assets/loaders/texture_loader.hpp"
#include "qdr/assets/texture.hpp"
#include "qdr/core/log.hpp"
#include "qdr/core/time.hpp"
#include "qdr/graphics/batched_renderer.hpp"
#include "qdr/graphics/camera2d.hpp"
#include "qdr/graphics/quad.hpp"
#include "qdr/platform/sdl/sdl_window_runtime.hpp"
#include "qdr/rhi/backend/backend_factory.hpp"
#include "qdr/rhi/drivers/software/sw_gpu_backend.hpp"

namespace
{
    constexpr uint32_t kCellPx = 16;
    constexpr uint32_t kSheetCols = 4;
    constexpr uint32_t kSheetRows = 2;
    constexpr float kFrameSeconds = 0.12f;
    constexpr int kGridCols = 24;
    constexpr int kGridRows = 16;

    // Зураг өгөөгүй үед ашиглах 4x2 нүдтэй sprite sheet: нүд бүр өөр өнгийн дугуй.
    std::vector<uint8_t> make_fallback_sheet()
    {
        const uint32_t w = kCellPx * kSheetCols;
        const uint32_t h = kCellPx * kSheetRows;
        std::vector<uint8_t> px((size_t)w * (size_t)h * 4u, 0u);
        for (uint32_t y = 0; y < h; ++y)
        {
            for (uint32_t x = 0; x < w; ++x)
            {
                const uint32_t cell = (y / kCellPx) * kSheetCols + (x / kCellPx);
                const float cx = (float)(x % kCellPx) - (float)kCellPx * 0.5f + 0.5f;
                const float cy = (float)(y % kCellPx) - (float)kCellPx * 0.5f + 0.5f;
                const float r = (float)kCellPx * (0.2f + 0.035f * (float)cell);
                uint8_t* p = px.data() + ((size_t)y * w + x) * 4u;
                if (cx * cx + cy * cy > r * r) continue;
                p[0] = (uint8_t)(255 - cell * 28);
                p[1] = (uint8_t)(60 + cell * 24);
                p[2] = (uint8_t)(120 + cell * 16);
                p[3] = 255;
            }
        }
        return px;
    }
}

int main(int argc, char** argv)
{
    qdr::EngineConfig cfg{};
    cfg.window_title = "hello-quads";
    qdr::apply_env_overrides(cfg);

    const bool want_vulkan = cfg.backend == qdr::RenderBackendType::Vulkan && qdr::vulkan_backend_compiled();

    qdr::WindowDesc win{};
    win.title = cfg.window_title;
    win.width = cfg.window_width;
    win.height = cfg.window_height;
    win.vulkan = want_vulkan;
    auto window = std::make_unique<qdr::SdlWindowRuntime>(win);
    if (!window->valid()) return 1;

    qdr::GpuBackendCreateDesc bdesc{};
    bdesc.window = window->window();
    bdesc.width = cfg.window_width;
    bdesc.height = cfg.window_height;
    bdesc.vk_validation = cfg.vk_validation;
    bdesc.vk_present_mode = cfg.vk_present_mode;
    qdr::GpuBackendCreateResult created = qdr::create_gpu_backend(cfg.backend, bdesc);

    if (want_vulkan && created.active != qdr::RenderBackendType::Vulkan)
    {
        // Vulkan цонхонд SDL_Renderer байхгүй тул software-д зориулж дахин нээнэ.
        window.reset();
        win.vulkan = false;
        window = std::make_unique<qdr::SdlWindowRuntime>(win);
        if (!window->valid()) return 1;
    }
    qdr::IGpuBackend& backend = *created.backend;
    auto* sw_backend = dynamic_cast<qdr::SoftwareGpuBackend*>(created.backend.get());
    qdr::log_info(std::string("[hello-quads] backend: ") + backend.name());

    qdr::SharedAssetRegistry assets{};
    std::unique_ptr<qdr::BatchedRenderer> renderer{};
    try
    {
        renderer = std::make_unique<qdr::BatchedRenderer>(backend, assets, cfg.renderer);
    }
    catch (const std::exception& e)
    {
        qdr::log_error(std::string("[hello-quads] ") + e.what());
        return 1;
    }

    qdr::AssetHandle<qdr::Texture2D> sheet_tex{};
    uint32_t sprite_w = kCellPx;
    uint32_t sprite_h = kCellPx;
    {
        auto reg = assets.write();
        qdr::Result<qdr::AssetHandle<qdr::Texture2D>> loaded{};
        if (argc > 1)
        {
            loaded = reg->load<qdr::Texture2D, std::string>(std::string(argv[1]));
            if (!loaded.ok) qdr::log_warn("[hello-quads] " + loaded.error + "; using generated sheet");
            if (argc > 3)
            {
                sprite_w = qdr::parse_env_u32(argv[2], kCellPx);
                sprite_h = qdr::parse_env_u32(argv[3], kCellPx);
            }
        }
        if (!loaded.ok)
        {
            const std::vector<uint8_t> px = make_fallback_sheet();
            loaded = reg->load<qdr::Texture2D, qdr::RawRgbaImageData>(
                qdr::RawRgbaImageData{px, kCellPx * kSheetCols, kCellPx * kSheetRows});
            sprite_w = kCellPx;
            sprite_h = kCellPx;
        }
        if (!loaded.ok)
        {
            qdr::log_error("[hello-quads] " + loaded.error);
            return 1;
        }
        sheet_tex = loaded.value;
    }

    qdr::SpriteSheetCoordinates sheet = [&]() {
        const auto reg = assets.read();
        return qdr::SpriteSheetCoordinates(reg->get(sheet_tex), sprite_w, sprite_h);
    }();
    if (sheet.size() == 0)
    {
        qdr::log_error("[hello-quads] sprite sheet has no cells");
        return 1;
    }

    qdr::Camera2D camera((float)backend.surface_width(), (float)backend.surface_height());

    std::vector<qdr::Quad> tiles{};
    tiles.reserve((size_t)kGridCols * (size_t)kGridRows);
    for (int y = 0; y < kGridRows; ++y)
    {
        for (int x = 0; x < kGridCols; ++x)
        {
            qdr::Quad q({(float)x * 32.0f + 4.0f, (float)y * 32.0f + 4.0f}, {24.0f, 24.0f}, (float)((x + y) * 15));
            q.color = glm::vec4((float)x / (float)kGridCols, (float)y / (float)kGridRows, 0.6f, 0.85f);
            tiles.push_back(q);
        }
    }
    qdr::Quad sprite({0.0f, 0.0f}, {128.0f, 128.0f}, 0.0f, 1);

    qdr::FrameTimer frame_timer{};
    qdr::FrameTimer anim_timer{};
    size_t sprite_frame = 0;
    float t = 0.0f;
    uint64_t frame_index = 0;

    qdr::WindowEvents events{};
    while (window->pump_events(events))
    {
        if (events.resized)
        {
            renderer->on_resize(events.width, events.height);
            camera.resize((float)events.width, (float)events.height);
        }

        const float dt = frame_timer.restart();
        t += dt;
        if (anim_timer.elapsed_seconds() >= kFrameSeconds)
        {
            anim_timer.restart();
            sprite_frame = (sprite_frame + 1) % sheet.size();
        }

        renderer->begin(cfg.clear_color, camera);
        for (qdr::Quad& q : tiles)
        {
            q.rotate(dt * 45.0f);
            renderer->draw_quad(q);
        }
        sprite.set_position({
            camera.width() * 0.5f - 64.0f + std::cos(t) * camera.width() * 0.3f,
            camera.height() * 0.5f - 64.0f + std::sin(t * 1.3f) * camera.height() * 0.3f});
        if (const auto coords = sheet.get_coords_by_index(sprite_frame))
        {
            renderer->draw_quad_textured(sprite, sheet_tex, *coords);
        }

        const qdr::FrameSubmitResult r = renderer->submit();
        if (r == qdr::FrameSubmitResult::Failed)
        {
            qdr::log_error("[hello-quads] frame submission failed");
            break;
        }
        if (sw_backend && r == qdr::FrameSubmitResult::Presented)
        {
            window->upload_rgba8(sw_backend->color_target().data(), sw_backend->surface_width(), sw_backend->surface_height());
            window->present();
        }

        if ((++frame_index % 120u) == 0u)
        {
            const qdr::FrameStats& st = renderer->last_frame_stats();
            window->set_title(cfg.window_title + " | " + backend.name() +
                " | batches " + std::to_string(st.batches_drawn) +
                " | quads " + std::to_string(st.instances) +
                " | " + std::to_string((int)(dt > 0.0f ? 1.0f / dt : 0.0f)) + " fps");
        }
    }

    renderer.reset();
    return 0;
}
