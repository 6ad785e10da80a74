#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: sdl_window_runtime.hpp
    МОДУЛЬ: platform/sdl
    ЗОРИЛГО: SDL2 цонх, event pump (quit/resize) болон software backend-ийн
            өнгөний буферийг streaming texture-ээр дэлгэцэнд гаргах runtime.
            Vulkan горимд цонх SDL_WINDOW_VULKAN-аар үүсэж, SDL_Renderer үүсгэхгүй.
*/


#include <cstdint>
#include <cstring>
#include <string>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>

#include "qdr/core/log.hpp"

namespace qdr
{
    struct WindowDesc
    {
        std::string title = "qdr";
        uint32_t width = 800;
        uint32_t height = 600;
        bool vulkan = false;
        bool resizable = true;
    };

    struct WindowEvents
    {
        bool quit = false;
        bool resized = false;
        uint32_t width = 0;
        uint32_t height = 0;
    };

    class SdlWindowRuntime
    {
    public:
        explicit SdlWindowRuntime(const WindowDesc& win)
            : width_(win.width), height_(win.height)
        {
            if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
            {
                log_error(std::string("[sdl] SDL_Init failed: ") + SDL_GetError());
                return;
            }
            sdl_inited_ = true;

            const int img_flags = IMG_INIT_PNG | IMG_INIT_JPG;
            if ((IMG_Init(img_flags) & img_flags) == 0)
            {
                log_error(std::string("[sdl] IMG_Init failed: ") + IMG_GetError());
                return;
            }
            img_inited_ = true;

            uint32_t flags = SDL_WINDOW_SHOWN;
            if (win.resizable) flags |= SDL_WINDOW_RESIZABLE;
            if (win.vulkan) flags |= SDL_WINDOW_VULKAN;
            window_ = SDL_CreateWindow(
                win.title.c_str(),
                SDL_WINDOWPOS_CENTERED,
                SDL_WINDOWPOS_CENTERED,
                (int)win.width,
                (int)win.height,
                flags
            );
            if (!window_)
            {
                log_error(std::string("[sdl] SDL_CreateWindow failed: ") + SDL_GetError());
                return;
            }

            if (!win.vulkan)
            {
                renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
                if (!renderer_)
                {
                    log_error(std::string("[sdl] SDL_CreateRenderer failed: ") + SDL_GetError());
                    return;
                }
            }
            valid_ = true;
        }

        ~SdlWindowRuntime()
        {
            if (texture_) SDL_DestroyTexture(texture_);
            if (renderer_) SDL_DestroyRenderer(renderer_);
            if (window_) SDL_DestroyWindow(window_);
            if (img_inited_) IMG_Quit();
            if (sdl_inited_) SDL_Quit();
        }

        SdlWindowRuntime(const SdlWindowRuntime&) = delete;
        SdlWindowRuntime& operator=(const SdlWindowRuntime&) = delete;

        bool valid() const { return valid_; }
        SDL_Window* window() const { return window_; }
        uint32_t width() const { return width_; }
        uint32_t height() const { return height_; }

        // false буцаавал цонх хаагдах ёстой.
        bool pump_events(WindowEvents& out)
        {
            out = WindowEvents{};

            SDL_Event e;
            while (SDL_PollEvent(&e))
            {
                if (e.type == SDL_QUIT) out.quit = true;
                if (e.type == SDL_KEYDOWN && e.key.keysym.sym == SDLK_ESCAPE) out.quit = true;
                if (e.type == SDL_WINDOWEVENT &&
                    (e.window.event == SDL_WINDOWEVENT_RESIZED || e.window.event == SDL_WINDOWEVENT_SIZE_CHANGED))
                {
                    if (e.window.data1 > 0 && e.window.data2 > 0)
                    {
                        width_ = (uint32_t)e.window.data1;
                        height_ = (uint32_t)e.window.data2;
                        out.resized = true;
                    }
                }
            }
            out.width = width_;
            out.height = height_;
            return !out.quit;
        }

        void set_title(const std::string& title)
        {
            if (window_) SDL_SetWindowTitle(window_, title.c_str());
        }

        // Software backend-ийн RGBA8 буферийг streaming texture руу хуулна.
        // Хэмжээ өөрчлөгдсөн бол texture-ийг дахин үүсгэнэ.
        bool upload_rgba8(const uint8_t* src, uint32_t width, uint32_t height)
        {
            if (!renderer_ || !src || width == 0 || height == 0) return false;
            if (!texture_ || texture_w_ != width || texture_h_ != height)
            {
                if (texture_) SDL_DestroyTexture(texture_);
                texture_ = SDL_CreateTexture(
                    renderer_,
                    SDL_PIXELFORMAT_RGBA32,
                    SDL_TEXTUREACCESS_STREAMING,
                    (int)width,
                    (int)height
                );
                if (!texture_)
                {
                    log_error(std::string("[sdl] SDL_CreateTexture failed: ") + SDL_GetError());
                    return false;
                }
                texture_w_ = width;
                texture_h_ = height;
            }

            void* dst = nullptr;
            int dst_pitch = 0;
            if (SDL_LockTexture(texture_, nullptr, &dst, &dst_pitch) != 0) return false;
            const size_t row_bytes = (size_t)width * 4u;
            auto* d = static_cast<uint8_t*>(dst);
            for (uint32_t y = 0; y < height; ++y)
            {
                std::memcpy(d + (size_t)y * (size_t)dst_pitch, src + (size_t)y * row_bytes, row_bytes);
            }
            SDL_UnlockTexture(texture_);
            return true;
        }

        void present()
        {
            if (!renderer_ || !texture_) return;
            SDL_RenderClear(renderer_);
            SDL_RenderCopy(renderer_, texture_, nullptr, nullptr);
            SDL_RenderPresent(renderer_);
        }

    private:
        bool valid_ = false;
        bool sdl_inited_ = false;
        bool img_inited_ = false;
        SDL_Window* window_ = nullptr;
        SDL_Renderer* renderer_ = nullptr;
        SDL_Texture* texture_ = nullptr;
        uint32_t texture_w_ = 0;
        uint32_t texture_h_ = 0;
        uint32_t width_ = 0;
        uint32_t height_ = 0;
    };
}
