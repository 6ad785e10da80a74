#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: image_decoder_sdl.hpp
    МОДУЛЬ: assets/loaders
    ЗОРИЛГО: SDL2_image ашиглан зураг файлыг RGBA8 пиксел болгон задлах plugin.
            Эхний мөр нь зургийн дээд мөр (UV-ийн (0,0) нь зүүн дээд булан).
*/


#include <cstdint>
#include <cstring>
#include <string>

#include <SDL2/SDL.h>
#include <SDL2/SDL_image.h>

#include "qdr/assets/texture.hpp"
#include "qdr/core/result.hpp"

namespace qdr
{
    inline Result<RgbaImage> decode_rgba_image_sdl(const std::string& path)
    {
        SDL_Surface* loaded = IMG_Load(path.c_str());
        if (!loaded)
        {
            return Result<RgbaImage>::failure(ErrorKind::DecodeFailed,
                "IMG_Load('" + path + "') failed: " + std::string(IMG_GetError()));
        }

        SDL_Surface* rgba = SDL_ConvertSurfaceFormat(loaded, SDL_PIXELFORMAT_RGBA32, 0);
        SDL_FreeSurface(loaded);
        if (!rgba)
        {
            return Result<RgbaImage>::failure(ErrorKind::DecodeFailed,
                "SDL_ConvertSurfaceFormat('" + path + "') failed: " + std::string(SDL_GetError()));
        }

        RgbaImage out{};
        out.width = (uint32_t)rgba->w;
        out.height = (uint32_t)rgba->h;
        out.pixels.resize((size_t)out.width * (size_t)out.height * 4u);

        if (SDL_MUSTLOCK(rgba)) SDL_LockSurface(rgba);
        const auto* src = static_cast<const uint8_t*>(rgba->pixels);
        const size_t row_bytes = (size_t)out.width * 4u;
        for (uint32_t y = 0; y < out.height; ++y)
        {
            std::memcpy(out.pixels.data() + (size_t)y * row_bytes, src + (size_t)y * (size_t)rgba->pitch, row_bytes);
        }
        if (SDL_MUSTLOCK(rgba)) SDL_UnlockSurface(rgba);

        SDL_FreeSurface(rgba);
        return Result<RgbaImage>::success(std::move(out));
    }
}
