#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: camera2d.hpp
    МОДУЛЬ: graphics
    ЗОРИЛГО: Зүүн дээд булан эхтэй (x баруун, y доош) ортографик 2D камер.
*/


#include <glm/glm.hpp>
#include <glm/ext/matrix_clip_space.hpp>

namespace qdr
{
    // Uniform buffer-ийн агуулга (binding 0).
    struct CameraUniform
    {
        glm::mat4 view_proj{1.0f};
    };
    static_assert(sizeof(CameraUniform) == 64, "CameraUniform must be a tightly packed mat4");

    class Camera2D
    {
    public:
        Camera2D(float viewport_w, float viewport_h)
        {
            resize(viewport_w, viewport_h);
        }

        void resize(float viewport_w, float viewport_h)
        {
            width_ = viewport_w;
            height_ = viewport_h;
            proj_ = glm::orthoLH_ZO(0.0f, width_, height_, 0.0f, 0.0f, 1.0f);
        }

        const glm::mat4& to_matrix() const { return proj_; }
        float width() const { return width_; }
        float height() const { return height_; }

    private:
        float width_ = 0.0f;
        float height_ = 0.0f;
        glm::mat4 proj_{1.0f};
    };
}
