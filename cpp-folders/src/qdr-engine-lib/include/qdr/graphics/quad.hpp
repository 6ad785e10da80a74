#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: quad.hpp
    МОДУЛЬ: graphics
    ЗОРИЛГО: 2D тэгш өнцөгт (sprite) ба түүний lazy тооцоологдох model matrix.
            position нь эргүүлэхээс өмнөх зүүн дээд булан, эргэлт нь төвийг тойрно.
*/


#include <cstdint>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

namespace qdr
{
    class Quad
    {
    public:
        Quad(glm::vec2 position, glm::vec2 size, float rotation_deg, int32_t depth_index = 0)
            : position_(position), size_(size), rotation_deg_(rotation_deg), depth_index_(depth_index)
        {
            transform_ = compute_transform(position_, size_, rotation_deg_);
            dirty_ = false;
        }

        void set_position(glm::vec2 p) { position_ = p; dirty_ = true; }
        void set_size(glm::vec2 s) { size_ = s; dirty_ = true; }
        void set_rotation(float deg) { rotation_deg_ = deg; dirty_ = true; }
        void rotate(float delta_deg) { rotation_deg_ += delta_deg; dirty_ = true; }
        void set_depth_index(int32_t d) { depth_index_ = d; dirty_ = true; }

        glm::vec2 position() const { return position_; }
        glm::vec2 size() const { return size_; }
        float rotation() const { return rotation_deg_; }
        int32_t depth_index() const { return depth_index_; }
        bool is_dirty() const { return dirty_; }

        const glm::mat4& get_transform() const
        {
            if (dirty_)
            {
                transform_ = compute_transform(position_, size_, rotation_deg_);
                dirty_ = false;
            }
            return transform_;
        }

        // T(position + c + q * (-c)) * R(q) * S(size, 1), c = size / 2
        static glm::mat4 compute_transform(glm::vec2 position, glm::vec2 size, float rotation_deg)
        {
            const glm::quat q = glm::angleAxis(glm::radians(rotation_deg), glm::vec3(0.0f, 0.0f, 1.0f));
            const glm::vec3 center(size * 0.5f, 0.0f);
            const glm::vec3 t = glm::vec3(position, 0.0f) + center + q * (-center);

            glm::mat4 m = glm::translate(glm::mat4(1.0f), t);
            m = m * glm::mat4_cast(q);
            m = glm::scale(m, glm::vec3(size, 1.0f));
            return m;
        }

        glm::vec4 color{1.0f, 1.0f, 1.0f, 1.0f};

    private:
        glm::vec2 position_{0.0f};
        glm::vec2 size_{1.0f};
        float rotation_deg_ = 0.0f;
        int32_t depth_index_ = 0;
        mutable glm::mat4 transform_{1.0f};
        mutable bool dirty_ = true;
    };
}
