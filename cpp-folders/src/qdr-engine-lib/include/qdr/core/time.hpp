#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: time.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Фрэйм хоорондын хугацаа (dt) хэмжих steady_clock-д суурилсан FrameTimer.
*/


#include <chrono>

namespace qdr
{
    class FrameTimer
    {
    public:
        using clock = std::chrono::steady_clock;

        FrameTimer() : start_(clock::now()) {}

        float elapsed_seconds() const
        {
            return std::chrono::duration<float>(clock::now() - start_).count();
        }

        // Өнгөрсөн хугацааг буцааж, эхлэлийг одоо болгоно.
        float restart()
        {
            const clock::time_point now = clock::now();
            const float dt = std::chrono::duration<float>(now - start_).count();
            start_ = now;
            return dt;
        }

    private:
        clock::time_point start_{};
    };
}
