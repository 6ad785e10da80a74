#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: log.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Энгийн түвшинтэй лог функцууд. stdout/stderr руу "[LEVEL] msg" мөр бичнэ.
            Доод түвшинг QDR_LOG_LEVEL орчны хувьсагч эсвэл set_log_level-ээр тохируулна.
*/


#include <atomic>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

namespace qdr
{
    enum class LogLevel : uint8_t
    {
        Debug = 0,
        Info = 1,
        Warn = 2,
        Error = 3,
        Off = 4
    };

    inline LogLevel parse_log_level(const char* text, LogLevel fallback)
    {
        if (!text || *text == '\0') return fallback;
        std::string v(text);
        for (char& c : v) c = (char)std::tolower((unsigned char)c);
        if (v == "debug") return LogLevel::Debug;
        if (v == "info") return LogLevel::Info;
        if (v == "warn" || v == "warning") return LogLevel::Warn;
        if (v == "error") return LogLevel::Error;
        if (v == "off" || v == "none") return LogLevel::Off;
        return fallback;
    }

    namespace detail
    {
        inline std::atomic<uint8_t>& log_level_storage()
        {
            static std::atomic<uint8_t> level{
                (uint8_t)parse_log_level(std::getenv("QDR_LOG_LEVEL"), LogLevel::Info)};
            return level;
        }
    }

    inline void set_log_level(LogLevel level)
    {
        detail::log_level_storage().store((uint8_t)level);
    }

    inline LogLevel log_level()
    {
        return (LogLevel)detail::log_level_storage().load();
    }

    inline bool log_enabled(LogLevel level)
    {
        return (uint8_t)level >= (uint8_t)log_level() && level != LogLevel::Off;
    }

    inline void log_debug(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Debug)) return;
        std::cout << "[DEBUG] " << msg << std::endl;
    }

    inline void log_info(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Info)) return;
        std::cout << "[INFO] " << msg << std::endl;
    }

    inline void log_warn(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Warn)) return;
        std::cout << "[WARN] " << msg << std::endl;
    }

    inline void log_error(const std::string& msg)
    {
        if (!log_enabled(LogLevel::Error)) return;
        std::cerr << "[ERROR] " << msg << std::endl;
    }
}
