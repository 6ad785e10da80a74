#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: env_config.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Орчны хувьсагчаас bool/u32/string утга уншиж, хоосон эсвэл
            буруу утга ирвэл fallback буцаадаг туслах функцууд.
*/


#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>

namespace qdr
{
    inline bool parse_env_bool(const char* value, bool fallback)
    {
        if (!value || *value == '\0') return fallback;
        std::string v(value);
        std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        if (v == "1" || v == "true" || v == "on" || v == "yes") return true;
        if (v == "0" || v == "false" || v == "off" || v == "no") return false;
        return fallback;
    }

    // Тэмдэгтэй, илүү тэмдэгттэй, хүрээнээс гарсан утгад fallback буцаана.
    // min_value-ээс бага утгыг min_value болгоно.
    inline uint32_t parse_env_u32(
        const char* value,
        uint32_t fallback,
        uint32_t min_value = 1u,
        uint32_t max_value = std::numeric_limits<uint32_t>::max())
    {
        if (!value || *value == '\0') return fallback;
        const char* p = value;
        while (std::isspace((unsigned char)*p)) ++p;
        if (!std::isdigit((unsigned char)*p)) return fallback;

        char* end = nullptr;
        errno = 0;
        const unsigned long long parsed = std::strtoull(p, &end, 10);
        if (errno == ERANGE || end == p || *end != '\0') return fallback;
        if (parsed > (unsigned long long)max_value) return fallback;
        return std::max(min_value, static_cast<uint32_t>(parsed));
    }

    inline std::string env_string(const char* name, const std::string& fallback = {})
    {
        const char* v = std::getenv(name);
        if (!v || *v == '\0') return fallback;
        return std::string(v);
    }
}
