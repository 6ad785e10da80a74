#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: type_id.hpp
    МОДУЛЬ: core
    ЗОРИЛГО: Compile-time төрлийн таних утга (std::type_index) болон
            лог/алдааны мессежэнд зориулсан уншигдахуйц төрлийн нэр.
*/


#include <cstdlib>
#include <functional>
#include <memory>
#include <string>
#include <typeindex>
#include <typeinfo>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace qdr
{
    using TypeKey = std::type_index;

    template<typename T>
    inline TypeKey type_key()
    {
        return TypeKey(typeid(T));
    }

    inline std::string demangle_type_name(const char* mangled)
    {
#if defined(__GNUG__)
        int status = 0;
        std::unique_ptr<char, void (*)(void*)> out{
            abi::__cxa_demangle(mangled, nullptr, nullptr, &status),
            std::free};
        if (status == 0 && out) return std::string(out.get());
#endif
        return std::string(mangled);
    }

    template<typename T>
    inline std::string type_name()
    {
        return demangle_type_name(typeid(T).name());
    }

    // (loader, source) хос түлхүүр.
    struct TypeKeyPair
    {
        TypeKey first;
        TypeKey second;

        bool operator==(const TypeKeyPair& o) const
        {
            return first == o.first && second == o.second;
        }
    };

    struct TypeKeyPairHash
    {
        size_t operator()(const TypeKeyPair& k) const noexcept
        {
            const size_t a = std::hash<TypeKey>{}(k.first);
            const size_t b = std::hash<TypeKey>{}(k.second);
            return a ^ (b + 0x9e3779b97f4a7c15ull + (a << 6) + (a >> 2));
        }
    };
}
