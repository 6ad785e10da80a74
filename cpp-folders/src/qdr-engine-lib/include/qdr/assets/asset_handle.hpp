#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: asset_handle.hpp
    МОДУЛЬ: assets
    ЗОРИЛГО: Төрөлтэй asset handle: (тоон id, compile-time төрлийн tag).
            Эзэмшил агуулахгүй, зөвхөн үүсгэсэн registry-гээр дамжиж шийдэгдэнэ.
*/


#include <cstddef>
#include <cstdint>
#include <functional>

namespace qdr
{
    using AssetId = uint32_t;

    template<typename TAsset>
    class AssetHandle
    {
    public:
        using asset_type = TAsset;

        AssetHandle() = default;
        explicit AssetHandle(AssetId id) : id_(id) {}

        AssetId id() const { return id_; }

        bool operator==(const AssetHandle& o) const { return id_ == o.id_; }
        bool operator!=(const AssetHandle& o) const { return id_ != o.id_; }
        bool operator<(const AssetHandle& o) const { return id_ < o.id_; }

    private:
        AssetId id_ = 0;
    };
}

template<typename TAsset>
struct std::hash<qdr::AssetHandle<TAsset>>
{
    size_t operator()(const qdr::AssetHandle<TAsset>& h) const noexcept
    {
        return std::hash<qdr::AssetId>{}(h.id());
    }
};
