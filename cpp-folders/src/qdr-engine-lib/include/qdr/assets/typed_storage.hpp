#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: typed_storage.hpp
    МОДУЛЬ: assets
    ЗОРИЛГО: Нэг төрлийн asset-уудыг хадгалах зөвхөн нэмэгддэг (append-only) сан.
            IErasedStorage нь registry дотор төрлийг нууж хадгалах суурь интерфэйс.
*/


#include <cstddef>
#include <unordered_map>
#include <utility>

#include "qdr/assets/asset_handle.hpp"
#include "qdr/core/type_id.hpp"

namespace qdr
{
    class IErasedStorage
    {
    public:
        virtual ~IErasedStorage() = default;

        virtual TypeKey asset_type() const = 0;
        virtual size_t size() const = 0;
    };

    template<typename TAsset>
    class TypedStorage final : public IErasedStorage
    {
    public:
        TypeKey asset_type() const override { return type_key<TAsset>(); }
        size_t size() const override { return assets_.size(); }

        AssetHandle<TAsset> store(TAsset asset)
        {
            const AssetId id = next_id_;
            assets_.emplace(id, std::move(asset));
            ++next_id_;
            return AssetHandle<TAsset>(id);
        }

        const TAsset* find(AssetHandle<TAsset> handle) const
        {
            const auto it = assets_.find(handle.id());
            return it == assets_.end() ? nullptr : &it->second;
        }

        TAsset* find(AssetHandle<TAsset> handle)
        {
            const auto it = assets_.find(handle.id());
            return it == assets_.end() ? nullptr : &it->second;
        }

        AssetId next_id() const { return next_id_; }

    private:
        AssetId next_id_ = 0;
        std::unordered_map<AssetId, TAsset> assets_{};
    };
}
