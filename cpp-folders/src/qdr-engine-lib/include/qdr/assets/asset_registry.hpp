#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: asset_registry.hpp
    МОДУЛЬ: assets
    ЗОРИЛГО: Төрөл бүрийн asset-ийн TypedStorage болон loader-уудыг type_index-ээр
            хадгалдаг registry. SharedAssetRegistry нь олон уншигч / нэг бичигч
            түгжээтэй хувилбар.
*/


#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include "qdr/assets/asset_handle.hpp"
#include "qdr/assets/asset_loader.hpp"
#include "qdr/assets/typed_storage.hpp"
#include "qdr/core/log.hpp"
#include "qdr/core/result.hpp"
#include "qdr/core/type_id.hpp"

namespace qdr
{
    class AssetRegistry
    {
    public:
        AssetRegistry() = default;
        AssetRegistry(const AssetRegistry&) = delete;
        AssetRegistry& operator=(const AssetRegistry&) = delete;
        AssetRegistry(AssetRegistry&&) = default;
        AssetRegistry& operator=(AssetRegistry&&) = default;

        template<typename TAsset>
        Status register_type()
        {
            const TypeKey key = type_key<TAsset>();
            if (storages_.find(key) != storages_.end())
            {
                const std::string msg = "asset type already registered: " + type_name<TAsset>();
                log_error("[assets] " + msg);
                return Status::failure(ErrorKind::AlreadyRegistered, msg);
            }
            storages_.emplace(key, std::make_unique<TypedStorage<TAsset>>());
            log_debug("[assets] registered type " + type_name<TAsset>());
            return Status::success();
        }

        template<typename TLoader, typename TSource>
            requires AssetLoaderFor<TLoader, TSource>
        void register_loader(TLoader loader)
        {
            const TypeKeyPair key{type_key<TLoader>(), type_key<TSource>()};
            auto entry = std::make_unique<LoaderEntry<TLoader, TSource>>(std::move(loader));
            auto it = loaders_.find(key);
            if (it != loaders_.end())
            {
                log_warn("[assets] loader " + type_name<TLoader>() + " for source " +
                    type_name<TSource>() + " replaced");
                it->second = std::move(entry);
                return;
            }
            loaders_.emplace(key, std::move(entry));
        }

        template<typename TAsset>
        Result<AssetHandle<TAsset>> store(TAsset asset)
        {
            TypedStorage<TAsset>* storage = storage_for<TAsset>();
            if (!storage) return unregistered_asset<TAsset>();
            return Result<AssetHandle<TAsset>>::success(storage->store(std::move(asset)));
        }

        // Default loader-оор ачаална. (TAsset, TSource) хосод QDR_DEFAULT_ASSET_LOADER
        // зарлаагүй бол UnregisteredLoader буцаана.
        template<typename TAsset, typename TSource>
        Result<AssetHandle<TAsset>> load(const TSource& source)
        {
            if constexpr (HasDefaultAssetLoader<TAsset, TSource>)
            {
                using TLoader = typename DefaultAssetLoader<TAsset, TSource>::type;
                return load_with<TAsset, TLoader, TSource>(source);
            }
            else
            {
                const std::string msg = "no default loader for asset " + type_name<TAsset>() +
                    " from source " + type_name<TSource>();
                log_error("[assets] " + msg);
                return Result<AssetHandle<TAsset>>::failure(ErrorKind::UnregisteredLoader, msg);
            }
        }

        template<typename TAsset, typename TLoader, typename TSource>
        Result<AssetHandle<TAsset>> load_with(const TSource& source)
        {
            static_assert(std::is_same_v<typename TLoader::asset_type, TAsset>,
                "loader asset_type does not match the requested asset type");

            TypedStorage<TAsset>* storage = storage_for<TAsset>();
            if (!storage) return unregistered_asset<TAsset>();

            LoaderEntry<TLoader, TSource>* entry = loader_for<TLoader, TSource>();
            if (!entry)
            {
                const std::string msg = "loader " + type_name<TLoader>() + " for source " +
                    type_name<TSource>() + " is not registered";
                log_error("[assets] " + msg);
                return Result<AssetHandle<TAsset>>::failure(ErrorKind::UnregisteredLoader, msg);
            }

            Result<TAsset> loaded = entry->load(source);
            if (!loaded.ok)
            {
                log_warn("[assets] " + type_name<TLoader>() + " failed: " + loaded.error);
                return Result<AssetHandle<TAsset>>::failure(ErrorKind::LoadingError, loaded.error);
            }
            return Result<AssetHandle<TAsset>>::success(storage->store(std::move(loaded.value)));
        }

        template<typename TAsset>
        const TAsset& get(AssetHandle<TAsset> handle) const
        {
            const TAsset* asset = try_get(handle);
            if (!asset) invariant_break<TAsset>(handle);
            return *asset;
        }

        template<typename TAsset>
        TAsset& get_mut(AssetHandle<TAsset> handle)
        {
            TypedStorage<TAsset>* storage = storage_for<TAsset>();
            TAsset* asset = storage ? storage->find(handle) : nullptr;
            if (!asset) invariant_break<TAsset>(handle);
            return *asset;
        }

        template<typename TAsset>
        const TAsset* try_get(AssetHandle<TAsset> handle) const
        {
            const TypedStorage<TAsset>* storage = storage_for<TAsset>();
            return storage ? storage->find(handle) : nullptr;
        }

        template<typename TAsset>
        bool contains() const
        {
            return storages_.find(type_key<TAsset>()) != storages_.end();
        }

        template<typename TLoader, typename TSource>
        bool has_loader() const
        {
            return loaders_.find(TypeKeyPair{type_key<TLoader>(), type_key<TSource>()}) != loaders_.end();
        }

        template<typename TAsset>
        size_t count() const
        {
            const TypedStorage<TAsset>* storage = storage_for<TAsset>();
            return storage ? storage->size() : 0u;
        }

        size_t type_count() const { return storages_.size(); }
        size_t loader_count() const { return loaders_.size(); }

    private:
        template<typename TAsset>
        TypedStorage<TAsset>* storage_for()
        {
            const auto it = storages_.find(type_key<TAsset>());
            if (it == storages_.end()) return nullptr;
            return dynamic_cast<TypedStorage<TAsset>*>(it->second.get());
        }

        template<typename TAsset>
        const TypedStorage<TAsset>* storage_for() const
        {
            const auto it = storages_.find(type_key<TAsset>());
            if (it == storages_.end()) return nullptr;
            return dynamic_cast<const TypedStorage<TAsset>*>(it->second.get());
        }

        template<typename TLoader, typename TSource>
        LoaderEntry<TLoader, TSource>* loader_for()
        {
            const auto it = loaders_.find(TypeKeyPair{type_key<TLoader>(), type_key<TSource>()});
            if (it == loaders_.end()) return nullptr;
            return dynamic_cast<LoaderEntry<TLoader, TSource>*>(it->second.get());
        }

        template<typename TAsset>
        static Result<AssetHandle<TAsset>> unregistered_asset()
        {
            const std::string msg = "asset type not registered: " + type_name<TAsset>();
            log_error("[assets] " + msg);
            return Result<AssetHandle<TAsset>>::failure(ErrorKind::UnregisteredAsset, msg);
        }

        template<typename TAsset>
        [[noreturn]] static void invariant_break(AssetHandle<TAsset> handle)
        {
            const std::string msg = "no " + type_name<TAsset>() + " asset for handle id " +
                std::to_string(handle.id());
            log_error("[assets] " + msg);
            throw std::logic_error(msg);
        }

        std::unordered_map<TypeKey, std::unique_ptr<IErasedStorage>> storages_{};
        std::unordered_map<TypeKeyPair, std::unique_ptr<IErasedLoader>, TypeKeyPairHash> loaders_{};
    };

    // Guard амьд байх хугацаанд түгжээ барина.
    template<typename TRegistry, typename TLock>
    class AssetRegistryAccess
    {
    public:
        AssetRegistryAccess(TRegistry& registry, TLock lock)
            : registry_(&registry), lock_(std::move(lock))
        {}

        TRegistry* operator->() const { return registry_; }
        TRegistry& operator*() const { return *registry_; }

    private:
        TRegistry* registry_ = nullptr;
        TLock lock_;
    };

    class SharedAssetRegistry
    {
    public:
        using ReadAccess = AssetRegistryAccess<const AssetRegistry, std::shared_lock<std::shared_mutex>>;
        using WriteAccess = AssetRegistryAccess<AssetRegistry, std::unique_lock<std::shared_mutex>>;

        SharedAssetRegistry() = default;
        explicit SharedAssetRegistry(AssetRegistry registry) : registry_(std::move(registry)) {}

        SharedAssetRegistry(const SharedAssetRegistry&) = delete;
        SharedAssetRegistry& operator=(const SharedAssetRegistry&) = delete;

        ReadAccess read() const
        {
            return ReadAccess(registry_, std::shared_lock<std::shared_mutex>(mutex_));
        }

        WriteAccess write()
        {
            return WriteAccess(registry_, std::unique_lock<std::shared_mutex>(mutex_));
        }

    private:
        mutable std::shared_mutex mutex_{};
        AssetRegistry registry_{};
    };
}
