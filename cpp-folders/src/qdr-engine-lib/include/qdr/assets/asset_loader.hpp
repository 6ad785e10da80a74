#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: asset_loader.hpp
    МОДУЛЬ: assets
    ЗОРИЛГО: Loader-уудыг registry дотор төрлөөс нь салгаж хадгалах entry,
            (asset, source) хосын default loader холбоос (trait + macro).
*/


#include <concepts>
#include <utility>

#include "qdr/core/result.hpp"
#include "qdr/core/type_id.hpp"

namespace qdr
{
    // Loader бүр `using asset_type = ...` зарлаж, дэмжих source бүрд
    // `Result<asset_type> load(const Source&)` overload-той байна.
    template<typename TLoader, typename TSource>
    concept AssetLoaderFor = requires(TLoader& loader, const TSource& source) {
        typename TLoader::asset_type;
        { loader.load(source) } -> std::same_as<Result<typename TLoader::asset_type>>;
    };

    class IErasedLoader
    {
    public:
        virtual ~IErasedLoader() = default;

        virtual TypeKey loader_type() const = 0;
        virtual TypeKey source_type() const = 0;
        virtual TypeKey asset_type() const = 0;
    };

    template<typename TLoader, typename TSource>
        requires AssetLoaderFor<TLoader, TSource>
    class LoaderEntry final : public IErasedLoader
    {
    public:
        using value_type = typename TLoader::asset_type;

        explicit LoaderEntry(TLoader loader) : loader_(std::move(loader)) {}

        TypeKey loader_type() const override { return type_key<TLoader>(); }
        TypeKey source_type() const override { return type_key<TSource>(); }
        TypeKey asset_type() const override { return type_key<value_type>(); }

        Result<value_type> load(const TSource& source)
        {
            return loader_.load(source);
        }

        TLoader& loader() { return loader_; }
        const TLoader& loader() const { return loader_; }

    private:
        TLoader loader_;
    };

    // Primary template-д `type` байхгүй: холбоос зарлаагүй (asset, source) хос
    // registry.load() дээр UnregisteredLoader алдаа өгнө.
    template<typename TAsset, typename TSource>
    struct DefaultAssetLoader
    {
    };

    template<typename TAsset, typename TSource>
    concept HasDefaultAssetLoader = requires {
        typename DefaultAssetLoader<TAsset, TSource>::type;
    };
}

// Global scope дээр, холбоосыг ашиглах load() дуудлагаас өмнө зарлана.
#define QDR_DEFAULT_ASSET_LOADER(ASSET, LOADER, SOURCE)          \
    template<>                                                   \
    struct qdr::DefaultAssetLoader<ASSET, SOURCE>                \
    {                                                            \
        using type = LOADER;                                     \
    }
