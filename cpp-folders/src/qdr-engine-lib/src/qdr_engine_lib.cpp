/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: qdr_engine_lib.cpp
    МОДУЛЬ: qdr-engine-lib
    ЗОРИЛГО: Compiled library target anchor translation unit.
*/

#include "qdr/app/engine_config.hpp"
#include "qdr/assets/asset_registry.hpp"
#include "qdr/assets/loaders/texture_loader.hpp"
#include "qdr/graphics/batched_renderer.hpp"
#include "qdr/rhi/backend/backend_factory.hpp"

namespace qdr
{
    int qdr_engine_compiled_target_anchor()
    {
        return 0;
    }
}
