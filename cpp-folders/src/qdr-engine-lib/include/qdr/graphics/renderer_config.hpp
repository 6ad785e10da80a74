#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: renderer_config.hpp
    МОДУЛЬ: graphics
    ЗОРИЛГО: BatchedRenderer-ийн тохиргоо. SPIR-V замуудын default утгыг build
            систем QDR_QUAD_VERT_SPV / QDR_QUAD_FRAG_SPV-ээр дамжуулна.
*/


#include <cstdint>
#include <string>

#ifndef QDR_QUAD_VERT_SPV
#define QDR_QUAD_VERT_SPV "shaders/quad.vert.spv"
#endif

#ifndef QDR_QUAD_FRAG_SPV
#define QDR_QUAD_FRAG_SPV "shaders/quad.frag.spv"
#endif

namespace qdr
{
    struct RendererConfig
    {
        // Шинэ batch-ийн CPU талын instance жагсаалтад урьдчилан нөөцлөх тоо.
        uint32_t batch_capacity_hint = 1024;
        std::string quad_vert_spv = QDR_QUAD_VERT_SPV;
        std::string quad_frag_spv = QDR_QUAD_FRAG_SPV;
    };
}
