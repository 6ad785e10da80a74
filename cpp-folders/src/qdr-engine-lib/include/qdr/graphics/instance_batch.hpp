#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: instance_batch.hpp
    МОДУЛЬ: graphics
    ЗОРИЛГО: Нэг (texture, depth) түлхүүрт хамаарах instance жагсаалт болон
            түүний GPU instance buffer. Buffer-ийн багтаамж зөвхөн өснө.
*/


#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "qdr/assets/asset_handle.hpp"
#include "qdr/assets/texture.hpp"
#include "qdr/graphics/quad_geometry.hpp"
#include "qdr/rhi/core/gpu_backend.hpp"

namespace qdr
{
    // Эрэмбэ: depth өсөхөөр, тэнцүү depth дээр texture id өсөхөөр.
    struct BatchKey
    {
        int32_t depth_index = 0;
        AssetId texture_id = 0;

        bool operator<(const BatchKey& o) const
        {
            if (depth_index != o.depth_index) return depth_index < o.depth_index;
            return texture_id < o.texture_id;
        }

        bool operator==(const BatchKey& o) const
        {
            return depth_index == o.depth_index && texture_id == o.texture_id;
        }

        std::string to_string() const
        {
            return "(depth=" + std::to_string(depth_index) + ", texture=" + std::to_string(texture_id) + ")";
        }
    };

    class InstanceBatch
    {
    public:
        InstanceBatch(AssetHandle<Texture2D> texture, int32_t depth_index, size_t capacity_hint)
            : texture_(texture), depth_index_(depth_index)
        {
            instances_.reserve(capacity_hint);
        }

        InstanceBatch(const InstanceBatch&) = delete;
        InstanceBatch& operator=(const InstanceBatch&) = delete;
        InstanceBatch(InstanceBatch&&) = default;
        InstanceBatch& operator=(InstanceBatch&&) = default;

        BatchKey key() const { return BatchKey{depth_index_, texture_.id()}; }
        AssetHandle<Texture2D> texture() const { return texture_; }
        int32_t depth_index() const { return depth_index_; }

        void push(const QuadInstanceData& instance) { instances_.push_back(instance); }
        void clear() { instances_.clear(); }

        bool empty() const { return instances_.empty(); }
        uint32_t count() const { return (uint32_t)instances_.size(); }
        const std::vector<QuadInstanceData>& instances() const { return instances_; }

        RHIBufferHandle gpu_buffer() const { return buffer_; }
        uint32_t gpu_capacity() const { return capacity_; }
        uint32_t reallocation_count() const { return reallocations_; }

        // Buffer байхгүй эсвэл багтаахгүй бол яг count хэмжээгээр дахин үүсгэнэ,
        // бусад үед байгаа buffer-ийн эхнээс дарж бичнэ.
        bool upload(IGpuBackend& backend, bool* reallocated = nullptr)
        {
            if (reallocated) *reallocated = false;
            if (instances_.empty()) return true;

            const auto bytes = std::span<const uint8_t>(
                reinterpret_cast<const uint8_t*>(instances_.data()),
                instances_.size() * sizeof(QuadInstanceData));

            if (buffer_ == kNullRHIHandle || count() > capacity_)
            {
                if (buffer_ != kNullRHIHandle) backend.destroy_buffer(buffer_);

                RHIBufferDesc desc{};
                desc.size_bytes = bytes.size();
                desc.usage = RHIBufferUsage_Vertex | RHIBufferUsage_TransferDst;
                desc.memory = RHIMemoryClass::CPUVisible;
                desc.label = "quad_instances";
                buffer_ = backend.create_buffer(desc, bytes);
                if (buffer_ == kNullRHIHandle)
                {
                    capacity_ = 0;
                    return false;
                }
                capacity_ = count();
                ++reallocations_;
                if (reallocated) *reallocated = true;
                return true;
            }
            return backend.write_buffer(buffer_, 0, bytes);
        }

        void release(IGpuBackend& backend)
        {
            if (buffer_ != kNullRHIHandle) backend.destroy_buffer(buffer_);
            buffer_ = kNullRHIHandle;
            capacity_ = 0;
        }

    private:
        AssetHandle<Texture2D> texture_{};
        int32_t depth_index_ = 0;
        std::vector<QuadInstanceData> instances_{};
        RHIBufferHandle buffer_ = kNullRHIHandle;
        uint32_t capacity_ = 0;
        uint32_t reallocations_ = 0;
    };
}
