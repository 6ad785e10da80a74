#pragma once

/*
    QDR РЕНДЕРЕР САН

    ФАЙЛ: vk_gpu_backend.hpp
    МОДУЛЬ: rhi/drivers/vulkan
    ЗОРИЛГО: IGpuBackend-ийн Vulkan хэрэгжүүлэлт: SDL2 surface, swapchain, render pass,
            host-visible buffer, staging-ээр upload хийсэн texture, descriptor set,
            SPIR-V pipeline. Нэг фрэйм in-flight; swapchain outdated/suboptimal/lost
            үед configure_surface() дахин байгуулна.
*/


#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "qdr/core/log.hpp"
#include "qdr/rhi/core/gpu_backend.hpp"

#ifdef QDR_HAS_VULKAN
#include <SDL2/SDL.h>
#include <SDL2/SDL_vulkan.h>
#include <vulkan/vulkan.h>

namespace qdr
{
    enum class VkPresentModePreference : uint8_t
    {
        Fifo = 0,
        Mailbox = 1
    };

    inline bool vk_read_spirv_file(const std::string& path, std::vector<char>& out_bytes)
    {
        out_bytes.clear();
        if (path.empty()) return false;
        std::ifstream f(path, std::ios::ate | std::ios::binary);
        if (!f.is_open()) return false;
        const std::streampos end_pos = f.tellg();
        if (end_pos <= 0) return false;
        out_bytes.resize((size_t)end_pos);
        f.seekg(0);
        f.read(out_bytes.data(), (std::streamsize)out_bytes.size());
        if (!f || (out_bytes.size() % 4u) != 0)
        {
            out_bytes.clear();
            return false;
        }
        return true;
    }

    class VulkanGpuBackend final : public IGpuBackend
    {
    public:
        struct InitDesc
        {
            SDL_Window* window = nullptr;
            uint32_t width = 0;
            uint32_t height = 0;
            bool enable_validation = false;
            VkPresentModePreference present_mode = VkPresentModePreference::Fifo;
            const char* app_name = "qdr-engine";
        };

        VulkanGpuBackend() = default;
        ~VulkanGpuBackend() override { shutdown(); }

        VulkanGpuBackend(const VulkanGpuBackend&) = delete;
        VulkanGpuBackend& operator=(const VulkanGpuBackend&) = delete;

        bool init_sdl(const InitDesc& desc)
        {
            shutdown();
            if (!desc.window) return false;
            window_ = desc.window;
            enable_validation_ = desc.enable_validation;
            present_mode_pref_ = desc.present_mode;
            requested_width_ = desc.width;
            requested_height_ = desc.height;
            app_name_ = desc.app_name ? desc.app_name : "qdr-engine";

            if (!create_instance()) { shutdown(); return false; }
            if (!SDL_Vulkan_CreateSurface(window_, instance_, &surface_)) { shutdown(); return false; }
            if (!pick_physical_device()) { shutdown(); return false; }
            if (!create_device_and_queues()) { shutdown(); return false; }
            if (!create_swapchain()) { shutdown(); return false; }
            if (!create_render_pass()) { shutdown(); return false; }
            if (!create_framebuffers()) { shutdown(); return false; }
            if (!create_command_pool_and_buffer()) { shutdown(); return false; }
            if (!create_sync_objects()) { shutdown(); return false; }
            if (!create_descriptor_objects()) { shutdown(); return false; }
            initialized_ = true;
            log_info(std::string("[vulkan] initialized ") + std::to_string(extent_.width) + "x" +
                std::to_string(extent_.height));
            return true;
        }

        bool ready() const { return initialized_; }

        RenderBackendType type() const override { return RenderBackendType::Vulkan; }

        BackendCapabilities capabilities() const override
        {
            BackendCapabilities c{};
            c.features.validation_layers = !layers_.empty();
            c.limits.max_frames_in_flight = 1;
            c.supports_present = surface_ != VK_NULL_HANDLE;
            if (gpu_ != VK_NULL_HANDLE)
            {
                VkPhysicalDeviceProperties props{};
                vkGetPhysicalDeviceProperties(gpu_, &props);
                c.limits.max_texture_dimension_2d = props.limits.maxImageDimension2D;
                c.limits.max_vertex_buffers = props.limits.maxVertexInputBindings;
                c.limits.max_bind_groups = props.limits.maxBoundDescriptorSets;
            }
            return c;
        }

        RHIBufferHandle create_buffer(const RHIBufferDesc& desc, std::span<const uint8_t> initial_bytes) override
        {
            if (!initialized_ || desc.size_bytes == 0) return kNullRHIHandle;

            VkBufferUsageFlags usage = 0;
            if (desc.usage & RHIBufferUsage_Vertex) usage |= VK_BUFFER_USAGE_VERTEX_BUFFER_BIT;
            if (desc.usage & RHIBufferUsage_Index) usage |= VK_BUFFER_USAGE_INDEX_BUFFER_BIT;
            if (desc.usage & RHIBufferUsage_Uniform) usage |= VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
            if (desc.usage & RHIBufferUsage_TransferDst) usage |= VK_BUFFER_USAGE_TRANSFER_DST_BIT;

            BufferSlot b{};
            b.size = desc.size_bytes;
            if (!create_host_buffer(desc.size_bytes, usage, b.buffer, b.memory)) return kNullRHIHandle;
            if (vkMapMemory(device_, b.memory, 0, desc.size_bytes, 0, &b.mapped) != VK_SUCCESS)
            {
                destroy_buffer_slot(b);
                return kNullRHIHandle;
            }
            if (!initial_bytes.empty())
            {
                std::memcpy(b.mapped, initial_bytes.data(), std::min<size_t>(initial_bytes.size(), (size_t)b.size));
            }
            const uint64_t h = next_handle_++;
            buffers_.emplace(h, b);
            return h;
        }

        bool write_buffer(RHIBufferHandle buffer, uint64_t offset, std::span<const uint8_t> bytes) override
        {
            const auto it = buffers_.find(buffer);
            if (it == buffers_.end() || !it->second.mapped) return false;
            if (offset + bytes.size() > it->second.size) return false;
            if (!bytes.empty()) std::memcpy(static_cast<uint8_t*>(it->second.mapped) + offset, bytes.data(), bytes.size());
            return true;
        }

        void destroy_buffer(RHIBufferHandle buffer) override
        {
            auto it = buffers_.find(buffer);
            if (it == buffers_.end()) return;
            destroy_buffer_slot(it->second);
            buffers_.erase(it);
        }

        RHITextureHandle create_texture(const RHITextureDesc& desc, std::span<const uint8_t> rgba_bytes) override
        {
            if (!initialized_) return kNullRHIHandle;
            const size_t expected = (size_t)desc.width * (size_t)desc.height * 4u;
            if (expected == 0 || rgba_bytes.size() != expected) return kNullRHIHandle;

            TextureSlot t{};
            if (!create_device_image(desc.width, desc.height, t)) return kNullRHIHandle;
            if (!upload_image(t.image, desc.width, desc.height, rgba_bytes))
            {
                destroy_texture_slot(t);
                return kNullRHIHandle;
            }

            VkImageViewCreateInfo iv{};
            iv.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
            iv.image = t.image;
            iv.viewType = VK_IMAGE_VIEW_TYPE_2D;
            iv.format = VK_FORMAT_R8G8B8A8_UNORM;
            iv.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
            iv.subresourceRange.levelCount = 1;
            iv.subresourceRange.layerCount = 1;
            if (vkCreateImageView(device_, &iv, nullptr, &t.view) != VK_SUCCESS)
            {
                destroy_texture_slot(t);
                return kNullRHIHandle;
            }
            const uint64_t h = next_handle_++;
            textures_.emplace(h, t);
            return h;
        }

        void destroy_texture(RHITextureHandle texture) override
        {
            auto it = textures_.find(texture);
            if (it == textures_.end()) return;
            destroy_texture_slot(it->second);
            textures_.erase(it);
        }

        RHISamplerHandle create_sampler(const RHISamplerDesc& desc) override
        {
            if (!initialized_) return kNullRHIHandle;
            VkSamplerCreateInfo si{};
            si.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
            si.magFilter = to_vk_filter(desc.mag_filter);
            si.minFilter = to_vk_filter(desc.min_filter);
            si.mipmapMode = VK_SAMPLER_MIPMAP_MODE_NEAREST;
            si.addressModeU = to_vk_address(desc.address_u);
            si.addressModeV = to_vk_address(desc.address_v);
            si.addressModeW = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
            si.maxLod = 0.0f;
            VkSampler s = VK_NULL_HANDLE;
            if (vkCreateSampler(device_, &si, nullptr, &s) != VK_SUCCESS) return kNullRHIHandle;
            const uint64_t h = next_handle_++;
            samplers_.emplace(h, s);
            return h;
        }

        void destroy_sampler(RHISamplerHandle sampler) override
        {
            auto it = samplers_.find(sampler);
            if (it == samplers_.end()) return;
            vkDestroySampler(device_, it->second, nullptr);
            samplers_.erase(it);
        }

        RHIBindGroupHandle create_texture_bind_group(RHITextureHandle texture, RHISamplerHandle sampler) override
        {
            const auto t = textures_.find(texture);
            const auto s = samplers_.find(sampler);
            if (t == textures_.end() || s == samplers_.end()) return kNullRHIHandle;

            VkDescriptorSet set = VK_NULL_HANDLE;
            if (!allocate_set(texture_layout_, set)) return kNullRHIHandle;

            VkDescriptorImageInfo ii{};
            ii.sampler = s->second;
            ii.imageView = t->second.view;
            ii.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;

            VkWriteDescriptorSet w{};
            w.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
            w.dstSet = set;
            w.dstBinding = 0;
            w.descriptorCount = 1;
            w.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
            w.pImageInfo = &ii;
            vkUpdateDescriptorSets(device_, 1, &w, 0, nullptr);

            const uint64_t h = next_handle_++;
            sets_.emplace(h, set);
            return h;
        }

        RHIBindGroupHandle create_uniform_bind_group(RHIBufferHandle buffer) override
        {
            const auto b = buffers_.find(buffer);
            if (b == buffers_.end()) return kNullRHIHandle;

            VkDescriptorSet set = VK_NULL_HANDLE;
            if (!allocate_set(uniform_layout_, set)) return kNullRHIHandle;

            VkDescriptorBufferInfo bi{};
            bi.buffer = b->second.buffer;
            bi.offset = 0;
            bi.range = b->second.size;

            VkWriteDescriptorSet w{};
            w.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
            w.dstSet = set;
            w.dstBinding = 0;
            w.descriptorCount = 1;
            w.descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
            w.pBufferInfo = &bi;
            vkUpdateDescriptorSets(device_, 1, &w, 0, nullptr);

            const uint64_t h = next_handle_++;
            sets_.emplace(h, set);
            return h;
        }

        RHIPipelineHandle create_graphics_pipeline(const RHIGraphicsPipelineDesc& desc) override
        {
            if (!initialized_) return kNullRHIHandle;

            std::vector<char> vs_code{};
            std::vector<char> fs_code{};
            if (!vk_read_spirv_file(desc.vs.spirv_path, vs_code) || !vk_read_spirv_file(desc.fs.spirv_path, fs_code))
            {
                log_error("[vulkan] pipeline '" + std::string(desc.label) + "': cannot read SPIR-V '" +
                    desc.vs.spirv_path + "' / '" + desc.fs.spirv_path + "'");
                return kNullRHIHandle;
            }
            VkShaderModule vs = create_shader_module(vs_code);
            VkShaderModule fs = create_shader_module(fs_code);
            if (vs == VK_NULL_HANDLE || fs == VK_NULL_HANDLE)
            {
                if (vs != VK_NULL_HANDLE) vkDestroyShaderModule(device_, vs, nullptr);
                if (fs != VK_NULL_HANDLE) vkDestroyShaderModule(device_, fs, nullptr);
                return kNullRHIHandle;
            }

            VkPipelineShaderStageCreateInfo stages[2]{};
            stages[0].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
            stages[0].stage = VK_SHADER_STAGE_VERTEX_BIT;
            stages[0].module = vs;
            stages[0].pName = desc.vs.entry;
            stages[1].sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO;
            stages[1].stage = VK_SHADER_STAGE_FRAGMENT_BIT;
            stages[1].module = fs;
            stages[1].pName = desc.fs.entry;

            std::vector<VkVertexInputBindingDescription> bindings{};
            std::vector<VkVertexInputAttributeDescription> attrs{};
            for (uint32_t i = 0; i < (uint32_t)desc.vertex_buffers.size(); ++i)
            {
                const RHIVertexBufferLayoutDesc& l = desc.vertex_buffers[i];
                VkVertexInputBindingDescription b{};
                b.binding = i;
                b.stride = l.stride;
                b.inputRate = l.step == RHIVertexStepMode::Instance
                    ? VK_VERTEX_INPUT_RATE_INSTANCE
                    : VK_VERTEX_INPUT_RATE_VERTEX;
                bindings.push_back(b);
                for (const RHIVertexAttributeDesc& a : l.attributes)
                {
                    VkVertexInputAttributeDescription va{};
                    va.location = a.location;
                    va.binding = i;
                    va.format = to_vk_vertex_format(a.format);
                    va.offset = a.offset;
                    attrs.push_back(va);
                }
            }

            VkPipelineVertexInputStateCreateInfo vi{};
            vi.sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO;
            vi.vertexBindingDescriptionCount = (uint32_t)bindings.size();
            vi.pVertexBindingDescriptions = bindings.data();
            vi.vertexAttributeDescriptionCount = (uint32_t)attrs.size();
            vi.pVertexAttributeDescriptions = attrs.data();

            VkPipelineInputAssemblyStateCreateInfo ia{};
            ia.sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO;
            ia.topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;

            VkPipelineViewportStateCreateInfo vp{};
            vp.sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO;
            vp.viewportCount = 1;
            vp.scissorCount = 1;

            VkPipelineRasterizationStateCreateInfo rs{};
            rs.sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO;
            rs.polygonMode = VK_POLYGON_MODE_FILL;
            rs.cullMode = desc.raster.cull == RHICullMode::Back ? VK_CULL_MODE_BACK_BIT
                : desc.raster.cull == RHICullMode::Front ? VK_CULL_MODE_FRONT_BIT
                : VK_CULL_MODE_NONE;
            rs.frontFace = desc.raster.front_face == RHIFrontFace::CW ? VK_FRONT_FACE_CLOCKWISE : VK_FRONT_FACE_COUNTER_CLOCKWISE;
            rs.lineWidth = 1.0f;

            VkPipelineMultisampleStateCreateInfo ms{};
            ms.sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO;
            ms.rasterizationSamples = VK_SAMPLE_COUNT_1_BIT;

            VkPipelineColorBlendAttachmentState cba{};
            cba.colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT | VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;
            cba.blendEnable = desc.blend.alpha_blend ? VK_TRUE : VK_FALSE;
            cba.srcColorBlendFactor = VK_BLEND_FACTOR_SRC_ALPHA;
            cba.dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
            cba.colorBlendOp = VK_BLEND_OP_ADD;
            cba.srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE;
            cba.dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA;
            cba.alphaBlendOp = VK_BLEND_OP_ADD;

            VkPipelineColorBlendStateCreateInfo cb{};
            cb.sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO;
            cb.attachmentCount = 1;
            cb.pAttachments = &cba;

            const VkDynamicState dyn_states[] = {VK_DYNAMIC_STATE_VIEWPORT, VK_DYNAMIC_STATE_SCISSOR};
            VkPipelineDynamicStateCreateInfo dyn{};
            dyn.sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO;
            dyn.dynamicStateCount = 2;
            dyn.pDynamicStates = dyn_states;

            VkGraphicsPipelineCreateInfo gp{};
            gp.sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO;
            gp.stageCount = 2;
            gp.pStages = stages;
            gp.pVertexInputState = &vi;
            gp.pInputAssemblyState = &ia;
            gp.pViewportState = &vp;
            gp.pRasterizationState = &rs;
            gp.pMultisampleState = &ms;
            gp.pColorBlendState = &cb;
            gp.pDynamicState = &dyn;
            gp.layout = pipeline_layout_;
            gp.renderPass = render_pass_;
            gp.subpass = 0;

            VkPipeline pipeline = VK_NULL_HANDLE;
            const VkResult res = vkCreateGraphicsPipelines(device_, VK_NULL_HANDLE, 1, &gp, nullptr, &pipeline);
            vkDestroyShaderModule(device_, vs, nullptr);
            vkDestroyShaderModule(device_, fs, nullptr);
            if (res != VK_SUCCESS)
            {
                log_error("[vulkan] vkCreateGraphicsPipelines failed for '" + std::string(desc.label) + "'");
                return kNullRHIHandle;
            }
            const uint64_t h = next_handle_++;
            pipelines_.emplace(h, pipeline);
            return h;
        }

        SurfaceAcquireResult acquire_frame() override
        {
            SurfaceAcquireResult out{};
            out.width = extent_.width;
            out.height = extent_.height;
            if (!initialized_ || device_lost_)
            {
                out.status = device_lost_ ? SurfaceStatus::DeviceLost : SurfaceStatus::Failed;
                return out;
            }
            if (swapchain_ == VK_NULL_HANDLE)
            {
                out.status = SurfaceStatus::Outdated;
                return out;
            }

            const VkResult wait_res = vkWaitForFences(device_, 1, &inflight_fence_, VK_TRUE, UINT64_MAX);
            if (wait_res != VK_SUCCESS)
            {
                out.status = map_result(wait_res);
                return out;
            }

            uint32_t image_index = 0;
            const VkResult res = vkAcquireNextImageKHR(device_, swapchain_, kAcquireTimeoutNs, image_available_, VK_NULL_HANDLE, &image_index);
            if (res != VK_SUCCESS)
            {
                out.status = map_result(res);
                return out;
            }

            if (vkResetFences(device_, 1, &inflight_fence_) != VK_SUCCESS)
            {
                out.status = SurfaceStatus::Failed;
                return out;
            }
            fence_pending_ = true;

            VkCommandBufferBeginInfo bi{};
            bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
            bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
            if (vkResetCommandBuffer(cmd_buf_, 0) != VK_SUCCESS ||
                vkBeginCommandBuffer(cmd_buf_, &bi) != VK_SUCCESS)
            {
                abort_frame();
                out.status = SurfaceStatus::Failed;
                return out;
            }
            cmd_recording_ = true;

            image_index_ = image_index;
            frame_open_ = true;
            out.image_index = image_index;
            out.status = SurfaceStatus::Ok;
            return out;
        }

        void begin_render_pass(const RHICmdBeginPassDesc& desc) override
        {
            if (!frame_open_) return;

            VkClearValue clear{};
            clear.color.float32[0] = desc.clear_value.r;
            clear.color.float32[1] = desc.clear_value.g;
            clear.color.float32[2] = desc.clear_value.b;
            clear.color.float32[3] = desc.clear_value.a;

            VkRenderPassBeginInfo rp{};
            rp.sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO;
            rp.renderPass = render_pass_;
            rp.framebuffer = framebuffers_[image_index_];
            rp.renderArea.extent = extent_;
            rp.clearValueCount = 1;
            rp.pClearValues = &clear;
            vkCmdBeginRenderPass(cmd_buf_, &rp, VK_SUBPASS_CONTENTS_INLINE);
            pass_open_ = true;

            // Сөрөг өндөртэй viewport: NDC +y дээш.
            VkViewport viewport{};
            viewport.x = 0.0f;
            viewport.y = (float)extent_.height;
            viewport.width = (float)extent_.width;
            viewport.height = -(float)extent_.height;
            viewport.minDepth = 0.0f;
            viewport.maxDepth = 1.0f;
            VkRect2D scissor{};
            scissor.extent = extent_;
            vkCmdSetViewport(cmd_buf_, 0, 1, &viewport);
            vkCmdSetScissor(cmd_buf_, 0, 1, &scissor);
        }

        void bind_pipeline(const RHICmdBindPipelineDesc& desc) override
        {
            const auto it = pipelines_.find(desc.pipeline);
            if (!frame_open_ || it == pipelines_.end()) return;
            vkCmdBindPipeline(cmd_buf_, VK_PIPELINE_BIND_POINT_GRAPHICS, it->second);
        }

        void bind_group(const RHICmdBindGroupDesc& desc) override
        {
            const auto it = sets_.find(desc.group);
            if (!frame_open_ || it == sets_.end()) return;
            vkCmdBindDescriptorSets(cmd_buf_, VK_PIPELINE_BIND_POINT_GRAPHICS, pipeline_layout_, desc.slot, 1, &it->second, 0, nullptr);
        }

        void bind_vertex_buffer(const RHICmdBindVertexBufferDesc& desc) override
        {
            const auto it = buffers_.find(desc.buffer);
            if (!frame_open_ || it == buffers_.end()) return;
            const VkDeviceSize offset = desc.offset;
            vkCmdBindVertexBuffers(cmd_buf_, desc.slot, 1, &it->second.buffer, &offset);
        }

        void bind_index_buffer(const RHICmdBindIndexBufferDesc& desc) override
        {
            const auto it = buffers_.find(desc.buffer);
            if (!frame_open_ || it == buffers_.end()) return;
            vkCmdBindIndexBuffer(cmd_buf_, it->second.buffer, desc.offset, desc.index_u32 ? VK_INDEX_TYPE_UINT32 : VK_INDEX_TYPE_UINT16);
        }

        void draw_indexed(const RHICmdDrawIndexedDesc& desc) override
        {
            if (!frame_open_) return;
            vkCmdDrawIndexed(cmd_buf_, desc.index_count, desc.instance_count, desc.first_index, desc.vertex_offset, desc.first_instance);
        }

        void end_render_pass() override
        {
            if (!frame_open_ || !pass_open_) return;
            vkCmdEndRenderPass(cmd_buf_);
            pass_open_ = false;
        }

        bool submit_frame() override
        {
            if (!frame_open_) return false;
            if (pass_open_)
            {
                vkCmdEndRenderPass(cmd_buf_);
                pass_open_ = false;
            }
            const VkResult end_res = vkEndCommandBuffer(cmd_buf_);
            cmd_recording_ = false;
            if (end_res != VK_SUCCESS)
            {
                log_error("[vulkan] vkEndCommandBuffer failed");
                return false;
            }

            VkPipelineStageFlags wait_stage = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
            VkSubmitInfo si{};
            si.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
            si.waitSemaphoreCount = 1;
            si.pWaitSemaphores = &image_available_;
            si.pWaitDstStageMask = &wait_stage;
            si.commandBufferCount = 1;
            si.pCommandBuffers = &cmd_buf_;
            si.signalSemaphoreCount = 1;
            si.pSignalSemaphores = &render_finished_;
            const VkResult res = vkQueueSubmit(graphics_q_, 1, &si, inflight_fence_);
            if (res == VK_ERROR_DEVICE_LOST) device_lost_ = true;
            if (res != VK_SUCCESS)
            {
                log_error("[vulkan] vkQueueSubmit failed: " + std::to_string((int)res));
                return false;
            }
            fence_pending_ = false;
            return true;
        }

        // Acquire-аас хойш тасарсан фрэймийг хаяна. Хоосон submit нь image_available_-ийг
        // хүлээж, inflight_fence_-ийг signal хийнэ. Ингэснээр дараагийн acquire_frame()
        // fence дээр гацахгүй.
        void abort_frame() override
        {
            if (device_ == VK_NULL_HANDLE) return;
            if (cmd_recording_)
            {
                if (pass_open_) vkCmdEndRenderPass(cmd_buf_);
                if (vkEndCommandBuffer(cmd_buf_) != VK_SUCCESS)
                {
                    log_warn("[vulkan] vkEndCommandBuffer failed while aborting frame");
                }
            }
            cmd_recording_ = false;
            pass_open_ = false;
            frame_open_ = false;
            if (!fence_pending_) return;

            VkPipelineStageFlags wait_stage = VK_PIPELINE_STAGE_ALL_COMMANDS_BIT;
            VkSubmitInfo si{};
            si.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
            si.waitSemaphoreCount = 1;
            si.pWaitSemaphores = &image_available_;
            si.pWaitDstStageMask = &wait_stage;
            const VkResult res = vkQueueSubmit(graphics_q_, 1, &si, inflight_fence_);
            if (res == VK_SUCCESS)
            {
                fence_pending_ = false;
                return;
            }
            if (res == VK_ERROR_DEVICE_LOST)
            {
                device_lost_ = true;
                log_error("[vulkan] device lost while aborting frame");
                return;
            }

            // Хоосон submit ч бүтэлгүйтвэл sync объектуудыг signal төлөвтэй шинээр үүсгэнэ.
            log_warn("[vulkan] empty submit failed while aborting frame; recreating sync objects");
            const VkResult idle_res = vkDeviceWaitIdle(device_);
            if (idle_res != VK_SUCCESS)
            {
                if (idle_res == VK_ERROR_DEVICE_LOST) device_lost_ = true;
                log_error("[vulkan] vkDeviceWaitIdle failed while aborting frame");
                return;
            }
            destroy_sync_objects();
            if (!create_sync_objects())
            {
                log_error("[vulkan] failed to recreate sync objects");
                return;
            }
            fence_pending_ = false;
        }

        SurfaceStatus present_frame() override
        {
            if (!frame_open_) return SurfaceStatus::Failed;
            frame_open_ = false;

            VkPresentInfoKHR pi{};
            pi.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
            pi.waitSemaphoreCount = 1;
            pi.pWaitSemaphores = &render_finished_;
            pi.swapchainCount = 1;
            pi.pSwapchains = &swapchain_;
            pi.pImageIndices = &image_index_;
            return map_result(vkQueuePresentKHR(present_q_, &pi));
        }

        // Swapchain-ийг drawable хэмжээгээр дахин байгуулна. width/height нь
        // surface currentExtent тодорхойгүй үед хэрэглэгдэнэ.
        bool configure_surface(uint32_t width, uint32_t height) override
        {
            if (device_ == VK_NULL_HANDLE) return false;
            if (width > 0 && height > 0)
            {
                requested_width_ = width;
                requested_height_ = height;
            }
            int dw = 0;
            int dh = 0;
            SDL_Vulkan_GetDrawableSize(window_, &dw, &dh);
            if (dw <= 0 || dh <= 0) return false;

            const VkResult idle_res = vkDeviceWaitIdle(device_);
            if (idle_res == VK_ERROR_DEVICE_LOST) device_lost_ = true;
            if (idle_res != VK_SUCCESS) return false;

            frame_open_ = false;
            cmd_recording_ = false;
            pass_open_ = false;
            fence_pending_ = false;
            destroy_swapchain_objects();
            destroy_sync_objects();
            if (!create_swapchain()) return false;
            if (!create_framebuffers()) return false;
            if (!create_sync_objects()) return false;
            log_debug("[vulkan] swapchain rebuilt " + std::to_string(extent_.width) + "x" + std::to_string(extent_.height));
            return true;
        }

        uint32_t surface_width() const override { return extent_.width != 0 ? extent_.width : requested_width_; }
        uint32_t surface_height() const override { return extent_.height != 0 ? extent_.height : requested_height_; }

    private:
        struct BufferSlot
        {
            VkBuffer buffer = VK_NULL_HANDLE;
            VkDeviceMemory memory = VK_NULL_HANDLE;
            VkDeviceSize size = 0;
            void* mapped = nullptr;
        };

        struct TextureSlot
        {
            VkImage image = VK_NULL_HANDLE;
            VkDeviceMemory memory = VK_NULL_HANDLE;
            VkImageView view = VK_NULL_HANDLE;
        };

        struct QueueFamilies
        {
            std::optional<uint32_t> graphics{};
            std::optional<uint32_t> present{};
            bool ok() const { return graphics.has_value() && present.has_value(); }
        };

        struct SwapchainSupport
        {
            VkSurfaceCapabilitiesKHR caps{};
            std::vector<VkSurfaceFormatKHR> formats{};
            std::vector<VkPresentModeKHR> modes{};
        };

        static constexpr uint64_t kAcquireTimeoutNs = 1000000000ull;
        static constexpr uint32_t kMaxTextureSets = 1024;
        static constexpr uint32_t kMaxUniformSets = 16;

        static SurfaceStatus map_result(VkResult r)
        {
            switch (r)
            {
                case VK_SUCCESS: return SurfaceStatus::Ok;
                case VK_SUBOPTIMAL_KHR: return SurfaceStatus::Suboptimal;
                case VK_ERROR_OUT_OF_DATE_KHR: return SurfaceStatus::Outdated;
                case VK_ERROR_SURFACE_LOST_KHR: return SurfaceStatus::Lost;
                case VK_TIMEOUT:
                case VK_NOT_READY: return SurfaceStatus::Timeout;
                case VK_ERROR_DEVICE_LOST: return SurfaceStatus::DeviceLost;
                default: break;
            }
            return SurfaceStatus::Failed;
        }

        static VkFilter to_vk_filter(RHIFilter f)
        {
            return f == RHIFilter::Nearest ? VK_FILTER_NEAREST : VK_FILTER_LINEAR;
        }

        static VkSamplerAddressMode to_vk_address(RHIAddressMode m)
        {
            switch (m)
            {
                case RHIAddressMode::ClampToEdge: return VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
                case RHIAddressMode::Repeat: return VK_SAMPLER_ADDRESS_MODE_REPEAT;
                case RHIAddressMode::MirrorRepeat: return VK_SAMPLER_ADDRESS_MODE_MIRRORED_REPEAT;
            }
            return VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
        }

        static VkFormat to_vk_vertex_format(RHIVertexFormat f)
        {
            switch (f)
            {
                case RHIVertexFormat::Float2: return VK_FORMAT_R32G32_SFLOAT;
                case RHIVertexFormat::Float3: return VK_FORMAT_R32G32B32_SFLOAT;
                case RHIVertexFormat::Float4: return VK_FORMAT_R32G32B32A32_SFLOAT;
            }
            return VK_FORMAT_UNDEFINED;
        }

        static VKAPI_ATTR VkBool32 VKAPI_CALL debug_callback(
            VkDebugUtilsMessageSeverityFlagBitsEXT severity,
            VkDebugUtilsMessageTypeFlagsEXT type,
            const VkDebugUtilsMessengerCallbackDataEXT* data,
            void* user)
        {
            (void)type;
            (void)user;
            if (data && data->pMessage)
            {
                if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) log_error(std::string("[vulkan] ") + data->pMessage);
                else log_warn(std::string("[vulkan] ") + data->pMessage);
            }
            return VK_FALSE;
        }

        static bool layer_supported(const char* name)
        {
            uint32_t count = 0;
            vkEnumerateInstanceLayerProperties(&count, nullptr);
            std::vector<VkLayerProperties> layers(count);
            vkEnumerateInstanceLayerProperties(&count, layers.data());
            for (const auto& l : layers)
            {
                if (std::strcmp(l.layerName, name) == 0) return true;
            }
            return false;
        }

        static bool extension_supported(const char* name)
        {
            uint32_t count = 0;
            vkEnumerateInstanceExtensionProperties(nullptr, &count, nullptr);
            std::vector<VkExtensionProperties> exts(count);
            vkEnumerateInstanceExtensionProperties(nullptr, &count, exts.data());
            for (const auto& e : exts)
            {
                if (std::strcmp(e.extensionName, name) == 0) return true;
            }
            return false;
        }

        bool create_instance()
        {
            unsigned int ext_count = 0;
            if (!SDL_Vulkan_GetInstanceExtensions(window_, &ext_count, nullptr)) return false;
            std::vector<const char*> exts(ext_count);
            if (!SDL_Vulkan_GetInstanceExtensions(window_, &ext_count, exts.data())) return false;

            const char* validation_layer = "VK_LAYER_KHRONOS_validation";
            const bool debug_utils = enable_validation_ && extension_supported(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
            if (enable_validation_)
            {
                if (layer_supported(validation_layer)) layers_.push_back(validation_layer);
                else log_warn("[vulkan] validation requested but VK_LAYER_KHRONOS_validation is unavailable");
            }
            if (debug_utils) exts.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);

            VkApplicationInfo app{};
            app.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
            app.pApplicationName = app_name_.c_str();
            app.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
            app.pEngineName = "qdr";
            app.engineVersion = VK_MAKE_VERSION(0, 1, 0);
            app.apiVersion = VK_API_VERSION_1_1;

            VkInstanceCreateInfo ci{};
            ci.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
            ci.pApplicationInfo = &app;
            ci.enabledLayerCount = (uint32_t)layers_.size();
            ci.ppEnabledLayerNames = layers_.empty() ? nullptr : layers_.data();
            ci.enabledExtensionCount = (uint32_t)exts.size();
            ci.ppEnabledExtensionNames = exts.empty() ? nullptr : exts.data();
            if (vkCreateInstance(&ci, nullptr, &instance_) != VK_SUCCESS) return false;

            if (debug_utils && !layers_.empty())
            {
                auto create_fn = (PFN_vkCreateDebugUtilsMessengerEXT)vkGetInstanceProcAddr(instance_, "vkCreateDebugUtilsMessengerEXT");
                if (create_fn)
                {
                    VkDebugUtilsMessengerCreateInfoEXT dbg{};
                    dbg.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
                    dbg.messageSeverity = VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
                    dbg.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT | VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT;
                    dbg.pfnUserCallback = debug_callback;
                    if (create_fn(instance_, &dbg, nullptr, &debug_messenger_) != VK_SUCCESS)
                    {
                        log_warn("[vulkan] debug messenger creation failed");
                    }
                }
            }
            return true;
        }

        QueueFamilies find_queue_families(VkPhysicalDevice gpu) const
        {
            QueueFamilies out{};
            uint32_t n = 0;
            vkGetPhysicalDeviceQueueFamilyProperties(gpu, &n, nullptr);
            std::vector<VkQueueFamilyProperties> props(n);
            vkGetPhysicalDeviceQueueFamilyProperties(gpu, &n, props.data());
            for (uint32_t i = 0; i < n; ++i)
            {
                if (props[i].queueFlags & VK_QUEUE_GRAPHICS_BIT) out.graphics = i;
                VkBool32 present = VK_FALSE;
                vkGetPhysicalDeviceSurfaceSupportKHR(gpu, i, surface_, &present);
                if (present) out.present = i;
                if (out.ok()) break;
            }
            return out;
        }

        SwapchainSupport query_swapchain_support(VkPhysicalDevice gpu) const
        {
            SwapchainSupport out{};
            vkGetPhysicalDeviceSurfaceCapabilitiesKHR(gpu, surface_, &out.caps);
            uint32_t nf = 0;
            vkGetPhysicalDeviceSurfaceFormatsKHR(gpu, surface_, &nf, nullptr);
            out.formats.resize(nf);
            if (nf) vkGetPhysicalDeviceSurfaceFormatsKHR(gpu, surface_, &nf, out.formats.data());
            uint32_t nm = 0;
            vkGetPhysicalDeviceSurfacePresentModesKHR(gpu, surface_, &nm, nullptr);
            out.modes.resize(nm);
            if (nm) vkGetPhysicalDeviceSurfacePresentModesKHR(gpu, surface_, &nm, out.modes.data());
            return out;
        }

        static bool device_extension_supported(VkPhysicalDevice gpu, const char* name)
        {
            uint32_t count = 0;
            vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, nullptr);
            std::vector<VkExtensionProperties> exts(count);
            vkEnumerateDeviceExtensionProperties(gpu, nullptr, &count, exts.data());
            for (const auto& e : exts)
            {
                if (std::strcmp(e.extensionName, name) == 0) return true;
            }
            return false;
        }

        bool pick_physical_device()
        {
            uint32_t gpu_count = 0;
            vkEnumeratePhysicalDevices(instance_, &gpu_count, nullptr);
            if (gpu_count == 0) return false;
            std::vector<VkPhysicalDevice> gpus(gpu_count);
            vkEnumeratePhysicalDevices(instance_, &gpu_count, gpus.data());
            for (VkPhysicalDevice gpu : gpus)
            {
                const QueueFamilies qf = find_queue_families(gpu);
                const SwapchainSupport sc = query_swapchain_support(gpu);
                if (!qf.ok() || sc.formats.empty() || sc.modes.empty()) continue;
                if (!device_extension_supported(gpu, VK_KHR_SWAPCHAIN_EXTENSION_NAME)) continue;
                gpu_ = gpu;
                qf_ = qf;
                return true;
            }
            return false;
        }

        bool create_device_and_queues()
        {
            float qprio = 1.0f;
            std::vector<uint32_t> fams{*qf_.graphics};
            if (*qf_.present != *qf_.graphics) fams.push_back(*qf_.present);

            std::vector<VkDeviceQueueCreateInfo> qcis{};
            for (uint32_t fam : fams)
            {
                VkDeviceQueueCreateInfo qci{};
                qci.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
                qci.queueFamilyIndex = fam;
                qci.queueCount = 1;
                qci.pQueuePriorities = &qprio;
                qcis.push_back(qci);
            }

            const char* device_exts[] = {VK_KHR_SWAPCHAIN_EXTENSION_NAME};
            VkDeviceCreateInfo dci{};
            dci.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
            dci.queueCreateInfoCount = (uint32_t)qcis.size();
            dci.pQueueCreateInfos = qcis.data();
            dci.enabledExtensionCount = 1;
            dci.ppEnabledExtensionNames = device_exts;
            if (vkCreateDevice(gpu_, &dci, nullptr, &device_) != VK_SUCCESS) return false;

            vkGetDeviceQueue(device_, *qf_.graphics, 0, &graphics_q_);
            vkGetDeviceQueue(device_, *qf_.present, 0, &present_q_);
            return true;
        }

        VkPresentModeKHR choose_present_mode(const std::vector<VkPresentModeKHR>& modes) const
        {
            if (present_mode_pref_ == VkPresentModePreference::Mailbox)
            {
                for (const auto m : modes)
                {
                    if (m == VK_PRESENT_MODE_MAILBOX_KHR) return m;
                }
            }
            return VK_PRESENT_MODE_FIFO_KHR;
        }

        VkExtent2D choose_extent(const VkSurfaceCapabilitiesKHR& caps) const
        {
            if (caps.currentExtent.width != UINT32_MAX) return caps.currentExtent;
            int w = 0;
            int h = 0;
            SDL_Vulkan_GetDrawableSize(window_, &w, &h);
            if (w <= 0 || h <= 0)
            {
                w = (int)requested_width_;
                h = (int)requested_height_;
            }
            VkExtent2D out{};
            out.width = std::clamp((uint32_t)w, caps.minImageExtent.width, caps.maxImageExtent.width);
            out.height = std::clamp((uint32_t)h, caps.minImageExtent.height, caps.maxImageExtent.height);
            return out;
        }

        bool create_swapchain()
        {
            const SwapchainSupport sc = query_swapchain_support(gpu_);
            if (sc.formats.empty() || sc.modes.empty()) return false;

            VkSurfaceFormatKHR sf = sc.formats[0];
            for (const auto& f : sc.formats)
            {
                if (f.format == VK_FORMAT_B8G8R8A8_UNORM && f.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR)
                {
                    sf = f;
                    break;
                }
            }
            // Render pass-ийг swapchain-ийн формат өөрчлөгдөхгүй гэж үзэж нэг удаа үүсгэнэ.
            if (swapchain_format_ != VK_FORMAT_UNDEFINED && sf.format != swapchain_format_) return false;

            const VkExtent2D extent = choose_extent(sc.caps);
            if (extent.width == 0 || extent.height == 0) return false;

            uint32_t img_count = sc.caps.minImageCount + 1;
            if (sc.caps.maxImageCount > 0 && img_count > sc.caps.maxImageCount) img_count = sc.caps.maxImageCount;

            const uint32_t qidx[] = {*qf_.graphics, *qf_.present};
            VkSwapchainCreateInfoKHR sci{};
            sci.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
            sci.surface = surface_;
            sci.minImageCount = img_count;
            sci.imageFormat = sf.format;
            sci.imageColorSpace = sf.colorSpace;
            sci.imageExtent = extent;
            sci.imageArrayLayers = 1;
            sci.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
            if (*qf_.graphics != *qf_.present)
            {
                sci.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
                sci.queueFamilyIndexCount = 2;
                sci.pQueueFamilyIndices = qidx;
            }
            else
            {
                sci.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
            }
            sci.preTransform = sc.caps.currentTransform;
            sci.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
            sci.presentMode = choose_present_mode(sc.modes);
            sci.clipped = VK_TRUE;
            if (vkCreateSwapchainKHR(device_, &sci, nullptr, &swapchain_) != VK_SUCCESS) return false;

            extent_ = extent;
            swapchain_format_ = sf.format;

            uint32_t nimg = 0;
            if (vkGetSwapchainImagesKHR(device_, swapchain_, &nimg, nullptr) != VK_SUCCESS || nimg == 0) return false;
            images_.resize(nimg);
            if (vkGetSwapchainImagesKHR(device_, swapchain_, &nimg, images_.data()) != VK_SUCCESS) return false;

            views_.assign(images_.size(), VK_NULL_HANDLE);
            for (size_t i = 0; i < images_.size(); ++i)
            {
                VkImageViewCreateInfo iv{};
                iv.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
                iv.image = images_[i];
                iv.viewType = VK_IMAGE_VIEW_TYPE_2D;
                iv.format = swapchain_format_;
                iv.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
                iv.subresourceRange.levelCount = 1;
                iv.subresourceRange.layerCount = 1;
                if (vkCreateImageView(device_, &iv, nullptr, &views_[i]) != VK_SUCCESS) return false;
            }
            return true;
        }

        bool create_render_pass()
        {
            VkAttachmentDescription color{};
            color.format = swapchain_format_;
            color.samples = VK_SAMPLE_COUNT_1_BIT;
            color.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
            color.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
            color.stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE;
            color.stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
            color.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
            color.finalLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;

            VkAttachmentReference color_ref{};
            color_ref.attachment = 0;
            color_ref.layout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;

            VkSubpassDescription sub{};
            sub.pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
            sub.colorAttachmentCount = 1;
            sub.pColorAttachments = &color_ref;

            VkSubpassDependency dep{};
            dep.srcSubpass = VK_SUBPASS_EXTERNAL;
            dep.dstSubpass = 0;
            dep.srcStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
            dep.dstStageMask = VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT;
            dep.dstAccessMask = VK_ACCESS_COLOR_ATTACHMENT_WRITE_BIT;

            VkRenderPassCreateInfo rp{};
            rp.sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO;
            rp.attachmentCount = 1;
            rp.pAttachments = &color;
            rp.subpassCount = 1;
            rp.pSubpasses = &sub;
            rp.dependencyCount = 1;
            rp.pDependencies = &dep;
            return vkCreateRenderPass(device_, &rp, nullptr, &render_pass_) == VK_SUCCESS;
        }

        bool create_framebuffers()
        {
            framebuffers_.assign(views_.size(), VK_NULL_HANDLE);
            for (size_t i = 0; i < views_.size(); ++i)
            {
                VkFramebufferCreateInfo fb{};
                fb.sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO;
                fb.renderPass = render_pass_;
                fb.attachmentCount = 1;
                fb.pAttachments = &views_[i];
                fb.width = extent_.width;
                fb.height = extent_.height;
                fb.layers = 1;
                if (vkCreateFramebuffer(device_, &fb, nullptr, &framebuffers_[i]) != VK_SUCCESS) return false;
            }
            return true;
        }

        bool create_command_pool_and_buffer()
        {
            VkCommandPoolCreateInfo cp{};
            cp.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
            cp.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
            cp.queueFamilyIndex = *qf_.graphics;
            if (vkCreateCommandPool(device_, &cp, nullptr, &cmd_pool_) != VK_SUCCESS) return false;

            VkCommandBufferAllocateInfo cba{};
            cba.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
            cba.commandPool = cmd_pool_;
            cba.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
            cba.commandBufferCount = 1;
            return vkAllocateCommandBuffers(device_, &cba, &cmd_buf_) == VK_SUCCESS;
        }

        bool create_sync_objects()
        {
            VkSemaphoreCreateInfo sem{};
            sem.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
            VkFenceCreateInfo fe{};
            fe.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
            fe.flags = VK_FENCE_CREATE_SIGNALED_BIT;
            if (vkCreateSemaphore(device_, &sem, nullptr, &image_available_) != VK_SUCCESS) return false;
            if (vkCreateSemaphore(device_, &sem, nullptr, &render_finished_) != VK_SUCCESS) return false;
            return vkCreateFence(device_, &fe, nullptr, &inflight_fence_) == VK_SUCCESS;
        }

        // set 0: camera uniform (vertex), set 1: texture + sampler (fragment)
        bool create_descriptor_objects()
        {
            VkDescriptorSetLayoutBinding ub{};
            ub.binding = 0;
            ub.descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
            ub.descriptorCount = 1;
            ub.stageFlags = VK_SHADER_STAGE_VERTEX_BIT;
            VkDescriptorSetLayoutCreateInfo ul{};
            ul.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
            ul.bindingCount = 1;
            ul.pBindings = &ub;
            if (vkCreateDescriptorSetLayout(device_, &ul, nullptr, &uniform_layout_) != VK_SUCCESS) return false;

            VkDescriptorSetLayoutBinding tb{};
            tb.binding = 0;
            tb.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
            tb.descriptorCount = 1;
            tb.stageFlags = VK_SHADER_STAGE_FRAGMENT_BIT;
            VkDescriptorSetLayoutCreateInfo tl{};
            tl.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
            tl.bindingCount = 1;
            tl.pBindings = &tb;
            if (vkCreateDescriptorSetLayout(device_, &tl, nullptr, &texture_layout_) != VK_SUCCESS) return false;

            const VkDescriptorSetLayout set_layouts[] = {uniform_layout_, texture_layout_};
            VkPipelineLayoutCreateInfo pl{};
            pl.sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO;
            pl.setLayoutCount = 2;
            pl.pSetLayouts = set_layouts;
            if (vkCreatePipelineLayout(device_, &pl, nullptr, &pipeline_layout_) != VK_SUCCESS) return false;

            std::array<VkDescriptorPoolSize, 2> sizes{};
            sizes[0].type = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
            sizes[0].descriptorCount = kMaxUniformSets;
            sizes[1].type = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
            sizes[1].descriptorCount = kMaxTextureSets;
            VkDescriptorPoolCreateInfo dp{};
            dp.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
            dp.maxSets = kMaxUniformSets + kMaxTextureSets;
            dp.poolSizeCount = (uint32_t)sizes.size();
            dp.pPoolSizes = sizes.data();
            return vkCreateDescriptorPool(device_, &dp, nullptr, &descriptor_pool_) == VK_SUCCESS;
        }

        bool allocate_set(VkDescriptorSetLayout layout, VkDescriptorSet& out)
        {
            VkDescriptorSetAllocateInfo ai{};
            ai.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
            ai.descriptorPool = descriptor_pool_;
            ai.descriptorSetCount = 1;
            ai.pSetLayouts = &layout;
            if (vkAllocateDescriptorSets(device_, &ai, &out) != VK_SUCCESS)
            {
                log_error("[vulkan] descriptor pool exhausted");
                return false;
            }
            return true;
        }

        uint32_t find_memory_type(uint32_t type_bits, VkMemoryPropertyFlags required) const
        {
            VkPhysicalDeviceMemoryProperties mp{};
            vkGetPhysicalDeviceMemoryProperties(gpu_, &mp);
            for (uint32_t i = 0; i < mp.memoryTypeCount; ++i)
            {
                const bool type_ok = (type_bits & (1u << i)) != 0;
                const bool props_ok = (mp.memoryTypes[i].propertyFlags & required) == required;
                if (type_ok && props_ok) return i;
            }
            return UINT32_MAX;
        }

        bool create_host_buffer(VkDeviceSize size, VkBufferUsageFlags usage, VkBuffer& out_buffer, VkDeviceMemory& out_memory)
        {
            out_buffer = VK_NULL_HANDLE;
            out_memory = VK_NULL_HANDLE;

            VkBufferCreateInfo bci{};
            bci.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
            bci.size = size;
            bci.usage = usage;
            bci.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
            if (vkCreateBuffer(device_, &bci, nullptr, &out_buffer) != VK_SUCCESS) return false;

            VkMemoryRequirements req{};
            vkGetBufferMemoryRequirements(device_, out_buffer, &req);
            const uint32_t memory_type = find_memory_type(req.memoryTypeBits,
                VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT | VK_MEMORY_PROPERTY_HOST_COHERENT_BIT);

            VkMemoryAllocateInfo mai{};
            mai.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
            mai.allocationSize = req.size;
            mai.memoryTypeIndex = memory_type;
            if (memory_type == UINT32_MAX ||
                vkAllocateMemory(device_, &mai, nullptr, &out_memory) != VK_SUCCESS ||
                vkBindBufferMemory(device_, out_buffer, out_memory, 0) != VK_SUCCESS)
            {
                if (out_memory != VK_NULL_HANDLE) vkFreeMemory(device_, out_memory, nullptr);
                vkDestroyBuffer(device_, out_buffer, nullptr);
                out_buffer = VK_NULL_HANDLE;
                out_memory = VK_NULL_HANDLE;
                return false;
            }
            return true;
        }

        void destroy_buffer_slot(BufferSlot& b)
        {
            if (b.mapped) vkUnmapMemory(device_, b.memory);
            if (b.buffer != VK_NULL_HANDLE) vkDestroyBuffer(device_, b.buffer, nullptr);
            if (b.memory != VK_NULL_HANDLE) vkFreeMemory(device_, b.memory, nullptr);
            b = BufferSlot{};
        }

        bool create_device_image(uint32_t width, uint32_t height, TextureSlot& t)
        {
            VkImageCreateInfo ii{};
            ii.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
            ii.imageType = VK_IMAGE_TYPE_2D;
            ii.extent = VkExtent3D{width, height, 1};
            ii.mipLevels = 1;
            ii.arrayLayers = 1;
            ii.format = VK_FORMAT_R8G8B8A8_UNORM;
            ii.tiling = VK_IMAGE_TILING_OPTIMAL;
            ii.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
            ii.usage = VK_IMAGE_USAGE_TRANSFER_DST_BIT | VK_IMAGE_USAGE_SAMPLED_BIT;
            ii.samples = VK_SAMPLE_COUNT_1_BIT;
            ii.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
            if (vkCreateImage(device_, &ii, nullptr, &t.image) != VK_SUCCESS) return false;

            VkMemoryRequirements req{};
            vkGetImageMemoryRequirements(device_, t.image, &req);
            VkMemoryAllocateInfo mai{};
            mai.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
            mai.allocationSize = req.size;
            mai.memoryTypeIndex = find_memory_type(req.memoryTypeBits, VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT);
            if (mai.memoryTypeIndex == UINT32_MAX ||
                vkAllocateMemory(device_, &mai, nullptr, &t.memory) != VK_SUCCESS ||
                vkBindImageMemory(device_, t.image, t.memory, 0) != VK_SUCCESS)
            {
                destroy_texture_slot(t);
                return false;
            }
            return true;
        }

        void destroy_texture_slot(TextureSlot& t)
        {
            if (t.view != VK_NULL_HANDLE) vkDestroyImageView(device_, t.view, nullptr);
            if (t.image != VK_NULL_HANDLE) vkDestroyImage(device_, t.image, nullptr);
            if (t.memory != VK_NULL_HANDLE) vkFreeMemory(device_, t.memory, nullptr);
            t = TextureSlot{};
        }

        static void image_barrier(VkCommandBuffer cb, VkImage image, VkImageLayout from, VkImageLayout to,
            VkAccessFlags src_access, VkAccessFlags dst_access, VkPipelineStageFlags src_stage, VkPipelineStageFlags dst_stage)
        {
            VkImageMemoryBarrier b{};
            b.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER;
            b.oldLayout = from;
            b.newLayout = to;
            b.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
            b.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
            b.image = image;
            b.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
            b.subresourceRange.levelCount = 1;
            b.subresourceRange.layerCount = 1;
            b.srcAccessMask = src_access;
            b.dstAccessMask = dst_access;
            vkCmdPipelineBarrier(cb, src_stage, dst_stage, 0, 0, nullptr, 0, nullptr, 1, &b);
        }

        // Staging buffer -> image, нэг удаагийн command buffer, queue idle хүлээнэ.
        bool upload_image(VkImage image, uint32_t width, uint32_t height, std::span<const uint8_t> rgba)
        {
            BufferSlot staging{};
            staging.size = rgba.size();
            if (!create_host_buffer(staging.size, VK_BUFFER_USAGE_TRANSFER_SRC_BIT, staging.buffer, staging.memory)) return false;
            if (vkMapMemory(device_, staging.memory, 0, staging.size, 0, &staging.mapped) != VK_SUCCESS)
            {
                destroy_buffer_slot(staging);
                return false;
            }
            std::memcpy(staging.mapped, rgba.data(), rgba.size());

            VkCommandBufferAllocateInfo cba{};
            cba.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
            cba.commandPool = cmd_pool_;
            cba.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
            cba.commandBufferCount = 1;
            VkCommandBuffer cb = VK_NULL_HANDLE;
            if (vkAllocateCommandBuffers(device_, &cba, &cb) != VK_SUCCESS)
            {
                destroy_buffer_slot(staging);
                return false;
            }

            VkCommandBufferBeginInfo bi{};
            bi.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
            bi.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
            bool ok = vkBeginCommandBuffer(cb, &bi) == VK_SUCCESS;
            if (ok)
            {
                image_barrier(cb, image, VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                    0, VK_ACCESS_TRANSFER_WRITE_BIT, VK_PIPELINE_STAGE_TOP_OF_PIPE_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT);

                VkBufferImageCopy region{};
                region.imageSubresource.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
                region.imageSubresource.layerCount = 1;
                region.imageExtent = VkExtent3D{width, height, 1};
                vkCmdCopyBufferToImage(cb, staging.buffer, image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);

                image_barrier(cb, image, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL,
                    VK_ACCESS_TRANSFER_WRITE_BIT, VK_ACCESS_SHADER_READ_BIT, VK_PIPELINE_STAGE_TRANSFER_BIT, VK_PIPELINE_STAGE_FRAGMENT_SHADER_BIT);
                ok = vkEndCommandBuffer(cb) == VK_SUCCESS;
            }
            if (ok)
            {
                VkSubmitInfo si{};
                si.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
                si.commandBufferCount = 1;
                si.pCommandBuffers = &cb;
                ok = vkQueueSubmit(graphics_q_, 1, &si, VK_NULL_HANDLE) == VK_SUCCESS &&
                    vkQueueWaitIdle(graphics_q_) == VK_SUCCESS;
            }

            vkFreeCommandBuffers(device_, cmd_pool_, 1, &cb);
            destroy_buffer_slot(staging);
            return ok;
        }

        VkShaderModule create_shader_module(const std::vector<char>& code)
        {
            VkShaderModuleCreateInfo ci{};
            ci.sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO;
            ci.codeSize = code.size();
            ci.pCode = reinterpret_cast<const uint32_t*>(code.data());
            VkShaderModule m = VK_NULL_HANDLE;
            if (vkCreateShaderModule(device_, &ci, nullptr, &m) != VK_SUCCESS) return VK_NULL_HANDLE;
            return m;
        }

        void destroy_swapchain_objects()
        {
            for (auto fb : framebuffers_) vkDestroyFramebuffer(device_, fb, nullptr);
            framebuffers_.clear();
            for (auto iv : views_)
            {
                if (iv != VK_NULL_HANDLE) vkDestroyImageView(device_, iv, nullptr);
            }
            views_.clear();
            images_.clear();
            if (swapchain_ != VK_NULL_HANDLE)
            {
                vkDestroySwapchainKHR(device_, swapchain_, nullptr);
                swapchain_ = VK_NULL_HANDLE;
            }
        }

        // Acquire хийгээд хаягдсан фрэймийн semaphore signal төлөвт үлдэхээс сэргийлж
        // swapchain-тэй хамт дахин үүсгэнэ.
        void destroy_sync_objects()
        {
            if (image_available_ != VK_NULL_HANDLE) vkDestroySemaphore(device_, image_available_, nullptr);
            if (render_finished_ != VK_NULL_HANDLE) vkDestroySemaphore(device_, render_finished_, nullptr);
            if (inflight_fence_ != VK_NULL_HANDLE) vkDestroyFence(device_, inflight_fence_, nullptr);
            image_available_ = VK_NULL_HANDLE;
            render_finished_ = VK_NULL_HANDLE;
            inflight_fence_ = VK_NULL_HANDLE;
        }

        void shutdown()
        {
            if (device_ != VK_NULL_HANDLE)
            {
                (void)vkDeviceWaitIdle(device_);
                for (auto& [h, b] : buffers_) { (void)h; destroy_buffer_slot(b); }
                for (auto& [h, t] : textures_) { (void)h; destroy_texture_slot(t); }
                for (auto& [h, s] : samplers_) { (void)h; vkDestroySampler(device_, s, nullptr); }
                for (auto& [h, p] : pipelines_) { (void)h; vkDestroyPipeline(device_, p, nullptr); }
                if (descriptor_pool_ != VK_NULL_HANDLE) vkDestroyDescriptorPool(device_, descriptor_pool_, nullptr);
                if (pipeline_layout_ != VK_NULL_HANDLE) vkDestroyPipelineLayout(device_, pipeline_layout_, nullptr);
                if (uniform_layout_ != VK_NULL_HANDLE) vkDestroyDescriptorSetLayout(device_, uniform_layout_, nullptr);
                if (texture_layout_ != VK_NULL_HANDLE) vkDestroyDescriptorSetLayout(device_, texture_layout_, nullptr);
                destroy_swapchain_objects();
                if (render_pass_ != VK_NULL_HANDLE) vkDestroyRenderPass(device_, render_pass_, nullptr);
                destroy_sync_objects();
                if (cmd_pool_ != VK_NULL_HANDLE) vkDestroyCommandPool(device_, cmd_pool_, nullptr);
                vkDestroyDevice(device_, nullptr);
            }
            if (surface_ != VK_NULL_HANDLE) vkDestroySurfaceKHR(instance_, surface_, nullptr);
            if (debug_messenger_ != VK_NULL_HANDLE)
            {
                auto destroy_fn = (PFN_vkDestroyDebugUtilsMessengerEXT)vkGetInstanceProcAddr(instance_, "vkDestroyDebugUtilsMessengerEXT");
                if (destroy_fn) destroy_fn(instance_, debug_messenger_, nullptr);
            }
            if (instance_ != VK_NULL_HANDLE) vkDestroyInstance(instance_, nullptr);

            buffers_.clear();
            textures_.clear();
            samplers_.clear();
            sets_.clear();
            pipelines_.clear();
            descriptor_pool_ = VK_NULL_HANDLE;
            pipeline_layout_ = VK_NULL_HANDLE;
            uniform_layout_ = VK_NULL_HANDLE;
            texture_layout_ = VK_NULL_HANDLE;
            render_pass_ = VK_NULL_HANDLE;
            cmd_pool_ = VK_NULL_HANDLE;
            cmd_buf_ = VK_NULL_HANDLE;
            device_ = VK_NULL_HANDLE;
            surface_ = VK_NULL_HANDLE;
            debug_messenger_ = VK_NULL_HANDLE;
            instance_ = VK_NULL_HANDLE;
            gpu_ = VK_NULL_HANDLE;
            graphics_q_ = VK_NULL_HANDLE;
            present_q_ = VK_NULL_HANDLE;
            qf_ = QueueFamilies{};
            swapchain_format_ = VK_FORMAT_UNDEFINED;
            extent_ = VkExtent2D{};
            layers_.clear();
            window_ = nullptr;
            initialized_ = false;
            frame_open_ = false;
            cmd_recording_ = false;
            pass_open_ = false;
            fence_pending_ = false;
            device_lost_ = false;
        }

        bool initialized_ = false;
        bool enable_validation_ = false;
        bool frame_open_ = false;
        // Command buffer бичигдэж байгаа (begin хийгдсэн, end хийгдээгүй).
        bool cmd_recording_ = false;
        bool pass_open_ = false;
        // Fence reset хийгдсэн ч submit-ээр signal хийгдэх ажил дараалалд ороогүй.
        bool fence_pending_ = false;
        bool device_lost_ = false;
        VkPresentModePreference present_mode_pref_ = VkPresentModePreference::Fifo;
        uint32_t requested_width_ = 0;
        uint32_t requested_height_ = 0;
        std::string app_name_ = "qdr-engine";
        std::vector<const char*> layers_{};
        SDL_Window* window_ = nullptr;

        VkInstance instance_ = VK_NULL_HANDLE;
        VkDebugUtilsMessengerEXT debug_messenger_ = VK_NULL_HANDLE;
        VkSurfaceKHR surface_ = VK_NULL_HANDLE;
        VkPhysicalDevice gpu_ = VK_NULL_HANDLE;
        QueueFamilies qf_{};
        VkDevice device_ = VK_NULL_HANDLE;
        VkQueue graphics_q_ = VK_NULL_HANDLE;
        VkQueue present_q_ = VK_NULL_HANDLE;

        VkSwapchainKHR swapchain_ = VK_NULL_HANDLE;
        VkFormat swapchain_format_ = VK_FORMAT_UNDEFINED;
        VkExtent2D extent_{};
        std::vector<VkImage> images_{};
        std::vector<VkImageView> views_{};
        std::vector<VkFramebuffer> framebuffers_{};
        VkRenderPass render_pass_ = VK_NULL_HANDLE;
        uint32_t image_index_ = 0;

        VkCommandPool cmd_pool_ = VK_NULL_HANDLE;
        VkCommandBuffer cmd_buf_ = VK_NULL_HANDLE;
        VkSemaphore image_available_ = VK_NULL_HANDLE;
        VkSemaphore render_finished_ = VK_NULL_HANDLE;
        VkFence inflight_fence_ = VK_NULL_HANDLE;

        VkDescriptorSetLayout uniform_layout_ = VK_NULL_HANDLE;
        VkDescriptorSetLayout texture_layout_ = VK_NULL_HANDLE;
        VkPipelineLayout pipeline_layout_ = VK_NULL_HANDLE;
        VkDescriptorPool descriptor_pool_ = VK_NULL_HANDLE;

        uint64_t next_handle_ = 1;
        std::unordered_map<uint64_t, BufferSlot> buffers_{};
        std::unordered_map<uint64_t, TextureSlot> textures_{};
        std::unordered_map<uint64_t, VkSampler> samplers_{};
        std::unordered_map<uint64_t, VkDescriptorSet> sets_{};
        std::unordered_map<uint64_t, VkPipeline> pipelines_{};
    };
}
#endif
