//
// Copyright (C) 2024 Pablo Delgado Krämer
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program. If not, see <https://www.gnu.org/licenses/>.
//

#pragma once

#include "rdx/rgpu/Rgpu.h"
#include "ShaderReflection.h"

#include <stdlib.h>
#include <mutex>
#include <vector>

#include <volk.h>

#ifdef __clang__
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wnullability-completeness"
#endif

#include <vk_mem_alloc.h>

#ifdef __clang__
#pragma clang diagnostic pop
#endif

#include <rdx/rb/Log.h>
#include <rdx/rb/LinearDataStore.h>

namespace rdx
{
  constexpr static const uint32_t RGPU_MIN_VK_API_VERSION = VK_API_VERSION_1_2;

  /* Internal structures */

  struct RgpuIDevice
  {
    VmaAllocator          allocator;
    VkQueue               queue;
    uint32_t              queueFamilyIndex;
    VkCommandPool         uploadCommandPool;
    VkDevice              logicalDevice;
    VkPhysicalDevice      physicalDevice;
    VkPipelineCache       pipelineCache;
    size_t                minMemoryMapAlignment;
    RgpuDeviceProperties  properties;
    VolkDeviceTable       table;
  };

  struct RgpuIBuffer
  {
    VmaAllocation        allocation;
    VkBuffer             buffer;
    uint64_t             size;
    RgpuBufferUsage      usage;
    RgpuMemoryProperties memoryProperties;

    void*                cpuPtr = nullptr;
    uint64_t             gpuAddress = 0;
  };

  struct RgpuIImage
  {
    VkImage       image;
    VmaAllocation allocation = VK_NULL_HANDLE; // null for swapchain images
    RgpuImageInfo info;
  };

  struct RgpuIImageView
  {
    VkImageView     imageView;
    RgpuImage       image;
    RgpuImageAspect aspect;
  };

  struct RgpuISampler
  {
    VkSampler sampler;
  };

  struct RgpuIFence
  {
    VkFence fence;
  };

  struct RgpuISemaphore
  {
    VkSemaphore semaphore;
  };

  struct RgpuIRenderPass
  {
    VkRenderPass renderPass;
    uint32_t     attachmentCount;
    uint32_t     colorAttachmentCount;
  };

  struct RgpuIFramebuffer
  {
    VkFramebuffer framebuffer;
    RgpuExtent2D  extent;
  };

  struct RgpuIPipelineLayout
  {
    VkPipelineLayout            layout;
    RgpuPipelineLayoutInterface shaderInterface;
  };

  struct RgpuIPipeline
  {
    VkPipeline          pipeline;
    VkPipelineBindPoint bindPoint;
    uint32_t            groupCount;
  };

  struct RgpuIDescriptorSetLayout
  {
    VkDescriptorSetLayout                       layout;
    RgpuDescriptorSetLayoutFlags                flags;
    std::vector<RgpuDescriptorSetLayoutBinding> bindings;
  };

  struct RgpuIDescriptorSet
  {
    VkDescriptorPool pool;
    VkDescriptorSet  descriptorSet;
  };

  struct RgpuIShaderModule
  {
    VkShaderModule       module;
    RgpuShaderStage      stage;
    RgpuShaderReflection reflection;
  };

  struct RgpuIAccelerationStructure
  {
    VkAccelerationStructureKHR     as;
    RgpuAccelerationStructureLevel level;
    RgpuBufferRegion               region;
    uint64_t                       address;
  };

  struct RgpuICommandBuffer
  {
    VkCommandBuffer commandBuffer;
    VkCommandPool   pool;
  };

  /* Context */

  struct RgpuContext
  {
    VkInstance   instance;
    VkSurfaceKHR surface = VK_NULL_HANDLE;
    bool         debugUtilsEnabled;

    RgpuIDevice  idevice;

    std::mutex storeMutex;

    RbLinearDataStore<RgpuIBuffer> ibufferStore;
    RbLinearDataStore<RgpuIImage> iimageStore;
    RbLinearDataStore<RgpuIImageView> iimageViewStore;
    RbLinearDataStore<RgpuISampler> isamplerStore;
    RbLinearDataStore<RgpuIFence> ifenceStore;
    RbLinearDataStore<RgpuISemaphore> isemaphoreStore;
    RbLinearDataStore<RgpuIRenderPass> irenderPassStore;
    RbLinearDataStore<RgpuIFramebuffer> iframebufferStore;
    RbLinearDataStore<RgpuIPipelineLayout> ipipelineLayoutStore;
    RbLinearDataStore<RgpuIPipeline> ipipelineStore;
    RbLinearDataStore<RgpuIDescriptorSetLayout> idescriptorSetLayoutStore;
    RbLinearDataStore<RgpuIDescriptorSet> idescriptorSetStore;
    RbLinearDataStore<RgpuIShaderModule> ishaderModuleStore;
    RbLinearDataStore<RgpuIAccelerationStructure> iasStore;
    RbLinearDataStore<RgpuICommandBuffer> icommandBufferStore;
  };

  /* Helper macros */

#define RGPU_RETURN_ERROR(msg)                      \
  do {                                              \
    RB_ERROR("{}:{}: {}", __FILE__, __LINE__, msg); \
    return false;                                   \
  } while (false)

#define RGPU_FATAL(msg)                             \
  do {                                              \
    RB_ERROR("{}:{}: {}", __FILE__, __LINE__, msg); \
    rdx::rbLogFlush();                              \
    exit(EXIT_FAILURE);                             \
  } while (false)

  template<typename T>
  uint64_t rgpuStoreAllocate(RgpuContext* ctx, RbLinearDataStore<T>& store)
  {
    std::lock_guard guard(ctx->storeMutex);
    return store.allocate();
  }

  template<typename T>
  void rgpuStoreFree(RgpuContext* ctx, RbLinearDataStore<T>& store, uint64_t handle)
  {
    std::lock_guard guard(ctx->storeMutex);
    store.free(handle);
  }

#define RGPU_RESOLVE_HANDLE(RESOURCE_NAME, HANDLE_TYPE, IRESOURCE_TYPE, RESOURCE_STORE)                            \
  inline bool rgpuResolve##RESOURCE_NAME(RgpuContext* ctx, HANDLE_TYPE handle, IRESOURCE_TYPE** idata)             \
  {                                                                                                                \
    std::lock_guard guard(ctx->storeMutex);                                                                        \
    return ctx->RESOURCE_STORE.get(handle.handle, idata);                                                          \
  }

  RGPU_RESOLVE_HANDLE(              Buffer,               RgpuBuffer,               RgpuIBuffer,               ibufferStore)
  RGPU_RESOLVE_HANDLE(               Image,                RgpuImage,                RgpuIImage,                iimageStore)
  RGPU_RESOLVE_HANDLE(           ImageView,            RgpuImageView,            RgpuIImageView,            iimageViewStore)
  RGPU_RESOLVE_HANDLE(             Sampler,              RgpuSampler,              RgpuISampler,              isamplerStore)
  RGPU_RESOLVE_HANDLE(               Fence,                RgpuFence,                RgpuIFence,                ifenceStore)
  RGPU_RESOLVE_HANDLE(           Semaphore,            RgpuSemaphore,            RgpuISemaphore,            isemaphoreStore)
  RGPU_RESOLVE_HANDLE(          RenderPass,           RgpuRenderPass,           RgpuIRenderPass,           irenderPassStore)
  RGPU_RESOLVE_HANDLE(         Framebuffer,          RgpuFramebuffer,          RgpuIFramebuffer,          iframebufferStore)
  RGPU_RESOLVE_HANDLE(      PipelineLayout,       RgpuPipelineLayout,       RgpuIPipelineLayout,       ipipelineLayoutStore)
  RGPU_RESOLVE_HANDLE(            Pipeline,             RgpuPipeline,             RgpuIPipeline,             ipipelineStore)
  RGPU_RESOLVE_HANDLE( DescriptorSetLayout,  RgpuDescriptorSetLayout,  RgpuIDescriptorSetLayout,  idescriptorSetLayoutStore)
  RGPU_RESOLVE_HANDLE(       DescriptorSet,        RgpuDescriptorSet,        RgpuIDescriptorSet,        idescriptorSetStore)
  RGPU_RESOLVE_HANDLE(        ShaderModule,         RgpuShaderModule,         RgpuIShaderModule,         ishaderModuleStore)
  RGPU_RESOLVE_HANDLE(AccelerationStructure, RgpuAccelerationStructure, RgpuIAccelerationStructure, iasStore)
  RGPU_RESOLVE_HANDLE(       CommandBuffer,        RgpuCommandBuffer,        RgpuICommandBuffer,        icommandBufferStore)

#define RGPU_RESOLVE_OR_EXIT(CTX, HANDLE, VAR_NAME, ITYPE, RESOLVE_FUNC) \
  ITYPE* VAR_NAME;                                                       \
  if (!RESOLVE_FUNC(CTX, HANDLE, &VAR_NAME)) [[unlikely]] {              \
    RGPU_FATAL("invalid handle!");                                       \
  }

#define RGPU_RESOLVE_BUFFER(CTX, HANDLE, VAR_NAME)           RGPU_RESOLVE_OR_EXIT(CTX, HANDLE, VAR_NAME, RgpuIBuffer, rgpuResolveBuffer)
#define RGPU_RESOLVE_IMAGE(CTX, HANDLE, VAR_NAME)            RGPU_RESOLVE_OR_EXIT(CTX, HANDLE, VAR_NAME, RgpuIImage, rgpuResolveImage)
#define RGPU_RESOLVE_IMAGE_VIEW(CTX, HANDLE, VAR_NAME)       RGPU_RESOLVE_OR_EXIT(CTX, HANDLE, VAR_NAME, RgpuIImageView, rgpuResolveImageView)
#define RGPU_RESOLVE_SAMPLER(CTX, HANDLE, VAR_NAME)          RGPU_RESOLVE_OR_EXIT(CTX, HANDLE, VAR_NAME, RgpuISampler, rgpuResolveSampler)
#define RGPU_RESOLVE_FENCE(CTX, HANDLE, VAR_NAME)            RGPU_RESOLVE_OR_EXIT(CTX, HANDLE, VAR_NAME, RgpuIFence, rgpuResolveFence)
#define RGPU_RESOLVE_SEMAPHORE(CTX, HANDLE, VAR_NAME)        RGPU_RESOLVE_OR_EXIT(CTX, HANDLE, VAR_NAME, RgpuISemaphore, rgpuResolveSemaphore)
#define RGPU_RESOLVE_RENDER_PASS(CTX, HANDLE, VAR_NAME)      RGPU_RESOLVE_OR_EXIT(CTX, HANDLE, VAR_NAME, RgpuIRenderPass, rgpuResolveRenderPass)
#define RGPU_RESOLVE_FRAMEBUFFER(CTX, HANDLE, VAR_NAME)      RGPU_RESOLVE_OR_EXIT(CTX, HANDLE, VAR_NAME, RgpuIFramebuffer, rgpuResolveFramebuffer)
#define RGPU_RESOLVE_PIPELINE_LAYOUT(CTX, HANDLE, VAR_NAME)  RGPU_RESOLVE_OR_EXIT(CTX, HANDLE, VAR_NAME, RgpuIPipelineLayout, rgpuResolvePipelineLayout)
#define RGPU_RESOLVE_PIPELINE(CTX, HANDLE, VAR_NAME)         RGPU_RESOLVE_OR_EXIT(CTX, HANDLE, VAR_NAME, RgpuIPipeline, rgpuResolvePipeline)
#define RGPU_RESOLVE_DESCRIPTOR_SET_LAYOUT(CTX, HANDLE, VAR_NAME) RGPU_RESOLVE_OR_EXIT(CTX, HANDLE, VAR_NAME, RgpuIDescriptorSetLayout, rgpuResolveDescriptorSetLayout)
#define RGPU_RESOLVE_DESCRIPTOR_SET(CTX, HANDLE, VAR_NAME)   RGPU_RESOLVE_OR_EXIT(CTX, HANDLE, VAR_NAME, RgpuIDescriptorSet, rgpuResolveDescriptorSet)
#define RGPU_RESOLVE_SHADER_MODULE(CTX, HANDLE, VAR_NAME)    RGPU_RESOLVE_OR_EXIT(CTX, HANDLE, VAR_NAME, RgpuIShaderModule, rgpuResolveShaderModule)
#define RGPU_RESOLVE_AS(CTX, HANDLE, VAR_NAME)               RGPU_RESOLVE_OR_EXIT(CTX, HANDLE, VAR_NAME, RgpuIAccelerationStructure, rgpuResolveAccelerationStructure)
#define RGPU_RESOLVE_COMMAND_BUFFER(CTX, HANDLE, VAR_NAME)   RGPU_RESOLVE_OR_EXIT(CTX, HANDLE, VAR_NAME, RgpuICommandBuffer, rgpuResolveCommandBuffer)

  /* Functions shared between translation units */

  void rgpuSetObjectName(RgpuContext* ctx, VkObjectType type, uint64_t handle, const char* name);

  bool rgpuAllocateCommandBuffer(RgpuContext* ctx, VkCommandPool pool, RgpuCommandBuffer* commandBuffer);

  // Frees every command buffer allocated from the pool, then the pool itself.
  void rgpuDestroyCommandPool(RgpuContext* ctx, VkCommandPool pool);

  bool rgpuWrapSwapchainImage(RgpuContext* ctx, VkImage vkImage, RgpuFormat format,
                              RgpuExtent2D extent, RgpuImage* image);

  bool rgpuBeginOneShot(RgpuContext* ctx, VkCommandBuffer* commandBuffer);

  bool rgpuEndOneShot(RgpuContext* ctx, VkCommandBuffer commandBuffer);

  // Records with a temporary command buffer from the upload pool and blocks until completion.
  template<typename F>
  bool rgpuSubmitOneShot(RgpuContext* ctx, F&& record)
  {
    VkCommandBuffer commandBuffer;
    if (!rgpuBeginOneShot(ctx, &commandBuffer))
    {
      return false;
    }

    record(commandBuffer);

    return rgpuEndOneShot(ctx, commandBuffer);
  }
}
