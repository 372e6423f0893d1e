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

#include "Internal.h"

#include <algorithm>

namespace rdx
{
  std::vector<RgpuDescriptorPoolSize> rgpuComputeDescriptorPoolSizes(std::span<const RgpuDescriptorSetLayoutBinding> bindings)
  {
    std::vector<RgpuDescriptorPoolSize> poolSizes;

    for (const RgpuDescriptorSetLayoutBinding& binding : bindings)
    {
      if (binding.count == 0)
      {
        continue;
      }

      auto it = std::find_if(poolSizes.begin(), poolSizes.end(), [&](const RgpuDescriptorPoolSize& s) {
        return s.type == binding.type;
      });

      if (it != poolSizes.end())
      {
        it->count += binding.count;
      }
      else
      {
        poolSizes.push_back({ binding.type, binding.count });
      }
    }

    return poolSizes;
  }

  bool rgpuCreateDescriptorSetLayout(RgpuContext* ctx,
                                     const RgpuDescriptorSetLayoutCreateInfo& createInfo,
                                     RgpuDescriptorSetLayout* layout)
  {
    RgpuIDevice* idevice = &ctx->idevice;

    bool updateAfterBind = rbHasFlags(createInfo.flags, RgpuDescriptorSetLayoutFlags::UpdateAfterBindPool);

    std::vector<VkDescriptorSetLayoutBinding> bindings;
    std::vector<VkDescriptorBindingFlags> bindingFlags;
    bindings.reserve(createInfo.bindings.size());

    for (const RgpuDescriptorSetLayoutBinding& b : createInfo.bindings)
    {
      bindings.push_back(VkDescriptorSetLayoutBinding {
        .binding = b.binding,
        .descriptorType = (VkDescriptorType) b.type,
        .descriptorCount = b.count,
        .stageFlags = (VkShaderStageFlags) b.stages,
        .pImmutableSamplers = nullptr,
      });

      bindingFlags.push_back(updateAfterBind ? VkDescriptorBindingFlags(VK_DESCRIPTOR_BINDING_UPDATE_AFTER_BIND_BIT) : 0);
    }

    VkDescriptorSetLayoutBindingFlagsCreateInfo bindingFlagsCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_BINDING_FLAGS_CREATE_INFO,
      .pNext = nullptr,
      .bindingCount = (uint32_t) bindingFlags.size(),
      .pBindingFlags = bindingFlags.data(),
    };

    VkDescriptorSetLayoutCreateInfo layoutCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO,
      .pNext = updateAfterBind ? &bindingFlagsCreateInfo : nullptr,
      .flags = (VkDescriptorSetLayoutCreateFlags) createInfo.flags,
      .bindingCount = (uint32_t) bindings.size(),
      .pBindings = bindings.data(),
    };

    uint64_t handle = rgpuStoreAllocate(ctx, ctx->idescriptorSetLayoutStore);

    RGPU_RESOLVE_DESCRIPTOR_SET_LAYOUT(ctx, { handle }, ilayout);

    VkResult result = idevice->table.vkCreateDescriptorSetLayout(
      idevice->logicalDevice,
      &layoutCreateInfo,
      nullptr,
      &ilayout->layout
    );

    if (result != VK_SUCCESS)
    {
      rgpuStoreFree(ctx, ctx->idescriptorSetLayoutStore, handle);
      RGPU_RETURN_ERROR("failed to create descriptor set layout");
    }

    ilayout->flags = createInfo.flags;
    ilayout->bindings = createInfo.bindings;

    layout->handle = handle;
    return true;
  }

  void rgpuDestroyDescriptorSetLayout(RgpuContext* ctx, RgpuDescriptorSetLayout layout)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_DESCRIPTOR_SET_LAYOUT(ctx, layout, ilayout);

    idevice->table.vkDestroyDescriptorSetLayout(idevice->logicalDevice, ilayout->layout, nullptr);

    rgpuStoreFree(ctx, ctx->idescriptorSetLayoutStore, layout.handle);
  }

  bool rgpuCreateDescriptorSet(RgpuContext* ctx,
                               RgpuDescriptorSetLayout layout,
                               RgpuDescriptorSet* descriptorSet)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_DESCRIPTOR_SET_LAYOUT(ctx, layout, ilayout);

    std::vector<VkDescriptorPoolSize> poolSizes;
    for (const RgpuDescriptorPoolSize& s : rgpuComputeDescriptorPoolSizes(ilayout->bindings))
    {
      poolSizes.push_back({ (VkDescriptorType) s.type, s.count });
    }

    VkDescriptorPoolCreateFlags poolFlags = 0;
    if (rbHasFlags(ilayout->flags, RgpuDescriptorSetLayoutFlags::UpdateAfterBindPool))
    {
      poolFlags |= VK_DESCRIPTOR_POOL_CREATE_UPDATE_AFTER_BIND_BIT;
    }

    VkDescriptorPoolCreateInfo poolCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO,
      .pNext = nullptr,
      .flags = poolFlags,
      .maxSets = 1,
      .poolSizeCount = (uint32_t) poolSizes.size(),
      .pPoolSizes = poolSizes.data(),
    };

    uint64_t handle = rgpuStoreAllocate(ctx, ctx->idescriptorSetStore);

    RGPU_RESOLVE_DESCRIPTOR_SET(ctx, { handle }, iset);

    VkResult result = idevice->table.vkCreateDescriptorPool(
      idevice->logicalDevice,
      &poolCreateInfo,
      nullptr,
      &iset->pool
    );

    if (result != VK_SUCCESS)
    {
      rgpuStoreFree(ctx, ctx->idescriptorSetStore, handle);
      RGPU_RETURN_ERROR("failed to create descriptor pool");
    }

    VkDescriptorSetAllocateInfo allocateInfo = {
      .sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO,
      .pNext = nullptr,
      .descriptorPool = iset->pool,
      .descriptorSetCount = 1,
      .pSetLayouts = &ilayout->layout,
    };

    result = idevice->table.vkAllocateDescriptorSets(
      idevice->logicalDevice,
      &allocateInfo,
      &iset->descriptorSet
    );

    if (result != VK_SUCCESS)
    {
      idevice->table.vkDestroyDescriptorPool(idevice->logicalDevice, iset->pool, nullptr);
      rgpuStoreFree(ctx, ctx->idescriptorSetStore, handle);
      RGPU_RETURN_ERROR("failed to allocate descriptor set");
    }

    descriptorSet->handle = handle;
    return true;
  }

  void rgpuDestroyDescriptorSet(RgpuContext* ctx, RgpuDescriptorSet descriptorSet)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_DESCRIPTOR_SET(ctx, descriptorSet, iset);

    // Destroying the pool frees the set.
    idevice->table.vkDestroyDescriptorPool(idevice->logicalDevice, iset->pool, nullptr);

    rgpuStoreFree(ctx, ctx->idescriptorSetStore, descriptorSet.handle);
  }

  void rgpuUpdateDescriptorSet(RgpuContext* ctx,
                               RgpuDescriptorSet descriptorSet,
                               std::span<const RgpuDescriptorWrite> writes)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_DESCRIPTOR_SET(ctx, descriptorSet, iset);

    struct WriteStorage
    {
      std::vector<VkDescriptorImageInfo> images;
      std::vector<VkDescriptorBufferInfo> buffers;
      std::vector<VkAccelerationStructureKHR> accelerationStructures;
      VkWriteDescriptorSetAccelerationStructureKHR asInfo;
    };

    // Reserved up front: native writes point into the storage.
    std::vector<WriteStorage> storage(writes.size());
    std::vector<VkWriteDescriptorSet> nativeWrites;
    nativeWrites.reserve(writes.size());

    for (size_t i = 0; i < writes.size(); i++)
    {
      const RgpuDescriptorWrite& write = writes[i];
      WriteStorage& s = storage[i];

      VkWriteDescriptorSet nativeWrite = {
        .sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET,
        .pNext = nullptr,
        .dstSet = iset->descriptorSet,
        .dstBinding = write.binding,
        .dstArrayElement = write.arrayElement,
        .descriptorCount = 0,
        .descriptorType = (VkDescriptorType) write.type,
        .pImageInfo = nullptr,
        .pBufferInfo = nullptr,
        .pTexelBufferView = nullptr,
      };

      for (const RgpuDescriptorImageInfo& image : write.images)
      {
        VkSampler sampler = VK_NULL_HANDLE;
        if (image.sampler.handle)
        {
          RGPU_RESOLVE_SAMPLER(ctx, image.sampler, isampler);
          sampler = isampler->sampler;
        }

        VkImageView imageView = VK_NULL_HANDLE;
        if (image.view.handle)
        {
          RGPU_RESOLVE_IMAGE_VIEW(ctx, image.view, iview);
          imageView = iview->imageView;
        }

        s.images.push_back({ sampler, imageView, (VkImageLayout) image.layout });
      }

      for (const RgpuDescriptorBufferInfo& buffer : write.buffers)
      {
        RGPU_RESOLVE_BUFFER(ctx, buffer.buffer, ibuffer);

        s.buffers.push_back({ ibuffer->buffer, buffer.offset, buffer.range });
      }

      for (RgpuAccelerationStructure as : write.accelerationStructures)
      {
        RGPU_RESOLVE_AS(ctx, as, ias);

        s.accelerationStructures.push_back(ias->as);
      }

      if (!s.images.empty())
      {
        nativeWrite.descriptorCount = (uint32_t) s.images.size();
        nativeWrite.pImageInfo = s.images.data();
      }
      else if (!s.buffers.empty())
      {
        nativeWrite.descriptorCount = (uint32_t) s.buffers.size();
        nativeWrite.pBufferInfo = s.buffers.data();
      }
      else if (!s.accelerationStructures.empty())
      {
        s.asInfo = {
          .sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET_ACCELERATION_STRUCTURE_KHR,
          .pNext = nullptr,
          .accelerationStructureCount = (uint32_t) s.accelerationStructures.size(),
          .pAccelerationStructures = s.accelerationStructures.data(),
        };

        nativeWrite.descriptorCount = s.asInfo.accelerationStructureCount;
        nativeWrite.pNext = &s.asInfo;
      }
      else
      {
        continue;
      }

      nativeWrites.push_back(nativeWrite);
    }

    if (nativeWrites.empty())
    {
      return;
    }

    idevice->table.vkUpdateDescriptorSets(
      idevice->logicalDevice,
      (uint32_t) nativeWrites.size(),
      nativeWrites.data(),
      0,
      nullptr
    );
  }
}
