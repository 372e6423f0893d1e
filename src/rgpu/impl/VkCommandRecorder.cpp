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

#include "VkCommandRecorder.h"

#include <vector>

namespace rdx
{
  RgpuVkCommandRecorder::RgpuVkCommandRecorder(RgpuContext* ctx, VkCommandBuffer commandBuffer)
    : m_ctx(ctx)
    , m_idevice(&ctx->idevice)
    , m_commandBuffer(commandBuffer)
  {
  }

  uint32_t RgpuVkCommandRecorder::renderPassAttachmentCount(RgpuRenderPass renderPass)
  {
    RGPU_RESOLVE_RENDER_PASS(m_ctx, renderPass, irenderPass);

    return irenderPass->attachmentCount;
  }

  RgpuExtent2D RgpuVkCommandRecorder::framebufferExtent(RgpuFramebuffer framebuffer)
  {
    RGPU_RESOLVE_FRAMEBUFFER(m_ctx, framebuffer, iframebuffer);

    return iframebuffer->extent;
  }

  uint64_t RgpuVkCommandRecorder::bufferAddress(RgpuBuffer buffer)
  {
    RGPU_RESOLVE_BUFFER(m_ctx, buffer, ibuffer);

    return ibuffer->gpuAddress;
  }

  void RgpuVkCommandRecorder::beginRenderPass(RgpuRenderPass renderPass,
                                              RgpuFramebuffer framebuffer,
                                              RgpuRect2D renderArea,
                                              std::span<const RgpuClearValue> clears)
  {
    RGPU_RESOLVE_RENDER_PASS(m_ctx, renderPass, irenderPass);
    RGPU_RESOLVE_FRAMEBUFFER(m_ctx, framebuffer, iframebuffer);

    std::vector<VkClearValue> clearValues(clears.size());
    for (size_t i = 0; i < clears.size(); i++)
    {
      const RgpuClearValue& c = clears[i];

      // Attachments pick the member matching their format.
      if (i < irenderPass->colorAttachmentCount)
      {
        clearValues[i].color = {{ c.color[0], c.color[1], c.color[2], c.color[3] }};
      }
      else
      {
        clearValues[i].depthStencil = { c.depth, c.stencil };
      }
    }

    VkRenderPassBeginInfo beginInfo = {
      .sType = VK_STRUCTURE_TYPE_RENDER_PASS_BEGIN_INFO,
      .pNext = nullptr,
      .renderPass = irenderPass->renderPass,
      .framebuffer = iframebuffer->framebuffer,
      .renderArea = {
        .offset = { renderArea.x, renderArea.y },
        .extent = { renderArea.width, renderArea.height },
      },
      .clearValueCount = (uint32_t) clearValues.size(),
      .pClearValues = clearValues.data(),
    };

    m_idevice->table.vkCmdBeginRenderPass(m_commandBuffer, &beginInfo, VK_SUBPASS_CONTENTS_INLINE);
  }

  void RgpuVkCommandRecorder::endRenderPass()
  {
    m_idevice->table.vkCmdEndRenderPass(m_commandBuffer);
  }

  void RgpuVkCommandRecorder::bindPipeline(RgpuPipelineBindPoint bindPoint, RgpuPipeline pipeline)
  {
    RGPU_RESOLVE_PIPELINE(m_ctx, pipeline, ipipeline);

    m_idevice->table.vkCmdBindPipeline(m_commandBuffer, (VkPipelineBindPoint) bindPoint, ipipeline->pipeline);
  }

  void RgpuVkCommandRecorder::bindDescriptorSets(RgpuPipelineBindPoint bindPoint,
                                                 RgpuPipelineLayout layout,
                                                 uint32_t firstSet,
                                                 std::span<const RgpuDescriptorSet> sets)
  {
    RGPU_RESOLVE_PIPELINE_LAYOUT(m_ctx, layout, ilayout);

    std::vector<VkDescriptorSet> descriptorSets;
    descriptorSets.reserve(sets.size());

    for (RgpuDescriptorSet set : sets)
    {
      RGPU_RESOLVE_DESCRIPTOR_SET(m_ctx, set, iset);

      descriptorSets.push_back(iset->descriptorSet);
    }

    m_idevice->table.vkCmdBindDescriptorSets(
      m_commandBuffer,
      (VkPipelineBindPoint) bindPoint,
      ilayout->layout,
      firstSet,
      (uint32_t) descriptorSets.size(),
      descriptorSets.data(),
      0,
      nullptr
    );
  }

  void RgpuVkCommandRecorder::setViewport(const RgpuViewport& viewport)
  {
    VkViewport nativeViewport = {
      .x = viewport.x,
      .y = viewport.y,
      .width = viewport.width,
      .height = viewport.height,
      .minDepth = viewport.minDepth,
      .maxDepth = viewport.maxDepth,
    };

    m_idevice->table.vkCmdSetViewport(m_commandBuffer, 0, 1, &nativeViewport);
  }

  void RgpuVkCommandRecorder::setScissor(const RgpuRect2D& scissor)
  {
    VkRect2D nativeScissor = {
      .offset = { scissor.x, scissor.y },
      .extent = { scissor.width, scissor.height },
    };

    m_idevice->table.vkCmdSetScissor(m_commandBuffer, 0, 1, &nativeScissor);
  }

  void RgpuVkCommandRecorder::draw(uint32_t vertexCount, uint32_t instanceCount, uint32_t firstVertex, uint32_t firstInstance)
  {
    m_idevice->table.vkCmdDraw(m_commandBuffer, vertexCount, instanceCount, firstVertex, firstInstance);
  }

  void RgpuVkCommandRecorder::drawIndexed(uint32_t indexCount, uint32_t instanceCount, uint32_t firstIndex,
                                          int32_t vertexOffset, uint32_t firstInstance)
  {
    m_idevice->table.vkCmdDrawIndexed(m_commandBuffer, indexCount, instanceCount, firstIndex, vertexOffset, firstInstance);
  }

  void RgpuVkCommandRecorder::updateBuffer(RgpuBuffer buffer, uint64_t offset, std::span<const uint8_t> data)
  {
    RGPU_RESOLVE_BUFFER(m_ctx, buffer, ibuffer);

    m_idevice->table.vkCmdUpdateBuffer(m_commandBuffer, ibuffer->buffer, offset, data.size(), data.data());
  }

  void RgpuVkCommandRecorder::bindVertexBuffers(uint32_t firstBinding, std::span<const RgpuVertexBufferBinding> bindings)
  {
    std::vector<VkBuffer> buffers;
    std::vector<VkDeviceSize> offsets;

    for (const RgpuVertexBufferBinding& binding : bindings)
    {
      RGPU_RESOLVE_BUFFER(m_ctx, binding.buffer, ibuffer);

      buffers.push_back(ibuffer->buffer);
      offsets.push_back(binding.offset);
    }

    m_idevice->table.vkCmdBindVertexBuffers(m_commandBuffer, firstBinding, (uint32_t) buffers.size(),
                                            buffers.data(), offsets.data());
  }

  void RgpuVkCommandRecorder::bindIndexBuffer(RgpuBuffer buffer, uint64_t offset, RgpuIndexType type)
  {
    RGPU_RESOLVE_BUFFER(m_ctx, buffer, ibuffer);

    m_idevice->table.vkCmdBindIndexBuffer(m_commandBuffer, ibuffer->buffer, offset, (VkIndexType) type);
  }

  void RgpuVkCommandRecorder::pushConstants(RgpuPipelineLayout layout, RgpuShaderStage stages, uint32_t offset,
                                            std::span<const uint8_t> data)
  {
    RGPU_RESOLVE_PIPELINE_LAYOUT(m_ctx, layout, ilayout);

    m_idevice->table.vkCmdPushConstants(
      m_commandBuffer,
      ilayout->layout,
      (VkShaderStageFlags) stages,
      offset,
      (uint32_t) data.size(),
      data.data()
    );
  }

  void RgpuVkCommandRecorder::buildAccelerationStructures(std::span<const RgpuAsBuildCall> calls)
  {
    std::vector<std::vector<VkAccelerationStructureGeometryKHR>> geometries(calls.size());
    std::vector<std::vector<VkAccelerationStructureBuildRangeInfoKHR>> ranges(calls.size());
    std::vector<VkAccelerationStructureBuildGeometryInfoKHR> buildInfos;
    std::vector<const VkAccelerationStructureBuildRangeInfoKHR*> rangePtrs;

    for (size_t i = 0; i < calls.size(); i++)
    {
      const RgpuAsBuildCall& call = calls[i];

      RGPU_RESOLVE_AS(m_ctx, call.dst, idst);

      VkAccelerationStructureKHR src = VK_NULL_HANDLE;
      if (call.src)
      {
        RGPU_RESOLVE_AS(m_ctx, *call.src, isrc);
        src = isrc->as;
      }

      for (const RgpuAsGeometry& geometry : call.geometries)
      {
        VkAccelerationStructureGeometryKHR nativeGeometry = {
          .sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_GEOMETRY_KHR,
          .pNext = nullptr,
          .geometryType = VK_GEOMETRY_TYPE_TRIANGLES_KHR,
          .geometry = {},
          .flags = 0,
        };

        VkAccelerationStructureBuildRangeInfoKHR range = {
          .primitiveCount = 0,
          .primitiveOffset = 0,
          .firstVertex = 0,
          .transformOffset = 0,
        };

        if (const auto* triangles = std::get_if<RgpuAsTriangles>(&geometry); triangles)
        {
          nativeGeometry.flags = (VkGeometryFlagsKHR) triangles->flags;
          nativeGeometry.geometry.triangles = VkAccelerationStructureGeometryTrianglesDataKHR {
            .sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_GEOMETRY_TRIANGLES_DATA_KHR,
            .pNext = nullptr,
            .vertexFormat = (VkFormat) triangles->vertexFormat,
            .vertexData = { .deviceAddress = triangles->vertexAddress },
            .vertexStride = triangles->vertexStride,
            .maxVertex = triangles->vertexCount > 0 ? triangles->vertexCount - 1 : 0,
            .indexType = triangles->indices ? (VkIndexType) triangles->indices->type : VK_INDEX_TYPE_NONE_KHR,
            .indexData = { .deviceAddress = triangles->indices ? triangles->indices->address : 0 },
            .transformData = { .deviceAddress = triangles->transformAddress.value_or(0) },
          };

          range.primitiveCount = triangles->primitiveCount;
          range.firstVertex = triangles->firstVertex;
        }
        else
        {
          const auto& instances = std::get<RgpuAsInstances>(geometry);

          nativeGeometry.geometryType = VK_GEOMETRY_TYPE_INSTANCES_KHR;
          nativeGeometry.flags = (VkGeometryFlagsKHR) instances.flags;
          nativeGeometry.geometry.instances = VkAccelerationStructureGeometryInstancesDataKHR {
            .sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_GEOMETRY_INSTANCES_DATA_KHR,
            .pNext = nullptr,
            .arrayOfPointers = VK_FALSE,
            .data = { .deviceAddress = instances.instanceAddress },
          };

          range.primitiveCount = instances.primitiveCount;
        }

        geometries[i].push_back(nativeGeometry);
        ranges[i].push_back(range);
      }

      buildInfos.push_back(VkAccelerationStructureBuildGeometryInfoKHR {
        .sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_BUILD_GEOMETRY_INFO_KHR,
        .pNext = nullptr,
        .type = idst->level == RgpuAccelerationStructureLevel::Top ? VK_ACCELERATION_STRUCTURE_TYPE_TOP_LEVEL_KHR
                                                                   : VK_ACCELERATION_STRUCTURE_TYPE_BOTTOM_LEVEL_KHR,
        .flags = (VkBuildAccelerationStructureFlagsKHR) call.flags,
        .mode = call.mode == RgpuAsBuildMode::Update ? VK_BUILD_ACCELERATION_STRUCTURE_MODE_UPDATE_KHR
                                                     : VK_BUILD_ACCELERATION_STRUCTURE_MODE_BUILD_KHR,
        .srcAccelerationStructure = src,
        .dstAccelerationStructure = idst->as,
        .geometryCount = (uint32_t) geometries[i].size(),
        .pGeometries = geometries[i].data(),
        .ppGeometries = nullptr,
        .scratchData = { .deviceAddress = call.scratchAddress },
      });

      rangePtrs.push_back(ranges[i].data());
    }

    m_idevice->table.vkCmdBuildAccelerationStructuresKHR(
      m_commandBuffer,
      (uint32_t) buildInfos.size(),
      buildInfos.data(),
      rangePtrs.data()
    );
  }

  void RgpuVkCommandRecorder::traceRays(const RgpuStridedRegion& raygen,
                                        const RgpuStridedRegion& miss,
                                        const RgpuStridedRegion& hit,
                                        const RgpuStridedRegion& callable,
                                        uint32_t width, uint32_t height, uint32_t depth)
  {
    const auto toNative = [](const RgpuStridedRegion& r) {
      return VkStridedDeviceAddressRegionKHR { .deviceAddress = r.address, .stride = r.stride, .size = r.size };
    };

    VkStridedDeviceAddressRegionKHR raygenRegion = toNative(raygen);
    VkStridedDeviceAddressRegionKHR missRegion = toNative(miss);
    VkStridedDeviceAddressRegionKHR hitRegion = toNative(hit);
    VkStridedDeviceAddressRegionKHR callableRegion = toNative(callable);

    m_idevice->table.vkCmdTraceRaysKHR(
      m_commandBuffer,
      &raygenRegion,
      &missRegion,
      &hitRegion,
      &callableRegion,
      width,
      height,
      depth
    );
  }

  void RgpuVkCommandRecorder::pipelineBarrier(const RgpuMemoryBarrier& memoryBarrier,
                                              std::span<const RgpuImageLayoutBarrier> imageBarriers)
  {
    VkMemoryBarrier2KHR nativeMemoryBarrier = {
      .sType = VK_STRUCTURE_TYPE_MEMORY_BARRIER_2_KHR,
      .pNext = nullptr,
      .srcStageMask = (VkPipelineStageFlags2KHR) memoryBarrier.srcStages,
      .srcAccessMask = (VkAccessFlags2KHR) memoryBarrier.srcAccess,
      .dstStageMask = (VkPipelineStageFlags2KHR) memoryBarrier.dstStages,
      .dstAccessMask = (VkAccessFlags2KHR) memoryBarrier.dstAccess,
    };

    std::vector<VkImageMemoryBarrier2KHR> nativeImageBarriers;
    nativeImageBarriers.reserve(imageBarriers.size());

    for (const RgpuImageLayoutBarrier& b : imageBarriers)
    {
      RGPU_RESOLVE_IMAGE(m_ctx, b.image, iimage);

      nativeImageBarriers.push_back(VkImageMemoryBarrier2KHR {
        .sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2_KHR,
        .pNext = nullptr,
        .srcStageMask = (VkPipelineStageFlags2KHR) b.srcStages,
        .srcAccessMask = (VkAccessFlags2KHR) b.srcAccess,
        .dstStageMask = (VkPipelineStageFlags2KHR) b.dstStages,
        .dstAccessMask = (VkAccessFlags2KHR) b.dstAccess,
        .oldLayout = (VkImageLayout) b.oldLayout,
        .newLayout = (VkImageLayout) b.newLayout,
        .srcQueueFamilyIndex = b.srcQueueFamily,
        .dstQueueFamilyIndex = b.dstQueueFamily,
        .image = iimage->image,
        .subresourceRange = {
          .aspectMask = (VkImageAspectFlags) b.aspect,
          .baseMipLevel = b.baseMipLevel,
          .levelCount = b.mipLevelCount,
          .baseArrayLayer = b.baseArrayLayer,
          .layerCount = b.arrayLayerCount,
        },
      });
    }

    VkDependencyInfoKHR dependencyInfo = {
      .sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO_KHR,
      .pNext = nullptr,
      .dependencyFlags = 0,
      .memoryBarrierCount = 1,
      .pMemoryBarriers = &nativeMemoryBarrier,
      .bufferMemoryBarrierCount = 0,
      .pBufferMemoryBarriers = nullptr,
      .imageMemoryBarrierCount = (uint32_t) nativeImageBarriers.size(),
      .pImageMemoryBarriers = nativeImageBarriers.data(),
    };

    m_idevice->table.vkCmdPipelineBarrier2KHR(m_commandBuffer, &dependencyInfo);
  }
}
