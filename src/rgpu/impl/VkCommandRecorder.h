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

#include "Internal.h"

#include "rdx/rgpu/Command.h"

namespace rdx
{
  // Lowers replayed commands onto a native command buffer.
  class RgpuVkCommandRecorder final : public RgpuCommandRecorder
  {
  public:
    RgpuVkCommandRecorder(RgpuContext* ctx, VkCommandBuffer commandBuffer);

  public:
    uint32_t renderPassAttachmentCount(RgpuRenderPass renderPass) override;
    RgpuExtent2D framebufferExtent(RgpuFramebuffer framebuffer) override;
    uint64_t bufferAddress(RgpuBuffer buffer) override;

    void beginRenderPass(RgpuRenderPass renderPass,
                         RgpuFramebuffer framebuffer,
                         RgpuRect2D renderArea,
                         std::span<const RgpuClearValue> clears) override;
    void endRenderPass() override;
    void bindPipeline(RgpuPipelineBindPoint bindPoint, RgpuPipeline pipeline) override;
    void bindDescriptorSets(RgpuPipelineBindPoint bindPoint,
                            RgpuPipelineLayout layout,
                            uint32_t firstSet,
                            std::span<const RgpuDescriptorSet> sets) override;
    void setViewport(const RgpuViewport& viewport) override;
    void setScissor(const RgpuRect2D& scissor) override;
    void draw(uint32_t vertexCount, uint32_t instanceCount, uint32_t firstVertex, uint32_t firstInstance) override;
    void drawIndexed(uint32_t indexCount, uint32_t instanceCount, uint32_t firstIndex,
                     int32_t vertexOffset, uint32_t firstInstance) override;
    void updateBuffer(RgpuBuffer buffer, uint64_t offset, std::span<const uint8_t> data) override;
    void bindVertexBuffers(uint32_t firstBinding, std::span<const RgpuVertexBufferBinding> bindings) override;
    void bindIndexBuffer(RgpuBuffer buffer, uint64_t offset, RgpuIndexType type) override;
    void pushConstants(RgpuPipelineLayout layout, RgpuShaderStage stages, uint32_t offset,
                       std::span<const uint8_t> data) override;
    void buildAccelerationStructures(std::span<const RgpuAsBuildCall> calls) override;
    void traceRays(const RgpuStridedRegion& raygen,
                   const RgpuStridedRegion& miss,
                   const RgpuStridedRegion& hit,
                   const RgpuStridedRegion& callable,
                   uint32_t width, uint32_t height, uint32_t depth) override;
    void pipelineBarrier(const RgpuMemoryBarrier& memoryBarrier,
                         std::span<const RgpuImageLayoutBarrier> imageBarriers) override;

  private:
    RgpuContext* m_ctx;
    RgpuIDevice* m_idevice;
    VkCommandBuffer m_commandBuffer;
  };
}
