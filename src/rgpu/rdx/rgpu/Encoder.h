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

#include <rdx/rgpu/Command.h>
#include <rdx/rb/Arena.h>

#include <span>
#include <vector>

namespace rdx
{
  class RgpuEncoder;

  // A fully recorded native command buffer, consumed by RgpuQueue::submit.
  class RgpuRecordedCommandBuffer
  {
  public:
    RgpuRecordedCommandBuffer(RgpuRecordedCommandBuffer&& other) noexcept;
    RgpuRecordedCommandBuffer& operator=(RgpuRecordedCommandBuffer&& other) noexcept;

    RgpuRecordedCommandBuffer(const RgpuRecordedCommandBuffer&) = delete;
    RgpuRecordedCommandBuffer& operator=(const RgpuRecordedCommandBuffer&) = delete;

  public:
    RgpuCommandBuffer handle() const { return m_commandBuffer; }

  private:
    friend class RgpuEncoder;

    explicit RgpuRecordedCommandBuffer(RgpuCommandBuffer commandBuffer);

  private:
    RgpuCommandBuffer m_commandBuffer;
  };

  // Records commands into a list; nothing reaches the driver before finish().
  // Variable-length operands are copied into the arena, which must outlive
  // the encoder and is only reset once every encoder using it was finished.
  class RgpuEncoder
  {
  public:
    RgpuEncoder(RgpuCommandBuffer commandBuffer, RbArena& arena);

    RgpuEncoder(RgpuEncoder&& other) noexcept = default;
    RgpuEncoder& operator=(RgpuEncoder&& other) noexcept = default;

    RgpuEncoder(const RgpuEncoder&) = delete;
    RgpuEncoder& operator=(const RgpuEncoder&) = delete;

  public:
    // The number of clears must match the render pass attachment count.
    void beginRenderPass(RgpuRenderPass renderPass,
                         RgpuFramebuffer framebuffer,
                         std::span<const RgpuClearValue> clears);

    void endRenderPass();

    void bindGraphicsPipeline(RgpuPipeline pipeline);

    void bindRayTracingPipeline(RgpuPipeline pipeline);

    void bindDescriptorSets(RgpuPipelineBindPoint bindPoint,
                            RgpuPipelineLayout layout,
                            uint32_t firstSet,
                            std::span<const RgpuDescriptorSet> sets);

    void setViewport(const RgpuViewport& viewport);

    void setScissor(const RgpuRect2D& scissor);

    void draw(RgpuRange vertices, RgpuRange instances);

    void drawIndexed(RgpuRange indices, int32_t vertexOffset, RgpuRange instances);

    // Inline update of at most 64 KiB, offset and size multiples of 4.
    void updateBuffer(RgpuBuffer buffer, uint64_t offset, std::span<const uint8_t> data);

    void bindVertexBuffers(uint32_t firstBinding, std::span<const RgpuVertexBufferBinding> bindings);

    void bindIndexBuffer(RgpuBuffer buffer, uint64_t offset, RgpuIndexType type);

    void pushConstants(RgpuPipelineLayout layout, RgpuShaderStage stages, uint32_t offset,
                       std::span<const uint8_t> data);

    void buildAccelerationStructure(std::span<const RgpuAsBuildInfo> infos);

    void traceRays(const RgpuShaderBindingTable& sbt, uint32_t width, uint32_t height, uint32_t depth = 1);

    void pipelineBarrier(RgpuPipelineStage srcStages,
                         RgpuPipelineStage dstStages,
                         RgpuAccess srcAccess,
                         RgpuAccess dstAccess,
                         std::span<const RgpuImageBarrier> imageBarriers = {});

    std::span<const RgpuCommand> commands() const;

    RgpuCommandBuffer commandBuffer() const { return m_commandBuffer; }

    // Replays the command list into the native command buffer. Malformed
    // commands terminate the process.
    RgpuRecordedCommandBuffer finish(RgpuContext* ctx) &&;

  private:
    RgpuCommandBuffer m_commandBuffer;
    RbArena* m_arena;
    std::vector<RgpuCommand> m_commands;
  };
}
