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

#include "rdx/rgpu/Encoder.h"

#include "Internal.h"
#include "VkCommandRecorder.h"

namespace rdx
{
  RgpuRecordedCommandBuffer::RgpuRecordedCommandBuffer(RgpuCommandBuffer commandBuffer)
    : m_commandBuffer(commandBuffer)
  {
  }

  RgpuRecordedCommandBuffer::RgpuRecordedCommandBuffer(RgpuRecordedCommandBuffer&& other) noexcept
    : m_commandBuffer(other.m_commandBuffer)
  {
    other.m_commandBuffer = {};
  }

  RgpuRecordedCommandBuffer& RgpuRecordedCommandBuffer::operator=(RgpuRecordedCommandBuffer&& other) noexcept
  {
    m_commandBuffer = other.m_commandBuffer;
    other.m_commandBuffer = {};
    return *this;
  }

  RgpuEncoder::RgpuEncoder(RgpuCommandBuffer commandBuffer, RbArena& arena)
    : m_commandBuffer(commandBuffer)
    , m_arena(&arena)
  {
  }

  void RgpuEncoder::beginRenderPass(RgpuRenderPass renderPass,
                                    RgpuFramebuffer framebuffer,
                                    std::span<const RgpuClearValue> clears)
  {
    m_commands.push_back(RgpuCmdBeginRenderPass {
      .renderPass = renderPass,
      .framebuffer = framebuffer,
      .clears = m_arena->copy(clears)
    });
  }

  void RgpuEncoder::endRenderPass()
  {
    m_commands.push_back(RgpuCmdEndRenderPass{});
  }

  void RgpuEncoder::bindGraphicsPipeline(RgpuPipeline pipeline)
  {
    m_commands.push_back(RgpuCmdBindGraphicsPipeline{ pipeline });
  }

  void RgpuEncoder::bindRayTracingPipeline(RgpuPipeline pipeline)
  {
    m_commands.push_back(RgpuCmdBindRayTracingPipeline{ pipeline });
  }

  void RgpuEncoder::bindDescriptorSets(RgpuPipelineBindPoint bindPoint,
                                       RgpuPipelineLayout layout,
                                       uint32_t firstSet,
                                       std::span<const RgpuDescriptorSet> sets)
  {
    m_commands.push_back(RgpuCmdBindDescriptorSets {
      .bindPoint = bindPoint,
      .layout = layout,
      .firstSet = firstSet,
      .sets = m_arena->copy(sets)
    });
  }

  void RgpuEncoder::setViewport(const RgpuViewport& viewport)
  {
    m_commands.push_back(RgpuCmdSetViewport{ viewport });
  }

  void RgpuEncoder::setScissor(const RgpuRect2D& scissor)
  {
    m_commands.push_back(RgpuCmdSetScissor{ scissor });
  }

  void RgpuEncoder::draw(RgpuRange vertices, RgpuRange instances)
  {
    m_commands.push_back(RgpuCmdDraw{ vertices, instances });
  }

  void RgpuEncoder::drawIndexed(RgpuRange indices, int32_t vertexOffset, RgpuRange instances)
  {
    m_commands.push_back(RgpuCmdDrawIndexed{ indices, vertexOffset, instances });
  }

  void RgpuEncoder::updateBuffer(RgpuBuffer buffer, uint64_t offset, std::span<const uint8_t> data)
  {
    m_commands.push_back(RgpuCmdUpdateBuffer {
      .buffer = buffer,
      .offset = offset,
      .data = m_arena->copy(data)
    });
  }

  void RgpuEncoder::bindVertexBuffers(uint32_t firstBinding, std::span<const RgpuVertexBufferBinding> bindings)
  {
    m_commands.push_back(RgpuCmdBindVertexBuffers {
      .firstBinding = firstBinding,
      .bindings = m_arena->copy(bindings)
    });
  }

  void RgpuEncoder::bindIndexBuffer(RgpuBuffer buffer, uint64_t offset, RgpuIndexType type)
  {
    m_commands.push_back(RgpuCmdBindIndexBuffer{ buffer, offset, type });
  }

  void RgpuEncoder::pushConstants(RgpuPipelineLayout layout, RgpuShaderStage stages, uint32_t offset,
                                  std::span<const uint8_t> data)
  {
    m_commands.push_back(RgpuCmdPushConstants {
      .layout = layout,
      .stages = stages,
      .offset = offset,
      .data = m_arena->copy(data)
    });
  }

  void RgpuEncoder::buildAccelerationStructure(std::span<const RgpuAsBuildInfo> infos)
  {
    std::span<RgpuAsBuildInfo> copies = m_arena->allocArray<RgpuAsBuildInfo>(infos.size());

    for (size_t i = 0; i < infos.size(); i++)
    {
      copies[i] = infos[i];
      copies[i].geometries = m_arena->copy(infos[i].geometries);
    }

    m_commands.push_back(RgpuCmdBuildAccelerationStructure{ copies });
  }

  void RgpuEncoder::traceRays(const RgpuShaderBindingTable& sbt, uint32_t width, uint32_t height, uint32_t depth)
  {
    m_commands.push_back(RgpuCmdTraceRays {
      .raygen = sbt.raygen,
      .miss = sbt.miss,
      .hit = sbt.hit,
      .callable = sbt.callable,
      .width = width,
      .height = height,
      .depth = depth
    });
  }

  void RgpuEncoder::pipelineBarrier(RgpuPipelineStage srcStages,
                                    RgpuPipelineStage dstStages,
                                    RgpuAccess srcAccess,
                                    RgpuAccess dstAccess,
                                    std::span<const RgpuImageBarrier> imageBarriers)
  {
    m_commands.push_back(RgpuCmdPipelineBarrier {
      .srcStages = srcStages,
      .dstStages = dstStages,
      .srcAccess = srcAccess,
      .dstAccess = dstAccess,
      .imageBarriers = m_arena->copy(imageBarriers)
    });
  }

  std::span<const RgpuCommand> RgpuEncoder::commands() const
  {
    return m_commands;
  }

  RgpuRecordedCommandBuffer RgpuEncoder::finish(RgpuContext* ctx) &&
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_COMMAND_BUFFER(ctx, m_commandBuffer, icommandBuffer);

    VkCommandBufferBeginInfo beginInfo = {
      .sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO,
      .pNext = nullptr,
      .flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT,
      .pInheritanceInfo = nullptr,
    };

    if (idevice->table.vkBeginCommandBuffer(icommandBuffer->commandBuffer, &beginInfo) != VK_SUCCESS)
    {
      RGPU_FATAL("failed to begin command buffer");
    }

    RgpuVkCommandRecorder recorder(ctx, icommandBuffer->commandBuffer);

    if (!rgpuReplayCommands(m_commands, recorder))
    {
      RGPU_FATAL("command replay failed");
    }

    if (idevice->table.vkEndCommandBuffer(icommandBuffer->commandBuffer) != VK_SUCCESS)
    {
      RGPU_FATAL("failed to end command buffer");
    }

    m_commands.clear();

    return RgpuRecordedCommandBuffer(m_commandBuffer);
  }
}
