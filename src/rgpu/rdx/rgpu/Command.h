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

#include <rdx/rgpu/Rgpu.h>

#include <optional>
#include <span>
#include <variant>

namespace rdx
{
  struct RgpuClearValue
  {
    float color[4] = { 0.0f, 0.0f, 0.0f, 0.0f };
    float depth = 1.0f;
    uint32_t stencil = 0;
  };

  inline RgpuClearValue rgpuClearColor(float r, float g, float b, float a)
  {
    return RgpuClearValue{ .color = { r, g, b, a } };
  }

  inline RgpuClearValue rgpuClearDepthStencil(float depth, uint32_t stencil = 0)
  {
    return RgpuClearValue{ .depth = depth, .stencil = stencil };
  }

  // Half-open [start, end).
  struct RgpuRange
  {
    uint32_t start;
    uint32_t end;

    uint32_t count() const { return end - start; }
  };

  struct RgpuViewport
  {
    float x;
    float y;
    float width;
    float height;
    float minDepth = 0.0f;
    float maxDepth = 1.0f;
  };

  struct RgpuRect2D
  {
    int32_t x;
    int32_t y;
    uint32_t width;
    uint32_t height;

    bool operator==(const RgpuRect2D&) const = default;
  };

  struct RgpuVertexBufferBinding
  {
    RgpuBuffer buffer;
    uint64_t offset = 0;
  };

  struct RgpuImageBarrier
  {
    RgpuImage image;
    std::optional<RgpuImageLayout> oldLayout; // empty: contents are discarded
    RgpuImageLayout newLayout;
    RgpuImageAspect aspect = RgpuImageAspect::Color;
    uint32_t srcQueueFamily = RGPU_QUEUE_FAMILY_IGNORED;
    uint32_t dstQueueFamily = RGPU_QUEUE_FAMILY_IGNORED;
    uint32_t baseMipLevel = 0;
    uint32_t mipLevelCount = 1;
    uint32_t baseArrayLayer = 0;
    uint32_t arrayLayerCount = 1;
  };

  struct RgpuAsIndexData
  {
    RgpuIndexType type;
    uint64_t address;
  };

  struct RgpuAsTriangles
  {
    RgpuGeometryFlags flags = RgpuGeometryFlags::Opaque;
    RgpuFormat vertexFormat;
    uint64_t vertexAddress;
    uint64_t vertexStride;
    uint32_t vertexCount; // highest addressable vertex + 1
    uint32_t firstVertex = 0;
    uint32_t primitiveCount;
    std::optional<RgpuAsIndexData> indices;
    std::optional<uint64_t> transformAddress; // 3x4 row-major float matrix
  };

  struct RgpuAsInstances
  {
    RgpuGeometryFlags flags = RgpuGeometryFlags::None;
    uint64_t instanceAddress; // packed RGPU_AS_INSTANCE_SIZE byte records
    uint32_t primitiveCount;
  };

  using RgpuAsGeometry = std::variant<RgpuAsTriangles, RgpuAsInstances>;

  struct RgpuAsBuildInfo
  {
    std::optional<RgpuAccelerationStructure> src; // update from src when given
    RgpuAccelerationStructure dst;
    RgpuAsBuildFlags flags = RgpuAsBuildFlags::PreferFastTrace;
    std::span<const RgpuAsGeometry> geometries;
    uint64_t scratchAddress;
  };

  /* Recorded commands. Spans point into the encoder's arena. */

  struct RgpuCmdBeginRenderPass
  {
    RgpuRenderPass renderPass;
    RgpuFramebuffer framebuffer;
    std::span<const RgpuClearValue> clears;
  };

  struct RgpuCmdEndRenderPass
  {
  };

  struct RgpuCmdBindGraphicsPipeline
  {
    RgpuPipeline pipeline;
  };

  struct RgpuCmdBindRayTracingPipeline
  {
    RgpuPipeline pipeline;
  };

  struct RgpuCmdBindDescriptorSets
  {
    RgpuPipelineBindPoint bindPoint;
    RgpuPipelineLayout layout;
    uint32_t firstSet;
    std::span<const RgpuDescriptorSet> sets;
  };

  struct RgpuCmdSetViewport
  {
    RgpuViewport viewport;
  };

  struct RgpuCmdSetScissor
  {
    RgpuRect2D scissor;
  };

  struct RgpuCmdDraw
  {
    RgpuRange vertices;
    RgpuRange instances;
  };

  struct RgpuCmdDrawIndexed
  {
    RgpuRange indices;
    int32_t vertexOffset;
    RgpuRange instances;
  };

  struct RgpuCmdUpdateBuffer
  {
    RgpuBuffer buffer;
    uint64_t offset;
    std::span<const uint8_t> data;
  };

  struct RgpuCmdBindVertexBuffers
  {
    uint32_t firstBinding;
    std::span<const RgpuVertexBufferBinding> bindings;
  };

  struct RgpuCmdBindIndexBuffer
  {
    RgpuBuffer buffer;
    uint64_t offset;
    RgpuIndexType type;
  };

  struct RgpuCmdPushConstants
  {
    RgpuPipelineLayout layout;
    RgpuShaderStage stages;
    uint32_t offset;
    std::span<const uint8_t> data;
  };

  struct RgpuCmdBuildAccelerationStructure
  {
    std::span<const RgpuAsBuildInfo> infos;
  };

  struct RgpuCmdTraceRays
  {
    std::optional<RgpuBufferRegion> raygen;
    std::optional<RgpuBufferRegion> miss;
    std::optional<RgpuBufferRegion> hit;
    std::optional<RgpuBufferRegion> callable;
    uint32_t width;
    uint32_t height;
    uint32_t depth;
  };

  struct RgpuCmdPipelineBarrier
  {
    RgpuPipelineStage srcStages;
    RgpuPipelineStage dstStages;
    RgpuAccess srcAccess;
    RgpuAccess dstAccess;
    std::span<const RgpuImageBarrier> imageBarriers;
  };

  using RgpuCommand = std::variant<
    RgpuCmdBeginRenderPass,
    RgpuCmdEndRenderPass,
    RgpuCmdBindGraphicsPipeline,
    RgpuCmdBindRayTracingPipeline,
    RgpuCmdBindDescriptorSets,
    RgpuCmdSetViewport,
    RgpuCmdSetScissor,
    RgpuCmdDraw,
    RgpuCmdDrawIndexed,
    RgpuCmdUpdateBuffer,
    RgpuCmdBindVertexBuffers,
    RgpuCmdBindIndexBuffer,
    RgpuCmdPushConstants,
    RgpuCmdBuildAccelerationStructure,
    RgpuCmdTraceRays,
    RgpuCmdPipelineBarrier
  >;

  /* Replay target */

  struct RgpuStridedRegion
  {
    uint64_t address = 0;
    uint64_t stride = 0;
    uint64_t size = 0;

    bool operator==(const RgpuStridedRegion&) const = default;
  };

  struct RgpuAsBuildCall
  {
    RgpuAsBuildMode mode;
    std::optional<RgpuAccelerationStructure> src;
    RgpuAccelerationStructure dst;
    RgpuAsBuildFlags flags;
    std::span<const RgpuAsGeometry> geometries;
    uint64_t scratchAddress;
  };

  struct RgpuMemoryBarrier
  {
    RgpuPipelineStage srcStages;
    RgpuPipelineStage dstStages;
    RgpuAccess srcAccess;
    RgpuAccess dstAccess;
  };

  // Image barrier with every optional resolved.
  struct RgpuImageLayoutBarrier
  {
    RgpuImage image;
    RgpuImageLayout oldLayout;
    RgpuImageLayout newLayout;
    RgpuImageAspect aspect;
    RgpuPipelineStage srcStages;
    RgpuPipelineStage dstStages;
    RgpuAccess srcAccess;
    RgpuAccess dstAccess;
    uint32_t srcQueueFamily;
    uint32_t dstQueueFamily;
    uint32_t baseMipLevel;
    uint32_t mipLevelCount;
    uint32_t baseArrayLayer;
    uint32_t arrayLayerCount;
  };

  class RgpuCommandRecorder
  {
  public:
    virtual ~RgpuCommandRecorder() = default;

  public:
    virtual uint32_t renderPassAttachmentCount(RgpuRenderPass renderPass) = 0;
    virtual RgpuExtent2D framebufferExtent(RgpuFramebuffer framebuffer) = 0;
    virtual uint64_t bufferAddress(RgpuBuffer buffer) = 0;

    virtual void beginRenderPass(RgpuRenderPass renderPass,
                                 RgpuFramebuffer framebuffer,
                                 RgpuRect2D renderArea,
                                 std::span<const RgpuClearValue> clears) = 0;
    virtual void endRenderPass() = 0;
    virtual void bindPipeline(RgpuPipelineBindPoint bindPoint, RgpuPipeline pipeline) = 0;
    virtual void bindDescriptorSets(RgpuPipelineBindPoint bindPoint,
                                    RgpuPipelineLayout layout,
                                    uint32_t firstSet,
                                    std::span<const RgpuDescriptorSet> sets) = 0;
    virtual void setViewport(const RgpuViewport& viewport) = 0;
    virtual void setScissor(const RgpuRect2D& scissor) = 0;
    virtual void draw(uint32_t vertexCount, uint32_t instanceCount, uint32_t firstVertex, uint32_t firstInstance) = 0;
    virtual void drawIndexed(uint32_t indexCount, uint32_t instanceCount, uint32_t firstIndex,
                             int32_t vertexOffset, uint32_t firstInstance) = 0;
    virtual void updateBuffer(RgpuBuffer buffer, uint64_t offset, std::span<const uint8_t> data) = 0;
    virtual void bindVertexBuffers(uint32_t firstBinding, std::span<const RgpuVertexBufferBinding> bindings) = 0;
    virtual void bindIndexBuffer(RgpuBuffer buffer, uint64_t offset, RgpuIndexType type) = 0;
    virtual void pushConstants(RgpuPipelineLayout layout, RgpuShaderStage stages, uint32_t offset,
                               std::span<const uint8_t> data) = 0;
    virtual void buildAccelerationStructures(std::span<const RgpuAsBuildCall> calls) = 0;
    virtual void traceRays(const RgpuStridedRegion& raygen,
                           const RgpuStridedRegion& miss,
                           const RgpuStridedRegion& hit,
                           const RgpuStridedRegion& callable,
                           uint32_t width, uint32_t height, uint32_t depth) = 0;
    virtual void pipelineBarrier(const RgpuMemoryBarrier& memoryBarrier,
                                 std::span<const RgpuImageLayoutBarrier> imageBarriers) = 0;
  };

  // Lowers the command list onto the recorder in order. Returns false on the
  // first malformed command; the recorder may have received a prefix by then.
  bool rgpuReplayCommands(std::span<const RgpuCommand> commands, RgpuCommandRecorder& recorder);
}
