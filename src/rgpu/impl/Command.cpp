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

#include "rdx/rgpu/Command.h"

#include <vector>

namespace rdx
{
  // vkCmdUpdateBuffer limits.
  constexpr static const uint64_t RGPU_MAX_BUFFER_UPDATE_SIZE = 65536;

  namespace
  {
    template<class... Ts>
    struct RgpuOverloaded : Ts... { using Ts::operator()...; };

    RgpuStridedRegion rgpuResolveRegion(RgpuCommandRecorder& recorder, const std::optional<RgpuBufferRegion>& region)
    {
      if (!region)
      {
        return {};
      }

      return RgpuStridedRegion {
        .address = recorder.bufferAddress(region->buffer) + region->offset,
        .stride = region->stride,
        .size = region->size
      };
    }
  }

  bool rgpuReplayCommands(std::span<const RgpuCommand> commands, RgpuCommandRecorder& recorder)
  {
    std::vector<RgpuAsBuildCall> buildCalls;
    std::vector<RgpuImageLayoutBarrier> imageBarriers;

    for (const RgpuCommand& command : commands)
    {
      bool success = std::visit(RgpuOverloaded {
        [&](const RgpuCmdBeginRenderPass& cmd) {
          if (cmd.clears.size() != recorder.renderPassAttachmentCount(cmd.renderPass))
          {
            return false;
          }

          RgpuExtent2D extent = recorder.framebufferExtent(cmd.framebuffer);
          RgpuRect2D renderArea = { 0, 0, extent.width, extent.height };

          recorder.beginRenderPass(cmd.renderPass, cmd.framebuffer, renderArea, cmd.clears);
          return true;
        },
        [&](const RgpuCmdEndRenderPass&) {
          recorder.endRenderPass();
          return true;
        },
        [&](const RgpuCmdBindGraphicsPipeline& cmd) {
          recorder.bindPipeline(RgpuPipelineBindPoint::Graphics, cmd.pipeline);
          return true;
        },
        [&](const RgpuCmdBindRayTracingPipeline& cmd) {
          recorder.bindPipeline(RgpuPipelineBindPoint::RayTracing, cmd.pipeline);
          return true;
        },
        [&](const RgpuCmdBindDescriptorSets& cmd) {
          recorder.bindDescriptorSets(cmd.bindPoint, cmd.layout, cmd.firstSet, cmd.sets);
          return true;
        },
        [&](const RgpuCmdSetViewport& cmd) {
          recorder.setViewport(cmd.viewport);
          return true;
        },
        [&](const RgpuCmdSetScissor& cmd) {
          recorder.setScissor(cmd.scissor);
          return true;
        },
        [&](const RgpuCmdDraw& cmd) {
          if (cmd.vertices.end < cmd.vertices.start || cmd.instances.end < cmd.instances.start)
          {
            return false;
          }

          recorder.draw(cmd.vertices.count(), cmd.instances.count(), cmd.vertices.start, cmd.instances.start);
          return true;
        },
        [&](const RgpuCmdDrawIndexed& cmd) {
          if (cmd.indices.end < cmd.indices.start || cmd.instances.end < cmd.instances.start)
          {
            return false;
          }

          recorder.drawIndexed(cmd.indices.count(), cmd.instances.count(), cmd.indices.start,
                               cmd.vertexOffset, cmd.instances.start);
          return true;
        },
        [&](const RgpuCmdUpdateBuffer& cmd) {
          if ((cmd.offset % 4) != 0 || (cmd.data.size() % 4) != 0 || cmd.data.size() > RGPU_MAX_BUFFER_UPDATE_SIZE)
          {
            return false;
          }

          if (!cmd.data.empty())
          {
            recorder.updateBuffer(cmd.buffer, cmd.offset, cmd.data);
          }
          return true;
        },
        [&](const RgpuCmdBindVertexBuffers& cmd) {
          if (!cmd.bindings.empty())
          {
            recorder.bindVertexBuffers(cmd.firstBinding, cmd.bindings);
          }
          return true;
        },
        [&](const RgpuCmdBindIndexBuffer& cmd) {
          recorder.bindIndexBuffer(cmd.buffer, cmd.offset, cmd.type);
          return true;
        },
        [&](const RgpuCmdPushConstants& cmd) {
          if (cmd.data.empty() || (cmd.offset % 4) != 0 || (cmd.data.size() % 4) != 0)
          {
            return false;
          }

          recorder.pushConstants(cmd.layout, cmd.stages, cmd.offset, cmd.data);
          return true;
        },
        [&](const RgpuCmdBuildAccelerationStructure& cmd) {
          if (cmd.infos.empty())
          {
            return true;
          }

          buildCalls.clear();
          for (const RgpuAsBuildInfo& info : cmd.infos)
          {
            buildCalls.push_back(RgpuAsBuildCall {
              .mode = info.src ? RgpuAsBuildMode::Update : RgpuAsBuildMode::Build,
              .src = info.src,
              .dst = info.dst,
              .flags = info.flags,
              .geometries = info.geometries,
              .scratchAddress = info.scratchAddress
            });
          }

          recorder.buildAccelerationStructures(buildCalls);
          return true;
        },
        [&](const RgpuCmdTraceRays& cmd) {
          recorder.traceRays(rgpuResolveRegion(recorder, cmd.raygen),
                             rgpuResolveRegion(recorder, cmd.miss),
                             rgpuResolveRegion(recorder, cmd.hit),
                             rgpuResolveRegion(recorder, cmd.callable),
                             cmd.width, cmd.height, cmd.depth);
          return true;
        },
        [&](const RgpuCmdPipelineBarrier& cmd) {
          RgpuMemoryBarrier memoryBarrier = {
            .srcStages = cmd.srcStages,
            .dstStages = cmd.dstStages,
            .srcAccess = cmd.srcAccess,
            .dstAccess = cmd.dstAccess
          };

          imageBarriers.clear();
          for (const RgpuImageBarrier& b : cmd.imageBarriers)
          {
            imageBarriers.push_back(RgpuImageLayoutBarrier {
              .image = b.image,
              .oldLayout = b.oldLayout.value_or(RgpuImageLayout::Undefined),
              .newLayout = b.newLayout,
              .aspect = b.aspect,
              .srcStages = cmd.srcStages,
              .dstStages = cmd.dstStages,
              .srcAccess = cmd.srcAccess,
              .dstAccess = cmd.dstAccess,
              .srcQueueFamily = b.srcQueueFamily,
              .dstQueueFamily = b.dstQueueFamily,
              .baseMipLevel = b.baseMipLevel,
              .mipLevelCount = b.mipLevelCount,
              .baseArrayLayer = b.baseArrayLayer,
              .arrayLayerCount = b.arrayLayerCount
            });
          }

          recorder.pipelineBarrier(memoryBarrier, imageBarriers);
          return true;
        }
      }, command);

      if (!success)
      {
        return false;
      }
    }

    return true;
  }
}
