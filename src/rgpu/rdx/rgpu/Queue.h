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

#include <rdx/rgpu/Encoder.h>

#include <optional>
#include <span>

namespace rdx
{
  class RgpuDelayedResourceDestroyer;
  class RgpuSwapchain;
  struct RgpuSwapchainImage;

  struct RgpuSemaphoreWait
  {
    RgpuPipelineStage stages;
    RgpuSemaphore semaphore;
  };

  class RgpuQueue
  {
  public:
    RgpuQueue(RgpuContext* ctx, RgpuDelayedResourceDestroyer& destroyer);

    RgpuQueue(const RgpuQueue&) = delete;
    RgpuQueue& operator=(const RgpuQueue&) = delete;

    ~RgpuQueue();

  public:
    RgpuEncoder createEncoder(RbArena& arena);

    // Submission failure terminates the process. The command buffer is
    // released once it can no longer be in flight.
    void submit(RgpuRecordedCommandBuffer&& commandBuffer,
                std::span<const RgpuSemaphoreWait> waits = {},
                std::span<const RgpuSemaphore> signals = {},
                std::optional<RgpuFence> fence = std::nullopt);

    void submitAndWait(RgpuRecordedCommandBuffer&& commandBuffer);

    // Returns false when the image's chain is out of date or suboptimal.
    bool present(const RgpuSwapchain& swapchain, const RgpuSwapchainImage& image);

  private:
    RgpuContext* m_ctx;
    RgpuDelayedResourceDestroyer& m_destroyer;
    uint64_t m_commandPool = 0;
  };
}
