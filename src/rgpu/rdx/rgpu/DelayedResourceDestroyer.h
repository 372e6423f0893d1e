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

#include <functional>
#include <vector>

namespace rdx
{
  // Holds back destruction of resources that in-flight frames may still
  // reference. An enqueued resource is destroyed FrameCount frames later.
  class RgpuDelayedResourceDestroyer
  {
  public:
    constexpr static uint32_t FrameCount = 4;

    using DestroyFunc = std::function<void()>;

  public:
    explicit RgpuDelayedResourceDestroyer(RgpuContext* ctx);

    RgpuDelayedResourceDestroyer(const RgpuDelayedResourceDestroyer&) = delete;
    RgpuDelayedResourceDestroyer& operator=(const RgpuDelayedResourceDestroyer&) = delete;

    ~RgpuDelayedResourceDestroyer();

  public:
    void nextFrame();
    void housekeep();

    void destroyAll();

    size_t pendingCount() const;

    template<typename T, typename... U>
      requires (sizeof...(U) > 0)
    void enqueueDestruction(T handle, U... moreHandles)
    {
      enqueueDestruction(handle);
      enqueueDestruction(moreHandles...);
    }

    void enqueueDestruction(DestroyFunc fun);
    void enqueueDestruction(RgpuBuffer handle);
    void enqueueDestruction(RgpuImage handle);
    void enqueueDestruction(RgpuImageView handle);
    void enqueueDestruction(RgpuFramebuffer handle);
    void enqueueDestruction(RgpuPipeline handle);
    void enqueueDestruction(RgpuSemaphore handle);
    void enqueueDestruction(RgpuDescriptorSet handle);
    void enqueueDestruction(RgpuCommandBuffer handle);
    void enqueueDestruction(RgpuAccelerationStructure handle);

  private:
    RgpuContext* m_ctx;
    uint32_t m_frameIndex = 0;
    std::vector<DestroyFunc> m_pendingDestructions[FrameCount];
  };
}
