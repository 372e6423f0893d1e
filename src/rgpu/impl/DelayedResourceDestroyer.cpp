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

#include "rdx/rgpu/DelayedResourceDestroyer.h"

#include <assert.h>

namespace rdx
{
  RgpuDelayedResourceDestroyer::RgpuDelayedResourceDestroyer(RgpuContext* ctx)
    : m_ctx(ctx)
  {
  }

  RgpuDelayedResourceDestroyer::~RgpuDelayedResourceDestroyer()
  {
    for (uint32_t i = 0; i < FrameCount; i++)
    {
      assert(m_pendingDestructions[i].empty());
    }
  }

  void RgpuDelayedResourceDestroyer::housekeep()
  {
    // Destroy functions may enqueue further destructions.
    std::vector<DestroyFunc> oldestFrameDestructions = std::move(m_pendingDestructions[m_frameIndex]);
    m_pendingDestructions[m_frameIndex].clear();

    for (const DestroyFunc& fun : oldestFrameDestructions)
    {
      fun();
    }
  }

  void RgpuDelayedResourceDestroyer::nextFrame()
  {
    m_frameIndex = (m_frameIndex + 1) % FrameCount;
  }

  void RgpuDelayedResourceDestroyer::destroyAll()
  {
    while (pendingCount() > 0)
    {
      for (uint32_t i = 0; i < FrameCount; i++)
      {
        nextFrame();
        housekeep();
      }
    }
  }

  size_t RgpuDelayedResourceDestroyer::pendingCount() const
  {
    size_t count = 0;
    for (uint32_t i = 0; i < FrameCount; i++)
    {
      count += m_pendingDestructions[i].size();
    }
    return count;
  }

  void RgpuDelayedResourceDestroyer::enqueueDestruction(DestroyFunc fun)
  {
    m_pendingDestructions[m_frameIndex].push_back(std::move(fun));
  }

  void RgpuDelayedResourceDestroyer::enqueueDestruction(RgpuBuffer handle)
  {
    assert(handle.handle);
    enqueueDestruction([ctx = m_ctx, handle]() { rgpuDestroyBuffer(ctx, handle); });
  }

  void RgpuDelayedResourceDestroyer::enqueueDestruction(RgpuImage handle)
  {
    assert(handle.handle);
    enqueueDestruction([ctx = m_ctx, handle]() { rgpuDestroyImage(ctx, handle); });
  }

  void RgpuDelayedResourceDestroyer::enqueueDestruction(RgpuImageView handle)
  {
    assert(handle.handle);
    enqueueDestruction([ctx = m_ctx, handle]() { rgpuDestroyImageView(ctx, handle); });
  }

  void RgpuDelayedResourceDestroyer::enqueueDestruction(RgpuFramebuffer handle)
  {
    assert(handle.handle);
    enqueueDestruction([ctx = m_ctx, handle]() { rgpuDestroyFramebuffer(ctx, handle); });
  }

  void RgpuDelayedResourceDestroyer::enqueueDestruction(RgpuPipeline handle)
  {
    assert(handle.handle);
    enqueueDestruction([ctx = m_ctx, handle]() { rgpuDestroyPipeline(ctx, handle); });
  }

  void RgpuDelayedResourceDestroyer::enqueueDestruction(RgpuSemaphore handle)
  {
    assert(handle.handle);
    enqueueDestruction([ctx = m_ctx, handle]() { rgpuDestroySemaphore(ctx, handle); });
  }

  void RgpuDelayedResourceDestroyer::enqueueDestruction(RgpuDescriptorSet handle)
  {
    assert(handle.handle);
    enqueueDestruction([ctx = m_ctx, handle]() { rgpuDestroyDescriptorSet(ctx, handle); });
  }

  void RgpuDelayedResourceDestroyer::enqueueDestruction(RgpuCommandBuffer handle)
  {
    assert(handle.handle);
    enqueueDestruction([ctx = m_ctx, handle]() { rgpuDestroyCommandBuffer(ctx, handle); });
  }

  void RgpuDelayedResourceDestroyer::enqueueDestruction(RgpuAccelerationStructure handle)
  {
    assert(handle.handle);
    enqueueDestruction([ctx = m_ctx, handle]() { rgpuDestroyAccelerationStructure(ctx, handle); });
  }
}
