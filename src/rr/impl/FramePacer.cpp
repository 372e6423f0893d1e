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

#include "rdx/rr/FramePacer.h"

#include <rdx/rgpu/DelayedResourceDestroyer.h>
#include <rdx/rb/Log.h>

#include "Internal.h"

namespace rdx
{
  bool RrFramePacerSlots::beginFrame(uint64_t frame) const
  {
    return m_submitted[slotIndex(frame)];
  }

  void RrFramePacerSlots::markSubmitted(uint64_t frame)
  {
    m_submitted[slotIndex(frame)] = true;
  }

  void RrFramePacerSlots::markIdle(uint64_t frame)
  {
    m_submitted[slotIndex(frame)] = false;
  }

  RrFramePacer::RrFramePacer(RgpuContext* ctx)
    : m_ctx(ctx)
  {
  }

  RrFramePacer::~RrFramePacer()
  {
    for (RgpuFence fence : m_fences)
    {
      if (fence.handle)
      {
        rgpuDestroyFence(m_ctx, fence);
      }
    }
  }

  bool RrFramePacer::allocate()
  {
    for (RgpuFence& fence : m_fences)
    {
      if (!rgpuCreateFence(m_ctx, false, &fence))
      {
        RB_ERROR("failed to create frame fence");
        return false;
      }
    }
    return true;
  }

  RgpuFence RrFramePacer::beginFrame(uint64_t frame, RgpuDelayedResourceDestroyer& destroyer)
  {
    RgpuFence fence = m_fences[RrFramePacerSlots::slotIndex(frame)];

    if (m_slots.beginFrame(frame))
    {
      if (!rgpuWaitFence(m_ctx, fence) || !rgpuResetFence(m_ctx, fence))
      {
        RR_FATAL("failed to wait for frame fence");
      }

      m_slots.markIdle(frame);
    }

    destroyer.nextFrame();
    destroyer.housekeep();

    return fence;
  }

  void RrFramePacer::endFrame(uint64_t frame)
  {
    m_slots.markSubmitted(frame);
  }

  bool RrFramePacer::isInFlight(uint64_t frame) const
  {
    return m_slots.beginFrame(frame);
  }

  void RrFramePacer::waitIdle()
  {
    for (uint32_t i = 0; i < RrFramePacerSlots::SlotCount; i++)
    {
      if (!m_slots.beginFrame(i))
      {
        continue;
      }

      if (!rgpuWaitFence(m_ctx, m_fences[i]) || !rgpuResetFence(m_ctx, m_fences[i]))
      {
        RR_FATAL("failed to wait for frame fence");
      }

      m_slots.markIdle(i);
    }
  }
}
