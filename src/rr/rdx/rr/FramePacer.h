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

#include <array>

namespace rdx
{
  // Bounds the number of frames in flight to SlotCount. Each slot tracks
  // whether its fence was handed to a submission, so a slot that was never
  // submitted is not waited on.
  class RrFramePacerSlots
  {
  public:
    constexpr static uint32_t SlotCount = 2;

  public:
    static uint32_t slotIndex(uint64_t frame) { return uint32_t(frame % SlotCount); }

    // True if the slot's previous submission must be waited for before the
    // frame may be recorded.
    bool beginFrame(uint64_t frame) const;

    void markSubmitted(uint64_t frame);

    void markIdle(uint64_t frame);

  private:
    std::array<bool, SlotCount> m_submitted = {};
  };

  class RgpuDelayedResourceDestroyer;

  class RrFramePacer
  {
  public:
    explicit RrFramePacer(RgpuContext* ctx);

    RrFramePacer(const RrFramePacer&) = delete;
    RrFramePacer& operator=(const RrFramePacer&) = delete;

    ~RrFramePacer();

    bool allocate();

  public:
    // Waits for and resets the frame slot's fence if it is in flight, then
    // advances the destroyer by one frame. Returns the fence that the frame's
    // last submission must signal.
    RgpuFence beginFrame(uint64_t frame, RgpuDelayedResourceDestroyer& destroyer);

    // Called once the submission signaling the frame's fence was made. A frame
    // that never reaches this is not waited on when its slot comes around.
    void endFrame(uint64_t frame);

    bool isInFlight(uint64_t frame) const;

    void waitIdle();

  private:
    RgpuContext* m_ctx;
    RrFramePacerSlots m_slots;
    std::array<RgpuFence, RrFramePacerSlots::SlotCount> m_fences = {};
  };
}
