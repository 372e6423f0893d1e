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
#include <memory>
#include <optional>
#include <vector>

namespace rdx
{
  class RgpuDelayedResourceDestroyer;

  struct RgpuSwapchainImage
  {
    RgpuImage image;
    RgpuSemaphore wait;   // signaled by the acquire, waited on before writing the image
    RgpuSemaphore signal; // signaled by the last submission, waited on by present
    uint32_t index;
    uint64_t chain;
  };

  // Rotates per-image semaphore pools so that no semaphore is reused while a
  // wait on it may still be pending.
  class RgpuSwapchainSemaphores
  {
  public:
    constexpr static uint32_t SlotCount = 3;

    struct ImageSlots
    {
      std::array<RgpuSemaphore, SlotCount> acquire;
      std::array<RgpuSemaphore, SlotCount> release;
      uint32_t acquireIndex = 0;
      uint32_t releaseIndex = 0;
    };

  public:
    RgpuSwapchainSemaphores(RgpuSemaphore freeSemaphore, std::vector<ImageSlots> images);

  public:
    // The semaphore the next acquire signals.
    RgpuSemaphore freeSemaphore() const { return m_freeSemaphore; }

    // Moves the just signaled free semaphore into the image's acquire pool and
    // takes the slot's previous semaphore as the new free one.
    void onAcquired(uint32_t imageIndex, RgpuSemaphore* wait, RgpuSemaphore* signal);

    uint32_t imageCount() const { return (uint32_t) m_images.size(); }

    std::vector<RgpuSemaphore> allSemaphores() const;

  private:
    RgpuSemaphore m_freeSemaphore;
    std::vector<ImageSlots> m_images;
  };

  // Owns the active native swapchain plus chains retired by reconfiguration.
  // Retired chains are destroyed through the delayed resource destroyer.
  class RgpuSwapchain
  {
  public:
    RgpuSwapchain(RgpuContext* ctx, RgpuDelayedResourceDestroyer& destroyer);

    RgpuSwapchain(const RgpuSwapchain&) = delete;
    RgpuSwapchain& operator=(const RgpuSwapchain&) = delete;

    ~RgpuSwapchain();

  public:
    bool configure(RgpuExtent2D extent);

    // Empty when no chain is active or the active one is out of date.
    std::optional<RgpuSwapchainImage> acquireNextImage();

    bool isActiveChain(uint64_t chain) const;

    RgpuFormat format() const;

    RgpuExtent2D extent() const;

    struct Chain;

  private:
    void retireActiveChain();

  private:
    RgpuContext* m_ctx;
    RgpuDelayedResourceDestroyer& m_destroyer;
    std::shared_ptr<Chain> m_active;
    std::vector<std::weak_ptr<Chain>> m_retired;
  };
}
