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
#include <rdx/rb/LruCache.h>

#include <functional>

namespace rdx
{
  class RgpuDelayedResourceDestroyer;

  struct RrFramebufferEntry
  {
    RgpuImageView view;
    RgpuFramebuffer framebuffer;
  };

  // Framebuffers keyed by their target image. Render targets rotate with the
  // swapchain while a pass's render pass stays fixed, so a handful of entries
  // covers every target. Entries leaving the cache are handed to the delayed
  // resource destroyer since in-flight frames may still use them.
  class RrFramebufferCache
  {
  public:
    constexpr static uint32_t Capacity = 4;

    using CreateFunc = std::function<bool(RgpuImage image, RrFramebufferEntry* entry)>;
    using DestroyFunc = std::function<void(const RrFramebufferEntry& entry)>;

  public:
    RrFramebufferCache(RgpuDelayedResourceDestroyer& destroyer, DestroyFunc destroyFunc);

    RrFramebufferCache(const RrFramebufferCache&) = delete;
    RrFramebufferCache& operator=(const RrFramebufferCache&) = delete;

    ~RrFramebufferCache();

  public:
    // Returns nullptr if the entry was missing and creation failed.
    const RrFramebufferEntry* get(RgpuImage image, const CreateFunc& createFunc);

    void clear();

    size_t size() const;

  public:
    static DestroyFunc makeDestroyFunc(RgpuContext* ctx);

  private:
    void retire(const RrFramebufferEntry& entry);

  private:
    RgpuDelayedResourceDestroyer& m_destroyer;
    DestroyFunc m_destroyFunc;
    RbLruCache<RgpuImage, RrFramebufferEntry> m_cache;
  };
}
