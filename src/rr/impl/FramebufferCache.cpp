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

#include "rdx/rr/FramebufferCache.h"

#include <rdx/rgpu/DelayedResourceDestroyer.h>

namespace rdx
{
  RrFramebufferCache::RrFramebufferCache(RgpuDelayedResourceDestroyer& destroyer, DestroyFunc destroyFunc)
    : m_destroyer(destroyer)
    , m_destroyFunc(std::move(destroyFunc))
    , m_cache(Capacity)
  {
  }

  RrFramebufferCache::~RrFramebufferCache()
  {
    clear();
  }

  const RrFramebufferEntry* RrFramebufferCache::get(RgpuImage image, const CreateFunc& createFunc)
  {
    if (const RrFramebufferEntry* entry = m_cache.get(image); entry)
    {
      return entry;
    }

    RrFramebufferEntry entry;
    if (!createFunc(image, &entry))
    {
      return nullptr;
    }

    if (auto evicted = m_cache.put(image, entry); evicted)
    {
      retire(evicted->second);
    }

    return m_cache.get(image);
  }

  void RrFramebufferCache::clear()
  {
    m_cache.drain([this](RgpuImage, const RrFramebufferEntry& entry) {
      retire(entry);
    });
  }

  size_t RrFramebufferCache::size() const
  {
    return m_cache.size();
  }

  RrFramebufferCache::DestroyFunc RrFramebufferCache::makeDestroyFunc(RgpuContext* ctx)
  {
    return [ctx](const RrFramebufferEntry& entry) {
      rgpuDestroyFramebuffer(ctx, entry.framebuffer);
      rgpuDestroyImageView(ctx, entry.view);
    };
  }

  void RrFramebufferCache::retire(const RrFramebufferEntry& entry)
  {
    m_destroyer.enqueueDestruction([destroyFunc = m_destroyFunc, entry]() {
      destroyFunc(entry);
    });
  }
}
