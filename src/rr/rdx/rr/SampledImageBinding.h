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

namespace rdx
{
  class RgpuDelayedResourceDestroyer;

  // View of the image that a descriptor set samples. The view is only
  // recreated when a different image is bound, which happens when the
  // producing pass reallocates its output on resize. Replaced views go
  // through the delayed resource destroyer.
  class RrSampledImageBinding
  {
  public:
    enum class BindResult
    {
      Unchanged,
      Rebound, // the new view must be written to the descriptor set
      Failed   // the previous binding is kept
    };

    using CreateFunc = std::function<bool(RgpuImage image, RgpuImageView* view)>;
    using DestroyFunc = std::function<void(RgpuImageView view)>;

  public:
    RrSampledImageBinding(RgpuDelayedResourceDestroyer& destroyer, DestroyFunc destroyFunc);

    RrSampledImageBinding(const RrSampledImageBinding&) = delete;
    RrSampledImageBinding& operator=(const RrSampledImageBinding&) = delete;

    ~RrSampledImageBinding();

  public:
    BindResult bind(RgpuImage image, const CreateFunc& createFunc);

    RgpuImage image() const { return m_image; }

    RgpuImageView view() const { return m_view; }

  public:
    static DestroyFunc makeDestroyFunc(RgpuContext* ctx);

  private:
    void retire();

  private:
    RgpuDelayedResourceDestroyer& m_destroyer;
    DestroyFunc m_destroyFunc;
    RgpuImage m_image = {};
    RgpuImageView m_view = {};
  };
}
