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

#include "rdx/rr/SampledImageBinding.h"

#include <rdx/rgpu/DelayedResourceDestroyer.h>

namespace rdx
{
  RrSampledImageBinding::RrSampledImageBinding(RgpuDelayedResourceDestroyer& destroyer, DestroyFunc destroyFunc)
    : m_destroyer(destroyer)
    , m_destroyFunc(std::move(destroyFunc))
  {
  }

  RrSampledImageBinding::~RrSampledImageBinding()
  {
    retire();
  }

  RrSampledImageBinding::BindResult RrSampledImageBinding::bind(RgpuImage image, const CreateFunc& createFunc)
  {
    if (m_view.handle && m_image == image)
    {
      return BindResult::Unchanged;
    }

    RgpuImageView view;
    if (!createFunc(image, &view))
    {
      return BindResult::Failed;
    }

    retire();

    m_image = image;
    m_view = view;
    return BindResult::Rebound;
  }

  RrSampledImageBinding::DestroyFunc RrSampledImageBinding::makeDestroyFunc(RgpuContext* ctx)
  {
    return [ctx](RgpuImageView view) {
      rgpuDestroyImageView(ctx, view);
    };
  }

  void RrSampledImageBinding::retire()
  {
    if (!m_view.handle)
    {
      return;
    }

    m_destroyer.enqueueDestruction([destroyFunc = m_destroyFunc, view = m_view]() {
      destroyFunc(view);
    });

    m_image = {};
    m_view = {};
  }
}
