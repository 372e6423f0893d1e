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

#include <rdx/rr/FramebufferCache.h>
#include <rdx/rgpu/Queue.h>

#include <span>

namespace rdx
{
  struct RrCamera;
  struct RrRenderContext;

  // Fullscreen triangle into a color target with a depth attachment.
  class RrRasterPass
  {
  public:
    struct Input
    {
      RgpuImage target;
    };

    struct Output
    {
    };

  public:
    explicit RrRasterPass(RrRenderContext& renderContext);

    RrRasterPass(const RrRasterPass&) = delete;
    RrRasterPass& operator=(const RrRasterPass&) = delete;

    ~RrRasterPass();

    bool allocate(RgpuFormat targetFormat);

  public:
    Output draw(const Input& input,
                uint64_t frame,
                std::span<const RgpuSemaphoreWait> waits,
                std::span<const RgpuSemaphore> signals,
                std::optional<RgpuFence> fence,
                RrRenderContext& renderContext,
                RbArena& arena,
                const RrCamera& camera);

  private:
    bool ensureDepthImage(RgpuExtent2D extent);

  private:
    RrRenderContext& m_renderContext;
    RgpuRenderPass m_renderPass;
    RgpuPipelineLayout m_pipelineLayout;
    RgpuPipeline m_pipeline;
    RgpuImage m_depthImage;
    RgpuImageView m_depthView;
    RgpuExtent2D m_depthExtent = { 0, 0 };
    RrFramebufferCache m_framebuffers;
  };
}
