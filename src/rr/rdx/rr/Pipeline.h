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

#include <rdx/rr/Blas.h>
#include <rdx/rr/FramePacer.h>
#include <rdx/rr/RasterPass.h>
#include <rdx/rr/RayTracingPass.h>
#include <rdx/rr/TonemapPass.h>
#include <rdx/rr/UiPass.h>
#include <rdx/rgpu/Swapchain.h>

#include <map>

namespace rdx
{
  struct RrCamera;
  struct RrRenderContext;

  struct RrFrameInput
  {
    const RgpuSwapchainImage& target;
    const std::map<uint32_t, RrBlas>& blases;
    RrUiProvider* uiProvider; // optional
  };

  // Sequence of passes that renders one frame into a swapchain image. The
  // last submission waits on the image's acquire semaphore and signals its
  // release semaphore and the frame slot's fence.
  class RrPipeline
  {
  public:
    virtual ~RrPipeline() = default;

  public:
    virtual void draw(const RrFrameInput& input,
                      uint64_t frame,
                      RrRenderContext& renderContext,
                      RbArena& arena,
                      const RrCamera& camera) = 0;

    // Waits for all frames in flight.
    virtual bool resize(RgpuExtent2D extent) = 0;

    virtual void waitIdle() = 0;
  };

  class RrRasterPipeline : public RrPipeline
  {
  public:
    explicit RrRasterPipeline(RrRenderContext& renderContext);

    bool allocate(RgpuFormat targetFormat);

  public:
    void draw(const RrFrameInput& input,
              uint64_t frame,
              RrRenderContext& renderContext,
              RbArena& arena,
              const RrCamera& camera) override;

    bool resize(RgpuExtent2D extent) override;

    void waitIdle() override;

  private:
    RrFramePacer m_framePacer;
    RrRasterPass m_rasterPass;
    RrUiPass m_uiPass;
  };

  class RrPathTracingPipeline : public RrPipeline
  {
  public:
    explicit RrPathTracingPipeline(RrRenderContext& renderContext);

    bool allocate(RgpuFormat targetFormat, RgpuExtent2D extent);

  public:
    void draw(const RrFrameInput& input,
              uint64_t frame,
              RrRenderContext& renderContext,
              RbArena& arena,
              const RrCamera& camera) override;

    bool resize(RgpuExtent2D extent) override;

    void waitIdle() override;

  private:
    RrFramePacer m_framePacer;
    RrRayTracingPass m_rayTracingPass;
    RrTonemapPass m_tonemapPass;
    RrUiPass m_uiPass;
  };
}
