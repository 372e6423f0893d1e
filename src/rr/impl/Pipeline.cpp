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

#include "rdx/rr/Pipeline.h"

#include <rdx/rr/RenderContext.h>
#include <rdx/rb/Log.h>

#include <array>

namespace rdx
{
  RrRasterPipeline::RrRasterPipeline(RrRenderContext& renderContext)
    : m_framePacer(renderContext.ctx)
    , m_rasterPass(renderContext)
    , m_uiPass(renderContext)
  {
  }

  bool RrRasterPipeline::allocate(RgpuFormat targetFormat)
  {
    if (!m_framePacer.allocate())
    {
      return false;
    }

    if (!m_rasterPass.allocate(targetFormat))
    {
      RB_ERROR("failed to allocate raster pass");
      return false;
    }

    if (!m_uiPass.allocate(targetFormat))
    {
      RB_ERROR("failed to allocate UI pass");
      return false;
    }

    return true;
  }

  void RrRasterPipeline::draw(const RrFrameInput& input,
                              uint64_t frame,
                              RrRenderContext& renderContext,
                              RbArena& arena,
                              const RrCamera& camera)
  {
    RgpuFence fence = m_framePacer.beginFrame(frame, renderContext.destroyer);

    std::array<RgpuSemaphoreWait, 1> waits = {
      RgpuSemaphoreWait{ .stages = RgpuPipelineStage::ColorAttachmentOutput, .semaphore = input.target.wait }
    };
    std::array<RgpuSemaphore, 1> signals = { input.target.signal };

    if (!input.uiProvider)
    {
      m_rasterPass.draw({ .target = input.target.image }, frame, waits, signals, fence, renderContext, arena, camera);
    }
    else
    {
      m_rasterPass.draw({ .target = input.target.image }, frame, waits, {}, std::nullopt, renderContext, arena, camera);
      m_uiPass.draw({ .target = input.target.image, .provider = *input.uiProvider }, frame, {}, signals, fence, renderContext, arena, camera);
    }

    m_framePacer.endFrame(frame);
  }

  bool RrRasterPipeline::resize(RgpuExtent2D extent)
  {
    // The depth attachment follows the target's extent on its own.
    m_framePacer.waitIdle();
    return true;
  }

  void RrRasterPipeline::waitIdle()
  {
    m_framePacer.waitIdle();
  }

  RrPathTracingPipeline::RrPathTracingPipeline(RrRenderContext& renderContext)
    : m_framePacer(renderContext.ctx)
    , m_rayTracingPass(renderContext)
    , m_tonemapPass(renderContext)
    , m_uiPass(renderContext)
  {
  }

  bool RrPathTracingPipeline::allocate(RgpuFormat targetFormat, RgpuExtent2D extent)
  {
    if (!m_framePacer.allocate())
    {
      return false;
    }

    if (!m_rayTracingPass.allocate(extent))
    {
      RB_ERROR("failed to allocate ray tracing pass");
      return false;
    }

    if (!m_tonemapPass.allocate(targetFormat))
    {
      RB_ERROR("failed to allocate tonemap pass");
      return false;
    }

    if (!m_uiPass.allocate(targetFormat))
    {
      RB_ERROR("failed to allocate UI pass");
      return false;
    }

    return true;
  }

  void RrPathTracingPipeline::draw(const RrFrameInput& input,
                                   uint64_t frame,
                                   RrRenderContext& renderContext,
                                   RbArena& arena,
                                   const RrCamera& camera)
  {
    RgpuFence fence = m_framePacer.beginFrame(frame, renderContext.destroyer);

    RrRayTracingPass::Output rtOutput = m_rayTracingPass.draw({ .blases = input.blases }, frame,
                                                              {}, {}, std::nullopt,
                                                              renderContext, arena, camera);

    std::array<RgpuSemaphoreWait, 1> waits = {
      RgpuSemaphoreWait{ .stages = RgpuPipelineStage::ColorAttachmentOutput, .semaphore = input.target.wait }
    };
    std::array<RgpuSemaphore, 1> signals = { input.target.signal };

    RrTonemapPass::Input tonemapInput = {
      .initialImage = rtOutput.outputImage,
      .finalImage = input.target.image
    };

    if (!input.uiProvider)
    {
      m_tonemapPass.draw(tonemapInput, frame, waits, signals, fence, renderContext, arena, camera);
    }
    else
    {
      m_tonemapPass.draw(tonemapInput, frame, waits, {}, std::nullopt, renderContext, arena, camera);
      m_uiPass.draw({ .target = input.target.image, .provider = *input.uiProvider }, frame, {}, signals, fence, renderContext, arena, camera);
    }

    m_framePacer.endFrame(frame);
  }

  bool RrPathTracingPipeline::resize(RgpuExtent2D extent)
  {
    m_framePacer.waitIdle();

    if (!m_rayTracingPass.resize(extent))
    {
      RB_ERROR("failed to resize ray tracing output to {}x{}", extent.width, extent.height);
      return false;
    }
    return true;
  }

  void RrPathTracingPipeline::waitIdle()
  {
    m_framePacer.waitIdle();
  }
}
