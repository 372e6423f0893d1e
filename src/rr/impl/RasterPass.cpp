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

#include "rdx/rr/RasterPass.h"

#include <rdx/rr/RenderContext.h>
#include <rdx/rgpu/DelayedResourceDestroyer.h>
#include <rdx/rb/Log.h>

#include <array>

namespace rdx
{
  RrRasterPass::RrRasterPass(RrRenderContext& renderContext)
    : m_renderContext(renderContext)
    , m_framebuffers(renderContext.destroyer, RrFramebufferCache::makeDestroyFunc(renderContext.ctx))
  {
  }

  RrRasterPass::~RrRasterPass()
  {
    RgpuContext* ctx = m_renderContext.ctx;
    RgpuDelayedResourceDestroyer& destroyer = m_renderContext.destroyer;

    m_framebuffers.clear();

    if (m_depthView.handle)
    {
      destroyer.enqueueDestruction(m_depthView, m_depthImage);
    }
    if (m_pipeline.handle)
    {
      destroyer.enqueueDestruction(m_pipeline);
    }

    RgpuPipelineLayout pipelineLayout = m_pipelineLayout;
    RgpuRenderPass renderPass = m_renderPass;
    destroyer.enqueueDestruction([ctx, pipelineLayout, renderPass]() {
      if (pipelineLayout.handle) rgpuDestroyPipelineLayout(ctx, pipelineLayout);
      if (renderPass.handle) rgpuDestroyRenderPass(ctx, renderPass);
    });
  }

  bool RrRasterPass::allocate(RgpuFormat targetFormat)
  {
    RgpuContext* ctx = m_renderContext.ctx;

    RgpuShaderModule vertexShader;
    RgpuShaderModule fragmentShader;
    bool result = false;

    RgpuRenderPassCreateInfo renderPassCreateInfo = {
      .attachments = {
        RgpuAttachmentInfo {
          .format = targetFormat,
          .loadOp = RgpuLoadOp::Clear,
          .storeOp = RgpuStoreOp::Store,
          .initialLayout = std::nullopt,
          .finalLayout = RgpuImageLayout::PresentSrc
        },
        RgpuAttachmentInfo {
          .format = RgpuFormat::D32Sfloat,
          .loadOp = RgpuLoadOp::Clear,
          .storeOp = RgpuStoreOp::DontCare,
          .initialLayout = std::nullopt,
          .finalLayout = RgpuImageLayout::DepthStencilAttachmentOptimal
        }
      },
      .colorAttachments = { 0 },
      .depthAttachment = 1
    };

    if (!rgpuCreateRenderPass(ctx, renderPassCreateInfo, &m_renderPass))
    {
      RB_ERROR("failed to create raster render pass");
      return false;
    }

    if (!rgpuCreatePipelineLayout(ctx, RgpuPipelineLayoutCreateInfo{}, &m_pipelineLayout))
    {
      RB_ERROR("failed to create raster pipeline layout");
      return false;
    }

    if (!rrLoadShaderModule(ctx, "shader.vert.spv", RgpuShaderStage::Vertex, &vertexShader))
    {
      return false;
    }

    if (!rrLoadShaderModule(ctx, "shader.frag.spv", RgpuShaderStage::Fragment, &fragmentShader))
    {
      goto cleanup_vertex;
    }

    {
      RgpuGraphicsPipelineCreateInfo pipelineCreateInfo = {
        .layout = m_pipelineLayout,
        .renderPass = m_renderPass,
        .vertexShader = vertexShader,
        .fragmentShader = fragmentShader,
        .frontFace = RgpuFrontFace::CounterClockwise,
        .cullMode = RgpuCullMode::None,
        .depthTest = true,
        .debugName = "[Raster]"
      };

      if (!rgpuCreateGraphicsPipeline(ctx, pipelineCreateInfo, &m_pipeline))
      {
        RB_ERROR("failed to create raster pipeline");
        goto cleanup_fragment;
      }
    }

    result = true;

  cleanup_fragment:
    rgpuDestroyShaderModule(ctx, fragmentShader);
  cleanup_vertex:
    rgpuDestroyShaderModule(ctx, vertexShader);
    return result;
  }

  bool RrRasterPass::ensureDepthImage(RgpuExtent2D extent)
  {
    if (m_depthView.handle && m_depthExtent == extent)
    {
      return true;
    }

    RgpuContext* ctx = m_renderContext.ctx;

    // Cached framebuffers reference the old depth view.
    m_framebuffers.clear();

    if (m_depthView.handle)
    {
      m_renderContext.destroyer.enqueueDestruction(m_depthView, m_depthImage);
      m_depthView = {};
      m_depthImage = {};
    }

    RgpuImageCreateInfo imageCreateInfo = {
      .width = extent.width,
      .height = extent.height,
      .format = RgpuFormat::D32Sfloat,
      .usage = RgpuImageUsage::DepthStencilAttachment,
      .debugName = "[Raster depth]"
    };

    if (!rgpuCreateImage(ctx, imageCreateInfo, &m_depthImage))
    {
      RB_ERROR("failed to create depth image");
      return false;
    }

    RgpuImageViewCreateInfo viewCreateInfo = {
      .image = m_depthImage,
      .aspect = RgpuImageAspect::Depth
    };

    if (!rgpuCreateImageView(ctx, viewCreateInfo, &m_depthView))
    {
      RB_ERROR("failed to create depth image view");
      rgpuDestroyImage(ctx, m_depthImage);
      m_depthImage = {};
      return false;
    }

    m_depthExtent = extent;
    return true;
  }

  RrRasterPass::Output RrRasterPass::draw(const Input& input,
                                          uint64_t frame,
                                          std::span<const RgpuSemaphoreWait> waits,
                                          std::span<const RgpuSemaphore> signals,
                                          std::optional<RgpuFence> fence,
                                          RrRenderContext& renderContext,
                                          RbArena& arena,
                                          const RrCamera& camera)
  {
    RgpuContext* ctx = renderContext.ctx;
    RgpuExtent2D extent = rgpuGetImageInfo(ctx, input.target).extent;

    if (!ensureDepthImage(extent))
    {
      RB_ERROR("raster pass has no depth target; skipping frame");
    }

    const RrFramebufferEntry* framebuffer = m_framebuffers.get(input.target, [&](RgpuImage image, RrFramebufferEntry* entry) {
      if (!m_depthView.handle || !rgpuCreateImageView(ctx, RgpuImageViewCreateInfo{ .image = image }, &entry->view))
      {
        return false;
      }

      RgpuFramebufferCreateInfo framebufferCreateInfo = {
        .renderPass = m_renderPass,
        .views = { entry->view, m_depthView },
        .extent = extent
      };

      if (!rgpuCreateFramebuffer(ctx, framebufferCreateInfo, &entry->framebuffer))
      {
        rgpuDestroyImageView(ctx, entry->view);
        return false;
      }
      return true;
    });

    RgpuEncoder encoder = renderContext.queue.createEncoder(arena);

    if (framebuffer)
    {
      std::array<RgpuClearValue, 2> clears = {
        rgpuClearColor(0.5f, 0.2f, 0.2f, 0.0f),
        rgpuClearDepthStencil(1.0f)
      };

      encoder.beginRenderPass(m_renderPass, framebuffer->framebuffer, clears);
      encoder.bindGraphicsPipeline(m_pipeline);
      encoder.setViewport(RgpuViewport {
        .x = 0.0f,
        .y = float(extent.height),
        .width = float(extent.width),
        .height = -float(extent.height)
      });
      encoder.setScissor(RgpuRect2D{ 0, 0, extent.width, extent.height });
      encoder.draw({ 0, 3 }, { 0, 1 });
      encoder.endRenderPass();
    }
    else
    {
      RB_ERROR("failed to create raster framebuffer");
    }

    // Submit even when empty so that the semaphores and fence get signaled.
    renderContext.queue.submit(std::move(encoder).finish(ctx), waits, signals, fence);

    return Output{};
  }
}
