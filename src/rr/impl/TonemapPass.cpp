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

#include "rdx/rr/TonemapPass.h"

#include <rdx/rr/RenderContext.h>
#include <rdx/rgpu/DelayedResourceDestroyer.h>
#include <rdx/rb/Log.h>

namespace rdx
{
  RrTonemapPass::RrTonemapPass(RrRenderContext& renderContext)
    : m_renderContext(renderContext)
    , m_inputBindings{ {
        { renderContext.destroyer, RrSampledImageBinding::makeDestroyFunc(renderContext.ctx) },
        { renderContext.destroyer, RrSampledImageBinding::makeDestroyFunc(renderContext.ctx) }
      } }
    , m_framebuffers(renderContext.destroyer, RrFramebufferCache::makeDestroyFunc(renderContext.ctx))
  {
    static_assert(SLOT_COUNT == 2);
  }

  RrTonemapPass::~RrTonemapPass()
  {
    RgpuContext* ctx = m_renderContext.ctx;
    RgpuDelayedResourceDestroyer& destroyer = m_renderContext.destroyer;

    m_framebuffers.clear();

    for (RgpuDescriptorSet descriptorSet : m_descriptorSets)
    {
      if (descriptorSet.handle) destroyer.enqueueDestruction(descriptorSet);
    }

    if (m_pipeline.handle) destroyer.enqueueDestruction(m_pipeline);

    RgpuSampler sampler = m_sampler;
    RgpuPipelineLayout pipelineLayout = m_pipelineLayout;
    RgpuDescriptorSetLayout descriptorSetLayout = m_descriptorSetLayout;
    RgpuRenderPass renderPass = m_renderPass;
    destroyer.enqueueDestruction([=]() {
      if (sampler.handle) rgpuDestroySampler(ctx, sampler);
      if (pipelineLayout.handle) rgpuDestroyPipelineLayout(ctx, pipelineLayout);
      if (descriptorSetLayout.handle) rgpuDestroyDescriptorSetLayout(ctx, descriptorSetLayout);
      if (renderPass.handle) rgpuDestroyRenderPass(ctx, renderPass);
    });
  }

  bool RrTonemapPass::allocate(RgpuFormat targetFormat)
  {
    RgpuContext* ctx = m_renderContext.ctx;

    RgpuDescriptorSetLayoutCreateInfo layoutCreateInfo = {
      .flags = RgpuDescriptorSetLayoutFlags::UpdateAfterBindPool,
      .bindings = {
        { .binding = 0, .type = RgpuDescriptorType::CombinedImageSampler, .stages = RgpuShaderStage::Fragment }
      }
    };

    if (!rgpuCreateDescriptorSetLayout(ctx, layoutCreateInfo, &m_descriptorSetLayout))
    {
      RB_ERROR("failed to create tonemap descriptor set layout");
      return false;
    }

    for (RgpuDescriptorSet& descriptorSet : m_descriptorSets)
    {
      if (!rgpuCreateDescriptorSet(ctx, m_descriptorSetLayout, &descriptorSet))
      {
        RB_ERROR("failed to create tonemap descriptor set");
        return false;
      }
    }

    if (!rgpuCreateSampler(ctx, RgpuSamplerCreateInfo{}, &m_sampler))
    {
      RB_ERROR("failed to create tonemap sampler");
      return false;
    }

    RgpuRenderPassCreateInfo renderPassCreateInfo = {
      .attachments = {
        RgpuAttachmentInfo {
          .format = targetFormat,
          .loadOp = RgpuLoadOp::Clear,
          .storeOp = RgpuStoreOp::Store,
          .initialLayout = std::nullopt,
          .finalLayout = RgpuImageLayout::PresentSrc
        }
      },
      .colorAttachments = { 0 }
    };

    if (!rgpuCreateRenderPass(ctx, renderPassCreateInfo, &m_renderPass))
    {
      RB_ERROR("failed to create tonemap render pass");
      return false;
    }

    RgpuPipelineLayoutCreateInfo pipelineLayoutCreateInfo = {
      .setLayouts = { m_descriptorSetLayout }
    };

    if (!rgpuCreatePipelineLayout(ctx, pipelineLayoutCreateInfo, &m_pipelineLayout))
    {
      RB_ERROR("failed to create tonemap pipeline layout");
      return false;
    }

    RgpuShaderModule vertexShader;
    RgpuShaderModule fragmentShader;
    bool result = false;

    if (!rrLoadShaderModule(ctx, "tonemap.vert.spv", RgpuShaderStage::Vertex, &vertexShader))
    {
      return false;
    }

    if (!rrLoadShaderModule(ctx, "tonemap.frag.spv", RgpuShaderStage::Fragment, &fragmentShader))
    {
      goto cleanup_vertex;
    }

    {
      RgpuGraphicsPipelineCreateInfo pipelineCreateInfo = {
        .layout = m_pipelineLayout,
        .renderPass = m_renderPass,
        .vertexShader = vertexShader,
        .fragmentShader = fragmentShader,
        .debugName = "[Tonemap]"
      };

      if (!rgpuCreateGraphicsPipeline(ctx, pipelineCreateInfo, &m_pipeline))
      {
        RB_ERROR("failed to create tonemap pipeline");
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

  bool RrTonemapPass::bindInput(uint32_t slot, RgpuImage image)
  {
    RgpuContext* ctx = m_renderContext.ctx;
    RrSampledImageBinding& binding = m_inputBindings[slot];

    RrSampledImageBinding::BindResult result = binding.bind(image, [ctx](RgpuImage target, RgpuImageView* view) {
      return rgpuCreateImageView(ctx, RgpuImageViewCreateInfo{ .image = target }, view);
    });

    if (result == RrSampledImageBinding::BindResult::Failed)
    {
      RB_ERROR("failed to create tonemap input view");
      return false;
    }

    if (result == RrSampledImageBinding::BindResult::Unchanged)
    {
      return true;
    }

    std::array<RgpuDescriptorWrite, 1> writes = {
      RgpuDescriptorWrite {
        .binding = 0,
        .type = RgpuDescriptorType::CombinedImageSampler,
        .images = {
          RgpuDescriptorImageInfo{ .sampler = m_sampler, .view = binding.view(), .layout = RgpuImageLayout::ShaderReadOnlyOptimal }
        }
      }
    };

    rgpuUpdateDescriptorSet(ctx, m_descriptorSets[slot], writes);
    return true;
  }

  RrTonemapPass::Output RrTonemapPass::draw(const Input& input,
                                            uint64_t frame,
                                            std::span<const RgpuSemaphoreWait> waits,
                                            std::span<const RgpuSemaphore> signals,
                                            std::optional<RgpuFence> fence,
                                            RrRenderContext& renderContext,
                                            RbArena& arena,
                                            const RrCamera& camera)
  {
    RgpuContext* ctx = renderContext.ctx;
    RgpuExtent2D extent = rgpuGetImageInfo(ctx, input.finalImage).extent;
    uint32_t slot = uint32_t(frame % SLOT_COUNT);

    const RrFramebufferEntry* framebuffer = m_framebuffers.get(input.finalImage, [&](RgpuImage image, RrFramebufferEntry* entry) {
      if (!rgpuCreateImageView(ctx, RgpuImageViewCreateInfo{ .image = image }, &entry->view))
      {
        return false;
      }

      RgpuFramebufferCreateInfo framebufferCreateInfo = {
        .renderPass = m_renderPass,
        .views = { entry->view },
        .extent = extent
      };

      if (!rgpuCreateFramebuffer(ctx, framebufferCreateInfo, &entry->framebuffer))
      {
        rgpuDestroyImageView(ctx, entry->view);
        return false;
      }
      return true;
    });

    bool inputBound = bindInput(slot, input.initialImage);

    RgpuEncoder encoder = renderContext.queue.createEncoder(arena);

    if (framebuffer && inputBound)
    {
      std::array<RgpuClearValue, 1> clears = { rgpuClearColor(0.5f, 0.2f, 0.2f, 0.0f) };
      std::array<RgpuDescriptorSet, 1> descriptorSets = { m_descriptorSets[slot] };

      encoder.beginRenderPass(m_renderPass, framebuffer->framebuffer, clears);
      encoder.bindGraphicsPipeline(m_pipeline);
      encoder.bindDescriptorSets(RgpuPipelineBindPoint::Graphics, m_pipelineLayout, 0, descriptorSets);
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
      RB_ERROR("tonemap pass is missing its framebuffer or input");
    }

    renderContext.queue.submit(std::move(encoder).finish(ctx), waits, signals, fence);

    return Output{};
  }
}
