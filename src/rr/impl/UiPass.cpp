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

#include "rdx/rr/UiPass.h"

#include <rdx/rr/RenderContext.h>
#include <rdx/rgpu/DelayedResourceDestroyer.h>
#include <rdx/rb/Log.h>

#include <algorithm>
#include <math.h>
#include <stddef.h>

namespace rdx
{
  RgpuRect2D rrComputeUiScissor(const RrUiDrawCommand& command, RgpuExtent2D extent)
  {
    float width = float(extent.width);
    float height = float(extent.height);

    float x0 = std::clamp(floorf(command.clipMin[0]), 0.0f, width);
    float y0 = std::clamp(floorf(command.clipMin[1]), 0.0f, height);
    float x1 = std::clamp(ceilf(command.clipMax[0]), x0, width);
    float y1 = std::clamp(ceilf(command.clipMax[1]), y0, height);

    return RgpuRect2D{ int32_t(x0), int32_t(y0), uint32_t(x1 - x0), uint32_t(y1 - y0) };
  }

  std::vector<uint8_t> rrExpandAlphaToRgba(std::span<const uint8_t> alpha)
  {
    std::vector<uint8_t> rgba(alpha.size() * 4);
    for (size_t i = 0; i < alpha.size(); i++)
    {
      rgba[i * 4 + 0] = alpha[i];
      rgba[i * 4 + 1] = alpha[i];
      rgba[i * 4 + 2] = alpha[i];
      rgba[i * 4 + 3] = alpha[i];
    }
    return rgba;
  }

  RrUiPass::RrUiPass(RrRenderContext& renderContext)
    : m_renderContext(renderContext)
    , m_framebuffers(renderContext.destroyer, RrFramebufferCache::makeDestroyFunc(renderContext.ctx))
  {
  }

  RrUiPass::~RrUiPass()
  {
    RgpuContext* ctx = m_renderContext.ctx;
    RgpuDelayedResourceDestroyer& destroyer = m_renderContext.destroyer;

    m_framebuffers.clear();

    for (const FrameSlot& slot : m_slots)
    {
      if (slot.descriptorSet.handle) destroyer.enqueueDestruction(slot.descriptorSet);
      if (slot.vertexBuffer.handle) destroyer.enqueueDestruction(slot.vertexBuffer);
      if (slot.indexBuffer.handle) destroyer.enqueueDestruction(slot.indexBuffer);
    }

    if (m_fontView.handle) destroyer.enqueueDestruction(m_fontView, m_fontImage);
    if (m_pipeline.handle) destroyer.enqueueDestruction(m_pipeline);

    RgpuSampler sampler = m_fontSampler;
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

  bool RrUiPass::allocate(RgpuFormat targetFormat)
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
      RB_ERROR("failed to create UI descriptor set layout");
      return false;
    }

    for (FrameSlot& slot : m_slots)
    {
      if (!rgpuCreateDescriptorSet(ctx, m_descriptorSetLayout, &slot.descriptorSet))
      {
        RB_ERROR("failed to create UI descriptor set");
        return false;
      }

      if (!rgpuCreateBuffer(ctx, RgpuBufferCreateInfo {
                              .usage = RgpuBufferUsage::Vertex,
                              .memoryProperties = RgpuMemoryProperties::HostVisible | RgpuMemoryProperties::HostCoherent,
                              .size = VERTEX_BUFFER_SIZE,
                              .debugName = "[UI vertices]"
                            }, &slot.vertexBuffer))
      {
        RB_ERROR("failed to create UI vertex buffer");
        return false;
      }

      if (!rgpuCreateBuffer(ctx, RgpuBufferCreateInfo {
                              .usage = RgpuBufferUsage::Index,
                              .memoryProperties = RgpuMemoryProperties::HostVisible | RgpuMemoryProperties::HostCoherent,
                              .size = INDEX_BUFFER_SIZE,
                              .debugName = "[UI indices]"
                            }, &slot.indexBuffer))
      {
        RB_ERROR("failed to create UI index buffer");
        return false;
      }
    }

    if (!rgpuCreateSampler(ctx, RgpuSamplerCreateInfo{}, &m_fontSampler))
    {
      RB_ERROR("failed to create UI font sampler");
      return false;
    }

    RgpuRenderPassCreateInfo renderPassCreateInfo = {
      .attachments = {
        RgpuAttachmentInfo {
          .format = targetFormat,
          .loadOp = RgpuLoadOp::Load,
          .storeOp = RgpuStoreOp::Store,
          .initialLayout = RgpuImageLayout::PresentSrc,
          .finalLayout = RgpuImageLayout::PresentSrc
        }
      },
      .colorAttachments = { 0 }
    };

    if (!rgpuCreateRenderPass(ctx, renderPassCreateInfo, &m_renderPass))
    {
      RB_ERROR("failed to create UI render pass");
      return false;
    }

    RgpuPipelineLayoutCreateInfo pipelineLayoutCreateInfo = {
      .setLayouts = { m_descriptorSetLayout },
      .pushConstants = {
        { .stages = RgpuShaderStage::Vertex, .offset = 0, .size = 2 * sizeof(float) }
      }
    };

    if (!rgpuCreatePipelineLayout(ctx, pipelineLayoutCreateInfo, &m_pipelineLayout))
    {
      RB_ERROR("failed to create UI pipeline layout");
      return false;
    }

    RgpuShaderModule vertexShader;
    RgpuShaderModule fragmentShader;
    bool result = false;

    if (!rrLoadShaderModule(ctx, "ui.vert.spv", RgpuShaderStage::Vertex, &vertexShader))
    {
      return false;
    }

    if (!rrLoadShaderModule(ctx, "ui.frag.spv", RgpuShaderStage::Fragment, &fragmentShader))
    {
      goto cleanup_vertex;
    }

    {
      RgpuGraphicsPipelineCreateInfo pipelineCreateInfo = {
        .layout = m_pipelineLayout,
        .renderPass = m_renderPass,
        .vertexShader = vertexShader,
        .fragmentShader = fragmentShader,
        .vertexBindings = {
          { .binding = 0, .stride = sizeof(RrUiVertex) }
        },
        .vertexAttributes = {
          { .location = 0, .binding = 0, .format = RgpuFormat::R32G32Sfloat, .offset = offsetof(RrUiVertex, pos) },
          { .location = 1, .binding = 0, .format = RgpuFormat::R32G32Sfloat, .offset = offsetof(RrUiVertex, uv) },
          { .location = 2, .binding = 0, .format = RgpuFormat::R8G8B8A8Unorm, .offset = offsetof(RrUiVertex, color) }
        },
        .blend = true,
        .debugName = "[UI]"
      };

      if (!rgpuCreateGraphicsPipeline(ctx, pipelineCreateInfo, &m_pipeline))
      {
        RB_ERROR("failed to create UI pipeline");
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

  bool RrUiPass::updateFontTexture(RrUiProvider& provider)
  {
    RrUiFontTexture texture = provider.fontTexture();

    if (m_fontVersion == texture.version)
    {
      return true;
    }

    if (texture.alpha.size() != size_t(texture.width) * texture.height || texture.alpha.empty())
    {
      RB_ERROR("invalid UI font texture of size {}x{}", texture.width, texture.height);
      return false;
    }

    RgpuContext* ctx = m_renderContext.ctx;

    if (m_fontView.handle)
    {
      m_renderContext.destroyer.enqueueDestruction(m_fontView, m_fontImage);
      m_fontView = {};
      m_fontImage = {};
      m_fontVersion.reset();
    }

    std::vector<uint8_t> rgba = rrExpandAlphaToRgba(texture.alpha);

    RgpuImageCreateInfo imageCreateInfo = {
      .width = texture.width,
      .height = texture.height,
      .format = RgpuFormat::R8G8B8A8Unorm,
      .usage = RgpuImageUsage::TransferDst | RgpuImageUsage::Sampled,
      .debugName = "[UI font]"
    };

    if (!rgpuCreateImageWithData(ctx, imageCreateInfo, rgba, RgpuImageLayout::ShaderReadOnlyOptimal, &m_fontImage))
    {
      RB_ERROR("failed to create UI font image");
      return false;
    }

    if (!rgpuCreateImageView(ctx, RgpuImageViewCreateInfo{ .image = m_fontImage }, &m_fontView))
    {
      RB_ERROR("failed to create UI font view");
      rgpuDestroyImage(ctx, m_fontImage);
      m_fontImage = {};
      return false;
    }

    m_fontVersion = texture.version;
    RB_DEBUG("rebuilt UI font atlas (version {})", texture.version);
    return true;
  }

  void RrUiPass::bindFontTexture(FrameSlot& slot)
  {
    if (slot.fontVersion == m_fontVersion)
    {
      return;
    }

    std::array<RgpuDescriptorWrite, 1> writes = {
      RgpuDescriptorWrite {
        .binding = 0,
        .type = RgpuDescriptorType::CombinedImageSampler,
        .images = {
          RgpuDescriptorImageInfo{ .sampler = m_fontSampler, .view = m_fontView, .layout = RgpuImageLayout::ShaderReadOnlyOptimal }
        }
      }
    };

    rgpuUpdateDescriptorSet(m_renderContext.ctx, slot.descriptorSet, writes);
    slot.fontVersion = m_fontVersion;
  }

  RrUiPass::Output RrUiPass::draw(const Input& input,
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
    FrameSlot& slot = m_slots[frame % SLOT_COUNT];

    m_frame.vertices.clear();
    m_frame.indices.clear();
    m_frame.commands.clear();
    input.provider.tessellate(extent, m_frame);

    uint64_t vertexBytes = m_frame.vertices.size() * sizeof(RrUiVertex);
    uint64_t indexBytes = m_frame.indices.size() * sizeof(uint32_t);

    bool hasGeometry = !m_frame.commands.empty() && vertexBytes > 0 && indexBytes > 0;
    if (vertexBytes > VERTEX_BUFFER_SIZE || indexBytes > INDEX_BUFFER_SIZE)
    {
      RB_WARN("UI geometry exceeds buffer capacity; skipping");
      hasGeometry = false;
    }

    bool hasFont = updateFontTexture(input.provider);
    if (hasFont)
    {
      bindFontTexture(slot);
    }

    const RrFramebufferEntry* framebuffer = m_framebuffers.get(input.target, [&](RgpuImage image, RrFramebufferEntry* entry) {
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

    RgpuEncoder encoder = renderContext.queue.createEncoder(arena);

    if (framebuffer && hasFont && hasGeometry)
    {
      rgpuWriteBuffer(ctx, slot.vertexBuffer, 0, { (const uint8_t*) m_frame.vertices.data(), vertexBytes });
      rgpuWriteBuffer(ctx, slot.indexBuffer, 0, { (const uint8_t*) m_frame.indices.data(), indexBytes });

      std::array<RgpuClearValue, 1> clears = { rgpuClearColor(0.0f, 0.0f, 0.0f, 0.0f) };
      std::array<RgpuDescriptorSet, 1> descriptorSets = { slot.descriptorSet };
      std::array<RgpuVertexBufferBinding, 1> vertexBuffers = { RgpuVertexBufferBinding{ .buffer = slot.vertexBuffer } };
      float screenSize[2] = { float(extent.width), float(extent.height) };

      encoder.beginRenderPass(m_renderPass, framebuffer->framebuffer, clears);
      encoder.bindGraphicsPipeline(m_pipeline);
      encoder.bindDescriptorSets(RgpuPipelineBindPoint::Graphics, m_pipelineLayout, 0, descriptorSets);
      encoder.bindVertexBuffers(0, vertexBuffers);
      encoder.bindIndexBuffer(slot.indexBuffer, 0, RgpuIndexType::Uint32);
      encoder.setViewport(RgpuViewport{ .x = 0.0f, .y = 0.0f, .width = float(extent.width), .height = float(extent.height) });
      encoder.pushConstants(m_pipelineLayout, RgpuShaderStage::Vertex, 0, { (const uint8_t*) screenSize, sizeof(screenSize) });

      for (const RrUiDrawCommand& command : m_frame.commands)
      {
        RgpuRect2D scissor = rrComputeUiScissor(command, extent);
        if (scissor.width == 0 || scissor.height == 0)
        {
          continue;
        }

        encoder.setScissor(scissor);
        encoder.drawIndexed({ command.firstIndex, command.firstIndex + command.indexCount }, command.vertexOffset, { 0, 1 });
      }

      encoder.endRenderPass();
    }

    renderContext.queue.submit(std::move(encoder).finish(ctx), waits, signals, fence);

    return Output{};
  }
}
