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

#include <array>
#include <optional>
#include <span>
#include <vector>

namespace rdx
{
  struct RrCamera;
  struct RrRenderContext;

  struct RrUiVertex
  {
    float pos[2];
    float uv[2];
    uint8_t color[4]; // premultiplied sRGBA
  };
  static_assert(sizeof(RrUiVertex) == 20);

  struct RrUiDrawCommand
  {
    float clipMin[2]; // in pixels
    float clipMax[2];
    uint32_t firstIndex;
    uint32_t indexCount;
    int32_t vertexOffset;
  };

  struct RrUiFrame
  {
    std::vector<RrUiVertex> vertices;
    std::vector<uint32_t> indices;
    std::vector<RrUiDrawCommand> commands;
  };

  struct RrUiFontTexture
  {
    uint32_t width;
    uint32_t height;
    std::span<const uint8_t> alpha; // one byte per texel
    uint64_t version;
  };

  // Immediate mode UI toolkit adapter. Layout happens on the toolkit's side;
  // the pass only consumes tessellated meshes and the font atlas.
  class RrUiProvider
  {
  public:
    virtual ~RrUiProvider() = default;

  public:
    virtual RrUiFontTexture fontTexture() = 0;

    virtual void tessellate(RgpuExtent2D screenSize, RrUiFrame& frame) = 0;
  };

  // Clip rectangle clamped to the target. Zero-sized when nothing is visible.
  RgpuRect2D rrComputeUiScissor(const RrUiDrawCommand& command, RgpuExtent2D extent);

  std::vector<uint8_t> rrExpandAlphaToRgba(std::span<const uint8_t> alpha);

  // Draws UI meshes on top of the target's current contents.
  class RrUiPass
  {
  public:
    constexpr static uint32_t SLOT_COUNT = 2;
    constexpr static uint64_t VERTEX_BUFFER_SIZE = 4 * 1024 * 1024;
    constexpr static uint64_t INDEX_BUFFER_SIZE = 2 * 1024 * 1024;

    struct Input
    {
      RgpuImage target; // in PRESENT_SRC
      RrUiProvider& provider;
    };

    struct Output
    {
    };

  public:
    explicit RrUiPass(RrRenderContext& renderContext);

    RrUiPass(const RrUiPass&) = delete;
    RrUiPass& operator=(const RrUiPass&) = delete;

    ~RrUiPass();

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
    struct FrameSlot
    {
      RgpuBuffer vertexBuffer;
      RgpuBuffer indexBuffer;
      RgpuDescriptorSet descriptorSet;
      std::optional<uint64_t> fontVersion;
    };

    bool updateFontTexture(RrUiProvider& provider);

    void bindFontTexture(FrameSlot& slot);

  private:
    RrRenderContext& m_renderContext;
    RgpuRenderPass m_renderPass;
    RgpuDescriptorSetLayout m_descriptorSetLayout;
    RgpuPipelineLayout m_pipelineLayout;
    RgpuPipeline m_pipeline;
    RgpuSampler m_fontSampler;
    RgpuImage m_fontImage;
    RgpuImageView m_fontView;
    std::optional<uint64_t> m_fontVersion;
    std::array<FrameSlot, SLOT_COUNT> m_slots = {};
    RrUiFrame m_frame;
    RrFramebufferCache m_framebuffers;
  };
}
