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
#include <rdx/rr/SampledImageBinding.h>
#include <rdx/rgpu/Queue.h>

#include <array>
#include <span>

namespace rdx
{
  struct RrCamera;
  struct RrRenderContext;

  // Resolves a floating point image into the presentable target.
  class RrTonemapPass
  {
  public:
    constexpr static uint32_t SLOT_COUNT = 2;

    struct Input
    {
      RgpuImage initialImage; // in SHADER_READ_ONLY_OPTIMAL
      RgpuImage finalImage;
    };

    struct Output
    {
    };

  public:
    explicit RrTonemapPass(RrRenderContext& renderContext);

    RrTonemapPass(const RrTonemapPass&) = delete;
    RrTonemapPass& operator=(const RrTonemapPass&) = delete;

    ~RrTonemapPass();

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
    bool bindInput(uint32_t slot, RgpuImage image);

  private:
    RrRenderContext& m_renderContext;
    RgpuRenderPass m_renderPass;
    RgpuDescriptorSetLayout m_descriptorSetLayout;
    RgpuPipelineLayout m_pipelineLayout;
    RgpuPipeline m_pipeline;
    RgpuSampler m_sampler;
    std::array<RgpuDescriptorSet, SLOT_COUNT> m_descriptorSets = {};
    std::array<RrSampledImageBinding, SLOT_COUNT> m_inputBindings;
    RrFramebufferCache m_framebuffers;
  };
}
