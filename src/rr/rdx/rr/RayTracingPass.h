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
#include <rdx/rgpu/Queue.h>

#include <array>
#include <map>
#include <span>

#include <glm/glm.hpp>

namespace rdx
{
  struct RrCamera;
  struct RrRenderContext;

  // Builds a TLAS over all loaded BLASes and traces primary rays into a
  // floating point image. TLAS, instance and uniform buffers are
  // double-buffered so that the next frame can be recorded while the
  // previous one is in flight.
  class RrRayTracingPass
  {
  public:
    constexpr static uint32_t MAX_INSTANCE_COUNT = 2048;
    constexpr static uint32_t SLOT_COUNT = 2;
    constexpr static RgpuFormat OUTPUT_FORMAT = RgpuFormat::R32G32B32A32Sfloat;

    struct Globals
    {
      glm::mat4 view;
      glm::mat4 proj;
      glm::mat4 viewInverse;
      glm::mat4 projInverse;
      glm::vec4 color;
    };

    struct Input
    {
      const std::map<uint32_t, RrBlas>& blases;
    };

    struct Output
    {
      RgpuAccelerationStructure tlas;
      RgpuImage outputImage;
    };

  public:
    explicit RrRayTracingPass(RrRenderContext& renderContext);

    RrRayTracingPass(const RrRayTracingPass&) = delete;
    RrRayTracingPass& operator=(const RrRayTracingPass&) = delete;

    ~RrRayTracingPass();

    bool allocate(RgpuExtent2D extent);

    // No frame may be in flight.
    bool resize(RgpuExtent2D extent);

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
      RgpuBuffer instanceBuffer;
      RgpuBuffer globalsBuffer;
      RgpuBuffer tlasBuffer;
      RgpuBuffer scratchBuffer;
      RgpuAccelerationStructure tlas;
      RgpuDescriptorSet descriptorSet;
    };

    bool allocateSlot(FrameSlot& slot, const RgpuAsBuildSizes& tlasSizes);

    bool createOutputImage(RgpuExtent2D extent);

    void writeDescriptorSets();

  private:
    RrRenderContext& m_renderContext;
    RgpuDescriptorSetLayout m_descriptorSetLayout;
    RgpuPipelineLayout m_pipelineLayout;
    RgpuPipeline m_pipeline;
    RgpuShaderBindingTable m_sbt;
    RgpuImage m_outputImage;
    RgpuImageView m_outputView;
    RgpuExtent2D m_extent = { 0, 0 };
    std::array<FrameSlot, SLOT_COUNT> m_slots = {};
  };
}
