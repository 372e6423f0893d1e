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

#include "rdx/rr/RayTracingPass.h"

#include <rdx/rr/Camera.h>
#include <rdx/rr/RenderContext.h>
#include <rdx/rgpu/DelayedResourceDestroyer.h>
#include <rdx/rb/Log.h>

#include <iterator>
#include <vector>

namespace rdx
{
  namespace
  {
    constexpr RgpuAsBuildFlags TLAS_BUILD_FLAGS = RgpuAsBuildFlags::PreferFastBuild;

    constexpr uint32_t GROUP_RAYGEN = 0;
    constexpr uint32_t GROUP_MISS = 1;
    constexpr uint32_t GROUP_HIT = 2;
  }

  RrRayTracingPass::RrRayTracingPass(RrRenderContext& renderContext)
    : m_renderContext(renderContext)
  {
  }

  RrRayTracingPass::~RrRayTracingPass()
  {
    RgpuContext* ctx = m_renderContext.ctx;
    RgpuDelayedResourceDestroyer& destroyer = m_renderContext.destroyer;

    for (const FrameSlot& slot : m_slots)
    {
      if (slot.descriptorSet.handle) destroyer.enqueueDestruction(slot.descriptorSet);
      if (slot.tlas.handle) destroyer.enqueueDestruction(slot.tlas);
      if (slot.tlasBuffer.handle) destroyer.enqueueDestruction(slot.tlasBuffer);
      if (slot.scratchBuffer.handle) destroyer.enqueueDestruction(slot.scratchBuffer);
      if (slot.globalsBuffer.handle) destroyer.enqueueDestruction(slot.globalsBuffer);
      if (slot.instanceBuffer.handle) destroyer.enqueueDestruction(slot.instanceBuffer);
    }

    if (m_outputView.handle) destroyer.enqueueDestruction(m_outputView);
    if (m_outputImage.handle) destroyer.enqueueDestruction(m_outputImage);
    if (m_pipeline.handle) destroyer.enqueueDestruction(m_pipeline);

    RgpuShaderBindingTable sbt = m_sbt;
    RgpuPipelineLayout pipelineLayout = m_pipelineLayout;
    RgpuDescriptorSetLayout descriptorSetLayout = m_descriptorSetLayout;
    destroyer.enqueueDestruction([ctx, sbt, pipelineLayout, descriptorSetLayout]() {
      if (sbt.buffer.handle) rgpuDestroyShaderBindingTable(ctx, sbt);
      if (pipelineLayout.handle) rgpuDestroyPipelineLayout(ctx, pipelineLayout);
      if (descriptorSetLayout.handle) rgpuDestroyDescriptorSetLayout(ctx, descriptorSetLayout);
    });
  }

  bool RrRayTracingPass::allocate(RgpuExtent2D extent)
  {
    RgpuContext* ctx = m_renderContext.ctx;

    RgpuDescriptorSetLayoutCreateInfo layoutCreateInfo = {
      .bindings = {
        { .binding = 0, .type = RgpuDescriptorType::AccelerationStructure, .stages = RgpuShaderStage::RayGen | RgpuShaderStage::ClosestHit },
        { .binding = 1, .type = RgpuDescriptorType::StorageImage, .stages = RgpuShaderStage::RayGen },
        { .binding = 2, .type = RgpuDescriptorType::UniformBuffer, .stages = RgpuShaderStage::RayGen | RgpuShaderStage::ClosestHit | RgpuShaderStage::Miss }
      }
    };

    if (!rgpuCreateDescriptorSetLayout(ctx, layoutCreateInfo, &m_descriptorSetLayout))
    {
      RB_ERROR("failed to create ray tracing descriptor set layout");
      return false;
    }

    RgpuPipelineLayoutCreateInfo pipelineLayoutCreateInfo = {
      .setLayouts = { m_descriptorSetLayout }
    };

    if (!rgpuCreatePipelineLayout(ctx, pipelineLayoutCreateInfo, &m_pipelineLayout))
    {
      RB_ERROR("failed to create ray tracing pipeline layout");
      return false;
    }

    {
      struct ShaderFile
      {
        const char* name;
        RgpuShaderStage stage;
      };

      const ShaderFile shaderFiles[] = {
        { "raytrace.rgen.spv", RgpuShaderStage::RayGen },
        { "raytrace.rmiss.spv", RgpuShaderStage::Miss },
        { "raytrace.rchit.spv", RgpuShaderStage::ClosestHit }
      };

      std::vector<RgpuShaderModule> shaders;
      for (const ShaderFile& file : shaderFiles)
      {
        RgpuShaderModule shader;
        if (!rrLoadShaderModule(ctx, file.name, file.stage, &shader))
        {
          break;
        }
        shaders.push_back(shader);
      }

      bool pipelineCreated = false;
      if (shaders.size() == std::size(shaderFiles))
      {
        RgpuRayTracingPipelineCreateInfo pipelineCreateInfo = {
          .layout = m_pipelineLayout,
          .shaders = shaders,
          .groups = {
            { .type = RgpuShaderGroupType::General, .generalShader = 0 },
            { .type = RgpuShaderGroupType::General, .generalShader = 1 },
            { .type = RgpuShaderGroupType::TrianglesHit, .closestHitShader = 2 }
          },
          .maxRecursionDepth = 2,
          .debugName = "[RayTracing]"
        };

        pipelineCreated = rgpuCreateRayTracingPipeline(ctx, pipelineCreateInfo, &m_pipeline);
      }

      for (RgpuShaderModule shader : shaders)
      {
        rgpuDestroyShaderModule(ctx, shader);
      }

      if (!pipelineCreated)
      {
        RB_ERROR("failed to create ray tracing pipeline");
        return false;
      }
    }

    RgpuShaderBindingTableCreateInfo sbtCreateInfo = {
      .raygenGroup = GROUP_RAYGEN,
      .missGroups = { GROUP_MISS },
      .hitGroups = { GROUP_HIT }
    };

    if (!rgpuCreateShaderBindingTable(ctx, m_pipeline, sbtCreateInfo, &m_sbt))
    {
      RB_ERROR("failed to create shader binding table");
      return false;
    }

    std::array<RgpuAsGeometryDesc, 1> tlasDescs = {
      RgpuAsInstancesDesc{ .maxPrimitiveCount = MAX_INSTANCE_COUNT }
    };

    RgpuAsBuildSizes tlasSizes;
    rgpuGetAccelerationStructureBuildSizes(ctx, RgpuAccelerationStructureLevel::Top, TLAS_BUILD_FLAGS, tlasDescs, &tlasSizes);

    for (FrameSlot& slot : m_slots)
    {
      if (!allocateSlot(slot, tlasSizes))
      {
        return false;
      }
    }

    if (!createOutputImage(extent))
    {
      return false;
    }

    writeDescriptorSets();
    return true;
  }

  bool RrRayTracingPass::allocateSlot(FrameSlot& slot, const RgpuAsBuildSizes& tlasSizes)
  {
    RgpuContext* ctx = m_renderContext.ctx;
    const RgpuDeviceProperties& properties = rgpuGetDeviceProperties(ctx);

    if (!rgpuCreateBuffer(ctx, RgpuBufferCreateInfo {
                            .usage = RgpuBufferUsage::AccelerationStructureBuildInput | RgpuBufferUsage::ShaderDeviceAddress,
                            .memoryProperties = RgpuMemoryProperties::HostVisible | RgpuMemoryProperties::HostCoherent,
                            .size = uint64_t(MAX_INSTANCE_COUNT) * RGPU_AS_INSTANCE_SIZE,
                            .alignment = 16,
                            .debugName = "[TLAS instances]"
                          }, &slot.instanceBuffer))
    {
      RB_ERROR("failed to create TLAS instance buffer");
      return false;
    }

    if (!rgpuCreateBuffer(ctx, RgpuBufferCreateInfo {
                            .usage = RgpuBufferUsage::Uniform | RgpuBufferUsage::TransferDst,
                            .memoryProperties = RgpuMemoryProperties::DeviceLocal,
                            .size = sizeof(Globals),
                            .debugName = "[Globals]"
                          }, &slot.globalsBuffer))
    {
      RB_ERROR("failed to create globals buffer");
      return false;
    }

    if (!rgpuCreateBuffer(ctx, RgpuBufferCreateInfo {
                            .usage = RgpuBufferUsage::AccelerationStructureStorage | RgpuBufferUsage::ShaderDeviceAddress,
                            .memoryProperties = RgpuMemoryProperties::DeviceLocal,
                            .size = tlasSizes.accelerationStructureSize,
                            .debugName = "[TLAS storage]"
                          }, &slot.tlasBuffer))
    {
      RB_ERROR("failed to create TLAS storage buffer");
      return false;
    }

    if (!rgpuCreateBuffer(ctx, RgpuBufferCreateInfo {
                            .usage = RgpuBufferUsage::Storage | RgpuBufferUsage::ShaderDeviceAddress,
                            .memoryProperties = RgpuMemoryProperties::DeviceLocal,
                            .size = tlasSizes.buildScratchSize,
                            .alignment = properties.minAccelerationStructureScratchOffsetAlignment,
                            .debugName = "[TLAS scratch]"
                          }, &slot.scratchBuffer))
    {
      RB_ERROR("failed to create TLAS scratch buffer");
      return false;
    }

    if (!rgpuCreateAccelerationStructure(ctx, RgpuAccelerationStructureCreateInfo {
                                           .level = RgpuAccelerationStructureLevel::Top,
                                           .region = RgpuBufferRegion{ .buffer = slot.tlasBuffer, .size = tlasSizes.accelerationStructureSize }
                                         }, &slot.tlas))
    {
      RB_ERROR("failed to create TLAS");
      return false;
    }

    if (!rgpuCreateDescriptorSet(ctx, m_descriptorSetLayout, &slot.descriptorSet))
    {
      RB_ERROR("failed to create ray tracing descriptor set");
      return false;
    }

    return true;
  }

  bool RrRayTracingPass::createOutputImage(RgpuExtent2D extent)
  {
    RgpuContext* ctx = m_renderContext.ctx;

    RgpuImageCreateInfo imageCreateInfo = {
      .width = extent.width,
      .height = extent.height,
      .format = OUTPUT_FORMAT,
      .usage = RgpuImageUsage::Storage | RgpuImageUsage::Sampled,
      .debugName = "[RayTracing output]"
    };

    if (!rgpuCreateImage(ctx, imageCreateInfo, &m_outputImage))
    {
      RB_ERROR("failed to create ray tracing output image");
      return false;
    }

    if (!rgpuCreateImageView(ctx, RgpuImageViewCreateInfo{ .image = m_outputImage }, &m_outputView))
    {
      RB_ERROR("failed to create ray tracing output view");
      rgpuDestroyImage(ctx, m_outputImage);
      m_outputImage = {};
      return false;
    }

    m_extent = extent;
    return true;
  }

  void RrRayTracingPass::writeDescriptorSets()
  {
    for (const FrameSlot& slot : m_slots)
    {
      std::array<RgpuDescriptorWrite, 3> writes = {
        RgpuDescriptorWrite {
          .binding = 0,
          .type = RgpuDescriptorType::AccelerationStructure,
          .accelerationStructures = { slot.tlas }
        },
        RgpuDescriptorWrite {
          .binding = 1,
          .type = RgpuDescriptorType::StorageImage,
          .images = { RgpuDescriptorImageInfo{ .view = m_outputView, .layout = RgpuImageLayout::General } }
        },
        RgpuDescriptorWrite {
          .binding = 2,
          .type = RgpuDescriptorType::UniformBuffer,
          .buffers = { RgpuDescriptorBufferInfo{ .buffer = slot.globalsBuffer } }
        }
      };

      rgpuUpdateDescriptorSet(m_renderContext.ctx, slot.descriptorSet, writes);
    }
  }

  bool RrRayTracingPass::resize(RgpuExtent2D extent)
  {
    if (extent == m_extent)
    {
      return true;
    }

    m_renderContext.destroyer.enqueueDestruction(m_outputView, m_outputImage);
    m_outputView = {};
    m_outputImage = {};

    if (!createOutputImage(extent))
    {
      return false;
    }

    writeDescriptorSets();
    return true;
  }

  RrRayTracingPass::Output RrRayTracingPass::draw(const Input& input,
                                                  uint64_t frame,
                                                  std::span<const RgpuSemaphoreWait> waits,
                                                  std::span<const RgpuSemaphore> signals,
                                                  std::optional<RgpuFence> fence,
                                                  RrRenderContext& renderContext,
                                                  RbArena& arena,
                                                  const RrCamera& camera)
  {
    RgpuContext* ctx = renderContext.ctx;
    const FrameSlot& slot = m_slots[frame % SLOT_COUNT];

    // Instances
    uint32_t instanceCount = 0;
    {
      std::span<uint8_t> instanceData = arena.allocArray<uint8_t>(input.blases.size() * RGPU_AS_INSTANCE_SIZE);

      for (const auto& [meshId, blas] : input.blases)
      {
        if (instanceCount == MAX_INSTANCE_COUNT)
        {
          RB_WARN("instance limit of {} reached", MAX_INSTANCE_COUNT);
          break;
        }

        RgpuAsInstance instance = {
          .transform = {
            { 1.0f, 0.0f, 0.0f, 0.0f },
            { 0.0f, 1.0f, 0.0f, 0.0f },
            { 0.0f, 0.0f, 1.0f, 0.0f }
          },
          .customIndex = meshId,
          .flags = RgpuAsInstanceFlags::TriangleFacingCullDisable,
          .blasAddress = blas.address
        };

        rgpuPackAccelerationStructureInstance(instance, &instanceData[instanceCount * RGPU_AS_INSTANCE_SIZE]);
        instanceCount++;
      }

      if (instanceCount > 0)
      {
        rgpuWriteBuffer(ctx, slot.instanceBuffer, 0, instanceData.subspan(0, instanceCount * RGPU_AS_INSTANCE_SIZE));
      }
    }

    // Globals
    float aspectRatio = float(m_extent.width) / float(m_extent.height);
    glm::mat4 view = rrGetCameraView(camera);
    glm::mat4 proj = rrGetCameraProjection(camera, aspectRatio);

    Globals globals = {
      .view = view,
      .proj = proj,
      .viewInverse = glm::inverse(view),
      .projInverse = glm::inverse(proj),
      .color = glm::vec4(0.8f, 0.0f, 0.0f, 1.0f)
    };

    RgpuEncoder encoder = renderContext.queue.createEncoder(arena);

    encoder.pipelineBarrier(RgpuPipelineStage::AccelerationStructureBuild,
                            RgpuPipelineStage::AccelerationStructureBuild,
                            RgpuAccess::AccelerationStructureWrite,
                            RgpuAccess::AccelerationStructureRead);

    std::array<RgpuAsGeometry, 1> geometries = {
      RgpuAsInstances {
        .flags = RgpuGeometryFlags::Opaque,
        .instanceAddress = rgpuGetBufferAddress(ctx, slot.instanceBuffer),
        .primitiveCount = instanceCount
      }
    };

    std::array<RgpuAsBuildInfo, 1> buildInfos = {
      RgpuAsBuildInfo {
        .dst = slot.tlas,
        .flags = TLAS_BUILD_FLAGS,
        .geometries = geometries,
        .scratchAddress = rgpuGetBufferAddress(ctx, slot.scratchBuffer)
      }
    };

    encoder.buildAccelerationStructure(buildInfos);

    encoder.updateBuffer(slot.globalsBuffer, 0, { (const uint8_t*) &globals, sizeof(Globals) });

    encoder.pipelineBarrier(RgpuPipelineStage::Transfer,
                            RgpuPipelineStage::RayTracingShader,
                            RgpuAccess::TransferWrite,
                            RgpuAccess::UniformRead);

    std::array<RgpuImageBarrier, 1> toGeneral = {
      RgpuImageBarrier{ .image = m_outputImage, .oldLayout = std::nullopt, .newLayout = RgpuImageLayout::General }
    };

    encoder.pipelineBarrier(RgpuPipelineStage::FragmentShader,
                            RgpuPipelineStage::RayTracingShader,
                            RgpuAccess::ShaderRead,
                            RgpuAccess::ShaderWrite,
                            toGeneral);

    encoder.pipelineBarrier(RgpuPipelineStage::AccelerationStructureBuild,
                            RgpuPipelineStage::RayTracingShader,
                            RgpuAccess::AccelerationStructureWrite,
                            RgpuAccess::AccelerationStructureRead);

    encoder.bindRayTracingPipeline(m_pipeline);

    std::array<RgpuDescriptorSet, 1> descriptorSets = { slot.descriptorSet };
    encoder.bindDescriptorSets(RgpuPipelineBindPoint::RayTracing, m_pipelineLayout, 0, descriptorSets);

    encoder.traceRays(m_sbt, m_extent.width, m_extent.height);

    std::array<RgpuImageBarrier, 1> toShaderRead = {
      RgpuImageBarrier{ .image = m_outputImage, .oldLayout = RgpuImageLayout::General, .newLayout = RgpuImageLayout::ShaderReadOnlyOptimal }
    };

    encoder.pipelineBarrier(RgpuPipelineStage::RayTracingShader,
                            RgpuPipelineStage::FragmentShader,
                            RgpuAccess::ShaderWrite,
                            RgpuAccess::ShaderRead,
                            toShaderRead);

    renderContext.queue.submit(std::move(encoder).finish(ctx), waits, signals, fence);

    return Output{ .tlas = slot.tlas, .outputImage = m_outputImage };
  }
}
