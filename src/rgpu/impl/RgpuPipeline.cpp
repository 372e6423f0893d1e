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

#include "Internal.h"

#include <string.h>
#include <string>

#include <rdx/rb/Data.h>

namespace rdx
{
  constexpr static const char* RGPU_SHADER_ENTRY_POINT = "main";

  static VkPipelineShaderStageCreateInfo rgpuMakeStageCreateInfo(VkShaderStageFlagBits stage, VkShaderModule module)
  {
    return VkPipelineShaderStageCreateInfo {
      .sType = VK_STRUCTURE_TYPE_PIPELINE_SHADER_STAGE_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .stage = stage,
      .module = module,
      .pName = RGPU_SHADER_ENTRY_POINT,
      .pSpecializationInfo = nullptr,
    };
  }

  static bool rgpuCheckPipelineShader(const RgpuIShaderModule* ishader, const RgpuIPipelineLayout* ilayout)
  {
    std::string error;
    if (!rgpuCheckShaderInterface(ishader->reflection, ilayout->shaderInterface, &error))
    {
      RB_ERROR("shader does not match pipeline layout: {}", error);
      return false;
    }
    return true;
  }

  bool rgpuCreateGraphicsPipeline(RgpuContext* ctx,
                                  const RgpuGraphicsPipelineCreateInfo& createInfo,
                                  RgpuPipeline* pipeline)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_PIPELINE_LAYOUT(ctx, createInfo.layout, ilayout);
    RGPU_RESOLVE_RENDER_PASS(ctx, createInfo.renderPass, irenderPass);
    RGPU_RESOLVE_SHADER_MODULE(ctx, createInfo.vertexShader, ivertexShader);
    RGPU_RESOLVE_SHADER_MODULE(ctx, createInfo.fragmentShader, ifragmentShader);

    if (ivertexShader->stage != RgpuShaderStage::Vertex || ifragmentShader->stage != RgpuShaderStage::Fragment)
    {
      RGPU_RETURN_ERROR("graphics pipeline shader stage mismatch");
    }

    if (!rgpuCheckPipelineShader(ivertexShader, ilayout) || !rgpuCheckPipelineShader(ifragmentShader, ilayout))
    {
      return false;
    }

    VkPipelineShaderStageCreateInfo stages[] = {
      rgpuMakeStageCreateInfo(VK_SHADER_STAGE_VERTEX_BIT, ivertexShader->module),
      rgpuMakeStageCreateInfo(VK_SHADER_STAGE_FRAGMENT_BIT, ifragmentShader->module)
    };

    std::vector<VkVertexInputBindingDescription> vertexBindings;
    for (const RgpuVertexBinding& b : createInfo.vertexBindings)
    {
      vertexBindings.push_back({ b.binding, b.stride, VK_VERTEX_INPUT_RATE_VERTEX });
    }

    std::vector<VkVertexInputAttributeDescription> vertexAttributes;
    for (const RgpuVertexAttribute& a : createInfo.vertexAttributes)
    {
      vertexAttributes.push_back({ a.location, a.binding, (VkFormat) a.format, a.offset });
    }

    VkPipelineVertexInputStateCreateInfo vertexInputState = {
      .sType = VK_STRUCTURE_TYPE_PIPELINE_VERTEX_INPUT_STATE_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .vertexBindingDescriptionCount = (uint32_t) vertexBindings.size(),
      .pVertexBindingDescriptions = vertexBindings.data(),
      .vertexAttributeDescriptionCount = (uint32_t) vertexAttributes.size(),
      .pVertexAttributeDescriptions = vertexAttributes.data(),
    };

    VkPipelineInputAssemblyStateCreateInfo inputAssemblyState = {
      .sType = VK_STRUCTURE_TYPE_PIPELINE_INPUT_ASSEMBLY_STATE_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST,
      .primitiveRestartEnable = VK_FALSE,
    };

    // Viewport and scissor are dynamic.
    VkPipelineViewportStateCreateInfo viewportState = {
      .sType = VK_STRUCTURE_TYPE_PIPELINE_VIEWPORT_STATE_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .viewportCount = 1,
      .pViewports = nullptr,
      .scissorCount = 1,
      .pScissors = nullptr,
    };

    VkPipelineRasterizationStateCreateInfo rasterizationState = {
      .sType = VK_STRUCTURE_TYPE_PIPELINE_RASTERIZATION_STATE_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .depthClampEnable = VK_FALSE,
      .rasterizerDiscardEnable = VK_FALSE,
      .polygonMode = VK_POLYGON_MODE_FILL,
      .cullMode = (VkCullModeFlags) createInfo.cullMode,
      .frontFace = (VkFrontFace) createInfo.frontFace,
      .depthBiasEnable = VK_FALSE,
      .depthBiasConstantFactor = 0.0f,
      .depthBiasClamp = 0.0f,
      .depthBiasSlopeFactor = 0.0f,
      .lineWidth = 1.0f,
    };

    VkPipelineMultisampleStateCreateInfo multisampleState = {
      .sType = VK_STRUCTURE_TYPE_PIPELINE_MULTISAMPLE_STATE_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .rasterizationSamples = VK_SAMPLE_COUNT_1_BIT,
      .sampleShadingEnable = VK_FALSE,
      .minSampleShading = 0.0f,
      .pSampleMask = nullptr,
      .alphaToCoverageEnable = VK_FALSE,
      .alphaToOneEnable = VK_FALSE,
    };

    VkPipelineDepthStencilStateCreateInfo depthStencilState = {
      .sType = VK_STRUCTURE_TYPE_PIPELINE_DEPTH_STENCIL_STATE_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .depthTestEnable = createInfo.depthTest ? VK_TRUE : VK_FALSE,
      .depthWriteEnable = createInfo.depthTest ? VK_TRUE : VK_FALSE,
      .depthCompareOp = VK_COMPARE_OP_LESS_OR_EQUAL,
      .depthBoundsTestEnable = VK_FALSE,
      .stencilTestEnable = VK_FALSE,
      .front = {},
      .back = {},
      .minDepthBounds = 0.0f,
      .maxDepthBounds = 1.0f,
    };

    VkPipelineColorBlendAttachmentState blendAttachment = {
      .blendEnable = createInfo.blend ? VK_TRUE : VK_FALSE,
      .srcColorBlendFactor = VK_BLEND_FACTOR_ONE,
      .dstColorBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA,
      .colorBlendOp = VK_BLEND_OP_ADD,
      .srcAlphaBlendFactor = VK_BLEND_FACTOR_ONE,
      .dstAlphaBlendFactor = VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA,
      .alphaBlendOp = VK_BLEND_OP_ADD,
      .colorWriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
                        VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT,
    };

    std::vector<VkPipelineColorBlendAttachmentState> blendAttachments(irenderPass->colorAttachmentCount, blendAttachment);

    VkPipelineColorBlendStateCreateInfo colorBlendState = {
      .sType = VK_STRUCTURE_TYPE_PIPELINE_COLOR_BLEND_STATE_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .logicOpEnable = VK_FALSE,
      .logicOp = VK_LOGIC_OP_COPY,
      .attachmentCount = (uint32_t) blendAttachments.size(),
      .pAttachments = blendAttachments.data(),
      .blendConstants = { 0.0f, 0.0f, 0.0f, 0.0f },
    };

    VkDynamicState dynamicStates[] = {
      VK_DYNAMIC_STATE_VIEWPORT,
      VK_DYNAMIC_STATE_SCISSOR
    };

    VkPipelineDynamicStateCreateInfo dynamicState = {
      .sType = VK_STRUCTURE_TYPE_PIPELINE_DYNAMIC_STATE_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .dynamicStateCount = 2,
      .pDynamicStates = dynamicStates,
    };

    VkGraphicsPipelineCreateInfo pipelineCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_GRAPHICS_PIPELINE_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .stageCount = 2,
      .pStages = stages,
      .pVertexInputState = &vertexInputState,
      .pInputAssemblyState = &inputAssemblyState,
      .pTessellationState = nullptr,
      .pViewportState = &viewportState,
      .pRasterizationState = &rasterizationState,
      .pMultisampleState = &multisampleState,
      .pDepthStencilState = &depthStencilState,
      .pColorBlendState = &colorBlendState,
      .pDynamicState = &dynamicState,
      .layout = ilayout->layout,
      .renderPass = irenderPass->renderPass,
      .subpass = createInfo.subpass,
      .basePipelineHandle = VK_NULL_HANDLE,
      .basePipelineIndex = -1,
    };

    uint64_t handle = rgpuStoreAllocate(ctx, ctx->ipipelineStore);

    RGPU_RESOLVE_PIPELINE(ctx, { handle }, ipipeline);

    VkResult result = idevice->table.vkCreateGraphicsPipelines(
      idevice->logicalDevice,
      idevice->pipelineCache,
      1,
      &pipelineCreateInfo,
      nullptr,
      &ipipeline->pipeline
    );

    if (result != VK_SUCCESS)
    {
      rgpuStoreFree(ctx, ctx->ipipelineStore, handle);
      RGPU_RETURN_ERROR("failed to create graphics pipeline");
    }

    rgpuSetObjectName(ctx, VK_OBJECT_TYPE_PIPELINE, (uint64_t) ipipeline->pipeline, createInfo.debugName);

    ipipeline->bindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS;
    ipipeline->groupCount = 0;

    pipeline->handle = handle;
    return true;
  }

  bool rgpuCreateRayTracingPipeline(RgpuContext* ctx,
                                    const RgpuRayTracingPipelineCreateInfo& createInfo,
                                    RgpuPipeline* pipeline)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_PIPELINE_LAYOUT(ctx, createInfo.layout, ilayout);

    if (createInfo.maxRecursionDepth > idevice->properties.maxRayRecursionDepth)
    {
      RGPU_RETURN_ERROR("ray recursion depth exceeds device limit");
    }

    std::vector<VkPipelineShaderStageCreateInfo> stages;
    stages.reserve(createInfo.shaders.size());

    for (RgpuShaderModule shader : createInfo.shaders)
    {
      RGPU_RESOLVE_SHADER_MODULE(ctx, shader, ishader);

      if (!rgpuCheckPipelineShader(ishader, ilayout))
      {
        return false;
      }

      stages.push_back(rgpuMakeStageCreateInfo((VkShaderStageFlagBits) ishader->stage, ishader->module));
    }

    const auto isValidShaderIndex = [&](uint32_t index) {
      return index == RGPU_SHADER_UNUSED || index < stages.size();
    };

    std::vector<VkRayTracingShaderGroupCreateInfoKHR> groups;
    groups.reserve(createInfo.groups.size());

    for (const RgpuRayTracingShaderGroup& group : createInfo.groups)
    {
      if (!isValidShaderIndex(group.generalShader) ||
          !isValidShaderIndex(group.closestHitShader) ||
          !isValidShaderIndex(group.anyHitShader))
      {
        RGPU_RETURN_ERROR("shader group references unknown shader");
      }

      groups.push_back(VkRayTracingShaderGroupCreateInfoKHR {
        .sType = VK_STRUCTURE_TYPE_RAY_TRACING_SHADER_GROUP_CREATE_INFO_KHR,
        .pNext = nullptr,
        .type = group.type == RgpuShaderGroupType::General ?
          VK_RAY_TRACING_SHADER_GROUP_TYPE_GENERAL_KHR : VK_RAY_TRACING_SHADER_GROUP_TYPE_TRIANGLES_HIT_GROUP_KHR,
        .generalShader = group.generalShader,
        .closestHitShader = group.closestHitShader,
        .anyHitShader = group.anyHitShader,
        .intersectionShader = VK_SHADER_UNUSED_KHR,
        .pShaderGroupCaptureReplayHandle = nullptr,
      });
    }

    VkRayTracingPipelineCreateInfoKHR pipelineCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_RAY_TRACING_PIPELINE_CREATE_INFO_KHR,
      .pNext = nullptr,
      .flags = 0,
      .stageCount = (uint32_t) stages.size(),
      .pStages = stages.data(),
      .groupCount = (uint32_t) groups.size(),
      .pGroups = groups.data(),
      .maxPipelineRayRecursionDepth = createInfo.maxRecursionDepth,
      .pLibraryInfo = nullptr,
      .pLibraryInterface = nullptr,
      .pDynamicState = nullptr,
      .layout = ilayout->layout,
      .basePipelineHandle = VK_NULL_HANDLE,
      .basePipelineIndex = -1
    };

    uint64_t handle = rgpuStoreAllocate(ctx, ctx->ipipelineStore);

    RGPU_RESOLVE_PIPELINE(ctx, { handle }, ipipeline);

    VkResult result = idevice->table.vkCreateRayTracingPipelinesKHR(
      idevice->logicalDevice,
      VK_NULL_HANDLE,
      idevice->pipelineCache,
      1,
      &pipelineCreateInfo,
      nullptr,
      &ipipeline->pipeline
    );

    if (result != VK_SUCCESS)
    {
      rgpuStoreFree(ctx, ctx->ipipelineStore, handle);
      RGPU_RETURN_ERROR("failed to create ray tracing pipeline");
    }

    rgpuSetObjectName(ctx, VK_OBJECT_TYPE_PIPELINE, (uint64_t) ipipeline->pipeline, createInfo.debugName);

    ipipeline->bindPoint = VK_PIPELINE_BIND_POINT_RAY_TRACING_KHR;
    ipipeline->groupCount = (uint32_t) groups.size();

    pipeline->handle = handle;
    return true;
  }

  void rgpuDestroyPipeline(RgpuContext* ctx, RgpuPipeline pipeline)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_PIPELINE(ctx, pipeline, ipipeline);

    idevice->table.vkDestroyPipeline(idevice->logicalDevice, ipipeline->pipeline, nullptr);

    rgpuStoreFree(ctx, ctx->ipipelineStore, pipeline.handle);
  }

  /* Shader binding tables */

  bool rgpuComputeSbtLayout(uint32_t handleSize,
                            uint32_t baseAlignment,
                            RgpuSbtGroupCounts counts,
                            RgpuSbtLayout* layout)
  {
    if (handleSize == 0)
    {
      return false;
    }

    uint64_t stride;
    if (!rbCheckedAlignUpwards(uint64_t(handleSize), uint64_t(baseAlignment), &stride))
    {
      return false;
    }

    uint64_t missSize, hitSize, callableSize;
    if (!rbCheckedMul(uint64_t(counts.miss), stride, &missSize) ||
        !rbCheckedMul(uint64_t(counts.hit), stride, &hitSize) ||
        !rbCheckedMul(uint64_t(counts.callable), stride, &callableSize))
    {
      return false;
    }

    // Raygen region size must equal its stride. Every region size is a
    // multiple of the stride, so every offset stays base-aligned.
    RgpuSbtLayout l;
    l.stride = stride;
    l.raygenOffset = 0;
    l.raygenSize = stride;
    l.missOffset = l.raygenSize;
    l.missSize = missSize;

    if (!rbCheckedAdd(l.missOffset, l.missSize, &l.hitOffset))
    {
      return false;
    }
    l.hitSize = hitSize;

    if (!rbCheckedAdd(l.hitOffset, l.hitSize, &l.callableOffset))
    {
      return false;
    }
    l.callableSize = callableSize;

    if (!rbCheckedAdd(l.callableOffset, l.callableSize, &l.totalSize))
    {
      return false;
    }

    *layout = l;
    return true;
  }

  bool rgpuCreateShaderBindingTable(RgpuContext* ctx,
                                    RgpuPipeline pipeline,
                                    const RgpuShaderBindingTableCreateInfo& createInfo,
                                    RgpuShaderBindingTable* sbt)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_PIPELINE(ctx, pipeline, ipipeline);

    if (ipipeline->bindPoint != VK_PIPELINE_BIND_POINT_RAY_TRACING_KHR)
    {
      RGPU_RETURN_ERROR("pipeline is not a ray tracing pipeline");
    }

    const RgpuDeviceProperties& properties = idevice->properties;

    RgpuSbtGroupCounts counts = {
      .miss = (uint32_t) createInfo.missGroups.size(),
      .hit = (uint32_t) createInfo.hitGroups.size(),
      .callable = (uint32_t) createInfo.callableGroups.size()
    };

    RgpuSbtLayout layout;
    if (!rgpuComputeSbtLayout(properties.shaderGroupHandleSize, properties.shaderGroupBaseAlignment, counts, &layout))
    {
      RGPU_FATAL("shader binding table size overflow");
    }

    uint32_t handleSize = properties.shaderGroupHandleSize;
    uint32_t groupCount = ipipeline->groupCount;

    std::vector<uint8_t> handleData(size_t(handleSize) * groupCount);
    if (idevice->table.vkGetRayTracingShaderGroupHandlesKHR(idevice->logicalDevice, ipipeline->pipeline, 0,
                                                            groupCount, handleData.size(), handleData.data()) != VK_SUCCESS)
    {
      RGPU_FATAL("failed to read shader group handles");
    }

    std::vector<uint8_t> sbtMem(layout.totalSize, 0);

    const auto copyGroups = [&](uint64_t offset, std::span<const uint32_t> groups) {
      for (size_t i = 0; i < groups.size(); i++)
      {
        if (groups[i] >= groupCount)
        {
          return false;
        }

        memcpy(&sbtMem[offset + i * layout.stride], &handleData[size_t(handleSize) * groups[i]], handleSize);
      }
      return true;
    };

    uint32_t raygenGroup[] = { createInfo.raygenGroup };
    if (!copyGroups(layout.raygenOffset, raygenGroup) ||
        !copyGroups(layout.missOffset, createInfo.missGroups) ||
        !copyGroups(layout.hitOffset, createInfo.hitGroups) ||
        !copyGroups(layout.callableOffset, createInfo.callableGroups))
    {
      RGPU_RETURN_ERROR("shader binding table references unknown group");
    }

    RgpuBufferCreateInfo bufferCreateInfo = {
      .usage = RgpuBufferUsage::ShaderDeviceAddress | RgpuBufferUsage::ShaderBindingTable,
      .memoryProperties = RgpuMemoryProperties::HostVisible | RgpuMemoryProperties::HostCoherent,
      .size = layout.totalSize,
      .alignment = properties.shaderGroupBaseAlignment,
      .debugName = "[SBT]"
    };

    RgpuBuffer buffer;
    if (!rgpuCreateBuffer(ctx, bufferCreateInfo, &buffer))
    {
      RGPU_RETURN_ERROR("failed to create shader binding table buffer");
    }

    rgpuWriteBuffer(ctx, buffer, 0, sbtMem);

    const auto makeRegion = [&](uint64_t offset, uint64_t size) -> std::optional<RgpuBufferRegion> {
      if (size == 0)
      {
        return std::nullopt;
      }
      return RgpuBufferRegion{ .buffer = buffer, .offset = offset, .size = size, .stride = layout.stride };
    };

    *sbt = RgpuShaderBindingTable {
      .buffer = buffer,
      .raygen = makeRegion(layout.raygenOffset, layout.raygenSize),
      .miss = makeRegion(layout.missOffset, layout.missSize),
      .hit = makeRegion(layout.hitOffset, layout.hitSize),
      .callable = makeRegion(layout.callableOffset, layout.callableSize)
    };

    return true;
  }

  void rgpuDestroyShaderBindingTable(RgpuContext* ctx, const RgpuShaderBindingTable& sbt)
  {
    rgpuDestroyBuffer(ctx, sbt.buffer);
  }
}
