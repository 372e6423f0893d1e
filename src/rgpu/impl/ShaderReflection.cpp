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

#include "ShaderReflection.h"

#include <rdx/rb/Log.h>

#include <spirv_reflect.h>

#include <algorithm>

namespace rdx
{
  bool rgpuReflectShader(const uint32_t* spv, uint64_t size, RgpuShaderReflection* reflection)
  {
    if (size == 0 || (size % sizeof(uint32_t)) != 0)
    {
      return false;
    }

    SpvReflectShaderModule shaderModule = {};
    SpvReflectModuleFlags flags = SPV_REFLECT_MODULE_FLAG_NO_COPY;
    if (spvReflectCreateShaderModule2(flags, size, spv, &shaderModule) != SPV_REFLECT_RESULT_SUCCESS)
    {
      return false;
    }

    bool result = false;

    uint32_t descriptorSetCount;
    std::vector<SpvReflectDescriptorSet*> descriptorSets;

    uint32_t pushConstantBlockCount;
    std::vector<SpvReflectBlockVariable*> pushConstantBlocks;

    if (shaderModule.entry_point_count != 1)
    {
      goto fail;
    }

    reflection->stage = int(shaderModule.entry_points[0].shader_stage);

    if (spvReflectEnumerateDescriptorSets(&shaderModule, &descriptorSetCount, nullptr) != SPV_REFLECT_RESULT_SUCCESS)
    {
      goto fail;
    }

    descriptorSets.resize(descriptorSetCount);
    if (spvReflectEnumerateDescriptorSets(&shaderModule, &descriptorSetCount, descriptorSets.data()) != SPV_REFLECT_RESULT_SUCCESS)
    {
      goto fail;
    }

    reflection->bindings.clear();
    for (const SpvReflectDescriptorSet* srcDescriptorSet : descriptorSets)
    {
      for (uint32_t i = 0; i < srcDescriptorSet->binding_count; i++)
      {
        const SpvReflectDescriptorBinding* srcBinding = srcDescriptorSet->bindings[i];

        reflection->bindings.push_back(RgpuShaderReflectionBinding{
          .set = srcDescriptorSet->set,
          .binding = srcBinding->binding,
          .count = srcBinding->count,
          .descriptorType = int(srcBinding->descriptor_type)
        });
      }
    }

    if (spvReflectEnumeratePushConstantBlocks(&shaderModule, &pushConstantBlockCount, nullptr) != SPV_REFLECT_RESULT_SUCCESS)
    {
      goto fail;
    }

    pushConstantBlocks.resize(pushConstantBlockCount);
    if (spvReflectEnumeratePushConstantBlocks(&shaderModule, &pushConstantBlockCount, pushConstantBlocks.data()) != SPV_REFLECT_RESULT_SUCCESS)
    {
      goto fail;
    }

    reflection->pushConstantsSize = 0;
    for (const SpvReflectBlockVariable* block : pushConstantBlocks)
    {
      uint32_t end = block->offset + block->size;
      if (end > reflection->pushConstantsSize)
      {
        reflection->pushConstantsSize = end;
      }
    }

    result = true;

fail:
    spvReflectDestroyShaderModule(&shaderModule);
    return result;
  }

  bool rgpuCheckShaderInterface(const RgpuShaderReflection& reflection,
                                const RgpuPipelineLayoutInterface& layout,
                                std::string* error)
  {
    RgpuShaderStage stage = RgpuShaderStage(reflection.stage);

    for (const RgpuShaderReflectionBinding& reflected : reflection.bindings)
    {
      if (reflected.set >= layout.sets.size())
      {
        *error = RB_FMT("descriptor set {} not in layout", reflected.set);
        return false;
      }

      const std::vector<RgpuDescriptorSetLayoutBinding>& bindings = layout.sets[reflected.set];

      auto it = std::find_if(bindings.begin(), bindings.end(), [&](const RgpuDescriptorSetLayoutBinding& b) {
        return b.binding == reflected.binding;
      });

      if (it == bindings.end())
      {
        *error = RB_FMT("binding {}.{} not in layout", reflected.set, reflected.binding);
        return false;
      }

      if (int(it->type) != reflected.descriptorType)
      {
        *error = RB_FMT("binding {}.{} has type {} in shader but {} in layout",
                        reflected.set, reflected.binding, reflected.descriptorType, int(it->type));
        return false;
      }

      if (it->count < reflected.count)
      {
        *error = RB_FMT("binding {}.{} declares {} descriptors but layout has {}",
                        reflected.set, reflected.binding, reflected.count, it->count);
        return false;
      }

      if (!rbHasFlags(it->stages, stage))
      {
        *error = RB_FMT("binding {}.{} not visible to shader stage {:#x}", reflected.set, reflected.binding, reflection.stage);
        return false;
      }
    }

    if (reflection.pushConstantsSize == 0)
    {
      return true;
    }

    uint32_t visibleSize = 0;
    for (const RgpuPushConstantRange& range : layout.pushConstants)
    {
      if (range.offset == 0 && rbHasFlags(range.stages, stage))
      {
        visibleSize = std::max(visibleSize, range.size);
      }
    }

    if (reflection.pushConstantsSize > visibleSize)
    {
      *error = RB_FMT("push constants of {} bytes exceed the {} bytes visible to the stage",
                      reflection.pushConstantsSize, visibleSize);
      return false;
    }

    return true;
  }
}
