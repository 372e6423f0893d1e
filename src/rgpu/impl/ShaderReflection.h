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

#include "rdx/rgpu/Rgpu.h"

#include <stdint.h>
#include <string>
#include <vector>

namespace rdx
{
  struct RgpuShaderReflectionBinding
  {
    uint32_t set;
    uint32_t binding;
    uint32_t count;
    int descriptorType; // VkDescriptorType
  };

  struct RgpuShaderReflection
  {
    int stage; // VkShaderStageFlagBits of the single entry point
    uint32_t pushConstantsSize;
    std::vector<RgpuShaderReflectionBinding> bindings;
  };

  // Descriptor and push constant declarations of a pipeline layout, kept for
  // matching against the shaders of the pipelines created with it.
  struct RgpuPipelineLayoutInterface
  {
    std::vector<std::vector<RgpuDescriptorSetLayoutBinding>> sets;
    std::vector<RgpuPushConstantRange> pushConstants;
  };

  // Fails for malformed SPIR-V and for modules without exactly one entry point.
  bool rgpuReflectShader(const uint32_t* spv, uint64_t size, RgpuShaderReflection* reflection);

  // Every descriptor the shader declares must exist in the layout with the
  // same type, at least the declared array size and the shader's stage. The
  // shader's push constant block must fit a range at offset zero that is
  // visible to its stage.
  // On failure, 'error' names the first mismatch.
  bool rgpuCheckShaderInterface(const RgpuShaderReflection& reflection,
                                const RgpuPipelineLayoutInterface& layout,
                                std::string* error);
}
