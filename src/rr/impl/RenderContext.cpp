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

#include "rdx/rr/RenderContext.h"

#include <rdx/rb/Log.h>

#include <fstream>
#include <string>
#include <vector>

#ifndef RDX_SHADER_DIR
#define RDX_SHADER_DIR "assets/shaders"
#endif

namespace rdx
{
  namespace
  {
    bool _rrReadSpirvFromFile(const std::string& filePath, std::vector<uint32_t>& words)
    {
      std::ifstream file(filePath, std::ios_base::in | std::ios_base::binary);
      if (!file.is_open())
      {
        return false;
      }

      file.seekg(0, std::ios_base::end);
      size_t size = file.tellg();
      file.seekg(0, std::ios_base::beg);

      if (size == 0 || (size % sizeof(uint32_t)) != 0)
      {
        return false;
      }

      words.resize(size / sizeof(uint32_t));
      file.read((char*) words.data(), size);
      return file.good();
    }
  }

  bool rrLoadShaderModule(RgpuContext* ctx,
                          const char* fileName,
                          RgpuShaderStage stage,
                          RgpuShaderModule* shaderModule)
  {
    std::string filePath = std::string(RDX_SHADER_DIR) + "/" + fileName;

    std::vector<uint32_t> words;
    if (!_rrReadSpirvFromFile(filePath, words))
    {
      RB_ERROR("unable to read shader {}", filePath);
      return false;
    }

    RgpuShaderModuleCreateInfo createInfo = {
      .code = { (const uint8_t*) words.data(), words.size() * sizeof(uint32_t) },
      .stage = stage,
      .debugName = fileName
    };

    if (!rgpuCreateShaderModule(ctx, createInfo, shaderModule))
    {
      RB_ERROR("invalid shader {}", filePath);
      return false;
    }

    RB_DEBUG("loaded shader {}", fileName);
    return true;
  }
}
