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

#include <rdx/rgpu/Rgpu.h>

namespace rdx
{
  class RgpuDelayedResourceDestroyer;
  class RgpuQueue;

  struct RrRenderContext
  {
    RgpuContext* ctx;
    RgpuQueue& queue;
    RgpuDelayedResourceDestroyer& destroyer;
  };

  // Loads precompiled SPIR-V from the shader directory.
  bool rrLoadShaderModule(RgpuContext* ctx,
                          const char* fileName,
                          RgpuShaderStage stage,
                          RgpuShaderModule* shaderModule);
}
