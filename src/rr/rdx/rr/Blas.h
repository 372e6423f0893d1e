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
  class RrMesh;
  struct RrRenderContext;

  struct RrBlas
  {
    RgpuAccelerationStructure as;
    RgpuBuffer storageBuffer;
    RgpuBuffer vertexBuffer;
    RgpuBuffer indexBuffer;
    uint64_t address;
  };

  // Builds a bottom-level acceleration structure from the mesh's Float32x3
  // positions and its triangle list indices, and waits for the build to
  // complete. The mesh is validated before any device object is created.
  bool rrBuildTriangleBlas(RrRenderContext& renderContext, const RrMesh& mesh, RrBlas* blas);

  // Hands the BLAS and its buffers to the delayed resource destroyer.
  void rrRetireBlas(RrRenderContext& renderContext, const RrBlas& blas);
}
