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

#include "rdx/rr/Blas.h"

#include <rdx/rr/Mesh.h>
#include <rdx/rr/RenderContext.h>
#include <rdx/rgpu/DelayedResourceDestroyer.h>
#include <rdx/rgpu/Queue.h>
#include <rdx/rb/Log.h>

#include <array>

namespace rdx
{
  namespace
  {
    bool _rrValidateTriangleMesh(const RrMesh& mesh, uint32_t* vertexCount, uint32_t* triangleCount)
    {
      if (mesh.topology() != RrPrimitiveTopology::TriangleList)
      {
        RB_ERROR("BLAS mesh must be a triangle list");
        return false;
      }

      const RrVertexAttribute* positions = mesh.attribute(RrMesh::ATTRIBUTE_POSITION);
      if (!positions || positions->format != RrVertexFormat::Float32x3)
      {
        RB_ERROR("BLAS mesh requires Float32x3 positions");
        return false;
      }

      if (!mesh.countVertices(vertexCount) || *vertexCount == 0)
      {
        RB_ERROR("BLAS mesh has invalid vertex data");
        return false;
      }

      const std::optional<RrIndices>& indices = mesh.indices();
      if (!indices)
      {
        RB_ERROR("BLAS mesh without indices");
        return false;
      }

      uint32_t indexCount = rrGetIndexCount(*indices);
      if (indexCount == 0 || (indexCount % 3) != 0)
      {
        RB_ERROR("BLAS mesh index count {} is not a positive multiple of 3", indexCount);
        return false;
      }

      bool inRange = std::visit([&](const auto& v) {
        for (auto index : v)
        {
          if (uint32_t(index) >= *vertexCount)
          {
            return false;
          }
        }
        return true;
      }, *indices);

      if (!inRange)
      {
        RB_ERROR("BLAS mesh index out of range");
        return false;
      }

      *triangleCount = indexCount / 3;
      return true;
    }

    bool _rrCreateBufferWithData(RgpuContext* ctx, RgpuBufferUsage usage, std::span<const uint8_t> data,
                                 const char* debugName, RgpuBuffer* buffer)
    {
      RgpuBufferCreateInfo createInfo = {
        .usage = usage | RgpuBufferUsage::AccelerationStructureBuildInput | RgpuBufferUsage::ShaderDeviceAddress,
        .memoryProperties = RgpuMemoryProperties::HostVisible | RgpuMemoryProperties::HostCoherent,
        .size = data.size(),
        .debugName = debugName
      };

      if (!rgpuCreateBuffer(ctx, createInfo, buffer))
      {
        return false;
      }

      rgpuWriteBuffer(ctx, *buffer, 0, data);
      return true;
    }
  }

  bool rrBuildTriangleBlas(RrRenderContext& renderContext, const RrMesh& mesh, RrBlas* blas)
  {
    uint32_t vertexCount;
    uint32_t triangleCount;
    if (!_rrValidateTriangleMesh(mesh, &vertexCount, &triangleCount))
    {
      return false;
    }

    RgpuContext* ctx = renderContext.ctx;
    const RrVertexAttribute* positions = mesh.attribute(RrMesh::ATTRIBUTE_POSITION);
    const RrIndices& indices = *mesh.indices();

    RgpuIndexType indexType = std::holds_alternative<std::vector<uint16_t>>(indices)
      ? RgpuIndexType::Uint16 : RgpuIndexType::Uint32;

    const RgpuDeviceProperties& properties = rgpuGetDeviceProperties(ctx);

    RgpuBuffer vertexBuffer;
    RgpuBuffer indexBuffer;
    RgpuBuffer storageBuffer;
    RgpuBuffer scratchBuffer;
    RgpuAccelerationStructure as;
    RgpuAsBuildSizes sizes;

    if (!_rrCreateBufferWithData(ctx, RgpuBufferUsage::Vertex, positions->data, "[BLAS vertices]", &vertexBuffer))
    {
      RB_ERROR("failed to create BLAS vertex buffer");
      goto fail;
    }

    if (!_rrCreateBufferWithData(ctx, RgpuBufferUsage::Index, rrGetIndexBytes(indices), "[BLAS indices]", &indexBuffer))
    {
      RB_ERROR("failed to create BLAS index buffer");
      goto fail_vertex;
    }

    {
      std::array<RgpuAsGeometryDesc, 1> descs = {
        RgpuAsTrianglesDesc{
          .maxPrimitiveCount = triangleCount,
          .maxVertexCount = vertexCount,
          .vertexFormat = RgpuFormat::R32G32B32Sfloat,
          .indexType = indexType
        }
      };

      rgpuGetAccelerationStructureBuildSizes(ctx, RgpuAccelerationStructureLevel::Bottom,
                                             RgpuAsBuildFlags::PreferFastTrace, descs, &sizes);
    }

    if (!rgpuCreateBuffer(ctx, RgpuBufferCreateInfo {
                            .usage = RgpuBufferUsage::AccelerationStructureStorage | RgpuBufferUsage::ShaderDeviceAddress,
                            .memoryProperties = RgpuMemoryProperties::DeviceLocal,
                            .size = sizes.accelerationStructureSize,
                            .debugName = "[BLAS storage]"
                          }, &storageBuffer))
    {
      RB_ERROR("failed to create BLAS storage buffer");
      goto fail_index;
    }

    if (!rgpuCreateBuffer(ctx, RgpuBufferCreateInfo {
                            .usage = RgpuBufferUsage::Storage | RgpuBufferUsage::ShaderDeviceAddress,
                            .memoryProperties = RgpuMemoryProperties::DeviceLocal,
                            .size = sizes.buildScratchSize,
                            .alignment = properties.minAccelerationStructureScratchOffsetAlignment,
                            .debugName = "[BLAS scratch]"
                          }, &scratchBuffer))
    {
      RB_ERROR("failed to create BLAS scratch buffer");
      goto fail_storage;
    }

    if (!rgpuCreateAccelerationStructure(ctx, RgpuAccelerationStructureCreateInfo {
                                           .level = RgpuAccelerationStructureLevel::Bottom,
                                           .region = RgpuBufferRegion{ .buffer = storageBuffer, .size = sizes.accelerationStructureSize }
                                         }, &as))
    {
      RB_ERROR("failed to create BLAS");
      goto fail_scratch;
    }

    {
      RbArena arena(4 * 1024);

      std::array<RgpuAsGeometry, 1> geometries = {
        RgpuAsTriangles {
          .flags = RgpuGeometryFlags::None,
          .vertexFormat = RgpuFormat::R32G32B32Sfloat,
          .vertexAddress = rgpuGetBufferAddress(ctx, vertexBuffer),
          .vertexStride = rrGetVertexFormatSize(positions->format),
          .vertexCount = vertexCount,
          .primitiveCount = triangleCount,
          .indices = RgpuAsIndexData{ .type = indexType, .address = rgpuGetBufferAddress(ctx, indexBuffer) }
        }
      };

      std::array<RgpuAsBuildInfo, 1> infos = {
        RgpuAsBuildInfo {
          .dst = as,
          .flags = RgpuAsBuildFlags::PreferFastTrace,
          .geometries = geometries,
          .scratchAddress = rgpuGetBufferAddress(ctx, scratchBuffer)
        }
      };

      RgpuEncoder encoder = renderContext.queue.createEncoder(arena);
      encoder.buildAccelerationStructure(infos);
      renderContext.queue.submitAndWait(std::move(encoder).finish(ctx));
    }

    rgpuDestroyBuffer(ctx, scratchBuffer);

    *blas = RrBlas {
      .as = as,
      .storageBuffer = storageBuffer,
      .vertexBuffer = vertexBuffer,
      .indexBuffer = indexBuffer,
      .address = rgpuGetAccelerationStructureAddress(ctx, as)
    };

    RB_DEBUG("built BLAS with {} triangles", triangleCount);
    return true;

  fail_scratch:
    rgpuDestroyBuffer(ctx, scratchBuffer);
  fail_storage:
    rgpuDestroyBuffer(ctx, storageBuffer);
  fail_index:
    rgpuDestroyBuffer(ctx, indexBuffer);
  fail_vertex:
    rgpuDestroyBuffer(ctx, vertexBuffer);
  fail:
    return false;
  }

  void rrRetireBlas(RrRenderContext& renderContext, const RrBlas& blas)
  {
    renderContext.destroyer.enqueueDestruction(blas.as, blas.storageBuffer, blas.vertexBuffer, blas.indexBuffer);
  }
}
