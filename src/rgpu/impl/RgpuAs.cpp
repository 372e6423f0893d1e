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

namespace rdx
{
  static VkAccelerationStructureTypeKHR rgpuTranslateAsLevel(RgpuAccelerationStructureLevel level)
  {
    return level == RgpuAccelerationStructureLevel::Top ? VK_ACCELERATION_STRUCTURE_TYPE_TOP_LEVEL_KHR
                                                        : VK_ACCELERATION_STRUCTURE_TYPE_BOTTOM_LEVEL_KHR;
  }

  void rgpuGetAccelerationStructureBuildSizes(RgpuContext* ctx,
                                              RgpuAccelerationStructureLevel level,
                                              RgpuAsBuildFlags flags,
                                              std::span<const RgpuAsGeometryDesc> geometries,
                                              RgpuAsBuildSizes* sizes)
  {
    RgpuIDevice* idevice = &ctx->idevice;

    std::vector<VkAccelerationStructureGeometryKHR> nativeGeometries;
    std::vector<uint32_t> maxPrimitiveCounts;
    nativeGeometries.reserve(geometries.size());
    maxPrimitiveCounts.reserve(geometries.size());

    for (const RgpuAsGeometryDesc& geometry : geometries)
    {
      VkAccelerationStructureGeometryKHR nativeGeometry = {
        .sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_GEOMETRY_KHR,
        .pNext = nullptr,
        .geometryType = VK_GEOMETRY_TYPE_TRIANGLES_KHR,
        .geometry = {},
        .flags = 0,
      };

      if (const auto* triangles = std::get_if<RgpuAsTrianglesDesc>(&geometry); triangles)
      {
        nativeGeometry.geometry.triangles = VkAccelerationStructureGeometryTrianglesDataKHR {
          .sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_GEOMETRY_TRIANGLES_DATA_KHR,
          .pNext = nullptr,
          .vertexFormat = (VkFormat) triangles->vertexFormat,
          .vertexData = {},
          .vertexStride = 0,
          .maxVertex = triangles->maxVertexCount > 0 ? triangles->maxVertexCount - 1 : 0,
          .indexType = triangles->indexType ? (VkIndexType) *triangles->indexType : VK_INDEX_TYPE_NONE_KHR,
          .indexData = {},
          .transformData = {},
        };

        maxPrimitiveCounts.push_back(triangles->maxPrimitiveCount);
      }
      else
      {
        const auto& instances = std::get<RgpuAsInstancesDesc>(geometry);

        nativeGeometry.geometryType = VK_GEOMETRY_TYPE_INSTANCES_KHR;
        nativeGeometry.geometry.instances = VkAccelerationStructureGeometryInstancesDataKHR {
          .sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_GEOMETRY_INSTANCES_DATA_KHR,
          .pNext = nullptr,
          .arrayOfPointers = VK_FALSE,
          .data = {},
        };

        maxPrimitiveCounts.push_back(instances.maxPrimitiveCount);
      }

      nativeGeometries.push_back(nativeGeometry);
    }

    VkAccelerationStructureBuildGeometryInfoKHR buildInfo = {
      .sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_BUILD_GEOMETRY_INFO_KHR,
      .pNext = nullptr,
      .type = rgpuTranslateAsLevel(level),
      .flags = (VkBuildAccelerationStructureFlagsKHR) flags,
      .mode = VK_BUILD_ACCELERATION_STRUCTURE_MODE_BUILD_KHR,
      .srcAccelerationStructure = VK_NULL_HANDLE,
      .dstAccelerationStructure = VK_NULL_HANDLE,
      .geometryCount = (uint32_t) nativeGeometries.size(),
      .pGeometries = nativeGeometries.data(),
      .ppGeometries = nullptr,
      .scratchData = {},
    };

    VkAccelerationStructureBuildSizesInfoKHR sizesInfo = {
      .sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_BUILD_SIZES_INFO_KHR,
      .pNext = nullptr,
      .accelerationStructureSize = 0,
      .updateScratchSize = 0,
      .buildScratchSize = 0,
    };

    idevice->table.vkGetAccelerationStructureBuildSizesKHR(
      idevice->logicalDevice,
      VK_ACCELERATION_STRUCTURE_BUILD_TYPE_DEVICE_KHR,
      &buildInfo,
      maxPrimitiveCounts.data(),
      &sizesInfo
    );

    *sizes = RgpuAsBuildSizes {
      .accelerationStructureSize = sizesInfo.accelerationStructureSize,
      .updateScratchSize = sizesInfo.updateScratchSize,
      .buildScratchSize = sizesInfo.buildScratchSize
    };
  }

  bool rgpuCreateAccelerationStructure(RgpuContext* ctx,
                                       RgpuAccelerationStructureCreateInfo createInfo,
                                       RgpuAccelerationStructure* as)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_BUFFER(ctx, createInfo.region.buffer, ibuffer);

    if (!rbHasFlags(ibuffer->usage, RgpuBufferUsage::AccelerationStructureStorage))
    {
      RGPU_RETURN_ERROR("buffer lacks acceleration structure storage usage");
    }

    if (createInfo.region.offset + createInfo.region.size > ibuffer->size)
    {
      RGPU_RETURN_ERROR("acceleration structure region out of bounds");
    }

    VkAccelerationStructureCreateInfoKHR asCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_CREATE_INFO_KHR,
      .pNext = nullptr,
      .createFlags = 0,
      .buffer = ibuffer->buffer,
      .offset = createInfo.region.offset,
      .size = createInfo.region.size,
      .type = rgpuTranslateAsLevel(createInfo.level),
      .deviceAddress = 0,
    };

    uint64_t handle = rgpuStoreAllocate(ctx, ctx->iasStore);

    RGPU_RESOLVE_AS(ctx, { handle }, ias);

    VkResult result = idevice->table.vkCreateAccelerationStructureKHR(
      idevice->logicalDevice,
      &asCreateInfo,
      nullptr,
      &ias->as
    );

    if (result != VK_SUCCESS)
    {
      rgpuStoreFree(ctx, ctx->iasStore, handle);
      RGPU_RETURN_ERROR("failed to create acceleration structure");
    }

    VkAccelerationStructureDeviceAddressInfoKHR addressInfo = {
      .sType = VK_STRUCTURE_TYPE_ACCELERATION_STRUCTURE_DEVICE_ADDRESS_INFO_KHR,
      .pNext = nullptr,
      .accelerationStructure = ias->as,
    };

    ias->address = idevice->table.vkGetAccelerationStructureDeviceAddressKHR(idevice->logicalDevice, &addressInfo);
    ias->level = createInfo.level;
    ias->region = createInfo.region;

    as->handle = handle;
    return true;
  }

  void rgpuDestroyAccelerationStructure(RgpuContext* ctx, RgpuAccelerationStructure as)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_AS(ctx, as, ias);

    idevice->table.vkDestroyAccelerationStructureKHR(idevice->logicalDevice, ias->as, nullptr);

    rgpuStoreFree(ctx, ctx->iasStore, as.handle);
  }

  uint64_t rgpuGetAccelerationStructureAddress(RgpuContext* ctx, RgpuAccelerationStructure as)
  {
    RGPU_RESOLVE_AS(ctx, as, ias);

    return ias->address;
  }

  void rgpuPackAccelerationStructureInstance(const RgpuAsInstance& instance, uint8_t* dst)
  {
    uint32_t customIndexAndMask = (instance.customIndex & 0x00FFFFFF) | (uint32_t(instance.mask) << 24);
    uint32_t sbtOffsetAndFlags = (instance.sbtRecordOffset & 0x00FFFFFF) | ((uint32_t(instance.flags) & 0xFF) << 24);

    memcpy(&dst[0], instance.transform, 48);
    memcpy(&dst[48], &customIndexAndMask, 4);
    memcpy(&dst[52], &sbtOffsetAndFlags, 4);
    memcpy(&dst[56], &instance.blasAddress, 8);
  }

  static_assert(sizeof(VkAccelerationStructureInstanceKHR) == RGPU_AS_INSTANCE_SIZE);
}
