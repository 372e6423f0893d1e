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
#include "ShaderReflection.h"

#include <stdlib.h>
#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include <assert.h>
#include <algorithm>
#include <array>
#include <memory>
#include <string>

#include <rdx/rb/Data.h>
#include <quill/bundled/fmt/printf.h>

#ifdef __clang__
#pragma clang diagnostic push
// Silence nullability log spam on AppleClang
#pragma clang diagnostic ignored "-Wnullability-completeness"
#endif

#ifdef RDX_VERBOSE
#define VMA_LEAK_LOG_FORMAT(format, ...) do { RB_ERROR("[VMA] {}", fmtquill::sprintf((format), __VA_ARGS__)); rdx::rbLogFlush(); } while(false)
#endif

#define VMA_IMPLEMENTATION
#include <vk_mem_alloc.h>

#ifdef __clang__
#pragma clang diagnostic pop
#endif

namespace rdx
{
  /* Constants */

  constexpr static const uint32_t RGPU_VENDOR_ID_AMD = 0x1002;
  constexpr static const uint32_t RGPU_VENDOR_ID_NVIDIA = 0x10DE;
  constexpr static const uint32_t RGPU_VENDOR_ID_INTEL = 0x8086;
  constexpr static const uint32_t RGPU_VENDOR_ID_MESA = VK_VENDOR_ID_MESA;

  static const std::array<const char*, 8> RGPU_REQUIRED_EXTENSIONS = {
    VK_KHR_ACCELERATION_STRUCTURE_EXTENSION_NAME,
    VK_EXT_DESCRIPTOR_INDEXING_EXTENSION_NAME, // required by VK_KHR_acceleration_structure
    VK_KHR_BUFFER_DEVICE_ADDRESS_EXTENSION_NAME, // required by VK_KHR_acceleration_structure
    VK_KHR_DEFERRED_HOST_OPERATIONS_EXTENSION_NAME, // required by VK_KHR_acceleration_structure
    VK_KHR_RAY_TRACING_PIPELINE_EXTENSION_NAME,
    VK_KHR_SPIRV_1_4_EXTENSION_NAME, // required by VK_KHR_ray_tracing_pipeline
    VK_KHR_SHADER_FLOAT_CONTROLS_EXTENSION_NAME, // required by VK_KHR_spirv_1_4
    VK_KHR_SYNCHRONIZATION_2_EXTENSION_NAME
  };

  /* Helper methods */

  static const char* rgpuGetVendorName(uint32_t vendorId)
  {
    switch (vendorId)
    {
    case RGPU_VENDOR_ID_AMD:
      return "AMD";
    case RGPU_VENDOR_ID_NVIDIA:
      return "NVIDIA";
    case RGPU_VENDOR_ID_INTEL:
      return "Intel";
    case RGPU_VENDOR_ID_MESA:
      return "Mesa";
    default:
      return nullptr;
    }
  }

#ifndef NDEBUG
  static bool rgpuFindLayer(const char* name, size_t layerCount, VkLayerProperties* layers)
  {
    for (size_t i = 0; i < layerCount; i++)
    {
      if (!strcmp(layers[i].layerName, name))
      {
        return true;
      }
    }
    return false;
  }
#endif

  static bool rgpuFindExtension(const char* name, size_t extensionCount, const VkExtensionProperties* extensions)
  {
    for (size_t i = 0; i < extensionCount; ++i)
    {
      if (!strcmp(extensions[i].extensionName, name))
      {
        return true;
      }
    }
    return false;
  }

  static uint32_t rgpuGetFormatSize(RgpuFormat format)
  {
    switch (format)
    {
    case RgpuFormat::R8G8B8A8Unorm:
    case RgpuFormat::R8G8B8A8Srgb:
    case RgpuFormat::B8G8R8A8Unorm:
    case RgpuFormat::B8G8R8A8Srgb:
    case RgpuFormat::D32Sfloat:
      return 4;
    case RgpuFormat::R16G16B16A16Sfloat:
    case RgpuFormat::R32G32Sfloat:
      return 8;
    case RgpuFormat::R32G32B32Sfloat:
      return 12;
    case RgpuFormat::R32G32B32A32Sfloat:
      return 16;
    default:
      return 0;
    }
  }

  static std::vector<std::string> rgpuToStrings(const std::vector<const char*>& names)
  {
    return std::vector<std::string>(names.begin(), names.end());
  }

  void rgpuSetObjectName(RgpuContext* ctx, VkObjectType type, uint64_t handle, const char* name)
  {
    if (!ctx->debugUtilsEnabled || !name)
    {
      return;
    }

    VkDebugUtilsObjectNameInfoEXT info = {
      .sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_OBJECT_NAME_INFO_EXT,
      .pNext = nullptr,
      .objectType = type,
      .objectHandle = handle,
      .pObjectName = name
    };

    [[maybe_unused]] VkResult result = vkSetDebugUtilsObjectNameEXT(ctx->idevice.logicalDevice, &info);

    assert(result == VK_SUCCESS);
  }

  /* Static state */

  static bool s_volkInitialized = false;
  static std::mutex s_volkLock;

  /* Device selection */

  struct RgpuDevicePropertyChain
  {
    VkPhysicalDeviceProperties2 properties2;
    VkPhysicalDeviceDriverPropertiesKHR driver;
    VkPhysicalDeviceAccelerationStructurePropertiesKHR accelerationStructure;
    VkPhysicalDeviceRayTracingPipelinePropertiesKHR rayTracingPipeline;
  };

  static void rgpuSetupDevicePropertyChain(RgpuDevicePropertyChain& chain, bool driverProperties)
  {
    chain = {};

    chain.driver = {
      .sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_DRIVER_PROPERTIES_KHR,
      .pNext = nullptr
    };
    chain.accelerationStructure = {
      .sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_ACCELERATION_STRUCTURE_PROPERTIES_KHR,
      .pNext = driverProperties ? &chain.driver : nullptr
    };
    chain.rayTracingPipeline = {
      .sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_RAY_TRACING_PIPELINE_PROPERTIES_KHR,
      .pNext = &chain.accelerationStructure
    };
    chain.properties2 = {
      .sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_PROPERTIES_2,
      .pNext = &chain.rayTracingPipeline
    };
  }

  static RgpuDeviceProperties rgpuGetDeviceProperties(const RgpuDevicePropertyChain& chain)
  {
    const VkPhysicalDeviceLimits& limits = chain.properties2.properties.limits;

    return RgpuDeviceProperties {
      .maxPushConstantsSize = limits.maxPushConstantsSize,
      .minAccelerationStructureScratchOffsetAlignment =
        chain.accelerationStructure.minAccelerationStructureScratchOffsetAlignment,
      .minUniformBufferOffsetAlignment = limits.minUniformBufferOffsetAlignment,
      .shaderGroupBaseAlignment = chain.rayTracingPipeline.shaderGroupBaseAlignment,
      .shaderGroupHandleAlignment = chain.rayTracingPipeline.shaderGroupHandleAlignment,
      .shaderGroupHandleSize = chain.rayTracingPipeline.shaderGroupHandleSize,
      .maxRayRecursionDepth = chain.rayTracingPipeline.maxRayRecursionDepth
    };
  }

  struct RgpuDeviceFeatureChain
  {
    VkPhysicalDeviceFeatures2 features2;
    VkPhysicalDeviceSynchronization2FeaturesKHR synchronization2;
    VkPhysicalDeviceAccelerationStructureFeaturesKHR accelerationStructure;
    VkPhysicalDeviceRayTracingPipelineFeaturesKHR rayTracingPipeline;
    VkPhysicalDeviceBufferDeviceAddressFeaturesKHR bufferDeviceAddress;
    VkPhysicalDeviceDescriptorIndexingFeaturesEXT descriptorIndexing;
  };

  static void rgpuSetupDeviceFeatureChain(RgpuDeviceFeatureChain& chain)
  {
    chain = {};

    chain.descriptorIndexing = {
      .sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_DESCRIPTOR_INDEXING_FEATURES,
      .pNext = nullptr
    };
    chain.bufferDeviceAddress = {
      .sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_BUFFER_DEVICE_ADDRESS_FEATURES,
      .pNext = &chain.descriptorIndexing
    };
    chain.rayTracingPipeline = {
      .sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_RAY_TRACING_PIPELINE_FEATURES_KHR,
      .pNext = &chain.bufferDeviceAddress
    };
    chain.accelerationStructure = {
      .sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_ACCELERATION_STRUCTURE_FEATURES_KHR,
      .pNext = &chain.rayTracingPipeline
    };
    chain.synchronization2 = {
      .sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_SYNCHRONIZATION_2_FEATURES_KHR,
      .pNext = &chain.accelerationStructure
    };
    chain.features2 = {
      .sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2,
      .pNext = &chain.synchronization2
    };
  }

  // Chains point into the candidate itself, so candidates are heap allocated and never moved.
  struct RgpuDeviceCandidate
  {
    VkPhysicalDevice device;
    std::vector<const char*> enabledExtensions;

    RgpuDevicePropertyChain propertyChain;
    RgpuDeviceFeatureChain featureChain;
    bool driverProperties;

    uint32_t queueFamilyIndex;
    uint32_t score;
    std::vector<std::string> errorMessages; // if size() > 0: device is unsuitable
  };

  static void rgpuQueryDeviceCandidate(VkPhysicalDevice device, VkSurfaceKHR surface, RgpuDeviceCandidate& c)
  {
    c.device = device;

    // query & check queue
    uint32_t queueFamilyCount;
    vkGetPhysicalDeviceQueueFamilyProperties(c.device, &queueFamilyCount, nullptr);

    std::vector<VkQueueFamilyProperties> queueFamilies(queueFamilyCount);
    vkGetPhysicalDeviceQueueFamilyProperties(c.device, &queueFamilyCount, queueFamilies.data());

    const VkQueueFlags requiredQueueFlags = VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT | VK_QUEUE_TRANSFER_BIT;

    c.queueFamilyIndex = UINT32_MAX;
    for (uint32_t i = 0; i < queueFamilyCount; ++i)
    {
      if ((queueFamilies[i].queueFlags & requiredQueueFlags) != requiredQueueFlags)
      {
        continue;
      }

      if (surface != VK_NULL_HANDLE)
      {
        VkBool32 presentSupported = VK_FALSE;
        vkGetPhysicalDeviceSurfaceSupportKHR(c.device, i, surface, &presentSupported);

        if (!presentSupported)
        {
          continue;
        }
      }

      c.queueFamilyIndex = i;
      break;
    }
    if (c.queueFamilyIndex == UINT32_MAX)
    {
      c.errorMessages.push_back("no suitable queue family");
    }

    // query memory
    VkPhysicalDeviceMemoryProperties memoryProperties;
    vkGetPhysicalDeviceMemoryProperties(c.device, &memoryProperties);

    VkDeviceSize largestDeviceLocalHeapSize = 0;
    for (uint32_t i = 0; i < memoryProperties.memoryHeapCount; i++)
    {
      const VkMemoryHeap& heap = memoryProperties.memoryHeaps[i];

      if (bool(heap.flags & VK_MEMORY_HEAP_DEVICE_LOCAL_BIT))
      {
        largestDeviceLocalHeapSize = std::max(largestDeviceLocalHeapSize, heap.size);
      }
    }

    // query & check extensions
    uint32_t extensionCount;
    vkEnumerateDeviceExtensionProperties(c.device, nullptr, &extensionCount, nullptr);

    std::vector<VkExtensionProperties> extensions(extensionCount);
    vkEnumerateDeviceExtensionProperties(c.device, nullptr, &extensionCount, extensions.data());

    const auto requireExtension = [&](const char* extension)
    {
      if (!rgpuFindExtension(extension, extensionCount, extensions.data()))
      {
        c.errorMessages.push_back(RB_FMT("extension {} missing", extension));
      }

      c.enabledExtensions.push_back(extension);
    };

    for (const char* extension : RGPU_REQUIRED_EXTENSIONS)
    {
      requireExtension(extension);
    }

    if (surface != VK_NULL_HANDLE)
    {
      requireExtension(VK_KHR_SWAPCHAIN_EXTENSION_NAME);

      uint32_t formatCount = 0;
      vkGetPhysicalDeviceSurfaceFormatsKHR(c.device, surface, &formatCount, nullptr);

      uint32_t presentModeCount = 0;
      vkGetPhysicalDeviceSurfacePresentModesKHR(c.device, surface, &presentModeCount, nullptr);

      if (formatCount == 0)
      {
        c.errorMessages.push_back("no surface formats");
      }
      if (presentModeCount == 0)
      {
        c.errorMessages.push_back("no present modes");
      }
    }

    c.driverProperties = rgpuFindExtension(VK_KHR_DRIVER_PROPERTIES_EXTENSION_NAME, extensionCount, extensions.data());
    if (c.driverProperties)
    {
      c.enabledExtensions.push_back(VK_KHR_DRIVER_PROPERTIES_EXTENSION_NAME);
    }

    // query & check properties
    rgpuSetupDevicePropertyChain(c.propertyChain, c.driverProperties);
    vkGetPhysicalDeviceProperties2(c.device, &c.propertyChain.properties2);

    const VkPhysicalDeviceProperties& properties = c.propertyChain.properties2.properties;

    uint32_t apiVersion = properties.apiVersion;
    if (apiVersion < RGPU_MIN_VK_API_VERSION)
    {
      c.errorMessages.push_back(RB_FMT("outdated Vulkan API {}.{}.{}", VK_API_VERSION_MAJOR(apiVersion),
        VK_API_VERSION_MINOR(apiVersion), VK_API_VERSION_PATCH(apiVersion)));
    }

    // query & check features
    RgpuDeviceFeatureChain tempFeatureChain;
    rgpuSetupDeviceFeatureChain(tempFeatureChain);
    vkGetPhysicalDeviceFeatures2(c.device, &tempFeatureChain.features2);

#define RGPU_REQUIRE_FEATURE(STRUCT, FIELD)                              \
      if (tempFeatureChain.STRUCT.FIELD) {                               \
        c.featureChain.STRUCT.FIELD = VK_TRUE;                           \
      } else {                                                           \
        c.errorMessages.push_back(RB_FMT("feature {} missing", #FIELD)); \
      }

    rgpuSetupDeviceFeatureChain(c.featureChain);
    RGPU_REQUIRE_FEATURE(synchronization2, synchronization2);
    RGPU_REQUIRE_FEATURE(accelerationStructure, accelerationStructure);
    RGPU_REQUIRE_FEATURE(rayTracingPipeline, rayTracingPipeline);
    RGPU_REQUIRE_FEATURE(bufferDeviceAddress, bufferDeviceAddress);
    RGPU_REQUIRE_FEATURE(descriptorIndexing, descriptorBindingSampledImageUpdateAfterBind);
#undef RGPU_REQUIRE_FEATURE

    // calculate score
    c.score = 0;

    if (!c.errorMessages.empty())
    {
      return;
    }

    if (properties.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU)
    {
      c.score += 10000;
    }
    else if (properties.deviceType == VK_PHYSICAL_DEVICE_TYPE_VIRTUAL_GPU)
    {
      c.score += 8000; // can be a masked dGPU
    }

    c.score += uint32_t(largestDeviceLocalHeapSize / uint64_t(1024 * 1024 * 1024)); // bytes to gigabytes
  }

  using RgpuCandidateVector = std::vector<std::unique_ptr<RgpuDeviceCandidate>>;

  static RgpuCandidateVector rgpuQueryDeviceCandidates(VkInstance instance, VkSurfaceKHR surface)
  {
    uint32_t deviceCount;
    vkEnumeratePhysicalDevices(instance, &deviceCount, nullptr);

    if (deviceCount == 0)
    {
      return {};
    }

    std::vector<VkPhysicalDevice> devices(deviceCount);
    vkEnumeratePhysicalDevices(instance, &deviceCount, devices.data());

    RgpuCandidateVector candidates;
    candidates.reserve(deviceCount);

    for (VkPhysicalDevice device : devices)
    {
      auto c = std::make_unique<RgpuDeviceCandidate>();

      rgpuQueryDeviceCandidate(device, surface, *c);

      candidates.push_back(std::move(c));
    }

    return candidates;
  }

  static bool rgpuCreateIDevice(VkInstance instance, VkSurfaceKHR surface, RgpuIDevice* idevice)
  {
    // query & sort devices
    RgpuCandidateVector candidates = rgpuQueryDeviceCandidates(instance, surface);

    if (candidates.empty())
    {
      RB_ERROR("no GPUs found");
      return false;
    }

    std::stable_sort(candidates.begin(), candidates.end(), [](const auto& a, const auto& b) {
      return a->score > b->score;
    });

    uint32_t deviceIndex = 0;
    if (const char* envStr = getenv("RDX_DEVICE_INDEX_OVERRIDE"); envStr)
    {
      long newDeviceIndex = strtol(envStr, nullptr, 10);

      deviceIndex = uint32_t(newDeviceIndex < 0 ? 0 :
        (size_t(newDeviceIndex) >= candidates.size() ? candidates.size() - 1 : size_t(newDeviceIndex)));
    }

    RB_LOG("Device list:");
    for (uint32_t i = 0; i < candidates.size(); i++)
    {
      const RgpuDeviceCandidate& candidate = *candidates[i];
      const VkPhysicalDeviceProperties& properties = candidate.propertyChain.properties2.properties;

      std::string idxStr = (i == deviceIndex) ? "x" : RB_FMT("{}", i);

      RB_LOG("[{}] ({}) {}", idxStr, candidate.score, properties.deviceName);

      for (const std::string& msg : candidate.errorMessages)
      {
        RB_LOG("  - {}", msg);
      }
    }

    const RgpuDeviceCandidate& candidate = *candidates[deviceIndex];

    if (candidate.score == 0)
    {
      RB_ERROR("GPU not suitable");
      return false;
    }

    // print info
    const VkPhysicalDeviceProperties& properties = candidate.propertyChain.properties2.properties;

    RB_LOG("Selected device {}:", deviceIndex);
    uint32_t apiVersion = properties.apiVersion;
    {
      uint32_t major = VK_VERSION_MAJOR(apiVersion);
      uint32_t minor = VK_VERSION_MINOR(apiVersion);
      uint32_t patch = VK_VERSION_PATCH(apiVersion);
      RB_LOG("> API version: {}.{}.{}", major, minor, patch);
    }

    RB_LOG("> name: {}", properties.deviceName);

    if (const char* vendor = rgpuGetVendorName(properties.vendorID); vendor)
    {
      RB_LOG("> vendor: {}", vendor);
    }
    else
    {
      RB_LOG("> vendor: Unknown ({:#08x})", properties.vendorID);
    }

    if (candidate.driverProperties)
    {
      RB_LOG("> driver: {} ({})", candidate.propertyChain.driver.driverName,
                                  candidate.propertyChain.driver.driverInfo);
    }

    // create device
    *idevice = {};

    idevice->physicalDevice = candidate.device;
    idevice->queueFamilyIndex = candidate.queueFamilyIndex;
    idevice->minMemoryMapAlignment = properties.limits.minMemoryMapAlignment;
    idevice->properties = rgpuGetDeviceProperties(candidate.propertyChain);

    const float queuePriority = 1.0f;

    VkDeviceQueueCreateInfo queueCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .queueFamilyIndex = candidate.queueFamilyIndex,
      .queueCount = 1,
      .pQueuePriorities = &queuePriority,
    };

    VkDeviceCreateInfo deviceCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO,
      .pNext = &candidate.featureChain.features2,
      .flags = 0,
      .queueCreateInfoCount = 1,
      .pQueueCreateInfos = &queueCreateInfo,
      .enabledLayerCount = 0,
      .ppEnabledLayerNames = nullptr,
      .enabledExtensionCount = (uint32_t) candidate.enabledExtensions.size(),
      .ppEnabledExtensionNames = candidate.enabledExtensions.data(),
      .pEnabledFeatures = nullptr,
    };

    VkResult result = vkCreateDevice(
      idevice->physicalDevice,
      &deviceCreateInfo,
      nullptr,
      &idevice->logicalDevice
    );
    if (result != VK_SUCCESS)
    {
      RGPU_RETURN_ERROR("failed to create device");
    }

    volkLoadDeviceTable(&idevice->table, idevice->logicalDevice);

    idevice->table.vkGetDeviceQueue(
      idevice->logicalDevice,
      candidate.queueFamilyIndex,
      0,
      &idevice->queue
    );

    VkCommandPoolCreateInfo poolCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO,
      .pNext = nullptr,
      .flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT,
      .queueFamilyIndex = candidate.queueFamilyIndex,
    };

    result = idevice->table.vkCreateCommandPool(
      idevice->logicalDevice,
      &poolCreateInfo,
      nullptr,
      &idevice->uploadCommandPool
    );

    if (result != VK_SUCCESS)
    {
      idevice->table.vkDestroyDevice(idevice->logicalDevice, nullptr);
      RGPU_RETURN_ERROR("failed to create command pool");
    }

    VmaVulkanFunctions vmaVulkanFunctions = {
      .vkGetInstanceProcAddr = vkGetInstanceProcAddr,
      .vkGetDeviceProcAddr = vkGetDeviceProcAddr,
      .vkGetPhysicalDeviceProperties = vkGetPhysicalDeviceProperties,
      .vkGetPhysicalDeviceMemoryProperties = vkGetPhysicalDeviceMemoryProperties,
      .vkAllocateMemory = idevice->table.vkAllocateMemory,
      .vkFreeMemory = idevice->table.vkFreeMemory,
      .vkMapMemory = idevice->table.vkMapMemory,
      .vkUnmapMemory = idevice->table.vkUnmapMemory,
      .vkFlushMappedMemoryRanges = idevice->table.vkFlushMappedMemoryRanges,
      .vkInvalidateMappedMemoryRanges = idevice->table.vkInvalidateMappedMemoryRanges,
      .vkBindBufferMemory = idevice->table.vkBindBufferMemory,
      .vkBindImageMemory = idevice->table.vkBindImageMemory,
      .vkGetBufferMemoryRequirements = idevice->table.vkGetBufferMemoryRequirements,
      .vkGetImageMemoryRequirements = idevice->table.vkGetImageMemoryRequirements,
      .vkCreateBuffer = idevice->table.vkCreateBuffer,
      .vkDestroyBuffer = idevice->table.vkDestroyBuffer,
      .vkCreateImage = idevice->table.vkCreateImage,
      .vkDestroyImage = idevice->table.vkDestroyImage,
      .vkCmdCopyBuffer = idevice->table.vkCmdCopyBuffer,
      .vkGetBufferMemoryRequirements2KHR = idevice->table.vkGetBufferMemoryRequirements2,
      .vkGetImageMemoryRequirements2KHR = idevice->table.vkGetImageMemoryRequirements2,
      .vkBindBufferMemory2KHR = idevice->table.vkBindBufferMemory2,
      .vkBindImageMemory2KHR = idevice->table.vkBindImageMemory2,
      .vkGetPhysicalDeviceMemoryProperties2KHR = vkGetPhysicalDeviceMemoryProperties2,
    };

    VmaAllocatorCreateInfo allocCreateInfo = {};
    allocCreateInfo.flags = VMA_ALLOCATOR_CREATE_BUFFER_DEVICE_ADDRESS_BIT;
    allocCreateInfo.vulkanApiVersion = RGPU_MIN_VK_API_VERSION;
    allocCreateInfo.physicalDevice = idevice->physicalDevice;
    allocCreateInfo.device = idevice->logicalDevice;
    allocCreateInfo.instance = instance;
    allocCreateInfo.pVulkanFunctions = &vmaVulkanFunctions;

    result = vmaCreateAllocator(&allocCreateInfo, &idevice->allocator);

    if (result != VK_SUCCESS)
    {
      idevice->table.vkDestroyCommandPool(idevice->logicalDevice, idevice->uploadCommandPool, nullptr);
      idevice->table.vkDestroyDevice(idevice->logicalDevice, nullptr);

      RGPU_RETURN_ERROR("failed to create vma allocator");
    }

    VkPipelineCacheCreateInfo cacheCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_PIPELINE_CACHE_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .initialDataSize = 0,
      .pInitialData = nullptr
    };

    result = idevice->table.vkCreatePipelineCache(
      idevice->logicalDevice,
      &cacheCreateInfo,
      nullptr,
      &idevice->pipelineCache
    );

    if (result != VK_SUCCESS)
    {
      RB_WARN("{}:{}: {}", __FILE__, __LINE__, "failed to create pipeline cache");

      idevice->pipelineCache = VK_NULL_HANDLE;
    }

    return true;
  }

  static void rgpuDestroyIDevice(RgpuIDevice* idevice)
  {
    if (idevice->pipelineCache != VK_NULL_HANDLE)
    {
      idevice->table.vkDestroyPipelineCache(idevice->logicalDevice, idevice->pipelineCache, nullptr);
    }

    idevice->table.vkDestroyCommandPool(idevice->logicalDevice, idevice->uploadCommandPool, nullptr);

    vmaDestroyAllocator(idevice->allocator);

    idevice->table.vkDestroyDevice(idevice->logicalDevice, nullptr);
  }

  /* Context */

  RgpuContext* rgpuCreateContext(const RgpuContextCreateInfo& createInfo)
  {
    {
      std::lock_guard guard(s_volkLock);

      if (!s_volkInitialized && volkInitialize() != VK_SUCCESS)
      {
        RB_ERROR("failed to initialize volk");
        return nullptr;
      }

      s_volkInitialized = true;
    }

    uint32_t instanceVersion = volkGetInstanceVersion();
    RB_LOG("Vulkan instance:");
    RB_LOG("> version {}.{}.{}", VK_VERSION_MAJOR(instanceVersion), VK_VERSION_MINOR(instanceVersion), VK_VERSION_PATCH(instanceVersion));

    if (instanceVersion < RGPU_MIN_VK_API_VERSION)
    {
      RB_ERROR("Vulkan instance version does not match minimum of {}.{}.{}",
        VK_VERSION_MAJOR(RGPU_MIN_VK_API_VERSION), VK_VERSION_MINOR(RGPU_MIN_VK_API_VERSION),
        VK_VERSION_PATCH(RGPU_MIN_VK_API_VERSION));
      return nullptr;
    }

    std::vector<const char*> enabledLayers;
    std::vector<const char*> enabledExtensions = createInfo.instanceExtensions;
    bool debugUtilsEnabled = false;
#ifndef NDEBUG
    {
      uint32_t layerCount;
      vkEnumerateInstanceLayerProperties(&layerCount, nullptr);

      std::vector<VkLayerProperties> availableLayers(layerCount);
      vkEnumerateInstanceLayerProperties(&layerCount, availableLayers.data());

      const char* VK_LAYER_KHRONOS_VALIDATION_NAME = "VK_LAYER_KHRONOS_validation";

      if (rgpuFindLayer(VK_LAYER_KHRONOS_VALIDATION_NAME, availableLayers.size(), availableLayers.data()))
      {
        enabledLayers.push_back(VK_LAYER_KHRONOS_VALIDATION_NAME);
      }

      if (enabledLayers.size() > 0)
      {
        RB_LOG("> layers: {}", rgpuToStrings(enabledLayers));
      }
    }

    {
      uint32_t extensionCount;
      vkEnumerateInstanceExtensionProperties(nullptr, &extensionCount, nullptr);

      std::vector<VkExtensionProperties> availableExtensions(extensionCount);
      vkEnumerateInstanceExtensionProperties(nullptr, &extensionCount, availableExtensions.data());

      if (rgpuFindExtension(VK_EXT_DEBUG_UTILS_EXTENSION_NAME, availableExtensions.size(), availableExtensions.data()))
      {
        enabledExtensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
        debugUtilsEnabled = true;
      }
    }
#endif

    if (enabledExtensions.size() > 0)
    {
      RB_LOG("> extensions: {}", rgpuToStrings(enabledExtensions));
    }

    uint32_t versionVariant = 0;
    VkApplicationInfo appInfo = {
      .sType = VK_STRUCTURE_TYPE_APPLICATION_INFO,
      .pNext = nullptr,
      .pApplicationName = createInfo.appName,
      .applicationVersion = VK_MAKE_API_VERSION(versionVariant, createInfo.versionMajor, createInfo.versionMinor, createInfo.versionPatch),
      .pEngineName = "rdx",
      .engineVersion = VK_MAKE_API_VERSION(versionVariant, createInfo.versionMajor, createInfo.versionMinor, createInfo.versionPatch),
      .apiVersion = RGPU_MIN_VK_API_VERSION,
    };

    VkInstanceCreateInfo instanceCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .pApplicationInfo = &appInfo,
      .enabledLayerCount = (uint32_t) enabledLayers.size(),
      .ppEnabledLayerNames = enabledLayers.data(),
      .enabledExtensionCount = (uint32_t) enabledExtensions.size(),
      .ppEnabledExtensionNames = enabledExtensions.data(),
    };

    VkInstance instance;
    {
      VkResult result = vkCreateInstance(&instanceCreateInfo, nullptr, &instance);

      if (result != VK_SUCCESS)
      {
        RB_ERROR("{}:{}: failed to create Vulkan instance (code: {})", __FILE__, __LINE__, int(result));
        return nullptr;
      }
    }

    volkLoadInstanceOnly(instance);

    VkSurfaceKHR surface = VK_NULL_HANDLE;
    if (createInfo.createSurface)
    {
      uint64_t surfaceHandle = 0;
      if (!createInfo.createSurface((void*) instance, &surfaceHandle) || surfaceHandle == 0)
      {
        RB_ERROR("{}:{}: failed to create surface", __FILE__, __LINE__);
        vkDestroyInstance(instance, nullptr);
        return nullptr;
      }

      surface = (VkSurfaceKHR) surfaceHandle;
    }

    RgpuIDevice idevice;
    if (!rgpuCreateIDevice(instance, surface, &idevice))
    {
      if (surface != VK_NULL_HANDLE)
      {
        vkDestroySurfaceKHR(instance, surface, nullptr);
      }
      vkDestroyInstance(instance, nullptr);
      return nullptr;
    }

    RgpuContext* ctx = new RgpuContext;
    ctx->instance = instance;
    ctx->surface = surface;
    ctx->debugUtilsEnabled = debugUtilsEnabled;
    ctx->idevice = idevice;

    return ctx;
  }

  static void rgpuDestroyIBuffer(RgpuIDevice* idevice, RgpuIBuffer* ibuffer)
  {
    if (ibuffer->cpuPtr)
    {
      vmaUnmapMemory(idevice->allocator, ibuffer->allocation);
    }
    vmaDestroyBuffer(idevice->allocator, ibuffer->buffer, ibuffer->allocation);
  }

  void rgpuDestroyContext(RgpuContext* ctx)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    VkDevice device = idevice->logicalDevice;

    idevice->table.vkDeviceWaitIdle(device);

    ctx->idescriptorSetStore.forEach([&](uint64_t, RgpuIDescriptorSet& iset) {
      idevice->table.vkDestroyDescriptorPool(device, iset.pool, nullptr);
    });
    ctx->ipipelineStore.forEach([&](uint64_t, RgpuIPipeline& ipipeline) {
      idevice->table.vkDestroyPipeline(device, ipipeline.pipeline, nullptr);
    });
    ctx->iframebufferStore.forEach([&](uint64_t, RgpuIFramebuffer& iframebuffer) {
      idevice->table.vkDestroyFramebuffer(device, iframebuffer.framebuffer, nullptr);
    });
    ctx->iimageViewStore.forEach([&](uint64_t, RgpuIImageView& iview) {
      idevice->table.vkDestroyImageView(device, iview.imageView, nullptr);
    });
    ctx->iasStore.forEach([&](uint64_t, RgpuIAccelerationStructure& ias) {
      idevice->table.vkDestroyAccelerationStructureKHR(device, ias.as, nullptr);
    });
    ctx->ibufferStore.forEach([&](uint64_t, RgpuIBuffer& ibuffer) {
      rgpuDestroyIBuffer(idevice, &ibuffer);
    });
    ctx->iimageStore.forEach([&](uint64_t, RgpuIImage& iimage) {
      if (iimage.allocation != VK_NULL_HANDLE)
      {
        vmaDestroyImage(idevice->allocator, iimage.image, iimage.allocation);
      }
    });
    ctx->isamplerStore.forEach([&](uint64_t, RgpuISampler& isampler) {
      idevice->table.vkDestroySampler(device, isampler.sampler, nullptr);
    });
    ctx->ifenceStore.forEach([&](uint64_t, RgpuIFence& ifence) {
      idevice->table.vkDestroyFence(device, ifence.fence, nullptr);
    });
    ctx->isemaphoreStore.forEach([&](uint64_t, RgpuISemaphore& isemaphore) {
      idevice->table.vkDestroySemaphore(device, isemaphore.semaphore, nullptr);
    });
    ctx->icommandBufferStore.forEach([&](uint64_t, RgpuICommandBuffer& icommandBuffer) {
      idevice->table.vkFreeCommandBuffers(device, icommandBuffer.pool, 1, &icommandBuffer.commandBuffer);
    });
    ctx->ipipelineLayoutStore.forEach([&](uint64_t, RgpuIPipelineLayout& ilayout) {
      idevice->table.vkDestroyPipelineLayout(device, ilayout.layout, nullptr);
    });
    ctx->idescriptorSetLayoutStore.forEach([&](uint64_t, RgpuIDescriptorSetLayout& ilayout) {
      idevice->table.vkDestroyDescriptorSetLayout(device, ilayout.layout, nullptr);
    });
    ctx->irenderPassStore.forEach([&](uint64_t, RgpuIRenderPass& irenderPass) {
      idevice->table.vkDestroyRenderPass(device, irenderPass.renderPass, nullptr);
    });
    ctx->ishaderModuleStore.forEach([&](uint64_t, RgpuIShaderModule& ishader) {
      idevice->table.vkDestroyShaderModule(device, ishader.module, nullptr);
    });

    rgpuDestroyIDevice(idevice);

    if (ctx->surface != VK_NULL_HANDLE)
    {
      vkDestroySurfaceKHR(ctx->instance, ctx->surface, nullptr);
    }
    vkDestroyInstance(ctx->instance, nullptr);

    delete ctx;
  }

  const RgpuDeviceProperties& rgpuGetDeviceProperties(RgpuContext* ctx)
  {
    return ctx->idevice.properties;
  }

  bool rgpuHasSurface(RgpuContext* ctx)
  {
    return ctx->surface != VK_NULL_HANDLE;
  }

  void rgpuWaitIdle(RgpuContext* ctx)
  {
    RgpuIDevice* idevice = &ctx->idevice;

    idevice->table.vkDeviceWaitIdle(idevice->logicalDevice);
  }

  /* Buffers */

  static bool rgpuCreateIBuffer(RgpuIDevice* idevice,
                                const RgpuBufferCreateInfo& createInfo,
                                RgpuIBuffer* ibuffer)
  {
    VkBufferCreateInfo bufferInfo = {
      .sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .size = createInfo.size,
      .usage = (VkBufferUsageFlags) createInfo.usage,
      .sharingMode = VK_SHARING_MODE_EXCLUSIVE,
      .queueFamilyIndexCount = 0,
      .pQueueFamilyIndices = nullptr,
    };

    VmaAllocationCreateInfo allocCreateInfo = {};
    allocCreateInfo.requiredFlags = (VkMemoryPropertyFlags) createInfo.memoryProperties;

    uint64_t alignment = createInfo.alignment;
    if (rbHasFlags(createInfo.memoryProperties, RgpuMemoryProperties::HostVisible) && alignment < idevice->minMemoryMapAlignment)
    {
      alignment = idevice->minMemoryMapAlignment;
    }

    VkResult result = vmaCreateBufferWithAlignment(
      idevice->allocator,
      &bufferInfo,
      &allocCreateInfo,
      alignment,
      &ibuffer->buffer,
      &ibuffer->allocation,
      nullptr
    );

    if (result != VK_SUCCESS)
    {
      RGPU_RETURN_ERROR("failed to create buffer");
    }

    if (createInfo.debugName)
    {
      vmaSetAllocationName(idevice->allocator, ibuffer->allocation, createInfo.debugName);
    }

    if (rbHasFlags(createInfo.usage, RgpuBufferUsage::ShaderDeviceAddress))
    {
      VkBufferDeviceAddressInfoKHR addressInfo = {
        .sType = VK_STRUCTURE_TYPE_BUFFER_DEVICE_ADDRESS_INFO,
        .pNext = nullptr,
        .buffer = ibuffer->buffer,
      };

      ibuffer->gpuAddress = idevice->table.vkGetBufferDeviceAddressKHR(idevice->logicalDevice, &addressInfo);
    }

    if (rbHasFlags(createInfo.memoryProperties, RgpuMemoryProperties::HostVisible) &&
        vmaMapMemory(idevice->allocator, ibuffer->allocation, &ibuffer->cpuPtr) != VK_SUCCESS)
    {
      ibuffer->cpuPtr = nullptr;
      rgpuDestroyIBuffer(idevice, ibuffer);
      RGPU_RETURN_ERROR("failed to map buffer memory");
    }

    ibuffer->size = createInfo.size;
    ibuffer->usage = createInfo.usage;
    ibuffer->memoryProperties = createInfo.memoryProperties;

    return true;
  }

  bool rgpuCreateBuffer(RgpuContext* ctx,
                        RgpuBufferCreateInfo createInfo,
                        RgpuBuffer* buffer)
  {
    RgpuIDevice* idevice = &ctx->idevice;

    if (createInfo.size == 0)
    {
      RGPU_RETURN_ERROR("buffer size must not be zero");
    }

    uint64_t handle = rgpuStoreAllocate(ctx, ctx->ibufferStore);

    RGPU_RESOLVE_BUFFER(ctx, { handle }, ibuffer);

    if (!rgpuCreateIBuffer(idevice, createInfo, ibuffer))
    {
      rgpuStoreFree(ctx, ctx->ibufferStore, handle);
      RGPU_RETURN_ERROR("failed to create buffer");
    }

    rgpuSetObjectName(ctx, VK_OBJECT_TYPE_BUFFER, (uint64_t) ibuffer->buffer, createInfo.debugName);

    buffer->handle = handle;
    return true;
  }

  void rgpuDestroyBuffer(RgpuContext* ctx, RgpuBuffer buffer)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_BUFFER(ctx, buffer, ibuffer);

    rgpuDestroyIBuffer(idevice, ibuffer);

    rgpuStoreFree(ctx, ctx->ibufferStore, buffer.handle);
  }

  void rgpuWriteBuffer(RgpuContext* ctx, RgpuBuffer buffer, uint64_t offset, std::span<const uint8_t> data)
  {
    RGPU_RESOLVE_BUFFER(ctx, buffer, ibuffer);

    if (!ibuffer->cpuPtr)
    {
      RGPU_FATAL("buffer is not host-visible");
    }

    uint64_t end;
    if (!rbCheckedAdd(offset, uint64_t(data.size()), &end) || end > ibuffer->size)
    {
      RGPU_FATAL("buffer write out of bounds");
    }

    memcpy((uint8_t*) ibuffer->cpuPtr + offset, data.data(), data.size());
  }

  void* rgpuGetBufferCpuPtr(RgpuContext* ctx, RgpuBuffer buffer)
  {
    RGPU_RESOLVE_BUFFER(ctx, buffer, ibuffer);

    return ibuffer->cpuPtr;
  }

  uint64_t rgpuGetBufferAddress(RgpuContext* ctx, RgpuBuffer buffer)
  {
    RGPU_RESOLVE_BUFFER(ctx, buffer, ibuffer);

    return ibuffer->gpuAddress;
  }

  uint64_t rgpuGetBufferSize(RgpuContext* ctx, RgpuBuffer buffer)
  {
    RGPU_RESOLVE_BUFFER(ctx, buffer, ibuffer);

    return ibuffer->size;
  }

  /* Images */

  bool rgpuCreateImage(RgpuContext* ctx,
                       RgpuImageCreateInfo createInfo,
                       RgpuImage* image)
  {
    RgpuIDevice* idevice = &ctx->idevice;

    uint64_t handle = rgpuStoreAllocate(ctx, ctx->iimageStore);

    RGPU_RESOLVE_IMAGE(ctx, { handle }, iimage);

    VkImageCreateInfo imageCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .imageType = VK_IMAGE_TYPE_2D,
      .format = (VkFormat) createInfo.format,
      .extent = {
        .width = createInfo.width,
        .height = createInfo.height,
        .depth = 1,
      },
      .mipLevels = createInfo.mipLevels,
      .arrayLayers = createInfo.arrayLayers,
      .samples = VK_SAMPLE_COUNT_1_BIT,
      .tiling = VK_IMAGE_TILING_OPTIMAL,
      .usage = (VkImageUsageFlags) createInfo.usage,
      .sharingMode = VK_SHARING_MODE_EXCLUSIVE,
      .queueFamilyIndexCount = 0,
      .pQueueFamilyIndices = nullptr,
      .initialLayout = VK_IMAGE_LAYOUT_UNDEFINED,
    };

    VmaAllocationCreateInfo allocationCreateInfo = {};
    allocationCreateInfo.requiredFlags = VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT;

    VkResult result = vmaCreateImage(
      idevice->allocator,
      &imageCreateInfo,
      &allocationCreateInfo,
      &iimage->image,
      &iimage->allocation,
      nullptr
    );

    if (result != VK_SUCCESS)
    {
      rgpuStoreFree(ctx, ctx->iimageStore, handle);
      RGPU_RETURN_ERROR("failed to create image");
    }

    if (createInfo.debugName)
    {
      vmaSetAllocationName(idevice->allocator, iimage->allocation, createInfo.debugName);
    }

    rgpuSetObjectName(ctx, VK_OBJECT_TYPE_IMAGE, (uint64_t) iimage->image, createInfo.debugName);

    iimage->info = RgpuImageInfo {
      .extent = { createInfo.width, createInfo.height },
      .format = createInfo.format,
      .usage = createInfo.usage,
      .mipLevels = createInfo.mipLevels,
      .arrayLayers = createInfo.arrayLayers,
      .ownsMemory = true
    };

    image->handle = handle;
    return true;
  }

  bool rgpuCreateImageWithData(RgpuContext* ctx,
                               RgpuImageCreateInfo createInfo,
                               std::span<const uint8_t> data,
                               RgpuImageLayout finalLayout,
                               RgpuImage* image)
  {
    RgpuIDevice* idevice = &ctx->idevice;

    uint64_t expectedSize = uint64_t(createInfo.width) * createInfo.height * rgpuGetFormatSize(createInfo.format);
    if (expectedSize == 0 || data.size() != expectedSize)
    {
      RGPU_RETURN_ERROR("image data size does not match extent and format");
    }

    createInfo.usage |= RgpuImageUsage::TransferDst;

    if (!rgpuCreateImage(ctx, createInfo, image))
    {
      return false;
    }

    RgpuBuffer stagingBuffer;
    if (!rgpuCreateBuffer(ctx, {
                            .usage = RgpuBufferUsage::TransferSrc,
                            .memoryProperties = RgpuMemoryProperties::HostVisible | RgpuMemoryProperties::HostCoherent,
                            .size = expectedSize,
                            .debugName = "[image staging]"
                          }, &stagingBuffer))
    {
      rgpuDestroyImage(ctx, *image);
      RGPU_RETURN_ERROR("failed to create staging buffer");
    }

    rgpuWriteBuffer(ctx, stagingBuffer, 0, data);

    RGPU_RESOLVE_IMAGE(ctx, *image, iimage);
    RGPU_RESOLVE_BUFFER(ctx, stagingBuffer, istaging);

    VkImageSubresourceRange subresourceRange = {
      .aspectMask = VK_IMAGE_ASPECT_COLOR_BIT,
      .baseMipLevel = 0,
      .levelCount = 1,
      .baseArrayLayer = 0,
      .layerCount = 1,
    };

    bool result = rgpuSubmitOneShot(ctx, [&](VkCommandBuffer commandBuffer) {
      VkImageMemoryBarrier2KHR toTransfer = {
        .sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2_KHR,
        .pNext = nullptr,
        .srcStageMask = VK_PIPELINE_STAGE_2_TOP_OF_PIPE_BIT_KHR,
        .srcAccessMask = VK_ACCESS_2_NONE_KHR,
        .dstStageMask = VK_PIPELINE_STAGE_2_TRANSFER_BIT_KHR,
        .dstAccessMask = VK_ACCESS_2_TRANSFER_WRITE_BIT_KHR,
        .oldLayout = VK_IMAGE_LAYOUT_UNDEFINED,
        .newLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
        .srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED,
        .dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED,
        .image = iimage->image,
        .subresourceRange = subresourceRange,
      };

      VkDependencyInfoKHR dependencyInfo = {
        .sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO_KHR,
        .pNext = nullptr,
        .dependencyFlags = 0,
        .memoryBarrierCount = 0,
        .pMemoryBarriers = nullptr,
        .bufferMemoryBarrierCount = 0,
        .pBufferMemoryBarriers = nullptr,
        .imageMemoryBarrierCount = 1,
        .pImageMemoryBarriers = &toTransfer,
      };

      idevice->table.vkCmdPipelineBarrier2KHR(commandBuffer, &dependencyInfo);

      VkBufferImageCopy region = {
        .bufferOffset = 0,
        .bufferRowLength = 0,
        .bufferImageHeight = 0,
        .imageSubresource = {
          .aspectMask = VK_IMAGE_ASPECT_COLOR_BIT,
          .mipLevel = 0,
          .baseArrayLayer = 0,
          .layerCount = 1,
        },
        .imageOffset = { 0, 0, 0 },
        .imageExtent = { createInfo.width, createInfo.height, 1 },
      };

      idevice->table.vkCmdCopyBufferToImage(commandBuffer, istaging->buffer, iimage->image,
                                            VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);

      VkImageMemoryBarrier2KHR toFinal = toTransfer;
      toFinal.srcStageMask = VK_PIPELINE_STAGE_2_TRANSFER_BIT_KHR;
      toFinal.srcAccessMask = VK_ACCESS_2_TRANSFER_WRITE_BIT_KHR;
      toFinal.dstStageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT_KHR;
      toFinal.dstAccessMask = VK_ACCESS_2_MEMORY_READ_BIT_KHR;
      toFinal.oldLayout = VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL;
      toFinal.newLayout = (VkImageLayout) finalLayout;

      dependencyInfo.pImageMemoryBarriers = &toFinal;

      idevice->table.vkCmdPipelineBarrier2KHR(commandBuffer, &dependencyInfo);
    });

    rgpuDestroyBuffer(ctx, stagingBuffer);

    if (!result)
    {
      rgpuDestroyImage(ctx, *image);
      RGPU_RETURN_ERROR("failed to upload image data");
    }

    return true;
  }

  void rgpuDestroyImage(RgpuContext* ctx, RgpuImage image)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_IMAGE(ctx, image, iimage);

    // Swapchain images are owned by their swapchain.
    if (iimage->allocation != VK_NULL_HANDLE)
    {
      vmaDestroyImage(idevice->allocator, iimage->image, iimage->allocation);
    }

    rgpuStoreFree(ctx, ctx->iimageStore, image.handle);
  }

  RgpuImageInfo rgpuGetImageInfo(RgpuContext* ctx, RgpuImage image)
  {
    RGPU_RESOLVE_IMAGE(ctx, image, iimage);

    return iimage->info;
  }

  bool rgpuWrapSwapchainImage(RgpuContext* ctx, VkImage vkImage, RgpuFormat format,
                              RgpuExtent2D extent, RgpuImage* image)
  {
    uint64_t handle = rgpuStoreAllocate(ctx, ctx->iimageStore);

    RGPU_RESOLVE_IMAGE(ctx, { handle }, iimage);

    iimage->image = vkImage;
    iimage->allocation = VK_NULL_HANDLE;
    iimage->info = RgpuImageInfo {
      .extent = extent,
      .format = format,
      .usage = RgpuImageUsage::ColorAttachment,
      .mipLevels = 1,
      .arrayLayers = 1,
      .ownsMemory = false
    };

    image->handle = handle;
    return true;
  }

  bool rgpuCreateImageView(RgpuContext* ctx,
                           RgpuImageViewCreateInfo createInfo,
                           RgpuImageView* imageView)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_IMAGE(ctx, createInfo.image, iimage);

    uint64_t handle = rgpuStoreAllocate(ctx, ctx->iimageViewStore);

    RGPU_RESOLVE_IMAGE_VIEW(ctx, { handle }, iview);

    VkImageViewCreateInfo imageViewCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .image = iimage->image,
      .viewType = createInfo.arrayLayerCount > 1 ? VK_IMAGE_VIEW_TYPE_2D_ARRAY : VK_IMAGE_VIEW_TYPE_2D,
      .format = (VkFormat) iimage->info.format,
      .components = {
        .r = VK_COMPONENT_SWIZZLE_IDENTITY,
        .g = VK_COMPONENT_SWIZZLE_IDENTITY,
        .b = VK_COMPONENT_SWIZZLE_IDENTITY,
        .a = VK_COMPONENT_SWIZZLE_IDENTITY,
      },
      .subresourceRange = {
        .aspectMask = (VkImageAspectFlags) createInfo.aspect,
        .baseMipLevel = createInfo.baseMipLevel,
        .levelCount = createInfo.mipLevelCount,
        .baseArrayLayer = createInfo.baseArrayLayer,
        .layerCount = createInfo.arrayLayerCount,
      },
    };

    VkResult result = idevice->table.vkCreateImageView(
      idevice->logicalDevice,
      &imageViewCreateInfo,
      nullptr,
      &iview->imageView
    );
    if (result != VK_SUCCESS)
    {
      rgpuStoreFree(ctx, ctx->iimageViewStore, handle);
      RGPU_RETURN_ERROR("failed to create image view");
    }

    iview->image = createInfo.image;
    iview->aspect = createInfo.aspect;

    imageView->handle = handle;
    return true;
  }

  void rgpuDestroyImageView(RgpuContext* ctx, RgpuImageView imageView)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_IMAGE_VIEW(ctx, imageView, iview);

    idevice->table.vkDestroyImageView(idevice->logicalDevice, iview->imageView, nullptr);

    rgpuStoreFree(ctx, ctx->iimageViewStore, imageView.handle);
  }

  bool rgpuCreateSampler(RgpuContext* ctx,
                         RgpuSamplerCreateInfo createInfo,
                         RgpuSampler* sampler)
  {
    RgpuIDevice* idevice = &ctx->idevice;

    uint64_t handle = rgpuStoreAllocate(ctx, ctx->isamplerStore);

    RGPU_RESOLVE_SAMPLER(ctx, { handle }, isampler);

    VkSamplerCreateInfo samplerCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .magFilter = (VkFilter) createInfo.magFilter,
      .minFilter = (VkFilter) createInfo.minFilter,
      .mipmapMode = VK_SAMPLER_MIPMAP_MODE_LINEAR,
      .addressModeU = (VkSamplerAddressMode) createInfo.addressModeU,
      .addressModeV = (VkSamplerAddressMode) createInfo.addressModeV,
      .addressModeW = (VkSamplerAddressMode) createInfo.addressModeW,
      .mipLodBias = 0.0f,
      .anisotropyEnable = VK_FALSE,
      .maxAnisotropy = 1.0f,
      .compareEnable = VK_FALSE,
      .compareOp = VK_COMPARE_OP_NEVER,
      .minLod = 0.0f,
      .maxLod = VK_LOD_CLAMP_NONE,
      .borderColor = VK_BORDER_COLOR_FLOAT_TRANSPARENT_BLACK,
      .unnormalizedCoordinates = VK_FALSE,
    };

    VkResult result = idevice->table.vkCreateSampler(
      idevice->logicalDevice,
      &samplerCreateInfo,
      nullptr,
      &isampler->sampler
    );

    if (result != VK_SUCCESS)
    {
      rgpuStoreFree(ctx, ctx->isamplerStore, handle);
      RGPU_RETURN_ERROR("failed to create sampler");
    }

    sampler->handle = handle;
    return true;
  }

  void rgpuDestroySampler(RgpuContext* ctx, RgpuSampler sampler)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_SAMPLER(ctx, sampler, isampler);

    idevice->table.vkDestroySampler(idevice->logicalDevice, isampler->sampler, nullptr);

    rgpuStoreFree(ctx, ctx->isamplerStore, sampler.handle);
  }

  /* Synchronization */

  bool rgpuCreateFence(RgpuContext* ctx, bool signaled, RgpuFence* fence)
  {
    RgpuIDevice* idevice = &ctx->idevice;

    uint64_t handle = rgpuStoreAllocate(ctx, ctx->ifenceStore);

    RGPU_RESOLVE_FENCE(ctx, { handle }, ifence);

    VkFenceCreateInfo createInfo = {
      .sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO,
      .pNext = nullptr,
      .flags = signaled ? VkFenceCreateFlags(VK_FENCE_CREATE_SIGNALED_BIT) : VkFenceCreateFlags(0),
    };

    VkResult result = idevice->table.vkCreateFence(
      idevice->logicalDevice,
      &createInfo,
      nullptr,
      &ifence->fence
    );

    if (result != VK_SUCCESS)
    {
      rgpuStoreFree(ctx, ctx->ifenceStore, handle);
      RGPU_RETURN_ERROR("failed to create fence");
    }

    fence->handle = handle;
    return true;
  }

  void rgpuDestroyFence(RgpuContext* ctx, RgpuFence fence)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_FENCE(ctx, fence, ifence);

    idevice->table.vkDestroyFence(idevice->logicalDevice, ifence->fence, nullptr);

    rgpuStoreFree(ctx, ctx->ifenceStore, fence.handle);
  }

  bool rgpuWaitFence(RgpuContext* ctx, RgpuFence fence)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_FENCE(ctx, fence, ifence);

    VkResult result = idevice->table.vkWaitForFences(idevice->logicalDevice, 1, &ifence->fence, VK_TRUE, UINT64_MAX);

    if (result != VK_SUCCESS)
    {
      RGPU_RETURN_ERROR("failed to wait for fence");
    }

    return true;
  }

  bool rgpuResetFence(RgpuContext* ctx, RgpuFence fence)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_FENCE(ctx, fence, ifence);

    if (idevice->table.vkResetFences(idevice->logicalDevice, 1, &ifence->fence) != VK_SUCCESS)
    {
      RGPU_RETURN_ERROR("failed to reset fence");
    }

    return true;
  }

  bool rgpuCreateSemaphore(RgpuContext* ctx, RgpuSemaphore* semaphore)
  {
    RgpuIDevice* idevice = &ctx->idevice;

    uint64_t handle = rgpuStoreAllocate(ctx, ctx->isemaphoreStore);

    RGPU_RESOLVE_SEMAPHORE(ctx, { handle }, isemaphore);

    VkSemaphoreCreateInfo createInfo = {
      .sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
    };

    VkResult result = idevice->table.vkCreateSemaphore(
      idevice->logicalDevice,
      &createInfo,
      nullptr,
      &isemaphore->semaphore
    );

    if (result != VK_SUCCESS)
    {
      rgpuStoreFree(ctx, ctx->isemaphoreStore, handle);
      RGPU_RETURN_ERROR("failed to create semaphore");
    }

    semaphore->handle = handle;
    return true;
  }

  void rgpuDestroySemaphore(RgpuContext* ctx, RgpuSemaphore semaphore)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_SEMAPHORE(ctx, semaphore, isemaphore);

    idevice->table.vkDestroySemaphore(idevice->logicalDevice, isemaphore->semaphore, nullptr);

    rgpuStoreFree(ctx, ctx->isemaphoreStore, semaphore.handle);
  }

  /* Render passes */

  RgpuSubpassDependency rgpuGetExternalSubpassDependency()
  {
    RgpuPipelineStage attachmentStages = RgpuPipelineStage::ColorAttachmentOutput |
                                         RgpuPipelineStage::EarlyFragmentTests |
                                         RgpuPipelineStage::LateFragmentTests;

    return RgpuSubpassDependency {
      .srcStages = attachmentStages,
      .dstStages = attachmentStages,
      .srcAccess = RgpuAccess::ColorAttachmentWrite | RgpuAccess::DepthStencilAttachmentWrite,
      .dstAccess = RgpuAccess::ColorAttachmentRead | RgpuAccess::ColorAttachmentWrite |
                   RgpuAccess::DepthStencilAttachmentRead | RgpuAccess::DepthStencilAttachmentWrite
    };
  }

  bool rgpuCreateRenderPass(RgpuContext* ctx,
                            const RgpuRenderPassCreateInfo& createInfo,
                            RgpuRenderPass* renderPass)
  {
    RgpuIDevice* idevice = &ctx->idevice;

    std::vector<VkAttachmentDescription> attachments;
    attachments.reserve(createInfo.attachments.size());

    for (const RgpuAttachmentInfo& a : createInfo.attachments)
    {
      attachments.push_back(VkAttachmentDescription {
        .flags = 0,
        .format = (VkFormat) a.format,
        .samples = VK_SAMPLE_COUNT_1_BIT,
        .loadOp = (VkAttachmentLoadOp) a.loadOp,
        .storeOp = (VkAttachmentStoreOp) a.storeOp,
        .stencilLoadOp = VK_ATTACHMENT_LOAD_OP_DONT_CARE,
        .stencilStoreOp = VK_ATTACHMENT_STORE_OP_DONT_CARE,
        .initialLayout = (VkImageLayout) a.initialLayout.value_or(RgpuImageLayout::Undefined),
        .finalLayout = (VkImageLayout) a.finalLayout,
      });
    }

    std::vector<VkAttachmentReference> colorRefs;
    for (uint32_t index : createInfo.colorAttachments)
    {
      if (index >= attachments.size())
      {
        RGPU_RETURN_ERROR("color attachment index out of range");
      }

      colorRefs.push_back({ index, VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL });
    }

    VkAttachmentReference depthRef = {};
    if (createInfo.depthAttachment)
    {
      if (*createInfo.depthAttachment >= attachments.size())
      {
        RGPU_RETURN_ERROR("depth attachment index out of range");
      }

      depthRef = { *createInfo.depthAttachment, VK_IMAGE_LAYOUT_DEPTH_STENCIL_ATTACHMENT_OPTIMAL };
    }

    VkSubpassDescription subpass = {
      .flags = 0,
      .pipelineBindPoint = VK_PIPELINE_BIND_POINT_GRAPHICS,
      .inputAttachmentCount = 0,
      .pInputAttachments = nullptr,
      .colorAttachmentCount = (uint32_t) colorRefs.size(),
      .pColorAttachments = colorRefs.data(),
      .pResolveAttachments = nullptr,
      .pDepthStencilAttachment = createInfo.depthAttachment ? &depthRef : nullptr,
      .preserveAttachmentCount = 0,
      .pPreserveAttachments = nullptr,
    };

    RgpuSubpassDependency externalDependency = rgpuGetExternalSubpassDependency();

    VkSubpassDependency dependency = {
      .srcSubpass = VK_SUBPASS_EXTERNAL,
      .dstSubpass = 0,
      .srcStageMask = VkPipelineStageFlags(externalDependency.srcStages),
      .dstStageMask = VkPipelineStageFlags(externalDependency.dstStages),
      .srcAccessMask = VkAccessFlags(externalDependency.srcAccess),
      .dstAccessMask = VkAccessFlags(externalDependency.dstAccess),
      .dependencyFlags = 0,
    };

    VkRenderPassCreateInfo renderPassCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_RENDER_PASS_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .attachmentCount = (uint32_t) attachments.size(),
      .pAttachments = attachments.data(),
      .subpassCount = 1,
      .pSubpasses = &subpass,
      .dependencyCount = 1,
      .pDependencies = &dependency,
    };

    uint64_t handle = rgpuStoreAllocate(ctx, ctx->irenderPassStore);

    RGPU_RESOLVE_RENDER_PASS(ctx, { handle }, irenderPass);

    VkResult result = idevice->table.vkCreateRenderPass(
      idevice->logicalDevice,
      &renderPassCreateInfo,
      nullptr,
      &irenderPass->renderPass
    );

    if (result != VK_SUCCESS)
    {
      rgpuStoreFree(ctx, ctx->irenderPassStore, handle);
      RGPU_RETURN_ERROR("failed to create render pass");
    }

    irenderPass->attachmentCount = (uint32_t) attachments.size();
    irenderPass->colorAttachmentCount = (uint32_t) colorRefs.size();

    renderPass->handle = handle;
    return true;
  }

  void rgpuDestroyRenderPass(RgpuContext* ctx, RgpuRenderPass renderPass)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_RENDER_PASS(ctx, renderPass, irenderPass);

    idevice->table.vkDestroyRenderPass(idevice->logicalDevice, irenderPass->renderPass, nullptr);

    rgpuStoreFree(ctx, ctx->irenderPassStore, renderPass.handle);
  }

  uint32_t rgpuGetRenderPassAttachmentCount(RgpuContext* ctx, RgpuRenderPass renderPass)
  {
    RGPU_RESOLVE_RENDER_PASS(ctx, renderPass, irenderPass);

    return irenderPass->attachmentCount;
  }

  bool rgpuCreateFramebuffer(RgpuContext* ctx,
                             const RgpuFramebufferCreateInfo& createInfo,
                             RgpuFramebuffer* framebuffer)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_RENDER_PASS(ctx, createInfo.renderPass, irenderPass);

    if (createInfo.views.size() != irenderPass->attachmentCount)
    {
      RGPU_RETURN_ERROR("framebuffer view count does not match render pass");
    }

    std::vector<VkImageView> views;
    views.reserve(createInfo.views.size());

    for (RgpuImageView view : createInfo.views)
    {
      RGPU_RESOLVE_IMAGE_VIEW(ctx, view, iview);

      views.push_back(iview->imageView);
    }

    VkFramebufferCreateInfo framebufferCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_FRAMEBUFFER_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .renderPass = irenderPass->renderPass,
      .attachmentCount = (uint32_t) views.size(),
      .pAttachments = views.data(),
      .width = createInfo.extent.width,
      .height = createInfo.extent.height,
      .layers = 1,
    };

    uint64_t handle = rgpuStoreAllocate(ctx, ctx->iframebufferStore);

    RGPU_RESOLVE_FRAMEBUFFER(ctx, { handle }, iframebuffer);

    VkResult result = idevice->table.vkCreateFramebuffer(
      idevice->logicalDevice,
      &framebufferCreateInfo,
      nullptr,
      &iframebuffer->framebuffer
    );

    if (result != VK_SUCCESS)
    {
      rgpuStoreFree(ctx, ctx->iframebufferStore, handle);
      RGPU_RETURN_ERROR("failed to create framebuffer");
    }

    iframebuffer->extent = createInfo.extent;

    framebuffer->handle = handle;
    return true;
  }

  void rgpuDestroyFramebuffer(RgpuContext* ctx, RgpuFramebuffer framebuffer)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_FRAMEBUFFER(ctx, framebuffer, iframebuffer);

    idevice->table.vkDestroyFramebuffer(idevice->logicalDevice, iframebuffer->framebuffer, nullptr);

    rgpuStoreFree(ctx, ctx->iframebufferStore, framebuffer.handle);
  }

  RgpuExtent2D rgpuGetFramebufferExtent(RgpuContext* ctx, RgpuFramebuffer framebuffer)
  {
    RGPU_RESOLVE_FRAMEBUFFER(ctx, framebuffer, iframebuffer);

    return iframebuffer->extent;
  }

  /* Pipeline layouts & shader modules */

  bool rgpuCreatePipelineLayout(RgpuContext* ctx,
                                const RgpuPipelineLayoutCreateInfo& createInfo,
                                RgpuPipelineLayout* layout)
  {
    RgpuIDevice* idevice = &ctx->idevice;

    RgpuPipelineLayoutInterface shaderInterface = {
      .sets = {},
      .pushConstants = createInfo.pushConstants
    };

    std::vector<VkDescriptorSetLayout> setLayouts;
    for (RgpuDescriptorSetLayout setLayout : createInfo.setLayouts)
    {
      RGPU_RESOLVE_DESCRIPTOR_SET_LAYOUT(ctx, setLayout, isetLayout);

      setLayouts.push_back(isetLayout->layout);
      shaderInterface.sets.push_back(isetLayout->bindings);
    }

    std::vector<VkPushConstantRange> pushConstantRanges;
    for (const RgpuPushConstantRange& range : createInfo.pushConstants)
    {
      if (range.offset + range.size > idevice->properties.maxPushConstantsSize)
      {
        RGPU_RETURN_ERROR("push constant range exceeds device limit");
      }

      pushConstantRanges.push_back({
        .stageFlags = (VkShaderStageFlags) range.stages,
        .offset = range.offset,
        .size = range.size
      });
    }

    VkPipelineLayoutCreateInfo layoutCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_PIPELINE_LAYOUT_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .setLayoutCount = (uint32_t) setLayouts.size(),
      .pSetLayouts = setLayouts.data(),
      .pushConstantRangeCount = (uint32_t) pushConstantRanges.size(),
      .pPushConstantRanges = pushConstantRanges.data(),
    };

    uint64_t handle = rgpuStoreAllocate(ctx, ctx->ipipelineLayoutStore);

    RGPU_RESOLVE_PIPELINE_LAYOUT(ctx, { handle }, ilayout);

    VkResult result = idevice->table.vkCreatePipelineLayout(
      idevice->logicalDevice,
      &layoutCreateInfo,
      nullptr,
      &ilayout->layout
    );

    if (result != VK_SUCCESS)
    {
      rgpuStoreFree(ctx, ctx->ipipelineLayoutStore, handle);
      RGPU_RETURN_ERROR("failed to create pipeline layout");
    }

    ilayout->shaderInterface = std::move(shaderInterface);

    layout->handle = handle;
    return true;
  }

  void rgpuDestroyPipelineLayout(RgpuContext* ctx, RgpuPipelineLayout layout)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_PIPELINE_LAYOUT(ctx, layout, ilayout);

    idevice->table.vkDestroyPipelineLayout(idevice->logicalDevice, ilayout->layout, nullptr);

    rgpuStoreFree(ctx, ctx->ipipelineLayoutStore, layout.handle);
  }

  bool rgpuCreateShaderModule(RgpuContext* ctx,
                              RgpuShaderModuleCreateInfo createInfo,
                              RgpuShaderModule* shaderModule)
  {
    RgpuIDevice* idevice = &ctx->idevice;

    const uint32_t* spv = reinterpret_cast<const uint32_t*>(createInfo.code.data());

    RgpuShaderReflection reflection;
    if (!rgpuReflectShader(spv, createInfo.code.size(), &reflection))
    {
      RGPU_RETURN_ERROR("failed to reflect shader");
    }

    if (reflection.stage != int(createInfo.stage))
    {
      RGPU_RETURN_ERROR("shader entry point stage mismatch");
    }

    VkShaderModuleCreateInfo moduleCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_SHADER_MODULE_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
      .codeSize = createInfo.code.size(),
      .pCode = spv,
    };

    uint64_t handle = rgpuStoreAllocate(ctx, ctx->ishaderModuleStore);

    RGPU_RESOLVE_SHADER_MODULE(ctx, { handle }, ishader);

    VkResult result = idevice->table.vkCreateShaderModule(
      idevice->logicalDevice,
      &moduleCreateInfo,
      nullptr,
      &ishader->module
    );

    if (result != VK_SUCCESS)
    {
      rgpuStoreFree(ctx, ctx->ishaderModuleStore, handle);
      RGPU_RETURN_ERROR("failed to create shader module");
    }

    rgpuSetObjectName(ctx, VK_OBJECT_TYPE_SHADER_MODULE, (uint64_t) ishader->module, createInfo.debugName);

    ishader->stage = createInfo.stage;
    ishader->reflection = std::move(reflection);

    shaderModule->handle = handle;
    return true;
  }

  void rgpuDestroyShaderModule(RgpuContext* ctx, RgpuShaderModule shaderModule)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_SHADER_MODULE(ctx, shaderModule, ishader);

    idevice->table.vkDestroyShaderModule(idevice->logicalDevice, ishader->module, nullptr);

    rgpuStoreFree(ctx, ctx->ishaderModuleStore, shaderModule.handle);
  }

  /* Command buffers */

  bool rgpuAllocateCommandBuffer(RgpuContext* ctx, VkCommandPool pool, RgpuCommandBuffer* commandBuffer)
  {
    RgpuIDevice* idevice = &ctx->idevice;

    uint64_t handle = rgpuStoreAllocate(ctx, ctx->icommandBufferStore);

    RGPU_RESOLVE_COMMAND_BUFFER(ctx, { handle }, icommandBuffer);

    VkCommandBufferAllocateInfo allocateInfo = {
      .sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO,
      .pNext = nullptr,
      .commandPool = pool,
      .level = VK_COMMAND_BUFFER_LEVEL_PRIMARY,
      .commandBufferCount = 1,
    };

    VkResult result = idevice->table.vkAllocateCommandBuffers(
      idevice->logicalDevice,
      &allocateInfo,
      &icommandBuffer->commandBuffer
    );

    if (result != VK_SUCCESS)
    {
      rgpuStoreFree(ctx, ctx->icommandBufferStore, handle);
      RGPU_RETURN_ERROR("failed to allocate command buffer");
    }

    icommandBuffer->pool = pool;

    commandBuffer->handle = handle;
    return true;
  }

  void rgpuDestroyCommandBuffer(RgpuContext* ctx, RgpuCommandBuffer commandBuffer)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    RGPU_RESOLVE_COMMAND_BUFFER(ctx, commandBuffer, icommandBuffer);

    idevice->table.vkFreeCommandBuffers(
      idevice->logicalDevice,
      icommandBuffer->pool,
      1,
      &icommandBuffer->commandBuffer
    );

    rgpuStoreFree(ctx, ctx->icommandBufferStore, commandBuffer.handle);
  }

  void rgpuDestroyCommandPool(RgpuContext* ctx, VkCommandPool pool)
  {
    RgpuIDevice* idevice = &ctx->idevice;

    std::vector<uint64_t> handles;
    {
      std::lock_guard guard(ctx->storeMutex);

      ctx->icommandBufferStore.forEach([&](uint64_t handle, RgpuICommandBuffer& icommandBuffer) {
        if (icommandBuffer.pool == pool)
        {
          handles.push_back(handle);
        }
      });
    }

    for (uint64_t handle : handles)
    {
      rgpuDestroyCommandBuffer(ctx, { handle });
    }

    idevice->table.vkDestroyCommandPool(idevice->logicalDevice, pool, nullptr);
  }

  bool rgpuBeginOneShot(RgpuContext* ctx, VkCommandBuffer* commandBuffer)
  {
    RgpuIDevice* idevice = &ctx->idevice;

    VkCommandBufferAllocateInfo allocateInfo = {
      .sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO,
      .pNext = nullptr,
      .commandPool = idevice->uploadCommandPool,
      .level = VK_COMMAND_BUFFER_LEVEL_PRIMARY,
      .commandBufferCount = 1,
    };

    if (idevice->table.vkAllocateCommandBuffers(idevice->logicalDevice, &allocateInfo, commandBuffer) != VK_SUCCESS)
    {
      RGPU_RETURN_ERROR("failed to allocate command buffer");
    }

    VkCommandBufferBeginInfo beginInfo = {
      .sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO,
      .pNext = nullptr,
      .flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT,
      .pInheritanceInfo = nullptr,
    };

    if (idevice->table.vkBeginCommandBuffer(*commandBuffer, &beginInfo) != VK_SUCCESS)
    {
      idevice->table.vkFreeCommandBuffers(idevice->logicalDevice, idevice->uploadCommandPool, 1, commandBuffer);
      RGPU_RETURN_ERROR("failed to begin command buffer");
    }

    return true;
  }

  bool rgpuEndOneShot(RgpuContext* ctx, VkCommandBuffer commandBuffer)
  {
    RgpuIDevice* idevice = &ctx->idevice;
    VkDevice device = idevice->logicalDevice;

    const auto freeCommandBuffer = [&]() {
      idevice->table.vkFreeCommandBuffers(device, idevice->uploadCommandPool, 1, &commandBuffer);
    };

    if (idevice->table.vkEndCommandBuffer(commandBuffer) != VK_SUCCESS)
    {
      freeCommandBuffer();
      RGPU_RETURN_ERROR("failed to end command buffer");
    }

    VkFenceCreateInfo fenceCreateInfo = {
      .sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO,
      .pNext = nullptr,
      .flags = 0,
    };

    VkFence fence;
    if (idevice->table.vkCreateFence(device, &fenceCreateInfo, nullptr, &fence) != VK_SUCCESS)
    {
      freeCommandBuffer();
      RGPU_RETURN_ERROR("failed to create fence");
    }

    VkCommandBufferSubmitInfoKHR commandBufferSubmitInfo = {
      .sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO_KHR,
      .pNext = nullptr,
      .commandBuffer = commandBuffer,
      .deviceMask = 0,
    };

    VkSubmitInfo2KHR submitInfo = {
      .sType = VK_STRUCTURE_TYPE_SUBMIT_INFO_2_KHR,
      .pNext = nullptr,
      .flags = 0,
      .waitSemaphoreInfoCount = 0,
      .pWaitSemaphoreInfos = nullptr,
      .commandBufferInfoCount = 1,
      .pCommandBufferInfos = &commandBufferSubmitInfo,
      .signalSemaphoreInfoCount = 0,
      .pSignalSemaphoreInfos = nullptr,
    };

    bool success = idevice->table.vkQueueSubmit2KHR(idevice->queue, 1, &submitInfo, fence) == VK_SUCCESS &&
                   idevice->table.vkWaitForFences(device, 1, &fence, VK_TRUE, UINT64_MAX) == VK_SUCCESS;

    idevice->table.vkDestroyFence(device, fence, nullptr);
    freeCommandBuffer();

    if (!success)
    {
      RGPU_RETURN_ERROR("failed to submit one-shot command buffer");
    }

    return true;
  }
}
