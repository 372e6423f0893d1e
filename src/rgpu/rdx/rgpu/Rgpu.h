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

#include <stdint.h>
#include <stddef.h>

#include <array>
#include <functional>
#include <optional>
#include <span>
#include <variant>
#include <vector>

#include <rdx/rb/Enum.h>

namespace rdx
{
  constexpr static const uint64_t RGPU_WHOLE_SIZE = ~0ULL;
  constexpr static const uint32_t RGPU_SHADER_UNUSED = ~0U;
  constexpr static const uint32_t RGPU_QUEUE_FAMILY_IGNORED = ~0U;
  constexpr static const uint32_t RGPU_AS_INSTANCE_SIZE = 64;

  // Enum values match their Vulkan counterparts so they can be cast directly.

  enum class RgpuBufferUsage
  {
    TransferSrc = 0x00000001,
    TransferDst = 0x00000002,
    Uniform = 0x00000010,
    Storage = 0x00000020,
    Index = 0x00000040,
    Vertex = 0x00000080,
    ShaderBindingTable = 0x00000400,
    ShaderDeviceAddress = 0x00020000,
    AccelerationStructureBuildInput = 0x00080000,
    AccelerationStructureStorage = 0x00100000
  };
  RB_DECLARE_FLAG_OPS(RgpuBufferUsage);

  enum class RgpuMemoryProperties
  {
    DeviceLocal = 0x00000001,
    HostVisible = 0x00000002,
    HostCoherent = 0x00000004,
    HostCached = 0x00000008
  };
  RB_DECLARE_FLAG_OPS(RgpuMemoryProperties);

  enum class RgpuImageUsage
  {
    TransferSrc = 0x00000001,
    TransferDst = 0x00000002,
    Sampled = 0x00000004,
    Storage = 0x00000008,
    ColorAttachment = 0x00000010,
    DepthStencilAttachment = 0x00000020
  };
  RB_DECLARE_FLAG_OPS(RgpuImageUsage);

  enum class RgpuFormat
  {
    Undefined = 0,
    R8G8B8A8Unorm = 37,
    R8G8B8A8Srgb = 43,
    B8G8R8A8Unorm = 44,
    B8G8R8A8Srgb = 50,
    R16G16B16A16Sfloat = 97,
    R32G32Sfloat = 103,
    R32G32B32Sfloat = 106,
    R32G32B32A32Sfloat = 109,
    D32Sfloat = 126
  };

  enum class RgpuImageLayout
  {
    Undefined = 0,
    General = 1,
    ColorAttachmentOptimal = 2,
    DepthStencilAttachmentOptimal = 3,
    ShaderReadOnlyOptimal = 5,
    TransferSrcOptimal = 6,
    TransferDstOptimal = 7,
    PresentSrc = 1000001002
  };

  enum class RgpuImageAspect
  {
    Color = 0x00000001,
    Depth = 0x00000002,
    Stencil = 0x00000004
  };
  RB_DECLARE_FLAG_OPS(RgpuImageAspect);

  enum class RgpuShaderStage
  {
    Vertex = 0x00000001,
    Fragment = 0x00000010,
    Compute = 0x00000020,
    RayGen = 0x00000100,
    AnyHit = 0x00000200,
    ClosestHit = 0x00000400,
    Miss = 0x00000800,
    Intersection = 0x00001000,
    Callable = 0x00002000
  };
  RB_DECLARE_FLAG_OPS(RgpuShaderStage);

  enum class RgpuPipelineStage
  {
    None = 0,
    TopOfPipe = 0x00000001,
    VertexInput = 0x00000004,
    VertexShader = 0x00000008,
    FragmentShader = 0x00000080,
    EarlyFragmentTests = 0x00000100,
    LateFragmentTests = 0x00000200,
    ColorAttachmentOutput = 0x00000400,
    ComputeShader = 0x00000800,
    Transfer = 0x00001000,
    BottomOfPipe = 0x00002000,
    Host = 0x00004000,
    AllGraphics = 0x00008000,
    AllCommands = 0x00010000,
    RayTracingShader = 0x00200000,
    AccelerationStructureBuild = 0x02000000
  };
  RB_DECLARE_FLAG_OPS(RgpuPipelineStage);

  enum class RgpuAccess
  {
    None = 0,
    IndexRead = 0x00000002,
    VertexAttributeRead = 0x00000004,
    UniformRead = 0x00000008,
    ShaderRead = 0x00000020,
    ShaderWrite = 0x00000040,
    ColorAttachmentRead = 0x00000080,
    ColorAttachmentWrite = 0x00000100,
    DepthStencilAttachmentRead = 0x00000200,
    DepthStencilAttachmentWrite = 0x00000400,
    TransferRead = 0x00000800,
    TransferWrite = 0x00001000,
    HostRead = 0x00002000,
    HostWrite = 0x00004000,
    MemoryRead = 0x00008000,
    MemoryWrite = 0x00010000,
    AccelerationStructureRead = 0x00200000,
    AccelerationStructureWrite = 0x00400000
  };
  RB_DECLARE_FLAG_OPS(RgpuAccess);

  enum class RgpuDescriptorType
  {
    Sampler = 0,
    CombinedImageSampler = 1,
    SampledImage = 2,
    StorageImage = 3,
    UniformBuffer = 6,
    StorageBuffer = 7,
    AccelerationStructure = 1000150000
  };

  enum class RgpuDescriptorSetLayoutFlags
  {
    None = 0,
    UpdateAfterBindPool = 0x00000002
  };
  RB_DECLARE_FLAG_OPS(RgpuDescriptorSetLayoutFlags);

  enum class RgpuLoadOp
  {
    Load = 0,
    Clear = 1,
    DontCare = 2
  };

  enum class RgpuStoreOp
  {
    Store = 0,
    DontCare = 1
  };

  enum class RgpuIndexType
  {
    Uint16 = 0,
    Uint32 = 1
  };

  enum class RgpuPipelineBindPoint
  {
    Graphics = 0,
    RayTracing = 1000165000
  };

  enum class RgpuAccelerationStructureLevel
  {
    Top = 0,
    Bottom = 1
  };

  enum class RgpuAsBuildFlags
  {
    None = 0,
    AllowUpdate = 0x00000001,
    AllowCompaction = 0x00000002,
    PreferFastTrace = 0x00000004,
    PreferFastBuild = 0x00000008,
    LowMemory = 0x00000010
  };
  RB_DECLARE_FLAG_OPS(RgpuAsBuildFlags);

  enum class RgpuAsBuildMode
  {
    Build = 0,
    Update = 1
  };

  enum class RgpuGeometryFlags
  {
    None = 0,
    Opaque = 0x00000001,
    NoDuplicateAnyHitInvocation = 0x00000002
  };
  RB_DECLARE_FLAG_OPS(RgpuGeometryFlags);

  enum class RgpuAsInstanceFlags
  {
    None = 0,
    TriangleFacingCullDisable = 0x00000001,
    TriangleFlipFacing = 0x00000002,
    ForceOpaque = 0x00000004,
    ForceNoOpaque = 0x00000008
  };
  RB_DECLARE_FLAG_OPS(RgpuAsInstanceFlags);

  enum class RgpuFilter
  {
    Nearest = 0,
    Linear = 1
  };

  enum class RgpuSamplerAddressMode
  {
    Repeat = 0,
    MirrorRepeat = 1,
    ClampToEdge = 2,
    ClampToBorder = 3
  };

  enum class RgpuCullMode
  {
    None = 0,
    Front = 1,
    Back = 2
  };

  enum class RgpuFrontFace
  {
    CounterClockwise = 0,
    Clockwise = 1
  };

  enum class RgpuShaderGroupType
  {
    General = 0,
    TrianglesHit = 1
  };

  struct RgpuBuffer              { uint64_t handle = 0; bool operator==(const RgpuBuffer&) const = default; };
  struct RgpuImage               { uint64_t handle = 0; bool operator==(const RgpuImage&) const = default; };
  struct RgpuImageView           { uint64_t handle = 0; bool operator==(const RgpuImageView&) const = default; };
  struct RgpuSampler             { uint64_t handle = 0; bool operator==(const RgpuSampler&) const = default; };
  struct RgpuFence               { uint64_t handle = 0; bool operator==(const RgpuFence&) const = default; };
  struct RgpuSemaphore           { uint64_t handle = 0; bool operator==(const RgpuSemaphore&) const = default; };
  struct RgpuRenderPass          { uint64_t handle = 0; bool operator==(const RgpuRenderPass&) const = default; };
  struct RgpuFramebuffer         { uint64_t handle = 0; bool operator==(const RgpuFramebuffer&) const = default; };
  struct RgpuPipelineLayout      { uint64_t handle = 0; bool operator==(const RgpuPipelineLayout&) const = default; };
  struct RgpuPipeline            { uint64_t handle = 0; bool operator==(const RgpuPipeline&) const = default; };
  struct RgpuDescriptorSetLayout { uint64_t handle = 0; bool operator==(const RgpuDescriptorSetLayout&) const = default; };
  struct RgpuDescriptorSet       { uint64_t handle = 0; bool operator==(const RgpuDescriptorSet&) const = default; };
  struct RgpuShaderModule        { uint64_t handle = 0; bool operator==(const RgpuShaderModule&) const = default; };
  struct RgpuAccelerationStructure { uint64_t handle = 0; bool operator==(const RgpuAccelerationStructure&) const = default; };
  struct RgpuCommandBuffer       { uint64_t handle = 0; bool operator==(const RgpuCommandBuffer&) const = default; };

  struct RgpuContext;

  struct RgpuExtent2D
  {
    uint32_t width;
    uint32_t height;

    bool operator==(const RgpuExtent2D&) const = default;
  };

  // Receives the VkInstance and writes the VkSurfaceKHR created by the host's window system.
  using RgpuSurfaceCreateFunc = std::function<bool(void* instance, uint64_t* surface)>;

  struct RgpuContextCreateInfo
  {
    const char* appName;
    uint32_t versionMajor = 0;
    uint32_t versionMinor = 1;
    uint32_t versionPatch = 0;
    std::vector<const char*> instanceExtensions;
    RgpuSurfaceCreateFunc createSurface; // headless if empty
  };

  struct RgpuDeviceProperties
  {
    uint32_t maxPushConstantsSize;
    uint32_t minAccelerationStructureScratchOffsetAlignment;
    uint64_t minUniformBufferOffsetAlignment;
    uint32_t shaderGroupBaseAlignment;
    uint32_t shaderGroupHandleAlignment;
    uint32_t shaderGroupHandleSize;
    uint32_t maxRayRecursionDepth;
  };

  struct RgpuBufferCreateInfo
  {
    RgpuBufferUsage usage;
    RgpuMemoryProperties memoryProperties;
    uint64_t size;
    uint64_t alignment = 0; // no explicit alignment
    const char* debugName = nullptr;
  };

  struct RgpuImageCreateInfo
  {
    uint32_t width;
    uint32_t height;
    RgpuFormat format = RgpuFormat::R8G8B8A8Unorm;
    RgpuImageUsage usage = RgpuImageUsage::TransferDst | RgpuImageUsage::Sampled;
    uint32_t mipLevels = 1;
    uint32_t arrayLayers = 1;
    const char* debugName = nullptr;
  };

  struct RgpuImageInfo
  {
    RgpuExtent2D extent;
    RgpuFormat format;
    RgpuImageUsage usage;
    uint32_t mipLevels;
    uint32_t arrayLayers;
    bool ownsMemory; // false for swapchain images
  };

  struct RgpuImageViewCreateInfo
  {
    RgpuImage image;
    RgpuImageAspect aspect = RgpuImageAspect::Color;
    uint32_t baseMipLevel = 0;
    uint32_t mipLevelCount = 1;
    uint32_t baseArrayLayer = 0;
    uint32_t arrayLayerCount = 1;
  };

  struct RgpuSamplerCreateInfo
  {
    RgpuFilter magFilter = RgpuFilter::Linear;
    RgpuFilter minFilter = RgpuFilter::Linear;
    RgpuSamplerAddressMode addressModeU = RgpuSamplerAddressMode::ClampToEdge;
    RgpuSamplerAddressMode addressModeV = RgpuSamplerAddressMode::ClampToEdge;
    RgpuSamplerAddressMode addressModeW = RgpuSamplerAddressMode::ClampToEdge;
  };

  struct RgpuAttachmentInfo
  {
    RgpuFormat format;
    RgpuLoadOp loadOp;
    RgpuStoreOp storeOp;
    std::optional<RgpuImageLayout> initialLayout; // empty: contents are discarded
    RgpuImageLayout finalLayout;
  };

  struct RgpuSubpassDependency
  {
    RgpuPipelineStage srcStages;
    RgpuPipelineStage dstStages;
    RgpuAccess srcAccess;
    RgpuAccess dstAccess;
  };

  struct RgpuRenderPassCreateInfo
  {
    std::vector<RgpuAttachmentInfo> attachments;
    std::vector<uint32_t> colorAttachments;
    std::optional<uint32_t> depthAttachment;
  };

  struct RgpuFramebufferCreateInfo
  {
    RgpuRenderPass renderPass;
    std::vector<RgpuImageView> views;
    RgpuExtent2D extent;
  };

  struct RgpuDescriptorSetLayoutBinding
  {
    uint32_t binding;
    RgpuDescriptorType type;
    uint32_t count = 1;
    RgpuShaderStage stages;
  };

  struct RgpuDescriptorSetLayoutCreateInfo
  {
    RgpuDescriptorSetLayoutFlags flags = RgpuDescriptorSetLayoutFlags::None;
    std::vector<RgpuDescriptorSetLayoutBinding> bindings;
  };

  struct RgpuDescriptorPoolSize
  {
    RgpuDescriptorType type;
    uint32_t count;

    bool operator==(const RgpuDescriptorPoolSize&) const = default;
  };

  struct RgpuDescriptorImageInfo
  {
    RgpuSampler sampler;
    RgpuImageView view;
    RgpuImageLayout layout;
  };

  struct RgpuDescriptorBufferInfo
  {
    RgpuBuffer buffer;
    uint64_t offset = 0;
    uint64_t range = RGPU_WHOLE_SIZE;
  };

  struct RgpuDescriptorWrite
  {
    uint32_t binding;
    uint32_t arrayElement = 0;
    RgpuDescriptorType type;
    std::vector<RgpuDescriptorImageInfo> images;
    std::vector<RgpuDescriptorBufferInfo> buffers;
    std::vector<RgpuAccelerationStructure> accelerationStructures;
  };

  struct RgpuPushConstantRange
  {
    RgpuShaderStage stages;
    uint32_t offset;
    uint32_t size;
  };

  struct RgpuPipelineLayoutCreateInfo
  {
    std::vector<RgpuDescriptorSetLayout> setLayouts;
    std::vector<RgpuPushConstantRange> pushConstants;
  };

  struct RgpuShaderModuleCreateInfo
  {
    std::span<const uint8_t> code;
    RgpuShaderStage stage;
    const char* debugName = nullptr;
  };

  struct RgpuVertexBinding
  {
    uint32_t binding;
    uint32_t stride;
  };

  struct RgpuVertexAttribute
  {
    uint32_t location;
    uint32_t binding;
    RgpuFormat format;
    uint32_t offset;
  };

  struct RgpuGraphicsPipelineCreateInfo
  {
    RgpuPipelineLayout layout;
    RgpuRenderPass renderPass;
    uint32_t subpass = 0;
    RgpuShaderModule vertexShader;
    RgpuShaderModule fragmentShader;
    std::vector<RgpuVertexBinding> vertexBindings;
    std::vector<RgpuVertexAttribute> vertexAttributes;
    RgpuFrontFace frontFace = RgpuFrontFace::CounterClockwise;
    RgpuCullMode cullMode = RgpuCullMode::None;
    bool depthTest = false;
    bool blend = false; // premultiplied alpha
    const char* debugName = nullptr;
  };

  // Shader indices refer to RgpuRayTracingPipelineCreateInfo::shaders.
  struct RgpuRayTracingShaderGroup
  {
    RgpuShaderGroupType type;
    uint32_t generalShader = RGPU_SHADER_UNUSED;
    uint32_t closestHitShader = RGPU_SHADER_UNUSED;
    uint32_t anyHitShader = RGPU_SHADER_UNUSED;
  };

  struct RgpuRayTracingPipelineCreateInfo
  {
    RgpuPipelineLayout layout;
    std::vector<RgpuShaderModule> shaders;
    std::vector<RgpuRayTracingShaderGroup> groups;
    uint32_t maxRecursionDepth = 1;
    const char* debugName = nullptr;
  };

  struct RgpuBufferRegion
  {
    RgpuBuffer buffer;
    uint64_t offset = 0;
    uint64_t size;
    uint64_t stride = 0;
  };

  struct RgpuShaderBindingTableCreateInfo
  {
    uint32_t raygenGroup;
    std::vector<uint32_t> missGroups;
    std::vector<uint32_t> hitGroups;
    std::vector<uint32_t> callableGroups;
  };

  struct RgpuShaderBindingTable
  {
    RgpuBuffer buffer;
    std::optional<RgpuBufferRegion> raygen;
    std::optional<RgpuBufferRegion> miss;
    std::optional<RgpuBufferRegion> hit;
    std::optional<RgpuBufferRegion> callable;
  };

  struct RgpuSbtGroupCounts
  {
    uint32_t miss;
    uint32_t hit;
    uint32_t callable;
  };

  struct RgpuSbtLayout
  {
    uint64_t stride;
    uint64_t raygenOffset;
    uint64_t raygenSize;
    uint64_t missOffset;
    uint64_t missSize;
    uint64_t hitOffset;
    uint64_t hitSize;
    uint64_t callableOffset;
    uint64_t callableSize;
    uint64_t totalSize;
  };

  struct RgpuAsTrianglesDesc
  {
    uint32_t maxPrimitiveCount;
    uint32_t maxVertexCount;
    RgpuFormat vertexFormat;
    std::optional<RgpuIndexType> indexType;
  };

  struct RgpuAsInstancesDesc
  {
    uint32_t maxPrimitiveCount;
  };

  using RgpuAsGeometryDesc = std::variant<RgpuAsTrianglesDesc, RgpuAsInstancesDesc>;

  struct RgpuAsBuildSizes
  {
    uint64_t accelerationStructureSize;
    uint64_t updateScratchSize;
    uint64_t buildScratchSize;
  };

  struct RgpuAccelerationStructureCreateInfo
  {
    RgpuAccelerationStructureLevel level;
    RgpuBufferRegion region;
  };

  struct RgpuAsInstance
  {
    float transform[3][4]; // row-major 3x4
    uint32_t customIndex = 0; // 24 bits
    uint8_t mask = 0xFF;
    uint32_t sbtRecordOffset = 0; // 24 bits
    RgpuAsInstanceFlags flags = RgpuAsInstanceFlags::None;
    uint64_t blasAddress;
  };

  /* Context */

  RgpuContext* rgpuCreateContext(const RgpuContextCreateInfo& createInfo);

  void rgpuDestroyContext(RgpuContext* ctx);

  const RgpuDeviceProperties& rgpuGetDeviceProperties(RgpuContext* ctx);

  bool rgpuHasSurface(RgpuContext* ctx);

  void rgpuWaitIdle(RgpuContext* ctx);

  /* Buffers */

  bool rgpuCreateBuffer(RgpuContext* ctx,
                        RgpuBufferCreateInfo createInfo,
                        RgpuBuffer* buffer);

  void rgpuDestroyBuffer(RgpuContext* ctx, RgpuBuffer buffer);

  // Not synchronized: callers serialize writes to the same buffer.
  void rgpuWriteBuffer(RgpuContext* ctx, RgpuBuffer buffer, uint64_t offset, std::span<const uint8_t> data);

  void* rgpuGetBufferCpuPtr(RgpuContext* ctx, RgpuBuffer buffer);

  uint64_t rgpuGetBufferAddress(RgpuContext* ctx, RgpuBuffer buffer);

  uint64_t rgpuGetBufferSize(RgpuContext* ctx, RgpuBuffer buffer);

  /* Images */

  bool rgpuCreateImage(RgpuContext* ctx,
                       RgpuImageCreateInfo createInfo,
                       RgpuImage* image);

  // Uploads tightly packed texel data through a staging buffer and leaves the image in finalLayout.
  bool rgpuCreateImageWithData(RgpuContext* ctx,
                               RgpuImageCreateInfo createInfo,
                               std::span<const uint8_t> data,
                               RgpuImageLayout finalLayout,
                               RgpuImage* image);

  void rgpuDestroyImage(RgpuContext* ctx, RgpuImage image);

  RgpuImageInfo rgpuGetImageInfo(RgpuContext* ctx, RgpuImage image);

  bool rgpuCreateImageView(RgpuContext* ctx,
                           RgpuImageViewCreateInfo createInfo,
                           RgpuImageView* imageView);

  void rgpuDestroyImageView(RgpuContext* ctx, RgpuImageView imageView);

  bool rgpuCreateSampler(RgpuContext* ctx,
                         RgpuSamplerCreateInfo createInfo,
                         RgpuSampler* sampler);

  void rgpuDestroySampler(RgpuContext* ctx, RgpuSampler sampler);

  /* Synchronization */

  bool rgpuCreateFence(RgpuContext* ctx, bool signaled, RgpuFence* fence);

  void rgpuDestroyFence(RgpuContext* ctx, RgpuFence fence);

  bool rgpuWaitFence(RgpuContext* ctx, RgpuFence fence);

  bool rgpuResetFence(RgpuContext* ctx, RgpuFence fence);

  bool rgpuCreateSemaphore(RgpuContext* ctx, RgpuSemaphore* semaphore);

  void rgpuDestroySemaphore(RgpuContext* ctx, RgpuSemaphore semaphore);

  /* Render passes */

  // Dependency from previous submissions into the single subpass. Covers
  // attachment writes of an earlier pass on the same image, for both loads
  // and clears, and the acquire semaphore wait at color attachment output.
  RgpuSubpassDependency rgpuGetExternalSubpassDependency();

  bool rgpuCreateRenderPass(RgpuContext* ctx,
                            const RgpuRenderPassCreateInfo& createInfo,
                            RgpuRenderPass* renderPass);

  void rgpuDestroyRenderPass(RgpuContext* ctx, RgpuRenderPass renderPass);

  uint32_t rgpuGetRenderPassAttachmentCount(RgpuContext* ctx, RgpuRenderPass renderPass);

  bool rgpuCreateFramebuffer(RgpuContext* ctx,
                             const RgpuFramebufferCreateInfo& createInfo,
                             RgpuFramebuffer* framebuffer);

  void rgpuDestroyFramebuffer(RgpuContext* ctx, RgpuFramebuffer framebuffer);

  RgpuExtent2D rgpuGetFramebufferExtent(RgpuContext* ctx, RgpuFramebuffer framebuffer);

  /* Descriptors */

  std::vector<RgpuDescriptorPoolSize> rgpuComputeDescriptorPoolSizes(std::span<const RgpuDescriptorSetLayoutBinding> bindings);

  bool rgpuCreateDescriptorSetLayout(RgpuContext* ctx,
                                     const RgpuDescriptorSetLayoutCreateInfo& createInfo,
                                     RgpuDescriptorSetLayout* layout);

  void rgpuDestroyDescriptorSetLayout(RgpuContext* ctx, RgpuDescriptorSetLayout layout);

  // Allocates the set from a dedicated pool sized exactly for the layout's bindings.
  bool rgpuCreateDescriptorSet(RgpuContext* ctx,
                               RgpuDescriptorSetLayout layout,
                               RgpuDescriptorSet* descriptorSet);

  void rgpuDestroyDescriptorSet(RgpuContext* ctx, RgpuDescriptorSet descriptorSet);

  void rgpuUpdateDescriptorSet(RgpuContext* ctx,
                               RgpuDescriptorSet descriptorSet,
                               std::span<const RgpuDescriptorWrite> writes);

  /* Pipelines */

  bool rgpuCreatePipelineLayout(RgpuContext* ctx,
                                const RgpuPipelineLayoutCreateInfo& createInfo,
                                RgpuPipelineLayout* layout);

  void rgpuDestroyPipelineLayout(RgpuContext* ctx, RgpuPipelineLayout layout);

  bool rgpuCreateShaderModule(RgpuContext* ctx,
                              RgpuShaderModuleCreateInfo createInfo,
                              RgpuShaderModule* shaderModule);

  void rgpuDestroyShaderModule(RgpuContext* ctx, RgpuShaderModule shaderModule);

  bool rgpuCreateGraphicsPipeline(RgpuContext* ctx,
                                  const RgpuGraphicsPipelineCreateInfo& createInfo,
                                  RgpuPipeline* pipeline);

  bool rgpuCreateRayTracingPipeline(RgpuContext* ctx,
                                    const RgpuRayTracingPipelineCreateInfo& createInfo,
                                    RgpuPipeline* pipeline);

  void rgpuDestroyPipeline(RgpuContext* ctx, RgpuPipeline pipeline);

  /* Shader binding tables */

  bool rgpuComputeSbtLayout(uint32_t handleSize,
                            uint32_t baseAlignment,
                            RgpuSbtGroupCounts counts,
                            RgpuSbtLayout* layout);

  bool rgpuCreateShaderBindingTable(RgpuContext* ctx,
                                    RgpuPipeline pipeline,
                                    const RgpuShaderBindingTableCreateInfo& createInfo,
                                    RgpuShaderBindingTable* sbt);

  void rgpuDestroyShaderBindingTable(RgpuContext* ctx, const RgpuShaderBindingTable& sbt);

  /* Acceleration structures */

  void rgpuGetAccelerationStructureBuildSizes(RgpuContext* ctx,
                                              RgpuAccelerationStructureLevel level,
                                              RgpuAsBuildFlags flags,
                                              std::span<const RgpuAsGeometryDesc> geometries,
                                              RgpuAsBuildSizes* sizes);

  bool rgpuCreateAccelerationStructure(RgpuContext* ctx,
                                       RgpuAccelerationStructureCreateInfo createInfo,
                                       RgpuAccelerationStructure* as);

  void rgpuDestroyAccelerationStructure(RgpuContext* ctx, RgpuAccelerationStructure as);

  uint64_t rgpuGetAccelerationStructureAddress(RgpuContext* ctx, RgpuAccelerationStructure as);

  // Writes the 64 byte VkAccelerationStructureInstanceKHR representation.
  void rgpuPackAccelerationStructureInstance(const RgpuAsInstance& instance, uint8_t* dst);

  /* Command buffers */

  void rgpuDestroyCommandBuffer(RgpuContext* ctx, RgpuCommandBuffer commandBuffer);
}

template<>
struct std::hash<rdx::RgpuImage>
{
  size_t operator()(const rdx::RgpuImage& image) const noexcept
  {
    return std::hash<uint64_t>()(image.handle);
  }
};
