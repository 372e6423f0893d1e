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

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <rdx/rgpu/Rgpu.h>
#include <rdx/rgpu/Command.h>
#include <rdx/rgpu/DelayedResourceDestroyer.h>
#include <rdx/rgpu/Encoder.h>
#include <rdx/rgpu/Queue.h>
#include <rdx/rgpu/Swapchain.h>
#include <rdx/rb/Arena.h>
#include <rdx/rb/Log.h>
#include <rdx/rt/TestLogListener.h>

#include "ShaderReflection.h"

#include <algorithm>
#include <array>
#include <deque>
#include <fstream>
#include <set>
#include <string.h>
#include <string>
#include <vector>

#ifndef RDX_SHADER_DIR
#define RDX_SHADER_DIR "assets/shaders"
#endif

using namespace rdx;

REGISTER_LISTENER("TestLog", 1, RtTestLogListener);

// Logs every recorder call as a line of text.
class RecordingRecorder : public RgpuCommandRecorder
{
public:
  uint32_t attachmentCount = 1;
  RgpuExtent2D extent = { 640, 480 };

  std::vector<std::string> calls;

public:
  uint32_t renderPassAttachmentCount(RgpuRenderPass) override { return attachmentCount; }
  RgpuExtent2D framebufferExtent(RgpuFramebuffer) override { return extent; }
  uint64_t bufferAddress(RgpuBuffer buffer) override { return buffer.handle * 0x10000; }

  void beginRenderPass(RgpuRenderPass renderPass, RgpuFramebuffer framebuffer, RgpuRect2D area,
                       std::span<const RgpuClearValue> clears) override
  {
    calls.push_back(RB_FMT("beginRenderPass {} {} {}x{} {}", renderPass.handle, framebuffer.handle,
                           area.width, area.height, clears.size()));
  }
  void endRenderPass() override { calls.push_back("endRenderPass"); }
  void bindPipeline(RgpuPipelineBindPoint bindPoint, RgpuPipeline pipeline) override
  {
    calls.push_back(RB_FMT("bindPipeline {} {}", int(bindPoint), pipeline.handle));
  }
  void bindDescriptorSets(RgpuPipelineBindPoint, RgpuPipelineLayout layout, uint32_t firstSet,
                          std::span<const RgpuDescriptorSet> sets) override
  {
    calls.push_back(RB_FMT("bindDescriptorSets {} {} {}", layout.handle, firstSet, sets.size()));
  }
  void setViewport(const RgpuViewport& viewport) override
  {
    calls.push_back(RB_FMT("setViewport {} {}", viewport.width, viewport.height));
  }
  void setScissor(const RgpuRect2D& scissor) override
  {
    calls.push_back(RB_FMT("setScissor {} {}", scissor.width, scissor.height));
  }
  void draw(uint32_t vertexCount, uint32_t instanceCount, uint32_t firstVertex, uint32_t firstInstance) override
  {
    calls.push_back(RB_FMT("draw {} {} {} {}", vertexCount, instanceCount, firstVertex, firstInstance));
  }
  void drawIndexed(uint32_t indexCount, uint32_t instanceCount, uint32_t firstIndex,
                   int32_t vertexOffset, uint32_t firstInstance) override
  {
    calls.push_back(RB_FMT("drawIndexed {} {} {} {} {}", indexCount, instanceCount, firstIndex, vertexOffset, firstInstance));
  }
  void updateBuffer(RgpuBuffer buffer, uint64_t offset, std::span<const uint8_t> data) override
  {
    calls.push_back(RB_FMT("updateBuffer {} {} {}", buffer.handle, offset, data.size()));
  }
  void bindVertexBuffers(uint32_t firstBinding, std::span<const RgpuVertexBufferBinding> bindings) override
  {
    calls.push_back(RB_FMT("bindVertexBuffers {} {}", firstBinding, bindings.size()));
  }
  void bindIndexBuffer(RgpuBuffer buffer, uint64_t offset, RgpuIndexType type) override
  {
    calls.push_back(RB_FMT("bindIndexBuffer {} {} {}", buffer.handle, offset, int(type)));
  }
  void pushConstants(RgpuPipelineLayout layout, RgpuShaderStage, uint32_t offset, std::span<const uint8_t> data) override
  {
    calls.push_back(RB_FMT("pushConstants {} {} {}", layout.handle, offset, data.size()));
  }
  void buildAccelerationStructures(std::span<const RgpuAsBuildCall> buildCalls) override
  {
    for (const RgpuAsBuildCall& c : buildCalls)
    {
      calls.push_back(RB_FMT("buildAs {} {} {}", int(c.mode), c.dst.handle, c.geometries.size()));
    }
  }
  void traceRays(const RgpuStridedRegion& raygen, const RgpuStridedRegion& miss, const RgpuStridedRegion& hit,
                 const RgpuStridedRegion& callable, uint32_t width, uint32_t height, uint32_t depth) override
  {
    calls.push_back(RB_FMT("traceRays {:x} {:x} {:x} {} {}x{}x{}", raygen.address, miss.address, hit.address,
                           callable.size, width, height, depth));
  }
  void pipelineBarrier(const RgpuMemoryBarrier&, std::span<const RgpuImageLayoutBarrier> imageBarriers) override
  {
    std::string line = "pipelineBarrier";
    for (const RgpuImageLayoutBarrier& b : imageBarriers)
    {
      line += RB_FMT(" {}:{}->{}", b.image.handle, int(b.oldLayout), int(b.newLayout));
    }
    calls.push_back(line);
  }
};

TEST_CASE("Sbt.LayoutRespectsAlignment")
{
  RgpuSbtLayout layout;
  REQUIRE(rgpuComputeSbtLayout(32, 64, RgpuSbtGroupCounts{ .miss = 2, .hit = 1, .callable = 0 }, &layout));

  CHECK_EQ(layout.stride, 64);
  CHECK_EQ(layout.raygenOffset, 0);
  CHECK_EQ(layout.raygenSize, layout.stride);
  CHECK_EQ(layout.missOffset, 64);
  CHECK_EQ(layout.missSize, 128);
  CHECK_EQ(layout.hitOffset, 192);
  CHECK_EQ(layout.hitSize, 64);
  CHECK_EQ(layout.callableOffset, 256);
  CHECK_EQ(layout.callableSize, 0);
  CHECK_EQ(layout.totalSize, 256);

  for (uint64_t offset : { layout.missOffset, layout.hitOffset, layout.callableOffset })
  {
    CHECK_EQ(offset % 64, 0);
  }
}

TEST_CASE("Sbt.HandleLargerThanAlignment")
{
  RgpuSbtLayout layout;
  REQUIRE(rgpuComputeSbtLayout(48, 32, RgpuSbtGroupCounts{ .miss = 1, .hit = 3, .callable = 1 }, &layout));

  CHECK_EQ(layout.stride, 64);
  CHECK_EQ(layout.hitSize, 192);
  CHECK_EQ(layout.totalSize, 64 + 64 + 192 + 64);
}

TEST_CASE("Sbt.RejectsZeroHandleSizeAndOverflow")
{
  RgpuSbtLayout layout;
  CHECK_FALSE(rgpuComputeSbtLayout(0, 64, RgpuSbtGroupCounts{ 1, 1, 0 }, &layout));

  // Three regions of (2^32 - 1) * 2^31 bytes each do not fit 64 bits once summed.
  CHECK_FALSE(rgpuComputeSbtLayout(0x80000000u, 0x80000000u,
                                   RgpuSbtGroupCounts{ 0xFFFFFFFFu, 0xFFFFFFFFu, 0xFFFFFFFFu }, &layout));
}

TEST_CASE("Descriptor.PoolSizesSumPerType")
{
  std::vector<RgpuDescriptorSetLayoutBinding> bindings = {
    { .binding = 0, .type = RgpuDescriptorType::StorageImage, .count = 1, .stages = RgpuShaderStage::RayGen },
    { .binding = 1, .type = RgpuDescriptorType::StorageBuffer, .count = 2, .stages = RgpuShaderStage::RayGen },
    { .binding = 2, .type = RgpuDescriptorType::StorageImage, .count = 3, .stages = RgpuShaderStage::RayGen },
    { .binding = 3, .type = RgpuDescriptorType::UniformBuffer, .count = 0, .stages = RgpuShaderStage::RayGen },
  };

  std::vector<RgpuDescriptorPoolSize> sizes = rgpuComputeDescriptorPoolSizes(bindings);

  std::vector<RgpuDescriptorPoolSize> expected = {
    { RgpuDescriptorType::StorageImage, 4 },
    { RgpuDescriptorType::StorageBuffer, 2 },
  };
  CHECK_EQ(sizes, expected);

  CHECK(rgpuComputeDescriptorPoolSizes({}).empty());
}

TEST_CASE("AccelerationStructure.InstancePacking")
{
  RgpuAsInstance instance = {
    .transform = { { 1, 0, 0, 5 }, { 0, 1, 0, 6 }, { 0, 0, 1, 7 } },
    .customIndex = 0x1234567, // exceeds 24 bits
    .mask = 0xAB,
    .sbtRecordOffset = 5,
    .flags = RgpuAsInstanceFlags::ForceOpaque,
    .blasAddress = 0x1122334455667788ull
  };

  std::array<uint8_t, RGPU_AS_INSTANCE_SIZE> bytes;
  bytes.fill(0xCD);
  rgpuPackAccelerationStructureInstance(instance, bytes.data());

  float transform[12];
  memcpy(transform, &bytes[0], sizeof(transform));
  CHECK_EQ(transform[3], 5.0f);
  CHECK_EQ(transform[7], 6.0f);
  CHECK_EQ(transform[10], 1.0f);

  uint32_t indexAndMask, offsetAndFlags;
  uint64_t address;
  memcpy(&indexAndMask, &bytes[48], 4);
  memcpy(&offsetAndFlags, &bytes[52], 4);
  memcpy(&address, &bytes[56], 8);

  CHECK_EQ(indexAndMask, 0xAB234567u);
  CHECK_EQ(offsetAndFlags, 0x04000005u);
  CHECK_EQ(address, 0x1122334455667788ull);
}

TEST_CASE("RenderPass.ExternalDependencyCoversPriorAttachmentWrites")
{
  RgpuSubpassDependency dependency = rgpuGetExternalSubpassDependency();

  // A pass loading the color output of the previous pass on the same image.
  CHECK(rbHasFlags(dependency.srcStages, RgpuPipelineStage::ColorAttachmentOutput));
  CHECK(rbHasFlags(dependency.srcAccess, RgpuAccess::ColorAttachmentWrite));
  CHECK(rbHasFlags(dependency.dstAccess, RgpuAccess::ColorAttachmentRead | RgpuAccess::ColorAttachmentWrite));

  // A depth clear after the previous frame's depth store.
  CHECK(rbHasFlags(dependency.srcStages, RgpuPipelineStage::LateFragmentTests));
  CHECK(rbHasFlags(dependency.srcAccess, RgpuAccess::DepthStencilAttachmentWrite));
  CHECK(rbHasFlags(dependency.dstStages, RgpuPipelineStage::EarlyFragmentTests));
  CHECK(rbHasFlags(dependency.dstAccess, RgpuAccess::DepthStencilAttachmentWrite));

  // The acquire semaphore is waited on at color attachment output.
  CHECK(rbHasFlags(dependency.dstStages, RgpuPipelineStage::ColorAttachmentOutput));
}

TEST_CASE("ShaderReflection.RejectsGarbage")
{
  std::array<uint32_t, 8> words;
  words.fill(0xDEADBEEF);

  RgpuShaderReflection reflection;
  CHECK_FALSE(rgpuReflectShader(words.data(), words.size() * sizeof(uint32_t), &reflection));
}

TEST_CASE("ShaderReflection.InterfaceMatchesLayout")
{
  RgpuShaderReflection reflection = {
    .stage = int(RgpuShaderStage::RayGen),
    .pushConstantsSize = 16,
    .bindings = {
      { .set = 0, .binding = 0, .count = 1, .descriptorType = int(RgpuDescriptorType::AccelerationStructure) },
      { .set = 0, .binding = 1, .count = 1, .descriptorType = int(RgpuDescriptorType::StorageImage) }
    }
  };

  RgpuPipelineLayoutInterface layout = {
    .sets = {
      {
        { .binding = 0, .type = RgpuDescriptorType::AccelerationStructure, .stages = RgpuShaderStage::RayGen | RgpuShaderStage::ClosestHit },
        { .binding = 1, .type = RgpuDescriptorType::StorageImage, .count = 2, .stages = RgpuShaderStage::RayGen },
        { .binding = 2, .type = RgpuDescriptorType::UniformBuffer, .stages = RgpuShaderStage::Miss }
      }
    },
    .pushConstants = {
      { .stages = RgpuShaderStage::RayGen, .offset = 0, .size = 16 }
    }
  };

  std::string error;
  CHECK(rgpuCheckShaderInterface(reflection, layout, &error));

  SUBCASE("MissingSet")
  {
    reflection.bindings[1].set = 1;
    CHECK_FALSE(rgpuCheckShaderInterface(reflection, layout, &error));
    CHECK_NE(error.find("set 1"), std::string::npos);
  }
  SUBCASE("MissingBinding")
  {
    reflection.bindings[1].binding = 5;
    CHECK_FALSE(rgpuCheckShaderInterface(reflection, layout, &error));
  }
  SUBCASE("TypeMismatch")
  {
    reflection.bindings[1].descriptorType = int(RgpuDescriptorType::SampledImage);
    CHECK_FALSE(rgpuCheckShaderInterface(reflection, layout, &error));
  }
  SUBCASE("ArrayLargerThanLayout")
  {
    reflection.bindings[1].count = 3;
    CHECK_FALSE(rgpuCheckShaderInterface(reflection, layout, &error));
  }
  SUBCASE("BindingNotVisibleToStage")
  {
    reflection.bindings.push_back({ .set = 0, .binding = 2, .count = 1, .descriptorType = int(RgpuDescriptorType::UniformBuffer) });
    CHECK_FALSE(rgpuCheckShaderInterface(reflection, layout, &error));
  }
  SUBCASE("PushConstantsExceedRange")
  {
    reflection.pushConstantsSize = 20;
    CHECK_FALSE(rgpuCheckShaderInterface(reflection, layout, &error));
  }
  SUBCASE("PushConstantsOfOtherStage")
  {
    layout.pushConstants[0].stages = RgpuShaderStage::Miss;
    CHECK_FALSE(rgpuCheckShaderInterface(reflection, layout, &error));
  }
}

namespace
{
  bool readShaderWords(const char* fileName, std::vector<uint32_t>& words)
  {
    std::ifstream file(std::string(RDX_SHADER_DIR) + "/" + fileName, std::ios_base::binary | std::ios_base::ate);
    if (!file.is_open())
    {
      return false;
    }

    size_t size = file.tellg();
    file.seekg(0, std::ios_base::beg);

    words.resize(size / sizeof(uint32_t));
    file.read((char*) words.data(), words.size() * sizeof(uint32_t));
    return file.good() && !words.empty();
  }
}

TEST_CASE("ShaderReflection.ReflectsCompiledShaders")
{
  std::vector<uint32_t> uiVert;
  std::vector<uint32_t> rgen;
  if (!readShaderWords("ui.vert.spv", uiVert) || !readShaderWords("raytrace.rgen.spv", rgen))
  {
    MESSAGE("compiled shaders not found in " RDX_SHADER_DIR "; skipped");
    return;
  }

  RgpuShaderReflection reflection;
  REQUIRE(rgpuReflectShader(uiVert.data(), uiVert.size() * sizeof(uint32_t), &reflection));
  CHECK_EQ(reflection.stage, int(RgpuShaderStage::Vertex));
  CHECK_EQ(reflection.pushConstantsSize, 2 * sizeof(float));
  CHECK(reflection.bindings.empty());

  REQUIRE(rgpuReflectShader(rgen.data(), rgen.size() * sizeof(uint32_t), &reflection));
  CHECK_EQ(reflection.stage, int(RgpuShaderStage::RayGen));
  CHECK_EQ(reflection.pushConstantsSize, 0);
  REQUIRE_EQ(reflection.bindings.size(), 3);

  std::sort(reflection.bindings.begin(), reflection.bindings.end(), [](const auto& a, const auto& b) {
    return a.binding < b.binding;
  });
  CHECK_EQ(reflection.bindings[0].descriptorType, int(RgpuDescriptorType::AccelerationStructure));
  CHECK_EQ(reflection.bindings[1].descriptorType, int(RgpuDescriptorType::StorageImage));
  CHECK_EQ(reflection.bindings[2].descriptorType, int(RgpuDescriptorType::UniformBuffer));

  // The path tracer's layout without the uniform buffer binding.
  RgpuPipelineLayoutInterface layout = {
    .sets = {
      {
        { .binding = 0, .type = RgpuDescriptorType::AccelerationStructure, .stages = RgpuShaderStage::RayGen },
        { .binding = 1, .type = RgpuDescriptorType::StorageImage, .stages = RgpuShaderStage::RayGen }
      }
    },
    .pushConstants = {}
  };

  std::string error;
  CHECK_FALSE(rgpuCheckShaderInterface(reflection, layout, &error));

  layout.sets[0].push_back({ .binding = 2, .type = RgpuDescriptorType::UniformBuffer, .stages = RgpuShaderStage::RayGen });
  CHECK(rgpuCheckShaderInterface(reflection, layout, &error));
}

TEST_CASE("Encoder.ReplayIsDeterministic")
{
  RbArena arena(256);

  auto encode = [&]() {
    RgpuEncoder encoder(RgpuCommandBuffer{ 1 }, arena);

    std::array<RgpuClearValue, 1> clears = { rgpuClearColor(0.0f, 0.0f, 0.0f, 1.0f) };
    encoder.beginRenderPass(RgpuRenderPass{ 2 }, RgpuFramebuffer{ 3 }, clears);
    encoder.bindGraphicsPipeline(RgpuPipeline{ 4 });
    encoder.setViewport(RgpuViewport{ 0.0f, 0.0f, 640.0f, 480.0f });
    encoder.setScissor(RgpuRect2D{ 0, 0, 640, 480 });

    std::array<RgpuVertexBufferBinding, 2> vertexBuffers = { RgpuVertexBufferBinding{ RgpuBuffer{ 5 } },
                                                             RgpuVertexBufferBinding{ RgpuBuffer{ 6 }, 16 } };
    encoder.bindVertexBuffers(0, vertexBuffers);
    encoder.bindIndexBuffer(RgpuBuffer{ 7 }, 0, RgpuIndexType::Uint32);

    std::array<uint8_t, 16> constants = {};
    encoder.pushConstants(RgpuPipelineLayout{ 8 }, RgpuShaderStage::Vertex, 0, constants);
    encoder.drawIndexed(RgpuRange{ 0, 36 }, 0, RgpuRange{ 0, 1 });
    encoder.endRenderPass();
    return encoder;
  };

  RgpuEncoder first = encode();
  RgpuEncoder second = encode();

  RecordingRecorder a, b;
  REQUIRE(rgpuReplayCommands(first.commands(), a));
  REQUIRE(rgpuReplayCommands(second.commands(), b));

  CHECK_EQ(a.calls, b.calls);

  std::vector<std::string> expected = {
    "beginRenderPass 2 3 640x480 1",
    "bindPipeline 0 4",
    "setViewport 640 480",
    "setScissor 640 480",
    "bindVertexBuffers 0 2",
    "bindIndexBuffer 7 0 1",
    "pushConstants 8 0 16",
    "drawIndexed 36 1 0 0 0",
    "endRenderPass",
  };
  CHECK_EQ(a.calls, expected);
}

TEST_CASE("Encoder.OperandsAreCopied")
{
  RbArena arena(64);
  RgpuEncoder encoder(RgpuCommandBuffer{ 1 }, arena);

  {
    std::vector<uint8_t> data(8, 0xFF);
    encoder.updateBuffer(RgpuBuffer{ 2 }, 4, data);
    data.assign(8, 0x00);
  }

  const auto& cmd = std::get<RgpuCmdUpdateBuffer>(encoder.commands()[0]);
  REQUIRE_EQ(cmd.data.size(), 8);
  CHECK_EQ(cmd.data[0], 0xFF);
  CHECK_EQ(cmd.data[7], 0xFF);
}

TEST_CASE("Replay.ClearCountMustMatchAttachments")
{
  RbArena arena(256);
  RgpuEncoder encoder(RgpuCommandBuffer{ 1 }, arena);

  std::array<RgpuClearValue, 1> clears = { rgpuClearColor(1.0f, 0.0f, 0.0f, 1.0f) };
  encoder.beginRenderPass(RgpuRenderPass{ 2 }, RgpuFramebuffer{ 3 }, clears);
  encoder.endRenderPass();

  RecordingRecorder recorder;
  recorder.attachmentCount = 2;
  CHECK_FALSE(rgpuReplayCommands(encoder.commands(), recorder));
  CHECK(recorder.calls.empty());

  recorder.attachmentCount = 1;
  CHECK(rgpuReplayCommands(encoder.commands(), recorder));
  CHECK_EQ(recorder.calls.size(), 2);
}

TEST_CASE("Replay.InstanceCountComesFromInstanceRange")
{
  RbArena arena(64);
  RgpuEncoder encoder(RgpuCommandBuffer{ 1 }, arena);

  // Index and instance ranges differ so that mixing them up is visible.
  encoder.drawIndexed(RgpuRange{ 6, 42 }, -3, RgpuRange{ 2, 5 });
  encoder.draw(RgpuRange{ 10, 13 }, RgpuRange{ 0, 4 });

  RecordingRecorder recorder;
  REQUIRE(rgpuReplayCommands(encoder.commands(), recorder));

  std::vector<std::string> expected = {
    "drawIndexed 36 3 6 -3 2",
    "draw 3 4 10 0",
  };
  CHECK_EQ(recorder.calls, expected);
}

TEST_CASE("Replay.RejectsInvertedRange")
{
  RbArena arena(64);
  RgpuEncoder encoder(RgpuCommandBuffer{ 1 }, arena);
  encoder.draw(RgpuRange{ 5, 2 }, RgpuRange{ 0, 1 });

  RecordingRecorder recorder;
  CHECK_FALSE(rgpuReplayCommands(encoder.commands(), recorder));
}

TEST_CASE("Replay.EmptyOperandsAreDropped")
{
  RbArena arena(64);
  RgpuEncoder encoder(RgpuCommandBuffer{ 1 }, arena);

  encoder.buildAccelerationStructure({});
  encoder.bindVertexBuffers(0, {});
  encoder.updateBuffer(RgpuBuffer{ 2 }, 0, {});

  RecordingRecorder recorder;
  CHECK(rgpuReplayCommands(encoder.commands(), recorder));
  CHECK(recorder.calls.empty());
}

TEST_CASE("Replay.UpdateBufferConstraints")
{
  RbArena arena(1024);
  RecordingRecorder recorder;

  std::vector<uint8_t> unaligned(6);
  std::vector<uint8_t> tooLarge(65536 + 4);

  {
    RgpuEncoder encoder(RgpuCommandBuffer{ 1 }, arena);
    encoder.updateBuffer(RgpuBuffer{ 2 }, 0, unaligned);
    CHECK_FALSE(rgpuReplayCommands(encoder.commands(), recorder));
  }
  {
    RgpuEncoder encoder(RgpuCommandBuffer{ 1 }, arena);
    encoder.updateBuffer(RgpuBuffer{ 2 }, 0, tooLarge);
    CHECK_FALSE(rgpuReplayCommands(encoder.commands(), recorder));
  }
  CHECK(recorder.calls.empty());
}

TEST_CASE("Replay.AccelerationStructureUpdateMode")
{
  RbArena arena(256);
  RgpuEncoder encoder(RgpuCommandBuffer{ 1 }, arena);

  std::array<RgpuAsGeometry, 1> geometries = {
    RgpuAsInstances{ .instanceAddress = 0x1000, .primitiveCount = 4 }
  };

  std::array<RgpuAsBuildInfo, 2> infos = {
    RgpuAsBuildInfo{ .dst = RgpuAccelerationStructure{ 10 }, .geometries = geometries, .scratchAddress = 0x2000 },
    RgpuAsBuildInfo{ .src = RgpuAccelerationStructure{ 10 }, .dst = RgpuAccelerationStructure{ 11 },
                     .geometries = geometries, .scratchAddress = 0x3000 },
  };
  encoder.buildAccelerationStructure(infos);

  RecordingRecorder recorder;
  REQUIRE(rgpuReplayCommands(encoder.commands(), recorder));

  std::vector<std::string> expected = {
    "buildAs 0 10 1",
    "buildAs 1 11 1",
  };
  CHECK_EQ(recorder.calls, expected);
}

TEST_CASE("Replay.TraceRaysResolvesRegions")
{
  RbArena arena(64);
  RgpuEncoder encoder(RgpuCommandBuffer{ 1 }, arena);

  RgpuShaderBindingTable sbt = {
    .buffer = RgpuBuffer{ 3 },
    .raygen = RgpuBufferRegion{ .buffer = RgpuBuffer{ 3 }, .offset = 0, .size = 64, .stride = 64 },
    .miss = RgpuBufferRegion{ .buffer = RgpuBuffer{ 3 }, .offset = 64, .size = 64, .stride = 64 },
    .hit = RgpuBufferRegion{ .buffer = RgpuBuffer{ 3 }, .offset = 128, .size = 64, .stride = 64 },
    .callable = std::nullopt
  };
  encoder.traceRays(sbt, 320, 240);

  RecordingRecorder recorder;
  REQUIRE(rgpuReplayCommands(encoder.commands(), recorder));
  REQUIRE_EQ(recorder.calls.size(), 1);
  CHECK_EQ(recorder.calls[0], "traceRays 30000 30040 30080 0 320x240x1");
}

TEST_CASE("Replay.BarrierDefaultsToUndefinedLayout")
{
  RbArena arena(256);
  RgpuEncoder encoder(RgpuCommandBuffer{ 1 }, arena);

  std::array<RgpuImageBarrier, 2> barriers = {
    RgpuImageBarrier{ .image = RgpuImage{ 4 }, .newLayout = RgpuImageLayout::General },
    RgpuImageBarrier{ .image = RgpuImage{ 5 }, .oldLayout = RgpuImageLayout::General,
                      .newLayout = RgpuImageLayout::ShaderReadOnlyOptimal },
  };
  encoder.pipelineBarrier(RgpuPipelineStage::TopOfPipe, RgpuPipelineStage::RayTracingShader,
                          RgpuAccess::None, RgpuAccess::ShaderWrite, barriers);

  RecordingRecorder recorder;
  REQUIRE(rgpuReplayCommands(encoder.commands(), recorder));
  CHECK_EQ(recorder.calls, std::vector<std::string>{ "pipelineBarrier 4:0->1 5:1->5" });
}

TEST_CASE("SwapchainSemaphores.NoAliasingWhileInFlight")
{
  const uint32_t imageCount = 3;

  uint64_t nextHandle = 1;
  auto makeSemaphore = [&]() { return RgpuSemaphore{ nextHandle++ }; };

  RgpuSemaphore freeSemaphore = makeSemaphore();
  std::vector<RgpuSwapchainSemaphores::ImageSlots> slots(imageCount);
  for (auto& s : slots)
  {
    for (uint32_t i = 0; i < RgpuSwapchainSemaphores::SlotCount; i++)
    {
      s.acquire[i] = makeSemaphore();
      s.release[i] = makeSemaphore();
    }
  }

  RgpuSwapchainSemaphores semaphores(freeSemaphore, std::move(slots));

  // At most two frames are in flight, so the waits and signals of the last
  // two acquires must stay distinct from everything handed out now.
  std::deque<std::pair<RgpuSemaphore, RgpuSemaphore>> inFlight;
  uint32_t imageSequence[] = { 0, 1, 2, 2, 0, 1, 1, 1, 0, 2 };

  for (uint32_t i = 0; i < 100; i++)
  {
    uint32_t imageIndex = imageSequence[i % 10];

    RgpuSemaphore signaled = semaphores.freeSemaphore();

    RgpuSemaphore wait, signal;
    semaphores.onAcquired(imageIndex, &wait, &signal);

    CHECK_EQ(wait, signaled);
    CHECK_NE(wait, signal);
    CHECK_NE(semaphores.freeSemaphore(), wait);

    for (const auto& [prevWait, prevSignal] : inFlight)
    {
      CHECK_NE(wait, prevWait);
      CHECK_NE(signal, prevSignal);
      CHECK_NE(semaphores.freeSemaphore(), prevWait);
    }

    inFlight.push_back({ wait, signal });
    if (inFlight.size() > 2)
    {
      inFlight.pop_front();
    }
  }

  // The pool is rotated, never grown.
  std::vector<RgpuSemaphore> all = semaphores.allSemaphores();
  CHECK_EQ(all.size(), 1 + imageCount * RgpuSwapchainSemaphores::SlotCount * 2);

  std::set<uint64_t> unique;
  for (RgpuSemaphore s : all)
  {
    unique.insert(s.handle);
  }
  CHECK_EQ(unique.size(), all.size());
}

TEST_CASE("DelayedResourceDestroyer.DestroysOnFourthCycle")
{
  RgpuDelayedResourceDestroyer destroyer(nullptr);

  int destroyed = 0;
  destroyer.enqueueDestruction([&]() { destroyed++; });
  CHECK_EQ(destroyer.pendingCount(), 1);

  for (uint32_t i = 0; i < RgpuDelayedResourceDestroyer::FrameCount - 1; i++)
  {
    destroyer.nextFrame();
    destroyer.housekeep();
    CHECK_EQ(destroyed, 0);
  }

  destroyer.nextFrame();
  destroyer.housekeep();
  CHECK_EQ(destroyed, 1);
  CHECK_EQ(destroyer.pendingCount(), 0);
}

TEST_CASE("DelayedResourceDestroyer.DestroyAllRunsChainedDestructions")
{
  RgpuDelayedResourceDestroyer destroyer(nullptr);

  std::vector<int> order;
  destroyer.enqueueDestruction([&]() {
    order.push_back(1);
    destroyer.enqueueDestruction([&]() { order.push_back(2); });
  });

  destroyer.destroyAll();

  CHECK_EQ(order, std::vector<int>{ 1, 2 });
  CHECK_EQ(destroyer.pendingCount(), 0);
}

// Tests below need a ray tracing capable device. Without one they report a
// skip message and check nothing.
class DeviceFixture
{
public:
  DeviceFixture()
  {
    RgpuContextCreateInfo createInfo = {
      .appName = "rdx_rgpu_tests"
    };
    m_ctx = rgpuCreateContext(createInfo);
  }

  ~DeviceFixture()
  {
    if (m_ctx)
    {
      rgpuDestroyContext(m_ctx);
    }
  }

protected:
  bool hasDevice() const
  {
    if (!m_ctx)
    {
      MESSAGE("skipped: no ray tracing capable device");
    }
    return m_ctx != nullptr;
  }

protected:
  RgpuContext* m_ctx = nullptr;
};

TEST_CASE_FIXTURE(DeviceFixture, "Device.BuildSizesGrowWithPrimitiveCount")
{
  if (!hasDevice())
  {
    return;
  }

  auto query = [&](uint32_t primitiveCount) {
    std::array<RgpuAsGeometryDesc, 1> geometries = {
      RgpuAsTrianglesDesc{ .maxPrimitiveCount = primitiveCount, .maxVertexCount = primitiveCount * 3,
                           .vertexFormat = RgpuFormat::R32G32B32Sfloat }
    };

    RgpuAsBuildSizes sizes;
    rgpuGetAccelerationStructureBuildSizes(m_ctx, RgpuAccelerationStructureLevel::Bottom,
                                           RgpuAsBuildFlags::PreferFastTrace, geometries, &sizes);
    return sizes;
  };

  RgpuAsBuildSizes small = query(1);
  RgpuAsBuildSizes large = query(10000);

  CHECK_GT(small.accelerationStructureSize, 0);
  CHECK_GE(large.accelerationStructureSize, small.accelerationStructureSize);
  CHECK_GE(large.buildScratchSize, small.buildScratchSize);
}

TEST_CASE_FIXTURE(DeviceFixture, "Device.BuildTriangleBlas")
{
  if (!hasDevice())
  {
    return;
  }

  const RgpuDeviceProperties& properties = rgpuGetDeviceProperties(m_ctx);

  RgpuDelayedResourceDestroyer destroyer(m_ctx);

  const float vertices[] = {
    -1.0f, -1.0f, 0.0f,
     1.0f, -1.0f, 0.0f,
     0.0f,  1.0f, 0.0f
  };

  RgpuBuffer vertexBuffer;
  REQUIRE(rgpuCreateBuffer(m_ctx, RgpuBufferCreateInfo {
    .usage = RgpuBufferUsage::AccelerationStructureBuildInput | RgpuBufferUsage::ShaderDeviceAddress,
    .memoryProperties = RgpuMemoryProperties::HostVisible | RgpuMemoryProperties::HostCoherent,
    .size = sizeof(vertices)
  }, &vertexBuffer));
  rgpuWriteBuffer(m_ctx, vertexBuffer, 0, { (const uint8_t*) vertices, sizeof(vertices) });

  std::array<RgpuAsGeometryDesc, 1> descs = {
    RgpuAsTrianglesDesc{ .maxPrimitiveCount = 1, .maxVertexCount = 3, .vertexFormat = RgpuFormat::R32G32B32Sfloat }
  };

  RgpuAsBuildSizes sizes;
  rgpuGetAccelerationStructureBuildSizes(m_ctx, RgpuAccelerationStructureLevel::Bottom,
                                         RgpuAsBuildFlags::PreferFastTrace, descs, &sizes);

  RgpuBuffer storageBuffer;
  REQUIRE(rgpuCreateBuffer(m_ctx, RgpuBufferCreateInfo {
    .usage = RgpuBufferUsage::AccelerationStructureStorage | RgpuBufferUsage::ShaderDeviceAddress,
    .memoryProperties = RgpuMemoryProperties::DeviceLocal,
    .size = sizes.accelerationStructureSize
  }, &storageBuffer));

  RgpuBuffer scratchBuffer;
  REQUIRE(rgpuCreateBuffer(m_ctx, RgpuBufferCreateInfo {
    .usage = RgpuBufferUsage::Storage | RgpuBufferUsage::ShaderDeviceAddress,
    .memoryProperties = RgpuMemoryProperties::DeviceLocal,
    .size = sizes.buildScratchSize,
    .alignment = properties.minAccelerationStructureScratchOffsetAlignment
  }, &scratchBuffer));

  RgpuAccelerationStructure blas;
  REQUIRE(rgpuCreateAccelerationStructure(m_ctx, RgpuAccelerationStructureCreateInfo {
    .level = RgpuAccelerationStructureLevel::Bottom,
    .region = RgpuBufferRegion{ .buffer = storageBuffer, .size = sizes.accelerationStructureSize }
  }, &blas));

  CHECK_NE(rgpuGetAccelerationStructureAddress(m_ctx, blas), 0);

  {
    RgpuQueue queue(m_ctx, destroyer);
    RbArena arena(1024);

    std::array<RgpuAsGeometry, 1> geometries = {
      RgpuAsTriangles {
        .vertexFormat = RgpuFormat::R32G32B32Sfloat,
        .vertexAddress = rgpuGetBufferAddress(m_ctx, vertexBuffer),
        .vertexStride = sizeof(float) * 3,
        .vertexCount = 3,
        .primitiveCount = 1
      }
    };

    std::array<RgpuAsBuildInfo, 1> infos = {
      RgpuAsBuildInfo{ .dst = blas, .geometries = geometries, .scratchAddress = rgpuGetBufferAddress(m_ctx, scratchBuffer) }
    };

    RgpuEncoder encoder = queue.createEncoder(arena);
    encoder.buildAccelerationStructure(infos);
    queue.submitAndWait(std::move(encoder).finish(m_ctx));

    destroyer.destroyAll();
  }

  rgpuDestroyAccelerationStructure(m_ctx, blas);
  rgpuDestroyBuffer(m_ctx, scratchBuffer);
  rgpuDestroyBuffer(m_ctx, storageBuffer);
  rgpuDestroyBuffer(m_ctx, vertexBuffer);
}
