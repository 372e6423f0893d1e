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

#include <rdx/rr/Blas.h>
#include <rdx/rr/Camera.h>
#include <rdx/rr/FramePacer.h>
#include <rdx/rr/FramebufferCache.h>
#include <rdx/rr/Mesh.h>
#include <rdx/rr/RenderContext.h>
#include <rdx/rr/SampledImageBinding.h>
#include <rdx/rr/UiPass.h>
#include <rdx/rgpu/DelayedResourceDestroyer.h>
#include <rdx/rgpu/Queue.h>
#include <rdx/rb/Arena.h>
#include <rdx/rt/TestLogListener.h>

#include <glm/gtc/matrix_transform.hpp>

#include <array>
#include <cmath>
#include <vector>

using namespace rdx;

REGISTER_LISTENER("TestLog", 1, RtTestLogListener);

TEST_CASE("FramePacer.NeverSubmittedSlotIsNotWaited")
{
  RrFramePacerSlots slots;

  CHECK_FALSE(slots.beginFrame(0));
  slots.markSubmitted(0);
  CHECK_FALSE(slots.beginFrame(1));
  slots.markSubmitted(1);

  CHECK(slots.beginFrame(2));
  CHECK(slots.beginFrame(3));
}

TEST_CASE("FramePacer.AtMostTwoFramesInFlight")
{
  RrFramePacerSlots slots;

  // Simulated GPU: a submitted frame only completes when its fence is waited on.
  std::vector<uint64_t> inFlight;
  uint32_t waits = 0;

  for (uint64_t frame = 0; frame < 100; frame++)
  {
    if (slots.beginFrame(frame))
    {
      uint64_t waited = frame - RrFramePacerSlots::SlotCount;
      CHECK_EQ(inFlight.front(), waited);
      inFlight.erase(inFlight.begin());
      slots.markIdle(frame);
      waits++;
    }

    slots.markSubmitted(frame);
    inFlight.push_back(frame);

    CHECK_LE(inFlight.size(), RrFramePacerSlots::SlotCount);
  }

  CHECK_EQ(waits, 98);
}

TEST_CASE("Mesh.VertexFormatSizes")
{
  CHECK_EQ(rrGetVertexFormatSize(RrVertexFormat::Float32), 4);
  CHECK_EQ(rrGetVertexFormatSize(RrVertexFormat::Float32x3), 12);
  CHECK_EQ(rrGetVertexFormatSize(RrVertexFormat::Uint32x4), 16);
  CHECK_EQ(rrGetVertexFormatSize(RrVertexFormat::Snorm16x2), 4);
  CHECK_EQ(rrGetVertexFormatSize(RrVertexFormat::Unorm16x4), 8);
  CHECK_EQ(rrGetVertexFormatSize(RrVertexFormat::Uint8x2), 2);
  CHECK_EQ(rrGetVertexFormatSize(RrVertexFormat::Unorm8x4), 4);
}

TEST_CASE("Mesh.CountVerticesRejectsMismatch")
{
  RrMesh mesh(RrPrimitiveTopology::TriangleList);

  uint32_t count = 42;
  CHECK(mesh.countVertices(&count));
  CHECK_EQ(count, 0);

  std::array<float, 9> positions = {};
  std::array<float, 4> uvs = {};
  mesh.setAttribute<float>(RrMesh::ATTRIBUTE_POSITION, RrVertexFormat::Float32x3, positions);
  CHECK(mesh.countVertices(&count));
  CHECK_EQ(count, 3);

  mesh.setAttribute<float>(RrMesh::ATTRIBUTE_UV_0, RrVertexFormat::Float32x2, uvs);
  CHECK_FALSE(mesh.countVertices(&count));
}

TEST_CASE("Mesh.IndexBytes")
{
  RrIndices u16 = std::vector<uint16_t>{ 0, 1, 2 };
  RrIndices u32 = std::vector<uint32_t>{ 0, 1, 2, 2, 1, 3 };

  CHECK_EQ(rrGetIndexCount(u16), 3);
  CHECK_EQ(rrGetIndexBytes(u16).size(), 6);
  CHECK_EQ(rrGetIndexCount(u32), 6);
  CHECK_EQ(rrGetIndexBytes(u32).size(), 24);
}

TEST_CASE("Mesh.DuplicateVertices")
{
  RrMesh mesh(RrPrimitiveTopology::TriangleList);

  std::array<uint32_t, 4> ids = { 10, 11, 12, 13 };
  mesh.setAttribute<uint32_t>("Id", RrVertexFormat::Uint32, ids);
  mesh.setIndices(RrIndices{ std::vector<uint16_t>{ 0, 1, 2, 2, 1, 3 } });

  REQUIRE(mesh.duplicateVertices());
  CHECK_FALSE(mesh.indices().has_value());

  const RrVertexAttribute* attribute = mesh.attribute("Id");
  REQUIRE(attribute);
  REQUIRE_EQ(attribute->count(), 6);

  const uint32_t* values = (const uint32_t*) attribute->data.data();
  std::vector<uint32_t> expanded(values, values + 6);
  CHECK_EQ(expanded, std::vector<uint32_t>{ 10, 11, 12, 12, 11, 13 });
}

TEST_CASE("Mesh.DuplicateVerticesRejectsOutOfRangeIndex")
{
  RrMesh mesh(RrPrimitiveTopology::TriangleList);

  std::array<float, 9> positions = {};
  mesh.setAttribute<float>(RrMesh::ATTRIBUTE_POSITION, RrVertexFormat::Float32x3, positions);
  mesh.setIndices(RrIndices{ std::vector<uint32_t>{ 0, 1, 7 } });

  CHECK_FALSE(mesh.duplicateVertices());

  RrMesh strip(RrPrimitiveTopology::TriangleStrip);
  CHECK_FALSE(strip.duplicateVertices());
}

TEST_CASE("Mesh.FlatNormals")
{
  RrMesh mesh(RrPrimitiveTopology::TriangleList);

  std::array<float, 9> positions = {
    0.0f, 0.0f, 0.0f,
    1.0f, 0.0f, 0.0f,
    0.0f, 1.0f, 0.0f
  };
  mesh.setAttribute<float>(RrMesh::ATTRIBUTE_POSITION, RrVertexFormat::Float32x3, positions);

  REQUIRE(mesh.computeFlatNormals());

  const RrVertexAttribute* normals = mesh.attribute(RrMesh::ATTRIBUTE_NORMAL);
  REQUIRE(normals);
  CHECK(normals->format == RrVertexFormat::Float32x3);
  REQUIRE_EQ(normals->count(), 3);

  const float* n = (const float*) normals->data.data();
  for (uint32_t i = 0; i < 3; i++)
  {
    CHECK_EQ(n[i * 3 + 0], doctest::Approx(0.0f));
    CHECK_EQ(n[i * 3 + 1], doctest::Approx(0.0f));
    CHECK_EQ(n[i * 3 + 2], doctest::Approx(1.0f));
  }
}

TEST_CASE("Mesh.DuplicateVerticesLeavesMeshUnchangedOnMismatch")
{
  RrMesh mesh(RrPrimitiveTopology::TriangleList);

  std::array<uint32_t, 4> ids = { 10, 11, 12, 13 };
  std::array<uint32_t, 3> tags = { 1, 2, 3 };
  mesh.setAttribute<uint32_t>("Id", RrVertexFormat::Uint32, ids);
  mesh.setAttribute<uint32_t>("Tag", RrVertexFormat::Uint32, tags);
  mesh.setIndices(RrIndices{ std::vector<uint16_t>{ 0, 1, 2 } });

  CHECK_FALSE(mesh.duplicateVertices());

  CHECK(mesh.indices().has_value());
  CHECK_EQ(mesh.attribute("Id")->count(), 4);
  CHECK_EQ(mesh.attribute("Tag")->count(), 3);

  // An out-of-range index is caught before any attribute is expanded.
  mesh.setAttribute<uint32_t>("Tag", RrVertexFormat::Uint32, std::array<uint32_t, 4>{ 1, 2, 3, 4 });
  mesh.setIndices(RrIndices{ std::vector<uint32_t>{ 0, 1, 4 } });

  CHECK_FALSE(mesh.duplicateVertices());
  CHECK_EQ(mesh.attribute("Id")->count(), 4);
  CHECK_EQ(mesh.attribute("Tag")->count(), 4);
}

TEST_CASE("Mesh.FlatNormalsOfDegenerateTriangleAreZero")
{
  RrMesh mesh(RrPrimitiveTopology::TriangleList);

  std::array<float, 18> positions = {
    0.0f, 0.0f, 0.0f,
    1.0f, 0.0f, 0.0f,
    2.0f, 0.0f, 0.0f, // collinear
    0.0f, 0.0f, 0.0f,
    0.0f, 0.0f, 1.0f,
    0.0f, 1.0f, 0.0f
  };
  mesh.setAttribute<float>(RrMesh::ATTRIBUTE_POSITION, RrVertexFormat::Float32x3, positions);

  REQUIRE(mesh.computeFlatNormals());

  const RrVertexAttribute* normals = mesh.attribute(RrMesh::ATTRIBUTE_NORMAL);
  REQUIRE(normals);
  REQUIRE_EQ(normals->count(), 6);

  const float* n = (const float*) normals->data.data();
  for (uint32_t i = 0; i < 9; i++)
  {
    CHECK_FALSE(std::isnan(n[i]));
    CHECK_EQ(n[i], 0.0f);
  }

  CHECK_EQ(n[9], doctest::Approx(-1.0f));
  CHECK_EQ(n[10], doctest::Approx(0.0f));
  CHECK_EQ(n[11], doctest::Approx(0.0f));
}

TEST_CASE("Camera.ViewInvertsTransform")
{
  RrCamera camera;
  camera.transform = glm::translate(glm::mat4(1.0f), glm::vec3(1.0f, 2.0f, 3.0f));

  glm::vec4 origin = rrGetCameraView(camera) * glm::vec4(1.0f, 2.0f, 3.0f, 1.0f);
  CHECK_EQ(origin.x, doctest::Approx(0.0f));
  CHECK_EQ(origin.y, doctest::Approx(0.0f));
  CHECK_EQ(origin.z, doctest::Approx(0.0f));

  // Points in front of a right-handed camera land in the [0, 1] depth range.
  glm::mat4 proj = rrGetCameraProjection(camera, 1.0f);
  glm::vec4 clip = proj * glm::vec4(0.0f, 0.0f, -1.0f, 1.0f);
  float depth = clip.z / clip.w;
  CHECK_GT(depth, 0.0f);
  CHECK_LT(depth, 1.0f);
}

TEST_CASE("SampledImageBinding.ViewIsRecreatedOnlyWhenImageChanges")
{
  RgpuDelayedResourceDestroyer destroyer(nullptr);

  std::vector<uint64_t> destroyed;
  uint32_t created = 0;
  bool failCreation = false;

  auto create = [&](RgpuImage image, RgpuImageView* view) {
    if (failCreation)
    {
      return false;
    }
    created++;
    *view = RgpuImageView{ image.handle * 10 + created };
    return true;
  };

  {
    RrSampledImageBinding binding(destroyer, [&](RgpuImageView view) {
      destroyed.push_back(view.handle);
    });

    CHECK(binding.bind(RgpuImage{ 1 }, create) == RrSampledImageBinding::BindResult::Rebound);
    CHECK_EQ(binding.view().handle, 11);

    // Same image on the following frames.
    CHECK(binding.bind(RgpuImage{ 1 }, create) == RrSampledImageBinding::BindResult::Unchanged);
    CHECK(binding.bind(RgpuImage{ 1 }, create) == RrSampledImageBinding::BindResult::Unchanged);
    CHECK_EQ(created, 1);
    CHECK_EQ(destroyer.pendingCount(), 0);

    // The producing pass reallocated its output after a resize.
    CHECK(binding.bind(RgpuImage{ 2 }, create) == RrSampledImageBinding::BindResult::Rebound);
    CHECK_EQ(binding.view().handle, 22);
    CHECK_EQ(binding.image().handle, 2);
    CHECK_EQ(destroyer.pendingCount(), 1);
    CHECK(destroyed.empty());

    failCreation = true;
    CHECK(binding.bind(RgpuImage{ 3 }, create) == RrSampledImageBinding::BindResult::Failed);
    CHECK_EQ(binding.view().handle, 22);
    CHECK_EQ(destroyer.pendingCount(), 1);
  }

  // Destruction retires the last view too.
  CHECK_EQ(destroyer.pendingCount(), 2);

  destroyer.destroyAll();
  CHECK_EQ(destroyed, std::vector<uint64_t>{ 11, 22 });
}

TEST_CASE("FramebufferCache.EvictedEntriesAreDestroyedLater")
{
  RgpuDelayedResourceDestroyer destroyer(nullptr);

  std::vector<uint64_t> destroyed;
  RrFramebufferCache cache(destroyer, [&](const RrFramebufferEntry& entry) {
    destroyed.push_back(entry.framebuffer.handle);
  });

  uint32_t created = 0;
  auto create = [&](RgpuImage image, RrFramebufferEntry* entry) {
    created++;
    *entry = RrFramebufferEntry{ .view = { image.handle + 100 }, .framebuffer = { image.handle + 200 } };
    return true;
  };

  for (uint64_t i = 1; i <= RrFramebufferCache::Capacity; i++)
  {
    REQUIRE(cache.get(RgpuImage{ i }, create));
  }
  CHECK_EQ(created, RrFramebufferCache::Capacity);

  // Touch image 1 so that image 2 becomes the least recently used entry.
  const RrFramebufferEntry* hit = cache.get(RgpuImage{ 1 }, create);
  REQUIRE(hit);
  CHECK_EQ(hit->framebuffer.handle, 201);
  CHECK_EQ(created, RrFramebufferCache::Capacity);

  REQUIRE(cache.get(RgpuImage{ 5 }, create));
  CHECK_EQ(cache.size(), RrFramebufferCache::Capacity);

  // Eviction only enqueues; the entry may still be referenced by a frame in flight.
  CHECK(destroyed.empty());
  CHECK_EQ(destroyer.pendingCount(), 1);

  for (uint32_t i = 0; i < RgpuDelayedResourceDestroyer::FrameCount; i++)
  {
    destroyer.nextFrame();
    destroyer.housekeep();
  }
  CHECK_EQ(destroyed, std::vector<uint64_t>{ 202 });

  cache.clear();
  CHECK_EQ(cache.size(), 0);
  destroyer.destroyAll();
  CHECK_EQ(destroyed.size(), 1 + RrFramebufferCache::Capacity);
}

TEST_CASE("FramebufferCache.FailedCreationIsNotCached")
{
  RgpuDelayedResourceDestroyer destroyer(nullptr);
  RrFramebufferCache cache(destroyer, [](const RrFramebufferEntry&) {});

  CHECK_FALSE(cache.get(RgpuImage{ 1 }, [](RgpuImage, RrFramebufferEntry*) { return false; }));
  CHECK_EQ(cache.size(), 0);
  CHECK_EQ(destroyer.pendingCount(), 0);
}

TEST_CASE("Blas.RejectsInvalidMeshesWithoutTouchingTheDevice")
{
  RgpuDelayedResourceDestroyer destroyer(nullptr);
  RgpuQueue queue(nullptr, destroyer);
  RrRenderContext renderContext = { .ctx = nullptr, .queue = queue, .destroyer = destroyer };

  std::array<float, 9> positions = {};
  RrBlas blas;

  SUBCASE("not a triangle list")
  {
    RrMesh mesh(RrPrimitiveTopology::LineList);
    mesh.setAttribute<float>(RrMesh::ATTRIBUTE_POSITION, RrVertexFormat::Float32x3, positions);
    mesh.setIndices(RrIndices{ std::vector<uint16_t>{ 0, 1, 2 } });
    CHECK_FALSE(rrBuildTriangleBlas(renderContext, mesh, &blas));
  }

  SUBCASE("wrong position format")
  {
    RrMesh mesh(RrPrimitiveTopology::TriangleList);
    mesh.setAttribute<float>(RrMesh::ATTRIBUTE_POSITION, RrVertexFormat::Float32x4, { positions.data(), 8 });
    mesh.setIndices(RrIndices{ std::vector<uint16_t>{ 0, 1, 0 } });
    CHECK_FALSE(rrBuildTriangleBlas(renderContext, mesh, &blas));
  }

  SUBCASE("missing indices")
  {
    RrMesh mesh(RrPrimitiveTopology::TriangleList);
    mesh.setAttribute<float>(RrMesh::ATTRIBUTE_POSITION, RrVertexFormat::Float32x3, positions);
    CHECK_FALSE(rrBuildTriangleBlas(renderContext, mesh, &blas));
  }

  SUBCASE("incomplete triangle")
  {
    RrMesh mesh(RrPrimitiveTopology::TriangleList);
    mesh.setAttribute<float>(RrMesh::ATTRIBUTE_POSITION, RrVertexFormat::Float32x3, positions);
    mesh.setIndices(RrIndices{ std::vector<uint16_t>{ 0, 1 } });
    CHECK_FALSE(rrBuildTriangleBlas(renderContext, mesh, &blas));
  }

  SUBCASE("index out of range")
  {
    RrMesh mesh(RrPrimitiveTopology::TriangleList);
    mesh.setAttribute<float>(RrMesh::ATTRIBUTE_POSITION, RrVertexFormat::Float32x3, positions);
    mesh.setIndices(RrIndices{ std::vector<uint32_t>{ 0, 1, 3 } });
    CHECK_FALSE(rrBuildTriangleBlas(renderContext, mesh, &blas));
  }

  CHECK_EQ(destroyer.pendingCount(), 0);
}

TEST_CASE("UiPass.ScissorIsClampedToTarget")
{
  RgpuExtent2D extent = { 100, 50 };

  RrUiDrawCommand command = {
    .clipMin = { -10.0f, 5.2f },
    .clipMax = { 30.5f, 80.0f }
  };
  RgpuRect2D scissor = rrComputeUiScissor(command, extent);
  CHECK_EQ(scissor.x, 0);
  CHECK_EQ(scissor.y, 5);
  CHECK_EQ(scissor.width, 31);
  CHECK_EQ(scissor.height, 45);

  RrUiDrawCommand offscreen = {
    .clipMin = { 120.0f, 10.0f },
    .clipMax = { 140.0f, 20.0f }
  };
  scissor = rrComputeUiScissor(offscreen, extent);
  CHECK_EQ(scissor.width, 0);
}

TEST_CASE("UiPass.AlphaIsExpandedToPremultipliedWhite")
{
  std::array<uint8_t, 2> alpha = { 0, 200 };

  std::vector<uint8_t> rgba = rrExpandAlphaToRgba(alpha);
  CHECK_EQ(rgba, std::vector<uint8_t>{ 0, 0, 0, 0, 200, 200, 200, 200 });
}

// Tests below need a ray tracing capable device. Without one they report a
// skip message and check nothing.
class DeviceFixture
{
public:
  DeviceFixture()
  {
    RgpuContextCreateInfo createInfo = {
      .appName = "rdx_rr_tests"
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

TEST_CASE_FIXTURE(DeviceFixture, "Device.TriangleBlasHasAddress")
{
  if (!hasDevice())
  {
    return;
  }

  {
    RgpuDelayedResourceDestroyer destroyer(m_ctx);

    {
      RgpuQueue queue(m_ctx, destroyer);
      RrRenderContext renderContext = { .ctx = m_ctx, .queue = queue, .destroyer = destroyer };

      std::array<float, 9> positions = {
        -0.5f, -0.5f, 0.0f,
         0.5f, -0.5f, 0.0f,
         0.0f,  0.5f, 0.0f
      };

      RrMesh mesh(RrPrimitiveTopology::TriangleList);
      mesh.setAttribute<float>(RrMesh::ATTRIBUTE_POSITION, RrVertexFormat::Float32x3, positions);
      mesh.setIndices(RrIndices{ std::vector<uint16_t>{ 0, 1, 2 } });

      RrBlas blas;
      REQUIRE(rrBuildTriangleBlas(renderContext, mesh, &blas));
      CHECK_NE(blas.address, 0);
      CHECK_GT(rgpuGetBufferSize(m_ctx, blas.storageBuffer), 0);

      rrRetireBlas(renderContext, blas);
      destroyer.destroyAll();
    }
  }
}

TEST_CASE_FIXTURE(DeviceFixture, "Device.FramePacerSkipsFramesThatWereNeverSubmitted")
{
  if (!hasDevice())
  {
    return;
  }

  {
    RgpuDelayedResourceDestroyer destroyer(m_ctx);

    {
      RgpuQueue queue(m_ctx, destroyer);
      RrFramePacer pacer(m_ctx);
      REQUIRE(pacer.allocate());

      RbArena arena;

      // Frames 0 and 1 end before their submission, as after a failed acquire.
      RgpuFence fence0 = pacer.beginFrame(0, destroyer);
      RgpuFence fence1 = pacer.beginFrame(1, destroyer);
      CHECK_NE(fence0.handle, fence1.handle);
      CHECK_FALSE(pacer.isInFlight(2));

      // Slot 0 again: its unsignaled fence must not be waited on.
      RgpuFence fence2 = pacer.beginFrame(2, destroyer);
      CHECK_EQ(fence2.handle, fence0.handle);

      queue.submit(std::move(queue.createEncoder(arena)).finish(m_ctx), {}, {}, fence2);
      pacer.endFrame(2);
      CHECK(pacer.isInFlight(4));

      // Waits for the submission of frame 2 and hands the slot back.
      RgpuFence fence4 = pacer.beginFrame(4, destroyer);
      CHECK_EQ(fence4.handle, fence0.handle);
      CHECK_FALSE(pacer.isInFlight(4));

      queue.submit(std::move(queue.createEncoder(arena)).finish(m_ctx), {}, {}, fence4);
      pacer.endFrame(4);

      pacer.waitIdle();
      CHECK_FALSE(pacer.isInFlight(4));
      CHECK_FALSE(pacer.isInFlight(5));

      destroyer.destroyAll();
    }
  }
}
