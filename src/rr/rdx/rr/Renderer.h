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

#include <rdx/rr/Blas.h>
#include <rdx/rr/Camera.h>
#include <rdx/rgpu/Rgpu.h>
#include <rdx/rb/Arena.h>

#include <map>
#include <memory>
#include <vector>

namespace rdx
{
  class RgpuDelayedResourceDestroyer;
  class RgpuQueue;
  class RgpuSwapchain;
  class RrMesh;
  class RrPipeline;
  class RrUiProvider;
  struct RrRenderContext;

  enum class RrPipelineKind
  {
    PathTracing,
    Raster
  };

  struct RrRendererCreateInfo
  {
    const char* appName;
    uint32_t versionMajor = 0;
    uint32_t versionMinor = 1;
    uint32_t versionPatch = 0;
    std::vector<const char*> instanceExtensions;
    RgpuSurfaceCreateFunc createSurface;
    RgpuExtent2D extent;
    RrPipelineKind pipeline = RrPipelineKind::PathTracing;
  };

  class RrRenderer
  {
  public:
    // Returns nullptr if any part of the device, swapchain or pipeline setup fails.
    static std::unique_ptr<RrRenderer> create(const RrRendererCreateInfo& createInfo);

    RrRenderer(const RrRenderer&) = delete;
    RrRenderer& operator=(const RrRenderer&) = delete;

    ~RrRenderer();

  public:
    void draw(const RrCamera& camera);

    // Builds the mesh's BLAS synchronously. A previously loaded mesh with the
    // same id is replaced.
    bool loadModel(uint32_t meshId, const RrMesh& mesh);

    void unloadModel(uint32_t meshId);

    void resize(RgpuExtent2D extent);

    // Not owned; must outlive the renderer or be reset to nullptr.
    void setUiProvider(RrUiProvider* provider);

    uint64_t frame() const { return m_frame; }

  private:
    RrRenderer() = default;

    bool reconfigure();

  private:
    RgpuContext* m_ctx = nullptr;
    std::unique_ptr<RgpuDelayedResourceDestroyer> m_destroyer;
    std::unique_ptr<RgpuQueue> m_queue;
    std::unique_ptr<RrRenderContext> m_renderContext;
    std::unique_ptr<RgpuSwapchain> m_swapchain;
    std::unique_ptr<RrPipeline> m_pipeline;
    std::map<uint32_t, RrBlas> m_blases;
    RrUiProvider* m_uiProvider = nullptr;
    RgpuExtent2D m_extent = { 0, 0 };
    RgpuExtent2D m_pipelineExtent = { 0, 0 };
    uint64_t m_frame = 0;
    RbArena m_arena;
  };
}
