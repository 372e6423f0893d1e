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

#include "rdx/rr/Renderer.h"

#include <rdx/rr/Mesh.h>
#include <rdx/rr/Pipeline.h>
#include <rdx/rr/RenderContext.h>
#include <rdx/rgpu/DelayedResourceDestroyer.h>
#include <rdx/rgpu/Queue.h>
#include <rdx/rgpu/Swapchain.h>
#include <rdx/rb/Log.h>

#include "Internal.h"

#include <array>

namespace
{
  using namespace rdx;

  constexpr static uint32_t DEFAULT_MESH_ID = 0;

  RrMesh rrMakeDefaultTriangle()
  {
    std::array<float, 9> positions = {
      -0.5f, -0.5f, 0.0f,
       0.5f, -0.5f, 0.0f,
       0.0f,  0.5f, 0.0f
    };

    RrMesh mesh(RrPrimitiveTopology::TriangleList);
    mesh.setAttribute<float>(RrMesh::ATTRIBUTE_POSITION, RrVertexFormat::Float32x3, positions);
    mesh.setIndices(RrIndices{ std::vector<uint16_t>{ 0, 1, 2 } });
    return mesh;
  }
}

namespace rdx
{
  std::unique_ptr<RrRenderer> RrRenderer::create(const RrRendererCreateInfo& createInfo)
  {
    rbLogInit();

    if (!createInfo.createSurface)
    {
      RB_ERROR("renderer requires a surface");
      return nullptr;
    }

    std::unique_ptr<RrRenderer> renderer(new RrRenderer());

    RgpuContextCreateInfo contextCreateInfo = {
      .appName = createInfo.appName,
      .versionMajor = createInfo.versionMajor,
      .versionMinor = createInfo.versionMinor,
      .versionPatch = createInfo.versionPatch,
      .instanceExtensions = createInfo.instanceExtensions,
      .createSurface = createInfo.createSurface
    };

    renderer->m_ctx = rgpuCreateContext(contextCreateInfo);
    if (!renderer->m_ctx)
    {
      RB_ERROR("failed to create GPU context");
      return nullptr;
    }

    RgpuContext* ctx = renderer->m_ctx;
    renderer->m_destroyer = std::make_unique<RgpuDelayedResourceDestroyer>(ctx);
    renderer->m_queue = std::make_unique<RgpuQueue>(ctx, *renderer->m_destroyer);
    renderer->m_renderContext = std::make_unique<RrRenderContext>(RrRenderContext{
      .ctx = ctx,
      .queue = *renderer->m_queue,
      .destroyer = *renderer->m_destroyer
    });
    renderer->m_swapchain = std::make_unique<RgpuSwapchain>(ctx, *renderer->m_destroyer);
    renderer->m_extent = createInfo.extent;

    if (!renderer->m_swapchain->configure(createInfo.extent))
    {
      RB_ERROR("failed to configure swapchain with extent {}x{}", createInfo.extent.width, createInfo.extent.height);
      return nullptr;
    }

    RgpuFormat format = renderer->m_swapchain->format();
    RgpuExtent2D extent = renderer->m_swapchain->extent();
    RrRenderContext& renderContext = *renderer->m_renderContext;

    if (createInfo.pipeline == RrPipelineKind::Raster)
    {
      auto pipeline = std::make_unique<RrRasterPipeline>(renderContext);
      if (!pipeline->allocate(format))
      {
        RB_ERROR("failed to allocate raster pipeline");
        return nullptr;
      }
      renderer->m_pipeline = std::move(pipeline);
    }
    else
    {
      auto pipeline = std::make_unique<RrPathTracingPipeline>(renderContext);
      if (!pipeline->allocate(format, extent))
      {
        RB_ERROR("failed to allocate path tracing pipeline");
        return nullptr;
      }
      renderer->m_pipeline = std::move(pipeline);
    }

    renderer->m_pipelineExtent = extent;

    RB_LOG("renderer ready ({}x{})", extent.width, extent.height);
    return renderer;
  }

  RrRenderer::~RrRenderer()
  {
    if (m_ctx)
    {
      rgpuWaitIdle(m_ctx);
    }

    m_pipeline.reset();

    if (m_renderContext)
    {
      for (const auto& [meshId, blas] : m_blases)
      {
        rrRetireBlas(*m_renderContext, blas);
      }
    }
    m_blases.clear();

    if (m_destroyer)
    {
      m_destroyer->destroyAll();
    }

    m_swapchain.reset();
    m_renderContext.reset();
    m_queue.reset();
    m_destroyer.reset();

    if (m_ctx)
    {
      rgpuDestroyContext(m_ctx);
    }
  }

  bool RrRenderer::reconfigure()
  {
    if (!m_swapchain->configure(m_extent))
    {
      return false;
    }

    RgpuExtent2D extent = m_swapchain->extent();
    if (extent == m_pipelineExtent)
    {
      return true;
    }

    if (!m_pipeline->resize(extent))
    {
      return false;
    }

    m_pipelineExtent = extent;
    return true;
  }

  void RrRenderer::draw(const RrCamera& camera)
  {
    if (!m_blases.contains(DEFAULT_MESH_ID))
    {
      RrMesh triangle = rrMakeDefaultTriangle();
      if (!loadModel(DEFAULT_MESH_ID, triangle))
      {
        RR_FATAL("failed to build default triangle BLAS");
      }
    }

    std::optional<RgpuSwapchainImage> image = m_swapchain->acquireNextImage();
    while (!image)
    {
      if (!reconfigure())
      {
        // Zero-sized surface; nothing to draw into until the next resize.
        return;
      }
      image = m_swapchain->acquireNextImage();
    }

    RrFrameInput input = {
      .target = *image,
      .blases = m_blases,
      .uiProvider = m_uiProvider
    };

    m_pipeline->draw(input, m_frame, *m_renderContext, m_arena, camera);

    if (!m_queue->present(*m_swapchain, *image))
    {
      reconfigure();
    }

    m_frame++;
    m_arena.reset();
  }

  bool RrRenderer::loadModel(uint32_t meshId, const RrMesh& mesh)
  {
    RrBlas blas;
    if (!rrBuildTriangleBlas(*m_renderContext, mesh, &blas))
    {
      RB_ERROR("failed to build BLAS for mesh {}", meshId);
      return false;
    }

    auto it = m_blases.find(meshId);
    if (it != m_blases.end())
    {
      rrRetireBlas(*m_renderContext, it->second);
      it->second = blas;
    }
    else
    {
      m_blases.emplace(meshId, blas);
    }

    RB_DEBUG("loaded mesh {}", meshId);
    return true;
  }

  void RrRenderer::unloadModel(uint32_t meshId)
  {
    auto it = m_blases.find(meshId);
    if (it == m_blases.end())
    {
      return;
    }

    rrRetireBlas(*m_renderContext, it->second);
    m_blases.erase(it);
  }

  void RrRenderer::resize(RgpuExtent2D extent)
  {
    if (extent == m_extent)
    {
      return;
    }

    m_extent = extent;

    if (!reconfigure())
    {
      RB_WARN("swapchain not reconfigured for extent {}x{}", extent.width, extent.height);
    }
  }

  void RrRenderer::setUiProvider(RrUiProvider* provider)
  {
    m_uiProvider = provider;
  }
}
