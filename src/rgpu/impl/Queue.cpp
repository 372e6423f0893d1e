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

#include "rdx/rgpu/Queue.h"

#include "rdx/rgpu/DelayedResourceDestroyer.h"
#include "rdx/rgpu/Swapchain.h"

#include "Internal.h"

#include <vector>

namespace rdx
{
  RgpuQueue::RgpuQueue(RgpuContext* ctx, RgpuDelayedResourceDestroyer& destroyer)
    : m_ctx(ctx)
    , m_destroyer(destroyer)
  {
  }

  RgpuQueue::~RgpuQueue()
  {
    if (m_commandPool)
    {
      rgpuDestroyCommandPool(m_ctx, (VkCommandPool) m_commandPool);
    }
  }

  RgpuEncoder RgpuQueue::createEncoder(RbArena& arena)
  {
    RgpuIDevice* idevice = &m_ctx->idevice;

    if (!m_commandPool)
    {
      VkCommandPoolCreateInfo poolCreateInfo = {
        .sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO,
        .pNext = nullptr,
        .flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT,
        .queueFamilyIndex = idevice->queueFamilyIndex,
      };

      VkCommandPool pool;
      if (idevice->table.vkCreateCommandPool(idevice->logicalDevice, &poolCreateInfo, nullptr, &pool) != VK_SUCCESS)
      {
        RGPU_FATAL("failed to create command pool");
      }

      m_commandPool = (uint64_t) pool;
    }

    RgpuCommandBuffer commandBuffer;
    if (!rgpuAllocateCommandBuffer(m_ctx, (VkCommandPool) m_commandPool, &commandBuffer))
    {
      RGPU_FATAL("failed to allocate command buffer");
    }

    return RgpuEncoder(commandBuffer, arena);
  }

  void RgpuQueue::submit(RgpuRecordedCommandBuffer&& commandBuffer,
                         std::span<const RgpuSemaphoreWait> waits,
                         std::span<const RgpuSemaphore> signals,
                         std::optional<RgpuFence> fence)
  {
    RgpuIDevice* idevice = &m_ctx->idevice;
    RGPU_RESOLVE_COMMAND_BUFFER(m_ctx, commandBuffer.handle(), icommandBuffer);

    std::vector<VkSemaphoreSubmitInfoKHR> waitInfos;
    waitInfos.reserve(waits.size());

    for (const RgpuSemaphoreWait& wait : waits)
    {
      RGPU_RESOLVE_SEMAPHORE(m_ctx, wait.semaphore, isemaphore);

      waitInfos.push_back(VkSemaphoreSubmitInfoKHR {
        .sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO_KHR,
        .pNext = nullptr,
        .semaphore = isemaphore->semaphore,
        .value = 0,
        .stageMask = (VkPipelineStageFlags2KHR) wait.stages,
        .deviceIndex = 0,
      });
    }

    std::vector<VkSemaphoreSubmitInfoKHR> signalInfos;
    signalInfos.reserve(signals.size());

    for (RgpuSemaphore signal : signals)
    {
      RGPU_RESOLVE_SEMAPHORE(m_ctx, signal, isemaphore);

      signalInfos.push_back(VkSemaphoreSubmitInfoKHR {
        .sType = VK_STRUCTURE_TYPE_SEMAPHORE_SUBMIT_INFO_KHR,
        .pNext = nullptr,
        .semaphore = isemaphore->semaphore,
        .value = 0,
        .stageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT_KHR,
        .deviceIndex = 0,
      });
    }

    VkFence vkFence = VK_NULL_HANDLE;
    if (fence)
    {
      RGPU_RESOLVE_FENCE(m_ctx, *fence, ifence);
      vkFence = ifence->fence;
    }

    VkCommandBufferSubmitInfoKHR commandBufferSubmitInfo = {
      .sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO_KHR,
      .pNext = nullptr,
      .commandBuffer = icommandBuffer->commandBuffer,
      .deviceMask = 0,
    };

    VkSubmitInfo2KHR submitInfo = {
      .sType = VK_STRUCTURE_TYPE_SUBMIT_INFO_2_KHR,
      .pNext = nullptr,
      .flags = 0,
      .waitSemaphoreInfoCount = (uint32_t) waitInfos.size(),
      .pWaitSemaphoreInfos = waitInfos.data(),
      .commandBufferInfoCount = 1,
      .pCommandBufferInfos = &commandBufferSubmitInfo,
      .signalSemaphoreInfoCount = (uint32_t) signalInfos.size(),
      .pSignalSemaphoreInfos = signalInfos.data(),
    };

    if (idevice->table.vkQueueSubmit2KHR(idevice->queue, 1, &submitInfo, vkFence) != VK_SUCCESS)
    {
      RGPU_FATAL("failed to submit to queue");
    }

    m_destroyer.enqueueDestruction(commandBuffer.handle());
  }

  void RgpuQueue::submitAndWait(RgpuRecordedCommandBuffer&& commandBuffer)
  {
    RgpuFence fence;
    if (!rgpuCreateFence(m_ctx, false, &fence))
    {
      RGPU_FATAL("failed to create fence");
    }

    submit(std::move(commandBuffer), {}, {}, fence);

    if (!rgpuWaitFence(m_ctx, fence))
    {
      RGPU_FATAL("failed to wait for fence");
    }

    rgpuDestroyFence(m_ctx, fence);
  }

  bool RgpuQueue::present(const RgpuSwapchain& swapchain, const RgpuSwapchainImage& image)
  {
    RgpuIDevice* idevice = &m_ctx->idevice;

    if (!swapchain.isActiveChain(image.chain))
    {
      RB_WARN("presenting image of retired swapchain");
      return false;
    }

    RGPU_RESOLVE_SEMAPHORE(m_ctx, image.signal, isemaphore);

    VkSwapchainKHR vkSwapchain = (VkSwapchainKHR) image.chain;

    VkPresentInfoKHR presentInfo = {
      .sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR,
      .pNext = nullptr,
      .waitSemaphoreCount = 1,
      .pWaitSemaphores = &isemaphore->semaphore,
      .swapchainCount = 1,
      .pSwapchains = &vkSwapchain,
      .pImageIndices = &image.index,
      .pResults = nullptr,
    };

    VkResult result = idevice->table.vkQueuePresentKHR(idevice->queue, &presentInfo);

    if (result == VK_ERROR_OUT_OF_DATE_KHR || result == VK_SUBOPTIMAL_KHR)
    {
      return false;
    }
    if (result != VK_SUCCESS)
    {
      RGPU_FATAL("failed to present");
    }

    return true;
  }
}
