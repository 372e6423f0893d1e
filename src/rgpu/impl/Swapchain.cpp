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

#include "rdx/rgpu/Swapchain.h"

#include "rdx/rgpu/DelayedResourceDestroyer.h"

#include "Internal.h"

#include <algorithm>
#include <limits>

namespace rdx
{
  RgpuSwapchainSemaphores::RgpuSwapchainSemaphores(RgpuSemaphore freeSemaphore, std::vector<ImageSlots> images)
    : m_freeSemaphore(freeSemaphore)
    , m_images(std::move(images))
  {
  }

  void RgpuSwapchainSemaphores::onAcquired(uint32_t imageIndex, RgpuSemaphore* wait, RgpuSemaphore* signal)
  {
    ImageSlots& slots = m_images[imageIndex];

    *wait = m_freeSemaphore;
    std::swap(slots.acquire[slots.acquireIndex % SlotCount], m_freeSemaphore);
    slots.acquireIndex++;

    *signal = slots.release[slots.releaseIndex % SlotCount];
    slots.releaseIndex++;
  }

  std::vector<RgpuSemaphore> RgpuSwapchainSemaphores::allSemaphores() const
  {
    std::vector<RgpuSemaphore> semaphores;
    semaphores.reserve(1 + m_images.size() * SlotCount * 2);

    semaphores.push_back(m_freeSemaphore);
    for (const ImageSlots& slots : m_images)
    {
      semaphores.insert(semaphores.end(), slots.acquire.begin(), slots.acquire.end());
      semaphores.insert(semaphores.end(), slots.release.begin(), slots.release.end());
    }

    return semaphores;
  }

  struct RgpuSwapchain::Chain
  {
    VkSwapchainKHR swapchain = VK_NULL_HANDLE;
    RgpuFormat format = RgpuFormat::Undefined;
    RgpuExtent2D extent = {};
    std::vector<RgpuImage> images;
    std::optional<RgpuSwapchainSemaphores> semaphores;
    bool outOfDate = false;
    bool destroyed = false;
  };

  namespace
  {
    constexpr static uint32_t RGPU_PREFERRED_IMAGE_COUNT = 3;

    void rgpuDestroyChain(RgpuContext* ctx, RgpuSwapchain::Chain& chain)
    {
      if (chain.destroyed)
      {
        return;
      }

      RgpuIDevice* idevice = &ctx->idevice;

      if (chain.semaphores)
      {
        for (RgpuSemaphore semaphore : chain.semaphores->allSemaphores())
        {
          rgpuDestroySemaphore(ctx, semaphore);
        }
      }

      for (RgpuImage image : chain.images)
      {
        rgpuDestroyImage(ctx, image);
      }

      if (chain.swapchain != VK_NULL_HANDLE)
      {
        idevice->table.vkDestroySwapchainKHR(idevice->logicalDevice, chain.swapchain, nullptr);
      }

      chain.destroyed = true;
    }

    VkSurfaceFormatKHR rgpuPickSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& formats)
    {
      for (const VkSurfaceFormatKHR& format : formats)
      {
        if (format.format == VK_FORMAT_B8G8R8A8_SRGB && format.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR)
        {
          return format;
        }
      }

      RB_WARN("preferred surface format unavailable, falling back to format {}", (int) formats[0].format);
      return formats[0];
    }

    VkCompositeAlphaFlagBitsKHR rgpuPickCompositeAlpha(VkCompositeAlphaFlagsKHR supported)
    {
      const VkCompositeAlphaFlagBitsKHR candidates[] = {
        VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR,
        VK_COMPOSITE_ALPHA_INHERIT_BIT_KHR,
        VK_COMPOSITE_ALPHA_PRE_MULTIPLIED_BIT_KHR,
        VK_COMPOSITE_ALPHA_POST_MULTIPLIED_BIT_KHR,
      };

      for (VkCompositeAlphaFlagBitsKHR candidate : candidates)
      {
        if (supported & candidate)
        {
          return candidate;
        }
      }
      return VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    }

    bool rgpuCreateChainSemaphores(RgpuContext* ctx, RgpuSwapchain::Chain& chain)
    {
      std::vector<RgpuSemaphore> created;
      auto createSemaphore = [&](RgpuSemaphore& semaphore) {
        if (!rgpuCreateSemaphore(ctx, &semaphore))
        {
          return false;
        }
        created.push_back(semaphore);
        return true;
      };

      RgpuSemaphore freeSemaphore;
      std::vector<RgpuSwapchainSemaphores::ImageSlots> slots(chain.images.size());

      bool success = createSemaphore(freeSemaphore);
      for (size_t i = 0; success && i < slots.size(); i++)
      {
        for (uint32_t j = 0; success && j < RgpuSwapchainSemaphores::SlotCount; j++)
        {
          success = createSemaphore(slots[i].acquire[j]) && createSemaphore(slots[i].release[j]);
        }
      }

      if (!success)
      {
        for (RgpuSemaphore semaphore : created)
        {
          rgpuDestroySemaphore(ctx, semaphore);
        }
        return false;
      }

      chain.semaphores.emplace(freeSemaphore, std::move(slots));
      return true;
    }
  }

  RgpuSwapchain::RgpuSwapchain(RgpuContext* ctx, RgpuDelayedResourceDestroyer& destroyer)
    : m_ctx(ctx)
    , m_destroyer(destroyer)
  {
  }

  RgpuSwapchain::~RgpuSwapchain()
  {
    rgpuWaitIdle(m_ctx);

    if (m_active)
    {
      rgpuDestroyChain(m_ctx, *m_active);
    }

    for (const std::weak_ptr<Chain>& weak : m_retired)
    {
      if (std::shared_ptr<Chain> chain = weak.lock(); chain)
      {
        rgpuDestroyChain(m_ctx, *chain);
      }
    }
  }

  void RgpuSwapchain::retireActiveChain()
  {
    if (!m_active)
    {
      return;
    }

    std::shared_ptr<Chain> chain = std::move(m_active);
    RgpuContext* ctx = m_ctx;

    m_destroyer.enqueueDestruction([ctx, chain]() {
      rgpuDestroyChain(ctx, *chain);
    });

    // Drop expired entries before tracking the new one.
    std::erase_if(m_retired, [](const std::weak_ptr<Chain>& weak) { return weak.expired(); });
    m_retired.push_back(chain);
  }

  bool RgpuSwapchain::configure(RgpuExtent2D extent)
  {
    RgpuIDevice* idevice = &m_ctx->idevice;

    if (m_ctx->surface == VK_NULL_HANDLE)
    {
      RGPU_RETURN_ERROR("context has no surface");
    }

    VkSurfaceCapabilitiesKHR capabilities;
    if (vkGetPhysicalDeviceSurfaceCapabilitiesKHR(idevice->physicalDevice, m_ctx->surface, &capabilities) != VK_SUCCESS)
    {
      RGPU_RETURN_ERROR("failed to query surface capabilities");
    }

    VkExtent2D imageExtent = capabilities.currentExtent;
    if (imageExtent.width == std::numeric_limits<uint32_t>::max())
    {
      imageExtent.width = std::clamp(extent.width, capabilities.minImageExtent.width, capabilities.maxImageExtent.width);
      imageExtent.height = std::clamp(extent.height, capabilities.minImageExtent.height, capabilities.maxImageExtent.height);
    }

    if (imageExtent.width == 0 || imageExtent.height == 0)
    {
      // Minimized window; keep no chain until a non-zero extent is configured.
      retireActiveChain();
      return false;
    }

    uint32_t formatCount = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(idevice->physicalDevice, m_ctx->surface, &formatCount, nullptr);
    std::vector<VkSurfaceFormatKHR> formats(formatCount);
    vkGetPhysicalDeviceSurfaceFormatsKHR(idevice->physicalDevice, m_ctx->surface, &formatCount, formats.data());

    if (formats.empty())
    {
      RGPU_RETURN_ERROR("no surface formats");
    }

    VkSurfaceFormatKHR surfaceFormat = rgpuPickSurfaceFormat(formats);

    uint32_t maxImageCount = capabilities.maxImageCount > 0 ? capabilities.maxImageCount : std::numeric_limits<uint32_t>::max();
    uint32_t minImageCount = std::clamp(RGPU_PREFERRED_IMAGE_COUNT, capabilities.minImageCount, maxImageCount);

    VkSwapchainCreateInfoKHR createInfo = {
      .sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR,
      .pNext = nullptr,
      .flags = 0,
      .surface = m_ctx->surface,
      .minImageCount = minImageCount,
      .imageFormat = surfaceFormat.format,
      .imageColorSpace = surfaceFormat.colorSpace,
      .imageExtent = imageExtent,
      .imageArrayLayers = 1,
      .imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT,
      .imageSharingMode = VK_SHARING_MODE_EXCLUSIVE,
      .queueFamilyIndexCount = 0,
      .pQueueFamilyIndices = nullptr,
      .preTransform = capabilities.currentTransform,
      .compositeAlpha = rgpuPickCompositeAlpha(capabilities.supportedCompositeAlpha),
      .presentMode = VK_PRESENT_MODE_FIFO_KHR,
      .clipped = VK_TRUE,
      .oldSwapchain = m_active ? m_active->swapchain : VK_NULL_HANDLE,
    };

    auto chain = std::make_shared<Chain>();
    chain->format = (RgpuFormat) surfaceFormat.format;
    chain->extent = RgpuExtent2D{ imageExtent.width, imageExtent.height };

    if (idevice->table.vkCreateSwapchainKHR(idevice->logicalDevice, &createInfo, nullptr, &chain->swapchain) != VK_SUCCESS)
    {
      RGPU_RETURN_ERROR("failed to create swapchain");
    }

    // The old chain is retired by the create call, even though it stays alive.
    retireActiveChain();

    uint32_t imageCount = 0;
    idevice->table.vkGetSwapchainImagesKHR(idevice->logicalDevice, chain->swapchain, &imageCount, nullptr);
    std::vector<VkImage> vkImages(imageCount);
    if (idevice->table.vkGetSwapchainImagesKHR(idevice->logicalDevice, chain->swapchain, &imageCount, vkImages.data()) != VK_SUCCESS)
    {
      rgpuDestroyChain(m_ctx, *chain);
      RGPU_RETURN_ERROR("failed to get swapchain images");
    }

    for (VkImage vkImage : vkImages)
    {
      RgpuImage image;
      if (!rgpuWrapSwapchainImage(m_ctx, vkImage, chain->format, chain->extent, &image))
      {
        rgpuDestroyChain(m_ctx, *chain);
        RGPU_RETURN_ERROR("failed to wrap swapchain image");
      }
      chain->images.push_back(image);
    }

    if (!rgpuCreateChainSemaphores(m_ctx, *chain))
    {
      rgpuDestroyChain(m_ctx, *chain);
      RGPU_RETURN_ERROR("failed to create swapchain semaphores");
    }

    RB_LOG("swapchain configured: {}x{}, {} images", imageExtent.width, imageExtent.height, imageCount);

    m_active = std::move(chain);
    return true;
  }

  std::optional<RgpuSwapchainImage> RgpuSwapchain::acquireNextImage()
  {
    if (!m_active || m_active->outOfDate)
    {
      return std::nullopt;
    }

    RgpuIDevice* idevice = &m_ctx->idevice;
    RgpuSwapchainSemaphores& semaphores = *m_active->semaphores;

    RGPU_RESOLVE_SEMAPHORE(m_ctx, semaphores.freeSemaphore(), isemaphore);

    uint32_t imageIndex;
    VkResult result = idevice->table.vkAcquireNextImageKHR(
      idevice->logicalDevice,
      m_active->swapchain,
      std::numeric_limits<uint64_t>::max(),
      isemaphore->semaphore,
      VK_NULL_HANDLE,
      &imageIndex
    );

    if (result == VK_ERROR_OUT_OF_DATE_KHR)
    {
      m_active->outOfDate = true;
      return std::nullopt;
    }
    // A suboptimal acquire still signals the semaphore; the image is used and present reports it.
    if (result != VK_SUCCESS && result != VK_SUBOPTIMAL_KHR)
    {
      RGPU_FATAL("failed to acquire swapchain image");
    }

    RgpuSwapchainImage image {
      .image = m_active->images[imageIndex],
      .index = imageIndex,
      .chain = (uint64_t) m_active->swapchain
    };
    semaphores.onAcquired(imageIndex, &image.wait, &image.signal);

    return image;
  }

  bool RgpuSwapchain::isActiveChain(uint64_t chain) const
  {
    return m_active && (uint64_t) m_active->swapchain == chain;
  }

  RgpuFormat RgpuSwapchain::format() const
  {
    return m_active ? m_active->format : RgpuFormat::Undefined;
  }

  RgpuExtent2D RgpuSwapchain::extent() const
  {
    return m_active ? m_active->extent : RgpuExtent2D{};
  }
}
