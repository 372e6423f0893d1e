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
#include <string.h>
#include <memory>
#include <new>
#include <span>
#include <type_traits>
#include <vector>

#include "Class.h"

namespace rdx
{
  // CPU scratch memory for one frame's worth of recorded commands. Allocations
  // stay valid until reset(); blocks are kept around for reuse.
  class RbArena
  {
  public:
    explicit RbArena(uint64_t blockSize = 64 * 1024);

    RB_DECLARE_NONCOPY(RbArena)

  public:
    void* alloc(uint64_t size, uint64_t alignment);

    template<typename T>
    std::span<T> allocArray(size_t count)
    {
      static_assert(std::is_trivially_copyable_v<T>);

      if (count == 0)
      {
        return {};
      }

      T* data = (T*) alloc(sizeof(T) * count, alignof(T));
      for (size_t i = 0; i < count; i++)
      {
        new (&data[i]) T{};
      }
      return { data, count };
    }

    template<typename T>
    std::span<const T> copy(std::span<const T> src)
    {
      static_assert(std::is_trivially_copyable_v<T>);

      if (src.empty())
      {
        return {};
      }

      T* data = (T*) alloc(src.size_bytes(), alignof(T));
      memcpy(data, src.data(), src.size_bytes());
      return { data, src.size() };
    }

    void reset();

    uint64_t bytesUsed() const;

  private:
    struct Block
    {
      std::unique_ptr<uint8_t[]> memory;
      uint64_t size;
    };

    uint64_t m_blockSize;
    std::vector<Block> m_blocks;
    uint32_t m_blockIndex = 0;
    uint64_t m_offset = 0;
    uint64_t m_bytesUsed = 0;
  };
}
