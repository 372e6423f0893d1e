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

#include "rdx/rb/Arena.h"
#include "rdx/rb/Data.h"

#include <assert.h>
#include <algorithm>

namespace rdx
{
  RbArena::RbArena(uint64_t blockSize)
    : m_blockSize(blockSize)
  {
    assert(blockSize > 0);
  }

  void* RbArena::alloc(uint64_t size, uint64_t alignment)
  {
    assert(alignment > 0 && (alignment & (alignment - 1)) == 0);

    while (m_blockIndex < m_blocks.size())
    {
      Block& block = m_blocks[m_blockIndex];

      uint64_t offset = rbAlignUpwards(m_offset, alignment);

      if (offset + size <= block.size)
      {
        m_offset = offset + size;
        m_bytesUsed += size;
        return &block.memory[offset];
      }

      m_blockIndex++;
      m_offset = 0;
    }

    // Oversized requests get a dedicated block. new[] memory satisfies the
    // fundamental alignment, larger alignments are not supported.
    assert(alignment <= alignof(std::max_align_t));

    uint64_t blockSize = std::max(m_blockSize, size);
    m_blocks.push_back(Block{ .memory = std::make_unique<uint8_t[]>(blockSize), .size = blockSize });
    m_blockIndex = uint32_t(m_blocks.size() - 1);

    m_offset = size;
    m_bytesUsed += size;
    return &m_blocks[m_blockIndex].memory[0];
  }

  void RbArena::reset()
  {
    m_blockIndex = 0;
    m_offset = 0;
    m_bytesUsed = 0;
  }

  uint64_t RbArena::bytesUsed() const
  {
    return m_bytesUsed;
  }
}
