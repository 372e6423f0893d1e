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
#include <vector>

namespace rdx
{
  // Generational handles: the upper 32 bits hold the version, the lower 32 bits the
  // slot index. Version 0 is never handed out, so a zeroed handle is always invalid.
  class RbHandleStore
  {
  public:
    uint64_t allocateHandle();

    bool isHandleValid(uint64_t handle) const;

    void freeHandle(uint64_t handle);

    uint32_t allocatedCount() const;

    template<typename F>
    void forEachHandle(F&& fun) const
    {
      for (uint32_t index = 0; index < m_maxIndex; index++)
      {
        if (m_allocated[index])
        {
          fun((uint64_t(m_versions[index]) << 32ul) | index);
        }
      }
    }

  private:
    uint32_t m_maxIndex = 0;
    std::vector<uint32_t> m_versions;
    std::vector<uint8_t> m_allocated;
    std::vector<uint32_t> m_freeList;
  };
}
