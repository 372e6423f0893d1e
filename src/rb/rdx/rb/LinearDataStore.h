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
#include <assert.h>
#include <deque>

#include "HandleStore.h"

namespace rdx
{
  // Objects are stored in a deque so that pointers returned by get() stay valid
  // while other handles are allocated.
  template<typename T>
  class RbLinearDataStore
  {
  public:
    uint64_t allocate()
    {
      uint64_t handle = m_handleStore.allocateHandle();

      uint32_t index = uint32_t(handle);
      if (index >= m_objects.size())
      {
        m_objects.resize(index + 1);
      }

      m_objects[index] = T{};
      return handle;
    }

    void free(uint64_t handle)
    {
      assert(m_handleStore.isHandleValid(handle));

      m_handleStore.freeHandle(handle);
    }

    bool get(uint64_t handle, T** object)
    {
      if (!m_handleStore.isHandleValid(handle))
      {
        return false;
      }

      *object = &m_objects[uint32_t(handle)];
      return true;
    }

    uint32_t count() const
    {
      return m_handleStore.allocatedCount();
    }

    template<typename F>
    void forEach(F&& fun)
    {
      m_handleStore.forEachHandle([&](uint64_t handle) {
        fun(handle, m_objects[uint32_t(handle)]);
      });
    }

  private:
    RbHandleStore m_handleStore;
    std::deque<T> m_objects;
  };
}
