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
#include <concepts>
#include <limits>

namespace rdx
{
  template<std::integral T>
  T rbAlignUpwards(T value, T alignment)
  {
    if (alignment == T(0))
    {
      return value;
    }

    return (value + alignment - T(1)) / alignment * alignment;
  }

  template<std::unsigned_integral T>
  bool rbCheckedAdd(T a, T b, T* result)
  {
    if (a > std::numeric_limits<T>::max() - b)
    {
      return false;
    }

    *result = a + b;
    return true;
  }

  template<std::unsigned_integral T>
  bool rbCheckedMul(T a, T b, T* result)
  {
    if (a != T(0) && b > std::numeric_limits<T>::max() / a)
    {
      return false;
    }

    *result = a * b;
    return true;
  }

  // Same as rbAlignUpwards but fails instead of wrapping around.
  template<std::unsigned_integral T>
  bool rbCheckedAlignUpwards(T value, T alignment, T* result)
  {
    if (alignment == T(0))
    {
      *result = value;
      return true;
    }

    T biased;
    if (!rbCheckedAdd(value, T(alignment - T(1)), &biased))
    {
      return false;
    }

    *result = biased / alignment * alignment;
    return true;
  }
}
