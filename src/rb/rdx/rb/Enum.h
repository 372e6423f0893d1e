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

#include <type_traits>

// Mask operators for scoped flag enums. rbHasFlags() is true only if every
// bit of 'flags' is set in 'value'.
#define RB_DECLARE_FLAG_OPS(FLAGS)                              \
  inline constexpr FLAGS operator|(FLAGS a, FLAGS b)            \
  {                                                             \
    using Bits = std::underlying_type_t<FLAGS>;                 \
    return FLAGS(Bits(a) | Bits(b));                            \
  }                                                             \
  inline constexpr FLAGS operator&(FLAGS a, FLAGS b)            \
  {                                                             \
    using Bits = std::underlying_type_t<FLAGS>;                 \
    return FLAGS(Bits(a) & Bits(b));                            \
  }                                                             \
  inline FLAGS& operator|=(FLAGS& a, FLAGS b)                   \
  {                                                             \
    return a = a | b;                                           \
  }                                                             \
  inline constexpr bool rbHasFlags(FLAGS value, FLAGS flags)    \
  {                                                             \
    return (value & flags) == flags;                            \
  }
