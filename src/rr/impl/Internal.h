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

#include <rdx/rb/Log.h>

#include <stdlib.h>

#define RR_FATAL(msg)                               \
  do {                                              \
    RB_ERROR("{}:{}: {}", __FILE__, __LINE__, msg); \
    rdx::rbLogFlush();                              \
    exit(EXIT_FAILURE);                             \
  } while (false)
