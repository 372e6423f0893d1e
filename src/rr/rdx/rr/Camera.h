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

#include <glm/glm.hpp>

namespace rdx
{
  struct RrCamera
  {
    glm::mat4 transform = glm::mat4(1.0f); // camera to world
    float fovY = glm::radians(90.0f);
    float nearPlane = 0.001f;
    float farPlane = 10000.0f;
  };

  glm::mat4 rrGetCameraView(const RrCamera& camera);

  // Right-handed, depth range [0, 1].
  glm::mat4 rrGetCameraProjection(const RrCamera& camera, float aspectRatio);
}
