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

#include "rdx/rr/Camera.h"

#include <glm/gtc/matrix_transform.hpp>

namespace rdx
{
  glm::mat4 rrGetCameraView(const RrCamera& camera)
  {
    return glm::inverse(camera.transform);
  }

  glm::mat4 rrGetCameraProjection(const RrCamera& camera, float aspectRatio)
  {
    return glm::perspectiveRH_ZO(camera.fovY, aspectRatio, camera.nearPlane, camera.farPlane);
  }
}
