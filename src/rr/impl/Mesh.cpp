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

#include "rdx/rr/Mesh.h"

#include <rdx/rb/Log.h>

#include <glm/glm.hpp>

#include <cmath>
#include <string.h>

namespace rdx
{
  uint32_t rrGetVertexFormatSize(RrVertexFormat format)
  {
    switch (format)
    {
    case RrVertexFormat::Float32:
    case RrVertexFormat::Sint32:
    case RrVertexFormat::Uint32:
      return 4;
    case RrVertexFormat::Float32x2:
    case RrVertexFormat::Sint32x2:
    case RrVertexFormat::Uint32x2:
      return 8;
    case RrVertexFormat::Float32x3:
    case RrVertexFormat::Sint32x3:
    case RrVertexFormat::Uint32x3:
      return 12;
    case RrVertexFormat::Float32x4:
    case RrVertexFormat::Sint32x4:
    case RrVertexFormat::Uint32x4:
      return 16;
    case RrVertexFormat::Sint16x2:
    case RrVertexFormat::Snorm16x2:
    case RrVertexFormat::Uint16x2:
    case RrVertexFormat::Unorm16x2:
      return 4;
    case RrVertexFormat::Sint16x4:
    case RrVertexFormat::Snorm16x4:
    case RrVertexFormat::Uint16x4:
    case RrVertexFormat::Unorm16x4:
      return 8;
    case RrVertexFormat::Sint8x2:
    case RrVertexFormat::Snorm8x2:
    case RrVertexFormat::Uint8x2:
    case RrVertexFormat::Unorm8x2:
      return 2;
    case RrVertexFormat::Sint8x4:
    case RrVertexFormat::Snorm8x4:
    case RrVertexFormat::Uint8x4:
    case RrVertexFormat::Unorm8x4:
      return 4;
    }
    return 0;
  }

  uint32_t RrVertexAttribute::count() const
  {
    return uint32_t(data.size() / rrGetVertexFormatSize(format));
  }

  uint32_t rrGetIndexCount(const RrIndices& indices)
  {
    return std::visit([](const auto& v) { return uint32_t(v.size()); }, indices);
  }

  std::span<const uint8_t> rrGetIndexBytes(const RrIndices& indices)
  {
    return std::visit([](const auto& v) {
      return std::span<const uint8_t>((const uint8_t*) v.data(), v.size() * sizeof(v[0]));
    }, indices);
  }

  RrMesh::RrMesh(RrPrimitiveTopology topology)
    : m_topology(topology)
  {
  }

  void RrMesh::setAttribute(const std::string& name, RrVertexAttribute attribute)
  {
    m_attributes[name] = std::move(attribute);
  }

  const RrVertexAttribute* RrMesh::attribute(const std::string& name) const
  {
    auto it = m_attributes.find(name);
    return (it == m_attributes.end()) ? nullptr : &it->second;
  }

  void RrMesh::setIndices(std::optional<RrIndices> indices)
  {
    m_indices = std::move(indices);
  }

  bool RrMesh::countVertices(uint32_t* count) const
  {
    std::optional<uint32_t> vertexCount;

    for (const auto& [name, attribute] : m_attributes)
    {
      uint32_t attributeCount = attribute.count();

      if (vertexCount && *vertexCount != attributeCount)
      {
        RB_ERROR("attribute {} has a different vertex count ({}) than other attributes ({})",
                 name, attributeCount, *vertexCount);
        return false;
      }

      vertexCount = attributeCount;
    }

    *count = vertexCount.value_or(0);
    return true;
  }

  bool RrMesh::duplicateVertices()
  {
    if (m_topology != RrPrimitiveTopology::TriangleList)
    {
      RB_ERROR("can only duplicate vertices of triangle lists");
      return false;
    }

    if (!m_indices)
    {
      return true;
    }

    uint32_t vertexCount;
    if (!countVertices(&vertexCount))
    {
      return false;
    }

    std::vector<uint32_t> indices;
    std::visit([&](const auto& v) { indices.assign(v.begin(), v.end()); }, *m_indices);

    for (uint32_t index : indices)
    {
      if (index >= vertexCount)
      {
        RB_ERROR("index {} out of range for {} vertices", index, vertexCount);
        return false;
      }
    }

    for (auto& entry : m_attributes)
    {
      RrVertexAttribute& attribute = entry.second;
      uint32_t elementSize = rrGetVertexFormatSize(attribute.format);

      std::vector<uint8_t> data(indices.size() * elementSize);
      for (size_t i = 0; i < indices.size(); i++)
      {
        memcpy(&data[i * elementSize], &attribute.data[size_t(indices[i]) * elementSize], elementSize);
      }

      attribute.data = std::move(data);
    }

    m_indices.reset();
    return true;
  }

  bool RrMesh::computeFlatNormals()
  {
    if (m_indices)
    {
      RB_ERROR("flat normals require non-indexed geometry");
      return false;
    }

    const RrVertexAttribute* positions = attribute(ATTRIBUTE_POSITION);
    if (!positions || positions->format != RrVertexFormat::Float32x3)
    {
      RB_ERROR("flat normals require Float32x3 positions");
      return false;
    }

    uint32_t vertexCount = positions->count();
    if (m_topology != RrPrimitiveTopology::TriangleList || (vertexCount % 3) != 0)
    {
      RB_ERROR("flat normals require a triangle list");
      return false;
    }

    std::vector<glm::vec3> p(vertexCount);
    memcpy(p.data(), positions->data.data(), vertexCount * sizeof(glm::vec3));

    std::vector<glm::vec3> normals(vertexCount);
    for (uint32_t i = 0; i < vertexCount; i += 3)
    {
      glm::vec3 c = glm::cross(p[i + 1] - p[i], p[i + 2] - p[i]);

      // Degenerate triangles get a zero normal.
      float lengthSquared = glm::dot(c, c);
      glm::vec3 n = (lengthSquared > 0.0f) ? c / std::sqrt(lengthSquared) : glm::vec3(0.0f);
      normals[i + 0] = n;
      normals[i + 1] = n;
      normals[i + 2] = n;
    }

    setAttribute(ATTRIBUTE_NORMAL, RrVertexFormat::Float32x3, std::span<const glm::vec3>(normals));
    return true;
  }
}
