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

#include <map>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace rdx
{
  enum class RrVertexFormat
  {
    Float32,
    Sint32,
    Uint32,
    Float32x2,
    Sint32x2,
    Uint32x2,
    Float32x3,
    Sint32x3,
    Uint32x3,
    Float32x4,
    Sint32x4,
    Uint32x4,
    Sint16x2,
    Snorm16x2,
    Uint16x2,
    Unorm16x2,
    Sint16x4,
    Snorm16x4,
    Uint16x4,
    Unorm16x4,
    Sint8x2,
    Snorm8x2,
    Uint8x2,
    Unorm8x2,
    Sint8x4,
    Snorm8x4,
    Uint8x4,
    Unorm8x4
  };

  // Size in bytes of one element.
  uint32_t rrGetVertexFormatSize(RrVertexFormat format);

  enum class RrPrimitiveTopology
  {
    PointList,
    LineList,
    LineStrip,
    TriangleList,
    TriangleStrip
  };

  // Tightly packed elements of a single format.
  struct RrVertexAttribute
  {
    RrVertexFormat format;
    std::vector<uint8_t> data;

    uint32_t count() const;
  };

  using RrIndices = std::variant<std::vector<uint16_t>, std::vector<uint32_t>>;

  uint32_t rrGetIndexCount(const RrIndices& indices);

  std::span<const uint8_t> rrGetIndexBytes(const RrIndices& indices);

  class RrMesh
  {
  public:
    constexpr static const char* ATTRIBUTE_POSITION = "Vertex_Position";
    constexpr static const char* ATTRIBUTE_NORMAL = "Vertex_Normal";
    constexpr static const char* ATTRIBUTE_TANGENT = "Vertex_Tangent";
    constexpr static const char* ATTRIBUTE_COLOR = "Vertex_Color";
    constexpr static const char* ATTRIBUTE_UV_0 = "Vertex_Uv";
    constexpr static const char* ATTRIBUTE_JOINT_WEIGHT = "Vertex_JointWeight";
    constexpr static const char* ATTRIBUTE_JOINT_INDEX = "Vertex_JointIndex";

  public:
    explicit RrMesh(RrPrimitiveTopology topology);

  public:
    RrPrimitiveTopology topology() const { return m_topology; }

    void setAttribute(const std::string& name, RrVertexAttribute attribute);

    template<typename T>
    void setAttribute(const std::string& name, RrVertexFormat format, std::span<const T> values)
    {
      const uint8_t* bytes = (const uint8_t*) values.data();
      setAttribute(name, RrVertexAttribute{ format, std::vector<uint8_t>(bytes, bytes + values.size_bytes()) });
    }

    const RrVertexAttribute* attribute(const std::string& name) const;

    const std::map<std::string, RrVertexAttribute>& attributes() const { return m_attributes; }

    void setIndices(std::optional<RrIndices> indices);

    const std::optional<RrIndices>& indices() const { return m_indices; }

    // Fails if two attributes disagree in element count. A mesh without
    // attributes has zero vertices.
    bool countVertices(uint32_t* count) const;

    // Expands indexed triangle lists so no vertex is shared. No-op without
    // indices. The mesh is left unchanged on failure.
    bool duplicateVertices();

    // Requires non-indexed Float32x3 positions in a triangle list. Degenerate
    // triangles get a zero normal.
    bool computeFlatNormals();

  private:
    RrPrimitiveTopology m_topology;
    std::map<std::string, RrVertexAttribute> m_attributes;
    std::optional<RrIndices> m_indices;
  };
}
