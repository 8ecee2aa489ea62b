#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace tessella::tiling {

// Index into a TilingMesh's point array. The point for lattice cell (x, y) is
// always stored at x + y * cols.
using VertexKey = uint32_t;

// Polygon as a counter-clockwise list of vertex keys
using Face = std::vector<VertexKey>;
using FaceIndex = std::vector<Face>;

using Point = glm::vec2;
using Points = std::vector<Point>;

// Thrown when rows * cols does not fit in a VertexKey.
class TilingOverflowError : public std::overflow_error {
public:
    TilingOverflowError(uint32_t rows, uint32_t cols);
    
    uint32_t GetRows() const { return m_Rows; }
    uint32_t GetCols() const { return m_Cols; }
    
private:
    uint32_t m_Rows;
    uint32_t m_Cols;
};

// Result of one generator call: a finite patch of a uniform tiling.
// Immutable once built; every call produces an independent record.
class TilingMesh {
public:
    TilingMesh(std::string name, uint32_t rows, uint32_t cols, Points points, FaceIndex faces);
    
    const std::string& GetName() const { return m_Name; }
    const Points& GetPoints() const { return m_Points; }
    const FaceIndex& GetFaces() const { return m_Faces; }
    
    uint32_t GetRows() const { return m_Rows; }
    uint32_t GetCols() const { return m_Cols; }
    
    size_t GetVertexCount() const { return m_Points.size(); }
    size_t GetFaceCount() const { return m_Faces.size(); }
    
private:
    std::string m_Name;
    uint32_t m_Rows = 0;
    uint32_t m_Cols = 0;
    Points m_Points;
    FaceIndex m_Faces;
};

} // namespace tessella::tiling
