#pragma once

#include "tessella/core/Assert.h"
#include "tessella/tiling/TilingMesh.h"
#include <glm/glm.hpp>
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace tessella::tiling {

constexpr double kSqrt2 = 1.414213562373095049;
constexpr double kSqrt3 = 1.732050807568877293;

// 60 degree rhombic lattice with unit spacing. Used by the triangle tiling and
// by the semi-regular tilings that are subsets of it.
inline glm::dvec2 RhombicPosition(uint32_t x, uint32_t y) {
    return { x + 0.5 * y, y * kSqrt3 * 0.5 };
}

// Position of a face corner relative to the lattice cell that emits the face
struct CellOffset {
    int dx = 0;
    int dy = 0;
};

template<size_t N>
using FaceOffsets = std::array<CellOffset, N>;

// Cells to skip on each side of the lattice so that every offset a face rule
// uses stays inside [0, cols) x [0, rows).
struct Margins {
    uint32_t left = 0;
    uint32_t right = 0;
    uint32_t bottom = 0;
    uint32_t top = 0;
};

// Smallest margins that keep every offset of every given face in bounds
template<size_t... Ns>
constexpr Margins MarginsCovering(const FaceOffsets<Ns>&... faces) {
    Margins margins{};
    auto cover = [&margins](const auto& offsets) {
        for (const CellOffset& o : offsets) {
            if (o.dx < 0) margins.left = std::max(margins.left, static_cast<uint32_t>(-o.dx));
            if (o.dx > 0) margins.right = std::max(margins.right, static_cast<uint32_t>(o.dx));
            if (o.dy < 0) margins.bottom = std::max(margins.bottom, static_cast<uint32_t>(-o.dy));
            if (o.dy > 0) margins.top = std::max(margins.top, static_cast<uint32_t>(o.dy));
        }
    };
    (cover(faces), ...);
    return margins;
}

// A rows x cols patch of lattice cells and the flat indexing shared by every
// lattice builder and face assembler: cell (x, y) lives at key x + y * cols.
class Lattice {
public:
    // Throws TilingOverflowError when rows * cols does not fit in a VertexKey.
    Lattice(uint32_t rows, uint32_t cols);
    
    uint32_t GetRows() const { return m_Rows; }
    uint32_t GetCols() const { return m_Cols; }
    size_t GetPointCount() const { return static_cast<size_t>(m_Rows) * m_Cols; }
    
    VertexKey Key(int64_t x, int64_t y) const {
        TESSELLA_CORE_ASSERT(x >= 0 && x < m_Cols && y >= 0 && y < m_Rows,
                             "Lattice cell ({}, {}) outside {} x {} patch", x, y, m_Cols, m_Rows);
        return static_cast<VertexKey>(x + y * static_cast<int64_t>(m_Cols));
    }
    
    // Keys of the polygon whose corners sit at the given offsets from (x, y)
    template<size_t N>
    Face MakeFace(int64_t x, int64_t y, const FaceOffsets<N>& offsets) const {
        Face face;
        face.reserve(N);
        for (const CellOffset& o : offsets) {
            face.push_back(Key(x + o.dx, y + o.dy));
        }
        return face;
    }
    
    // Evaluates position(x, y) -> glm::dvec2 for every cell, y outermost, and
    // stores the result in single precision.
    template<typename PositionFn>
    Points BuildPoints(PositionFn&& position) const {
        Points points;
        points.reserve(GetPointCount());
        for (uint32_t y = 0; y < m_Rows; ++y) {
            for (uint32_t x = 0; x < m_Cols; ++x) {
                const glm::dvec2 p = position(x, y);
                points.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
            }
        }
        return points;
    }
    
    // Calls visit(x, y) for every cell of the interior left after removing the
    // margins, y outermost. Visits nothing when the margins cover the patch.
    template<typename VisitFn>
    void ForEachInterior(const Margins& margins, VisitFn&& visit) const {
        const int64_t xEnd = static_cast<int64_t>(m_Cols) - margins.right;
        const int64_t yEnd = static_cast<int64_t>(m_Rows) - margins.top;
        for (int64_t y = margins.bottom; y < yEnd; ++y) {
            for (int64_t x = margins.left; x < xEnd; ++x) {
                visit(x, y);
            }
        }
    }
    
    // Packages the generated geometry into the immutable mesh record
    TilingMesh Assemble(std::string name, Points points, FaceIndex faces) const;
    
private:
    uint32_t m_Rows = 0;
    uint32_t m_Cols = 0;
};

} // namespace tessella::tiling
