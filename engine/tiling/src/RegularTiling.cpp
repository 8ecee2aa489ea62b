#include "tessella/tiling/RegularTiling.h"
#include "tessella/tiling/Lattice.h"

#include <cmath>
#include <utility>

namespace tessella::tiling {
namespace RegularTiling {

namespace {

constexpr FaceOffsets<3> kTriangleUp{{ {0, 0}, {1, 0}, {0, 1} }};
constexpr FaceOffsets<3> kTriangleDown{{ {1, 0}, {1, 1}, {0, 1} }};
constexpr Margins kTriangleMargins = MarginsCovering(kTriangleUp, kTriangleDown);

constexpr FaceOffsets<4> kSquare{{ {0, 0}, {1, 0}, {1, 1}, {0, 1} }};
constexpr Margins kSquareMargins = MarginsCovering(kSquare);

// Hexagon spans two lattice columns and three rows
constexpr FaceOffsets<6> kHexagon{{ {0, 0}, {1, 0}, {1, 1}, {1, 2}, {0, 2}, {0, 1} }};
constexpr Margins kHexagonMargins = MarginsCovering(kHexagon);

} // namespace

TilingMesh Triangle(uint32_t rows, uint32_t cols) {
    const Lattice lattice(rows, cols);
    
    Points points = lattice.BuildPoints(RhombicPosition);
    
    FaceIndex faces;
    lattice.ForEachInterior(kTriangleMargins, [&](int64_t x, int64_t y) {
        faces.push_back(lattice.MakeFace(x, y, kTriangleUp));
        faces.push_back(lattice.MakeFace(x, y, kTriangleDown));
    });
    
    return lattice.Assemble("TRIANGLE", std::move(points), std::move(faces));
}

TilingMesh Square(uint32_t rows, uint32_t cols) {
    const Lattice lattice(rows, cols);
    
    Points points = lattice.BuildPoints([](uint32_t x, uint32_t y) {
        return glm::dvec2(x, y);
    });
    
    FaceIndex faces;
    lattice.ForEachInterior(kSquareMargins, [&](int64_t x, int64_t y) {
        faces.push_back(lattice.MakeFace(x, y, kSquare));
    });
    
    return lattice.Assemble("SQUARE", std::move(points), std::move(faces));
}

TilingMesh Hexagon(uint32_t rows, uint32_t cols) {
    const Lattice lattice(rows, cols);
    
    // Odd rows are shifted half a hexagon; within a row, points alternate
    // between the left and right corner of each hexagon.
    Points points = lattice.BuildPoints([](uint32_t x, uint32_t y) {
        const uint32_t rowParity = y % 2;
        const double px = std::floor((x + rowParity) / 2.0) * 3.0
                        + ((x + y) % 2)
                        - rowParity * 1.5;
        return glm::dvec2(px, y * kSqrt3 * 0.5);
    });
    
    FaceIndex faces;
    lattice.ForEachInterior(kHexagonMargins, [&](int64_t x, int64_t y) {
        if (x % 2 == y % 2) {
            faces.push_back(lattice.MakeFace(x, y, kHexagon));
        }
    });
    
    return lattice.Assemble("HEXAGON", std::move(points), std::move(faces));
}

} // namespace RegularTiling
} // namespace tessella::tiling
