#include "tessella/tiling/SemiRegularTiling.h"
#include "tessella/tiling/Lattice.h"

#include <array>
#include <utility>

namespace tessella::tiling {
namespace SemiRegularTiling {

namespace {

struct Shift {
    double x = 0.0;
    double y = 0.0;
};

// ============================================================================
// 1: snub hexagonal (3.3.3.3.6)
// ============================================================================

// One hexagon and eight triangles per period of seven cells along x + 3y
constexpr FaceOffsets<3> kOneTriangleUp{{ {0, 0}, {1, 0}, {0, 1} }};
constexpr FaceOffsets<3> kOneTriangleDown{{ {1, 0}, {1, 1}, {0, 1} }};
constexpr FaceOffsets<6> kOneHexagon{{ {1, 0}, {0, 1}, {-1, 1}, {-1, 0}, {0, -1}, {1, -1} }};
constexpr Margins kOneMargins = MarginsCovering(kOneTriangleUp, kOneTriangleDown, kOneHexagon);

// ============================================================================
// 2: truncated square (4.8.8)
// ============================================================================

constexpr FaceOffsets<8> kTwoOctagon{{
    {0, 0}, {1, -1}, {2, -1}, {1, 0}, {1, 1}, {0, 2}, {-1, 2}, {0, 1}
}};
constexpr FaceOffsets<4> kTwoSquare{{ {0, 0}, {1, 0}, {1, 1}, {0, 1} }};
constexpr Margins kTwoOctagonMargins = MarginsCovering(kTwoOctagon);
constexpr Margins kTwoSquareMargins = MarginsCovering(kTwoSquare);

// ============================================================================
// 3: elongated triangular (3.3.3.4.4)
// ============================================================================

constexpr FaceOffsets<4> kThreeSquare{{ {0, 0}, {1, 0}, {1, 1}, {0, 1} }};
constexpr FaceOffsets<3> kThreeTriangleUp{{ {0, 0}, {1, 0}, {0, 1} }};
constexpr FaceOffsets<3> kThreeTriangleDown{{ {1, 0}, {1, 1}, {0, 1} }};
constexpr Margins kThreeMargins = MarginsCovering(kThreeSquare, kThreeTriangleUp, kThreeTriangleDown);

// ============================================================================
// 4: trihexagonal (3.6.3.6)
// ============================================================================

constexpr FaceOffsets<3> kFourTriangleUp{{ {0, 0}, {1, 0}, {0, 1} }};
constexpr FaceOffsets<3> kFourTriangleDown{{ {0, 0}, {0, 1}, {-1, 1} }};
constexpr FaceOffsets<6> kFourHexagon{{ {0, 0}, {1, 0}, {1, 1}, {0, 2}, {-1, 2}, {-1, 1} }};
constexpr Margins kFourMargins = MarginsCovering(kFourTriangleUp, kFourTriangleDown, kFourHexagon);

// ============================================================================
// 5: snub square (3.3.4.3.4)
// ============================================================================

constexpr FaceOffsets<4> kFiveSquare{{ {0, 0}, {1, 0}, {1, 1}, {0, 1} }};
constexpr FaceOffsets<3> kFiveTriangleLeft{{ {0, 0}, {0, 1}, {-1, 1} }};
constexpr FaceOffsets<3> kFiveTriangleUp{{ {0, 0}, {1, 0}, {0, 1} }};
constexpr FaceOffsets<3> kFiveTriangleRight{{ {0, 0}, {1, 0}, {1, 1} }};
constexpr FaceOffsets<3> kFiveTriangleTop{{ {0, 0}, {1, 1}, {0, 1} }};
constexpr Margins kFiveMargins = MarginsCovering(
    kFiveSquare, kFiveTriangleLeft, kFiveTriangleUp, kFiveTriangleRight, kFiveTriangleTop);

// ============================================================================
// 6: truncated hexagonal (3.12.12)
// ============================================================================

// Four lattice rows per band of dodecagons, offsets indexed by y % 4
constexpr std::array<Shift, 4> kSixRowShift{{
    { 0.0, 0.0 },
    { 0.5, kSqrt3 * 0.5 },
    { 0.5, 1.0 + kSqrt3 * 0.5 },
    { 0.0, 1.0 + kSqrt3 },
}};

constexpr FaceOffsets<12> kSixDodecagon{{
    {1, 0}, {2, -1}, {3, -1}, {2, 0}, {2, 1}, {2, 2},
    {2, 3}, {1, 4}, {0, 4}, {1, 3}, {0, 2}, {0, 1}
}};
constexpr FaceOffsets<3> kSixTriangleLow{{ {0, 0}, {1, 0}, {0, 1} }};
constexpr FaceOffsets<3> kSixTriangleHigh{{ {0, 0}, {1, 1}, {0, 1} }};
constexpr Margins kSixMargins = MarginsCovering(kSixDodecagon, kSixTriangleLow, kSixTriangleHigh);

// ============================================================================
// 7: rhombitrihexagonal (3.4.6.4)
// ============================================================================

// Shared by 7 and 8, indexed by y % 4
constexpr std::array<Shift, 4> kHexBandRowShift{{
    { kSqrt3 * 0.5, -0.5 },
    { 0.0, 0.0 },
    { 0.0, 1.0 },
    { kSqrt3 * 0.5, 1.5 },
}};

constexpr FaceOffsets<6> kSevenHexagon{{ {0, 0}, {1, 1}, {1, 2}, {0, 3}, {0, 2}, {0, 1} }};
constexpr FaceOffsets<4> kSevenSquareSlanted{{ {0, 0}, {2, -2}, {2, -1}, {1, 1} }};
constexpr FaceOffsets<3> kSevenTriangleRight{{ {1, 1}, {2, -1}, {2, 1} }};
constexpr FaceOffsets<4> kSevenSquare{{ {0, 0}, {1, 0}, {1, 1}, {0, 1} }};
constexpr FaceOffsets<4> kSevenSquareLeft{{ {0, 0}, {-1, 2}, {-1, 3}, {-1, 1} }};
constexpr FaceOffsets<3> kSevenTriangleLeft{{ {-1, 0}, {0, 0}, {-2, 2} }};
constexpr Margins kSevenMargins = MarginsCovering(
    kSevenHexagon, kSevenSquareSlanted, kSevenTriangleRight,
    kSevenSquare, kSevenSquareLeft, kSevenTriangleLeft);

// ============================================================================
// 8: truncated trihexagonal (4.6.12)
// ============================================================================

// Horizontal position inside a four column group, indexed by x % 4
constexpr std::array<double, 4> kEightColumnShift{{
    0.0,
    kSqrt3,
    1.0 + kSqrt3,
    1.0 + 2.0 * kSqrt3,
}};

constexpr FaceOffsets<6> kEightHexagon{{ {0, 0}, {1, 1}, {1, 2}, {0, 3}, {0, 2}, {0, 1} }};
constexpr FaceOffsets<4> kEightSquare{{ {0, 0}, {1, 0}, {1, 1}, {0, 1} }};
constexpr FaceOffsets<4> kEightSquareLeft{{ {0, 0}, {-3, 2}, {-3, 3}, {-1, 1} }};
constexpr FaceOffsets<4> kEightSquareRight{{ {0, 1}, {-1, 3}, {-2, 2}, {0, 0} }};
constexpr FaceOffsets<12> kEightDodecagon{{
    {0, 0}, {1, -2}, {2, -3}, {3, -3}, {3, -2}, {1, 0},
    {1, 1}, {-1, 3}, {-1, 4}, {-2, 4}, {-3, 3}, {0, 1}
}};
constexpr Margins kEightMargins = MarginsCovering(
    kEightHexagon, kEightSquare, kEightSquareLeft, kEightSquareRight, kEightDodecagon);

} // namespace

TilingMesh One(uint32_t rows, uint32_t cols) {
    const Lattice lattice(rows, cols);
    
    // Subset of the triangular lattice: every seventh point becomes a hexagon centre
    Points points = lattice.BuildPoints(RhombicPosition);
    
    FaceIndex faces;
    lattice.ForEachInterior(kOneMargins, [&](int64_t x, int64_t y) {
        switch ((x + 3 * y) % 7) {
            case 0:
                faces.push_back(lattice.MakeFace(x, y, kOneTriangleUp));
                break;
            case 2:
            case 5:
            case 6:
                faces.push_back(lattice.MakeFace(x, y, kOneTriangleUp));
                faces.push_back(lattice.MakeFace(x, y, kOneTriangleDown));
                break;
            case 4:
                faces.push_back(lattice.MakeFace(x, y, kOneTriangleDown));
                faces.push_back(lattice.MakeFace(x, y, kOneHexagon));
                break;
            default:
                // 1 and 3 lie inside a hexagon
                break;
        }
    });
    
    return lattice.Assemble("SEMI-REGULAR-1", std::move(points), std::move(faces));
}

TilingMesh Two(uint32_t rows, uint32_t cols) {
    const Lattice lattice(rows, cols);
    
    // 2x2 cells hold one unit square; consecutive squares are an octagon diagonal apart
    Points points = lattice.BuildPoints([](uint32_t x, uint32_t y) {
        const double step = 1.0 + kSqrt2 * 0.5;
        return glm::dvec2((x >> 1) * (2.0 + kSqrt2) + (x % 2) + (y >> 1) * step,
                          (y >> 1) * step + (y % 2));
    });
    
    FaceIndex faces;
    lattice.ForEachInterior(kTwoOctagonMargins, [&](int64_t x, int64_t y) {
        if (x % 2 == 1 && y % 2 == 0) {
            faces.push_back(lattice.MakeFace(x, y, kTwoOctagon));
        }
    });
    lattice.ForEachInterior(kTwoSquareMargins, [&](int64_t x, int64_t y) {
        if (x % 2 == 0 && y % 2 == 0) {
            faces.push_back(lattice.MakeFace(x, y, kTwoSquare));
        }
    });
    
    return lattice.Assemble("SEMI-REGULAR-2", std::move(points), std::move(faces));
}

TilingMesh Three(uint32_t rows, uint32_t cols) {
    const Lattice lattice(rows, cols);
    
    // Rows alternate between a unit step (square band) and a triangle height
    Points points = lattice.BuildPoints([](uint32_t x, uint32_t y) {
        return glm::dvec2(x + 0.5 * (y >> 1),
                          (y >> 1) * (1.0 + kSqrt3 * 0.5) + (y % 2));
    });
    
    FaceIndex faces;
    lattice.ForEachInterior(kThreeMargins, [&](int64_t x, int64_t y) {
        if (y % 2 == 0) {
            faces.push_back(lattice.MakeFace(x, y, kThreeSquare));
        } else {
            faces.push_back(lattice.MakeFace(x, y, kThreeTriangleUp));
            faces.push_back(lattice.MakeFace(x, y, kThreeTriangleDown));
        }
    });
    
    return lattice.Assemble("SEMI-REGULAR-3", std::move(points), std::move(faces));
}

TilingMesh Four(uint32_t rows, uint32_t cols) {
    const Lattice lattice(rows, cols);
    
    Points points = lattice.BuildPoints(RhombicPosition);
    
    FaceIndex faces;
    lattice.ForEachInterior(kFourMargins, [&](int64_t x, int64_t y) {
        const bool evenColumn = x % 2 == 0;
        const bool evenRow = y % 2 == 0;
        if (evenColumn && evenRow) {
            faces.push_back(lattice.MakeFace(x, y, kFourTriangleUp));
        }
        if (evenColumn && !evenRow) {
            faces.push_back(lattice.MakeFace(x, y, kFourTriangleDown));
        }
        if (!evenColumn && evenRow) {
            faces.push_back(lattice.MakeFace(x, y, kFourHexagon));
        }
    });
    
    return lattice.Assemble("SEMI-REGULAR-4", std::move(points), std::move(faces));
}

TilingMesh Five(uint32_t rows, uint32_t cols) {
    const Lattice lattice(rows, cols);
    
    // Squares are rotated by 30 degrees; each 2x2 block is sheared by half a unit
    Points points = lattice.BuildPoints([](uint32_t x, uint32_t y) {
        const double step = 1.0 + kSqrt3 * 0.5;
        return glm::dvec2((x >> 1) * step + (x % 2) - (y >> 1) * 0.5,
                          (y >> 1) * step + (y % 2) + (x >> 1) * 0.5);
    });
    
    FaceIndex faces;
    lattice.ForEachInterior(kFiveMargins, [&](int64_t x, int64_t y) {
        const bool evenColumn = x % 2 == 0;
        const bool evenRow = y % 2 == 0;
        if (evenColumn && evenRow) {
            faces.push_back(lattice.MakeFace(x, y, kFiveSquare));
            faces.push_back(lattice.MakeFace(x, y, kFiveTriangleLeft));
        }
        if (!evenColumn && evenRow) {
            faces.push_back(lattice.MakeFace(x, y, kFiveTriangleUp));
        }
        if (evenColumn && !evenRow) {
            faces.push_back(lattice.MakeFace(x, y, kFiveTriangleRight));
            faces.push_back(lattice.MakeFace(x, y, kFiveTriangleTop));
        }
        if (!evenColumn && !evenRow) {
            faces.push_back(lattice.MakeFace(x, y, kFiveSquare));
        }
    });
    
    return lattice.Assemble("SEMI-REGULAR-5", std::move(points), std::move(faces));
}

TilingMesh Six(uint32_t rows, uint32_t cols) {
    const Lattice lattice(rows, cols);
    
    Points points = lattice.BuildPoints([](uint32_t x, uint32_t y) {
        const Shift& shift = kSixRowShift[y % 4];
        return glm::dvec2((x >> 1) * (2.0 + kSqrt3) + (x % 2) + (y >> 2) * (1.0 + kSqrt3 * 0.5) + shift.x,
                          (y >> 2) * (1.5 + kSqrt3) + shift.y);
    });
    
    FaceIndex faces;
    lattice.ForEachInterior(kSixMargins, [&](int64_t x, int64_t y) {
        if (x % 2 != 0) {
            return;
        }
        switch (y % 4) {
            case 0:
                faces.push_back(lattice.MakeFace(x, y, kSixDodecagon));
                faces.push_back(lattice.MakeFace(x, y, kSixTriangleLow));
                break;
            case 2:
                faces.push_back(lattice.MakeFace(x, y, kSixTriangleHigh));
                break;
            default:
                break;
        }
    });
    
    return lattice.Assemble("SEMI-REGULAR-6", std::move(points), std::move(faces));
}

TilingMesh Seven(uint32_t rows, uint32_t cols) {
    const Lattice lattice(rows, cols);
    
    Points points = lattice.BuildPoints([](uint32_t x, uint32_t y) {
        const Shift& shift = kHexBandRowShift[y % 4];
        return glm::dvec2((x >> 1) * (1.0 + kSqrt3) + (x % 2) * kSqrt3 + (y >> 2) * (0.5 + kSqrt3 * 0.5) + shift.x,
                          (y >> 2) * (1.5 + kSqrt3 * 0.5) + shift.y);
    });
    
    FaceIndex faces;
    lattice.ForEachInterior(kSevenMargins, [&](int64_t x, int64_t y) {
        const bool evenColumn = x % 2 == 0;
        const int64_t band = y % 4;
        if (evenColumn && band == 0) {
            faces.push_back(lattice.MakeFace(x, y, kSevenHexagon));
            faces.push_back(lattice.MakeFace(x, y, kSevenSquareSlanted));
            faces.push_back(lattice.MakeFace(x, y, kSevenTriangleRight));
        }
        if (!evenColumn && band == 1) {
            faces.push_back(lattice.MakeFace(x, y, kSevenSquare));
        }
        if (!evenColumn && band == 2) {
            faces.push_back(lattice.MakeFace(x, y, kSevenSquareLeft));
        }
        if (evenColumn && band == 2) {
            faces.push_back(lattice.MakeFace(x, y, kSevenTriangleLeft));
        }
    });
    
    return lattice.Assemble("SEMI-REGULAR-7", std::move(points), std::move(faces));
}

TilingMesh Eight(uint32_t rows, uint32_t cols) {
    const Lattice lattice(rows, cols);
    
    Points points = lattice.BuildPoints([](uint32_t x, uint32_t y) {
        const Shift& shift = kHexBandRowShift[y % 4];
        return glm::dvec2((x >> 2) * (3.0 + 3.0 * kSqrt3) + (y >> 2) * (1.5 + 1.5 * kSqrt3)
                              + shift.x + kEightColumnShift[x % 4],
                          (y >> 2) * (1.5 + kSqrt3 * 0.5) + shift.y);
    });
    
    FaceIndex faces;
    lattice.ForEachInterior(kEightMargins, [&](int64_t x, int64_t y) {
        const int64_t column = x % 4;
        const int64_t band = y % 4;
        if (column % 2 == 0 && band == 0) {
            faces.push_back(lattice.MakeFace(x, y, kEightHexagon));
        }
        if (column == 1 && band == 1) {
            faces.push_back(lattice.MakeFace(x, y, kEightSquare));
        }
        if (column == 3 && band == 2) {
            faces.push_back(lattice.MakeFace(x, y, kEightSquareLeft));
        }
        if (column == 0 && band == 2) {
            faces.push_back(lattice.MakeFace(x, y, kEightSquareRight));
        }
        if (column == 3 && band == 1) {
            faces.push_back(lattice.MakeFace(x, y, kEightDodecagon));
        }
    });
    
    return lattice.Assemble("SEMI-REGULAR-8", std::move(points), std::move(faces));
}

} // namespace SemiRegularTiling
} // namespace tessella::tiling
