#pragma once

#include "tessella/tiling/TilingMesh.h"
#include <cstdint>

namespace tessella::tiling {

// Tilings made of a single regular polygon with unit length edges.
// Each generator returns a rows x cols lattice of points; faces cover the
// cells whose corners all fall inside the lattice.
// All generators throw TilingOverflowError when rows * cols does not fit in a VertexKey.
namespace RegularTiling {

// Equilateral triangles on a 60 degree rhombic lattice (3.3.3.3.3.3)
TilingMesh Triangle(uint32_t rows, uint32_t cols);

// Unit squares (4.4.4.4)
TilingMesh Square(uint32_t rows, uint32_t cols);

// Regular hexagons on a brick-offset lattice (6.6.6)
TilingMesh Hexagon(uint32_t rows, uint32_t cols);

} // namespace RegularTiling

} // namespace tessella::tiling
