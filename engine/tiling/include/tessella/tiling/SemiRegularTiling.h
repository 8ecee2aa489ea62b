#pragma once

#include "tessella/tiling/TilingMesh.h"
#include <cstdint>

namespace tessella::tiling {

// The eight Archimedean tilings: two or more regular polygons with unit
// length edges, every vertex surrounded by the same polygon arrangement.
//
// The lattice of each tiling is laid out so that neighbouring polygons share
// points; faces are only emitted where all of a polygon's corners fall inside
// the requested rows x cols patch, so the border of the patch stays ragged.
// All generators throw TilingOverflowError when rows * cols does not fit in a VertexKey.
namespace SemiRegularTiling {

// Snub hexagonal (3.3.3.3.6)
TilingMesh One(uint32_t rows, uint32_t cols);

// Truncated square (4.8.8)
TilingMesh Two(uint32_t rows, uint32_t cols);

// Elongated triangular (3.3.3.4.4)
TilingMesh Three(uint32_t rows, uint32_t cols);

// Trihexagonal (3.6.3.6)
TilingMesh Four(uint32_t rows, uint32_t cols);

// Snub square (3.3.4.3.4)
TilingMesh Five(uint32_t rows, uint32_t cols);

// Truncated hexagonal (3.12.12)
TilingMesh Six(uint32_t rows, uint32_t cols);

// Rhombitrihexagonal (3.4.6.4)
TilingMesh Seven(uint32_t rows, uint32_t cols);

// Truncated trihexagonal (4.6.12)
TilingMesh Eight(uint32_t rows, uint32_t cols);

} // namespace SemiRegularTiling

} // namespace tessella::tiling
