#pragma once

#include "tessella/tiling/TilingMesh.h"
#include <cstddef>
#include <map>
#include <string>

namespace tessella::tiling {

// Structural and geometric checks over a generated tiling patch
struct ValidationReport {
    size_t expectedPointCount = 0;   // rows * cols
    size_t pointCount = 0;
    size_t faceCount = 0;
    
    size_t outOfBoundsKeys = 0;      // keys >= point count
    size_t repeatedKeyFaces = 0;     // faces listing a key twice
    size_t degenerateFaces = 0;      // faces with fewer than three keys
    size_t clockwiseFaces = 0;       // non-positive signed area
    size_t nonUnitEdges = 0;         // edge length differs from 1 by more than the tolerance
    
    // Face vertex count -> number of faces
    std::map<size_t, size_t> faceSizes;
    
    bool IsValid() const {
        return pointCount == expectedPointCount &&
               outOfBoundsKeys == 0 && repeatedKeyFaces == 0 && degenerateFaces == 0 &&
               clockwiseFaces == 0 && nonUnitEdges == 0;
    }
    
    // One line, e.g. "400 points, 252 faces [3:224 6:28], valid"
    std::string Summary() const;
};

// Every tiling uses unit edges; the tolerance absorbs single precision storage.
ValidationReport ValidateTilingMesh(const TilingMesh& mesh, double edgeTolerance = 1e-3);

} // namespace tessella::tiling
