#include "tessella/tiling/TilingMesh.h"

#include <utility>

namespace tessella::tiling {

TilingOverflowError::TilingOverflowError(uint32_t rows, uint32_t cols)
    : std::overflow_error("Tiling lattice of " + std::to_string(rows) + " x " + std::to_string(cols) +
                          " points exceeds the vertex key range")
    , m_Rows(rows)
    , m_Cols(cols) {
}

TilingMesh::TilingMesh(std::string name, uint32_t rows, uint32_t cols, Points points, FaceIndex faces)
    : m_Name(std::move(name))
    , m_Rows(rows)
    , m_Cols(cols)
    , m_Points(std::move(points))
    , m_Faces(std::move(faces)) {
}

} // namespace tessella::tiling
