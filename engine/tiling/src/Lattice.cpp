#include "tessella/tiling/Lattice.h"
#include "tessella/core/Log.h"

#include <limits>
#include <utility>

namespace tessella::tiling {

Lattice::Lattice(uint32_t rows, uint32_t cols)
    : m_Rows(rows)
    , m_Cols(cols) {
    const uint64_t count = static_cast<uint64_t>(rows) * cols;
    if (count > std::numeric_limits<VertexKey>::max()) {
        TESSELLA_CORE_ERROR("Refusing to build {} x {} lattice: {} points exceed the vertex key range",
                            rows, cols, count);
        throw TilingOverflowError(rows, cols);
    }
}

TilingMesh Lattice::Assemble(std::string name, Points points, FaceIndex faces) const {
    TESSELLA_CORE_ASSERT(points.size() == GetPointCount(), "{} points for a {} x {} lattice",
                         points.size(), m_Rows, m_Cols);
    TESSELLA_CORE_DEBUG("Generated {} tiling ({} x {}): {} points, {} faces",
                        name, m_Rows, m_Cols, points.size(), faces.size());
    return TilingMesh(std::move(name), m_Rows, m_Cols, std::move(points), std::move(faces));
}

} // namespace tessella::tiling
