#pragma once

#include "tessella/tiling/TilingMesh.h"
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace tessella::tiling {

enum class TilingKind : uint8_t {
    Triangle,
    Square,
    Hexagon,
    SemiRegular1,
    SemiRegular2,
    SemiRegular3,
    SemiRegular4,
    SemiRegular5,
    SemiRegular6,
    SemiRegular7,
    SemiRegular8,
};

constexpr size_t kTilingKindCount = 11;

// Regular tilings first, then the semi-regular ones in order
const std::array<TilingKind, kTilingKindCount>& AllTilingKinds();

// Identifier used as the mesh name, e.g. "HEXAGON" or "SEMI-REGULAR-3"
const char* GetTilingName(TilingKind kind);

// Vertex configuration around every vertex, e.g. "4.8.8"
const char* GetVertexConfiguration(TilingKind kind);

// Case-insensitive lookup. Accepts the identifier ("SEMI-REGULAR-3"),
// underscores instead of dashes, and short aliases ("sr3").
std::optional<TilingKind> FindTilingKind(const std::string& name);

// Runs the generator for kind. Throws TilingOverflowError like the generators do.
TilingMesh Generate(TilingKind kind, uint32_t rows, uint32_t cols);

} // namespace tessella::tiling
