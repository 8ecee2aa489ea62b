#include "tessella/tiling/TilingCatalog.h"
#include "tessella/tiling/RegularTiling.h"
#include "tessella/tiling/SemiRegularTiling.h"

#include <algorithm>
#include <cctype>

namespace tessella::tiling {

namespace {

struct TilingEntry {
    TilingKind kind;
    const char* name;
    const char* alias;
    const char* vertexConfiguration;
    TilingMesh (*generate)(uint32_t rows, uint32_t cols);
};

const std::array<TilingEntry, kTilingKindCount> s_Entries{{
    { TilingKind::Triangle,     "TRIANGLE",       "tri", "3.3.3.3.3.3", &RegularTiling::Triangle },
    { TilingKind::Square,       "SQUARE",         "sq",  "4.4.4.4",     &RegularTiling::Square },
    { TilingKind::Hexagon,      "HEXAGON",        "hex", "6.6.6",       &RegularTiling::Hexagon },
    { TilingKind::SemiRegular1, "SEMI-REGULAR-1", "sr1", "3.3.3.3.6",   &SemiRegularTiling::One },
    { TilingKind::SemiRegular2, "SEMI-REGULAR-2", "sr2", "4.8.8",       &SemiRegularTiling::Two },
    { TilingKind::SemiRegular3, "SEMI-REGULAR-3", "sr3", "3.3.3.4.4",   &SemiRegularTiling::Three },
    { TilingKind::SemiRegular4, "SEMI-REGULAR-4", "sr4", "3.6.3.6",     &SemiRegularTiling::Four },
    { TilingKind::SemiRegular5, "SEMI-REGULAR-5", "sr5", "3.3.4.3.4",   &SemiRegularTiling::Five },
    { TilingKind::SemiRegular6, "SEMI-REGULAR-6", "sr6", "3.12.12",     &SemiRegularTiling::Six },
    { TilingKind::SemiRegular7, "SEMI-REGULAR-7", "sr7", "3.4.6.4",     &SemiRegularTiling::Seven },
    { TilingKind::SemiRegular8, "SEMI-REGULAR-8", "sr8", "4.6.12",      &SemiRegularTiling::Eight },
}};

const TilingEntry& GetEntry(TilingKind kind) {
    return s_Entries[static_cast<size_t>(kind)];
}

std::string Normalize(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        if (c == '_') c = '-';
        result.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return result;
}

} // namespace

const std::array<TilingKind, kTilingKindCount>& AllTilingKinds() {
    static const std::array<TilingKind, kTilingKindCount> kinds = [] {
        std::array<TilingKind, kTilingKindCount> result{};
        std::transform(s_Entries.begin(), s_Entries.end(), result.begin(),
                       [](const TilingEntry& entry) { return entry.kind; });
        return result;
    }();
    return kinds;
}

const char* GetTilingName(TilingKind kind) {
    return GetEntry(kind).name;
}

const char* GetVertexConfiguration(TilingKind kind) {
    return GetEntry(kind).vertexConfiguration;
}

std::optional<TilingKind> FindTilingKind(const std::string& name) {
    const std::string key = Normalize(name);
    for (const TilingEntry& entry : s_Entries) {
        if (key == entry.name || key == Normalize(entry.alias)) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

TilingMesh Generate(TilingKind kind, uint32_t rows, uint32_t cols) {
    return GetEntry(kind).generate(rows, cols);
}

} // namespace tessella::tiling
