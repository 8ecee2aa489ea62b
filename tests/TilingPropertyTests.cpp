#include "tessella/tiling/TilingCatalog.h"
#include "tessella/tiling/MeshValidation.h"

#include <gtest/gtest.h>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace tessella::tiling;

namespace {

// Polygon sizes each tiling is allowed to emit
std::set<size_t> PolygonSizes(TilingKind kind) {
    switch (kind) {
        case TilingKind::Triangle:     return { 3 };
        case TilingKind::Square:       return { 4 };
        case TilingKind::Hexagon:      return { 6 };
        case TilingKind::SemiRegular1: return { 3, 6 };
        case TilingKind::SemiRegular2: return { 4, 8 };
        case TilingKind::SemiRegular3: return { 3, 4 };
        case TilingKind::SemiRegular4: return { 3, 6 };
        case TilingKind::SemiRegular5: return { 3, 4 };
        case TilingKind::SemiRegular6: return { 3, 12 };
        case TilingKind::SemiRegular7: return { 3, 4, 6 };
        case TilingKind::SemiRegular8: return { 4, 6, 12 };
    }
    return {};
}

const std::vector<std::pair<uint32_t, uint32_t>> kSizes{
    { 0, 0 }, { 0, 9 }, { 9, 0 }, { 1, 1 }, { 1, 12 }, { 12, 1 }, { 2, 2 }, { 3, 3 },
    { 4, 4 }, { 5, 7 }, { 7, 5 }, { 8, 8 }, { 9, 13 }, { 16, 16 }, { 23, 17 }, { 32, 40 },
};

class TilingPropertyTest : public ::testing::TestWithParam<TilingKind> {};

} // namespace

TEST_P(TilingPropertyTest, PointCountIsRowsTimesCols) {
    for (const auto& [rows, cols] : kSizes) {
        const TilingMesh mesh = Generate(GetParam(), rows, cols);
        EXPECT_EQ(mesh.GetVertexCount(), static_cast<size_t>(rows) * cols) << rows << " x " << cols;
        EXPECT_EQ(mesh.GetRows(), rows);
        EXPECT_EQ(mesh.GetCols(), cols);
    }
}

TEST_P(TilingPropertyTest, FacesStayInBoundsWithDistinctKeys) {
    for (const auto& [rows, cols] : kSizes) {
        const TilingMesh mesh = Generate(GetParam(), rows, cols);
        for (const Face& face : mesh.GetFaces()) {
            ASSERT_GE(face.size(), 3u);
            std::set<VertexKey> keys(face.begin(), face.end());
            EXPECT_EQ(keys.size(), face.size()) << rows << " x " << cols;
            EXPECT_LT(*keys.rbegin(), static_cast<VertexKey>(rows * cols)) << rows << " x " << cols;
        }
    }
}

TEST_P(TilingPropertyTest, FacesAreCounterClockwiseWithUnitEdges) {
    const TilingMesh mesh = Generate(GetParam(), 24, 28);
    const ValidationReport report = ValidateTilingMesh(mesh);
    EXPECT_TRUE(report.IsValid()) << mesh.GetName() << ": " << report.Summary();
    EXPECT_GT(report.faceCount, 0u);
}

TEST_P(TilingPropertyTest, EmitsOnlyTheTilingsPolygons) {
    const TilingMesh mesh = Generate(GetParam(), 24, 28);
    const std::set<size_t> allowed = PolygonSizes(GetParam());
    
    std::set<size_t> emitted;
    for (const Face& face : mesh.GetFaces()) {
        emitted.insert(face.size());
    }
    // A patch this size contains every polygon of the tiling
    EXPECT_EQ(emitted, allowed) << mesh.GetName();
}

TEST_P(TilingPropertyTest, GenerationIsDeterministic) {
    const TilingMesh first = Generate(GetParam(), 17, 19);
    const TilingMesh second = Generate(GetParam(), 17, 19);
    
    EXPECT_EQ(first.GetName(), second.GetName());
    ASSERT_EQ(first.GetPoints().size(), second.GetPoints().size());
    for (size_t i = 0; i < first.GetPoints().size(); ++i) {
        // Bit-identical, not just close
        EXPECT_EQ(first.GetPoints()[i].x, second.GetPoints()[i].x);
        EXPECT_EQ(first.GetPoints()[i].y, second.GetPoints()[i].y);
    }
    EXPECT_EQ(first.GetFaces(), second.GetFaces());
}

TEST_P(TilingPropertyTest, PositionsDoNotDependOnPatchSize) {
    const uint32_t rows1 = 9, cols1 = 11;
    const uint32_t rows2 = 20, cols2 = 26;
    const TilingMesh small = Generate(GetParam(), rows1, cols1);
    const TilingMesh large = Generate(GetParam(), rows2, cols2);
    
    for (uint32_t y = 0; y < rows1; ++y) {
        for (uint32_t x = 0; x < cols1; ++x) {
            const Point& a = small.GetPoints()[x + y * cols1];
            const Point& b = large.GetPoints()[x + y * cols2];
            EXPECT_EQ(a.x, b.x) << "(" << x << ", " << y << ")";
            EXPECT_EQ(a.y, b.y) << "(" << x << ", " << y << ")";
        }
    }
}

TEST_P(TilingPropertyTest, SmallPatchFacesAreKeptByLargerPatches) {
    // Every face of a small patch reappears, re-indexed, in a larger one
    const uint32_t rows1 = 10, cols1 = 12;
    const uint32_t cols2 = 21;
    const TilingMesh small = Generate(GetParam(), rows1, cols1);
    const TilingMesh large = Generate(GetParam(), 18, cols2);
    
    std::set<Face> largeFaces(large.GetFaces().begin(), large.GetFaces().end());
    for (const Face& face : small.GetFaces()) {
        Face reindexed;
        for (VertexKey key : face) {
            reindexed.push_back((key % cols1) + (key / cols1) * cols2);
        }
        EXPECT_TRUE(largeFaces.count(reindexed)) << small.GetName();
    }
}

TEST_P(TilingPropertyTest, DegeneratePatchesAreNotErrors) {
    for (uint32_t n = 0; n < 3; ++n) {
        EXPECT_NO_THROW({
            const TilingMesh wide = Generate(GetParam(), n, 50);
            EXPECT_EQ(wide.GetVertexCount(), static_cast<size_t>(n) * 50);
        });
        EXPECT_NO_THROW({
            const TilingMesh tall = Generate(GetParam(), 50, n);
            EXPECT_EQ(tall.GetVertexCount(), static_cast<size_t>(n) * 50);
        });
    }
    EXPECT_TRUE(Generate(GetParam(), 0, 0).GetFaces().empty());
    EXPECT_TRUE(Generate(GetParam(), 1, 1).GetFaces().empty());
    EXPECT_TRUE(Generate(GetParam(), 1, 50).GetFaces().empty());
}

TEST_P(TilingPropertyTest, OverflowingPatchThrows) {
    EXPECT_THROW(Generate(GetParam(), 65536, 65536), TilingOverflowError);
    EXPECT_THROW(Generate(GetParam(), UINT32_MAX, UINT32_MAX), TilingOverflowError);
    EXPECT_THROW(Generate(GetParam(), 2, UINT32_MAX), std::overflow_error);
}

INSTANTIATE_TEST_SUITE_P(AllTilings, TilingPropertyTest,
    ::testing::ValuesIn(AllTilingKinds().begin(), AllTilingKinds().end()),
    [](const ::testing::TestParamInfo<TilingKind>& info) {
        std::string name;
        for (const char* c = GetTilingName(info.param); *c; ++c) {
            if (*c != '-') name.push_back(*c);
        }
        return name;
    });
