#include "tessella/tiling/MeshValidation.h"
#include "tessella/tiling/RegularTiling.h"

#include <gtest/gtest.h>
#include <string>
#include <utility>

using namespace tessella::tiling;

namespace {

// 2 x 2 unit square patch with caller-supplied faces
TilingMesh UnitSquarePatch(FaceIndex faces) {
    Points points{ { 0.0f, 0.0f }, { 1.0f, 0.0f }, { 0.0f, 1.0f }, { 1.0f, 1.0f } };
    return TilingMesh("TEST", 2, 2, std::move(points), std::move(faces));
}

} // namespace

TEST(MeshValidationTest, GeneratedSquarePatchIsValid) {
    const ValidationReport report = ValidateTilingMesh(RegularTiling::Square(5, 5));
    EXPECT_TRUE(report.IsValid());
    EXPECT_EQ(report.pointCount, 25u);
    EXPECT_EQ(report.expectedPointCount, 25u);
    EXPECT_EQ(report.faceCount, 16u);
    ASSERT_EQ(report.faceSizes.size(), 1u);
    EXPECT_EQ(report.faceSizes.at(4), 16u);
    EXPECT_EQ(report.Summary(), "25 points, 16 faces [4:16], valid");
}

TEST(MeshValidationTest, EmptyMeshIsValid) {
    const ValidationReport report = ValidateTilingMesh(RegularTiling::Hexagon(0, 0));
    EXPECT_TRUE(report.IsValid());
    EXPECT_EQ(report.Summary(), "0 points, 0 faces [], valid");
}

TEST(MeshValidationTest, DetectsClockwiseFaces) {
    const ValidationReport report = ValidateTilingMesh(UnitSquarePatch({ { 0, 2, 3, 1 } }));
    EXPECT_FALSE(report.IsValid());
    EXPECT_EQ(report.clockwiseFaces, 1u);
    EXPECT_EQ(report.nonUnitEdges, 0u);
    EXPECT_NE(report.Summary().find("1 clockwise faces"), std::string::npos);
}

TEST(MeshValidationTest, DetectsNonUnitEdges) {
    // The diagonal 0 -> 3 is sqrt(2) long
    const ValidationReport report = ValidateTilingMesh(UnitSquarePatch({ { 0, 3, 2 } }));
    EXPECT_FALSE(report.IsValid());
    EXPECT_EQ(report.nonUnitEdges, 1u);
    EXPECT_EQ(report.clockwiseFaces, 0u);
}

TEST(MeshValidationTest, EdgeToleranceIsConfigurable) {
    const TilingMesh mesh = UnitSquarePatch({ { 0, 3, 2 } });
    EXPECT_TRUE(ValidateTilingMesh(mesh, 0.5).IsValid());
}

TEST(MeshValidationTest, DetectsOutOfBoundsKeys) {
    const ValidationReport report = ValidateTilingMesh(UnitSquarePatch({ { 0, 1, 4 }, { 0, 1, 3, 2 } }));
    EXPECT_FALSE(report.IsValid());
    EXPECT_EQ(report.outOfBoundsKeys, 1u);
    // Geometry of the bad face is skipped, the good one still passes
    EXPECT_EQ(report.clockwiseFaces, 0u);
    EXPECT_EQ(report.nonUnitEdges, 0u);
}

TEST(MeshValidationTest, DetectsRepeatedKeys) {
    const ValidationReport report = ValidateTilingMesh(UnitSquarePatch({ { 0, 1, 3, 1, 2 } }));
    EXPECT_FALSE(report.IsValid());
    EXPECT_EQ(report.repeatedKeyFaces, 1u);
}

TEST(MeshValidationTest, DetectsDegenerateFaces) {
    const ValidationReport report = ValidateTilingMesh(UnitSquarePatch({ { 0, 1 }, {} }));
    EXPECT_FALSE(report.IsValid());
    EXPECT_EQ(report.degenerateFaces, 2u);
    EXPECT_EQ(report.faceSizes.at(0), 1u);
    EXPECT_EQ(report.faceSizes.at(2), 1u);
}

TEST(MeshValidationTest, DetectsMissingPoints) {
    Points points{ { 0.0f, 0.0f }, { 1.0f, 0.0f } };
    const TilingMesh mesh("TEST", 2, 2, std::move(points), FaceIndex{});
    const ValidationReport report = ValidateTilingMesh(mesh);
    EXPECT_FALSE(report.IsValid());
    EXPECT_EQ(report.expectedPointCount, 4u);
    EXPECT_EQ(report.pointCount, 2u);
    EXPECT_NE(report.Summary().find("expected 4 points"), std::string::npos);
}
