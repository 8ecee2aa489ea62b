#include "tessella/tiling/TilingCatalog.h"

#include <gtest/gtest.h>
#include <set>
#include <string>

using namespace tessella::tiling;

TEST(TilingCatalogTest, ListsElevenDistinctKindsInOrder) {
    const auto& kinds = AllTilingKinds();
    ASSERT_EQ(kinds.size(), 11u);
    EXPECT_EQ(kinds.front(), TilingKind::Triangle);
    EXPECT_EQ(kinds[1], TilingKind::Square);
    EXPECT_EQ(kinds[2], TilingKind::Hexagon);
    EXPECT_EQ(kinds.back(), TilingKind::SemiRegular8);
    
    std::set<std::string> names;
    for (TilingKind kind : kinds) {
        names.insert(GetTilingName(kind));
    }
    EXPECT_EQ(names.size(), kinds.size());
}

TEST(TilingCatalogTest, NamesMatchGeneratedMeshes) {
    for (TilingKind kind : AllTilingKinds()) {
        EXPECT_EQ(Generate(kind, 4, 4).GetName(), GetTilingName(kind));
    }
}

TEST(TilingCatalogTest, VertexConfigurations) {
    EXPECT_STREQ(GetVertexConfiguration(TilingKind::Triangle), "3.3.3.3.3.3");
    EXPECT_STREQ(GetVertexConfiguration(TilingKind::Square), "4.4.4.4");
    EXPECT_STREQ(GetVertexConfiguration(TilingKind::Hexagon), "6.6.6");
    EXPECT_STREQ(GetVertexConfiguration(TilingKind::SemiRegular2), "4.8.8");
    EXPECT_STREQ(GetVertexConfiguration(TilingKind::SemiRegular8), "4.6.12");
}

TEST(TilingCatalogTest, FindsByIdentifier) {
    for (TilingKind kind : AllTilingKinds()) {
        const auto found = FindTilingKind(GetTilingName(kind));
        ASSERT_TRUE(found.has_value()) << GetTilingName(kind);
        EXPECT_EQ(*found, kind);
    }
}

TEST(TilingCatalogTest, LookupIgnoresCaseAndUnderscores) {
    EXPECT_EQ(FindTilingKind("hexagon"), TilingKind::Hexagon);
    EXPECT_EQ(FindTilingKind("Semi-Regular-4"), TilingKind::SemiRegular4);
    EXPECT_EQ(FindTilingKind("semi_regular_6"), TilingKind::SemiRegular6);
    EXPECT_EQ(FindTilingKind("SEMI_REGULAR_1"), TilingKind::SemiRegular1);
}

TEST(TilingCatalogTest, LookupAcceptsAliases) {
    EXPECT_EQ(FindTilingKind("tri"), TilingKind::Triangle);
    EXPECT_EQ(FindTilingKind("SQ"), TilingKind::Square);
    EXPECT_EQ(FindTilingKind("hex"), TilingKind::Hexagon);
    EXPECT_EQ(FindTilingKind("sr3"), TilingKind::SemiRegular3);
    EXPECT_EQ(FindTilingKind("SR8"), TilingKind::SemiRegular8);
}

TEST(TilingCatalogTest, RejectsUnknownNames) {
    EXPECT_FALSE(FindTilingKind("").has_value());
    EXPECT_FALSE(FindTilingKind("pentagon").has_value());
    EXPECT_FALSE(FindTilingKind("SEMI-REGULAR-9").has_value());
    EXPECT_FALSE(FindTilingKind("sr").has_value());
    EXPECT_FALSE(FindTilingKind(" hexagon").has_value());
}

TEST(TilingCatalogTest, GenerateForwardsOverflow) {
    EXPECT_THROW(Generate(TilingKind::Square, 100000, 100000), TilingOverflowError);
}
