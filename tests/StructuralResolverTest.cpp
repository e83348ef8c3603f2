#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>

#include "CurateExceptions.h"
#include "StructuralResolver.h"

// ============================================================================
// COLUMN NAMING
// ============================================================================

TEST(StructuralResolverTest, DuplicateNamesGetNumericSuffix) {
    auto names = StructuralResolver::deduplicateNames({"x", "x", "y"});
    EXPECT_EQ(names, (std::vector<std::string>{"x", "x_1", "y"}));
}

TEST(StructuralResolverTest, GeneratedSuffixDoesNotCollideWithLiteralName) {
    auto names = StructuralResolver::deduplicateNames({"x", "x_1", "x"});
    EXPECT_EQ(names, (std::vector<std::string>{"x", "x_1", "x_2"}));
}

TEST(StructuralResolverTest, BlankNamesBecomeCol) {
    auto names = StructuralResolver::deduplicateNames({"", "  ", " id "});
    EXPECT_EQ(names, (std::vector<std::string>{"col", "col_1", "id"}));
}

TEST(StructuralResolverTest, ShortRowsReadAsEmpty) {
    CSVUtils::RawRow row{"a"};
    EXPECT_EQ(StructuralResolver::cellAt(row, 0), "a");
    EXPECT_EQ(StructuralResolver::cellAt(row, 5), "");
}

// ============================================================================
// HEADER RESOLUTION
// ============================================================================

class StructuralResolveTest : public ::testing::Test {
protected:
    CSVUtils::RawRows rows = {
        {"exported by tool v2"},
        {"", ""},
        {"x", "x", "", "y"},
        {"1", "2", "3", "4"},
        {"5", "6", "7", "8"}
    };
};

TEST_F(StructuralResolveTest, ComputesAbsoluteIndices) {
    auto header = StructuralResolver::resolve(rows, 1, 1);

    EXPECT_EQ(header.headerAbsoluteIndex, 2u);
    EXPECT_EQ(header.dataStartIndex, 3u);
    EXPECT_EQ(header.names(), (std::vector<std::string>{"x", "x_1", "col", "y"}));
    EXPECT_EQ(header.findColumnIndex("y"), 3);
    EXPECT_EQ(header.findColumnIndex("missing"), -1);
    EXPECT_EQ(header.columns[1].index, 1u);
}

TEST_F(StructuralResolveTest, NamesAreDistinctForEveryValidLayout) {
    for (size_t skip = 0; skip < rows.size(); ++skip) {
        for (size_t head = 0; head < rows.size() - skip; ++head) {
            auto header = StructuralResolver::resolve(rows, skip, head);
            auto names = header.names();
            std::set<std::string> distinct(names.begin(), names.end());
            EXPECT_EQ(distinct.size(), names.size()) << "skip=" << skip << " header=" << head;
            EXPECT_EQ(header.dataStartIndex, skip + head + 1);
        }
    }
}

TEST_F(StructuralResolveTest, SkipRowsOutOfRangeThrows) {
    EXPECT_THROW(StructuralResolver::resolve(rows, 5, 0), Curate::StructuralException);
}

TEST_F(StructuralResolveTest, HeaderRowOutOfRangeThrows) {
    EXPECT_THROW(StructuralResolver::resolve(rows, 2, 3), Curate::StructuralException);
}

TEST(StructuralResolverTest, EmptyInputThrows) {
    try {
        StructuralResolver::resolve({}, 0, 0);
        FAIL() << "Expected StructuralException";
    } catch (const Curate::StructuralException& e) {
        EXPECT_NE(std::string(e.what()).find("No rows found"), std::string::npos);
    }
}
