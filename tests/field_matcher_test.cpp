#include "field_matcher.hpp"
#include "volume_errors.hpp"
#include <cmath>
#include <cstddef>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace pilab;

TEST(FieldMatcherTest, MultipleValuesAreOred) {
    std::vector<bool> const mask = match_field(MetaField{ 1, 2, 3, 2 }, FieldQuery{ 2, 3 });
    EXPECT_EQ(mask, (std::vector<bool>{ false, true, true, true }));
}

TEST(FieldMatcherTest, SingleNumericValue) {
    std::vector<bool> const mask = match_field(MetaField{ 1, 1, 2, 2 }, 1);
    EXPECT_EQ(mask, (std::vector<bool>{ true, true, false, false }));
}

TEST(FieldMatcherTest, CategoricalExactEquality) {
    MetaField const labels = { "A", "B", "AB", "a" };
    EXPECT_EQ(match_field(labels, "A"), (std::vector<bool>{ true, false, false, false }));
    EXPECT_EQ(match_field(labels, FieldQuery{ "A", "a" }), (std::vector<bool>{ true, false, false, true }));
}

TEST(FieldMatcherTest, NoMatchesGivesAllFalse) {
    EXPECT_EQ(match_field(MetaField{ 1, 2 }, 5.5), (std::vector<bool>{ false, false }));
}

TEST(FieldMatcherTest, NanNeverMatches) {
    const double nan = std::nan("");
    MetaField const values = MetaField::numeric({ nan, 1.0 });
    EXPECT_EQ(match_field(values, FieldQuery(std::vector<double>{ nan, 1.0 })), (std::vector<bool>{ false, true }));
}

TEST(FieldMatcherTest, DomainMismatchThrows) {
    MetaField const labels = { "A", "B" };
    MetaField const chunks = { 1, 2 };
    EXPECT_THROW(match_field(labels, 1), TypeMismatch);
    EXPECT_THROW(match_field(chunks, "A"), TypeMismatch);

    try {
        (void)match_field(labels, FieldQuery{ 1.0, 2.0 }, "labels");
        FAIL() << "Expected TypeMismatch";
    } catch (const TypeMismatch &e) {
        EXPECT_EQ(e.field(), "labels");
    }
}

TEST(FieldMatcherTest, NestedFieldThrows) {
    MetaField const nested = MetaField::nested(MetaTable{ { "x", { 1 } } });
    EXPECT_THROW(match_field(nested, 1), TypeMismatch);
}

TEST(FieldMatcherTest, UnsetFieldGivesEmptyMask) {
    EXPECT_TRUE(match_field(MetaField::unset(), 1).empty());
    EXPECT_TRUE(match_field(MetaField::unset(), "A").empty());
}

TEST(FieldMatcherTest, EmptyQueryIsRejected) {
    EXPECT_THROW(match_field(MetaField{ 1 }, FieldQuery(std::vector<double>{})), std::invalid_argument);
}

TEST(FieldQueryTest, DomainFromConstruction) {
    EXPECT_TRUE(FieldQuery(0).is_numeric());
    EXPECT_TRUE(FieldQuery(2.5).is_numeric());
    EXPECT_FALSE(FieldQuery("A").is_numeric());
    EXPECT_FALSE(FieldQuery(std::string("A")).is_numeric());
    EXPECT_EQ((FieldQuery{ "A", "B", "C" }).size(), 3u);
}

TEST(FieldQueryTest, AcceptsAnyIntegerType) {
    MetaField const chunks{ 1, 2, 3, 2 };
    std::size_t const chunk = 2;
    long const big = 3;
    unsigned const small = 1;
    EXPECT_EQ(match_field(chunks, FieldQuery(chunk)), (std::vector<bool>{ false, true, false, true }));
    EXPECT_EQ(match_field(chunks, FieldQuery(big)), (std::vector<bool>{ false, false, true, false }));
    EXPECT_EQ(match_field(chunks, small), (std::vector<bool>{ true, false, false, false }));
    EXPECT_EQ(FieldQuery(chunk).numeric_values(), (std::vector<double>{ 2.0 }));
}
