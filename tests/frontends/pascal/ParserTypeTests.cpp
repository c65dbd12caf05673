// File: tests/frontends/pascal/ParserTypeTests.cpp
// Purpose: Verify named, subrange, and array type parsing.
// Key invariants: Bounds are kept as written; low <= high is not enforced.
// Ownership/Lifetime: Tests own harness and AST.
// Links: SPEC_FULL.md#45-parser

#include <gtest/gtest.h>

#include "ParserTestUtil.hpp"

using namespace dwipa::frontends::pascal;
using namespace dwipa::frontends::pascal::test;

TEST(PascalParserType, NamedType)
{
    ParseHarness h;
    auto t = h.type("integer");
    ASSERT_NE(t, nullptr);
    ASSERT_EQ(t->kind, TypeKind::Named);
    EXPECT_EQ(as<NamedTypeNode>(*t).name, "integer");
}

TEST(PascalParserType, ArrayBounds)
{
    ParseHarness h;
    auto t = h.type("array[1..10] of integer");
    ASSERT_NE(t, nullptr);
    ASSERT_EQ(t->kind, TypeKind::Array);

    const auto &arr = as<ArrayTypeNode>(*t);
    EXPECT_EQ(arr.low, 1);
    EXPECT_EQ(arr.high, 10);
    ASSERT_NE(arr.elementType, nullptr);
    EXPECT_EQ(as<NamedTypeNode>(*arr.elementType).name, "integer");
}

TEST(PascalParserType, VernacularArrayWithSignedBounds)
{
    ParseHarness h;
    auto t = h.type("larik[-5..+5] dari real");
    ASSERT_NE(t, nullptr);

    const auto &arr = as<ArrayTypeNode>(*t);
    EXPECT_EQ(arr.low, -5);
    EXPECT_EQ(arr.high, 5);
}

TEST(PascalParserType, ReversedBoundsAreAccepted)
{
    ParseHarness h;
    auto t = h.type("array[10..1] of char");
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(as<ArrayTypeNode>(*t).low, 10);
    EXPECT_EQ(as<ArrayTypeNode>(*t).high, 1);
    EXPECT_TRUE(h.errors.empty());
}

TEST(PascalParserType, NestedArray)
{
    ParseHarness h;
    auto t = h.type("array[1..2] of array[0..3] of boolean");
    ASSERT_NE(t, nullptr);

    const auto &outer = as<ArrayTypeNode>(*t);
    ASSERT_EQ(outer.elementType->kind, TypeKind::Array);
    EXPECT_EQ(as<ArrayTypeNode>(*outer.elementType).high, 3);
}

TEST(PascalParserType, Subrange)
{
    ParseHarness h;
    auto t = h.type("0..255");
    ASSERT_NE(t, nullptr);
    ASSERT_EQ(t->kind, TypeKind::Range);
    EXPECT_EQ(as<RangeTypeNode>(*t).low, 0);
    EXPECT_EQ(as<RangeTypeNode>(*t).high, 255);
}

TEST(PascalParserType, BoundMustBeIntegerLiteral)
{
    ParseHarness h;
    auto t = h.type("array[1..n] of integer");

    EXPECT_EQ(t, nullptr);
    ASSERT_EQ(h.errors.size(), 1u);
    EXPECT_EQ(h.errors[0].expected, "integer bound");
    EXPECT_EQ(h.errors[0].found, "n");
}

TEST(PascalParserType, MissingOf)
{
    ParseHarness h;
    auto t = h.type("array[1..3] integer");

    EXPECT_EQ(t, nullptr);
    ASSERT_EQ(h.errors.size(), 1u);
    EXPECT_EQ(h.errors[0].expected, "'of' or 'dari'");
}
