// File: tests/support/SourceManagerTests.cpp
// Purpose: Verify file registration and path lookup in SourceManager.
// Key invariants: Identifiers start at 1; 0 denotes an unknown file.
// Ownership/Lifetime: Tests own the manager.
// Links: SPEC_FULL.md#3-data-model

#include <gtest/gtest.h>

#include "support/source_manager.hpp"

using dwipa::support::SourceManager;

TEST(SourceManager, AssignsIdsStartingAtOne)
{
    SourceManager sm;
    uint32_t a = sm.addFile("a.pas");
    uint32_t b = sm.addFile("b.pas");

    EXPECT_EQ(a, 1u);
    EXPECT_EQ(b, 2u);
    EXPECT_EQ(sm.getPath(a), "a.pas");
    EXPECT_EQ(sm.getPath(b), "b.pas");
    EXPECT_EQ(sm.fileCount(), 2u);
}

TEST(SourceManager, ReusesIdForNormalizedDuplicate)
{
    SourceManager sm;
    uint32_t first = sm.addFile("dir/prog.pas");
    uint32_t again = sm.addFile("dir/./prog.pas");

    EXPECT_EQ(first, again);
    EXPECT_EQ(sm.fileCount(), 1u);
}

TEST(SourceManager, UnknownIdsYieldEmptyPath)
{
    SourceManager sm;
    sm.addFile("only.pas");

    EXPECT_TRUE(sm.getPath(0).empty());
    EXPECT_TRUE(sm.getPath(2).empty());
}
