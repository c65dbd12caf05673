// File: tests/frontends/pascal/ParserStmtTests.cpp
// Purpose: Verify statement parsing: assignment, calls, blocks, if, while,
//          and for in both keyword spellings.
// Key invariants: Dangling else binds to the nearest if; empty statements
//                 are dropped from blocks.
// Ownership/Lifetime: Tests own harness and AST.
// Links: SPEC_FULL.md#45-parser

#include <gtest/gtest.h>

#include "ParserTestUtil.hpp"

using namespace dwipa::frontends::pascal;
using namespace dwipa::frontends::pascal::test;

TEST(PascalParserStmt, Assignment)
{
    ParseHarness h;
    auto s = h.statement("total := total + 1");
    ASSERT_NE(s, nullptr);
    ASSERT_EQ(s->kind, StmtKind::Assign);

    const auto &assign = as<AssignStmt>(*s);
    EXPECT_EQ(assign.target, "total");
    EXPECT_EQ(assign.value->kind, ExprKind::Binary);
}

TEST(PascalParserStmt, ProcedureCallWithAndWithoutArguments)
{
    ParseHarness h;
    auto withArgs = h.statement("writeln('hasil', x)");
    ASSERT_NE(withArgs, nullptr);
    ASSERT_EQ(withArgs->kind, StmtKind::Call);
    EXPECT_EQ(as<CallStmt>(*withArgs).call->callee, "writeln");
    EXPECT_EQ(as<CallStmt>(*withArgs).call->args.size(), 2u);

    auto bare = h.statement("Reset");
    ASSERT_NE(bare, nullptr);
    ASSERT_EQ(bare->kind, StmtKind::Call);
    EXPECT_TRUE(as<CallStmt>(*bare).call->args.empty());
}

TEST(PascalParserStmt, IdentifierNeedsAssignOrCall)
{
    ParseHarness h;
    auto s = h.statement("x 1");

    EXPECT_EQ(s, nullptr);
    ASSERT_EQ(h.errors.size(), 1u);
    EXPECT_EQ(h.errors[0].expected, "':=' or '('");
}

TEST(PascalParserStmt, DanglingElseBindsToNearestIf)
{
    ParseHarness h;
    auto s = h.statement("if a then if b then x := 1 else x := 2");
    ASSERT_NE(s, nullptr);
    ASSERT_EQ(s->kind, StmtKind::If);

    const auto &outer = as<IfStmt>(*s);
    EXPECT_EQ(outer.elseBranch, nullptr);
    ASSERT_EQ(outer.thenBranch->kind, StmtKind::If);
    const auto &inner = as<IfStmt>(*outer.thenBranch);
    ASSERT_NE(inner.elseBranch, nullptr);
    EXPECT_EQ(as<AssignStmt>(*inner.elseBranch).target, "x");
}

TEST(PascalParserStmt, VernacularIfElse)
{
    ParseHarness h;
    auto s = h.statement("jika a > 0 maka b := 1 selain_itu b := 2");
    ASSERT_NE(s, nullptr);
    ASSERT_EQ(s->kind, StmtKind::If);
    EXPECT_NE(as<IfStmt>(*s).elseBranch, nullptr);
}

TEST(PascalParserStmt, WhileLoop)
{
    ParseHarness h;
    auto s = h.statement("selama i < 10 lakukan i := i + 1");
    ASSERT_NE(s, nullptr);
    ASSERT_EQ(s->kind, StmtKind::While);

    const auto &loop = as<WhileStmt>(*s);
    EXPECT_EQ(as<BinaryExpr>(*loop.condition).op, BinaryExpr::Op::Lt);
    EXPECT_EQ(loop.body->kind, StmtKind::Assign);
}

TEST(PascalParserStmt, ForLoopDirections)
{
    ParseHarness h;
    auto up = h.statement("for i := 1 to 10 do sum := sum + i");
    ASSERT_NE(up, nullptr);
    ASSERT_EQ(up->kind, StmtKind::For);
    EXPECT_EQ(as<ForStmt>(*up).loopVar, "i");
    EXPECT_EQ(as<ForStmt>(*up).direction, ForDirection::To);

    auto down = h.statement("untuk i := 10 turun_ke 1 lakukan writeln(i)");
    ASSERT_NE(down, nullptr);
    ASSERT_EQ(down->kind, StmtKind::For);
    EXPECT_EQ(as<ForStmt>(*down).direction, ForDirection::Downto);
    EXPECT_EQ(as<ForStmt>(*down).body->kind, StmtKind::Call);
}

TEST(PascalParserStmt, ForNeedsDirection)
{
    ParseHarness h;
    auto s = h.statement("for i := 1 do x := i");

    EXPECT_EQ(s, nullptr);
    ASSERT_EQ(h.errors.size(), 1u);
    EXPECT_EQ(h.errors[0].expected, "'to', 'ke', 'downto' or 'turun_ke'");
}

TEST(PascalParserStmt, BlockDropsEmptyStatements)
{
    ParseHarness h;
    auto s = h.statement("mulai x := 1;; y := 2; selesai");
    ASSERT_NE(s, nullptr);
    ASSERT_EQ(s->kind, StmtKind::Block);
    EXPECT_EQ(as<BlockStmt>(*s).stmts.size(), 2u);
    EXPECT_TRUE(h.errors.empty());
}

TEST(PascalParserStmt, EmptyBlock)
{
    ParseHarness h;
    auto s = h.statement("begin end");
    ASSERT_NE(s, nullptr);
    EXPECT_TRUE(as<BlockStmt>(*s).stmts.empty());
}

TEST(PascalParserStmt, NestedBlocks)
{
    ParseHarness h;
    auto s = h.statement("begin if ok then begin a := 1; b := 2 end; c := 3 end");
    ASSERT_NE(s, nullptr);

    const auto &outer = as<BlockStmt>(*s);
    ASSERT_EQ(outer.stmts.size(), 2u);
    const auto &cond = as<IfStmt>(*outer.stmts[0]);
    ASSERT_EQ(cond.thenBranch->kind, StmtKind::Block);
    EXPECT_EQ(as<BlockStmt>(*cond.thenBranch).stmts.size(), 2u);
}
