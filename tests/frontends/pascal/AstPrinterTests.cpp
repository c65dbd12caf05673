// File: tests/frontends/pascal/AstPrinterTests.cpp
// Purpose: Verify the indented AST dump used by the dwipa tool.
// Key invariants: Two spaces per nesting level; declarations print their
//                 types inline.
// Ownership/Lifetime: Tests own harness and AST.
// Links: SPEC_FULL.md#46-ast-printer

#include <gtest/gtest.h>

#include "ParserTestUtil.hpp"
#include "frontends/pascal/AstPrinter.hpp"

using namespace dwipa::frontends::pascal;
using namespace dwipa::frontends::pascal::test;

TEST(PascalAstPrinter, DeclarationsAndAssignment)
{
    ParseHarness h;
    auto result = h.program("program Demo;\n"
                            "var a, b : integer;\n"
                            "type Numbers = array[1..10] of integer;\n"
                            "begin\n"
                            "  a := b + 1\n"
                            "end.");
    ASSERT_TRUE(result.succeeded());

    AstPrinter printer;
    EXPECT_EQ(printer.dump(*result.program),
              "Program Demo\n"
              "  VarDecl a, b : integer\n"
              "  TypeDecl Numbers = array[1..10] of integer\n"
              "  Block\n"
              "    Assign a\n"
              "      Binary +\n"
              "        Name b\n"
              "        Int 1\n");
}

TEST(PascalAstPrinter, SubprogramsAndControlFlow)
{
    ParseHarness h;
    auto result = h.program("program P;\n"
                            "procedure Show(var x : integer; y : real);\n"
                            "begin writeln(x) end;\n"
                            "function Sq(n : integer) : integer;\n"
                            "begin Sq := n * n end;\n"
                            "const LIMIT = 10;\n"
                            "begin\n"
                            "  if a > 0 then writeln('pos') else writeln('neg');\n"
                            "  while not done do i := i - 1;\n"
                            "  for i := 1 to LIMIT do total := total + Sq(i)\n"
                            "end.");
    ASSERT_TRUE(result.succeeded());

    AstPrinter printer;
    EXPECT_EQ(printer.dump(*result.program),
              "Program P\n"
              "  ProcedureDecl Show(var x : integer; y : real)\n"
              "    Block\n"
              "      CallStmt writeln\n"
              "        Name x\n"
              "  FunctionDecl Sq(n : integer) : integer\n"
              "    Block\n"
              "      Assign Sq\n"
              "        Binary *\n"
              "          Name n\n"
              "          Name n\n"
              "  ConstDecl LIMIT\n"
              "    Int 10\n"
              "  Block\n"
              "    If\n"
              "      Binary >\n"
              "        Name a\n"
              "        Int 0\n"
              "      Then\n"
              "        CallStmt writeln\n"
              "          String 'pos'\n"
              "      Else\n"
              "        CallStmt writeln\n"
              "          String 'neg'\n"
              "    While\n"
              "      Unary not\n"
              "        Name done\n"
              "      Do\n"
              "        Assign i\n"
              "          Binary -\n"
              "            Name i\n"
              "            Int 1\n"
              "    For i to\n"
              "      Int 1\n"
              "      Name LIMIT\n"
              "      Do\n"
              "        Assign total\n"
              "          Binary +\n"
              "            Name total\n"
              "            Call Sq\n"
              "              Name i\n");
}

TEST(PascalAstPrinter, Literals)
{
    ParseHarness h;
    AstPrinter printer;

    EXPECT_EQ(printer.dump(*h.expression("3.14")), "Real 3.14\n");
    EXPECT_EQ(printer.dump(*h.expression("'A'")), "Char 'A'\n");
    EXPECT_EQ(printer.dump(*h.expression("'it''s'")), "String 'it''s'\n");
    EXPECT_EQ(printer.dump(*h.expression("True")), "Bool true\n");
    EXPECT_EQ(printer.dump(*h.expression("x mod 2")), "Binary mod\n  Name x\n  Int 2\n");
}

TEST(PascalAstPrinter, DowntoAndRangeTypes)
{
    ParseHarness h;
    AstPrinter printer;

    EXPECT_EQ(printer.dump(*h.statement("for k := 9 downto 0 do")),
              "For k downto\n  Int 9\n  Int 0\n  Do\n    Empty\n");
    EXPECT_EQ(typeToString(*h.type("-3..3")), "-3..3");
    EXPECT_EQ(typeToString(*h.type("larik[0..1] dari larik[1..2] dari char")),
              "array[0..1] of array[1..2] of char");
}
