// File: tests/frontends/pascal/ParserRecoveryTests.cpp
// Purpose: Verify syntax error reporting and panic-mode recovery.
// Key invariants: Every malformed statement yields exactly one error; the
//                 error limit records one TooManyErrors note and then stays
//                 quiet; MissingProgram is terminal.
// Ownership/Lifetime: Tests own harness and AST.
// Links: SPEC_FULL.md#45-parser, SPEC_FULL.md#6-error-taxonomies

#include <gtest/gtest.h>

#include "ParserTestUtil.hpp"

#include <string>

using namespace dwipa::frontends::pascal;
using namespace dwipa::frontends::pascal::test;
using dwipa::support::Options;
using dwipa::support::Severity;

TEST(PascalParserRecovery, TwoMalformedStatementsTwoErrors)
{
    ParseHarness h;
    auto result = h.program("program T;\n"
                            "begin\n"
                            "  x := ;\n"
                            "  y := 1;\n"
                            "  z := * 2;\n"
                            "  w := 3\n"
                            "end.");

    ASSERT_NE(result.program, nullptr);
    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors[0].loc.line, 3u);
    EXPECT_EQ(result.errors[1].loc.line, 5u);
    EXPECT_EQ(result.errors[1].found, "*");

    // The well-formed statements survive
    EXPECT_EQ(result.program->body->stmts.size(), 2u);
    EXPECT_EQ(h.diag.errorCount(), 2u);
}

TEST(PascalParserRecovery, ChainedComparisonInProgramIsOneError)
{
    ParseHarness h;
    auto result = h.program("program T; begin ok := a < b < c; done := 1 end.");

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, SyntaxErrorKind::UnexpectedToken);
    ASSERT_EQ(result.program->body->stmts.size(), 1u);
    EXPECT_EQ(as<AssignStmt>(*result.program->body->stmts[0]).target, "done");
}

TEST(PascalParserRecovery, MissingSeparatorBetweenStatements)
{
    ParseHarness h;
    auto result = h.program("program T; begin x := 1 y := 2 end.");

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].expected, "';' or 'end' or 'selesai'");
    EXPECT_EQ(result.errors[0].found, "y");
    EXPECT_EQ(result.program->body->stmts.size(), 2u);
}

TEST(PascalParserRecovery, MissingBlockAfterDeclarationsIsOneError)
{
    ParseHarness h;
    auto result = h.program("program a; var x : integer; end.");

    ASSERT_NE(result.program, nullptr);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, SyntaxErrorKind::UnexpectedToken);
    EXPECT_EQ(result.errors[0].expected, "'begin' or 'mulai'");
    EXPECT_EQ(result.errors[0].found, "end");
    EXPECT_EQ(result.program->decls.size(), 1u);
    EXPECT_FALSE(result.program->body);
    EXPECT_EQ(h.diag.errorCount(), 1u);
}

TEST(PascalParserRecovery, MissingBlockAtEndOfFileIsOneError)
{
    ParseHarness h;
    auto result = h.program("program a; var x : integer;");

    ASSERT_NE(result.program, nullptr);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].expected, "'begin' or 'mulai'");
}

TEST(PascalParserRecovery, UnclosedBlockAtEndOfFile)
{
    ParseHarness h;
    auto result = h.program("program T;\nbegin\n  x := 1");

    ASSERT_NE(result.program, nullptr);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, SyntaxErrorKind::UnclosedBlock);
    EXPECT_EQ(result.errors[0].message(),
              "unclosed block: expected 'end' or 'selesai', found end of file");
    EXPECT_EQ(h.diag.diagnostics()[0].code, "P2002");
}

TEST(PascalParserRecovery, UnclosedOuterBlockAtDot)
{
    ParseHarness h;
    auto result = h.program("program T; begin if a then begin x := 1 end.");

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, SyntaxErrorKind::UnclosedBlock);
    EXPECT_EQ(result.errors[0].found, ".");
}

TEST(PascalParserRecovery, MalformedDeclarationRecoversAtSemicolon)
{
    ParseHarness h;
    auto result = h.program("program T;\n"
                            "var a integer; b : real;\n"
                            "begin b := 1.5 end.");

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, SyntaxErrorKind::MalformedDeclaration);
    EXPECT_EQ(result.errors[0].expected, "':'");
    EXPECT_EQ(h.diag.diagnostics()[0].code, "P2003");

    ASSERT_EQ(result.program->decls.size(), 1u);
    EXPECT_EQ(as<VarDecl>(*result.program->decls[0]).names[0], "b");
    EXPECT_EQ(result.program->body->stmts.size(), 1u);
}

TEST(PascalParserRecovery, ErrorsInsideSubprogramBodyAreUnexpectedToken)
{
    ParseHarness h;
    auto result = h.program("program T;\n"
                            "procedure P; begin x := end;\n"
                            "begin P end.");

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, SyntaxErrorKind::UnexpectedToken);
    EXPECT_EQ(result.program->decls.size(), 1u);
    EXPECT_EQ(result.program->body->stmts.size(), 1u);
}

TEST(PascalParserRecovery, MissingProgramIsTerminal)
{
    ParseHarness h;
    auto result = h.program("x := 1;");

    EXPECT_EQ(result.program, nullptr);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, SyntaxErrorKind::MissingProgram);
    EXPECT_EQ(result.errors[0].message(), "no program header or block found");
    EXPECT_EQ(h.diag.diagnostics()[0].code, "P2004");
}

TEST(PascalParserRecovery, EmptyInputIsMissingProgram)
{
    ParseHarness h;
    auto result = h.program("");

    EXPECT_EQ(result.program, nullptr);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, SyntaxErrorKind::MissingProgram);
}

TEST(PascalParserRecovery, BlockWithoutHeaderStillParses)
{
    ParseHarness h;
    auto result = h.program("begin x := 1 end.");

    ASSERT_NE(result.program, nullptr);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].expected, "'program'");
    EXPECT_EQ(result.program->body->stmts.size(), 1u);
}

TEST(PascalParserRecovery, TrailingTokensAfterFinalDot)
{
    ParseHarness h;
    auto result = h.program("program T; begin end. extra");

    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].expected, "end of file");
    EXPECT_EQ(result.errors[0].found, "extra");
}

TEST(PascalParserRecovery, InvalidTokensAreSkipped)
{
    ParseHarness h;
    auto result = h.program("program T; begin x := 1 # ; y := 2 end.");

    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(result.program->body->stmts.size(), 2u);
    // The lexer still reported the invalid character
    EXPECT_EQ(h.diag.errorCount(), 1u);
    EXPECT_EQ(h.diag.diagnostics()[0].code, "L1003");
}

TEST(PascalParserRecovery, ErrorLimitRecordsOneNote)
{
    ParseHarness h;
    Options options;
    options.maxErrors = 2;
    auto result = h.program("program T;\n"
                            "begin\n"
                            "  a := ;\n"
                            "  b := ;\n"
                            "  c := ;\n"
                            "  d := ;\n"
                            "end.",
                            options);

    ASSERT_EQ(result.errors.size(), 3u);
    EXPECT_EQ(result.errors[0].kind, SyntaxErrorKind::UnexpectedToken);
    EXPECT_EQ(result.errors[1].kind, SyntaxErrorKind::UnexpectedToken);
    EXPECT_EQ(result.errors[2].kind, SyntaxErrorKind::TooManyErrors);
    EXPECT_EQ(result.errors[2].loc.line, 5u);

    EXPECT_EQ(h.diag.errorCount(), 2u);
    ASSERT_EQ(h.diag.diagnostics().size(), 3u);
    EXPECT_EQ(h.diag.diagnostics()[2].severity, Severity::Note);
    EXPECT_EQ(h.diag.diagnostics()[2].code, "P2005");

    // Parsing still consumed the whole program
    ASSERT_NE(result.program, nullptr);
    EXPECT_NE(result.program->body, nullptr);
}

TEST(PascalParserRecovery, ZeroMeansNoLimit)
{
    std::string src = "program T;\nbegin\n";
    for (int i = 0; i < 60; ++i)
        src += "  v := ;\n";
    src += "end.";

    ParseHarness h;
    Options options;
    options.maxErrors = 0;
    auto result = h.program(src, options);

    EXPECT_EQ(result.errors.size(), 60u);
    EXPECT_EQ(h.diag.errorCount(), 60u);
}

TEST(PascalParserRecovery, DefaultLimitIsFifty)
{
    std::string src = "program T;\nbegin\n";
    for (int i = 0; i < 60; ++i)
        src += "  v := ;\n";
    src += "end.";

    ParseHarness h;
    auto result = h.program(src);

    ASSERT_EQ(result.errors.size(), 51u);
    EXPECT_EQ(result.errors.back().kind, SyntaxErrorKind::TooManyErrors);
    EXPECT_EQ(h.diag.errorCount(), 50u);
}
