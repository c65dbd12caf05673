// File: tests/frontends/pascal/FrontendTests.cpp
// Purpose: Verify the runFrontend driver and the token listing format.
// Key invariants: The driver keeps tokens, tree, and diagnostics as data and
//                 registers the path unless a file id is supplied.
// Ownership/Lifetime: Tests own source managers and results.
// Links: SPEC_FULL.md#47-frontend-driver, SPEC_FULL.md#48-token-listing

#include <gtest/gtest.h>

#include "frontends/pascal/Frontend.hpp"
#include "support/options.hpp"
#include "support/source_manager.hpp"

#include <sstream>
#include <string>

using namespace dwipa::frontends::pascal;
using dwipa::support::Options;
using dwipa::support::SourceManager;

TEST(PascalFrontend, CleanProgramSucceeds)
{
    SourceManager sm;
    FrontendInput input{};
    input.source = "program Halo; mulai writeln('halo') selesai.";
    input.path = "halo.pas";

    FrontendResult result = runFrontend(input, Options{}, sm);

    EXPECT_TRUE(result.succeeded());
    EXPECT_EQ(result.fileId, 1u);
    EXPECT_EQ(sm.getPath(result.fileId), "halo.pas");
    ASSERT_NE(result.program, nullptr);
    EXPECT_EQ(result.program->name, "Halo");
    EXPECT_TRUE(result.syntaxErrors.empty());
    ASSERT_FALSE(result.tokens.empty());
    EXPECT_EQ(result.tokens.back().kind, TokenKind::Eof);
    EXPECT_EQ(result.tokens.back().loc.file_id, result.fileId);
}

TEST(PascalFrontend, UsesSuppliedFileId)
{
    SourceManager sm;
    uint32_t fid = sm.addFile("given.pas");

    FrontendInput input{};
    input.source = "program G; begin end.";
    input.fileId = fid;

    FrontendResult result = runFrontend(input, Options{}, sm);

    EXPECT_EQ(result.fileId, fid);
    EXPECT_EQ(sm.fileCount(), 1u);
}

TEST(PascalFrontend, CollectsLexicalAndSyntaxDiagnostics)
{
    SourceManager sm;
    FrontendInput input{};
    input.source = "program E;\nbegin\n  x := @;\n  y := 1\n";
    input.path = "errors.pas";

    FrontendResult result = runFrontend(input, Options{}, sm);

    EXPECT_FALSE(result.succeeded());
    ASSERT_NE(result.program, nullptr);
    ASSERT_EQ(result.syntaxErrors.size(), 2u);
    EXPECT_EQ(result.syntaxErrors[1].kind, SyntaxErrorKind::UnclosedBlock);

    std::ostringstream os;
    result.diagnostics.printAll(os, &sm);
    EXPECT_EQ(os.str(),
              "errors.pas:3:8: error[L1003]: invalid character '@'\n"
              "errors.pas:3:9: error[P2001]: expected expression, found ';'\n"
              "errors.pas:5:1: error[P2002]: unclosed block: expected 'end' or 'selesai', "
              "found end of file\n");
}

TEST(PascalFrontend, MissingProgramLeavesNoTree)
{
    SourceManager sm;
    FrontendInput input{};
    input.source = "writeln('x')";

    FrontendResult result = runFrontend(input, Options{}, sm);

    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.program, nullptr);
    EXPECT_EQ(sm.getPath(result.fileId), "<input>");
}

TEST(PascalFrontend, HonoursErrorLimit)
{
    SourceManager sm;
    FrontendInput input{};
    input.source = "program L; begin a := ; b := ; c := end.";

    Options options;
    options.maxErrors = 1;
    FrontendResult result = runFrontend(input, options, sm);

    ASSERT_EQ(result.syntaxErrors.size(), 2u);
    EXPECT_EQ(result.syntaxErrors[1].kind, SyntaxErrorKind::TooManyErrors);
    EXPECT_EQ(result.diagnostics.errorCount(), 1u);
}

TEST(PascalTokenListing, OneLinePerToken)
{
    SourceManager sm;
    FrontendInput input{};
    input.source = "x := 'A'\n  jika";

    FrontendResult result = runFrontend(input, Options{}, sm);

    EXPECT_EQ(formatTokenListing(result.tokens),
              "0\tidentifier\tidentifier\tx\t1:1\n"
              "1\toperator\t:=\t:=\t1:3\n"
              "2\tliteral\tchar\t'A'\t1:6\n"
              "3\tkeyword\tif\tjika\t2:3\n"
              "4\teof\teof\t\t2:7\n");
}
