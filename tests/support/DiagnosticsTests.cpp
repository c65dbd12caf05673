// File: tests/support/DiagnosticsTests.cpp
// Purpose: Verify DiagnosticEngine counting and the printed diagnostic format.
// Key invariants: Diagnostics print in report order; notes are not counted.
// Ownership/Lifetime: Tests own engines and source managers.
// Links: SPEC_FULL.md#21-diagnostics-and-logging

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_manager.hpp"

#include <sstream>
#include <string>

using namespace dwipa::support;

TEST(DiagnosticEngine, CountsErrorsAndWarningsButNotNotes)
{
    DiagnosticEngine de;
    de.report({Severity::Error, "bad", {}, "P2001"});
    de.report({Severity::Warning, "odd", {}, {}});
    de.report({Severity::Note, "fyi", {}, "P2005"});
    de.report({Severity::Error, "worse", {}, {}});

    EXPECT_EQ(de.errorCount(), 2u);
    EXPECT_EQ(de.warningCount(), 1u);
    ASSERT_EQ(de.diagnostics().size(), 4u);
    EXPECT_EQ(de.diagnostics()[2].message, "fyi");
}

TEST(DiagnosticEngine, ErrorAndNoteHelpersSetSeverity)
{
    DiagnosticEngine de;
    EXPECT_FALSE(de.hasErrors());

    de.note(SourceLoc{1, 2, 3, 4}, "too many syntax errors", "P2005");
    EXPECT_FALSE(de.hasErrors());
    EXPECT_EQ(de.count(Severity::Note), 1u);

    de.error(SourceLoc{1, 5, 1, 40}, "invalid character '@'", "L1003");
    EXPECT_TRUE(de.hasErrors());
    ASSERT_EQ(de.diagnostics().size(), 2u);
    EXPECT_EQ(de.diagnostics()[1].severity, Severity::Error);
    EXPECT_EQ(de.diagnostics()[1].code, "L1003");
    EXPECT_EQ(de.diagnostics()[1].loc.line, 5u);
}

TEST(DiagnosticEngine, SeverityNames)
{
    EXPECT_STREQ(severityName(Severity::Note), "note");
    EXPECT_STREQ(severityName(Severity::Warning), "warning");
    EXPECT_STREQ(severityName(Severity::Error), "error");
}

TEST(SourceLoc, StreamsLineAndColumn)
{
    std::ostringstream os;
    os << SourceLoc{2, 14, 3, 200};
    EXPECT_EQ(os.str(), "14:3");
}

TEST(SourceLoc, SamePlaceComparesFileAndOffset)
{
    SourceLoc a{1, 2, 5, 17};
    SourceLoc b{1, 0, 0, 17};
    SourceLoc c{2, 2, 5, 17};
    EXPECT_TRUE(a.samePlace(b));
    EXPECT_FALSE(a.samePlace(c));
    EXPECT_TRUE(a.hasFile());
    EXPECT_FALSE(SourceLoc{}.hasFile());
}

TEST(DiagnosticEngine, PrintsPathLineColumnAndCode)
{
    SourceManager sm;
    uint32_t fid = sm.addFile("demo.pas");

    DiagnosticEngine de;
    de.report({Severity::Error, "unterminated comment", SourceLoc{fid, 3, 7, 20}, "L1002"});
    de.report({Severity::Note, "too many syntax errors", SourceLoc{fid, 9, 1, 80}, "P2005"});

    std::ostringstream os;
    de.printAll(os, &sm);
    EXPECT_EQ(os.str(),
              "demo.pas:3:7: error[L1002]: unterminated comment\n"
              "demo.pas:9:1: note[P2005]: too many syntax errors\n");
}

TEST(DiagnosticEngine, PrintsWithoutLocationWhenFileUnknown)
{
    DiagnosticEngine de;
    de.report({Severity::Error, "unable to open x.pas", {}, {}});

    std::ostringstream os;
    de.printAll(os);
    EXPECT_EQ(os.str(), "error: unable to open x.pas\n");
}

TEST(Expected, CarriesValueOrDiagnostic)
{
    Expected<int> ok(42);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 42);

    Expected<int> bad(makeError({}, "boom", "T0001"));
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().severity, Severity::Error);
    EXPECT_EQ(bad.error().message, "boom");
    EXPECT_EQ(bad.error().code, "T0001");

    Expected<void> done;
    EXPECT_TRUE(done.hasValue());
    Expected<void> failed(makeError({}, "nope"));
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().message, "nope");
}

TEST(Expected, PrintDiagRendersSingleDiagnostic)
{
    std::ostringstream os;
    printDiag(makeError({}, "source file too large: big.pas"), os);
    EXPECT_EQ(os.str(), "error: source file too large: big.pas\n");
}
