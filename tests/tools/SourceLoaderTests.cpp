// File: tests/tools/SourceLoaderTests.cpp
// Purpose: Exercise the source loader used by the dwipa tool and run the
//          bundled example programs through the frontend.
// Key invariants: Load failures come back as error diagnostics; the clean
//                 examples parse without diagnostics.
// Ownership/Lifetime: Tests create temporary files under the system temp dir.
// Links: SPEC_FULL.md#49-cli-tool-dwipa

#include <gtest/gtest.h>

#include "frontends/pascal/Frontend.hpp"
#include "support/options.hpp"
#include "support/source_manager.hpp"
#include "tools/common/source_loader.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace dwipa::frontends::pascal;
using dwipa::support::Options;
using dwipa::support::Severity;
using dwipa::support::SourceManager;
using dwipa::tools::common::loadSourceBuffer;

namespace
{

std::filesystem::path repoRoot()
{
    const auto sourcePath = std::filesystem::absolute(std::filesystem::path(__FILE__));
    return sourcePath.parent_path().parent_path().parent_path();
}

FrontendResult runExample(const std::string &name, SourceManager &sm)
{
    const std::string path = (repoRoot() / "examples/pascal" / name).string();
    auto loaded = loadSourceBuffer(path, sm);
    EXPECT_TRUE(loaded) << path;
    if (!loaded)
        return FrontendResult{};

    FrontendInput input{};
    input.source = loaded.value().buffer;
    input.path = path;
    input.fileId = loaded.value().fileId;
    return runFrontend(input, Options{}, sm);
}

} // namespace

TEST(SourceLoader, ReadsFileAndRegistersPath)
{
    const auto path = std::filesystem::temp_directory_path() / "dwipa_loader_test.pas";
    {
        std::ofstream out(path, std::ios::binary);
        out << "program X;\nbegin end.\n";
    }

    SourceManager sm;
    auto loaded = loadSourceBuffer(path.string(), sm);
    ASSERT_TRUE(loaded);
    EXPECT_EQ(loaded.value().buffer, "program X;\nbegin end.\n");
    EXPECT_NE(loaded.value().fileId, 0u);
    EXPECT_FALSE(sm.getPath(loaded.value().fileId).empty());

    std::filesystem::remove(path);
}

TEST(SourceLoader, MissingFileIsErrorDiagnostic)
{
    SourceManager sm;
    auto loaded = loadSourceBuffer("/definitely/not/present.pas", sm);

    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().severity, Severity::Error);
    EXPECT_EQ(loaded.error().message, "unable to open /definitely/not/present.pas");
    EXPECT_EQ(sm.fileCount(), 0u);
}

TEST(ExamplePrograms, CleanExamplesParse)
{
    for (const char *name : {"hello.pas", "halo.pas", "campuran.pas"})
    {
        SourceManager sm;
        FrontendResult result = runExample(name, sm);
        EXPECT_TRUE(result.succeeded()) << name;
        EXPECT_EQ(result.diagnostics.diagnostics().size(), 0u) << name;
    }
}

TEST(ExamplePrograms, BrokenExampleReportsErrors)
{
    SourceManager sm;
    FrontendResult result = runExample("rusak.pas", sm);

    EXPECT_FALSE(result.succeeded());
    ASSERT_NE(result.program, nullptr);
    EXPECT_GE(result.diagnostics.errorCount(), 3u);
}
