#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "sandbox/script_builder.hpp"
#include "sandbox/tool_config.hpp"

namespace {

using threatweaver::sandbox::BuildEnsureWorkspaceScript;
using threatweaver::sandbox::BuildListWorkspaceScript;
using threatweaver::sandbox::BuildToolScript;
using threatweaver::sandbox::ExtractExitCode;
using threatweaver::sandbox::ParseWorkspaceListing;
using threatweaver::sandbox::ToolConfig;

TEST(ExtractExitCodeTest, ReadsAndStripsMarker) {
    const auto extraction = ExtractExitCode("some warning\n\n__E2B_EXIT_CODE__=0\n");
    ASSERT_TRUE(extraction.exit_code.has_value());
    EXPECT_EQ(*extraction.exit_code, 0);
    EXPECT_EQ(extraction.stderr_text.find("__E2B_EXIT_CODE__"), std::string::npos);
    EXPECT_NE(extraction.stderr_text.find("some warning"), std::string::npos);
}

TEST(ExtractExitCodeTest, MissingMarkerLeavesTextAlone) {
    const auto extraction = ExtractExitCode("Traceback (most recent call last):\n");
    EXPECT_FALSE(extraction.exit_code.has_value());
    EXPECT_EQ(extraction.stderr_text, "Traceback (most recent call last):\n");
}

TEST(ExtractExitCodeTest, LastMarkerWins) {
    const auto extraction = ExtractExitCode(
        "__E2B_EXIT_CODE__=0\nchild printed a fake marker\n__E2B_EXIT_CODE__=2\n");
    ASSERT_TRUE(extraction.exit_code.has_value());
    EXPECT_EQ(*extraction.exit_code, 2);
    EXPECT_EQ(extraction.stderr_text, "child printed a fake marker\n");
}

TEST(ExtractExitCodeTest, AcceptsNegativeCodes) {
    const auto extraction = ExtractExitCode("killed\n__E2B_EXIT_CODE__=-9\n");
    ASSERT_TRUE(extraction.exit_code.has_value());
    EXPECT_EQ(*extraction.exit_code, -9);
}

TEST(ExtractExitCodeTest, MarkerWithoutTrailingNewline) {
    const auto extraction = ExtractExitCode("__E2B_EXIT_CODE__=137");
    ASSERT_TRUE(extraction.exit_code.has_value());
    EXPECT_EQ(*extraction.exit_code, 137);
    EXPECT_TRUE(extraction.stderr_text.empty());
}

TEST(ToolScriptTest, EmbedsArgvAsJsonLiteral) {
    ToolConfig config{};
    config.name = "sqlmap";
    config.command = "sqlmap";
    config.args = {"-u", "http://t.example/?id=1' OR \"1\"=\"1", "--batch"};
    config.timeout = 900;

    const auto code = BuildToolScript(config);
    EXPECT_NE(code.find(R"(_tw_argv = ["sqlmap","-u","http://t.example/?id=1' OR \"1\"=\"1","--batch"])"),
              std::string::npos);
    EXPECT_NE(code.find("timeout=900"), std::string::npos);
    EXPECT_NE(code.find("cwd=\"/workspace\""), std::string::npos);
    EXPECT_NE(code.find("__E2B_EXIT_CODE__=%d"), std::string::npos);
    EXPECT_NE(code.find("_tw_code = 127"), std::string::npos);
    EXPECT_NE(code.find("_tw_code = 124"), std::string::npos);
}

TEST(ToolScriptTest, EmbedsEnvironment) {
    ToolConfig config{};
    config.command = "nuclei";
    config.env = {{"HOME", "/tmp"}, {"NUCLEI_TEMPLATES", "/opt/templates"}};

    const auto code = BuildToolScript(config);
    EXPECT_NE(code.find(R"(_tw_env.update({"HOME":"/tmp","NUCLEI_TEMPLATES":"/opt/templates"}))"),
              std::string::npos);
}

TEST(WorkspaceScriptTest, EnsureAndListTargetWorkspaceRoot) {
    EXPECT_NE(BuildEnsureWorkspaceScript().find("os.makedirs(\"/workspace\", exist_ok=True)"), std::string::npos);
    const auto listing = BuildListWorkspaceScript();
    EXPECT_NE(listing.find("os.walk"), std::string::npos);
    EXPECT_NE(listing.find("json.dumps"), std::string::npos);
}

TEST(ParseWorkspaceListingTest, ParsesLastLine) {
    const auto entries = ParseWorkspaceListing("noise from sitecustomize\n[\"out.txt\", \"reports/a.json\"]\n");
    const std::vector<std::string> expected{"out.txt", "reports/a.json"};
    EXPECT_EQ(entries, expected);
}

TEST(ParseWorkspaceListingTest, DropsEscapingEntries) {
    const auto entries = ParseWorkspaceListing(R"(["../etc/passwd", "/abs", "ok.txt", "a/../../b", 7])");
    const std::vector<std::string> expected{"ok.txt"};
    EXPECT_EQ(entries, expected);
}

TEST(ParseWorkspaceListingTest, MalformedListingIsEmpty) {
    EXPECT_TRUE(ParseWorkspaceListing("").empty());
    EXPECT_TRUE(ParseWorkspaceListing("not json").empty());
    EXPECT_TRUE(ParseWorkspaceListing("{\"a\": 1}").empty());
}

}  // namespace
