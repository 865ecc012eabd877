#include <gtest/gtest.h>

#include "font_tool.h"
#include "test_helpers.h"

class HandwriteToolTest : public ::testing::Test {
protected:
    void SetUp() override {
        out_dir = dir / "outputs";
        fs::create_directories(out_dir);
        input = dir / "input.jpg";
        write_file(input, "JPEG");
    }

    ToolRequest request(const string& filename = "myfont") const {
        return ToolRequest{input, out_dir, "Sans", "Regular", filename};
    }

    TempDir  dir;
    fs::path out_dir;
    fs::path input;
};

TEST_F(HandwriteToolTest, BuildsFixedArgumentVector) {
    HandwriteTool tool("handwrite", std::chrono::seconds(5));
    auto cmd = tool.build_command(ToolRequest{"in/a b.png", "outputs", "My Family", "Bold", "name"});

    vector<string> expected = {"handwrite", "in/a b.png", "outputs", "--family", "My Family",
                               "--style", "Bold", "--filename", "name"};
    EXPECT_EQ(cmd, expected);
}

TEST_F(HandwriteToolTest, SucceedsAndPassesArgumentsVerbatim) {
    auto exe = write_script(dir / "fake-handwrite",
                            "printf '%s\\n' \"$@\" > \"$2/args.txt\"\n"
                            "printf 'TTF' > \"$2/$8.ttf\"");
    HandwriteTool tool(exe.string(), std::chrono::seconds(10));

    ToolOutcome outcome = tool.run(ToolRequest{input, out_dir, "My Family", "Bold Italic", "my font"});

    ASSERT_EQ(outcome.status, ToolStatus::Succeeded);
    EXPECT_EQ(outcome.exit_code, 0);
    EXPECT_EQ(outcome.expected_output, out_dir / "my font.ttf");
    EXPECT_EQ(read_file_binary(outcome.expected_output.string()), "TTF");

    string expected = input.string() + "\n" + out_dir.string() +
                      "\n--family\nMy Family\n--style\nBold Italic\n--filename\nmy font\n";
    EXPECT_EQ(read_file_binary((out_dir / "args.txt").string()), expected);
}

TEST_F(HandwriteToolTest, NonZeroExitUsesStderr) {
    auto exe = write_script(dir / "fake-handwrite", "echo 'progress' ; echo '  bad image  ' 1>&2; exit 2");
    HandwriteTool tool(exe.string(), std::chrono::seconds(10));

    ToolOutcome outcome = tool.run(request());
    EXPECT_EQ(outcome.status, ToolStatus::Failed);
    EXPECT_EQ(outcome.exit_code, 2);
    EXPECT_EQ(outcome.diagnostic, "bad image");
}

TEST_F(HandwriteToolTest, NonZeroExitFallsBackToStdout) {
    auto exe = write_script(dir / "fake-handwrite", "echo 'could not find grid'; exit 1");
    HandwriteTool tool(exe.string(), std::chrono::seconds(10));

    ToolOutcome outcome = tool.run(request());
    EXPECT_EQ(outcome.status, ToolStatus::Failed);
    EXPECT_EQ(outcome.diagnostic, "could not find grid");
}

TEST_F(HandwriteToolTest, ZeroExitWithoutOutputStillReportsExpectedPath) {
    auto exe = write_script(dir / "fake-handwrite", "exit 0");
    HandwriteTool tool(exe.string(), std::chrono::seconds(10));

    ToolOutcome outcome = tool.run(request("ghost"));
    EXPECT_EQ(outcome.status, ToolStatus::Succeeded);
    EXPECT_EQ(outcome.expected_output, out_dir / "ghost.ttf");
    EXPECT_FALSE(fs::exists(outcome.expected_output));
}

TEST_F(HandwriteToolTest, MissingExecutableIsUnavailable) {
    HandwriteTool tool((dir / "not-installed").string(), std::chrono::seconds(5));
    EXPECT_EQ(tool.run(request()).status, ToolStatus::Unavailable);

    HandwriteTool on_path("handfont-missing-handwrite", std::chrono::seconds(5));
    EXPECT_EQ(on_path.run(request()).status, ToolStatus::Unavailable);
}

TEST_F(HandwriteToolTest, SlowToolTimesOut) {
    auto exe = write_script(dir / "fake-handwrite", "sleep 30");
    HandwriteTool tool(exe.string(), std::chrono::seconds(1));

    auto start = std::chrono::steady_clock::now();
    ToolOutcome outcome = tool.run(request());

    EXPECT_EQ(outcome.status, ToolStatus::TimedOut);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST(PickDiagnostic, PrefersStderrAndCapsLength) {
    EXPECT_EQ(pick_diagnostic("  err\n", "out"), "err");
    EXPECT_EQ(pick_diagnostic(" \n", "out\n"), "out");
    EXPECT_EQ(pick_diagnostic("", ""), "");

    string longer(5000, 'e');
    longer.back() = 'Z';
    string capped = pick_diagnostic(longer, "");
    EXPECT_EQ(capped.size(), 2003u);
    EXPECT_EQ(capped.substr(0, 3), "...");
    EXPECT_EQ(capped.back(), 'Z');
}
