#pragma once
/**
 * Handfont — Font generation tool capability
 *
 * The job service only sees FontTool::run(). HandwriteTool drives the real
 * `handwrite` executable through run_process(); tests substitute fakes.
 *
 * Argument contract:
 *   <tool> <input-image> <output-dir> --family <f> --style <s> --filename <n>
 * On success the tool writes <output-dir>/<n>.ttf and exits 0.
 */

#include "common.h"

struct ToolRequest {
    fs::path input_image;
    fs::path output_dir;
    string   family;
    string   style;
    string   filename;     // sanitized artifact key
};

enum class ToolStatus {
    Succeeded,
    Unavailable,
    TimedOut,
    Failed
};

struct ToolOutcome {
    ToolStatus status    = ToolStatus::Failed;
    int        exit_code = -1;
    string     diagnostic;          // stderr, or stdout when stderr is empty
    fs::path   expected_output;     // set on success; existence not yet checked
};

class FontTool {
public:
    virtual ~FontTool() = default;
    virtual ToolOutcome run(const ToolRequest& request) = 0;
    virtual string name() const = 0;
};

class HandwriteTool : public FontTool {
public:
    HandwriteTool(string executable, std::chrono::seconds timeout);

    ToolOutcome run(const ToolRequest& request) override;
    string name() const override { return executable_; }

    vector<string> build_command(const ToolRequest& request) const;

private:
    string               executable_;
    std::chrono::seconds timeout_;
};

// Diagnostic text for the user: trimmed stderr, else trimmed stdout, capped.
string pick_diagnostic(const string& stderr_text, const string& stdout_text);
