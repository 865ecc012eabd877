/**
 * Handfont — `handwrite` tool adapter
 */

#include "font_tool.h"
#include "artifact.h"
#include "process.h"

static constexpr size_t MAX_DIAGNOSTIC_CHARS = 2000;

string pick_diagnostic(const string& stderr_text, const string& stdout_text) {
    string text = trim(stderr_text);
    if (text.empty()) text = trim(stdout_text);

    if (text.size() > MAX_DIAGNOSTIC_CHARS) {
        text = "..." + text.substr(text.size() - MAX_DIAGNOSTIC_CHARS);
    }

    return text;
}

HandwriteTool::HandwriteTool(string executable, std::chrono::seconds timeout)
    : executable_(std::move(executable)), timeout_(timeout) {}

vector<string> HandwriteTool::build_command(const ToolRequest& request) const {
    return {
        executable_,
        request.input_image.string(),
        request.output_dir.string(),
        "--family",   request.family,
        "--style",    request.style,
        "--filename", request.filename,
    };
}

ToolOutcome HandwriteTool::run(const ToolRequest& request) {
    ToolOutcome outcome;
    auto started = std::chrono::steady_clock::now();

    ProcessResult proc = run_process(build_command(request), timeout_);

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    cout << "[Handfont] " << executable_ << " " << process_status_name(proc.status)
         << " (code " << proc.exit_code << ", " << elapsed << " ms)" << endl;

    outcome.exit_code = proc.exit_code;

    switch (proc.status) {
        case ProcessStatus::NotFound:
            outcome.status = ToolStatus::Unavailable;
            outcome.diagnostic = proc.error;
            return outcome;

        case ProcessStatus::TimedOut:
            outcome.status = ToolStatus::TimedOut;
            outcome.diagnostic = pick_diagnostic(proc.stderr_text, proc.stdout_text);
            return outcome;

        case ProcessStatus::SpawnFailed:
            outcome.status = ToolStatus::Failed;
            outcome.diagnostic = "could not start " + executable_ + ": " + proc.error;
            return outcome;

        case ProcessStatus::Exited:
            break;
    }

    if (proc.exit_code != 0) {
        outcome.status = ToolStatus::Failed;
        outcome.diagnostic = pick_diagnostic(proc.stderr_text, proc.stdout_text);
        return outcome;
    }

    outcome.status = ToolStatus::Succeeded;
    outcome.expected_output = artifact_path(request.output_dir, request.filename);
    return outcome;
}
