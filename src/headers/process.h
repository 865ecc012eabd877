#pragma once
/**
 * Handfont — Child process execution
 *
 * Runs an argv vector directly via fork/execvp (no shell), capturing stdout
 * and stderr separately. The child becomes the leader of its own process
 * group; on timeout, and again after a normal exit, the whole group receives
 * SIGKILL so nothing the tool spawned outlives the request.
 */

#include "common.h"

enum class ProcessStatus {
    Exited,        // ran to completion, exit_code is valid
    NotFound,      // execvp failed: missing or not executable
    TimedOut,      // killed after the deadline
    SpawnFailed    // pipe/fork failure
};

struct ProcessResult {
    ProcessStatus status    = ProcessStatus::SpawnFailed;
    int           exit_code = -1;     // 128 + signo when killed by a signal
    string        stdout_text;
    string        stderr_text;
    string        error;              // errno text for NotFound / SpawnFailed
};

ProcessResult run_process(const vector<string>& argv, std::chrono::milliseconds timeout);

const char* process_status_name(ProcessStatus status);
