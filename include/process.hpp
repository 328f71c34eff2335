#pragma once

#include <string>
#include <vector>

namespace wayvox {

struct ProcessResult {
    bool started = false;     // false if the program could not be executed
    bool timed_out = false;   // killed after exceeding the timeout
    int exit_code = -1;

    bool ok() const { return started && !timed_out && exit_code == 0; }
};

// Run argv[0] (looked up in PATH) with optional stdin data, wait at most
// timeout_ms. stdout/stderr are discarded. The child is killed on timeout.
// Safe to call from several threads at once.
ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::string& input,
                          int timeout_ms);

// Set SIGPIPE to ignored for the whole process. Idempotent; run_process
// calls it too. Write errors then surface as EPIPE instead.
void ignore_sigpipe();

// True if program is an executable somewhere in PATH
bool find_in_path(const std::string& program);

} // namespace wayvox
