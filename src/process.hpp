#pragma once
#include <string>
#include <vector>

namespace cronreg {

struct ProcessResult {
    int exit_code = -1;    // 127 if the program could not be executed
    bool signaled = false; // terminated by a signal
    std::string out;
    std::string err;

    bool success() const { return !signaled && exit_code == 0; }
};

// Run argv[0] (looked up in PATH) with the given arguments, feed stdin_data
// to its standard input and capture stdout and stderr separately.
// Throws std::runtime_error if the process cannot be started at all.
ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::string& stdin_data = {});

} // namespace cronreg
