#pragma once

#include <chrono>
#include <map>
#include <string>
#include <vector>

struct ProcessSpec {
    std::vector<std::string> argv;  // argv[0] is looked up on PATH
    std::string cwd;
    std::map<std::string, std::string> env;  // added to the inherited environment
    std::chrono::milliseconds timeout{0};    // 0 = wait forever
};

struct ProcessResult {
    bool started = false;
    bool timed_out = false;
    int exit_code = -1;
    std::string out;
    std::string err;

    bool ok() const { return started && !timed_out && exit_code == 0; }
};

// Runs a child to completion, collecting stdout and stderr.
// A child that outlives the timeout is killed.
ProcessResult run_process(const ProcessSpec& spec);
