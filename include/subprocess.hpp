//
//  subprocess.hpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <signal.h>
#include <sys/types.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Result of a child run to completion with stdout captured.
struct CommandResult {
    bool spawned = false;  // false when fork/exec failed (e.g. binary not on PATH)
    int exit_code = -1;    // 128+N when killed by signal N
    std::string output;    // captured stdout
};

// Run argv[0] (PATH lookup, no shell) with stdin from /dev/null and stdout captured.
// stderr is inherited so tool diagnostics reach the user.
CommandResult run_command(const std::vector<std::string> &argv);

// Space-joined argv with quoting for arguments that need it; for logs only.
std::string format_command(const std::vector<std::string> &argv);

/**
 * @brief A child process fed through its stdin.
 *
 * start() spawns with a pipe on the child's stdin. write() blocks until the whole buffer is in
 * the pipe, so a slow consumer throttles the producer. SIGPIPE is ignored while the process is
 * running, a write after the child went away fails with EPIPE instead of killing us.
 * The destructor closes the pipe and reaps the child if close_and_wait() was not called.
 */
class PipedProcess {
public:
    PipedProcess() = default;
    ~PipedProcess();

    PipedProcess(const PipedProcess &) = delete;
    PipedProcess &operator=(const PipedProcess &) = delete;

    bool start(const std::vector<std::string> &argv);

    // False on any write error; last_error() holds the errno.
    bool write(const uint8_t *data, size_t size);

    // Close stdin, wait for exit, restore SIGPIPE. Returns the exit code; repeated calls
    // return the cached code.
    int close_and_wait();

    bool running() const { return pid_ > 0; }
    int last_error() const { return last_errno_; }

private:
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int exit_code_ = -1;
    int last_errno_ = 0;
    bool sigpipe_saved_ = false;
    struct sigaction old_sigpipe_ {};
};
