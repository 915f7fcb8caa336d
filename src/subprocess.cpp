//
//  subprocess.cpp
//  CaptionBurn
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "subprocess.hpp"

#include <errno.h>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>

#include "logging.hpp"

using captionburn::errno_message;

namespace {

std::vector<char *> make_exec_argv(const std::vector<std::string> &argv) {
    std::vector<char *> out;
    out.reserve(argv.size() + 1);
    for (const auto &a : argv) {
        out.push_back(const_cast<char *>(a.c_str()));
    }
    out.push_back(nullptr);
    return out;
}

void close_fd(int &fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

int wait_exit_code(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            CB_LOG("error", "waitpid failed for pid " << pid << " errno=" << errno_message(errno));
            return -1;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// Fork and exec argv. `stdin_fd`/`stdout_fd` (when >= 0) are dup2'ed onto the child's
// stdin/stdout; `close_in_child` lists parent-side ends to drop. A CLOEXEC status pipe
// reports exec failures back to the parent. Returns the pid or -1.
pid_t spawn(const std::vector<std::string> &argv, int stdin_fd, int stdout_fd,
            const std::vector<int> &close_in_child) {
    if (argv.empty()) {
        CB_LOG("error", "spawn called with empty argv");
        return -1;
    }
    int status_pipe[2];
    if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
        CB_LOG("error", "pipe2 failed errno=" << errno_message(errno));
        return -1;
    }
    auto exec_argv = make_exec_argv(argv);
    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        CB_LOG("error", "fork failed errno=" << errno_message(err));
        return -1;
    }
    if (pid == 0) {
        ::close(status_pipe[0]);
        for (int fd : close_in_child) {
            ::close(fd);
        }
        if (stdin_fd >= 0 && ::dup2(stdin_fd, STDIN_FILENO) < 0) {
            int err = errno;
            (void)!::write(status_pipe[1], &err, sizeof(err));
            _exit(127);
        }
        if (stdout_fd >= 0 && ::dup2(stdout_fd, STDOUT_FILENO) < 0) {
            int err = errno;
            (void)!::write(status_pipe[1], &err, sizeof(err));
            _exit(127);
        }
        if (stdin_fd > STDERR_FILENO) ::close(stdin_fd);
        if (stdout_fd > STDERR_FILENO) ::close(stdout_fd);
        ::execvp(exec_argv[0], exec_argv.data());
        int err = errno;
        (void)!::write(status_pipe[1], &err, sizeof(err));
        _exit(127);
    }
    ::close(status_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);
    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        // exec never happened; reap the child and report.
        wait_exit_code(pid);
        CB_LOG("error", "cannot run '" << argv[0] << "' errno=" << errno_message(child_errno));
        return -1;
    }
    return pid;
}

}  // namespace

std::string format_command(const std::vector<std::string> &argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) out.push_back(' ');
        const auto &a = argv[i];
        bool quote = a.empty() || a.find_first_of(" \t\"'[];$") != std::string::npos;
        if (quote) {
            out.push_back('\'');
            out += a;
            out.push_back('\'');
        } else {
            out += a;
        }
    }
    return out;
}

CommandResult run_command(const std::vector<std::string> &argv) {
    CommandResult result;
    CB_LOG("debug", "run: " << format_command(argv));
    int out_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        CB_LOG("error", "pipe2 failed errno=" << errno_message(errno));
        return result;
    }
    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    pid_t pid = spawn(argv, devnull, out_pipe[1], {out_pipe[0]});
    if (devnull >= 0) {
        ::close(devnull);
    }
    ::close(out_pipe[1]);
    if (pid < 0) {
        ::close(out_pipe[0]);
        return result;
    }
    result.spawned = true;
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(out_pipe[0], buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            CB_LOG("warn", "read from '" << argv[0] << "' failed errno=" << errno_message(errno));
            break;
        }
    }
    ::close(out_pipe[0]);
    result.exit_code = wait_exit_code(pid);
    CB_LOG("debug", "'" << argv[0] << "' exited with " << result.exit_code << " ("
                        << result.output.size() << " bytes of output)");
    return result;
}

PipedProcess::~PipedProcess() {
    if (pid_ > 0 || stdin_fd_ >= 0) {
        close_and_wait();
    }
}

bool PipedProcess::start(const std::vector<std::string> &argv) {
    if (pid_ > 0) {
        CB_LOG("error", "process already running (pid " << pid_ << ")");
        return false;
    }
    int in_pipe[2];
    if (::pipe2(in_pipe, O_CLOEXEC) != 0) {
        last_errno_ = errno;
        CB_LOG("error", "pipe2 failed errno=" << errno_message(last_errno_));
        return false;
    }
    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    if (::sigaction(SIGPIPE, &ignore, &old_sigpipe_) == 0) {
        sigpipe_saved_ = true;
    }
    CB_LOG("debug", "spawn: " << format_command(argv));
    pid_ = spawn(argv, in_pipe[0], -1, {in_pipe[1]});
    ::close(in_pipe[0]);
    if (pid_ < 0) {
        ::close(in_pipe[1]);
        if (sigpipe_saved_) {
            ::sigaction(SIGPIPE, &old_sigpipe_, nullptr);
            sigpipe_saved_ = false;
        }
        return false;
    }
    stdin_fd_ = in_pipe[1];
    exit_code_ = -1;
    return true;
}

bool PipedProcess::write(const uint8_t *data, size_t size) {
    if (stdin_fd_ < 0) {
        last_errno_ = EBADF;
        return false;
    }
    size_t done = 0;
    while (done < size) {
        ssize_t n = ::write(stdin_fd_, data + done, size - done);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            last_errno_ = errno;
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

int PipedProcess::close_and_wait() {
    close_fd(stdin_fd_);
    if (pid_ > 0) {
        exit_code_ = wait_exit_code(pid_);
        pid_ = -1;
    }
    if (sigpipe_saved_) {
        ::sigaction(SIGPIPE, &old_sigpipe_, nullptr);
        sigpipe_saved_ = false;
    }
    return exit_code_;
}
