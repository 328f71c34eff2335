#include "process.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>

namespace wayvox {

// Interval for polling the child while waiting for it to exit
static constexpr int WAIT_POLL_MS = 10;

void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, []() {
        struct sigaction ignore_pipe {};
        ignore_pipe.sa_handler = SIG_IGN;
        sigemptyset(&ignore_pipe.sa_mask);
        sigaction(SIGPIPE, &ignore_pipe, nullptr);
    });
}

bool find_in_path(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return access(program.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return false;

    std::stringstream paths(path_env);
    std::string dir;
    while (std::getline(paths, dir, ':')) {
        if (dir.empty()) continue;
        std::string candidate = dir + "/" + program;
        struct stat st;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) &&
            access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::string& input,
                          int timeout_ms) {
    ProcessResult result;
    if (argv.empty()) return result;

    // A child that exits early must not kill us while we feed its stdin
    ignore_sigpipe();

    int stdin_pipe[2];
    // Close-on-exec so children started concurrently do not hold each other's pipes
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0) {
        std::cerr << "[process] pipe failed: " << std::strerror(errno) << std::endl;
        return result;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "[process] fork failed: " << std::strerror(errno) << std::endl;
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child: stdin from the pipe, output discarded
        dup2(stdin_pipe[0], STDIN_FILENO);
        close(stdin_pipe[0]);
        close(stdin_pipe[1]);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        // Ignored signals survive exec; give the tool the default
        signal(SIGPIPE, SIG_DFL);
        execvp(args[0], args.data());
        _exit(127);
    }

    close(stdin_pipe[0]);

    size_t offset = 0;
    while (offset < input.size()) {
        ssize_t n = write(stdin_pipe[1], input.data() + offset, input.size() - offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        offset += static_cast<size_t>(n);
    }
    close(stdin_pipe[1]);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    int status = 0;
    while (true) {
        pid_t done = waitpid(pid, &status, WNOHANG);
        if (done == pid) break;
        if (done < 0 && errno != EINTR) {
            std::cerr << "[process] waitpid failed: " << std::strerror(errno) << std::endl;
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            result.started = true;
            result.timed_out = true;
            std::cerr << "[process] " << argv[0] << " timed out after " << timeout_ms << " ms" << std::endl;
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(WAIT_POLL_MS));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        // execvp failure in the child
        result.started = result.exit_code != 127;
    } else {
        result.started = true;
        result.exit_code = -1;
    }
    return result;
}

} // namespace wayvox
