/*
 * subfetch - Concurrent Subtitle Fetch Scheduler
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "subfetch/process.hpp"
#include "subfetch/logger.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace subfetch {

namespace {

constexpr const char* DEFAULT_PATH = "/usr/local/bin:/usr/bin:/bin";

std::mutex g_search_mutex;
std::vector<std::string> g_extra_dirs;

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> entries;
    std::size_t begin = 0;
    while (true) {
        auto end = path.find(':', begin);
        entries.push_back(path.substr(begin, end == std::string::npos ? std::string::npos : end - begin));
        if (end == std::string::npos) {
            break;
        }
        begin = end + 1;
    }
    return entries;
}

bool hasEntry(const std::string& path, const std::string& directory) {
    for (const auto& entry : splitPath(path)) {
        if (entry == directory) {
            return true;
        }
    }
    return false;
}

// `base` with every added directory appended once.
std::string extendPath(std::string base) {
    std::lock_guard<std::mutex> lock(g_search_mutex);
    for (const auto& dir : g_extra_dirs) {
        if (hasEntry(base, dir)) {
            continue;
        }
        base = base.empty() ? dir : base + ":" + dir;
    }
    return base;
}

std::string inheritedPath() {
    const char* path = std::getenv("PATH");
    return path ? path : DEFAULT_PATH;
}

// Candidate executables for `program`, in search order.
std::vector<std::string> resolveCandidates(const std::string& program, const std::string& path) {
    if (program.find('/') != std::string::npos) {
        return {program};
    }
    std::vector<std::string> candidates;
    for (const auto& entry : splitPath(path)) {
        candidates.push_back((entry.empty() ? std::string(".") : entry) + "/" + program);
    }
    return candidates;
}

struct Pipe {
    int fds[2] = {-1, -1};

    bool open(int flags) noexcept { return ::pipe2(fds, flags) == 0; }
    int readEnd() const noexcept { return fds[0]; }
    int writeEnd() const noexcept { return fds[1]; }

    void closeRead() noexcept {
        if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; }
    }
    void closeWrite() noexcept {
        if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; }
    }
    ~Pipe() { closeRead(); closeWrite(); }
};

std::vector<std::string> buildEnvironment(const Environment& overrides) {
    std::vector<std::string> entries;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        if (overrides.count(key) == 0) {
            entries.push_back(std::move(entry));
        }
    }
    for (const auto& [key, value] : overrides) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

std::vector<char*> toArgv(std::vector<std::string>& strings) {
    std::vector<char*> out;
    out.reserve(strings.size() + 1);
    for (auto& s : strings) {
        out.push_back(s.data());
    }
    out.push_back(nullptr);
    return out;
}

// Drains both pipes until EOF on each.
void collectOutput(int outFd, int errFd, std::string& out, std::string& err) {
    pollfd fds[2] = {{outFd, POLLIN, 0}, {errFd, POLLIN, 0}};
    int open = 2;
    char buffer[4096];

    while (open > 0) {
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            LOG_ERROR(std::string("poll() failed while reading child output: ") + std::strerror(errno));
            return;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                (i == 0 ? out : err).append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open;
            }
        }
    }
}

int waitForChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

}

ProcessResult runProcess(const std::string& program,
                         const std::vector<std::string>& args,
                         const Environment& env) noexcept {
    ProcessResult result;

    try {
        Environment overrides = env;
        overrides.emplace("DEBIAN_FRONTEND", "noninteractive");
        overrides.emplace("PYTHONUNBUFFERED", "1");

        auto pathOverride = env.find("PATH");
        const std::string path = pathOverride != env.end() ? pathOverride->second : extendPath(inheritedPath());
        overrides["PATH"] = path;

        const std::vector<std::string> candidates = resolveCandidates(program, path);

        std::vector<std::string> argvStrings;
        argvStrings.reserve(args.size() + 1);
        argvStrings.push_back(program);
        argvStrings.insert(argvStrings.end(), args.begin(), args.end());
        std::vector<std::string> envStrings = buildEnvironment(overrides);

        // Everything the child needs is built before fork(); the child only calls
        // async-signal-safe functions.
        std::vector<char*> argv = toArgv(argvStrings);
        std::vector<char*> envp = toArgv(envStrings);

        Pipe outPipe, errPipe, execPipe;
        if (!outPipe.open(O_CLOEXEC) || !errPipe.open(O_CLOEXEC) || !execPipe.open(O_CLOEXEC)) {
            result.error = std::string("pipe2: ") + std::strerror(errno);
            return result;
        }

        pid_t pid = ::fork();
        if (pid < 0) {
            result.error = std::string("fork: ") + std::strerror(errno);
            return result;
        }

        if (pid == 0) {
            int devnull = ::open("/dev/null", O_RDONLY);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
            }
            ::dup2(outPipe.writeEnd(), STDOUT_FILENO);
            ::dup2(errPipe.writeEnd(), STDERR_FILENO);
            // Same search rules as execvp: keep going past missing or
            // inaccessible entries, report EACCES if any entry had it.
            int code = ENOENT;
            bool denied = false;
            for (const auto& candidate : candidates) {
                ::execve(candidate.c_str(), argv.data(), envp.data());
                code = errno;
                if (code == EACCES) {
                    denied = true;
                } else if (code != ENOENT && code != ENOTDIR) {
                    break;
                }
            }
            if (denied && (code == ENOENT || code == ENOTDIR)) {
                code = EACCES;
            }
            ssize_t ignored = ::write(execPipe.writeEnd(), &code, sizeof(code));
            (void)ignored;
            ::_exit(127);
        }

        outPipe.closeWrite();
        errPipe.closeWrite();
        execPipe.closeWrite();

        // The exec pipe closes on a successful exec; data on it is the exec errno.
        int execErrno = 0;
        ssize_t got;
        do {
            got = ::read(execPipe.readEnd(), &execErrno, sizeof(execErrno));
        } while (got < 0 && errno == EINTR);

        if (got == static_cast<ssize_t>(sizeof(execErrno))) {
            waitForChild(pid);
            result.error = program + ": " + std::strerror(execErrno);
            LOG_TRACE("Launch failed: " + result.error);
            return result;
        }

        result.launched = true;
        collectOutput(outPipe.readEnd(), errPipe.readEnd(), result.out, result.err);
        result.exitCode = waitForChild(pid);
        LOG_TRACE(program + " exited with code " + std::to_string(result.exitCode));
        return result;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to run " + program + ": " + std::string(e.what()));
        result.error = e.what();
        return result;
    }
}

bool addSearchDirectory(const std::string& directory) {
    if (directory.empty() || hasEntry(inheritedPath(), directory)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(g_search_mutex);
    for (const auto& dir : g_extra_dirs) {
        if (dir == directory) {
            return false;
        }
    }
    g_extra_dirs.push_back(directory);
    return true;
}

std::string searchPath() {
    return extendPath(inheritedPath());
}

}
