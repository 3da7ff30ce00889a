#include "util/PosixProcessRunner.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
#include <sys/prctl.h>
#endif

#include "util/Logger.hpp"

namespace vcstrim {

namespace {

volatile sig_atomic_t g_childPid = 0;
volatile sig_atomic_t g_pendingSignal = 0;

void forwardSignal(int sig) {
    g_pendingSignal = sig;
    if (g_childPid > 0) ::kill(static_cast<pid_t>(g_childPid), sig);
}

/// Installs forwarding handlers for the lifetime of one child
class SignalForwarder {
public:
    SignalForwarder(pid_t child, bool forwardInterrupt) {
        g_childPid = child;
        g_pendingSignal = 0;
        struct sigaction sa;
        std::memset(&sa, 0, sizeof(sa));
        sa.sa_handler = forwardSignal;
        sigemptyset(&sa.sa_mask);
        install(SIGTERM, sa, oldTerm);
        install(SIGHUP, sa, oldHup);
        if (forwardInterrupt) {
            install(SIGINT, sa, oldInt);
            ::sigaction(SIGQUIT, nullptr, &oldQuit);
        } else {
            // Terminal-generated SIGINT/SIGQUIT already reach the child through its process group
            sa.sa_handler = SIG_IGN;
            install(SIGINT, sa, oldInt);
            install(SIGQUIT, sa, oldQuit);
        }
    }

    ~SignalForwarder() {
        ::sigaction(SIGTERM, &oldTerm, nullptr);
        ::sigaction(SIGHUP, &oldHup, nullptr);
        ::sigaction(SIGINT, &oldInt, nullptr);
        ::sigaction(SIGQUIT, &oldQuit, nullptr);
        g_childPid = 0;
    }

    /// Signal received while the child ran, 0 if none
    int pending() const { return static_cast<int>(g_pendingSignal); }

    SignalForwarder(const SignalForwarder&) = delete;
    SignalForwarder& operator=(const SignalForwarder&) = delete;

private:
    struct sigaction oldTerm {};
    struct sigaction oldHup {};
    struct sigaction oldInt {};
    struct sigaction oldQuit {};

    static void install(int sig, const struct sigaction& sa, struct sigaction& old) {
        ::sigaction(sig, &sa, &old);
    }

};

void reraise(int sig) {
    if (sig == 0) return;
    std::signal(sig, SIG_DFL);
    std::raise(sig);
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

/// SpawnFailed when exec itself failed (missing binary), IoError for pipe/fork trouble
Error spawnError(const std::vector<std::string>& argv, int err, bool execFailed) {
    std::string program = argv.empty() ? std::string("<empty>") : argv.front();
    return Error{execFailed ? ErrorCode::SpawnFailed : ErrorCode::IoError,
                 "failed to run " + program + ": " + std::strerror(err)};
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

int waitChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return decodeStatus(status);
}

/**
 * Fork and exec argv. stdoutFd/stderrFd (when >= 0) become the child's
 * stdout/stderr. Returns the child pid, or -1 with spawnErrno set; exec
 * failure arrives via the status pipe and sets execFailed.
 */
pid_t spawn(const std::vector<std::string>& argv, int stdoutFd, int stderrFd, int& spawnErrno, bool& execFailed) {
    execFailed = false;
    int statusPipe[2];
    if (::pipe2(statusPipe, O_CLOEXEC) != 0) {
        spawnErrno = errno;
        return -1;
    }

    std::vector<char*> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto& arg : argv) cargs.push_back(const_cast<char*>(arg.c_str()));
    cargs.push_back(nullptr);

    pid_t parent = ::getpid();
    pid_t pid = ::fork();
    if (pid < 0) {
        spawnErrno = errno;
        ::close(statusPipe[0]);
        ::close(statusPipe[1]);
        return -1;
    }

    if (pid == 0) {
#ifdef __linux__
        ::prctl(PR_SET_PDEATHSIG, SIGTERM);
        if (::getppid() != parent) _exit(127);
#else
        (void)parent;
#endif
        ::close(statusPipe[0]);
        if (stdoutFd >= 0) ::dup2(stdoutFd, STDOUT_FILENO);
        if (stderrFd >= 0) ::dup2(stderrFd, STDERR_FILENO);
        ::execvp(cargs[0], cargs.data());
        int err = errno;
        ssize_t ignored = ::write(statusPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    ::close(statusPipe[1]);
    int childErr = 0;
    ssize_t n;
    do {
        n = ::read(statusPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    ::close(statusPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        waitChild(pid);
        spawnErrno = childErr;
        execFailed = true;
        return -1;
    }
    return pid;
}

/// Drain both pipes until EOF on each
bool drain(int outFd, int errFd, std::string& out, std::string& err) {
    struct pollfd fds[2] = {{outFd, POLLIN, 0}, {errFd, POLLIN, 0}};
    std::string* sinks[2] = {&out, &err};
    int open = 2;
    char buf[8192];
    while (open > 0) {
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open;
            }
        }
    }
    return true;
}

}

Expected<RawOutput> PosixProcessRunner::capture(const std::vector<std::string>& argv) {
    if (argv.empty()) return Error{ErrorCode::InvalidArgs, "empty command line"};

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (::pipe2(outPipe, O_CLOEXEC) != 0) return spawnError(argv, errno, false);
    if (::pipe2(errPipe, O_CLOEXEC) != 0) {
        int e = errno;
        closeFd(outPipe[0]);
        closeFd(outPipe[1]);
        return spawnError(argv, e, false);
    }

    int spawnErrno = 0;
    bool execFailed = false;
    pid_t pid = spawn(argv, outPipe[1], errPipe[1], spawnErrno, execFailed);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    if (pid < 0) {
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        return spawnError(argv, spawnErrno, execFailed);
    }

    RawOutput raw;
    int pendingSignal = 0;
    bool drained = false;
    {
        SignalForwarder forwarder(pid, true);
        drained = drain(outPipe[0], errPipe[0], raw.stdoutText, raw.stderrText);
        closeFd(outPipe[0]);
        closeFd(errPipe[0]);
        if (!drained) ::kill(pid, SIGTERM);
        raw.exitStatus = waitChild(pid);
        pendingSignal = forwarder.pending();
    }
    reraise(pendingSignal);

    if (!drained) return Error{ErrorCode::IoError, "failed reading output of " + argv.front()};
    return raw;
}

Expected<int> PosixProcessRunner::interactive(const std::vector<std::string>& argv) {
    if (argv.empty()) return Error{ErrorCode::InvalidArgs, "empty command line"};

    int spawnErrno = 0;
    bool execFailed = false;
    pid_t pid = spawn(argv, -1, -1, spawnErrno, execFailed);
    if (pid < 0) return spawnError(argv, spawnErrno, execFailed);

    int status = 0;
    int pendingSignal = 0;
    {
        SignalForwarder forwarder(pid, false);
        status = waitChild(pid);
        pendingSignal = forwarder.pending();
    }
    reraise(pendingSignal);
    return status;
}

}
