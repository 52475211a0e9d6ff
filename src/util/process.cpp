#include "util/process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

namespace dw::util {

namespace {

constexpr int EXEC_FAILED = 127;

void closeFd(int& fd) {
    if (fd >= 0) ::close(fd);
    fd = -1;
}

}

ProcessResult runProcess(const std::vector<std::string>& argv, const std::filesystem::path& cwd) {
    if (argv.empty()) throw std::invalid_argument("runProcess: empty argv");

    int outPipe[2], errPipe[2], execPipe[2];
    if (pipe(outPipe) == -1) throw SpawnError("Failed to create stdout pipe");
    if (pipe(errPipe) == -1) {
        ::close(outPipe[0]); ::close(outPipe[1]);
        throw SpawnError("Failed to create stderr pipe");
    }
    // closed on successful exec, carries errno otherwise
    if (pipe2(execPipe, O_CLOEXEC) == -1) {
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);
        throw SpawnError("Failed to create exec status pipe");
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) {
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);
        ::close(execPipe[0]); ::close(execPipe[1]);
        throw SpawnError("Failed to fork " + argv.front());
    }

    if (pid == 0) {
        dup2(outPipe[1], STDOUT_FILENO);
        dup2(errPipe[1], STDERR_FILENO);
        ::close(outPipe[0]); ::close(outPipe[1]);
        ::close(errPipe[0]); ::close(errPipe[1]);
        ::close(execPipe[0]);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            const int e = errno;
            (void)!write(execPipe[1], &e, sizeof(e));
            _exit(EXEC_FAILED);
        }

        execvp(args[0], args.data());
        const int e = errno;
        (void)!write(execPipe[1], &e, sizeof(e));
        _exit(EXEC_FAILED);
    }

    ::close(outPipe[1]);
    ::close(errPipe[1]);
    ::close(execPipe[1]);

    int childErrno = 0;
    ssize_t n;
    do { n = read(execPipe[0], &childErrno, sizeof(childErrno)); } while (n < 0 && errno == EINTR);
    ::close(execPipe[0]);

    ProcessResult res;
    int fds[2] = {outPipe[0], errPipe[0]};
    std::string* sinks[2] = {&res.out, &res.err};

    char buf[8192];
    while (fds[0] >= 0 || fds[1] >= 0) {
        pollfd pfds[2];
        nfds_t count = 0;
        int map[2];
        for (int i = 0; i < 2; ++i) {
            if (fds[i] < 0) continue;
            pfds[count] = {fds[i], POLLIN, 0};
            map[count++] = i;
        }

        if (poll(pfds, count, -1) < 0) {
            if (errno == EINTR) continue;
            break;
        }

        for (nfds_t k = 0; k < count; ++k) {
            if (!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            const int idx = map[k];
            const ssize_t r = read(fds[idx], buf, sizeof(buf));
            if (r > 0) sinks[idx]->append(buf, static_cast<size_t>(r));
            else if (r == 0 || errno != EINTR) closeFd(fds[idx]);
        }
    }
    closeFd(fds[0]);
    closeFd(fds[1]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    if (n == sizeof(childErrno))
        throw SpawnError(fmt::format("Failed to execute {}: {}", argv.front(), std::strerror(childErrno)));

    res.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return res;
}

}
