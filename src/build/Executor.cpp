#include "build/Executor.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <fmt/core.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/wait.h>

using namespace mh::build;
using namespace mh::log;

Result ShellExecutor::run(const std::string& command, const std::filesystem::path& workingDirectory) {
    if (command.empty()) throw std::invalid_argument("Build command is empty");

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) == -1)
        throw std::runtime_error(fmt::format("Failed to create pipe for build output: {}", std::strerror(errno)));

    const std::string workdir = workingDirectory.string();

    const pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        throw std::runtime_error(fmt::format("Failed to fork build process: {}", std::strerror(errno)));
    }

    if (pid == 0) {
        // Child: stdout and stderr both go to the pipe. dup2 targets do not
        // inherit O_CLOEXEC; everything above stderr (listener sockets
        // included) is closed before exec.
        if (dup2(pipefd[1], STDOUT_FILENO) < 0 || dup2(pipefd[1], STDERR_FILENO) < 0) _exit(127);
        if (close_range(STDERR_FILENO + 1, ~0U, 0) != 0)
            for (int fd = STDERR_FILENO + 1; fd < static_cast<int>(sysconf(_SC_OPEN_MAX)); ++fd) close(fd);

        if (!workdir.empty() && chdir(workdir.c_str()) != 0) _exit(126);

        execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127); // exec failed
    }

    close(pipefd[1]);

    Result result;
    char buf[4096];
    for (;;) {
        const ssize_t n = read(pipefd[0], buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        result.output.append(buf, static_cast<size_t>(n));
        if (result.output.size() > MAX_CAPTURE)
            result.output.erase(0, result.output.size() - MAX_CAPTURE);
    }
    close(pipefd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw std::runtime_error(fmt::format("Failed to wait for build process: {}", std::strerror(errno)));
    }

    if (WIFEXITED(status)) result.exitCode = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exitCode = 128 + WTERMSIG(status);

    Registry::build()->debug("[ShellExecutor] '{}' in {} exited with {}", command, workdir, result.exitCode);
    return result;
}
