#pragma once

#include <filesystem>
#include <string>

namespace mh::build {

struct Result {
    int exitCode{-1};
    std::string output;  // combined stdout and stderr, diagnostics only

    [[nodiscard]] bool ok() const { return exitCode == 0; }
};

class Executor {
public:
    virtual ~Executor() = default;

    // Throws std::runtime_error when the command cannot be started at all.
    virtual Result run(const std::string& command, const std::filesystem::path& workingDirectory) = 0;
};

// Runs the command through /bin/sh -c in a forked child.
class ShellExecutor final : public Executor {
public:
    Result run(const std::string& command, const std::filesystem::path& workingDirectory) override;

private:
    static constexpr size_t MAX_CAPTURE = 1024 * 1024;  // keep the tail beyond this
};

}
