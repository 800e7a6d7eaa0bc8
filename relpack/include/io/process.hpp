#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace relpack::io {

struct ProcessResult {
    int code = -1;
    std::string commandLine;
    // stdout and stderr interleaved in arrival order.
    std::string output;
    bool timedOut = false;
    bool cancelled = false;
};

struct RunOptions {
    // Zero means no limit.
    std::chrono::milliseconds timeout{0};
    // Polled while the child runs; setting it terminates the child.
    const std::atomic<bool> *cancel = nullptr;
    bool dryRun = false;
};

std::string shellQuote(const std::string &value);
std::string displayCommand(const std::string &command, const std::vector<std::string> &args);

ProcessResult runCommand(
    const std::string &command,
    const std::vector<std::string> &args,
    const std::filesystem::path &cwd,
    const relpack::Context &ctx,
    const RunOptions &options = {}
);

} // namespace relpack::io
