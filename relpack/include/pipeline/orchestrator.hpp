#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "model/manifest.hpp"

namespace relpack::pipeline {

enum class BuildStatus {
    Ok,
    Failed,
    Cancelled,
    // Target has no step of its own.
    Skipped,
};

const char *buildStatusName(BuildStatus status);

struct StepOutcome {
    BuildStatus status = BuildStatus::Skipped;
    int exitCode = 0;
    std::string commandLine;
    std::string output;
    bool timedOut = false;
};

struct TargetBuildStatus {
    std::string triple;
    StepOutcome step;
};

struct BuildReport {
    bool globalRan = false;
    StepOutcome global;
    std::vector<TargetBuildStatus> targets;

    bool ok() const;
};

struct OrchestratorOptions {
    // 0 picks a worker count from the hardware.
    int jobs = 0;
    // Applied to steps that set no timeout of their own.
    std::chrono::seconds defaultTimeout{0};
    bool dryRun = false;
};

class BuildOrchestrator {
public:
    BuildOrchestrator(const relpack::Context &ctx, const model::BuildManifest &manifest, OrchestratorOptions options);

    // Blocks until every started build has finished or been terminated.
    BuildReport run();

    // Safe to call from any thread; pending builds are not started, running ones are terminated.
    void cancel();
    bool cancelled() const { return cancel_.load(); }

private:
    StepOutcome runStep(const model::BuildStep &step, const std::string &label);
    void runTargets(BuildReport &report);

    const relpack::Context &ctx_;
    const model::BuildManifest &manifest_;
    OrchestratorOptions options_;
    std::atomic<bool> cancel_{false};
};

std::size_t resolveWorkerCount(int requested, std::size_t targets);

} // namespace relpack::pipeline
