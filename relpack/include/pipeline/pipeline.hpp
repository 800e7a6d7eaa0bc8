#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "core/errors.hpp"
#include "model/manifest.hpp"
#include "pipeline/orchestrator.hpp"

namespace relpack::pipeline {

enum class Stage {
    Start,
    Building,
    BuildFailed,
    Validating,
    ValidationFailed,
    Packaging,
    PackageFailed,
    Done,
};

const char *stageName(Stage stage);
bool isTerminal(Stage stage);
bool canTransition(Stage from, Stage to);

struct PackagingResult {
    Stage stage = Stage::Start;
    std::filesystem::path archivePath;
    std::vector<std::string> entries;
    std::vector<TargetFailure> failures;

    bool ok() const { return stage == Stage::Done; }
    std::vector<std::string> failedTriples() const;
};

struct PipelineOptions {
    // Empty keeps the manifest output.
    std::filesystem::path output;
    int jobs = -1;
    int level = -1;
    bool store = false;
    std::chrono::seconds timeout{0};
    bool skipBuild = false;
    // Prints the build commands and stops before validation.
    bool dryRun = false;
};

// One run of build -> validate -> package over an immutable manifest.
class Pipeline {
public:
    using StageObserver = std::function<void(Stage)>;

    Pipeline(const relpack::Context &ctx, model::BuildManifest manifest, PipelineOptions options);

    void onStage(StageObserver observer) { observer_ = std::move(observer); }

    // Only the first call runs; later calls return the same result.
    PackagingResult run();

    // Safe from any thread; stops pending and running builds.
    void cancel();

    Stage stage() const { return stage_; }

private:
    void transition(Stage next);
    bool build(PackagingResult &result);
    bool validate(PackagingResult &result);
    bool package(PackagingResult &result);

    const relpack::Context &ctx_;
    const model::BuildManifest manifest_;
    PipelineOptions options_;
    Stage stage_ = Stage::Start;
    StageObserver observer_;
    std::unique_ptr<BuildOrchestrator> orchestrator_;
    PackagingResult result_;
};

int exitCodeFor(const PackagingResult &result);
void reportResult(const relpack::Context &ctx, const PackagingResult &result);

} // namespace relpack::pipeline
