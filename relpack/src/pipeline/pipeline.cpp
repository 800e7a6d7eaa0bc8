#include "pipeline/pipeline.hpp"

#include <set>
#include <stdexcept>

#include "pipeline/packager.hpp"
#include "pipeline/resolver.hpp"

namespace relpack::pipeline
{
    namespace
    {

        std::string describeStep(const StepOutcome &step)
        {
            if (step.timedOut)
            {
                return "build timed out: " + step.commandLine;
            }
            if (step.status == BuildStatus::Cancelled)
            {
                return step.commandLine.empty() ? "build cancelled before it started"
                                                : "build cancelled: " + step.commandLine;
            }
            if (step.exitCode < 0)
            {
                return "build could not be started: " + step.commandLine;
            }
            return "build exited with code " + std::to_string(step.exitCode) + ": " + step.commandLine;
        }

        ErrorKind errorKindFor(ArtifactState state)
        {
            return state == ArtifactState::Empty ? ErrorKind::EmptyArtifact : ErrorKind::MissingArtifact;
        }

    } // namespace

    const char *stageName(Stage stage)
    {
        switch (stage)
        {
        case Stage::Start:
            return "START";
        case Stage::Building:
            return "BUILDING";
        case Stage::BuildFailed:
            return "BUILD_FAILED";
        case Stage::Validating:
            return "VALIDATING";
        case Stage::ValidationFailed:
            return "VALIDATION_FAILED";
        case Stage::Packaging:
            return "PACKAGING";
        case Stage::PackageFailed:
            return "PACKAGE_FAILED";
        case Stage::Done:
            return "DONE";
        }
        return "UNKNOWN";
    }

    bool isTerminal(Stage stage)
    {
        return stage == Stage::BuildFailed || stage == Stage::ValidationFailed ||
               stage == Stage::PackageFailed || stage == Stage::Done;
    }

    bool canTransition(Stage from, Stage to)
    {
        switch (from)
        {
        case Stage::Start:
            return to == Stage::Building;
        case Stage::Building:
            return to == Stage::BuildFailed || to == Stage::Validating;
        case Stage::Validating:
            return to == Stage::ValidationFailed || to == Stage::Packaging;
        case Stage::Packaging:
            return to == Stage::PackageFailed || to == Stage::Done;
        default:
            return false;
        }
    }

    std::vector<std::string> PackagingResult::failedTriples() const
    {
        std::vector<std::string> out;
        for (const auto &failure : failures)
        {
            if (!failure.triple.empty())
            {
                out.push_back(failure.triple);
            }
        }
        return out;
    }

    Pipeline::Pipeline(const relpack::Context &ctx, model::BuildManifest manifest, PipelineOptions options)
        : ctx_(ctx), manifest_(std::move(manifest)), options_(std::move(options))
    {
        OrchestratorOptions build;
        build.jobs = options_.jobs >= 0 ? options_.jobs : manifest_.jobs;
        build.defaultTimeout = options_.timeout;
        build.dryRun = options_.dryRun;
        orchestrator_ = std::make_unique<BuildOrchestrator>(ctx_, manifest_, build);
    }

    void Pipeline::cancel()
    {
        orchestrator_->cancel();
    }

    void Pipeline::transition(Stage next)
    {
        if (!canTransition(stage_, next))
        {
            throw std::logic_error(std::string("invalid pipeline transition ") + stageName(stage_) + " -> " + stageName(next));
        }
        stage_ = next;
        if (observer_)
        {
            observer_(next);
        }
    }

    bool Pipeline::build(PackagingResult &result)
    {
        if (options_.skipBuild)
        {
            ctx_.log("Build skipped (--skip-build)");
            return true;
        }

        const BuildReport report = orchestrator_->run();
        if (report.ok() && !orchestrator_->cancelled())
        {
            return true;
        }

        for (const auto &target : report.targets)
        {
            const StepOutcome &step = target.step;
            if (step.status == BuildStatus::Ok || step.status == BuildStatus::Skipped)
            {
                continue;
            }

            TargetFailure failure;
            failure.triple = target.triple;
            failure.kind = ErrorKind::BuildInvocation;
            failure.reason = report.globalRan && report.global.status != BuildStatus::Ok
                                 ? "global " + describeStep(step)
                                 : describeStep(step);
            failure.diagnostics = step.output;
            result.failures.push_back(failure);
        }
        if (result.failures.empty())
        {
            TargetFailure failure;
            failure.kind = ErrorKind::BuildInvocation;
            failure.reason = "build cancelled";
            result.failures.push_back(failure);
        }
        return false;
    }

    bool Pipeline::validate(PackagingResult &result)
    {
        ctx_.log("Resolve ", manifest_.targets.size(), " artifact(s)");
        const ResolveReport report = resolveArtifacts(ctx_, manifest_);
        if (report.ok())
        {
            return true;
        }

        for (const auto &artifact : report.problems())
        {
            TargetFailure failure;
            failure.triple = artifact.triple;
            failure.kind = errorKindFor(artifact.state);
            failure.reason = std::string(artifactStateName(artifact.state)) + " artifact, " + artifact.detail;
            result.failures.push_back(failure);
        }
        return false;
    }

    bool Pipeline::package(PackagingResult &result)
    {
        PackageOptions options = packageOptionsFor(manifest_);
        if (!options_.output.empty())
        {
            options.output = options_.output;
        }
        if (options_.level >= 0)
        {
            options.level = options_.level;
        }
        if (options_.store)
        {
            options.level = 0;
        }

        ctx_.log("Package ", manifest_.targets.size(), " entries -> ", options.output.string());
        const PackageOutcome outcome = writeArchive(ctx_, manifest_, options);
        if (!outcome.ok)
        {
            TargetFailure failure;
            failure.triple = outcome.failedTriple;
            failure.kind = ErrorKind::ArchiveWrite;
            failure.reason = outcome.error;
            result.failures.push_back(failure);
            return false;
        }

        result.archivePath = outcome.archivePath;
        result.entries = outcome.entries;
        return true;
    }

    PackagingResult Pipeline::run()
    {
        if (stage_ != Stage::Start)
        {
            return result_;
        }

        PackagingResult result;
        transition(Stage::Building);
        if (!build(result))
        {
            transition(Stage::BuildFailed);
        }
        else if (!options_.dryRun)
        {
            transition(Stage::Validating);
            if (!validate(result))
            {
                transition(Stage::ValidationFailed);
            }
            else
            {
                transition(Stage::Packaging);
                transition(package(result) ? Stage::Done : Stage::PackageFailed);
            }
        }

        result.stage = stage_;
        result_ = result;
        return result_;
    }

    int exitCodeFor(const PackagingResult &result)
    {
        switch (result.stage)
        {
        case Stage::BuildFailed:
            return 2;
        case Stage::ValidationFailed:
            return 3;
        case Stage::PackageFailed:
            return 4;
        default:
            return 0;
        }
    }

    void reportResult(const relpack::Context &ctx, const PackagingResult &result)
    {
        if (result.ok())
        {
            ctx.log("[ok] ", result.archivePath.string(), " (", result.entries.size(), " entries)");
            return;
        }
        if (!isTerminal(result.stage))
        {
            ctx.log("Stopped at ", stageName(result.stage), " (dry run)");
            return;
        }

        ctx.error(stageName(result.stage), ": ", result.failures.size(), " failure(s)");
        std::set<std::string> shown;
        for (const auto &failure : result.failures)
        {
            const std::string who = failure.triple.empty() ? "(archive)" : failure.triple;
            ctx.error("  ", who, " ", errorKindName(failure.kind), ": ", failure.reason);
            // A global build failure repeats the same output for every target.
            if (!failure.diagnostics.empty() && shown.insert(failure.diagnostics).second)
            {
                ctx.block(failure.diagnostics);
            }
        }
    }

} // namespace relpack::pipeline
