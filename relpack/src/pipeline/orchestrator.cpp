#include "pipeline/orchestrator.hpp"

#include <thread>

#include "io/process.hpp"

namespace relpack::pipeline
{
    namespace
    {

        constexpr std::size_t kMaxWorkers = 8;

    } // namespace

    const char *buildStatusName(BuildStatus status)
    {
        switch (status)
        {
        case BuildStatus::Ok:
            return "ok";
        case BuildStatus::Failed:
            return "failed";
        case BuildStatus::Cancelled:
            return "cancelled";
        case BuildStatus::Skipped:
            return "skipped";
        }
        return "unknown";
    }

    bool BuildReport::ok() const
    {
        if (globalRan && global.status != BuildStatus::Ok)
        {
            return false;
        }
        for (const auto &target : targets)
        {
            if (target.step.status == BuildStatus::Failed || target.step.status == BuildStatus::Cancelled)
            {
                return false;
            }
        }
        return true;
    }

    std::size_t resolveWorkerCount(int requested, std::size_t targets)
    {
        std::size_t count = 0;
        if (requested > 0)
        {
            count = static_cast<std::size_t>(requested);
        }
        else
        {
            const unsigned int cpu = std::thread::hardware_concurrency();
            count = cpu == 0 ? 4 : static_cast<std::size_t>(cpu);
        }
        if (count > kMaxWorkers)
        {
            count = kMaxWorkers;
        }
        if (count > targets)
        {
            count = targets;
        }
        return count == 0 ? 1 : count;
    }

    BuildOrchestrator::BuildOrchestrator(
        const relpack::Context &ctx,
        const model::BuildManifest &manifest,
        OrchestratorOptions options)
        : ctx_(ctx), manifest_(manifest), options_(options)
    {
    }

    void BuildOrchestrator::cancel()
    {
        cancel_.store(true);
    }

    StepOutcome BuildOrchestrator::runStep(const model::BuildStep &step, const std::string &label)
    {
        StepOutcome outcome;

        io::RunOptions run;
        run.dryRun = options_.dryRun;
        run.cancel = &cancel_;
        run.timeout = step.timeout > 0
                          ? std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(step.timeout))
                          : std::chrono::duration_cast<std::chrono::milliseconds>(options_.defaultTimeout);

        ctx_.log("Build ", label);
        const io::ProcessResult result = io::runCommand(step.command, step.args, step.cwd, ctx_, run);

        outcome.exitCode = result.code;
        outcome.commandLine = result.commandLine;
        outcome.output = result.output;
        outcome.timedOut = result.timedOut;

        if (result.timedOut)
        {
            outcome.status = BuildStatus::Failed;
            ctx_.error("Build ", label, " timed out after ", run.timeout.count(), " ms");
        }
        else if (result.cancelled)
        {
            outcome.status = BuildStatus::Cancelled;
            ctx_.warn("Build ", label, " cancelled");
        }
        else if (result.code != 0)
        {
            outcome.status = BuildStatus::Failed;
            ctx_.error("Build ", label, " failed (", result.code, "): ", result.commandLine);
        }
        else
        {
            outcome.status = BuildStatus::Ok;
        }
        return outcome;
    }

    void BuildOrchestrator::runTargets(BuildReport &report)
    {
        std::vector<std::size_t> pending;
        for (std::size_t i = 0; i < manifest_.targets.size(); ++i)
        {
            if (manifest_.targets[i].build.has_value())
            {
                pending.push_back(i);
            }
        }
        if (pending.empty())
        {
            return;
        }

        const std::size_t workers = resolveWorkerCount(options_.jobs, pending.size());
        ctx_.log("Per-target builds: ", pending.size(), " on ", workers, " worker(s)");

        // Every slot belongs to exactly one worker, so the report needs no lock.
        std::atomic<std::size_t> next{0};
        auto work = [&]()
        {
            for (;;)
            {
                const std::size_t claimed = next.fetch_add(1);
                if (claimed >= pending.size())
                {
                    return;
                }

                const std::size_t index = pending[claimed];
                const auto &target = manifest_.targets[index];
                StepOutcome &slot = report.targets[index].step;
                if (cancel_.load())
                {
                    slot.status = BuildStatus::Cancelled;
                    continue;
                }

                slot = runStep(target.build.value(), target.triple);
                if (slot.status == BuildStatus::Failed)
                {
                    cancel();
                }
            }
        };

        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i)
        {
            threads.emplace_back(work);
        }
        for (auto &thread : threads)
        {
            thread.join();
        }
    }

    BuildReport BuildOrchestrator::run()
    {
        BuildReport report;
        report.targets.reserve(manifest_.targets.size());
        for (const auto &target : manifest_.targets)
        {
            TargetBuildStatus status;
            status.triple = target.triple;
            report.targets.push_back(status);
        }

        if (manifest_.build.has_value())
        {
            report.globalRan = true;
            report.global = runStep(manifest_.build.value(), manifest_.name.empty() ? "(global)" : manifest_.name);
            if (report.global.status != BuildStatus::Ok)
            {
                // One driver builds every target, so its failure is every target's failure.
                for (auto &target : report.targets)
                {
                    target.step = report.global;
                }
                return report;
            }
        }

        runTargets(report);
        return report;
    }

} // namespace relpack::pipeline
