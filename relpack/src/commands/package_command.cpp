#include "commands/package_command.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include "model/loader.hpp"
#include "pipeline/pipeline.hpp"

namespace fs = std::filesystem;

namespace relpack::commands
{
    namespace
    {

        struct PackageCommandOptions
        {
            std::string manifestFile;
            std::string output;
            pipeline::PipelineOptions pipeline;
        };

        bool parseNumber(const std::string &flag, const std::string &text, int low, int high, int &out, const relpack::Context &ctx)
        {
            try
            {
                std::size_t used = 0;
                const int value = std::stoi(text, &used);
                if (used != text.size() || value < low || value > high)
                {
                    ctx.error("Invalid ", flag, ": ", text, " (expected ", low, "-", high, ")");
                    return false;
                }
                out = value;
                return true;
            }
            catch (const std::logic_error &)
            {
                ctx.error("Invalid ", flag, " value: ", text);
                return false;
            }
        }

        bool parseOptions(const std::vector<std::string> &args, PackageCommandOptions &opt, const relpack::Context &ctx)
        {
            for (size_t i = 0; i < args.size(); ++i)
            {
                const std::string &arg = args[i];
                if (arg == "--skip-build")
                {
                    opt.pipeline.skipBuild = true;
                    continue;
                }
                if (arg == "--dry-run")
                {
                    opt.pipeline.dryRun = true;
                    continue;
                }
                if (arg == "--store")
                {
                    opt.pipeline.store = true;
                    continue;
                }

                const bool takesValue = arg == "--manifest" || arg == "--out" || arg == "--jobs" ||
                                        arg == "--timeout" || arg == "--level";
                if (!takesValue)
                {
                    ctx.error("Unknown package option: ", arg);
                    return false;
                }
                if (i + 1 >= args.size())
                {
                    ctx.error(arg, " requires value");
                    return false;
                }

                const std::string &value = args[++i];
                if (arg == "--manifest")
                {
                    opt.manifestFile = value;
                }
                else if (arg == "--out")
                {
                    opt.output = value;
                }
                else if (arg == "--jobs")
                {
                    if (!parseNumber(arg, value, 0, 64, opt.pipeline.jobs, ctx))
                    {
                        return false;
                    }
                }
                else if (arg == "--level")
                {
                    if (!parseNumber(arg, value, 0, 10, opt.pipeline.level, ctx))
                    {
                        return false;
                    }
                }
                else
                {
                    int seconds = 0;
                    if (!parseNumber(arg, value, 0, 24 * 60 * 60, seconds, ctx))
                    {
                        return false;
                    }
                    opt.pipeline.timeout = std::chrono::seconds(seconds);
                }
            }
            return true;
        }

    } // namespace

    int runPackageCommand(const relpack::Context &ctx, const fs::path &cwd, const std::vector<std::string> &args)
    {
        PackageCommandOptions opt;
        if (!parseOptions(args, opt, ctx))
        {
            return 1;
        }

        const fs::path manifestFile = model::resolveManifestFile(cwd, opt.manifestFile);
        auto manifest = model::loadManifestFile(manifestFile, ctx);
        if (!manifest.has_value())
        {
            return 1;
        }
        if (!opt.output.empty())
        {
            const fs::path out(opt.output);
            opt.pipeline.output = out.is_absolute() ? out : fs::absolute(cwd / out);
        }

        ctx.log("Manifest: ", manifest->filePath.string());
        ctx.log("Package: ", manifest->name, " (", manifest->targets.size(), " targets)");

        pipeline::Pipeline run(ctx, std::move(manifest.value()), opt.pipeline);
        run.onStage([&ctx](pipeline::Stage stage)
                    { ctx.log("[", pipeline::stageName(stage), "]"); });

        const pipeline::PackagingResult result = run.run();
        pipeline::reportResult(ctx, result);
        return pipeline::exitCodeFor(result);
    }

} // namespace relpack::commands
