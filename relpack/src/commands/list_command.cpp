#include "commands/list_command.hpp"

#include <string>

#include "io/process.hpp"
#include "model/loader.hpp"

namespace fs = std::filesystem;

namespace relpack::commands
{
    namespace
    {

        std::string describeBuild(const std::optional<model::BuildStep> &step)
        {
            if (!step.has_value())
            {
                return "-";
            }
            std::string text = io::displayCommand(step->command, step->args);
            if (step->timeout > 0)
            {
                text += "  (timeout " + std::to_string(step->timeout) + "s)";
            }
            return text;
        }

    } // namespace

    int runListCommand(const relpack::Context &ctx, const fs::path &cwd, const std::vector<std::string> &args)
    {
        std::string manifestHint;
        for (size_t i = 0; i < args.size(); ++i)
        {
            if (args[i] == "--manifest" && i + 1 < args.size())
            {
                manifestHint = args[++i];
                continue;
            }
            ctx.error("Unknown list option: ", args[i]);
            return 1;
        }

        auto manifest = model::loadManifestFile(model::resolveManifestFile(cwd, manifestHint), ctx);
        if (!manifest.has_value())
        {
            return 1;
        }

        ctx.log("Package: ", manifest->name);
        ctx.log("  root:    ", manifest->root.string());
        ctx.log("  output:  ", manifest->output.string());
        ctx.log("  format:  ", manifest->compression == model::Compression::Store ? "store" : "deflate",
                " level ", manifest->level);
        ctx.log("  build:   ", describeBuild(manifest->build));

        ctx.log("Targets:");
        for (const auto &target : manifest->targets)
        {
            ctx.log("  ", target.triple, "  ", model::archiveEntryName(target), "  <- ", target.artifactPath.string());
            if (target.build.has_value())
            {
                ctx.log("      build: ", describeBuild(target.build));
            }
        }
        if (!model::hasTargetBuilds(manifest.value()) && !manifest->build.has_value())
        {
            ctx.log("No build steps; package expects prebuilt artifacts");
        }
        return 0;
    }

} // namespace relpack::commands
