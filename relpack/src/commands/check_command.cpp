#include "commands/check_command.hpp"

#include "model/loader.hpp"
#include "pipeline/resolver.hpp"

namespace fs = std::filesystem;

namespace relpack::commands
{

    int runCheckCommand(const relpack::Context &ctx, const fs::path &cwd, const std::vector<std::string> &args)
    {
        std::string manifestHint;
        for (size_t i = 0; i < args.size(); ++i)
        {
            if (args[i] == "--manifest" && i + 1 < args.size())
            {
                manifestHint = args[++i];
                continue;
            }
            ctx.error("Unknown check option: ", args[i]);
            return 1;
        }

        auto manifest = model::loadManifestFile(model::resolveManifestFile(cwd, manifestHint), ctx);
        if (!manifest.has_value())
        {
            return 1;
        }

        ctx.log("Artifacts for ", manifest->name, ":");
        const pipeline::ResolveReport report = pipeline::resolveArtifacts(ctx, manifest.value());
        if (!report.ok())
        {
            for (const auto &artifact : report.problems())
            {
                ctx.error(artifact.triple, ": ", pipeline::artifactStateName(artifact.state), " artifact (", artifact.detail, ")");
            }
            ctx.error(report.problems().size(), " of ", report.artifacts.size(), " artifact(s) not ready");
            return 3;
        }
        ctx.log("All ", report.artifacts.size(), " artifact(s) present");
        return 0;
    }

} // namespace relpack::commands
