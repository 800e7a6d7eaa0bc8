#include "commands/verify_command.hpp"

#include <system_error>

#include "model/loader.hpp"
#include "pipeline/packager.hpp"

namespace fs = std::filesystem;

namespace relpack::commands
{

    int runVerifyCommand(const relpack::Context &ctx, const fs::path &cwd, const std::vector<std::string> &args)
    {
        std::string manifestHint;
        std::string archiveHint;
        for (size_t i = 0; i < args.size(); ++i)
        {
            const std::string &arg = args[i];
            if ((arg == "--manifest" || arg == "--archive") && i + 1 < args.size())
            {
                (arg == "--manifest" ? manifestHint : archiveHint) = args[++i];
                continue;
            }
            ctx.error("Unknown verify option: ", arg);
            return 1;
        }

        auto manifest = model::loadManifestFile(model::resolveManifestFile(cwd, manifestHint), ctx);
        if (!manifest.has_value())
        {
            return 1;
        }

        fs::path archive = manifest->output;
        if (!archiveHint.empty())
        {
            const fs::path raw(archiveHint);
            archive = raw.is_absolute() ? raw : fs::absolute(cwd / raw);
        }

        std::error_code ec;
        if (!fs::is_regular_file(archive, ec))
        {
            ctx.error("Archive not found: ", archive.string());
            return 4;
        }

        std::vector<std::string> mismatches;
        if (!pipeline::verifyArchive(manifest.value(), archive, mismatches))
        {
            for (const auto &item : mismatches)
            {
                ctx.error(item);
            }
            return 4;
        }

        ctx.log("[ok] ", archive.string(), " matches ", manifest->targets.size(), " artifact(s)");
        return 0;
    }

} // namespace relpack::commands
