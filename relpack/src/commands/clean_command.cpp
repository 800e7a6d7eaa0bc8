#include "commands/clean_command.hpp"

#include <system_error>

#include "io/fs_utils.hpp"
#include "model/loader.hpp"

namespace fs = std::filesystem;

namespace relpack::commands
{
    namespace
    {

        struct CleanOptions
        {
            std::string manifestFile;
            std::string output;
            bool dryRun = false;
        };

        bool parseOptions(const std::vector<std::string> &args, CleanOptions &opt, const relpack::Context &ctx)
        {
            for (size_t i = 0; i < args.size(); ++i)
            {
                const std::string &arg = args[i];
                if (arg == "--dry-run")
                {
                    opt.dryRun = true;
                    continue;
                }
                if (arg == "--manifest" || arg == "--out")
                {
                    if (i + 1 >= args.size())
                    {
                        ctx.error(arg, " requires value");
                        return false;
                    }
                    (arg == "--manifest" ? opt.manifestFile : opt.output) = args[++i];
                    continue;
                }
                ctx.error("Unknown clean option: ", arg);
                return false;
            }
            return true;
        }

    } // namespace

    int runCleanCommand(const relpack::Context &ctx, const fs::path &cwd, const std::vector<std::string> &args)
    {
        CleanOptions opt;
        if (!parseOptions(args, opt, ctx))
        {
            return 1;
        }

        fs::path output;
        if (!opt.output.empty())
        {
            const fs::path raw(opt.output);
            output = raw.is_absolute() ? raw : fs::absolute(cwd / raw);
        }
        else
        {
            auto manifest = model::loadManifestFile(model::resolveManifestFile(cwd, opt.manifestFile), ctx);
            if (!manifest.has_value())
            {
                return 1;
            }
            output = manifest->output;
        }

        bool ok = true;
        int removed = 0;
        for (const fs::path &path : {output, io::partialPathFor(output)})
        {
            std::error_code ec;
            if (!fs::exists(path, ec))
            {
                continue;
            }
            if (!io::removePath(path, opt.dryRun, ctx))
            {
                ok = false;
                continue;
            }
            ++removed;
        }

        if (removed == 0 && ok)
        {
            ctx.log("Nothing to clean at ", output.string());
        }
        return ok ? 0 : 1;
    }

} // namespace relpack::commands
