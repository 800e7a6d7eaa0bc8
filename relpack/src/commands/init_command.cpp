#include "commands/init_command.hpp"

#include <fstream>
#include <system_error>

#include "io/fs_utils.hpp"
#include "model/loader.hpp"
#include "nlohmann/json.hpp"

namespace fs = std::filesystem;

namespace relpack::commands
{
    namespace
    {

        struct InitOptions
        {
            std::string manifestFile;
            std::string name = "sasa";
            bool force = false;
        };

        struct StarterTarget
        {
            const char *triple;
            const char *prefix;
            const char *extension;
        };

        // Cargo's output naming per platform: no lib prefix for Windows dlls.
        constexpr StarterTarget kStarterTargets[] = {
            {"x86_64-pc-windows-gnu", "", ".dll"},
            {"i686-pc-windows-gnu", "", ".dll"},
            {"aarch64-linux-android", "lib", ".so"},
            {"armv7-linux-androideabi", "lib", ".so"},
            {"aarch64-apple-ios", "lib", ".a"},
        };

        bool parseOptions(const std::vector<std::string> &args, InitOptions &opt, const relpack::Context &ctx)
        {
            for (size_t i = 0; i < args.size(); ++i)
            {
                const std::string &arg = args[i];
                if (arg == "--force")
                {
                    opt.force = true;
                    continue;
                }
                if (arg == "--manifest" || arg == "--name")
                {
                    if (i + 1 >= args.size())
                    {
                        ctx.error(arg, " requires value");
                        return false;
                    }
                    (arg == "--manifest" ? opt.manifestFile : opt.name) = args[++i];
                    continue;
                }
                ctx.error("Unknown init option: ", arg);
                return false;
            }
            if (opt.name.empty())
            {
                ctx.error("init: --name must not be empty");
                return false;
            }
            return true;
        }

        nlohmann::ordered_json buildStarterManifest(const InitOptions &opt)
        {
            nlohmann::ordered_json targets = nlohmann::ordered_json::array();
            for (const auto &item : kStarterTargets)
            {
                const std::string triple = item.triple;
                const std::string file = std::string(item.prefix) + opt.name + item.extension;
                nlohmann::ordered_json target = {
                    {"Triple", triple},
                    {"Artifact", "target/" + triple + "/release/" + file},
                    {"ArchiveName", file},
                };
                targets.push_back(std::move(target));
            }

            return {
                {"Name", opt.name},
                {"Root", "."},
                {"Output", model::kDefaultOutputName},
                {"Compression", "deflate"},
                {"Level", 6},
                {"Jobs", 0},
                {"Build", {
                    {"Command", "powershell"},
                    {"Args", nlohmann::ordered_json::array({"./build.ps1"})},
                    {"Timeout", 0},
                }},
                {"Targets", targets},
            };
        }

        bool writeTextFile(const fs::path &file, const std::string &content, bool force, const relpack::Context &ctx)
        {
            std::error_code ec;
            if (fs::exists(file, ec) && !force)
            {
                ctx.error("File already exists: ", file.string(), " (use --force)");
                return false;
            }

            if (!io::ensureDir(file.parent_path()))
            {
                ctx.error("Failed create directory: ", file.parent_path().string());
                return false;
            }

            std::ofstream out(file, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                ctx.error("Failed write file: ", file.string());
                return false;
            }
            out << content;
            out.close();
            if (!out.good())
            {
                ctx.error("Failed flush file: ", file.string());
                return false;
            }
            return true;
        }

    } // namespace

    int runInitCommand(const relpack::Context &ctx, const fs::path &cwd, const std::vector<std::string> &args)
    {
        InitOptions opt;
        if (!parseOptions(args, opt, ctx))
        {
            return 1;
        }

        const fs::path manifestFile = model::resolveManifestFile(cwd, opt.manifestFile);
        if (!writeTextFile(manifestFile, buildStarterManifest(opt).dump(2) + "\n", opt.force, ctx))
        {
            return 1;
        }

        ctx.log("Manifest created: ", manifestFile.string());
        ctx.log("Next steps:");
        ctx.log("  relpack list");
        ctx.log("  relpack package");
        return 0;
    }

} // namespace relpack::commands
