#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>

#include "commands/check_command.hpp"
#include "commands/clean_command.hpp"
#include "commands/init_command.hpp"
#include "commands/list_command.hpp"
#include "commands/package_command.hpp"
#include "commands/verify_command.hpp"
#include "core/context.hpp"

namespace fs = std::filesystem;

namespace
{

    constexpr const char *kAppName = "relpack";
    constexpr const char *kVersion = "1.0.0";

    void printHelp()
    {
        std::cout << kAppName << " " << kVersion << "\n"
                  << "Build native libraries for several target triples and package them into one zip.\n"
                  << "\n"
                  << "Usage:\n"
                  << "  " << kAppName << " package [--manifest FILE] [--out FILE] [--jobs N] [--timeout SEC]\n"
                  << "                  [--store] [--level N] [--skip-build] [--dry-run]\n"
                  << "  " << kAppName << " check   [--manifest FILE]\n"
                  << "  " << kAppName << " verify  [--manifest FILE] [--archive FILE]\n"
                  << "  " << kAppName << " list    [--manifest FILE]\n"
                  << "  " << kAppName << " clean   [--manifest FILE] [--out FILE] [--dry-run]\n"
                  << "  " << kAppName << " init    [--manifest FILE] [--name NAME] [--force]\n"
                  << "  " << kAppName << " help | version\n"
                  << "\n"
                  << "Global options:\n"
                  << "  --quiet, -q   only print warnings and errors\n"
                  << "\n"
                  << "Exit codes: 0 ok, 1 usage or manifest error, 2 build failed,\n"
                  << "            3 validation failed, 4 package failed or verify mismatch\n"
                  << "\n"
                  << "Examples:\n"
                  << "  " << kAppName << " init --name sasa\n"
                  << "  " << kAppName << " package --jobs 4 --timeout 1800\n"
                  << "  " << kAppName << " package --skip-build --store --out dist/sasa.zip\n"
                  << "  " << kAppName << " verify --archive dist/sasa.zip\n";
    }

    std::vector<std::string> collectArgs(int argc, char **argv, int startIndex, bool &quiet)
    {
        std::vector<std::string> out;
        for (int i = startIndex; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--quiet" || arg == "-q")
            {
                quiet = true;
                continue;
            }
            out.push_back(arg);
        }
        return out;
    }

} // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        printHelp();
        return 1;
    }

    const std::string command = argv[1];
    if (command == "help" || command == "--help" || command == "-h")
    {
        printHelp();
        return 0;
    }
    if (command == "version" || command == "--version" || command == "-v")
    {
        std::cout << kAppName << " " << kVersion << '\n';
        return 0;
    }

    bool quiet = false;
    const std::vector<std::string> args = collectArgs(argc, argv, 2, quiet);
    const relpack::Context ctx(!quiet);

    std::error_code ec;
    const fs::path cwd = fs::current_path(ec);
    if (ec)
    {
        ctx.error("Cannot read current directory: ", ec.message());
        return 1;
    }

    if (command == "package")
    {
        return relpack::commands::runPackageCommand(ctx, cwd, args);
    }
    if (command == "check")
    {
        return relpack::commands::runCheckCommand(ctx, cwd, args);
    }
    if (command == "verify")
    {
        return relpack::commands::runVerifyCommand(ctx, cwd, args);
    }
    if (command == "list")
    {
        return relpack::commands::runListCommand(ctx, cwd, args);
    }
    if (command == "clean")
    {
        return relpack::commands::runCleanCommand(ctx, cwd, args);
    }
    if (command == "init")
    {
        return relpack::commands::runInitCommand(ctx, cwd, args);
    }

    std::cerr << "Unknown command: " << command << '\n';
    printHelp();
    return 1;
}
