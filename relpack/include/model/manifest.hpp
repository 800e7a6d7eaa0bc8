#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace relpack::model {

struct BuildStep {
    std::string command;
    std::vector<std::string> args;
    std::filesystem::path cwd;
    // Seconds, 0 = use the run default.
    int timeout = 0;
};

struct TargetSpec {
    std::string triple;
    std::filesystem::path artifactPath;
    std::string archiveName;
    std::optional<BuildStep> build;
};

enum class Compression {
    Deflate,
    Store,
};

struct BuildManifest {
    std::string name;
    std::filesystem::path root;
    std::filesystem::path filePath;
    std::filesystem::path output;

    std::optional<BuildStep> build;
    std::vector<TargetSpec> targets;

    Compression compression = Compression::Deflate;
    int level = 6;
    int jobs = 0;
};

inline std::string archiveEntryName(const TargetSpec &target)
{
    return target.triple + "/" + target.archiveName;
}

inline bool hasTargetBuilds(const BuildManifest &manifest)
{
    for (const auto &target : manifest.targets)
    {
        if (target.build.has_value())
        {
            return true;
        }
    }
    return false;
}

} // namespace relpack::model
