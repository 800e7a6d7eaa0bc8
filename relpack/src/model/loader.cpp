#include "model/loader.hpp"

#include <cstdint>
#include <limits>
#include <set>
#include <stdexcept>

#include "io/json_reader.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace relpack::model
{

    namespace
    {

        fs::path toAbsolute(const fs::path &base, const std::string &value)
        {
            fs::path path(value);
            if (path.is_absolute())
            {
                return path.lexically_normal();
            }
            return fs::absolute(base / path).lexically_normal();
        }

        std::string readString(const json &node, const char *key, const std::string &where)
        {
            if (!node.contains(key))
            {
                return "";
            }
            if (!node[key].is_string())
            {
                throw std::runtime_error(where + ": \"" + key + "\" must be a string");
            }
            return node[key].get<std::string>();
        }

        int readInt(const json &node, const char *key, int fallback, const std::string &where)
        {
            if (!node.contains(key))
            {
                return fallback;
            }
            if (!node[key].is_number_integer())
            {
                throw std::runtime_error(where + ": \"" + key + "\" must be an integer");
            }
            const json &value = node[key];
            const bool inRange = value.is_number_unsigned()
                                     ? value.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                                     : value.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                                           value.get<std::int64_t>() <= std::numeric_limits<int>::max();
            if (!inRange)
            {
                throw std::runtime_error(where + ": \"" + key + "\" is out of range: " + value.dump());
            }
            return static_cast<int>(value.get<std::int64_t>());
        }

        std::optional<BuildStep> parseBuildStep(const json &node, const fs::path &root, const std::string &where)
        {
            if (node.is_null())
            {
                return std::nullopt;
            }
            if (!node.is_object())
            {
                throw std::runtime_error(where + ": \"Build\" must be an object");
            }

            BuildStep step;
            step.command = readString(node, "Command", where);
            if (step.command.empty())
            {
                throw std::runtime_error(where + ": \"Build\" needs a \"Command\"");
            }
            if (node.contains("Args"))
            {
                step.args = io::readArgList(node["Args"]);
            }

            const std::string cwd = readString(node, "Cwd", where);
            step.cwd = cwd.empty() ? root : toAbsolute(root, cwd);
            step.timeout = readInt(node, "Timeout", 0, where);
            return step;
        }

        Compression parseCompression(const std::string &value, const std::string &where)
        {
            if (value.empty() || value == "deflate")
            {
                return Compression::Deflate;
            }
            if (value == "store")
            {
                return Compression::Store;
            }
            throw std::runtime_error(where + ": unknown \"Compression\" " + value + " (use deflate|store)");
        }

        // Every component must name something; ".", ".." and empty ones do not.
        bool hasBadComponent(const std::string &name)
        {
            std::size_t start = 0;
            for (;;)
            {
                const std::size_t end = name.find('/', start);
                const std::string part = name.substr(start, end == std::string::npos ? std::string::npos : end - start);
                if (part.empty() || part == "." || part == "..")
                {
                    return true;
                }
                if (end == std::string::npos)
                {
                    return false;
                }
                start = end + 1;
            }
        }

    } // namespace

    fs::path resolveManifestFile(const fs::path &cwd, const std::string &explicitFile)
    {
        if (explicitFile.empty())
        {
            return fs::absolute(cwd / kDefaultManifestName);
        }

        fs::path raw(explicitFile);
        if (raw.is_absolute())
        {
            return raw;
        }
        return fs::absolute(cwd / raw);
    }

    bool isValidTriple(const std::string &triple)
    {
        if (triple.empty() || triple == "." || triple == "..")
        {
            return false;
        }
        return triple.find_first_of("/\\") == std::string::npos;
    }

    bool isValidArchiveName(const std::string &name)
    {
        if (name.empty() || name.find('\\') != std::string::npos)
        {
            return false;
        }
        if (fs::path(name).is_absolute())
        {
            return false;
        }
        return !hasBadComponent(name);
    }

    std::optional<BuildManifest> loadManifestFile(const fs::path &manifestFile, const relpack::Context &ctx)
    {
        BuildManifest manifest;
        try
        {
            json data = io::loadJsonFile(manifestFile);
            const std::string where = "manifest";

            manifest.filePath = fs::absolute(manifestFile);
            const fs::path base = manifest.filePath.parent_path();

            const std::string root = readString(data, "Root", where);
            manifest.root = root.empty() ? base : toAbsolute(base, root);
            manifest.name = readString(data, "Name", where);
            if (manifest.name.empty())
            {
                manifest.name = manifest.root.filename().string();
            }

            const std::string output = readString(data, "Output", where);
            manifest.output = toAbsolute(manifest.root, output.empty() ? kDefaultOutputName : output);

            manifest.compression = parseCompression(readString(data, "Compression", where), where);
            manifest.level = readInt(data, "Level", manifest.level, where);
            manifest.jobs = readInt(data, "Jobs", manifest.jobs, where);

            if (data.contains("Build"))
            {
                manifest.build = parseBuildStep(data["Build"], manifest.root, where);
            }

            if (!data.contains("Targets") || !data["Targets"].is_array())
            {
                throw std::runtime_error(where + ": \"Targets\" must be an array");
            }

            std::size_t index = 0;
            for (const auto &node : data["Targets"])
            {
                const std::string at = "Targets[" + std::to_string(index++) + "]";
                if (!node.is_object())
                {
                    throw std::runtime_error(at + ": target must be an object");
                }

                TargetSpec target;
                target.triple = readString(node, "Triple", at);

                const std::string artifact = readString(node, "Artifact", at);
                if (artifact.empty())
                {
                    throw std::runtime_error(at + ": \"Artifact\" is required");
                }
                target.artifactPath = toAbsolute(manifest.root, artifact);

                target.archiveName = readString(node, "ArchiveName", at);
                if (target.archiveName.empty())
                {
                    target.archiveName = target.artifactPath.filename().string();
                }

                if (node.contains("Build"))
                {
                    target.build = parseBuildStep(node["Build"], manifest.root, at);
                }
                manifest.targets.push_back(std::move(target));
            }
        }
        catch (const std::exception &e)
        {
            ctx.error("Failed parse manifest ", manifest.filePath.empty() ? manifestFile.string() : manifest.filePath.string(), " : ", e.what());
            return std::nullopt;
        }

        const auto problems = validateManifest(manifest);
        if (!problems.empty())
        {
            for (const auto &problem : problems)
            {
                ctx.error(manifestFile.string(), ": ", problem);
            }
            return std::nullopt;
        }
        return manifest;
    }

    std::vector<std::string> validateManifest(const BuildManifest &manifest)
    {
        std::vector<std::string> problems;
        if (manifest.targets.empty())
        {
            problems.push_back("manifest declares no targets");
        }

        std::set<std::string> seen;
        for (const auto &target : manifest.targets)
        {
            if (!isValidTriple(target.triple))
            {
                problems.push_back("invalid target triple \"" + target.triple + "\"");
            }
            else if (!seen.insert(target.triple).second)
            {
                problems.push_back("duplicate target triple \"" + target.triple + "\"");
            }

            if (target.artifactPath.empty())
            {
                problems.push_back("target " + target.triple + " has no artifact path");
            }
            if (!isValidArchiveName(target.archiveName))
            {
                problems.push_back("target " + target.triple + " has invalid archive name \"" + target.archiveName + "\"");
            }
            if (target.build.has_value() && target.build->timeout < 0)
            {
                problems.push_back("target " + target.triple + " has a negative build timeout");
            }
        }

        if (manifest.build.has_value() && manifest.build->timeout < 0)
        {
            problems.push_back("global build has a negative timeout");
        }
        if (manifest.level < 0 || manifest.level > 10)
        {
            problems.push_back("compression level " + std::to_string(manifest.level) + " is outside 0-10");
        }
        if (manifest.jobs < 0)
        {
            problems.push_back("jobs must not be negative");
        }
        if (manifest.output.empty())
        {
            problems.push_back("manifest has no output path");
        }
        return problems;
    }

} // namespace relpack::model
