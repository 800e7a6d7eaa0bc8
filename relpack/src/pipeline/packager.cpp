#include "pipeline/packager.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <system_error>

#include "io/fs_utils.hpp"
#include "io/zip_archive.hpp"

namespace fs = std::filesystem;

namespace relpack::pipeline
{
    namespace
    {

        struct ExpectedEntry
        {
            std::string name;
            std::uint64_t size = 0;
            std::uint32_t crc32 = 0;
        };

        bool checkWrittenEntries(
            const fs::path &archive,
            const std::vector<ExpectedEntry> &expected,
            std::string &error)
        {
            std::vector<io::ZipEntryInfo> entries;
            if (!io::listZipEntries(archive, entries, error))
            {
                return false;
            }
            if (entries.size() != expected.size())
            {
                error = "archive holds " + std::to_string(entries.size()) + " entries, expected " + std::to_string(expected.size());
                return false;
            }
            for (std::size_t i = 0; i < entries.size(); ++i)
            {
                if (entries[i].name != expected[i].name)
                {
                    error = "entry " + std::to_string(i) + " is " + entries[i].name + ", expected " + expected[i].name;
                    return false;
                }
                if (entries[i].size != expected[i].size || entries[i].crc32 != expected[i].crc32)
                {
                    error = "entry " + entries[i].name + " does not match its source";
                    return false;
                }
            }
            return true;
        }

    } // namespace

    std::time_t entryTimeFromEnvironment()
    {
        const char *value = std::getenv("SOURCE_DATE_EPOCH");
        if (value == nullptr || *value == '\0')
        {
            return kDefaultEntryTime;
        }

        try
        {
            std::size_t used = 0;
            const long long parsed = std::stoll(value, &used);
            if (used != std::char_traits<char>::length(value) || parsed < kDefaultEntryTime)
            {
                return kDefaultEntryTime;
            }
            return static_cast<std::time_t>(parsed);
        }
        catch (const std::logic_error &)
        {
            return kDefaultEntryTime;
        }
    }

    PackageOptions packageOptionsFor(const model::BuildManifest &manifest)
    {
        PackageOptions options;
        options.output = manifest.output;
        options.level = manifest.compression == model::Compression::Store ? 0 : manifest.level;
        options.entryTime = entryTimeFromEnvironment();
        return options;
    }

    PackageOutcome writeArchive(
        const relpack::Context &ctx,
        const model::BuildManifest &manifest,
        const PackageOptions &options)
    {
        PackageOutcome outcome;
        const fs::path staged = io::partialPathFor(options.output);

        if (!io::ensureDir(options.output.parent_path()))
        {
            outcome.error = "cannot create directory " + options.output.parent_path().string();
            return outcome;
        }

        std::error_code ec;
        fs::remove(staged, ec);

        io::ZipWriter writer;
        auto discard = [&]()
        {
            writer.close();
            std::error_code removeError;
            fs::remove(staged, removeError);
            if (removeError)
            {
                ctx.warn("Could not remove partial archive ", staged.string(), " : ", removeError.message());
            }
        };

        if (!writer.open(staged, outcome.error))
        {
            discard();
            return outcome;
        }

        std::vector<ExpectedEntry> expected;
        expected.reserve(manifest.targets.size());
        for (const auto &target : manifest.targets)
        {
            ExpectedEntry entry;
            entry.name = model::archiveEntryName(target);

            std::string data;
            std::string error;
            if (!io::readBinaryFile(target.artifactPath, data, error) ||
                !writer.addEntry(entry.name, data, options.level, options.entryTime, error))
            {
                outcome.failedTriple = target.triple;
                outcome.error = error;
                discard();
                return outcome;
            }

            entry.size = data.size();
            entry.crc32 = io::crc32Of(data);
            expected.push_back(entry);
            ctx.log("  + ", entry.name, " (", entry.size, " bytes)");
        }

        if (!writer.finalize(outcome.error) || !checkWrittenEntries(staged, expected, outcome.error))
        {
            discard();
            return outcome;
        }

        if (!io::publishFile(staged, options.output, outcome.error))
        {
            discard();
            return outcome;
        }

        outcome.ok = true;
        outcome.archivePath = options.output;
        for (const auto &entry : expected)
        {
            outcome.entries.push_back(entry.name);
        }
        return outcome;
    }

    bool verifyArchive(
        const model::BuildManifest &manifest,
        const fs::path &archive,
        std::vector<std::string> &mismatches)
    {
        std::vector<io::ZipEntryInfo> entries;
        std::string error;
        if (!io::listZipEntries(archive, entries, error))
        {
            mismatches.push_back(error);
            return false;
        }

        const std::size_t count = std::min(entries.size(), manifest.targets.size());
        for (std::size_t i = 0; i < count; ++i)
        {
            const auto &target = manifest.targets[i];
            const std::string name = model::archiveEntryName(target);
            if (entries[i].name != name)
            {
                mismatches.push_back("entry " + std::to_string(i) + " is " + entries[i].name + ", expected " + name);
                continue;
            }

            std::string source;
            if (!io::readBinaryFile(target.artifactPath, source, error))
            {
                mismatches.push_back(target.triple + ": " + error);
                continue;
            }

            std::string packed;
            if (!io::readZipEntry(archive, name, packed, error))
            {
                mismatches.push_back(target.triple + ": " + error);
                continue;
            }
            if (packed != source)
            {
                mismatches.push_back(target.triple + ": " + name + " differs from " + target.artifactPath.string());
            }
        }

        for (std::size_t i = count; i < entries.size(); ++i)
        {
            mismatches.push_back("unexpected entry " + entries[i].name);
        }
        for (std::size_t i = count; i < manifest.targets.size(); ++i)
        {
            mismatches.push_back("missing entry " + model::archiveEntryName(manifest.targets[i]));
        }
        return mismatches.empty();
    }

} // namespace relpack::pipeline
