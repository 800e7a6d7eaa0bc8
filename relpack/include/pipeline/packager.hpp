#pragma once

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "model/manifest.hpp"

namespace relpack::pipeline {

// 1980-01-02 00:00:00 UTC; the day after the zip epoch stays valid in every timezone.
constexpr std::time_t kDefaultEntryTime = 315619200;

struct PackageOptions {
    std::filesystem::path output;
    // 0-10, 0 stores entries.
    int level = 6;
    std::time_t entryTime = kDefaultEntryTime;
};

struct PackageOutcome {
    bool ok = false;
    std::filesystem::path archivePath;
    std::vector<std::string> entries;
    // Triple being written when the failure happened, empty for archive-level errors.
    std::string failedTriple;
    std::string error;
};

// Reads SOURCE_DATE_EPOCH when set and valid.
std::time_t entryTimeFromEnvironment();

PackageOptions packageOptionsFor(const model::BuildManifest &manifest);

PackageOutcome writeArchive(
    const relpack::Context &ctx,
    const model::BuildManifest &manifest,
    const PackageOptions &options
);

// Compares an archive with the manifest artifacts entry by entry.
bool verifyArchive(
    const model::BuildManifest &manifest,
    const std::filesystem::path &archive,
    std::vector<std::string> &mismatches
);

} // namespace relpack::pipeline
