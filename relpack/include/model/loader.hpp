#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "model/manifest.hpp"

namespace relpack::model {

constexpr const char *kDefaultManifestName = "relpack.json";
constexpr const char *kDefaultOutputName = "build.zip";

std::filesystem::path resolveManifestFile(const std::filesystem::path &cwd, const std::string &explicitFile);

std::optional<BuildManifest> loadManifestFile(const std::filesystem::path &manifestFile, const relpack::Context &ctx);

// Returns one message per problem; empty means the manifest can be packaged.
std::vector<std::string> validateManifest(const BuildManifest &manifest);

bool isValidTriple(const std::string &triple);
bool isValidArchiveName(const std::string &name);

} // namespace relpack::model
