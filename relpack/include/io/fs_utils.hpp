#pragma once

#include <filesystem>
#include <string>

#include "core/context.hpp"

namespace relpack::io {

bool ensureDir(const std::filesystem::path &path);
bool removePath(const std::filesystem::path &path, bool dryRun, const relpack::Context &ctx);

bool readBinaryFile(const std::filesystem::path &path, std::string &out, std::string &error);

// Sibling path an archive is staged at before it is published.
std::filesystem::path partialPathFor(const std::filesystem::path &output);
bool publishFile(const std::filesystem::path &staged, const std::filesystem::path &target, std::string &error);

} // namespace relpack::io
