#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace relpack::commands {

int runPackageCommand(
    const relpack::Context &ctx,
    const std::filesystem::path &cwd,
    const std::vector<std::string> &args
);

} // namespace relpack::commands
