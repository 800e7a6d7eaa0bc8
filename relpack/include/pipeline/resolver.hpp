#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/context.hpp"
#include "model/manifest.hpp"

namespace relpack::pipeline {

enum class ArtifactState {
    Present,
    Missing,
    Empty,
};

const char *artifactStateName(ArtifactState state);

struct ResolvedArtifact {
    std::string triple;
    std::filesystem::path path;
    ArtifactState state = ArtifactState::Missing;
    std::uintmax_t size = 0;
    std::string detail;
};

struct ResolveReport {
    // Manifest order.
    std::vector<ResolvedArtifact> artifacts;

    bool ok() const;
    std::vector<ResolvedArtifact> problems() const;
};

ResolvedArtifact resolveArtifact(const model::TargetSpec &target);
ResolveReport resolveArtifacts(const relpack::Context &ctx, const model::BuildManifest &manifest);

} // namespace relpack::pipeline
