#include "pipeline/resolver.hpp"

#include <system_error>

namespace fs = std::filesystem;

namespace relpack::pipeline
{

    const char *artifactStateName(ArtifactState state)
    {
        switch (state)
        {
        case ArtifactState::Present:
            return "present";
        case ArtifactState::Missing:
            return "missing";
        case ArtifactState::Empty:
            return "empty";
        }
        return "unknown";
    }

    bool ResolveReport::ok() const
    {
        for (const auto &artifact : artifacts)
        {
            if (artifact.state != ArtifactState::Present)
            {
                return false;
            }
        }
        return !artifacts.empty();
    }

    std::vector<ResolvedArtifact> ResolveReport::problems() const
    {
        std::vector<ResolvedArtifact> out;
        for (const auto &artifact : artifacts)
        {
            if (artifact.state != ArtifactState::Present)
            {
                out.push_back(artifact);
            }
        }
        return out;
    }

    ResolvedArtifact resolveArtifact(const model::TargetSpec &target)
    {
        ResolvedArtifact out;
        out.triple = target.triple;
        out.path = target.artifactPath;

        std::error_code ec;
        const fs::file_status status = fs::status(target.artifactPath, ec);
        if (ec || !fs::exists(status))
        {
            out.state = ArtifactState::Missing;
            out.detail = "not found: " + target.artifactPath.string();
            return out;
        }
        if (!fs::is_regular_file(status))
        {
            out.state = ArtifactState::Missing;
            out.detail = "not a regular file: " + target.artifactPath.string();
            return out;
        }

        out.size = fs::file_size(target.artifactPath, ec);
        if (ec)
        {
            out.state = ArtifactState::Missing;
            out.detail = "cannot read size of " + target.artifactPath.string() + ": " + ec.message();
            return out;
        }
        if (out.size == 0)
        {
            out.state = ArtifactState::Empty;
            out.detail = "zero-length file: " + target.artifactPath.string();
            return out;
        }

        out.state = ArtifactState::Present;
        return out;
    }

    ResolveReport resolveArtifacts(const relpack::Context &ctx, const model::BuildManifest &manifest)
    {
        ResolveReport report;
        report.artifacts.reserve(manifest.targets.size());
        for (const auto &target : manifest.targets)
        {
            ResolvedArtifact artifact = resolveArtifact(target);
            if (artifact.state == ArtifactState::Present)
            {
                ctx.log("  ", artifact.triple, "  ", artifact.size, " bytes  ", artifact.path.string());
            }
            else
            {
                // Callers decide how a problem is reported.
                ctx.log("  ", artifact.triple, "  ", artifactStateName(artifact.state), "  ", artifact.path.string());
            }
            report.artifacts.push_back(std::move(artifact));
        }
        return report;
    }

} // namespace relpack::pipeline
