#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

#include "core/context.hpp"
#include "model/loader.hpp"

namespace fs = std::filesystem;

namespace
{

    relpack::Context makeContext()
    {
        return relpack::Context(false);
    }

    fs::path makeTempRoot(const std::string &name)
    {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        return fs::temp_directory_path() / ("relpack_manifest_test_" + name + "_" + std::to_string(now));
    }

    void cleanupTemp(const fs::path &root)
    {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    fs::path writeManifest(const fs::path &root, const std::string &content)
    {
        fs::create_directories(root);
        const fs::path file = root / relpack::model::kDefaultManifestName;
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << content;
        return file;
    }

    relpack::model::BuildManifest validManifest()
    {
        relpack::model::BuildManifest manifest;
        manifest.name = "sasa";
        manifest.output = "/tmp/out.zip";
        relpack::model::TargetSpec target;
        target.triple = "x86_64-pc-windows-gnu";
        target.artifactPath = "/tmp/sasa.dll";
        target.archiveName = "sasa.dll";
        manifest.targets.push_back(target);
        return manifest;
    }

} // namespace

TEST(ManifestPaths, ResolveManifestFileDefaultsToCwd)
{
    const fs::path cwd = "/tmp/relpack_cwd";
    EXPECT_EQ(relpack::model::resolveManifestFile(cwd, ""), fs::absolute(cwd / "relpack.json"));
    EXPECT_EQ(relpack::model::resolveManifestFile(cwd, "ci/release.json"), fs::absolute(cwd / "ci" / "release.json"));
}

TEST(ManifestPaths, ResolveManifestFileKeepsAbsolutePath)
{
    const fs::path file = fs::temp_directory_path() / "elsewhere.json";
    EXPECT_EQ(relpack::model::resolveManifestFile("/tmp/relpack_cwd", file.string()), file);
}

TEST(ManifestLoader, AppliesDefaults)
{
    const fs::path root = makeTempRoot("defaults");
    cleanupTemp(root);
    const fs::path file = writeManifest(root, R"({
        "Name": "sasa",
        "Targets": [
            { "Triple": "aarch64-linux-android", "Artifact": "target/aarch64-linux-android/release/libsasa.so" }
        ]
    })");

    auto manifest = relpack::model::loadManifestFile(file, makeContext());
    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ(manifest->name, "sasa");
    EXPECT_EQ(manifest->root, fs::absolute(root));
    EXPECT_EQ(manifest->output, (fs::absolute(root) / "build.zip").lexically_normal());
    EXPECT_EQ(manifest->compression, relpack::model::Compression::Deflate);
    EXPECT_EQ(manifest->level, 6);
    EXPECT_EQ(manifest->jobs, 0);
    EXPECT_FALSE(manifest->build.has_value());

    ASSERT_EQ(manifest->targets.size(), 1u);
    const auto &target = manifest->targets.front();
    EXPECT_EQ(target.archiveName, "libsasa.so");
    EXPECT_EQ(target.artifactPath,
              (fs::absolute(root) / "target" / "aarch64-linux-android" / "release" / "libsasa.so").lexically_normal());
    EXPECT_EQ(relpack::model::archiveEntryName(target), "aarch64-linux-android/libsasa.so");

    cleanupTemp(root);
}

TEST(ManifestLoader, ReadsBuildStepsAndArgStrings)
{
    const fs::path root = makeTempRoot("build");
    cleanupTemp(root);
    const fs::path file = writeManifest(root, R"({
        "Name": "sasa",
        "Output": "dist/sasa.zip",
        "Compression": "store",
        "Jobs": 3,
        "Build": { "Command": "powershell", "Args": "./build.ps1 -Release", "Cwd": "scripts", "Timeout": 900 },
        "Targets": [
            { "Triple": "x86_64-pc-windows-gnu", "Artifact": "a/sasa.dll", "ArchiveName": "bin/sasa.dll",
              "Build": { "Command": "cargo", "Args": ["build", "--release"] } }
        ]
    })");

    auto manifest = relpack::model::loadManifestFile(file, makeContext());
    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ(manifest->compression, relpack::model::Compression::Store);
    EXPECT_EQ(manifest->jobs, 3);
    EXPECT_EQ(manifest->output, (fs::absolute(root) / "dist" / "sasa.zip").lexically_normal());

    ASSERT_TRUE(manifest->build.has_value());
    EXPECT_EQ(manifest->build->command, "powershell");
    ASSERT_EQ(manifest->build->args.size(), 2u);
    EXPECT_EQ(manifest->build->args[1], "-Release");
    EXPECT_EQ(manifest->build->cwd, (fs::absolute(root) / "scripts").lexically_normal());
    EXPECT_EQ(manifest->build->timeout, 900);

    const auto &target = manifest->targets.front();
    ASSERT_TRUE(target.build.has_value());
    EXPECT_EQ(target.build->cwd, fs::absolute(root));
    EXPECT_EQ(relpack::model::archiveEntryName(target), "x86_64-pc-windows-gnu/bin/sasa.dll");

    cleanupTemp(root);
}

TEST(ManifestLoader, RejectsDuplicateTriples)
{
    const fs::path root = makeTempRoot("dup");
    cleanupTemp(root);
    const fs::path file = writeManifest(root, R"({
        "Targets": [
            { "Triple": "x86", "Artifact": "a.bin" },
            { "Triple": "x86", "Artifact": "b.bin" }
        ]
    })");

    EXPECT_FALSE(relpack::model::loadManifestFile(file, makeContext()).has_value());
    cleanupTemp(root);
}

TEST(ManifestLoader, RejectsEscapingArchiveName)
{
    const fs::path root = makeTempRoot("escape");
    cleanupTemp(root);
    const fs::path file = writeManifest(root, R"({
        "Targets": [ { "Triple": "x86", "Artifact": "a.bin", "ArchiveName": "../a.bin" } ]
    })");

    EXPECT_FALSE(relpack::model::loadManifestFile(file, makeContext()).has_value());
    cleanupTemp(root);
}

TEST(ManifestLoader, RejectsMalformedInput)
{
    const fs::path root = makeTempRoot("malformed");
    cleanupTemp(root);
    auto ctx = makeContext();

    EXPECT_FALSE(relpack::model::loadManifestFile(root / "missing.json", ctx).has_value());
    EXPECT_FALSE(relpack::model::loadManifestFile(writeManifest(root, "[1, 2]"), ctx).has_value());
    EXPECT_FALSE(relpack::model::loadManifestFile(writeManifest(root, "{ \"Targets\": "), ctx).has_value());
    EXPECT_FALSE(relpack::model::loadManifestFile(writeManifest(root, R"({ "Targets": [] })"), ctx).has_value());
    EXPECT_FALSE(relpack::model::loadManifestFile(
                     writeManifest(root, R"({ "Targets": [ { "Triple": "x86" } ] })"), ctx)
                     .has_value());
    EXPECT_FALSE(relpack::model::loadManifestFile(
                     writeManifest(root, R"({ "Compression": "bzip2", "Targets": [ { "Triple": "x86", "Artifact": "a" } ] })"), ctx)
                     .has_value());
    EXPECT_FALSE(relpack::model::loadManifestFile(
                     writeManifest(root, R"({ "Build": { "Args": ["x"] }, "Targets": [ { "Triple": "x86", "Artifact": "a" } ] })"), ctx)
                     .has_value());
    EXPECT_FALSE(relpack::model::loadManifestFile(
                     writeManifest(root, R"({ "Build": { "Command": "sh", "Args": ["-c", 3] }, "Targets": [ { "Triple": "x86", "Artifact": "a" } ] })"), ctx)
                     .has_value());

    cleanupTemp(root);
}

TEST(ManifestLoader, RejectsIntegersOutsideIntRange)
{
    const fs::path root = makeTempRoot("range");
    cleanupTemp(root);
    auto ctx = makeContext();
    const std::string target = R"("Targets": [ { "Triple": "x86", "Artifact": "a.bin" } ])";

    EXPECT_FALSE(relpack::model::loadManifestFile(
                     writeManifest(root, "{ \"Level\": 4294967302, " + target + " }"), ctx)
                     .has_value());
    EXPECT_FALSE(relpack::model::loadManifestFile(
                     writeManifest(root, "{ \"Jobs\": 4294967297, " + target + " }"), ctx)
                     .has_value());
    EXPECT_FALSE(relpack::model::loadManifestFile(
                     writeManifest(root, "{ \"Jobs\": 18446744073709551615, " + target + " }"), ctx)
                     .has_value());
    EXPECT_FALSE(relpack::model::loadManifestFile(
                     writeManifest(root, "{ \"Level\": -4294967290, " + target + " }"), ctx)
                     .has_value());
    EXPECT_FALSE(relpack::model::loadManifestFile(
                     writeManifest(root, "{ \"Build\": { \"Command\": \"sh\", \"Timeout\": 4294967297 }, " + target + " }"), ctx)
                     .has_value());

    auto manifest = relpack::model::loadManifestFile(
        writeManifest(root, "{ \"Level\": 9, \"Jobs\": 2, " + target + " }"), ctx);
    ASSERT_TRUE(manifest.has_value());
    EXPECT_EQ(manifest->level, 9);
    EXPECT_EQ(manifest->jobs, 2);

    cleanupTemp(root);
}

TEST(ManifestLoader, RejectsDotArchiveName)
{
    const fs::path root = makeTempRoot("dot");
    cleanupTemp(root);
    const fs::path file = writeManifest(root, R"({
        "Targets": [ { "Triple": "x86", "Artifact": "a.bin", "ArchiveName": "." } ]
    })");

    EXPECT_FALSE(relpack::model::loadManifestFile(file, makeContext()).has_value());
    cleanupTemp(root);
}

TEST(ManifestValidation, AcceptsMinimalManifest)
{
    EXPECT_TRUE(relpack::model::validateManifest(validManifest()).empty());
}

TEST(ManifestValidation, ReportsEveryProblem)
{
    auto manifest = validManifest();
    manifest.level = 11;
    manifest.jobs = -1;
    manifest.targets.front().archiveName = "/abs.dll";

    relpack::model::BuildStep step;
    step.command = "cargo";
    step.timeout = -5;
    manifest.build = step;

    EXPECT_EQ(relpack::model::validateManifest(manifest).size(), 4u);
}

TEST(ManifestValidation, TripleRules)
{
    EXPECT_TRUE(relpack::model::isValidTriple("armv7-linux-androideabi"));
    EXPECT_FALSE(relpack::model::isValidTriple(""));
    EXPECT_FALSE(relpack::model::isValidTriple(".."));
    EXPECT_FALSE(relpack::model::isValidTriple("x86/64"));
    EXPECT_FALSE(relpack::model::isValidTriple("x86\\64"));
}

TEST(ManifestValidation, ArchiveNameRules)
{
    EXPECT_TRUE(relpack::model::isValidArchiveName("libsasa.so"));
    EXPECT_TRUE(relpack::model::isValidArchiveName("lib/libsasa.so"));
    EXPECT_FALSE(relpack::model::isValidArchiveName(""));
    EXPECT_FALSE(relpack::model::isValidArchiveName("/libsasa.so"));
    EXPECT_FALSE(relpack::model::isValidArchiveName("lib/"));
    EXPECT_FALSE(relpack::model::isValidArchiveName("lib\\libsasa.so"));
    EXPECT_FALSE(relpack::model::isValidArchiveName("lib/../../libsasa.so"));
    EXPECT_FALSE(relpack::model::isValidArchiveName("."));
    EXPECT_FALSE(relpack::model::isValidArchiveName(".."));
    EXPECT_FALSE(relpack::model::isValidArchiveName("lib/./libsasa.so"));
    EXPECT_FALSE(relpack::model::isValidArchiveName("lib//libsasa.so"));
    EXPECT_TRUE(relpack::model::isValidArchiveName("lib/.hidden"));
}
