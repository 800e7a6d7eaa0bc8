#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "core/context.hpp"
#include "io/fs_utils.hpp"
#include "io/zip_archive.hpp"
#include "pipeline/orchestrator.hpp"
#include "pipeline/pipeline.hpp"

namespace fs = std::filesystem;

using relpack::pipeline::Stage;

namespace
{

    relpack::Context makeContext()
    {
        return relpack::Context(false);
    }

    fs::path makeTempRoot(const std::string &name)
    {
        const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        return fs::temp_directory_path() / ("relpack_pipeline_test_" + name + "_" + std::to_string(now));
    }

    void cleanupTemp(const fs::path &root)
    {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void writeFile(const fs::path &file, const std::string &content)
    {
        fs::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string loadFile(const fs::path &file)
    {
        std::ifstream in(file, std::ios::binary);
        std::ostringstream out;
        out << in.rdbuf();
        return out.str();
    }

    relpack::model::BuildStep shellStep(const fs::path &cwd, const std::string &script, int timeout = 0)
    {
        relpack::model::BuildStep step;
        step.command = "sh";
        step.args = {"-c", script};
        step.cwd = cwd;
        step.timeout = timeout;
        return step;
    }

    // x86 -> a.bin, arm -> b.bin, nothing written yet.
    relpack::model::BuildManifest twoTargetManifest(const fs::path &root)
    {
        relpack::model::BuildManifest manifest;
        manifest.name = "demo";
        manifest.root = root;
        manifest.output = root / "build.zip";
        for (const auto &item : {std::make_pair("x86", "a.bin"), std::make_pair("arm", "b.bin")})
        {
            relpack::model::TargetSpec target;
            target.triple = item.first;
            target.artifactPath = root / item.second;
            target.archiveName = item.second;
            manifest.targets.push_back(target);
        }
        return manifest;
    }

    struct StageLog
    {
        std::vector<Stage> seen;

        void attach(relpack::pipeline::Pipeline &pipeline)
        {
            pipeline.onStage([this](Stage stage)
                             { seen.push_back(stage); });
        }

        bool saw(Stage stage) const
        {
            for (Stage item : seen)
            {
                if (item == stage)
                {
                    return true;
                }
            }
            return false;
        }
    };

} // namespace

TEST(PipelineStages, TransitionTable)
{
    EXPECT_TRUE(relpack::pipeline::canTransition(Stage::Start, Stage::Building));
    EXPECT_TRUE(relpack::pipeline::canTransition(Stage::Building, Stage::Validating));
    EXPECT_TRUE(relpack::pipeline::canTransition(Stage::Building, Stage::BuildFailed));
    EXPECT_TRUE(relpack::pipeline::canTransition(Stage::Validating, Stage::Packaging));
    EXPECT_TRUE(relpack::pipeline::canTransition(Stage::Validating, Stage::ValidationFailed));
    EXPECT_TRUE(relpack::pipeline::canTransition(Stage::Packaging, Stage::Done));
    EXPECT_TRUE(relpack::pipeline::canTransition(Stage::Packaging, Stage::PackageFailed));

    EXPECT_FALSE(relpack::pipeline::canTransition(Stage::Start, Stage::Packaging));
    EXPECT_FALSE(relpack::pipeline::canTransition(Stage::BuildFailed, Stage::Validating));
    EXPECT_FALSE(relpack::pipeline::canTransition(Stage::Done, Stage::Building));
    EXPECT_FALSE(relpack::pipeline::canTransition(Stage::Building, Stage::Packaging));
}

TEST(PipelineStages, TerminalStagesAndExitCodes)
{
    EXPECT_FALSE(relpack::pipeline::isTerminal(Stage::Start));
    EXPECT_FALSE(relpack::pipeline::isTerminal(Stage::Packaging));
    EXPECT_TRUE(relpack::pipeline::isTerminal(Stage::Done));
    EXPECT_TRUE(relpack::pipeline::isTerminal(Stage::BuildFailed));

    relpack::pipeline::PackagingResult result;
    result.stage = Stage::Done;
    EXPECT_EQ(relpack::pipeline::exitCodeFor(result), 0);
    result.stage = Stage::BuildFailed;
    EXPECT_EQ(relpack::pipeline::exitCodeFor(result), 2);
    result.stage = Stage::ValidationFailed;
    EXPECT_EQ(relpack::pipeline::exitCodeFor(result), 3);
    result.stage = Stage::PackageFailed;
    EXPECT_EQ(relpack::pipeline::exitCodeFor(result), 4);
    EXPECT_STREQ(relpack::pipeline::stageName(Stage::ValidationFailed), "VALIDATION_FAILED");
}

TEST(BuildOrchestrator, WorkerCountIsClamped)
{
    EXPECT_EQ(relpack::pipeline::resolveWorkerCount(4, 2), 2u);
    EXPECT_EQ(relpack::pipeline::resolveWorkerCount(64, 100), 8u);
    EXPECT_EQ(relpack::pipeline::resolveWorkerCount(3, 5), 3u);
    EXPECT_GE(relpack::pipeline::resolveWorkerCount(0, 5), 1u);
    EXPECT_EQ(relpack::pipeline::resolveWorkerCount(0, 0), 1u);
}

TEST(Pipeline, PackagesPrebuiltArtifacts)
{
    const fs::path root = makeTempRoot("prebuilt");
    cleanupTemp(root);
    writeFile(root / "a.bin", "1");
    writeFile(root / "b.bin", "22");

    const auto ctx = makeContext();
    relpack::pipeline::Pipeline pipeline(ctx, twoTargetManifest(root), {});
    StageLog log;
    log.attach(pipeline);
    const auto result = pipeline.run();

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(relpack::pipeline::exitCodeFor(result), 0);
    EXPECT_EQ(result.entries, (std::vector<std::string>{"x86/a.bin", "arm/b.bin"}));
    EXPECT_EQ(log.seen, (std::vector<Stage>{Stage::Building, Stage::Validating, Stage::Packaging, Stage::Done}));

    std::string data;
    std::string error;
    ASSERT_TRUE(relpack::io::readZipEntry(result.archivePath, "arm/b.bin", data, error)) << error;
    EXPECT_EQ(data, "22");

    cleanupTemp(root);
}

TEST(Pipeline, MissingArtifactFailsValidation)
{
    const fs::path root = makeTempRoot("missing");
    cleanupTemp(root);
    writeFile(root / "a.bin", "1");

    const auto ctx = makeContext();
    relpack::pipeline::Pipeline pipeline(ctx, twoTargetManifest(root), {});
    StageLog log;
    log.attach(pipeline);
    const auto result = pipeline.run();

    EXPECT_EQ(result.stage, Stage::ValidationFailed);
    EXPECT_EQ(relpack::pipeline::exitCodeFor(result), 3);
    EXPECT_EQ(result.failedTriples(), (std::vector<std::string>{"arm"}));
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].kind, relpack::ErrorKind::MissingArtifact);
    EXPECT_FALSE(log.saw(Stage::Packaging));
    EXPECT_FALSE(fs::exists(root / "build.zip"));
    EXPECT_FALSE(fs::exists(relpack::io::partialPathFor(root / "build.zip")));

    cleanupTemp(root);
}

TEST(Pipeline, EmptyArtifactFailsValidation)
{
    const fs::path root = makeTempRoot("empty");
    cleanupTemp(root);
    writeFile(root / "a.bin", "");
    writeFile(root / "b.bin", "22");
    writeFile(root / "build.zip", "previous");

    const auto ctx = makeContext();
    relpack::pipeline::Pipeline pipeline(ctx, twoTargetManifest(root), {});
    const auto result = pipeline.run();

    EXPECT_EQ(result.stage, Stage::ValidationFailed);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].triple, "x86");
    EXPECT_EQ(result.failures[0].kind, relpack::ErrorKind::EmptyArtifact);
    EXPECT_EQ(loadFile(root / "build.zip"), "previous");

    cleanupTemp(root);
}

TEST(Pipeline, GlobalBuildProducesArtifacts)
{
#ifdef _WIN32
    GTEST_SKIP() << "Uses sh build steps.";
#else
    const fs::path root = makeTempRoot("global_ok");
    cleanupTemp(root);
    fs::create_directories(root);

    auto manifest = twoTargetManifest(root);
    manifest.build = shellStep(root, "printf 1 > a.bin && printf 22 > b.bin");

    const auto ctx = makeContext();
    relpack::pipeline::Pipeline pipeline(ctx, manifest, {});
    const auto result = pipeline.run();

    ASSERT_TRUE(result.ok());
    std::string data;
    std::string error;
    ASSERT_TRUE(relpack::io::readZipEntry(result.archivePath, "x86/a.bin", data, error)) << error;
    EXPECT_EQ(data, "1");

    cleanupTemp(root);
#endif
}

TEST(Pipeline, GlobalBuildFailureStopsBeforeValidation)
{
#ifdef _WIN32
    GTEST_SKIP() << "Uses sh build steps.";
#else
    const fs::path root = makeTempRoot("global_fail");
    cleanupTemp(root);
    writeFile(root / "a.bin", "1");
    writeFile(root / "b.bin", "22");

    auto manifest = twoTargetManifest(root);
    manifest.build = shellStep(root, "echo compiler exploded; exit 3");

    const auto ctx = makeContext();
    relpack::pipeline::Pipeline pipeline(ctx, manifest, {});
    StageLog log;
    log.attach(pipeline);
    const auto result = pipeline.run();

    EXPECT_EQ(result.stage, Stage::BuildFailed);
    EXPECT_EQ(relpack::pipeline::exitCodeFor(result), 2);
    EXPECT_FALSE(log.saw(Stage::Validating));
    EXPECT_EQ(result.failedTriples(), (std::vector<std::string>{"x86", "arm"}));
    ASSERT_FALSE(result.failures.empty());
    EXPECT_EQ(result.failures[0].kind, relpack::ErrorKind::BuildInvocation);
    EXPECT_NE(result.failures[0].reason.find("code 3"), std::string::npos);
    EXPECT_NE(result.failures[0].diagnostics.find("compiler exploded"), std::string::npos);
    EXPECT_FALSE(fs::exists(root / "build.zip"));

    cleanupTemp(root);
#endif
}

TEST(Pipeline, FailingTargetCancelsRunningSibling)
{
#ifdef _WIN32
    GTEST_SKIP() << "Uses sh build steps.";
#else
    const fs::path root = makeTempRoot("cancel");
    cleanupTemp(root);
    fs::create_directories(root);

    auto manifest = twoTargetManifest(root);
    manifest.targets[0].build = shellStep(root, "sleep 30");
    manifest.targets[1].build = shellStep(root, "sleep 0.2; exit 1");

    relpack::pipeline::PipelineOptions options;
    options.jobs = 2;
    const auto ctx = makeContext();
    relpack::pipeline::Pipeline pipeline(ctx, manifest, options);

    const auto started = std::chrono::steady_clock::now();
    const auto result = pipeline.run();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(result.stage, Stage::BuildFailed);
    EXPECT_LT(elapsed, std::chrono::seconds(15));
    ASSERT_EQ(result.failures.size(), 2u);
    EXPECT_EQ(result.failures[0].triple, "x86");
    EXPECT_NE(result.failures[0].reason.find("cancelled"), std::string::npos);
    EXPECT_EQ(result.failures[1].triple, "arm");
    EXPECT_NE(result.failures[1].reason.find("code 1"), std::string::npos);

    cleanupTemp(root);
#endif
}

TEST(Pipeline, CancelFromAnotherThreadStopsGlobalBuild)
{
#ifdef _WIN32
    GTEST_SKIP() << "Uses sh build steps.";
#else
    const fs::path root = makeTempRoot("cancel_global");
    cleanupTemp(root);
    writeFile(root / "a.bin", "1");
    writeFile(root / "b.bin", "22");

    auto manifest = twoTargetManifest(root);
    manifest.build = shellStep(root, "sleep 30");

    const auto ctx = makeContext();
    relpack::pipeline::Pipeline pipeline(ctx, manifest, {});
    StageLog log;
    log.attach(pipeline);

    std::thread canceller([&pipeline]()
                          {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        pipeline.cancel(); });

    const auto started = std::chrono::steady_clock::now();
    const auto result = pipeline.run();
    const auto elapsed = std::chrono::steady_clock::now() - started;
    canceller.join();

    EXPECT_EQ(result.stage, Stage::BuildFailed);
    EXPECT_EQ(relpack::pipeline::exitCodeFor(result), 2);
    EXPECT_LT(elapsed, std::chrono::seconds(15));
    EXPECT_FALSE(log.saw(Stage::Validating));
    ASSERT_EQ(result.failures.size(), 2u);
    EXPECT_NE(result.failures[0].reason.find("cancelled"), std::string::npos);
    EXPECT_FALSE(fs::exists(root / "build.zip"));

    cleanupTemp(root);
#endif
}

TEST(Pipeline, StepTimeoutFailsBuild)
{
#ifdef _WIN32
    GTEST_SKIP() << "Uses sh build steps.";
#else
    const fs::path root = makeTempRoot("timeout");
    cleanupTemp(root);
    fs::create_directories(root);

    auto manifest = twoTargetManifest(root);
    manifest.targets[0].build = shellStep(root, "sleep 30", 1);

    const auto ctx = makeContext();
    relpack::pipeline::Pipeline pipeline(ctx, manifest, {});
    const auto result = pipeline.run();

    EXPECT_EQ(result.stage, Stage::BuildFailed);
    ASSERT_EQ(result.failures.size(), 1u);
    EXPECT_EQ(result.failures[0].triple, "x86");
    EXPECT_NE(result.failures[0].reason.find("timed out"), std::string::npos);

    cleanupTemp(root);
#endif
}

TEST(Pipeline, DryRunStopsAfterBuilding)
{
    const fs::path root = makeTempRoot("dry");
    cleanupTemp(root);
    fs::create_directories(root);

    auto manifest = twoTargetManifest(root);
    relpack::model::BuildStep step;
    step.command = "this_command_does_not_exist_12345";
    step.cwd = root;
    manifest.build = step;

    relpack::pipeline::PipelineOptions options;
    options.dryRun = true;
    const auto ctx = makeContext();
    relpack::pipeline::Pipeline pipeline(ctx, manifest, options);
    const auto result = pipeline.run();

    EXPECT_EQ(result.stage, Stage::Building);
    EXPECT_EQ(relpack::pipeline::exitCodeFor(result), 0);
    EXPECT_TRUE(result.failures.empty());
    EXPECT_FALSE(fs::exists(root / "build.zip"));

    cleanupTemp(root);
}

TEST(Pipeline, SkipBuildAndOverridesApply)
{
    const fs::path root = makeTempRoot("overrides");
    cleanupTemp(root);
    writeFile(root / "a.bin", std::string(2048, 'a'));
    writeFile(root / "b.bin", "22");

    auto manifest = twoTargetManifest(root);
    relpack::model::BuildStep step;
    step.command = "this_command_does_not_exist_12345";
    step.cwd = root;
    manifest.build = step;

    relpack::pipeline::PipelineOptions options;
    options.skipBuild = true;
    options.store = true;
    options.output = root / "dist" / "custom.zip";
    const auto ctx = makeContext();
    relpack::pipeline::Pipeline pipeline(ctx, manifest, options);
    const auto result = pipeline.run();

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.archivePath, root / "dist" / "custom.zip");

    std::vector<relpack::io::ZipEntryInfo> entries;
    std::string error;
    ASSERT_TRUE(relpack::io::listZipEntries(result.archivePath, entries, error)) << error;
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_FALSE(entries[0].compressed);

    cleanupTemp(root);
}

TEST(Pipeline, RunIsPerformedOnce)
{
    const fs::path root = makeTempRoot("once");
    cleanupTemp(root);
    writeFile(root / "a.bin", "1");

    const auto ctx = makeContext();
    relpack::pipeline::Pipeline pipeline(ctx, twoTargetManifest(root), {});
    StageLog log;
    log.attach(pipeline);
    const auto first = pipeline.run();
    writeFile(root / "b.bin", "22");
    const auto second = pipeline.run();

    EXPECT_EQ(first.stage, Stage::ValidationFailed);
    EXPECT_EQ(second.stage, Stage::ValidationFailed);
    EXPECT_EQ(pipeline.stage(), Stage::ValidationFailed);
    EXPECT_EQ(log.seen.size(), 3u);

    cleanupTemp(root);
}
