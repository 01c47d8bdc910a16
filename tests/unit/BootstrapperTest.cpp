#include <gtest/gtest.h>

#include "Bootstrapper.hpp"
#include "support/Fakes.hpp"

using Preflight::BootstrapState;
using Preflight::Bootstrapper;
using Preflight::Core::FailureKind;
using Preflight::Core::NoticeBus;
using Preflight::Core::RunContext;
using Preflight::Core::Severity;
using PreflightTest::FakeEnvironment;
using PreflightTest::FakeFileSystem;
using PreflightTest::FakeProvisioner;
using PreflightTest::NoticeCollector;

namespace
{
class BootstrapperTest : public ::testing::Test
{
protected:
    NoticeBus bus;
    NoticeCollector collector{bus};
    FakeFileSystem fs;
    FakeEnvironment env;
    FakeProvisioner provisioner{fs};
    Bootstrapper bootstrapper{bus, fs, env, provisioner};
    RunContext ctx;

    void SetUp() override
    {
        ctx.workingDirectory = "/work";
        env.vars["PATH"] = "/usr/bin:/bin";
    }
};

TEST_F(BootstrapperTest, local_run_walks_every_state)
{
    auto outcome = bootstrapper.run(ctx);

    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.exitCode(), 0);
    const std::vector<BootstrapState> expected = {
        BootstrapState::Start, BootstrapState::AnomalyChecked, BootstrapState::EnvironmentDetected,
        BootstrapState::EnvironmentReady, BootstrapState::InputValidated, BootstrapState::Done};
    EXPECT_EQ(outcome.transitions, expected);
    ASSERT_TRUE(outcome.environment.has_value());
    EXPECT_EQ(outcome.environment->name, ".venv");
}

TEST_F(BootstrapperTest, every_step_announces_itself)
{
    ASSERT_TRUE(bootstrapper.run(ctx).ok());

    EXPECT_TRUE(collector.contains("Reserved path check"));
    EXPECT_TRUE(collector.contains("Environment: local workstation"));
    EXPECT_TRUE(collector.contains("Isolated environment"));
    EXPECT_TRUE(collector.contains("Sanity checks"));
    EXPECT_EQ(collector.count(Severity::Step), 4u);
}

TEST_F(BootstrapperTest, ci_run_announces_runner)
{
    ctx.isCI = true;
    ASSERT_TRUE(bootstrapper.run(ctx).ok());
    EXPECT_TRUE(collector.contains("Environment: CI runner"));
}

TEST_F(BootstrapperTest, ci_run_skips_environment)
{
    ctx.isCI = true;
    auto outcome = bootstrapper.run(ctx);

    ASSERT_TRUE(outcome.ok());
    const std::vector<BootstrapState> expected = {
        BootstrapState::Start, BootstrapState::AnomalyChecked, BootstrapState::EnvironmentDetected,
        BootstrapState::EnvironmentSkipped, BootstrapState::InputValidated, BootstrapState::Done};
    EXPECT_EQ(outcome.transitions, expected);
    EXPECT_FALSE(outcome.environment.has_value());
    EXPECT_TRUE(provisioner.calls.empty());
}

TEST_F(BootstrapperTest, anomaly_failure_aborts_before_environment)
{
    fs.addFile("/work/.venv");
    fs.failRemovalOf("/work/.venv");

    auto outcome = bootstrapper.run(ctx);

    EXPECT_EQ(outcome.finalState, BootstrapState::Failed);
    EXPECT_EQ(outcome.result.failure, FailureKind::AnomalyRemoval);
    EXPECT_EQ(outcome.exitCode(), 4);
    EXPECT_TRUE(provisioner.calls.empty());
    EXPECT_FALSE(collector.contains("Sanity checks"));
}

TEST_F(BootstrapperTest, uninspectable_reserved_path_fails_ci_run)
{
    ctx.isCI = true;
    fs.failQueryOf("/work/.venv");

    auto outcome = bootstrapper.run(ctx);

    EXPECT_EQ(outcome.finalState, BootstrapState::Failed) << Preflight::toString(outcome.finalState);
    EXPECT_EQ(outcome.exitCode(), 4);
    EXPECT_EQ(collector.count(Severity::Error), 1u);
}

TEST_F(BootstrapperTest, provisioning_failure_aborts_before_input_check)
{
    provisioner.fail = true;
    ctx.inputArchivePath = "missing.zip";

    auto outcome = bootstrapper.run(ctx);

    EXPECT_EQ(outcome.finalState, BootstrapState::Failed);
    EXPECT_EQ(outcome.result.failure, FailureKind::Provisioning);
    EXPECT_EQ(outcome.exitCode(), 5);
    EXPECT_FALSE(collector.contains("Zip not found"));
}

TEST_F(BootstrapperTest, missing_input_reports_one_error)
{
    ctx.inputArchivePath = "missing.zip";

    auto outcome = bootstrapper.run(ctx);

    EXPECT_EQ(outcome.finalState, BootstrapState::Failed);
    EXPECT_EQ(outcome.result.failure, FailureKind::MissingInput);
    EXPECT_EQ(outcome.exitCode(), 3);
    EXPECT_EQ(collector.count(Severity::Error), 1u);
    EXPECT_TRUE(collector.contains("Zip not found: missing.zip"));
    EXPECT_TRUE(collector.contains("Stopped after state EnvironmentReady (missing_input)"));
    EXPECT_EQ(outcome.transitions.back(), BootstrapState::Failed);
}

TEST_F(BootstrapperTest, successful_run_reports_no_errors)
{
    fs.addFile("/work/input.zip");
    ctx.inputArchivePath = "input.zip";

    auto outcome = bootstrapper.run(ctx);

    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(collector.count(Severity::Error), 0u);
}
} // namespace
