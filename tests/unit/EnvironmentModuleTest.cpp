#include <gtest/gtest.h>

#include "modules/EnvironmentModule.hpp"
#include "support/Fakes.hpp"

using Preflight::Core::FailureKind;
using Preflight::Core::NoticeBus;
using Preflight::Core::RunContext;
using Preflight::Modules::EnvironmentModule;
using PreflightTest::FakeEnvironment;
using PreflightTest::FakeFileSystem;
using PreflightTest::FakeProvisioner;
using PreflightTest::NoticeCollector;

namespace
{
class EnvironmentModuleTest : public ::testing::Test
{
protected:
    NoticeBus bus;
    NoticeCollector collector{bus};
    FakeFileSystem fs;
    FakeEnvironment env;
    FakeProvisioner provisioner{fs};
    EnvironmentModule module{bus, fs, env, provisioner};
    RunContext ctx;

    void SetUp() override
    {
        ctx.workingDirectory = "/work";
        env.vars["PATH"] = "/usr/bin:/bin";
        env.vars["PYTHONHOME"] = "/opt/python";
    }

    void addEnvironment(const std::string& name)
    {
        fs.addDirectory("/work/" + name);
        fs.addDirectory("/work/" + name + "/bin");
    }
};

TEST_F(EnvironmentModuleTest, ci_mode_skips_everything)
{
    ctx.isCI = true;
    addEnvironment("venv");

    EXPECT_TRUE(module.acquire(ctx).ok());
    EXPECT_FALSE(module.active().has_value());
    EXPECT_TRUE(provisioner.calls.empty());
    EXPECT_EQ(env.vars.count("VIRTUAL_ENV"), 0u);
    EXPECT_EQ(env.vars["PATH"], "/usr/bin:/bin");
    EXPECT_TRUE(collector.contains("CI detected; using runner Python (no venv)"));
}

TEST_F(EnvironmentModuleTest, existing_primary_is_activated)
{
    addEnvironment("venv");

    EXPECT_TRUE(module.acquire(ctx).ok());
    ASSERT_TRUE(module.active().has_value());
    EXPECT_EQ(module.active()->name, "venv");
    EXPECT_FALSE(module.active()->created);
    EXPECT_TRUE(provisioner.calls.empty());
    EXPECT_EQ(env.vars["VIRTUAL_ENV"], "/work/venv");
    EXPECT_EQ(env.vars["PATH"], "/work/venv/bin:/usr/bin:/bin");
    EXPECT_EQ(env.vars.count("PYTHONHOME"), 0u);
}

TEST_F(EnvironmentModuleTest, existing_secondary_is_activated)
{
    addEnvironment(".venv");

    EXPECT_TRUE(module.acquire(ctx).ok());
    ASSERT_TRUE(module.active().has_value());
    EXPECT_EQ(module.active()->name, ".venv");
    EXPECT_TRUE(provisioner.calls.empty());
    EXPECT_EQ(env.vars["VIRTUAL_ENV"], "/work/.venv");
}

TEST_F(EnvironmentModuleTest, primary_wins_when_both_exist)
{
    addEnvironment("venv");
    addEnvironment(".venv");

    EXPECT_TRUE(module.acquire(ctx).ok());
    EXPECT_EQ(module.active()->name, "venv");
}

TEST_F(EnvironmentModuleTest, creates_secondary_when_none_exist)
{
    EXPECT_TRUE(module.acquire(ctx).ok());
    ASSERT_EQ(provisioner.calls.size(), 1u);
    EXPECT_EQ(provisioner.calls[0].string(), "/work/.venv");
    ASSERT_TRUE(module.active().has_value());
    EXPECT_TRUE(module.active()->created);
    EXPECT_EQ(env.vars["VIRTUAL_ENV"], "/work/.venv");
    EXPECT_FALSE(fs.hasDirectory("/work/venv"));
}

TEST_F(EnvironmentModuleTest, primary_name_occupied_by_file_is_ignored)
{
    fs.addFile("/work/venv");

    EXPECT_TRUE(module.acquire(ctx).ok());
    EXPECT_EQ(module.active()->name, ".venv");
    EXPECT_EQ(provisioner.calls.size(), 1u);
}

TEST_F(EnvironmentModuleTest, uninspectable_candidate_is_fatal)
{
    fs.failQueryOf("/work/venv");

    auto result = module.acquire(ctx);
    EXPECT_EQ(result.failure, FailureKind::Provisioning);
    EXPECT_TRUE(provisioner.calls.empty());
    EXPECT_FALSE(module.active().has_value());
}

TEST_F(EnvironmentModuleTest, provisioning_failure_is_fatal)
{
    provisioner.fail = true;

    auto result = module.acquire(ctx);
    EXPECT_EQ(result.failure, FailureKind::Provisioning);
    EXPECT_FALSE(module.active().has_value());
    EXPECT_EQ(env.vars.count("VIRTUAL_ENV"), 0u);
}

TEST_F(EnvironmentModuleTest, provisioner_success_without_directory_is_fatal)
{
    provisioner.createRoot = false;

    auto result = module.acquire(ctx);
    EXPECT_EQ(result.failure, FailureKind::Provisioning);
    EXPECT_FALSE(module.active().has_value());
}

TEST_F(EnvironmentModuleTest, environment_without_bin_cannot_be_activated)
{
    fs.addDirectory("/work/venv");

    auto result = module.acquire(ctx);
    EXPECT_EQ(result.failure, FailureKind::Activation);
    EXPECT_EQ(result.path, "/work/venv/bin");
    EXPECT_FALSE(module.active().has_value());
}

TEST_F(EnvironmentModuleTest, rejected_environment_write_is_fatal)
{
    addEnvironment("venv");
    env.rejectWrites = true;

    EXPECT_EQ(module.acquire(ctx).failure, FailureKind::Activation);
}

TEST_F(EnvironmentModuleTest, reactivation_does_not_duplicate_path)
{
    addEnvironment(".venv");

    ASSERT_TRUE(module.acquire(ctx).ok());
    ASSERT_TRUE(module.acquire(ctx).ok());

    EXPECT_EQ(env.vars["PATH"], "/work/.venv/bin:/usr/bin:/bin");
    EXPECT_TRUE(provisioner.calls.empty());
}

TEST_F(EnvironmentModuleTest, previously_active_environment_is_replaced)
{
    addEnvironment("venv");
    env.vars["VIRTUAL_ENV"] = "/elsewhere/env";
    env.vars["PATH"] = "/elsewhere/env/bin:/usr/bin:/bin";

    ASSERT_TRUE(module.acquire(ctx).ok());
    EXPECT_EQ(env.vars["VIRTUAL_ENV"], "/work/venv");
    EXPECT_EQ(env.vars["PATH"], "/work/venv/bin:/usr/bin:/bin");
}

TEST_F(EnvironmentModuleTest, empty_path_gets_only_bin_dir)
{
    addEnvironment("venv");
    env.vars.erase("PATH");

    ASSERT_TRUE(module.acquire(ctx).ok());
    EXPECT_EQ(env.vars["PATH"], "/work/venv/bin");
}

TEST_F(EnvironmentModuleTest, dry_run_creates_and_activates_nothing)
{
    ctx.dryRun = true;

    EXPECT_TRUE(module.acquire(ctx).ok());
    EXPECT_TRUE(provisioner.calls.empty());
    EXPECT_EQ(env.vars.count("VIRTUAL_ENV"), 0u);
    EXPECT_EQ(env.vars["PATH"], "/usr/bin:/bin");
    ASSERT_TRUE(module.active().has_value());
    EXPECT_EQ(module.active()->name, ".venv");
    EXPECT_TRUE(collector.contains("[DRY-RUN] Would create virtualenv .venv"));
}
} // namespace
