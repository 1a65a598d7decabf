#include <gtest/gtest.h>
#include "exec_harness/capabilities.h"
#include "exec_harness/policy.h"
#include "exec_harness/supervisor.h"

#include <unistd.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

using namespace exec_harness;
namespace fs = std::filesystem;

TEST(CapabilityTableTest, DefaultsDisableEverything) {
    auto table = CapabilityTable::defaults();
    EXPECT_FALSE(table.entries().empty());
    EXPECT_EQ(table.disabled().size(), table.entries().size());

    for (const char* name : {"os.remove", "os.kill", "subprocess.Popen", "shutil.rmtree",
                             "builtins.exit", "os.getcwd", "os.chdir", "module:psutil"}) {
        EXPECT_FALSE(table.is_enabled(name)) << name;
    }
}

TEST(CapabilityTableTest, SetEnabledByName) {
    auto table = CapabilityTable::defaults();
    size_t before = table.disabled().size();

    table.set_enabled("os.getcwd", true);
    EXPECT_TRUE(table.is_enabled("os.getcwd"));
    EXPECT_EQ(table.disabled().size(), before - 1);

    auto disabled = table.disabled();
    EXPECT_EQ(std::find(disabled.begin(), disabled.end(), "os.getcwd"), disabled.end());

    table.set_enabled("os.getcwd", false);
    EXPECT_EQ(table.disabled().size(), before);
}

TEST(CapabilityTableTest, UnknownNameThrows) {
    auto table = CapabilityTable::defaults();
    EXPECT_THROW(table.set_enabled("os.listdir", false), std::invalid_argument);
    EXPECT_THROW(table.is_enabled("nope"), std::invalid_argument);
}

// The restrictions are permanent, so their effect is observed through a
// worker process.
class CapabilityEnforcementTest : public ::testing::Test {
protected:
    void SetUp() override {
        scratch = fs::temp_directory_path() / ("exec_harness_caps_" + std::to_string(getpid()));
        fs::create_directories(scratch);
        policy.timeout_seconds = 10.0;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(scratch, ec);
    }

    ExecutionResult run(const std::string& program) {
        return Supervisor::execute(program, policy);
    }

    void expect_not_callable(const ExecutionResult& r, int line) {
        EXPECT_EQ(r.outcome, Outcome::Failed) << r.message();
        EXPECT_EQ(r.error_kind, "TypeError") << r.message();
        EXPECT_EQ(r.line_number, line);
        EXPECT_NE(r.detail.find("not callable"), std::string::npos) << r.detail;
    }

    fs::path scratch;
    ExecutionPolicy policy;
};

TEST_F(CapabilityEnforcementTest, FileRemovalIsBlocked) {
    fs::path victim = scratch / "victim.txt";
    std::ofstream(victim) << "keep me";

    auto r = run("import os\nos.remove(" + ("'" + victim.string() + "'") + ")\n");
    expect_not_callable(r, 2);
    EXPECT_TRUE(fs::exists(victim));
}

TEST_F(CapabilityEnforcementTest, TreeRemovalAndRenameAreBlocked) {
    fs::path tree = scratch / "tree";
    fs::create_directories(tree / "sub");

    auto r = run("import shutil\nshutil.rmtree('" + tree.string() + "')\n");
    expect_not_callable(r, 2);
    EXPECT_TRUE(fs::exists(tree / "sub"));

    r = run("import os\nos.rename('" + tree.string() + "', '" + (scratch / "moved").string() + "')\n");
    expect_not_callable(r, 2);
    EXPECT_TRUE(fs::exists(tree));
}

TEST_F(CapabilityEnforcementTest, PermissionChangesAreBlocked) {
    fs::path target = scratch / "mode.txt";
    std::ofstream(target) << "x";
    auto perms_before = fs::status(target).permissions();

    auto r = run("import os\nos.chmod('" + target.string() + "', 0)\n");
    expect_not_callable(r, 2);
    EXPECT_EQ(fs::status(target).permissions(), perms_before);
}

TEST_F(CapabilityEnforcementTest, SubprocessesAreBlocked) {
    expect_not_callable(run("import subprocess\nsubprocess.run(['true'])\n"), 2);
    expect_not_callable(run("import os\nos.system('true')\n"), 2);
    expect_not_callable(run("import os\nos.fork()\n"), 2);
}

TEST_F(CapabilityEnforcementTest, ProcessControlIsBlocked) {
    expect_not_callable(run("exit(0)\n"), 1);
    expect_not_callable(run("quit()\n"), 1);
    expect_not_callable(run("import os\nos.kill(os.getppid(), 9)\n"), 2);
}

TEST_F(CapabilityEnforcementTest, WorkingDirectoryIsHidden) {
    expect_not_callable(run("import os\nos.getcwd()\n"), 2);
    expect_not_callable(run("import os\nos.chdir('/')\n"), 2);
}

TEST_F(CapabilityEnforcementTest, EnvironmentWritesAreBlocked) {
    expect_not_callable(run("import os\nos.putenv('X', '1')\n"), 2);
}

TEST_F(CapabilityEnforcementTest, DebugModulesAreUnimportable) {
    auto r = run("import resource\n");
    EXPECT_EQ(r.outcome, Outcome::Failed);
    EXPECT_EQ(r.error_kind, "ModuleNotFoundError");
    EXPECT_EQ(r.line_number, 1);
}

TEST_F(CapabilityEnforcementTest, NumericThreadsAreLimited) {
    auto r = run("import os\nassert os.environ['OMP_NUM_THREADS'] == '1'\n");
    EXPECT_EQ(r.outcome, Outcome::Passed) << r.message();

    policy.numeric_threads = 3;
    r = run("import os\nassert os.environ['OMP_NUM_THREADS'] == '3'\n");
    EXPECT_EQ(r.outcome, Outcome::Passed) << r.message();
}

TEST_F(CapabilityEnforcementTest, ReenabledCapabilityWorks) {
    policy.capabilities.set_enabled("os.getcwd", true);
    auto r = run("import os\nassert os.getcwd()\n");
    EXPECT_EQ(r.outcome, Outcome::Passed) << r.message();
}
