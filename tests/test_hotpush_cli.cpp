#include "testing.hpp"

#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <sys/wait.h>

namespace hotpush {
namespace {

std::string ShellQuote(const std::string& s) {
    std::string out = "'";
    for (const char c : s) {
        if (c == '\'') {
            out += "'\"'\"'";
        } else {
            out.push_back(c);
        }
    }
    out.push_back('\'');
    return out;
}

int ExitCodeFromSystem(int rc) {
    if (rc == -1) {
        return -1;
    }
    if (WIFEXITED(rc)) {
        return WEXITSTATUS(rc);
    }
    return -1;
}

class HotpushCliTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory tmp;
    std::filesystem::path base{tmp.Path()};

    int Run(const std::string& args, const std::string& stdout_path) const {
        const std::string cmd = "HOTPUSH_CONFIG_PATH=" + ShellQuote((base / "absent.conf").string()) +
                                " " + ShellQuote(HOTPUSH_TOOL_BIN) + " " + args + " >" +
                                ShellQuote(stdout_path) + " 2>/dev/null";
        return ExitCodeFromSystem(std::system(cmd.c_str()));
    }

    // Publishes `server` as a release: builds its manifest and writes chcp.json.
    void Publish(const std::filesystem::path& server, const std::string& release) const {
        const std::string out = (base / "publish.out").string();
        const std::string manifest = (server / "chcp.manifest").string();
        ASSERT_EQ(Run("-m " + ShellQuote(server.string()) + " -o " + ShellQuote(manifest), out), 0);
        ASSERT_TRUE(testutil::Exists(manifest));
        ASSERT_TRUE(testutil::WriteTextFile(
            (server / "chcp.json").string(),
            testutil::ConfigJson(release, "file://" + server.string(), 3)));
    }
};

TEST_F(HotpushCliTest, StagesChangedFilesFromFileUrls) {
    const auto server = base / "server";
    const auto root = base / "content";
    const auto www = root / "1" / "www";

    // Installed release 1.
    ASSERT_TRUE(testutil::WriteTextFile((server / "index.html").string(), "<html>v1</html>"));
    ASSERT_TRUE(testutil::WriteTextFile((server / "js" / "app.js").string(), "v1"));
    Publish(server, "1");
    std::filesystem::create_directories(www);
    for (const char* name : {"index.html", "chcp.json", "chcp.manifest"}) {
        std::filesystem::copy_file(server / name, www / name);
    }

    // Release 2 changes one file and adds another.
    ASSERT_TRUE(testutil::WriteTextFile((server / "js" / "app.js").string(), "v2"));
    ASSERT_TRUE(testutil::WriteTextFile((server / "img" / "logo.svg").string(), "<svg/>"));
    Publish(server, "2");

    const std::string out = (base / "run.out").string();
    const std::string args = "-u " + ShellQuote("file://" + (server / "chcp.json").string()) +
                             " -r " + ShellQuote(root.string()) + " -c 1 -n 3";
    ASSERT_EQ(Run(args, out), 0);

    const std::string printed = testutil::ReadTextFile(out);
    EXPECT_NE(printed.find("\"outcome\":\"ready_to_install\""), std::string::npos) << printed;
    EXPECT_NE(printed.find("\"release\":\"2\""), std::string::npos) << printed;

    const auto staging = root / "2" / "update";
    EXPECT_EQ(testutil::ReadTextFile((staging / "js" / "app.js").string()), "v2");
    EXPECT_EQ(testutil::ReadTextFile((staging / "img" / "logo.svg").string()), "<svg/>");
    EXPECT_FALSE(testutil::Exists((staging / "index.html").string()));
    EXPECT_TRUE(testutil::Exists((staging / "chcp.json").string()));
    EXPECT_TRUE(testutil::Exists((staging / "chcp.manifest").string()));
}

TEST_F(HotpushCliTest, NativeBuildTooLowExitsWithError) {
    const auto server = base / "server";
    const auto www = base / "content" / "1" / "www";
    ASSERT_TRUE(testutil::WriteTextFile((www / "chcp.json").string(), testutil::ConfigJson("1", "")));
    ASSERT_TRUE(testutil::WriteTextFile((www / "chcp.manifest").string(), "[]"));
    ASSERT_TRUE(testutil::WriteTextFile((server / "a.js").string(), "a"));
    Publish(server, "2");

    const std::string out = (base / "run.out").string();
    const std::string args = "-u " + ShellQuote("file://" + (server / "chcp.json").string()) +
                             " -r " + ShellQuote((base / "content").string()) + " -c 1 -n 2";
    ASSERT_EQ(Run(args, out), 1);

    const std::string printed = testutil::ReadTextFile(out);
    EXPECT_NE(printed.find("\"outcome\":\"error\""), std::string::npos) << printed;
    EXPECT_NE(printed.find("\"error_code\":-2"), std::string::npos) << printed;
    EXPECT_FALSE(testutil::Exists((base / "content" / "2").string()));
}

TEST_F(HotpushCliTest, MissingSettingsIsUsageError) {
    const std::string out = (base / "run.out").string();
    EXPECT_EQ(Run("-u file:///nowhere/chcp.json", out), 2);
    EXPECT_EQ(Run("-n not-a-number", out), 2);
}

} // namespace
} // namespace hotpush
