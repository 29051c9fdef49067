#include <gtest/gtest.h>
#include "backup/rclone_runner.hpp"
#include "common/run_status.hpp"
#include "test_utils.hpp"
#include <algorithm>
#include <utility>
#include <vector>

namespace {

class RecordingObserver : public RunObserver {
public:
    void onProgress(double percent, const std::string& statusLine) override {
        progress.emplace_back(percent, statusLine);
    }

    void onLogLine(const std::string& line) override {
        logLines.push_back(line);
    }

    std::string fullLog() const {
        std::string result;
        for (const auto& line : logLines) {
            result += line;
        }
        return result;
    }

    size_t countLogLinesStartingWith(const std::string& prefix) const {
        return std::count_if(logLines.begin(), logLines.end(), [&](const std::string& line) {
            return line.rfind(prefix, 0) == 0;
        });
    }

    std::vector<std::pair<double, std::string>> progress;
    std::vector<std::string> logLines;
};

} // namespace

class RcloneRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = makeTempDir("rclone-runner-test");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(tempDir_, ec);
    }

    std::string script(const std::string& body) {
        return writeScript(tempDir_, "fake-rclone", body);
    }

    std::filesystem::path tempDir_;
};

TEST_F(RcloneRunnerTest, ReportsProgressAndLogLines) {
    RcloneRunner runner(script(
        "echo \"Transferred:   1 MiB / 10 MiB, 10%, 1 MiB/s\"\n"
        "echo \"Transferred:   5 MiB / 10 MiB, 45%, 1 MiB/s\"\n"
        "exit 0\n"));
    RecordingObserver observer;

    int rc = runner.runCopy("/data/src", "remote:dst", {"--transfers=2"}, &observer);

    EXPECT_EQ(rc, 0);
    ASSERT_EQ(observer.progress.size(), 3u);
    EXPECT_DOUBLE_EQ(observer.progress[0].first, 10.0);
    EXPECT_DOUBLE_EQ(observer.progress[1].first, 45.0);
    EXPECT_EQ(observer.progress[1].second, "Transferred:   5 MiB / 10 MiB, 45%, 1 MiB/s");
    EXPECT_DOUBLE_EQ(observer.progress[2].first, 100.0);
    EXPECT_EQ(observer.progress[2].second, "Finished (exit code: 0)");

    ASSERT_FALSE(observer.logLines.empty());
    EXPECT_EQ(observer.logLines.front().rfind("$ ", 0), 0u);
    EXPECT_NE(observer.logLines.front().find("copy /data/src remote:dst --progress --stats=1s --transfers=2"),
              std::string::npos);
    EXPECT_EQ(observer.logLines[1], "Transferred:   1 MiB / 10 MiB, 10%, 1 MiB/s\n");
    EXPECT_EQ(observer.logLines.back(), "\n[SUCCESS] Exit code: 0\n");
}

TEST_F(RcloneRunnerTest, PassesArgumentsInOrder) {
    RcloneRunner runner(script("echo \"args: $*\"\n"));
    RecordingObserver observer;

    EXPECT_EQ(runner.runCopy("/src dir", "remote:x", {"--checksum", "--dry-run"}, &observer), 0);
    EXPECT_NE(observer.fullLog().find("args: copy /src dir remote:x --progress --stats=1s --checksum --dry-run"),
              std::string::npos);
    // Command line is shell-quoted in the log
    EXPECT_NE(observer.logLines.front().find("'/src dir'"), std::string::npos);
}

TEST_F(RcloneRunnerTest, LaterPercentOverwritesEarlierOne) {
    RcloneRunner runner(script("echo 'pass 80%'\necho 'restart 20%'\necho 'no number here'\n"));
    RecordingObserver observer;

    runner.runCopy("a", "b:", {}, &observer);

    ASSERT_EQ(observer.progress.size(), 4u);
    EXPECT_DOUBLE_EQ(observer.progress[0].first, 80.0);
    EXPECT_DOUBLE_EQ(observer.progress[1].first, 20.0);
    EXPECT_DOUBLE_EQ(observer.progress[2].first, 20.0);
    EXPECT_EQ(observer.progress[2].second, "no number here");
}

TEST_F(RcloneRunnerTest, MissingExecutableReturns127) {
    RcloneRunner runner((tempDir_ / "does-not-exist" / "rclone").string());
    RecordingObserver observer;

    int rc = runner.runCopy("/src", "remote:dst", {}, &observer);

    EXPECT_EQ(rc, kExitToolNotFound);
    ASSERT_EQ(observer.progress.size(), 1u);
    EXPECT_DOUBLE_EQ(observer.progress[0].first, 0.0);
    EXPECT_NE(observer.progress[0].second.find("not found"), std::string::npos);
    EXPECT_EQ(observer.countLogLinesStartingWith("ERROR:"), 1u);
}

TEST_F(RcloneRunnerTest, NonZeroExitIsReported) {
    RcloneRunner runner(script("echo 'ERROR : directory not found' >&2\nexit 4\n"));
    RecordingObserver observer;

    int rc = runner.runCopy("/src", "remote:dst", {}, &observer);

    EXPECT_EQ(rc, 4);
    EXPECT_NE(observer.fullLog().find("ERROR : directory not found\n"), std::string::npos);
    EXPECT_EQ(observer.logLines.back(), "\n[FAILED] Exit code: 4\n");
    EXPECT_EQ(observer.progress.back().second, "Finished (exit code: 4)");
}

TEST_F(RcloneRunnerTest, UndecodableBytesAreReplaced) {
    RcloneRunner runner(script("printf '\\377abc 5%%\\n'\n"));
    RecordingObserver observer;

    EXPECT_EQ(runner.runCopy("/src", "remote:dst", {}, &observer), 0);
    EXPECT_NE(observer.fullLog().find("\xEF\xBF\xBD" "abc 5%\n"), std::string::npos);
    EXPECT_DOUBLE_EQ(observer.progress.front().first, 5.0);
}

TEST_F(RcloneRunnerTest, CarriageReturnsSeparateLines) {
    RcloneRunner runner(script("printf '10%%\\r20%%\\r\\n30%%'\n"));
    RecordingObserver observer;

    runner.runCopy("/src", "remote:dst", {}, &observer);

    ASSERT_EQ(observer.progress.size(), 4u);
    EXPECT_EQ(observer.progress[0].second, "10%");
    EXPECT_EQ(observer.progress[1].second, "20%");
    EXPECT_EQ(observer.progress[2].second, "30%");
}

TEST_F(RcloneRunnerTest, TransferringFileBecomesStatus) {
    RcloneRunner runner(script("echo 'Transferring: photos/a.jpg, 50%'\necho 'Checks: 3 / 3, 60%'\n"));
    RecordingObserver observer;

    runner.runCopy("/src", "remote:dst", {}, &observer);

    ASSERT_GE(observer.progress.size(), 2u);
    EXPECT_EQ(observer.progress[0].second, "50% - photos/a.jpg");
    EXPECT_EQ(observer.progress[1].second, "60% - photos/a.jpg");
}

TEST_F(RcloneRunnerTest, ExtractPercent) {
    EXPECT_EQ(RcloneRunner::extractPercent("Transferred: 1.2 GiB / 2 GiB, 45%, 10 MiB/s"), 45.0);
    EXPECT_EQ(RcloneRunner::extractPercent("100%"), 100.0);
    EXPECT_EQ(RcloneRunner::extractPercent("1234%"), 234.0);
    EXPECT_FALSE(RcloneRunner::extractPercent("Elapsed time: 1.0s").has_value());
    EXPECT_FALSE(RcloneRunner::extractPercent("percent sign alone %").has_value());
}

TEST_F(RcloneRunnerTest, QuoteArgument) {
    EXPECT_EQ(RcloneRunner::quoteArgument("remote:path/sub"), "remote:path/sub");
    EXPECT_EQ(RcloneRunner::quoteArgument("--retries-sleep=10s"), "--retries-sleep=10s");
    EXPECT_EQ(RcloneRunner::quoteArgument("with space"), "'with space'");
    EXPECT_EQ(RcloneRunner::quoteArgument("it's"), "'it'\"'\"'s'");
    EXPECT_EQ(RcloneRunner::quoteArgument(""), "''");
}

TEST_F(RcloneRunnerTest, SanitizeUtf8KeepsValidText) {
    const std::string text = "h\xC3\xA9llo \xE2\x9C\x93 \xF0\x9F\x98\x80";
    EXPECT_EQ(RcloneRunner::sanitizeUtf8(text), text);
    EXPECT_EQ(RcloneRunner::sanitizeUtf8("a\xC3"), "a\xEF\xBF\xBD");
    EXPECT_EQ(RcloneRunner::sanitizeUtf8("\xED\xA0\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST_F(RcloneRunnerTest, CheckInstalledReadsVersion) {
    RcloneRunner runner(script("echo 'rclone v1.66.0'\necho '- os/version: linux'\n"));
    std::string version;
    EXPECT_TRUE(runner.checkInstalled(version));
    EXPECT_EQ(version, "rclone v1.66.0");

    RcloneRunner missing((tempDir_ / "missing-rclone").string());
    EXPECT_FALSE(missing.checkInstalled(version));
    EXPECT_EQ(version, "rclone not installed");
}

TEST_F(RcloneRunnerTest, ListRemotesTrimsOutput) {
    RcloneRunner runner(script("echo 'gdrive:'\necho ''\necho '  s3: '\n"));
    EXPECT_EQ(runner.listRemotes(), (std::vector<std::string>{"gdrive:", "s3:"}));

    RcloneRunner failing(script("echo 'gdrive:'\nexit 1\n"));
    EXPECT_TRUE(failing.listRemotes().empty());
}

TEST_F(RcloneRunnerTest, WorksWithoutObserver) {
    RcloneRunner runner(script("echo '50%'\nexit 2\n"));
    EXPECT_EQ(runner.runCopy("/src", "remote:dst", {}, nullptr), 2);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
