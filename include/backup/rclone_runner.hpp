#pragma once

#include <string>
#include <vector>
#include <optional>

// Receives events from one rclone invocation. Called on the thread that
// runs the output loop, not necessarily the thread that started the run.
class RunObserver {
public:
    virtual ~RunObserver() = default;

    virtual void onProgress(double percent, const std::string& statusLine) = 0;
    virtual void onLogLine(const std::string& line) = 0;
};

// Runs `rclone copy` for one source/destination pair and turns its merged
// stdout/stderr into progress and log events. Holds no shared state.
class RcloneRunner {
public:
    explicit RcloneRunner(const std::string& executable = "rclone");

    // Never throws. Returns the process exit code, 127 when the executable
    // cannot be found, 1 on any other local failure.
    int runCopy(const std::string& source,
                const std::string& destination,
                const std::vector<std::string>& extraArgs,
                RunObserver* observer) const;

    bool checkInstalled(std::string& version) const;
    std::vector<std::string> listRemotes() const;

    const std::string& getExecutable() const { return executable_; }

    static std::string quoteArgument(const std::string& arg);
    static std::string buildCommandString(const std::vector<std::string>& argv);
    static std::optional<double> extractPercent(const std::string& line);
    static std::optional<std::string> extractTransferringFile(const std::string& line);
    static std::string sanitizeUtf8(const std::string& bytes);

private:
    int captureOutput(const std::vector<std::string>& argv, std::vector<std::string>& lines) const;

    std::string executable_;
};
