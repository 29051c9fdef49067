#include "backup/rclone_runner.hpp"
#include "common/run_status.hpp"
#include "common/logger.hpp"
#include <regex>
#include <stdexcept>
#include <system_error>
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace {

class ExecutableNotFoundError : public std::runtime_error {
public:
    explicit ExecutableNotFoundError(const std::string& executable)
        : std::runtime_error("executable not found: " + executable) {}
};

// Owns the child pid and the read end of its merged output pipe.
class ChildProcess {
public:
    ChildProcess() = default;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    ~ChildProcess() {
        closeOutput();
        if (pid_ > 0) {
            int status = 0;
            while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
            }
        }
    }

    void spawn(const std::vector<std::string>& argv) {
        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);

        int outPipe[2];
        if (pipe2(outPipe, O_CLOEXEC) != 0) {
            throw std::system_error(errno, std::generic_category(), "pipe2");
        }
        // Carries errno from a failed execvp back to the parent
        int errPipe[2];
        if (pipe2(errPipe, O_CLOEXEC) != 0) {
            int err = errno;
            close(outPipe[0]);
            close(outPipe[1]);
            throw std::system_error(err, std::generic_category(), "pipe2");
        }

        pid_t pid = fork();
        if (pid < 0) {
            int err = errno;
            close(outPipe[0]);
            close(outPipe[1]);
            close(errPipe[0]);
            close(errPipe[1]);
            throw std::system_error(err, std::generic_category(), "fork");
        }

        if (pid == 0) {
            dup2(outPipe[1], STDOUT_FILENO);
            dup2(outPipe[1], STDERR_FILENO);
            execvp(args[0], args.data());
            int err = errno;
            ssize_t written = write(errPipe[1], &err, sizeof(err));
            (void)written;
            _exit(kExitToolNotFound);
        }

        pid_ = pid;
        outFd_ = outPipe[0];
        close(outPipe[1]);
        close(errPipe[1]);

        int childErrno = 0;
        ssize_t n;
        do {
            n = read(errPipe[0], &childErrno, sizeof(childErrno));
        } while (n < 0 && errno == EINTR);
        close(errPipe[0]);

        if (n == static_cast<ssize_t>(sizeof(childErrno))) {
            closeOutput();
            wait();
            if (childErrno == ENOENT) {
                throw ExecutableNotFoundError(argv.front());
            }
            throw std::system_error(childErrno, std::generic_category(), "exec " + argv.front());
        }
    }

    // Appends the next chunk of output. Returns false at end of stream.
    bool readChunk(std::string& out) {
        char buffer[4096];
        ssize_t n;
        do {
            n = read(outFd_, buffer, sizeof(buffer));
        } while (n < 0 && errno == EINTR);

        if (n < 0) {
            throw std::system_error(errno, std::generic_category(), "read process output");
        }
        if (n == 0) {
            return false;
        }
        out.append(buffer, static_cast<size_t>(n));
        return true;
    }

    int wait() {
        closeOutput();
        int status = 0;
        pid_t result;
        do {
            result = waitpid(pid_, &status, 0);
        } while (result < 0 && errno == EINTR);

        if (result < 0) {
            int err = errno;
            pid_ = -1;
            throw std::system_error(err, std::generic_category(), "waitpid");
        }
        pid_ = -1;

        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return -WTERMSIG(status);
        }
        return kExitLocalError;
    }

private:
    void closeOutput() {
        if (outFd_ >= 0) {
            close(outFd_);
            outFd_ = -1;
        }
    }

    pid_t pid_{-1};
    int outFd_{-1};
};

// Splits a byte stream on \n, \r and \r\n.
class LineSplitter {
public:
    std::vector<std::string> feed(const std::string& chunk) {
        std::vector<std::string> lines;
        for (char c : chunk) {
            if (skipLineFeed_) {
                skipLineFeed_ = false;
                if (c == '\n') {
                    continue;
                }
            }
            if (c == '\n' || c == '\r') {
                lines.push_back(pending_);
                pending_.clear();
                skipLineFeed_ = (c == '\r');
            } else {
                pending_.push_back(c);
            }
        }
        return lines;
    }

    std::vector<std::string> finish() {
        std::vector<std::string> lines;
        if (!pending_.empty()) {
            lines.push_back(pending_);
            pending_.clear();
        }
        return lines;
    }

private:
    std::string pending_;
    bool skipLineFeed_{false};
};

std::string formatPercent(double percent) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%.0f%%", percent);
    return buffer;
}

bool isBlank(const std::string& line) {
    return line.find_first_not_of(" \t\f\v") == std::string::npos;
}

std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n\f\v";
    auto begin = value.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(whitespace);
    return value.substr(begin, end - begin + 1);
}

void emitLog(RunObserver* observer, const std::string& line) {
    if (observer) {
        observer->onLogLine(line);
    }
}

void emitProgress(RunObserver* observer, double percent, const std::string& status) {
    if (observer) {
        observer->onProgress(percent, status);
    }
}

} // namespace

RcloneRunner::RcloneRunner(const std::string& executable)
    : executable_(executable) {
}

int RcloneRunner::runCopy(const std::string& source,
                          const std::string& destination,
                          const std::vector<std::string>& extraArgs,
                          RunObserver* observer) const {
    std::vector<std::string> argv = {executable_, "copy", source, destination, "--progress", "--stats=1s"};
    argv.insert(argv.end(), extraArgs.begin(), extraArgs.end());

    const std::string commandLine = buildCommandString(argv);
    Logger::info("Executing: " + commandLine);

    double percent = 0.0;
    try {
        emitLog(observer, "$ " + commandLine + "\n\n");

        ChildProcess child;
        child.spawn(argv);

        LineSplitter splitter;
        std::string currentFile;

        auto handleLine = [&](const std::string& raw) {
            const std::string line = sanitizeUtf8(raw);
            emitLog(observer, line + "\n");

            if (auto found = extractPercent(line)) {
                percent = *found;
            }
            if (auto file = extractTransferringFile(line)) {
                currentFile = *file;
            }

            std::string status;
            if (!currentFile.empty()) {
                status = formatPercent(percent) + " - " + currentFile;
            } else if (!isBlank(line)) {
                status = line;
            } else {
                status = formatPercent(percent);
            }
            emitProgress(observer, percent, status);
        };

        std::string chunk;
        while (child.readChunk(chunk)) {
            for (const auto& line : splitter.feed(chunk)) {
                handleLine(line);
            }
            chunk.clear();
        }
        for (const auto& line : splitter.finish()) {
            handleLine(line);
        }

        const int rc = child.wait();

        emitProgress(observer, 100.0, "Finished (exit code: " + std::to_string(rc) + ")");
        emitLog(observer, std::string("\n[") + (rc == 0 ? "SUCCESS" : "FAILED") +
                          "] Exit code: " + std::to_string(rc) + "\n");
        return rc;
    } catch (const ExecutableNotFoundError&) {
        const std::string error = "rclone not found (" + executable_ +
                                  "). Please install rclone and add it to PATH.";
        Logger::error(error);
        try {
            emitLog(observer, "ERROR: " + error + "\n");
            emitProgress(observer, 0.0, error);
        } catch (const std::exception& inner) {
            Logger::error("Run observer failed: " + std::string(inner.what()));
        }
        return kExitToolNotFound;
    } catch (const std::exception& e) {
        const std::string error = "Unexpected error: " + std::string(e.what());
        Logger::error(error + " while running: " + commandLine);
        try {
            emitLog(observer, "ERROR: " + error + "\n");
            emitProgress(observer, percent, error);
        } catch (const std::exception& inner) {
            Logger::error("Run observer failed: " + std::string(inner.what()));
        }
        return kExitLocalError;
    }
}

int RcloneRunner::captureOutput(const std::vector<std::string>& argv,
                                std::vector<std::string>& lines) const {
    ChildProcess child;
    child.spawn(argv);

    LineSplitter splitter;
    std::string chunk;
    while (child.readChunk(chunk)) {
        for (const auto& line : splitter.feed(chunk)) {
            lines.push_back(sanitizeUtf8(line));
        }
        chunk.clear();
    }
    for (const auto& line : splitter.finish()) {
        lines.push_back(sanitizeUtf8(line));
    }
    return child.wait();
}

bool RcloneRunner::checkInstalled(std::string& version) const {
    try {
        std::vector<std::string> lines;
        int rc = captureOutput({executable_, "version"}, lines);
        if (rc == 0) {
            version = lines.empty() ? std::string() : lines.front();
            return true;
        }
        version = "rclone returned error";
        return false;
    } catch (const ExecutableNotFoundError&) {
        version = "rclone not installed";
        return false;
    } catch (const std::exception& e) {
        version = e.what();
        return false;
    }
}

std::vector<std::string> RcloneRunner::listRemotes() const {
    std::vector<std::string> remotes;
    try {
        std::vector<std::string> lines;
        if (captureOutput({executable_, "listremotes"}, lines) != 0) {
            return {};
        }
        for (const auto& line : lines) {
            std::string remote = trim(line);
            if (!remote.empty()) {
                remotes.push_back(remote);
            }
        }
    } catch (const std::exception& e) {
        Logger::warning("Failed to list rclone remotes: " + std::string(e.what()));
        return {};
    }
    return remotes;
}

std::string RcloneRunner::quoteArgument(const std::string& arg) {
    if (arg.empty()) {
        return "''";
    }

    static const std::string safe =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789@%+=:,./_-";
    if (arg.find_first_not_of(safe) == std::string::npos) {
        return arg;
    }

    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\"'\"'";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

std::string RcloneRunner::buildCommandString(const std::vector<std::string>& argv) {
    std::string command;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            command += ' ';
        }
        command += quoteArgument(argv[i]);
    }
    return command;
}

std::optional<double> RcloneRunner::extractPercent(const std::string& line) {
    static const std::regex percentPattern(R"((\d{1,3})%)");
    std::smatch match;
    if (std::regex_search(line, match, percentPattern)) {
        return std::stod(match[1].str());
    }
    return std::nullopt;
}

std::optional<std::string> RcloneRunner::extractTransferringFile(const std::string& line) {
    static const std::regex transferringPattern(R"(Transferring:\s*(.+?)(?:,|$))");
    std::smatch match;
    if (std::regex_search(line, match, transferringPattern)) {
        std::string file = trim(match[1].str());
        if (!file.empty()) {
            return file;
        }
    }
    return std::nullopt;
}

std::string RcloneRunner::sanitizeUtf8(const std::string& bytes) {
    static const char replacement[] = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<unsigned char>(bytes[i]);

        size_t length = 0;
        unsigned char low = 0x80;
        unsigned char high = 0xBF;
        if (lead < 0x80) {
            length = 1;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            length = 2;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            length = 3;
            if (lead == 0xE0) {
                low = 0xA0;
            } else if (lead == 0xED) {
                high = 0x9F;
            }
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            length = 4;
            if (lead == 0xF0) {
                low = 0x90;
            } else if (lead == 0xF4) {
                high = 0x8F;
            }
        }

        if (length == 0) {
            out += replacement;
            ++i;
            continue;
        }

        bool valid = i + length <= bytes.size();
        for (size_t k = 1; valid && k < length; ++k) {
            const auto c = static_cast<unsigned char>(bytes[i + k]);
            const unsigned char min = (k == 1) ? low : 0x80;
            const unsigned char max = (k == 1) ? high : 0xBF;
            if (c < min || c > max) {
                valid = false;
            }
        }

        if (valid) {
            out.append(bytes, i, length);
            i += length;
        } else {
            out += replacement;
            ++i;
        }
    }
    return out;
}
