#pragma once

#include <string>

// Presence of the sentinel file is the only state; its content is informational.
class FirstRunMarker {
public:
    explicit FirstRunMarker(const std::string& path) : path_(path) {}

    bool exists() const;
    bool mark();

    const std::string& getPath() const { return path_; }
    std::string getLastError() const { return lastError_; }

private:
    std::string path_;
    std::string lastError_;
};
