#pragma once

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

// Unique scratch directory under the system temp dir
inline std::filesystem::path makeTempDir(const std::string& prefix) {
    std::random_device rd;
    std::filesystem::path dir = std::filesystem::temp_directory_path() /
        (prefix + "-" + std::to_string(rd()) + std::to_string(rd()));
    std::filesystem::create_directories(dir);
    return dir;
}

// Writes an executable /bin/sh script standing in for rclone
inline std::string writeScript(const std::filesystem::path& dir,
                               const std::string& name,
                               const std::string& body) {
    std::filesystem::path path = dir / name;
    {
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body;
    }
    std::filesystem::permissions(path,
        std::filesystem::perms::owner_all |
        std::filesystem::perms::group_read | std::filesystem::perms::group_exec |
        std::filesystem::perms::others_read | std::filesystem::perms::others_exec);
    return path.string();
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}
