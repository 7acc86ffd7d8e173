#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace clipstash::testing {

/**
 * @brief Unique temporary directory, removed with its contents on destruction
 */
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "clipstash_test") {
        static int counter = 0;
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                 "_" + std::to_string(++counter));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    [[nodiscard]] std::filesystem::path operator/(const std::string& name) const {
        return path_ / name;
    }

private:
    std::filesystem::path path_;
};

} // namespace clipstash::testing
