#pragma once

#include <string>
#include <filesystem>
#include <utility>

namespace platform {

// User home directory: $HOME, the passwd entry, else the temp dir.
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Text for an errno value.
std::string errno_text(int err);

// Deletes the file on destruction unless commit() was called.
class PartialFile {
public:
    explicit PartialFile(std::filesystem::path path) : path_(std::move(path)) {}
    ~PartialFile();

    PartialFile(const PartialFile&) = delete;
    PartialFile& operator=(const PartialFile&) = delete;

    void commit() { committed_ = true; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    bool committed_ = false;
};

} // namespace platform
