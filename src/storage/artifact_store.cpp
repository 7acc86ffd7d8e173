#include "storage/artifact_store.hpp"
#include "core/utils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <format>
#include <fstream>

namespace clipstash {

namespace fs = std::filesystem;

namespace {

// Write all bytes to fd, retrying on short writes and EINTR
bool write_fully(int fd, const uint8_t* data, size_t len) {
    while (len > 0) {
        const ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

void fsync_directory(const fs::path& dir) {
    const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) return;
    ::fsync(fd);
    ::close(fd);
}

} // anonymous namespace

ArtifactStore::ArtifactStore(fs::path directory, std::string extension)
    : directory_(std::move(directory)),
      extension_(std::move(extension)) {
    directory_ = directory_.lexically_normal();
    if (!directory_.has_filename() && directory_.has_parent_path()) {
        directory_ = directory_.parent_path();  // drop trailing separator
    }
}

Status ArtifactStore::ensure_directory() const {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        return Status::error(ErrorCategory::STORAGE_IO_ERROR,
            std::format("Cannot create artifact directory {}: {}", directory_.string(), ec.message()));
    }
    return ok_status();
}

fs::path ArtifactStore::path_for(const std::string& fingerprint_hex) const {
    return directory_ / std::format("{}.{}", fingerprint_hex, extension_);
}

Result<bool> ArtifactStore::write(const std::string& fingerprint_hex,
                                  std::span<const uint8_t> bytes) const {
    const fs::path target = path_for(fingerprint_hex);

    std::error_code ec;
    if (fs::exists(target, ec)) {
        return Result<bool>::ok(false);
    }

    const fs::path tmp = directory_ / std::format(".{}.{}.tmp", fingerprint_hex, ::getpid());
    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Result<bool>::error(ErrorCategory::STORAGE_IO_ERROR,
            std::format("Cannot create {}: {}", tmp.string(), std::strerror(errno)));
    }

    int err = 0;
    if (!write_fully(fd, bytes.data(), bytes.size()) || ::fsync(fd) != 0) {
        err = errno;
    }
    ::close(fd);

    if (err != 0) {
        fs::remove(tmp, ec);
        return Result<bool>::error(ErrorCategory::STORAGE_IO_ERROR,
            std::format("Cannot write artifact {}: {}", target.string(), std::strerror(err)));
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        return Result<bool>::error(ErrorCategory::STORAGE_IO_ERROR,
            std::format("Cannot move artifact into place {}: {}", target.string(), ec.message()));
    }
    fsync_directory(directory_);

    utils::log::debug(std::format("Artifact written: {} ({} bytes)", target.string(), bytes.size()));
    return Result<bool>::ok(true);
}

Result<std::vector<uint8_t>> ArtifactStore::read(const fs::path& path) const {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) {
        return Result<std::vector<uint8_t>>::error(ErrorCategory::INTEGRITY_VIOLATION,
            std::format("Artifact missing or unreadable: {}", path.string()));
    }
    const auto size = in.tellg();
    in.seekg(0);
    std::vector<uint8_t> bytes(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char*>(bytes.data()), size)) {
        return Result<std::vector<uint8_t>>::error(ErrorCategory::STORAGE_IO_ERROR,
            std::format("Read error on artifact {}", path.string()));
    }
    return Result<std::vector<uint8_t>>::ok(std::move(bytes));
}

Status ArtifactStore::remove(const fs::path& path) const {
    if (path.empty()) return ok_status();
    if (!owns(path)) {
        return Status::error(ErrorCategory::INTEGRITY_VIOLATION,
            std::format("Refusing to delete {} outside {}", path.string(), directory_.string()));
    }
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        return Status::error(ErrorCategory::STORAGE_IO_ERROR,
            std::format("Cannot delete artifact {}: {}", path.string(), ec.message()));
    }
    return ok_status();
}

bool ArtifactStore::exists(const fs::path& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool ArtifactStore::owns(const fs::path& path) const {
    return path.lexically_normal().parent_path() == directory_ &&
           path.extension() == "." + extension_;
}

uint64_t ArtifactStore::total_bytes() const {
    uint64_t total = 0;
    std::error_code ec;
    for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().extension() == "." + extension_) {
            const auto size = it->file_size(ec);
            if (!ec) total += size;
        }
    }
    return total;
}

} // namespace clipstash
