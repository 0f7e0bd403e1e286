#include "idscrub/fileio.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <vector>

#if defined(_WIN32) || defined(_WIN64)
#define IDSCRUB_PLATFORM_WINDOWS 1
#ifndef NOMINMAX
#define NOMINMAX
#endif
#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace idscrub {
namespace fileio {

namespace fs = std::filesystem;

namespace {

constexpr const char* kReplaceFailed = "Atomic replace failed";

// Removes the temporary file unless the rename consumed it
class TempFile {
  public:
    explicit TempFile(fs::path path) : path_(std::move(path)) {}
    ~TempFile() {
        if (armed_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const fs::path& path() const { return path_; }
    void release() { armed_ = false; }

  private:
    fs::path path_;
    bool armed_ = true;
};

std::string describe(const std::string& what, const fs::path& path, int err) {
    return std::string(kReplaceFailed) + ": " + what + " " + path.string() + ": " +
           std::strerror(err);
}

uint32_t existing_mode(const fs::path& target, uint32_t fallback) {
    std::error_code ec;
    auto status = fs::status(target, ec);
    if (ec || !fs::exists(status)) {
        return fallback;
    }
    return static_cast<uint32_t>(status.permissions() & fs::perms::mask);
}

#if defined(IDSCRUB_PLATFORM_WINDOWS)

Result<void> write_and_rename(const fs::path& target, const std::string& content,
                              const ReplaceOptions& options, uint32_t mode) {
    fs::path dir = target.has_parent_path() ? target.parent_path() : fs::path(".");
    fs::path temp_path =
        dir / ("." + target.filename().string() + ".idscrub-" + std::to_string(GetCurrentProcessId()));
    TempFile temp(temp_path);

    HANDLE handle = CreateFileW(temp_path.c_str(), GENERIC_WRITE, 0, nullptr, CREATE_ALWAYS,
                                FILE_ATTRIBUTE_NORMAL, nullptr);
    if (handle == INVALID_HANDLE_VALUE) {
        return Result<void>::error(ErrorCode::WriteFailure,
                                   std::string(kReplaceFailed) + ": cannot create " +
                                       temp_path.string());
    }

    DWORD written = 0;
    BOOL ok = content.empty() ||
              WriteFile(handle, content.data(), static_cast<DWORD>(content.size()), &written,
                        nullptr);
    ok = ok && (content.empty() || written == content.size());
    ok = ok && FlushFileBuffers(handle);
    CloseHandle(handle);
    if (!ok) {
        return Result<void>::error(ErrorCode::WriteFailure,
                                   std::string(kReplaceFailed) + ": cannot write " +
                                       temp_path.string());
    }

    std::error_code ec;
    fs::permissions(temp_path, static_cast<fs::perms>(mode), fs::perm_options::replace, ec);
    if (ec) {
        return Result<void>::error(ErrorCode::WriteFailure,
                                   std::string(kReplaceFailed) + ": cannot set attributes on " +
                                       temp_path.string());
    }

    if (options.before_rename && !options.before_rename(temp_path)) {
        return Result<void>::error(ErrorCode::WriteFailure,
                                   std::string(kReplaceFailed) + ": interrupted before rename");
    }

    if (!MoveFileExW(temp_path.c_str(), target.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DWORD err = GetLastError();
        ErrorCode code = err == ERROR_ACCESS_DENIED ? ErrorCode::PermissionDenied
                                                    : ErrorCode::WriteFailure;
        return Result<void>::error(code, std::string(kReplaceFailed) + ": cannot rename onto " +
                                             target.string());
    }
    temp.release();
    return Result<void>::ok();
}

#else

Result<void> write_all(int fd, const std::string& content, const fs::path& temp_path) {
    const char* data = content.data();
    std::size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            return Result<void>::error(error_from_errno(err), describe("write", temp_path, err));
        }
        data += n;
        remaining -= static_cast<std::size_t>(n);
    }
    return Result<void>::ok();
}

Result<void> write_and_rename(const fs::path& target, const std::string& content,
                              const ReplaceOptions& options, uint32_t mode) {
    fs::path dir = target.has_parent_path() ? target.parent_path() : fs::path(".");
    std::string pattern = (dir / ("." + target.filename().string() + ".idscrub-XXXXXX")).string();
    std::vector<char> name(pattern.begin(), pattern.end());
    name.push_back('\0');

    int fd = ::mkstemp(name.data());
    if (fd < 0) {
        int err = errno;
        return Result<void>::error(error_from_errno(err), describe("create temp in", dir, err));
    }
    TempFile temp(fs::path(name.data()));

    auto written = write_all(fd, content, temp.path());
    if (written.is_error()) {
        ::close(fd);
        return written;
    }

    if (::fchmod(fd, static_cast<mode_t>(mode)) != 0) {
        int err = errno;
        ::close(fd);
        return Result<void>::error(ErrorCode::WriteFailure, describe("chmod", temp.path(), err));
    }

    if (::fsync(fd) != 0) {
        int err = errno;
        ::close(fd);
        return Result<void>::error(ErrorCode::WriteFailure, describe("fsync", temp.path(), err));
    }

    if (::close(fd) != 0) {
        int err = errno;
        return Result<void>::error(ErrorCode::WriteFailure, describe("close", temp.path(), err));
    }

    if (options.before_rename && !options.before_rename(temp.path())) {
        return Result<void>::error(ErrorCode::WriteFailure,
                                   std::string(kReplaceFailed) + ": interrupted before rename");
    }

    if (::rename(temp.path().c_str(), target.c_str()) != 0) {
        int err = errno;
        return Result<void>::error(error_from_errno(err), describe("rename onto", target, err));
    }
    temp.release();

    // Persist the directory entry; the replace itself has already happened
    int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dir_fd >= 0) {
        if (::fsync(dir_fd) != 0 && errno != EINVAL) {
            int err = errno;
            ::close(dir_fd);
            return Result<void>::error(ErrorCode::WriteFailure, describe("fsync", dir, err));
        }
        ::close(dir_fd);
    }

    return Result<void>::ok();
}

#endif

}  // namespace

ErrorCode error_from_errno(int err) noexcept {
    switch (err) {
        case 0:
            return ErrorCode::Success;
        case ENOENT:
        case ENOTDIR:
            return ErrorCode::NotFound;
        case EACCES:
        case EPERM:
        case EROFS:
            return ErrorCode::PermissionDenied;
        default:
            return ErrorCode::WriteFailure;
    }
}

ErrorCode error_from_error_code(const std::error_code& ec) noexcept {
    if (!ec) {
        return ErrorCode::Success;
    }
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        return ErrorCode::NotFound;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted ||
        ec == std::errc::read_only_file_system) {
        return ErrorCode::PermissionDenied;
    }
    return ErrorCode::WriteFailure;
}

Result<void> atomic_replace(const fs::path& target, const std::string& content,
                            const ReplaceOptions& options) {
    if (target.empty() || target.filename().empty()) {
        return Result<void>::error(ErrorCode::InvalidParameter, "Target path has no file name");
    }

    uint32_t mode = options.mode ? *options.mode : existing_mode(target, 0644);
    return write_and_rename(target, content, options, mode);
}

Result<std::string> read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<std::string>::error(ErrorCode::NotFound,
                                          "File does not exist: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Result<std::string>::error(ErrorCode::PermissionDenied,
                                          "Cannot open " + path.string());
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<std::string>::error(ErrorCode::Unknown, "Cannot read " + path.string());
    }
    return Result<std::string>::ok(std::move(content));
}

}  // namespace fileio
}  // namespace idscrub
