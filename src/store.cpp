#include <docpatch-cpp/store.hpp>

#include <docpatch-cpp/error.hpp>
#include <docpatch-cpp/log.hpp>

#include "crypto/sha256.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace docpatch_cpp {

namespace fs = std::filesystem;

namespace {

auto posix_error(std::string_view what, const fs::path& path, int err) -> Error {
    return Error{ErrorKind::io_error,
                 std::string{what} + " " + path.string() + ": " + std::strerror(err)};
}

auto fs_error(std::string_view what, const fs::path& path, const std::error_code& ec) -> Error {
    return Error{ErrorKind::io_error,
                 std::string{what} + " " + path.string() + ": " + ec.message()};
}

/// A temporary file that is closed and unlinked unless released.
class TempFile {
public:
    explicit TempFile(const fs::path& dir) {
        auto pattern = (dir / ".docpatch-tmp-XXXXXX").string();
        auto buf = std::vector<char>(pattern.begin(), pattern.end());
        buf.push_back('\0');
        fd_ = ::mkstemp(buf.data());
        if (fd_ < 0) {
            throw posix_error("cannot create temporary file in", dir, errno);
        }
        path_ = fs::path{buf.data()};
    }

    ~TempFile() {
        if (fd_ >= 0) ::close(fd_);
        if (!path_.empty() && ::unlink(path_.c_str()) != 0) {
            log::get()->warn("could not remove temporary file {}: {}",
                             path_.string(), std::strerror(errno));
        }
    }

    TempFile(const TempFile&) = delete;
    auto operator=(const TempFile&) -> TempFile& = delete;

    auto fd() const -> int { return fd_; }
    auto path() const -> const fs::path& { return path_; }

    void write_all(std::string_view bytes) {
        auto data = bytes.data();
        auto remaining = bytes.size();
        while (remaining > 0) {
            auto n = ::write(fd_, data, remaining);
            if (n < 0) {
                if (errno == EINTR) continue;
                throw posix_error("cannot write", path_, errno);
            }
            data += n;
            remaining -= static_cast<std::size_t>(n);
        }
    }

    /// Flush to stable storage and close the descriptor.
    void sync_and_close() {
        if (::fsync(fd_) != 0) {
            throw posix_error("cannot fsync", path_, errno);
        }
        auto fd = fd_;
        fd_ = -1;
        if (::close(fd) != 0) {
            throw posix_error("cannot close", path_, errno);
        }
    }

    /// The file now lives elsewhere (renamed); do not unlink it.
    void release() { path_.clear(); }

private:
    int fd_{-1};
    fs::path path_;
};

/// Permission bits for the new revision: those of the file it replaces,
/// or the usual 0666 minus umask for a new file.
auto revision_mode(const fs::path& target) -> mode_t {
    struct stat st {};
    if (::stat(target.c_str(), &st) == 0) {
        return st.st_mode & 07777;
    }
    auto mask = ::umask(0);
    ::umask(mask);
    return static_cast<mode_t>(0666 & ~mask);
}

void sync_directory(const fs::path& dir) {
    auto fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        log::get()->warn("could not open directory {} for fsync: {}",
                         dir.string(), std::strerror(errno));
        return;
    }
    if (::fsync(fd) != 0) {
        log::get()->warn("could not fsync directory {}: {}", dir.string(), std::strerror(errno));
    }
    ::close(fd);
}

/// Copy the current revision to `base`, or to `base.N` when that name is
/// taken, and flush the copy before returning its path.
auto write_backup(const fs::path& path, const fs::path& base) -> fs::path {
    auto backup = base;
    for (auto n = 1;; ++n) {
        auto ec = std::error_code{};
        fs::copy_file(path, backup, fs::copy_options::none, ec);
        if (!ec) break;
        if (ec != std::errc::file_exists) throw fs_error("cannot back up", path, ec);
        backup = fs::path{base.string() + "." + std::to_string(n)};
    }

    auto fd = ::open(backup.c_str(), O_RDONLY);
    if (fd < 0) {
        throw posix_error("cannot open backup", backup, errno);
    }
    if (::fsync(fd) != 0) {
        auto err = errno;
        ::close(fd);
        throw posix_error("cannot fsync", backup, err);
    }
    ::close(fd);
    return backup;
}

}  // anonymous namespace

auto sha256_hex(std::string_view bytes) -> std::string {
    return crypto::to_hex(crypto::sha256(bytes));
}

auto backup_path_for(const fs::path& path, std::chrono::system_clock::time_point timestamp,
                     std::string_view digest) -> fs::path {
    auto t = std::chrono::system_clock::to_time_t(timestamp);
    auto tm = std::tm{};
    ::gmtime_r(&t, &tm);
    char stamp[32];
    auto len = std::strftime(stamp, sizeof stamp, "%Y%m%dT%H%M%SZ", &tm);
    return fs::path{path.string() + ".bak." + std::string{stamp, len} + "." +
                    std::string{digest.substr(0, 8)}};
}

auto read_file(const fs::path& path) -> std::string {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) {
        throw posix_error("cannot open", path, errno);
    }
    auto bytes = std::string{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    if (in.bad()) {
        throw posix_error("cannot read", path, errno);
    }
    return bytes;
}

auto load_document(const fs::path& path) -> LoadedDocument {
    auto bytes = read_file(path);
    auto document = parse_document(bytes, path.string());
    return LoadedDocument{std::move(document), std::move(bytes)};
}

auto commit_bytes(const fs::path& path, std::string_view bytes, const CommitOptions& options)
    -> CommitResult {
    auto result = CommitResult{path, sha256_hex(bytes), std::nullopt};

    auto dir = path.parent_path();
    if (dir.empty()) dir = ".";
    auto ec = std::error_code{};
    fs::create_directories(dir, ec);
    if (ec) throw fs_error("cannot create directory", dir, ec);

    // Same directory as the target, so the rename below stays on one filesystem
    auto tmp = TempFile{dir};
    tmp.write_all(bytes);
    if (::fchmod(tmp.fd(), revision_mode(path)) != 0) {
        throw posix_error("cannot set permissions on", tmp.path(), errno);
    }
    tmp.sync_and_close();

    auto replacing = fs::exists(path, ec);
    if (ec) throw fs_error("cannot stat", path, ec);
    if (options.make_backup && replacing) {
        auto when = options.timestamp.value_or(std::chrono::system_clock::now());
        auto backup = write_backup(path, backup_path_for(path, when, result.digest));
        // The backup's directory entry must be durable before the old revision is replaced
        sync_directory(dir);
        log::get()->info("backed up {} to {}", path.string(), backup.string());
        result.backup_path = std::move(backup);
    }

    if (::rename(tmp.path().c_str(), path.c_str()) != 0) {
        throw posix_error("cannot rename temporary file onto", path, errno);
    }
    tmp.release();
    sync_directory(dir);

    log::get()->info("committed {} (sha256 {})", path.string(), result.digest);
    return result;
}

auto commit_document(const fs::path& path, const Document& doc, const CommitOptions& options)
    -> CommitResult {
    return commit_bytes(path, serialize(doc), options);
}

}  // namespace docpatch_cpp
