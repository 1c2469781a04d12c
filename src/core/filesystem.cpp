#include "arbor/filesystem.h"

#include <cerrno>
#include <string_view>
#include <utility>

#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include "arbor/error.h"

namespace arbor {

namespace {

struct DirCloser {
    void operator()(DIR* dir) const noexcept { ::closedir(dir); }
};

using DirHandle = std::unique_ptr<DIR, DirCloser>;

NodeRecord::Clock::time_point to_time_point(std::int64_t seconds, std::int64_t nanoseconds) {
    auto since_epoch = std::chrono::seconds{seconds} + std::chrono::nanoseconds{nanoseconds};
    return NodeRecord::Clock::time_point{std::chrono::duration_cast<NodeRecord::Clock::duration>(since_epoch)};
}

NodeKind kind_from_mode(mode_t mode) {
    if (S_ISREG(mode)) {
        return NodeKind::File;
    }
    if (S_ISDIR(mode)) {
        return NodeKind::Directory;
    }
    return NodeKind::Other;
}

class FdReadStream final : public ReadStream {
public:
    FdReadStream(int fd, std::filesystem::path path)
        : fd_{fd}, path_{std::move(path)} {}

    ~FdReadStream() override { cancel(); }

    std::size_t read(std::span<char> buffer) override {
        if (fd_ < 0) {
            throw Error::from_errno(EBADF, "read", path_);
        }
        for (;;) {
            const ssize_t count = ::read(fd_, buffer.data(), buffer.size());
            if (count >= 0) {
                return static_cast<std::size_t>(count);
            }
            if (errno != EINTR) {
                throw Error::from_errno(errno, "read", path_);
            }
        }
    }

    void cancel() noexcept override {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
    std::filesystem::path path_;
};

class FdWriteStream final : public WriteStream {
public:
    FdWriteStream(int fd, std::filesystem::path path)
        : fd_{fd}, path_{std::move(path)} {}

    ~FdWriteStream() override { cancel(); }

    void write(std::span<const char> data) override {
        if (fd_ < 0) {
            throw Error::from_errno(EBADF, "write", path_);
        }
        while (!data.empty()) {
            const ssize_t count = ::write(fd_, data.data(), data.size());
            if (count < 0) {
                if (errno == EINTR) {
                    continue;
                }
                throw Error::from_errno(errno, "write", path_);
            }
            data = data.subspan(static_cast<std::size_t>(count));
        }
    }

    void finish() override {
        if (fd_ < 0) {
            throw Error::from_errno(EBADF, "close", path_);
        }
        const int fd = std::exchange(fd_, -1);
        if (::close(fd) != 0) {
            throw Error::from_errno(errno, "close", path_);
        }
    }

    void cancel() noexcept override {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_;
    std::filesystem::path path_;
};

} // namespace

NodeRecord PosixFileSystem::stat(const std::filesystem::path& path, LinkMode links) {
    NodeRecord record;
    record.path = path;
#if defined(__linux__) && defined(STATX_BTIME)
    struct statx st {};
    const int flags = AT_STATX_SYNC_AS_STAT | (links == LinkMode::NoFollow ? AT_SYMLINK_NOFOLLOW : 0);
    if (::statx(AT_FDCWD, path.c_str(), flags, STATX_BASIC_STATS | STATX_BTIME, &st) != 0) {
        throw Error::from_errno(errno, "stat", path);
    }
    record.kind = kind_from_mode(st.stx_mode);
    record.mode = st.stx_mode;
    record.owner_id = st.stx_uid;
    record.group_id = st.stx_gid;
    record.size_bytes = static_cast<std::uintmax_t>(st.stx_size);
    record.device_id = (static_cast<std::uint64_t>(st.stx_dev_major) << 32) | st.stx_dev_minor;
    record.inode = st.stx_ino;
    record.access_time = to_time_point(st.stx_atime.tv_sec, st.stx_atime.tv_nsec);
    record.modify_time = to_time_point(st.stx_mtime.tv_sec, st.stx_mtime.tv_nsec);
    record.change_time = to_time_point(st.stx_ctime.tv_sec, st.stx_ctime.tv_nsec);
    // Filesystems without creation times leave the mask bit clear.
    record.birth_time = (st.stx_mask & STATX_BTIME) != 0
                            ? to_time_point(st.stx_btime.tv_sec, st.stx_btime.tv_nsec)
                            : record.change_time;
#else
    struct stat st {};
    const int rc = links == LinkMode::Follow ? ::stat(path.c_str(), &st) : ::lstat(path.c_str(), &st);
    if (rc != 0) {
        throw Error::from_errno(errno, "stat", path);
    }
    record.kind = kind_from_mode(st.st_mode);
    record.mode = static_cast<std::uint32_t>(st.st_mode);
    record.owner_id = static_cast<std::uint32_t>(st.st_uid);
    record.group_id = static_cast<std::uint32_t>(st.st_gid);
    record.size_bytes = static_cast<std::uintmax_t>(st.st_size);
    record.device_id = static_cast<std::uint64_t>(st.st_dev);
    record.inode = static_cast<std::uint64_t>(st.st_ino);
#if defined(__APPLE__)
    record.access_time = to_time_point(st.st_atimespec.tv_sec, st.st_atimespec.tv_nsec);
    record.modify_time = to_time_point(st.st_mtimespec.tv_sec, st.st_mtimespec.tv_nsec);
    record.change_time = to_time_point(st.st_ctimespec.tv_sec, st.st_ctimespec.tv_nsec);
    record.birth_time = to_time_point(st.st_birthtimespec.tv_sec, st.st_birthtimespec.tv_nsec);
#else
    record.access_time = to_time_point(st.st_atim.tv_sec, st.st_atim.tv_nsec);
    record.modify_time = to_time_point(st.st_mtim.tv_sec, st.st_mtim.tv_nsec);
    record.change_time = to_time_point(st.st_ctim.tv_sec, st.st_ctim.tv_nsec);
    record.birth_time = record.change_time;
#endif
#endif
    return record;
}

std::vector<std::string> PosixFileSystem::read_directory(const std::filesystem::path& path) {
    DirHandle dir{::opendir(path.c_str())};
    if (!dir) {
        throw Error::from_errno(errno, "opendir", path);
    }

    std::vector<std::string> names;
    for (;;) {
        errno = 0;
        const dirent* entry = ::readdir(dir.get());
        if (entry == nullptr) {
            if (errno != 0) {
                throw Error::from_errno(errno, "readdir", path);
            }
            break;
        }
        std::string_view name{entry->d_name};
        if (name == "." || name == "..") {
            continue;
        }
        names.emplace_back(name);
    }
    return names;
}

void PosixFileSystem::make_directory(const std::filesystem::path& path, std::uint32_t mode) {
    if (::mkdir(path.c_str(), static_cast<mode_t>(mode)) != 0) {
        throw Error::from_errno(errno, "mkdir", path);
    }
}

void PosixFileSystem::remove_directory(const std::filesystem::path& path) {
    if (::rmdir(path.c_str()) != 0) {
        throw Error::from_errno(errno, "rmdir", path);
    }
}

void PosixFileSystem::remove_file(const std::filesystem::path& path) {
    if (::unlink(path.c_str()) != 0) {
        throw Error::from_errno(errno, "unlink", path);
    }
}

std::unique_ptr<ReadStream> PosixFileSystem::open_read(const std::filesystem::path& path) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw Error::from_errno(errno, "open", path);
    }
    return std::make_unique<FdReadStream>(fd, path);
}

std::unique_ptr<WriteStream> PosixFileSystem::open_write(const std::filesystem::path& path, std::uint32_t mode) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, static_cast<mode_t>(mode));
    if (fd < 0) {
        throw Error::from_errno(errno, "open", path);
    }
    return std::make_unique<FdWriteStream>(fd, path);
}

FileSystem& default_filesystem() {
    static PosixFileSystem filesystem;
    return filesystem;
}

} // namespace arbor
