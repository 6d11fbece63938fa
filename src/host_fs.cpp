#include <algorithm>
#include <cerrno>
#include <vector>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "host_fs.h"

namespace {

std::string BaseName(const std::string& path) {
    std::string trimmed = path;
    while (trimmed.size() > 1 && trimmed.back() == '/')
        trimmed.pop_back();
    auto slash = trimmed.rfind('/');
    if (slash == std::string::npos || trimmed.size() == 1)
        return trimmed;
    return trimmed.substr(slash + 1);
}

std::string Join(const std::string& dir, const std::string& name) {
    if (!dir.empty() && dir.back() == '/')
        return dir + name;
    return dir + "/" + name;
}

FsInfo InfoFromStat(const std::string& path, const struct stat& st) {
    FsInfo info;
    info.name = BaseName(path);
    info.is_dir = S_ISDIR(st.st_mode);
    info.mode = st.st_mode & 07777;
    info.mod_time = std::chrono::system_clock::from_time_t(st.st_mtim.tv_sec) +
                    std::chrono::duration_cast<std::chrono::system_clock::duration>(
                        std::chrono::nanoseconds(st.st_mtim.tv_nsec));
    info.size = (s64)st.st_size;
    return info;
}

// Sorted names of `path`'s entries, "." and ".." excluded.
FsReturn<std::vector<std::string>> ListDir(const std::string& path) {
    FsReturn<std::vector<std::string>> r;
    DIR* d = opendir(path.c_str());
    if (d == nullptr) {
        r.error = FsError("open", path, errno);
        return r;
    }
    while (dirent* entry = readdir(d)) {
        std::string name = entry->d_name;
        if (name == "." || name == "..")
            continue;
        r.value.push_back(name);
    }
    closedir(d);
    std::sort(r.value.begin(), r.value.end());
    return r;
}

FsError WalkHost(const std::string& path, const FsInfo& info, const WalkFunc& fn) {
    FsError err = fn(path, &info, FsError());
    if (err.code == WalkSkipDir)
        return {};
    if (err)
        return err;
    if (!info.is_dir)
        return {};

    auto names = ListDir(path);
    if (names.error)
        return fn(path, &info, names.error);

    for (const auto& name : names.value) {
        std::string child = Join(path, name);
        struct stat st;
        if (::lstat(child.c_str(), &st) != 0) {
            // vanished between readdir and lstat
            if (errno == ENOENT)
                continue;
            return FsError("lstat", child, errno);
        }
        FsInfo child_info = InfoFromStat(child, st);
        if (child_info.is_dir) {
            err = WalkHost(child, child_info, fn);
        } else {
            err = fn(child, &child_info, FsError());
            if (err.code == WalkSkipDir)
                return {};
        }
        if (err)
            return err;
    }
    return {};
}

FsError RemoveTree(const std::string& path) {
    struct stat st;
    if (::lstat(path.c_str(), &st) != 0)
        return errno == ENOENT ? FsError() : FsError("remove", path, errno);
    if (!S_ISDIR(st.st_mode)) {
        if (::unlink(path.c_str()) != 0 && errno != ENOENT)
            return FsError("remove", path, errno);
        return {};
    }

    auto names = ListDir(path);
    if (names.error)
        return names.error;
    for (const auto& name : names.value) {
        FsError err = RemoveTree(Join(path, name));
        if (err)
            return err;
    }
    if (::rmdir(path.c_str()) != 0 && errno != ENOENT)
        return FsError("remove", path, errno);
    return {};
}

class HostFile : public FsFileInterface {
public:
    HostFile(int fd_, std::string path_) : fd(fd_), path(std::move(path_)) {}

    ~HostFile() {
        if (!closed)
            ::close(fd);
    }

    FsIoResult Read(u8* buf, std::size_t size) override {
        FsIoResult result;
        if (closed) {
            result.error = FsError("read", path, EINVAL);
            return result;
        }
        ssize_t n;
        do {
            n = ::read(fd, buf, size);
        } while (n < 0 && errno == EINTR);
        if (n < 0) {
            result.error = FsError("read", path, errno);
            return result;
        }
        result.count = (std::size_t)n;
        result.end_of_stream = n == 0 && size != 0;
        return result;
    }

    FsIoResult Write(const u8* buf, std::size_t size) override {
        FsIoResult result;
        if (closed) {
            result.error = FsError("write", path, EINVAL);
            return result;
        }
        while (result.count < size) {
            ssize_t n = ::write(fd, buf + result.count, size - result.count);
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                result.error = FsError("write", path, errno);
                return result;
            }
            result.count += (std::size_t)n;
        }
        return result;
    }

    FsReturn<s64> Seek(s64 offset, int whence) override {
        FsReturn<s64> result;
        if (closed) {
            result.error = FsError("seek", path, EINVAL);
            return result;
        }
        off_t pos = ::lseek(fd, (off_t)offset, whence);
        if (pos < 0) {
            result.error = FsError("seek", path, errno);
            return result;
        }
        result.value = (s64)pos;
        return result;
    }

    FsReturn<FsInfo> Stat() override {
        FsReturn<FsInfo> result;
        if (closed) {
            result.error = FsError("stat", path, EINVAL);
            return result;
        }
        struct stat st;
        if (::fstat(fd, &st) != 0) {
            result.error = FsError("stat", path, errno);
            return result;
        }
        result.value = InfoFromStat(path, st);
        return result;
    }

    FsError Close() override {
        if (closed)
            return FsError("close", path, EINVAL);
        closed = true;
        if (::close(fd) != 0)
            return FsError("close", path, errno);
        return {};
    }

    std::string Name() const override {
        return BaseName(path);
    }

private:
    int fd;
    std::string path;
    bool closed = false;
};

} // namespace

FsReturn<FsFile> HostFs::Create(const std::string& path) {
    return OpenFile(path, O_RDWR | O_CREAT | O_TRUNC, 0666);
}

FsReturn<FsFile> HostFs::Open(const std::string& path) {
    return OpenFile(path, O_RDONLY, 0);
}

FsReturn<FsInfo> HostFs::Stat(const std::string& path) {
    FsReturn<FsInfo> r;
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        r.error = FsError("stat", path, errno);
        return r;
    }
    r.value = InfoFromStat(path, st);
    return r;
}

FsReturn<FsFile> HostFs::OpenFile(const std::string& path, int flags, u32 mode) {
    FsReturn<FsFile> r;
    int fd = ::open(path.c_str(), flags | O_CLOEXEC, (mode_t)mode);
    if (fd < 0) {
        r.error = FsError("open", path, errno);
        return r;
    }
    r.value = std::make_unique<HostFile>(fd, path);
    return r;
}

FsError HostFs::WalkDir(const std::string& root, const WalkFunc& fn) {
    FsError err;
    struct stat st;
    if (::lstat(root.c_str(), &st) != 0)
        err = fn(root, nullptr, FsError("lstat", root, errno));
    else
        err = WalkHost(root, InfoFromStat(root, st), fn);

    if (err.code == WalkSkipDir || err.code == WalkSkipAll)
        return {};
    return err;
}

FsError HostFs::Truncate(const std::string& path, s64 size) {
    if (::truncate(path.c_str(), (off_t)size) != 0)
        return FsError("truncate", path, errno);
    return {};
}

FsReturn<bytes> HostFs::ReadFile(const std::string& path) {
    FsReturn<bytes> r;
    auto opened = Open(path);
    if (opened.error) {
        r.error = opened.error;
        return r;
    }
    auto& file = opened.value;
    u8 chunk[4096];
    FsError read_error;
    while (true) {
        auto result = file->Read(chunk, sizeof(chunk));
        if (result.error) {
            read_error = result.error;
            break;
        }
        if (result.end_of_stream)
            break;
        r.value.insert(r.value.end(), chunk, chunk + result.count);
    }
    FsError close_error = file->Close();
    r.error = read_error ? read_error : close_error;
    return r;
}

FsError HostFs::WriteFile(const std::string& path, const bytes& data, u32 mode) {
    auto opened = OpenFile(path, O_WRONLY | O_CREAT | O_TRUNC, mode);
    if (opened.error)
        return opened.error;
    auto result = opened.value->Write(data.data(), data.size());
    FsError close_error = opened.value->Close();
    if (result.error)
        return result.error;
    return close_error;
}

FsError HostFs::Remove(const std::string& path) {
    if (::unlink(path.c_str()) == 0)
        return {};
    int unlink_errno = errno;
    if (::rmdir(path.c_str()) == 0)
        return {};
    // rmdir's answer is the relevant one for directories
    if (errno != ENOTDIR)
        return FsError("remove", path, errno);
    return FsError("remove", path, unlink_errno);
}

FsError HostFs::RemoveAll(const std::string& path) {
    if (path.empty())
        return {};
    return RemoveTree(path);
}
