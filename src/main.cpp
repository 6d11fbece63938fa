#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <fcntl.h>
#include <fuse.h>
#include "host_fs.h"
#include "mem_fs.h"

std::unique_ptr<MemFs> memfs;
std::mutex memfs_lock;

namespace FuseCallback {
int getattr(const char* path, struct stat* stbuf) {
    memset(stbuf, 0, sizeof(struct stat));
    std::lock_guard<std::mutex> lock(memfs_lock);
    auto s = memfs->Stat(path);
    if (s.error)
        return -s.error.code;
    const FsInfo& info = s.value;
    if (info.is_dir) {
        stbuf->st_mode = S_IFDIR | info.mode;
        stbuf->st_nlink = 2;
    } else {
        stbuf->st_mode = S_IFREG | info.mode;
        stbuf->st_nlink = 1;
        stbuf->st_size = info.size;
    }
    stbuf->st_mtime = std::chrono::system_clock::to_time_t(info.mod_time);
    return 0;
}

int readdir(const char* path, void* buf, fuse_fill_dir_t filler, off_t offset,
            struct fuse_file_info* fi) {
    std::lock_guard<std::mutex> lock(memfs_lock);
    auto s = memfs->Stat(path);
    if (s.error)
        return -s.error.code;
    if (!s.value.is_dir)
        return -ENOTDIR;

    filler(buf, ".", NULL, 0);
    filler(buf, "..", NULL, 0);
    bool at_top = true;
    FsError err = memfs->WalkDir(path, [&](const std::string& entry_path, const FsInfo* info,
                                           const FsError& error) -> FsError {
        if (error)
            return error;
        if (at_top) {
            at_top = false;
            return {};
        }
        filler(buf, info->name.c_str(), NULL, 0);
        // list only, never descend
        if (info->is_dir)
            return SkipDir();
        return {};
    });
    return -err.code;
}

int mkdir(const char* path, mode_t mode) {
    std::lock_guard<std::mutex> lock(memfs_lock);
    return -memfs->MakeDir(path, mode).code;
}

int rmdir(const char* path) {
    std::lock_guard<std::mutex> lock(memfs_lock);
    auto s = memfs->Stat(path);
    if (s.error)
        return -s.error.code;
    if (!s.value.is_dir)
        return -ENOTDIR;
    return -memfs->Remove(path).code;
}

int mknod(const char* path, mode_t mode, dev_t dev) {
    std::lock_guard<std::mutex> lock(memfs_lock);
    auto opened = memfs->OpenFile(path, O_WRONLY | O_CREAT | O_EXCL, mode);
    if (opened.error)
        return -opened.error.code;
    return -opened.value->Close().code;
}

int create(const char* path, mode_t mode, struct fuse_file_info* fi) {
    std::lock_guard<std::mutex> lock(memfs_lock);
    auto opened = memfs->OpenFile(path, fi->flags | O_CREAT, mode);
    if (opened.error)
        return -opened.error.code;
    fi->fh = (std::uint64_t)opened.value.release();
    return 0;
}

int unlink(const char* path) {
    std::lock_guard<std::mutex> lock(memfs_lock);
    auto s = memfs->Stat(path);
    if (s.error)
        return -s.error.code;
    if (s.value.is_dir)
        return -EISDIR;
    return -memfs->Remove(path).code;
}

int open(const char* path, struct fuse_file_info* fi) {
    std::lock_guard<std::mutex> lock(memfs_lock);
    auto opened = memfs->OpenFile(path, fi->flags, 0);
    if (opened.error)
        return -opened.error.code;
    fi->fh = (std::uint64_t)opened.value.release();
    return 0;
}

int read(const char* path, char* buf, size_t size, off_t offset, struct fuse_file_info* fi) {
    std::lock_guard<std::mutex> lock(memfs_lock);
    auto file = (FsFileInterface*)fi->fh;
    auto seek = file->Seek(offset, SEEK_SET);
    if (seek.error)
        return -seek.error.code;
    std::size_t total = 0;
    while (total < size) {
        auto result = file->Read((u8*)buf + total, size - total);
        if (result.error)
            return -result.error.code;
        if (result.end_of_stream || result.count == 0)
            break;
        total += result.count;
    }
    return (int)total;
}

int write(const char* path, const char* buf, size_t size, off_t offset, struct fuse_file_info* fi) {
    std::lock_guard<std::mutex> lock(memfs_lock);
    auto file = (FsFileInterface*)fi->fh;
    auto seek = file->Seek(offset, SEEK_SET);
    if (seek.error)
        return -seek.error.code;
    auto result = file->Write((const u8*)buf, size);
    if (result.error)
        return -result.error.code;
    return (int)result.count;
}

int truncate(const char* path, off_t size) {
    std::lock_guard<std::mutex> lock(memfs_lock);
    return -memfs->Truncate(path, size).code;
}

int release(const char* path, struct fuse_file_info* fi) {
    std::lock_guard<std::mutex> lock(memfs_lock);
    std::unique_ptr<FsFileInterface> file((FsFileInterface*)fi->fh);
    return -file->Close().code;
}
} // namespace FuseCallback

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::printf("usage: %s [MEMFS_OPTION]... MOUNT_POINT [FUSE_OPTION]...", argv[0]);
        std::printf(R"(
MEMFS_OPTION:
    --dir PATH             Create directory PATH (and its parents) before mounting.
    --file PATH HOSTFILE   Create file PATH with the content of HOSTFILE.
    --epoch SECONDS        Stamp every modification with this Unix time instead of the
                           current time.
)");
        return 0;
    }

    std::vector<char*> fuse_argv;
    fuse_argv.push_back(argv[0]);

    std::vector<FsOption> options;
    Clock clock = SystemClock();
    HostFs host;

    for (int i = 1; i < argc; ++i) {
        auto advance_i = [&i, argc, argv]() {
            ++i;
            if (i == argc) {
                printf("Needs more argument after %s\n", argv[i - 1]);
                exit(-1);
            }
        };
        if (std::strcmp(argv[i], "--dir") == 0) {
            advance_i();
            options.push_back(WithDirectory(argv[i]));
        } else if (std::strcmp(argv[i], "--file") == 0) {
            advance_i();
            std::string path = argv[i];
            advance_i();
            auto content = host.ReadFile(argv[i]);
            if (content.error) {
                printf("Failed to read %s\n", content.error.Message().c_str());
                exit(1);
            }
            options.push_back(WithFile(path, content.value));
        } else if (std::strcmp(argv[i], "--epoch") == 0) {
            advance_i();
            auto seconds = (std::time_t)std::strtoll(argv[i], nullptr, 10);
            clock = FixedClock(std::chrono::system_clock::from_time_t(seconds));
        } else {
            fuse_argv.push_back(argv[i]);
        }
    }

    try {
        memfs = std::make_unique<MemFs>(std::move(options), clock);
    } catch (const std::invalid_argument& e) {
        printf("Invalid layout: %s\n", e.what());
        exit(1);
    }
    printf("Mounting in-memory filesystem with %zu entries. Content is lost on unmount.\n",
           memfs->Tree().LinkedCount());

    static fuse_operations op;
    op.getattr = FuseCallback::getattr;
    op.readdir = FuseCallback::readdir;
    op.mkdir = FuseCallback::mkdir;
    op.rmdir = FuseCallback::rmdir;
    op.mknod = FuseCallback::mknod;
    op.create = FuseCallback::create;
    op.unlink = FuseCallback::unlink;
    op.open = FuseCallback::open;
    op.read = FuseCallback::read;
    op.write = FuseCallback::write;
    op.truncate = FuseCallback::truncate;
    op.release = FuseCallback::release;
    return fuse_main((int)fuse_argv.size(), fuse_argv.data(), &op, nullptr);
}
