#pragma once
#include <functional>
#include <list>
#include <memory>
#include <string>
#include "bytes.h"
#include "clock.h"
#include "fs_error.h"

class FsPath {
public:
    FsPath() = default;
    FsPath(const FsPath&) = default;
    FsPath(const std::string& str);

    // Absolute, with "." and ".." resolved and separators collapsed. "/" for the root.
    std::string Canonical() const;
    std::string Base() const;
    bool IsRoot() const {
        return is_valid && steps.empty();
    }

    std::list<std::string> steps;
    bool is_valid = false;
    // The literal path ended with a separator, i.e. it can only name a directory.
    bool dir_marked = false;
};

enum class FsResult {
    InvalidPath,
    PathNotFound,
    FileInPath,
    FileExists,
    DirExists,
    NotFound,
};

struct FsStat {
    u32 parent;
    u32 index;
    /*
    InvalidPath:  empty path
    PathNotFound: some ancestor is missing
    FileInPath:   some ancestor is a file
    FileExists:   `index` is a file
    DirExists:    `index` is a directory
    NotFound:     `parent` is a directory without an entry named `name`
    */
    FsResult result;
    std::string name;
};

struct FsInfo {
    std::string name;
    bool is_dir = false;
    u32 mode = 0;
    Timestamp mod_time;
    s64 size = 0;
};

class FsFileInterface {
public:
    virtual ~FsFileInterface();
    virtual FsIoResult Read(u8* buf, std::size_t size) = 0;
    virtual FsIoResult Write(const u8* buf, std::size_t size) = 0;
    // `whence` is SEEK_SET, SEEK_CUR or SEEK_END. Returns the new cursor.
    virtual FsReturn<s64> Seek(s64 offset, int whence) = 0;
    virtual FsReturn<FsInfo> Stat() = 0;
    virtual FsError Close() = 0;
    virtual std::string Name() const = 0;
};

using FsFile = std::unique_ptr<FsFileInterface>;

// `info` is null only when `error` is set, which happens when the walk root itself
// cannot be resolved.
using WalkFunc =
    std::function<FsError(const std::string& path, const FsInfo* info, const FsError& error)>;

class FsInterface {
public:
    virtual ~FsInterface();

    // Same as OpenFile(path, O_RDWR | O_CREAT | O_TRUNC, 0666).
    virtual FsReturn<FsFile> Create(const std::string& path) = 0;

    // Read-only open of a file or a directory.
    virtual FsReturn<FsFile> Open(const std::string& path) = 0;

    virtual FsReturn<FsInfo> Stat(const std::string& path) = 0;

    // `flags` is a combination of the <fcntl.h> O_* flags.
    virtual FsReturn<FsFile> OpenFile(const std::string& path, int flags, u32 mode) = 0;

    // Pre-order, depth first, entries of each directory in lexical order.
    virtual FsError WalkDir(const std::string& root, const WalkFunc& fn) = 0;

    virtual FsError Truncate(const std::string& path, s64 size) = 0;
    virtual FsReturn<bytes> ReadFile(const std::string& path) = 0;
    virtual FsError WriteFile(const std::string& path, const bytes& data, u32 mode) = 0;

    // Refuses non-empty directories.
    virtual FsError Remove(const std::string& path) = 0;
    virtual FsError RemoveAll(const std::string& path) = 0;
};
