#pragma once

#include <functional>
#include <string>
#include <vector>
#include "clock.h"
#include "fs_interface.h"
#include "node_tree.h"

// default umask on common Linux systems
static constexpr u32 Umask = 0022;
static constexpr u32 DefaultFileMode = 0666;
static constexpr u32 DefaultDirMode = 0777;

class MemFs;

// Applied in order by the MemFs constructor. Missing ancestors are created as
// directories. Throws std::invalid_argument if the path runs through a file.
using FsOption = std::function<void(MemFs&)>;
FsOption WithFile(std::string path, bytes content);
FsOption WithDirectory(std::string path);

// In-memory filesystem. Not thread-safe, callers serialize access.
class MemFs : public FsInterface {
public:
    explicit MemFs(std::vector<FsOption> options = {}, Clock clock_ = SystemClock());

    FsReturn<FsFile> Create(const std::string& path) override;
    FsReturn<FsFile> Open(const std::string& path) override;
    FsReturn<FsInfo> Stat(const std::string& path) override;
    FsReturn<FsFile> OpenFile(const std::string& path, int flags, u32 mode) override;
    FsError WalkDir(const std::string& root, const WalkFunc& fn) override;
    FsError Truncate(const std::string& path, s64 size) override;
    FsReturn<bytes> ReadFile(const std::string& path) override;
    FsError WriteFile(const std::string& path, const bytes& data, u32 mode) override;
    FsError Remove(const std::string& path) override;
    FsError RemoveAll(const std::string& path) override;

    FsError MakeDir(const std::string& path, u32 mode);

    void AddDirectory(const std::string& path);
    void AddFile(const std::string& path, const bytes& content);

    void SetClock(Clock clock_);

    // One line per node, breadth first, children in path order. File content is
    // summarized by its SHA-256.
    std::string Dump() const;

    const NodeTree& Tree() const {
        return tree;
    }

private:
    Clock clock;
    NodeTree tree;

    FsFile MakeHandle(u32 index, int flags);

    // Walks the first `count` steps of `path`, creating missing directories. Returns the
    // last directory reached.
    u32 EnsureDirectories(const FsPath& path, std::size_t count);
};
