#pragma once

#include <string>
#include "fs_interface.h"

// Forwards every operation to the host's filesystem.
class HostFs : public FsInterface {
public:
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
};
