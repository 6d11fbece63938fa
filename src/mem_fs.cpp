#include <cerrno>
#include <deque>
#include <new>
#include <fcntl.h>
#include <stdexcept>
#include "crypto.h"
#include "dir_walker.h"
#include "mem_file.h"
#include "mem_fs.h"

namespace {

// errno for a classification that names no existing entry
int MissingCode(FsResult result) {
    switch (result) {
    case FsResult::FileInPath:
        return ENOTDIR;
    case FsResult::InvalidPath:
    case FsResult::PathNotFound:
    case FsResult::NotFound:
    default:
        return ENOENT;
    }
}

constexpr char DigitToHex(u8 value) {
    if (value < 10)
        return '0' + value;
    else
        return 'a' + value - 10;
}

std::string ToHex(const bytes& data) {
    std::string result;
    for (u8 b : data) {
        result += DigitToHex(b >> 4);
        result += DigitToHex(b & 0xF);
    }
    return result;
}

} // namespace

FsOption WithFile(std::string path, bytes content) {
    return [path = std::move(path), content = std::move(content)](MemFs& fs) {
        fs.AddFile(path, content);
    };
}

FsOption WithDirectory(std::string path) {
    return [path = std::move(path)](MemFs& fs) { fs.AddDirectory(path); };
}

MemFs::MemFs(std::vector<FsOption> options, Clock clock_)
    : clock(std::move(clock_)), tree(DefaultDirMode & ~Umask, clock()) {
    for (const auto& option : options)
        option(*this);
}

FsReturn<FsFile> MemFs::Create(const std::string& path) {
    return OpenFile(path, O_RDWR | O_CREAT | O_TRUNC, DefaultFileMode);
}

FsReturn<FsFile> MemFs::Open(const std::string& path) {
    FsReturn<FsFile> r;
    FsPath p(path);
    auto s = tree.Find(p);
    switch (s.result) {
    case FsResult::FileExists:
        if (p.dir_marked) {
            r.error = FsError("open", path, ENOTDIR);
            return r;
        }
        [[fallthrough]];
    case FsResult::DirExists:
        r.value = MakeHandle(s.index, O_RDONLY);
        return r;
    default:
        r.error = FsError("open", path, MissingCode(s.result));
        return r;
    }
}

FsReturn<FsInfo> MemFs::Stat(const std::string& path) {
    FsReturn<FsInfo> r;
    FsPath p(path);
    auto s = tree.Find(p);
    switch (s.result) {
    case FsResult::FileExists:
        if (p.dir_marked) {
            r.error = FsError("stat", path, ENOTDIR);
            return r;
        }
        [[fallthrough]];
    case FsResult::DirExists:
        r.value = MakeInfo(tree.Get(s.index));
        return r;
    default:
        r.error = FsError("stat", path, MissingCode(s.result));
        return r;
    }
}

FsReturn<FsFile> MemFs::OpenFile(const std::string& path, int flags, u32 mode) {
    FsReturn<FsFile> r;
    FsPath p(path);
    auto s = tree.Find(p);
    switch (s.result) {
    case FsResult::InvalidPath:
    case FsResult::PathNotFound:
    case FsResult::FileInPath:
        r.error = FsError("open", path, MissingCode(s.result));
        return r;
    case FsResult::DirExists:
        r.error = FsError("open", path, EISDIR);
        return r;
    case FsResult::FileExists: {
        if (p.dir_marked) {
            r.error = FsError("open", path, EISDIR);
            return r;
        }
        if ((flags & O_CREAT) && (flags & O_EXCL)) {
            r.error = FsError("open", path, EEXIST);
            return r;
        }
        if (flags & O_TRUNC) {
            Node& node = tree.Get(s.index);
            node.content.clear();
            node.last_modified = clock();
        }
        r.value = MakeHandle(s.index, flags);
        return r;
    }
    case FsResult::NotFound: {
        if (p.dir_marked) {
            r.error = FsError("open", path, EISDIR);
            return r;
        }
        if (!(flags & O_CREAT)) {
            r.error = FsError("open", path, ENOENT);
            return r;
        }
        u32 index = tree.MakeFile(s.name, s.parent, mode & 07777 & ~Umask, clock());
        r.value = MakeHandle(index, flags);
        return r;
    }
    }
    r.error = FsError("open", path, EINVAL);
    return r;
}

FsError MemFs::WalkDir(const std::string& root, const WalkFunc& fn) {
    FsPath p(root);
    auto s = tree.Find(p);

    FsError err;
    if (s.result != FsResult::FileExists && s.result != FsResult::DirExists) {
        std::string start = p.is_valid ? p.Canonical() : root;
        err = fn(start, nullptr, FsError("lstat", root, MissingCode(s.result)));
    } else {
        err = WalkNodes(tree, tree.Handle(s.index), [this, &fn](const NodeHandle& handle) {
            const Node& node = *tree.Resolve(handle);
            std::string path = node.path;
            FsInfo info = MakeInfo(node);
            return fn(path, &info, FsError());
        });
    }

    if (err.code == WalkSkipDir || err.code == WalkSkipAll)
        return {};
    return err;
}

FsError MemFs::Truncate(const std::string& path, s64 size) {
    FsPath p(path);
    auto s = tree.Find(p);
    switch (s.result) {
    case FsResult::DirExists:
        return FsError("truncate", path, EISDIR);
    case FsResult::FileExists: {
        if (p.dir_marked)
            return FsError("truncate", path, EISDIR);
        if (size < 0)
            return FsError("truncate", path, EINVAL);
        // growing zero-fills, same as a sparse write
        Node& node = tree.Get(s.index);
        if ((u64)size > node.content.max_size())
            return FsError("truncate", path, EFBIG);
        try {
            node.content.resize((std::size_t)size, 0);
        } catch (const std::bad_alloc&) {
            return FsError("truncate", path, ENOMEM);
        }
        node.last_modified = clock();
        return {};
    }
    default:
        return FsError("truncate", path, MissingCode(s.result));
    }
}

FsReturn<bytes> MemFs::ReadFile(const std::string& path) {
    FsReturn<bytes> r;
    FsPath p(path);
    auto s = tree.Find(p);
    switch (s.result) {
    case FsResult::DirExists:
        r.error = FsError("read", path, EISDIR);
        return r;
    case FsResult::FileExists:
        if (p.dir_marked) {
            r.error = FsError("open", path, ENOTDIR);
            return r;
        }
        r.value = tree.Get(s.index).content;
        return r;
    default:
        r.error = FsError("open", path, MissingCode(s.result));
        return r;
    }
}

FsError MemFs::WriteFile(const std::string& path, const bytes& data, u32 mode) {
    FsPath p(path);
    auto s = tree.Find(p);
    switch (s.result) {
    case FsResult::DirExists:
        return FsError("open", path, EISDIR);
    case FsResult::FileExists: {
        if (p.dir_marked)
            return FsError("open", path, EISDIR);
        Node& node = tree.Get(s.index);
        node.content = data;
        node.last_modified = clock();
        return {};
    }
    case FsResult::NotFound: {
        if (p.dir_marked)
            return FsError("open", path, EISDIR);
        u32 index = tree.MakeFile(s.name, s.parent, mode & 07777 & ~Umask, clock());
        tree.Get(index).content = data;
        return {};
    }
    default:
        return FsError("open", path, MissingCode(s.result));
    }
}

FsError MemFs::Remove(const std::string& path) {
    FsPath p(path);
    auto s = tree.Find(p);
    switch (s.result) {
    case FsResult::DirExists:
        if (s.index == RootNode)
            return FsError("remove", path, EPERM);
        if (!tree.Get(s.index).children.empty())
            return FsError("remove", path, ENOTEMPTY);
        tree.Release(s.index);
        return {};
    case FsResult::FileExists:
        if (p.dir_marked)
            return FsError("remove", path, ENOTDIR);
        tree.Release(s.index);
        return {};
    default:
        return FsError("remove", path, MissingCode(s.result));
    }
}

FsError MemFs::RemoveAll(const std::string& path) {
    FsPath p(path);
    auto s = tree.Find(p);
    // same outcome as a walk whose visitor hands the missing-root error back
    if (s.result != FsResult::FileExists && s.result != FsResult::DirExists)
        return FsError("lstat", path, MissingCode(s.result));

    // Unlinked nodes keep their own children, so the walk reaches every descendant even
    // after its parent left the index. Slots are freed once the walk is over.
    std::vector<u32> unlinked;
    FsError err = WalkNodes(tree, tree.Handle(s.index), [this, &unlinked](const NodeHandle& h) {
        if (h.index == RootNode)
            return FsError("remove", tree.Get(h.index).path, EPERM);
        tree.Unlink(h.index);
        unlinked.push_back(h.index);
        return FsError();
    });
    for (u32 index : unlinked)
        tree.Release(index);

    if (err.code == WalkSkipDir || err.code == WalkSkipAll)
        return {};
    return err;
}

FsError MemFs::MakeDir(const std::string& path, u32 mode) {
    FsPath p(path);
    auto s = tree.Find(p);
    switch (s.result) {
    case FsResult::FileExists:
    case FsResult::DirExists:
        return FsError("mkdir", path, EEXIST);
    case FsResult::NotFound:
        tree.MakeDir(s.name, s.parent, mode & 07777 & ~Umask, clock());
        return {};
    default:
        return FsError("mkdir", path, MissingCode(s.result));
    }
}

void MemFs::AddDirectory(const std::string& path) {
    FsPath p(path);
    if (!p.is_valid)
        throw std::invalid_argument("WithDirectory: empty path");
    EnsureDirectories(p, p.steps.size());
}

void MemFs::AddFile(const std::string& path, const bytes& content) {
    FsPath p(path);
    if (!p.is_valid || p.IsRoot())
        throw std::invalid_argument("WithFile: not a file path: " + path);

    u32 parent = EnsureDirectories(p, p.steps.size() - 1);
    u32 index = tree.Lookup(p.Canonical());
    if (index == NoNode) {
        index = tree.MakeFile(p.Base(), parent, DefaultFileMode & ~Umask, clock());
    } else if (tree.Get(index).is_dir) {
        throw std::invalid_argument("WithFile: is a directory: " + path);
    }
    Node& node = tree.Get(index);
    node.content = content;
    node.last_modified = clock();
}

void MemFs::SetClock(Clock clock_) {
    clock = std::move(clock_);
}

std::string MemFs::Dump() const {
    std::string result;
    std::deque<u32> pending{RootNode};
    while (!pending.empty()) {
        const Node& node = tree.Get(pending.front());
        pending.pop_front();

        result += node.path + ": ";
        if (node.is_dir) {
            result += "(Directory)";
        } else {
            result += std::to_string(node.content.size()) + " bytes sha256:" +
                      ToHex(Crypto::Sha256(node.content));
        }
        result += "\n";

        for (const auto& [path, child] : node.children)
            pending.push_back(child);
    }
    return result;
}

FsFile MemFs::MakeHandle(u32 index, int flags) {
    return std::make_unique<MemFile>(&tree, tree.Handle(index), flags);
}

u32 MemFs::EnsureDirectories(const FsPath& path, std::size_t count) {
    u32 current = RootNode;
    std::string current_path;
    auto step = path.steps.begin();
    for (std::size_t i = 0; i < count; ++i, ++step) {
        current_path += "/" + *step;
        u32 next = tree.Lookup(current_path);
        if (next == NoNode) {
            next = tree.MakeDir(*step, current, DefaultDirMode & ~Umask, clock());
        } else if (!tree.Get(next).is_dir) {
            throw std::invalid_argument("not a directory: " + current_path);
        }
        current = next;
    }
    return current;
}
