#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <limits>
#include <new>
#include <fcntl.h>
#include "mem_file.h"

namespace {

// false when base + offset does not fit in s64
bool AddOffset(s64 base, s64 offset, s64& out) {
    if (offset > 0 && base > std::numeric_limits<s64>::max() - offset)
        return false;
    if (offset < 0 && base < std::numeric_limits<s64>::min() - offset)
        return false;
    out = base + offset;
    return true;
}

} // namespace

FsInfo MakeInfo(const Node& node) {
    FsInfo info;
    info.name = node.name;
    info.is_dir = node.is_dir;
    info.mode = node.mode;
    info.mod_time = node.last_modified;
    info.size = (s64)node.content.size();
    return info;
}

MemFile::MemFile(NodeTree* tree_, const NodeHandle& node_, int flags_)
    : tree(tree_), node(node_), flags(flags_) {
    const Node& n = tree->Get(node.index);
    path = n.path;
    name = n.name;
}

Node* MemFile::Live(const char* op, FsError& err) {
    if (closed) {
        err = FsError(op, path, EINVAL);
        return nullptr;
    }
    Node* n = tree->Resolve(node);
    if (n == nullptr)
        err = FsError(op, path, EBADF);
    return n;
}

FsIoResult MemFile::Read(u8* buf, std::size_t size) {
    FsIoResult result;
    Node* n = Live("read", result.error);
    if (n == nullptr)
        return result;
    if (n->is_dir) {
        result.error = FsError("read", path, EISDIR);
        return result;
    }
    if ((flags & O_ACCMODE) == O_WRONLY) {
        result.error = FsError("read", path, EBADF);
        return result;
    }
    if (cursor < 0) {
        result.error = FsError("read", path, EINVAL);
        return result;
    }

    const bytes& content = n->content;
    if ((u64)cursor >= content.size()) {
        result.end_of_stream = true;
        return result;
    }
    std::size_t count = std::min(size, content.size() - (std::size_t)cursor);
    if (count != 0)
        std::memcpy(buf, content.data() + cursor, count);
    cursor += (s64)count;
    result.count = count;
    return result;
}

FsIoResult MemFile::Write(const u8* buf, std::size_t size) {
    FsIoResult result;
    Node* n = Live("write", result.error);
    if (n == nullptr)
        return result;
    if (n->is_dir || (flags & O_ACCMODE) == O_RDONLY) {
        result.error = FsError("write", path, EBADF);
        return result;
    }

    bytes& content = n->content;
    if (flags & O_APPEND)
        cursor = (s64)content.size();
    if (cursor < 0) {
        result.error = FsError("write", path, EINVAL);
        return result;
    }

    if ((u64)cursor > content.max_size() || size > content.max_size() - (std::size_t)cursor) {
        result.error = FsError("write", path, EFBIG);
        return result;
    }

    // Writing past the end leaves a zero-filled gap.
    std::size_t end = (std::size_t)cursor + size;
    if (end > content.size()) {
        try {
            content.resize(end, 0);
        } catch (const std::bad_alloc&) {
            result.error = FsError("write", path, ENOMEM);
            return result;
        }
    }
    if (size != 0)
        std::memcpy(content.data() + cursor, buf, size);
    cursor += (s64)size;
    result.count = size;
    return result;
}

FsReturn<s64> MemFile::Seek(s64 offset, int whence) {
    FsReturn<s64> result;
    Node* n = Live("seek", result.error);
    if (n == nullptr)
        return result;
    s64 base;
    switch (whence) {
    case SEEK_SET:
        base = 0;
        break;
    case SEEK_CUR:
        base = cursor;
        break;
    case SEEK_END:
        base = (s64)n->content.size();
        break;
    default:
        result.error = FsError("seek", path, EINVAL);
        return result;
    }
    s64 target;
    if (!AddOffset(base, offset, target)) {
        result.error = FsError("seek", path, EINVAL);
        return result;
    }
    cursor = target;
    result.value = cursor;
    return result;
}

FsReturn<FsInfo> MemFile::Stat() {
    FsReturn<FsInfo> result;
    Node* n = Live("stat", result.error);
    if (n == nullptr)
        return result;
    result.value = MakeInfo(*n);
    return result;
}

FsError MemFile::Close() {
    if (closed)
        return FsError("close", path, EINVAL);
    closed = true;
    return {};
}

std::string MemFile::Name() const {
    return name;
}
