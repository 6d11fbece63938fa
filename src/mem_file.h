#pragma once
#include <string>
#include "fs_interface.h"
#include "node_tree.h"

FsInfo MakeInfo(const Node& node);

// Open handle on a node of a NodeTree. The node is shared with every other handle on
// it; only the cursor is private. The handle must not outlive the tree.
class MemFile : public FsFileInterface {
public:
    MemFile(NodeTree* tree_, const NodeHandle& node_, int flags_);

    FsIoResult Read(u8* buf, std::size_t size) override;
    FsIoResult Write(const u8* buf, std::size_t size) override;
    FsReturn<s64> Seek(s64 offset, int whence) override;
    FsReturn<FsInfo> Stat() override;
    FsError Close() override;
    std::string Name() const override;

private:
    NodeTree* tree;
    NodeHandle node;
    std::string path;
    std::string name;
    s64 cursor = 0;
    int flags;
    bool closed = false;

    // nullptr with `err` set if the handle is closed or its node has been removed
    Node* Live(const char* op, FsError& err);
};
