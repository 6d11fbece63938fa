#pragma once
#include <deque>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>
#include "bytes.h"
#include "clock.h"
#include "fs_interface.h"

static constexpr u32 NoNode = 0;
static constexpr u32 RootNode = 1;

// Stable reference to a node. Goes stale once the node is released, even if the slot
// is reused for another node.
struct NodeHandle {
    u32 index = NoNode;
    u32 generation = 0;
    bool operator==(const NodeHandle& other) const {
        return index == other.index && generation == other.generation;
    }
};

struct Node {
    bool is_dir = false;
    std::string path;
    std::string name;
    bytes content;
    u32 mode = 0;
    Timestamp last_modified;
    u32 parent = NoNode;
    // canonical path -> node index, directories only
    std::map<std::string, u32> children;
};

class NodeTree {
public:
    NodeTree(u32 root_mode, Timestamp now);

    // Classifies `path` against the tree. Never mutates.
    FsStat Find(const FsPath& path) const;

    // Flat index lookup by canonical path. NoNode if absent.
    u32 Lookup(const std::string& path) const;

    // Precondition:
    //    - `parent` is a linked directory
    //    - there is no entry in `parent` named `name`
    u32 MakeDir(const std::string& name, u32 parent, u32 mode, Timestamp now);
    u32 MakeFile(const std::string& name, u32 parent, u32 mode, Timestamp now);

    // Removes `index` from the flat index and from its parent's children. The node and
    // its own children stay addressable until Release.
    // Precondition:
    //    - `index` is linked and is not the root
    void Unlink(u32 index);

    // Frees `index` and every descendant still hanging below it.
    void Release(u32 index);

    bool IsLinked(u32 index) const;
    bool IsLive(u32 index) const;

    Node& Get(u32 index);
    const Node& Get(u32 index) const;
    NodeHandle Handle(u32 index) const;

    // nullptr if the node behind `handle` has been released
    Node* Resolve(const NodeHandle& handle);
    const Node* Resolve(const NodeHandle& handle) const;

    // Immediate children, ascending by canonical path.
    std::vector<NodeHandle> ListChildren(u32 index) const;

    std::size_t LinkedCount() const {
        return path_index.size();
    }

    // True when the flat index and the parent/children links describe the same tree.
    bool Consistent() const;

private:
    struct Slot {
        Node node;
        u32 generation = 0;
        bool in_use = false;
        bool linked = false;
    };

    std::deque<Slot> slots;
    std::vector<u32> free_slots;
    std::unordered_map<std::string, u32> path_index;

    u32 Allocate();
    u32 Add(const std::string& name, u32 parent, bool is_dir, u32 mode, Timestamp now);
};
