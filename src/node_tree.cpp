#include <cassert>
#include "node_tree.h"

NodeTree::NodeTree(u32 root_mode, Timestamp now) {
    slots.resize(2);
    Slot& root = slots[RootNode];
    root.in_use = true;
    root.linked = true;
    root.node.is_dir = true;
    root.node.path = "/";
    root.node.name = "/";
    root.node.mode = root_mode;
    root.node.last_modified = now;
    path_index["/"] = RootNode;
}

FsStat NodeTree::Find(const FsPath& path) const {
    FsStat s{NoNode, NoNode, FsResult::InvalidPath, {}};
    if (!path.is_valid)
        return s;

    u32 current = RootNode;
    std::string current_path;
    std::size_t remaining = path.steps.size();
    for (const auto& step : path.steps) {
        --remaining;
        if (!Get(current).is_dir) {
            s.result = FsResult::FileInPath;
            return s;
        }
        current_path += "/" + step;
        u32 next = Lookup(current_path);
        if (next == NoNode) {
            if (remaining != 0) {
                s.result = FsResult::PathNotFound;
                return s;
            }
            s.parent = current;
            s.name = step;
            s.result = FsResult::NotFound;
            return s;
        }
        current = next;
    }

    const Node& node = Get(current);
    s.parent = node.parent;
    s.index = current;
    s.name = node.name;
    s.result = node.is_dir ? FsResult::DirExists : FsResult::FileExists;
    return s;
}

u32 NodeTree::Lookup(const std::string& path) const {
    auto found = path_index.find(path);
    if (found == path_index.end())
        return NoNode;
    return found->second;
}

u32 NodeTree::MakeDir(const std::string& name, u32 parent, u32 mode, Timestamp now) {
    return Add(name, parent, true, mode, now);
}

u32 NodeTree::MakeFile(const std::string& name, u32 parent, u32 mode, Timestamp now) {
    return Add(name, parent, false, mode, now);
}

u32 NodeTree::Add(const std::string& name, u32 parent, bool is_dir, u32 mode, Timestamp now) {
    assert(IsLinked(parent) && Get(parent).is_dir);
    std::string path = (parent == RootNode ? "" : Get(parent).path) + "/" + name;
    assert(path_index.count(path) == 0);

    u32 index = Allocate();
    Slot& slot = slots[index];
    slot.in_use = true;
    slot.linked = true;
    slot.node = Node{};
    slot.node.is_dir = is_dir;
    slot.node.path = path;
    slot.node.name = name;
    slot.node.mode = mode;
    slot.node.last_modified = now;
    slot.node.parent = parent;

    Get(parent).children[path] = index;
    path_index[path] = index;
    return index;
}

void NodeTree::Unlink(u32 index) {
    assert(index != RootNode && IsLinked(index));
    Slot& slot = slots[index];
    path_index.erase(slot.node.path);
    if (IsLive(slot.node.parent))
        Get(slot.node.parent).children.erase(slot.node.path);
    slot.linked = false;
}

void NodeTree::Release(u32 index) {
    if (!IsLive(index))
        return;
    assert(index != RootNode);
    if (slots[index].linked)
        Unlink(index);

    // A released directory may still hold children that were never unlinked on their own.
    std::map<std::string, u32> children;
    children.swap(slots[index].node.children);
    for (const auto& [path, child] : children) {
        if (!IsLive(child) || Get(child).parent != index)
            continue;
        if (slots[child].linked) {
            path_index.erase(path);
            slots[child].linked = false;
        }
        Release(child);
    }

    Slot& slot = slots[index];
    slot.node = Node{};
    slot.in_use = false;
    slot.generation++;
    free_slots.push_back(index);
}

bool NodeTree::IsLinked(u32 index) const {
    return IsLive(index) && slots[index].linked;
}

bool NodeTree::IsLive(u32 index) const {
    return index != NoNode && index < slots.size() && slots[index].in_use;
}

Node& NodeTree::Get(u32 index) {
    assert(IsLive(index));
    return slots[index].node;
}

const Node& NodeTree::Get(u32 index) const {
    assert(IsLive(index));
    return slots[index].node;
}

NodeHandle NodeTree::Handle(u32 index) const {
    assert(IsLive(index));
    return NodeHandle{index, slots[index].generation};
}

Node* NodeTree::Resolve(const NodeHandle& handle) {
    if (!IsLive(handle.index) || slots[handle.index].generation != handle.generation)
        return nullptr;
    return &slots[handle.index].node;
}

const Node* NodeTree::Resolve(const NodeHandle& handle) const {
    if (!IsLive(handle.index) || slots[handle.index].generation != handle.generation)
        return nullptr;
    return &slots[handle.index].node;
}

std::vector<NodeHandle> NodeTree::ListChildren(u32 index) const {
    std::vector<NodeHandle> result;
    for (const auto& [path, child] : Get(index).children)
        result.push_back(Handle(child));
    return result;
}

bool NodeTree::Consistent() const {
    std::size_t linked = 0;
    for (u32 index = RootNode; index < slots.size(); ++index) {
        const Slot& slot = slots[index];
        if (!slot.in_use || !slot.linked)
            continue;
        ++linked;
        const Node& node = slot.node;
        if (Lookup(node.path) != index)
            return false;
        if (!node.is_dir && !node.children.empty())
            return false;
        for (const auto& [path, child] : node.children) {
            if (Lookup(path) != child)
                return false;
        }
        if (index == RootNode) {
            if (node.parent != NoNode || !node.is_dir)
                return false;
            continue;
        }
        if (!IsLinked(node.parent))
            return false;
        const Node& parent = Get(node.parent);
        std::string expected = (node.parent == RootNode ? "" : parent.path) + "/" + node.name;
        if (node.path != expected)
            return false;
        auto found = parent.children.find(node.path);
        if (found == parent.children.end() || found->second != index)
            return false;
    }
    return linked == path_index.size();
}

u32 NodeTree::Allocate() {
    if (!free_slots.empty()) {
        u32 index = free_slots.back();
        free_slots.pop_back();
        return index;
    }
    slots.emplace_back();
    return (u32)(slots.size() - 1);
}
