#include "dir_walker.h"

FsError WalkNodes(const NodeTree& tree, const NodeHandle& start, const NodeVisitor& visit) {
    FsError err = visit(start);
    if (err.code == WalkSkipDir)
        return {};
    if (err)
        return err;

    const Node* node = tree.Resolve(start);
    if (node == nullptr || !node->is_dir)
        return {};

    // Snapshot, the visitor is allowed to mutate the tree underneath us.
    for (const auto& child : tree.ListChildren(start.index)) {
        const Node* child_node = tree.Resolve(child);
        if (child_node == nullptr)
            continue;
        if (child_node->is_dir) {
            err = WalkNodes(tree, child, visit);
        } else {
            err = visit(child);
            // skipping from a file drops the rest of its directory
            if (err.code == WalkSkipDir)
                return {};
        }
        if (err)
            return err;
    }
    return {};
}
