#pragma once
#include <functional>
#include "fs_error.h"
#include "node_tree.h"

// Returns SkipDir() to prune a directory, SkipAll() to stop the walk, any other error to
// abort it. The visitor may unlink the node it is given.
using NodeVisitor = std::function<FsError(const NodeHandle& node)>;

// Visits `start`, then its children in ascending path order, descending into each
// directory before moving on to the next sibling. Returns the error that stopped the
// walk; a WalkSkipAll result is passed through for the caller to swallow.
FsError WalkNodes(const NodeTree& tree, const NodeHandle& start, const NodeVisitor& visit);
