#include <cstring>
#include "fs_error.h"

std::string FsError::Message() const {
    std::string reason;
    switch (code) {
    case 0:
        reason = "success";
        break;
    case WalkSkipDir:
        reason = "skip this directory";
        break;
    case WalkSkipAll:
        reason = "skip everything and stop the walk";
        break;
    default:
        reason = std::strerror(code);
        break;
    }
    if (op.empty())
        return reason;
    return op + " " + path + ": " + reason;
}

FsError SkipDir() {
    return FsError("", "", WalkSkipDir);
}

FsError SkipAll() {
    return FsError("", "", WalkSkipAll);
}
