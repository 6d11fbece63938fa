#pragma once

#include <string>
#include <utility>
#include "common_types.h"

// Walk control codes. Negative so they never collide with an errno value.
enum : int {
    WalkSkipDir = -1,
    WalkSkipAll = -2,
};

class FsError {
public:
    FsError() = default;
    FsError(std::string op_, std::string path_, int code_)
        : op(std::move(op_)), path(std::move(path_)), code(code_) {}

    explicit operator bool() const {
        return code != 0;
    }

    bool Is(int errno_code) const {
        return code == errno_code;
    }

    // "open /a/b: No such file or directory"
    std::string Message() const;

    std::string op;
    std::string path;
    int code = 0;
};

FsError SkipDir();
FsError SkipAll();

template <typename T>
struct FsReturn {
    T value{};
    FsError error;
};

struct FsIoResult {
    std::size_t count = 0;
    bool end_of_stream = false;
    FsError error;
};
