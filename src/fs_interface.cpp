#include "fs_interface.h"

FsPath::FsPath(const std::string& path) {
    if (path.empty())
        return;

    const char* str = path.c_str();
    while (true) {
        while (*str == '/')
            str++;

        if (*str == '\0')
            break;

        std::string new_step;
        while (*str != '/' && *str != '\0')
            new_step += *(str++);

        if (new_step == ".")
            continue;

        if (new_step == "..") {
            // ".." at the root stays at the root
            if (!steps.empty())
                steps.pop_back();
        } else {
            steps.push_back(new_step);
        }
    }

    dir_marked = path.back() == '/' && !steps.empty();
    is_valid = true;
}

std::string FsPath::Canonical() const {
    if (steps.empty())
        return "/";
    std::string result;
    for (const auto& step : steps)
        result += "/" + step;
    return result;
}

std::string FsPath::Base() const {
    if (steps.empty())
        return "/";
    return steps.back();
}

FsFileInterface::~FsFileInterface() {}

FsInterface::~FsInterface() {}
