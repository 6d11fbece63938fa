#include <cerrno>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "mem_fs.h"

TEST(WalkTest, PreOrderLexicalDepthFirst) {
    MemFs fs({WithFile("/a/x", ToBytes("x")), WithFile("/a/b/y", ToBytes("y"))});
    std::vector<std::string> visited;
    FsError err = fs.WalkDir("/a", [&](const std::string& path, const FsInfo* info,
                                       const FsError& error) -> FsError {
        EXPECT_FALSE(error);
        EXPECT_NE(info, nullptr);
        visited.push_back(path);
        return {};
    });
    EXPECT_FALSE(err);
    EXPECT_EQ(visited, (std::vector<std::string>{"/a", "/a/b", "/a/b/y", "/a/x"}));
}

TEST(WalkTest, EntriesCarryMetadata) {
    MemFs fs({WithFile("/a/x", ToBytes("xyz"))});
    std::vector<FsInfo> infos;
    ASSERT_FALSE(fs.WalkDir("/", [&](const std::string&, const FsInfo* info,
                                     const FsError&) -> FsError {
        infos.push_back(*info);
        return {};
    }));
    ASSERT_EQ(infos.size(), 3u);
    EXPECT_TRUE(infos[0].is_dir);
    EXPECT_EQ(infos[0].name, "/");
    EXPECT_TRUE(infos[1].is_dir);
    EXPECT_EQ(infos[1].name, "a");
    EXPECT_FALSE(infos[2].is_dir);
    EXPECT_EQ(infos[2].size, 3);
}

TEST(WalkTest, SkipDirPrunesOnlyThatDirectory) {
    MemFs fs({WithFile("/a/x", ToBytes("x")), WithFile("/a/b/y", ToBytes("y"))});
    std::vector<std::string> visited;
    FsError err = fs.WalkDir("/a", [&](const std::string& path, const FsInfo*,
                                       const FsError&) -> FsError {
        visited.push_back(path);
        if (path == "/a/b")
            return SkipDir();
        return {};
    });
    EXPECT_FALSE(err);
    EXPECT_EQ(visited, (std::vector<std::string>{"/a", "/a/b", "/a/x"}));
}

TEST(WalkTest, SkipDirOnStartEndsWalkSuccessfully) {
    MemFs fs({WithFile("/a/x", {})});
    int calls = 0;
    FsError err = fs.WalkDir("/a", [&](const std::string&, const FsInfo*,
                                       const FsError&) -> FsError {
        ++calls;
        return SkipDir();
    });
    EXPECT_FALSE(err);
    EXPECT_EQ(calls, 1);
}

TEST(WalkTest, SkipDirFromFileSkipsRemainingSiblings) {
    MemFs fs({WithFile("/d/1", {}), WithFile("/d/2", {}), WithFile("/d/3", {})});
    std::vector<std::string> visited;
    FsError err = fs.WalkDir("/d", [&](const std::string& path, const FsInfo* info,
                                       const FsError&) -> FsError {
        visited.push_back(path);
        if (!info->is_dir)
            return SkipDir();
        return {};
    });
    EXPECT_FALSE(err);
    EXPECT_EQ(visited, (std::vector<std::string>{"/d", "/d/1"}));
}

TEST(WalkTest, SkipDirFromFileResumesInParent) {
    MemFs fs({WithFile("/a/b/1", {}), WithFile("/a/b/2", {}), WithFile("/a/c", {})});
    std::vector<std::string> visited;
    FsError err = fs.WalkDir("/a", [&](const std::string& path, const FsInfo*,
                                       const FsError&) -> FsError {
        visited.push_back(path);
        if (path == "/a/b/1")
            return SkipDir();
        return {};
    });
    EXPECT_FALSE(err);
    EXPECT_EQ(visited, (std::vector<std::string>{"/a", "/a/b", "/a/b/1", "/a/c"}));
}

TEST(WalkTest, SkipAllStopsImmediately) {
    MemFs fs({WithFile("/a/x", {}), WithFile("/a/b/y", {}), WithFile("/c", {})});
    std::vector<std::string> visited;
    FsError err = fs.WalkDir("/", [&](const std::string& path, const FsInfo*,
                                      const FsError&) -> FsError {
        visited.push_back(path);
        if (path == "/a/b/y")
            return SkipAll();
        return {};
    });
    EXPECT_FALSE(err);
    EXPECT_EQ(visited, (std::vector<std::string>{"/", "/a", "/a/b", "/a/b/y"}));
}

TEST(WalkTest, VisitorErrorAbortsAndIsReturned) {
    MemFs fs({WithFile("/a/x", {}), WithFile("/a/b/y", {})});
    std::vector<std::string> visited;
    FsError err = fs.WalkDir("/a", [&](const std::string& path, const FsInfo*,
                                       const FsError&) -> FsError {
        visited.push_back(path);
        if (path == "/a/b")
            return FsError("visit", path, EIO);
        return {};
    });
    EXPECT_TRUE(err.Is(EIO));
    EXPECT_EQ(err.path, "/a/b");
    EXPECT_EQ(visited, (std::vector<std::string>{"/a", "/a/b"}));
}

TEST(WalkTest, MissingRootReportsErrorOnce) {
    MemFs fs;
    int calls = 0;
    FsError err = fs.WalkDir("/nope/", [&](const std::string& path, const FsInfo* info,
                                           const FsError& error) -> FsError {
        ++calls;
        EXPECT_EQ(path, "/nope");
        EXPECT_EQ(info, nullptr);
        EXPECT_TRUE(error.Is(ENOENT));
        EXPECT_EQ(error.op, "lstat");
        return error;
    });
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(err.Is(ENOENT));
}

TEST(WalkTest, MissingRootErrorCanBeSuppressed) {
    MemFs fs;
    FsError err = fs.WalkDir("/nope", [](const std::string&, const FsInfo*,
                                         const FsError&) -> FsError { return SkipDir(); });
    EXPECT_FALSE(err);
    err = fs.WalkDir("/nope", [](const std::string&, const FsInfo*,
                                 const FsError&) -> FsError { return {}; });
    EXPECT_FALSE(err);
}

TEST(WalkTest, WalkOfSingleFile) {
    MemFs fs({WithFile("/f", {})});
    std::vector<std::string> visited;
    EXPECT_FALSE(fs.WalkDir("/f", [&](const std::string& path, const FsInfo*,
                                      const FsError&) -> FsError {
        visited.push_back(path);
        return {};
    }));
    EXPECT_EQ(visited, (std::vector<std::string>{"/f"}));
}

TEST(WalkTest, VisitorMayRemoveEntries) {
    MemFs fs({WithFile("/d/a", {}), WithFile("/d/b", {}), WithFile("/d/c", {})});
    std::vector<std::string> visited;
    EXPECT_FALSE(fs.WalkDir("/d", [&](const std::string& path, const FsInfo*,
                                      const FsError&) -> FsError {
        visited.push_back(path);
        if (path == "/d/a")
            return fs.Remove("/d/b");
        return {};
    }));
    EXPECT_EQ(visited, (std::vector<std::string>{"/d", "/d/a", "/d/c"}));
    EXPECT_TRUE(fs.Tree().Consistent());
}
