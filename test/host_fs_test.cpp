#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <gtest/gtest.h>
#include "host_fs.h"

class HostFsTest : public ::testing::Test {
protected:
    void SetUp() override {
        char pattern[] = "/tmp/memfs_test_XXXXXX";
        ASSERT_NE(mkdtemp(pattern), nullptr);
        root = pattern;
    }

    void TearDown() override {
        EXPECT_FALSE(fs.RemoveAll(root));
    }

    std::string At(const std::string& relative) const {
        return root + "/" + relative;
    }

    HostFs fs;
    std::string root;
};

TEST_F(HostFsTest, WriteFileThenReadFile) {
    bytes payload{1, 2, 3, 0, 'z'};
    ASSERT_FALSE(fs.WriteFile(At("f"), payload, 0644));
    auto content = fs.ReadFile(At("f"));
    ASSERT_FALSE(content.error);
    EXPECT_EQ(content.value, payload);

    auto info = fs.Stat(At("f"));
    ASSERT_FALSE(info.error);
    EXPECT_FALSE(info.value.is_dir);
    EXPECT_EQ(info.value.size, 5);
    EXPECT_EQ(info.value.name, "f");
}

TEST_F(HostFsTest, DescriptorIo) {
    auto created = fs.Create(At("f"));
    ASSERT_FALSE(created.error);
    auto& file = created.value;
    EXPECT_EQ(file->Write((const u8*)"hello", 5).count, 5u);
    EXPECT_EQ(file->Seek(1, SEEK_SET).value, 1);

    u8 buf[8];
    auto r = file->Read(buf, sizeof(buf));
    ASSERT_FALSE(r.error);
    EXPECT_EQ(std::string((char*)buf, r.count), "ello");
    EXPECT_TRUE(file->Read(buf, sizeof(buf)).end_of_stream);

    EXPECT_FALSE(file->Close());
    EXPECT_TRUE(file->Close().Is(EINVAL));
}

TEST_F(HostFsTest, ErrorsCarryErrno) {
    EXPECT_TRUE(fs.Stat(At("missing")).error.Is(ENOENT));
    EXPECT_TRUE(fs.Open(At("missing")).error.Is(ENOENT));
    ASSERT_FALSE(fs.WriteFile(At("f"), {}, 0644));
    EXPECT_TRUE(fs.OpenFile(At("f"), O_RDWR | O_CREAT | O_EXCL, 0644).error.Is(EEXIST));
    EXPECT_TRUE(fs.Stat(At("f/x")).error.Is(ENOTDIR));
}

TEST_F(HostFsTest, TruncateAndRemove) {
    ASSERT_FALSE(fs.WriteFile(At("f"), {'a', 'b', 'c'}, 0644));
    ASSERT_FALSE(fs.Truncate(At("f"), 1));
    EXPECT_EQ(fs.ReadFile(At("f")).value, (bytes{'a'}));

    ASSERT_EQ(::mkdir(At("d").c_str(), 0755), 0);
    ASSERT_FALSE(fs.WriteFile(At("d/inner"), {}, 0644));
    EXPECT_TRUE(fs.Remove(At("d")).Is(ENOTEMPTY));
    ASSERT_FALSE(fs.Remove(At("d/inner")));
    ASSERT_FALSE(fs.Remove(At("d")));
    ASSERT_FALSE(fs.Remove(At("f")));
    EXPECT_TRUE(fs.Remove(At("f")).Is(ENOENT));
}

TEST_F(HostFsTest, WalkMatchesEngineOrder) {
    ASSERT_EQ(::mkdir(At("a").c_str(), 0755), 0);
    ASSERT_EQ(::mkdir(At("a/b").c_str(), 0755), 0);
    ASSERT_FALSE(fs.WriteFile(At("a/x"), {}, 0644));
    ASSERT_FALSE(fs.WriteFile(At("a/b/y"), {}, 0644));

    std::vector<std::string> visited;
    FsError err = fs.WalkDir(At("a"), [&](const std::string& path, const FsInfo*,
                                          const FsError& error) -> FsError {
        EXPECT_FALSE(error);
        visited.push_back(path.substr(root.size()));
        return {};
    });
    EXPECT_FALSE(err);
    EXPECT_EQ(visited, (std::vector<std::string>{"/a", "/a/b", "/a/b/y", "/a/x"}));
}

TEST_F(HostFsTest, SkipDirFromFileSkipsRemainingSiblings) {
    ASSERT_EQ(::mkdir(At("d").c_str(), 0755), 0);
    ASSERT_FALSE(fs.WriteFile(At("d/1"), {}, 0644));
    ASSERT_FALSE(fs.WriteFile(At("d/2"), {}, 0644));

    std::vector<std::string> visited;
    FsError err = fs.WalkDir(At("d"), [&](const std::string& path, const FsInfo* info,
                                          const FsError&) -> FsError {
        visited.push_back(path.substr(root.size()));
        if (!info->is_dir)
            return SkipDir();
        return {};
    });
    EXPECT_FALSE(err);
    EXPECT_EQ(visited, (std::vector<std::string>{"/d", "/d/1"}));
}

TEST_F(HostFsTest, ReadLoopsUntilEndOfStream) {
    bytes payload(10000, 'q');
    ASSERT_FALSE(fs.WriteFile(At("big"), payload, 0644));
    auto content = fs.ReadFile(At("big"));
    ASSERT_FALSE(content.error) << content.error.Message();
    EXPECT_EQ(content.value, payload);
}

TEST_F(HostFsTest, RemoveAllTree) {
    ASSERT_EQ(::mkdir(At("t").c_str(), 0755), 0);
    ASSERT_EQ(::mkdir(At("t/u").c_str(), 0755), 0);
    ASSERT_FALSE(fs.WriteFile(At("t/u/f"), {'1'}, 0644));
    ASSERT_FALSE(fs.RemoveAll(At("t")));
    EXPECT_TRUE(fs.Stat(At("t")).error.Is(ENOENT));
    EXPECT_FALSE(fs.RemoveAll(At("t")));
}
