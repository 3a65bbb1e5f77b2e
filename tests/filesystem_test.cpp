#include <gtest/gtest.h>

#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

#include "quadrant/fixtures.h"
#include "quadrant/ramdisk.h"
#include "test_support.h"

using namespace quadrant;
using namespace quadrant::test_support;

namespace {

class FileSystemTest : public ::testing::Test {
protected:
    std::unique_ptr<FileSystem> fs{new FileSystem()};

    int store(const char* name, const std::string& data) {
        int fd = fs->open_create(name);
        if (fd < 0) return fd;
        int written = fs->write(fd, data.data(), (int)data.size());
        fs->close(fd);
        return written;
    }
};

}

TEST(RamDisk, ReadsBackWrittenBlock) {
    std::unique_ptr<RamDisk> disk(new RamDisk());
    uint8_t in[config::BLOCK_SIZE];
    uint8_t out[config::BLOCK_SIZE];
    for (int i = 0; i < config::BLOCK_SIZE; i++) in[i] = (uint8_t)i;
    disk->write(200, in);
    disk->read(200, out);
    EXPECT_EQ(0, memcmp(in, out, sizeof(in)));
    disk->read(199, out);
    EXPECT_EQ(0, out[5]);
}

TEST(RamDiskDeathTest, BlockOutOfRangeIsFatal) {
    std::unique_ptr<RamDisk> disk(new RamDisk());
    uint8_t out[config::BLOCK_SIZE];
    EXPECT_DEATH(disk->read(config::NUM_BLOCKS, out), "");
}

TEST_F(FileSystemTest, LayoutFitsInReservedBlocks) {
    EXPECT_EQ(config::NUM_BLOCKS - FileSystem::DATA_START, fs->free_blocks());
    EXPECT_GE(FileSystem::INODES_PER_BLOCK * FileSystem::INODE_BLOCKS, config::MAX_FILES_STORED);
    EXPECT_GE(FileSystem::ENTRIES_PER_BLOCK * FileSystem::DIR_BLOCKS, config::MAX_FILES_STORED);
}

TEST_F(FileSystemTest, WriteThenReadAcrossBlocks) {
    std::string data(700, 'q');
    data[0] = 'a';
    data[699] = 'z';
    EXPECT_EQ(700, store("big", data));
    EXPECT_EQ(700, fs->file_size("big"));
    EXPECT_EQ(data, read_file(*fs, "big"));
}

TEST_F(FileSystemTest, OpenCreateTruncatesAndFreesBlocks) {
    int before = fs->free_blocks();
    store("f", std::string(600, 'x'));
    EXPECT_EQ(before - 3, fs->free_blocks());
    store("f", "short");
    EXPECT_EQ(before - 1, fs->free_blocks());
    EXPECT_EQ("short", read_file(*fs, "f"));
}

TEST_F(FileSystemTest, AppendsAcrossWrites) {
    int fd = fs->open_create("log");
    ASSERT_GE(fd, 0);
    EXPECT_EQ(3, fs->write(fd, "abc", 3));
    EXPECT_EQ(3, fs->write(fd, "def", 3));
    EXPECT_EQ(FS_OK, fs->close(fd));
    EXPECT_EQ("abcdef", read_file(*fs, "log"));
}

TEST_F(FileSystemTest, ReadFromMissingFile) {
    EXPECT_EQ(FS_ERR_FILE_NOT_FOUND, fs->open_read("nope"));
}

TEST_F(FileSystemTest, RejectsBadNames) {
    EXPECT_EQ(FS_ERR_BAD_NAME, fs->open_create(""));
    EXPECT_EQ(FS_ERR_BAD_NAME, fs->open_create("elevenchars"));
    EXPECT_EQ(FS_ERR_BAD_NAME, fs->open_create("a b"));
    EXPECT_GE(fs->open_create("tenchars10"), 0);
}

TEST_F(FileSystemTest, DirectoryFullAfterThirtyFiles) {
    char name[8];
    for (int i = 0; i < config::MAX_FILES_STORED; i++) {
        snprintf(name, sizeof(name), "f%d", i);
        ASSERT_EQ(0, store(name, ""));
    }
    EXPECT_EQ(FS_ERR_DIRECTORY_FULL, fs->open_create("extra"));
    EXPECT_EQ(FS_ERR_DIRECTORY_FULL, fs->can_create("extra"));
    EXPECT_EQ(FS_OK, fs->can_create("f3"));

    DirectoryListing listing;
    EXPECT_EQ(config::MAX_FILES_STORED, fs->list_directory(listing));
    EXPECT_STREQ("f0", listing.names[0]);
}

TEST_F(FileSystemTest, TooManyOpenHandles) {
    ASSERT_EQ(1, store("shared", "x"));
    for (int i = 0; i < config::MAX_OPEN; i++) ASSERT_GE(fs->open_read("shared"), 0);
    EXPECT_EQ(FS_ERR_TOO_MANY_OPEN, fs->open_read("shared"));
    EXPECT_EQ(config::MAX_OPEN, fs->open_count());
}

TEST_F(FileSystemTest, RecreateWithNoFreeHandleLeavesFileIntact) {
    ASSERT_EQ(1, store("a", "1"));
    ASSERT_EQ(0, store("b", ""));
    for (int i = 0; i < config::MAX_OPEN; i++) ASSERT_GE(fs->open_read("b"), 0);
    int free_before = fs->free_blocks();

    EXPECT_EQ(FS_ERR_TOO_MANY_OPEN, fs->can_create("a"));
    EXPECT_EQ(FS_ERR_TOO_MANY_OPEN, fs->open_create("a"));
    EXPECT_EQ(1, fs->file_size("a"));
    EXPECT_EQ(free_before, fs->free_blocks());
    EXPECT_EQ(config::MAX_OPEN, fs->open_count());

    ASSERT_EQ(FS_OK, fs->close(0));
    EXPECT_EQ("1", read_file(*fs, "a"));
}

TEST_F(FileSystemTest, CanStoreCountsBlocksOfReplacedFile) {
    std::string chunk(config::MAX_FILE_BYTES, 'z');
    ASSERT_EQ(config::MAX_FILE_BYTES, store("a", chunk));
    ASSERT_EQ(config::MAX_FILE_BYTES, store("b", chunk));
    ASSERT_EQ(config::MAX_FILE_BYTES, store("c", chunk));
    int spare = fs->free_blocks() * config::BLOCK_SIZE;

    EXPECT_EQ(FS_OK, fs->can_store("a", config::MAX_FILE_BYTES));
    EXPECT_EQ(FS_OK, fs->can_store("new", spare));
    EXPECT_EQ(FS_ERR_DISK_FULL, fs->can_store("new", spare + 1));
    EXPECT_EQ(FS_ERR_FILE_TOO_BIG, fs->can_store("a", config::MAX_FILE_BYTES + 1));
    EXPECT_EQ(FS_ERR_BAD_NAME, fs->can_store("", 0));
    EXPECT_EQ(config::MAX_FILE_BYTES, fs->file_size("a"));
}

TEST_F(FileSystemTest, FileTooBigLeavesFileUntouched) {
    int fd = fs->open_create("huge");
    ASSERT_GE(fd, 0);
    std::string data(config::MAX_FILE_BYTES, 'h');
    EXPECT_EQ(config::MAX_FILE_BYTES, fs->write(fd, data.data(), (int)data.size()));
    int free_before = fs->free_blocks();
    EXPECT_EQ(FS_ERR_FILE_TOO_BIG, fs->write(fd, "!", 1));
    EXPECT_EQ(free_before, fs->free_blocks());
    fs->close(fd);
    EXPECT_EQ(config::MAX_FILE_BYTES, fs->file_size("huge"));
}

TEST_F(FileSystemTest, DiskFullIsCheckedBeforeAllocating) {
    std::string chunk(config::MAX_FILE_BYTES, 'd');
    ASSERT_EQ(config::MAX_FILE_BYTES, store("a", chunk));
    ASSERT_EQ(config::MAX_FILE_BYTES, store("b", chunk));
    ASSERT_EQ(config::MAX_FILE_BYTES, store("c", chunk));
    int remaining = fs->free_blocks();
    ASSERT_LT(remaining, config::MAX_FILE_BLOCKS);

    int fd = fs->open_create("d");
    EXPECT_EQ(FS_ERR_DISK_FULL, fs->write(fd, chunk.data(), (int)chunk.size()));
    EXPECT_EQ(remaining, fs->free_blocks());
    fs->close(fd);
    EXPECT_EQ(0, fs->file_size("d"));
}

TEST_F(FileSystemTest, HandleModesAreEnforced) {
    ASSERT_EQ(1, store("m", "1"));
    int rd = fs->open_read("m");
    char buf[4];
    EXPECT_EQ(FS_ERR_WRONG_MODE, fs->write(rd, "x", 1));
    EXPECT_EQ(FS_ERR_ALREADY_OPEN, fs->open_create("m"));
    fs->close(rd);

    int wr = fs->open_create("m");
    EXPECT_EQ(FS_ERR_WRONG_MODE, fs->read(wr, buf, sizeof(buf)));
    EXPECT_EQ(FS_ERR_ALREADY_OPEN, fs->open_read("m"));
    fs->close(wr);
    EXPECT_EQ(FS_ERR_BAD_HANDLE, fs->close(wr));
    EXPECT_EQ(FS_ERR_BAD_HANDLE, fs->read(99, buf, sizeof(buf)));
}

TEST_F(FileSystemTest, StrerrorNamesEveryStatus) {
    EXPECT_STREQ("directory full", fs_strerror(FS_ERR_DIRECTORY_FULL));
    EXPECT_STREQ("disk full", fs_strerror(FS_ERR_DISK_FULL));
    EXPECT_STREQ("unknown error", fs_strerror(-100));
}

TEST_F(FileSystemTest, FixturesAreSeeded) {
    ASSERT_EQ(FS_OK, seed_fixtures(*fs));
    EXPECT_EQ("print(\"Hello, world!\")", read_file(*fs, "hello"));
    EXPECT_EQ("print(1)\nprint(257)", read_file(*fs, "nums"));
    EXPECT_TRUE(fs->exists("average"));
    EXPECT_TRUE(fs->exists("pi"));
    EXPECT_EQ(0, fs->open_count());
}
