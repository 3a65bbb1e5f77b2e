#ifndef QUADRANT_FILESYSTEM_H
#define QUADRANT_FILESYSTEM_H

#include <cstdint>

#include "quadrant/config.h"
#include "quadrant/ramdisk.h"

namespace quadrant {

// Negative results of the file system calls. Handles and byte counts are
// returned as non-negative ints on success.
enum FsStatus {
    FS_OK                 =  0,
    FS_ERR_DIRECTORY_FULL = -1,
    FS_ERR_FILE_NOT_FOUND = -2,
    FS_ERR_TOO_MANY_OPEN  = -3,
    FS_ERR_BAD_NAME       = -4,
    FS_ERR_FILE_TOO_BIG   = -5,
    FS_ERR_DISK_FULL      = -6,
    FS_ERR_BAD_HANDLE     = -7,
    FS_ERR_WRONG_MODE     = -8,
    FS_ERR_ALREADY_OPEN   = -9,
};

const char* fs_strerror(int status);

// --- On-disk structures ---

struct fs_inode_t {
    uint16_t bytes_stored;
    uint8_t  blocks[config::MAX_FILE_BLOCKS];
} __attribute__((packed));

struct fs_dir_entry_t {
    char    name[config::MAX_FILENAME_BYTES];  // NUL padded, not terminated at full length
    uint8_t in_use;
    uint8_t reserved;
} __attribute__((packed));

struct DirectoryListing {
    int  count;
    char names[config::MAX_FILES_STORED][config::MAX_FILENAME_BYTES + 1];
};

// Block file system over a private RAM disk.
//
//   block 0                      free-block bitmap
//   INODE_START..DIR_START-1     inode table, inode i belongs to directory slot i
//   DIR_START..DATA_START-1      directory table
//   DATA_START..                 file data
class FileSystem {
public:
    static constexpr int INODES_PER_BLOCK = config::BLOCK_SIZE / (int)sizeof(fs_inode_t);
    static constexpr int INODE_START      = 1;
    static constexpr int INODE_BLOCKS     = (config::MAX_FILES_STORED + INODES_PER_BLOCK - 1) / INODES_PER_BLOCK;
    static constexpr int ENTRIES_PER_BLOCK = config::BLOCK_SIZE / (int)sizeof(fs_dir_entry_t);
    static constexpr int DIR_START        = INODE_START + INODE_BLOCKS;
    static constexpr int DIR_BLOCKS       = (config::MAX_FILES_STORED + ENTRIES_PER_BLOCK - 1) / ENTRIES_PER_BLOCK;
    static constexpr int DATA_START       = DIR_START + DIR_BLOCKS;

    FileSystem();

    void format();

    // Creates the file, or truncates it when it already exists.
    int open_create(const char* name);
    int open_read(const char* name);

    // Appends at the handle's offset. Capacity is checked first, so a failed
    // write leaves the file and the free map untouched.
    int write(int fd, const void* data, int len);
    int read(int fd, void* buffer, int cap);
    int close(int fd);

    int  list_directory(DirectoryListing& out) const;
    bool exists(const char* name) const;
    int  can_create(const char* name) const;

    // Whether open_create(name) followed by a write of len bytes would
    // succeed. Nothing is changed either way.
    int  can_store(const char* name, int len) const;
    int  file_size(const char* name) const;
    int  free_blocks() const;
    int  open_count() const;

private:
    struct OpenFile {
        bool in_use;
        bool writing;
        int  inode;
        int  offset;
    };

    RamDisk  disk;
    OpenFile open_files[config::MAX_OPEN];

    static bool valid_name(const char* name);
    static int  blocks_for(int bytes);

    int  find_slot(const char* name) const;
    int  find_free_slot() const;
    int  find_free_handle() const;
    bool slot_is_open(int slot, bool writers_only) const;

    void load_entry(int slot, fs_dir_entry_t& entry) const;
    void store_entry(int slot, const fs_dir_entry_t& entry);
    void load_inode(int inode, fs_inode_t& out) const;
    void store_inode(int inode, const fs_inode_t& in);

    bool block_used(int block) const;
    void set_block_used(int block, bool used);
    int  allocate_block();
    void release_blocks(fs_inode_t& inode);
    OpenFile* handle(int fd);
};

}

#endif
