#include "quadrant/filesystem.h"

#include "quadrant/klog.h"
#include "quadrant/kstring.h"

namespace quadrant {

static_assert(FileSystem::DATA_START < config::NUM_BLOCKS, "metadata leaves no room for data");
static_assert(config::NUM_BLOCKS <= 256, "block numbers are stored in one byte");
static_assert(config::NUM_BLOCKS <= config::BLOCK_SIZE * 8, "bitmap must fit one block");
static_assert(config::MAX_FILE_BYTES <= 0xFFFF, "file size is stored in 16 bits");

const char* fs_strerror(int status) {
    switch (status) {
        case FS_OK:                 return "ok";
        case FS_ERR_DIRECTORY_FULL: return "directory full";
        case FS_ERR_FILE_NOT_FOUND: return "file not found";
        case FS_ERR_TOO_MANY_OPEN:  return "too many open files";
        case FS_ERR_BAD_NAME:       return "bad file name";
        case FS_ERR_FILE_TOO_BIG:   return "file too big";
        case FS_ERR_DISK_FULL:      return "disk full";
        case FS_ERR_BAD_HANDLE:     return "bad handle";
        case FS_ERR_WRONG_MODE:     return "wrong open mode";
        case FS_ERR_ALREADY_OPEN:   return "file already open";
    }
    return "unknown error";
}

FileSystem::FileSystem() {
    format();
}

void FileSystem::format() {
    uint8_t zero[config::BLOCK_SIZE];
    k_memset(zero, 0, sizeof(zero));
    for (int b = 0; b < config::NUM_BLOCKS; b++) disk.write(b, zero);
    for (int b = 0; b < DATA_START; b++) set_block_used(b, true);
    k_memset(open_files, 0, sizeof(open_files));
}

// =============================================================================
// NAMES AND SLOTS
// =============================================================================

bool FileSystem::valid_name(const char* name) {
    size_t len = k_strlen(name);
    if (len == 0 || len > (size_t)config::MAX_FILENAME_BYTES) return false;
    for (size_t i = 0; i < len; i++) {
        if (!k_is_printable(name[i]) || name[i] == ' ') return false;
    }
    return true;
}

int FileSystem::blocks_for(int bytes) {
    return (bytes + config::BLOCK_SIZE - 1) / config::BLOCK_SIZE;
}

static bool entry_matches(const fs_dir_entry_t& entry, const char* name) {
    size_t len = k_strlen(name);
    if (len > (size_t)config::MAX_FILENAME_BYTES) return false;
    if (k_strncmp(entry.name, name, len) != 0) return false;
    return len == (size_t)config::MAX_FILENAME_BYTES || entry.name[len] == '\0';
}

void FileSystem::load_entry(int slot, fs_dir_entry_t& entry) const {
    uint8_t block[config::BLOCK_SIZE];
    disk.read(DIR_START + slot / ENTRIES_PER_BLOCK, block);
    k_memcpy(&entry, block + (slot % ENTRIES_PER_BLOCK) * sizeof(fs_dir_entry_t), sizeof(fs_dir_entry_t));
}

void FileSystem::store_entry(int slot, const fs_dir_entry_t& entry) {
    uint8_t block[config::BLOCK_SIZE];
    int b = DIR_START + slot / ENTRIES_PER_BLOCK;
    disk.read(b, block);
    k_memcpy(block + (slot % ENTRIES_PER_BLOCK) * sizeof(fs_dir_entry_t), &entry, sizeof(fs_dir_entry_t));
    disk.write(b, block);
}

void FileSystem::load_inode(int inode, fs_inode_t& out) const {
    uint8_t block[config::BLOCK_SIZE];
    disk.read(INODE_START + inode / INODES_PER_BLOCK, block);
    k_memcpy(&out, block + (inode % INODES_PER_BLOCK) * sizeof(fs_inode_t), sizeof(fs_inode_t));
}

void FileSystem::store_inode(int inode, const fs_inode_t& in) {
    uint8_t block[config::BLOCK_SIZE];
    int b = INODE_START + inode / INODES_PER_BLOCK;
    disk.read(b, block);
    k_memcpy(block + (inode % INODES_PER_BLOCK) * sizeof(fs_inode_t), &in, sizeof(fs_inode_t));
    disk.write(b, block);
}

int FileSystem::find_slot(const char* name) const {
    fs_dir_entry_t entry;
    for (int slot = 0; slot < config::MAX_FILES_STORED; slot++) {
        load_entry(slot, entry);
        if (entry.in_use && entry_matches(entry, name)) return slot;
    }
    return -1;
}

int FileSystem::find_free_slot() const {
    fs_dir_entry_t entry;
    for (int slot = 0; slot < config::MAX_FILES_STORED; slot++) {
        load_entry(slot, entry);
        if (!entry.in_use) return slot;
    }
    return -1;
}

int FileSystem::find_free_handle() const {
    for (int fd = 0; fd < config::MAX_OPEN; fd++) {
        if (!open_files[fd].in_use) return fd;
    }
    return -1;
}

bool FileSystem::slot_is_open(int slot, bool writers_only) const {
    for (int fd = 0; fd < config::MAX_OPEN; fd++) {
        const OpenFile& f = open_files[fd];
        if (f.in_use && f.inode == slot && (!writers_only || f.writing)) return true;
    }
    return false;
}

FileSystem::OpenFile* FileSystem::handle(int fd) {
    if (fd < 0 || fd >= config::MAX_OPEN || !open_files[fd].in_use) return nullptr;
    return &open_files[fd];
}

// =============================================================================
// FREE MAP
// =============================================================================

bool FileSystem::block_used(int block) const {
    uint8_t bitmap[config::BLOCK_SIZE];
    disk.read(0, bitmap);
    return (bitmap[block / 8] >> (block % 8)) & 1;
}

void FileSystem::set_block_used(int block, bool used) {
    uint8_t bitmap[config::BLOCK_SIZE];
    disk.read(0, bitmap);
    if (used) bitmap[block / 8] |= (uint8_t)(1 << (block % 8));
    else      bitmap[block / 8] &= (uint8_t)~(1 << (block % 8));
    disk.write(0, bitmap);
}

int FileSystem::allocate_block() {
    for (int b = DATA_START; b < config::NUM_BLOCKS; b++) {
        if (!block_used(b)) {
            set_block_used(b, true);
            return b;
        }
    }
    return -1;
}

void FileSystem::release_blocks(fs_inode_t& inode) {
    int held = blocks_for(inode.bytes_stored);
    for (int i = 0; i < held; i++) set_block_used(inode.blocks[i], false);
    k_memset(&inode, 0, sizeof(inode));
}

int FileSystem::free_blocks() const {
    int count = 0;
    for (int b = DATA_START; b < config::NUM_BLOCKS; b++) {
        if (!block_used(b)) count++;
    }
    return count;
}

// =============================================================================
// FILE OPERATIONS
// =============================================================================

int FileSystem::can_create(const char* name) const {
    if (!valid_name(name)) return FS_ERR_BAD_NAME;
    int slot = find_slot(name);
    if (slot >= 0) {
        if (find_free_handle() < 0) return FS_ERR_TOO_MANY_OPEN;
        return slot_is_open(slot, false) ? FS_ERR_ALREADY_OPEN : FS_OK;
    }
    if (find_free_slot() < 0) return FS_ERR_DIRECTORY_FULL;
    if (find_free_handle() < 0) return FS_ERR_TOO_MANY_OPEN;
    return FS_OK;
}

int FileSystem::can_store(const char* name, int len) const {
    int status = can_create(name);
    if (status != FS_OK) return status;
    if (len > config::MAX_FILE_BYTES) return FS_ERR_FILE_TOO_BIG;

    // Blocks of the file being replaced come back before the new data lands.
    int reclaimed = 0;
    int slot = find_slot(name);
    if (slot >= 0) {
        fs_inode_t inode;
        load_inode(slot, inode);
        reclaimed = blocks_for(inode.bytes_stored);
    }
    if (blocks_for(len) > free_blocks() + reclaimed) return FS_ERR_DISK_FULL;
    return FS_OK;
}

int FileSystem::open_create(const char* name) {
    int status = can_create(name);
    if (status != FS_OK) return status;

    int fd = find_free_handle();
    QUADRANT_ASSERT(fd >= 0, "no handle after can_create");
    int slot = find_slot(name);
    fs_inode_t inode;
    if (slot >= 0) {
        load_inode(slot, inode);
        release_blocks(inode);
        store_inode(slot, inode);
    } else {
        slot = find_free_slot();
        fs_dir_entry_t entry;
        k_memset(&entry, 0, sizeof(entry));
        k_memcpy(entry.name, name, k_strlen(name));
        entry.in_use = 1;
        store_entry(slot, entry);
        k_memset(&inode, 0, sizeof(inode));
        store_inode(slot, inode);
    }

    open_files[fd].in_use = true;
    open_files[fd].writing = true;
    open_files[fd].inode = slot;
    open_files[fd].offset = 0;
    return fd;
}

int FileSystem::open_read(const char* name) {
    if (!valid_name(name)) return FS_ERR_BAD_NAME;
    int slot = find_slot(name);
    if (slot < 0) return FS_ERR_FILE_NOT_FOUND;
    if (slot_is_open(slot, true)) return FS_ERR_ALREADY_OPEN;
    int fd = find_free_handle();
    if (fd < 0) return FS_ERR_TOO_MANY_OPEN;

    open_files[fd].in_use = true;
    open_files[fd].writing = false;
    open_files[fd].inode = slot;
    open_files[fd].offset = 0;
    return fd;
}

int FileSystem::write(int fd, const void* data, int len) {
    OpenFile* f = handle(fd);
    if (!f) return FS_ERR_BAD_HANDLE;
    if (!f->writing) return FS_ERR_WRONG_MODE;
    if (len <= 0) return 0;

    int end = f->offset + len;
    if (end > config::MAX_FILE_BYTES) return FS_ERR_FILE_TOO_BIG;

    fs_inode_t inode;
    load_inode(f->inode, inode);
    int held = blocks_for(inode.bytes_stored);
    int needed = blocks_for(end);
    if (needed - held > free_blocks()) return FS_ERR_DISK_FULL;

    for (int i = held; i < needed; i++) {
        int b = allocate_block();
        QUADRANT_ASSERT(b >= 0, "free map changed during write");
        inode.blocks[i] = (uint8_t)b;
    }

    const uint8_t* src = (const uint8_t*)data;
    uint8_t block[config::BLOCK_SIZE];
    int written = 0;
    while (written < len) {
        int pos = f->offset + written;
        int index = pos / config::BLOCK_SIZE;
        int within = pos % config::BLOCK_SIZE;
        int chunk = config::BLOCK_SIZE - within;
        if (chunk > len - written) chunk = len - written;

        disk.read(inode.blocks[index], block);
        k_memcpy(block + within, src + written, chunk);
        disk.write(inode.blocks[index], block);
        written += chunk;
    }

    f->offset = end;
    if (end > inode.bytes_stored) inode.bytes_stored = (uint16_t)end;
    store_inode(f->inode, inode);
    return written;
}

int FileSystem::read(int fd, void* buffer, int cap) {
    OpenFile* f = handle(fd);
    if (!f) return FS_ERR_BAD_HANDLE;
    if (f->writing) return FS_ERR_WRONG_MODE;

    fs_inode_t inode;
    load_inode(f->inode, inode);
    int available = inode.bytes_stored - f->offset;
    int n = cap < available ? cap : available;
    if (n <= 0) return 0;

    uint8_t* dst = (uint8_t*)buffer;
    uint8_t block[config::BLOCK_SIZE];
    int done = 0;
    while (done < n) {
        int pos = f->offset + done;
        int within = pos % config::BLOCK_SIZE;
        int chunk = config::BLOCK_SIZE - within;
        if (chunk > n - done) chunk = n - done;

        disk.read(inode.blocks[pos / config::BLOCK_SIZE], block);
        k_memcpy(dst + done, block + within, chunk);
        done += chunk;
    }
    f->offset += done;
    return done;
}

int FileSystem::close(int fd) {
    OpenFile* f = handle(fd);
    if (!f) return FS_ERR_BAD_HANDLE;
    f->in_use = false;
    return FS_OK;
}

int FileSystem::list_directory(DirectoryListing& out) const {
    fs_dir_entry_t entry;
    out.count = 0;
    for (int slot = 0; slot < config::MAX_FILES_STORED; slot++) {
        load_entry(slot, entry);
        if (!entry.in_use) continue;
        k_memcpy(out.names[out.count], entry.name, config::MAX_FILENAME_BYTES);
        out.names[out.count][config::MAX_FILENAME_BYTES] = '\0';
        out.count++;
    }
    return out.count;
}

bool FileSystem::exists(const char* name) const {
    return valid_name(name) && find_slot(name) >= 0;
}

int FileSystem::file_size(const char* name) const {
    if (!valid_name(name)) return FS_ERR_BAD_NAME;
    int slot = find_slot(name);
    if (slot < 0) return FS_ERR_FILE_NOT_FOUND;
    fs_inode_t inode;
    load_inode(slot, inode);
    return inode.bytes_stored;
}

int FileSystem::open_count() const {
    int n = 0;
    for (int fd = 0; fd < config::MAX_OPEN; fd++) {
        if (open_files[fd].in_use) n++;
    }
    return n;
}

}
