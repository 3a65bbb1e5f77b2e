#ifndef QUADRANT_RAMDISK_H
#define QUADRANT_RAMDISK_H

#include <cstdint>

#include "quadrant/config.h"

namespace quadrant {

// Fixed-size block device held entirely in memory.
class RamDisk {
public:
    RamDisk();

    void read(int block, uint8_t* out) const;
    void write(int block, const uint8_t* in);

    int num_blocks() const { return config::NUM_BLOCKS; }
    int block_size() const { return config::BLOCK_SIZE; }

private:
    uint8_t blocks[config::NUM_BLOCKS][config::BLOCK_SIZE];
};

}

#endif
