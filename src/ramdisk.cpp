#include "quadrant/ramdisk.h"

#include "quadrant/klog.h"
#include "quadrant/kstring.h"

namespace quadrant {

RamDisk::RamDisk() {
    k_memset(blocks, 0, sizeof(blocks));
}

void RamDisk::read(int block, uint8_t* out) const {
    QUADRANT_ASSERT(block >= 0 && block < config::NUM_BLOCKS, "ramdisk read out of range");
    k_memcpy(out, blocks[block], config::BLOCK_SIZE);
}

void RamDisk::write(int block, const uint8_t* in) {
    QUADRANT_ASSERT(block >= 0 && block < config::NUM_BLOCKS, "ramdisk write out of range");
    k_memcpy(blocks[block], in, config::BLOCK_SIZE);
}

}
