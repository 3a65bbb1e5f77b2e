#ifndef QUADRANT_FIXTURES_H
#define QUADRANT_FIXTURES_H

#include "quadrant/filesystem.h"

namespace quadrant {

struct Fixture {
    const char* name;
    const char* source;
};

static constexpr int NUM_FIXTURES = 4;

// hello, nums, average, pi
const Fixture& fixture(int index);

// Writes every fixture into the file system. Returns FS_OK or the first
// failing status.
int seed_fixtures(FileSystem& fs);

}

#endif
