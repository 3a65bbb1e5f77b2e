#ifndef QUADRANT_CONFIG_H
#define QUADRANT_CONFIG_H

// =============================================================================
// WORKSPACE CONFIGURATION
// =============================================================================

// Host tunables. Both are overridable from the build (see CMakeLists.txt).
#ifndef QUADRANT_TIMER_HZ
#define QUADRANT_TIMER_HZ 30
#endif

#ifndef QUADRANT_POLLS_PER_TICK
#define QUADRANT_POLLS_PER_TICK 500
#endif

namespace quadrant {
namespace config {
    // Screen
    constexpr int SCREEN_WIDTH        = 80;
    constexpr int SCREEN_HEIGHT       = 25;
    constexpr int STATUS_ROW          = SCREEN_HEIGHT - 1;

    // Window layout
    constexpr int NUM_WINDOWS         = 4;
    constexpr int TASK_MANAGER_WIDTH  = 10;
    constexpr int WIN_REGION_WIDTH    = SCREEN_WIDTH - TASK_MANAGER_WIDTH;
    constexpr int WINDOW_WIDTH        = (WIN_REGION_WIDTH - 3) / 2;
    constexpr int WINDOW_HEIGHT       = 10;
    constexpr int INPUT_ROW           = WINDOW_HEIGHT - 1;
    constexpr int OUTPUT_ROWS         = WINDOW_HEIGHT - 1;
    constexpr int TASK_MANAGER_COL    = WIN_REGION_WIDTH + 1;

    constexpr int WINDOW_START_COL[NUM_WINDOWS] = { 1, 36, 1, 36 };
    constexpr int WINDOW_START_ROW[NUM_WINDOWS] = { 2, 2, 14, 14 };
    constexpr int WINDOW_LABEL_COL[NUM_WINDOWS] = { 16, 52, 16, 52 };
    constexpr int WINDOW_LABEL_ROW[NUM_WINDOWS] = { 1, 1, 13, 13 };

    // Directory listing: three names per row
    constexpr int LISTING_COLUMNS     = 3;
    constexpr int LISTING_COL_WIDTH   = 10;

    // Storage
    constexpr int MAX_OPEN            = 16;
    constexpr int BLOCK_SIZE          = 256;
    constexpr int NUM_BLOCKS          = 255;
    constexpr int MAX_FILE_BLOCKS     = 64;
    constexpr int MAX_FILE_BYTES      = MAX_FILE_BLOCKS * BLOCK_SIZE;
    constexpr int MAX_FILES_STORED    = 30;
    constexpr int MAX_FILENAME_BYTES  = 10;

    // Interpreter
    constexpr int MAX_TOKENS          = 128;
    constexpr int MAX_LITERAL_CHARS   = 15;
    constexpr int STACK_DEPTH         = 20;
    constexpr int MAX_LOCAL_VARS      = 10;
    constexpr int MAX_CODE_BYTES      = 512;
    constexpr int MAX_CONSTANTS       = 48;
    constexpr int MAX_STRING_CHARS    = WINDOW_WIDTH;

    // Logging
    constexpr int LOG_RING_LINES      = 16;
    constexpr int LOG_LINE_CHARS      = 96;
}
}

#endif
