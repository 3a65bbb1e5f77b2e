#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "test_support.h"

using namespace quadrant;
using namespace quadrant::test_support;

namespace {

class DocumentWindowTest : public ::testing::Test {
protected:
    std::unique_ptr<DocumentWindow> win{new DocumentWindow()};

    void SetUp() override {
        win->init(0);
        win->set_active(true);
    }

    // Steps the program until it blocks or ends.
    void run_program(int max_ticks = 100000) {
        for (int i = 0; i < max_ticks && win->is_runnable(); i++) win->run_tick();
    }

    std::string row(int r) const { return row_text(win->buffer(), r); }
};

}

TEST_F(DocumentWindowTest, StartsInDirectoryWithFixtures) {
    EXPECT_EQ(WINDOW_DISPLAYING_FILES, win->status());
    DirectoryListing listing;
    ASSERT_EQ(4, win->storage().list_directory(listing));
    EXPECT_STREQ("hello", listing.names[0]);
    EXPECT_STREQ("nums", listing.names[1]);
    EXPECT_STREQ("average", listing.names[2]);
    EXPECT_STREQ("pi", listing.names[3]);
    EXPECT_EQ(1, win->start_col());
    EXPECT_EQ(2, win->start_row());
}

TEST_F(DocumentWindowTest, HighlightMovesAndClamps) {
    press(*win, KEY_ARROW_LEFT);
    EXPECT_EQ(0, win->highlighted());
    for (int i = 0; i < 6; i++) press(*win, KEY_ARROW_RIGHT);
    EXPECT_EQ(3, win->highlighted());
    press(*win, KEY_ARROW_UP);
    EXPECT_EQ(0, win->highlighted());
    press(*win, KEY_ARROW_RIGHT);
    press(*win, KEY_ARROW_DOWN);
    EXPECT_EQ(3, win->highlighted());
}

TEST_F(DocumentWindowTest, InactiveWindowIgnoresKeys) {
    win->set_active(false);
    press(*win, KEY_ARROW_RIGHT);
    type_text(*win, "e");
    EXPECT_EQ(0, win->highlighted());
    EXPECT_EQ(WINDOW_DISPLAYING_FILES, win->status());
}

TEST_F(DocumentWindowTest, PrintableKeysIgnoredInDirectory) {
    type_text(*win, "xyz\n");
    EXPECT_EQ(WINDOW_DISPLAYING_FILES, win->status());
    EXPECT_TRUE(win->buffer().is_empty(0));
}

TEST_F(DocumentWindowTest, EditLoadsHighlightedFile) {
    ASSERT_TRUE(highlight_file(*win, "nums"));
    type_text(*win, "e");
    EXPECT_EQ(WINDOW_EDITING_FILE, win->status());
    EXPECT_STREQ("nums", win->filename());
    EXPECT_TRUE(win->has_named_edit());
    EXPECT_EQ("print(1)", row(0));
    EXPECT_EQ("print(257)", row(1));

    press(*win, KEY_ARROW_DOWN);
    press(*win, KEY_ARROW_RIGHT);
    type_text(*win, "X");
    EXPECT_EQ("pXrint(257)", row(1));

    char out[64];
    win->serialize(out, sizeof(out));
    EXPECT_STREQ("print(1)\npXrint(257)", out);
}

TEST_F(DocumentWindowTest, RunsProgramToOutput) {
    ASSERT_TRUE(highlight_file(*win, "nums"));
    type_text(*win, "r");
    EXPECT_EQ(WINDOW_EXECUTING_FILE, win->status());
    EXPECT_TRUE(win->program_running());
    EXPECT_TRUE(win->has_program());

    run_program();
    EXPECT_EQ(WINDOW_DISPLAYING_OUTPUT, win->status());
    EXPECT_FALSE(win->program_running());
    EXPECT_FALSE(win->has_program());
    EXPECT_EQ("1", row(0));
    EXPECT_EQ("257", row(1));

    type_text(*win, "e");
    EXPECT_EQ(WINDOW_DISPLAYING_OUTPUT, win->status());
    type_text(*win, "r");
    EXPECT_EQ(WINDOW_DISPLAYING_FILES, win->status());
    EXPECT_TRUE(win->buffer().is_empty(0));
}

TEST_F(DocumentWindowTest, AverageProgramTakesInput) {
    ASSERT_TRUE(highlight_file(*win, "average"));
    type_text(*win, "r");
    run_program();
    ASSERT_EQ(WINDOW_AWAITING_INPUT, win->status());
    EXPECT_FALSE(win->is_runnable());
    EXPECT_EQ("Enter a number:", row(0));
    EXPECT_EQ(config::INPUT_ROW, win->buffer().current_row());

    type_text(*win, "5");
    EXPECT_EQ("5", row(config::INPUT_ROW));
    type_text(*win, "\n");
    EXPECT_EQ(WINDOW_EXECUTING_FILE, win->status());
    EXPECT_EQ("5", row(1));
    EXPECT_TRUE(win->buffer().is_empty(config::INPUT_ROW));

    run_program();
    ASSERT_EQ(WINDOW_AWAITING_INPUT, win->status());
    type_text(*win, "quit\n");
    run_program();
    EXPECT_EQ(WINDOW_DISPLAYING_OUTPUT, win->status());
    EXPECT_EQ("5", row(4));
}

TEST_F(DocumentWindowTest, InputRowIsBounded) {
    ASSERT_TRUE(highlight_file(*win, "average"));
    type_text(*win, "r");
    run_program();
    type_text(*win, std::string(LineBuffer::WIDTH + 7, '9').c_str());
    EXPECT_EQ(LineBuffer::WIDTH, win->buffer().num_letters());
    EXPECT_EQ(config::INPUT_ROW, win->buffer().current_row());
    type_text(*win, "\b");
    EXPECT_EQ(LineBuffer::WIDTH - 1, win->buffer().num_letters());
}

TEST_F(DocumentWindowTest, LongPrintsWrapAndOutputScrolls) {
    std::string text(LineBuffer::WIDTH + 5, 'w');
    win->print(text.c_str(), (int)text.size());
    EXPECT_EQ(std::string(LineBuffer::WIDTH, 'w'), row(0));
    EXPECT_EQ("wwwww", row(1));

    win->print("a\nb", 3);
    EXPECT_EQ("a", row(2));
    EXPECT_EQ("b", row(3));

    for (int i = 0; i < 8; i++) {
        std::string line = "line" + std::to_string(i);
        win->print(line.c_str(), (int)line.size());
    }
    EXPECT_EQ("b", row(0));
    EXPECT_EQ("line7", row(config::OUTPUT_ROWS - 1));
    EXPECT_TRUE(win->buffer().is_empty(config::INPUT_ROW));
}

TEST_F(DocumentWindowTest, CloseStopsProgram) {
    ASSERT_TRUE(highlight_file(*win, "pi"));
    type_text(*win, "r");
    run_program();
    ASSERT_EQ(WINDOW_AWAITING_INPUT, win->status());
    win->close_to_directory();
    EXPECT_EQ(WINDOW_DISPLAYING_FILES, win->status());
    EXPECT_FALSE(win->program_running());
    EXPECT_FALSE(win->has_program());
    EXPECT_TRUE(win->buffer().is_empty(0));
}

TEST_F(DocumentWindowTest, LoadFailureLeavesDirectoryWithNotice) {
    for (int i = 0; i < config::MAX_OPEN; i++) ASSERT_GE(win->storage().open_read("pi"), 0);
    type_text(*win, "e");
    EXPECT_EQ(WINDOW_DISPLAYING_FILES, win->status());
    EXPECT_STREQ("too many open files", win->notice());
    press(*win, KEY_ARROW_RIGHT);
    EXPECT_STREQ("", win->notice());
}

TEST_F(DocumentWindowTest, StoredGarbageIsTruncatedToValidPrefix) {
    ASSERT_EQ(FS_OK, win->store_file("bad", "print(1)\x02rest", 13));
    ASSERT_TRUE(highlight_file(*win, "bad"));
    type_text(*win, "e");
    EXPECT_EQ("print(1)", row(0));
    EXPECT_TRUE(win->buffer().is_empty(1));
}

TEST_F(DocumentWindowTest, RendersOutlineLabelAndListing) {
    TextGrid grid;
    win->render(grid);
    EXPECT_EQ('*', grid.char_at(0, 1));
    EXPECT_TRUE(grid.color_at(0, 1) == Palette::inverse());
    EXPECT_EQ('*', grid.char_at(1 + LineBuffer::WIDTH, 2 + LineBuffer::HEIGHT));
    EXPECT_EQ("F1", grid_text(grid, 16, 1, 2));
    EXPECT_EQ("hello", grid_text(grid, 1, 2, 5));
    EXPECT_TRUE(grid.color_at(1, 2) == Palette::inverse());
    EXPECT_EQ("nums", grid_text(grid, 11, 2, 4));
    EXPECT_TRUE(grid.color_at(11, 2) == Palette::normal());
    EXPECT_EQ("pi", grid_text(grid, 1, 3, 2));

    win->set_active(false);
    win->render(grid);
    EXPECT_TRUE(grid.color_at(0, 1) == Palette::normal());
}

TEST_F(DocumentWindowTest, RendersEditorCursor) {
    type_text(*win, "e");
    TextGrid grid;
    win->render(grid);
    EXPECT_TRUE(grid.color_at(1, 2) == Palette::cursor());
    EXPECT_EQ("rint(\"Hello, world!\")", grid_text(grid, 2, 2, 32));
}
