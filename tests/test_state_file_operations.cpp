// Google Test for reading and writing state files
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "state.hpp"
#include "state_file_operations.hpp"

namespace fs = std::filesystem;

static fs::path temp_state_path(const std::string& name) {
    return fs::temp_directory_path() / ("8-puzzle-test-" + name + ".state");
}

TEST(StateFile, WriteThenRead) {
    fs::path p = temp_state_path("roundtrip");
    State s(std::vector<int>{8, 6, 7, 2, 5, 4, 3, 0, 1});
    write_state_to_file(s, p.string());
    EXPECT_EQ(read_state_from_file(p.string()), s);
    fs::remove(p);
}

TEST(StateFile, AcceptsAnyWhitespace) {
    std::istringstream in("1 2 3\n4 5 6   7\n0\t8");
    EXPECT_EQ(read_state(in, "inline"), State(std::vector<int>{1, 2, 3, 4, 5, 6, 7, 0, 8}));
}

TEST(StateFile, MissingFileThrows) {
    fs::path p = temp_state_path("does-not-exist");
    fs::remove(p);
    EXPECT_THROW(read_state_from_file(p.string()), std::runtime_error);
}

TEST(StateFile, TruncatedFileThrows) {
    fs::path p = temp_state_path("truncated");
    {
        std::ofstream out(p);
        out << "1 2 3\n4 5 6\n7 8\n";
    }
    EXPECT_THROW(read_state_from_file(p.string()), std::runtime_error);
    fs::remove(p);
}

TEST(StateFile, InvalidValuesThrow) {
    std::istringstream duplicate("1 1 3 4 5 6 7 8 0");
    EXPECT_THROW(read_state(duplicate, "duplicate"), std::invalid_argument);
    std::istringstream garbage("1 2 three 4 5 6 7 8 0");
    EXPECT_THROW(read_state(garbage, "garbage"), std::runtime_error);
    std::istringstream extra_value("1 2 3 4 5 6 7 0 8 5");
    EXPECT_THROW(read_state(extra_value, "extra value"), std::runtime_error);
    std::istringstream trailing_text("1 2 3 4 5 6 7 0 8x");
    EXPECT_THROW(read_state(trailing_text, "trailing text"), std::runtime_error);
}

TEST(StateFile, TrailingWhitespaceIsAccepted) {
    std::istringstream in("1 2 3\n4 5 6\n7 0 8\n\n  ");
    EXPECT_EQ(read_state(in, "inline"), State(std::vector<int>{1, 2, 3, 4, 5, 6, 7, 0, 8}));
}

TEST(StateFile, FileWithExtraValueThrows) {
    fs::path p = temp_state_path("extra-value");
    {
        std::ofstream out(p);
        out << "1 2 3\n4 5 6\n7 0 8\n9\n";
    }
    EXPECT_THROW(read_state_from_file(p.string()), std::runtime_error);
    fs::remove(p);
}
