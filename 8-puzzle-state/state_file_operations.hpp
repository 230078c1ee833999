#ifndef __8_PUZZLE_STATE_FILE_OPERATIONS_HPP___
#define __8_PUZZLE_STATE_FILE_OPERATIONS_HPP___

#include <istream>
#include <string>

#include "state.hpp"

/**
 * @file state_file_operations.hpp
 * @brief Simple helpers to read/write `State` values from plain text files.
 *
 * The file format is minimal plain text: nine whitespace separated cell
 * values in row-major order, written as three lines of three values.
 */

/**
 * @brief Parse a `State` from a stream holding nine cell values.
 *
 * The stream must hold nothing but whitespace after the ninth value.
 *
 * @param in Input stream.
 * @param source Name used in error messages.
 * @throws std::runtime_error if fewer than nine integers can be read or
 *         anything follows them.
 * @throws std::invalid_argument if the values are not a permutation of 0..8.
 * @return Constructed `State` instance.
 */
State read_state(std::istream& in, const std::string& source);

/**
 * @brief Read a `State` from a simple plain-text file.
 *
 * @param filename Path to the input file.
 * @throws std::runtime_error if the file cannot be opened, is truncated or has trailing data.
 * @return Constructed `State` instance.
 */
State read_state_from_file(const std::string& filename);

/**
 * @brief Write a `State` to a simple plain-text file.
 *
 * @param state State to serialize.
 * @param filename Output file path.
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
void write_state_to_file(const State& state, const std::string& filename);

#endif // __8_PUZZLE_STATE_FILE_OPERATIONS_HPP___
