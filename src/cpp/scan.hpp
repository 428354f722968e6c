/*
scan.hpp:
    Marker search over one immutable text buffer. Every OUTCAR field is
    located by the same three steps: find the occurrences of a marker,
    cut a bounded slice around each occurrence, parse the slice.

functions:
    find_all: offsets of every occurrence of a marker
    find_line_starts: offsets of occurrences that begin a line
    preceding_slices: for each occurrence, the text since the previous one
    following_slices: for each occurrence, the text up to the next one
    line_at / next_line: line navigation inside a slice
    split_ws: whitespace tokenizer
    to_int / to_double: checked token conversion
    value_after: first token following a marker on the same line
*/
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

/* offsets of every (non-overlapping) occurrence of marker in text */
std::vector<size_t> find_all(std::string_view text, std::string_view marker);

/* offsets of the occurrences of marker sitting at the very beginning of a line */
std::vector<size_t> find_line_starts(std::string_view text, std::string_view marker);

/**
 * @brief For each occurrence of marker, the slice from the end of the previous
 * occurrence (or the start of text) up to this occurrence.
 * Used for values printed before a repeating trailer, e.g. the SCF counter
 * that precedes each "free  energy" line.
 */
std::vector<std::string_view> preceding_slices(std::string_view text, std::string_view marker);

/**
 * @brief For each occurrence of marker, the slice starting at the occurrence and
 * ending at the next occurrence (or the end of text).
 * Used for tables that follow a repeating header.
 * @param at_line_start only accept occurrences that begin a line.
 */
std::vector<std::string_view> following_slices(std::string_view text, std::string_view marker,
                                               bool at_line_start = false);

/* the line containing offset pos, without the trailing newline */
std::string_view line_at(std::string_view text, size_t pos);

/**
 * @brief Pops the first line off text.
 * @return false when text is exhausted.
 */
bool next_line(std::string_view& text, std::string_view& line);

std::vector<std::string_view> split_ws(std::string_view s);

bool is_blank(std::string_view line);

/**
 * @brief Checked conversions, the whole token must be consumed.
 * @throws ParseError naming field.
 */
int to_int(std::string_view token, const std::string& field);
double to_double(std::string_view token, const std::string& field);

/* tokens of s converted with to_double */
std::vector<double> to_doubles(std::string_view s, const std::string& field);

/**
 * @brief The whitespace-delimited token right after the first occurrence of
 * marker in text.
 * @throws FormatError if the marker (or a token after it) is missing.
 */
std::string_view value_after(std::string_view text, std::string_view marker, const std::string& field);
