// Exceptions thrown by the parsers, the structure operations and the writers.
// None of them is recoverable for the load or operation that raised it.
#pragma once

#include <stdexcept>
#include <string>

/** @brief A required marker or section is missing, or a section has the wrong shape. */
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief A token that must be numeric or boolean could not be converted. */
class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief Per-step fields disagree in length, or an atom-count invariant is broken. */
class ConsistencyError : public std::runtime_error {
public:
    explicit ConsistencyError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief The lattice is singular and cannot be inverted. */
class GeometryError : public std::runtime_error {
public:
    explicit GeometryError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief A step, mode or atom index outside the loaded data. */
class RangeError : public std::out_of_range {
public:
    explicit RangeError(const std::string& what) : std::out_of_range(what) {}
};
