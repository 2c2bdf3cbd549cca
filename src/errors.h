#pragma once

#include <stdexcept>
#include <string>
#include <cstdint>

#include <fmt/format.h>

/**
 * A mapfile line that does not follow the ddrescue grammar, or a map that
 * breaks the coverage invariant.
 */
class format_error : public std::runtime_error
{
    size_t line_;

public:
    format_error(size_t line, const std::string &message)
        : std::runtime_error(line ? fmt::format("line {}: {}", line, message) : message), line_(line) {}

    size_t line() const { return line_; }
};

/**
 * A block that the map reports as finished decoded to something invalid.
 * The working assumption is that finished bytes are trustworthy, so this
 * usually means a wrong partition start or a non-ReiserFS image.
 */
class malformed_structure_error : public std::runtime_error
{
    uint64_t block_;

public:
    malformed_structure_error(uint64_t block, const std::string &message)
        : std::runtime_error(fmt::format("malformed structure in block {}: {}", block, message)), block_(block) {}

    uint64_t block() const { return block_; }
};

/**
 * A decoded block pointer or offset falls outside the volume.
 */
class out_of_range_reference_error : public malformed_structure_error
{
    uint64_t reference_;

public:
    out_of_range_reference_error(uint64_t block, uint64_t reference, const std::string &what)
        : malformed_structure_error(block, fmt::format("{} {} is out of range", what, reference)), reference_(reference) {}

    uint64_t reference() const { return reference_; }
};
