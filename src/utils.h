#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <iostream>
#include <endian.h>

#include <fmt/format.h>

extern bool gVerbose;

// Utility function declarations
std::string sanitize_string(const std::string &str);
std::string string_from_size(uint64_t size);
bool parse_number(const std::string &text, uint64_t &value);

// ReiserFS is little-endian on disk
inline uint16_t le16(const uint8_t *b)
{
    return uint16_t(b[0]) | (uint16_t(b[1]) << 8);
}

inline uint16_t le16(const uint16_t b)
{
    return le16toh(b);
}

inline uint32_t le32(const uint8_t *b)
{
    return uint32_t(b[0]) | (uint32_t(b[1]) << 8) | (uint32_t(b[2]) << 16) | (uint32_t(b[3]) << 24);
}

inline uint32_t le32(const uint32_t b)
{
    return le32toh(b);
}

inline uint64_t le64(const uint8_t *b)
{
    return uint64_t(le32(b)) | (uint64_t(le32(b + 4)) << 32);
}

inline uint64_t le64(const uint64_t b)
{
    return le64toh(b);
}

void rs_log_increment();
void rs_log_decrement();
int get_log_indent();

template <typename... Args>
void rs_log(fmt::format_string<Args...> format_str, Args &&...args)
{
    if (!gVerbose)
        return;
    // Add indentation based on current log_indent level
    int indent = get_log_indent();
    std::string indent_str(static_cast<size_t>(indent * 4), ' ');
    std::clog << indent_str << fmt::format(format_str, std::forward<Args>(args)...) << std::endl;
}

// Warnings are printed regardless of verbosity
template <typename... Args>
void rs_warn(fmt::format_string<Args...> format_str, Args &&...args)
{
    std::clog << "warning: " << fmt::format(format_str, std::forward<Args>(args)...) << std::endl;
}

template <typename... Args>
void rs_log_function(const std::string &function, const std::string &filename, int lineno, fmt::format_string<Args...> format_str, Args &&...args)
{
    if (!gVerbose)
        return;
    // Add indentation based on current log_indent level
    int indent = get_log_indent();
    std::string indent_str(static_cast<size_t>(indent * 4), ' ');
    std::clog
        << indent_str
        << fmt::format("--> {} (", function)
        << fmt::format(format_str, std::forward<Args>(args)...)
        << fmt::format(") at {}:{}", filename, lineno)
        << std::endl;
    rs_log_increment();
}

// RAII helper class for automatic decrement on scope exit
class rs_log_scope_guard
{
    std::string function_name;

public:
    rs_log_scope_guard(const std::string &func_name) : function_name(func_name) {}
    ~rs_log_scope_guard()
    {
        if (!gVerbose)
            return;
        rs_log_decrement();
        rs_log("<-- {}", function_name);
    }
    // Non-copyable, non-movable
    rs_log_scope_guard(const rs_log_scope_guard &) = delete;
    rs_log_scope_guard &operator=(const rs_log_scope_guard &) = delete;
    rs_log_scope_guard(rs_log_scope_guard &&) = delete;
    rs_log_scope_guard &operator=(rs_log_scope_guard &&) = delete;
};

// ENTRY macro for function entry logging with automatic exit logging
#define ENTRY(...)                                              \
    rs_log_function(__func__, __FILE__, __LINE__, __VA_ARGS__); \
    rs_log_scope_guard _rs_log_guard(__func__);
