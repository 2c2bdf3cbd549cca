#include "utils.h"

#include <iostream>
#include <cctype>
#include <algorithm>

bool gVerbose = false;

// Sanitize a raw on-disk name: doubles backslashes and escapes control bytes.
// Names are byte strings on ReiserFS; high bytes are passed through untouched.
std::string sanitize_string(const std::string &str)
{
    std::string result;
    result.reserve(str.size() * 2);

    for (char c : str)
    {
        if (c == '\\')
        {
            result += "\\\\";
        }
        else if (c == '\n')
        {
            result += "\\n";
        }
        else if (c == '\r')
        {
            result += "\\r";
        }
        else if (c == '\t')
        {
            result += "\\t";
        }
        else if (c == '\0')
        {
            result += "\\0";
        }
        else if (std::iscntrl(static_cast<unsigned char>(c)))
        {
            result += "\\x";
            result += fmt::format("{:02x}", static_cast<unsigned char>(c));
        }
        else
        {
            result += c;
        }
    }

    return result;
}

std::string string_from_size(uint64_t size)
{
    static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(size);
    size_t unit = 0;
    while (value >= 1024.0 && unit < 4)
    {
        value /= 1024.0;
        unit++;
    }
    if (unit == 0)
        return fmt::format("{} B", size);
    return fmt::format("{:.1f} {}", value, units[unit]);
}

// Accepts decimal or 0x-prefixed hexadecimal. Leading zeros are decimal,
// not octal, because ddrescue never writes octal.
bool parse_number(const std::string &text, uint64_t &value)
{
    if (text.empty())
        return false;

    int base = 10;
    size_t start = 0;
    if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X'))
    {
        base = 16;
        start = 2;
    }

    uint64_t result = 0;
    for (size_t i = start; i < text.size(); i++)
    {
        unsigned char c = static_cast<unsigned char>(text[i]);
        unsigned digit;
        if (std::isdigit(c))
            digit = c - '0';
        else if (base == 16 && std::isxdigit(c))
            digit = static_cast<unsigned>(std::tolower(c) - 'a' + 10);
        else
            return false;

        if (result > (UINT64_MAX - digit) / base)
            return false;
        result = result * base + digit;
    }

    value = result;
    return true;
}

// Static variable for log indentation
static int log_indent = 0;

void rs_log_increment()
{
    log_indent++;
}

void rs_log_decrement()
{
    if (log_indent > 0)
        log_indent--;
}

int get_log_indent()
{
    return log_indent;
}
