#include "config.h"
#include "utils.h"

#include <iostream>
#include <stdexcept>

std::tuple<std::vector<std::string>, std::map<std::string, std::string>> parse_arguments(int argc, char *argv[])
{
    std::map<std::string, std::string> flags;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg.starts_with("--"))
        {
            // Format: --xxx=yyy, --xxx= or --xxx
            size_t equals_pos = arg.find('=');
            if (equals_pos != std::string::npos)
                flags[arg.substr(2, equals_pos - 2)] = arg.substr(equals_pos + 1);
            else
                flags[arg.substr(2)] = "true";
        }
        else
        {
            // Single-dash arguments (-R, -excluded/path) are positional
            positional.push_back(arg);
        }
    }

    return std::make_tuple(positional, flags);
}

template <typename T>
T get_arg(const std::map<std::string, std::string> &flags, const std::string &key, const T &default_value)
{
    auto it = flags.find(key);
    if (it == flags.end())
        return default_value;
    return default_value;
}

// Specialization for sizes and offsets; decimal or 0x hex
template <>
uint64_t get_arg<uint64_t>(const std::map<std::string, std::string> &flags, const std::string &key, const uint64_t &default_value)
{
    auto it = flags.find(key);
    if (it == flags.end())
        return default_value;

    uint64_t value;
    if (!parse_number(it->second, value))
        throw std::invalid_argument(fmt::format("--{} expects a number, got '{}'", key, it->second));
    return value;
}

// Specialization for bool
template <>
bool get_arg<bool>(const std::map<std::string, std::string> &flags, const std::string &key, const bool &default_value)
{
    auto it = flags.find(key);
    if (it == flags.end())
        return default_value;

    return it->second == "true";
}

// Specialization for std::string
template <>
std::string get_arg<std::string>(const std::map<std::string, std::string> &flags, const std::string &key, const std::string &default_value)
{
    auto it = flags.find(key);
    if (it == flags.end())
        return default_value;

    return it->second;
}

namespace
{

const std::map<std::string, command_t> kCommands = {
    {"bitmap", command_t::bitmap},
    {"tree", command_t::tree},
    {"folder", command_t::folder},
    {"ls", command_t::ls},
    {"find", command_t::find},
    {"cat", command_t::cat},
};

const char *kKnownFlags[] = {"partition-start", "metadata", "output", "out", "fill", "margin", "verbose"};

} // anonymous namespace

triage_config_t make_config(int argc, char *argv[])
{
    auto [positional, flags] = parse_arguments(argc, argv);

    for (const auto &[key, value] : flags)
    {
        bool known = false;
        for (auto flag : kKnownFlags)
            known = known || key == flag;
        if (!known)
            throw std::invalid_argument(fmt::format("unknown option --{}", key));
    }

    triage_config_t config;
    config.verbose = get_arg(flags, "verbose", false);
    config.out = get_arg(flags, "out", std::string{});

    if (!positional.empty() && positional[0] == "extend")
    {
        if (positional.size() != 2)
            throw std::invalid_argument("extend takes exactly one MAPFILE");
        config.command = command_t::extend;
        config.mapfile = positional[1];
        config.margin = get_arg(flags, "margin", config.margin);
        return config;
    }

    if (positional.size() < 3)
        throw std::invalid_argument("IMAGE, MAPFILE and COMMAND are required");

    config.image = positional[0];
    config.mapfile = positional[1];
    auto command = kCommands.find(positional[2]);
    if (command == kCommands.end())
        throw std::invalid_argument(fmt::format("unknown command '{}'", positional[2]));
    config.command = command->second;
    config.arguments.assign(positional.begin() + 3, positional.end());

    config.partition_start = get_arg(flags, "partition-start", config.partition_start);
    config.metadata_only = get_arg(flags, "metadata", false);

    std::string output = get_arg(flags, "output", std::string{"retry"});
    if (!parse_output_style(output, config.output))
        throw std::invalid_argument(fmt::format("--output must be retry or domain, got '{}'", output));

    uint64_t fill = get_arg(flags, "fill", uint64_t{0});
    if (fill > 0xFF)
        throw std::invalid_argument(fmt::format("--fill must be a byte, got {}", fill));
    config.fill = static_cast<uint8_t>(fill);

    auto &arguments = config.arguments;
    switch (config.command)
    {
    case command_t::bitmap:
        if (!arguments.empty())
            throw std::invalid_argument("bitmap takes no arguments");
        break;

    case command_t::tree:
        if (arguments.size() > 1)
            throw std::invalid_argument("tree takes at most one LEVEL");
        if (arguments.size() == 1)
        {
            uint64_t level;
            if (!parse_number(arguments[0], level) || level >= 5)
                throw std::invalid_argument(fmt::format("invalid tree level '{}'", arguments[0]));
            config.level = static_cast<uint16_t>(level);
        }
        break;

    case command_t::folder:
        if (arguments.empty())
            throw std::invalid_argument("PATH required");
        break;

    case command_t::ls:
        if (!arguments.empty() && arguments[0] == "-R")
        {
            config.recursive = true;
            arguments.erase(arguments.begin());
        }
        if (arguments.size() != 1)
            throw std::invalid_argument("PATH required");
        break;

    case command_t::find:
        if (arguments.size() != 1)
            throw std::invalid_argument("NAME required");
        break;

    case command_t::cat:
        if (arguments.size() != 1)
            throw std::invalid_argument("PATH required");
        break;

    case command_t::extend:
        break;
    }

    return config;
}

void print_usage(const char *program)
{
    std::cerr << "Usage: " << program << " IMAGE MAPFILE COMMAND [ARGS...] [options]\n";
    std::cerr << "       " << program << " extend MAPFILE [--margin=N] [--out=FILE]\n";
    std::cerr << "Triages a ReiserFS image that ddrescue is still reading, using its mapfile.\n";
    std::cerr << "Only bytes the mapfile marks finished are trusted.\n";
    std::cerr << "Commands:\n";
    std::cerr << "  bitmap         Map of the blocks the free space bitmaps mark used. Fast;\n";
    std::cerr << "                 rerun as more bitmaps are recovered\n";
    std::cerr << "  tree [LEVEL]   Map of the blocks reachable from the tree root at LEVEL and\n";
    std::cerr << "                 above: 0 file data, 1 file metadata, 2+ internal nodes\n";
    std::cerr << "  folder PATH... Map of the blocks below PATH; a path prefixed with '-' is\n";
    std::cerr << "                 excluded\n";
    std::cerr << "  ls [-R] PATH   List a directory, flagging incomplete entries\n";
    std::cerr << "  find NAME      Find entries called NAME, including unreachable ones\n";
    std::cerr << "  cat PATH       Dump a file to stdout (advisory when incomplete)\n";
    std::cerr << "  extend MAPFILE Mark bytes next to finished regions for retry\n";
    std::cerr << "PATH is absolute, or starts with an object id D_O as in lost+found.\n";
    std::cerr << "Options:\n";
    std::cerr << "  --partition-start=N  Byte offset of the partition in a full disk image\n";
    std::cerr << "  --metadata           Restrict maps to bitmap and tree blocks\n";
    std::cerr << "  --output=STYLE       retry (default): input map with targets set to non-tried\n";
    std::cerr << "                       domain: targets finished, the rest bad (--domain-mapfile)\n";
    std::cerr << "  --out=FILE           Write the map or file contents to FILE\n";
    std::cerr << "  --fill=BYTE          Byte written over unreadable file ranges (cat)\n";
    std::cerr << "  --margin=N           Bytes to extend finished regions by (extend, default 512)\n";
    std::cerr << "  --verbose            Trace what is read\n";
    std::cerr << "Exit status: 0 success, 1 error, 2 not found, 3 incomplete.\n";
}
