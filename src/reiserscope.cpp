#include "config.h"
#include "errors.h"
#include "utils.h"
#include "data/data.h"
#include "rescue/rescue_map.h"
#include "rescue/extender.h"
#include "rescue/map_output.h"
#include "reiserfs/hash.h"
#include "triage/triage.h"

#include <cstdint>
#include <string>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <filesystem>
#include <memory>
#include <vector>

namespace
{

constexpr int kExitSuccess = 0;
constexpr int kExitError = 1;
constexpr int kExitNotFound = 2;
constexpr int kExitIncomplete = 3;

int exit_code_from_status(lookup_status_t status)
{
    switch (status)
    {
    case lookup_status_t::found:
        return kExitSuccess;
    case lookup_status_t::not_found:
        return kExitNotFound;
    case lookup_status_t::incomplete:
        return kExitIncomplete;
    }
    return kExitError;
}

void write_map(const rescue_map_t &map, const std::filesystem::path &out)
{
    if (out.empty())
        map.write(std::cout);
    else
        map.save(out);
}

void write_bytes(const std::vector<uint8_t> &bytes, const std::filesystem::path &out)
{
    if (out.empty())
    {
        std::cout.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        std::cout.flush();
        return;
    }

    std::ofstream file(out, std::ios::binary);
    if (!file)
        throw std::runtime_error("Cannot create file: " + out.string());
    file.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file.good())
        throw std::runtime_error("Error writing to " + out.string());
}

std::string annotations(const ls_entry_t &entry)
{
    std::string result;
    if (entry.stat_incomplete)
        result += " (incomplete stat info)";
    if (entry.block_list_incomplete)
        result += " (incomplete block list)";
    if (entry.data_incomplete)
        result += " (incomplete data blocks)";
    return result;
}

std::string string_from_kind_marker(entry_kind_t kind)
{
    switch (kind)
    {
    case entry_kind_t::directory:
        return "/";
    case entry_kind_t::link:
        return "@";
    case entry_kind_t::special:
        return "*";
    case entry_kind_t::regular:
    case entry_kind_t::unknown:
        return "";
    }
    return "";
}

// Prints one listing and its subdirectories, returns false if anything is incomplete
bool print_listing(const ls_listing_t &listing)
{
    bool complete = listing.complete;

    std::cout << listing.path << ":" << (listing.complete ? "" : " (incomplete entry list)") << "\n";
    std::cout << fmt::format("  {:<12} .\n", listing.object.to_string());
    if (listing.parent)
        std::cout << fmt::format("  {:<12} ..\n", listing.parent->to_string());

    for (const auto &entry : listing.entries)
    {
        std::cout << fmt::format("  {:<12} {}{}{}\n",
                                 entry.object.to_string(),
                                 sanitize_string(entry.name),
                                 string_from_kind_marker(entry.kind),
                                 annotations(entry));
        complete = complete && entry.complete();
    }

    for (const auto &subdirectory : listing.subdirectories)
    {
        std::cout << "\n";
        complete = print_listing(subdirectory) && complete;
    }
    return complete;
}

void print_summary(const targets_t &targets, const range_list_t &bytes)
{
    const auto &counters = targets.counters;
    if (counters.nodes_read)
        std::clog << fmt::format("{} nodes read in {} passes, {} holes, {} pointers followed\n",
                                 counters.nodes_read, counters.passes, counters.holes, counters.pointers);
    if (targets.incomplete_subtrees)
        std::clog << fmt::format("{} subtrees behind holes\n", targets.incomplete_subtrees);
    if (targets.missing_bitmaps)
        std::clog << fmt::format("{} bitmap blocks missing\n", targets.missing_bitmaps);
    std::clog << fmt::format("{} in {} ranges to read\n", string_from_size(bytes.total()), bytes.count());
}

int run_extend(const triage_config_t &config)
{
    auto map = rescue_map_t::load(config.mapfile);
    auto extended = extend_finished(map, config.margin);
    write_map(extended, config.out);
    return kExitSuccess;
}

int run_map_command(triage_t &triage, const triage_config_t &config, const rescue_map_t &map)
{
    targets_t targets;
    switch (config.command)
    {
    case command_t::bitmap:
        targets = triage.bitmap(config.metadata_only);
        break;
    case command_t::tree:
        targets = triage.tree_blocks(config.level, config.metadata_only);
        break;
    case command_t::folder:
        targets = triage.folder(config.arguments, config.metadata_only);
        break;
    default:
        throw std::logic_error("not a map command");
    }

    if (targets.status == lookup_status_t::not_found)
    {
        std::cerr << "Error: " << targets.missing_path << " not found\n";
        return kExitNotFound;
    }
    if (!triage.superblock())
        std::cerr << "Superblock not recovered yet, requesting it first\n";
    else if (targets.status == lookup_status_t::incomplete)
        std::cerr << "Warning: " << targets.missing_path << " is behind unread blocks, map is partial\n";

    print_summary(targets, targets.bytes);
    write_map(render_targets(targets.bytes, map, config.output), config.out);
    return exit_code_from_status(targets.status);
}

int run_ls(triage_t &triage, const triage_config_t &config)
{
    const std::string &path = config.arguments[0];
    auto result = triage.ls(path, config.recursive);

    if (result.status == lookup_status_t::not_found)
    {
        std::cerr << "Error: " << path << " not found\n";
        return kExitNotFound;
    }
    if (result.status == lookup_status_t::incomplete)
    {
        std::cerr << path << ": (results incomplete)\n";
        return kExitIncomplete;
    }
    if (result.kind != entry_kind_t::directory)
    {
        std::cout << path << " (" << string_from_entry_kind(result.kind) << ")\n";
        return kExitSuccess;
    }

    bool complete = print_listing(result.listing);
    if (!complete)
        std::cout << "(results incomplete)\n";
    return complete ? kExitSuccess : kExitIncomplete;
}

int run_find(triage_t &triage, const triage_config_t &config)
{
    auto result = triage.find(config.arguments[0]);
    for (const auto &path : result.paths)
        std::cout << path << "\n";

    if (!result.complete)
    {
        std::cerr << "(results incomplete)\n";
        return kExitIncomplete;
    }
    return result.paths.empty() ? kExitNotFound : kExitSuccess;
}

int run_cat(triage_t &triage, const triage_config_t &config)
{
    const std::string &path = config.arguments[0];
    auto result = triage.cat(path, config.fill);

    if (result.status == lookup_status_t::not_found)
    {
        std::cerr << "Error: " << path << " not found\n";
        return kExitNotFound;
    }
    if (result.status == lookup_status_t::incomplete)
    {
        std::cerr << path << ": (results incomplete)\n";
        return kExitIncomplete;
    }
    if (result.contents.status == object_status_t::not_regular)
    {
        std::cerr << "Error: " << path << " is " << string_from_object_status(result.contents.status) << "\n";
        return kExitError;
    }

    write_bytes(result.contents.bytes, config.out);

    const auto &gaps = result.contents.gaps;
    for (const auto &gap : gaps.items())
        std::cerr << fmt::format("gap at {} ({} bytes)\n", gap.start, gap.size);
    if (!gaps.empty())
    {
        std::cerr << fmt::format("{}: {} of {} bytes not recovered, filled with 0x{:02X}\n",
                                 path, gaps.total(), result.contents.bytes.size(), config.fill);
        return kExitIncomplete;
    }
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, char *argv[])
{
    if (argc < 2)
    {
        print_usage(argv[0]);
        return kExitError;
    }

    triage_config_t config;
    try
    {
        config = make_config(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return kExitError;
    }

    gVerbose = config.verbose;

    try
    {
        if (config.command == command_t::extend)
            return run_extend(config);

        auto map = rescue_map_t::load(config.mapfile);
        auto image = std::make_shared<file_datasource_t>(config.image);
        rs_log("{}: {} bytes, map covers {} bytes", image->description(), image->size(), map.size());

        triage_t triage(image, map, config.partition_start);
        if (triage.open())
        {
            const auto &superblock = *triage.superblock();
            rs_log("ReiserFS {} blocks of {} bytes, root {} at level {}, {} hash, {} bitmaps",
                   superblock.block_count, superblock.block_size, superblock.root_block,
                   superblock.root_level(), string_from_hash_code(superblock.hash_code),
                   string_from_layout(superblock.layout));
        }

        switch (config.command)
        {
        case command_t::bitmap:
        case command_t::tree:
        case command_t::folder:
            return run_map_command(triage, config, map);
        case command_t::ls:
            return run_ls(triage, config);
        case command_t::find:
            return run_find(triage, config);
        case command_t::cat:
            return run_cat(triage, config);
        case command_t::extend:
            break;
        }
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        std::cerr << "Filesystem Error: " << e.what() << "\n";
        std::cerr << "Path: " << e.path1() << "\n";
        return kExitError;
    }
    catch (const format_error &e)
    {
        std::cerr << "Mapfile Error: " << e.what() << "\n";
        return kExitError;
    }
    catch (const malformed_structure_error &e)
    {
        std::cerr << "Malformed Structure: " << e.what() << "\n";
        std::cerr << "Check --partition-start, or the image is not ReiserFS\n";
        return kExitError;
    }
    catch (const std::out_of_range &e)
    {
        std::cerr << "Range Error: " << e.what() << "\n";
        return kExitError;
    }
    catch (const std::runtime_error &e)
    {
        std::cerr << "Runtime Error: " << e.what() << "\n";
        return kExitError;
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "Invalid Argument: " << e.what() << "\n";
        return kExitError;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitError;
    }

    return kExitSuccess;
}
