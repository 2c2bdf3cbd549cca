#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "data/data.h"
#include "data/gated_reader.h"
#include "reiserfs/bitmap.h"
#include "reiserfs/directory.h"
#include "reiserfs/file_reader.h"
#include "reiserfs/superblock.h"
#include "reiserfs/tree.h"
#include "rescue/range_list.h"
#include "rescue/rescue_map.h"

/**
 * Byte ranges a map-producing operation wants read, in absolute image
 * offsets, ready for render_targets().
 */
struct targets_t
{
	/**
	 * incomplete if the superblock is a hole (the target is then the
	 * superblock itself) or a folder path, or something below it, is behind
	 * a hole; not_found if a folder path does not exist.
	 */
	lookup_status_t status = lookup_status_t::found;
	range_list_t bytes;
	std::string missing_path;

	walk_counters_t counters;
	uint64_t incomplete_subtrees = 0;
	uint64_t missing_bitmaps = 0;
};

enum class entry_kind_t
{
	directory,
	regular,
	link,
	special,
	unknown ///< stat data not readable
};

std::string string_from_entry_kind(entry_kind_t kind);

struct ls_entry_t
{
	std::string name;
	object_id_t object;
	entry_kind_t kind = entry_kind_t::unknown;
	bool stat_incomplete = false;
	bool block_list_incomplete = false;
	bool data_incomplete = false;

	bool complete() const { return !stat_incomplete && !block_list_incomplete && !data_incomplete; }
};

struct ls_listing_t
{
	std::string path; ///< ends with '/'
	object_id_t object;
	std::optional<object_id_t> parent;
	bool complete = false;
	std::vector<ls_entry_t> entries;        ///< sorted by name, "." and ".." excluded
	std::vector<ls_listing_t> subdirectories; ///< filled when recursive
};

struct ls_result_t
{
	lookup_status_t status = lookup_status_t::not_found;
	entry_kind_t kind = entry_kind_t::unknown; ///< of the path itself
	ls_listing_t listing;
};

struct find_result_t
{
	bool complete = true; ///< false if some leaves were holes
	std::vector<std::string> paths;
};

struct cat_result_t
{
	lookup_status_t status = lookup_status_t::not_found;
	file_contents_t contents;
};

/**
 * One triage session over an image and its rescue map.
 *
 * The superblock is read on the first operation and kept. Every
 * operation is synchronous and reads one block at a time.
 */
class triage_t
{
	gated_reader_t reader_;
	std::optional<superblock_t> superblock_;
	std::unique_ptr<tree_t> tree_;
	bool opened_ = false;

	ls_listing_t list(const object_id_t &directory, const std::optional<object_id_t> &parent, const std::string &path, bool recursive, std::set<object_id_t> &visited);
	ls_entry_t describe(const dir_entry_t &entry);
	targets_t superblock_targets() const;

public:
	triage_t(std::shared_ptr<datasource_t> image, const rescue_map_t &map, uint64_t partition_start = 0);

	/**
	 * Read the superblock if not done yet.
	 * @return False if it is behind a hole
	 */
	bool open();

	const std::optional<superblock_t> &superblock() const { return superblock_; }
	gated_reader_t &reader() { return reader_; }

	/**
	 * @throws std::logic_error if the superblock was not read
	 */
	tree_t &tree();

	/**
	 * Blocks the bitmaps mark used, plus the bitmap blocks still missing.
	 * metadata_only: the superblock and bitmap blocks only.
	 */
	targets_t bitmap(bool metadata_only);

	/**
	 * Blocks the tree reaches at or above level.
	 * metadata_only raises the level to at least 1.
	 */
	targets_t tree_blocks(uint16_t level, bool metadata_only);

	/**
	 * Blocks needed to read everything below paths. A path starting with
	 * '-' is excluded instead. Every block the traversal read is a target,
	 * plus the data blocks of the files unless metadata_only.
	 */
	targets_t folder(const std::vector<std::string> &paths, bool metadata_only);

	ls_result_t ls(const std::string &path, bool recursive);

	/**
	 * Full paths of every directory entry called name, in readable leaves.
	 */
	find_result_t find(const std::string &name);

	cat_result_t cat(const std::string &path, uint8_t fill = 0);
};
