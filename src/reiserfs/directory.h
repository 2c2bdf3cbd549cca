#pragma once

#include <optional>
#include <string>
#include <vector>

#include "reiserfs/tree.h"

/**
 * Entries of one directory.
 */
struct directory_listing_t
{
	lookup_status_t stat_status = lookup_status_t::not_found;
	std::optional<stat_data_t> stat;
	std::vector<dir_entry_t> entries; ///< visible entries, in offset order

	/**
	 * False if an item was behind a hole, or if the items found do not add
	 * up to the size in the stat data.
	 */
	bool complete = false;

	/**
	 * False if an item was behind a hole.
	 */
	bool items_complete = false;

	/**
	 * True if the stat data says this is not a directory.
	 */
	bool not_a_directory() const { return stat && !stat->is_directory(); }

	const dir_entry_t *find_name(const std::string &name) const;
	const dir_entry_t *find_object(const object_id_t &object) const;
};

directory_listing_t list_directory(tree_t &tree, const object_id_t &directory);

struct name_lookup_t
{
	lookup_status_t status = lookup_status_t::not_found;
	std::optional<dir_entry_t> entry;
};

/**
 * Look a name up in one directory by its hash.
 *
 * Only the directory item spanning the hash and the items starting inside
 * its generation window are read, so holes elsewhere in the directory do
 * not matter. With an unknown hash code the whole directory is listed and
 * searched by literal name.
 */
name_lookup_t lookup_name(tree_t &tree, const object_id_t &directory, const std::string &name);

struct resolve_result_t
{
	lookup_status_t status = lookup_status_t::not_found;
	object_id_t object;
	std::optional<object_id_t> parent; ///< directory the last component was found in
	std::string component;             ///< where resolution stopped, if it did
};

/**
 * Resolve a path.
 *
 * "/a/b" starts at the root; "D_O/a" starts at object D_O (lost+found
 * naming); any other relative path starts at the root. Each component is
 * found with lookup_name().
 */
resolve_result_t resolve(tree_t &tree, const std::string &path);

/**
 * Name of object in directory parent.
 * @return "" for the root, std::nullopt if parent has no entry for it
 */
std::optional<std::string> name_of(tree_t &tree, const object_id_t &object, const object_id_t &parent);

/**
 * Path of object, built by following ".." upwards from parent. When a
 * name cannot be found the path starts with that object as "D_O".
 */
std::string full_path(tree_t &tree, const object_id_t &object, const object_id_t &parent);
