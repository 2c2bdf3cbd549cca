#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "data/data.h"
#include "reiserfs/key.h"

/**
 * Object metadata, from either stat data layout.
 */
struct stat_data_t
{
	uint16_t mode = 0;
	uint32_t nlink = 0;
	uint64_t size = 0;
	uint32_t uid = 0;
	uint32_t gid = 0;
	uint32_t atime = 0;
	uint32_t mtime = 0;
	uint32_t ctime = 0;

	uint16_t file_type() const { return mode >> 12; }
	uint16_t permissions() const { return mode & 07777; }
	bool is_directory() const { return file_type() == kTypeDirectory; }
	bool is_regular() const { return file_type() == kTypeRegular; }
	bool is_link() const { return file_type() == kTypeLink; }
};

struct dir_entry_t
{
	uint32_t offset = 0; ///< hash | generation
	object_id_t object;
	std::string name;
	uint16_t state = 0;

	bool visible() const { return (state & kEntryVisible) != 0; }

	/**
	 * Hash part of the offset, as stored by the kernel.
	 */
	uint32_t hash_value() const { return offset & 0x7FFFFF80; }
};

struct direct_item_t
{
	std::vector<uint8_t> bytes;
};

struct indirect_item_t
{
	std::vector<uint32_t> blocks; ///< 0 is a sparse block
};

struct directory_item_t
{
	std::vector<dir_entry_t> entries;
};

using item_body_t = std::variant<stat_data_t, indirect_item_t, direct_item_t, directory_item_t>;

/**
 * One item of a leaf, with the address of the leaf it came from.
 */
struct item_t
{
	reiser_key_t key;
	key_format_t format = key_format_t::v2;
	uint16_t length = 0;
	uint64_t block = 0;
	item_body_t body;

	item_type_t type() const { return key.type; }
};

struct disk_child_t
{
	uint32_t block = 0;
	uint16_t size = 0;
};

/**
 * Internal node: keys[i] separates children[i] from children[i + 1].
 */
struct internal_node_t
{
	std::vector<reiser_key_t> keys;
	std::vector<disk_child_t> children;
};

struct leaf_node_t
{
	std::vector<item_t> items;
};

/**
 * A decoded formatted node. The variant follows the on-disk level:
 * level 1 is a leaf, anything above is internal.
 */
struct tree_node_t
{
	uint64_t block = 0;
	uint16_t level = 0;
	std::variant<internal_node_t, leaf_node_t> content;

	bool is_leaf() const { return level == kLeafLevel; }
	const internal_node_t &internal() const { return std::get<internal_node_t>(content); }
	const leaf_node_t &leaf() const { return std::get<leaf_node_t>(content); }
};

/**
 * Decode a formatted node.
 *
 * The bytes come from a finished block, so anything that does not decode
 * is fatal: a free block (level 0), counts or locations that do not fit
 * the block, keys out of order, pointers past the end of the volume.
 *
 * @param block Block contents
 * @param address Block address, for error reports
 * @param block_count Blocks in the volume, bound for child and data pointers
 * @throws malformed_structure_error, out_of_range_reference_error
 */
tree_node_t decode_node(const block_t &block, uint64_t address, uint64_t block_count);

/**
 * Decode a stat data body of either layout, selected by its length.
 * @throws malformed_structure_error on any other length
 */
stat_data_t decode_stat_data(const uint8_t *body, size_t length, uint64_t address);

/**
 * Decode the entries of a directory item body.
 * @throws malformed_structure_error if heads or names do not fit
 */
std::vector<dir_entry_t> decode_directory_entries(const uint8_t *body, size_t length, uint16_t count, uint64_t address);
