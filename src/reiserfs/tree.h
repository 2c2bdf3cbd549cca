#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "data/gated_reader.h"
#include "reiserfs/node.h"
#include "reiserfs/superblock.h"
#include "rescue/range_list.h"

/**
 * Outcome of a lookup that may run into holes.
 */
enum class lookup_status_t
{
	found,
	not_found, ///< absent from structures that were all read
	incomplete ///< a structure on the way is a hole
};

std::string string_from_lookup_status(lookup_status_t status);

/**
 * Receives the nodes of a walk as they are read.
 */
class tree_visitor_t
{
public:
	virtual ~tree_visitor_t() = default;
	virtual void visit_leaf(const tree_node_t &) {}
	virtual void visit_hole(uint64_t /* block */, uint16_t /* level */) {}
};

struct walk_options_t
{
	/**
	 * Lowest level to report: 0 data blocks, 1 leaves, 2+ internal nodes.
	 */
	uint16_t min_level = 0;

	/**
	 * Read the leaves and return their items, whatever min_level is.
	 */
	bool collect_items = false;

	tree_visitor_t *visitor = nullptr;
};

struct incomplete_subtree_t
{
	uint64_t block;
	uint16_t level;

	bool operator==(const incomplete_subtree_t &other) const = default;
};

struct walk_counters_t
{
	uint64_t nodes_read = 0;
	uint64_t holes = 0;
	uint64_t pointers = 0; ///< child and data pointers marked used
	uint64_t passes = 0;
};

struct walk_result_t
{
	range_list_t used_blocks;
	std::vector<item_t> items;
	std::vector<incomplete_subtree_t> incomplete_subtrees;
	range_list_t required_reads;
	walk_counters_t counters;
};

struct item_lookup_t
{
	lookup_status_t status = lookup_status_t::not_found;
	std::optional<item_t> item;
};

struct stat_lookup_t
{
	lookup_status_t status = lookup_status_t::not_found;
	stat_data_t stat;
};

struct item_range_t
{
	std::vector<item_t> items; ///< in key order
	bool complete = true;
	std::vector<uint64_t> holes;
};

/**
 * The S+tree of a volume, read through the gated reader.
 *
 * Nodes are cached per session, bounded; holes are never cached.
 */
class tree_t
{
	gated_reader_t &reader_;
	superblock_t superblock_;

	std::map<uint64_t, std::shared_ptr<const tree_node_t>> cache_;
	std::deque<uint64_t> cache_order_;
	size_t cache_limit_;

	void find_items(uint64_t block, uint16_t level, const reiser_key_t &start, const reiser_key_t &end, item_range_t &result);
	item_lookup_t find_last_item(uint64_t block, uint16_t level, const reiser_key_t &key);

public:
	tree_t(gated_reader_t &reader, const superblock_t &superblock, size_t cache_limit = 128);

	const superblock_t &superblock() const { return superblock_; }
	gated_reader_t &reader() { return reader_; }

	/**
	 * Read and decode one node.
	 * @param block Node address
	 * @param level Level the parent implies for this node
	 * @return The node, or nullptr if the block is a hole
	 * @throws malformed_structure_error if the node is not at the expected level
	 */
	std::shared_ptr<const tree_node_t> read_node(uint64_t block, uint16_t level);

	/**
	 * Exact key lookup.
	 */
	item_lookup_t find_item(const reiser_key_t &key);

	/**
	 * The item with the largest key not above key. Used to find the
	 * directory item whose entries span a name hash.
	 * @return incomplete if the leaf that would hold it is a hole
	 */
	item_lookup_t find_last_item(const reiser_key_t &key);

	/**
	 * Stat data of an object.
	 */
	stat_lookup_t find_stat(const object_id_t &object);

	/**
	 * All items with start <= key < end. Only the subtrees whose key span
	 * can hold such keys are read.
	 */
	item_range_t find_items(const reiser_key_t &start, const reiser_key_t &end);

	/**
	 * Level-aware traversal from the root.
	 *
	 * Nodes are visited in ascending block order within a pass; children
	 * behind the current block wait for the next pass, so a slow medium is
	 * read mostly forward.
	 */
	walk_result_t walk(const walk_options_t &options);
};
