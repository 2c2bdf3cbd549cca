#pragma once

#include <cstdint>
#include <vector>

#include "reiserfs/tree.h"
#include "rescue/range_list.h"

enum class object_status_t
{
	found,
	not_found,
	incomplete, ///< the stat data is behind a hole
	not_regular
};

std::string string_from_object_status(object_status_t status);

/**
 * A reconstructed file.
 *
 * When status is found and contents were requested, bytes.size() equals
 * stat.size. Bytes nobody could confirm hold the fill byte and are listed
 * in gaps, as file offsets.
 */
struct file_contents_t
{
	object_status_t status = object_status_t::not_found;
	stat_data_t stat;
	std::vector<uint8_t> bytes;
	range_list_t gaps;

	std::vector<uint64_t> data_blocks;    ///< non-sparse indirect pointers, in file order
	std::vector<uint64_t> missing_blocks; ///< data blocks not finished in the map

	/**
	 * False if a body item may be behind a hole.
	 */
	bool metadata_complete = false;

	bool complete() const { return gaps.empty(); }
};

/**
 * Reconstruct a regular file from its body items.
 *
 * @param full_contents If false, no data block is read: bytes stays empty
 *        and gaps only holds ranges the metadata cannot account for
 * @param fill Byte written over gaps
 */
file_contents_t read_object(tree_t &tree, const object_id_t &object, bool full_contents, uint8_t fill = 0);
