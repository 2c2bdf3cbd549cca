#pragma once

#include <cstdint>
#include <vector>

#include "data/gated_reader.h"
#include "reiserfs/superblock.h"
#include "rescue/range_list.h"

/**
 * Result of a bitmap scan, in blocks.
 * used, free and unknown are disjoint and together cover the volume.
 */
struct bitmap_scan_t
{
	range_list_t used;
	range_list_t free;
	range_list_t unknown;                 ///< described by bitmap blocks not read yet
	std::vector<uint64_t> missing_bitmaps; ///< those bitmap blocks
};

/**
 * Decode every bitmap block. A bitmap block that is a hole makes the range
 * it describes unknown; nothing is assumed about it.
 */
bitmap_scan_t scan_bitmaps(gated_reader_t &reader, const superblock_t &superblock);

/**
 * Add the set bits of one bitmap block to used and the clear ones to free.
 * @param first Block described by bit 0
 * @param limit Blocks past this one are ignored
 */
void decode_bitmap(const block_t &bitmap, uint64_t first, uint64_t limit, range_list_t &used, range_list_t &free);
