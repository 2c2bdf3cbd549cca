#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "data/gated_reader.h"

/**
 * Where the bitmap blocks live.
 */
enum class bitmap_layout_t
{
	spread, ///< bitmap 0 right after the superblock, bitmap i at i * block_size * 8
	packed  ///< old 3.5 volumes: all bitmaps right after the superblock
};

std::string string_from_layout(bitmap_layout_t layout);

/**
 * The decoded and validated superblock. Read once per session.
 */
struct superblock_t
{
	uint64_t offset = 0; ///< byte offset in the partition
	uint32_t block_count = 0;
	uint32_t free_blocks = 0;
	uint32_t root_block = 0;
	uint32_t block_size = 0;
	uint16_t tree_height = 0;
	uint16_t stored_bitmap_count = 0;
	uint16_t version = 0;
	uint32_t hash_code = 0;
	std::string magic;
	bitmap_layout_t layout = bitmap_layout_t::spread;

	uint16_t root_level() const { return tree_height - 1; }
	uint64_t superblock_block() const { return offset / block_size; }

	/**
	 * Blocks covered by one bitmap block.
	 */
	uint64_t bits_per_bitmap() const { return static_cast<uint64_t>(block_size) * 8; }

	uint32_t bitmap_count() const;
	uint64_t bitmap_block(uint32_t index) const;
	std::vector<uint64_t> bitmap_blocks() const;
};

bool is_reiserfs_magic(const char *magic, size_t size);

/**
 * Decode and validate a superblock read at offset.
 * @throws malformed_structure_error on a bad magic or out-of-range field
 */
superblock_t decode_superblock(const block_t &block, uint64_t offset);

/**
 * Locate and decode the superblock, trying 64 KiB then 8 KiB. On success
 * the reader's geometry is set.
 *
 * @return The superblock, or std::nullopt (incomplete) if a read hit a hole
 * @throws malformed_structure_error if neither location holds a valid superblock
 */
std::optional<superblock_t> read_superblock(gated_reader_t &reader);
