#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "data/data.h"
#include "rescue/rescue_map.h"
#include "rescue/range_list.h"

/**
 * Block reader that only hands out bytes the rescue map reports as finished.
 *
 * The image file holds zeros or stale data wherever ddrescue has not read
 * yet, so every structure read goes through this class. A block with any
 * byte not finished is a hole (std::nullopt), which callers record as a
 * read to request rather than treat as an error.
 *
 * Map and image share the same absolute coordinates; block addresses are
 * relative to the partition start.
 */
class gated_reader_t
{
	std::shared_ptr<datasource_t> image_;
	const rescue_map_t &map_;
	uint64_t partition_start_;
	uint64_t block_size_ = 512;
	uint64_t block_count_ = 0;

	// absolute byte ranges of every read attempted, finished or not
	range_list_t requested_;

	void check_address(uint64_t address) const;

public:
	/**
	 * @param image Full image (or device dump) the map describes
	 * @param map Rescue map of the image; must outlive the reader
	 * @param partition_start Byte offset of the filesystem inside the image
	 */
	gated_reader_t(std::shared_ptr<datasource_t> image, const rescue_map_t &map, uint64_t partition_start = 0);

	/**
	 * Fix the geometry once the superblock is known.
	 * Until then block_count is unknown and addresses are only checked
	 * against the map end.
	 */
	void set_geometry(uint64_t block_size, uint64_t block_count);

	uint64_t block_size() const { return block_size_; }
	uint64_t block_count() const { return block_count_; }
	uint64_t partition_start() const { return partition_start_; }
	const rescue_map_t &map() const { return map_; }

	/**
	 * Absolute byte offset of a block.
	 */
	uint64_t block_offset(uint64_t address) const { return partition_start_ + address * block_size_; }

	/**
	 * True if every byte of the block is finished. Does not read and does
	 * not record the block as requested.
	 * @throws out_of_range_reference_error if the block is outside the volume
	 */
	bool is_block_complete(uint64_t address) const;

	/**
	 * Read one block.
	 * @return The block, or std::nullopt if it is a hole
	 * @throws out_of_range_reference_error if the block is outside the volume
	 */
	std::optional<block_t> read_block(uint64_t address);

	/**
	 * Read a byte range relative to the partition start.
	 * Used before the block size is known. Bytes past the map end are holes.
	 */
	std::optional<block_t> read_bytes(uint64_t offset, uint64_t size);

	/**
	 * Absolute byte ranges of everything read so far, holes included.
	 */
	const range_list_t &requested() const { return requested_; }
	void clear_requested() { requested_.clear(); }
};
