#include "reiserfs/bitmap.h"
#include "utils.h"

#include <algorithm>

void decode_bitmap(const block_t &bitmap, uint64_t first, uint64_t limit, range_list_t &used, range_list_t &free)
{
	uint64_t bits = std::min<uint64_t>(bitmap.size() * 8, limit > first ? limit - first : 0);
	const uint8_t *bytes = bitmap.bytes();

	// Runs of equal bits, least significant bit first
	uint64_t run_start = 0;
	bool run_used = false;
	for (uint64_t bit = 0; bit != bits; bit++)
	{
		bool set = (bytes[bit / 8] >> (bit % 8)) & 1;
		if (bit == 0)
		{
			run_used = set;
			continue;
		}
		if (set != run_used)
		{
			(run_used ? used : free).add(first + run_start, bit - run_start);
			run_start = bit;
			run_used = set;
		}
	}
	if (bits != 0)
		(run_used ? used : free).add(first + run_start, bits - run_start);
}

bitmap_scan_t scan_bitmaps(gated_reader_t &reader, const superblock_t &superblock)
{
	ENTRY("{} bitmaps", superblock.bitmap_count());

	bitmap_scan_t scan;
	uint64_t per_bitmap = superblock.bits_per_bitmap();

	for (uint32_t i = 0; i != superblock.bitmap_count(); i++)
	{
		uint64_t address = superblock.bitmap_block(i);
		uint64_t first = i * per_bitmap;
		uint64_t limit = std::min<uint64_t>(first + per_bitmap, superblock.block_count);

		auto block = reader.read_block(address);
		if (!block)
		{
			scan.missing_bitmaps.push_back(address);
			scan.unknown.add(first, limit - first);
			continue;
		}
		decode_bitmap(*block, first, limit, scan.used, scan.free);
	}

	rs_log("used {} blocks, free {}, unknown {} ({} bitmaps missing)",
		   scan.used.total(), scan.free.total(), scan.unknown.total(), scan.missing_bitmaps.size());
	return scan;
}
