#include "reiserfs/superblock.h"
#include "reiserfs/reiserfs.h"
#include "reiserfs/hash.h"
#include "errors.h"
#include "utils.h"

#include <cstring>

std::string string_from_layout(bitmap_layout_t layout)
{
	return layout == bitmap_layout_t::spread ? "spread" : "packed";
}

bool is_reiserfs_magic(const char *magic, size_t size)
{
	static const char *magics[] = {"ReIsErFs", "ReIsEr2Fs", "ReIsEr3Fs"};
	for (auto candidate : magics)
	{
		size_t length = strlen(candidate);
		if (length <= size && memcmp(magic, candidate, length) == 0)
			return true;
	}
	return false;
}

uint32_t superblock_t::bitmap_count() const
{
	return static_cast<uint32_t>((block_count + bits_per_bitmap() - 1) / bits_per_bitmap());
}

uint64_t superblock_t::bitmap_block(uint32_t index) const
{
	if (layout == bitmap_layout_t::packed)
		return superblock_block() + 1 + index;
	if (index == 0)
		return kSuperBlockOffset / block_size + 1;
	return index * bits_per_bitmap();
}

std::vector<uint64_t> superblock_t::bitmap_blocks() const
{
	std::vector<uint64_t> blocks;
	uint32_t count = bitmap_count();
	blocks.reserve(count);
	for (uint32_t i = 0; i != count; i++)
		blocks.push_back(bitmap_block(i));
	return blocks;
}

superblock_t decode_superblock(const block_t &block, uint64_t offset)
{
	if (block.size() < sizeof(ReiserSuperBlock))
		throw std::runtime_error("Superblock read too short");

	auto sb = reinterpret_cast<const ReiserSuperBlock *>(block.bytes());

	superblock_t result;
	result.offset = offset;
	result.block_size = le16(sb->s_blocksize);

	// Until the block size is validated, report in 512-byte units
	uint64_t address = offset / kSuperBlockReadSize;

	if (!is_reiserfs_magic(sb->s_magic, sizeof(sb->s_magic)))
		throw malformed_structure_error(address, fmt::format("no ReiserFS magic at byte {}", offset));
	result.magic.assign(sb->s_magic, strnlen(sb->s_magic, sizeof(sb->s_magic)));

	// s_blocksize is 16 bits, so 65536 cannot be stored; 0 is invalid anyway
	if (result.block_size < 512 || (result.block_size & (result.block_size - 1)) != 0)
		throw malformed_structure_error(address, fmt::format("block size {}", result.block_size));
	address = offset / result.block_size;

	result.block_count = le32(sb->s_block_count);
	result.free_blocks = le32(sb->s_free_blocks);
	result.root_block = le32(sb->s_root_block);
	result.tree_height = le16(sb->s_tree_height);
	result.stored_bitmap_count = le16(sb->s_bmap_nr);
	result.version = le16(sb->s_version);
	result.hash_code = le32(sb->s_hash_function_code);
	result.layout = offset == kOldSuperBlockOffset ? bitmap_layout_t::packed : bitmap_layout_t::spread;

	if (result.block_count == 0)
		throw malformed_structure_error(address, "block count is 0");
	if (result.block_count <= address)
		throw out_of_range_reference_error(address, address, "superblock block");
	if (result.free_blocks > result.block_count)
		throw malformed_structure_error(address, fmt::format("{} free blocks in a volume of {}", result.free_blocks, result.block_count));
	if (result.root_block >= result.block_count)
		throw out_of_range_reference_error(address, result.root_block, "root block");
	if (result.tree_height < 2 || result.tree_height > kMaxTreeHeight)
		throw malformed_structure_error(address, fmt::format("tree height {}", result.tree_height));

	auto bitmaps = result.bitmap_blocks();
	if (!bitmaps.empty() && bitmaps.back() >= result.block_count)
		throw out_of_range_reference_error(address, bitmaps.back(), "bitmap block");

	if (result.stored_bitmap_count != 0 && result.stored_bitmap_count != result.bitmap_count())
		rs_warn("superblock says {} bitmap blocks, the block count implies {}", result.stored_bitmap_count, result.bitmap_count());

	return result;
}

std::optional<superblock_t> read_superblock(gated_reader_t &reader)
{
	ENTRY("{}", reader.partition_start());

	for (uint64_t offset : {kSuperBlockOffset, kOldSuperBlockOffset})
	{
		auto block = reader.read_bytes(offset, kSuperBlockReadSize);
		if (!block)
		{
			rs_log("superblock at {} is not read yet", offset);
			return std::nullopt;
		}

		auto sb = reinterpret_cast<const ReiserSuperBlock *>(block->bytes());
		if (!is_reiserfs_magic(sb->s_magic, sizeof(sb->s_magic)))
		{
			rs_log("no magic at {}", offset);
			continue;
		}

		superblock_t superblock = decode_superblock(*block, offset);
		rs_log("{} volume: {} blocks of {}, root {}, height {}, {} hash, {} bitmaps",
			   superblock.magic, superblock.block_count, superblock.block_size, superblock.root_block,
			   superblock.tree_height, string_from_hash_code(superblock.hash_code), string_from_layout(superblock.layout));
		reader.set_geometry(superblock.block_size, superblock.block_count);
		return superblock;
	}

	throw malformed_structure_error(kSuperBlockOffset / kSuperBlockReadSize,
									fmt::format("no ReiserFS superblock at byte {} or {}", kSuperBlockOffset, kOldSuperBlockOffset));
}
