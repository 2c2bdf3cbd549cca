#include "reiserfs/node.h"
#include "errors.h"
#include "utils.h"

#include <cstring>

stat_data_t decode_stat_data(const uint8_t *body, size_t length, uint64_t address)
{
	stat_data_t stat;
	if (length == sizeof(ReiserStatDataV1))
	{
		auto sd = reinterpret_cast<const ReiserStatDataV1 *>(body);
		stat.mode = le16(sd->sd_mode);
		stat.nlink = le16(sd->sd_nlink);
		stat.uid = le16(sd->sd_uid);
		stat.gid = le16(sd->sd_gid);
		stat.size = le32(sd->sd_size);
		stat.atime = le32(sd->sd_atime);
		stat.mtime = le32(sd->sd_mtime);
		stat.ctime = le32(sd->sd_ctime);
		return stat;
	}
	if (length == sizeof(ReiserStatDataV2))
	{
		auto sd = reinterpret_cast<const ReiserStatDataV2 *>(body);
		stat.mode = le16(sd->sd_mode);
		stat.nlink = le32(sd->sd_nlink);
		stat.size = le64(sd->sd_size);
		stat.uid = le32(sd->sd_uid);
		stat.gid = le32(sd->sd_gid);
		stat.atime = le32(sd->sd_atime);
		stat.mtime = le32(sd->sd_mtime);
		stat.ctime = le32(sd->sd_ctime);
		return stat;
	}
	throw malformed_structure_error(address, fmt::format("stat data of {} bytes", length));
}

std::vector<dir_entry_t> decode_directory_entries(const uint8_t *body, size_t length, uint16_t count, uint64_t address)
{
	if (static_cast<size_t>(count) * sizeof(ReiserDirEntryHead) > length)
		throw malformed_structure_error(address, fmt::format("{} directory entries do not fit {} bytes", count, length));

	std::vector<dir_entry_t> entries;
	entries.reserve(count);

	auto heads = reinterpret_cast<const ReiserDirEntryHead *>(body);
	size_t names_start = count * sizeof(ReiserDirEntryHead);

	// Names are packed backwards: entry i ends where entry i-1 starts
	size_t implicit_end = length;
	for (uint16_t i = 0; i != count; i++)
	{
		size_t location = le16(heads[i].deh_location);
		if (location < names_start || location > implicit_end)
			throw malformed_structure_error(address, fmt::format("directory entry {} has name location {}", i, location));

		dir_entry_t entry;
		entry.offset = le32(heads[i].deh_offset);
		entry.object = {le32(heads[i].deh_dir_id), le32(heads[i].deh_objectid)};
		entry.state = le16(heads[i].deh_state);

		// Names are padded with NULs on 3.6 volumes
		const char *name = reinterpret_cast<const char *>(body + location);
		size_t name_length = 0;
		while (location + name_length < implicit_end && name[name_length] != '\0')
			name_length++;
		entry.name.assign(name, name_length);

		if (!entries.empty() && entries.back().offset >= entry.offset)
			throw malformed_structure_error(address, fmt::format("directory entry offsets out of order ({} after {})", entry.offset, entries.back().offset));

		entries.push_back(std::move(entry));
		implicit_end = location;
	}
	return entries;
}

namespace
{

internal_node_t decode_internal(const block_t &block, const ReiserBlockHead *head, uint64_t address, uint64_t block_count)
{
	size_t count = le16(head->blk_nr_item);
	size_t needed = sizeof(ReiserBlockHead) + count * sizeof(ReiserKey) + (count + 1) * sizeof(ReiserDiskChild);
	if (needed > block.size())
		throw malformed_structure_error(address, fmt::format("{} keys do not fit an internal node", count));

	internal_node_t node;
	node.keys.reserve(count);
	node.children.reserve(count + 1);

	auto keys = reinterpret_cast<const ReiserKey *>(block.bytes() + sizeof(ReiserBlockHead));
	for (size_t i = 0; i != count; i++)
	{
		reiser_key_t key = decode_key(keys[i], guess_key_format(keys[i]), address);
		if (!node.keys.empty() && !(node.keys.back() < key))
			throw malformed_structure_error(address, fmt::format("key {} is not above {}", key.to_string(), node.keys.back().to_string()));
		node.keys.push_back(key);
	}

	auto children = reinterpret_cast<const ReiserDiskChild *>(keys + count);
	for (size_t i = 0; i != count + 1; i++)
	{
		disk_child_t child{le32(children[i].dc_block_number), le16(children[i].dc_size)};
		if (child.block >= block_count)
			throw out_of_range_reference_error(address, child.block, "child pointer");
		node.children.push_back(child);
	}
	return node;
}

item_body_t decode_body(const item_t &item, const uint8_t *body, uint16_t entry_count, uint64_t address, uint64_t block_count)
{
	switch (item.type())
	{
	case item_type_t::stat:
		return decode_stat_data(body, item.length, address);

	case item_type_t::direct:
		return direct_item_t{std::vector<uint8_t>(body, body + item.length)};

	case item_type_t::indirect:
	{
		if (item.length % 4 != 0)
			throw malformed_structure_error(address, fmt::format("indirect item of {} bytes", item.length));
		indirect_item_t indirect;
		indirect.blocks.reserve(item.length / 4);
		for (size_t i = 0; i < item.length; i += 4)
		{
			uint32_t pointer = le32(body + i);
			if (pointer >= block_count)
				throw out_of_range_reference_error(address, pointer, "data block pointer");
			indirect.blocks.push_back(pointer);
		}
		return indirect;
	}

	case item_type_t::directory:
		return directory_item_t{decode_directory_entries(body, item.length, entry_count, address)};

	case item_type_t::any:
		break;
	}
	throw malformed_structure_error(address, fmt::format("item {} has no concrete type", item.key.to_string()));
}

leaf_node_t decode_leaf(const block_t &block, const ReiserBlockHead *head, uint64_t address, uint64_t block_count)
{
	size_t count = le16(head->blk_nr_item);
	size_t heads_end = sizeof(ReiserBlockHead) + count * sizeof(ReiserItemHead);
	if (heads_end > block.size())
		throw malformed_structure_error(address, fmt::format("{} item heads do not fit a leaf", count));

	leaf_node_t leaf;
	leaf.items.reserve(count);

	auto heads = reinterpret_cast<const ReiserItemHead *>(block.bytes() + sizeof(ReiserBlockHead));
	for (size_t i = 0; i != count; i++)
	{
		const ReiserItemHead &head_i = heads[i];
		uint16_t version = le16(head_i.ih_version);
		if (version > 1)
			throw malformed_structure_error(address, fmt::format("item {} has key version {}", i, version));

		item_t item;
		item.format = version == 0 ? key_format_t::v1 : key_format_t::v2;
		item.key = decode_key(head_i.ih_key, item.format, address);
		item.length = le16(head_i.ih_item_len);
		item.block = address;

		size_t location = le16(head_i.ih_item_location);
		if (location < heads_end || location + item.length > block.size())
			throw malformed_structure_error(address, fmt::format("item {} body at {}+{} is outside the leaf", i, location, item.length));

		if (!leaf.items.empty() && !(leaf.items.back().key < item.key))
			throw malformed_structure_error(address, fmt::format("item key {} is not above {}", item.key.to_string(), leaf.items.back().key.to_string()));

		item.body = decode_body(item, block.bytes() + location, le16(head_i.ih_entry_count), address, block_count);
		leaf.items.push_back(std::move(item));
	}
	return leaf;
}

} // anonymous namespace

tree_node_t decode_node(const block_t &block, uint64_t address, uint64_t block_count)
{
	if (block.size() < sizeof(ReiserBlockHead))
		throw malformed_structure_error(address, "block too small for a node");

	auto head = reinterpret_cast<const ReiserBlockHead *>(block.bytes());

	tree_node_t node;
	node.block = address;
	node.level = le16(head->blk_level);

	if (node.level == kFreeLevel)
		throw malformed_structure_error(address, "free block in the tree");
	if (node.level >= kMaxTreeHeight)
		throw malformed_structure_error(address, fmt::format("node level {}", node.level));
	if (le16(head->blk_free_space) > block.size() - sizeof(ReiserBlockHead))
		throw malformed_structure_error(address, fmt::format("free space {}", le16(head->blk_free_space)));

	if (node.level == kLeafLevel)
		node.content = decode_leaf(block, head, address, block_count);
	else
		node.content = decode_internal(block, head, address, block_count);

	return node;
}
