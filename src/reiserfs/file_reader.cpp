#include "reiserfs/file_reader.h"
#include "errors.h"
#include "utils.h"

#include <algorithm>
#include <cstring>

std::string string_from_object_status(object_status_t status)
{
	switch (status)
	{
	case object_status_t::found:
		return "found";
	case object_status_t::not_found:
		return "not found";
	case object_status_t::incomplete:
		return "incomplete";
	case object_status_t::not_regular:
		return "not a regular file";
	}
	return "unknown";
}

file_contents_t read_object(tree_t &tree, const object_id_t &object, bool full_contents, uint8_t fill)
{
	ENTRY("{} full={}", object.to_string(), full_contents);

	file_contents_t result;

	auto stat = tree.find_stat(object);
	if (stat.status == lookup_status_t::not_found)
		return result;
	if (stat.status == lookup_status_t::incomplete)
	{
		result.status = object_status_t::incomplete;
		return result;
	}

	result.stat = stat.stat;
	if (!stat.stat.is_regular())
	{
		result.status = object_status_t::not_regular;
		return result;
	}
	result.status = object_status_t::found;

	uint64_t size = stat.stat.size;
	uint64_t block_size = tree.superblock().block_size;
	gated_reader_t &reader = tree.reader();

	if (full_contents)
		result.bytes.assign(size, 0);

	// Body items start at offset 1, right after the stat data
	reiser_key_t start{object.dir_id, object.object_id, 1, item_type_t::stat};
	auto range = tree.find_items(start, reiser_key_t::end_key(object));

	bool uncovered = false;
	auto cover = [&](uint64_t from, uint64_t to)
	{
		to = std::min(to, size);
		if (from >= to)
			return;
		// Without holes in the search, uncovered bytes are sparse zeros
		if (range.complete)
			return;
		uncovered = true;
		result.gaps.add(from, to - from);
		if (full_contents)
			std::fill(result.bytes.begin() + static_cast<std::ptrdiff_t>(from), result.bytes.begin() + static_cast<std::ptrdiff_t>(to), fill);
	};

	uint64_t cursor = 0;
	for (const auto &item : range.items)
	{
		if (item.type() != item_type_t::direct && item.type() != item_type_t::indirect)
			continue;

		uint64_t position = item.key.offset - 1;
		if (position < cursor)
			throw malformed_structure_error(item.block, fmt::format("item {} overlaps the previous body item", item.key.to_string()));
		if (position >= size)
			break;
		cover(cursor, position);

		if (auto direct = std::get_if<direct_item_t>(&item.body))
		{
			uint64_t count = std::min<uint64_t>(direct->bytes.size(), size - position);
			if (full_contents)
				std::memcpy(result.bytes.data() + position, direct->bytes.data(), count);
			cursor = position + direct->bytes.size();
			continue;
		}

		const auto &indirect = std::get<indirect_item_t>(item.body);
		for (size_t i = 0; i != indirect.blocks.size(); i++)
		{
			uint64_t block_position = position + i * block_size;
			if (block_position >= size)
				break;
			uint32_t pointer = indirect.blocks[i];
			if (pointer == 0)
				continue;

			uint64_t count = std::min(block_size, size - block_position);
			result.data_blocks.push_back(pointer);
			if (!reader.is_block_complete(pointer))
				result.missing_blocks.push_back(pointer);

			if (!full_contents)
				continue;

			auto data = reader.read_block(pointer);
			if (!data)
			{
				result.gaps.add(block_position, count);
				std::memset(result.bytes.data() + block_position, fill, count);
				continue;
			}
			std::memcpy(result.bytes.data() + block_position, data->bytes(), count);
		}
		cursor = position + indirect.blocks.size() * block_size;
	}
	cover(cursor, size);

	result.metadata_complete = !uncovered;
	rs_log("{} bytes, {} data blocks ({} missing), {} bytes in gaps",
		   size, result.data_blocks.size(), result.missing_blocks.size(), result.gaps.total());
	return result;
}
