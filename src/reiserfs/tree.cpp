#include "reiserfs/tree.h"
#include "errors.h"
#include "utils.h"

#include <algorithm>
#include <functional>
#include <iterator>
#include <queue>

std::string string_from_lookup_status(lookup_status_t status)
{
	switch (status)
	{
	case lookup_status_t::found:
		return "found";
	case lookup_status_t::not_found:
		return "not found";
	case lookup_status_t::incomplete:
		return "incomplete";
	}
	return "unknown";
}

tree_t::tree_t(gated_reader_t &reader, const superblock_t &superblock, size_t cache_limit)
	: reader_(reader), superblock_(superblock), cache_limit_(cache_limit)
{
}

std::shared_ptr<const tree_node_t> tree_t::read_node(uint64_t block, uint16_t level)
{
	auto cached = cache_.find(block);
	if (cached != cache_.end())
	{
		if (cached->second->level != level)
			throw malformed_structure_error(block, fmt::format("node of level {} reached as level {}", cached->second->level, level));
		return cached->second;
	}

	auto data = reader_.read_block(block);
	if (!data)
		return nullptr;

	auto node = std::make_shared<const tree_node_t>(decode_node(*data, block, superblock_.block_count));
	if (node->level != level)
		throw malformed_structure_error(block, fmt::format("node of level {} reached as level {}", node->level, level));

	if (cache_limit_ != 0)
	{
		if (cache_.size() >= cache_limit_)
		{
			cache_.erase(cache_order_.front());
			cache_order_.pop_front();
		}
		cache_[block] = node;
		cache_order_.push_back(block);
	}
	return node;
}

item_lookup_t tree_t::find_item(const reiser_key_t &key)
{
	uint64_t block = superblock_.root_block;
	uint16_t level = superblock_.root_level();

	while (true)
	{
		auto node = read_node(block, level);
		if (!node)
			return {lookup_status_t::incomplete, std::nullopt};

		if (node->is_leaf())
		{
			const auto &items = node->leaf().items;
			auto it = std::lower_bound(items.begin(), items.end(), key,
									   [](const item_t &item, const reiser_key_t &k)
									   { return item.key < k; });
			if (it != items.end() && it->key == key)
				return {lookup_status_t::found, *it};
			return {lookup_status_t::not_found, std::nullopt};
		}

		// Child i holds the keys in [keys[i-1], keys[i])
		const auto &internal = node->internal();
		auto index = std::upper_bound(internal.keys.begin(), internal.keys.end(), key) - internal.keys.begin();
		block = internal.children[static_cast<size_t>(index)].block;
		level--;
	}
}

item_lookup_t tree_t::find_last_item(uint64_t block, uint16_t level, const reiser_key_t &key)
{
	auto node = read_node(block, level);
	if (!node)
		return {lookup_status_t::incomplete, std::nullopt};

	if (node->is_leaf())
	{
		const auto &items = node->leaf().items;
		auto it = std::upper_bound(items.begin(), items.end(), key,
								   [](const reiser_key_t &k, const item_t &item)
								   { return k < item.key; });
		if (it == items.begin())
			return {lookup_status_t::not_found, std::nullopt};
		return {lookup_status_t::found, *std::prev(it)};
	}

	// A subtree with nothing at or below key sends the search to its left sibling
	const auto &internal = node->internal();
	auto index = std::upper_bound(internal.keys.begin(), internal.keys.end(), key) - internal.keys.begin();
	for (auto i = index; i >= 0; i--)
	{
		auto lookup = find_last_item(internal.children[static_cast<size_t>(i)].block, level - 1, key);
		if (lookup.status != lookup_status_t::not_found)
			return lookup;
	}
	return {lookup_status_t::not_found, std::nullopt};
}

item_lookup_t tree_t::find_last_item(const reiser_key_t &key)
{
	return find_last_item(superblock_.root_block, superblock_.root_level(), key);
}

stat_lookup_t tree_t::find_stat(const object_id_t &object)
{
	auto lookup = find_item(reiser_key_t::stat_key(object));
	if (lookup.status != lookup_status_t::found)
		return {lookup.status, {}};
	return {lookup_status_t::found, std::get<stat_data_t>(lookup.item->body)};
}

void tree_t::find_items(uint64_t block, uint16_t level, const reiser_key_t &start, const reiser_key_t &end, item_range_t &result)
{
	auto node = read_node(block, level);
	if (!node)
	{
		result.complete = false;
		result.holes.push_back(block);
		return;
	}

	if (node->is_leaf())
	{
		for (const auto &item : node->leaf().items)
		{
			if (start <= item.key && item.key < end)
				result.items.push_back(item);
		}
		return;
	}

	const auto &internal = node->internal();
	auto first = std::upper_bound(internal.keys.begin(), internal.keys.end(), start) - internal.keys.begin();
	auto last = std::lower_bound(internal.keys.begin(), internal.keys.end(), end) - internal.keys.begin();
	for (auto i = first; i <= last; i++)
		find_items(internal.children[static_cast<size_t>(i)].block, level - 1, start, end, result);
}

item_range_t tree_t::find_items(const reiser_key_t &start, const reiser_key_t &end)
{
	ENTRY("{} to {}", start.to_string(), end.to_string());

	item_range_t result;
	if (!(start < end))
		return result;
	find_items(superblock_.root_block, superblock_.root_level(), start, end, result);
	rs_log("{} items{}", result.items.size(), result.complete ? "" : " (incomplete)");
	return result;
}

walk_result_t tree_t::walk(const walk_options_t &options)
{
	ENTRY("min_level={} collect_items={}", options.min_level, options.collect_items);

	walk_result_t result;
	bool read_leaves = options.collect_items || options.visitor != nullptr;

	auto wanted = [&](uint16_t level)
	{
		return level > options.min_level || (level == kLeafLevel && read_leaves);
	};

	using entry_t = std::pair<uint64_t, uint16_t>; // block, level
	std::priority_queue<entry_t, std::vector<entry_t>, std::greater<entry_t>> heap;
	std::vector<entry_t> next_pass;

	uint16_t root_level = superblock_.root_level();
	if (root_level >= options.min_level)
		result.used_blocks.add(superblock_.root_block, 1);
	if (wanted(root_level))
		next_pass.push_back({superblock_.root_block, root_level});

	while (!next_pass.empty())
	{
		result.counters.passes++;
		for (const auto &entry : next_pass)
			heap.push(entry);
		next_pass.clear();

		while (!heap.empty())
		{
			auto [block, level] = heap.top();
			heap.pop();

			auto node = read_node(block, level);
			if (!node)
			{
				result.counters.holes++;
				result.incomplete_subtrees.push_back({block, level});
				result.required_reads.add(block, 1);
				if (options.visitor)
					options.visitor->visit_hole(block, level);
				continue;
			}
			result.counters.nodes_read++;

			if (node->is_leaf())
			{
				if (options.visitor)
					options.visitor->visit_leaf(*node);

				const auto &items = node->leaf().items;
				if (options.collect_items)
					result.items.insert(result.items.end(), items.begin(), items.end());

				if (options.min_level == 0)
				{
					for (const auto &item : items)
					{
						auto indirect = std::get_if<indirect_item_t>(&item.body);
						if (!indirect)
							continue;
						for (uint32_t pointer : indirect->blocks)
						{
							// 0 is a sparse block
							if (pointer == 0)
								continue;
							result.used_blocks.add(pointer, 1);
							result.counters.pointers++;
						}
					}
				}
				continue;
			}

			uint16_t child_level = level - 1;
			for (const auto &child : node->internal().children)
			{
				if (child_level >= options.min_level)
				{
					result.used_blocks.add(child.block, 1);
					result.counters.pointers++;
				}
				if (!wanted(child_level))
					continue;
				if (child.block < block)
					next_pass.push_back({child.block, child_level});
				else
					heap.push({child.block, child_level});
			}
		}
	}

	rs_log("{} nodes read in {} passes, {} holes, {} blocks used",
		   result.counters.nodes_read, result.counters.passes, result.counters.holes, result.used_blocks.total());
	return result;
}
