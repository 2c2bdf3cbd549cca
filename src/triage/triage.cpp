#include "triage/triage.h"
#include "utils.h"

#include <algorithm>
#include <stdexcept>

std::string string_from_entry_kind(entry_kind_t kind)
{
	switch (kind)
	{
	case entry_kind_t::directory:
		return "directory";
	case entry_kind_t::regular:
		return "regular file";
	case entry_kind_t::link:
		return "symbolic link";
	case entry_kind_t::special:
		return "special file";
	case entry_kind_t::unknown:
		return "unknown";
	}
	return "unknown";
}

namespace
{

entry_kind_t kind_of(const stat_data_t &stat)
{
	if (stat.is_directory())
		return entry_kind_t::directory;
	if (stat.is_regular())
		return entry_kind_t::regular;
	if (stat.is_link())
		return entry_kind_t::link;
	return entry_kind_t::special;
}

// Collects the (entry, directory) pairs of every entry with a given name
class name_finder_t : public tree_visitor_t
{
	std::string name_;
	std::vector<std::pair<object_id_t, object_id_t>> matches_;

public:
	name_finder_t(const std::string &name) : name_(name) {}

	void visit_leaf(const tree_node_t &node) override
	{
		for (const auto &item : node.leaf().items)
		{
			auto directory = std::get_if<directory_item_t>(&item.body);
			if (!directory)
				continue;
			for (const auto &entry : directory->entries)
			{
				if (entry.visible() && entry.name == name_)
					matches_.push_back({entry.object, item.key.object()});
			}
		}
	}

	const std::vector<std::pair<object_id_t, object_id_t>> &matches() const { return matches_; }
};

} // anonymous namespace

triage_t::triage_t(std::shared_ptr<datasource_t> image, const rescue_map_t &map, uint64_t partition_start)
	: reader_(std::move(image), map, partition_start)
{
}

bool triage_t::open()
{
	if (opened_)
		return superblock_.has_value();

	superblock_ = read_superblock(reader_);
	opened_ = true;
	if (!superblock_)
	{
		rs_warn("could not access the superblock");
		return false;
	}
	tree_ = std::make_unique<tree_t>(reader_, *superblock_);
	return true;
}

tree_t &triage_t::tree()
{
	if (!tree_)
		throw std::logic_error("superblock not read");
	return *tree_;
}

targets_t triage_t::superblock_targets() const
{
	targets_t result;
	result.status = lookup_status_t::incomplete;
	result.bytes = reader_.requested();
	return result;
}

targets_t triage_t::bitmap(bool metadata_only)
{
	ENTRY("metadata_only={}", metadata_only);

	if (!open())
		return superblock_targets();

	const superblock_t &superblock = *superblock_;
	targets_t result;
	range_list_t blocks;
	blocks.add(superblock.superblock_block(), 1);

	if (metadata_only)
	{
		for (auto block : superblock.bitmap_blocks())
			blocks.add(block, 1);
	}
	else
	{
		auto scan = scan_bitmaps(reader_, superblock);
		blocks.add(scan.used);
		for (auto block : scan.missing_bitmaps)
			blocks.add(block, 1);
		result.missing_bitmaps = scan.missing_bitmaps.size();
	}

	result.bytes = blocks.scaled(superblock.block_size, reader_.partition_start());
	return result;
}

targets_t triage_t::tree_blocks(uint16_t level, bool metadata_only)
{
	ENTRY("level={} metadata_only={}", level, metadata_only);

	if (!open())
		return superblock_targets();

	if (metadata_only)
		level = std::max<uint16_t>(level, kLeafLevel);

	walk_options_t options;
	options.min_level = level;
	auto walk = tree().walk(options);

	range_list_t blocks;
	blocks.add(superblock_->superblock_block(), 1);
	blocks.add(walk.used_blocks);

	targets_t result;
	result.bytes = blocks.scaled(superblock_->block_size, reader_.partition_start());
	result.counters = walk.counters;
	result.incomplete_subtrees = walk.incomplete_subtrees.size();
	return result;
}

targets_t triage_t::folder(const std::vector<std::string> &paths, bool metadata_only)
{
	ENTRY("{} paths, metadata_only={}", paths.size(), metadata_only);

	if (!open())
		return superblock_targets();

	targets_t result;
	std::vector<object_id_t> pending;
	std::set<object_id_t> excluded;

	for (const auto &path : paths)
	{
		bool exclude = path.starts_with("-");
		std::string name = exclude ? path.substr(1) : path;

		auto resolved = resolve(tree(), name);
		if (resolved.status == lookup_status_t::not_found)
		{
			result.status = lookup_status_t::not_found;
			result.missing_path = name;
			result.bytes.clear();
			return result;
		}
		if (resolved.status == lookup_status_t::incomplete)
		{
			rs_warn("{} cannot be resolved yet ({} is behind a hole)", name, resolved.component);
			result.status = lookup_status_t::incomplete;
			result.missing_path = name;
			continue;
		}

		if (exclude)
			excluded.insert(resolved.object);
		else
			pending.push_back(resolved.object);
	}

	// Hard links and corrupt directories can reach an object twice
	std::set<object_id_t> visited;
	range_list_t data_blocks;
	while (!pending.empty())
	{
		object_id_t object = pending.back();
		pending.pop_back();
		if (!visited.insert(object).second)
			continue;

		auto stat = tree().find_stat(object);
		if (stat.status == lookup_status_t::incomplete)
			result.status = lookup_status_t::incomplete;
		if (stat.status != lookup_status_t::found)
			continue;

		if (stat.stat.is_directory())
		{
			auto listing = list_directory(tree(), object);
			if (!listing.complete)
				result.status = lookup_status_t::incomplete;
			for (const auto &entry : listing.entries)
			{
				if (entry.name == "." || entry.name == "..")
					continue;
				if (excluded.contains(entry.object))
					continue;
				pending.push_back(entry.object);
			}
		}
		else if (stat.stat.is_regular())
		{
			auto contents = read_object(tree(), object, false);
			if (!contents.metadata_complete)
				result.status = lookup_status_t::incomplete;
			if (!metadata_only)
			{
				for (auto block : contents.data_blocks)
					data_blocks.add(block, 1);
			}
		}
	}

	rs_log("{} objects visited, {} data blocks", visited.size(), data_blocks.total());

	result.bytes = reader_.requested();
	result.bytes.add(data_blocks.scaled(superblock_->block_size, reader_.partition_start()));
	return result;
}

ls_entry_t triage_t::describe(const dir_entry_t &entry)
{
	ls_entry_t result;
	result.name = entry.name;
	result.object = entry.object;

	auto stat = tree().find_stat(entry.object);
	if (stat.status != lookup_status_t::found)
	{
		result.stat_incomplete = true;
		return result;
	}

	result.kind = kind_of(stat.stat);
	if (result.kind == entry_kind_t::regular)
	{
		auto contents = read_object(tree(), entry.object, false);
		result.block_list_incomplete = !contents.metadata_complete;
		result.data_incomplete = !contents.missing_blocks.empty();
	}
	return result;
}

ls_listing_t triage_t::list(const object_id_t &directory, const std::optional<object_id_t> &parent, const std::string &path, bool recursive, std::set<object_id_t> &visited)
{
	ENTRY("{}", path);

	ls_listing_t listing;
	listing.path = path;
	listing.object = directory;
	listing.parent = parent;

	auto contents = list_directory(tree(), directory);
	listing.complete = contents.complete;

	for (const auto &entry : contents.entries)
	{
		if (entry.name == "." || entry.name == "..")
		{
			if (entry.name == ".." && !listing.parent)
				listing.parent = entry.object;
			continue;
		}
		listing.entries.push_back(describe(entry));
	}

	std::sort(listing.entries.begin(), listing.entries.end(),
			  [](const ls_entry_t &a, const ls_entry_t &b)
			  { return a.name < b.name; });

	if (!recursive)
		return listing;

	for (const auto &entry : listing.entries)
	{
		if (entry.kind != entry_kind_t::directory)
			continue;
		if (!visited.insert(entry.object).second)
			continue;
		listing.subdirectories.push_back(list(entry.object, directory, path + entry.name + "/", true, visited));
	}
	return listing;
}

ls_result_t triage_t::ls(const std::string &path, bool recursive)
{
	ENTRY("{} recursive={}", path, recursive);

	ls_result_t result;
	if (!open())
	{
		result.status = lookup_status_t::incomplete;
		return result;
	}

	auto resolved = resolve(tree(), path);
	if (resolved.status != lookup_status_t::found)
	{
		result.status = resolved.status;
		return result;
	}

	auto stat = tree().find_stat(resolved.object);
	if (stat.status != lookup_status_t::found)
	{
		result.status = stat.status;
		return result;
	}

	result.status = lookup_status_t::found;
	result.kind = kind_of(stat.stat);
	if (result.kind != entry_kind_t::directory)
		return result;

	std::string display = path.empty() ? "/" : path;
	if (!display.ends_with("/"))
		display += "/";

	std::set<object_id_t> visited{resolved.object};
	result.listing = list(resolved.object, resolved.parent, display, recursive, visited);
	return result;
}

find_result_t triage_t::find(const std::string &name)
{
	ENTRY("{}", name);

	find_result_t result;
	if (!open())
	{
		result.complete = false;
		return result;
	}

	name_finder_t finder(name);
	walk_options_t options;
	options.min_level = kLeafLevel;
	options.visitor = &finder;
	auto walk = tree().walk(options);
	result.complete = walk.incomplete_subtrees.empty();

	for (const auto &[object, directory] : finder.matches())
		result.paths.push_back(full_path(tree(), object, directory));
	return result;
}

cat_result_t triage_t::cat(const std::string &path, uint8_t fill)
{
	ENTRY("{}", path);

	cat_result_t result;
	if (!open())
	{
		result.status = lookup_status_t::incomplete;
		return result;
	}

	auto resolved = resolve(tree(), path);
	if (resolved.status != lookup_status_t::found)
	{
		result.status = resolved.status;
		return result;
	}

	result.contents = read_object(tree(), resolved.object, true, fill);
	switch (result.contents.status)
	{
	case object_status_t::not_found:
		result.status = lookup_status_t::not_found;
		break;
	case object_status_t::incomplete:
		result.status = lookup_status_t::incomplete;
		break;
	case object_status_t::found:
	case object_status_t::not_regular:
		result.status = lookup_status_t::found;
		break;
	}
	return result;
}
