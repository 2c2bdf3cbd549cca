#include "reiserfs/directory.h"
#include "reiserfs/hash.h"
#include "utils.h"

#include <sstream>

namespace
{

// Bound on ".." hops; a corrupt parent chain must not loop forever
const int kMaxPathDepth = 256;

std::vector<std::string> split_path(const std::string &path)
{
	std::vector<std::string> components;
	std::stringstream stream(path);
	std::string component;
	while (std::getline(stream, component, '/'))
	{
		if (!component.empty())
			components.push_back(component);
	}
	return components;
}

std::optional<object_id_t> parent_of(tree_t &tree, const object_id_t &directory)
{
	auto dotdot = lookup_name(tree, directory, "..");
	if (!dotdot.entry)
		return std::nullopt;
	return dotdot.entry->object;
}

// Entries stored under a name hash keep it in bits 7-30; "." and ".." are exact
bool stored_under(const dir_entry_t &entry, uint32_t offset)
{
	if (offset <= kDotDotOffset)
		return entry.offset == offset;
	return entry.hash_value() == offset;
}

const dir_entry_t *find_entry(const item_t &item, const object_id_t &directory, uint32_t offset, const std::string &name)
{
	auto body = std::get_if<directory_item_t>(&item.body);
	if (!body || item.key.object() != directory)
		return nullptr;
	for (const auto &entry : body->entries)
	{
		if (entry.visible() && stored_under(entry, offset) && entry.name == name)
			return &entry;
	}
	return nullptr;
}

name_lookup_t lookup_by_listing(tree_t &tree, const object_id_t &directory, const std::string &name)
{
	auto listing = list_directory(tree, directory);
	if (auto entry = listing.find_name(name))
		return {lookup_status_t::found, *entry};

	bool confirmed = listing.complete || listing.not_a_directory() ||
					 (listing.stat_status == lookup_status_t::not_found && listing.items_complete);
	return {confirmed ? lookup_status_t::not_found : lookup_status_t::incomplete, std::nullopt};
}

} // anonymous namespace

const dir_entry_t *directory_listing_t::find_name(const std::string &name) const
{
	for (const auto &entry : entries)
	{
		if (entry.name == name)
			return &entry;
	}
	return nullptr;
}

const dir_entry_t *directory_listing_t::find_object(const object_id_t &object) const
{
	for (const auto &entry : entries)
	{
		if (entry.object == object && entry.name != "." && entry.name != "..")
			return &entry;
	}
	return nullptr;
}

directory_listing_t list_directory(tree_t &tree, const object_id_t &directory)
{
	ENTRY("{}", directory.to_string());

	directory_listing_t listing;

	auto stat = tree.find_stat(directory);
	listing.stat_status = stat.status;
	if (stat.status == lookup_status_t::found)
	{
		listing.stat = stat.stat;
		if (!stat.stat.is_directory())
			return listing;
	}

	reiser_key_t start{directory.dir_id, directory.object_id, kDotOffset, item_type_t::directory};
	auto range = tree.find_items(start, reiser_key_t::end_key(directory));

	uint64_t total = 0;
	for (const auto &item : range.items)
	{
		auto body = std::get_if<directory_item_t>(&item.body);
		if (!body)
			continue;
		total += item.length;
		for (const auto &entry : body->entries)
		{
			if (entry.visible())
				listing.entries.push_back(entry);
		}
	}

	listing.items_complete = range.complete;
	listing.complete = range.complete && listing.stat && total == listing.stat->size;
	if (!listing.complete)
		rs_log("listing of {} is incomplete ({} of {} bytes)", directory.to_string(), total, listing.stat ? listing.stat->size : 0);
	return listing;
}

name_lookup_t lookup_name(tree_t &tree, const object_id_t &directory, const std::string &name)
{
	ENTRY("{} in {}", name, directory.to_string());

	auto offset = name_offset(tree.superblock().hash_code, name);
	if (!offset)
		return lookup_by_listing(tree, directory, name);

	// The item holding the first entry of the hash may start below it
	reiser_key_t first{directory.dir_id, directory.object_id, *offset, item_type_t::directory};
	auto spanning = tree.find_last_item(first);
	if (spanning.item)
	{
		if (auto entry = find_entry(*spanning.item, directory, *offset, name))
			return {lookup_status_t::found, *entry};
	}

	uint64_t window = *offset <= kDotDotOffset ? 1 : kMaxGeneration + 1;
	reiser_key_t start{directory.dir_id, directory.object_id, *offset + 1ULL, item_type_t::directory};
	reiser_key_t end{directory.dir_id, directory.object_id, *offset + window, item_type_t::directory};
	auto range = tree.find_items(start, end);
	for (const auto &item : range.items)
	{
		if (auto entry = find_entry(item, directory, *offset, name))
			return {lookup_status_t::found, *entry};
	}

	bool complete = spanning.status != lookup_status_t::incomplete && range.complete;
	rs_log("{} {}", name, complete ? "absent" : "behind a hole");
	return {complete ? lookup_status_t::not_found : lookup_status_t::incomplete, std::nullopt};
}

resolve_result_t resolve(tree_t &tree, const std::string &path)
{
	ENTRY("{}", path);

	resolve_result_t result;
	result.object = object_id_t::root();

	auto components = split_path(path);
	size_t first = 0;
	if (!path.starts_with("/") && !components.empty())
	{
		auto start = object_id_t::parse(components[0]);
		if (start)
		{
			result.object = *start;
			first = 1;
		}
	}

	for (size_t i = first; i < components.size(); i++)
	{
		const std::string &name = components[i];
		auto lookup = lookup_name(tree, result.object, name);
		if (!lookup.entry)
		{
			result.component = name;
			result.status = lookup.status;
			rs_log("{} {} in {}", name, string_from_lookup_status(result.status), result.object.to_string());
			return result;
		}

		result.parent = result.object;
		result.object = lookup.entry->object;
	}

	result.status = lookup_status_t::found;
	return result;
}

std::optional<std::string> name_of(tree_t &tree, const object_id_t &object, const object_id_t &parent)
{
	if (object.is_root())
		return "";

	auto listing = list_directory(tree, parent);
	auto entry = listing.find_object(object);
	if (!entry)
		return std::nullopt;
	return entry->name;
}

std::string full_path(tree_t &tree, const object_id_t &object, const object_id_t &parent)
{
	ENTRY("{} in {}", object.to_string(), parent.to_string());

	if (object.is_root())
		return "/";

	std::vector<std::string> parts;
	object_id_t current = object;
	object_id_t directory = parent;

	for (int depth = 0; depth != kMaxPathDepth; depth++)
	{
		auto name = name_of(tree, current, directory);
		if (!name)
		{
			parts.push_back(current.to_string());
			break;
		}
		parts.push_back(*name);

		if (directory.is_root())
		{
			parts.push_back("");
			break;
		}

		auto grandparent = parent_of(tree, directory);
		if (!grandparent)
		{
			parts.push_back(directory.to_string());
			break;
		}
		current = directory;
		directory = *grandparent;
	}

	std::string path;
	for (auto it = parts.rbegin(); it != parts.rend(); ++it)
	{
		if (it != parts.rbegin())
			path += "/";
		path += *it;
	}
	return path;
}
