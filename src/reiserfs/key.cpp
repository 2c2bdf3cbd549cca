#include "reiserfs/key.h"
#include "errors.h"
#include "utils.h"

std::string string_from_item_type(item_type_t type)
{
	switch (type)
	{
	case item_type_t::stat:
		return "stat";
	case item_type_t::indirect:
		return "indirect";
	case item_type_t::direct:
		return "direct";
	case item_type_t::directory:
		return "directory";
	case item_type_t::any:
		return "any";
	}
	return "unknown";
}

std::string object_id_t::to_string() const
{
	return fmt::format("{}_{}", dir_id, object_id);
}

std::optional<object_id_t> object_id_t::parse(const std::string &text)
{
	auto underscore = text.find('_');
	if (underscore == std::string::npos || underscore == 0 || underscore == text.size() - 1)
		return std::nullopt;

	std::string dir = text.substr(0, underscore);
	std::string object = text.substr(underscore + 1);
	auto is_decimal = [](const std::string &s)
	{ return s.find_first_not_of("0123456789") == std::string::npos; };
	if (!is_decimal(dir) || !is_decimal(object))
		return std::nullopt;

	uint64_t dir_id;
	uint64_t object_id;
	if (!parse_number(dir, dir_id) || !parse_number(object, object_id))
		return std::nullopt;
	if (dir_id > UINT32_MAX || object_id > UINT32_MAX)
		return std::nullopt;

	return object_id_t{static_cast<uint32_t>(dir_id), static_cast<uint32_t>(object_id)};
}

reiser_key_t reiser_key_t::end_key(const object_id_t &object)
{
	if (object.object_id != UINT32_MAX)
		return {object.dir_id, object.object_id + 1, 0, item_type_t::stat};
	if (object.dir_id != UINT32_MAX)
		return {object.dir_id + 1, 0, 0, item_type_t::stat};
	return {UINT32_MAX, UINT32_MAX, UINT64_MAX, item_type_t::any};
}

std::string reiser_key_t::to_string() const
{
	return fmt::format("[{} {} {} {}]", dir_id, object_id, offset, string_from_item_type(type));
}

key_format_t guess_key_format(const ReiserKey &key)
{
	uint32_t type = le32(key.k_uniqueness) >> 28;
	if (type == static_cast<uint32_t>(item_type_t::indirect) ||
		type == static_cast<uint32_t>(item_type_t::direct) ||
		type == static_cast<uint32_t>(item_type_t::directory))
		return key_format_t::v2;
	return key_format_t::v1;
}

reiser_key_t decode_key(const ReiserKey &key, key_format_t format, uint64_t block)
{
	reiser_key_t result;
	result.dir_id = le32(key.k_dir_id);
	result.object_id = le32(key.k_objectid);

	uint32_t low = le32(key.k_offset);
	uint32_t high = le32(key.k_uniqueness);

	if (format == key_format_t::v2)
	{
		uint64_t offset_v2 = (static_cast<uint64_t>(high) << 32) | low;
		result.offset = offset_v2 & 0x0FFFFFFFFFFFFFFFULL;
		uint32_t type = high >> 28;
		switch (type)
		{
		case 0:
		case 1:
		case 2:
		case 3:
		case 15:
			result.type = static_cast<item_type_t>(type);
			break;
		default:
			throw malformed_structure_error(block, fmt::format("key {}/{} has unknown type {}", result.dir_id, result.object_id, type));
		}
		return result;
	}

	result.offset = low;
	switch (high)
	{
	case kV1StatUniqueness:
		result.type = item_type_t::stat;
		break;
	case kV1IndirectUniqueness:
		result.type = item_type_t::indirect;
		break;
	case kV1DirectUniqueness:
		result.type = item_type_t::direct;
		break;
	case kV1DirectoryUniqueness:
		result.type = item_type_t::directory;
		break;
	case kV1AnyUniqueness:
		result.type = item_type_t::any;
		break;
	default:
		throw malformed_structure_error(block, fmt::format("key {}/{} has unknown uniqueness {}", result.dir_id, result.object_id, high));
	}
	return result;
}
