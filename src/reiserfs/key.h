#pragma once

#include <compare>
#include <cstdint>
#include <string>
#include <optional>

#include "reiserfs/reiserfs.h"

/**
 * Item type of a key. The numeric values are the 3.6 on-disk codes,
 * which also give the tie-break order of keys that differ only by type.
 */
enum class item_type_t : uint8_t
{
	stat = 0,
	indirect = 1,
	direct = 2,
	directory = 3,
	any = 15
};

std::string string_from_item_type(item_type_t type);

/**
 * On-disk key layout. Item headers carry it; internal node keys don't.
 */
enum class key_format_t
{
	v1, ///< 3.5: u32 offset, u32 uniqueness
	v2  ///< 3.6: u64 with type in the top 4 bits
};

/**
 * Identity of a file or directory: (dir_id, object_id).
 */
struct object_id_t
{
	uint32_t dir_id = 0;
	uint32_t object_id = 0;

	static object_id_t root() { return {1, 2}; }
	bool is_root() const { return *this == root(); }

	/**
	 * "D_O", the lost+found naming of an object.
	 */
	std::string to_string() const;

	/**
	 * Parse "D_O" (two decimal ids).
	 */
	static std::optional<object_id_t> parse(const std::string &text);

	auto operator<=>(const object_id_t &other) const = default;
};

/**
 * A decoded key. Ordered by dir_id, object_id, offset, then type.
 */
struct reiser_key_t
{
	uint32_t dir_id = 0;
	uint32_t object_id = 0;
	uint64_t offset = 0;
	item_type_t type = item_type_t::stat;

	object_id_t object() const { return {dir_id, object_id}; }

	/**
	 * Key of the stat data of an object, the smallest key of the object.
	 */
	static reiser_key_t stat_key(const object_id_t &object) { return {object.dir_id, object.object_id, 0, item_type_t::stat}; }

	/**
	 * Smallest key of the next object id; the end of a range over one object.
	 * Past the last object id it is the largest key there is.
	 */
	static reiser_key_t end_key(const object_id_t &object);

	std::string to_string() const;

	auto operator<=>(const reiser_key_t &other) const = default;
};

/**
 * Guess the layout of a key without an item header, the way the kernel
 * does: a 3.6 type of indirect, direct or directory means 3.6.
 */
key_format_t guess_key_format(const ReiserKey &key);

/**
 * Decode a key.
 * @param key On-disk key
 * @param format Layout to decode with
 * @param block Block holding the key, for error reports
 * @throws malformed_structure_error on an unknown type
 */
reiser_key_t decode_key(const ReiserKey &key, key_format_t format, uint64_t block);
