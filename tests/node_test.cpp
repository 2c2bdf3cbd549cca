#include <gtest/gtest.h>

#include <endian.h>

#include "errors.h"
#include "image_builder.h"
#include "reiserfs/node.h"
#include "reiserfs/reiserfs.h"

namespace
{

const size_t kBlockSize = 4096;
const uint64_t kBlockCount = 64;

tree_node_t decode(const std::vector<uint8_t> &bytes)
{
	return decode_node(block_t(bytes), 20, kBlockCount);
}

} // anonymous namespace

TEST(Node, DecodesALeaf)
{
	object_id_t file{2, 3};
	auto node = decode(encode_leaf({stat_item(file, kTypeRegular, 4), direct_item(file, "data")}, kBlockSize));

	ASSERT_TRUE(node.is_leaf());
	const auto &items = node.leaf().items;
	ASSERT_EQ(items.size(), 2u);

	EXPECT_EQ(items[0].key, reiser_key_t::stat_key(file));
	EXPECT_EQ(items[0].format, key_format_t::v2);
	const auto &stat = std::get<stat_data_t>(items[0].body);
	EXPECT_TRUE(stat.is_regular());
	EXPECT_EQ(stat.size, 4u);
	EXPECT_EQ(stat.permissions(), 0644);

	EXPECT_EQ(items[1].type(), item_type_t::direct);
	EXPECT_EQ(std::get<direct_item_t>(items[1].body).bytes, (std::vector<uint8_t>{'d', 'a', 't', 'a'}));
	EXPECT_EQ(items[1].block, 20u);
}

TEST(Node, DecodesDirectoryEntries)
{
	object_id_t directory{1, 2};
	auto item = directory_item(directory, {0, 1}, {{"b", {2, 10}}, {"a", {2, 11}}}, kHashR5);
	auto node = decode(encode_leaf({item}, kBlockSize));

	const auto &entries = std::get<directory_item_t>(node.leaf().items[0].body).entries;
	ASSERT_EQ(entries.size(), 4u);
	EXPECT_EQ(entries[0].name, ".");
	EXPECT_EQ(entries[0].object, directory);
	EXPECT_EQ(entries[1].name, "..");
	EXPECT_EQ(entries[1].object, (object_id_t{0, 1}));
	for (size_t i = 1; i != entries.size(); i++)
		EXPECT_LT(entries[i - 1].offset, entries[i].offset);
	for (const auto &entry : entries)
		EXPECT_TRUE(entry.visible());
}

TEST(Node, DecodesAnInternalNode)
{
	auto node = decode(encode_internal(2, {reiser_key_t::stat_key({2, 5})}, {21, 22}, kBlockSize));

	ASSERT_FALSE(node.is_leaf());
	EXPECT_EQ(node.level, 2);
	const auto &internal = node.internal();
	ASSERT_EQ(internal.keys.size(), 1u);
	EXPECT_EQ(internal.keys[0], reiser_key_t::stat_key({2, 5}));
	ASSERT_EQ(internal.children.size(), 2u);
	EXPECT_EQ(internal.children[1].block, 22u);
}

TEST(Node, FreeBlockIsMalformed)
{
	EXPECT_THROW(decode(std::vector<uint8_t>(kBlockSize, 0)), malformed_structure_error);
}

TEST(Node, KeysOutOfOrderAreMalformed)
{
	object_id_t first{2, 3};
	object_id_t second{2, 4};
	auto bytes = encode_leaf({stat_item(second, kTypeRegular, 0), stat_item(first, kTypeRegular, 0)}, kBlockSize);
	EXPECT_THROW(decode(bytes), malformed_structure_error);

	auto internal = encode_internal(2, {reiser_key_t::stat_key(second), reiser_key_t::stat_key(first)}, {21, 22, 23}, kBlockSize);
	EXPECT_THROW(decode(internal), malformed_structure_error);
}

TEST(Node, PointersPastTheVolumeAreOutOfRange)
{
	object_id_t file{2, 3};
	auto leaf = encode_leaf({stat_item(file, kTypeRegular, 8192), indirect_item(file, {30, 64})}, kBlockSize);
	EXPECT_THROW(decode(leaf), out_of_range_reference_error);

	auto internal = encode_internal(2, {reiser_key_t::stat_key(file)}, {21, 1000}, kBlockSize);
	EXPECT_THROW(decode(internal), out_of_range_reference_error);
}

TEST(Node, BadStatDataLengthIsMalformed)
{
	object_id_t file{2, 3};
	auto item = stat_item(file, kTypeRegular, 0);
	item.body.resize(40);
	EXPECT_THROW(decode(encode_leaf({item}, kBlockSize)), malformed_structure_error);
}

TEST(Node, ObjectIdNaming)
{
	EXPECT_EQ((object_id_t{12, 345}).to_string(), "12_345");
	EXPECT_EQ(object_id_t::parse("12_345"), (object_id_t{12, 345}));
	EXPECT_FALSE(object_id_t::parse("12_").has_value());
	EXPECT_FALSE(object_id_t::parse("docs").has_value());
	EXPECT_FALSE(object_id_t::parse("1_x").has_value());
	EXPECT_FALSE(object_id_t::parse("1_99999999999").has_value());
}

TEST(Node, EndKeyCarriesIntoTheDirId)
{
	EXPECT_EQ(reiser_key_t::end_key({1, 2}), (reiser_key_t{1, 3, 0, item_type_t::stat}));
	EXPECT_EQ(reiser_key_t::end_key({5, UINT32_MAX}), (reiser_key_t{6, 0, 0, item_type_t::stat}));
	EXPECT_LT(reiser_key_t::stat_key({5, UINT32_MAX}), reiser_key_t::end_key({5, UINT32_MAX}));

	object_id_t last{UINT32_MAX, UINT32_MAX};
	reiser_key_t body{UINT32_MAX, UINT32_MAX, 1, item_type_t::direct};
	EXPECT_LT(reiser_key_t::stat_key(last), reiser_key_t::end_key(last));
	EXPECT_LT(body, reiser_key_t::end_key(last));
}

TEST(Node, DecodesOldFormatItems)
{
	object_id_t file{2, 3};
	auto node = decode(encode_leaf({old_stat_item(file, kTypeRegular, 4, 500),
									old_format(direct_item(file, "data"))},
								   kBlockSize));

	const auto &items = node.leaf().items;
	ASSERT_EQ(items.size(), 2u);
	EXPECT_EQ(items[0].format, key_format_t::v1);
	EXPECT_EQ(items[0].key, reiser_key_t::stat_key(file));
	EXPECT_EQ(items[0].length, sizeof(ReiserStatDataV1));

	const auto &stat = std::get<stat_data_t>(items[0].body);
	EXPECT_TRUE(stat.is_regular());
	EXPECT_EQ(stat.permissions(), 0644);
	EXPECT_EQ(stat.nlink, 1u);
	EXPECT_EQ(stat.uid, 500u);
	EXPECT_EQ(stat.size, 4u);
	EXPECT_EQ(stat.mtime, 900000000u);

	EXPECT_EQ(items[1].format, key_format_t::v1);
	EXPECT_EQ(items[1].key, (reiser_key_t{2, 3, 1, item_type_t::direct}));
}

TEST(Node, OldKeysUseUniquenessCodes)
{
	auto key = [](uint32_t offset, uint32_t uniqueness)
	{
		ReiserKey result;
		result.k_dir_id = htole32(2);
		result.k_objectid = htole32(3);
		result.k_offset = htole32(offset);
		result.k_uniqueness = htole32(uniqueness);
		return result;
	};

	EXPECT_EQ(decode_key(key(0, kV1StatUniqueness), key_format_t::v1, 20).type, item_type_t::stat);
	EXPECT_EQ(decode_key(key(1, kV1IndirectUniqueness), key_format_t::v1, 20).type, item_type_t::indirect);
	EXPECT_EQ(decode_key(key(4097, kV1DirectUniqueness), key_format_t::v1, 20),
			  (reiser_key_t{2, 3, 4097, item_type_t::direct}));
	EXPECT_EQ(decode_key(key(kDotOffset, kV1DirectoryUniqueness), key_format_t::v1, 20).type, item_type_t::directory);
	EXPECT_EQ(decode_key(key(0, kV1AnyUniqueness), key_format_t::v1, 20).type, item_type_t::any);
	EXPECT_THROW(decode_key(key(0, 7), key_format_t::v1, 20), malformed_structure_error);

	// Internal node keys carry no version
	EXPECT_EQ(guess_key_format(key(1, kV1IndirectUniqueness)), key_format_t::v1);
	EXPECT_EQ(guess_key_format(key(1, kV1DirectoryUniqueness)), key_format_t::v1);
	EXPECT_EQ(guess_key_format(key(1, 0x10000000)), key_format_t::v2);
	EXPECT_EQ(guess_key_format(key(1, 0x30000000)), key_format_t::v2);
}
