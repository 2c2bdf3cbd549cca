#include <gtest/gtest.h>

#include "data/gated_reader.h"
#include "errors.h"

namespace
{

std::shared_ptr<datasource_t> striped_image()
{
	std::vector<uint8_t> bytes(4 * 1024);
	for (size_t i = 0; i != bytes.size(); i++)
		bytes[i] = static_cast<uint8_t>(i / 1024 + 1);
	return std::make_shared<memory_datasource_t>(bytes);
}

} // anonymous namespace

TEST(GatedReader, HandsOutFinishedBlocksOnly)
{
	auto map = rescue_map_t::parse("0 1024 +\n1024 1024 ?\n2048 1536 +\n3584 512 -\n");
	gated_reader_t reader(striped_image(), map);
	reader.set_geometry(1024, 4);

	auto first = reader.read_block(0);
	ASSERT_TRUE(first.has_value());
	EXPECT_EQ(first->size(), 1024u);
	EXPECT_EQ(first->bytes()[0], 1);

	EXPECT_FALSE(reader.read_block(1).has_value());
	EXPECT_TRUE(reader.read_block(2).has_value());
	EXPECT_FALSE(reader.read_block(3).has_value()); // half finished
}

TEST(GatedReader, RecordsEveryRequest)
{
	auto map = rescue_map_t::parse("0 1024 +\n1024 3072 ?\n");
	gated_reader_t reader(striped_image(), map);
	reader.set_geometry(1024, 4);

	EXPECT_TRUE(reader.is_block_complete(0));
	EXPECT_FALSE(reader.is_block_complete(2));
	EXPECT_TRUE(reader.requested().empty());

	EXPECT_TRUE(reader.read_block(0).has_value());
	EXPECT_FALSE(reader.read_block(2).has_value());

	range_list_t expected;
	expected.add(0, 1024);
	expected.add(2048, 1024);
	EXPECT_EQ(reader.requested(), expected);

	reader.clear_requested();
	EXPECT_TRUE(reader.requested().empty());
}

TEST(GatedReader, AddressesArePartitionRelative)
{
	auto map = rescue_map_t::parse("0 2048 ?\n2048 2048 +\n");
	gated_reader_t reader(striped_image(), map, 2048);
	reader.set_geometry(1024, 2);

	auto block = reader.read_block(1);
	ASSERT_TRUE(block.has_value());
	EXPECT_EQ(block->bytes()[0], 4);
	EXPECT_EQ(reader.block_offset(1), 3072u);
	EXPECT_TRUE(reader.requested().contains(3072));

	auto bytes = reader.read_bytes(0, 16);
	ASSERT_TRUE(bytes.has_value());
	EXPECT_EQ(bytes->bytes()[0], 3);
}

TEST(GatedReader, RejectsAddressesOutsideTheVolume)
{
	auto map = rescue_map_t::parse("0 4096 +\n");
	gated_reader_t reader(striped_image(), map);
	reader.set_geometry(1024, 3);

	EXPECT_THROW(reader.read_block(3), out_of_range_reference_error);
	EXPECT_THROW(reader.is_block_complete(100), out_of_range_reference_error);

	// The volume may claim more blocks than the map covers
	reader.set_geometry(1024, 10);
	EXPECT_THROW(reader.read_block(5), out_of_range_reference_error);
}

TEST(GatedReader, BytesPastTheMapAreHoles)
{
	auto map = rescue_map_t::parse("0 4096 +\n");
	gated_reader_t reader(striped_image(), map);

	EXPECT_FALSE(reader.read_bytes(4000, 512).has_value());
	EXPECT_TRUE(reader.read_bytes(3584, 512).has_value());
}
