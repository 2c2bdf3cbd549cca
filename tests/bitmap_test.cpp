#include <gtest/gtest.h>

#include "image_builder.h"
#include "reiserfs/bitmap.h"

TEST(Bitmap, DecodesRunsLeastSignificantBitFirst)
{
	std::vector<uint8_t> bytes(4, 0);
	bytes[0] = 0x0F; // blocks 0-3
	bytes[1] = 0x80; // block 15
	bytes[2] = 0xFF; // blocks 16-23
	range_list_t used;
	range_list_t free;

	decode_bitmap(block_t(bytes), 1000, 1030, used, free);

	range_list_t expected_used;
	expected_used.add(1000, 4);
	expected_used.add(1015, 9);
	EXPECT_EQ(used, expected_used);
	EXPECT_EQ(free.total(), 30u - 13u);
}

TEST(Bitmap, ScanOfTheSampleVolume)
{
	sample_volume_t volume(3);
	auto map = volume.finished_map();
	gated_reader_t reader(volume.source(), map);
	auto superblock = read_superblock(reader);
	ASSERT_TRUE(superblock.has_value());

	auto scan = scan_bitmaps(reader, *superblock);
	EXPECT_TRUE(scan.missing_bitmaps.empty());
	EXPECT_TRUE(scan.unknown.empty());
	EXPECT_TRUE(scan.used.contains(sample_volume_t::kRootBlock));
	EXPECT_TRUE(scan.used.contains(sample_volume_t::kRightLeaf));
	EXPECT_TRUE(scan.used.contains(sample_volume_t::kSecondDataBlock));
	EXPECT_FALSE(scan.used.contains(40));
	EXPECT_EQ(scan.used.total() + scan.free.total(), sample_volume_t::kBlockCount);
}

TEST(Bitmap, MissingBitmapMakesItsRangeUnknown)
{
	sample_volume_t volume;
	auto map = volume.map_with_hole(sample_volume_t::kBitmapBlock);
	gated_reader_t reader(volume.source(), map);
	auto superblock = read_superblock(reader);
	ASSERT_TRUE(superblock.has_value());

	auto scan = scan_bitmaps(reader, *superblock);
	EXPECT_EQ(scan.missing_bitmaps, std::vector<uint64_t>{sample_volume_t::kBitmapBlock});
	EXPECT_TRUE(scan.used.empty());
	EXPECT_TRUE(scan.free.empty());
	EXPECT_EQ(scan.unknown.total(), sample_volume_t::kBlockCount);
}

TEST(Bitmap, ScanIsDeterministic)
{
	sample_volume_t volume(3);
	auto map = volume.finished_map();
	gated_reader_t reader(volume.source(), map);
	auto superblock = read_superblock(reader);
	ASSERT_TRUE(superblock.has_value());

	auto first = scan_bitmaps(reader, *superblock);
	auto second = scan_bitmaps(reader, *superblock);
	EXPECT_EQ(first.used, second.used);
	EXPECT_EQ(first.free, second.free);
}

TEST(Bitmap, ScanOfPackedBitmaps)
{
	old_volume_t volume;
	auto map = volume.finished_map();
	gated_reader_t reader(volume.source(), map);
	auto superblock = read_superblock(reader);
	ASSERT_TRUE(superblock.has_value());

	auto scan = scan_bitmaps(reader, *superblock);
	EXPECT_TRUE(scan.missing_bitmaps.empty());
	EXPECT_TRUE(scan.unknown.empty());
	for (uint64_t block = 0; block <= old_volume_t::kSecondBitmap; block++)
		EXPECT_TRUE(scan.used.contains(block)) << block;
	EXPECT_TRUE(scan.used.contains(old_volume_t::kRootBlock));
	EXPECT_TRUE(scan.used.contains(old_volume_t::kDataBlock));
	EXPECT_FALSE(scan.used.contains(old_volume_t::kDataBlock - 1));
	EXPECT_EQ(scan.used.total(), 13u);
	EXPECT_EQ(scan.used.total() + scan.free.total(), old_volume_t::kBlockCount);
}

TEST(Bitmap, MissingPackedBitmapMakesTheTailUnknown)
{
	old_volume_t volume;
	auto map = volume.map_with_hole(old_volume_t::kSecondBitmap);
	gated_reader_t reader(volume.source(), map);
	auto superblock = read_superblock(reader);
	ASSERT_TRUE(superblock.has_value());

	auto scan = scan_bitmaps(reader, *superblock);
	EXPECT_EQ(scan.missing_bitmaps, std::vector<uint64_t>{old_volume_t::kSecondBitmap});

	range_list_t expected;
	expected.add(8192, old_volume_t::kBlockCount - 8192);
	EXPECT_EQ(scan.unknown, expected);
	EXPECT_TRUE(scan.used.contains(old_volume_t::kRootBlock));
	EXPECT_FALSE(scan.used.contains(old_volume_t::kDataBlock));
}
