#include <gtest/gtest.h>

#include "image_builder.h"
#include "reiserfs/reiserfs.h"
#include "rescue/map_output.h"
#include "triage/triage.h"

namespace
{

const uint64_t kBlock = sample_volume_t::kBlockSize;

bool covers_block(const range_list_t &bytes, uint64_t block)
{
	return bytes.contains(block * kBlock) && bytes.contains(block * kBlock + kBlock - 1);
}

} // anonymous namespace

TEST(Triage, BitmapTargetsUsedBlocks)
{
	sample_volume_t volume(3);
	auto map = volume.finished_map();
	triage_t triage(volume.source(), map);

	auto targets = triage.bitmap(false);
	EXPECT_EQ(targets.status, lookup_status_t::found);
	EXPECT_TRUE(covers_block(targets.bytes, sample_volume_t::kSuperBlock));
	EXPECT_TRUE(covers_block(targets.bytes, sample_volume_t::kRightLeaf));
	EXPECT_TRUE(covers_block(targets.bytes, sample_volume_t::kSecondDataBlock));
	EXPECT_FALSE(targets.bytes.contains(40 * kBlock));
	EXPECT_EQ(targets.missing_bitmaps, 0u);
}

TEST(Triage, BitmapMetadataOnly)
{
	sample_volume_t volume(3);
	auto map = volume.finished_map();
	triage_t triage(volume.source(), map);

	auto targets = triage.bitmap(true);
	range_list_t expected;
	expected.add(sample_volume_t::kSuperBlock * kBlock, 2 * kBlock); // superblock and bitmap
	EXPECT_EQ(targets.bytes, expected);
}

TEST(Triage, MissingBitmapIsATarget)
{
	sample_volume_t volume(3);
	auto map = volume.map_with_hole(sample_volume_t::kBitmapBlock);
	triage_t triage(volume.source(), map);

	auto targets = triage.bitmap(false);
	EXPECT_EQ(targets.missing_bitmaps, 1u);
	EXPECT_TRUE(covers_block(targets.bytes, sample_volume_t::kBitmapBlock));

	// The retry map asks for the bitmap again
	auto output = render_targets(targets.bytes, map, output_style_t::retry);
	EXPECT_EQ(output.status_at(sample_volume_t::kBitmapBlock * kBlock), rescue_status_t::non_tried);
	EXPECT_EQ(output.size(), map.size());
}

TEST(Triage, SuperblockHoleTargetsTheSuperblock)
{
	sample_volume_t volume(3);
	auto map = volume.map_with_hole(sample_volume_t::kSuperBlock);
	triage_t triage(volume.source(), map);

	range_list_t expected;
	expected.add(kSuperBlockOffset, kSuperBlockReadSize);

	for (auto targets : {triage.bitmap(false), triage.tree_blocks(0, false), triage.folder({"/"}, false)})
	{
		EXPECT_EQ(targets.status, lookup_status_t::incomplete);
		EXPECT_EQ(targets.bytes, expected);
	}
	EXPECT_FALSE(triage.superblock().has_value());
	EXPECT_EQ(triage.ls("/", false).status, lookup_status_t::incomplete);
	EXPECT_EQ(triage.cat("/hello.txt").status, lookup_status_t::incomplete);
	EXPECT_FALSE(triage.find("hello.txt").complete);
}

TEST(Triage, TreeLevels)
{
	sample_volume_t volume(3);
	auto map = volume.finished_map();
	triage_t triage(volume.source(), map);

	auto internal = triage.tree_blocks(2, false);
	auto leaves = triage.tree_blocks(1, false);
	auto everything = triage.tree_blocks(0, false);
	auto metadata = triage.tree_blocks(0, true);

	EXPECT_TRUE(covers_block(internal.bytes, sample_volume_t::kRootBlock));
	EXPECT_FALSE(internal.bytes.contains(sample_volume_t::kLeftLeaf * kBlock));
	EXPECT_TRUE(covers_block(leaves.bytes, sample_volume_t::kLeftLeaf));
	EXPECT_FALSE(leaves.bytes.contains(sample_volume_t::kFirstDataBlock * kBlock));
	EXPECT_TRUE(covers_block(everything.bytes, sample_volume_t::kFirstDataBlock));

	EXPECT_TRUE(internal.bytes.is_subset_of(leaves.bytes));
	EXPECT_TRUE(leaves.bytes.is_subset_of(everything.bytes));
	EXPECT_EQ(metadata.bytes, leaves.bytes);
}

TEST(Triage, FolderTargetsTheSubtree)
{
	sample_volume_t volume(3);
	auto map = volume.finished_map();
	triage_t triage(volume.source(), map);

	auto targets = triage.folder({"/"}, false);
	EXPECT_EQ(targets.status, lookup_status_t::found);
	EXPECT_TRUE(covers_block(targets.bytes, sample_volume_t::kLeftLeaf));
	EXPECT_TRUE(covers_block(targets.bytes, sample_volume_t::kRightLeaf));
	EXPECT_TRUE(covers_block(targets.bytes, sample_volume_t::kFirstDataBlock));
	EXPECT_TRUE(covers_block(targets.bytes, sample_volume_t::kSecondDataBlock));
}

TEST(Triage, FolderExcludesDashPaths)
{
	sample_volume_t volume(3);
	auto map = volume.finished_map();
	triage_t triage(volume.source(), map);

	auto targets = triage.folder({"/", "-/big.bin"}, false);
	EXPECT_EQ(targets.status, lookup_status_t::found);
	EXPECT_TRUE(covers_block(targets.bytes, sample_volume_t::kRightLeaf));
	EXPECT_FALSE(targets.bytes.contains(sample_volume_t::kFirstDataBlock * kBlock));
	EXPECT_FALSE(targets.bytes.contains(sample_volume_t::kSecondDataBlock * kBlock));
}

TEST(Triage, FolderMetadataOnlyLeavesDataOut)
{
	sample_volume_t volume(3);
	auto map = volume.finished_map();
	triage_t triage(volume.source(), map);

	auto targets = triage.folder({"/"}, true);
	EXPECT_TRUE(covers_block(targets.bytes, sample_volume_t::kLeftLeaf));
	EXPECT_FALSE(targets.bytes.contains(sample_volume_t::kFirstDataBlock * kBlock));
}

TEST(Triage, FolderNotFoundAborts)
{
	sample_volume_t volume(3);
	auto map = volume.finished_map();
	triage_t triage(volume.source(), map);

	auto targets = triage.folder({"/docs", "/nope"}, false);
	EXPECT_EQ(targets.status, lookup_status_t::not_found);
	EXPECT_EQ(targets.missing_path, "/nope");
	EXPECT_TRUE(targets.bytes.empty());
}

TEST(Triage, FolderBehindAHoleTargetsTheHole)
{
	sample_volume_t volume(3);
	auto map = volume.map_with_hole(sample_volume_t::kRightLeaf);
	triage_t triage(volume.source(), map);

	// docs resolves, but what is below it cannot be read yet
	auto targets = triage.folder({"/docs"}, false);
	EXPECT_EQ(targets.status, lookup_status_t::incomplete);
	EXPECT_TRUE(covers_block(targets.bytes, sample_volume_t::kRightLeaf));

	auto nested = triage.folder({"/docs/notes.txt"}, false);
	EXPECT_EQ(nested.status, lookup_status_t::incomplete);
	EXPECT_TRUE(covers_block(nested.bytes, sample_volume_t::kRightLeaf));
}

TEST(Triage, LsListsSortedEntries)
{
	sample_volume_t volume(3);
	auto map = volume.finished_map();
	triage_t triage(volume.source(), map);

	auto result = triage.ls("/", false);
	ASSERT_EQ(result.status, lookup_status_t::found);
	EXPECT_EQ(result.kind, entry_kind_t::directory);

	const auto &listing = result.listing;
	EXPECT_EQ(listing.path, "/");
	EXPECT_TRUE(listing.complete);
	ASSERT_EQ(listing.entries.size(), 3u);
	EXPECT_EQ(listing.entries[0].name, "big.bin");
	EXPECT_EQ(listing.entries[1].name, "docs");
	EXPECT_EQ(listing.entries[1].kind, entry_kind_t::directory);
	EXPECT_EQ(listing.entries[2].name, "hello.txt");
	EXPECT_EQ(listing.entries[2].kind, entry_kind_t::regular);
	for (const auto &entry : listing.entries)
		EXPECT_TRUE(entry.complete());
	EXPECT_TRUE(listing.subdirectories.empty());
}

TEST(Triage, LsFlagsABodyBehindAHole)
{
	split_file_volume_t volume;
	auto map = volume.map_with_hole(split_file_volume_t::kBodyLeaf);
	triage_t triage(volume.source(), map);

	auto result = triage.ls("/", false);
	ASSERT_EQ(result.status, lookup_status_t::found);
	EXPECT_TRUE(result.listing.complete);
	ASSERT_EQ(result.listing.entries.size(), 1u);

	const auto &entry = result.listing.entries[0];
	EXPECT_EQ(entry.name, "split.txt");
	EXPECT_EQ(entry.kind, entry_kind_t::regular);
	EXPECT_FALSE(entry.stat_incomplete);
	EXPECT_TRUE(entry.block_list_incomplete);
	EXPECT_FALSE(entry.complete());
}

TEST(Triage, LsRecursive)
{
	sample_volume_t volume(3);
	auto map = volume.finished_map();
	triage_t triage(volume.source(), map);

	auto result = triage.ls("/", true);
	ASSERT_EQ(result.listing.subdirectories.size(), 1u);
	const auto &docs = result.listing.subdirectories[0];
	EXPECT_EQ(docs.path, "/docs/");
	EXPECT_EQ(docs.object, sample_volume_t::docs());
	EXPECT_EQ(docs.parent, object_id_t::root());
	ASSERT_EQ(docs.entries.size(), 1u);
	EXPECT_EQ(docs.entries[0].name, "notes.txt");
}

TEST(Triage, LsFlagsIncompleteEntries)
{
	sample_volume_t volume(3);
	auto map = volume.map_with_hole(sample_volume_t::kSecondDataBlock);
	map.set_status(sample_volume_t::kRightLeaf * kBlock, kBlock, rescue_status_t::bad_sector);
	triage_t triage(volume.source(), map);

	auto result = triage.ls("/", false);
	ASSERT_EQ(result.status, lookup_status_t::found);
	const auto &entries = result.listing.entries;
	ASSERT_EQ(entries.size(), 3u);

	EXPECT_EQ(entries[0].name, "big.bin");
	EXPECT_TRUE(entries[0].data_incomplete);
	EXPECT_FALSE(entries[0].stat_incomplete);

	EXPECT_EQ(entries[1].name, "docs");
	EXPECT_TRUE(entries[1].stat_incomplete);
	EXPECT_EQ(entries[1].kind, entry_kind_t::unknown);

	EXPECT_TRUE(entries[2].complete());
}

TEST(Triage, LsOfAFileOrMissingPath)
{
	sample_volume_t volume(3);
	auto map = volume.finished_map();
	triage_t triage(volume.source(), map);

	auto file = triage.ls("/hello.txt", false);
	EXPECT_EQ(file.status, lookup_status_t::found);
	EXPECT_EQ(file.kind, entry_kind_t::regular);

	EXPECT_EQ(triage.ls("/nope", false).status, lookup_status_t::not_found);
	EXPECT_EQ(triage.ls("2_5", false).listing.path, "2_5/");
}

TEST(Triage, FindReportsFullPaths)
{
	sample_volume_t volume(3);
	auto map = volume.finished_map();
	triage_t triage(volume.source(), map);

	auto notes = triage.find("notes.txt");
	EXPECT_TRUE(notes.complete);
	EXPECT_EQ(notes.paths, std::vector<std::string>{"/docs/notes.txt"});

	EXPECT_EQ(triage.find("hello.txt").paths, std::vector<std::string>{"/hello.txt"});
	EXPECT_TRUE(triage.find("missing").paths.empty());
}

TEST(Triage, FindSeesOrphanedSubtrees)
{
	sample_volume_t volume(3);
	auto map = volume.map_with_hole(sample_volume_t::kLeftLeaf);
	triage_t triage(volume.source(), map);

	auto notes = triage.find("notes.txt");
	EXPECT_FALSE(notes.complete);
	EXPECT_EQ(notes.paths, std::vector<std::string>{"2_5/notes.txt"});
}

TEST(Triage, CatReconstructsFiles)
{
	sample_volume_t volume(3);
	auto map = volume.finished_map();
	triage_t triage(volume.source(), map);

	auto hello = triage.cat("/hello.txt");
	ASSERT_EQ(hello.status, lookup_status_t::found);
	EXPECT_EQ(std::string(hello.contents.bytes.begin(), hello.contents.bytes.end()), "greetings\n");
	EXPECT_TRUE(hello.contents.gaps.empty());

	EXPECT_EQ(triage.cat("/missing").status, lookup_status_t::not_found);
	EXPECT_EQ(triage.cat("/docs").contents.status, object_status_t::not_regular);
}

TEST(Triage, CatFillsHoles)
{
	sample_volume_t volume(3);
	auto map = volume.map_with_hole(sample_volume_t::kSecondDataBlock);
	triage_t triage(volume.source(), map);

	auto big = triage.cat("/big.bin", 0xEE);
	ASSERT_EQ(big.status, lookup_status_t::found);
	ASSERT_EQ(big.contents.bytes.size(), sample_volume_t::kBigSize);
	EXPECT_EQ(big.contents.bytes[100], 'A');
	EXPECT_EQ(big.contents.bytes[4500], 0xEE);
	EXPECT_EQ(big.contents.gaps.count(), 1u);
	EXPECT_EQ(big.contents.gaps.total(), sample_volume_t::kBigSize - 4096);
}

TEST(Triage, PartitionOffset)
{
	sample_volume_t volume(3);
	const uint64_t offset = 32256;
	std::vector<uint8_t> disk(offset, 0xCC);
	disk.insert(disk.end(), volume.image.begin(), volume.image.end());
	rescue_map_t map(disk.size(), rescue_status_t::finished);
	triage_t triage(std::make_shared<memory_datasource_t>(disk), map, offset);

	auto targets = triage.tree_blocks(1, false);
	EXPECT_TRUE(targets.bytes.contains(offset + sample_volume_t::kRootBlock * kBlock));
	EXPECT_FALSE(targets.bytes.contains(sample_volume_t::kRootBlock * kBlock));
	EXPECT_EQ(triage.cat("/docs/notes.txt").contents.bytes.size(), 6u);
}
