#pragma once

#include <cstdint>

// ReiserFS on-disk structures, all little-endian
#pragma pack(push, 1)

//	The superblock, at byte 65536 of the partition (8192 on old 3.5 volumes)
struct ReiserSuperBlock
{
	uint32_t s_block_count;            // 0x00: Blocks in the volume
	uint32_t s_free_blocks;            // 0x04: Free blocks
	uint32_t s_root_block;             // 0x08: Root of the tree
	uint32_t s_journal_block;          // 0x0C: Journal parameters
	uint32_t s_journal_dev;            // 0x10
	uint32_t s_orig_journal_size;      // 0x14
	uint32_t s_journal_trans_max;      // 0x18
	uint32_t s_journal_magic;          // 0x1C
	uint32_t s_journal_max_batch;      // 0x20
	uint32_t s_journal_max_commit_age; // 0x24
	uint32_t s_journal_max_trans_age;  // 0x28
	uint16_t s_blocksize;              // 0x2C: Block size in bytes
	uint16_t s_oid_maxsize;            // 0x2E
	uint16_t s_oid_cursize;            // 0x30
	uint16_t s_umount_state;           // 0x32
	char s_magic[10];                  // 0x34: "ReIsErFs", "ReIsEr2Fs" or "ReIsEr3Fs"
	uint16_t s_fs_state;               // 0x3E
	uint32_t s_hash_function_code;     // 0x40: 1 tea, 2 yura, 3 r5
	uint16_t s_tree_height;            // 0x44: Root level + 1
	uint16_t s_bmap_nr;                // 0x46: Bitmap blocks (0 on huge volumes)
	uint16_t s_version;                // 0x48: 0 for 3.5, 2 for 3.6
	uint16_t s_reserved;               // 0x4A
	uint32_t s_inode_generation;       // 0x4C
};

//	A key. The last 8 bytes are either offset/uniqueness (3.5)
//	or a single u64 with the type in the top 4 bits (3.6)
struct ReiserKey
{
	uint32_t k_dir_id;     // 0x00: Parent directory id
	uint32_t k_objectid;   // 0x04: Object id
	uint32_t k_offset;     // 0x08: Offset (3.5) / low half of offset_v2
	uint32_t k_uniqueness; // 0x0C: Type (3.5) / high half of offset_v2
};

//	Every formatted node starts with this
struct ReiserBlockHead
{
	uint16_t blk_level;        // 0x00: 1 for leaves, 2+ for internal nodes
	uint16_t blk_nr_item;      // 0x02: Keys (internal) or items (leaf)
	uint16_t blk_free_space;   // 0x04
	uint16_t blk_reserved;     // 0x06
	ReiserKey blk_right_delim; // 0x08: Right delimiting key (unused here)
};

//	Child pointer of an internal node; n keys are followed by n+1 of these
struct ReiserDiskChild
{
	uint32_t dc_block_number; // 0x00
	uint16_t dc_size;         // 0x04: Used bytes in the child
	uint16_t dc_reserved;     // 0x06
};

//	Item header of a leaf; bodies are packed from the end of the block
struct ReiserItemHead
{
	ReiserKey ih_key;          // 0x00
	uint16_t ih_entry_count;   // 0x10: Entries (directory items), else free space
	uint16_t ih_item_len;      // 0x12: Body length
	uint16_t ih_item_location; // 0x14: Body offset from the block start
	uint16_t ih_version;       // 0x16: Key format, 0 for 3.5 and 1 for 3.6
};

//	Stat data of a 3.5 object
struct ReiserStatDataV1
{
	uint16_t sd_mode;              // 0x00
	uint16_t sd_nlink;             // 0x02
	uint16_t sd_uid;               // 0x04
	uint16_t sd_gid;               // 0x06
	uint32_t sd_size;              // 0x08
	uint32_t sd_atime;             // 0x0C
	uint32_t sd_mtime;             // 0x10
	uint32_t sd_ctime;             // 0x14
	uint32_t sd_rdev_or_blocks;    // 0x18
	uint32_t sd_first_direct_byte; // 0x1C
};

//	Stat data of a 3.6 object
struct ReiserStatDataV2
{
	uint16_t sd_mode;           // 0x00
	uint16_t sd_attrs;          // 0x02
	uint32_t sd_nlink;          // 0x04
	uint64_t sd_size;           // 0x08
	uint32_t sd_uid;            // 0x10
	uint32_t sd_gid;            // 0x14
	uint32_t sd_atime;          // 0x18
	uint32_t sd_mtime;          // 0x1C
	uint32_t sd_ctime;          // 0x20
	uint32_t sd_blocks;         // 0x24
	uint32_t sd_rdev_or_generation; // 0x28
};

//	Directory entry header; names are packed from the end of the item
struct ReiserDirEntryHead
{
	uint32_t deh_offset;   // 0x00: Name hash | generation number
	uint32_t deh_dir_id;   // 0x04: Key of the named object
	uint32_t deh_objectid; // 0x08
	uint16_t deh_location; // 0x0C: Name offset from the item start
	uint16_t deh_state;    // 0x0E: Bit 2 set if the entry is visible
};

#pragma pack(pop)

static_assert(sizeof(ReiserSuperBlock) == 80);
static_assert(sizeof(ReiserKey) == 16);
static_assert(sizeof(ReiserBlockHead) == 24);
static_assert(sizeof(ReiserDiskChild) == 8);
static_assert(sizeof(ReiserItemHead) == 24);
static_assert(sizeof(ReiserStatDataV1) == 32);
static_assert(sizeof(ReiserStatDataV2) == 44);
static_assert(sizeof(ReiserDirEntryHead) == 16);

// Superblock locations, in bytes from the partition start
const uint64_t kSuperBlockOffset = 65536;
const uint64_t kOldSuperBlockOffset = 8192;
const uint64_t kSuperBlockReadSize = 512;

// Tree levels
const uint16_t kFreeLevel = 0;
const uint16_t kLeafLevel = 1;
const uint16_t kMaxTreeHeight = 5;

// 3.5 key uniqueness values
const uint32_t kV1StatUniqueness = 0;
const uint32_t kV1IndirectUniqueness = 0xFFFFFFFE;
const uint32_t kV1DirectUniqueness = 0xFFFFFFFF;
const uint32_t kV1DirectoryUniqueness = 500;
const uint32_t kV1AnyUniqueness = 555;

// Directory entries
const uint32_t kDotOffset = 1;
const uint32_t kDotDotOffset = 2;
const uint16_t kEntryVisible = 1 << 2;
const uint32_t kMaxGeneration = 127; // entries with one hash differ in the low 7 bits

// Hash function codes of s_hash_function_code
const uint32_t kHashUnset = 0;
const uint32_t kHashTea = 1;
const uint32_t kHashYura = 2;
const uint32_t kHashR5 = 3;

// File type, from the top 4 bits of the mode
const uint16_t kTypeDirectory = 4;
const uint16_t kTypeRegular = 8;
const uint16_t kTypeLink = 10;
