// ============================================================================
// Sector and volume constants
// ============================================================================
#define SECTOR_SIZE 512
#define BOOT_SIGNATURE_OFFSET 0x1FE
#define BOOT_SIGNATURE_BYTE_1 0x55
#define BOOT_SIGNATURE_BYTE_2 0xAA

#define FAT32_RESERVED_SECTORS 32
#define FAT32_NUMBER_OF_FATS 2
#define FAT32_ROOT_CLUSTER 2
#define FAT32_FSINFO_SECTOR 1
#define FAT32_BACKUP_BOOT_SECTOR 6
#define FAT32_MEDIA_DESCRIPTOR 0xF8
#define FAT32_MIN_CLUSTERS 65525
#define FAT32_MAX_CLUSTERS 0x0FFFFFF5
#define FAT32_MAX_SECTORS 0xFFFFFFFFULL
#define FAT32_MAX_FILE_SIZE 0xFFFFFFFFULL
#define FAT32_ENTRY_MASK 0x0FFFFFFF
#define FAT32_END_OF_CHAIN 0x0FFFFFFF
#define FAT32_END_OF_CHAIN_MIN 0x0FFFFFF8
#define FAT32_NO_FREE_HINT 0xFFFFFFFF
#define FAT32_ENTRIES_PER_SECTOR (SECTOR_SIZE / 4)

// Convergence bounds for the sizing fixed points
#define GEOMETRY_MAX_ITERATIONS 10

// ============================================================================
// FAT BIOS Parameter Block constants
// ============================================================================
#define BPB_JUMP_OFFSET 0x00
#define BPB_OEM_NAME_OFFSET 0x03
#define BPB_OEM_NAME_LENGTH 8
#define BPB_BYTES_PER_SECTOR_OFFSET 0x0B
#define BPB_SECTORS_PER_CLUSTER_OFFSET 0x0D
#define BPB_RESERVED_SECTORS_OFFSET 0x0E
#define BPB_NUMBER_OF_FATS_OFFSET 0x10
#define BPB_ROOT_ENTRY_COUNT_OFFSET 0x11
#define BPB_TOTAL_SECTORS_16_OFFSET 0x13
#define BPB_MEDIA_OFFSET 0x15
#define BPB_SECTORS_PER_FAT_OFFSET 0x16
#define BPB_SECTORS_PER_TRACK_OFFSET 0x18
#define BPB_NUMBER_OF_HEADS_OFFSET 0x1A
#define BPB_HIDDEN_SECTORS_OFFSET 0x1C
#define BPB_TOTAL_SECTORS_32_OFFSET 0x20
#define BPB_SECTORS_PER_FAT32_OFFSET 0x24
#define BPB_EXT_FLAGS_OFFSET 0x28
#define BPB_FS_VERSION_OFFSET 0x2A
#define BPB_ROOT_DIRECTORY_CLUSTER_OFFSET 0x2C
#define BPB_FSINFO_SECTOR_OFFSET 0x30
#define BPB_BACKUP_BOOT_SECTOR_OFFSET 0x32
#define BS_DRIVE_NUMBER_OFFSET 0x40
#define BS_BOOT_SIGNATURE_OFFSET 0x42
#define BS_VOLUME_ID_OFFSET 0x43
#define BS_VOLUME_LABEL_OFFSET 0x47
#define BS_VOLUME_LABEL_LENGTH 11
#define BS_FS_TYPE_OFFSET 0x52
#define BS_FS_TYPE_LENGTH 8

#define BS_EXTENDED_BOOT_SIGNATURE 0x29
#define BS_DRIVE_NUMBER_HARD_DISK 0x80
#define BPB_SECTORS_PER_TRACK 63
#define BPB_NUMBER_OF_HEADS 255

// ============================================================================
// FSInfo constants
// ============================================================================
#define FSI_LEAD_SIGNATURE_OFFSET 0x000
#define FSI_STRUCT_SIGNATURE_OFFSET 0x1E4
#define FSI_FREE_COUNT_OFFSET 0x1E8
#define FSI_NEXT_FREE_OFFSET 0x1EC
#define FSI_TRAIL_SIGNATURE_OFFSET 0x1FC

#define FSI_LEAD_SIGNATURE 0x41615252
#define FSI_STRUCT_SIGNATURE 0x61417272
#define FSI_TRAIL_SIGNATURE 0xAA550000

// ============================================================================
// Entry constants
// ============================================================================
#define ENTRY_SIZE 32 // 32 bytes per entry
#define DIRECTORY_MAX_ENTRIES 65536 // entries per directory, 2 MiB

#define ENTRY_END_OF_DIRECTORY 0x00
#define ENTRY_DELETED 0xE5
#define ENTRY_KANJI_E5 0x05
#define ENTRY_CURRENT_DIRECTORY 0x2E

#define ENTRY_NAME_OFFSET 0x00
#define ENTRY_NAME_LENGTH 11
#define ENTRY_BASE_LENGTH 8
#define ENTRY_EXTENSION_LENGTH 3
#define ENTRY_ATTRIBUTE_OFFSET 0x0B
#define ENTRY_CASE_OFFSET 0x0C
#define ENTRY_CREATION_TENTHS_OFFSET 0x0D
#define ENTRY_CREATION_DATE_TIME_OFFSET 0x0E
#define ENTRY_ACCESSED_DATE_OFFSET 0x12
#define ENTRY_HIGH_ORDER_CLUSTER_ADDRESS_OFFSET 0x14
#define ENTRY_WRITTEN_DATE_TIME_OFFSET 0x16
#define ENTRY_CLUSTER_OFFSET 0x1A
#define ENTRY_SIZE_OFFSET 0x1C

#define ENTRY_ATTRIBUTE_READ_ONLY 0x01
#define ENTRY_ATTRIBUTE_HIDDEN 0x02
#define ENTRY_ATTRIBUTE_SYSTEM 0x04
#define ENTRY_ATTRIBUTE_VOLUME_LABEL 0x08
#define ENTRY_ATTRIBUTE_DIRECTORY 0x10
#define ENTRY_ATTRIBUTE_ARCHIVE 0x20
#define ENTRY_ATTRIBUTE_LONG_FILE_NAME 0x0F

// NT reserved byte: base / extension stored in lower case
#define ENTRY_CASE_LOWER_BASE 0x08
#define ENTRY_CASE_LOWER_EXTENSION 0x10

#define ENTRY_DATE_TIME_START_OF_YEAR 1980
#define ENTRY_DATE_TIME_END_OF_YEAR 2107

// 0x0 (1B): sequence number, starting at 1, not 0; last one is ORed with 0x40
#define ENTRY_LFN_SEQUENCE_START 1
#define ENTRY_LFN_SEQUENCE_LAST_MASK 0x40
#define ENTRY_LFN_CHECKSUM_OFFSET 0x0D
#define ENTRY_LFN_CHARS 13 // 13 characters per part
#define ENTRY_LFN_MAX_NAME_LENGTH 255
#define ENTRY_LFN_PART1_OFFSET 0x01
#define ENTRY_LFN_PART1_LENGTH 10
#define ENTRY_LFN_PART2_OFFSET 0x0E
#define ENTRY_LFN_PART2_LENGTH 12
#define ENTRY_LFN_PART3_OFFSET 0x1C
#define ENTRY_LFN_PART3_LENGTH 4

// Numeric tails run ~1 .. ~99
#define ENTRY_ALIAS_MAX_TAIL 99

// ============================================================================
// MBR constants
// ============================================================================
#define MBR_BOOT_CODE_LENGTH 440
#define MBR_DISK_SIGNATURE_OFFSET 0x1B8
#define MBR_PARTITION_TABLE_OFFSET 0x1BE

#define MBR_ENTRY_STATUS_OFFSET 0x00
#define MBR_ENTRY_CHS_START_OFFSET 0x01
#define MBR_ENTRY_TYPE_OFFSET 0x04
#define MBR_ENTRY_CHS_END_OFFSET 0x05
#define MBR_ENTRY_LBA_START_OFFSET 0x08
#define MBR_ENTRY_SECTOR_COUNT_OFFSET 0x0C

#define MBR_STATUS_ACTIVE 0x80
#define MBR_STATUS_INACTIVE 0x00
#define MBR_TYPE_FAT32_CHS 0x0B
#define MBR_TYPE_FAT32_LBA 0x0C
#define MBR_TYPE_EFI_SYSTEM 0xEF
#define MBR_TYPE_GPT_PROTECTIVE 0xEE
#define MBR_MAX_LBA 0xFFFFFFFFULL

// Partition starts are aligned to 1 MiB
#define PARTITION_ALIGNMENT_SECTORS 2048

// ============================================================================
// GPT constants
// ============================================================================
#define GPT_SIGNATURE "EFI PART"
#define GPT_REVISION 0x00010000
#define GPT_HEADER_SIZE 92
#define GPT_HEADER_LBA 1
#define GPT_ENTRIES_LBA 2
#define GPT_ENTRY_COUNT 128
#define GPT_ENTRY_SIZE 128
#define GPT_ENTRY_ARRAY_SECTORS ((GPT_ENTRY_COUNT * GPT_ENTRY_SIZE) / SECTOR_SIZE)
#define GPT_ENTRY_NAME_OFFSET 0x38
#define GPT_ENTRY_NAME_LENGTH 36
#define GPT_ATTRIBUTE_LEGACY_BIOS_BOOTABLE (1ULL << 2)

#define GPT_HEADER_CRC_OFFSET 0x10
#define GPT_HEADER_MY_LBA_OFFSET 0x18
#define GPT_HEADER_ALTERNATE_LBA_OFFSET 0x20
#define GPT_HEADER_FIRST_USABLE_OFFSET 0x28
#define GPT_HEADER_LAST_USABLE_OFFSET 0x30
#define GPT_HEADER_DISK_GUID_OFFSET 0x38
#define GPT_HEADER_ENTRIES_LBA_OFFSET 0x48
#define GPT_HEADER_ENTRY_COUNT_OFFSET 0x50
#define GPT_HEADER_ENTRY_SIZE_OFFSET 0x54
#define GPT_HEADER_ENTRIES_CRC_OFFSET 0x58

#define GPT_TYPE_EFI_SYSTEM "{c12a7328-f81f-11d2-ba4b-00a0c93ec93b}"
#define GPT_TYPE_BASIC_DATA "{ebd0a0a2-b9e5-4433-87c0-68b6b72699c7}"
// RFC 4122 URL namespace, seed for name-based GUIDs
#define GPT_GUID_NAMESPACE "{6ba7b811-9dad-11d1-80b4-00c04fd430c8}"

// ============================================================================
// Helper masks
// ============================================================================
#define MASK_4_BITS 0x0F
#define MASK_5_BITS 0x1F
#define MASK_6_BITS 0x3F
#define MASK_7_BITS 0x7F
#define MASK_8_BITS 0xFF
