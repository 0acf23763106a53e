#ifndef PARTITION_TABLE_H
#define PARTITION_TABLE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

class FlashReader;

// ESP32 partition table location in flash
#define PARTITION_TABLE_OFFSET 0x8000
#define PARTITION_TABLE_SIZE   0x1000

#define PARTITION_ENTRY_SIZE   32
#define PARTITION_MAGIC        0x50AA
#define PARTITION_MAGIC_MD5    0xEBEB

enum
{
    PartitionTypeApp = 0x00,
    PartitionTypeData = 0x01
};

enum
{
    PartitionSubtypeFat = 0x81,
    PartitionSubtypeSpiffs = 0x82,
    PartitionSubtypeLittleFs = 0x83
};

struct flash_partition_info
{
    std::string name;
    uint8_t type = 0;
    uint8_t subtype = 0;
    uint32_t offset = 0;
    uint32_t size = 0;
    uint32_t flags = 0;

    // Data partition declared as SPIFFS or LittleFS. The declaration is a
    // hint only; fs_detect() decides from the contents.
    bool is_filesystem() const;
};

// Parse 32-byte entries until an erased slot, the MD5 entry or anything
// without the entry magic. The MD5 checksum is not verified.
std::vector<flash_partition_info> partition_table_parse(const uint8_t *data, size_t size);

// Read the table through `reader` and parse it. Returns false if the read
// fails; an empty `parts` on success means no table was found.
bool partition_table_read(FlashReader &reader, uint32_t table_offset, uint32_t table_size,
                          std::vector<flash_partition_info> &parts, std::string &error);

std::string partition_type_name(uint8_t type);
std::string partition_subtype_name(uint8_t type, uint8_t subtype);

#endif // PARTITION_TABLE_H
