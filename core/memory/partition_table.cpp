#include "memory/partition_table.h"
#include "memory/flash_reader.h"
#include <cstdio>

// Max entries in a 0xC00-byte table region (the rest holds the MD5 entry)
static const size_t MAX_PARTITIONS = 95;

static uint32_t rd32(const uint8_t *p)
{
    return p[0] | (p[1] << 8) | (p[2] << 16) | ((uint32_t)p[3] << 24);
}

static uint16_t rd16(const uint8_t *p)
{
    return p[0] | (p[1] << 8);
}

static std::string hex2(uint8_t v)
{
    char buf[8];
    snprintf(buf, sizeof(buf), "0x%02x", v);
    return std::string(buf);
}

bool flash_partition_info::is_filesystem() const
{
    return type == PartitionTypeData
        && (subtype == PartitionSubtypeSpiffs || subtype == PartitionSubtypeLittleFs);
}

// Entry layout (little-endian):
//   +0x00: magic (0x50AA)
//   +0x02: type
//   +0x03: subtype
//   +0x04: offset
//   +0x08: size
//   +0x0C: label, 16 bytes, NUL padded
//   +0x1C: flags
std::vector<flash_partition_info> partition_table_parse(const uint8_t *data, size_t size)
{
    std::vector<flash_partition_info> parts;
    if (!data)
        return parts;

    for (size_t pos = 0; pos + PARTITION_ENTRY_SIZE <= size && parts.size() < MAX_PARTITIONS;
         pos += PARTITION_ENTRY_SIZE)
    {
        const uint8_t *entry = data + pos;
        uint16_t magic = rd16(entry);
        if (magic != PARTITION_MAGIC)
            break; // 0xFFFF (erased), PARTITION_MAGIC_MD5 or garbage

        flash_partition_info part;
        part.type = entry[2];
        part.subtype = entry[3];
        part.offset = rd32(entry + 0x04);
        part.size = rd32(entry + 0x08);
        part.flags = rd32(entry + 0x1C);

        const char *label = reinterpret_cast<const char *>(entry + 0x0C);
        size_t label_len = 0;
        while (label_len < 16 && label[label_len] != '\0')
            label_len++;
        part.name.assign(label, label_len);

        parts.push_back(part);
    }

    return parts;
}

bool partition_table_read(FlashReader &reader, uint32_t table_offset, uint32_t table_size,
                          std::vector<flash_partition_info> &parts, std::string &error)
{
    parts.clear();

    std::vector<uint8_t> table;
    if (!reader.read(table_offset, table_size, table, error))
        return false;

    parts = partition_table_parse(table.data(), table.size());
    return true;
}

std::string partition_type_name(uint8_t type)
{
    switch (type)
    {
    case PartitionTypeApp: return "app";
    case PartitionTypeData: return "data";
    default: break;
    }
    return hex2(type);
}

std::string partition_subtype_name(uint8_t type, uint8_t subtype)
{
    if (type == PartitionTypeApp)
    {
        if (subtype == 0x00)
            return "factory";
        if (subtype >= 0x10 && subtype <= 0x1F)
            return "ota_" + std::to_string(subtype - 0x10);
        if (subtype == 0x20)
            return "test";
    }
    else if (type == PartitionTypeData)
    {
        switch (subtype)
        {
        case 0x00: return "ota";
        case 0x01: return "phy";
        case 0x02: return "nvs";
        case 0x03: return "coredump";
        case 0x04: return "nvs_keys";
        case 0x05: return "efuse";
        case 0x80: return "esphttpd";
        case PartitionSubtypeFat: return "fat";
        case PartitionSubtypeSpiffs: return "spiffs";
        case PartitionSubtypeLittleFs: return "littlefs";
        default: break;
        }
    }
    return hex2(subtype);
}
