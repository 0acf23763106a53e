#include "memory/fs_detect.h"
#include "memory/flash_reader.h"
#include "fs_log.h"
#include <algorithm>
#include <exception>
#include <string>
#include <vector>

// LittleFS erase-block sizes to try, largest first
static const uint32_t LFS_BLOCK_SIZES[] = {4096, 2048, 1024, 512};

static const char LFS_MARKER[] = "littlefs";

// -------------------- Helpers --------------------

// Read a 32-bit little-endian value from a buffer
static uint32_t rd32(const uint8_t *p)
{
    return p[0] | (p[1] << 8) | (p[2] << 16) | ((uint32_t)p[3] << 24);
}

const char *fs_type_name(FsType type)
{
    switch (type)
    {
    case FsTypeLittleFs: return "littlefs";
    case FsTypeSpiffs: break;
    }
    return "spiffs";
}

// -------------------- Heuristics --------------------

std::optional<FsType> fs_detect_marker(const uint8_t *data, size_t len)
{
    if (!data)
        return std::nullopt;

    // Plain byte search: anything outside ASCII just fails to match
    const uint8_t *marker = reinterpret_cast<const uint8_t *>(LFS_MARKER);
    const size_t marker_len = sizeof(LFS_MARKER) - 1;
    if (std::search(data, data + len, marker, marker + marker_len) != data + len)
        return FsTypeLittleFs;

    return std::nullopt;
}

// LittleFS metadata blocks start with tag words:
//   [31:20] type, [19:10] id, [9:0] length
std::optional<FsType> fs_detect_metadata_tag(const uint8_t *data, size_t len)
{
    if (!data || len < 4)
        return std::nullopt;

    for (uint32_t block_size : LFS_BLOCK_SIZES)
    {
        if (len < (size_t)block_size * 2)
            continue;

        size_t limit = std::min((size_t)block_size, len - 4);
        for (size_t i = 0; i < limit; i += 4)
        {
            uint32_t tag = rd32(data + i);
            uint32_t type = (tag >> 20) & 0xFFF;
            uint32_t length = tag & 0x3FF;

            if (type > LFS_TAG_TYPE_MAX || length == 0 || length > LFS_TAG_LENGTH_MAX)
                continue;

            // Payload has to fit in what we sampled
            if (i + length + 4 > len)
                continue;

            return FsTypeLittleFs;
        }
    }

    return std::nullopt;
}

std::optional<FsType> fs_detect_spiffs_magic(const uint8_t *data, size_t len)
{
    if (!data)
        return std::nullopt;

    size_t limit = std::min(len, SPIFFS_MAGIC_SCAN_SIZE);
    for (size_t i = 0; i + 4 <= limit; i += 4)
    {
        uint32_t magic = rd32(data + i);
        if (magic == SPIFFS_MAGIC_2014 || magic == SPIFFS_MAGIC_2016)
            return FsTypeSpiffs;
    }

    return std::nullopt;
}

// -------------------- Detection --------------------

struct FsHeuristic
{
    std::optional<FsType> (*check)(const uint8_t *data, size_t len);
    const char *found;
};

static const FsHeuristic heuristics[] = {
    {fs_detect_marker,       "LittleFS detected: found \"littlefs\" signature"},
    {fs_detect_metadata_tag, "LittleFS detected: found valid metadata structure"},
    {fs_detect_spiffs_magic, "SPIFFS detected: found SPIFFS magic number"},
};

FsType fs_detect_sample(const uint8_t *data, size_t len, FsLogger *logger)
{
    if (!data || len < FS_DETECT_MIN_SAMPLE)
    {
        if (logger)
            logger->log("Partition too small (" + std::to_string(data ? len : 0)
                        + " bytes), assuming SPIFFS");
        return FsTypeSpiffs;
    }

    for (const FsHeuristic &h : heuristics)
    {
        std::optional<FsType> result = h.check(data, len);
        if (result)
        {
            if (logger)
                logger->log(h.found);
            return *result;
        }
    }

    if (logger)
        logger->warn("No clear filesystem signature found, assuming SPIFFS");
    return FsTypeSpiffs;
}

FsType fs_detect(FlashReader &reader, uint32_t offset, uint32_t size, FsLogger *logger)
{
    const uint32_t read_size = std::min(size, FS_DETECT_SAMPLE_SIZE);

    std::vector<uint8_t> sample;
    std::string read_error;
    bool ok = false;
    try
    {
        ok = reader.read(offset, read_size, sample, read_error);
    }
    catch (const std::exception &e)
    {
        read_error = e.what();
    }

    if (!ok)
    {
        if (logger)
            logger->error("Failed to detect filesystem type: "
                          + (read_error.empty() ? std::string("read failed") : read_error));
        return FsTypeSpiffs;
    }

    // Only the requested window counts, whatever the reader handed back
    if (sample.size() > read_size)
        sample.resize(read_size);

    return fs_detect_sample(sample.data(), sample.size(), logger);
}
