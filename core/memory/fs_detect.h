/* Flash filesystem signature detection.
 *
 * Decides whether a raw flash partition holds SPIFFS or LittleFS by
 * looking at the first few KB of it. There is no "unknown" answer:
 * whenever the evidence is weak or the read fails, the result is
 * SPIFFS, the format older tooling expects.
 *
 * Heuristics, strongest evidence first:
 *   1. the ASCII text "littlefs" anywhere in the sample
 *   2. a plausible LittleFS metadata tag word in the first block
 *   3. a SPIFFS magic word in the first 4 KB
 *
 * The metadata tag test only checks bit ranges (no CRC), so arbitrary
 * binary data passes it quite easily. The SPIFFS magic words themselves
 * satisfy it, which means the magic test only decides samples too short
 * to hold two 512-byte blocks. */

#ifndef FS_DETECT_H
#define FS_DETECT_H

#include <cstddef>
#include <cstdint>
#include <optional>

class FlashReader;
class FsLogger;

enum FsType
{
    FsTypeSpiffs = 0,
    FsTypeLittleFs
};

// Bytes read from the start of the partition
static const uint32_t FS_DETECT_SAMPLE_SIZE = 8192;
// Samples shorter than this are not inspected
static const size_t FS_DETECT_MIN_SAMPLE = 32;

// Only the first 4 KB are searched for SPIFFS magic words
static const size_t SPIFFS_MAGIC_SCAN_SIZE = 4096;
static const uint32_t SPIFFS_MAGIC_2014 = 0x20140529;
static const uint32_t SPIFFS_MAGIC_2016 = 0x20160529;

static const uint32_t LFS_TAG_TYPE_MAX = 0x7FF;
static const uint32_t LFS_TAG_LENGTH_MAX = 1022;

// "littlefs" / "spiffs"
const char *fs_type_name(FsType type);

// Reads min(FS_DETECT_SAMPLE_SIZE, size) bytes at `offset` and classifies
// them. Never fails: read errors, including exceptions thrown by the
// reader, are logged and resolve to FsTypeSpiffs. `logger` may be null.
FsType fs_detect(FlashReader &reader, uint32_t offset, uint32_t size,
                 FsLogger *logger = nullptr);

// Classifies an already acquired sample.
FsType fs_detect_sample(const uint8_t *data, size_t len, FsLogger *logger = nullptr);

// Individual heuristics, in the order fs_detect_sample() runs them.
// Each returns a classification on a match and std::nullopt otherwise.
std::optional<FsType> fs_detect_marker(const uint8_t *data, size_t len);
std::optional<FsType> fs_detect_metadata_tag(const uint8_t *data, size_t len);
std::optional<FsType> fs_detect_spiffs_magic(const uint8_t *data, size_t len);

#endif // FS_DETECT_H
