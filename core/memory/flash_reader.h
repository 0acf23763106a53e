#ifndef FLASH_READER_H
#define FLASH_READER_H

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

/* Byte-read capability for a flash device or a dump of one.
 *
 * read() fills `out` with up to `length` bytes starting at `offset`.
 * It returns false and sets `error` when nothing could be read. A
 * source that ends before `length` bytes yields a short `out`. */
class FlashReader
{
public:
    virtual ~FlashReader() = default;

    virtual bool read(uint32_t offset, uint32_t length,
                      std::vector<uint8_t> &out, std::string &error) = 0;
};

// Serves reads from a caller-owned buffer, which must outlive the reader.
// Safe to share between threads.
class BufferFlashReader : public FlashReader
{
public:
    BufferFlashReader(const uint8_t *data, size_t size) : m_data(data), m_size(size) {}

    bool read(uint32_t offset, uint32_t length,
              std::vector<uint8_t> &out, std::string &error) override;

private:
    const uint8_t *m_data;
    size_t m_size;
};

// Serves reads from a flash image file. Not thread-safe.
class FileFlashReader : public FlashReader
{
public:
    FileFlashReader() = default;
    ~FileFlashReader() override;

    FileFlashReader(const FileFlashReader &) = delete;
    FileFlashReader &operator=(const FileFlashReader &) = delete;

    bool open(const char *filename, std::string &error);
    void close();

    bool isOpen() const { return m_file != nullptr; }
    size_t size() const { return m_size; }

    bool read(uint32_t offset, uint32_t length,
              std::vector<uint8_t> &out, std::string &error) override;

private:
    FILE *m_file = nullptr;
    size_t m_size = 0;
};

#endif // FLASH_READER_H
