#include "memory/flash_reader.h"
#include <algorithm>
#include <cerrno>
#include <cstring>

static std::string hex8(uint32_t v)
{
    char buf[12];
    snprintf(buf, sizeof(buf), "%08X", v);
    return std::string(buf);
}

// -------------------- Buffer --------------------

bool BufferFlashReader::read(uint32_t offset, uint32_t length,
                             std::vector<uint8_t> &out, std::string &error)
{
    out.clear();
    if (length == 0)
        return true;

    if (!m_data || offset >= m_size)
    {
        error = "Read at 0x" + hex8(offset) + " is outside the buffer (size 0x"
              + hex8((uint32_t)m_size) + ")";
        return false;
    }

    size_t avail = std::min((size_t)length, m_size - offset);
    out.assign(m_data + offset, m_data + offset + avail);
    return true;
}

// -------------------- Image file --------------------

FileFlashReader::~FileFlashReader()
{
    close();
}

bool FileFlashReader::open(const char *filename, std::string &error)
{
    close();

    m_file = fopen(filename, "rb");
    if (!m_file)
    {
        error = std::string(filename) + ": " + strerror(errno);
        return false;
    }

    long end = -1;
    if (fseek(m_file, 0, SEEK_END) == 0)
        end = ftell(m_file);

    if (end < 0)
    {
        error = std::string(filename) + ": could not determine image size: " + strerror(errno);
        close();
        return false;
    }

    m_size = (size_t)end;
    return true;
}

void FileFlashReader::close()
{
    if (m_file)
        fclose(m_file);
    m_file = nullptr;
    m_size = 0;
}

bool FileFlashReader::read(uint32_t offset, uint32_t length,
                           std::vector<uint8_t> &out, std::string &error)
{
    out.clear();
    if (!m_file)
    {
        error = "No flash image open";
        return false;
    }

    if (length == 0)
        return true;

    if (offset >= m_size)
    {
        error = "Read at 0x" + hex8(offset) + " is past the end of the image (size 0x"
              + hex8((uint32_t)m_size) + ")";
        return false;
    }

    size_t to_read = std::min((size_t)length, m_size - offset);
    if (fseek(m_file, (long)offset, SEEK_SET) != 0)
    {
        error = "Seek to 0x" + hex8(offset) + " failed: " + strerror(errno);
        return false;
    }

    out.resize(to_read);
    size_t got = fread(out.data(), 1, to_read, m_file);
    if (got != to_read)
    {
        int saved_errno = errno;
        out.clear();
        error = "Short read at 0x" + hex8(offset) + " (" + std::to_string(got) + " of "
              + std::to_string(to_read) + " bytes)";
        if (ferror(m_file))
        {
            error += ": " + std::string(strerror(saved_errno));
            clearerr(m_file);
        }
        return false;
    }

    return true;
}
