#ifndef FW_ENV_BLOCK_H
#define FW_ENV_BLOCK_H

#include <stdint.h>
#include <stddef.h>
#include <vector>

#define FW_ENV_CRC_SIZE 4
#define FW_ENV_FLAG_SIZE 1
#define FW_ENV_HEADER_SIZE FW_ENV_CRC_SIZE
#define FW_ENV_REDUNDANT_HEADER_SIZE (FW_ENV_CRC_SIZE + FW_ENV_FLAG_SIZE)

/**
 * @brief Borrowed view of one raw environment block.
 *
 *   single:    [crc32 le:4][data ...]
 *   redundant: [crc32 le:4][flag:1][data ...]
 *
 * The view never owns or copies the bytes. A remapping layer (bad block
 * skipping) would hand a contiguous buffer in here.
 */
class FwEnvBlock
{
public:
    FwEnvBlock();
    FwEnvBlock(const uint8_t *data, uint32_t size, uint32_t header_size = FW_ENV_HEADER_SIZE);
    explicit FwEnvBlock(const std::vector<uint8_t> &buf, uint32_t header_size = FW_ENV_HEADER_SIZE);

    const uint8_t *data() const { return m_data; }
    uint32_t size() const { return m_size; }
    uint32_t header_size() const { return m_header_size; }

    // false for a NULL buffer or one too short to hold the header
    bool is_complete() const;

    uint32_t stored_crc() const;
    bool has_flag() const { return m_header_size > FW_ENV_CRC_SIZE; }
    uint8_t flag() const;

    // checksummed bytes, up to the end of the block
    const uint8_t *payload() const;
    uint32_t payload_size() const;

private:
    const uint8_t *m_data;
    uint32_t m_size;
    uint32_t m_header_size;
};

#endif
