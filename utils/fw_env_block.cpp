#include "fw_env_block.h"

FwEnvBlock::FwEnvBlock() : m_data(NULL), m_size(0), m_header_size(FW_ENV_HEADER_SIZE)
{
}

FwEnvBlock::FwEnvBlock(const uint8_t *data, uint32_t size, uint32_t header_size)
    : m_data(data), m_size(size), m_header_size(header_size)
{
}

FwEnvBlock::FwEnvBlock(const std::vector<uint8_t> &buf, uint32_t header_size)
    : m_data(buf.empty() ? NULL : &buf[0]), m_size((uint32_t)buf.size()), m_header_size(header_size)
{
}

bool FwEnvBlock::is_complete() const
{
    return m_data != NULL && m_size >= m_header_size && m_header_size >= FW_ENV_CRC_SIZE;
}

uint32_t FwEnvBlock::stored_crc() const
{
    if (!is_complete())
        return 0;
    return (uint32_t)m_data[0] | ((uint32_t)m_data[1] << 8) | ((uint32_t)m_data[2] << 16) | ((uint32_t)m_data[3] << 24);
}

uint8_t FwEnvBlock::flag() const
{
    if (!is_complete() || !has_flag())
        return 0;
    return m_data[FW_ENV_CRC_SIZE];
}

const uint8_t *FwEnvBlock::payload() const
{
    if (!is_complete())
        return NULL;
    return m_data + m_header_size;
}

uint32_t FwEnvBlock::payload_size() const
{
    if (!is_complete())
        return 0;
    return m_size - m_header_size;
}
