#include "fw_env_crc.h"
#include <zlib.h>

uint32_t fw_env_crc32(const uint8_t *data, size_t len)
{
    uLong crc = crc32(0L, Z_NULL, 0);
    while (len > 0)
    {
        uInt chunk = len > 0x40000000 ? 0x40000000 : (uInt)len;
        crc = crc32(crc, data, chunk);
        data += chunk;
        len -= chunk;
    }
    return (uint32_t)crc;
}

fw_env_crc_status_t fw_env_crc_verify(const FwEnvBlock &block)
{
    fw_env_crc_status_t status;
    status.valid = false;
    status.expected = 0;
    status.actual = 0;
    if (!block.is_complete())
        return status;
    status.expected = block.stored_crc();
    status.actual = fw_env_crc32(block.payload(), block.payload_size());
    status.valid = status.expected == status.actual;
    return status;
}
