#ifndef FW_ENV_CRC_H
#define FW_ENV_CRC_H

#include <stdint.h>
#include <stddef.h>
#include "fw_env_block.h"

typedef struct fw_env_crc_status_tag
{
    bool valid;
    uint32_t expected; // stored in the block header
    uint32_t actual;   // computed over the payload
} fw_env_crc_status_t;

/**
 * @brief CRC32 as U-Boot computes it for the environment (zlib crc32,
 *        reflected polynomial 0xEDB88320)
 */
uint32_t fw_env_crc32(const uint8_t *data, size_t len);

/**
 * @brief compare the stored header against the payload checksum
 *
 * @param[in] block
 * @return status with valid set when they match; an incomplete block is
 *         never valid
 */
fw_env_crc_status_t fw_env_crc_verify(const FwEnvBlock &block);

#endif
