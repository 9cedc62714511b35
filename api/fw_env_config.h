#ifndef FW_ENV_CONFIG_H
#define FW_ENV_CONFIG_H

#include <stdint.h>
#include <stddef.h>
#include <string>
#include "fw_env_error.h"
#include "fw_env_block.h"

typedef struct FwEnvRegion
{
    std::string device;   // device node or image file
    uint64_t offset;      // byte offset of the block on the device
    uint32_t size;        // block size including the header
    uint32_t sector_size; // 0 if not configured
    uint32_t sectors;     // 0 if not configured

    FwEnvRegion() : offset(0), size(0), sector_size(0), sectors(0) {}
    FwEnvRegion(const std::string &dev, uint64_t off, uint32_t sz)
        : device(dev), offset(off), size(sz), sector_size(0), sectors(0) {}
} FwEnvRegion;

/**
 * @brief Where the environment lives: one region, or two for a redundant
 *        environment. Built once and only read afterwards.
 */
class FwEnvConfig
{
public:
    FwEnvConfig();
    explicit FwEnvConfig(const FwEnvRegion &primary);
    FwEnvConfig(const FwEnvRegion &primary, const FwEnvRegion &secondary);
    // secondary may be NULL; validate() reports the inconsistency
    FwEnvConfig(const FwEnvRegion &primary, const FwEnvRegion *secondary, bool redundant);

    /**
     * @brief check the region description
     * @return FW_ENV_OK, FW_ENV_ERR_INVALID_SIZE, FW_ENV_ERR_MISSING_SECONDARY
     *         or FW_ENV_ERR_SIZE_MISMATCH
     */
    int validate() const;

    const FwEnvRegion &primary() const { return m_primary; }
    const FwEnvRegion *secondary() const { return m_has_secondary ? &m_secondary : NULL; }
    bool is_redundant() const { return m_redundant; }

    // bytes before the checksummed data: crc, plus the flag byte when redundant
    uint32_t header_size() const;
    uint32_t env_size() const { return m_primary.size; }

private:
    FwEnvRegion m_primary;
    FwEnvRegion m_secondary;
    bool m_has_secondary;
    bool m_redundant;
};

/**
 * @brief Reader for fw_env.config:
 *
 *   # device      offset      size      [sector size  [sectors]]
 *   /dev/mmcblk1  0x180000    0x20000
 *   /dev/mmcblk1  0x1A0000    0x20000
 *
 *        The offset takes 0x/0/decimal prefixes; size and sector columns
 *        are hex. Only the first two non-comment lines are used; two lines
 *        make a redundant environment.
 */
class FwEnvConfigParser
{
public:
    FwEnvConfigParser();
    ~FwEnvConfigParser();

    int ReadFile(const std::string &path, FwEnvConfig &config);
    int ReadString(const std::string &text, FwEnvConfig &config);
    int ParseLine(const std::string &line, FwEnvRegion &region);

    // 1-based line of the last error, 0 if none
    int error_line() const { return m_error_line; }

private:
    bool IsNotes(const std::string &line);
    std::string TrimTrialLineBreak(const std::string &data);
    int m_error_line;
};

// base as for strtoull(); a leading '-' or trailing junk is rejected
int fw_env_parse_number(const std::string &field, uint64_t *value, int base = 0);

#endif
