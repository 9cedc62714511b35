#ifndef FW_ENV_H
#define FW_ENV_H

#include <stdint.h>
#include <string>
#include <vector>
#include <map>
#include <utility>
#include "fw_env_config.h"
#include "fw_env_block.h"
#include "fw_env_crc.h"
#include "fw_env_error.h"

typedef enum
{
    FW_ENV_SRC_NONE = -1,
    FW_ENV_SRC_PRIMARY = 0,
    FW_ENV_SRC_SECONDARY = 1,
} fw_env_source_t;

/**
 * @brief One raw block per configured region, as read from storage.
 *        Holds views only; the buffers must outlive FwEnv::read().
 */
typedef struct FwEnvBlockSet
{
    FwEnvBlock blocks[2];
    int count;

    FwEnvBlockSet() : count(0) {}
    explicit FwEnvBlockSet(const FwEnvBlock &primary) : count(1) { blocks[0] = primary; }
    FwEnvBlockSet(const FwEnvBlock &primary, const FwEnvBlock &secondary) : count(2)
    {
        blocks[0] = primary;
        blocks[1] = secondary;
    }
} FwEnvBlockSet;

typedef std::pair<std::string, std::string> FwEnvVar;

/**
 * @brief Freshness rule for the redundant flag byte: the larger counter
 *        is newer, except that 0 follows 0xff when the counter wraps.
 *
 * @return true if a copy carrying flag is newer than one carrying other
 */
bool fw_env_flag_is_newer(uint8_t flag, uint8_t other);

class FwEnv
{
public:
    typedef std::vector<FwEnvVar>::const_iterator const_iterator;

    FwEnv();
    ~FwEnv();

    /**
     * @brief pick the valid (and, when redundant, newest) copy and parse it
     *
     * @param[in] config validated region description
     * @param[in] blocks one block, or two when config is redundant
     * @param[out] env replaced only on success
     * @param[out] status optional; checksum result of the rejected or chosen copy
     * @return FW_ENV_OK or a negative fw_env_err_t
     */
    static int read(const FwEnvConfig &config, const FwEnvBlockSet &blocks, FwEnv &env,
                    fw_env_crc_status_t *status = NULL);

    // NULL if name is not defined
    const std::string *find_var(const std::string &name) const;

    const_iterator begin() const { return m_vars.begin(); }
    const_iterator end() const { return m_vars.end(); }
    size_t size() const { return m_vars.size(); }
    bool empty() const { return m_vars.empty(); }

    fw_env_source_t source() const { return m_source; }
    const fw_env_crc_status_t &crc_status() const { return m_crc_status; }
    uint8_t flag() const { return m_flag; }

private:
    int parse(const uint8_t *data, uint32_t len);
    void set_var(const std::string &name, const std::string &value);

    std::vector<FwEnvVar> m_vars;
    std::map<std::string, size_t> m_index;
    fw_env_source_t m_source;
    fw_env_crc_status_t m_crc_status;
    uint8_t m_flag;
};

#endif
