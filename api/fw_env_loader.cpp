#include "fw_env_loader.h"
#include <stdint.h>
#include <vector>

#define LOG_TAG "fw_env_loader"
#undef LOG_LEVEL
#define LOG_LEVEL LOG_DEBUG
#include "log.h"

static int read_region(const FwEnvRegion &region, std::vector<uint8_t> &buf)
{
    buf.assign(region.size, 0);
    return hl_fw_storage_read(region.device.c_str(), region.offset, &buf[0], region.size);
}

int fw_env_load(const FwEnvConfig &config, FwEnv &env, fw_env_crc_status_t *status)
{
    std::vector<uint8_t> primary;
    std::vector<uint8_t> secondary;

    int ret = config.validate();
    if (ret != FW_ENV_OK)
        return ret;

    ret = read_region(config.primary(), primary);
    if (ret != FW_ENV_OK)
        return ret;
    if (!config.is_redundant())
        return FwEnv::read(config, FwEnvBlockSet(FwEnvBlock(primary)), env, status);

    ret = read_region(*config.secondary(), secondary);
    if (ret != FW_ENV_OK)
        return ret;
    return FwEnv::read(config, FwEnvBlockSet(FwEnvBlock(primary), FwEnvBlock(secondary)), env, status);
}

int fw_env_load_file(const std::string &config_file, FwEnv &env, fw_env_crc_status_t *status)
{
    FwEnvConfig config;
    FwEnvConfigParser parser;
    int ret = parser.ReadFile(config_file, config);
    if (ret != FW_ENV_OK)
        return ret;
    return fw_env_load(config, env, status);
}

int bootloader_env_get(const char *name, std::string &value, const char *config_file, const char *lockname)
{
    FwEnv env;
    int lock = hl_fw_storage_lock(lockname);
    if (lock < 0)
        return lock;

    int ret = fw_env_load_file(config_file, env);
    hl_fw_storage_unlock(lock);
    if (ret != FW_ENV_OK)
    {
        LOG_E("Error: environment not initialized, %s\n", fw_env_strerror(ret));
        return ret;
    }

    const std::string *var = env.find_var(name);
    LOG_D("bootloader_env_get %s : %s\n", name, var == NULL ? "?" : var->c_str());
    if (var == NULL)
        return FW_ENV_ERR_NOT_FOUND;
    value = *var;
    return FW_ENV_OK;
}
