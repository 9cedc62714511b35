#ifndef FW_ENV_LOADER_H
#define FW_ENV_LOADER_H

#include <string>
#include "fw_env.h"
#include "config.h"
#include "hl_fw_storage.h"

/**
 * @brief read the configured region(s) from storage and parse them
 */
int fw_env_load(const FwEnvConfig &config, FwEnv &env, fw_env_crc_status_t *status = NULL);

/**
 * @brief same as fw_env_load(), with the regions taken from a fw_env.config file
 */
int fw_env_load_file(const std::string &config_file, FwEnv &env, fw_env_crc_status_t *status = NULL);

/**
 * @brief one-shot lookup under the env lock
 *
 * @param[in] name variable name
 * @param[out] value set only when found
 * @return FW_ENV_OK, FW_ENV_ERR_NOT_FOUND, or the load/lock error
 */
int bootloader_env_get(const char *name, std::string &value,
                       const char *config_file = CONFIG_UBOOT_FWENV,
                       const char *lockname = CONFIG_UBOOT_FWENV_LOCK);

#endif
