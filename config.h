#ifndef CONFIG_H
#define CONFIG_H

#define FW_ENV_VERSION "1.0.0"

// clang-format off
#define CONFIG_UBOOT_FWENV "/etc/fw_env.config"        // region description
#define CONFIG_UBOOT_FWENV_LOCK "/var/lock/fw_printenv.lock"
// clang-format on

#endif
