#ifndef FW_ENV_ERROR_H
#define FW_ENV_ERROR_H

#ifdef __cplusplus
extern "C" {
#endif

typedef enum{
    FW_ENV_OK = 0,

    /* config */
    FW_ENV_ERR_INVALID_SIZE = -100,         /* region too small for the header */
    FW_ENV_ERR_MISSING_SECONDARY,           /* redundant without a second region */
    FW_ENV_ERR_SIZE_MISMATCH,               /* regions differ in size */
    FW_ENV_ERR_CONFIG_OPEN,                 /* config file unreadable */
    FW_ENV_ERR_PARSE_DEVNAME,               /* no device field */
    FW_ENV_ERR_PARSE_OFFSET,                /* bad offset field */
    FW_ENV_ERR_PARSE_SIZE,                  /* bad size field */
    FW_ENV_ERR_PARSE_SECTOR,                /* bad sector size / count field */
    FW_ENV_ERR_WRONG_DEV_NUM,               /* no configuration line */

    /* environment data */
    FW_ENV_ERR_CHECKSUM_MISMATCH = -200,    /* single copy failed crc */
    FW_ENV_ERR_NO_VALID_COPY,               /* both redundant copies failed crc */
    FW_ENV_ERR_MALFORMED_ENTRY,             /* record without '=' */
    FW_ENV_ERR_BLOCK_MISMATCH,              /* blocks do not match the config */

    /* storage */
    FW_ENV_ERR_OPEN = -300,
    FW_ENV_ERR_SEEK,
    FW_ENV_ERR_READ,
    FW_ENV_ERR_LOCK,

    /* lookup */
    FW_ENV_ERR_NOT_FOUND = -400,
} fw_env_err_t;

const char *fw_env_strerror(int err);

#ifdef __cplusplus
}
#endif

#endif
