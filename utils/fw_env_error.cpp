#include "fw_env_error.h"

const char *fw_env_strerror(int err)
{
    switch (err)
    {
    case FW_ENV_OK:
        return "success";
    case FW_ENV_ERR_INVALID_SIZE:
        return "environment size too small";
    case FW_ENV_ERR_MISSING_SECONDARY:
        return "redundant environment without secondary region";
    case FW_ENV_ERR_SIZE_MISMATCH:
        return "primary and secondary sizes differ";
    case FW_ENV_ERR_CONFIG_OPEN:
        return "cannot read configuration file";
    case FW_ENV_ERR_PARSE_DEVNAME:
        return "missing device name";
    case FW_ENV_ERR_PARSE_OFFSET:
        return "invalid device offset";
    case FW_ENV_ERR_PARSE_SIZE:
        return "invalid environment size";
    case FW_ENV_ERR_PARSE_SECTOR:
        return "invalid sector size or count";
    case FW_ENV_ERR_WRONG_DEV_NUM:
        return "no environment device configured";
    case FW_ENV_ERR_CHECKSUM_MISMATCH:
        return "bad CRC";
    case FW_ENV_ERR_NO_VALID_COPY:
        return "no valid environment copy";
    case FW_ENV_ERR_MALFORMED_ENTRY:
        return "malformed environment entry";
    case FW_ENV_ERR_BLOCK_MISMATCH:
        return "environment blocks do not match configuration";
    case FW_ENV_ERR_OPEN:
        return "cannot open device";
    case FW_ENV_ERR_SEEK:
        return "cannot seek device";
    case FW_ENV_ERR_READ:
        return "cannot read device";
    case FW_ENV_ERR_LOCK:
        return "cannot lock environment";
    case FW_ENV_ERR_NOT_FOUND:
        return "variable not defined";
    default:
        return "unknown error";
    }
}
