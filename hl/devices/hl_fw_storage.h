#ifndef HL_FW_STORAGE_H
#define HL_FW_STORAGE_H
#ifdef __cplusplus
extern "C"
{
#endif

#include <stdint.h>

    /**
     * @brief take the advisory lock shared with the other U-Boot env tools
     *
     * @param[in] lockname lock file, created if missing
     * @return lock descriptor, or FW_ENV_ERR_LOCK
     */
    int hl_fw_storage_lock(const char *lockname);
    void hl_fw_storage_unlock(int lock);

    /**
     * @brief read size bytes at offset from a device node or image file
     *
     * @return FW_ENV_OK, FW_ENV_ERR_OPEN, FW_ENV_ERR_SEEK or FW_ENV_ERR_READ
     */
    int hl_fw_storage_read(const char *device, uint64_t offset, uint8_t *buf, uint32_t size);

#ifdef __cplusplus
}
#endif
#endif
