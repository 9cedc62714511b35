#include <stdio.h>
#include <string.h>
#include <errno.h>
#include <unistd.h>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/types.h>
#include "hl_fw_storage.h"
#include "fw_env_error.h"

#define LOG_TAG "hl_fw_storage"
#undef LOG_LEVEL
#define LOG_LEVEL LOG_DEBUG
#include "log.h"

int hl_fw_storage_lock(const char *lockname)
{
    int lockfd = open(lockname, O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0666);
    if (lockfd < 0)
    {
        LOG_E("Error opening U-Boot lock file %s, %s\n", lockname, strerror(errno));
        return FW_ENV_ERR_LOCK;
    }
    if (flock(lockfd, LOCK_EX) < 0)
    {
        LOG_E("Error locking file %s, %s\n", lockname, strerror(errno));
        close(lockfd);
        return FW_ENV_ERR_LOCK;
    }
    return lockfd;
}

void hl_fw_storage_unlock(int lock)
{
    if (lock < 0)
        return;
    flock(lock, LOCK_UN);
    close(lock);
}

int hl_fw_storage_read(const char *device, uint64_t offset, uint8_t *buf, uint32_t size)
{
    int fd = open(device, O_RDONLY | O_CLOEXEC);
    if (fd < 0)
    {
        LOG_E("Can't open %s: %s\n", device, strerror(errno));
        return FW_ENV_ERR_OPEN;
    }
    if (lseek(fd, (off_t)offset, SEEK_SET) == (off_t)-1)
    {
        LOG_E("Seek error on %s: %s\n", device, strerror(errno));
        close(fd);
        return FW_ENV_ERR_SEEK;
    }

    uint32_t done = 0;
    while (done < size)
    {
        ssize_t n = read(fd, buf + done, size - done);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_E("Read error on %s: %s\n", device, strerror(errno));
            close(fd);
            return FW_ENV_ERR_READ;
        }
        if (n == 0)
        {
            LOG_E("Short read on %s: %u of %u bytes at 0x%llx\n", device, done, size, (unsigned long long)offset);
            close(fd);
            return FW_ENV_ERR_READ;
        }
        done += (uint32_t)n;
    }
    close(fd);
    LOG_D("read 0x%x bytes from %s at 0x%llx\n", size, device, (unsigned long long)offset);
    return FW_ENV_OK;
}
