#include <gtest/gtest.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>
#include <fcntl.h>
#include <algorithm>
#include <string>
#include <vector>
#include "fw_env_loader.h"
#include "hl_fw_storage.h"
#include "fw_env_test_util.h"

#define ENV_SIZE 0x100
#define ENV_OFFSET 0x200

class FwEnvLoaderTest : public ::testing::Test
{
protected:
    std::string m_dir;

    void SetUp() override
    {
        char tmpl[] = "/tmp/fw_env_loader_XXXXXX";
        ASSERT_TRUE(mkdtemp(tmpl) != NULL);
        m_dir = tmpl;
    }

    void TearDown() override
    {
        const char *names[] = {"image", "fw_env.config", "lock"};
        for (size_t i = 0; i < sizeof(names) / sizeof(names[0]); i++)
            unlink(path(names[i]).c_str());
        rmdir(m_dir.c_str());
    }

    std::string path(const char *name) const
    {
        return m_dir + "/" + name;
    }

    void write_file(const char *name, const std::string &data)
    {
        FILE *fp = fopen(path(name).c_str(), "wb");
        ASSERT_TRUE(fp != NULL);
        ASSERT_EQ(data.size(), fwrite(data.data(), 1, data.size(), fp));
        fclose(fp);
    }

    // image with blocks at ENV_OFFSET and ENV_OFFSET + ENV_SIZE, 0xff elsewhere
    void write_image(const std::vector<uint8_t> &first, const std::vector<uint8_t> &second)
    {
        std::string image(ENV_OFFSET + 2 * ENV_SIZE, '\xff');
        std::copy(first.begin(), first.end(), image.begin() + ENV_OFFSET);
        std::copy(second.begin(), second.end(), image.begin() + ENV_OFFSET + ENV_SIZE);
        write_file("image", image);
    }

    void write_config(bool redundant)
    {
        char line[512];
        std::string text = "# test image\n";
        snprintf(line, sizeof(line), "%s 0x%x 0x%x\n", path("image").c_str(), (unsigned)ENV_OFFSET, (unsigned)ENV_SIZE);
        text += line;
        if (redundant)
        {
            snprintf(line, sizeof(line), "%s %u %x\n", path("image").c_str(), (unsigned)(ENV_OFFSET + ENV_SIZE), (unsigned)ENV_SIZE);
            text += line;
        }
        write_file("fw_env.config", text);
    }
};

TEST_F(FwEnvLoaderTest, StorageReadsRegionAtOffset)
{
    std::vector<uint8_t> block = make_env_block(env_str("a=1\0\0", 5), ENV_SIZE);
    write_image(block, block);

    std::vector<uint8_t> buf(ENV_SIZE, 0);
    ASSERT_EQ(FW_ENV_OK, hl_fw_storage_read(path("image").c_str(), ENV_OFFSET, &buf[0], ENV_SIZE));
    EXPECT_TRUE(buf == block);
}

TEST_F(FwEnvLoaderTest, StorageShortReadFails)
{
    write_file("image", "short");
    std::vector<uint8_t> buf(ENV_SIZE, 0);
    EXPECT_EQ(FW_ENV_ERR_READ, hl_fw_storage_read(path("image").c_str(), 0, &buf[0], ENV_SIZE));
    EXPECT_EQ(FW_ENV_ERR_OPEN, hl_fw_storage_read(path("missing").c_str(), 0, &buf[0], ENV_SIZE));
}

TEST_F(FwEnvLoaderTest, LockCanBeTakenAgainAfterRelease)
{
    int lock = hl_fw_storage_lock(path("lock").c_str());
    ASSERT_GE(lock, 0);
    hl_fw_storage_unlock(lock);
    lock = hl_fw_storage_lock(path("lock").c_str());
    ASSERT_GE(lock, 0);
    hl_fw_storage_unlock(lock);
    EXPECT_EQ(FW_ENV_ERR_LOCK, hl_fw_storage_lock(path("nodir/lock").c_str()));
}

TEST_F(FwEnvLoaderTest, LoadsSingleEnvironmentFromConfigFile)
{
    write_image(make_env_block(env_str("bootcmd=run distro_bootcmd\0bootdelay=2\0\0", 39), ENV_SIZE),
                std::vector<uint8_t>());
    write_config(false);

    FwEnv env;
    ASSERT_EQ(FW_ENV_OK, fw_env_load_file(path("fw_env.config"), env));
    ASSERT_TRUE(env.find_var("bootdelay") != NULL);
    EXPECT_EQ("2", *env.find_var("bootdelay"));
    EXPECT_EQ("run distro_bootcmd", *env.find_var("bootcmd"));
}

TEST_F(FwEnvLoaderTest, LoadsNewerRedundantCopy)
{
    write_image(make_env_block(env_str("slot=a\0\0", 8), ENV_SIZE, true, 9),
                make_env_block(env_str("slot=b\0\0", 8), ENV_SIZE, true, 10));
    write_config(true);

    FwEnv env;
    ASSERT_EQ(FW_ENV_OK, fw_env_load_file(path("fw_env.config"), env));
    EXPECT_EQ(FW_ENV_SRC_SECONDARY, env.source());
    EXPECT_EQ("b", *env.find_var("slot"));
}

TEST_F(FwEnvLoaderTest, ErasedFlashHasNoValidCopy)
{
    std::vector<uint8_t> erased(ENV_SIZE, 0xff);
    write_image(erased, erased);
    write_config(true);

    FwEnv env;
    EXPECT_EQ(FW_ENV_ERR_NO_VALID_COPY, fw_env_load_file(path("fw_env.config"), env));
}

TEST_F(FwEnvLoaderTest, MissingConfigFile)
{
    FwEnv env;
    EXPECT_EQ(FW_ENV_ERR_CONFIG_OPEN, fw_env_load_file(path("fw_env.config"), env));
}

TEST_F(FwEnvLoaderTest, BootloaderEnvGet)
{
    write_image(make_env_block(env_str("boot_partition=bootB\0\0", 22), ENV_SIZE), std::vector<uint8_t>());
    write_config(false);

    std::string value;
    EXPECT_EQ(FW_ENV_OK, bootloader_env_get("boot_partition", value, path("fw_env.config").c_str(), path("lock").c_str()));
    EXPECT_EQ("bootB", value);

    value = "unchanged";
    EXPECT_EQ(FW_ENV_ERR_NOT_FOUND,
              bootloader_env_get("recovery_status", value, path("fw_env.config").c_str(), path("lock").c_str()));
    EXPECT_EQ("unchanged", value);
}
