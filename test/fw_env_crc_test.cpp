#include <gtest/gtest.h>
#include <string.h>
#include "fw_env_crc.h"
#include "fw_env_test_util.h"

TEST(FwEnvCrc, MatchesReferenceCheckValue)
{
    const char *check = "123456789";
    EXPECT_EQ(0xCBF43926u, fw_env_crc32((const uint8_t *)check, strlen(check)));
    EXPECT_EQ(0u, fw_env_crc32(NULL, 0));
}

TEST(FwEnvCrc, ValidBlock)
{
    std::vector<uint8_t> buf = make_env_block(env_str("ver=U-Boot 2021.01\0baudrate=115200\0\0", 36), 64);
    fw_env_crc_status_t status = fw_env_crc_verify(FwEnvBlock(buf));
    EXPECT_TRUE(status.valid);
    EXPECT_EQ(status.expected, status.actual);
}

TEST(FwEnvCrc, EmptyEnvironmentChecksumsLikeAnyOtherPayload)
{
    std::vector<uint8_t> buf(32, 0);
    std::vector<uint8_t> zeros(28, 0);
    uint32_t crc = fw_env_crc32(&zeros[0], zeros.size());
    buf[0] = crc & 0xff;
    buf[1] = (crc >> 8) & 0xff;
    buf[2] = (crc >> 16) & 0xff;
    buf[3] = (crc >> 24) & 0xff;
    fw_env_crc_status_t status = fw_env_crc_verify(FwEnvBlock(buf));
    EXPECT_TRUE(status.valid);
    EXPECT_EQ(crc, status.actual);
}

TEST(FwEnvCrc, ZeroHeaderWithNonEmptyPayloadIsInvalid)
{
    std::vector<uint8_t> buf = make_env_block(env_str("bootdelay=3\0\0", 13), 32);
    buf[0] = buf[1] = buf[2] = buf[3] = 0;
    fw_env_crc_status_t status = fw_env_crc_verify(FwEnvBlock(buf));
    EXPECT_FALSE(status.valid);
    EXPECT_EQ(0u, status.expected);
    EXPECT_EQ(fw_env_crc32(&buf[4], buf.size() - 4), status.actual);
    EXPECT_NE(0u, status.actual);
}

TEST(FwEnvCrc, AnySingleBitFlipIsDetected)
{
    std::vector<uint8_t> buf = make_env_block(env_str("a=1\0b=2\0\0", 9), 24);
    for (size_t byte = FW_ENV_HEADER_SIZE; byte < buf.size(); byte++)
    {
        for (int bit = 0; bit < 8; bit++)
        {
            std::vector<uint8_t> flipped = buf;
            flipped[byte] ^= (uint8_t)(1 << bit);
            EXPECT_FALSE(fw_env_crc_verify(FwEnvBlock(flipped)).valid) << "byte " << byte << " bit " << bit;
        }
    }
}

TEST(FwEnvCrc, HeaderIsLittleEndian)
{
    std::vector<uint8_t> buf = make_env_block("x=y", 16);
    uint32_t crc = fw_env_crc32(&buf[4], 12);
    EXPECT_EQ(crc & 0xff, buf[0]);
    EXPECT_EQ(crc >> 24, buf[3]);
    EXPECT_EQ(crc, FwEnvBlock(buf).stored_crc());
}

TEST(FwEnvCrc, RedundantPayloadExcludesFlagByte)
{
    std::vector<uint8_t> buf = make_env_block("x=y", 16, true, 7);
    FwEnvBlock block(buf, FW_ENV_REDUNDANT_HEADER_SIZE);
    EXPECT_EQ(7, block.flag());
    EXPECT_EQ(11u, block.payload_size());
    EXPECT_TRUE(fw_env_crc_verify(block).valid);

    buf[FW_ENV_CRC_SIZE] = 8;
    EXPECT_TRUE(fw_env_crc_verify(FwEnvBlock(buf, FW_ENV_REDUNDANT_HEADER_SIZE)).valid);
}

TEST(FwEnvCrc, IncompleteBlockIsNeverValid)
{
    uint8_t tiny[3] = {0, 0, 0};
    EXPECT_FALSE(fw_env_crc_verify(FwEnvBlock(tiny, sizeof(tiny))).valid);
    EXPECT_FALSE(fw_env_crc_verify(FwEnvBlock()).valid);
}
