#include "fw_env.h"
#include <string.h>

#define LOG_TAG "fw_env"
#undef LOG_LEVEL
#define LOG_LEVEL LOG_DEBUG
#include "log.h"

bool fw_env_flag_is_newer(uint8_t flag, uint8_t other)
{
    if (flag == other)
        return false;
    if (flag == 0 && other == 0xff)
        return true;
    if (flag == 0xff && other == 0)
        return false;
    return flag > other;
}

FwEnv::FwEnv() : m_source(FW_ENV_SRC_NONE), m_flag(0)
{
    m_crc_status.valid = false;
    m_crc_status.expected = 0;
    m_crc_status.actual = 0;
}

FwEnv::~FwEnv()
{
}

const std::string *FwEnv::find_var(const std::string &name) const
{
    std::map<std::string, size_t>::const_iterator it = m_index.find(name);
    if (it == m_index.end())
        return NULL;
    return &m_vars[it->second].second;
}

void FwEnv::set_var(const std::string &name, const std::string &value)
{
    std::map<std::string, size_t>::iterator it = m_index.find(name);
    if (it != m_index.end())
    {
        LOG_D("duplicate variable %s, keeping the later value\n", name.c_str());
        m_vars[it->second].second = value;
        return;
    }
    m_index[name] = m_vars.size();
    m_vars.push_back(FwEnvVar(name, value));
}

// name=value\0name=value\0\0<padding>
int FwEnv::parse(const uint8_t *data, uint32_t len)
{
    uint32_t pos = 0;
    while (pos < len)
    {
        const uint8_t *record = data + pos;
        const uint8_t *nul = (const uint8_t *)memchr(record, '\0', len - pos);
        uint32_t record_len = nul != NULL ? (uint32_t)(nul - record) : len - pos;
        if (record_len == 0)
            break;

        const uint8_t *eq = (const uint8_t *)memchr(record, '=', record_len);
        if (eq == NULL || eq == record)
        {
            LOG_E("malformed entry at payload offset %u: \"%.*s\"\n", pos, (int)record_len, (const char *)record);
            return FW_ENV_ERR_MALFORMED_ENTRY;
        }
        set_var(std::string((const char *)record, eq - record),
                std::string((const char *)eq + 1, record + record_len - eq - 1));
        pos += record_len + 1;
    }
    return FW_ENV_OK;
}

static int check_block(const FwEnvConfig &config, const FwEnvBlock &block, int index)
{
    if (block.data() == NULL || block.size() != config.env_size())
    {
        LOG_E("block %d: size %u, expected %u\n", index, block.size(), config.env_size());
        return FW_ENV_ERR_BLOCK_MISMATCH;
    }
    return FW_ENV_OK;
}

int FwEnv::read(const FwEnvConfig &config, const FwEnvBlockSet &blocks, FwEnv &env, fw_env_crc_status_t *status)
{
    int ret = config.validate();
    if (ret != FW_ENV_OK)
        return ret;

    int expected_count = config.is_redundant() ? 2 : 1;
    if (blocks.count != expected_count)
    {
        LOG_E("%d environment blocks given, %d configured\n", blocks.count, expected_count);
        return FW_ENV_ERR_BLOCK_MISMATCH;
    }

    FwEnvBlock views[2];
    fw_env_crc_status_t crc[2];
    for (int i = 0; i < expected_count; i++)
    {
        ret = check_block(config, blocks.blocks[i], i);
        if (ret != FW_ENV_OK)
            return ret;
        views[i] = FwEnvBlock(blocks.blocks[i].data(), blocks.blocks[i].size(), config.header_size());
        crc[i] = fw_env_crc_verify(views[i]);
        if (!crc[i].valid)
            LOG_W("block %d: bad CRC, stored 0x%08x computed 0x%08x\n", i, crc[i].expected, crc[i].actual);
    }

    int current;
    if (!config.is_redundant())
    {
        if (status != NULL)
            *status = crc[0];
        if (!crc[0].valid)
            return FW_ENV_ERR_CHECKSUM_MISMATCH;
        current = FW_ENV_SRC_PRIMARY;
    }
    else if (!crc[0].valid && !crc[1].valid)
    {
        if (status != NULL)
            *status = crc[0];
        LOG_E("both environment copies are corrupt\n");
        return FW_ENV_ERR_NO_VALID_COPY;
    }
    else if (crc[0].valid && !crc[1].valid)
    {
        current = FW_ENV_SRC_PRIMARY;
    }
    else if (!crc[0].valid && crc[1].valid)
    {
        current = FW_ENV_SRC_SECONDARY;
    }
    else
    {
        current = fw_env_flag_is_newer(views[1].flag(), views[0].flag()) ? FW_ENV_SRC_SECONDARY : FW_ENV_SRC_PRIMARY;
        LOG_D("flags primary %u secondary %u\n", views[0].flag(), views[1].flag());
    }
    if (status != NULL)
        *status = crc[current];

    FwEnv parsed;
    ret = parsed.parse(views[current].payload(), views[current].payload_size());
    if (ret != FW_ENV_OK)
        return ret;
    parsed.m_source = (fw_env_source_t)current;
    parsed.m_crc_status = crc[current];
    parsed.m_flag = views[current].flag();
    LOG_D("using %s copy, %u variables\n", current == FW_ENV_SRC_PRIMARY ? "primary" : "secondary",
          (unsigned)parsed.size());

    env = parsed;
    return FW_ENV_OK;
}
