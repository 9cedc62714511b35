#include "fw_env_config.h"
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <fstream>
#include <sstream>
#include <vector>
#include "str_util.h"

#define LOG_TAG "fw_env_config"
#undef LOG_LEVEL
#define LOG_LEVEL LOG_DEBUG
#include "log.h"

// fw_env.config may carry more lines; only the first two describe regions
#define FW_ENV_CONFIG_MAX_REGIONS 2

FwEnvConfig::FwEnvConfig() : m_has_secondary(false), m_redundant(false)
{
}

FwEnvConfig::FwEnvConfig(const FwEnvRegion &primary)
    : m_primary(primary), m_has_secondary(false), m_redundant(false)
{
}

FwEnvConfig::FwEnvConfig(const FwEnvRegion &primary, const FwEnvRegion &secondary)
    : m_primary(primary), m_secondary(secondary), m_has_secondary(true), m_redundant(true)
{
}

FwEnvConfig::FwEnvConfig(const FwEnvRegion &primary, const FwEnvRegion *secondary, bool redundant)
    : m_primary(primary), m_has_secondary(secondary != NULL), m_redundant(redundant)
{
    if (secondary != NULL)
        m_secondary = *secondary;
}

uint32_t FwEnvConfig::header_size() const
{
    return m_redundant ? FW_ENV_REDUNDANT_HEADER_SIZE : FW_ENV_HEADER_SIZE;
}

int FwEnvConfig::validate() const
{
    if (m_primary.size <= header_size())
    {
        LOG_E("%s: environment size 0x%x too small\n", m_primary.device.c_str(), m_primary.size);
        return FW_ENV_ERR_INVALID_SIZE;
    }
    if (!m_redundant)
        return FW_ENV_OK;
    if (!m_has_secondary)
    {
        LOG_E("redundant environment needs a second region\n");
        return FW_ENV_ERR_MISSING_SECONDARY;
    }
    if (m_secondary.size != m_primary.size)
    {
        LOG_E("environment sizes differ: 0x%x != 0x%x\n", m_primary.size, m_secondary.size);
        return FW_ENV_ERR_SIZE_MISMATCH;
    }
    return FW_ENV_OK;
}

int fw_env_parse_number(const std::string &field, uint64_t *value, int base)
{
    char *end = NULL;
    if (field.empty() || field[0] == '-')
        return -1;
    errno = 0;
    unsigned long long v = strtoull(field.c_str(), &end, base);
    if (errno != 0 || end == field.c_str() || *end != '\0')
        return -1;
    *value = v;
    return 0;
}

// size and sector columns are always hex, with or without 0x
static int parse_hex_u32(const std::string &field, uint32_t *value)
{
    uint64_t v;
    if (fw_env_parse_number(field, &v, 16) != 0 || v > 0xFFFFFFFFULL)
        return -1;
    *value = (uint32_t)v;
    return 0;
}

FwEnvConfigParser::FwEnvConfigParser() : m_error_line(0)
{
}

FwEnvConfigParser::~FwEnvConfigParser()
{
}

bool FwEnvConfigParser::IsNotes(const std::string &line)
{
    std::string s = strip(line);
    return s.empty() || startswith(s, "#");
}

std::string FwEnvConfigParser::TrimTrialLineBreak(const std::string &data)
{
    return rstrip(data, "\r\n");
}

int FwEnvConfigParser::ParseLine(const std::string &line, FwEnvRegion &region)
{
    std::vector<std::string> fields = split(line, " \t");
    FwEnvRegion r;

    if (fields.empty())
        return FW_ENV_ERR_PARSE_DEVNAME;
    r.device = fields[0];
    if (fields.size() < 2 || fw_env_parse_number(fields[1], &r.offset) != 0)
        return FW_ENV_ERR_PARSE_OFFSET;
    if (fields.size() < 3 || parse_hex_u32(fields[2], &r.size) != 0)
        return FW_ENV_ERR_PARSE_SIZE;
    if (fields.size() > 3 && parse_hex_u32(fields[3], &r.sector_size) != 0)
        return FW_ENV_ERR_PARSE_SECTOR;
    if (fields.size() > 4 && parse_hex_u32(fields[4], &r.sectors) != 0)
        return FW_ENV_ERR_PARSE_SECTOR;

    region = r;
    return FW_ENV_OK;
}

int FwEnvConfigParser::ReadString(const std::string &text, FwEnvConfig &config)
{
    std::istringstream iss(text);
    std::string str_line;
    std::vector<FwEnvRegion> regions;
    int row = 0;

    m_error_line = 0;
    while (regions.size() < FW_ENV_CONFIG_MAX_REGIONS && std::getline(iss, str_line))
    {
        row++;
        str_line = TrimTrialLineBreak(str_line);
        if (IsNotes(str_line))
            continue;

        FwEnvRegion region;
        int ret = ParseLine(str_line, region);
        if (ret != FW_ENV_OK)
        {
            m_error_line = row;
            LOG_E("line %d: %s: \"%s\"\n", row, fw_env_strerror(ret), str_line.c_str());
            return ret;
        }
        LOG_D("region %d: %s offset 0x%llx size 0x%x\n", (int)regions.size(), region.device.c_str(),
              (unsigned long long)region.offset, region.size);
        regions.push_back(region);
    }

    FwEnvConfig parsed;
    switch (regions.size())
    {
    case 1:
        parsed = FwEnvConfig(regions[0]);
        break;
    case 2:
        parsed = FwEnvConfig(regions[0], regions[1]);
        break;
    default:
        LOG_E("no environment region configured\n");
        return FW_ENV_ERR_WRONG_DEV_NUM;
    }

    int ret = parsed.validate();
    if (ret != FW_ENV_OK)
        return ret;
    config = parsed;
    return FW_ENV_OK;
}

int FwEnvConfigParser::ReadFile(const std::string &path, FwEnvConfig &config)
{
    std::ifstream file(path.c_str());
    if (!file.is_open())
    {
        LOG_E("Cannot open this file:%s \n", path.c_str());
        return FW_ENV_ERR_CONFIG_OPEN;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad())
    {
        LOG_E("Cannot read this file:%s \n", path.c_str());
        return FW_ENV_ERR_CONFIG_OPEN;
    }
    return ReadString(buffer.str(), config);
}
