#include "fw_printenv.h"
#include <getopt.h>
#include <string>
#include <vector>
#include "config.h"
#include "fw_env.h"
#include "fw_env_loader.h"
#include "hl_fw_storage.h"
#include "cJSON.h"

#define LOG_TAG "fw_printenv"
#undef LOG_LEVEL
#define LOG_LEVEL LOG_DEBUG
#include "log.h"

static const char *help_text =
    "Usage: fw_printenv [OPTIONS]... [VARIABLE]...\n"
    "Print variables from U-Boot environment (fw_printenv " FW_ENV_VERSION ")\n"
    "\n"
    " -h, --help           print this help.\n"
    " -c, --config         configuration file, default:" CONFIG_UBOOT_FWENV "\n"
    " -l, --lock           lock file, default:" CONFIG_UBOOT_FWENV_LOCK "\n"
    " -n, --noheader       do not repeat variable name in output\n"
    " -j, --json           print variables as a JSON object\n"
    " -v, --verbose        debug output\n";

static struct option long_options[] = {
    {"config", required_argument, NULL, 'c'},
    {"lock", required_argument, NULL, 'l'},
    {"noheader", no_argument, NULL, 'n'},
    {"json", no_argument, NULL, 'j'},
    {"verbose", no_argument, NULL, 'v'},
    {"help", no_argument, NULL, 'h'},
    {NULL, 0, NULL, 0},
};

static void print_var(FILE *out, const std::string &name, const std::string &value, bool noheader)
{
    if (!noheader)
    {
        fwrite(name.data(), 1, name.size(), out);
        fputc('=', out);
    }
    fwrite(value.data(), 1, value.size(), out);
    fputc('\n', out);
}

static int print_json(FILE *out, FILE *err, const FwEnv &env, const std::vector<std::string> &names)
{
    int ret = 0;
    cJSON *root = cJSON_CreateObject();
    if (root == NULL)
    {
        LOG_E("cJSON_CreateObject failed\n");
        return 1;
    }
    if (names.empty())
    {
        for (FwEnv::const_iterator it = env.begin(); it != env.end(); ++it)
            cJSON_AddItemToObject(root, it->first.c_str(), cJSON_CreateString(it->second.c_str()));
    }
    else
    {
        for (size_t i = 0; i < names.size(); i++)
        {
            const std::string *value = env.find_var(names[i]);
            if (value == NULL)
            {
                fprintf(err, "## Error: \"%s\" not defined\n", names[i].c_str());
                ret = 1;
                continue;
            }
            cJSON_AddItemToObject(root, names[i].c_str(), cJSON_CreateString(value->c_str()));
        }
    }
    char *text = cJSON_Print(root);
    if (text == NULL)
    {
        LOG_E("cJSON_Print failed\n");
        ret = 1;
    }
    else
    {
        fprintf(out, "%s\n", text);
        cJSON_free(text);
    }
    cJSON_Delete(root);
    return ret;
}

int fw_printenv_run(int argc, char *argv[], FILE *out, FILE *err)
{
    const char *config_file = CONFIG_UBOOT_FWENV;
    const char *lockname = CONFIG_UBOOT_FWENV_LOCK;
    bool noheader = false;
    bool json = false;
    int c;

    // 0 makes getopt start over on every call
    optind = 0;
    while ((c = getopt_long(argc, argv, "c:l:njvh", long_options, NULL)) != -1)
    {
        switch (c)
        {
        case 'c':
            config_file = optarg;
            break;
        case 'l':
            lockname = optarg;
            break;
        case 'n':
            noheader = true;
            break;
        case 'j':
            json = true;
            break;
        case 'v':
            log_set_level(LOG_DEBUG);
            break;
        case 'h':
            fputs(help_text, out);
            return 0;
        default:
            fputs(help_text, err);
            return 1;
        }
    }

    std::vector<std::string> names;
    for (int i = optind; i < argc; i++)
        names.push_back(argv[i]);

    if (noheader && names.size() != 1)
    {
        fprintf(err, "## Error: `-n'/`--noheader' option requires exactly one argument\n");
        return 1;
    }

    FwEnv env;
    fw_env_crc_status_t crc = {false, 0, 0};
    int lock = hl_fw_storage_lock(lockname);
    if (lock < 0)
        return 1;
    int ret = fw_env_load_file(config_file, env, &crc);
    hl_fw_storage_unlock(lock);
    if (ret != FW_ENV_OK)
    {
        if (ret == FW_ENV_ERR_CHECKSUM_MISMATCH)
            LOG_E("stored CRC 0x%08x, computed 0x%08x\n", crc.expected, crc.actual);
        LOG_E("Error: environment not initialized, %s\n", fw_env_strerror(ret));
        return 1;
    }
    LOG_D("environment from %s copy\n", env.source() == FW_ENV_SRC_PRIMARY ? "primary" : "secondary");

    if (json)
        return print_json(out, err, env, names);

    if (names.empty())
    {
        for (FwEnv::const_iterator it = env.begin(); it != env.end(); ++it)
            print_var(out, it->first, it->second, false);
        return 0;
    }

    ret = 0;
    for (size_t i = 0; i < names.size(); i++)
    {
        const std::string *value = env.find_var(names[i]);
        if (value == NULL)
        {
            fprintf(err, "## Error: \"%s\" not defined\n", names[i].c_str());
            ret = 1;
            continue;
        }
        print_var(out, names[i], *value, noheader);
    }
    return ret;
}
