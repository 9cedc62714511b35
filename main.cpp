#include <stdio.h>
#include "fw_printenv.h"

#define LOG_TAG "main"
#undef LOG_LEVEL
#define LOG_LEVEL LOG_DEBUG
#include "log.h"

int main(int argc, char *argv[])
{
    log_init();
    return fw_printenv_run(argc, argv, stdout, stderr);
}
