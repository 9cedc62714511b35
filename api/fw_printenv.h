#ifndef FW_PRINTENV_H
#define FW_PRINTENV_H

#include <stdio.h>

/**
 * @brief fw_printenv command line: parse options, load the environment under
 *        the lock and print the selected variables
 *
 * @param[in] argc, argv command line, argv[0] is the program name
 * @param[in] out variables, JSON and help text
 * @param[in] err "## Error" diagnostics and usage on bad options
 * @return process exit status, 0 on success and 1 on any failure
 */
int fw_printenv_run(int argc, char *argv[], FILE *out, FILE *err);

#endif
