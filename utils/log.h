#ifndef LOG_H
#define LOG_H
#ifdef __cplusplus
extern "C"
{
#endif
#include <stdio.h>
    // Usage, per source file:
    //     #define LOG_TAG "module"
    //     #undef LOG_LEVEL
    //     #define LOG_LEVEL LOG_INFO
    //     #include "log.h"
    //
    // 0.[O]: off
    // 1.[A]: assert
    // 2.[E]: error
    // 3.[W]: warn
    // 4.[I]: info
    // 5.[D]: debug
    //
    // [module][timestamp][level]: message

#define LOG_OUTPUT_FILE_LINE 0

#define LOG_OFF 0
#define LOG_ASSERT 1
#define LOG_ERROR 2
#define LOG_WARN 3
#define LOG_INFO 4
#define LOG_DEBUG 5
#define LOG_LEVEL_NUM 6

    void log_init(void);
    void log_set_level(int level);
    int log_get_level(void);
    int log_set_output_path(const char *path);
    void log_set_output(FILE *fp);
    void log_output(const char *module, int level, const char *file_name, int line_num, const char *fmt, ...)
        __attribute__((format(printf, 5, 6)));

#ifndef LOG_LEVEL
#define LOG_LEVEL LOG_OFF
#endif

#ifndef LOG_TAG
#define LOG_TAG ""
#endif

#if (LOG_LEVEL >= LOG_ASSERT)
#define LOG_A(...) log_output(LOG_TAG, LOG_ASSERT, __FILE__, __LINE__, __VA_ARGS__)
#else
#define LOG_A(...)
#endif

#if (LOG_LEVEL >= LOG_ERROR)
#define LOG_E(...) log_output(LOG_TAG, LOG_ERROR, __FILE__, __LINE__, __VA_ARGS__)
#else
#define LOG_E(...)
#endif

#if (LOG_LEVEL >= LOG_WARN)
#define LOG_W(...) log_output(LOG_TAG, LOG_WARN, __FILE__, __LINE__, __VA_ARGS__)
#else
#define LOG_W(...)
#endif

#if (LOG_LEVEL >= LOG_INFO)
#define LOG_I(...) log_output(LOG_TAG, LOG_INFO, __FILE__, __LINE__, __VA_ARGS__)
#else
#define LOG_I(...)
#endif

#if (LOG_LEVEL >= LOG_DEBUG)
#define LOG_D(...) log_output(LOG_TAG, LOG_DEBUG, __FILE__, __LINE__, __VA_ARGS__)
#else
#define LOG_D(...)
#endif

#ifdef __cplusplus
}
#endif

#endif
