#include <stdio.h>
#include <stdarg.h>
#include <string.h>
#include <errno.h>
#include <time.h>
#include <sys/time.h>
#include <pthread.h>
#include "log.h"

static pthread_mutex_t log_lock = PTHREAD_MUTEX_INITIALIZER;
static FILE *log_fp = NULL;
static int log_owns_fp = 0;
static int log_level = LOG_INFO;

static const char log_level_char[LOG_LEVEL_NUM] = {'O', 'A', 'E', 'W', 'I', 'D'};

void log_init(void)
{
    pthread_mutex_lock(&log_lock);
    if (log_owns_fp && log_fp != NULL)
        fclose(log_fp);
    log_fp = stderr;
    log_owns_fp = 0;
    log_level = LOG_INFO;
    pthread_mutex_unlock(&log_lock);
}

void log_set_level(int level)
{
    if (level < LOG_OFF)
        level = LOG_OFF;
    if (level > LOG_DEBUG)
        level = LOG_DEBUG;
    pthread_mutex_lock(&log_lock);
    log_level = level;
    pthread_mutex_unlock(&log_lock);
}

int log_get_level(void)
{
    int level;
    pthread_mutex_lock(&log_lock);
    level = log_level;
    pthread_mutex_unlock(&log_lock);
    return level;
}

// append to path; the previous sink is closed if it was opened here
int log_set_output_path(const char *path)
{
    FILE *fp = fopen(path, "a");
    if (fp == NULL)
    {
        fprintf(stderr, "log: cannot open %s, %s\n", path, strerror(errno));
        return -1;
    }
    pthread_mutex_lock(&log_lock);
    if (log_owns_fp && log_fp != NULL)
        fclose(log_fp);
    log_fp = fp;
    log_owns_fp = 1;
    pthread_mutex_unlock(&log_lock);
    return 0;
}

void log_set_output(FILE *fp)
{
    pthread_mutex_lock(&log_lock);
    if (log_owns_fp && log_fp != NULL)
        fclose(log_fp);
    log_fp = fp;
    log_owns_fp = 0;
    pthread_mutex_unlock(&log_lock);
}

void log_output(const char *module, int level, const char *file_name, int line_num, const char *fmt, ...)
{
    struct timeval tv;
    struct tm tm;
    char timestamp[32];
    va_list args;

    if (level <= LOG_OFF || level >= LOG_LEVEL_NUM)
        return;

    gettimeofday(&tv, NULL);
    localtime_r(&tv.tv_sec, &tm);
    strftime(timestamp, sizeof(timestamp), "%H:%M:%S", &tm);

    pthread_mutex_lock(&log_lock);
    if (level > log_level)
    {
        pthread_mutex_unlock(&log_lock);
        return;
    }
    FILE *fp = log_fp != NULL ? log_fp : stderr;
    fprintf(fp, "[%s][%s.%03ld][%c]:", module, timestamp, (long)(tv.tv_usec / 1000), log_level_char[level]);
#if LOG_OUTPUT_FILE_LINE
    fprintf(fp, "[%s:%d]", file_name, line_num);
#else
    (void)file_name;
    (void)line_num;
#endif
    va_start(args, fmt);
    vfprintf(fp, fmt, args);
    va_end(args);
    fflush(fp);
    pthread_mutex_unlock(&log_lock);
}
