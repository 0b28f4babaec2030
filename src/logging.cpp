// src/logging.cpp
#include "inventory/logging.h"
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>
#include <unistd.h>   // fileno, fsync
#include <iostream>

using namespace std;

namespace inventory
{

static FILE *g_log_fp = nullptr;
static std::mutex g_log_mutex;
static std::string g_log_path = "";
static bool g_console = true;

static std::string now_string()
{
    time_t t = time(nullptr);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char ts[64];
    strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(ts);
}

static void write_line(const char *level, const std::string &msg)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);

    char prefix[64];
    snprintf(prefix, sizeof(prefix), "%-19s | %-5s | ", now_string().c_str(), level);
    std::string line = std::string(prefix) + msg;

    if (g_console)
    {
        std::cerr << line << std::endl;
    }

    if (g_log_fp)
    {
        fprintf(g_log_fp, "%s\n", line.c_str());
        fflush(g_log_fp);
        fsync(fileno(g_log_fp));
    }
}

void init_logger(const std::string &path)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_fp) return;
    g_log_path = path;
    if (g_log_path.empty()) return;

    // ensure directory exists is left to user (we don't create dirs here)
    g_log_fp = fopen(g_log_path.c_str(), "a");
    if (!g_log_fp)
    {
        std::cerr << "[logging] Failed to open log file: " << g_log_path << ", logging to console only\n";
        return;
    }
    setvbuf(g_log_fp, nullptr, _IOLBF, 0); // line buffering
    fprintf(g_log_fp, "=== inventory log started at %s ===\n", now_string().c_str());
    fflush(g_log_fp);
    fsync(fileno(g_log_fp));
}

void set_log_console(bool enabled)
{
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_console = enabled;
}

void log_message(const std::string &msg)
{
    write_line("INFO", msg);
}

void log_warning(const std::string &msg)
{
    write_line("WARN", msg);
}

void log_error(const std::string &msg)
{
    write_line("ERR", msg);
}

} // namespace inventory
