/*
 * [APKCHAIN_FLOW_NOTE] 文件级流程注释
 * - 控制台日志实现，统一阶段轨迹/告警/错误输出。
 * - 链路位置：观测层。
 * - 输入：日志级别与格式化参数。
 * - 输出：控制台可读日志。
 */
#include "zLog.h"

#include <atomic>   // 运行时阈值需要跨线程可见。
#include <cstdio>   // fprintf / vsnprintf。
#include <cstdarg>  // va_list / va_start / va_end。

// 单次格式化缓冲长度上限（含结尾 '\0'）。
// 外部工具 stderr 可能很长，超出部分直接截断。
#define MAX_LOG_BUF_LEN 4096

namespace {

// 运行时阈值，初始值取编译期默认。
std::atomic<int> g_log_level{CURRENT_LOG_LEVEL};

}  // namespace

void zLogSetLevel(int level) {
    g_log_level.store(level, std::memory_order_relaxed);
}

int zLogGetLevel() {
    return g_log_level.load(std::memory_order_relaxed);
}

// 控制台日志实现：先格式化，再按级别选择输出流。
void zLogPrint(int level, const char* tag, const char* file_name, const char* function_name, int line_num, const char* format, ...) {
    // 小于阈值的日志直接忽略。
    if (level < g_log_level.load(std::memory_order_relaxed)) return;

    va_list args;
    va_start(args, format);
    char buffer[MAX_LOG_BUF_LEN];
    // 安全格式化，自动截断超长内容。
    vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    (void)tag;
    if (level >= LOG_LEVEL_ERROR) {
        fprintf(stderr, "[error] %s\n", buffer);
    } else if (level == LOG_LEVEL_WARN) {
        fprintf(stderr, "[warn] %s\n", buffer);
    } else if (level <= LOG_LEVEL_DEBUG) {
        // 调试级别带上位置信息，便于回溯到具体阶段代码。
        fprintf(stdout, "[debug][%s:%d %s] %s\n", file_name, line_num, function_name, buffer);
    } else {
        // INFO 只输出正文，保持用户可读。
        fprintf(stdout, "%s\n", buffer);
    }
    // 这里不主动 flush stdout，沿用 C 运行时缓冲策略；stderr 本身无缓冲。
}
