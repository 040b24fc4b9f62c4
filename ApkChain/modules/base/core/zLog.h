/*
 * [APKCHAIN_FLOW_NOTE] 文件级流程注释
 * - 日志宏与接口声明。
 * - 链路位置：全局基础设施。
 * - 输入：模块日志请求。
 * - 输出：统一日志格式（INFO 以下走 stdout，WARN/ERROR 走 stderr）。
 */
#ifndef APKCHAIN_ZLOG_H
#define APKCHAIN_ZLOG_H

#include <cstdarg>  // `va_list` / 可变参数接口需要。

// 日志总开关：
// 1 = 启用日志宏；
// 0 = 关闭日志宏。
#define ZLOG_ENABLE_LOGGING 1

// 日志级别定义（数值越大表示等级越高、越重要）。
// 与 Android Log 优先级顺序一致，方便和 adb logcat 输出比对。
#define LOG_LEVEL_VERBOSE 2
#define LOG_LEVEL_DEBUG   3
#define LOG_LEVEL_INFO    4
#define LOG_LEVEL_WARN    5
#define LOG_LEVEL_ERROR   6

// 运行时阈值档位：
// 默认      INFO，阶段轨迹写 stdout；
// --verbose DEBUG，额外带出外部命令行与源码位置；
// --json    JSON_OUTPUT，stdout 只留给结果对象，告警与错误照常写 stderr。
#define LOG_LEVEL_JSON_OUTPUT LOG_LEVEL_WARN

// 编译期默认阈值，运行时可通过 `zLogSetLevel` 覆盖。
#ifndef CURRENT_LOG_LEVEL
#define CURRENT_LOG_LEVEL LOG_LEVEL_INFO
#endif

// 默认日志标签（跨模块可通过重新定义 `LOG_TAG` 覆盖）。
#ifndef LOG_TAG
#define LOG_TAG "ApkChain"
#endif

// 兼容没有 __FILE_NAME__ 的编译环境。
#ifndef __FILE_NAME__
#define __FILE_NAME__ __FILE__
#endif

#if ZLOG_ENABLE_LOGGING
    // 详细跟踪日志（最高噪音等级）。
    #define LOGV(...) zLogPrint(LOG_LEVEL_VERBOSE, LOG_TAG, __FILE_NAME__, __FUNCTION__, __LINE__, ##__VA_ARGS__)
    // 调试日志：外部命令行、阶段细节。
    #define LOGD(...) zLogPrint(LOG_LEVEL_DEBUG, LOG_TAG, __FILE_NAME__, __FUNCTION__,__LINE__, ##__VA_ARGS__)
    // 信息日志：阶段开始/结束等业务轨迹。
    #define LOGI(...) zLogPrint(LOG_LEVEL_INFO, LOG_TAG, __FILE_NAME__, __FUNCTION__,__LINE__, ##__VA_ARGS__)
    // 警告日志：可选阶段失败、可降级路径。
    #define LOGW(...) zLogPrint(LOG_LEVEL_WARN, LOG_TAG, __FILE_NAME__, __FUNCTION__,__LINE__, ##__VA_ARGS__)
    // 错误日志：明确失败路径。
    #define LOGE(...) zLogPrint(LOG_LEVEL_ERROR, LOG_TAG, __FILE_NAME__, __FUNCTION__,__LINE__, ##__VA_ARGS__)
#else
    #define LOGV(...)
    #define LOGD(...)
    #define LOGI(...)
    #define LOGW(...)
    #define LOGE(...)
#endif

// 统一日志输出函数。
// 参数语义：
// `level`         日志等级（用于阈值过滤）；
// `tag`           模块标签；
// `fileName`      源文件名（DEBUG 以下级别会带出）；
// `functionName`  函数名（DEBUG 以下级别会带出）；
// `lineNum`       行号（DEBUG 以下级别会带出）；
// `format`        printf 风格格式串。
void zLogPrint(int level, const char* tag, const char* fileName, const char* functionName, int lineNum, const char* format, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 6, 7)))
#endif
    ;

// 设置运行时日志阈值，低于阈值的日志直接丢弃。
void zLogSetLevel(int level);
// 读取当前运行时日志阈值。
int zLogGetLevel();

#endif // APKCHAIN_ZLOG_H
