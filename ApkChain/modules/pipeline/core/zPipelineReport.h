// 防止头文件重复包含。
#pragma once

// 引入字符串类型。
#include <string>

// jsoncpp 文档对象。
#include <json/value.h>

// 引入框架检测报告。
#include "zFrameworkDetect.h"
// 引入统一错误对象。
#include "zPipelineError.h"
// 引入结果类型。
#include "zPipelineTypes.h"

// 进入 pipeline 命名空间。
namespace apkc {

// 各结果对象转 JSON（--json 输出与测试共用）。
Json::Value toJson(const BuildResult& result);
Json::Value toJson(const DecompileResult& result);
Json::Value toJson(const MergeResult& result);
Json::Value toJson(const DumpResult& result);
Json::Value toJson(const InstrumentResult& result);
Json::Value toJson(const FrameworkReport& report);
Json::Value toJson(const PipelineError& error);

// 缩进格式序列化。
std::string renderJson(const Json::Value& value);

// 人类可读摘要（直接打印到标准输出）。
void printSummary(const BuildResult& result);
void printSummary(const DecompileResult& result);
void printSummary(const MergeResult& result);
void printSummary(const DumpResult& result);
void printSummary(const InstrumentResult& result);
void printSummary(const FrameworkReport& report);

// 结束命名空间。
}  // namespace apkc
