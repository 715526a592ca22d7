#ifndef SUBAGENT_SDK_LOG_H
#define SUBAGENT_SDK_LOG_H

#include <spdlog/common.h>

#include <filesystem>
#include <memory>
#include <string>

namespace spdlog {
class logger;
}

namespace subagent {

/**
 * 初始化日志系统
 *
 * 日志轮转策略（按启动次数轮转）：
 * - 每次启动时，上次的 <name>.log 重命名为 <name>.0.log
 * - 历史日志依次向后移动：<name>.0.log -> <name>.1.log -> ... -> <name>.{max_files-1}.log
 * - 最旧的日志被删除，新的 <name>.log 从空文件开始
 *
 * @param log_path 日志文件路径（可选，默认 ~/.config/subagent-sdk/log/subagent_sdk.log）
 * @param max_files 保留的历史日志文件数量，默认 10 个
 * @param level 日志级别，默认 debug
 */
void init_log(const std::string& log_path = "", size_t max_files = 10, const std::string& level = "debug");

/**
 * 日志级别字符串（trace/debug/info/warn/err/critical/off）转换为 spdlog 级别，未知值按 info 处理
 */
spdlog::level::level_enum parse_log_level(const std::string& level);

/**
 * 启动时轮转 log_file 及其历史文件
 */
void rotate_logs_on_startup(const std::filesystem::path& log_file, size_t max_files);

/**
 * 获取默认 logger
 */
std::shared_ptr<spdlog::logger> get_logger();

}  // namespace subagent

#endif  // SUBAGENT_SDK_LOG_H
