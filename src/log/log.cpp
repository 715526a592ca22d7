#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <iostream>

#include "core/config.hpp"

namespace subagent {

namespace fs = std::filesystem;

namespace {

fs::path numbered(const fs::path& log_file, size_t index) {
  // subagent_sdk.log -> subagent_sdk.3.log
  return log_file.parent_path() / (log_file.stem().string() + "." + std::to_string(index) + log_file.extension().string());
}

}  // namespace

// 策略：<name>.log -> <name>.0.log -> ... -> <name>.{max_files-1}.log（最旧的被删除）
void rotate_logs_on_startup(const fs::path& log_file, size_t max_files) {
  std::error_code ec;

  // 当前日志文件不存在，或不保留历史，无需轮转
  if (!fs::exists(log_file) || max_files == 0) {
    return;
  }

  fs::path oldest = numbered(log_file, max_files - 1);
  if (fs::exists(oldest)) {
    fs::remove(oldest, ec);
  }

  // 从后往前依次重命名
  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    fs::path old_name = numbered(log_file, static_cast<size_t>(i));
    if (fs::exists(old_name)) {
      fs::rename(old_name, numbered(log_file, static_cast<size_t>(i) + 1), ec);
    }
  }

  fs::rename(log_file, numbered(log_file, 0), ec);
  if (ec) {
    std::cerr << "Failed to rotate log " << log_file << ": " << ec.message() << "\n";
  }
}

spdlog::level::level_enum parse_log_level(const std::string& level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn") return spdlog::level::warn;
  if (level == "err" || level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

void init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  try {
    fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / "subagent_sdk.log" : fs::path(log_path);

    // 确保日志目录存在
    std::error_code ec;
    if (actual_path.has_parent_path()) {
      fs::create_directories(actual_path.parent_path(), ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
        return;
      }
    }

    rotate_logs_on_startup(actual_path, max_files);

    // 每次启动都是新的干净文件
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);

    // 重复初始化时替换已注册的 logger
    spdlog::drop("subagent_sdk");
    auto logger = std::make_shared<spdlog::logger>("subagent_sdk", file_sink);

    logger->set_level(parse_log_level(level));

    // [时间] [级别] [线程 ID] 消息
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    // 后台线程较多，每条日志立即刷新，避免崩溃时丢失
    logger->flush_on(spdlog::level::trace);

    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== subagent_sdk started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace subagent
