// logger.h - spdlog setup for the gateway
#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace chatgw::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// Log directory: CHATGW_LOG_DIR, else ~/.chatgw/logs.
std::string get_log_dir();

// Today's log file path (chatgw.jsonl.YYYY-MM-DD).
std::string get_log_file_path();

// CHATGW_LOG_RETENTION_DAYS, default 7.
int get_retention_days();

// Remove chatgw.jsonl.* files dated before now - retention_days.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Install the default "chatgw" logger. additional_sinks replaces the file
// sink when given (tests inject an ostream sink this way).
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// stdout (human readable) + daily JSONL file, configured from
// CHATGW_LOG_LEVEL, CHATGW_LOG_DIR and CHATGW_LOG_RETENTION_DAYS.
void init_from_env();

}  // namespace chatgw::logger
