// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 이스케이프
// ---------------------------------------------------------------------------
std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (unsigned char ch : str) {
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}

// ---------------------------------------------------------------------------
// Helper: 문자열 배열 → JSON 배열
// ---------------------------------------------------------------------------
std::string json_string_array(const std::vector<std::string>& items) {
    std::string out = "[";
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += '"';
        out += escape_json_string(items[i]);
        out += '"';
    }
    out += ']';
    return out;
}

}  // namespace

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
        default:               return spdlog::level::info;
    }
}

LogLevel parse_log_level(std::string_view level_str) {
    if (level_str == "debug") { return LogLevel::kDebug; }
    if (level_str == "warn")  { return LogLevel::kWarn;  }
    if (level_str == "error") { return LogLevel::kError; }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        if (!log_path_.empty()) {
            if (log_path_.has_parent_path()) {
                std::filesystem::create_directories(log_path_.parent_path());
            }

            // Rotating file sink (100MB, 3개 파일 유지)
            const std::size_t max_file_size = 100 * 1024 * 1024;
            const std::size_t max_files     = 3;
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path_.string(), max_file_size, max_files));
        }

        logger_ = std::make_shared<spdlog::logger>("promptgate", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 구조화 로그는 각 메서드에서 JSON 으로 생성하므로 타임스탬프만 붙인다
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

bool StructuredLogger::enabled(LogLevel level) const noexcept {
    return logger_ && static_cast<int>(min_level_) <= static_cast<int>(level);
}

// ---------------------------------------------------------------------------
// log_request: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_request(const RequestLog& entry) {
    if (!enabled(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"prompt_forwarded","request_id":)" << entry.request_id
         << R"(,"client_ip":")" << escape_json_string(entry.client_ip)
         << R"(","prompt":")" << escape_json_string(entry.prompt)
         << R"(","response_bytes":)" << entry.response_bytes
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << R"(})";

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_block: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_block(const BlockLog& entry) {
    if (!enabled(LogLevel::kWarn)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"prompt_blocked","request_id":)" << entry.request_id
         << R"(,"client_ip":")" << escape_json_string(entry.client_ip)
         << R"(","prompt":")" << escape_json_string(entry.prompt)
         << R"(","direct_matches":)" << json_string_array(entry.direct_matches)
         << R"(,"indirect_matches":)" << json_string_array(entry.indirect_matches)
         << R"(,"reason":")" << escape_json_string(entry.reason)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->warn(json.str());
}

// ---------------------------------------------------------------------------
// log_backend_failure: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_backend_failure(const BackendFailureLog& entry) {
    if (!enabled(LogLevel::kError)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"backend_failure","request_id":)" << entry.request_id
         << R"(,"client_ip":")" << escape_json_string(entry.client_ip)
         << R"(","prompt":")" << escape_json_string(entry.prompt)
         << R"(","failure":")" << escape_json_string(entry.failure)
         << R"(","status":)" << entry.status
         << R"(,"detail":")" << escape_json_string(entry.detail)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << R"(})";

    logger_->error(json.str());
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
