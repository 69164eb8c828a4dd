// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/blob_upload/config/feature_flags.h"

#if BLOB_UPLOAD_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::blob_upload {

/**
 * @brief Log categories for the upload engine
 */
struct log_category {
    static constexpr std::string_view engine = "blob_upload.engine";
    static constexpr std::string_view chunk = "blob_upload.chunk";
    static constexpr std::string_view epilogue = "blob_upload.epilogue";
    static constexpr std::string_view cleanup = "blob_upload.cleanup";
    static constexpr std::string_view destination = "blob_upload.destination";
    static constexpr std::string_view pacer = "blob_upload.pacer";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name (case-insensitive); unknown names yield nullopt
 */
inline std::optional<log_level> log_level_from_string(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return log_level::trace;
    if (lower == "debug") return log_level::debug;
    if (lower == "info") return log_level::info;
    if (lower == "warn" || lower == "warning") return log_level::warn;
    if (lower == "error") return log_level::error;
    if (lower == "fatal") return log_level::fatal;
    return std::nullopt;
}

/**
 * @brief Configuration for sensitive information masking
 *
 * SAS signatures and account keys are masked by default; local paths are
 * only masked on request.
 */
struct masking_config {
    bool mask_sas_signatures = true;
    bool mask_account_keys = true;
    bool mask_paths = false;
    char mask_char = '*';

    static masking_config all_masked() {
        return {true, true, true, '*'};
    }

    static masking_config none() {
        return {false, false, false, '*'};
    }
};

/**
 * @brief Masks credentials embedded in destination URLs and messages
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config{})
        : config_(config) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string result = input;

        if (config_.mask_sas_signatures) {
            result = mask_query_value(result, "sig");
        }
        if (config_.mask_account_keys) {
            result = mask_query_value(result, "AccountKey");
        }
        if (config_.mask_paths) {
            result = mask_file_paths(result);
        }

        return result;
    }

    /**
     * @brief Mask the directory part of a local path, keeping the filename
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }

        return std::string(last_sep, config_.mask_char) + path.substr(last_sep);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = config;
    }

private:
    // Replaces the value of key=... (terminated by '&', ';' or whitespace)
    [[nodiscard]] auto mask_query_value(const std::string& input,
                                        const std::string& key) const -> std::string {
        std::string result;
        result.reserve(input.size());

        std::size_t pos = 0;
        const std::string needle = key + "=";
        while (pos < input.size()) {
            auto found = input.find(needle, pos);
            if (found == std::string::npos) {
                result.append(input, pos, std::string::npos);
                break;
            }

            bool at_boundary = found == 0 || input[found - 1] == '?' ||
                               input[found - 1] == '&' || input[found - 1] == ';' ||
                               input[found - 1] == ' ';
            auto value_start = found + needle.size();
            result.append(input, pos, value_start - pos);
            if (!at_boundary) {
                pos = value_start;
                continue;
            }

            auto value_end = input.find_first_of("&; \t\n\"", value_start);
            if (value_end == std::string::npos) {
                value_end = input.size();
            }
            if (value_end > value_start) {
                result.append("REDACTED");
            }
            pos = value_end;
        }

        return result;
    }

    [[nodiscard]] auto mask_file_paths(const std::string& input) const -> std::string {
        static const std::regex path_pattern(R"((?:^|\s)((?:\/[a-zA-Z0-9._-]+)+))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        std::size_t last_pos = 0;
        for (; it != end; ++it) {
            auto start = static_cast<std::size_t>(it->position(1));
            result += input.substr(last_pos, start - last_pos);
            result += mask_path(it->str(1));
            last_pos = start + static_cast<std::size_t>(it->length(1));
        }
        result += input.substr(last_pos);

        return result;
    }

    masking_config config_;
};

namespace detail {

inline auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for one transfer
 */
struct transfer_log_context {
    std::string source;
    std::string destination;
    std::optional<uint64_t> source_size;
    std::optional<uint64_t> bytes;
    std::optional<uint32_t> chunk_index;
    std::optional<uint32_t> total_chunks;
    std::optional<int> status_code;
    std::optional<std::string> error_message;
    std::optional<uint64_t> duration_ms;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_int = [&](const char* name, int64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!source.empty()) {
            add_field("source", masker ? masker->mask_path(source) : source);
        }
        if (!destination.empty()) {
            add_field("destination", masker ? masker->mask(destination) : destination);
        }
        if (source_size) add_int("source_size", static_cast<int64_t>(*source_size));
        if (bytes) add_int("bytes", static_cast<int64_t>(*bytes));
        if (chunk_index) add_int("chunk_index", *chunk_index);
        if (total_chunks) add_int("total_chunks", *total_chunks);
        if (status_code) add_int("status_code", *status_code);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }
        if (duration_ms) add_int("duration_ms", static_cast<int64_t>(*duration_ms));

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source_location\":{\"file\":\""
                << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

class blob_upload_logger;

/**
 * @brief Global logger accessor
 */
inline blob_upload_logger& get_logger();

enum class log_output_format {
    text,
    json
};

/**
 * @brief Logger used by every blob_upload component
 */
class blob_upload_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;

    blob_upload_logger() = default;
    ~blob_upload_logger() = default;

    blob_upload_logger(const blob_upload_logger&) = delete;
    blob_upload_logger& operator=(const blob_upload_logger&) = delete;

    /**
     * @brief Initialize the backend
     *
     * Safe to call multiple times. upload_engine calls it on construction,
     * then applies its configured level and output format.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if BLOB_UPLOAD_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if BLOB_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if BLOB_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(config);
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Observe every record that passes the level filter
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            masker = masker_;
        }

        std::string rendered;
        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = iso8601_timestamp();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            rendered = entry.to_json_with_masking(&masker);
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << masker.mask(std::string(message));
            if (context) {
                oss << " " << context->to_json_with_masking(&masker);
            }
            rendered = oss.str();
        }

        write(level, rendered, format);
    }

    void flush() {
#if BLOB_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#else
        std::lock_guard<std::mutex> lock(stderr_mutex());
        std::cerr.flush();
#endif
    }

private:
    void write(log_level level, const std::string& rendered,
               [[maybe_unused]] log_output_format format) {
#if BLOB_UPLOAD_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), rendered);
        }
#else
        std::lock_guard<std::mutex> lock(stderr_mutex());
        if (format == log_output_format::json) {
            std::cerr << rendered << "\n";
        } else {
            std::cerr << local_timestamp() << " [" << log_level_to_string(level) << "] "
                      << rendered << "\n";
        }
#endif
    }

    static auto stderr_mutex() -> std::mutex& {
        static std::mutex mutex;
        return mutex;
    }

#if BLOB_UPLOAD_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    static auto local_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

inline blob_upload_logger& get_logger() {
    static blob_upload_logger instance;
    return instance;
}

#define BU_LOG(level, category, message) \
    kcenon::blob_upload::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__)

#define BU_LOG_CTX(level, category, message, context) \
    kcenon::blob_upload::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__)

#define BU_LOG_TRACE(category, message) \
    BU_LOG(kcenon::blob_upload::log_level::trace, category, message)

#define BU_LOG_DEBUG(category, message) \
    BU_LOG(kcenon::blob_upload::log_level::debug, category, message)

#define BU_LOG_INFO(category, message) \
    BU_LOG(kcenon::blob_upload::log_level::info, category, message)

#define BU_LOG_WARN(category, message) \
    BU_LOG(kcenon::blob_upload::log_level::warn, category, message)

#define BU_LOG_ERROR(category, message) \
    BU_LOG(kcenon::blob_upload::log_level::error, category, message)

#define BU_LOG_FATAL(category, message) \
    BU_LOG(kcenon::blob_upload::log_level::fatal, category, message)

#define BU_LOG_DEBUG_CTX(category, message, ctx) \
    BU_LOG_CTX(kcenon::blob_upload::log_level::debug, category, message, ctx)

#define BU_LOG_INFO_CTX(category, message, ctx) \
    BU_LOG_CTX(kcenon::blob_upload::log_level::info, category, message, ctx)

#define BU_LOG_WARN_CTX(category, message, ctx) \
    BU_LOG_CTX(kcenon::blob_upload::log_level::warn, category, message, ctx)

#define BU_LOG_ERROR_CTX(category, message, ctx) \
    BU_LOG_CTX(kcenon::blob_upload::log_level::error, category, message, ctx)

#define BU_LOG_FATAL_CTX(category, message, ctx) \
    BU_LOG_CTX(kcenon::blob_upload::log_level::fatal, category, message, ctx)

}  // namespace kcenon::blob_upload
