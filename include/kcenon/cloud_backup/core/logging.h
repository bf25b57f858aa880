// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

#include "kcenon/cloud_backup/config/feature_flags.h"

#if CLOUD_BACKUP_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::cloud_backup {

/**
 * @brief Log categories, one per component of a backup job
 */
struct log_category {
    static constexpr std::string_view source = "cloud_backup.source";
    static constexpr std::string_view cipher = "cloud_backup.cipher";
    static constexpr std::string_view upload = "cloud_backup.upload";
    static constexpr std::string_view pipeline = "cloud_backup.pipeline";
    static constexpr std::string_view rate_limit = "cloud_backup.rate_limit";
    static constexpr std::string_view store = "cloud_backup.store";
    static constexpr std::string_view inventory = "cloud_backup.inventory";
    static constexpr std::string_view restore = "cloud_backup.restore";
    static constexpr std::string_view retention = "cloud_backup.retention";
    static constexpr std::string_view cli = "cloud_backup.cli";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

namespace detail {

inline constexpr std::array<std::string_view, 6> level_names = {
    "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};

}  // namespace detail

inline std::string_view log_level_to_string(log_level level) {
    auto index = static_cast<std::size_t>(level);
    return index < detail::level_names.size() ? detail::level_names[index] : "UNKNOWN";
}

/**
 * @brief Parse a --log-level value, case insensitive; "warning" is accepted
 */
inline std::optional<log_level> log_level_from_string(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "WARNING") {
        return log_level::warn;
    }
    for (std::size_t i = 0; i < detail::level_names.size(); ++i) {
        if (detail::level_names[i] == upper) {
            return static_cast<log_level>(i);
        }
    }
    return std::nullopt;
}

/**
 * @brief What secret_masker scrubs
 *
 * Signed URLs and authorization headers are masked unless explicitly
 * disabled. Paths stay readable by default since operators need them.
 */
struct masking_config {
    bool mask_signatures = true;
    bool mask_paths = false;
    char mask_char = '*';

    static masking_config all_masked() { return {true, true, '*'}; }
    static masking_config none() { return {false, false, '*'}; }
};

/**
 * @brief Scrubs credentials and signatures from log text
 */
class secret_masker {
public:
    explicit secret_masker(masking_config config = masking_config{})
        : config_(config) {}

    [[nodiscard]] auto mask(std::string text) const -> std::string {
        if (config_.mask_signatures) {
            // Query values of signed URLs, then "Signature=" style header fields
            static const std::regex query_pattern(
                R"((X-Amz-(?:Signature|Credential|Security-Token)=)([^&\s"']+))",
                std::regex::icase);
            static const std::regex header_pattern(
                R"(((?:Signature|Credential)=)([^,\s"']+))");
            static const std::regex auth_pattern(
                R"((Authorization:\s*)([^\r\n]+))", std::regex::icase);

            const std::string hidden = "$1" + std::string(4, config_.mask_char);
            text = std::regex_replace(text, query_pattern, hidden);
            text = std::regex_replace(text, header_pattern, hidden);
            text = std::regex_replace(text, auth_pattern, hidden);
        }
        if (config_.mask_paths) {
            static const std::regex dir_pattern(R"((?:\/[a-zA-Z0-9._-]+)+\/)");
            text = std::regex_replace(text, dir_pattern, std::string(3, config_.mask_char) + "/");
        }
        return text;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& { return config_; }
    void set_config(masking_config config) { config_ = config; }

private:
    masking_config config_;
};

namespace detail {

/// Appends "key":value members to a flat JSON object
class json_members {
public:
    explicit json_members(std::string& out) : out_(out) {}

    void text(std::string_view key, std::string_view value) {
        open(key);
        out_ += '"';
        for (char c : value) {
            escape(c);
        }
        out_ += '"';
    }

    void number(std::string_view key, uint64_t value) {
        open(key);
        out_ += std::to_string(value);
    }

    void fixed(std::string_view key, double value) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.2f", value);
        open(key);
        out_ += buf;
    }

    /// Splices the members of an already rendered object
    void merge(std::string_view object) {
        if (object.size() <= 2) {
            return;
        }
        if (!empty_) {
            out_ += ',';
        }
        out_.append(object.substr(1, object.size() - 2));
        empty_ = false;
    }

private:
    void open(std::string_view key) {
        if (!empty_) {
            out_ += ',';
        }
        empty_ = false;
        out_ += '"';
        out_.append(key);
        out_ += "\":";
    }

    void escape(char c) {
        switch (c) {
            case '"': out_ += "\\\""; return;
            case '\\': out_ += "\\\\"; return;
            case '\n': out_ += "\\n"; return;
            case '\r': out_ += "\\r"; return;
            case '\t': out_ += "\\t"; return;
            default: break;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
            out_ += buf;
        } else {
            out_ += c;
        }
    }

    std::string& out_;
    bool empty_ = true;
};

/// "2024-05-01T10:00:00.123Z" in UTC, or "2024-05-01 12:00:00.123" local
inline auto timestamp_now(bool utc) -> std::string {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()).count() % 1000;

    std::tm parts{};
    if (utc) {
        gmtime_r(&seconds, &parts);
    } else {
        localtime_r(&seconds, &parts);
    }

    char date[32];
    std::strftime(date, sizeof(date), utc ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S", &parts);
    char full[48];
    std::snprintf(full, sizeof(full), "%s.%03d%s", date, static_cast<int>(millis),
                  utc ? "Z" : "");
    return full;
}

}  // namespace detail

/**
 * @brief Where a log line sits in a backup job
 *
 * Only the fields that are set appear in the rendered JSON.
 */
struct chunk_log_context {
    std::string host;
    std::optional<uint64_t> backup_number;
    std::optional<uint32_t> sequence;
    std::optional<uint32_t> total_chunks;
    std::optional<std::string> object_key;
    std::optional<uint64_t> bytes;
    std::optional<uint32_t> attempt;
    std::optional<double> rate_mbps;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string { return to_json_with_masking(nullptr); }

    [[nodiscard]] auto to_json_with_masking(const secret_masker* masker) const -> std::string {
        std::string out = "{";
        detail::json_members json(out);
        if (!host.empty()) json.text("host", host);
        if (backup_number) json.number("backup", *backup_number);
        if (sequence) json.number("sequence", *sequence);
        if (total_chunks) json.number("total_chunks", *total_chunks);
        if (object_key) json.text("key", *object_key);
        if (bytes) json.number("bytes", *bytes);
        if (attempt) json.number("attempt", *attempt);
        if (rate_mbps) json.fixed("rate_mbps", *rate_mbps);
        if (duration_ms) json.number("duration_ms", *duration_ms);
        if (error_message) {
            json.text("error_message", masker ? masker->mask(*error_message) : *error_message);
        }
        out += '}';
        return out;
    }
};

enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for the backup shipper
 *
 * Messages are masked once, handed to the optional callback, then rendered
 * as text or JSON. With logger_system built in and initialize() called, the
 * rendered line goes to its async console writer; otherwise to stderr.
 */
class backup_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const chunk_log_context*)>;

    backup_logger() = default;

    backup_logger(const backup_logger&) = delete;
    backup_logger& operator=(const backup_logger&) = delete;

    /// Idempotent
    void initialize() {
        if (initialized_.exchange(true)) {
            return;
        }
#if CLOUD_BACKUP_USE_LOGGER_SYSTEM
        auto built = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();
        if (built) {
            backend_ = std::move(built.value());
        }
#endif
    }

    void shutdown() {
#if CLOUD_BACKUP_USE_LOGGER_SYSTEM
        if (backend_) {
            backend_->flush();
            backend_->stop();
            backend_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if CLOUD_BACKUP_USE_LOGGER_SYSTEM
        if (backend_) {
            backend_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard lock(mutex_);
        format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard lock(mutex_);
        return format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard lock(mutex_);
        masker_.set_config(config);
    }

    /// Receives every enabled message after masking
    void set_callback(log_callback callback) {
        std::lock_guard lock(mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const chunk_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) {
            return;
        }

        log_output_format format;
        secret_masker masker;
        log_callback callback;
        {
            std::lock_guard lock(mutex_);
            format = format_;
            masker = masker_;
            callback = callback_;
        }

        const std::string masked = masker.mask(std::string(message));
        if (callback) {
            callback(level, category, masked, context);
        }

        std::string rendered;
        if (format == log_output_format::json) {
            rendered = render_json(level, category, masked, context, masker, file, line, function);
        } else {
            rendered = "[" + std::string(category) + "] " + masked;
            if (context) {
                rendered += " " + context->to_json_with_masking(&masker);
            }
        }

#if CLOUD_BACKUP_USE_LOGGER_SYSTEM
        if (backend_) {
            if (file && line > 0 && function) {
                backend_->log(to_logger_level(level), rendered, file, line, function);
            } else {
                backend_->log(to_logger_level(level), rendered);
            }
            return;
        }
#endif
        if (format == log_output_format::text) {
            rendered = detail::timestamp_now(false) + " [" +
                       std::string(log_level_to_string(level)) + "] " + rendered;
        }
        write_stderr(rendered);
    }

    void flush() {
#if CLOUD_BACKUP_USE_LOGGER_SYSTEM
        if (backend_) {
            backend_->flush();
        }
#endif
        std::cerr.flush();
    }

private:
    static auto render_json(log_level level, std::string_view category,
                            const std::string& message, const chunk_log_context* context,
                            const secret_masker& masker, const char* file, int line,
                            const char* function) -> std::string {
        std::string out = "{";
        detail::json_members json(out);
        json.text("timestamp", detail::timestamp_now(true));
        json.text("level", log_level_to_string(level));
        json.text("category", category);
        json.text("message", message);
        if (context) {
            json.merge(context->to_json_with_masking(&masker));
        }
        if (file) {
            std::string source = "{";
            detail::json_members where(source);
            where.text("file", file);
            if (line > 0) where.number("line", static_cast<uint64_t>(line));
            if (function) where.text("function", function);
            source += '}';
            out += ",\"source\":" + source;
        }
        out += '}';
        return out;
    }

    static void write_stderr(const std::string& line) {
        static std::mutex stderr_mutex;
        std::lock_guard lock(stderr_mutex);
        std::cerr << line << "\n";
    }

#if CLOUD_BACKUP_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
        }
        return kcenon::logger::log_level::info;
    }

    std::unique_ptr<kcenon::logger::logger> backend_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};

    mutable std::mutex mutex_;
    log_output_format format_{log_output_format::text};
    secret_masker masker_;
    log_callback callback_;
};

inline backup_logger& get_logger() {
    static backup_logger instance;
    return instance;
}

#define CB_LOG(level, category, message) \
    kcenon::cloud_backup::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define CB_LOG_CTX(level, category, message, context) \
    kcenon::cloud_backup::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define CB_LOG_TRACE(category, message) \
    CB_LOG(kcenon::cloud_backup::log_level::trace, category, message)
#define CB_LOG_DEBUG(category, message) \
    CB_LOG(kcenon::cloud_backup::log_level::debug, category, message)
#define CB_LOG_INFO(category, message) \
    CB_LOG(kcenon::cloud_backup::log_level::info, category, message)
#define CB_LOG_WARN(category, message) \
    CB_LOG(kcenon::cloud_backup::log_level::warn, category, message)
#define CB_LOG_ERROR(category, message) \
    CB_LOG(kcenon::cloud_backup::log_level::error, category, message)
#define CB_LOG_FATAL(category, message) \
    CB_LOG(kcenon::cloud_backup::log_level::fatal, category, message)

#define CB_LOG_DEBUG_CTX(category, message, ctx) \
    CB_LOG_CTX(kcenon::cloud_backup::log_level::debug, category, message, ctx)
#define CB_LOG_INFO_CTX(category, message, ctx) \
    CB_LOG_CTX(kcenon::cloud_backup::log_level::info, category, message, ctx)
#define CB_LOG_WARN_CTX(category, message, ctx) \
    CB_LOG_CTX(kcenon::cloud_backup::log_level::warn, category, message, ctx)
#define CB_LOG_ERROR_CTX(category, message, ctx) \
    CB_LOG_CTX(kcenon::cloud_backup::log_level::error, category, message, ctx)

} // namespace kcenon::cloud_backup
