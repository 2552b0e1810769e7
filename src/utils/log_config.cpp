#include "prologixlib/utils/log_config.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <sstream>
#include <system_error>

#include "prologixlib/utils/env.hpp"

namespace prologixlib::utils {

namespace {

const char* level_label(LogLevel l) {
    switch (l) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Critical: return "CRIT";
        default: return "OFF";
    }
}

} // namespace

// UnifiedLogFormatter
UnifiedLogFormatter::UnifiedLogFormatter() : config_{} {}
UnifiedLogFormatter::UnifiedLogFormatter(const FormatConfig& config) : config_(config) {}

std::string UnifiedLogFormatter::format_timestamp(const std::chrono::system_clock::time_point& tp) const {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    char buf[64];
    size_t n = std::strftime(buf, sizeof(buf), config_.timestamp_format.c_str(), &tm);
    return std::string(buf, n);
}

std::string UnifiedLogFormatter::format(const LogEntry& e) const {
    std::lock_guard<std::mutex> lk(format_mutex_);
    std::ostringstream ss;
    ss << format_timestamp(e.timestamp) << config_.field_separator << level_label(e.level)
       << config_.field_separator << e.logger_name << config_.field_separator << e.message;
    if (config_.include_file_info && !e.file.empty()) {
        ss << config_.field_separator << std::filesystem::path(e.file).filename().string() << ':' << e.line;
    }
    return ss.str();
}

void UnifiedLogFormatter::update_config(const FormatConfig& cfg) {
    std::lock_guard<std::mutex> lk(format_mutex_);
    config_ = cfg;
}

// ConsoleLogSink
ConsoleLogSink::ConsoleLogSink(bool use_colors) : out_(&std::cerr), use_colors_(use_colors) {}
ConsoleLogSink::ConsoleLogSink(std::ostream& out, bool use_colors) : out_(&out), use_colors_(use_colors) {}

std::string ConsoleLogSink::colorize(LogLevel level, const std::string& text) const {
    if (!use_colors_) return text;
    const char* c = "\033[0m";
    switch (level) {
        case LogLevel::Trace: c = "\033[37m"; break;
        case LogLevel::Debug: c = "\033[36m"; break;
        case LogLevel::Info: c = "\033[32m"; break;
        case LogLevel::Warning: c = "\033[33m"; break;
        case LogLevel::Error: c = "\033[31m"; break;
        case LogLevel::Critical: c = "\033[35m"; break;
        default: break;
    }
    return std::string(c) + text + "\033[0m";
}

void ConsoleLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lk(console_mutex_);
    (*out_) << colorize(entry.level, formatter_.format(entry)) << '\n';
}

void ConsoleLogSink::flush() {
    std::lock_guard<std::mutex> lk(console_mutex_);
    out_->flush();
}

// FileLogSink
FileLogSink::FileLogSink(const std::filesystem::path& file_path, size_t max_file_size, size_t max_files)
    : file_path_(file_path), max_file_size_(max_file_size), max_files_(max_files) {
    std::error_code ec;
    if (std::filesystem::exists(file_path_, ec)) {
        current_file_size_ = static_cast<size_t>(std::filesystem::file_size(file_path_, ec));
        if (ec) current_file_size_ = 0;
    }
    file_stream_ = std::make_unique<std::ofstream>(file_path_, std::ios::app);
}

FileLogSink::~FileLogSink() { close(); }

bool FileLogSink::is_open() const {
    std::lock_guard<std::mutex> lk(file_mutex_);
    return file_stream_ && file_stream_->is_open();
}

void FileLogSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lk(file_mutex_);
    if (!file_stream_ || !file_stream_->is_open()) return;
    std::string line = formatter_.format(entry);
    (*file_stream_) << line << '\n';
    current_file_size_ += line.size() + 1;
    if (max_file_size_ && current_file_size_ > max_file_size_) rotate_file();
}

void FileLogSink::flush() {
    std::lock_guard<std::mutex> lk(file_mutex_);
    if (file_stream_) file_stream_->flush();
}

void FileLogSink::close() {
    std::lock_guard<std::mutex> lk(file_mutex_);
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
        file_stream_->close();
    }
}

void FileLogSink::rotate_file() {
    if (!file_stream_) return;
    file_stream_->close();
    std::error_code ec;
    // app.log.N-1 -> app.log.N ... app.log -> app.log.1
    for (size_t i = max_files_; i-- > 1;) {
        auto src = get_rotated_file_path(i - 1);
        auto dst = get_rotated_file_path(i);
        std::filesystem::remove(dst, ec);
        if (std::filesystem::exists(src, ec)) std::filesystem::rename(src, dst, ec);
    }
    if (max_files_ > 0) {
        std::filesystem::rename(file_path_, get_rotated_file_path(0), ec);
    }
    file_stream_ = std::make_unique<std::ofstream>(file_path_, std::ios::trunc);
    current_file_size_ = 0;
}

std::filesystem::path FileLogSink::get_rotated_file_path(size_t index) const {
    return std::filesystem::path(file_path_.string() + "." + std::to_string(index + 1));
}

// Logger
Logger::Logger(const std::string& name) : name_(name), min_level_(LogLevel::Info) {}

void Logger::add_sink(std::shared_ptr<LogSink> s) {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    if (std::find(sinks_.begin(), sinks_.end(), s) == sinks_.end()) sinks_.push_back(std::move(s));
}

void Logger::remove_sink(const std::shared_ptr<LogSink>& s) {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), s), sinks_.end());
}

void Logger::clear_sinks() { std::lock_guard<std::mutex> lk(sinks_mutex_); sinks_.clear(); }
void Logger::set_level(LogLevel l) { min_level_ = l; }
LogLevel Logger::get_level() const { return min_level_; }

bool Logger::should_log(LogLevel level) const {
    if (level == LogLevel::Off || level < min_level_.load()) return false;
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    return !sinks_.empty();
}

void Logger::write_to_sinks(const LogEntry& e) {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    for (auto& s : sinks_) {
        if (e.level >= s->get_min_level()) s->write(e);
    }
}

void Logger::log(LogLevel level, const std::string& message, const std::string& file, int line, const std::string& function) {
    if (level == LogLevel::Off || level < min_level_.load()) return;
    LogEntry e{level, name_, message, std::chrono::system_clock::now(), file, line, function};
    write_to_sinks(e);
}

void Logger::trace(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Trace, m, f, l, fn); }
void Logger::debug(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Debug, m, f, l, fn); }
void Logger::info(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Info, m, f, l, fn); }
void Logger::warning(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Warning, m, f, l, fn); }
void Logger::error(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Error, m, f, l, fn); }
void Logger::critical(const std::string& m, const std::string& f, int l, const std::string& fn) { log(LogLevel::Critical, m, f, l, fn); }

void Logger::flush() {
    std::lock_guard<std::mutex> lk(sinks_mutex_);
    for (auto& s : sinks_) s->flush();
}

std::string Logger::get_name() const { return name_; }

// LogManager
LogManager& LogManager::instance() { static LogManager inst; return inst; }
LogManager::~LogManager() { shutdown(); }

std::shared_ptr<Logger> LogManager::get_logger(const std::string& name) {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    auto it = loggers_.find(name);
    if (it != loggers_.end()) return it->second;
    auto l = std::make_shared<Logger>(name);
    l->set_level(global_level_);
    for (auto& s : global_sinks_) l->add_sink(s);
    loggers_[name] = l;
    return l;
}

void LogManager::remove_logger(const std::string& name) { std::lock_guard<std::mutex> lk(loggers_mutex_); loggers_.erase(name); }
void LogManager::clear_loggers() { std::lock_guard<std::mutex> lk(loggers_mutex_); loggers_.clear(); }

void LogManager::set_global_level(LogLevel l) {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    global_level_ = l;
    for (auto& [n, logger] : loggers_) logger->set_level(l);
}

LogLevel LogManager::get_global_level() const {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    return global_level_;
}

void LogManager::add_global_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    for (auto& [n, logger] : loggers_) logger->add_sink(sink);
    global_sinks_.push_back(std::move(sink));
}

void LogManager::clear_global_sinks() {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    for (auto& s : global_sinks_) {
        for (auto& [n, logger] : loggers_) logger->remove_sink(s);
    }
    global_sinks_.clear();
}

void LogManager::flush_all() {
    std::lock_guard<std::mutex> lk(loggers_mutex_);
    for (auto& [n, l] : loggers_) l->flush();
}

void LogManager::shutdown() { flush_all(); }

// log_utils
LogLevel log_utils::parse_log_level(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "trace") return LogLevel::Trace;
    if (v == "debug") return LogLevel::Debug;
    if (v == "info") return LogLevel::Info;
    if (v == "warn" || v == "warning") return LogLevel::Warning;
    if (v == "error") return LogLevel::Error;
    if (v == "critical" || v == "fatal") return LogLevel::Critical;
    if (v == "off") return LogLevel::Off;
    return LogLevel::Info;
}

std::string log_utils::log_level_to_string(LogLevel l) {
    switch (l) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Critical: return "critical";
        default: return "off";
    }
}

LogLevel log_utils::log_level_from_env() {
    if (auto v = getenv_os("PROLOGIX_LOG_LEVEL"); v && !v->empty()) return parse_log_level(*v);
    return LogLevel::Warning;
}

void log_utils::setup_basic_logging(LogLevel level, bool log_to_console, const std::filesystem::path& log_file) {
    auto& mgr = LogManager::instance();
    mgr.set_global_level(level);
    if (log_to_console) {
        mgr.add_global_sink(std::make_shared<ConsoleLogSink>());
    }
    if (!log_file.empty()) {
        mgr.add_global_sink(std::make_shared<FileLogSink>(log_file));
    }
}

} // namespace prologixlib::utils
