#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <micrograd/utils/logger/logger.hpp>
#include <system_error>

namespace micrograd::log {
namespace {
constexpr std::array<std::string_view, 6> severity_strings = {
    "TRACE", "DEBUG", "INFO", "WARNING", "ERROR", "FATAL"};

std::string_view file_name(const char* path) {
    std::string_view view(path);
    auto pos = view.find_last_of("/\\");
    return pos == std::string_view::npos ? view : view.substr(pos + 1);
}
}  // namespace

std::string_view to_string(Severity severity) noexcept {
    return severity_strings[static_cast<size_t>(severity)];
}

core::error::Result<Severity> parse_severity(std::string_view name) {
    std::string upper(name);
    std::ranges::transform(upper, upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    if (upper == "WARN")
        return Severity::Warning;

    for (size_t i = 0; i < severity_strings.size(); ++i) {
        if (severity_strings[i] == upper)
            return static_cast<Severity>(i);
    }

    return tl::unexpected(std::shared_ptr<core::error::Error>(
        new core::error::InvalidArgument("Unknown log severity '{}'", name)));
}

std::string format_entry(const LogEntry& entry) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      entry.timestamp.time_since_epoch())
                      .count() %
                  1000;
    auto time = std::chrono::system_clock::to_time_t(entry.timestamp);

    auto line = fmt::format(
        "[{:%Y-%m-%d %H:%M:%S}.{:03}] [{}] [{:x}] {} ({}:{})",
        fmt::localtime(time), millis, to_string(entry.severity),
        std::hash<std::thread::id>{}(entry.thread_id), entry.message,
        file_name(entry.location.file_name()), entry.location.line());

    if (entry.error) {
        line += fmt::format(" [{}:{}] {}", entry.error->category().name(),
                            entry.error->value(), entry.error->message());
    }

    return line;
}

void ConsoleLogSink::write(const LogEntry& entry) {
    auto line = format_entry(entry);

    std::lock_guard lock(m_mutex);
    std::fputs(line.c_str(), stderr);
    std::fputc('\n', stderr);
}

void ConsoleLogSink::flush() {
    std::lock_guard lock(m_mutex);
    std::fflush(stderr);
}

FileLogSink::FileLogSink(Config config) : m_config(std::move(config)) {
    m_file.open(m_config.path, std::ios::app);
    MICROGRAD_THROW_IF(!m_file.is_open(), RuntimeError,
                       core::error::make_error_code(
                           core::error::RuntimeCategory::Code::IoError),
                       "Unable to open log file '{}'", m_config.path.string());

    std::error_code ec;
    auto size = std::filesystem::file_size(m_config.path, ec);
    m_current_size = ec ? 0 : static_cast<size_t>(size);
}

void FileLogSink::write(const LogEntry& entry) {
    auto line = format_entry(entry);
    line.push_back('\n');

    std::lock_guard lock(m_mutex);
    m_file.write(line.data(), static_cast<std::streamsize>(line.size()));
    m_current_size += line.size();

    if (m_config.auto_flush)
        m_file.flush();

    rotate_if_needed();
}

void FileLogSink::flush() {
    std::lock_guard lock(m_mutex);
    m_file.flush();
}

void FileLogSink::rotate_if_needed() {
    if (m_current_size < m_config.max_size || m_config.max_files == 0)
        return;

    m_file.close();

    // log.N-1 is dropped, log.i becomes log.i+1, log becomes log.0
    std::error_code ec;
    auto base = m_config.path.string();
    std::filesystem::remove(fmt::format("{}.{}", base, m_config.max_files - 1),
                            ec);
    for (size_t i = m_config.max_files - 1; i > 0; --i) {
        std::filesystem::rename(fmt::format("{}.{}", base, i - 1),
                                fmt::format("{}.{}", base, i), ec);
    }

    std::filesystem::rename(base, fmt::format("{}.0", base), ec);
    m_file.open(m_config.path, std::ios::trunc);
    MICROGRAD_THROW_IF(!m_file.is_open(), RuntimeError,
                       core::error::make_error_code(
                           core::error::RuntimeCategory::Code::IoError),
                       "Unable to reopen log file '{}'", base);
    m_current_size = 0;
}

CircularBufferSink::CircularBufferSink(size_t capacity) : m_buffer(capacity) {}

void CircularBufferSink::write(const LogEntry& entry) {
    std::unique_lock lock(m_mutex);
    m_buffer.push_back(entry);
}

std::vector<LogEntry> CircularBufferSink::entries() const {
    std::shared_lock lock(m_mutex);
    return {m_buffer.begin(), m_buffer.end()};
}

Logger::Logger() : Logger(Config{}) {}

Logger::Logger(Config config)
    : m_config(std::move(config)), m_min_severity(m_config.min_severity) {
    if (m_config.async) {
        m_worker =
            std::jthread([this](std::stop_token stop) { process_queue(stop); });
    }
}

Logger::~Logger() {
    if (m_worker.joinable()) {
        m_worker.request_stop();
        m_worker.join();
    }

    flush();
}

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard lock(m_mutex);
    m_sinks.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard lock(m_mutex);
    m_sinks.clear();
}

void Logger::flush() {
    {
        std::lock_guard drain(m_drain_mutex);
        LogEntry entry;
        while (m_queue.try_pop(entry)) {
            write_entry(entry);
        }
    }

    std::lock_guard lock(m_mutex);
    for (auto& sink : m_sinks) {
        sink->flush();
    }
}

void Logger::submit(LogEntry entry) {
    if (m_config.async)
        m_queue.push(std::move(entry));

    else
        write_entry(entry);
}

void Logger::process_queue(std::stop_token stop) {
    std::vector<LogEntry> batch;
    batch.reserve(m_config.batch_size);

    while (!stop.stop_requested()) {
        batch.clear();

        {
            std::lock_guard drain(m_drain_mutex);
            for (size_t i = 0; i < m_config.batch_size; ++i) {
                LogEntry entry;
                if (!m_queue.try_pop(entry))
                    break;
                batch.push_back(std::move(entry));
            }

            for (const auto& entry : batch) {
                write_entry(entry);
            }
        }

        if (batch.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
}

void Logger::write_entry(const LogEntry& entry) {
    std::lock_guard lock(m_mutex);
    for (auto& sink : m_sinks) {
        sink->write(entry);
    }
}

Logger& global_logger() {
    static Logger logger;
    static std::once_flag console_once;
    std::call_once(console_once,
                   [] { logger.add_sink(std::make_shared<ConsoleLogSink>()); });

    return logger;
}

}  // namespace micrograd::log
