#include "utils/logger.hpp"

#include <array>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <system_error>

#if defined(ULIDGEN_PLATFORM_WINDOWS)
#include <windows.h>
#endif

namespace {
struct LevelStyle {
    ulidgen::utils::LogLevel level;
    std::string_view parseName;
    std::string_view name;
    const char *color; // ANSI
};

// Порядок совпадает с порядком значений LogLevel
constexpr std::array<LevelStyle, 6> LEVEL_STYLES { {
    { ulidgen::utils::LogLevel::TRACE, "trace", "TRACE", "\033[36m" },
    { ulidgen::utils::LogLevel::DEBUG, "debug", "DEBUG", "\033[34m" },
    { ulidgen::utils::LogLevel::INFO, "info", "INFO", "\033[32m" },
    { ulidgen::utils::LogLevel::WARNING, "warning", "WARNING", "\033[33m" },
    { ulidgen::utils::LogLevel::ERROR, "error", "ERROR", "\033[31m" },
    { ulidgen::utils::LogLevel::CRITICAL, "critical", "CRITICAL", "\033[35m" },
} };

constexpr const char *COLOR_RESET = "\033[0m";
constexpr std::string_view STDERR_PREFIX = "ULIDGEN: ";

const LevelStyle &styleOf(ulidgen::utils::LogLevel level)
{
    return LEVEL_STYLES[static_cast<size_t>(level)];
}

/**
 * @brief Локальное время в формате "YYYY-MM-DD HH:MM:SS.mmm"
 */
std::string timestamp()
{
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto ms
        = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm localTime {};
#if defined(ULIDGEN_PLATFORM_WINDOWS)
    localtime_s(&localTime, &seconds);
#else
    localtime_r(&seconds, &localTime);
#endif

    std::ostringstream oss;
    oss << std::put_time(&localTime, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << ms.count();
    return oss.str();
}

std::string_view baseName(std::string_view path)
{
    const auto pos = path.find_last_of("/\\");
    return pos == std::string_view::npos ? path : path.substr(pos + 1);
}

bool terminalSupportsColors()
{
#if defined(ULIDGEN_PLATFORM_WINDOWS)
    HANDLE handle = GetStdHandle(STD_ERROR_HANDLE);
    DWORD mode = 0;
    if (handle == INVALID_HANDLE_VALUE || !GetConsoleMode(handle, &mode)) {
        return false;
    }
    return (mode & ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
#else
    const char *term = std::getenv("TERM");
    if (term == nullptr) {
        return false;
    }
    const std::string_view value(term);
    return value != "dumb" && value != "unknown";
#endif
}
} // namespace

namespace ulidgen::utils {
std::optional<LogLevel> parseLogLevel(std::string_view name)
{
    for (const auto &style : LEVEL_STYLES) {
        if (style.parseName == name) {
            return style.level;
        }
    }
    return std::nullopt;
}

std::string_view levelName(LogLevel level)
{
    return styleOf(level).name;
}

Logger &Logger::getInstance()
{
    static Logger instance;
    return instance;
}

bool Logger::enable(const LoggerOptions &options)
{
    bool fileOpened = true;
    {
        std::lock_guard<std::mutex> lock(sinkMutex_);
        toStderr_ = options.toStderr;
        colored_ = options.toStderr && options.colored && terminalSupportsColors();

        if (fileSink_.is_open()) {
            fileSink_.close();
        }
        if (options.file.has_value()) {
            const auto dir = options.file->parent_path();
            std::error_code ec;
            if (!dir.empty()) {
                std::filesystem::create_directories(dir, ec);
            }
            fileSink_.open(*options.file, std::ios::out | std::ios::app);
            fileOpened = fileSink_.is_open();
            if (fileOpened) {
                fileSink_ << "--- ULIDGEN логирование начато в " << timestamp() << " ---"
                          << std::endl;
            }
        }
    }

    minimumLevel_ = options.minLevel;
    enabled_ = true;

    if (!fileOpened) {
        LOG_ERROR << "Не удалось открыть файл лога: " << options.file->string();
    }
    LOG_DEBUG << "Логирование включено (минимальный уровень: " << levelName(options.minLevel)
              << ", цветной вывод: " << (colored_ ? "да" : "нет") << ")";
    return fileOpened;
}

void Logger::disable()
{
    LOG_DEBUG << "Логирование отключено";
    enabled_ = false;

    std::lock_guard<std::mutex> lock(sinkMutex_);
    if (fileSink_.is_open()) {
        fileSink_.close();
    }
}

bool Logger::isEnabled() const
{
    return enabled_;
}

void Logger::setMinLogLevel(LogLevel level)
{
    minimumLevel_ = level;
    LOG_DEBUG << "Минимальный уровень логирования установлен на " << levelName(level);
}

LogLevel Logger::getMinLogLevel() const
{
    return minimumLevel_;
}

void Logger::log(LogLevel level, const std::string &message, std::string_view file, int line)
{
    if (!enabled_ || level < minimumLevel_) {
        return;
    }

    const auto formatted = format(level, message, file, line);

    std::lock_guard<std::mutex> lock(sinkMutex_);
    if (toStderr_) {
        if (colored_) {
            std::cerr << styleOf(level).color << STDERR_PREFIX << formatted << COLOR_RESET
                      << std::endl;
        }
        else {
            std::cerr << STDERR_PREFIX << formatted << std::endl;
        }
    }
    if (fileSink_.is_open()) {
        fileSink_ << formatted << std::endl;
    }
}

std::string Logger::format(LogLevel level, const std::string &message, std::string_view file,
                           int line) const
{
    // [ВРЕМЯ] [УРОВЕНЬ] [ФАЙЛ:СТРОКА] Сообщение
    std::ostringstream oss;
    oss << '[' << timestamp() << "] [" << levelName(level) << "] ";
    if (!file.empty()) {
        oss << '[' << baseName(file) << ':' << line << "] ";
    }
    oss << message;
    return oss.str();
}

LogStream::LogStream(LogLevel level, std::string_view file, int line)
    : level_(level)
    , file_(file)
    , line_(line)
{
}

LogStream::~LogStream()
{
    Logger::getInstance().log(level_, stream_.str(), file_, line_);
}
} // namespace ulidgen::utils
