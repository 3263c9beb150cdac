#pragma once

#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace ulidgen::utils {
/**
 * @enum LogLevel
 * @brief Уровни логирования в порядке возрастания важности
 */
enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARNING,
    ERROR, // Ошибка выполнения отдельной команды или запроса
    CRITICAL // Ошибка, после которой работа невозможна
};

/**
 * @brief Разбор уровня логирования из строки (trace, debug, info, warning, error, critical)
 * @param name Имя уровня в нижнем регистре
 * @return Уровень логирования или std::nullopt, если имя неизвестно
 */
std::optional<LogLevel> parseLogLevel(std::string_view name);

/**
 * @brief Текстовое имя уровня для вывода в лог ("TRACE", "DEBUG", ...)
 */
std::string_view levelName(LogLevel level);

/**
 * @struct LoggerOptions
 * @brief Куда и в каком виде выводить сообщения
 */
struct LoggerOptions {
    LogLevel minLevel = LogLevel::WARNING;
    bool toStderr = true;
    bool colored = true; // Применяется, только если терминал поддерживает ANSI цвета
    std::optional<std::filesystem::path> file;
};

/**
 * @class Logger
 * @brief Синглтон для потокобезопасного вывода диагностических сообщений
 *
 * Сообщения пишутся в stderr и, при необходимости, дописываются в файл.
 * stdout не используется: он отведен под сгенерированные идентификаторы.
 * До вызова enable() все сообщения отбрасываются.
 */
class Logger {
public:
    static Logger &getInstance();

    /**
     * @brief Включает логирование с заданными настройками
     * @param options Настройки вывода
     * @return false, если файл лога не удалось открыть (вывод в stderr при этом работает)
     */
    bool enable(const LoggerOptions &options);

    void disable();

    bool isEnabled() const;

    void setMinLogLevel(LogLevel level);

    LogLevel getMinLogLevel() const;

    /**
     * @brief Запись сообщения
     * @param level Уровень сообщения
     * @param message Текст сообщения
     * @param file Исходный файл, из которого вызвано логирование
     * @param line Строка в исходном файле
     */
    void log(LogLevel level, const std::string &message, std::string_view file = {},
             int line = 0);

private:
    Logger() = default;
    ~Logger() = default;
    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    std::string format(LogLevel level, const std::string &message, std::string_view file,
                       int line) const;

    std::atomic<bool> enabled_ { false };
    std::atomic<LogLevel> minimumLevel_ { LogLevel::WARNING };

    std::mutex sinkMutex_; // Защищает настройки вывода и файловый поток
    bool toStderr_ = false;
    bool colored_ = false;
    std::ofstream fileSink_;
};

/**
 * @brief Собирает сообщение через operator<< и передает его в Logger при разрушении
 */
class LogStream {
public:
    LogStream(LogLevel level, std::string_view file, int line);
    ~LogStream();

    template <typename T> LogStream &operator<<(const T &val)
    {
        stream_ << val;
        return *this;
    }

private:
    LogLevel level_;
    std::string_view file_;
    int line_;
    std::ostringstream stream_;
};

} // namespace ulidgen::utils

#define ULIDGEN_LOG_ENABLED(level)                                                                 \
    (ulidgen::utils::Logger::getInstance().isEnabled()                                             \
     && ulidgen::utils::Logger::getInstance().getMinLogLevel() <= (level))

// Аргументы после << не вычисляются, если уровень отключен
#define ULIDGEN_LOG(level)                                                                         \
    if (ULIDGEN_LOG_ENABLED(level))                                                                \
    ulidgen::utils::LogStream((level), __FILE__, __LINE__)

#define LOG_TRACE ULIDGEN_LOG(ulidgen::utils::LogLevel::TRACE)
#define LOG_DEBUG ULIDGEN_LOG(ulidgen::utils::LogLevel::DEBUG)
#define LOG_INFO ULIDGEN_LOG(ulidgen::utils::LogLevel::INFO)
#define LOG_WARNING ULIDGEN_LOG(ulidgen::utils::LogLevel::WARNING)
#define LOG_ERROR ULIDGEN_LOG(ulidgen::utils::LogLevel::ERROR)
#define LOG_CRITICAL ULIDGEN_LOG(ulidgen::utils::LogLevel::CRITICAL)
