#include <algorithm>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "cli/commands.hpp"
#include "server/server.hpp"
#include "ulid/sources.hpp"
#include "ulid/ulid_generator.hpp"
#include "utils/logger.hpp"

namespace {
// Максимальное количество идентификаторов за один запуск
constexpr size_t MAX_COUNT = 100000;
} // namespace

// Вывод справки
void printHelp(const char *executable)
{
    std::cout
        << "Использование:\n"
        << "  " << executable << " [ОПЦИИ] <КОМАНДА> [АРГУМЕНТЫ]\n\n"

        << "Описание:\n"
        << "  Генератор ULID - лексикографически сортируемых уникальных идентификаторов\n"
        << "  из 26 символов Crockford Base32 (10 символов времени + 16 случайных).\n\n"

        << "Общие опции:\n"
        << "  --random-source=ИСТОЧНИК       Источник случайных чисел: default (mt19937_64)\n"
        << "                                 или device (std::random_device)\n"
        << "  --log-level=УРОВЕНЬ            trace, debug, info, warning, error, critical\n"
        << "                                 (по умолчанию: warning)\n"
        << "  --log-file=ПУТЬ                Дополнительно писать лог в файл\n"
        << "  --disable-warnings             Выводить только ошибки\n"
        << "  --help                         Показать справку\n\n"

        << "Режимы работы:\n"
        << "  По умолчанию выполняется однократная команда, если не указаны "
           "--interactive или --server.\n\n"

        << "=== Однократное выполнение команды ===\n"
        << "  Запуск: " << executable << " [ОПЦИИ] <КОМАНДА> [АРГУМЕНТЫ]\n"
        << "  Доступные опции:\n"
        << "    --count=ЧИСЛО                Количество идентификаторов для generate "
           "(по умолчанию: 1)\n"
        << "  Доступные команды:\n"
        << "    generate [ВРЕМЯ]             Сгенерировать ULID\n"
        << "    time [ВРЕМЯ] [ДЛИНА]         Временная часть ULID (по умолчанию 10 символов)\n"
        << "    random [ДЛИНА]               Случайная часть ULID (по умолчанию 16 символов)\n\n"

        << "  ВРЕМЯ - секунды с начала эпохи Unix с миллисекундами, например 1469918176.385.\n"
        << "  Если время не указано, используется текущее.\n\n"

        << "=== Интерактивный режим ===\n"
        << "  Запуск: " << executable << " --interactive [ОПЦИИ]\n"
        << "  Команды вводятся построчно, дополнительно доступны help и exit.\n\n"

        << "=== Серверный режим ===\n"
        << "  Запуск: " << executable << " --server [ОПЦИИ]\n"
        << "  Доступные опции:\n"
        << "    --socket=ПУТЬ                Путь к Unix-сокету (по умолчанию: "
        << ulidgen::server::Server::defaultSocketPath().string() << ").\n"
        << "                                 Сокет не должен существовать.\n\n"

        << "  Неподдерживаемые опции для выбранного режима будут проигнорированы.\n";
}

// Получение значения опции из аргументов командной строки
std::optional<std::string> getOptionValue(const std::string &option, std::vector<std::string> &args)
{
    for (size_t i = 0; i < args.size(); ++i) {
        const auto &arg = args[i];
        // Проверка формата `--option=value`
        size_t pos = arg.find('=');
        if (pos != std::string::npos && arg.substr(0, pos) == option) {
            const std::string value = arg.substr(pos + 1);
            args.erase(args.begin() + i);
            return value;
        }
        // Проверка формата `--option value`
        if (arg == option && i + 1 < args.size()) {
            const std::string value = args[i + 1];
            args.erase(args.begin() + i, args.begin() + i + 2);
            return value;
        }
    }
    return std::nullopt;
}

// Проверка наличия флага в аргументах командной строки
bool hasFlag(const std::string &flag, std::vector<std::string> &args)
{
    auto it = std::find(args.begin(), args.end(), flag);
    if (it != args.end()) {
        args.erase(it);
        return true;
    }
    return false;
}

// Проверка оставшихся флагов: если флаги остались, то это ошибка
bool checkLastArgs(const std::vector<std::string> &args)
{
    if (args.empty()) {
        return true;
    }

    LOG_ERROR << "Ошибка: неизвестные аргументы:";
    for (const auto &arg : args) {
        LOG_ERROR << "\t" << arg;
    }
    return false;
}

int main(int argc, char *argv[])
{
    auto executable = (argc > 0) ? argv[0] : "ulidgen";
    std::vector<std::string> args(argv + 1, argv + argc);

    if (args.empty() || hasFlag("--help", args)) {
        printHelp(executable);
        return 0;
    }

    const auto interactiveMode = hasFlag("--interactive", args);
    const auto serverMode = hasFlag("--server", args);
    const auto disableWarnings = hasFlag("--disable-warnings", args);
    const auto socketPath = getOptionValue("--socket", args);
    const auto logLevelOption = getOptionValue("--log-level", args);
    const auto logFileOption = getOptionValue("--log-file", args);
    const auto randomSourceOption = getOptionValue("--random-source", args);
    const auto countOption = getOptionValue("--count", args);

    // Логи выводятся в stderr, stdout остается только для идентификаторов
    ulidgen::utils::LoggerOptions loggerOptions;
    if (disableWarnings) {
        loggerOptions.minLevel = ulidgen::utils::LogLevel::ERROR;
    }
    if (logFileOption.has_value()) {
        loggerOptions.file = *logFileOption;
    }
    const auto logLevel = logLevelOption.has_value()
        ? ulidgen::utils::parseLogLevel(*logLevelOption)
        : std::optional<ulidgen::utils::LogLevel>(loggerOptions.minLevel);
    if (logLevel.has_value()) {
        loggerOptions.minLevel = *logLevel;
    }
    if (!ulidgen::utils::Logger::getInstance().enable(loggerOptions)) {
        return 1;
    }

    if (!logLevel.has_value()) {
        LOG_ERROR << "Ошибка: некорректное значение для --log-level: " << *logLevelOption;
        return 1;
    }

    // Выбор источника случайных чисел
    ulidgen::RandomProvider randomProvider;
    if (randomSourceOption.has_value()) {
        if (*randomSourceOption == "device") {
            randomProvider = ulidgen::sources::systemRandomProvider();
        }
        else if (*randomSourceOption != "default") {
            LOG_ERROR << "Ошибка: некорректное значение для --random-source: "
                      << *randomSourceOption;
            return 1;
        }
    }

    size_t count = 1;
    if (countOption.has_value()) {
        try {
            size_t pos = 0;
            count = std::stoul(*countOption, &pos);
            if (pos != countOption->size() || count == 0 || count > MAX_COUNT
                || countOption->front() == '-') {
                throw std::out_of_range("count");
            }
        }
        catch (const std::exception &) {
            LOG_ERROR << "Ошибка: значение --count должно быть в диапазоне [1, " << MAX_COUNT
                      << "]";
            return 1;
        }
    }

    // Для интерактивного и серверного режимов не должно остаться аргументов
    if ((interactiveMode || serverMode) && !checkLastArgs(args)) {
        return 1;
    }

    if (!ulidgen::sources::hasMillisecondClock()) {
        LOG_WARNING << "Системные часы не обеспечивают миллисекундную точность, "
                       "генерация без явного времени завершится ошибкой";
    }

    const ulidgen::UlidGenerator generator({}, std::move(randomProvider));

    if (serverMode) {
        return ulidgen::server::Server::startServer(generator, socketPath);
    }

    if (interactiveMode) {
        return ulidgen::cli::CommandProcessor::runInteractiveMode(generator);
    }

    const auto result
        = ulidgen::cli::CommandProcessor::executeShot(generator, std::move(args), count);
    return result == ulidgen::cli::CommandResult::SUCCESS ? 0 : 1;
}
