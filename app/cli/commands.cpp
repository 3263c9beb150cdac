#include "cli/commands.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <optional>
#include <string>

#include "utils/compiler.hpp"

namespace {
// Максимальная длина поля для команд `time` и `random`
constexpr size_t MAX_FIELD_LENGTH = 1024;

// Множество пробельных символов (аналогично std::isspace())
constexpr char SPACES[] = " \t\n\r\f\v";

/**
 * @brief Извлечение первого слова из строки с удалением пробелов до следующего слова
 * @param input Ссылка на исходную строку
 * @return Строка со словом (если слова нет - std::nullopt)
 */
std::optional<std::string> extractFirstWord(std::string &input)
{
    const auto start = input.find_first_not_of(SPACES);
    if (start == std::string::npos) {
        input.clear();
        return std::nullopt;
    }

    const auto end = input.find_first_of(SPACES, start);
    auto word = input.substr(start, (end == std::string::npos ? input.size() : end) - start);

    const auto next
        = (end == std::string::npos) ? std::string::npos : input.find_first_not_of(SPACES, end);
    if (next == std::string::npos) {
        input.clear();
    }
    else {
        input.erase(0, next);
    }

    return word;
}

/**
 * @brief Разбиение введенной строки на слова
 * @param input Входная строка
 * @return Слова строки (пустой вектор, если строка состоит из пробелов)
 */
std::vector<std::string> splitWords(std::string input)
{
    std::vector<std::string> words;
    while (auto word = extractFirstWord(input)) {
        words.push_back(std::move(*word));
    }
    return words;
}

/**
 * @brief Разбор времени в секундах с начала эпохи
 * @param arg Строковое представление (например, 1469918176.385)
 * @return Время или std::nullopt, если строка не является числом целиком
 */
std::optional<double> parseTime(const std::string &arg)
{
    try {
        size_t pos = 0;
        const auto value = std::stod(arg, &pos);
        if (pos != arg.size()) {
            return std::nullopt;
        }
        return value;
    }
    catch (const std::exception &) {
        return std::nullopt;
    }
}

/**
 * @brief Разбор длины поля
 * @param arg Строковое представление длины
 * @return Длина или std::nullopt, если значение некорректно или превышает MAX_FIELD_LENGTH
 */
std::optional<size_t> parseLength(const std::string &arg)
{
    const auto isDigit = [](unsigned char c) { return std::isdigit(c) != 0; };
    if (arg.empty() || arg.size() > 4 || !std::all_of(arg.begin(), arg.end(), isDigit)) {
        return std::nullopt;
    }
    const auto value = static_cast<size_t>(std::stoul(arg));
    if (value > MAX_FIELD_LENGTH) {
        return std::nullopt;
    }
    return value;
}
} // namespace

namespace ulidgen::cli {
CommandProcessor::CommandProcessor(const UlidGenerator &generator, bool singleShotMode,
                                   size_t count)
    : generator_(generator)
    , singleShotMode_(singleShotMode)
    , count_(count)
{
    // Генерация ULID: generate [ВРЕМЯ]
    commands_["generate"]
        = { 0, 1, false,
            [this](const std::vector<std::string> &args, std::ostream &out) -> CommandResult {
                std::optional<double> time;
                if (!args.empty()) {
                    time = parseTime(args[0]);
                    if (!time.has_value()) {
                        LOG_ERROR << "Ошибка: некорректное значение времени: " << args[0];
                        return CommandResult::FAILURE;
                    }
                }
                for (const auto &id : generator_.generateBatch(count_, time)) {
                    out << id << "\n";
                }
                return CommandResult::SUCCESS;
            } };

    // Временная часть ULID: time [ВРЕМЯ] [ДЛИНА]
    commands_["time"]
        = { 0, 2, false,
            [this](const std::vector<std::string> &args, std::ostream &out) -> CommandResult {
                std::optional<double> time;
                auto length = TIME_FIELD_LENGTH;
                if (!args.empty()) {
                    time = parseTime(args[0]);
                    if (!time.has_value()) {
                        LOG_ERROR << "Ошибка: некорректное значение времени: " << args[0];
                        return CommandResult::FAILURE;
                    }
                }
                if (args.size() > 1) {
                    const auto parsed = parseLength(args[1]);
                    if (!parsed.has_value()) {
                        LOG_ERROR << "Ошибка: некорректная длина: " << args[1];
                        return CommandResult::FAILURE;
                    }
                    length = *parsed;
                }
                out << generator_.encodeTimeField(time, length) << "\n";
                return CommandResult::SUCCESS;
            } };

    // Случайная часть ULID: random [ДЛИНА]
    commands_["random"]
        = { 0, 1, false,
            [this](const std::vector<std::string> &args, std::ostream &out) -> CommandResult {
                auto length = RANDOM_FIELD_LENGTH;
                if (!args.empty()) {
                    const auto parsed = parseLength(args[0]);
                    if (!parsed.has_value()) {
                        LOG_ERROR << "Ошибка: некорректная длина: " << args[0];
                        return CommandResult::FAILURE;
                    }
                    length = *parsed;
                }
                out << generator_.encodeRandomField(length) << "\n";
                return CommandResult::SUCCESS;
            } };

    // Команда выхода
    commands_["exit"] = { 0, 0, true,
                          [](const std::vector<std::string> &, std::ostream &) -> CommandResult {
                              return CommandResult::EXIT;
                          } };

    // Команда вывода справки
    commands_["help"]
        = { 0, 0, true, [](const std::vector<std::string> &, std::ostream &out) -> CommandResult {
               out << "Доступные команды:\n"
                   << "  generate [ВРЕМЯ]             Сгенерировать ULID\n"
                   << "  time [ВРЕМЯ] [ДЛИНА]         Временная часть ULID (по умолчанию 10)\n"
                   << "  random [ДЛИНА]               Случайная часть ULID (по умолчанию 16)\n"
                   << "  exit                         Выход из интерактивного режима\n"
                   << "  help                         Показать справку по доступным командам\n\n"

                   << "  ВРЕМЯ - секунды с начала эпохи Unix с миллисекундами (1469918176.385),\n"
                   << "  если не указано, используется текущее время.\n\n";
               return CommandResult::SUCCESS;
           } };
}

CommandResult CommandProcessor::do_execute(const std::string &command,
                                           const std::vector<std::string> &args,
                                           std::ostream &out) const
{
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        LOG_ERROR << "Ошибка: неизвестная команда: " << command << ".\n"
                  << "Введите `help` для получения списка доступных команд";
        return CommandResult::FAILURE;
    }

    const auto &cmd = it->second;
    if (args.size() < cmd.minArgs || args.size() > cmd.maxArgs) {
        LOG_ERROR << "Ошибка: неправильное использование команды " << command << ".\n"
                  << "Введите `help` для получения информации об использовании команд";
        return CommandResult::FAILURE;
    }

    if (singleShotMode_ && cmd.onlyForInteractive) {
        LOG_ERROR << "Ошибка: команда " << command << " доступна только в интерактивном режиме";
        return CommandResult::FAILURE;
    }

    try {
        return cmd.execute(args, out);
    }
    catch (const std::exception &e) {
        // Идентификатор либо формируется полностью, либо не выводится вовсе
        LOG_ERROR << "Ошибка выполнения команды " << command << ": " << e.what();
        return CommandResult::FAILURE;
    }
}

CommandResult CommandProcessor::executeShot(const UlidGenerator &generator,
                                            std::vector<std::string> args, size_t count,
                                            std::ostream &out)
{
    if (args.empty()) {
        LOG_ERROR << "Ошибка: необходимо указать команду для выполнения.\n"
                  << "Запустите программу с `--help` для получения справки";
        return CommandResult::FAILURE;
    }

    // Достаем команду из аргументов
    const auto command = std::move(args.front());
    args.erase(args.begin());

    const auto processor = CommandProcessor(generator, true, count);
    return processor.do_execute(command, args, out);
}

int CommandProcessor::runInteractiveMode(const UlidGenerator &generator, std::istream &in,
                                         std::ostream &out)
{
    const auto processor = CommandProcessor(generator, false);

    constexpr char PROMPT[] = "ulidgen> ";
    std::string input;

    out << "ulidgen - интерактивный режим\n"
        << "Введите команду или 'help' для получения справки, 'exit' для выхода\n";

    while (true) {
        out << PROMPT << std::flush;
        if (!std::getline(in, input)) {
            // Конец ввода равносилен выходу
            if (in.eof()) {
                out << "\n";
                return 0;
            }
            LOG_ERROR << "Ошибка ввода. Завершение работы.";
            return 1;
        }

        auto words = splitWords(std::move(input));
        if (words.empty()) {
            continue;
        }
        const auto command = std::move(words.front());
        words.erase(words.begin());

        if (processor.do_execute(command, words, out) == CommandResult::EXIT) {
            out << "Выход из интерактивного режима\n";
            return 0;
        }
    }
    UNREACHABLE("Exit from the loop can only be done manually");
}
} // namespace ulidgen::cli
