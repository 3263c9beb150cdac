#pragma once

#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

#include "ulid/ulid_generator.hpp"

namespace ulidgen::cli {
/**
 * @enum CommandResult
 * @brief Тип результата выполнения команды
 */
enum class CommandResult : int {
    SUCCESS, // Успешное выполнение
    FAILURE, // Ошибка выполнения
    EXIT, // Выход из интерактивного режима
};

/**
 * @struct Command
 * @brief Структура команды
 */
struct Command {
    // Минимальное и максимальное количество аргументов
    uint8_t minArgs;
    uint8_t maxArgs;
    // Команда только для интерактивного режима
    bool onlyForInteractive;
    // Функция выполнения команды
    std::function<CommandResult(const std::vector<std::string> &, std::ostream &)> execute;
};

/**
 * @class CommandProcessor
 * @brief Управляет выполнением команд
 */
class CommandProcessor {
public:
    /**
     * @brief Конструктор
     * @param generator Генератор идентификаторов
     * @param singleShotMode Процессор создается для однократного выполнения команды
     * @param count Количество идентификаторов, выдаваемых командой generate
     */
    CommandProcessor(const UlidGenerator &generator, bool singleShotMode, size_t count = 1);

    /**
     * @brief Одноразовое выполнение команды
     * @param generator Генератор идентификаторов
     * @param args Команда и ее аргументы
     * @param count Количество идентификаторов, выдаваемых командой generate
     * @param out Поток вывода результата
     */
    static CommandResult executeShot(const UlidGenerator &generator, std::vector<std::string> args,
                                     size_t count = 1, std::ostream &out = std::cout);

    /**
     * @brief Запуск интерактивного режима
     * @param generator Генератор идентификаторов
     * @param in Поток ввода команд
     * @param out Поток вывода результатов
     * @return Код завершения
     */
    static int runInteractiveMode(const UlidGenerator &generator, std::istream &in = std::cin,
                                  std::ostream &out = std::cout);

private:
    const UlidGenerator &generator_; // Генератор
    std::unordered_map<std::string, Command> commands_; // Зарегистрированные команды
    bool singleShotMode_ = false;
    size_t count_ = 1;

    /**
     * @brief Фактическое выполнение команды
     * @param command Команда для выполнения
     * @param args Аргументы команды
     * @param out Поток вывода результата выполнения команды
     */
    CommandResult do_execute(const std::string &command, const std::vector<std::string> &args,
                             std::ostream &out) const;
};
} // namespace ulidgen::cli
