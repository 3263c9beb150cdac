#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ulidgen::server {
/**
 * @enum CommandType
 * @brief Типы команд, принимаемых сервером
 */
enum class CommandType { GENERATE, TIME, RANDOM, PING, UNKNOWN };

/**
 * @struct Request
 * @brief Запрос клиента (например, плагина редактора)
 */
struct Request {
    std::string requestId;
    CommandType command;
    std::optional<double> time; // Время в секундах с начала эпохи
    std::optional<size_t> length; // Длина поля для `time` и `random`
    std::optional<size_t> count; // Количество идентификаторов для `generate`

    /**
     * @brief Десериализация запроса из JSON
     * @param jsonStr JSON-строка
     * @return Request или std::nullopt при ошибке
     */
    static std::optional<Request> fromJson(const std::string &jsonStr);

    /**
     * @brief Конвертация строкового представления команды в CommandType
     * @param cmdStr Строковое представление команды
     * @return Соответствующий CommandType
     */
    static CommandType stringToCommand(const std::string &cmdStr);
};

/**
 * @struct Response
 * @brief Ответ сервера
 */
struct Response {
    std::string requestId;
    bool success = false;
    std::optional<std::vector<std::string>> ids; // Результат `generate`
    std::optional<std::string> value; // Результат `time` и `random`
    std::optional<std::string> error;

    /**
     * @brief Сериализация ответа в JSON
     * @return JSON-строка
     */
    std::string toJson() const;
};

/**
 * @brief Класс для работы с форматом сообщений по протоколу
 *
 * Формат: [4 байта длины сообщения, little-endian][JSON-сообщение]
 */
class ProtocolFrame {
public:
    // Размер заголовка с длиной сообщения
    static constexpr size_t HEADER_SIZE = sizeof(uint32_t);

    /**
     * @brief Обертывание JSON-сообщения в фрейм протокола
     * @param jsonMessage Сообщение в формате JSON
     * @return Байты фрейма протокола
     */
    static std::vector<uint8_t> wrapMessage(const std::string &jsonMessage);

    /**
     * @brief Извлечение JSON-сообщения из частичного буфера
     *
     * Извлеченные байты удаляются из начала буфера.
     *
     * @param buffer Буфер с данными
     * @return std::nullopt, если сообщение неполное, или JSON-сообщение
     */
    static std::optional<std::string> extractMessage(std::vector<uint8_t> &buffer);

    static uint32_t decodeLength(const uint8_t *headerBytes);

    static std::vector<uint8_t> encodeLength(uint32_t length);
};
} // namespace ulidgen::server
