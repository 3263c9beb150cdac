#pragma once

#include "server/protocol.hpp"
#include "ulid/ulid_generator.hpp"

namespace ulidgen::server {
// Максимальное количество идентификаторов в одном ответе
constexpr size_t MAX_BATCH_SIZE = 10000;
// Максимальная длина поля, запрашиваемого командами `time` и `random`
constexpr size_t MAX_FIELD_LENGTH = 1024;

/**
 * @class RequestHandler
 * @brief Выполняет запрос клиента с помощью генератора и формирует ответ
 *
 * Не зависит от транспорта, поэтому используется как соединениями сервера,
 * так и тестами напрямую.
 */
class RequestHandler {
public:
    explicit RequestHandler(const UlidGenerator &generator);

    /**
     * @brief Обработка запроса
     * @param request Запрос
     * @return Ответ (исключения генератора превращаются в ответ с ошибкой)
     */
    Response handle(const Request &request) const;

private:
    const UlidGenerator &generator_; // Генератор идентификаторов
};
} // namespace ulidgen::server
