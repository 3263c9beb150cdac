#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio.hpp>

#include "server/request_handler.hpp"
#include "ulid/ulid_generator.hpp"

namespace ulidgen::server {
/**
 * @class Server
 * @brief Серверный процесс, выдающий идентификаторы через Unix Domain Socket
 *
 * Предназначен для интеграций (например, плагинов редакторов), которым неудобно
 * запускать отдельный процесс на каждый идентификатор.
 */
class Server {
public:
    /**
     * @brief Инициализация и запуск сервера (блокирующий вызов)
     * @param generator Генератор идентификаторов
     * @param socketPath Путь к сокету (по умолчанию - временная директория)
     * @return Код завершения
     */
    static int startServer(const UlidGenerator &generator, std::optional<std::string> socketPath);

    /**
     * @brief Путь к сокету по умолчанию
     */
    static std::filesystem::path defaultSocketPath();

private:
    RequestHandler handler_; // Обработчик запросов
    std::filesystem::path socketPath_; // Путь к сокету
    std::unique_ptr<boost::asio::io_context> ioCtx_; // ASIO контекст
    std::unique_ptr<boost::asio::local::stream_protocol::acceptor> acceptor_; // Аксептор
    std::unique_ptr<boost::asio::signal_set> signalSet_; // Обработчик сигналов завершения
    std::atomic<bool> running_; // Флаг работы сервера

    Server(const UlidGenerator &generator, std::optional<std::string> socketPath);
    ~Server();

    /**
     * @brief Запуск сервера
     * @return Код завершения
     */
    int start();

    /**
     * @brief Остановка сервера и удаление файла сокета
     */
    void stop();

    /**
     * @brief Принятие нового соединения
     */
    void accept();
};
} // namespace ulidgen::server
