#pragma once

#include <memory>
#include <queue>
#include <vector>
#include <boost/asio.hpp>

#include "server/protocol.hpp"
#include "server/request_handler.hpp"

namespace ulidgen::server {
/**
 * @class Connection
 * @brief Класс, обрабатывающий одно соединение с клиентом
 *
 * Все операции выполняются в потоке io_context, поэтому очередь записи
 * не требует дополнительной синхронизации.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using SharedConnection = std::shared_ptr<Connection>;

    /**
     * @brief Создает новое соединение
     * @param ioCtx ASIO контекст
     * @param handler Обработчик запросов
     * @return Указатель на новое соединение
     */
    static SharedConnection create(boost::asio::io_context &ioCtx, const RequestHandler &handler);

    boost::asio::local::stream_protocol::socket &socket();

    /**
     * @brief Начать обработку соединения
     */
    void start();

private:
    const RequestHandler &handler_; // Обработчик запросов
    boost::asio::local::stream_protocol::socket socket_; // Сокет
    std::vector<uint8_t> readBuffer_; // Буфер для чтения
    std::queue<std::shared_ptr<std::vector<uint8_t>>> writeQueue_; // Очередь буферов для записи
    bool writeInProgress_ = false; // Выполняется ли в данный момент операция записи

    Connection(boost::asio::io_context &ioCtx, const RequestHandler &handler);

    /**
     * @brief Асинхронное чтение данных
     */
    void read();

    /**
     * @brief Обработка полных сообщений в буфере
     * @return false, если буфер переполнен и соединение нужно закрыть
     */
    bool processMessages();

    /**
     * @brief Постановка ответа в очередь на отправку
     * @param response Ответ для отправки
     */
    void write(const Response &response);

    /**
     * @brief Асинхронная запись сообщения из очереди
     */
    void do_write();
};
} // namespace ulidgen::server
