#include "server/connection.hpp"

#include "utils/logger.hpp"

namespace ulidgen::server {
// Максимальный размер буфера чтения (16 КБ)
constexpr size_t MAX_BUFFER_SIZE = 16384;
// Размер блока одного чтения из сокета
constexpr size_t READ_CHUNK_SIZE = 1024;

Connection::SharedConnection Connection::create(boost::asio::io_context &ioCtx,
                                                const RequestHandler &handler)
{
    return SharedConnection(new Connection(ioCtx, handler));
}

Connection::Connection(boost::asio::io_context &ioCtx, const RequestHandler &handler)
    : handler_(handler)
    , socket_(ioCtx)
{
    readBuffer_.reserve(MAX_BUFFER_SIZE);
}

boost::asio::local::stream_protocol::socket &Connection::socket()
{
    return socket_;
}

void Connection::start()
{
    LOG_DEBUG << "Новое соединение установлено";
    read();
}

void Connection::read()
{
    auto chunk = std::make_shared<std::vector<uint8_t>>(READ_CHUNK_SIZE);

    // Указатель на себя не дает уничтожить соединение во время чтения
    socket_.async_read_some(
        boost::asio::buffer(*chunk),
        [this, self = shared_from_this(), chunk](boost::system::error_code ec, std::size_t length) {
            if (ec) {
                if (ec == boost::asio::error::eof) {
                    LOG_DEBUG << "Клиент закрыл соединение";
                }
                else if (ec != boost::asio::error::operation_aborted) {
                    LOG_ERROR << "Ошибка при чтении: " << ec.message();
                }
                return;
            }

            readBuffer_.insert(readBuffer_.end(), chunk->begin(), chunk->begin() + length);

            if (!processMessages()) {
                boost::system::error_code closeEc;
                socket_.close(closeEc);
                return;
            }

            read();
        });
}

bool Connection::processMessages()
{
    while (true) {
        const auto jsonMessage = ProtocolFrame::extractMessage(readBuffer_);
        if (!jsonMessage.has_value()) {
            break;
        }
        LOG_TRACE << "Извлечено сообщение: " << *jsonMessage;

        const auto request = Request::fromJson(*jsonMessage);
        if (request.has_value()) {
            write(handler_.handle(*request));
        }
        else {
            LOG_ERROR << "Некорректный формат запроса: " << *jsonMessage;
            Response errorResponse;
            errorResponse.requestId = "error";
            errorResponse.success = false;
            errorResponse.error = "Invalid request format";
            write(errorResponse);
        }
    }

    // Неполное сообщение, которое уже не поместится в буфер
    if (readBuffer_.size() > MAX_BUFFER_SIZE) {
        LOG_ERROR << "Переполнение буфера чтения, соединение закрывается";
        return false;
    }
    return true;
}

void Connection::write(const Response &response)
{
    writeQueue_.push(
        std::make_shared<std::vector<uint8_t>>(ProtocolFrame::wrapMessage(response.toJson())));

    // Текущая операция записи сама запустит следующую при завершении
    if (writeInProgress_) {
        return;
    }
    do_write();
}

void Connection::do_write()
{
    if (writeQueue_.empty()) {
        writeInProgress_ = false;
        return;
    }
    writeInProgress_ = true;
    auto buffer = writeQueue_.front();
    writeQueue_.pop();

    boost::asio::async_write(socket_, boost::asio::buffer(*buffer),
                             [this, self = shared_from_this(),
                              buffer](boost::system::error_code ec, std::size_t) {
                                 if (ec) {
                                     if (ec != boost::asio::error::operation_aborted) {
                                         LOG_ERROR << "Ошибка при записи: " << ec.message();
                                     }
                                     writeInProgress_ = false;
                                     return;
                                 }
                                 do_write();
                             });
}
} // namespace ulidgen::server
