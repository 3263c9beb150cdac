#include "server/request_handler.hpp"

#include <exception>

#include "utils/logger.hpp"

namespace ulidgen::server {
RequestHandler::RequestHandler(const UlidGenerator &generator)
    : generator_(generator)
{
}

Response RequestHandler::handle(const Request &request) const
{
    Response response;
    response.requestId = request.requestId;
    response.success = true;

    try {
        switch (request.command) {
        case CommandType::GENERATE: {
            const auto count = request.count.value_or(1);
            if (count == 0 || count > MAX_BATCH_SIZE) {
                response.success = false;
                response.error = "Count must be in range [1, " + std::to_string(MAX_BATCH_SIZE)
                    + "]";
                break;
            }
            response.ids = generator_.generateBatch(count, request.time);
            break;
        }
        case CommandType::TIME: {
            const auto length = request.length.value_or(TIME_FIELD_LENGTH);
            if (length > MAX_FIELD_LENGTH) {
                response.success = false;
                response.error = "Length exceeds " + std::to_string(MAX_FIELD_LENGTH);
                break;
            }
            response.value = generator_.encodeTimeField(request.time, length);
            break;
        }
        case CommandType::RANDOM: {
            const auto length = request.length.value_or(RANDOM_FIELD_LENGTH);
            if (length > MAX_FIELD_LENGTH) {
                response.success = false;
                response.error = "Length exceeds " + std::to_string(MAX_FIELD_LENGTH);
                break;
            }
            response.value = generator_.encodeRandomField(length);
            break;
        }
        case CommandType::PING: {
            break;
        }
        case CommandType::UNKNOWN:
        default: {
            response.success = false;
            response.error = "Unknown command";
            break;
        }
        }
    }
    catch (const std::exception &e) {
        response.success = false;
        response.error = e.what();
        LOG_ERROR << "Ошибка при обработке запроса " << request.requestId << ": " << e.what();
    }

    return response;
}
} // namespace ulidgen::server
