#include "server/protocol.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

#include "utils/logger.hpp"

namespace {
using json = nlohmann::json;

// Извлекает необязательный неотрицательный целый параметр
bool readUnsigned(const json &params, const char *name, std::optional<size_t> &out)
{
    if (!params.contains(name)) {
        return true;
    }
    const auto &value = params[name];
    if (!value.is_number_unsigned()) {
        LOG_ERROR << "Параметр " << name << " должен быть неотрицательным целым числом";
        return false;
    }
    out = value.get<size_t>();
    return true;
}
} // namespace

namespace ulidgen::server {
std::optional<Request> Request::fromJson(const std::string &jsonStr)
{
    try {
        const auto jsonData = json::parse(jsonStr);

        // Проверка обязательных полей
        if (!jsonData.is_object() || !jsonData.contains("request_id")
            || !jsonData.contains("command")) {
            LOG_ERROR << "JSON не содержит обязательных полей";
            return std::nullopt;
        }

        Request req;
        req.requestId = jsonData["request_id"].get<std::string>();
        req.command = stringToCommand(jsonData["command"].get<std::string>());

        // Параметры необязательны
        if (!jsonData.contains("params")) {
            return req;
        }
        const auto &params = jsonData["params"];
        if (!params.is_object()) {
            LOG_ERROR << "Поле params должно быть объектом";
            return std::nullopt;
        }

        if (params.contains("time")) {
            if (!params["time"].is_number()) {
                LOG_ERROR << "Параметр time должен быть числом";
                return std::nullopt;
            }
            req.time = params["time"].get<double>();
        }

        if (!readUnsigned(params, "length", req.length)
            || !readUnsigned(params, "count", req.count)) {
            return std::nullopt;
        }

        return req;
    }
    catch (const json::exception &e) {
        LOG_ERROR << "Ошибка при разборе JSON: " << e.what();
        return std::nullopt;
    }
}

CommandType Request::stringToCommand(const std::string &cmdStr)
{
    if (cmdStr == "generate")
        return CommandType::GENERATE;
    if (cmdStr == "time")
        return CommandType::TIME;
    if (cmdStr == "random")
        return CommandType::RANDOM;
    if (cmdStr == "ping")
        return CommandType::PING;
    return CommandType::UNKNOWN;
}

std::string Response::toJson() const
{
    json jsonData;
    jsonData["request_id"] = requestId;
    jsonData["success"] = success;

    json params = json::object();
    if (ids.has_value()) {
        params["ids"] = *ids;
    }
    if (value.has_value()) {
        params["value"] = *value;
    }
    jsonData["params"] = params;

    if (error.has_value()) {
        jsonData["error"] = *error;
    }

    return jsonData.dump();
}

std::vector<uint8_t> ProtocolFrame::wrapMessage(const std::string &jsonMessage)
{
    const auto lengthBytes = encodeLength(static_cast<uint32_t>(jsonMessage.size()));

    std::vector<uint8_t> frame(HEADER_SIZE + jsonMessage.size());
    std::copy(lengthBytes.begin(), lengthBytes.end(), frame.begin());
    std::copy(jsonMessage.begin(), jsonMessage.end(), frame.begin() + HEADER_SIZE);

    return frame;
}

std::optional<std::string> ProtocolFrame::extractMessage(std::vector<uint8_t> &buffer)
{
    if (buffer.size() < HEADER_SIZE) {
        return std::nullopt;
    }

    const auto messageLength = decodeLength(buffer.data());
    if (buffer.size() - HEADER_SIZE < messageLength) {
        return std::nullopt;
    }

    std::string message(buffer.begin() + HEADER_SIZE,
                        buffer.begin() + HEADER_SIZE + messageLength);

    // Удаляем обработанные данные из буфера
    buffer.erase(buffer.begin(), buffer.begin() + HEADER_SIZE + messageLength);

    return message;
}

// !! Для кодирования/декодирования используем формат little-endian

uint32_t ProtocolFrame::decodeLength(const uint8_t *headerBytes)
{
    constexpr size_t BITS_PER_BYTE = 8;
    uint32_t length = 0;
    for (size_t i = 0; i < HEADER_SIZE; ++i) {
        length |= static_cast<uint32_t>(headerBytes[i]) << (i * BITS_PER_BYTE);
    }
    return length;
}

std::vector<uint8_t> ProtocolFrame::encodeLength(uint32_t length)
{
    constexpr size_t BITS_PER_BYTE = 8;
    std::vector<uint8_t> bytes(HEADER_SIZE);
    for (size_t i = 0; i < HEADER_SIZE; i++) {
        bytes[i] = (length >> (i * BITS_PER_BYTE)) & 0xFF;
    }
    return bytes;
}
} // namespace ulidgen::server
