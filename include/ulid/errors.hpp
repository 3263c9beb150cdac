#pragma once

#include <stdexcept>
#include <string>

namespace ulidgen {
/**
 * @class ConfigurationError
 * @brief Передан пустой источник времени или случайных чисел
 */
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string &what)
        : std::invalid_argument(what)
    {
    }
};

/**
 * @class SourceUnavailableError
 * @brief В системе нет источника времени с миллисекундной точностью
 */
class SourceUnavailableError : public std::runtime_error {
public:
    explicit SourceUnavailableError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

/**
 * @class RangeError
 * @brief Временная метка не может быть закодирована без потери разрядов
 */
class RangeError : public std::out_of_range {
public:
    explicit RangeError(const std::string &what)
        : std::out_of_range(what)
    {
    }
};

/**
 * @class ProviderContractError
 * @brief Источник случайных чисел вернул значение вне [0, 1)
 */
class ProviderContractError : public std::domain_error {
public:
    explicit ProviderContractError(const std::string &what)
        : std::domain_error(what)
    {
    }
};
} // namespace ulidgen
