#include "ulid/ulid_generator.hpp"

#include <cmath>
#include <cstdint>
#include <mutex>
#include <sstream>
#include <utility>

#include "ulid/codec.hpp"
#include "ulid/errors.hpp"

namespace {
constexpr double MILLISECONDS_PER_SECOND = 1000.0;
// 2^64: первое значение, не представимое в uint64_t
constexpr double UINT64_LIMIT = 18446744073709551616.0;

/**
 * @brief Переводит секунды в целое число миллисекунд с проверкой диапазона
 * @param seconds Время в секундах с начала эпохи
 * @param length Длина временной части, в которую должно поместиться значение
 * @return Количество миллисекунд
 */
uint64_t toMilliseconds(double seconds, size_t length)
{
    const auto milliseconds = std::floor(seconds * MILLISECONDS_PER_SECOND);
    if (!std::isfinite(milliseconds) || milliseconds < 0 || milliseconds >= UINT64_LIMIT) {
        std::ostringstream oss;
        oss << "Time " << seconds << " cannot be encoded as milliseconds since epoch";
        throw ulidgen::RangeError(oss.str());
    }

    const auto value = static_cast<uint64_t>(milliseconds);
    if (!ulidgen::codec::fitsInLength(value, length)) {
        std::ostringstream oss;
        oss << "Time " << seconds << " does not fit in " << length << " characters";
        throw ulidgen::RangeError(oss.str());
    }
    return value;
}

/**
 * @brief Переводит случайное значение из [0, 1) в индекс алфавита
 * @param sample Значение, полученное от источника
 * @return Индекс в диапазоне [0, 31]
 */
size_t toAlphabetIndex(double sample)
{
    // Отрицательные значения, NaN и значения >= 1 нарушают контракт источника
    if (!(sample >= 0.0 && sample < 1.0)) {
        std::ostringstream oss;
        oss << "Random provider returned " << sample << ", expected a value in [0, 1)";
        throw ulidgen::ProviderContractError(oss.str());
    }
    return static_cast<size_t>(std::floor(sample * ulidgen::codec::BASE));
}
} // namespace

namespace ulidgen {
UlidGenerator::UlidGenerator(TimeProvider timeProvider, RandomProvider randomProvider)
    : timeProvider_(timeProvider ? std::move(timeProvider) : sources::defaultTimeProvider())
    , randomProvider_(randomProvider ? std::move(randomProvider)
                                     : sources::defaultRandomProvider())
{
}

std::string UlidGenerator::generate(std::optional<double> time) const
{
    // Обе части формируются из одного и того же набора источников
    const auto timeProvider = currentTimeProvider();
    const auto randomProvider = currentRandomProvider();

    auto result = encodeTime(timeProvider, time, TIME_FIELD_LENGTH);
    result += encodeRandom(randomProvider, RANDOM_FIELD_LENGTH);
    return result;
}

std::vector<std::string> UlidGenerator::generateBatch(size_t count,
                                                     std::optional<double> time) const
{
    std::vector<std::string> result;
    result.reserve(count);
    for (size_t i = 0; i < count; i++) {
        result.push_back(generate(time));
    }
    return result;
}

std::string UlidGenerator::encodeTimeField(std::optional<double> time, size_t length) const
{
    return encodeTime(currentTimeProvider(), time, length);
}

std::string UlidGenerator::encodeRandomField(size_t length) const
{
    return encodeRandom(currentRandomProvider(), length);
}

bool UlidGenerator::setTimeProvider(TimeProvider provider)
{
    if (!provider) {
        throw ConfigurationError("Time provider must be a callable object");
    }
    std::unique_lock<std::shared_mutex> lock(providersMutex_);
    timeProvider_ = std::move(provider);
    return true;
}

bool UlidGenerator::setRandomProvider(RandomProvider provider)
{
    if (!provider) {
        throw ConfigurationError("Random provider must be a callable object");
    }
    std::unique_lock<std::shared_mutex> lock(providersMutex_);
    randomProvider_ = std::move(provider);
    return true;
}

TimeProvider UlidGenerator::currentTimeProvider() const
{
    std::shared_lock<std::shared_mutex> lock(providersMutex_);
    return timeProvider_;
}

RandomProvider UlidGenerator::currentRandomProvider() const
{
    std::shared_lock<std::shared_mutex> lock(providersMutex_);
    return randomProvider_;
}

std::string UlidGenerator::encodeTime(const TimeProvider &provider, std::optional<double> time,
                                      size_t length)
{
    const auto seconds = time.has_value() ? *time : provider();
    return codec::encode(toMilliseconds(seconds, length), length);
}

std::string UlidGenerator::encodeRandom(const RandomProvider &provider, size_t length)
{
    std::string result;
    result.reserve(length);
    // Каждый символ - независимый вызов источника
    for (size_t i = 0; i < length; i++) {
        result += codec::ALPHABET[toAlphabetIndex(provider())];
    }
    return result;
}
} // namespace ulidgen
