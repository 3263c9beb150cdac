#include "ulid/sources.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <random>
#include <ratio>

#include "ulid/errors.hpp"

namespace {
// Количество значащих бит мантиссы double
constexpr int DOUBLE_MANTISSA_BITS = 53;

/**
 * @brief Преобразует 64 случайных бита в число из [0, 1)
 *
 * Используются только старшие 53 бита, поэтому результат всегда строго меньше единицы.
 */
double toUnitInterval(uint64_t bits)
{
    return std::ldexp(static_cast<double>(bits >> (64 - DOUBLE_MANTISSA_BITS)),
                      -DOUBLE_MANTISSA_BITS);
}

double systemClockSeconds()
{
    // Дробные секунды с полным разрешением часов, без промежуточного округления до миллисекунд
    const auto sinceEpoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(sinceEpoch).count();
}
} // namespace

namespace ulidgen::sources {
bool hasMillisecondClock()
{
    return std::ratio_less_equal<std::chrono::system_clock::period, std::milli>::value;
}

TimeProvider defaultTimeProvider()
{
    if (!hasMillisecondClock()) {
        return unavailableTimeProvider();
    }
    return systemClockSeconds;
}

TimeProvider unavailableTimeProvider()
{
    return []() -> double {
        throw SourceUnavailableError("No time source with millisecond precision is available, "
                                     "please provide time in seconds with millisecond precision");
    };
}

RandomProvider defaultRandomProvider()
{
    return []() -> double {
        // Для каждого потока создаем свой экземпляр генератора
        thread_local std::mt19937_64 rng(std::random_device {}());
        return toUnitInterval(rng());
    };
}

RandomProvider systemRandomProvider()
{
    return []() -> double {
        thread_local std::random_device device;
        // random_device выдает 32 бита за вызов, собираем из двух вызовов 64 бита
        const auto high = static_cast<uint64_t>(device()) & 0xFFFFFFFF;
        const auto low = static_cast<uint64_t>(device()) & 0xFFFFFFFF;
        return toUnitInterval((high << 32) | low);
    };
}
} // namespace ulidgen::sources
