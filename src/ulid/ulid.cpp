#include "ulid/ulid.hpp"

#include <utility>

namespace ulidgen {
UlidGenerator &defaultGenerator()
{
    static UlidGenerator instance;
    return instance;
}

std::string generate(std::optional<double> time)
{
    return defaultGenerator().generate(time);
}

std::string encodeTimeField(std::optional<double> time, size_t length)
{
    return defaultGenerator().encodeTimeField(time, length);
}

std::string encodeRandomField(size_t length)
{
    return defaultGenerator().encodeRandomField(length);
}

bool setTimeProvider(TimeProvider provider)
{
    return defaultGenerator().setTimeProvider(std::move(provider));
}

bool setRandomProvider(RandomProvider provider)
{
    return defaultGenerator().setRandomProvider(std::move(provider));
}
} // namespace ulidgen
