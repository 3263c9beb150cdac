#include "testing_utils.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <random>

#include "ulid/codec.hpp"

namespace ulidgen::tests {
uint64_t getRandomInt(uint64_t min, uint64_t max)
{
    // Для каждого потока создаем свой экземпляр генератора
    thread_local std::mt19937_64 rng(std::chrono::system_clock::now().time_since_epoch().count());
    std::uniform_int_distribution<uint64_t> dist(min, max);
    return dist(rng);
}

uint64_t decodeBase32(const std::string &encoded)
{
    uint64_t value = 0;
    for (const auto symbol : encoded) {
        const auto it = std::find(codec::ALPHABET.begin(), codec::ALPHABET.end(), symbol);
        value = value * codec::BASE + static_cast<uint64_t>(it - codec::ALPHABET.begin());
    }
    return value;
}

bool consistsOfAlphabet(const std::string &value)
{
    return std::all_of(value.begin(), value.end(), codec::isAlphabetSymbol);
}

std::function<double()> makeSequenceProvider(std::vector<double> values)
{
    // Состояние разделяется между копиями функции (генератор копирует источники)
    auto state = std::make_shared<std::pair<std::vector<double>, size_t>>(std::move(values), 0);
    return [state]() {
        const auto value = state->first[state->second % state->first.size()];
        state->second++;
        return value;
    };
}

std::function<double()> makeConstantProvider(double value)
{
    return [value]() { return value; };
}
} // namespace ulidgen::tests
