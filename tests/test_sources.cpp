#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <future>
#include <vector>

#include "ulid/codec.hpp"
#include "ulid/errors.hpp"
#include "ulid/sources.hpp"

namespace {
// Количество выборок при проверке источников случайных чисел
constexpr size_t SAMPLE_COUNT = 100000;

double nowSeconds()
{
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}
} // namespace

namespace ulidgen::tests {
// Источник времени по умолчанию совпадает с системными часами
TEST(SourcesTest, DefaultTimeProviderFollowsSystemClock)
{
    ASSERT_TRUE(sources::hasMillisecondClock());

    const auto provider = sources::defaultTimeProvider();
    ASSERT_TRUE(static_cast<bool>(provider));

    const auto before = nowSeconds();
    const auto value = provider();
    const auto after = nowSeconds();

    EXPECT_LE(before, value);
    EXPECT_GE(after, value);
}

// Время содержит дробную часть секунды
TEST(SourcesTest, DefaultTimeProviderHasSubSecondPrecision)
{
    const auto provider = sources::defaultTimeProvider();
    bool seenFraction = false;
    for (size_t i = 0; i < 1000 && !seenFraction; i++) {
        const auto value = provider();
        seenFraction = value != std::floor(value);
    }
    EXPECT_TRUE(seenFraction);
}

// Заглушка всегда выбрасывает исключение
TEST(SourcesTest, UnavailableTimeProviderThrows)
{
    const auto provider = sources::unavailableTimeProvider();
    EXPECT_THROW(provider(), SourceUnavailableError);
    EXPECT_THROW(provider(), SourceUnavailableError);
}

// Значения источника по умолчанию лежат в [0, 1) и покрывают все символы алфавита
TEST(SourcesTest, DefaultRandomProviderIsUniformInUnitInterval)
{
    const auto provider = sources::defaultRandomProvider();
    std::array<size_t, codec::ALPHABET.size()> buckets {};

    for (size_t i = 0; i < SAMPLE_COUNT; i++) {
        const auto value = provider();
        ASSERT_GE(value, 0.0);
        ASSERT_LT(value, 1.0);
        buckets[static_cast<size_t>(value * codec::BASE)]++;
    }

    // Ожидаем около 3125 попаданий в каждую корзину
    for (const auto count : buckets) {
        EXPECT_GT(count, SAMPLE_COUNT / codec::BASE / 2);
        EXPECT_LT(count, SAMPLE_COUNT / codec::BASE * 2);
    }
}

TEST(SourcesTest, SystemRandomProviderIsInUnitInterval)
{
    const auto provider = sources::systemRandomProvider();
    double minValue = 1.0;
    double maxValue = 0.0;
    for (size_t i = 0; i < SAMPLE_COUNT / 10; i++) {
        const auto value = provider();
        ASSERT_GE(value, 0.0);
        ASSERT_LT(value, 1.0);
        minValue = std::min(minValue, value);
        maxValue = std::max(maxValue, value);
    }
    EXPECT_LT(minValue, 0.1);
    EXPECT_GT(maxValue, 0.9);
}

// Источник по умолчанию можно вызывать из нескольких потоков одновременно
TEST(SourcesTest, DefaultRandomProviderConcurrentUse)
{
    constexpr size_t THREAD_COUNT = 8;
    const auto provider = sources::defaultRandomProvider();

    auto task = [&provider]() {
        for (size_t i = 0; i < SAMPLE_COUNT / THREAD_COUNT; i++) {
            const auto value = provider();
            if (value < 0.0 || value >= 1.0) {
                return false;
            }
        }
        return true;
    };

    std::vector<std::future<bool>> futures;
    for (size_t i = 0; i < THREAD_COUNT; i++) {
        futures.push_back(std::async(std::launch::async, task));
    }
    for (auto &future : futures) {
        EXPECT_TRUE(future.get());
    }
}
} // namespace ulidgen::tests
