#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <set>
#include <string>

#include "testing_utils.hpp"
#include "ulid/codec.hpp"

namespace ulidgen::tests {
// Проверка свойств алфавита
TEST(CodecTest, AlphabetInvariants)
{
    const auto &alphabet = codec::ALPHABET;
    EXPECT_EQ(32U, alphabet.size());

    // Все символы различны
    const std::set<char> unique(alphabet.begin(), alphabet.end());
    EXPECT_EQ(alphabet.size(), unique.size());

    // Порядок символов совпадает с порядком индексов
    EXPECT_TRUE(std::is_sorted(alphabet.begin(), alphabet.end()));

    // Нет визуально неоднозначных символов
    for (const auto ambiguous : { 'I', 'L', 'O', 'U' }) {
        EXPECT_FALSE(codec::isAlphabetSymbol(ambiguous)) << ambiguous;
    }
    // Все цифры присутствуют
    for (char digit = '0'; digit <= '9'; digit++) {
        EXPECT_TRUE(codec::isAlphabetSymbol(digit)) << digit;
    }
    EXPECT_FALSE(codec::isAlphabetSymbol('a'));
    EXPECT_FALSE(codec::isAlphabetSymbol('-'));
}

// Ноль кодируется нулевыми символами нужной длины
TEST(CodecTest, EncodeZeroIsPaddedWithZeroSymbol)
{
    for (size_t length = 1; length <= 20; length++) {
        EXPECT_EQ(std::string(length, '0'), codec::encode(0, length));
    }
}

TEST(CodecTest, EncodeZeroLengthIsEmpty)
{
    EXPECT_EQ("", codec::encode(0, 0));
    EXPECT_EQ("", codec::encode(123456789, 0));
}

// Известные значения
TEST(CodecTest, EncodeKnownValues)
{
    EXPECT_EQ("Z", codec::encode(31, 1));
    EXPECT_EQ("10", codec::encode(32, 2));
    EXPECT_EQ("15NM7", codec::encode(1234567, 5));
    EXPECT_EQ("01ARYZ6S41", codec::encode(1469918176385ULL, 10));
    EXPECT_EQ("7ZZZZZZZZZ", codec::encode((1ULL << 48) - 1, 10));
    EXPECT_EQ("0001ARYZ6S41", codec::encode(1469918176385ULL, 12));
}

// Старшие разряды, не поместившиеся в длину, отбрасываются
TEST(CodecTest, EncodeTruncatesHighOrderDigits)
{
    EXPECT_EQ("0", codec::encode(32, 1));
    EXPECT_EQ("M7", codec::encode(1234567, 2));
    EXPECT_EQ("ZZZZZZZZZZ", codec::encode((1ULL << 50) - 1, 10));
    EXPECT_EQ("0000000000", codec::encode(1ULL << 50, 10));
}

// Кодирование обратимо для значений, помещающихся в длину
TEST(CodecTest, EncodeDecodesBackToValue)
{
    for (size_t i = 0; i < 10000; i++) {
        const auto length = static_cast<size_t>(getRandomInt(1, 12));
        const auto maxValue = (1ULL << (length * codec::BITS_PER_SYMBOL)) - 1;
        const auto value = getRandomInt(0, maxValue);

        const auto encoded = codec::encode(value, length);
        ASSERT_EQ(length, encoded.size());
        ASSERT_TRUE(consistsOfAlphabet(encoded));
        ASSERT_EQ(value, decodeBase32(encoded));
    }

    const auto maxValue = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(maxValue, decodeBase32(codec::encode(maxValue, 13)));
}

// Порядок строк совпадает с порядком чисел
TEST(CodecTest, EncodePreservesOrdering)
{
    for (size_t i = 0; i < 10000; i++) {
        const auto a = getRandomInt(0, (1ULL << 48) - 1);
        const auto b = getRandomInt(0, (1ULL << 48) - 1);
        EXPECT_EQ(a < b, codec::encode(a, 10) < codec::encode(b, 10));
    }
}

TEST(CodecTest, FitsInLength)
{
    EXPECT_TRUE(codec::fitsInLength(0, 0));
    EXPECT_FALSE(codec::fitsInLength(1, 0));
    EXPECT_TRUE(codec::fitsInLength(31, 1));
    EXPECT_FALSE(codec::fitsInLength(32, 1));
    EXPECT_TRUE(codec::fitsInLength((1ULL << 50) - 1, 10));
    EXPECT_FALSE(codec::fitsInLength(1ULL << 50, 10));
    EXPECT_FALSE(codec::fitsInLength(std::numeric_limits<uint64_t>::max(), 12));
    EXPECT_TRUE(codec::fitsInLength(std::numeric_limits<uint64_t>::max(), 13));
    EXPECT_TRUE(codec::fitsInLength(std::numeric_limits<uint64_t>::max(), 100));
}
} // namespace ulidgen::tests
