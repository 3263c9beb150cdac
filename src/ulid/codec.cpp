#include "ulid/codec.hpp"

#include <algorithm>

namespace ulidgen::codec {
std::string encode(uint64_t value, size_t length)
{
    std::string result(length, ALPHABET[0]);

    // Заполняем строку с конца: очередной остаток от деления - следующий младший разряд
    for (size_t i = length; i > 0; i--) {
        result[i - 1] = ALPHABET[value % BASE];
        value /= BASE;
    }

    return result;
}

bool fitsInLength(uint64_t value, size_t length)
{
    // 64-битное число всегда помещается в 13 символов (13 * 5 = 65 бит)
    if (length * BITS_PER_SYMBOL >= 64) {
        return true;
    }
    return (value >> (length * BITS_PER_SYMBOL)) == 0;
}

bool isAlphabetSymbol(char symbol)
{
    return std::find(ALPHABET.begin(), ALPHABET.end(), symbol) != ALPHABET.end();
}
} // namespace ulidgen::codec
