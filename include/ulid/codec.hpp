#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ulidgen::codec {
// Алфавит Crockford Base32 (без I, L, O, U). Порядок символов совпадает с порядком индексов
inline constexpr std::array<char, 32> ALPHABET = { '0', '1', '2', '3', '4', '5', '6', '7',
                                                   '8', '9', 'A', 'B', 'C', 'D', 'E', 'F',
                                                   'G', 'H', 'J', 'K', 'M', 'N', 'P', 'Q',
                                                   'R', 'S', 'T', 'V', 'W', 'X', 'Y', 'Z' };

// Основание системы счисления
inline constexpr uint64_t BASE = ALPHABET.size();

// Количество бит, кодируемых одним символом
inline constexpr size_t BITS_PER_SYMBOL = 5;

/**
 * @brief Кодирует число в строку фиксированной длины
 *
 * Старший разряд идет первым, строка дополняется слева нулевым символом алфавита.
 * Если число не помещается в @p length символов, старшие разряды отбрасываются.
 *
 * @param value Кодируемое число
 * @param length Длина результирующей строки
 * @return Строка из @p length символов алфавита
 */
std::string encode(uint64_t value, size_t length);

/**
 * @brief Проверяет, помещается ли число в @p length символов без потери старших разрядов
 * @param value Проверяемое число
 * @param length Количество символов
 * @return true, если кодирование не приведет к усечению
 */
bool fitsInLength(uint64_t value, size_t length);

/**
 * @brief Проверяет принадлежность символа алфавиту
 * @param symbol Проверяемый символ
 * @return true, если символ входит в алфавит
 */
bool isAlphabetSymbol(char symbol);
} // namespace ulidgen::codec
