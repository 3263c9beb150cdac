#pragma once

#include <optional>
#include <string>

#include "ulid/errors.hpp"
#include "ulid/sources.hpp"
#include "ulid/ulid_generator.hpp"

/**
 * Функции уровня процесса над общим экземпляром UlidGenerator.
 * Замена источника влияет на все последующие вызовы во всех потоках.
 */
namespace ulidgen {
/**
 * @brief Общий для процесса генератор с источниками по умолчанию
 * @return Ссылка на генератор
 */
UlidGenerator &defaultGenerator();

/**
 * @brief Генерирует ULID общим генератором
 * @param time Время в секундах с начала эпохи (если не указано - текущее)
 * @return Строка из 26 символов
 */
std::string generate(std::optional<double> time = std::nullopt);

/**
 * @brief Временная часть ULID, сформированная общим генератором
 */
std::string encodeTimeField(std::optional<double> time = std::nullopt,
                            size_t length = TIME_FIELD_LENGTH);

/**
 * @brief Случайная часть ULID, сформированная общим генератором
 */
std::string encodeRandomField(size_t length = RANDOM_FIELD_LENGTH);

/**
 * @brief Заменяет источник времени общего генератора
 * @throw ConfigurationError если источник пустой
 */
bool setTimeProvider(TimeProvider provider);

/**
 * @brief Заменяет источник случайных чисел общего генератора
 * @throw ConfigurationError если источник пустой
 */
bool setRandomProvider(RandomProvider provider);
} // namespace ulidgen
