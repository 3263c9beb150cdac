#pragma once

#include <functional>

namespace ulidgen {
/**
 * Источник времени: возвращает количество секунд с начала эпохи Unix,
 * дробная часть содержит как минимум миллисекунды
 */
using TimeProvider = std::function<double()>;

/**
 * Источник случайных чисел: возвращает равномерно распределенное значение из [0, 1)
 */
using RandomProvider = std::function<double()>;

namespace sources {
/**
 * @brief Проверяет, что системные часы имеют разрешение не хуже миллисекунды
 * @return true, если часы пригодны для генерации временной части ULID
 */
bool hasMillisecondClock();

/**
 * @brief Источник времени по умолчанию
 *
 * Использует std::chrono::system_clock. Если разрешения часов недостаточно,
 * возвращается заглушка unavailableTimeProvider().
 *
 * @return Источник времени
 */
TimeProvider defaultTimeProvider();

/**
 * @brief Заглушка, выбрасывающая SourceUnavailableError при каждом вызове
 * @return Источник времени
 */
TimeProvider unavailableTimeProvider();

/**
 * @brief Источник случайных чисел по умолчанию
 *
 * Для каждого потока создается собственный std::mt19937_64, проинициализированный
 * из std::random_device, поэтому источник можно вызывать из нескольких потоков.
 *
 * @return Источник случайных чисел
 */
RandomProvider defaultRandomProvider();

/**
 * @brief Источник случайных чисел на основе std::random_device
 * @return Источник случайных чисел
 */
RandomProvider systemRandomProvider();
} // namespace sources
} // namespace ulidgen
