#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "ulid/sources.hpp"

namespace ulidgen {
// Длина временной части ULID (48 бит миллисекунд помещаются в 10 символов)
inline constexpr size_t TIME_FIELD_LENGTH = 10;
// Длина случайной части ULID
inline constexpr size_t RANDOM_FIELD_LENGTH = 16;
// Полная длина ULID
inline constexpr size_t ULID_LENGTH = TIME_FIELD_LENGTH + RANDOM_FIELD_LENGTH;

/**
 * @class UlidGenerator
 * @brief Генерирует ULID из временной метки и случайной части
 *
 * Источники времени и случайных чисел передаются при создании генератора
 * (пустые значения заменяются источниками по умолчанию) и могут быть заменены позже.
 * Каждый вызов генерации берет копию источников под разделяемой блокировкой, поэтому
 * замена источника во время генерации в других потоках безопасна: уже начатые вызовы
 * завершатся со старыми источниками.
 *
 * Монотонность внутри одной миллисекунды не гарантируется.
 */
class UlidGenerator {
public:
    /**
     * @brief Конструктор генератора
     * @param timeProvider Источник времени (пустой - источник по умолчанию)
     * @param randomProvider Источник случайных чисел (пустой - источник по умолчанию)
     */
    explicit UlidGenerator(TimeProvider timeProvider = {}, RandomProvider randomProvider = {});

    /**
     * @brief Генерирует новый ULID
     * @param time Время в секундах с начала эпохи (если не указано - берется из источника)
     * @return Строка из 26 символов
     * @throw RangeError если время отрицательное или не помещается во временную часть
     * @throw SourceUnavailableError если источник времени недоступен
     * @throw ProviderContractError если источник случайных чисел нарушил контракт
     */
    std::string generate(std::optional<double> time = std::nullopt) const;

    /**
     * @brief Генерирует несколько ULID подряд
     * @param count Количество идентификаторов
     * @param time Время в секундах с начала эпохи (если не указано - берется из источника)
     * @return Вектор идентификаторов в порядке генерации
     */
    std::vector<std::string> generateBatch(size_t count, std::optional<double> time) const;

    /**
     * @brief Формирует временную часть ULID
     * @param time Время в секундах с начала эпохи (если не указано - берется из источника)
     * @param length Длина результата
     * @return Строка из @p length символов
     * @throw RangeError если время отрицательное или не помещается в @p length символов
     */
    std::string encodeTimeField(std::optional<double> time = std::nullopt,
                                size_t length = TIME_FIELD_LENGTH) const;

    /**
     * @brief Формирует случайную часть ULID
     * @param length Длина результата
     * @return Строка из @p length символов
     * @throw ProviderContractError если источник вернул значение вне [0, 1)
     */
    std::string encodeRandomField(size_t length = RANDOM_FIELD_LENGTH) const;

    /**
     * @brief Заменяет источник времени
     * @param provider Новый источник
     * @return true
     * @throw ConfigurationError если источник пустой
     */
    bool setTimeProvider(TimeProvider provider);

    /**
     * @brief Заменяет источник случайных чисел
     * @param provider Новый источник
     * @return true
     * @throw ConfigurationError если источник пустой
     */
    bool setRandomProvider(RandomProvider provider);

private:
    mutable std::shared_mutex providersMutex_; // Защищает замену источников
    TimeProvider timeProvider_; // Текущий источник времени
    RandomProvider randomProvider_; // Текущий источник случайных чисел

    TimeProvider currentTimeProvider() const;
    RandomProvider currentRandomProvider() const;

    static std::string encodeTime(const TimeProvider &provider, std::optional<double> time,
                                  size_t length);
    static std::string encodeRandom(const RandomProvider &provider, size_t length);
};
} // namespace ulidgen
