#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace yyid {
/**
 * @brief Источник случайных байт, передаваемый генератору.
 *
 * Функция должна полностью заполнить буфер указанного размера и вернуть true, либо вернуть
 * false, если байты получить не удалось. Вызовы могут выполняться одновременно из разных
 * потоков.
 */
using EntropySource = std::function<bool(uint8_t *buffer, size_t size)>;

/**
 * @brief Криптографически стойкий источник операционной системы.
 *
 * Unix: getrandom(2), Windows: BCryptGenRandom. Ошибка источника логируется.
 * @param buffer Буфер для заполнения
 * @param size Размер буфера
 * @return true, если буфер заполнен полностью
 */
bool readSystemEntropy(uint8_t *buffer, size_t size);

/**
 * @brief Быстрый некриптографический источник (mt19937_64 на поток).
 *
 * Значения предсказуемы, источник не должен использоваться для секретов. Генератор
 * каждого потока инициализируется при первом вызове из std::random_device.
 * @param buffer Буфер для заполнения
 * @param size Размер буфера
 * @return false, если не удалось инициализировать генератор потока (ошибка логируется)
 */
bool readFastEntropy(uint8_t *buffer, size_t size);

/**
 * @brief Источник по умолчанию (системный).
 */
EntropySource systemEntropySource();

/**
 * @brief Явно выбираемый быстрый некриптографический источник.
 */
EntropySource fastEntropySource();
} // namespace yyid
