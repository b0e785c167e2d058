#pragma once

#include <string>

#include "token/entropy_source.hpp"
#include "token/errors.hpp"
#include "token/token.hpp"

namespace yyid {
/**
 * @enum EntropyMode
 * @brief Тип источника энтропии генератора
 */
enum class EntropyMode {
    SYSTEM, // Криптографически стойкий источник ОС (по умолчанию)
    FAST, // Некриптографический источник, только при явном выборе
    CUSTOM, // Внешний источник (например, детерминированный в тестах)
};

/**
 * @class TokenGenerator
 * @brief Генерирует токены, все 128 бит которых берутся из источника энтропии.
 *
 * В отличие от UUID v4 биты версии и варианта не фиксируются. Генератор не хранит
 * изменяемого состояния, поэтому generate() можно вызывать из нескольких потоков
 * одновременно.
 */
class TokenGenerator {
public:
    /**
     * @brief Генератор на системном криптографическом источнике.
     */
    TokenGenerator();

    /**
     * @brief Генератор на переданном источнике энтропии.
     * @param source Источник случайных байт
     */
    explicit TokenGenerator(EntropySource source);

    /**
     * @brief Генератор на быстром некриптографическом источнике.
     */
    static TokenGenerator createFast();

    /**
     * @brief Генерирует новый токен.
     * @return Новый токен
     * @throws EntropyUnavailable если источник не смог предоставить байты
     */
    Token generate() const;

    /**
     * @brief Тип используемого источника.
     */
    EntropyMode mode() const;

private:
    TokenGenerator(EntropySource source, EntropyMode mode);

    EntropySource source_; // Источник случайных байт
    EntropyMode mode_; // Тип источника
};

/**
 * @brief Строковое название режима источника ("system", "fast", "custom").
 */
const char *entropyModeName(EntropyMode mode);

/**
 * @brief Генерирует токен системным генератором.
 * @throws EntropyUnavailable
 */
Token generateToken();

/**
 * @brief Генерирует токен и возвращает его каноническое строковое представление.
 * @throws EntropyUnavailable
 */
std::string generateTokenString();
} // namespace yyid
