#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "token/token.hpp"

namespace yyid {
/**
 * @enum TokenFormat
 * @brief Строковые представления токена
 */
enum class TokenFormat {
    HYPHENATED, // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx (каноническое)
    SIMPLE, // 32 hex-символа без дефисов
    URN, // urn:yyid:xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    BRACED, // {xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx}
};

/**
 * @enum LetterCase
 * @brief Регистр hex-символов
 */
enum class LetterCase { LOWER, UPPER };

// Длины представлений
constexpr size_t HYPHENATED_LENGTH = 36;
constexpr size_t SIMPLE_LENGTH = 32;
constexpr size_t URN_LENGTH = 45;
constexpr size_t BRACED_LENGTH = 38;

// Максимальная длина среди всех представлений
constexpr size_t MAX_FORMATTED_LENGTH = URN_LENGTH;

// Префикс URN-представления
constexpr std::string_view URN_PREFIX = "urn:yyid:";

/**
 * @brief Длина строкового представления в указанном формате.
 */
size_t formattedLength(TokenFormat format);

/**
 * @brief Записывает представление токена в буфер без выделения памяти.
 *
 * Завершающий нулевой символ не записывается.
 * @param token Токен
 * @param buffer Буфер размером не меньше formattedLength(format)
 * @param format Формат представления
 * @param letterCase Регистр hex-символов
 * @return Количество записанных символов
 */
size_t encode(const Token &token, char *buffer, TokenFormat format = TokenFormat::HYPHENATED,
              LetterCase letterCase = LetterCase::LOWER);

/**
 * @brief Каноническое строковое представление токена (36 символов в нижнем регистре).
 */
std::string toString(const Token &token);

/**
 * @brief Строковое представление токена в указанном формате.
 */
std::string toString(const Token &token, TokenFormat format,
                     LetterCase letterCase = LetterCase::LOWER);

/**
 * @brief Отладочное представление токена вида YYID("xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx").
 */
std::string toDebugString(const Token &token);

/**
 * @brief Имя формата ("hyphenated", "simple", "urn", "braced").
 */
const char *formatName(TokenFormat format);

/**
 * @brief Формат по его имени.
 * @param name Имя формата
 * @return Формат или std::nullopt для неизвестного имени
 */
std::optional<TokenFormat> formatFromString(std::string_view name);
} // namespace yyid
