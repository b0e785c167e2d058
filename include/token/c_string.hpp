#pragma once

#include "token/token_generator.hpp"

namespace yyid {
/**
 * @brief Генерирует токен и возвращает его каноническое представление в виде C-строки.
 *
 * Основа yyid_c_string(). Исключения наружу не выходят: при любой ошибке она логируется и
 * возвращается nullptr.
 * @param generator Генератор токенов
 * @return Строка, выделенная через malloc() (освобождается yyid_c_string_free()), или nullptr
 */
char *cStringFrom(const TokenGenerator &generator) noexcept;
} // namespace yyid
