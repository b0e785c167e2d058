#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "cli/options.hpp"
#include "token/token.hpp"
#include "token/token_formatter.hpp"
#include "token/token_generator.hpp"

namespace yyid::cli {
/**
 * @struct TokenBatch
 * @brief Набор сгенерированных токенов вместе с параметрами вывода
 */
struct TokenBatch {
    std::vector<Token> tokens;
    TokenFormat format = TokenFormat::HYPHENATED;
    LetterCase letterCase = LetterCase::LOWER;
    EntropyMode mode = EntropyMode::SYSTEM;

    /**
     * @brief Сериализация набора в JSON
     * @return JSON-строка вида {"format": ..., "mode": ..., "tokens": [...]}
     */
    std::string toJson() const;

    /**
     * @brief Вывод токенов построчно
     * @param out Поток вывода
     */
    void writeLines(std::ostream &out) const;
};

/**
 * @brief Генерация набора токенов согласно параметрам запуска
 * @param generator Генератор токенов
 * @param options Параметры запуска
 * @return Набор токенов или std::nullopt, если источник энтропии недоступен (ошибка логируется)
 */
std::optional<TokenBatch> generateBatch(const TokenGenerator &generator, const Options &options);

/**
 * @brief Генерация и вывод токенов
 * @param generator Генератор токенов
 * @param options Параметры запуска
 * @param out Поток вывода
 * @return Код завершения: 0 при успехе, 1 при ошибке генерации
 */
int run(const TokenGenerator &generator, const Options &options, std::ostream &out);
} // namespace yyid::cli
