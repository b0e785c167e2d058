#pragma once

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "token/token_formatter.hpp"
#include "utils/logger.hpp"

namespace yyid::cli {
/**
 * @struct Options
 * @brief Параметры запуска утилиты
 */
struct Options {
    size_t count = 1; // Количество генерируемых токенов
    TokenFormat format = TokenFormat::HYPHENATED; // Формат вывода
    LetterCase letterCase = LetterCase::LOWER; // Регистр hex-символов
    bool fast = false; // Некриптографический источник
    bool json = false; // Вывод в формате JSON
    bool help = false; // Показать справку
    utils::LogLevel logLevel = utils::LogLevel::WARNING; // Минимальный уровень логирования
};

/**
 * @brief Разбор аргументов командной строки
 * @param args Аргументы (без имени исполняемого файла)
 * @return Параметры запуска или std::nullopt при ошибке (ошибка логируется)
 */
std::optional<Options> parseOptions(std::vector<std::string> args);

/**
 * @brief Вывод справки
 * @param executable Имя исполняемого файла
 * @param out Поток вывода
 */
void printHelp(const char *executable, std::ostream &out);
} // namespace yyid::cli
