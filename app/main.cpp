#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "cli/options.hpp"
#include "cli/output.hpp"
#include "token/token_generator.hpp"
#include "utils/logger.hpp"

int main(int argc, char *argv[])
{
    // Получение команды запуска
    const auto *executable = (argc > 0) ? argv[0] : "yyid";
    // Преобразование аргументов в вектор строк для удобства работы
    std::vector<std::string> args(argv + 1, argv + argc);

    // Инициализация логгера
    yyid::utils::Logger::getInstance().enable(true, std::nullopt,
                                              yyid::utils::LogLevel::WARNING, true);

    const auto options = yyid::cli::parseOptions(std::move(args));
    if (!options.has_value()) {
        yyid::cli::printHelp(executable, std::cerr);
        return 1;
    }

    if (options->help) {
        yyid::cli::printHelp(executable, std::cout);
        return 0;
    }

    yyid::utils::Logger::getInstance().setMinLogLevel(options->logLevel);

    // Быстрый источник используется только по явному запросу
    auto generator = yyid::TokenGenerator();
    if (options->fast) {
        LOG_WARNING << "Используется некриптографический источник: токены предсказуемы";
        generator = yyid::TokenGenerator::createFast();
    }

    return yyid::cli::run(generator, *options, std::cout);
}
