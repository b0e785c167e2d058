#include "cli/options.hpp"

#include <algorithm>
#include <cctype>
#include <ostream>
#include <stdexcept>

namespace {
// Верхняя граница количества токенов за один запуск
constexpr size_t MAX_TOKEN_COUNT = 1000000;

// Получение значения опции из аргументов командной строки
std::optional<std::string> getOptionValue(const std::string &option, std::vector<std::string> &args)
{
    for (size_t i = 0; i < args.size(); ++i) {
        const auto &arg = args[i];
        // Проверка формата `--option=value`
        const size_t pos = arg.find('=');
        if (pos != std::string::npos && arg.substr(0, pos) == option) {
            const std::string value = arg.substr(pos + 1);
            args.erase(args.begin() + i);
            return value;
        }
        // Проверка формата `--option value`
        if (arg == option && i + 1 < args.size()) {
            const std::string value = args[i + 1];
            args.erase(args.begin() + i, args.begin() + i + 2);
            return value;
        }
    }
    return std::nullopt;
}

// Проверка наличия флага в аргументах командной строки
bool hasFlag(const std::string &flag, std::vector<std::string> &args)
{
    auto it = std::find(args.begin(), args.end(), flag);
    if (it != args.end()) {
        args.erase(it);
        return true;
    }
    return false;
}

// Проверка оставшихся флагов: если флаги остались, то это ошибка
bool checkLastArgs(const std::vector<std::string> &args)
{
    if (args.empty()) {
        return true;
    }

    LOG_ERROR << "Ошибка: неизвестные аргументы:";
    for (const auto &arg : args) {
        LOG_ERROR << "\t" << arg;
    }
    return false;
}

// Разбор количества токенов
std::optional<size_t> parseCount(const std::string &value)
{
    if (value.empty() || !std::all_of(value.begin(), value.end(),
                                           [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return std::nullopt;
    }
    try {
        const auto count = std::stoull(value);
        if (count == 0 || count > MAX_TOKEN_COUNT) {
            return std::nullopt;
        }
        return static_cast<size_t>(count);
    }
    catch (const std::exception &e) {
        LOG_DEBUG << "Ошибка преобразования --count: " << e.what();
        return std::nullopt;
    }
}
} // namespace

namespace yyid::cli {
std::optional<Options> parseOptions(std::vector<std::string> args)
{
    Options options;

    if (hasFlag("--help", args)) {
        options.help = true;
        return options;
    }

    options.fast = hasFlag("--fast", args);
    options.json = hasFlag("--json", args);
    if (hasFlag("--upper", args)) {
        options.letterCase = LetterCase::UPPER;
    }

    // Уровень логирования: --verbose имеет приоритет над --disable-warnings
    const auto disableWarnings = hasFlag("--disable-warnings", args);
    const auto verbose = hasFlag("--verbose", args);
    if (verbose) {
        options.logLevel = utils::LogLevel::DEBUG;
    }
    else if (disableWarnings) {
        options.logLevel = utils::LogLevel::ERROR;
    }

    const auto countOption = getOptionValue("--count", args);
    if (countOption.has_value()) {
        const auto count = parseCount(*countOption);
        if (!count.has_value()) {
            LOG_ERROR << "Ошибка: некорректное значение для --count (ожидается число от 1 до "
                      << MAX_TOKEN_COUNT << "): " << *countOption;
            return std::nullopt;
        }
        options.count = *count;
    }

    const auto formatOption = getOptionValue("--format", args);
    if (formatOption.has_value()) {
        const auto format = formatFromString(*formatOption);
        if (!format.has_value()) {
            LOG_ERROR << "Ошибка: неизвестный формат для --format: " << *formatOption;
            return std::nullopt;
        }
        options.format = *format;
    }

    if (!checkLastArgs(args)) {
        return std::nullopt;
    }

    return options;
}

void printHelp(const char *executable, std::ostream &out)
{
    out << "Использование:\n"
        << "  " << executable << " [ОПЦИИ]\n\n"

        << "Описание:\n"
        << "  Генерирует случайные 128-битные токены, похожие на UUID v4,\n"
        << "  но все 128 бит которых являются случайными.\n\n"

        << "Опции:\n"
        << "  --count=ЧИСЛО                  Количество токенов (по умолчанию: 1)\n"
        << "  --format=ФОРМАТ                hyphenated | simple | urn | braced\n"
        << "                                 (по умолчанию: hyphenated)\n"
        << "  --upper                        Hex-символы в верхнем регистре\n"
        << "  --fast                         Некриптографический источник случайных чисел\n"
        << "  --json                         Вывод в формате JSON\n"
        << "  --verbose                      Подробное логирование\n"
        << "  --disable-warnings             Отключить вывод текстовых сообщений-предупреждений\n"
        << "  --help                         Показать справку\n";
}
} // namespace yyid::cli
