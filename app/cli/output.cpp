#include "cli/output.hpp"

#include <nlohmann/json.hpp>

#include "utils/logger.hpp"

namespace yyid::cli {
// Используем nlohmann::json для работы с JSON
using json = nlohmann::json;

std::string TokenBatch::toJson() const
{
    json jsonData;
    jsonData["format"] = formatName(format);
    jsonData["mode"] = entropyModeName(mode);
    jsonData["upper"] = letterCase == LetterCase::UPPER;

    json items = json::array();
    for (const auto &token : tokens) {
        items.push_back(toString(token, format, letterCase));
    }
    jsonData["tokens"] = std::move(items);

    return jsonData.dump();
}

void TokenBatch::writeLines(std::ostream &out) const
{
    char buffer[MAX_FORMATTED_LENGTH];
    for (const auto &token : tokens) {
        const auto length = encode(token, buffer, format, letterCase);
        out.write(buffer, static_cast<std::streamsize>(length));
        out << '\n';
    }
}

std::optional<TokenBatch> generateBatch(const TokenGenerator &generator, const Options &options)
{
    TokenBatch batch;
    batch.format = options.format;
    batch.letterCase = options.letterCase;
    batch.mode = generator.mode();
    batch.tokens.reserve(options.count);

    try {
        for (size_t i = 0; i < options.count; i++) {
            batch.tokens.push_back(generator.generate());
        }
    }
    catch (const EntropyUnavailable &e) {
        LOG_ERROR << "Ошибка генерации токена: " << e.what();
        return std::nullopt;
    }

    LOG_DEBUG << "Сгенерировано токенов: " << batch.tokens.size() << " (источник: "
              << entropyModeName(batch.mode) << ")";
    return batch;
}

int run(const TokenGenerator &generator, const Options &options, std::ostream &out)
{
    const auto batch = generateBatch(generator, options);
    if (!batch.has_value()) {
        return 1;
    }

    if (options.json) {
        out << batch->toJson() << std::endl;
    }
    else {
        batch->writeLines(out);
    }
    return 0;
}
} // namespace yyid::cli
