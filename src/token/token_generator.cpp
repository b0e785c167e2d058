#include "token/token_generator.hpp"

#include <utility>

#include "token/token_formatter.hpp"
#include "utils/compiler.hpp"
#include "utils/logger.hpp"

namespace yyid {
TokenGenerator::TokenGenerator()
    : TokenGenerator(systemEntropySource(), EntropyMode::SYSTEM)
{
}

TokenGenerator::TokenGenerator(EntropySource source)
    : TokenGenerator(std::move(source), EntropyMode::CUSTOM)
{
}

TokenGenerator::TokenGenerator(EntropySource source, EntropyMode mode)
    : source_(std::move(source))
    , mode_(mode)
{
}

TokenGenerator TokenGenerator::createFast()
{
    LOG_DEBUG << "Создан генератор на некриптографическом источнике";
    return TokenGenerator(fastEntropySource(), EntropyMode::FAST);
}

/**
 * Все 16 байт берутся из источника без изменений: в отличие от UUID v4 биты версии
 * (байт 6) и варианта (байт 8) не маскируются.
 */
Token TokenGenerator::generate() const
{
    Token::Bytes bytes;
    // Пустой источник равнозначен недоступному
    if (!source_ || !source_(bytes.data(), bytes.size())) {
        throw EntropyUnavailable(std::string("TokenGenerator: источник энтропии (")
                                 + entropyModeName(mode_) + ") не предоставил случайные байты");
    }
    return Token(bytes);
}

EntropyMode TokenGenerator::mode() const
{
    return mode_;
}

const char *entropyModeName(EntropyMode mode)
{
    switch (mode) {
    case EntropyMode::SYSTEM:
        return "system";
    case EntropyMode::FAST:
        return "fast";
    case EntropyMode::CUSTOM:
        return "custom";
    default:
        UNREACHABLE("Unsupported EntropyMode");
    }
}

Token generateToken()
{
    static const TokenGenerator generator;
    return generator.generate();
}

std::string generateTokenString()
{
    return toString(generateToken());
}
} // namespace yyid
