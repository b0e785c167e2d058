#include "token/token_formatter.hpp"

#include <cstring>
#include <iterator>

#include "utils/compiler.hpp"

namespace {
constexpr char LOWER_DIGITS[] = "0123456789abcdef";
constexpr char UPPER_DIGITS[] = "0123456789ABCDEF";

// Количество байт в каждой группе представления 8-4-4-4-12
constexpr size_t GROUP_BYTES[] = { 4, 2, 2, 2, 6 };

/**
 * @brief Записывает байты токена в hex-виде
 * @param bytes Байты токена
 * @param dst Буфер назначения
 * @param digits Таблица hex-символов нужного регистра
 * @param hyphens Разделять группы дефисами
 * @return Количество записанных символов
 */
size_t writeHex(const yyid::Token::Bytes &bytes, char *dst, const char *digits, bool hyphens)
{
    size_t pos = 0;
    size_t byteIndex = 0;
    for (size_t group = 0; group < std::size(GROUP_BYTES); group++) {
        if (hyphens && group > 0) {
            dst[pos++] = '-';
        }
        for (size_t i = 0; i < GROUP_BYTES[group]; i++) {
            const auto byte = bytes[byteIndex++];
            dst[pos++] = digits[byte >> 4];
            dst[pos++] = digits[byte & 0x0F];
        }
    }
    return pos;
}
} // namespace

namespace yyid {
size_t formattedLength(TokenFormat format)
{
    switch (format) {
    case TokenFormat::HYPHENATED:
        return HYPHENATED_LENGTH;
    case TokenFormat::SIMPLE:
        return SIMPLE_LENGTH;
    case TokenFormat::URN:
        return URN_LENGTH;
    case TokenFormat::BRACED:
        return BRACED_LENGTH;
    default:
        UNREACHABLE("Unsupported TokenFormat");
    }
}

size_t encode(const Token &token, char *buffer, TokenFormat format, LetterCase letterCase)
{
    const char *digits = letterCase == LetterCase::UPPER ? UPPER_DIGITS : LOWER_DIGITS;
    const auto &bytes = token.bytes();

    switch (format) {
    case TokenFormat::HYPHENATED:
        return writeHex(bytes, buffer, digits, true);
    case TokenFormat::SIMPLE:
        return writeHex(bytes, buffer, digits, false);
    case TokenFormat::URN:
        // Префикс URN всегда в нижнем регистре
        std::memcpy(buffer, URN_PREFIX.data(), URN_PREFIX.size());
        return URN_PREFIX.size() + writeHex(bytes, buffer + URN_PREFIX.size(), digits, true);
    case TokenFormat::BRACED: {
        buffer[0] = '{';
        const auto written = writeHex(bytes, buffer + 1, digits, true);
        buffer[written + 1] = '}';
        return written + 2;
    }
    default:
        UNREACHABLE("Unsupported TokenFormat");
    }
}

std::string toString(const Token &token)
{
    return toString(token, TokenFormat::HYPHENATED, LetterCase::LOWER);
}

std::string toString(const Token &token, TokenFormat format, LetterCase letterCase)
{
    char buffer[MAX_FORMATTED_LENGTH];
    const auto length = encode(token, buffer, format, letterCase);
    return std::string(buffer, length);
}

std::string toDebugString(const Token &token)
{
    return "YYID(\"" + toString(token) + "\")";
}

const char *formatName(TokenFormat format)
{
    switch (format) {
    case TokenFormat::HYPHENATED:
        return "hyphenated";
    case TokenFormat::SIMPLE:
        return "simple";
    case TokenFormat::URN:
        return "urn";
    case TokenFormat::BRACED:
        return "braced";
    default:
        UNREACHABLE("Unsupported TokenFormat");
    }
}

std::optional<TokenFormat> formatFromString(std::string_view name)
{
    if (name == "hyphenated")
        return TokenFormat::HYPHENATED;
    if (name == "simple")
        return TokenFormat::SIMPLE;
    if (name == "urn")
        return TokenFormat::URN;
    if (name == "braced")
        return TokenFormat::BRACED;
    return std::nullopt;
}
} // namespace yyid
