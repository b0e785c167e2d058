#include <gtest/gtest.h>
#include <algorithm>
#include <cstring>
#include <string>

#include "testing_utils.hpp"
#include "token/token_formatter.hpp"

namespace yyid::tests {
class TokenFormatterTest : public ::testing::Test {
protected:
    const Token reference { REFERENCE_BYTES };
};

// Эталонный пример канонического представления
TEST_F(TokenFormatterTest, FormatterTestReference)
{
    const auto str = toString(reference);
    EXPECT_EQ(REFERENCE_STRING, str);
    EXPECT_EQ(HYPHENATED_LENGTH, str.length());
    EXPECT_TRUE(isCanonicalToken(str));

    // Формат по умолчанию совпадает с явно указанным каноническим
    EXPECT_EQ(str, toString(reference, TokenFormat::HYPHENATED, LetterCase::LOWER));
}

// Форматирование детерминировано
TEST_F(TokenFormatterTest, FormatterTestDeterministic)
{
    EXPECT_EQ(toString(reference), toString(reference));
    EXPECT_EQ(toString(reference), toString(Token(REFERENCE_BYTES)));
}

// Группы 8-4-4-4-12 соответствуют байтам 0-3, 4-5, 6-7, 8-9, 10-15
TEST_F(TokenFormatterTest, FormatterTestGroups)
{
    Token::Bytes bytes;
    for (size_t i = 0; i < bytes.size(); i++) {
        bytes[i] = static_cast<uint8_t>(i);
    }
    EXPECT_EQ("00010203-0405-0607-0809-0a0b0c0d0e0f", toString(Token(bytes)));

    Token::Bytes allOnes;
    allOnes.fill(0xFF);
    EXPECT_EQ("ffffffff-ffff-ffff-ffff-ffffffffffff", toString(Token(allOnes)));
    EXPECT_EQ("00000000-0000-0000-0000-000000000000", toString(Token::nil()));
}

// Альтернативные представления
TEST_F(TokenFormatterTest, FormatterTestAlternativeFormats)
{
    EXPECT_EQ("02e7f0f6067e8c92b25c12c9180540a9", toString(reference, TokenFormat::SIMPLE));
    EXPECT_EQ("urn:yyid:02e7f0f6-067e-8c92-b25c-12c9180540a9",
              toString(reference, TokenFormat::URN));
    EXPECT_EQ("{02e7f0f6-067e-8c92-b25c-12c9180540a9}", toString(reference, TokenFormat::BRACED));

    // Простое представление совпадает с каноническим без дефисов
    auto hyphenated = toString(reference);
    hyphenated.erase(std::remove(hyphenated.begin(), hyphenated.end(), '-'), hyphenated.end());
    EXPECT_EQ(hyphenated, toString(reference, TokenFormat::SIMPLE));
}

// Верхний регистр
TEST_F(TokenFormatterTest, FormatterTestUpperCase)
{
    EXPECT_EQ("02E7F0F6-067E-8C92-B25C-12C9180540A9",
              toString(reference, TokenFormat::HYPHENATED, LetterCase::UPPER));
    EXPECT_EQ("02E7F0F6067E8C92B25C12C9180540A9",
              toString(reference, TokenFormat::SIMPLE, LetterCase::UPPER));
    // Префикс URN остается в нижнем регистре
    EXPECT_EQ("urn:yyid:02E7F0F6-067E-8C92-B25C-12C9180540A9",
              toString(reference, TokenFormat::URN, LetterCase::UPPER));
    EXPECT_EQ("{02E7F0F6-067E-8C92-B25C-12C9180540A9}",
              toString(reference, TokenFormat::BRACED, LetterCase::UPPER));
}

// Длины представлений
TEST_F(TokenFormatterTest, FormatterTestLengths)
{
    for (const auto format :
         { TokenFormat::HYPHENATED, TokenFormat::SIMPLE, TokenFormat::URN, TokenFormat::BRACED }) {
        EXPECT_EQ(formattedLength(format), toString(reference, format).length());
        EXPECT_LE(formattedLength(format), MAX_FORMATTED_LENGTH);
    }
    EXPECT_EQ(36U, formattedLength(TokenFormat::HYPHENATED));
    EXPECT_EQ(32U, formattedLength(TokenFormat::SIMPLE));
    EXPECT_EQ(45U, formattedLength(TokenFormat::URN));
    EXPECT_EQ(38U, formattedLength(TokenFormat::BRACED));
}

// Запись в буфер не выходит за пределы представления
TEST_F(TokenFormatterTest, FormatterTestEncodeIntoBuffer)
{
    char buffer[MAX_FORMATTED_LENGTH + 4];
    std::memset(buffer, '#', sizeof(buffer));

    const auto written = encode(reference, buffer, TokenFormat::SIMPLE, LetterCase::LOWER);
    EXPECT_EQ(SIMPLE_LENGTH, written);
    EXPECT_EQ("02e7f0f6067e8c92b25c12c9180540a9", std::string(buffer, written));
    for (size_t i = written; i < sizeof(buffer); i++) {
        EXPECT_EQ('#', buffer[i]);
    }

    const auto braced = encode(reference, buffer, TokenFormat::BRACED);
    EXPECT_EQ(BRACED_LENGTH, braced);
    EXPECT_EQ('{', buffer[0]);
    EXPECT_EQ('}', buffer[braced - 1]);
    EXPECT_EQ('#', buffer[braced]);
}

// Имена форматов
TEST_F(TokenFormatterTest, FormatterTestFormatNames)
{
    for (const auto format :
         { TokenFormat::HYPHENATED, TokenFormat::SIMPLE, TokenFormat::URN, TokenFormat::BRACED }) {
        const auto parsed = formatFromString(formatName(format));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(format, *parsed);
    }

    EXPECT_FALSE(formatFromString("").has_value());
    EXPECT_FALSE(formatFromString("HYPHENATED").has_value());
    EXPECT_FALSE(formatFromString("compact").has_value());
}

// Отладочное представление используется и в сообщениях gtest
TEST_F(TokenFormatterTest, FormatterTestDebugString)
{
    EXPECT_EQ("YYID(\"02e7f0f6-067e-8c92-b25c-12c9180540a9\")", toDebugString(reference));
    EXPECT_EQ("YYID(\"00000000-0000-0000-0000-000000000000\")", toDebugString(Token::nil()));
    EXPECT_EQ(toDebugString(reference), ::testing::PrintToString(reference));
}
} // namespace yyid::tests
