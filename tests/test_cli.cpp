#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

#include "cli/options.hpp"
#include "cli/output.hpp"
#include "testing_utils.hpp"

namespace yyid::tests {
using json = nlohmann::json;

// Значения по умолчанию
TEST(CliTest, OptionsDefaults)
{
    const auto options = cli::parseOptions({});
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(1U, options->count);
    EXPECT_EQ(TokenFormat::HYPHENATED, options->format);
    EXPECT_EQ(LetterCase::LOWER, options->letterCase);
    EXPECT_FALSE(options->fast);
    EXPECT_FALSE(options->json);
    EXPECT_FALSE(options->help);
    EXPECT_EQ(utils::LogLevel::WARNING, options->logLevel);
}

// Разбор всех поддерживаемых опций
TEST(CliTest, OptionsParsing)
{
    const auto options = cli::parseOptions(
        { "--count=5", "--format", "urn", "--upper", "--fast", "--json", "--verbose" });
    ASSERT_TRUE(options.has_value());
    EXPECT_EQ(5U, options->count);
    EXPECT_EQ(TokenFormat::URN, options->format);
    EXPECT_EQ(LetterCase::UPPER, options->letterCase);
    EXPECT_TRUE(options->fast);
    EXPECT_TRUE(options->json);
    EXPECT_EQ(utils::LogLevel::DEBUG, options->logLevel);

    const auto quiet = cli::parseOptions({ "--disable-warnings" });
    ASSERT_TRUE(quiet.has_value());
    EXPECT_EQ(utils::LogLevel::ERROR, quiet->logLevel);

    const auto help = cli::parseOptions({ "--count=abc", "--help" });
    ASSERT_TRUE(help.has_value());
    EXPECT_TRUE(help->help);
}

// Некорректные аргументы
TEST(CliTest, OptionsInvalid)
{
    EXPECT_FALSE(cli::parseOptions({ "--count=0" }).has_value());
    EXPECT_FALSE(cli::parseOptions({ "--count=-3" }).has_value());
    EXPECT_FALSE(cli::parseOptions({ "--count=12abc" }).has_value());
    EXPECT_FALSE(cli::parseOptions({ "--count=99999999999999999999999" }).has_value());
    EXPECT_FALSE(cli::parseOptions({ "--format=compact" }).has_value());
    EXPECT_FALSE(cli::parseOptions({ "--unknown" }).has_value());
}

// Построчный вывод
TEST(CliTest, OutputLines)
{
    cli::TokenBatch batch;
    batch.tokens = { Token(REFERENCE_BYTES), Token::nil() };
    batch.format = TokenFormat::BRACED;

    std::ostringstream out;
    batch.writeLines(out);
    EXPECT_EQ("{02e7f0f6-067e-8c92-b25c-12c9180540a9}\n"
              "{00000000-0000-0000-0000-000000000000}\n",
              out.str());
}

// Вывод в JSON
TEST(CliTest, OutputJson)
{
    cli::TokenBatch batch;
    batch.tokens = { Token(REFERENCE_BYTES) };
    batch.format = TokenFormat::SIMPLE;
    batch.letterCase = LetterCase::UPPER;
    batch.mode = EntropyMode::FAST;

    const auto parsed = json::parse(batch.toJson());
    EXPECT_EQ("simple", parsed["format"].get<std::string>());
    EXPECT_EQ("fast", parsed["mode"].get<std::string>());
    EXPECT_TRUE(parsed["upper"].get<bool>());
    ASSERT_EQ(1U, parsed["tokens"].size());
    EXPECT_EQ("02E7F0F6067E8C92B25C12C9180540A9", parsed["tokens"][0].get<std::string>());

    // Пустой набор сериализуется в пустой массив
    const auto empty = json::parse(cli::TokenBatch {}.toJson());
    EXPECT_TRUE(empty["tokens"].is_array());
    EXPECT_TRUE(empty["tokens"].empty());
}

// Генерация набора на внедренном источнике
TEST(CliTest, GenerateBatchWithInjectedSource)
{
    const std::vector<uint8_t> pattern(REFERENCE_BYTES.begin(), REFERENCE_BYTES.end());
    const TokenGenerator generator(makeSequenceSource(pattern));

    cli::Options options;
    options.count = 3;
    options.format = TokenFormat::URN;

    const auto batch = cli::generateBatch(generator, options);
    ASSERT_TRUE(batch.has_value());
    ASSERT_EQ(3U, batch->tokens.size());
    EXPECT_EQ(TokenFormat::URN, batch->format);
    EXPECT_EQ(EntropyMode::CUSTOM, batch->mode);
    for (const auto &token : batch->tokens) {
        EXPECT_EQ(Token(REFERENCE_BYTES), token);
    }

    std::ostringstream out;
    EXPECT_EQ(0, cli::run(generator, options, out));
    EXPECT_EQ(3 * (URN_LENGTH + 1), out.str().size());
}

// Недоступный источник энтропии приводит к коду завершения 1 без вывода токенов
TEST(CliTest, RunFailsOnEntropyFailure)
{
    auto calls = std::make_shared<std::atomic<size_t>>(0);
    const TokenGenerator failing(makeFailingSource(calls));

    cli::Options options;
    options.count = 5;
    EXPECT_FALSE(cli::generateBatch(failing, options).has_value());
    // Генерация прекращается на первой ошибке
    EXPECT_EQ(1U, calls->load());

    options.json = true;
    std::ostringstream out;
    EXPECT_EQ(1, cli::run(failing, options, out));
    EXPECT_TRUE(out.str().empty());
}
} // namespace yyid::tests
