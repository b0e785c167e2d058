#include "yyid.h"

#include <cstdio>
#include <cstdlib>

#include "token/c_string.hpp"
#include "token/token_formatter.hpp"
#include "utils/logger.hpp"

namespace {
// Логирование ошибки C-интерфейса без выброса исключений
void reportFailure(const char *reason) noexcept
{
    try {
        LOG_ERROR << "yyid_c_string: " << reason;
    }
    catch (const std::exception &e) {
        // Логгер недоступен, остается только stderr
        std::fprintf(stderr, "YYID: yyid_c_string: %s (%s)\n", reason, e.what());
    }
}
} // namespace

namespace yyid {
char *cStringFrom(const TokenGenerator &generator) noexcept
{
    // Исключения не должны пересекать границу C-интерфейса
    Token token;
    try {
        token = generator.generate();
    }
    catch (const EntropyUnavailable &e) {
        reportFailure(e.what());
        return nullptr;
    }
    catch (const std::exception &e) {
        reportFailure(e.what());
        return nullptr;
    }

    auto *result = static_cast<char *>(std::malloc(HYPHENATED_LENGTH + 1));
    if (result == nullptr) {
        reportFailure("не удалось выделить память под строку");
        return nullptr;
    }

    const auto length = encode(token, result);
    result[length] = '\0';
    return result;
}
} // namespace yyid

extern "C" char *yyid_c_string(void)
{
    static const yyid::TokenGenerator generator;
    return yyid::cStringFrom(generator);
}

extern "C" void yyid_c_string_free(char *str)
{
    std::free(str);
}
