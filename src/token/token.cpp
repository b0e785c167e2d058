#include "token/token.hpp"

#include <algorithm>
#include <cstring>

#include "token/token_formatter.hpp"

namespace yyid {
bool Token::isNil() const noexcept
{
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t byte) { return byte == 0; });
}

std::ostream &operator<<(std::ostream &out, const Token &token)
{
    char buffer[HYPHENATED_LENGTH];
    const auto length = encode(token, buffer);
    return out.write(buffer, static_cast<std::streamsize>(length));
}
} // namespace yyid

namespace std {
size_t hash<yyid::Token>::operator()(const yyid::Token &token) const noexcept
{
    // Все биты токена случайны, достаточно смешать две половины
    uint64_t high = 0;
    uint64_t low = 0;
    std::memcpy(&high, token.bytes().data(), sizeof(high));
    std::memcpy(&low, token.bytes().data() + sizeof(high), sizeof(low));
    return static_cast<size_t>(high ^ (low + 0x9e3779b97f4a7c15ULL + (high << 6) + (high >> 2)));
}
} // namespace std
