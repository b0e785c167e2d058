#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>

namespace yyid {
/**
 * @class Token
 * @brief 128-битный случайный токен (YYID).
 *
 * Внешне токен похож на UUID v4, однако все 128 бит являются данными: биты версии и
 * варианта не фиксируются. Любая последовательность из 16 байт является корректным
 * токеном, поэтому недопустимых состояний у класса нет. После создания токен не изменяется.
 */
class Token {
public:
    // Размер токена в байтах
    static constexpr size_t SIZE = 16;

    using Bytes = std::array<uint8_t, SIZE>;

    /**
     * @brief Создает нулевой токен (все байты равны 0).
     */
    constexpr Token() noexcept
        : bytes_ {}
    {
    }

    /**
     * @brief Создает токен из готовой последовательности байт.
     * @param bytes 16 байт токена, проверка не требуется.
     */
    constexpr explicit Token(const Bytes &bytes) noexcept
        : bytes_(bytes)
    {
    }

    /**
     * @brief Нулевой токен.
     */
    static constexpr Token nil() noexcept
    {
        return Token();
    }

    /**
     * @brief Проверяет, что все байты токена равны 0.
     */
    bool isNil() const noexcept;

    /**
     * @brief Байтовое представление токена.
     */
    constexpr const Bytes &bytes() const noexcept
    {
        return bytes_;
    }

    // Сравнение выполняется побайтово (лексикографически)
    friend bool operator==(const Token &lhs, const Token &rhs) noexcept
    {
        return lhs.bytes_ == rhs.bytes_;
    }
    friend bool operator!=(const Token &lhs, const Token &rhs) noexcept
    {
        return lhs.bytes_ != rhs.bytes_;
    }
    friend bool operator<(const Token &lhs, const Token &rhs) noexcept
    {
        return lhs.bytes_ < rhs.bytes_;
    }
    friend bool operator<=(const Token &lhs, const Token &rhs) noexcept
    {
        return lhs.bytes_ <= rhs.bytes_;
    }
    friend bool operator>(const Token &lhs, const Token &rhs) noexcept
    {
        return lhs.bytes_ > rhs.bytes_;
    }
    friend bool operator>=(const Token &lhs, const Token &rhs) noexcept
    {
        return lhs.bytes_ >= rhs.bytes_;
    }

private:
    Bytes bytes_;
};

/**
 * @brief Вывод токена в каноническом виде (xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx).
 */
std::ostream &operator<<(std::ostream &out, const Token &token);
} // namespace yyid

namespace std {
template <> struct hash<yyid::Token> {
    size_t operator()(const yyid::Token &token) const noexcept;
};
} // namespace std
