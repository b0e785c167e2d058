#pragma once

#include <stdexcept>
#include <string>

namespace yyid {
/**
 * @class EntropyUnavailable
 * @brief Источник энтропии не смог предоставить случайные байты.
 *
 * Единственная ошибка библиотеки. Генератор никогда не подменяет источник более слабым,
 * решение о повторе или аварийном завершении принимает вызывающая сторона.
 */
class EntropyUnavailable : public std::runtime_error {
public:
    explicit EntropyUnavailable(const std::string &message)
        : std::runtime_error(message)
    {
    }
};
} // namespace yyid
