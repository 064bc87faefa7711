#pragma once

#include <stdexcept>
#include <string>

namespace ctrlhost::domain {

/**
 * @brief Источник криптографической энтропии недоступен
 *
 * Фатальная ошибка: выдача токена прерывается, откат на более слабый
 * источник запрещён.
 */
class EntropyUnavailableException : public std::runtime_error {
public:
    explicit EntropyUnavailableException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace ctrlhost::domain
