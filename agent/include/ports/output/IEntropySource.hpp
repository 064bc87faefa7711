#pragma once

#include <cstddef>
#include <cstdint>

namespace ctrlhost::ports::output {

/**
 * @brief Криптографически стойкий источник случайных байт
 */
class IEntropySource {
public:
    virtual ~IEntropySource() = default;

    /**
     * @brief Заполнить буфер случайными байтами
     *
     * @throws domain::EntropyUnavailableException если источник не смог
     *         выдать байты. Частично заполненный буфер использовать нельзя.
     */
    virtual void fill(uint8_t* buffer, std::size_t size) = 0;
};

} // namespace ctrlhost::ports::output
