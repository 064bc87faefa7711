#pragma once

#include "ports/output/IEntropySource.hpp"
#include "domain/exceptions/EntropyUnavailableException.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <climits>
#include <iostream>
#include <string>

namespace ctrlhost::adapters::secondary {

/**
 * @brief IEntropySource поверх OpenSSL RAND_bytes
 *
 * При отказе ГСЧ бросает EntropyUnavailableException с текстом ошибки
 * OpenSSL. Откат на std::random_device или mt19937 не делается.
 */
class OpenSslEntropySource : public ports::output::IEntropySource {
public:
    OpenSslEntropySource() {
        std::cout << "[OpenSslEntropySource] Created" << std::endl;
    }

    void fill(uint8_t* buffer, std::size_t size) override {
        if (size == 0) {
            return;
        }
        if (size > static_cast<std::size_t>(INT_MAX)) {
            throw domain::EntropyUnavailableException("Requested entropy block is too large");
        }

        if (RAND_bytes(buffer, static_cast<int>(size)) != 1) {
            throw domain::EntropyUnavailableException("RAND_bytes failed: " + lastError());
        }
    }

private:
    static std::string lastError() {
        unsigned long code = ERR_get_error();
        if (code == 0) {
            return "unknown error";
        }
        char text[256];
        ERR_error_string_n(code, text, sizeof(text));
        return text;
    }
};

} // namespace ctrlhost::adapters::secondary
