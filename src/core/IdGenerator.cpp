// Courier - Identifier generation

#include "IdGenerator.hpp"

#include <openssl/rand.h>
#include <stdexcept>

namespace courier::core {

RandomIdGenerator::RandomIdGenerator(uint32_t seed)
    : m_engine(std::in_place, seed) {
}

std::array<uint8_t, 16> RandomIdGenerator::randomBytes() {
    std::array<uint8_t, 16> bytes{};

    if (!m_engine) {
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
            throw std::runtime_error("Failed to generate random bytes");
        }
        return bytes;
    }

    std::uniform_int_distribution<int> dis(0, 255);
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(dis(*m_engine));
    }
    return bytes;
}

std::string RandomIdGenerator::nextId() {
    static const char hex[] = "0123456789abcdef";

    std::array<uint8_t, 16> bytes;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        bytes = randomBytes();
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80); // variant

    std::string uuid;
    uuid.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            uuid.push_back('-');
        }
        uuid.push_back(hex[bytes[i] >> 4]);
        uuid.push_back(hex[bytes[i] & 0x0F]);
    }
    return uuid;
}

} // namespace courier::core
