#pragma once

/**
 * IdGenerator.hpp
 *
 * Source of task identifiers and generated filenames. Injected wherever
 * tasks are created so tests can use a deterministic sequence.
 */

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>

namespace courier::core {

class IdGenerator {
public:
    virtual ~IdGenerator() = default;

    /**
     * Produce a new identifier. Identifiers never repeat for the lifetime
     * of the generator and contain no path separator.
     */
    virtual std::string nextId() = 0;
};

/**
 * RandomIdGenerator - version 4 UUIDs
 *
 * The default generator draws from OpenSSL's CSPRNG; a seeded one uses a
 * Mersenne Twister and repeats its sequence for the same seed.
 */
class RandomIdGenerator : public IdGenerator {
public:
    RandomIdGenerator() = default;
    explicit RandomIdGenerator(uint32_t seed);

    /**
     * @throws std::runtime_error if the system random source fails
     */
    std::string nextId() override;

private:
    std::array<uint8_t, 16> randomBytes();

    std::mutex m_mutex;
    std::optional<std::mt19937> m_engine;
};

/**
 * SequentialIdGenerator - "<prefix><n>" with n counting up from 1
 */
class SequentialIdGenerator : public IdGenerator {
public:
    explicit SequentialIdGenerator(std::string prefix = "task_")
        : m_prefix(std::move(prefix)) {}

    std::string nextId() override {
        return m_prefix + std::to_string(++m_counter);
    }

private:
    std::string m_prefix;
    std::atomic<uint64_t> m_counter{0};
};

} // namespace courier::core
