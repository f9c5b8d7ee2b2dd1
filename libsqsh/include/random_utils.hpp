#ifndef SQSH_RANDOM_UTILS_HPP
#define SQSH_RANDOM_UTILS_HPP

#include <string>

/**
 * @brief Thread-local random helpers for unique temporary names.
 *
 * The underlying generator (std::mt19937_64) is thread-local and seeded
 * from std::random_device, so concurrent callers never share state and
 * need no lock.
 */
namespace sqsh::RandomUtils {

    /**
     * @brief Generates a random 64-bit unsigned integer.
     */
    unsigned long long next_u64();

    /**
     * @brief Generates a random token of 32 lowercase hex digits (128 bits).
     *
     * Used as the unique part of staged file names.
     */
    std::string unique_token();

} // namespace sqsh::RandomUtils

#endif // SQSH_RANDOM_UTILS_HPP
