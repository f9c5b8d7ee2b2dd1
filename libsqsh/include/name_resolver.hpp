/**
 * @file name_resolver.hpp
 * @brief Collision-free naming: "a.png" -> "a (1).png" -> "a (2).png" ...
 */

#ifndef SQSH_NAME_RESOLVER_HPP
#define SQSH_NAME_RESOLVER_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>

namespace sqsh {

    /**
     * @brief Builds the n-th numbered variant of a name.
     *
     * The extension is everything from the last dot of the final component,
     * so "photo.tar.gz" gives "photo.tar (1).gz" and ".hidden" gives
     * ".hidden (1)". Any directory prefix is kept. n == 0 returns the name
     * unchanged.
     */
    std::string numbered_name(const std::string& desired, unsigned long long n);

    /**
     * @brief Returns the first of desired, "stem (1).ext", "stem (2).ext", ...
     * for which is_claimed() is false.
     */
    std::string resolve_unique_name(const std::string& desired,
                                    const std::function<bool(const std::string&)>& is_claimed);

    /**
     * @brief Set-based variant: resolves against used and records the
     * returned name in it, so repeated calls never return the same name.
     */
    std::string resolve_unique_name(const std::string& desired,
                                    std::unordered_set<std::string>& used);

    /**
     * @brief Filesystem variant: a candidate is claimed if it exists on disk.
     *
     * @param desired Desired target path.
     * @param self If set, a candidate referring to this file is accepted even
     * though it exists (in-place overwrite of the source).
     */
    std::filesystem::path resolve_unique_path(const std::filesystem::path& desired,
                                              const std::optional<std::filesystem::path>& self = std::nullopt);

} // namespace sqsh

#endif // SQSH_NAME_RESOLVER_HPP
