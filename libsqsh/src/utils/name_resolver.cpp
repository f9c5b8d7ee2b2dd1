#include "../../include/name_resolver.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace sqsh {

    std::string numbered_name(const std::string& desired, const unsigned long long n) {
        if (n == 0) return desired;

        const fs::path p(desired);
        const std::string stem = p.stem().string();
        const std::string ext = p.extension().string();
        const std::string name = stem + " (" + std::to_string(n) + ")" + ext;

        if (!p.has_parent_path()) return name;
        return (p.parent_path() / name).generic_string();
    }

    std::string resolve_unique_name(const std::string& desired,
                                    const std::function<bool(const std::string&)>& is_claimed) {
        for (unsigned long long n = 0;; ++n) {
            std::string candidate = numbered_name(desired, n);
            if (!is_claimed(candidate)) {
                return candidate;
            }
        }
    }

    std::string resolve_unique_name(const std::string& desired, std::unordered_set<std::string>& used) {
        std::string name = resolve_unique_name(desired, [&used](const std::string& candidate) {
            return used.contains(candidate);
        });
        used.insert(name);
        return name;
    }

    fs::path resolve_unique_path(const fs::path& desired, const std::optional<fs::path>& self) {
        const fs::path parent = desired.parent_path();
        const std::string filename = desired.filename().string();

        for (unsigned long long n = 0;; ++n) {
            const fs::path candidate = parent / numbered_name(filename, n);

            std::error_code ec;
            if (!fs::exists(candidate, ec) && !ec) {
                return candidate;
            }
            if (self) {
                std::error_code eq_ec;
                if (fs::equivalent(candidate, *self, eq_ec) && !eq_ec) {
                    return candidate;
                }
            }
        }
    }

} // namespace sqsh
