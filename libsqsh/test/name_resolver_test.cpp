#include <cassert>
#include <iostream>
#include <string>
#include <unordered_set>

#include "../include/name_resolver.hpp"
#include "test_support.hpp"

using namespace sqsh;

int main() {
    std::cout << "[Test] Starting Name Resolver Test..." << std::endl;

    // free name is returned unchanged
    {
        std::unordered_set<std::string> used;
        assert(resolve_unique_name("a.png", used) == "a.png");
        assert(used.contains("a.png"));
    }

    // numbered variants in increasing order, never repeated
    {
        std::unordered_set<std::string> used;
        assert(resolve_unique_name("a.png", used) == "a.png");
        assert(resolve_unique_name("a.png", used) == "a (1).png");
        assert(resolve_unique_name("a.png", used) == "a (2).png");
        assert(resolve_unique_name("b.png", used) == "b.png");
        assert(used.size() == 4);

        std::unordered_set<std::string> seen;
        for (int i = 0; i < 50; ++i) {
            const auto name = resolve_unique_name("photo.jpg", used);
            assert(!seen.contains(name));
            seen.insert(name);
        }
    }

    // gaps are filled first
    {
        std::unordered_set<std::string> used{"a.png", "a (2).png"};
        assert(resolve_unique_name("a.png", used) == "a (1).png");
        assert(resolve_unique_name("a.png", used) == "a (3).png");
    }

    // extension is the last dot only; dotfiles and bare names have none
    assert(numbered_name("archive.tar.gz", 1) == "archive.tar (1).gz");
    assert(numbered_name(".hidden", 1) == ".hidden (1)");
    assert(numbered_name("README", 2) == "README (2)");
    assert(numbered_name("dir/sub/a.png", 3) == "dir/sub/a (3).png");
    assert(numbered_name("a.png", 0) == "a.png");

    // predicate form
    {
        const auto name = resolve_unique_name("x.webp", [](const std::string& c) {
            return c == "x.webp" || c == "x (1).webp";
        });
        assert(name == "x (2).webp");
    }

    // filesystem form, including the self-overwrite exception
    {
        test::TempDir dir("sqsh_resolver");
        test::write_bytes(dir / "a.jpg", "x");
        test::write_bytes(dir / "a (1).jpg", "x");

        assert(resolve_unique_path(dir / "b.jpg") == dir / "b.jpg");
        assert(resolve_unique_path(dir / "a.jpg") == dir / "a (2).jpg");
        assert(resolve_unique_path(dir / "a.jpg", dir / "a.jpg") == dir / "a.jpg");
        assert(resolve_unique_path(dir / "a.jpg", dir / "other.jpg") == dir / "a (2).jpg");
    }

    std::cout << "[PASS] Name Resolver Test." << std::endl;
    return 0;
}
