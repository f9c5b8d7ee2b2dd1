#include <cassert>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "../include/errors.hpp"
#include "../include/staged_write.hpp"
#include "test_support.hpp"

using namespace sqsh;
namespace fs = std::filesystem;

int main() {
    std::cout << "[Test] Starting Staged Write Test..." << std::endl;

    test::TempDir dir("sqsh_staged");
    const std::string original(1000, 'o');

    // no improvement, no format change: skipped, source untouched
    {
        const auto src = dir / "skip_me.png";
        test::write_bytes(src, original);
        const auto out = StagedWriteCoordinator::run(src, "png", false, true, [](const fs::path& staged) {
            test::write_bytes(staged, std::string(1200, 'n'));
        });
        assert(out.skipped);
        assert(out.saved_bytes == 0);
        assert(out.output_path == src);
        assert(out.original_size == 1000);
        assert(out.new_size == 1000);
        assert(test::read_bytes(src) == original);
        assert(test::staged_leftovers("skip_me") == 0);
    }

    // equal size counts as no improvement
    {
        const auto src = dir / "equal.png";
        test::write_bytes(src, original);
        const auto out = StagedWriteCoordinator::run(src, "png", false, false, [](const fs::path& staged) {
            test::write_bytes(staged, std::string(1000, 'n'));
        });
        assert(out.skipped);
        assert(test::staged_leftovers("equal") == 0);
    }

    // smaller result, overwrite: source replaced in place
    {
        const auto src = dir / "shrink.png";
        test::write_bytes(src, original);
        const std::string optimized(400, 's');
        const auto out = StagedWriteCoordinator::run(src, "png", false, true, [&](const fs::path& staged) {
            test::write_bytes(staged, optimized);
        });
        assert(!out.skipped);
        assert(out.output_path == src);
        assert(out.new_size == 400);
        assert(out.saved_bytes == 600);
        assert(test::read_bytes(src) == optimized);
        assert(test::staged_leftovers("shrink") == 0);
    }

    // smaller result, no overwrite: staged file is returned, source kept
    {
        const auto src = dir / "keep.png";
        test::write_bytes(src, original);
        const auto out = StagedWriteCoordinator::run(src, "png", false, false, [](const fs::path& staged) {
            test::write_bytes(staged, std::string(10, 'k'));
        });
        assert(!out.skipped);
        assert(out.output_path != src);
        assert(out.output_path.parent_path() == fs::temp_directory_path() / "sqsh");
        assert(out.output_path.filename().string().starts_with("keep_"));
        assert(out.output_path.extension() == ".png");
        assert(out.output_path.stem().string().size() == std::string("keep_").size() + 32);
        assert(test::read_bytes(out.output_path) == std::string(10, 'k'));
        assert(test::read_bytes(src) == original);
        fs::remove(out.output_path);
    }

    // format change with overwrite: never deletes the source, even when larger
    {
        const auto src = dir / "photo.png";
        test::write_bytes(src, original);
        test::write_bytes(dir / "photo.jpg", "occupied");
        const auto out = StagedWriteCoordinator::run(src, "jpg", true, true, [](const fs::path& staged) {
            test::write_bytes(staged, std::string(5000, 'j'));
        });
        assert(!out.skipped);
        assert(out.saved_bytes == 0);
        assert(out.new_size == 5000);
        assert(out.output_path == dir / "photo (1).jpg");
        assert(fs::exists(src));
        assert(test::read_bytes(src) == original);
        assert(test::read_bytes(dir / "photo.jpg") == "occupied");
        assert(test::staged_leftovers("photo") == 0);
    }

    // empty result is an IOFailure and leaves nothing behind
    {
        const auto src = dir / "empty.png";
        test::write_bytes(src, original);
        bool threw = false;
        try {
            (void)StagedWriteCoordinator::run(src, "png", false, true, [](const fs::path& staged) {
                test::write_bytes(staged, "");
            });
        } catch (const SqshError& e) {
            threw = e.kind() == ErrorKind::IOFailure;
        }
        assert(threw);
        assert(test::read_bytes(src) == original);
        assert(test::staged_leftovers("empty") == 0);
    }

    // a failing transform propagates and the partial staged file is removed
    {
        const auto src = dir / "broken.png";
        test::write_bytes(src, original);
        bool threw = false;
        try {
            (void)StagedWriteCoordinator::run(src, "png", false, true, [](const fs::path& staged) {
                test::write_bytes(staged, "partial");
                throw std::runtime_error("codec exploded");
            });
        } catch (const std::runtime_error& e) {
            threw = std::string(e.what()) == "codec exploded";
        }
        assert(threw);
        assert(test::staged_leftovers("broken") == 0);
    }

    // StagedFile cleans up unless released
    {
        fs::path p;
        {
            StagedFile staged(dir / "raii.png", "png");
            p = staged.path();
            test::write_bytes(p, "x");
            assert(fs::exists(p));
        }
        assert(!fs::exists(p));

        fs::path kept;
        {
            StagedFile staged(dir / "raii.png", "png");
            test::write_bytes(staged.path(), "x");
            kept = staged.release();
        }
        assert(fs::exists(kept));
        fs::remove(kept);
    }

    std::cout << "[PASS] Staged Write Test." << std::endl;
    return 0;
}
