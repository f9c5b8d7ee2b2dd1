#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include <archive.h>
#include <archive_entry.h>

#include "../include/archive_packager.hpp"
#include "../include/errors.hpp"
#include "test_support.hpp"

using namespace sqsh;
namespace fs = std::filesystem;

struct StoredEntry {
    std::string name;
    std::string data;
};

static std::vector<StoredEntry> read_zip(const fs::path& zip) {
    std::vector<StoredEntry> out;
    archive* a = archive_read_new();
    archive_read_support_format_zip(a);
    const int r = archive_read_open_filename(a, zip.string().c_str(), 10240);
    assert(r == ARCHIVE_OK);

    archive_entry* entry = nullptr;
    while (archive_read_next_header(a, &entry) == ARCHIVE_OK) {
        StoredEntry e;
        e.name = archive_entry_pathname(entry);
        char buf[4096];
        la_ssize_t n;
        while ((n = archive_read_data(a, buf, sizeof(buf))) > 0) {
            e.data.append(buf, static_cast<size_t>(n));
        }
        out.push_back(e);
    }
    archive_read_free(a);
    return out;
}

static size_t partial_files(const fs::path& dir) {
    size_t n = 0;
    for (const auto& e : fs::directory_iterator(dir)) {
        if (e.path().extension() == ".part") ++n;
    }
    return n;
}

int main() {
    std::cout << "[Test] Starting Archive Packager Test..." << std::endl;

    test::TempDir dir("sqsh_archive");
    test::write_bytes(dir / "in" / "one.jpg", "first");
    test::write_bytes(dir / "in" / "two.jpg", "second file");
    test::write_bytes(dir / "in" / "three.png", "third");
    test::write_bytes(dir / "in" / "four.jpg", "fourth");

    // duplicate desired names get numbered in input order
    const std::vector<ArchiveEntry> entries = {
        {dir / "in" / "one.jpg", "a.jpg"},
        {dir / "in" / "two.jpg", "a.jpg"},
        {dir / "in" / "three.png", "b.png"},
        {dir / "in" / "four.jpg", "a.jpg"},
    };

    const auto names = ArchivePackager::assign_entry_names(entries);
    assert((names == std::vector<std::string>{"a.jpg", "a (1).jpg", "b.png", "a (2).jpg"}));

    const fs::path zip = dir / "out.zip";
    assert(ArchivePackager::package(entries, zip) == zip);
    assert(fs::exists(zip));
    assert(partial_files(dir.path()) == 0);

    const auto stored = read_zip(zip);
    assert(stored.size() == 4);
    assert(stored[0].name == "a.jpg" && stored[0].data == "first");
    assert(stored[1].name == "a (1).jpg" && stored[1].data == "second file");
    assert(stored[2].name == "b.png" && stored[2].data == "third");
    assert(stored[3].name == "a (2).jpg" && stored[3].data == "fourth");

    // an unreadable source aborts the archive and leaves nothing behind
    const fs::path broken = dir / "broken.zip";
    bool threw = false;
    try {
        ArchivePackager::package({{dir / "in" / "one.jpg", "x.jpg"}, {dir / "in" / "gone.jpg", "y.jpg"}}, broken);
    } catch (const SqshError& e) {
        threw = true;
        assert(e.kind() == ErrorKind::IOFailure);
    }
    assert(threw);
    assert(!fs::exists(broken));
    assert(partial_files(dir.path()) == 0);

    // an empty list still produces a valid archive
    const fs::path empty = dir / "empty.zip";
    ArchivePackager::package({}, empty);
    assert(fs::exists(empty));
    assert(read_zip(empty).empty());

    std::cout << "[PASS] Archive Packager Test." << std::endl;
    return 0;
}
