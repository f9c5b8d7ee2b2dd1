#include "../../include/archive_packager.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/name_resolver.hpp"
#include "../../include/random_utils.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <ctime>
#include <memory>
#include <system_error>
#include <unordered_set>

namespace fs = std::filesystem;

namespace {

struct ArchiveWriteFree {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

struct ArchiveEntryFree {
    void operator()(archive_entry* e) const {
        if (e) archive_entry_free(e);
    }
};

using unique_archive = std::unique_ptr<archive, ArchiveWriteFree>;
using unique_archive_entry = std::unique_ptr<archive_entry, ArchiveEntryFree>;

std::string archive_message(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown libarchive error";
}

[[noreturn]] void fail(const std::string& message) {
    sqsh::Logger::log(sqsh::LogLevel::Error, message, "archive_packager");
    throw sqsh::SqshError(sqsh::ErrorKind::IOFailure, message);
}

// removes the partial archive unless committed
struct PartialFile {
    fs::path path;
    bool committed = false;

    ~PartialFile() {
        if (!committed) {
            std::error_code ec;
            if (fs::exists(path, ec)) {
                sqsh::remove_file_logged(path, "archive_packager");
            }
        }
    }
};

void write_entry(archive* a, const sqsh::ArchiveEntry& item, const std::string& name) {
    const sqsh::unique_FILE in(sqsh::open_file(item.source_path, "rb"));
    if (!in) {
        fail("Cannot read archive source: " + item.source_path.string());
    }

    std::error_code ec;
    const auto size = fs::file_size(item.source_path, ec);
    if (ec) {
        fail("Cannot stat archive source: " + item.source_path.string() + " (" + ec.message() + ")");
    }

    const unique_archive_entry entry(archive_entry_new());
    if (!entry) {
        fail("archive_entry_new failed");
    }
    archive_entry_set_pathname(entry.get(), name.c_str());
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));
    archive_entry_set_mtime(entry.get(), std::time(nullptr), 0);

    int r = archive_write_header(a, entry.get());
    if (r == ARCHIVE_WARN) {
        sqsh::Logger::log(sqsh::LogLevel::Warning, "LIBARCHIVE WARN: " + archive_message(a), "archive_packager");
    } else if (r != ARCHIVE_OK) {
        fail("archive_write_header: " + archive_message(a) + " for " + name);
    }

    char buffer[64 * 1024];
    std::uintmax_t written = 0;
    size_t n;
    while ((n = std::fread(buffer, 1, sizeof(buffer), in.get())) > 0) {
        const la_ssize_t w = archive_write_data(a, buffer, n);
        if (w < 0 || static_cast<size_t>(w) != n) {
            fail("archive_write_data: " + archive_message(a) + " for " + name);
        }
        written += n;
    }
    if (std::ferror(in.get())) {
        fail("Read error on archive source: " + item.source_path.string());
    }
    if (written != size) {
        fail("Archive source changed while reading: " + item.source_path.string());
    }

    r = archive_write_finish_entry(a);
    if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
        fail("archive_write_finish_entry: " + archive_message(a) + " for " + name);
    }
}

} // namespace

namespace sqsh {

std::vector<std::string> ArchivePackager::assign_entry_names(const std::vector<ArchiveEntry>& entries) {
    std::unordered_set<std::string> used;
    std::vector<std::string> names;
    names.reserve(entries.size());
    for (const auto& e : entries) {
        names.push_back(resolve_unique_name(e.desired_name, used));
    }
    return names;
}

fs::path ArchivePackager::package(const std::vector<ArchiveEntry>& entries, const fs::path& destination) {
    const auto names = assign_entry_names(entries);

    PartialFile partial;
    partial.path = destination.parent_path() /
                   ("." + destination.filename().string() + "." + RandomUtils::unique_token() + ".part");

    Logger::log(LogLevel::Info,
                "Packing " + std::to_string(entries.size()) + " entries into " + destination.string(),
                "archive_packager");

    {
        const unique_archive a(archive_write_new());
        if (!a) {
            fail("archive_write_new failed");
        }
        if (archive_write_set_format_zip(a.get()) != ARCHIVE_OK) {
            fail("archive_write_set_format_zip: " + archive_message(a.get()));
        }
        if (archive_write_set_format_option(a.get(), "zip", "compression", "store") < ARCHIVE_WARN) {
            fail("zip compression=store rejected: " + archive_message(a.get()));
        }
        if (archive_write_open_filename(a.get(), partial.path.string().c_str()) != ARCHIVE_OK) {
            fail("archive_write_open_filename: " + archive_message(a.get()) + " for " + partial.path.string());
        }

        for (size_t i = 0; i < entries.size(); ++i) {
            write_entry(a.get(), entries[i], names[i]);
            Logger::log(LogLevel::Debug, "Stored " + entries[i].source_path.string() + " as " + names[i],
                        "archive_packager");
        }

        if (archive_write_close(a.get()) != ARCHIVE_OK) {
            fail("archive_write_close: " + archive_message(a.get()));
        }
    }

    std::error_code ec;
    fs::rename(partial.path, destination, ec);
    if (ec) {
        fail("Cannot move archive into place: " + destination.string() + " (" + ec.message() + ")");
    }
    partial.committed = true;

    Logger::log(LogLevel::Info, "Archive written: " + destination.string(), "archive_packager");
    return destination;
}

} // namespace sqsh
