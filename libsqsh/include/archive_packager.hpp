/**
 * @file archive_packager.hpp
 * @brief Bundles files into a ZIP archive with collision-free entry names.
 */

#ifndef SQSH_ARCHIVE_PACKAGER_HPP
#define SQSH_ARCHIVE_PACKAGER_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace sqsh {

/**
 * @brief A file to add and the entry name it should get.
 */
struct ArchiveEntry {
    std::filesystem::path source_path;
    std::string desired_name;
};

/**
 * @brief Writes ZIP archives (stored, no compression) with libarchive.
 */
class ArchivePackager {
public:
    /**
     * @brief Packs entries, in order, into a ZIP at destination.
     *
     * Duplicate names within the call become "name (1).ext", "name (2).ext".
     * The archive is written beside the destination under a temporary name
     * and renamed only after every entry was stored, so a failure leaves no
     * destination file behind.
     *
     * @return destination
     * @throws SqshError (IOFailure) if any source cannot be read or the
     * archive cannot be written.
     */
    static std::filesystem::path package(const std::vector<ArchiveEntry>& entries,
                                         const std::filesystem::path& destination);

    /**
     * @brief Entry names package() would assign, in input order.
     */
    static std::vector<std::string> assign_entry_names(const std::vector<ArchiveEntry>& entries);
};

} // namespace sqsh

#endif // SQSH_ARCHIVE_PACKAGER_HPP
