/**
 * @file staged_write.hpp
 * @brief Staging of transform results in the scratch directory and the
 * commit/skip policy applied to them.
 */

#ifndef SQSH_STAGED_WRITE_HPP
#define SQSH_STAGED_WRITE_HPP

#include "transform.hpp"
#include <filesystem>
#include <functional>
#include <string>

namespace sqsh {

    /**
     * @brief Owner of one uniquely named file in the scratch directory.
     *
     * The file is removed when the owner goes out of scope unless release()
     * was called, so every failure path cleans up after itself.
     */
    class StagedFile {
    public:
        /**
         * @brief Reserves "<scratch>/<stem>_<token>.<ext>". Nothing is created yet.
         * @throws SqshError (IOFailure) if the scratch directory is unavailable.
         */
        StagedFile(const std::filesystem::path& source, const std::string& extension);

        ~StagedFile();

        StagedFile(const StagedFile&) = delete;
        StagedFile& operator=(const StagedFile&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

        /// Removes the file now.
        void discard();

        /// Hands the file over to the caller; it will no longer be removed.
        std::filesystem::path release() noexcept;

    private:
        std::filesystem::path path_;
        bool owned_ = true;
    };

    /**
     * @brief Runs a transform into a staged file and decides its disposition.
     *
     * Skip: no format change and the result is not smaller. The staged file
     * is removed and the source reported unchanged.
     * Commit, overwrite + same format: the staged bytes replace the source.
     * Commit, overwrite + new format: the result is copied to
     * "<dir>/<stem>.<ext>" (collision-resolved on disk); the source stays.
     * Commit, no overwrite: the staged file itself is the result.
     */
    class StagedWriteCoordinator {
    public:
        using TransformFn = std::function<void(const std::filesystem::path& staged)>;

        /**
         * @param source Source file, must exist.
         * @param target_extension Extension (without dot) of the produced file.
         * @param format_changed True for a genuine format conversion.
         * @param overwrite Commit policy selector.
         * @param transform Writes the result to the given path; may throw.
         * @throws SqshError (IOFailure) on staging or commit failures. Exceptions
         * thrown by transform propagate unchanged after cleanup.
         */
        static TransformOutcome run(const std::filesystem::path& source,
                                    const std::string& target_extension,
                                    bool format_changed,
                                    bool overwrite,
                                    const TransformFn& transform);
    };

} // namespace sqsh

#endif // SQSH_STAGED_WRITE_HPP
