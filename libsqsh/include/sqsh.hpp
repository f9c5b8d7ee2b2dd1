/**
 * @file sqsh.hpp
 * @brief Public API for the sqsh library.
 */

#ifndef SQSH_HPP
#define SQSH_HPP

#include "app_config.hpp"
#include "archive_packager.hpp"
#include "batch_executor.hpp"
#include "config_store.hpp"
#include "errors.hpp"
#include "log_sink.hpp"
#include "transform.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqsh {

class AppContext;

/**
 * @brief Receives progress and log messages. All callbacks may arrive from
 * worker threads, one at a time.
 */
struct SqshObserver {
    virtual ~SqshObserver() = default;

    virtual void on_file_start(const std::filesystem::path& path) {}

    virtual void on_file_finish(const std::filesystem::path& path,
                                const std::filesystem::path& output,
                                std::uintmax_t size_before,
                                std::uintmax_t size_after) {}

    virtual void on_file_skipped(const std::filesystem::path& path, const std::string& reason) {}

    virtual void on_file_error(const std::filesystem::path& path, ErrorKind kind, const std::string& error) {}

    virtual void on_log(LogLevel level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Command-style entry points of sqsh.
 *
 * @details Owns the codec registry, the application context (settings and
 * window geometry, loaded on construction) and the event bus. Uses PIMPL
 * to keep the codec libraries out of client builds.
 */
class Sqsh {
public:
    /// Settings are read from JsonConfigStore::default_path().
    Sqsh();

    explicit Sqsh(std::unique_ptr<IConfigStore> store);

    ~Sqsh();

    Sqsh(const Sqsh&) = delete;
    Sqsh& operator=(const Sqsh&) = delete;
    Sqsh(Sqsh&&) noexcept;
    Sqsh& operator=(Sqsh&&) noexcept;

    /**
     * @brief Worker threads for optimize_batch(). Default: 4.
     */
    Sqsh& threads(unsigned val);

    /**
     * @brief Sets the observer for progress events and log messages.
     * The caller retains ownership; pass nullptr to detach.
     */
    void set_observer(SqshObserver* observer);

    // --- Transforms ---

    /**
     * @brief Optimizes one file, or converts it when target_format is given.
     * @param target_format same, jpg, jpeg, png or webp.
     * @throws SqshError NotFound, UnsupportedFormat, CodecFailure, IOFailure.
     */
    TransformOutcome optimize_or_convert(const std::filesystem::path& file,
                                         bool overwrite,
                                         const std::optional<std::string>& target_format = std::nullopt);

    /**
     * @brief Transforms files concurrently. Blocks until all are done.
     *
     * Per-file failures are reported in the results and to the observer.
     * @throws SqshError (UnsupportedFormat) if target_format is invalid.
     */
    std::vector<BatchResult> optimize_batch(const std::vector<std::filesystem::path>& files,
                                            bool overwrite,
                                            const std::optional<std::string>& target_format = std::nullopt);

    // --- Files ---

    /// @see ArchivePackager::package
    std::filesystem::path package_archive(const std::vector<ArchiveEntry>& entries,
                                          const std::filesystem::path& destination);

    /**
     * @brief Copies source to destination, replacing it.
     * @throws SqshError NotFound or IOFailure.
     */
    void copy_file(const std::filesystem::path& source, const std::filesystem::path& destination);

    /// @see collect_input_files
    std::vector<std::filesystem::path> scan_inputs(const std::vector<std::filesystem::path>& paths);

    // --- Settings ---

    [[nodiscard]] AppConfig get_settings() const;

    /**
     * @brief Applies a patch and persists it.
     * @throws SqshError (UnsupportedFormat) for an invalid convert_format.
     */
    AppConfig update_settings(const SettingsPatch& patch);

    /// Shared with the window geometry manager of a GUI host.
    [[nodiscard]] AppContext& context();

    // --- Control ---

    /**
     * @brief Requests cancellation of a running batch.
     *
     * Thread-safe, but it takes a lock, so it must not be called from a
     * signal handler.
     */
    void stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sqsh

#endif // SQSH_HPP
