#include "../../include/staged_write.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/name_resolver.hpp"
#include "../../include/random_utils.hpp"
#include <chrono>
#include <system_error>

namespace fs = std::filesystem;

namespace sqsh {

    StagedFile::StagedFile(const fs::path& source, const std::string& extension) {
        std::string name = source.stem().string() + "_" + RandomUtils::unique_token();
        if (!extension.empty()) {
            name += "." + extension;
        }
        path_ = scratch_dir() / name;
    }

    StagedFile::~StagedFile() {
        if (owned_) {
            discard();
        }
    }

    void StagedFile::discard() {
        std::error_code ec;
        if (fs::exists(path_, ec)) {
            remove_file_logged(path_, "staged_write");
        }
        owned_ = false;
    }

    fs::path StagedFile::release() noexcept {
        owned_ = false;
        return path_;
    }

    TransformOutcome StagedWriteCoordinator::run(const fs::path& source,
                                                 const std::string& target_extension,
                                                 const bool format_changed,
                                                 const bool overwrite,
                                                 const TransformFn& transform) {
        const auto start = std::chrono::steady_clock::now();
        const auto elapsed = [&start] {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        };

        const auto original_size = file_size_or_throw(source);

        StagedFile staged(source, target_extension);
        Logger::log(LogLevel::Debug, "Staging " + source.string() + " -> " + staged.path().string(), "staged_write");

        transform(staged.path());

        std::error_code ec;
        const auto new_size = fs::file_size(staged.path(), ec);
        if (ec) {
            throw SqshError(ErrorKind::IOFailure,
                            "Transform produced no readable output for " + source.string() + " (" + ec.message() + ")");
        }
        if (new_size == 0) {
            throw SqshError(ErrorKind::IOFailure, "Transform produced an empty file for " + source.string());
        }

        TransformOutcome outcome;
        outcome.original_size = original_size;

        if (!format_changed && new_size >= original_size) {
            staged.discard();
            outcome.new_size = original_size;
            outcome.saved_bytes = 0;
            outcome.output_path = source;
            outcome.skipped = true;
            outcome.duration = elapsed();
            Logger::log(LogLevel::Info,
                        "No size improvement for " + source.string() + " (" + std::to_string(new_size) +
                        " >= " + std::to_string(original_size) + "), kept original",
                        "staged_write");
            return outcome;
        }

        outcome.new_size = new_size;
        outcome.saved_bytes = new_size < original_size ? original_size - new_size : 0;

        if (overwrite && !format_changed) {
            copy_file_or_throw(staged.path(), source);
            staged.discard();
            outcome.output_path = source;
        } else if (overwrite) {
            const fs::path desired = source.parent_path() / (source.stem().string() + "." + target_extension);
            const fs::path target = resolve_unique_path(desired, source);
            copy_file_or_throw(staged.path(), target);
            staged.discard();
            outcome.output_path = target;
        } else {
            outcome.output_path = staged.release();
        }

        outcome.duration = elapsed();
        Logger::log(LogLevel::Info,
                    "Committed " + outcome.output_path.string() + " (" + std::to_string(original_size) +
                    " -> " + std::to_string(new_size) + " bytes)",
                    "staged_write");
        return outcome;
    }

} // namespace sqsh
