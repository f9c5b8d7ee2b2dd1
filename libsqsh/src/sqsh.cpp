/**
 * @file sqsh.cpp
 * @brief Implementation of the public Sqsh API.
 */

#include "../include/sqsh.hpp"

#include "../include/app_context.hpp"
#include "../include/codec_registry.hpp"
#include "../include/directory_scanner.hpp"
#include "../include/event_bus.hpp"
#include "../include/events.hpp"
#include "../include/file_utils.hpp"
#include "../include/logger.hpp"
#include "../include/transform_pipeline.hpp"

#include <atomic>
#include <mutex>
#include <system_error>

namespace sqsh {

namespace {

// observer slot shared between a Sqsh instance and its log sink, which
// outlives the instance inside the static Logger
struct ObserverSlot {
    std::atomic<SqshObserver*> observer = nullptr;
};

// bridge sink to redirect static logs to the instance observer
class BridgeLogSink final : public ILogSink {
    std::shared_ptr<ObserverSlot> slot_;
public:
    explicit BridgeLogSink(std::shared_ptr<ObserverSlot> slot) : slot_(std::move(slot)) {}

    void log(const LogLevel level, const std::string_view message, const std::string_view tag) override {
        if (auto* observer = slot_->observer.load()) {
            observer->on_log(level, std::string(message), std::string(tag));
        }
    }
};

} // namespace

struct Sqsh::Impl {
    CodecRegistry registry;
    TransformPipeline pipeline{registry};
    EventBus event_bus;
    AppContext context;

    unsigned num_threads = BatchExecutor::kDefaultThreads;

    std::shared_ptr<ObserverSlot> slot = std::make_shared<ObserverSlot>();
    bool sink_installed = false;
    // held while the running executor is published, cleared or stopped
    std::mutex executor_mtx;
    BatchExecutor* current_executor = nullptr;

    explicit Impl(std::unique_ptr<IConfigStore> store) : context(std::move(store)) {
        context.load();
        setup_event_bridging();
    }

    ~Impl() {
        slot->observer.store(nullptr);
    }

    template <typename Fn>
    void notify(Fn&& fn) {
        if (auto* observer = slot->observer.load()) fn(*observer);
    }

    void setup_event_bridging() {
        event_bus.subscribe<TransformStartEvent>([this](const TransformStartEvent& e) {
            notify([&](SqshObserver& o) { o.on_file_start(e.path); });
        });
        event_bus.subscribe<TransformCompleteEvent>([this](const TransformCompleteEvent& e) {
            notify([&](SqshObserver& o) { o.on_file_finish(e.path, e.output_path, e.original_size, e.new_size); });
        });
        event_bus.subscribe<TransformSkippedEvent>([this](const TransformSkippedEvent& e) {
            notify([&](SqshObserver& o) { o.on_file_skipped(e.path, e.reason); });
        });
        event_bus.subscribe<TransformErrorEvent>([this](const TransformErrorEvent& e) {
            notify([&](SqshObserver& o) { o.on_file_error(e.path, e.kind, e.error_message); });
        });
    }
};

Sqsh::Sqsh() : Sqsh(std::make_unique<JsonConfigStore>()) {}

Sqsh::Sqsh(std::unique_ptr<IConfigStore> store) : impl_(std::make_unique<Impl>(std::move(store))) {}

Sqsh::~Sqsh() {
    if (impl_) stop();
}

Sqsh::Sqsh(Sqsh&&) noexcept = default;
Sqsh& Sqsh::operator=(Sqsh&&) noexcept = default;

Sqsh& Sqsh::threads(const unsigned val) {
    impl_->num_threads = val > 0 ? val : BatchExecutor::kDefaultThreads;
    return *this;
}

void Sqsh::set_observer(SqshObserver* observer) {
    impl_->slot->observer.store(observer);
    // inject bridge sink once
    if (observer && !impl_->sink_installed) {
        Logger::add_sink(std::make_unique<BridgeLogSink>(impl_->slot));
        impl_->sink_installed = true;
    }
}

TransformOutcome Sqsh::optimize_or_convert(const std::filesystem::path& file,
                                           const bool overwrite,
                                           const std::optional<std::string>& target_format) {
    return impl_->pipeline.run(file, overwrite, target_format);
}

std::vector<BatchResult> Sqsh::optimize_batch(const std::vector<std::filesystem::path>& files,
                                              const bool overwrite,
                                              const std::optional<std::string>& target_format) {
    const auto target = TransformPipeline::parse_target(target_format);

    std::vector<TransformRequest> requests;
    requests.reserve(files.size());
    for (const auto& f : files) {
        requests.push_back(TransformRequest{f, overwrite, target});
    }

    BatchExecutor executor(impl_->pipeline, impl_->event_bus, impl_->num_threads);

    // unpublishes the executor before it is destroyed, on every exit path
    struct Registration {
        Impl& impl;

        Registration(Impl& i, BatchExecutor& e) : impl(i) {
            std::lock_guard lock(impl.executor_mtx);
            impl.current_executor = &e;
        }

        ~Registration() {
            std::lock_guard lock(impl.executor_mtx);
            impl.current_executor = nullptr;
        }
    } registration(*impl_, executor);

    return executor.run(requests);
}

std::filesystem::path Sqsh::package_archive(const std::vector<ArchiveEntry>& entries,
                                            const std::filesystem::path& destination) {
    return ArchivePackager::package(entries, destination);
}

void Sqsh::copy_file(const std::filesystem::path& source, const std::filesystem::path& destination) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        throw SqshError(ErrorKind::NotFound, "File not found: " + source.string());
    }
    copy_file_or_throw(source, destination);
    Logger::log(LogLevel::Info, "Saved " + source.string() + " to " + destination.string(), "sqsh");
}

std::vector<std::filesystem::path> Sqsh::scan_inputs(const std::vector<std::filesystem::path>& paths) {
    return collect_input_files(paths);
}

AppConfig Sqsh::get_settings() const {
    return impl_->context.settings();
}

AppConfig Sqsh::update_settings(const SettingsPatch& patch) {
    return impl_->context.update_settings(patch);
}

AppContext& Sqsh::context() {
    return impl_->context;
}

void Sqsh::stop() {
    std::lock_guard lock(impl_->executor_mtx);
    if (impl_->current_executor) {
        impl_->current_executor->request_stop();
    }
}

} // namespace sqsh
