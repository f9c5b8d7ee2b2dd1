#include <GLFW/glfw3.h>
#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>
#include "glfw_window_host.hpp"
#include "../../libsqsh/include/app_context.hpp"
#include "../../libsqsh/include/logger.hpp"
#include "../../libsqsh/include/sqsh.hpp"
#include "../../libsqsh/include/window_geometry.hpp"
#include "../../sqsh_cli/src/utils/console_log_sink.hpp"

using namespace sqsh;
namespace fs = std::filesystem;

namespace {

struct ShellState {
    Sqsh* sqsh = nullptr;
    WindowGeometryManager* geometry = nullptr;
    std::mutex drop_mtx;
    std::vector<fs::path> dropped;
};

void glfw_error_callback(const int error, const char* description) {
    Logger::log(LogLevel::Error, "GLFW error " + std::to_string(error) + ": " + description, "shell");
}

void on_window_pos(GLFWwindow* window, const int x, const int y) {
    auto* state = static_cast<ShellState*>(glfwGetWindowUserPointer(window));
    if (state && state->geometry) state->geometry->on_moved(x, y);
}

void on_window_size(GLFWwindow* window, const int width, const int height) {
    auto* state = static_cast<ShellState*>(glfwGetWindowUserPointer(window));
    // minimized windows report 0x0
    if (state && state->geometry && width > 0 && height > 0) state->geometry->on_resized(width, height);
}

void on_drop(GLFWwindow* window, const int count, const char** paths) {
    auto* state = static_cast<ShellState*>(glfwGetWindowUserPointer(window));
    if (!state) return;
    std::lock_guard lock(state->drop_mtx);
    for (int i = 0; i < count; ++i) {
        state->dropped.emplace_back(paths[i]);
    }
    glfwPostEmptyEvent();
}

// runs a dropped batch with the saved overwrite/convert settings
void process_drop(Sqsh& sqsh, const std::vector<fs::path>& inputs) {
    const AppConfig config = sqsh.get_settings();
    const auto files = sqsh.scan_inputs(inputs);
    if (files.empty()) {
        Logger::log(LogLevel::Warning, "Nothing to optimize in the dropped items", "shell");
        return;
    }
    std::optional<std::string> target;
    if (config.convert_enabled) target = config.convert_format;

    try {
        for (const auto& r : sqsh.optimize_batch(files, config.overwrite, target)) {
            if (r.outcome) {
                Logger::log(LogLevel::Info,
                            r.source_path.filename().string() + ": " + std::to_string(r.outcome->saved_bytes) +
                            " bytes saved -> " + r.outcome->output_path.string(),
                            "shell");
            }
        }
    } catch (const SqshError& e) {
        Logger::log(LogLevel::Error, e.what(), "shell");
    }
}

} // namespace

int main() {
    auto consoleSink = std::make_unique<ConsoleLogSink>();
    consoleSink->log_level = LogLevel::Info;
    Logger::add_sink(std::move(consoleSink));

    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) {
        std::cerr << "Failed to initialize GLFW" << std::endl;
        return 1;
    }

    Sqsh sqsh;
    ShellState state;
    state.sqsh = &sqsh;

    glfwWindowHint(GLFW_CLIENT_API, GLFW_NO_API);
    glfwWindowHint(GLFW_VISIBLE, GLFW_FALSE);
    const WindowState initial = sqsh.context().window_state();
    GLFWwindow* window = glfwCreateWindow(initial.width, initial.height, "sqsh", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return 1;
    }
    glfwSetWindowUserPointer(window, &state);

    GlfwWindowHost host(window);
    WindowGeometryManager geometry(sqsh.context(), host);
    geometry.restore();
    state.geometry = &geometry;

    glfwSetWindowPosCallback(window, on_window_pos);
    glfwSetWindowSizeCallback(window, on_window_size);
    glfwSetDropCallback(window, on_drop);
    glfwShowWindow(window);

    std::atomic<bool> busy{false};
    std::jthread worker;

    while (!glfwWindowShouldClose(window)) {
        glfwWaitEvents();

        std::vector<fs::path> batch;
        if (!busy.load()) {
            std::lock_guard lock(state.drop_mtx);
            batch.swap(state.dropped);
        }
        if (!batch.empty()) {
            busy.store(true);
            glfwSetWindowTitle(window, "sqsh - working");
            worker = std::jthread([&sqsh, &busy, batch = std::move(batch)] {
                process_drop(sqsh, batch);
                busy.store(false);
                glfwPostEmptyEvent();
            });
        } else if (!busy.load()) {
            glfwSetWindowTitle(window, "sqsh");
        }
    }

    geometry.on_close();
    state.geometry = nullptr;

    sqsh.stop();
    if (worker.joinable()) worker.join();

    glfwDestroyWindow(window);
    glfwTerminate();
    Logger::clear_sinks();
    return 0;
}
