#include "glfw_window_host.hpp"
#include <GLFW/glfw3.h>

std::vector<sqsh::Rect> GlfwWindowHost::monitors() const {
    std::vector<sqsh::Rect> result;

    int count = 0;
    GLFWmonitor** monitors = glfwGetMonitors(&count);
    if (!monitors || count <= 0) {
        return result;
    }
    result.reserve(static_cast<size_t>(count));
    // glfwGetMonitors lists the primary monitor first
    for (int i = 0; i < count; ++i) {
        sqsh::Rect r;
        glfwGetMonitorWorkarea(monitors[i], &r.x, &r.y, &r.width, &r.height);
        if (r.width > 0 && r.height > 0) {
            result.push_back(r);
        }
    }
    return result;
}

void GlfwWindowHost::apply_geometry(const sqsh::WindowState& state) {
    glfwSetWindowSizeLimits(window_, sqsh::kMinWindowWidth, sqsh::kMinWindowHeight, GLFW_DONT_CARE, GLFW_DONT_CARE);
    glfwSetWindowSize(window_, state.width, state.height);
    glfwSetWindowPos(window_, state.x, state.y);
}
