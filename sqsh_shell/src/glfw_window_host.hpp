#ifndef SQSH_GLFW_WINDOW_HOST_HPP
#define SQSH_GLFW_WINDOW_HOST_HPP

#include "../../libsqsh/include/window_geometry.hpp"

struct GLFWwindow;

/**
 * @brief IWindowHost over a GLFW window. Must be used on the GLFW main thread.
 */
class GlfwWindowHost final : public sqsh::IWindowHost {
public:
    explicit GlfwWindowHost(GLFWwindow* window) : window_(window) {}

    /// Work areas, primary monitor first.
    [[nodiscard]] std::vector<sqsh::Rect> monitors() const override;

    void apply_geometry(const sqsh::WindowState& state) override;

private:
    GLFWwindow* window_;
};

#endif // SQSH_GLFW_WINDOW_HOST_HPP
