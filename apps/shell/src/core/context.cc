#include "core/context.h"

#include "deskbridge/core/logger.h"

#define GL_SILENCE_DEPRECATION
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>

namespace deskbridge {
namespace shell {
namespace core {

namespace {
void GlfwErrorCallback(int error, const char* description) {
    DESKBRIDGE_LOG_ERROR("GLFW Error " + std::to_string(error) + ": " + description);
}
} // namespace

GraphicsContext::GraphicsContext(const std::string& title, int width, int height)
    : title_(title) {
    if (!InitGLFW(title, width, height)) return;
    if (!InitImGui()) {
        Shutdown();
        return;
    }
}

GraphicsContext::~GraphicsContext() {
    Shutdown();
}

bool GraphicsContext::InitGLFW(const std::string& title, int width, int height) {
    glfwSetErrorCallback(GlfwErrorCallback);
    if (!glfwInit()) return false;

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 2);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);

    window_ = glfwCreateWindow(width, height, title.c_str(), nullptr, nullptr);
    if (!window_) {
        DESKBRIDGE_LOG_ERROR("Failed to create GLFW window.");
        glfwTerminate();
        return false;
    }

    glfwMakeContextCurrent(window_);
    glfwSwapInterval(1);
    return true;
}

bool GraphicsContext::InitImGui() {
    IMGUI_CHECKVERSION();
    imgui_ctx_ = ImGui::CreateContext();

    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    if (!ImGui_ImplGlfw_InitForOpenGL(window_, true)) return false;
    if (!ImGui_ImplOpenGL3_Init("#version 150")) {
        ImGui_ImplGlfw_Shutdown();
        return false;
    }
    backends_ready_ = true;
    return true;
}

bool GraphicsContext::ShouldClose() const {
    return window_ ? glfwWindowShouldClose(window_) : true;
}

void GraphicsContext::SetTitle(const std::string& title) {
    if (!window_ || title == title_) return;
    title_ = title;
    glfwSetWindowTitle(window_, title_.c_str());
}

void GraphicsContext::BeginFrame() {
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();
}

void GraphicsContext::EndFrame(bool dark_mode) {
    ImGui::Render();

    int display_w = 0;
    int display_h = 0;
    glfwGetFramebufferSize(window_, &display_w, &display_h);
    glViewport(0, 0, display_w, display_h);
    if (dark_mode) {
        glClearColor(0.08f, 0.09f, 0.11f, 1.0f);
    } else {
        glClearColor(0.94f, 0.94f, 0.95f, 1.0f);
    }
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
    glfwSwapBuffers(window_);
}

void GraphicsContext::PollEvents() {
    glfwPollEvents();
}

void GraphicsContext::Shutdown() {
    if (backends_ready_) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        backends_ready_ = false;
    }
    if (imgui_ctx_) {
        ImGui::DestroyContext(imgui_ctx_);
        imgui_ctx_ = nullptr;
    }
    if (window_) {
        glfwDestroyWindow(window_);
        glfwTerminate();
        window_ = nullptr;
    }
}

} // namespace core
} // namespace shell
} // namespace deskbridge
