#pragma once

#include <string>
#include <imgui.h>

struct GLFWwindow;

namespace deskbridge {
namespace shell {
namespace core {

class GraphicsContext {
public:
    GraphicsContext(const std::string& title, int width, int height);
    ~GraphicsContext();

    bool IsValid() const { return window_ != nullptr && imgui_ctx_ != nullptr; }
    GLFWwindow* GetWindow() const { return window_; }

    bool ShouldClose() const;
    void SetTitle(const std::string& title);
    void BeginFrame();
    void EndFrame(bool dark_mode);
    void PollEvents();

private:
    bool InitGLFW(const std::string& title, int width, int height);
    bool InitImGui();
    void Shutdown();

    GLFWwindow* window_ = nullptr;
    ImGuiContext* imgui_ctx_ = nullptr;
    bool backends_ready_ = false;
    std::string title_;
};

} // namespace core
} // namespace shell
} // namespace deskbridge
