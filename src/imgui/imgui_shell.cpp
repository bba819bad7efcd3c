#include "imgui_shell.hpp"
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>
#include <GLFW/glfw3.h>
#include <cassert>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace statisfy {

ImGuiShell::ImGuiShell(std::shared_ptr<AppHandle> handle, std::string title, const std::string& event_name)
    : handle_(std::move(handle))
    , title_(std::move(title)) {

    assert(handle_ && "AppHandle must not be null");

    // Listener exists before the bridge starts, so nothing emitted at startup is dropped
    listener_id_ = handle_->listen(event_name, [this](const std::string& url) {
        view_model_.add(url);
    });

    // Wake the render loop when an event is queued from another thread
    handle_->set_waker([this]() {
        post_empty_event_debounced();
    });
}

ImGuiShell::~ImGuiShell() {
    handle_->set_waker({});
    handle_->unlisten(listener_id_);
}

void ImGuiShell::run() {
    // Initialize GLFW
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

    // GL 3.3 + GLSL 330
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    // Set Wayland app_id for desktop integration
    glfwWindowHintString(GLFW_WAYLAND_APP_ID, "statisfy");

    GLFWwindow* window = glfwCreateWindow(900, 600, title_.c_str(), nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window");
    }
    window_ = window;

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    // Setup Dear ImGui context
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;  // no persisted layout

    ImGuiStyle& style = ImGui::GetStyle();
    style.WindowRounding = 0.0f;
    style.FrameRounding = 2.0f;
    style.ScrollbarRounding = 2.0f;

    // Setup Platform/Renderer backends
    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init("#version 330");

    spdlog::debug("UI shell running");

    // Main loop
    while (!glfwWindowShouldClose(window)) {
        glfwWaitEventsTimeout(0.1);

        // Handle focus request from another instance
        if (focus_requested_.exchange(false)) {
            glfwShowWindow(window);
            glfwFocusWindow(window);
            glfwRequestWindowAttention(window);
        }

        handle_->dispatch_pending();

        // Start the Dear ImGui frame
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        render();

        // Rendering
        ImGui::Render();
        int display_w, display_h;
        glfwGetFramebufferSize(window, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window);
    }

    // Cleanup
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();

    // Posting threads check window_ under the same lock
    std::lock_guard lock(event_debounce_mutex_);
    window_ = nullptr;
    glfwDestroyWindow(window);
    glfwTerminate();
}

void ImGuiShell::request_focus() {
    focus_requested_ = true;
    post_empty_event_debounced();
}

void ImGuiShell::post_empty_event_debounced() {
    std::lock_guard lock(event_debounce_mutex_);
    if (!window_) return;

    const auto now = std::chrono::steady_clock::now();
    if (now - last_event_post_time_ >= kEventDebounceInterval) {
        last_event_post_time_ = now;
        glfwPostEmptyEvent();
    }
}

void ImGuiShell::render() {
    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->Pos);
    ImGui::SetNextWindowSize(viewport->Size);

    constexpr ImGuiWindowFlags window_flags = ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoCollapse |
                                              ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
                                              ImGuiWindowFlags_NoBringToFrontOnFocus;

    ImGui::Begin("Statisfy", nullptr, window_flags);

    ImGui::Text("Deep links received: %zu", view_model_.total_received);
    ImGui::SameLine();
    if (ImGui::Button("Clear")) {
        view_model_.clear();
    }
    ImGui::SameLine();
    ImGui::Checkbox("Auto-scroll", &view_model_.auto_scroll);
    ImGui::Separator();

    constexpr ImGuiTableFlags table_flags = ImGuiTableFlags_RowBg | ImGuiTableFlags_BordersInnerV |
                                            ImGuiTableFlags_ScrollY | ImGuiTableFlags_Resizable;

    if (ImGui::BeginTable("links", 2, table_flags)) {
        ImGui::TableSetupScrollFreeze(0, 1);
        ImGui::TableSetupColumn("Time", ImGuiTableColumnFlags_WidthFixed, 90.0f);
        ImGui::TableSetupColumn("URL", ImGuiTableColumnFlags_WidthStretch);
        ImGui::TableHeadersRow();

        for (int i = 0; i < static_cast<int>(view_model_.links.size()); ++i) {
            const auto& link = view_model_.links[static_cast<size_t>(i)];
            ImGui::TableNextRow();
            ImGui::TableSetColumnIndex(0);
            ImGui::TextUnformatted(DeepLinkViewModel::format_time(link.received_at).c_str());
            ImGui::TableSetColumnIndex(1);
            ImGui::PushID(i);
            if (ImGui::Selectable(link.url.c_str(), view_model_.selected_index == i,
                                  ImGuiSelectableFlags_SpanAllColumns)) {
                view_model_.selected_index = i;
            }
            if (ImGui::BeginPopupContextItem()) {
                if (ImGui::MenuItem("Copy URL")) {
                    ImGui::SetClipboardText(link.url.c_str());
                }
                ImGui::EndPopup();
            }
            ImGui::PopID();
        }

        if (view_model_.auto_scroll && ImGui::GetScrollY() >= ImGui::GetScrollMaxY()) {
            ImGui::SetScrollHereY(1.0f);
        }
        ImGui::EndTable();
    }

    ImGui::End();
}

} // namespace statisfy
