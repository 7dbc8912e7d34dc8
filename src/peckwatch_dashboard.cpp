#include "classifier.hpp"
#include "command_line.hpp"
#include "engine.hpp"
#include "monitor_window.hpp"
#include "server_app.hpp"

#include <trantor/utils/Logger.h>

#include <iostream>
#include <thread>
#include <vector>

// ImGui + OpenGL ES 3
#include <GLES3/gl3.h>
#include <GLFW/glfw3.h>
#include <imgui.h>
#include <imgui_impl_glfw.h>
#include <imgui_impl_opengl3.h>

using namespace peckwatch;

class Dashboard {
public:
    explicit Dashboard(Engine& engine) : engine(engine) {}

    bool init_gui() {
        if (!glfwInit()) return false;

        // Request OpenGL ES 3.0 context via EGL
        glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_ES_API);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

        window = glfwCreateWindow(1000, 700, "peckwatch monitor", nullptr, nullptr);
        if (!window) {
            glfwTerminate();
            return false;
        }

        glfwMakeContextCurrent(window);
        glfwSwapInterval(1); // Enable vsync

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        ImGuiIO& io = ImGui::GetIO(); (void)io;
        io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

        ImGui::StyleColorsDark();

        ImGui_ImplGlfw_InitForOpenGL(window, true);
        ImGui_ImplOpenGL3_Init("#version 300 es");
        return true;
    }

    void run() {
        if (!init_gui()) {
            std::cerr << "Failed to open the monitor window\n";
            return;
        }

        while (!glfwWindowShouldClose(window)) {
            glfwPollEvents();

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            monitor.render(engine);

            ImGui::Render();
            int display_w, display_h;
            glfwGetFramebufferSize(window, &display_w, &display_h);
            glViewport(0, 0, display_w, display_h);
            glClearColor(0.1f, 0.1f, 0.1f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

            glfwSwapBuffers(window);
        }

        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplGlfw_Shutdown();
        ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
    }

private:
    Engine& engine;
    GLFWwindow* window = nullptr;
    gui::MonitorWindow monitor;
};

int main(int argc, char* argv[]) {
    CommandLine cl;
    std::string error;
    if (!parse_command_line(argc, argv, cl, error)) {
        std::cerr << error << "\n";
        print_usage(argv[0], std::cerr);
        return 2;
    }
    if (cl.help) {
        std::cout << "peckwatch dashboard - detection server with a desktop monitor\n";
        print_usage(argv[0], std::cout);
        return 0;
    }

    EngineConfig cfg;
    if (!load_effective_config(cl, cfg, error)) {
        std::cerr << error << std::endl;
        return 2;
    }

    Engine engine(cfg, createClassifier(cfg.classifier));
    ServerApp server(engine);
    std::vector<std::string> problems;
    if (!engine.start(problems)) {
        for (const auto& p : problems) LOG_ERROR << p;
    }

    std::thread server_thread([&server]() { server.run(); });

    Dashboard dashboard(engine);
    dashboard.run();

    // quit() is ignored until the Drogon loop is up
    server.wait_until_running();
    server.quit();
    server_thread.join();
    return 0;
}
