// Task graph editor: ImGui + SDL3 + OpenGL3 (C++20)
#define SDL_MAIN_HANDLED

#include "imgui.h"
#include "imgui_impl_sdl3.h"
#include "imgui_impl_opengl3.h"
#include <canvas/canvas.hpp>
#include <graph_editor/task_editor.hpp>
#include <graph_loaders/json_loader.hpp>
#include <graph_loaders/sample_graph.hpp>
#include <graph_model/log.hpp>
#include <SDL3/SDL.h>
#include <SDL3/SDL_main.h>
#include <SDL3/SDL_opengl.h>
#include <spdlog/spdlog.h>
#include <cstdio>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace {

struct Options {
    std::string graph_path = "data/graph.json";
    bool link_mode = false;
    std::string log_level = "info";
};

bool parse_options(int argc, char* argv[], Options& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--graph" && i + 1 < argc) {
            out.graph_path = argv[++i];
        } else if (arg == "--link-mode") {
            out.link_mode = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            out.log_level = argv[++i];
        } else {
            (void)fprintf(stderr, "usage: %s [--graph <file.json>] [--link-mode] [--log-level <level>]\n", argv[0]);
            return false;
        }
    }
    return true;
}

// Toolbar + file menu + keyboard shortcuts around the editor. Every committed
// change is written back to the document file.
class EditorShell {
public:
    EditorShell(graph_editor::TaskEditor& editor, canvas::TaskCanvas& canvas, std::string graph_path)
        : editor_(editor)
        , canvas_(canvas)
        , graph_path_(std::move(graph_path))
    {
        editor_.events().on_selection_changed([this](const std::vector<graph_model::TaskId>& selection) {
            has_selection_ = !selection.empty();
        });
        editor_.events().on_task_moved([this](graph_model::TaskId) { save(); });
        editor_.events().on_new_dependency([this]() { save(); });
    }

    void load() {
        auto doc = graph_loaders::load_graph_document_from_json_file(graph_path_);
        if (!doc) {
            graph_model::graph_logger()->info("starting from the sample graph");
            doc = graph_loaders::generate_sample_graph();
        }
        editor_.load_graph(*doc);
        canvas_.invalidate_task_sizes();
    }

    void save() {
        if (!graph_loaders::save_graph_document_to_json_file(graph_path_, editor_.get_graph()))
            status_ = "Save failed: " + graph_path_;
        else
            status_.clear();
    }

    void new_graph() {
        editor_.clear_graph();
        save();
    }

    void begin_new_task() {
        new_task_open_ = true;
        focus_new_task_ = true;
        new_task_name_[0] = '\0';
    }

    void draw_menu_bar() {
        if (!ImGui::BeginMenuBar()) return;
        if (ImGui::BeginMenu("File")) {
            if (ImGui::MenuItem("New graph")) new_graph();
            if (ImGui::MenuItem("Reload", "Ctrl+O")) load();
            if (ImGui::MenuItem("Save", "Ctrl+S")) save();
            ImGui::EndMenu();
        }
        if (!status_.empty()) {
            ImGui::SameLine();
            ImGui::TextColored(ImVec4(1.0f, 0.45f, 0.4f, 1.0f), "%s", status_.c_str());
        }
        ImGui::EndMenuBar();
    }

    void draw_toolbar() {
        if (!has_selection_) {
            if (ImGui::Button("New task")) begin_new_task();
            ImGui::SameLine();
            bool link_mode = editor_.link_mode();
            if (ImGui::Checkbox("Link mode", &link_mode)) editor_.set_link_mode(link_mode);
        } else {
            if (ImGui::Button("Delete")) {
                editor_.delete_selected();
                save();
            }
            ImGui::SameLine();
            if (ImGui::Button("Complete")) {
                editor_.complete_selected();
                save();
            }
        }

        if (new_task_open_) {
            ImGui::SameLine();
            if (focus_new_task_) {
                ImGui::SetKeyboardFocusHere();
                focus_new_task_ = false;
            }
            ImGui::SetNextItemWidth(240.0f);
            if (ImGui::InputText("##new_task", new_task_name_, sizeof(new_task_name_),
                    ImGuiInputTextFlags_EnterReturnsTrue))
            {
                if (new_task_name_[0] != '\0') {
                    graph_model::TaskSpec spec;
                    spec.name = new_task_name_;
                    editor_.add_task(spec);
                    canvas_.invalidate_task_sizes();
                    save();
                }
                new_task_open_ = false;
            } else if (ImGui::IsItemDeactivated()) {
                new_task_open_ = false;
            }
        }
    }

    void handle_shortcuts() {
        ImGuiIO& io = ImGui::GetIO();
        if (io.WantTextInput || new_task_open_) return;

        if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_A, false)) editor_.select_all();
        if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_S, false)) save();
        if (io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_O, false)) load();
        if (!io.KeyCtrl && ImGui::IsKeyPressed(ImGuiKey_I, false)) begin_new_task();
        if (!io.KeyCtrl && (ImGui::IsKeyPressed(ImGuiKey_D, false) || ImGui::IsKeyPressed(ImGuiKey_Delete, false))) {
            editor_.delete_selected();
            save();
        }
    }

private:
    graph_editor::TaskEditor& editor_;
    canvas::TaskCanvas& canvas_;
    std::string graph_path_;
    std::string status_;
    bool has_selection_ = false;
    bool new_task_open_ = false;
    bool focus_new_task_ = false;
    char new_task_name_[256] = {};
};

struct GlWindow {
    SDL_Window* window = nullptr;
    SDL_GLContext context = nullptr;
};

// Two thirds of the usable display, 1280x720 if the display cannot be queried.
bool open_window(const char* title, GlWindow& out) {
    if (!SDL_Init(SDL_INIT_VIDEO | SDL_INIT_EVENTS)) {
        (void)fprintf(stderr, "SDL_Init: %s\n", SDL_GetError());
        return false;
    }
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);

    SDL_Rect usable{};
    int w = 1280;
    int h = 720;
    if (SDL_GetDisplayUsableBounds(SDL_GetPrimaryDisplay(), &usable)) {
        w = usable.w * 2 / 3;
        h = usable.h * 2 / 3;
    }
    out.window = SDL_CreateWindow(title, w, h,
        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY);
    if (!out.window) {
        (void)fprintf(stderr, "SDL_CreateWindow: %s\n", SDL_GetError());
        SDL_Quit();
        return false;
    }
    out.context = SDL_GL_CreateContext(out.window);
    if (!out.context) {
        (void)fprintf(stderr, "SDL_GL_CreateContext: %s\n", SDL_GetError());
        SDL_DestroyWindow(out.window);
        SDL_Quit();
        return false;
    }
    return true;
}

void close_window(GlWindow& w) {
    SDL_GL_DestroyContext(w.context);
    SDL_DestroyWindow(w.window);
    SDL_Quit();
}

void load_ui_font(ImGuiIO& io) {
    ImFontConfig cfg;
    cfg.OversampleH = 2;
    cfg.OversampleV = 2;
    cfg.PixelSnapH = true;
    std::error_code ec;
    for (const char* path : { "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
                              "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
                              "/usr/share/fonts/TTF/DejaVuSans.ttf" })
    {
        if (std::filesystem::exists(path, ec) && io.Fonts->AddFontFromFileTTF(path, 18.0f, &cfg))
            return;
    }
    io.Fonts->AddFontDefault();
}

bool pump_events(SDL_Window* window) {
    bool keep_running = true;
    SDL_Event ev;
    while (SDL_PollEvent(&ev)) {
        ImGui_ImplSDL3_ProcessEvent(&ev);
        if (ev.type == SDL_EVENT_QUIT) keep_running = false;
        if (ev.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED && ev.window.windowID == SDL_GetWindowID(window))
            keep_running = false;
    }
    return keep_running;
}

} // namespace

int main(int argc, char* argv[])
{
    Options options;
    if (!parse_options(argc, argv, options)) return 2;
    const spdlog::level::level_enum level = spdlog::level::from_str(options.log_level);
    spdlog::set_level(level);
    graph_model::graph_logger()->set_level(level);

    SDL_SetMainReady();
    GlWindow gl;
    if (!open_window("Task Graph", gl)) return 1;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;
    ImGui::StyleColorsDark();
    load_ui_font(io);
    ImGui_ImplSDL3_InitForOpenGL(gl.window, gl.context);
    ImGui_ImplOpenGL3_Init("#version 130");

    graph_editor::EditorConfig config;
    config.link_mode = options.link_mode;
    graph_editor::TaskEditor editor(config);
    canvas::TaskCanvas task_canvas(editor);
    EditorShell shell(editor, task_canvas, options.graph_path);
    shell.load();

    const ImGuiWindowFlags host_flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove
        | ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_MenuBar;

    while (pump_events(gl.window)) {
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        const ImGuiViewport* viewport = ImGui::GetMainViewport();
        ImGui::SetNextWindowPos(viewport->WorkPos);
        ImGui::SetNextWindowSize(viewport->WorkSize);
        if (ImGui::Begin("##task_graph_host", nullptr, host_flags)) {
            shell.draw_menu_bar();
            shell.draw_toolbar();
            shell.handle_shortcuts();
            const ImVec2 avail = ImGui::GetContentRegionAvail();
            if (avail.x > 0 && avail.y > 0) {
                ImGui::BeginChild("##task_canvas", avail, false,
                    ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse);
                task_canvas.update_and_draw(avail.x, avail.y);
                ImGui::EndChild();
            }
        }
        ImGui::End();

        ImGui::Render();
        SDL_GL_MakeCurrent(gl.window, gl.context);
        // Framebuffer pixels, not logical size (HiDPI).
        glViewport(0, 0, (int)(io.DisplaySize.x * io.DisplayFramebufferScale.x),
            (int)(io.DisplaySize.y * io.DisplayFramebufferScale.y));
        glClearColor(0.11f, 0.11f, 0.13f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(gl.window);
    }

    shell.save();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();
    close_window(gl);
    return 0;
}
