#include <SDL3/SDL.h>
#include <imgui.h>
#include <imgui_impl_sdl3.h>
#include <imgui_impl_opengl3.h>

#include "LabelOverlay.h"

#include <graphlens/common/Logger.h>
#include <graphlens/io/DatasetSerializer.h>
#include <graphlens/io/SettingsSerializer.h>
#include <graphlens/render/GlRenderer.h>
#include <graphlens/view/GraphView.h>

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace graphlens;

namespace {

/// Routes SDL input to a GraphView and keeps the touch list it expects
class GraphViewer {
public:
    GraphViewer(SDL_Window* window, std::shared_ptr<const GraphData> graph,
                const ViewSettings& settings)
        : window_(window)
        , view_(std::move(graph), std::make_unique<GlRenderer>())
    {
        view_.setSettings(settings);
        view_.setCallbacks({
            .onSelectionChange = [](std::optional<NodeId> id) {
                if (id) {
                    LOG_INFO("Selected node {}", *id);
                } else {
                    LOG_INFO("Selection cleared");
                }
            },
            .onHoverChange = {},
            .onViewChange = {},
            .onPointerCapture = [](bool captured) { SDL_CaptureMouse(captured); },
        });
        resize();
    }

    GraphView& view() { return view_; }

    void resize() {
        int w = 0;
        int h = 0;
        SDL_GetWindowSizeInPixels(window_, &w, &h);
        float density = SDL_GetWindowPixelDensity(window_);
        view_.resize(w, h, density > 0.0f ? density : 1.0f);
    }

    void handleEvent(const SDL_Event& event) {
        switch (event.type) {
            case SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED:
            case SDL_EVENT_WINDOW_DISPLAY_SCALE_CHANGED:
                resize();
                break;
            case SDL_EVENT_WINDOW_MOUSE_LEAVE:
                overlay_.clearHover(view_);
                break;
            case SDL_EVENT_MOUSE_BUTTON_DOWN:
                if (event.button.which == SDL_TOUCH_MOUSEID || event.button.button != SDL_BUTTON_LEFT) {
                    break;
                }
                if (auto label = overlay_.labelAt(view_, event.button.x, event.button.y)) {
                    view_.onLabelPointerDown(*label, event.button.x, event.button.y);
                } else {
                    view_.onMouseDown(event.button.x, event.button.y);
                }
                break;
            case SDL_EVENT_MOUSE_MOTION: {
                if (event.motion.which == SDL_TOUCH_MOUSEID) {
                    break;
                }
                bool overLabel = overlay_.labelAt(view_, event.motion.x, event.motion.y).has_value();
                view_.onMouseMove(event.motion.x, event.motion.y, overLabel);
                overlay_.updateHover(view_, event.motion.x, event.motion.y);
                break;
            }
            case SDL_EVENT_MOUSE_BUTTON_UP:
                if (event.button.which == SDL_TOUCH_MOUSEID || event.button.button != SDL_BUTTON_LEFT) {
                    break;
                }
                view_.onMouseUp(event.button.x, event.button.y);
                break;
            case SDL_EVENT_MOUSE_WHEEL:
                // Wheel up zooms in
                view_.onWheel(event.wheel.mouse_x, event.wheel.mouse_y, -event.wheel.y);
                break;
            case SDL_EVENT_FINGER_DOWN:
                touches_.push_back(toTouch(event.tfinger));
                view_.onTouchStart(touches_);
                break;
            case SDL_EVENT_FINGER_MOTION: {
                TouchPoint moved = toTouch(event.tfinger);
                for (auto& t : touches_) {
                    if (t.id == moved.id) {
                        t = moved;
                    }
                }
                view_.onTouchMove(touches_);
                break;
            }
            case SDL_EVENT_FINGER_UP:
            case SDL_EVENT_FINGER_CANCELED: {
                TouchPoint lifted = toTouch(event.tfinger);
                std::erase_if(touches_, [&](const TouchPoint& t) { return t.id == lifted.id; });
                view_.onTouchEnd(touches_, {lifted});
                break;
            }
            case SDL_EVENT_KEY_DOWN:
                handleKey(event.key.key);
                break;
            default:
                break;
        }
    }

    void drawLabels(ImDrawList* drawList) const { overlay_.draw(view_, drawList); }

private:
    TouchPoint toTouch(const SDL_TouchFingerEvent& finger) const {
        int w = 0;
        int h = 0;
        SDL_GetWindowSize(window_, &w, &h);
        return {static_cast<int64_t>(finger.fingerID),
                finger.x * static_cast<float>(w),
                finger.y * static_cast<float>(h)};
    }

    void handleKey(SDL_Keycode key) {
        ViewSettings settings = view_.settings();
        switch (key) {
            case SDLK_F:
                view_.fitToContent();
                return;
            case SDLK_L:
                settings.showLabels = !settings.showLabels;
                break;
            case SDLK_T:
                settings.theme = settings.theme == Theme::Dark ? Theme::Light : Theme::Dark;
                break;
            case SDLK_Z:
                settings.zoomOnSelect = !settings.zoomOnSelect;
                break;
            case SDLK_1:
            case SDLK_2:
            case SDLK_3:
            case SDLK_4:
            case SDLK_5:
                settings.maxInfluenceDistance = static_cast<int>(key - SDLK_0);
                break;
            case SDLK_D:
            case SDLK_S:
            case SDLK_G: {
                auto type = key == SDLK_D ? EdgeType::Derivative
                          : key == SDLK_S ? EdgeType::Subgenre
                                          : EdgeType::FusionGenre;
                auto& visible = settings.visibleTypes[edgeTypeIndex(type)];
                visible = !visible;
                break;
            }
            default:
                return;
        }
        view_.setSettings(settings);
    }

    SDL_Window* window_;
    GraphView view_;
    LabelOverlay overlay_;
    std::vector<TouchPoint> touches_;
};

void showFatal(SDL_Window* window, const std::string& message) {
    LOG_ERROR("{}", message);
    SDL_ShowSimpleMessageBox(SDL_MESSAGEBOX_ERROR, "Graph Viewer", message.c_str(), window);
}

}  // namespace

int main(int argc, char* argv[]) {
    if (const char* logFile = std::getenv("GRAPHLENS_LOG_FILE")) {
        Logger::initialize(logFile);
    } else {
        Logger::initialize();
    }

    if (argc < 2) {
        SDL_Log("Usage: %s <dataset.json> [settings.json]", argv[0]);
        return 1;
    }
    const std::string datasetPath = argv[1];
    const std::string settingsPath = argc > 2 ? argv[2] : "";

    std::shared_ptr<const GraphData> graph;
    ViewSettings settings;
    try {
        graph = std::make_shared<const GraphData>(DatasetSerializer::loadFromFile(datasetPath));
        if (!settingsPath.empty()) {
            settings = SettingsSerializer::loadFromFile(settingsPath);
        }
    } catch (const std::runtime_error& e) {
        LOG_ERROR("Failed to load input: {}", e.what());
        return 1;
    }
    LOG_INFO("Loaded {} nodes and {} edges from {}",
             graph->nodes().size(), graph->edges().size(), datasetPath);

    if (!SDL_Init(SDL_INIT_VIDEO)) {
        SDL_Log("SDL_Init failed: %s", SDL_GetError());
        return 1;
    }

    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_ES);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);
    SDL_GL_SetAttribute(SDL_GL_DOUBLEBUFFER, 1);

    SDL_Window* window = SDL_CreateWindow(
        "GraphLens Viewer",
        1024, 768,
        SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY
    );
    if (!window) {
        SDL_Log("SDL_CreateWindow failed: %s", SDL_GetError());
        SDL_Quit();
        return 1;
    }

    SDL_GLContext glContext = SDL_GL_CreateContext(window);
    if (!glContext) {
        showFatal(window, std::string("OpenGL ES 3.0 context unavailable: ") + SDL_GetError());
        SDL_DestroyWindow(window);
        SDL_Quit();
        return 1;
    }
    SDL_GL_MakeCurrent(window, glContext);
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.IniFilename = nullptr;

    ImGui::StyleColorsDark();

    ImGui_ImplSDL3_InitForOpenGL(window, glContext);
    ImGui_ImplOpenGL3_Init("#version 300 es");

    std::unique_ptr<GraphViewer> viewer;
    try {
        viewer = std::make_unique<GraphViewer>(window, graph, settings);
    } catch (const RenderContextError& e) {
        showFatal(window, e.what());
    }

    const bool started = viewer != nullptr;
    bool running = started;
    while (running) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL3_ProcessEvent(&event);
            if (event.type == SDL_EVENT_QUIT) {
                running = false;
            } else if (event.type == SDL_EVENT_KEY_DOWN && event.key.key == SDLK_ESCAPE) {
                running = false;
            } else {
                viewer->handleEvent(event);
            }
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL3_NewFrame();
        ImGui::NewFrame();

        viewer->view().frame();
        viewer->drawLabels(ImGui::GetBackgroundDrawList());

        ImGui::Render();
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(window);
    }

    if (viewer && !settingsPath.empty()) {
        if (!SettingsSerializer::saveToFile(viewer->view().settings(), settingsPath)) {
            LOG_WARN("Could not save settings to {}", settingsPath);
        }
    }
    viewer.reset();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplSDL3_Shutdown();
    ImGui::DestroyContext();

    SDL_GL_DestroyContext(glContext);
    SDL_DestroyWindow(window);
    SDL_Quit();

    Logger::flush();
    return started ? 0 : 1;
}
