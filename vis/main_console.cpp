// main_console.cpp
// - Interactive operator console for one ScanSession driven by the simulated rig
// - The session clock follows wall time through a fixed-dt accumulator, so the
//   same command sequence replays the same way in the console and in ScanReplay
// - Plots the RMS level of every streamed audio chunk and keeps a scrolling event log
// - Fault buttons inject the failures the session has to recover from

#include <vector>
#include <string>
#include <deque>
#include <cmath>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <memory>

#include "ScanSession.h"
#include "Filesystem.h"
#include "Log.h"
#include "WorldMapStore.h"

// Sensor-side stand-ins (no UI dependencies)
#include "../world/simulated_rig.h"

#include "imgui.h"
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

// GLFW pulls in the platform GL header.
#include <GLFW/glfw3.h>

#include <spdlog/spdlog.h>

// Owns the window, the GL context and the ImGui/ImPlot contexts. Teardown runs
// in reverse of whatever open() managed to bring up.
class ConsoleWindow {
public:
    ConsoleWindow() = default;
    ConsoleWindow(const ConsoleWindow&) = delete;
    ConsoleWindow& operator=(const ConsoleWindow&) = delete;
    ~ConsoleWindow() { close(); }

    bool open(spdlog::logger& log) {
        glfwSetErrorCallback([](int code, const char* what) {
            spdlog::error("glfw {}: {}", code, what ? what : "?");
        });
        if (!glfwInit()) {
            log.error("console: glfwInit failed");
            return false;
        }
        glfw_ = true;

        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);
        window_ = glfwCreateWindow(1280, 720, "Scan Session Console", nullptr, nullptr);
        if (!window_) {
            log.error("console: cannot create a 1280x720 GL 3.0 window");
            return false;
        }
        glfwMakeContextCurrent(window_);
        glfwSwapInterval(1);

        const GLubyte* gl_version = glGetString(GL_VERSION);
        if (!gl_version) {
            log.error("console: GL context has no version string");
            return false;
        }
        log.info("console: OpenGL {}", reinterpret_cast<const char*>(gl_version));

        IMGUI_CHECKVERSION();
        ImGui::CreateContext();
        imgui_ = true;
        ImPlot::CreateContext();
        implot_ = true;
        ImGui::StyleColorsDark();

        if (!ImGui_ImplGlfw_InitForOpenGL(window_, true)) {
            log.error("console: ImGui GLFW backend init failed");
            return false;
        }
        backend_glfw_ = true;
        if (!ImGui_ImplOpenGL3_Init("#version 130")) {
            log.error("console: ImGui OpenGL3 backend init failed");
            return false;
        }
        backend_gl3_ = true;
        return true;
    }

    GLFWwindow* window() const { return window_; }

private:
    void close() {
        if (implot_) ImPlot::DestroyContext();
        if (backend_gl3_) ImGui_ImplOpenGL3_Shutdown();
        if (backend_glfw_) ImGui_ImplGlfw_Shutdown();
        if (imgui_) ImGui::DestroyContext();
        if (window_) glfwDestroyWindow(window_);
        if (glfw_) glfwTerminate();
    }

    GLFWwindow* window_ = nullptr;
    bool glfw_ = false;
    bool imgui_ = false;
    bool implot_ = false;
    bool backend_glfw_ = false;
    bool backend_gl3_ = false;
};

struct ConsoleUIState {
    bool show_controls = true;
    bool show_log = true;
    bool show_audio = true;
    bool autoscroll = true;
};

struct LogLine {
    double t_s = 0.0;
    std::string text;
    bool error = false;
};

static constexpr std::size_t kMaxLogLines = 500;
static constexpr std::size_t kMaxAudioSamples = 4000;

static bool isErrorEvent(const scanorch::SessionEvent& e) {
    if (const auto* s = std::get_if<scanorch::StatusEvent>(&e)) return s->kind == scanorch::StatusKind::Error;
    if (const auto* p = std::get_if<scanorch::PhotoEvent>(&e)) return p->error.has_value();
    if (const auto* a = std::get_if<scanorch::AudioEvent>(&e)) return a->status == scanorch::AudioStatus::Error;
    return false;
}

static double chunkRms(const std::vector<std::int16_t>& chunk) {
    if (chunk.empty()) return 0.0;
    double acc = 0.0;
    for (std::int16_t s : chunk) acc += static_cast<double>(s) * s;
    return std::sqrt(acc / chunk.size()) / 32768.0;
}

int main(int argc, char** argv) {
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        if (argv[i] && std::string(argv[i]) == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        }
    }

    auto log = scanorch::makeLogger();
    scanorch::SessionConfigV1 cfg;
    if (!config_path.empty()) {
        std::string error;
        if (!scanorch::loadSessionConfig(config_path, cfg, error, log.get())) {
            log->error("config {}: {}", config_path, error);
        }
    }

    ConsoleWindow gui;
    if (!gui.open(*log)) return EXIT_FAILURE;
    GLFWwindow* window = gui.window();

    {
        // --- Session + rig (scoped so they die before the GL context) ---
        scanorch::EventLoop loop;
        scanorch::BackgroundTask background;
        scanorch::LocalFilesystem fs;
        scanorch::world::SimulatedRig rig(loop);
        scanorch::WorldMapStore maps(std::make_unique<scanorch::MemoryWorldMapTier>(),
                                     std::make_unique<scanorch::FileWorldMapTier>(
                                         fs, scanorch::resolvedWorldMapFile(cfg), log));
        scanorch::SessionDeps deps{loop, background, rig.capture, rig.rooms, rig.structures, rig.tracking,
                                   rig.audio, rig.permissions, fs, maps};
        scanorch::ScanSession session(deps, cfg, log);

        ConsoleUIState ui;
        std::deque<LogLine> log_lines;
        std::vector<double> audio_t, audio_rms;
        audio_t.reserve(kMaxAudioSamples);
        audio_rms.reserve(kMaxAudioSamples);
        std::string last_export;

        session.setListener([&](const scanorch::SessionEvent& e) {
            if (const auto* chunk = std::get_if<scanorch::AudioDataEvent>(&e)) {
                if (audio_t.size() >= kMaxAudioSamples) {
                    audio_t.erase(audio_t.begin(), audio_t.begin() + kMaxAudioSamples / 2);
                    audio_rms.erase(audio_rms.begin(), audio_rms.begin() + kMaxAudioSamples / 2);
                }
                audio_t.push_back(loop.now_s());
                audio_rms.push_back(chunkRms(chunk->chunk));
                return;
            }
            if (const auto* ex = std::get_if<scanorch::ExportedEvent>(&e)) {
                last_export = ex->result.scan_url.value_or("(no file location)");
            }
            log_lines.push_back(LogLine{loop.now_s(), scanorch::describeEvent(e), isErrorEvent(e)});
            if (log_lines.size() > kMaxLogLines) log_lines.pop_front();
        });
        session.photoController().setClock([&loop] { return loop.nowMs(); });

        // Editable copies of the config fields exposed in the UI.
        char scan_name[64];
        std::snprintf(scan_name, sizeof(scan_name), "%s", cfg.scan_name.c_str());
        int export_mode = static_cast<int>(scanorch::exportModeOf(cfg));
        float photo_interval_s = static_cast<float>(cfg.auto_photo_interval_s);
        bool audio_enabled = cfg.audio_enabled;
        int reloc_script = 0;

        constexpr double kDt = 0.05;
        double wall_prev = glfwGetTime();
        double accum_s = 0.0;

        while (!glfwWindowShouldClose(window)) {
            glfwPollEvents();

            // --- advance the session clock (wall-time accumulator) ---
            const double wall_now = glfwGetTime();
            double wall_dt = std::clamp(wall_now - wall_prev, 0.0, 0.1);
            wall_prev = wall_now;
            accum_s += wall_dt;

            constexpr int kMaxSubstepsPerFrame = 20;
            int substeps = 0;
            while (accum_s >= kDt && substeps < kMaxSubstepsPerFrame) {
                loop.step(kDt);
                accum_s -= kDt;
                ++substeps;
            }
            if (substeps == kMaxSubstepsPerFrame) accum_s = 0.0;
            loop.drain();

            // --- ImGui frame ---
            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            if (ui.show_controls) {
                ImGui::SetNextWindowPos(ImVec2(12, 12), ImGuiCond_FirstUseEver);
                ImGui::SetNextWindowSize(ImVec2(440, 560), ImGuiCond_FirstUseEver);
                ImGui::Begin("Session", &ui.show_controls);

                const ImVec4 header = ImVec4(0.0f, 0.8f, 1.0f, 1.0f);
                ImGui::Text("t = %.2f s   state: %s", loop.now_s(), session.stateName());
                ImGui::Text("rooms: %zu   photos: %zu   builds in flight: %d", session.roomCount(),
                            session.photos().size(), session.buildsInFlight());
                ImGui::Text("pending export: %s   deferred: %zu", session.pendingExport() ? "yes" : "no",
                            session.deferredCommands());
                ImGui::Text("audio: %s", session.audioController().isRecording() ? "recording" : "idle");
                if (!last_export.empty()) ImGui::TextWrapped("last export: %s", last_export.c_str());
                ImGui::Separator();

                ImGui::TextColored(header, "Commands");
                const ImVec2 b(100, 0);
                if (ImGui::Button("Start", b)) session.submit(scanorch::cmd::Start{});
                ImGui::SameLine();
                if (ImGui::Button("Add room", b)) session.submit(scanorch::cmd::AddRoom{});
                ImGui::SameLine();
                if (ImGui::Button("Finish", b)) session.submit(scanorch::cmd::Finish{});
                if (ImGui::Button("Pause", b)) session.submit(scanorch::cmd::Pause{});
                ImGui::SameLine();
                if (ImGui::Button("Resume", b)) session.submit(scanorch::cmd::Resume{});
                ImGui::SameLine();
                if (ImGui::Button("Export", b)) session.submit(scanorch::cmd::Export{});
                if (ImGui::Button("Photo", b)) session.submit(scanorch::cmd::CapturePhoto{});
                ImGui::SameLine();
                if (ImGui::Button("Audio on", b)) session.submit(scanorch::cmd::StartAudio{});
                ImGui::SameLine();
                if (ImGui::Button("Audio off", b)) session.submit(scanorch::cmd::StopAudio{});
                if (ImGui::Button("Cancel", b)) session.submit(scanorch::cmd::Cancel{});
                ImGui::SameLine();
                if (ImGui::Button("Reset", b)) session.submit(scanorch::cmd::Reset{false});
                ImGui::SameLine();
                if (ImGui::Button("Reset + map", b)) session.submit(scanorch::cmd::Reset{true});
                ImGui::Separator();

                ImGui::TextColored(header, "Configuration");
                ImGui::InputText("scan name", scan_name, sizeof(scan_name));
                const char* modes[] = {"PARAMETRIC", "MESH", "MODEL"};
                ImGui::Combo("export type", &export_mode, modes, 3);
                ImGui::Checkbox("audio with scan", &audio_enabled);
                if (ImGui::Button("Apply config")) {
                    scanorch::SessionConfigV1 next = session.config();
                    next.scan_name = scan_name;
                    next.export_type = modes[std::clamp(export_mode, 0, 2)];
                    next.audio_enabled = audio_enabled;
                    session.configure(next);
                }
                if (ImGui::SliderFloat("photo interval (s)", &photo_interval_s, 0.0f, 10.0f, "%.1f")) {
                    session.submit(scanorch::cmd::SetAutoPhotoInterval{photo_interval_s});
                }
                ImGui::Text("config hash 0x%08X", session.config().fnv_hash_u32);
                ImGui::Separator();

                ImGui::TextColored(header, "Faults");
                if (ImGui::Button("Capture failure")) rig.capture.injectFailure("injected capture failure");
                ImGui::SameLine();
                if (ImGui::Button("Fail next build")) rig.rooms.failNext("injected build failure");
                ImGui::SameLine();
                if (ImGui::Button("Fail next merge")) rig.structures.failNext("injected merge failure");
                if (ImGui::Button("Audio failure")) rig.audio.injectFailure("injected audio failure");
                ImGui::SameLine();
                if (ImGui::Button("Fail next snapshot")) rig.tracking.failNextSnapshot("injected snapshot failure");

                const char* scripts[] = {"converge", "unavailable", "never"};
                if (ImGui::Combo("relocalization", &reloc_script, scripts, 3)) {
                    rig.tracking.setRelocalizeScript(
                        static_cast<scanorch::world::SimTrackingSession::RelocalizeScript>(reloc_script));
                }
                ImGui::End();
            }

            if (ui.show_log) {
                ImGui::SetNextWindowPos(ImVec2(464, 12), ImGuiCond_FirstUseEver);
                ImGui::SetNextWindowSize(ImVec2(800, 380), ImGuiCond_FirstUseEver);
                ImGui::Begin("Events", &ui.show_log);
                ImGui::Checkbox("autoscroll", &ui.autoscroll);
                ImGui::SameLine();
                if (ImGui::Button("Clear")) log_lines.clear();
                ImGui::Separator();
                ImGui::BeginChild("event_scroll");
                for (const auto& line : log_lines) {
                    if (line.error) {
                        ImGui::TextColored(ImVec4(1.0f, 0.35f, 0.3f, 1.0f), "[%7.2f] %s", line.t_s, line.text.c_str());
                    } else {
                        ImGui::Text("[%7.2f] %s", line.t_s, line.text.c_str());
                    }
                }
                if (ui.autoscroll && ImGui::GetScrollY() >= ImGui::GetScrollMaxY()) ImGui::SetScrollHereY(1.0f);
                ImGui::EndChild();
                ImGui::End();
            }

            if (ui.show_audio) {
                ImGui::SetNextWindowPos(ImVec2(464, 404), ImGuiCond_FirstUseEver);
                ImGui::SetNextWindowSize(ImVec2(800, 300), ImGuiCond_FirstUseEver);
                ImGui::Begin("Audio level", &ui.show_audio);
                const int count = static_cast<int>(audio_t.size());
                if (count > 1) {
                    const double t0 = audio_t.front();
                    const double t1 = audio_t.back();
                    ImGui::Text("Chunks: %d   Window: [%0.2f, %0.2f] s", count, t0, t1);
                    if (ImPlot::BeginPlot("RMS (full scale)")) {
                        ImPlot::SetupAxisLimits(ImAxis_X1, t0, t1, ImGuiCond_Always);
                        ImPlot::SetupAxisLimits(ImAxis_Y1, 0.0, 1.0, ImGuiCond_Once);
                        ImPlot::PlotLine("rms", audio_t.data(), audio_rms.data(), count);
                        ImPlot::EndPlot();
                    }
                } else {
                    ImGui::TextUnformatted("No audio streamed yet.");
                }
                ImGui::End();
            }

            ImGui::Render();

            int fb_w = 0, fb_h = 0;
            glfwGetFramebufferSize(window, &fb_w, &fb_h);
            if (fb_w > 0 && fb_h > 0) {
                glViewport(0, 0, fb_w, fb_h);
                glClearColor(0.06f, 0.06f, 0.07f, 1.0f);
                glClear(GL_COLOR_BUFFER_BIT);
                ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
            }

            glfwSwapBuffers(window);
        }

        session.submit(scanorch::cmd::Cancel{});
        loop.drain();
        background.waitForCompletion();
        loop.drain();
    }

    return 0;
}
