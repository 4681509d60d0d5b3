/**
 * \file analyzer/ui/AnalyzerUI.hpp
 * \brief Terminal dashboard for driving and observing the worker pool via FTXUI.
 */

#pragma once
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/component/component_options.hpp>
#include <ftxui/component/mouse.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/box.hpp>

#include "logger.hpp"
#include "processUtils.hpp"
#include "analyzer/AnalyzerOptions.hpp"
#include "analyzer/ui/IAnalyzerService.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>
#include <algorithm>
#include <atomic>
#include <thread>
#include <memory>
#include <iostream>
#include <utility>

using namespace ftxui;

/// Clear the terminal screen using ANSI escape sequences.
inline void ClearTerminal() {
    std::cout << "\033[2J\033[3J\033[H" << std::flush;
}

/// Save terminal state by enabling the alternate screen buffer.
inline void SaveTerminalState() {
    std::cout << "\033[?1049h" << std::flush;
}

/// Restore terminal state and return to the primary screen buffer.
inline void RestoreTerminalState() {
    std::cout << "\033[?1049l" << std::flush;
}

/** \brief Color used for a worker state in the status table. */
inline Color StateColor(ProcSync::WorkerState state) {
    switch (state) {
        case ProcSync::WorkerState::Starting:   return Color::GrayLight;
        case ProcSync::WorkerState::Running:    return Color::Green;
        case ProcSync::WorkerState::Paused:     return Color::Yellow;
        case ProcSync::WorkerState::Completed:  return Color::Cyan;
        case ProcSync::WorkerState::Terminated: return Color::Red;
    }
    return Color::White;
}

/** \brief Interactive terminal dashboard for one analyzer session. */
class AnalyzerUI
{
public:
    /**
     * \brief Construct the UI tied to an analyzer service.
     * \param service Session exposing pool control, view rows and samples.
     * \param logger Logger providing append-only log access.
     * \param opts Initial pool settings and refresh period.
     */
    AnalyzerUI(std::shared_ptr<IAnalyzerService> service, std::shared_ptr<Logger> logger, const AnalyzerOptions& opts)
        : service_(std::move(service)), logger_(std::move(logger)), tick_(opts.tick), exit_requested_(false)
    {
        count_ = opts.count;
        for (std::size_t i = 0; i < ProcSync::kSpeedChoices.size(); ++i) {
            speed_entries_.push_back(ProcSync::format_speed(ProcSync::kSpeedChoices[i]));
            if (ProcSync::kSpeedChoices[i] == opts.speed) speed_selected_ = int(i);
        }
        priority_entries_ = {"Low", "Normal", "High"};
        priority_selected_ = static_cast<int>(opts.priority);
    }

    /** \brief Ensure background threads join on destruction. */
    ~AnalyzerUI() {
        exit_requested_ = true;
        if (refresher_.joinable()) {
            refresher_.join();
        }
    }

    /** \brief Launch the interactive UI loop; returns after Quit. */
    void Run()
    {
        SaveTerminalState();
        ClearTerminal();

        auto screen = ScreenInteractive::TerminalOutput();

        // --- Pool settings ---
        auto count_slider = Slider("Processes: ", &count_, ProcSync::kMinWorkers, ProcSync::kMaxWorkers, 1);
        auto speed_toggle = Toggle(&speed_entries_, &speed_selected_);
        auto priority_toggle = Toggle(&priority_entries_, &priority_selected_);
        auto settings_container = Container::Vertical({count_slider, speed_toggle, priority_toggle});
        auto settings = Renderer(settings_container, [&, count_slider, speed_toggle, priority_toggle]
            {
              return vbox({
                  hbox({ count_slider->Render() | flex, text(" " + std::to_string(count_) + " ") }),
                  hbox({ text("Speed:    "), speed_toggle->Render() }),
                  hbox({ text("Priority: "), priority_toggle->Render() }),
              }) | border;
            });

        // --- UI Controls (buttons) ---
        auto start_btn = Button("Start", [this] {
            if (!service_) return;
            const double speed = ProcSync::kSpeedChoices[std::size_t(speed_selected_)];
            service_->start_pool(count_, speed, static_cast<ProcSync::PriorityLevel>(priority_selected_));
        });
        auto pause_btn = Button(&pause_label_, [this] { if (service_) service_->toggle_pause(); });
        auto stop_btn = Button("Stop", [this] { if (service_) service_->stop_pool(); });
        auto clear_btn = Button("Clear Log", [this] { if (service_) service_->ClearLog(); });
        auto quit_btn = Button("Quit", [this]
                               {
                                   if (service_) service_->shutdown();
                                   // Refresher notices the flag and exits the screen
                                   exit_requested_ = true;
                               });

        auto buttons = std::vector<Component>{
            start_btn, pause_btn, stop_btn, clear_btn, quit_btn};
        int selected_button = 0;

        button_boxes_.resize(buttons.size());

        auto controls = Renderer([&](bool is_focused)
            {
              pause_label_ = paused_.load(std::memory_order_relaxed) ? "Resume" : "Pause";
              auto border_decorator = is_focused ? borderStyled(Color::Yellow) : border;
              Elements btn_elements;
              for (size_t i = 0; i < buttons.size(); ++i) {
                  auto btn = buttons[i]->Render() | reflect(button_boxes_[i]);
                  if (is_focused && int(i) == selected_button)
                      btn = btn | color(Color::White) | bgcolor(Color::Yellow) | bold | inverted;
                  else
                      btn = btn | color(Color::White) | bgcolor(Color::Black) | inverted;
                  btn_elements.push_back(btn);
              }
              return hbox(std::move(btn_elements)) | border_decorator | bgcolor(Color::Black);
            });

        controls |= CatchEvent([&](const Event &event)
                               {
              if (event.is_mouse()) {
                  Event event_copy = event;
                  int mouse_x = event_copy.mouse().x;
                  int hovered = -1;
                  for (size_t i = 0; i < buttons.size(); ++i) {
                      if (mouse_x >= button_boxes_[i].x_min && mouse_x <= button_boxes_[i].x_max) {
                          hovered = int(i);
                          break;
                      }
                  }
                  if (hovered >= 0) {
                      selected_button = hovered;
                      if (event_copy.mouse().button == Mouse::Left && event_copy.mouse().motion == Mouse::Pressed) {
                          buttons[selected_button]->OnEvent(Event::Return);
                          return true;
                      }
                  }
                  return false;
              }
              if (event == Event::ArrowLeft) {
                  if (selected_button > 0)
                      --selected_button;
                  return true;
              }
              if (event == Event::ArrowRight) {
                  if (selected_button < int(buttons.size()) - 1)
                      ++selected_button;
                  return true;
              }
              if (event == Event::Character(' ') || event == Event::Return) {
                  buttons[selected_button]->OnEvent(Event::Return);
                  return true;
              }
              return false; });

        // --- Worker status table ---
        auto table = Renderer([this]
            {
              std::vector<ProcSync::WorkerView> rows;
              {
                  std::lock_guard<std::mutex> lock(ui_mutex_);
                  rows = rows_;
              }
              Elements lines;
              lines.push_back(hbox({
                  text("PID") | size(WIDTH, EQUAL, 5),
                  text("State") | size(WIDTH, EQUAL, 12),
                  text("Progress") | flex,
                  text("Speed") | size(WIDTH, EQUAL, 7),
                  text("Priority") | size(WIDTH, EQUAL, 9),
                  text("Duration") | size(WIDTH, EQUAL, 10),
              }) | bold);
              lines.push_back(separator());
              for (const auto& row : rows) {
                  std::ostringstream duration;
                  if (row.duration_seconds) {
                      duration << std::fixed << std::setprecision(2) << *row.duration_seconds << "s";
                  }
                  lines.push_back(hbox({
                      text(std::to_string(row.id)) | size(WIDTH, EQUAL, 5),
                      text(ProcSync::to_string(row.state)) | color(StateColor(row.state)) | size(WIDTH, EQUAL, 12),
                      hbox({ gauge(row.progress / 100.0f) | flex, text(" " + std::to_string(row.progress) + "% ") }) | flex,
                      text(ProcSync::format_speed(row.speed)) | size(WIDTH, EQUAL, 7),
                      text(ProcSync::to_string(row.priority)) | size(WIDTH, EQUAL, 9),
                      text(duration.str()) | size(WIDTH, EQUAL, 10),
                  }));
              }
              return vbox(std::move(lines)) | border;
            });

        // --- System status: line, sampler readings and history graphs ---
        auto system_status = Renderer([this]
            {
              std::string status_copy;
              std::optional<ProcSync::SampleEvent> latest;
              std::vector<ProcSync::SampleEvent> history;
              {
                  std::lock_guard<std::mutex> lock(ui_mutex_);
                  status_copy = status_line_;
                  latest = latest_sample_;
                  history = sample_history_;
              }
              Color status_color = Color::GrayLight;
              if (status_copy.rfind("Running", 0) == 0) status_color = Color::Green;
              if (status_copy.rfind("Paused", 0) == 0) status_color = Color::Yellow;

              auto pct = [](double v) {
                  std::ostringstream oss;
                  oss << std::fixed << std::setprecision(1) << v << "%";
                  return oss.str();
              };
              auto history_graph = [history](bool memory) {
                  return [history, memory](int width, int height) {
                      std::vector<int> out(std::size_t(std::max(width, 0)), 0);
                      const int n = int(history.size());
                      for (int x = 0; x < width; ++x) {
                          const int idx = n - width + x;
                          if (idx < 0) continue;
                          const double v = memory ? history[std::size_t(idx)].memory_percent
                                                  : history[std::size_t(idx)].cpu_percent;
                          out[std::size_t(x)] = int(std::lround(v / 100.0 * height));
                      }
                      return out;
                  };
              };

              std::ostringstream self_cpu;
              self_cpu << std::fixed << std::setprecision(2) << cpu_usage_.load() << "%";

              return vbox({
                  hbox({ text("Status: "), text(status_copy) | color(status_color) }),
                  separator(),
                  hbox({
                      vbox({
                          text("CPU:    " + (latest ? pct(latest->cpu_percent) : std::string("-"))),
                          text("Memory: " + (latest ? pct(latest->memory_percent) : std::string("-"))),
                          text("Disk:   " + (latest ? pct(latest->disk_percent) : std::string("-"))),
                          text("Net:    " + (latest ? std::to_string(latest->network_bytes / 1024) + "KB" : std::string("-"))),
                          text("Self:   " + self_cpu.str() + " / " + std::to_string(int(mem_usage_.load())) + "MB"),
                      }) | size(WIDTH, EQUAL, 22),
                      separator(),
                      vbox({ text("CPU history"), graph(history_graph(false)) | color(Color::Green) | flex }) | flex,
                      separator(),
                      vbox({ text("Memory history"), graph(history_graph(true)) | color(Color::Blue) | flex }) | flex,
                  }) | size(HEIGHT, EQUAL, 6),
              }) | border;
            });

        // --- Log area renderer ---
        auto log_renderer = Renderer([this](bool is_focused)
                                     {
              std::vector<Element> log_elements;
              {
                  std::lock_guard<std::mutex> lock(ui_mutex_);
                  for (const auto& line : log_lines_display_)
                      log_elements.push_back(text(line));
              }

              auto border_decorator = is_focused ? borderStyled(Color::Yellow) : border;

              auto log_box = vbox(
                  text("Process Log:"),
                  separator(),
                  std::move(log_elements));

              return log_box
                      | size(HEIGHT, EQUAL, log_height_+ 2)
                      | border_decorator
                      | vscroll_indicator
                      | flex; });

        log_renderer |= CatchEvent([&](const Event &event)
                                   {
              int log_lines_count = service_ ? service_->GetNumberOfLogLines() : 0;
              int max_scroll = std::max(0, log_lines_count - log_height_);

              if (event.is_mouse()) {
                  Event event_copy = event;
                  auto mouse_event = event_copy.mouse();

                  if (mouse_event.button == Mouse::WheelUp) {
                      log_scroll_.store(std::max(0, log_scroll_.load() - 1));
                      scrolling_ = true;
                      return true;
                  }
                  if (mouse_event.button == Mouse::WheelDown) {
                      log_scroll_.store(std::min(log_scroll_.load() + 1, max_scroll));
                      scrolling_ = true;
                      return true;
                  }
              }

              if (event == Event::ArrowUp) {
                  log_scroll_.store(std::max(0, log_scroll_.load() - 1));
                  scrolling_ = true;
                  return true;
              }
              if (event == Event::ArrowDown) {
                  log_scroll_.store(std::min(log_scroll_.load() + 1, max_scroll));
                  scrolling_ = true;
                  return true;
              }

              // Any other key returns the log to tail-follow mode
              if (event.is_character())
              {
                  scrolling_ = false;
                  return true;
              }
              return false; });

        auto root = Container::Vertical({settings, controls, table, system_status, log_renderer});

        // --- Background thread: reconcile the pool and refresh UI state every tick ---
        refresher_ = std::thread([&screen, this]
        {
            ProcessUtils::set_current_thread_name("UIRefresher");
            while (!exit_requested_) {
                std::this_thread::sleep_for(tick_);
                if (exit_requested_) break;
                if (service_) {
                    service_->reconcile();
                    ProcessUsage usage = service_->GetProcessUsage();
                    cpu_usage_.store(static_cast<float>(usage.cpu_percent), std::memory_order_relaxed);
                    mem_usage_.store(usage.memory_bytes / (1024.0f * 1024.0f), std::memory_order_relaxed);
                    paused_.store(service_->IsPaused(), std::memory_order_relaxed);
                    auto rows = service_->GetWorkers();
                    auto status = service_->GetStatusLine();
                    auto latest = service_->GetLatestSample();
                    auto history = service_->GetSampleHistory();
                    {
                        std::lock_guard<std::mutex> lock(ui_mutex_);
                        rows_ = std::move(rows);
                        status_line_ = std::move(status);
                        latest_sample_ = latest;
                        sample_history_ = std::move(history);
                    }
                }
                {
                    std::lock_guard<std::mutex> lock(ui_mutex_);
                    int log_lines_count = service_ ? service_->GetNumberOfLogLines() : 0;
                    if (scrolling_) {
                        log_lines_display_ = service_ ? service_->GetLogLines(log_scroll_, log_height_) : std::vector<std::string>{};
                    } else {
                        int start = std::max(0, log_lines_count - log_height_);
                        log_scroll_.store(start, std::memory_order_relaxed);
                        int num_lines_to_show = std::min(log_height_, log_lines_count - start);
                        log_lines_display_ = service_ ? service_->GetLogLines(start, num_lines_to_show) : std::vector<std::string>{};
                    }
                }
                screen.PostEvent(ftxui::Event::Custom);
            }

            screen.Exit();
        });

        screen.Loop(root);

        exit_requested_ = true;
        if (refresher_.joinable())
            refresher_.join();

        // Window closed without Quit
        if (service_) service_->shutdown();

        RestoreTerminalState();
    }

private:
    std::shared_ptr<IAnalyzerService> service_;
    std::shared_ptr<Logger> logger_;
    std::chrono::milliseconds tick_;
    std::vector<ftxui::Box> button_boxes_;

    int count_{4};
    std::vector<std::string> speed_entries_;
    int speed_selected_{3};
    std::vector<std::string> priority_entries_;
    int priority_selected_{1};
    std::string pause_label_{"Pause"};           // Touched only on the UI thread

    std::atomic<bool> paused_{false};
    std::atomic<float> cpu_usage_{0.0f};
    std::atomic<float> mem_usage_{0.0f};
    std::vector<ProcSync::WorkerView> rows_;                   // Protected by ui_mutex_
    std::string status_line_{"Ready"};                         // Protected by ui_mutex_
    std::optional<ProcSync::SampleEvent> latest_sample_;       // Protected by ui_mutex_
    std::vector<ProcSync::SampleEvent> sample_history_;        // Protected by ui_mutex_
    std::vector<std::string> log_lines_display_;               // Protected by ui_mutex_
    std::mutex ui_mutex_;
    std::atomic<int> log_scroll_{0};
    int log_height_ = 10;
    bool scrolling_ = false;
    std::atomic<bool> exit_requested_;
    std::thread refresher_;
};
