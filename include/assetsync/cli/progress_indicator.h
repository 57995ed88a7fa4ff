#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>

namespace assetsync::cli {

/**
 * @brief Single-line progress display for long-running commands.
 *
 * On a terminal the line is redrawn in place; otherwise a plain percentage line is printed
 * at most once per update interval. Not thread-safe; drive it from one thread.
 */
class ProgressIndicator {
public:
    enum class Style {
        Percentage, // [ 45%]
        Bar         // [########............]
    };

    explicit ProgressIndicator(Style style = Style::Bar);
    ~ProgressIndicator();

    ProgressIndicator(const ProgressIndicator&) = delete;
    ProgressIndicator& operator=(const ProgressIndicator&) = delete;

    void start(const std::string& message);
    void update(std::size_t current, std::size_t total);
    void stop();

    void setMessage(const std::string& message) { message_ = message; }
    void setUpdateInterval(int ms) { updateIntervalMs_ = ms; }
    bool isActive() const { return active_; }

    static bool stdoutIsTty();

private:
    void render();

    Style style_;
    std::string message_;
    std::atomic<bool> active_{false};
    std::size_t current_ = 0;
    std::size_t total_ = 0;
    int updateIntervalMs_ = 100;
    bool tty_ = false;
    std::chrono::steady_clock::time_point lastUpdate_;
};

} // namespace assetsync::cli
