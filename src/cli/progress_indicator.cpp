#include <assetsync/cli/progress_indicator.h>

#include <unistd.h>

#include <iomanip>
#include <iostream>
#include <sstream>

namespace assetsync::cli {

namespace {
constexpr int kBarWidth = 20;
}

ProgressIndicator::ProgressIndicator(Style style) : style_(style), tty_(stdoutIsTty()) {
    if (!tty_)
        updateIntervalMs_ = 2000;
}

ProgressIndicator::~ProgressIndicator() {
    if (active_) {
        stop();
    }
}

bool ProgressIndicator::stdoutIsTty() {
    return ::isatty(STDOUT_FILENO) != 0;
}

void ProgressIndicator::start(const std::string& message) {
    if (active_)
        return;
    message_ = message;
    active_ = true;
    current_ = 0;
    total_ = 0;
    lastUpdate_ = std::chrono::steady_clock::now();
    render();
}

void ProgressIndicator::update(std::size_t current, std::size_t total) {
    if (!active_)
        return;
    current_ = current;
    total_ = total;

    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastUpdate_).count();
    if (elapsed >= updateIntervalMs_ || (total_ > 0 && current_ >= total_)) {
        lastUpdate_ = now;
        render();
    }
}

void ProgressIndicator::stop() {
    if (!active_)
        return;
    if (tty_) {
        std::cout << "\r\033[K" << std::flush;
    }
    active_ = false;
}

void ProgressIndicator::render() {
    if (!active_)
        return;

    std::ostringstream oss;
    if (tty_)
        oss << "\r\033[K";

    const int percent = total_ > 0 ? static_cast<int>((current_ * 100) / total_) : 0;
    if (style_ == Style::Bar && tty_ && total_ > 0) {
        const int filled = percent * kBarWidth / 100;
        oss << "[" << std::string(static_cast<std::size_t>(filled), '#')
            << std::string(static_cast<std::size_t>(kBarWidth - filled), '.') << "] ";
    } else {
        oss << "[" << std::setw(3) << percent << "%] ";
    }
    oss << message_;
    if (total_ > 0) {
        oss << " (" << current_ << "/" << total_ << ")";
    }
    if (!tty_)
        oss << "\n";

    std::cout << oss.str() << std::flush;
}

} // namespace assetsync::cli
