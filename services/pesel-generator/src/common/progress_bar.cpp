/**
 * @file progress_bar.cpp
 * @brief Console progress bar implementation
 */

#include "progress_bar.h"

namespace common {

ConsoleProgressBar::ConsoleProgressBar(std::ostream& out, int width)
    : out_(out), width_(width > 0 ? width : kDefaultWidth) {}

std::string ConsoleProgressBar::render(int64_t daysProcessed, int64_t totalDays, int percent, int width) {
    int64_t filled = totalDays > 0 ? (width * daysProcessed) / totalDays : 0;
    if (filled > width) filled = width;
    if (filled < 0) filled = 0;

    std::string line = "Progress: [";
    line.append(static_cast<size_t>(filled), '=');
    line.append(static_cast<size_t>(width - filled), '-');
    line += "] " + std::to_string(percent) + "%";
    return line;
}

void ConsoleProgressBar::onProgress(const pesel::core::ProgressUpdate& update) {
    out_ << '\r' << render(update.daysProcessed, update.totalDays, update.percent, width_);
    out_.flush();
}

void ConsoleProgressBar::onComplete(const pesel::core::ProgressUpdate&) {
    out_ << '\n';
    out_.flush();
}

} // namespace common
