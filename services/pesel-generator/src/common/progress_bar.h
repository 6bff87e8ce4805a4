#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <pesel/core/progress.h>

/**
 * @file progress_bar.h
 * @brief Console progress bar for range enumeration
 *
 * Renders "\rProgress: [=====-----] NN%" and terminates the line when the
 * enumeration completes. Meant for stderr so identifiers on stdout are
 * not mixed with it.
 */

namespace common {

class ConsoleProgressBar : public pesel::core::IProgressObserver {
public:
    static constexpr int kDefaultWidth = 50;

    explicit ConsoleProgressBar(std::ostream& out, int width = kDefaultWidth);

    void onProgress(const pesel::core::ProgressUpdate& update) override;
    void onComplete(const pesel::core::ProgressUpdate& update) override;

    /**
     * @brief Render one bar line (without the leading carriage return)
     *
     * Example: render(25, 100, 25, 8) == "Progress: [==------] 25%"
     */
    static std::string render(int64_t daysProcessed, int64_t totalDays, int percent, int width);

private:
    std::ostream& out_;
    int width_;
};

} // namespace common
