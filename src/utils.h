//
// utils.h - Engine level helpers shared by the executable and the model glue
//

#ifndef SMOKEFLOW_ENGINE_UTILS_H
#define SMOKEFLOW_ENGINE_UTILS_H

#include <chrono>

class Timer {
public:
    void Start() {
        start_ = std::chrono::high_resolution_clock::now();
    }

    void Stop() {
        end_ = std::chrono::high_resolution_clock::now();
    }

    [[nodiscard]] double GetDurationInMilliseconds() const {
        std::chrono::duration<double, std::milli> duration = end_ - start_;
        return duration.count();
    }
    // Only the running totals are kept
    void AppendDuration(double duration) {
        duration_sum_ += duration;
        duration_max_ = duration > duration_max_ ? duration : duration_max_;
        duration_count_++;
    }
    [[nodiscard]] double GetAverageDuration() const {
        if (duration_count_ == 0) {
            return 0.0;
        }
        return duration_sum_ / static_cast<double>(duration_count_);
    }
    [[nodiscard]] double GetMaxDuration() const { return duration_max_; }
    [[nodiscard]] long GetDurationCount() const { return duration_count_; }

private:
    double duration_sum_ = 0.0;
    double duration_max_ = 0.0;
    long duration_count_ = 0;
    std::chrono::time_point<std::chrono::high_resolution_clock> start_;
    std::chrono::time_point<std::chrono::high_resolution_clock> end_;
};

enum Mode { GUI, NoGUI };

#endif //SMOKEFLOW_ENGINE_UTILS_H
