#include "utils.h"
#include <algorithm>
#include <numeric>

std::string formatTime(int total_seconds) {
    const int seconds_per_minute = 60;
    const int minutes_per_hour = 60;

    int hours = total_seconds / (minutes_per_hour * seconds_per_minute);
    int minutes = (total_seconds / seconds_per_minute) % minutes_per_hour;
    int seconds = total_seconds % seconds_per_minute;

    std::string formatted_time;

    if (hours > 0) {
        formatted_time += std::to_string(hours) + " h ";
    }
    if (minutes > 0 || hours > 0) {
        formatted_time += std::to_string(minutes) + " min ";
    }
    formatted_time += std::to_string(seconds) + " s";

    return formatted_time;
}

std::string VentSideToString(VentSide side) {
    switch (side) {
        case VentSide::Left:
            return "LEFT";
        case VentSide::Right:
            return "RIGHT";
        default:
            return "UNKNOWN";
    }
}

double MaxOfRange(const std::vector<double>& samples, int begin, int end) {
    begin = std::max(begin, 0);
    end = std::min(end, static_cast<int>(samples.size()));
    if (begin >= end) {
        return 0.0;
    }
    return *std::max_element(samples.begin() + begin, samples.begin() + end);
}

double SumOfRange(const std::vector<double>& samples, int begin, int end) {
    begin = std::max(begin, 0);
    end = std::min(end, static_cast<int>(samples.size()));
    if (begin >= end) {
        return 0.0;
    }
    return std::accumulate(samples.begin() + begin, samples.begin() + end, 0.0);
}
