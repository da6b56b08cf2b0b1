//
// utils.h - Small shared types of the smoke model
//

#ifndef SMOKEFLOW_SMOKEMODEL_UTILS_H
#define SMOKEFLOW_SMOKEMODEL_UTILS_H

#include <string>
#include <vector>

std::string formatTime(int seconds);

enum class VentSide { Left, Right };

std::string VentSideToString(VentSide side);

// Which side of the wall a horizontal position lies on
enum class Zone { Left, Right };

struct VentState {
    bool left = false;
    bool right = false;

    [[nodiscard]] bool IsOn(VentSide side) const { return side == VentSide::Left ? left : right; }
    void Set(VentSide side, bool on) {
        if (side == VentSide::Left) left = on;
        else right = on;
    }
};

// Max of a sample range [begin, end), 0 for an empty range
double MaxOfRange(const std::vector<double>& samples, int begin, int end);
// Sum of a sample range [begin, end), indices are clamped to the sample bounds
double SumOfRange(const std::vector<double>& samples, int begin, int end);

#endif //SMOKEFLOW_SMOKEMODEL_UTILS_H
