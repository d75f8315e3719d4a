#pragma once

#include <cmath>

// Arm angle (radians) of the hammer swing for a cycle position in [0, 1).
//   0.0 - 0.3  raise
//   0.3 - 0.4  hold at the top
//   0.4 - 0.6  swing down
//   0.6 - 1.0  hold on impact
inline float hammerArmAngle(float cyclePhase) {
    float p = cyclePhase - std::floor(cyclePhase);

    if (p < 0.3f) {
        return -0.5f - (p / 0.3f) * 1.2f;
    }
    if (p < 0.4f) {
        return -1.7f;
    }
    if (p < 0.6f) {
        return -1.7f + ((p - 0.4f) / 0.2f) * 2.2f;
    }
    return 0.5f;
}
