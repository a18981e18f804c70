#pragma once

/**
 * @file input_source.hpp
 * @brief Interface shared by every input device
 */

#include "roamcam/input/input_frame.hpp"

namespace roamcam {

class InputSource {
public:
    virtual ~InputSource() = default;

    /// Short name for diagnostics
    [[nodiscard]] virtual const char* name() const = 0;

    /// True when the device may drive the controller (pointer captured,
    /// pad connected, joystick present)
    [[nodiscard]] virtual bool engaged() const = 0;

    /// Produce this frame's contribution. Rate-based devices scale look by
    /// dt; event-based devices drain what accumulated since the last call.
    virtual InputFrame sample(float dt) = 0;

    /// Drop all held state (keys, axes, pending deltas)
    virtual void reset() = 0;
};

}  // namespace roamcam
