#pragma once

/**
 * @file debug_flags.hpp
 * @brief Switches for verbose collision diagnostics on stderr
 */

namespace roamcam {

struct DebugFlags {
    bool sphereCast = false;       // Sphere-cast hits (verbose, per frame)
    bool penetration = false;      // Penetration samples and snaps (per frame)
    bool filtering = false;        // Excluded meshes and reasons (once per mesh)
    bool proximity = false;        // Wall clamp corrections (per frame)
    bool colliderQuality = true;   // Missing normals/bounds, odd sizes (once per mesh)
    bool ground = false;           // Rejected ground candidates
};

}  // namespace roamcam
