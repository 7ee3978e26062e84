//
//  SVARSessionConfig.h
//  SceneViewAR
//
//  Copyright © 2025 Viro Media. All rights reserved.
//
//  Permission is hereby granted, free of charge, to any person obtaining
//  a copy of this software and associated documentation files (the
//  "Software"), to deal in the Software without restriction, including
//  without limitation the rights to use, copy, modify, merge, publish,
//  distribute, sublicense, and/or sell copies of the Software, and to
//  permit persons to whom the Software is furnished to do so, subject to
//  the following conditions:
//
//  The above copyright notice and this permission notice shall be included
//  in all copies or substantial portions of the Software.
//
//  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
//  EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
//  MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT.
//  IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY
//  CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT,
//  TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE
//  SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#ifndef SVARSessionConfig_h
#define SVARSessionConfig_h

#include <string>

/*
 Which plane orientations the session should scan for each frame.
 */
enum class SVARPlaneFindingMode {
    Disabled,
    Horizontal,
    Vertical,
    HorizontalAndVertical
};

/*
 Depth sensing mode. RawDepthOnly provides unsmoothed depth without
 enabling depth based hit tests.
 */
enum class SVARDepthMode {
    Disabled,
    Automatic,
    RawDepthOnly
};

enum class SVARLightEstimationMode {
    Disabled,
    AmbientIntensity,
    EnvironmentalHDR
};

enum class SVARFocusMode {
    Fixed,
    Auto
};

/*
 Full configuration of an SVARSession. Configurations are values: a
 session is reconfigured by passing a modified copy to
 SVARSession::configure().
 */
struct SVARSessionConfig {

    SVARPlaneFindingMode planeFindingMode;
    SVARDepthMode depthMode;
    bool instantPlacementEnabled;
    SVARLightEstimationMode lightEstimationMode;
    bool cloudAnchorEnabled;
    bool geospatialEnabled;
    SVARFocusMode focusMode;

    SVARSessionConfig() :
        planeFindingMode(SVARPlaneFindingMode::HorizontalAndVertical),
        depthMode(SVARDepthMode::Automatic),
        instantPlacementEnabled(true),
        lightEstimationMode(SVARLightEstimationMode::EnvironmentalHDR),
        cloudAnchorEnabled(false),
        geospatialEnabled(false),
        focusMode(SVARFocusMode::Auto) {}

    bool isPlaneFindingEnabled() const {
        return planeFindingMode != SVARPlaneFindingMode::Disabled;
    }
    bool isDepthEnabled() const {
        return depthMode == SVARDepthMode::Automatic;
    }

    bool operator==(const SVARSessionConfig &other) const {
        return planeFindingMode == other.planeFindingMode &&
               depthMode == other.depthMode &&
               instantPlacementEnabled == other.instantPlacementEnabled &&
               lightEstimationMode == other.lightEstimationMode &&
               cloudAnchorEnabled == other.cloudAnchorEnabled &&
               geospatialEnabled == other.geospatialEnabled &&
               focusMode == other.focusMode;
    }
    bool operator!=(const SVARSessionConfig &other) const {
        return !(*this == other);
    }
};

inline std::string SVARPlaneFindingModeToString(SVARPlaneFindingMode mode) {
    switch (mode) {
        case SVARPlaneFindingMode::Disabled: return "DISABLED";
        case SVARPlaneFindingMode::Horizontal: return "HORIZONTAL";
        case SVARPlaneFindingMode::Vertical: return "VERTICAL";
        case SVARPlaneFindingMode::HorizontalAndVertical: return "HORIZONTAL_AND_VERTICAL";
    }
    return "UNKNOWN";
}

inline std::string SVARDepthModeToString(SVARDepthMode mode) {
    switch (mode) {
        case SVARDepthMode::Disabled: return "DISABLED";
        case SVARDepthMode::Automatic: return "AUTOMATIC";
        case SVARDepthMode::RawDepthOnly: return "RAW_DEPTH_ONLY";
    }
    return "UNKNOWN";
}

#endif /* SVARSessionConfig_h */
