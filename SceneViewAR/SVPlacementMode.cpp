//
//  SVPlacementMode.cpp
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

#include "SVPlacementMode.h"
#include "SVTrackingSettings.h"

SVPlacementMode::SVPlacementMode(SVPlacementModeType type) :
    _type(type),
    _instantPlacementDistance(kDefaultPlacementDistance),
    _instantPlacementFallback(type == SVPlacementModeType::BestAvailable),
    _keepPosition(false),
    _keepRotation(false) {
}

SVARPlaneFindingMode SVPlacementMode::getPlaneFindingMode() const {
    switch (_type) {
        case SVPlacementModeType::PlaneHorizontal:
            return SVARPlaneFindingMode::Horizontal;
        case SVPlacementModeType::PlaneVertical:
            return SVARPlaneFindingMode::Vertical;
        case SVPlacementModeType::PlaneHorizontalAndVertical:
        case SVPlacementModeType::BestAvailable:
            return SVARPlaneFindingMode::HorizontalAndVertical;
        default:
            return SVARPlaneFindingMode::Disabled;
    }
}

bool SVPlacementMode::isPlaneEnabled() const {
    return getPlaneFindingMode() != SVARPlaneFindingMode::Disabled;
}

bool SVPlacementMode::isDepthEnabled() const {
    return _type == SVPlacementModeType::Depth || _type == SVPlacementModeType::BestAvailable;
}

bool SVPlacementMode::isInstantPlacementEnabled() const {
    return _type == SVPlacementModeType::Instant || _instantPlacementFallback;
}

void SVPlacementMode::applyTo(SVARSessionConfig &config) const {
    config.planeFindingMode = getPlaneFindingMode();
    config.depthMode = isDepthEnabled() ? SVARDepthMode::Automatic : SVARDepthMode::Disabled;
    config.instantPlacementEnabled = isInstantPlacementEnabled();
}

std::string SVPlacementMode::toString() const {
    switch (_type) {
        case SVPlacementModeType::Disabled: return "DISABLED";
        case SVPlacementModeType::PlaneHorizontal: return "PLANE_HORIZONTAL";
        case SVPlacementModeType::PlaneVertical: return "PLANE_VERTICAL";
        case SVPlacementModeType::PlaneHorizontalAndVertical: return "PLANE_HORIZONTAL_AND_VERTICAL";
        case SVPlacementModeType::Depth: return "DEPTH";
        case SVPlacementModeType::Instant: return "INSTANT";
        case SVPlacementModeType::BestAvailable: return "BEST_AVAILABLE";
    }
    return "UNKNOWN";
}
