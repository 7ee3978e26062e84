//
//  SVPlacementMode.h
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

#ifndef SVPlacementMode_h
#define SVPlacementMode_h

#include <string>
#include "SVARSessionConfig.h"

/*
 Which real-world features a node may be placed on.

 Disabled: No hit tests are performed; the node is placed manually.
 PlaneHorizontal: Floors, table tops and ceilings.
 PlaneVertical: Walls.
 PlaneHorizontalAndVertical: Any detected plane.
 Depth: Points from the depth image, on any surface.
 Instant: Instant placement points at an approximate distance, refined
          as tracking improves.
 BestAvailable: Planes and depth, falling back to instant placement while
                neither has a result.
 */
enum class SVPlacementModeType {
    Disabled,
    PlaneHorizontal,
    PlaneVertical,
    PlaneHorizontalAndVertical,
    Depth,
    Instant,
    BestAvailable
};

/*
 A placement mode together with its tunable options. The session
 configuration a mode needs is derived from its type.
 */
class SVPlacementMode {
public:

    SVPlacementMode(SVPlacementModeType type = SVPlacementModeType::BestAvailable);

    SVPlacementModeType getType() const {
        return _type;
    }

    /*
     Distance in meters at which instant placement points are created.
     */
    float getInstantPlacementDistance() const {
        return _instantPlacementDistance;
    }
    void setInstantPlacementDistance(float distance) {
        _instantPlacementDistance = distance;
    }

    /*
     When true, instant placement is used while the mode's own features
     produce no hit result.
     */
    bool isInstantPlacementFallback() const {
        return _instantPlacementFallback;
    }
    void setInstantPlacementFallback(bool fallback) {
        _instantPlacementFallback = fallback;
    }

    /*
     When set, pose updates leave the node's position or rotation
     untouched.
     */
    bool isKeepPosition() const {
        return _keepPosition;
    }
    void setKeepPosition(bool keepPosition) {
        _keepPosition = keepPosition;
    }
    bool isKeepRotation() const {
        return _keepRotation;
    }
    void setKeepRotation(bool keepRotation) {
        _keepRotation = keepRotation;
    }

    SVARPlaneFindingMode getPlaneFindingMode() const;
    bool isPlaneEnabled() const;
    bool isDepthEnabled() const;
    bool isInstantPlacementEnabled() const;

    /*
     Write the plane finding, depth and instant placement settings this
     mode needs into the given session configuration.
     */
    void applyTo(SVARSessionConfig &config) const;

    bool operator==(const SVPlacementMode &other) const {
        return _type == other._type &&
               _instantPlacementDistance == other._instantPlacementDistance &&
               _instantPlacementFallback == other._instantPlacementFallback &&
               _keepPosition == other._keepPosition &&
               _keepRotation == other._keepRotation;
    }
    bool operator!=(const SVPlacementMode &other) const {
        return !(*this == other);
    }

    std::string toString() const;

private:

    SVPlacementModeType _type;
    float _instantPlacementDistance;
    bool _instantPlacementFallback;
    bool _keepPosition;
    bool _keepRotation;

};

#endif /* SVPlacementMode_h */
