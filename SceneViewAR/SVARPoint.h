//
//  SVARPoint.h
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

#ifndef SVARPoint_h
#define SVARPoint_h

#include "SVARTrackable.h"

enum class SVARPointOrientationMode {
    InitializedToIdentity,  // Orientation is the world axes
    EstimatedSurfaceNormal  // Orientation follows the surface around the point
};

/*
 How an instant placement point is currently tracked. Until full tracking
 is reached its pose is only valid in screen space, at an approximate
 distance.
 */
enum class SVARInstantPlacementTrackingMethod {
    NotTracking,
    ScreenspaceWithApproximateDistance,
    FullTracking
};

/*
 Feature point from the point cloud.
 */
class SVARPoint : public SVARTrackable {
public:
    virtual ~SVARPoint() {}

    SVARTrackableType getType() const {
        return SVARTrackableType::Point;
    }

    virtual SVARPointOrientationMode getOrientationMode() const = 0;
};

/*
 Point sampled from the depth image.
 */
class SVARDepthPoint : public SVARTrackable {
public:
    virtual ~SVARDepthPoint() {}

    SVARTrackableType getType() const {
        return SVARTrackableType::DepthPoint;
    }
};

/*
 Point created by an instant placement hit test, before the surface
 behind it is known.
 */
class SVARInstantPlacementPoint : public SVARTrackable {
public:
    virtual ~SVARInstantPlacementPoint() {}

    SVARTrackableType getType() const {
        return SVARTrackableType::InstantPlacementPoint;
    }

    virtual SVARInstantPlacementTrackingMethod getTrackingMethod() const = 0;
};

#endif /* SVARPoint_h */
