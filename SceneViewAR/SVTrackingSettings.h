//
//  SVTrackingSettings.h
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

#ifndef SVTrackingSettings_h
#define SVTrackingSettings_h

#include "SVVector3f.h"

/*
 Default hit tests issued per second by a node that is still being placed.
 */
static const float kDefaultMaxHitTestsPerSecond = 10.0f;

/*
 Default smoothing speed, in 1/s. Each frame a smoothed node covers
 (frame interval * speed) of the remaining distance to its target, clamped
 to the whole distance.
 */
static const float kDefaultSmoothSpeed = 5.0f;

/*
 Default distance, in meters, at which instant placement points are
 created before real depth is known.
 */
static const float kDefaultPlacementDistance = 2.0f;

/*
 Default normalized screen-space placement point: the center of the view,
 kDefaultPlacementDistance meters forward (negative Z is forward).
 */
static const SVVector3f kDefaultPlacementPosition = SVVector3f(0.0f, 0.0f, -kDefaultPlacementDistance);

/*
 Tunables shared by the tracking behaviors of a node.
 */
struct SVTrackingSettings {

    /*
     Upper bound on placement hit tests, in hit tests per second. Must be
     greater than zero.
     */
    float maxHitTestsPerSecond;

    /*
     Smoothing speed for pose driven transform changes, in 1/s.
     */
    float smoothSpeed;

    /*
     Whether pose driven transform changes are smoothed at all.
     */
    bool smoothPose;

    /*
     Minimum time between two refreshes of a node's pose from its anchor,
     in seconds. Zero refreshes the pose every frame.
     */
    double anchorPoseUpdateInterval;

    /*
     When true, a placement node that has no tracking hit result may
     anchor on the most recent hit result even if it is not tracking.
     */
    bool allowNonTrackingAnchorFallback;

    SVTrackingSettings() :
        maxHitTestsPerSecond(kDefaultMaxHitTestsPerSecond),
        smoothSpeed(kDefaultSmoothSpeed),
        smoothPose(true),
        anchorPoseUpdateInterval(0),
        allowNonTrackingAnchorFallback(false) {}
};

#endif /* SVTrackingSettings_h */
