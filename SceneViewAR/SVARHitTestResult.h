//
//  SVARHitTestResult.h
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

#ifndef SVARHitTestResult_h
#define SVARHitTestResult_h

#include <memory>
#include <set>
#include "SVPose.h"
#include "SVARTracking.h"
#include "SVARPlane.h"
#include "SVARPoint.h"

class SVARAnchor;

/*
 Types of hit test results:

 ExistingPlaneUsingExtent: Hit test found a plane and the hit location was
                           within the plane's boundary polygon.
 ExistingPlane: Hit test found a plane, but the hit location is outside its
                boundary polygon.
 FeaturePoint: Hit test found a point that the session believes is part of a
               continuous surface. This surface may not be horizontal.
 DepthPoint: Hit test found a point using depth data. Requires depth to be
             enabled on the session.
 InstantPlacementPoint: Hit test produced a point at an approximate distance
                        before the surface behind it is known.
 */
enum class SVARHitTestResultType {
    ExistingPlaneUsingExtent,
    ExistingPlane,
    FeaturePoint,
    DepthPoint,
    InstantPlacementPoint,
    Unknown
};

/*
 Criteria a hit test result must meet to be used for placement.
 */
struct SVARHitTestFilter {

    // Accepted plane types for plane results
    std::set<SVARPlaneType> planeTypes;

    // Which kinds of trackable are accepted at all
    bool point;
    bool depthPoint;
    bool instantPlacementPoint;

    // Accepted tracking states of the hit trackable
    std::set<SVARTrackingState> trackingStates;

    // Accepted orientation modes for feature point results
    std::set<SVARPointOrientationMode> pointOrientationModes;

    // Plane results must lie within the plane's boundary polygon
    bool planePoseInPolygon;

    // When enabled, plane results must face the camera from at least this
    // distance (meters)
    bool useMinCameraDistance;
    float minCameraDistance;

    SVARHitTestFilter() :
        planeTypes(SVARAllPlaneTypes()),
        point(true),
        depthPoint(true),
        instantPlacementPoint(true),
        trackingStates({ SVARTrackingState::Tracking }),
        pointOrientationModes({ SVARPointOrientationMode::EstimatedSurfaceNormal }),
        planePoseInPolygon(true),
        useMinCameraDistance(false),
        minCameraDistance(0) {}

    /*
     Filter used for placement hit tests with the given features enabled.
     Results of any tracking state pass; plane results must lie in their
     polygon and face the camera.
     */
    static SVARHitTestFilter forFeatures(bool plane, bool depth, bool instantPlacement) {
        SVARHitTestFilter filter;
        if (!plane) {
            filter.planeTypes.clear();
        }
        filter.point = depth;
        filter.depthPoint = depth;
        filter.instantPlacementPoint = instantPlacement;
        filter.trackingStates = SVARAllTrackingStates();
        filter.useMinCameraDistance = true;
        return filter;
    }

    bool isPlaneEnabled() const {
        return !planeTypes.empty();
    }
    bool isDepthEnabled() const {
        return point || depthPoint;
    }
};

/*
 Return value of AR hit tests: the trackable that was hit, where it was hit
 and how far from the camera.
 */
class SVARHitTestResult {
public:

    SVARHitTestResult(std::shared_ptr<SVARTrackable> trackable, SVPose hitPose, float distance) :
        _trackable(trackable), _hitPose(hitPose), _distance(distance) {
    }
    virtual ~SVARHitTestResult() {}

    const std::shared_ptr<SVARTrackable> &getTrackable() const {
        return _trackable;
    }

    /*
     The pose of the intersection point, in world coordinates.
     */
    const SVPose &getHitPose() const {
        return _hitPose;
    }

    /*
     Distance from the camera to the hit location, in meters.
     */
    float getDistance() const {
        return _distance;
    }

    SVARHitTestResultType getType() const;

    /*
     True if the hit trackable is currently tracking.
     */
    bool isTracking() const;

    /*
     Create a new anchor at the hit location. The default implementation
     pins the anchor to the hit trackable. On failure returns nullptr and
     writes the cause to outStatus.
     */
    virtual std::shared_ptr<SVARAnchor> createAnchor(SVARAnchorAcquireStatus *outStatus);

    /*
     True if this result passes the given filter, as seen from the given
     camera pose.
     */
    bool isValid(const SVARHitTestFilter &filter, const SVPose &cameraPose) const;

private:

    std::shared_ptr<SVARTrackable> _trackable;
    SVPose _hitPose;
    float _distance;

};

#endif /* SVARHitTestResult_h */
