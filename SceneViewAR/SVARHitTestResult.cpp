//
//  SVARHitTestResult.cpp
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

#include "SVARHitTestResult.h"
#include "SVARAnchor.h"

SVARHitTestResultType SVARHitTestResult::getType() const {
    if (!_trackable) {
        return SVARHitTestResultType::Unknown;
    }
    switch (_trackable->getType()) {
        case SVARTrackableType::Plane: {
            std::shared_ptr<SVARPlane> plane = std::dynamic_pointer_cast<SVARPlane>(_trackable);
            if (plane && plane->isPoseInPolygon(_hitPose)) {
                return SVARHitTestResultType::ExistingPlaneUsingExtent;
            }
            return SVARHitTestResultType::ExistingPlane;
        }
        case SVARTrackableType::Point:
            return SVARHitTestResultType::FeaturePoint;
        case SVARTrackableType::DepthPoint:
            return SVARHitTestResultType::DepthPoint;
        case SVARTrackableType::InstantPlacementPoint:
            return SVARHitTestResultType::InstantPlacementPoint;
        default:
            return SVARHitTestResultType::Unknown;
    }
}

bool SVARHitTestResult::isTracking() const {
    return _trackable && _trackable->getTrackingState() == SVARTrackingState::Tracking;
}

std::shared_ptr<SVARAnchor> SVARHitTestResult::createAnchor(SVARAnchorAcquireStatus *outStatus) {
    if (!_trackable) {
        *outStatus = SVARAnchorAcquireStatus::ErrorUnsupported;
        return nullptr;
    }
    return _trackable->acquireAnchor(_hitPose, outStatus);
}

bool SVARHitTestResult::isValid(const SVARHitTestFilter &filter, const SVPose &cameraPose) const {
    if (!_trackable) {
        return false;
    }
    if (filter.trackingStates.count(_trackable->getTrackingState()) == 0) {
        return false;
    }

    switch (_trackable->getType()) {
        case SVARTrackableType::Plane: {
            std::shared_ptr<SVARPlane> plane = std::dynamic_pointer_cast<SVARPlane>(_trackable);
            if (!plane || filter.planeTypes.count(plane->getPlaneType()) == 0) {
                return false;
            }
            if (filter.planePoseInPolygon && !plane->isPoseInPolygon(_hitPose)) {
                return false;
            }
            if (filter.useMinCameraDistance && _hitPose.distanceToPlane(cameraPose) <= filter.minCameraDistance) {
                return false;
            }
            return true;
        }
        case SVARTrackableType::Point: {
            if (!filter.point) {
                return false;
            }
            std::shared_ptr<SVARPoint> point = std::dynamic_pointer_cast<SVARPoint>(_trackable);
            return point && filter.pointOrientationModes.count(point->getOrientationMode()) > 0;
        }
        case SVARTrackableType::DepthPoint:
            return filter.depthPoint;
        case SVARTrackableType::InstantPlacementPoint:
            return filter.instantPlacementPoint;
        default:
            return false;
    }
}
