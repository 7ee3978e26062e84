//
//  SVARTrackableARCore.cpp
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

#include "SVARTrackableARCore.h"
#include "SVARAnchorARCore.h"
#include "SVARUtilsARCore.h"

static std::shared_ptr<SVARAnchor> acquireAnchorOnTrackable(arcore::Trackable *trackable,
                                                            const std::shared_ptr<arcore::Session> &session,
                                                            const SVPose &pose, SVARAnchorAcquireStatus *outStatus) {
    float raw[7];
    pose.toRaw(raw);
    std::unique_ptr<arcore::Pose> pose_arc(session->createPose(raw));

    arcore::AnchorAcquireStatus status;
    arcore::Anchor *anchor = trackable->acquireAnchor(pose_arc.get(), &status);
    *outStatus = SVConvertAnchorAcquireStatus(status);
    if (!anchor) {
        return nullptr;
    }
    return std::make_shared<SVARAnchorARCore>(std::shared_ptr<arcore::Anchor>(anchor), session);
}

std::shared_ptr<SVARTrackable> SVCreateTrackableARCore(arcore::Trackable *trackable,
                                                       std::shared_ptr<arcore::Session> session,
                                                       const SVPose &hitPose) {
    if (trackable == nullptr) {
        return nullptr;
    }
    switch (trackable->getType()) {
        case arcore::TrackableType::Plane:
            return std::make_shared<SVARPlaneARCore>(std::shared_ptr<arcore::Plane>((arcore::Plane *) trackable),
                                                     session);
        case arcore::TrackableType::Point:
            return std::make_shared<SVARPointARCore>(std::shared_ptr<arcore::Point>((arcore::Point *) trackable),
                                                     session);
        case arcore::TrackableType::DepthPoint:
            return std::make_shared<SVARDepthPointARCore>(std::shared_ptr<arcore::Trackable>(trackable),
                                                          session, hitPose);
        case arcore::TrackableType::InstantPlacementPoint:
            return std::make_shared<SVARInstantPlacementPointARCore>(
                    std::shared_ptr<arcore::InstantPlacementPoint>((arcore::InstantPlacementPoint *) trackable),
                    session);
        default:
            delete (trackable);
            return nullptr;
    }
}

#pragma mark - Plane

SVARTrackingState SVARPlaneARCore::getTrackingState() const {
    return SVConvertTrackingState(_plane->getTrackingState());
}

SVPose SVARPlaneARCore::getCenterPose() const {
    std::unique_ptr<arcore::Pose> pose(_session->createPose());
    _plane->getCenterPose(pose.get());
    return SVConvertPose(pose.get());
}

std::shared_ptr<SVARAnchor> SVARPlaneARCore::acquireAnchor(const SVPose &pose, SVARAnchorAcquireStatus *outStatus) {
    return acquireAnchorOnTrackable(_plane.get(), _session, pose, outStatus);
}

SVARPlaneType SVARPlaneARCore::getPlaneType() const {
    return SVConvertPlaneType(_plane->getPlaneType());
}

float SVARPlaneARCore::getExtentX() const {
    return _plane->getExtentX();
}

float SVARPlaneARCore::getExtentZ() const {
    return _plane->getExtentZ();
}

bool SVARPlaneARCore::isPoseInExtents(const SVPose &pose) const {
    float raw[7];
    pose.toRaw(raw);
    std::unique_ptr<arcore::Pose> pose_arc(_session->createPose(raw));
    return _plane->isPoseInExtents(pose_arc.get());
}

bool SVARPlaneARCore::isPoseInPolygon(const SVPose &pose) const {
    float raw[7];
    pose.toRaw(raw);
    std::unique_ptr<arcore::Pose> pose_arc(_session->createPose(raw));
    return _plane->isPoseInPolygon(pose_arc.get());
}

std::shared_ptr<SVARPlane> SVARPlaneARCore::getSubsumedBy() const {
    arcore::Plane *subsumingPlane = _plane->acquireSubsumedBy();
    if (!subsumingPlane) {
        return nullptr;
    }
    return std::make_shared<SVARPlaneARCore>(std::shared_ptr<arcore::Plane>(subsumingPlane), _session);
}

#pragma mark - Point

SVARTrackingState SVARPointARCore::getTrackingState() const {
    return SVConvertTrackingState(_point->getTrackingState());
}

SVPose SVARPointARCore::getCenterPose() const {
    std::unique_ptr<arcore::Pose> pose(_session->createPose());
    _point->getPose(pose.get());
    return SVConvertPose(pose.get());
}

std::shared_ptr<SVARAnchor> SVARPointARCore::acquireAnchor(const SVPose &pose, SVARAnchorAcquireStatus *outStatus) {
    return acquireAnchorOnTrackable(_point.get(), _session, pose, outStatus);
}

SVARPointOrientationMode SVARPointARCore::getOrientationMode() const {
    if (_point->getOrientationMode() == arcore::PointOrientationMode::EstimatedSurfaceNormal) {
        return SVARPointOrientationMode::EstimatedSurfaceNormal;
    }
    return SVARPointOrientationMode::InitializedToIdentity;
}

#pragma mark - Depth Point

SVARTrackingState SVARDepthPointARCore::getTrackingState() const {
    return SVConvertTrackingState(_trackable->getTrackingState());
}

std::shared_ptr<SVARAnchor> SVARDepthPointARCore::acquireAnchor(const SVPose &pose,
                                                                SVARAnchorAcquireStatus *outStatus) {
    return acquireAnchorOnTrackable(_trackable.get(), _session, pose, outStatus);
}

#pragma mark - Instant Placement Point

SVARTrackingState SVARInstantPlacementPointARCore::getTrackingState() const {
    return SVConvertTrackingState(_point->getTrackingState());
}

SVPose SVARInstantPlacementPointARCore::getCenterPose() const {
    std::unique_ptr<arcore::Pose> pose(_session->createPose());
    _point->getPose(pose.get());
    return SVConvertPose(pose.get());
}

std::shared_ptr<SVARAnchor> SVARInstantPlacementPointARCore::acquireAnchor(const SVPose &pose,
                                                                           SVARAnchorAcquireStatus *outStatus) {
    return acquireAnchorOnTrackable(_point.get(), _session, pose, outStatus);
}

SVARInstantPlacementTrackingMethod SVARInstantPlacementPointARCore::getTrackingMethod() const {
    switch (_point->getTrackingMethod()) {
        case arcore::InstantPlacementTrackingMethod::FullTracking:
            return SVARInstantPlacementTrackingMethod::FullTracking;
        case arcore::InstantPlacementTrackingMethod::ScreenspaceWithApproximateDistance:
            return SVARInstantPlacementTrackingMethod::ScreenspaceWithApproximateDistance;
        default:
            return SVARInstantPlacementTrackingMethod::NotTracking;
    }
}
