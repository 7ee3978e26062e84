//
//  SVARTrackableARCore.h
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

#ifndef SVARTrackableARCore_h
#define SVARTrackableARCore_h

#include <memory>
#include "SVARPlane.h"
#include "SVARPoint.h"
#include "ARCore_API.h"

/*
 Wrap the given ARCore trackable in the matching SceneViewAR trackable,
 taking ownership of it. Depth points carry no pose of their own in ARCore;
 the pose they were hit at is given in hitPose. Returns nullptr for
 trackable types SceneViewAR does not place on.
 */
std::shared_ptr<SVARTrackable> SVCreateTrackableARCore(arcore::Trackable *trackable,
                                                       std::shared_ptr<arcore::Session> session,
                                                       const SVPose &hitPose);

class SVARPlaneARCore : public SVARPlane {
public:

    SVARPlaneARCore(std::shared_ptr<arcore::Plane> plane, std::shared_ptr<arcore::Session> session) :
        _plane(plane), _session(session) {}
    virtual ~SVARPlaneARCore() {}

    uint64_t getHashCode() const {
        return _plane->getHashCode();
    }
    SVARTrackingState getTrackingState() const;
    SVPose getCenterPose() const;
    std::shared_ptr<SVARAnchor> acquireAnchor(const SVPose &pose, SVARAnchorAcquireStatus *outStatus);

    SVARPlaneType getPlaneType() const;
    float getExtentX() const;
    float getExtentZ() const;
    bool isPoseInExtents(const SVPose &pose) const;
    bool isPoseInPolygon(const SVPose &pose) const;
    std::shared_ptr<SVARPlane> getSubsumedBy() const;

private:

    std::shared_ptr<arcore::Plane> _plane;
    std::shared_ptr<arcore::Session> _session;

};

class SVARPointARCore : public SVARPoint {
public:

    SVARPointARCore(std::shared_ptr<arcore::Point> point, std::shared_ptr<arcore::Session> session) :
        _point(point), _session(session) {}
    virtual ~SVARPointARCore() {}

    uint64_t getHashCode() const {
        return _point->getHashCode();
    }
    SVARTrackingState getTrackingState() const;
    SVPose getCenterPose() const;
    std::shared_ptr<SVARAnchor> acquireAnchor(const SVPose &pose, SVARAnchorAcquireStatus *outStatus);
    SVARPointOrientationMode getOrientationMode() const;

private:

    std::shared_ptr<arcore::Point> _point;
    std::shared_ptr<arcore::Session> _session;

};

class SVARDepthPointARCore : public SVARDepthPoint {
public:

    SVARDepthPointARCore(std::shared_ptr<arcore::Trackable> trackable, std::shared_ptr<arcore::Session> session,
                         SVPose pose) :
        _trackable(trackable), _session(session), _pose(pose) {}
    virtual ~SVARDepthPointARCore() {}

    uint64_t getHashCode() const {
        return _trackable->getHashCode();
    }
    SVARTrackingState getTrackingState() const;
    SVPose getCenterPose() const {
        return _pose;
    }
    std::shared_ptr<SVARAnchor> acquireAnchor(const SVPose &pose, SVARAnchorAcquireStatus *outStatus);

private:

    std::shared_ptr<arcore::Trackable> _trackable;
    std::shared_ptr<arcore::Session> _session;
    SVPose _pose;

};

class SVARInstantPlacementPointARCore : public SVARInstantPlacementPoint {
public:

    SVARInstantPlacementPointARCore(std::shared_ptr<arcore::InstantPlacementPoint> point,
                                    std::shared_ptr<arcore::Session> session) :
        _point(point), _session(session) {}
    virtual ~SVARInstantPlacementPointARCore() {}

    uint64_t getHashCode() const {
        return _point->getHashCode();
    }
    SVARTrackingState getTrackingState() const;
    SVPose getCenterPose() const;
    std::shared_ptr<SVARAnchor> acquireAnchor(const SVPose &pose, SVARAnchorAcquireStatus *outStatus);
    SVARInstantPlacementTrackingMethod getTrackingMethod() const;

private:

    std::shared_ptr<arcore::InstantPlacementPoint> _point;
    std::shared_ptr<arcore::Session> _session;

};

#endif /* SVARTrackableARCore_h */
