//
//  SVARTestDoubles.h
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

#ifndef SVARTestDoubles_h
#define SVARTestDoubles_h

#include <memory>
#include <string>
#include <vector>
#include "SVARAnchor.h"
#include "SVARAnchorTask.h"
#include "SVARCamera.h"
#include "SVARFrame.h"
#include "SVARHitTestResult.h"
#include "SVARPlane.h"
#include "SVARPoint.h"
#include "SVARSession.h"

/*
 In-memory implementations of the tracking contracts. Every piece of state
 is public and set directly by the test; nothing changes on its own.
 */

class SVTestAnchor : public SVARAnchor {
public:

    SVTestAnchor(std::string id, SVPose pose) :
        id(id),
        pose(pose),
        trackingState(SVARTrackingState::Tracking),
        cloudAnchorState(SVARCloudAnchorState::None),
        detachCount(0) {}

    std::string getId() const {
        return id;
    }
    SVPose getPose() const {
        return pose;
    }
    SVARTrackingState getTrackingState() const {
        return detachCount > 0 ? SVARTrackingState::Stopped : trackingState;
    }
    SVARCloudAnchorState getCloudAnchorState() const {
        return cloudAnchorState;
    }
    std::string getCloudAnchorId() const {
        return cloudAnchorId;
    }
    void detach() {
        detachCount++;
    }

    std::string id;
    SVPose pose;
    SVARTrackingState trackingState;
    SVARCloudAnchorState cloudAnchorState;
    std::string cloudAnchorId;
    int detachCount;

};

/*
 Shared anchor factory for the test trackables: hands out anchors while
 tracking (or always, if requireTracking is cleared), or fails with the
 configured status.
 */
class SVTestAnchorSource {
public:

    SVTestAnchorSource() :
        failureStatus(SVARAnchorAcquireStatus::Success),
        requireTracking(true),
        _nextId(0) {}

    std::shared_ptr<SVARAnchor> acquire(const SVPose &pose, SVARTrackingState trackingState,
                                        SVARAnchorAcquireStatus *outStatus) {
        if (failureStatus != SVARAnchorAcquireStatus::Success) {
            *outStatus = failureStatus;
            return nullptr;
        }
        if (requireTracking && trackingState != SVARTrackingState::Tracking) {
            *outStatus = SVARAnchorAcquireStatus::ErrorNotTracking;
            return nullptr;
        }
        std::shared_ptr<SVTestAnchor> anchor = std::make_shared<SVTestAnchor>("anchor-" + std::to_string(++_nextId), pose);
        anchors.push_back(anchor);
        *outStatus = SVARAnchorAcquireStatus::Success;
        return anchor;
    }

    SVARAnchorAcquireStatus failureStatus;
    bool requireTracking;
    std::vector<std::shared_ptr<SVTestAnchor>> anchors;

private:

    int _nextId;

};

class SVTestPlane : public SVARPlane {
public:

    SVTestPlane(uint64_t hashCode, SVPose centerPose) :
        hashCode(hashCode),
        trackingState(SVARTrackingState::Tracking),
        centerPose(centerPose),
        planeType(SVARPlaneType::HorizontalUpward),
        inPolygon(true) {}

    uint64_t getHashCode() const {
        return hashCode;
    }
    SVARTrackingState getTrackingState() const {
        return trackingState;
    }
    SVPose getCenterPose() const {
        return centerPose;
    }
    std::shared_ptr<SVARAnchor> acquireAnchor(const SVPose &pose, SVARAnchorAcquireStatus *outStatus) {
        return anchorSource.acquire(pose, trackingState, outStatus);
    }
    SVARPlaneType getPlaneType() const {
        return planeType;
    }
    float getExtentX() const {
        return 1.0f;
    }
    float getExtentZ() const {
        return 1.0f;
    }
    bool isPoseInExtents(const SVPose &pose) const {
        return inPolygon;
    }
    bool isPoseInPolygon(const SVPose &pose) const {
        return inPolygon;
    }
    std::shared_ptr<SVARPlane> getSubsumedBy() const {
        return nullptr;
    }

    uint64_t hashCode;
    SVARTrackingState trackingState;
    SVPose centerPose;
    SVARPlaneType planeType;
    bool inPolygon;
    SVTestAnchorSource anchorSource;

};

class SVTestPoint : public SVARPoint {
public:

    SVTestPoint(uint64_t hashCode, SVPose pose) :
        hashCode(hashCode),
        trackingState(SVARTrackingState::Tracking),
        pose(pose),
        orientationMode(SVARPointOrientationMode::EstimatedSurfaceNormal) {}

    uint64_t getHashCode() const {
        return hashCode;
    }
    SVARTrackingState getTrackingState() const {
        return trackingState;
    }
    SVPose getCenterPose() const {
        return pose;
    }
    std::shared_ptr<SVARAnchor> acquireAnchor(const SVPose &pose, SVARAnchorAcquireStatus *outStatus) {
        return anchorSource.acquire(pose, trackingState, outStatus);
    }
    SVARPointOrientationMode getOrientationMode() const {
        return orientationMode;
    }

    uint64_t hashCode;
    SVARTrackingState trackingState;
    SVPose pose;
    SVARPointOrientationMode orientationMode;
    SVTestAnchorSource anchorSource;

};

class SVTestDepthPoint : public SVARDepthPoint {
public:

    SVTestDepthPoint(uint64_t hashCode, SVPose pose) :
        hashCode(hashCode),
        trackingState(SVARTrackingState::Tracking),
        pose(pose) {}

    uint64_t getHashCode() const {
        return hashCode;
    }
    SVARTrackingState getTrackingState() const {
        return trackingState;
    }
    SVPose getCenterPose() const {
        return pose;
    }
    std::shared_ptr<SVARAnchor> acquireAnchor(const SVPose &pose, SVARAnchorAcquireStatus *outStatus) {
        return anchorSource.acquire(pose, trackingState, outStatus);
    }

    uint64_t hashCode;
    SVARTrackingState trackingState;
    SVPose pose;
    SVTestAnchorSource anchorSource;

};

class SVTestInstantPlacementPoint : public SVARInstantPlacementPoint {
public:

    SVTestInstantPlacementPoint(uint64_t hashCode, SVPose pose) :
        hashCode(hashCode),
        trackingState(SVARTrackingState::Tracking),
        pose(pose),
        trackingMethod(SVARInstantPlacementTrackingMethod::ScreenspaceWithApproximateDistance) {}

    uint64_t getHashCode() const {
        return hashCode;
    }
    SVARTrackingState getTrackingState() const {
        return trackingState;
    }
    SVPose getCenterPose() const {
        return pose;
    }
    std::shared_ptr<SVARAnchor> acquireAnchor(const SVPose &pose, SVARAnchorAcquireStatus *outStatus) {
        return anchorSource.acquire(pose, trackingState, outStatus);
    }
    SVARInstantPlacementTrackingMethod getTrackingMethod() const {
        return trackingMethod;
    }

    uint64_t hashCode;
    SVARTrackingState trackingState;
    SVPose pose;
    SVARInstantPlacementTrackingMethod trackingMethod;
    SVTestAnchorSource anchorSource;

};

class SVTestCamera : public SVARCamera {
public:

    SVTestCamera(SVARTrackingState trackingState, SVPose pose) :
        trackingState(trackingState),
        pose(pose) {}

    SVARTrackingState getTrackingState() const {
        return trackingState;
    }
    SVPose getPose() const {
        return pose;
    }

    SVARTrackingState trackingState;
    SVPose pose;

};

class SVTestFrame : public SVARFrame {
public:

    SVTestFrame(int64_t timestampNs, std::shared_ptr<SVARCamera> camera) :
        timestampNs(timestampNs),
        camera(camera),
        hitTestCount(0),
        instantHitTestCount(0),
        lastInstantDistance(0) {}

    int64_t getTimestampNs() const {
        return timestampNs;
    }
    const std::shared_ptr<SVARCamera> &getCamera() const {
        return camera;
    }
    std::vector<std::shared_ptr<SVARHitTestResult>> hitTest(float x, float y) {
        hitTestCount++;
        lastHitPoint = SVVector3f(x, y, 0);
        return hits;
    }
    std::vector<std::shared_ptr<SVARHitTestResult>> hitTestInstantPlacement(float x, float y,
                                                                             float approximateDistance) {
        instantHitTestCount++;
        lastHitPoint = SVVector3f(x, y, 0);
        lastInstantDistance = approximateDistance;
        return instantHits;
    }
    const std::vector<std::shared_ptr<SVARTrackable>> &getUpdatedTrackables() const {
        return updatedTrackables;
    }

    int64_t timestampNs;
    std::shared_ptr<SVARCamera> camera;
    std::vector<std::shared_ptr<SVARHitTestResult>> hits;
    std::vector<std::shared_ptr<SVARHitTestResult>> instantHits;
    std::vector<std::shared_ptr<SVARTrackable>> updatedTrackables;

    int hitTestCount;
    int instantHitTestCount;
    SVVector3f lastHitPoint;
    float lastInstantDistance;

};

/*
 Anchor task whose progress is driven by the test.
 */
class SVTestAnchorTask : public SVARAnchorTask {
public:

    SVTestAnchorTask(SVARAnchorTaskType type) :
        type(type),
        state(SVARAnchorTaskState::InProgress),
        cancelCount(0),
        pollCount(0) {}

    SVARAnchorTaskType getType() const {
        return type;
    }
    SVARAnchorTaskState getState() {
        pollCount++;
        return state;
    }
    std::shared_ptr<SVARAnchor> getAnchor() const {
        return anchor;
    }
    void cancel() {
        cancelCount++;
        state = SVARAnchorTaskState::Cancelled;
    }

    SVARAnchorTaskType type;
    SVARAnchorTaskState state;
    std::shared_ptr<SVARAnchor> anchor;
    int cancelCount;
    int pollCount;

};

/*
 Session producing one SVTestFrame per update(), frameIntervalNs apart.
 Each new frame starts with the current camera and hit results; tests
 change those between updates to script what the next frame sees.
 */
class SVTestSession : public SVARSession {
public:

    SVTestSession() :
        depthSupported(true),
        geospatialSupported(true),
        acceptConfig(true),
        frameIntervalNs(33333333),
        timestampNs(0),
        cameraTrackingState(SVARTrackingState::Tracking),
        cameraPose(SVVector3f(0, 1.5f, 0), SVQuaternion()),
        applyConfigCount(0),
        pauseCount(0),
        closeCount(0),
        pausedBeforeClose(false),
        lastTTLDays(0),
        earthTrackingState(SVEarthTrackingState::Stopped) {}

    bool isDepthModeSupported(SVARDepthMode mode) const {
        return depthSupported;
    }
    bool isGeospatialModeSupported() const {
        return geospatialSupported;
    }
    SVEarthTrackingState getEarthTrackingState() const {
        return getConfig().geospatialEnabled ? earthTrackingState : SVEarthTrackingState::Stopped;
    }
    SVGeospatialPose getCameraGeospatialPose() const {
        return getConfig().geospatialEnabled ? cameraGeospatialPose : SVGeospatialPose();
    }

    std::shared_ptr<SVTestFrame> getTestFrame() const {
        return std::dynamic_pointer_cast<SVTestFrame>(getCurrentFrame());
    }

    /*
     Hit tests issued against every frame produced so far.
     */
    int countHitTests() const {
        int count = 0;
        for (const std::shared_ptr<SVTestFrame> &frame : frames) {
            count += frame->hitTestCount + frame->instantHitTestCount;
        }
        return count;
    }

    bool depthSupported;
    bool geospatialSupported;
    bool acceptConfig;

    int64_t frameIntervalNs;
    int64_t timestampNs;
    SVARTrackingState cameraTrackingState;
    SVPose cameraPose;
    std::vector<std::shared_ptr<SVARHitTestResult>> hits;
    std::vector<std::shared_ptr<SVARHitTestResult>> instantHits;
    std::vector<std::shared_ptr<SVARTrackable>> updatedTrackables;
    std::vector<std::shared_ptr<SVTestFrame>> frames;

    int applyConfigCount;
    SVARSessionConfig lastAppliedConfig;

    int pauseCount;
    int closeCount;
    bool pausedBeforeClose;

    SVTestAnchorSource anchorSource;
    std::shared_ptr<SVTestAnchor> lastCloudAnchor;
    std::shared_ptr<SVTestAnchorTask> lastGeospatialTask;
    std::vector<SVGeospatialAnchorRequest> geospatialRequests;
    int lastTTLDays;

    SVEarthTrackingState earthTrackingState;
    SVGeospatialPose cameraGeospatialPose;

protected:

    bool applyConfig(const SVARSessionConfig &config) {
        applyConfigCount++;
        if (!acceptConfig) {
            return false;
        }
        lastAppliedConfig = config;
        return true;
    }
    bool resumeSession() {
        return true;
    }
    void pauseSession() {
        pauseCount++;
    }
    void closeSession() {
        closeCount++;
        pausedBeforeClose = pauseCount > 0;
    }
    void applyDisplayGeometry(int rotation, int width, int height) {}

    std::shared_ptr<SVARFrame> updateFrame() {
        timestampNs += frameIntervalNs;
        std::shared_ptr<SVTestFrame> frame =
            std::make_shared<SVTestFrame>(timestampNs, std::make_shared<SVTestCamera>(cameraTrackingState, cameraPose));
        frame->hits = hits;
        frame->instantHits = instantHits;
        frame->updatedTrackables = updatedTrackables;
        frames.push_back(frame);
        return frame;
    }

    std::shared_ptr<SVARAnchor> acquireAnchor(const SVPose &pose, SVARAnchorAcquireStatus *outStatus) {
        return anchorSource.acquire(pose, SVARTrackingState::Tracking, outStatus);
    }

    std::shared_ptr<SVARAnchorTask> startHostCloudAnchor(const std::shared_ptr<SVARAnchor> &anchor, int ttlDays,
                                                         SVARAnchorAcquireStatus *outStatus) {
        lastTTLDays = ttlDays;
        lastCloudAnchor = std::make_shared<SVTestAnchor>(anchor->getId() + "-hosted", anchor->getPose());
        lastCloudAnchor->cloudAnchorState = SVARCloudAnchorState::TaskInProgress;
        *outStatus = SVARAnchorAcquireStatus::Success;
        return std::make_shared<SVARCloudAnchorTask>(SVARAnchorTaskType::HostCloudAnchor, lastCloudAnchor);
    }

    std::shared_ptr<SVARAnchorTask> startResolveCloudAnchor(const std::string &cloudAnchorId,
                                                            SVARAnchorAcquireStatus *outStatus) {
        lastCloudAnchor = std::make_shared<SVTestAnchor>("resolved-" + cloudAnchorId, SVPose());
        lastCloudAnchor->trackingState = SVARTrackingState::Paused;
        lastCloudAnchor->cloudAnchorState = SVARCloudAnchorState::TaskInProgress;
        *outStatus = SVARAnchorAcquireStatus::Success;
        return std::make_shared<SVARCloudAnchorTask>(SVARAnchorTaskType::ResolveCloudAnchor, lastCloudAnchor);
    }

    std::shared_ptr<SVARAnchorTask> startResolveGeospatialAnchor(const SVGeospatialAnchorRequest &request,
                                                                 SVARAnchorAcquireStatus *outStatus) {
        geospatialRequests.push_back(request);
        lastGeospatialTask = std::make_shared<SVTestAnchorTask>(
            request.type == SVGeospatialAnchorType::Rooftop ? SVARAnchorTaskType::ResolveRooftopAnchor
                                                            : SVARAnchorTaskType::ResolveTerrainAnchor);
        *outStatus = SVARAnchorAcquireStatus::Success;
        return lastGeospatialTask;
    }

};

/*
 Helpers to build hit results against the test trackables.
 */
inline std::shared_ptr<SVARHitTestResult> SVCreateTestHit(std::shared_ptr<SVARTrackable> trackable,
                                                          SVPose hitPose, float distance = 1.0f) {
    return std::make_shared<SVARHitTestResult>(trackable, hitPose, distance);
}

inline std::shared_ptr<SVARHitTestResult> SVCreateTestPlaneHit(uint64_t hashCode, SVPose hitPose,
                                                               SVARTrackingState state = SVARTrackingState::Tracking) {
    std::shared_ptr<SVTestPlane> plane = std::make_shared<SVTestPlane>(hashCode, hitPose);
    plane->trackingState = state;
    return SVCreateTestHit(plane, hitPose);
}

#endif /* SVARTestDoubles_h */
