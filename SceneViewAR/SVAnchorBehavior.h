//
//  SVAnchorBehavior.h
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

#ifndef SVAnchorBehavior_h
#define SVAnchorBehavior_h

#include <stdint.h>
#include <string>
#include <functional>
#include "SVTrackingBehavior.h"
#include "SVGeospatial.h"

class SVARAnchor;
class SVARAnchorTask;
class SVARSession;
class SVNode;

/*
 Completion callback of an anchor task. Invoked exactly once, on the frame
 the task reaches a terminal state, unless the task is cancelled first.
 */
typedef std::function<void(std::shared_ptr<SVARAnchor> anchor, bool success)> SVAnchorTaskCallback;

/*
 Pins a node to zero or one anchor and reconciles the node's pose against
 the anchor's live pose every frame. Also runs the asynchronous anchor
 operations (cloud host and resolve, terrain and rooftop resolve), at most
 one at a time.
 */
class SVAnchorBehavior : public SVTrackingBehavior {
public:

    SVAnchorBehavior(SVTrackingSettings settings = SVTrackingSettings());
    SVAnchorBehavior(std::shared_ptr<SVARAnchor> anchor, SVTrackingSettings settings = SVTrackingSettings());
    virtual ~SVAnchorBehavior() {}

    SVTrackingBehaviorType getType() const {
        return SVTrackingBehaviorType::Anchor;
    }

#pragma mark - Anchor

    const std::shared_ptr<SVARAnchor> &getAnchor() const {
        return _anchor;
    }
    bool isAnchored() const {
        return _anchor != nullptr;
    }

    /*
     Replace the node's anchor. The previous anchor, if different, is
     detached. Any anchor task in progress is cancelled without invoking
     its callback. The node's pose is taken from the new anchor, or
     cleared if the anchor is nullptr.
     */
    void setAnchor(std::shared_ptr<SVARAnchor> anchor);

    /*
     Detach the current anchor and leave the node unanchored. Calling this
     when already unanchored does nothing.
     */
    void detachAnchor();

    /*
     Create a new anchor at the node's current pose. Subclasses refine where
     the anchor is created. Does not change the node's anchor.
     */
    virtual std::shared_ptr<SVARAnchor> createAnchor(const std::shared_ptr<SVARSession> &session,
                                                     SVARAnchorAcquireStatus *outStatus);

    /*
     Create an anchor with createAnchor() and make it the node's anchor.
     */
    SVARAnchorAcquireStatus anchor(const std::shared_ptr<SVARSession> &session);

    /*
     Tracking state of the anchor as of the last frame. Stopped while
     unanchored.
     */
    SVARTrackingState getAnchorTrackingState() const {
        return _anchorTrackingState;
    }

    /*
     Anchor tracking states in which the node is visible. Only applies
     while anchored.
     */
    const std::set<SVARTrackingState> &getVisibleTrackingStates() const {
        return _visibleTrackingStates;
    }
    void setVisibleTrackingStates(std::set<SVARTrackingState> states);

    /*
     When false the node keeps the pose it had when anchored instead of
     following the anchor's pose updates.
     */
    bool isUpdateAnchorPose() const {
        return _updateAnchorPose;
    }
    void setUpdateAnchorPose(bool update) {
        _updateAnchorPose = update;
    }

    bool isVisible() const;

#pragma mark - Anchor Tasks

    bool isAnchorTaskInProgress() const {
        return _task != nullptr;
    }
    bool isCloudAnchorTaskInProgress() const;

    const std::shared_ptr<SVARAnchorTask> &getAnchorTask() const {
        return _task;
    }

    /*
     Cloud state and identifier of the current anchor.
     */
    SVARCloudAnchorState getCloudAnchorState() const;
    std::string getCloudAnchorId() const;

    /*
     Host the node's anchor on the cloud anchor service for ttlDays. The
     hosted anchor replaces the node's anchor. Throws std::logic_error if
     the node is not anchored or a task is already in progress. Returns
     Success if the task started; otherwise the callback is never invoked.
     */
    SVARAnchorAcquireStatus hostCloudAnchor(const std::shared_ptr<SVARSession> &session, int ttlDays,
                                            SVAnchorTaskCallback callback);

    /*
     Resolve the cloud anchor with the given identifier and make it the
     node's anchor. Throws std::logic_error if a task is already in
     progress.
     */
    SVARAnchorAcquireStatus resolveCloudAnchor(const std::shared_ptr<SVARSession> &session,
                                               std::string cloudAnchorId,
                                               SVAnchorTaskCallback callback);

    /*
     Resolve an anchor at the given latitude and longitude, altitude meters
     above the terrain or rooftop, with the given East-Up-South rotation.
     On success the resolved anchor becomes the node's anchor.
     */
    SVARAnchorAcquireStatus resolveTerrainAnchor(const std::shared_ptr<SVARSession> &session,
                                                 double latitude, double longitude, double altitude,
                                                 SVQuaternion eusQuaternion,
                                                 SVAnchorTaskCallback callback);
    SVARAnchorAcquireStatus resolveRooftopAnchor(const std::shared_ptr<SVARSession> &session,
                                                 double latitude, double longitude, double altitude,
                                                 SVQuaternion eusQuaternion,
                                                 SVAnchorTaskCallback callback);

    /*
     Cancel the task in progress and detach the anchor it was producing.
     The callback is never invoked. Does nothing if no task is in progress.
     */
    void cancelAnchorTask();
    void cancelCloudAnchorTask() {
        cancelAnchorTask();
    }

#pragma mark - Copies

    /*
     Create a new node anchored at this node's pose, with a fresh anchor
     independent of this node's.
     */
    std::shared_ptr<SVNode> createAnchoredNode(const std::shared_ptr<SVARSession> &session,
                                               SVARAnchorAcquireStatus *outStatus);

    /*
     Like createAnchoredNode(), also copying this node's name, scale,
     visibility and tracking settings.
     */
    std::shared_ptr<SVNode> createAnchoredCopy(const std::shared_ptr<SVARSession> &session,
                                               SVARAnchorAcquireStatus *outStatus);

#pragma mark - Frame Update

    void onARFrame(SVNode &node, const SVARFrameContext &context);

protected:

    void onDetach();

private:

    std::shared_ptr<SVARAnchor> _anchor;
    SVARTrackingState _anchorTrackingState;
    std::set<SVARTrackingState> _visibleTrackingStates;
    bool _updateAnchorPose;

    bool _hasAnchorPoseUpdate;
    int64_t _lastAnchorPoseUpdateNs;

    std::shared_ptr<SVARAnchorTask> _task;
    SVAnchorTaskCallback _taskCallback;

    /*
     Swap in the given anchor, detaching the previous one exactly once.
     Leaves any task in progress untouched.
     */
    void replaceAnchor(std::shared_ptr<SVARAnchor> anchor);
    void setAnchorTrackingState(SVARTrackingState state);

    void checkNoTaskInProgress(const char *operation) const;
    SVARAnchorAcquireStatus startTask(std::shared_ptr<SVARAnchorTask> task, SVARAnchorAcquireStatus status,
                                      SVAnchorTaskCallback callback);
    SVARAnchorAcquireStatus resolveGeospatialAnchor(const std::shared_ptr<SVARSession> &session,
                                                    const SVGeospatialAnchorRequest &request,
                                                    SVAnchorTaskCallback callback);
    void pollAnchorTask();
    void updatePoseFromAnchor(const SVARFrameContext &context);

};

#endif /* SVAnchorBehavior_h */
