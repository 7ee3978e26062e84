//
//  SVAnchorBehavior.cpp
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

#include "SVAnchorBehavior.h"
#include "SVNode.h"
#include "SVNodeDelegate.h"
#include "SVARAnchor.h"
#include "SVARAnchorTask.h"
#include "SVARSession.h"
#include "SVARFrameContext.h"
#include "SVLog.h"
#include <stdexcept>

static bool kDebugAnchorTasks = false;

SVAnchorBehavior::SVAnchorBehavior(SVTrackingSettings settings) :
    SVTrackingBehavior(settings),
    _anchorTrackingState(SVARTrackingState::Stopped),
    _visibleTrackingStates({ SVARTrackingState::Tracking }),
    _updateAnchorPose(true),
    _hasAnchorPoseUpdate(false),
    _lastAnchorPoseUpdateNs(0) {
}

SVAnchorBehavior::SVAnchorBehavior(std::shared_ptr<SVARAnchor> anchor, SVTrackingSettings settings) :
    SVAnchorBehavior(settings) {
    replaceAnchor(anchor);
}

#pragma mark - Anchor

void SVAnchorBehavior::setAnchor(std::shared_ptr<SVARAnchor> anchor) {
    if (_task) {
        pdebug("Anchor replaced, cancelling %s task", SVARAnchorTaskTypeToString(_task->getType()).c_str());
        std::shared_ptr<SVARAnchorTask> task = _task;
        _task.reset();
        _taskCallback = nullptr;
        task->cancel();
    }
    replaceAnchor(anchor);
}

void SVAnchorBehavior::detachAnchor() {
    setAnchor(nullptr);
}

void SVAnchorBehavior::replaceAnchor(std::shared_ptr<SVARAnchor> anchor) {
    if (anchor == _anchor) {
        return;
    }

    // Release the previous anchor before dropping our reference to it
    std::shared_ptr<SVARAnchor> previous = _anchor;
    if (previous) {
        previous->detach();
    }
    _anchor = anchor;
    _hasAnchorPoseUpdate = false;

    if (_anchor) {
        setAnchorTrackingState(_anchor->getTrackingState());
        setPose(_anchor->getPose());
    }
    else {
        setAnchorTrackingState(SVARTrackingState::Stopped);
        clearPose();
    }
    updateNodeVisibility();

    SVNode *node = getNode();
    if (node) {
        dispatchToDelegates([node, anchor](SVNodeDelegate &delegate) {
            delegate.onAnchorChanged(*node, anchor);
        });
    }
}

void SVAnchorBehavior::setAnchorTrackingState(SVARTrackingState state) {
    if (state == _anchorTrackingState) {
        return;
    }
    _anchorTrackingState = state;
    updateNodeVisibility();

    SVNode *node = getNode();
    if (node) {
        dispatchToDelegates([node, state](SVNodeDelegate &delegate) {
            delegate.onTrackingStateChanged(*node, state);
        });
    }
}

std::shared_ptr<SVARAnchor> SVAnchorBehavior::createAnchor(const std::shared_ptr<SVARSession> &session,
                                                           SVARAnchorAcquireStatus *outStatus) {
    if (!session) {
        *outStatus = SVARAnchorAcquireStatus::ErrorSessionPaused;
        return nullptr;
    }
    SVNode *node = getNode();
    if (!isTracking() && !node) {
        *outStatus = SVARAnchorAcquireStatus::ErrorNotTracking;
        return nullptr;
    }
    SVPose pose = isTracking() ? getPose() : node->getWorldPose();
    return session->createAnchor(pose, outStatus);
}

SVARAnchorAcquireStatus SVAnchorBehavior::anchor(const std::shared_ptr<SVARSession> &session) {
    SVARAnchorAcquireStatus status = SVARAnchorAcquireStatus::ErrorUnknown;
    std::shared_ptr<SVARAnchor> anchor = createAnchor(session, &status);
    if (!anchor) {
        return status == SVARAnchorAcquireStatus::Success ? SVARAnchorAcquireStatus::ErrorUnknown : status;
    }
    setAnchor(anchor);
    return SVARAnchorAcquireStatus::Success;
}

void SVAnchorBehavior::setVisibleTrackingStates(std::set<SVARTrackingState> states) {
    _visibleTrackingStates = states;
    updateNodeVisibility();
}

bool SVAnchorBehavior::isVisible() const {
    if (!SVTrackingBehavior::isVisible()) {
        return false;
    }
    return !_anchor || _visibleTrackingStates.count(_anchorTrackingState) > 0;
}

#pragma mark - Anchor Tasks

bool SVAnchorBehavior::isCloudAnchorTaskInProgress() const {
    return _task && (_task->getType() == SVARAnchorTaskType::HostCloudAnchor ||
                     _task->getType() == SVARAnchorTaskType::ResolveCloudAnchor);
}

SVARCloudAnchorState SVAnchorBehavior::getCloudAnchorState() const {
    return _anchor ? _anchor->getCloudAnchorState() : SVARCloudAnchorState::None;
}

std::string SVAnchorBehavior::getCloudAnchorId() const {
    return _anchor ? _anchor->getCloudAnchorId() : "";
}

void SVAnchorBehavior::checkNoTaskInProgress(const char *operation) const {
    if (_task) {
        throw std::logic_error(std::string("Cannot ") + operation + ": " +
                               SVARAnchorTaskTypeToString(_task->getType()) + " task already in progress");
    }
}

SVARAnchorAcquireStatus SVAnchorBehavior::startTask(std::shared_ptr<SVARAnchorTask> task,
                                                    SVARAnchorAcquireStatus status,
                                                    SVAnchorTaskCallback callback) {
    if (!task) {
        if (status == SVARAnchorAcquireStatus::Success) {
            status = SVARAnchorAcquireStatus::ErrorUnknown;
        }
        pwarn("Failed to start anchor task: %s", SVARAnchorAcquireStatusToString(status).c_str());
        return status;
    }
    if (kDebugAnchorTasks) {
        pinfo("Started %s task", SVARAnchorTaskTypeToString(task->getType()).c_str());
    }

    // Cloud tasks hand back the anchor being hosted or resolved right away
    std::shared_ptr<SVARAnchor> anchor = task->getAnchor();
    if (anchor) {
        replaceAnchor(anchor);
    }
    _task = task;
    _taskCallback = callback;
    return SVARAnchorAcquireStatus::Success;
}

SVARAnchorAcquireStatus SVAnchorBehavior::hostCloudAnchor(const std::shared_ptr<SVARSession> &session, int ttlDays,
                                                          SVAnchorTaskCallback callback) {
    checkNoTaskInProgress("host cloud anchor");
    if (!_anchor) {
        throw std::logic_error("Cannot host cloud anchor: node is not anchored");
    }

    SVARAnchorAcquireStatus status = SVARAnchorAcquireStatus::ErrorUnknown;
    std::shared_ptr<SVARAnchorTask> task = session->hostCloudAnchor(_anchor, ttlDays, &status);
    return startTask(task, status, callback);
}

SVARAnchorAcquireStatus SVAnchorBehavior::resolveCloudAnchor(const std::shared_ptr<SVARSession> &session,
                                                             std::string cloudAnchorId,
                                                             SVAnchorTaskCallback callback) {
    checkNoTaskInProgress("resolve cloud anchor");

    SVARAnchorAcquireStatus status = SVARAnchorAcquireStatus::ErrorUnknown;
    std::shared_ptr<SVARAnchorTask> task = session->resolveCloudAnchor(cloudAnchorId, &status);
    return startTask(task, status, callback);
}

SVARAnchorAcquireStatus SVAnchorBehavior::resolveTerrainAnchor(const std::shared_ptr<SVARSession> &session,
                                                               double latitude, double longitude, double altitude,
                                                               SVQuaternion eusQuaternion,
                                                               SVAnchorTaskCallback callback) {
    checkNoTaskInProgress("resolve terrain anchor");
    SVGeospatialAnchorRequest request(SVGeospatialAnchorType::Terrain, latitude, longitude, altitude, eusQuaternion);
    return resolveGeospatialAnchor(session, request, callback);
}

SVARAnchorAcquireStatus SVAnchorBehavior::resolveRooftopAnchor(const std::shared_ptr<SVARSession> &session,
                                                               double latitude, double longitude, double altitude,
                                                               SVQuaternion eusQuaternion,
                                                               SVAnchorTaskCallback callback) {
    checkNoTaskInProgress("resolve rooftop anchor");
    SVGeospatialAnchorRequest request(SVGeospatialAnchorType::Rooftop, latitude, longitude, altitude, eusQuaternion);
    return resolveGeospatialAnchor(session, request, callback);
}

SVARAnchorAcquireStatus SVAnchorBehavior::resolveGeospatialAnchor(const std::shared_ptr<SVARSession> &session,
                                                                  const SVGeospatialAnchorRequest &request,
                                                                  SVAnchorTaskCallback callback) {
    SVARAnchorAcquireStatus status = SVARAnchorAcquireStatus::ErrorUnknown;
    std::shared_ptr<SVARAnchorTask> task = session->resolveGeospatialAnchor(request, &status);
    return startTask(task, status, callback);
}

void SVAnchorBehavior::cancelAnchorTask() {
    if (!_task) {
        return;
    }
    std::shared_ptr<SVARAnchorTask> task = _task;
    _task.reset();
    _taskCallback = nullptr;

    task->cancel();
    replaceAnchor(nullptr);
}

void SVAnchorBehavior::pollAnchorTask() {
    SVARAnchorTaskState state = _task->getState();
    if (state == SVARAnchorTaskState::InProgress) {
        return;
    }

    std::shared_ptr<SVARAnchorTask> task = _task;
    SVAnchorTaskCallback callback = _taskCallback;
    _task.reset();
    _taskCallback = nullptr;

    bool success = (state == SVARAnchorTaskState::Success);
    std::shared_ptr<SVARAnchor> anchor = task->getAnchor();
    if (success) {
        if (anchor) {
            replaceAnchor(anchor);
        }
        pinfo("%s task succeeded", SVARAnchorTaskTypeToString(task->getType()).c_str());
    }
    else {
        pwarn("%s task failed", SVARAnchorTaskTypeToString(task->getType()).c_str());
    }

    if (callback) {
        callback(anchor, success);
    }
}

#pragma mark - Copies

std::shared_ptr<SVNode> SVAnchorBehavior::createAnchoredNode(const std::shared_ptr<SVARSession> &session,
                                                             SVARAnchorAcquireStatus *outStatus) {
    std::shared_ptr<SVARAnchor> anchor = createAnchor(session, outStatus);
    if (!anchor) {
        return nullptr;
    }
    std::shared_ptr<SVAnchorBehavior> behavior = std::make_shared<SVAnchorBehavior>(anchor, _settings);
    behavior->setVisibleTrackingStates(_visibleTrackingStates);
    behavior->setUpdateAnchorPose(_updateAnchorPose);
    return std::make_shared<SVNode>(behavior);
}

std::shared_ptr<SVNode> SVAnchorBehavior::createAnchoredCopy(const std::shared_ptr<SVARSession> &session,
                                                             SVARAnchorAcquireStatus *outStatus) {
    std::shared_ptr<SVNode> copy = createAnchoredNode(session, outStatus);
    SVNode *node = getNode();
    if (!copy || !node) {
        return copy;
    }
    copy->setName(node->getName());
    copy->setScale(node->getScale());
    copy->setSmoothSpeed(node->getSmoothSpeed());
    copy->setVisible(node->isBaseVisible());
    return copy;
}

#pragma mark - Frame Update

void SVAnchorBehavior::onARFrame(SVNode &node, const SVARFrameContext &context) {
    SVTrackingBehavior::onARFrame(node, context);

    if (_anchor) {
        setAnchorTrackingState(_anchor->getTrackingState());
        if (_anchorTrackingState == SVARTrackingState::Tracking && _updateAnchorPose) {
            updatePoseFromAnchor(context);
        }
    }
    if (_task) {
        pollAnchorTask();
    }
}

void SVAnchorBehavior::updatePoseFromAnchor(const SVARFrameContext &context) {
    int64_t timestamp = context.frame ? context.frame->getTimestampNs() : 0;
    if (_hasAnchorPoseUpdate &&
        (timestamp - _lastAnchorPoseUpdateNs) / 1e9 < _settings.anchorPoseUpdateInterval) {
        return;
    }
    setPose(_anchor->getPose());
    _hasAnchorPoseUpdate = true;
    _lastAnchorPoseUpdateNs = timestamp;
}

void SVAnchorBehavior::onDetach() {
    if (_task) {
        std::shared_ptr<SVARAnchorTask> task = _task;
        _task.reset();
        _taskCallback = nullptr;
        task->cancel();
    }
    replaceAnchor(nullptr);
}
