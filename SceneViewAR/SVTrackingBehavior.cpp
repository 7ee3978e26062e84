//
//  SVTrackingBehavior.cpp
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

#include "SVTrackingBehavior.h"
#include "SVNode.h"
#include "SVNodeDelegate.h"
#include "SVARFrameContext.h"
#include "SVARCamera.h"
#include "SVLog.h"
#include <stdexcept>

static bool kDebugTracking = false;

SVTrackingBehavior::SVTrackingBehavior(SVTrackingSettings settings) :
    _settings(settings),
    _node(nullptr),
    _hasPose(false),
    _cameraTrackingState(SVARTrackingState::Stopped),
    _visibleCameraTrackingStates(SVARAllTrackingStates()) {
    validateSettings(settings);
}

void SVTrackingBehavior::validateSettings(const SVTrackingSettings &settings) {
    if (settings.maxHitTestsPerSecond <= 0) {
        throw std::invalid_argument("Max hit tests per second must be greater than zero");
    }
}

void SVTrackingBehavior::attachToNode(SVNode *node) {
    if (_node && _node != node) {
        throw std::logic_error("Tracking behavior is already attached to a node");
    }
    _node = node;
    _node->setSmoothSpeed(_settings.smoothSpeed);
    if (_hasPose) {
        applyPoseToNode(false);
    }
    onAttach();
}

void SVTrackingBehavior::detachFromNode(SVNode *node) {
    if (_node != node) {
        return;
    }
    _node = nullptr;
    onDetach();
}

void SVTrackingBehavior::setSettings(SVTrackingSettings settings) {
    validateSettings(settings);
    _settings = settings;
    if (_node) {
        _node->setSmoothSpeed(_settings.smoothSpeed);
    }
}

#pragma mark - Pose

void SVTrackingBehavior::setPose(const SVPose &pose) {
    if (_hasPose && _pose == pose) {
        return;
    }
    _pose = pose;
    _hasPose = true;

    if (kDebugTracking) {
        pinfo("Tracked pose changed to %s", pose.toString().c_str());
    }
    if (_node) {
        applyPoseToNode(_settings.smoothPose);
    }
    notifyTrackingChanged();
}

void SVTrackingBehavior::clearPose() {
    if (!_hasPose) {
        return;
    }
    _hasPose = false;
    notifyTrackingChanged();
}

void SVTrackingBehavior::applyPoseToNode(bool smooth) {
    SVVector3f position = keepsPosition() ? _node->getTargetPosition() : _pose.getPosition();
    SVQuaternion rotation = keepsRotation() ? _node->getTargetRotation() : _pose.getRotation();
    _node->transform(position, rotation, smooth);
}

void SVTrackingBehavior::notifyTrackingChanged() {
    if (!_node) {
        return;
    }
    SVNode &node = *_node;
    bool tracking = _hasPose;
    SVPose pose = _pose;
    dispatchToDelegates([&node, tracking, pose](SVNodeDelegate &delegate) {
        delegate.onTrackingChanged(node, tracking, pose);
    });
}

#pragma mark - Camera Tracking

void SVTrackingBehavior::setVisibleCameraTrackingStates(std::set<SVARTrackingState> states) {
    _visibleCameraTrackingStates = states;
    updateNodeVisibility();
}

#pragma mark - Frame Update

bool SVTrackingBehavior::isVisible() const {
    return _visibleCameraTrackingStates.count(_cameraTrackingState) > 0;
}

void SVTrackingBehavior::onARFrame(SVNode &node, const SVARFrameContext &context) {
    if (!context.frame || !context.frame->getCamera()) {
        return;
    }
    SVARTrackingState state = context.frame->getCamera()->getTrackingState();
    if (state == _cameraTrackingState) {
        return;
    }
    _cameraTrackingState = state;
    updateNodeVisibility();

    dispatchToDelegates([&node, state](SVNodeDelegate &delegate) {
        delegate.onCameraTrackingChanged(node, state);
    });
}

void SVTrackingBehavior::dispatchToDelegates(const std::function<void(SVNodeDelegate &)> &fn) {
    if (_node) {
        _node->dispatchToDelegates(fn);
    }
}

void SVTrackingBehavior::updateNodeVisibility() {
    if (_node) {
        _node->updateVisibility();
    }
}
