//
//  SVTrackableBehavior.cpp
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

#include "SVTrackableBehavior.h"
#include "SVAnchorBehavior.h"
#include "SVNode.h"
#include "SVNodeDelegate.h"
#include "SVARTrackable.h"
#include "SVARAnchor.h"
#include "SVARFrameContext.h"
#include "SVLog.h"

SVTrackableBehavior::SVTrackableBehavior(std::shared_ptr<SVARTrackable> trackable, SVTrackingSettings settings) :
    SVTrackingBehavior(settings),
    _trackingState(SVARTrackingState::Stopped),
    _visibleTrackingStates({ SVARTrackingState::Tracking }) {
    setTrackable(trackable);
}

void SVTrackableBehavior::setTrackable(std::shared_ptr<SVARTrackable> trackable) {
    if (trackable == _trackable) {
        return;
    }
    if (trackable && _trackable && trackable->isSameTrackable(*_trackable)) {
        // New wrapper for the same feature
        _trackable = trackable;
        return;
    }
    _trackable = trackable;
    updateFromTrackable();
}

void SVTrackableBehavior::updateFromTrackable() {
    SVARTrackingState state = _trackable ? _trackable->getTrackingState() : SVARTrackingState::Stopped;
    setTrackingState(state);

    if (_trackable && state == SVARTrackingState::Tracking) {
        setPose(_trackable->getCenterPose());
    }
}

void SVTrackableBehavior::setTrackingState(SVARTrackingState state) {
    if (state == _trackingState) {
        return;
    }
    _trackingState = state;
    updateNodeVisibility();

    SVNode *node = getNode();
    if (node) {
        dispatchToDelegates([node, state](SVNodeDelegate &delegate) {
            delegate.onTrackingStateChanged(*node, state);
        });
    }
}

void SVTrackableBehavior::setVisibleTrackingStates(std::set<SVARTrackingState> states) {
    _visibleTrackingStates = states;
    updateNodeVisibility();
}

bool SVTrackableBehavior::isVisible() const {
    return SVTrackingBehavior::isVisible() && _visibleTrackingStates.count(_trackingState) > 0;
}

std::shared_ptr<SVARAnchor> SVTrackableBehavior::createAnchor(SVARAnchorAcquireStatus *outStatus) {
    if (!_trackable || _trackable->getTrackingState() != SVARTrackingState::Tracking) {
        *outStatus = SVARAnchorAcquireStatus::ErrorNotTracking;
        return nullptr;
    }
    SVPose pose = isTracking() ? getPose() : _trackable->getCenterPose();
    std::shared_ptr<SVARAnchor> anchor = _trackable->acquireAnchor(pose, outStatus);
    if (!anchor) {
        pwarn("Failed to anchor trackable: %s", SVARAnchorAcquireStatusToString(*outStatus).c_str());
    }
    return anchor;
}

std::shared_ptr<SVNode> SVTrackableBehavior::createAnchoredNode(SVARAnchorAcquireStatus *outStatus) {
    std::shared_ptr<SVARAnchor> anchor = createAnchor(outStatus);
    if (!anchor) {
        return nullptr;
    }
    return std::make_shared<SVNode>(std::make_shared<SVAnchorBehavior>(anchor, _settings));
}

void SVTrackableBehavior::onARFrame(SVNode &node, const SVARFrameContext &context) {
    SVTrackingBehavior::onARFrame(node, context);

    if (_trackable && context.frame && context.frame->hasUpdatedTrackable(_trackable)) {
        updateFromTrackable();

        std::shared_ptr<SVARTrackable> trackable = _trackable;
        dispatchToDelegates([&node, trackable](SVNodeDelegate &delegate) {
            delegate.onTrackableUpdated(node, trackable);
        });
    }
}
