//
//  SVPlacementBehavior.cpp
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

#include "SVPlacementBehavior.h"
#include "SVNode.h"
#include "SVNodeDelegate.h"
#include "SVVector2f.h"
#include "SVARAnchor.h"
#include "SVARHitTestResult.h"
#include "SVARSession.h"
#include "SVARFrameContext.h"
#include "SVLog.h"
#include <math.h>
#include <stdexcept>

static bool kDebugPlacement = false;

SVPlacementBehavior::SVPlacementBehavior(SVPlacementMode placementMode, SVVector3f placementPosition,
                                         SVTrackingSettings settings) :
    SVAnchorBehavior(settings),
    _placementMode(placementMode),
    _placementPosition(placementPosition),
    _autoAnchor(false),
    _sessionConfigPending(true),
    _hasLastHitTest(false),
    _lastHitTestTimestampNs(0) {
}

void SVPlacementBehavior::setPlacementMode(SVPlacementMode placementMode) {
    if (placementMode == _placementMode) {
        return;
    }
    _placementMode = placementMode;
    _sessionConfigPending = true;
}

void SVPlacementBehavior::setPlacementPosition(SVVector3f placementPosition) {
    _placementPosition = placementPosition;

    SVNode *node = getNode();
    if (node && !isTracking()) {
        node->setPosition(placementPosition);
    }
}

void SVPlacementBehavior::setAutoAnchor(bool autoAnchor) {
    _autoAnchor = autoAnchor;
    if (!autoAnchor && isAnchored()) {
        detachAnchor();
    }
}

void SVPlacementBehavior::setMaxHitTestsPerSecond(float rate) {
    if (rate <= 0) {
        throw std::invalid_argument("Max hit tests per second must be greater than zero");
    }
    _settings.maxHitTestsPerSecond = rate;
}

void SVPlacementBehavior::onAttach() {
    if (!isTracking()) {
        getNode()->setPosition(_placementPosition);
    }
}

#pragma mark - Hit Testing

std::shared_ptr<SVARHitTestResult> SVPlacementBehavior::hitTest(const SVARFrameContext &context) {
    if (!context.frame || !context.session) {
        return nullptr;
    }
    SVVector2f point = SVVector2f::fromNormalized(_placementPosition.x, _placementPosition.y,
                                                  context.session->getDisplayWidth(),
                                                  context.session->getDisplayHeight());
    return context.frame->findHitResult(point.x, point.y,
                                        _placementMode.isPlaneEnabled(),
                                        _placementMode.isDepthEnabled(),
                                        _placementMode.isInstantPlacementEnabled(),
                                        fabsf(_placementPosition.z));
}

void SVPlacementBehavior::setHitResult(std::shared_ptr<SVARHitTestResult> hitResult) {
    if (hitResult) {
        _lastHitResult = hitResult;
    }

    // A non tracking result keeps the last pose, to avoid snapping to a
    // stale or approximate location
    if (hitResult && hitResult->isTracking()) {
        _lastTrackingHitResult = hitResult;
        setPose(hitResult->getHitPose());
    }

    SVNode *node = getNode();
    if (node) {
        bool tracking = isTracking();
        dispatchToDelegates([node, hitResult, tracking](SVNodeDelegate &delegate) {
            delegate.onHitResult(*node, hitResult, tracking);
        });
    }
}

bool SVPlacementBehavior::isHitTestDue(int64_t timestampNs) const {
    if (!_hasLastHitTest) {
        return true;
    }
    double intervalNs = 1e9 / _settings.maxHitTestsPerSecond;
    return (timestampNs - _lastHitTestTimestampNs) >= intervalNs;
}

#pragma mark - Anchoring

std::shared_ptr<SVARAnchor> SVPlacementBehavior::createAnchor(const std::shared_ptr<SVARSession> &session,
                                                              SVARAnchorAcquireStatus *outStatus) {
    std::shared_ptr<SVARHitTestResult> hitResult;
    if (_lastHitResult && _lastHitResult->isTracking()) {
        hitResult = _lastHitResult;
    }
    else if (_lastTrackingHitResult && _lastTrackingHitResult->isTracking()) {
        hitResult = _lastTrackingHitResult;
    }
    else if (_settings.allowNonTrackingAnchorFallback) {
        hitResult = _lastHitResult ? _lastHitResult : _lastTrackingHitResult;
    }

    if (!hitResult) {
        *outStatus = SVARAnchorAcquireStatus::ErrorNotTracking;
        return nullptr;
    }
    return hitResult->createAnchor(outStatus);
}

void SVPlacementBehavior::applyPlacementModeToSession(const std::shared_ptr<SVARSession> &session) {
    SVARSessionConfig config = session->getConfig();
    _placementMode.applyTo(config);
    if (config != session->getConfig()) {
        pinfo("Reconfiguring session for placement mode %s", _placementMode.toString().c_str());
        if (!session->configure(config)) {
            pwarn("Session rejected configuration for placement mode %s", _placementMode.toString().c_str());
        }
    }
}

#pragma mark - Frame Update

void SVPlacementBehavior::onARFrame(SVNode &node, const SVARFrameContext &context) {
    SVAnchorBehavior::onARFrame(node, context);
    if (!context.frame || !context.session) {
        return;
    }

    if (_sessionConfigPending) {
        _sessionConfigPending = false;
        applyPlacementModeToSession(context.session);
    }
    if (isAnchored() || _placementMode.getType() == SVPlacementModeType::Disabled) {
        return;
    }

    if (_autoAnchor && !isAnchorTaskInProgress()) {
        SVARAnchorAcquireStatus status = anchor(context.session);
        if (status == SVARAnchorAcquireStatus::Success) {
            return;
        }
        if (kDebugPlacement) {
            pinfo("Auto anchor not possible yet (%s), will retry", SVARAnchorAcquireStatusToString(status).c_str());
        }
    }

    int64_t timestamp = context.frame->getTimestampNs();
    if (!isHitTestDue(timestamp)) {
        return;
    }
    _hasLastHitTest = true;
    _lastHitTestTimestampNs = timestamp;

    setHitResult(hitTest(context));
}
