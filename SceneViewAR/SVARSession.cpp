//
//  SVARSession.cpp
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

#include "SVARSession.h"
#include "SVARAnchor.h"
#include "SVARAnchorTask.h"
#include "SVARFrame.h"
#include "SVLog.h"
#include <algorithm>

static const int kMinCloudAnchorTTLDays = 1;
static const int kMaxCloudAnchorTTLDays = 365;

SVARSession::SVARSession() :
    _state(SVARSessionState::Created),
    _displayRotation(0),
    _displayWidth(0),
    _displayHeight(0),
    _displayGeometryPending(false) {
}

#pragma mark - Configuration

bool SVARSession::configure(const SVARSessionConfig &config) {
    if (_state == SVARSessionState::Closed) {
        perr("Cannot configure AR session: session is closed");
        return false;
    }

    SVARSessionConfig effective = config;
    if (effective.depthMode != SVARDepthMode::Disabled && !isDepthModeSupported(effective.depthMode)) {
        pwarn("Depth mode %s not supported on this device, disabling depth",
              SVARDepthModeToString(effective.depthMode).c_str());
        effective.depthMode = SVARDepthMode::Disabled;
    }
    if (effective.geospatialEnabled && !isGeospatialModeSupported()) {
        pwarn("Geospatial mode not supported on this device, disabling geospatial");
        effective.geospatialEnabled = false;
    }

    if (!applyConfig(effective)) {
        perr("Failed to apply AR session configuration");
        return false;
    }
    _config = effective;

    for (std::shared_ptr<SVARSessionDelegate> &delegate : getDelegates()) {
        delegate->onSessionConfigured(_config);
    }
    return true;
}

#pragma mark - Lifecycle

bool SVARSession::resume() {
    if (_state == SVARSessionState::Closed) {
        perr("Cannot resume AR session: session is closed");
        return false;
    }
    if (_state == SVARSessionState::Resumed) {
        return true;
    }
    if (!resumeSession()) {
        perr("Failed to resume AR session");
        return false;
    }
    _state = SVARSessionState::Resumed;

    if (_displayGeometryPending) {
        applyDisplayGeometry(_displayRotation, _displayWidth, _displayHeight);
        _displayGeometryPending = false;
    }
    for (std::shared_ptr<SVARSessionDelegate> &delegate : getDelegates()) {
        delegate->onSessionResumed();
    }
    return true;
}

void SVARSession::pause() {
    if (_state != SVARSessionState::Resumed) {
        return;
    }
    pauseSession();
    _state = SVARSessionState::Paused;

    for (std::shared_ptr<SVARSessionDelegate> &delegate : getDelegates()) {
        delegate->onSessionPaused();
    }
}

void SVARSession::close() {
    if (_state == SVARSessionState::Closed) {
        return;
    }
    pause();
    closeSession();
    _state = SVARSessionState::Closed;
    _currentFrame.reset();
    _previousFrame.reset();
}

void SVARSession::setDisplayGeometry(int rotation, int width, int height) {
    _displayRotation = rotation;
    _displayWidth = width;
    _displayHeight = height;

    if (_state == SVARSessionState::Resumed) {
        applyDisplayGeometry(rotation, width, height);
        _displayGeometryPending = false;
    }
    else {
        _displayGeometryPending = true;
    }
}

std::shared_ptr<SVARFrame> SVARSession::update() {
    if (_state != SVARSessionState::Resumed) {
        return nullptr;
    }
    std::shared_ptr<SVARFrame> frame = updateFrame();
    if (!frame) {
        return nullptr;
    }
    _previousFrame = _currentFrame;
    _currentFrame = frame;
    return frame;
}

#pragma mark - Delegates

void SVARSession::addDelegate(std::shared_ptr<SVARSessionDelegate> delegate) {
    _delegates.push_back(delegate);
}

void SVARSession::removeDelegate(std::shared_ptr<SVARSessionDelegate> delegate) {
    _delegates.erase(std::remove_if(_delegates.begin(), _delegates.end(),
                                    [delegate](const std::weak_ptr<SVARSessionDelegate> &candidate) {
                                        std::shared_ptr<SVARSessionDelegate> locked = candidate.lock();
                                        return !locked || locked == delegate;
                                    }),
                     _delegates.end());
}

std::vector<std::shared_ptr<SVARSessionDelegate>> SVARSession::getDelegates() {
    std::vector<std::shared_ptr<SVARSessionDelegate>> delegates;
    for (std::weak_ptr<SVARSessionDelegate> &delegate_w : _delegates) {
        std::shared_ptr<SVARSessionDelegate> delegate = delegate_w.lock();
        if (delegate) {
            delegates.push_back(delegate);
        }
    }
    return delegates;
}

#pragma mark - Anchors

std::shared_ptr<SVARAnchor> SVARSession::createAnchor(const SVPose &pose, SVARAnchorAcquireStatus *outStatus) {
    if (_state != SVARSessionState::Resumed) {
        *outStatus = SVARAnchorAcquireStatus::ErrorSessionPaused;
        return nullptr;
    }
    return acquireAnchor(pose, outStatus);
}

std::shared_ptr<SVARAnchorTask> SVARSession::hostCloudAnchor(const std::shared_ptr<SVARAnchor> &anchor, int ttlDays,
                                                             SVARAnchorAcquireStatus *outStatus) {
    if (_state != SVARSessionState::Resumed) {
        *outStatus = SVARAnchorAcquireStatus::ErrorSessionPaused;
        return nullptr;
    }
    if (!_config.cloudAnchorEnabled) {
        pwarn("Cloud anchors are disabled, ignoring anchor host request");
        *outStatus = SVARAnchorAcquireStatus::ErrorCloudAnchorsNotConfigured;
        return nullptr;
    }
    if (!anchor) {
        *outStatus = SVARAnchorAcquireStatus::ErrorUnsupported;
        return nullptr;
    }
    if (ttlDays < kMinCloudAnchorTTLDays || ttlDays > kMaxCloudAnchorTTLDays) {
        pwarn("Cloud anchor TTL of %d days out of range, clamping", ttlDays);
        ttlDays = std::max(kMinCloudAnchorTTLDays, std::min(ttlDays, kMaxCloudAnchorTTLDays));
    }
    return startHostCloudAnchor(anchor, ttlDays, outStatus);
}

std::shared_ptr<SVARAnchorTask> SVARSession::resolveCloudAnchor(const std::string &cloudAnchorId,
                                                                SVARAnchorAcquireStatus *outStatus) {
    if (_state != SVARSessionState::Resumed) {
        *outStatus = SVARAnchorAcquireStatus::ErrorSessionPaused;
        return nullptr;
    }
    if (!_config.cloudAnchorEnabled) {
        pwarn("Cloud anchors are disabled, ignoring anchor resolve request");
        *outStatus = SVARAnchorAcquireStatus::ErrorCloudAnchorsNotConfigured;
        return nullptr;
    }
    return startResolveCloudAnchor(cloudAnchorId, outStatus);
}

std::shared_ptr<SVARAnchorTask> SVARSession::resolveGeospatialAnchor(const SVGeospatialAnchorRequest &request,
                                                                     SVARAnchorAcquireStatus *outStatus) {
    if (_state != SVARSessionState::Resumed) {
        *outStatus = SVARAnchorAcquireStatus::ErrorSessionPaused;
        return nullptr;
    }
    if (!_config.geospatialEnabled) {
        pwarn("Geospatial mode is disabled, ignoring %s anchor request",
              SVGeospatialAnchorTypeToString(request.type).c_str());
        *outStatus = SVARAnchorAcquireStatus::ErrorUnsupported;
        return nullptr;
    }
    if (request.type == SVGeospatialAnchorType::WGS84) {
        pwarn("WGS84 anchors are created synchronously and cannot be resolved");
        *outStatus = SVARAnchorAcquireStatus::ErrorUnsupported;
        return nullptr;
    }
    return startResolveGeospatialAnchor(request, outStatus);
}
