//
//  SVARSessionARCore.cpp
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

#include "SVARSessionARCore.h"
#include "SVARAnchorARCore.h"
#include "SVARAnchorTask.h"
#include "SVARFrameARCore.h"
#include "SVARGeospatialAnchorTaskARCore.h"
#include "SVARUtilsARCore.h"
#include "SVLog.h"

static bool kDebugFrames = false;

SVARSessionARCore::SVARSessionARCore(std::shared_ptr<arcore::Session> session)
    : _session(session),
      _updateMode(arcore::UpdateMode::Blocking),
      _frameCount(0) {
}

SVARSessionARCore::~SVARSessionARCore() {

}

void SVARSessionARCore::setCameraTextureName(int32_t textureId) {
  _session->setCameraTextureName(textureId);
}

#pragma mark - Configuration

bool SVARSessionARCore::isDepthModeSupported(SVARDepthMode mode) const {
  return _session->isDepthModeSupported(SVConvertDepthMode(mode));
}

bool SVARSessionARCore::isGeospatialModeSupported() const {
  return _session->isGeospatialModeSupported(arcore::GeospatialMode::Enabled);
}

bool SVARSessionARCore::applyConfig(const SVARSessionConfig &config) {
  arcore::Config *config_arc = _session->createConfig(
      SVConvertLightingMode(config.lightEstimationMode),
      SVConvertPlaneFindingMode(config.planeFindingMode), _updateMode,
      config.cloudAnchorEnabled ? arcore::CloudAnchorMode::Enabled : arcore::CloudAnchorMode::Disabled,
      config.focusMode == SVARFocusMode::Auto ? arcore::FocusMode::AUTO_FOCUS : arcore::FocusMode::FIXED_FOCUS,
      SVConvertDepthMode(config.depthMode),
      config.instantPlacementEnabled ? arcore::InstantPlacementMode::LocalYUp : arcore::InstantPlacementMode::Disabled,
      config.geospatialEnabled ? arcore::GeospatialMode::Enabled : arcore::GeospatialMode::Disabled);

  // ARCore requires the session to be paused before calling configure()
  bool resumed = isResumed();
  if (resumed) {
    _session->pause();
  }

  arcore::ConfigStatus status = _session->configure(config_arc);
  delete (config_arc);

  if (resumed) {
    _session->resume();
  }
  if (status != arcore::ConfigStatus::Success) {
    pwarn("Failed to configure AR session (status %d)", (int)status);
    return false;
  }

  pinfo("AR session configured [planes %s, depth %s, instant placement %d, cloud %d, geospatial %d]",
        SVARPlaneFindingModeToString(config.planeFindingMode).c_str(),
        SVARDepthModeToString(config.depthMode).c_str(),
        config.instantPlacementEnabled, config.cloudAnchorEnabled, config.geospatialEnabled);
  return true;
}

#pragma mark - Lifecycle and Setup

bool SVARSessionARCore::resumeSession() {
  if (!_session->resume()) {
    return false;
  }
  pinfo("AR session resumed");
  return true;
}

void SVARSessionARCore::pauseSession() {
  if (!_session->pause()) {
    pwarn("AR session failed to pause");
    return;
  }
  pinfo("AR session paused");
}

/*
 SVARSession::close() pauses a resumed session before calling here, so the
 ArSession is already paused. The ArSession itself is destroyed by
 ~SessionNative once the last holder (this session and any frame or
 trackable wrappers still alive) releases it.
 */
void SVARSessionARCore::closeSession() {
  pinfo("AR session closed after %d frames", _frameCount);
}

void SVARSessionARCore::applyDisplayGeometry(int rotation, int width, int height) {
  _session->setDisplayGeometry(rotation, width, height);
}

#pragma mark - AR Frames

std::shared_ptr<SVARFrame> SVARSessionARCore::updateFrame() {
  std::shared_ptr<arcore::Frame> frame = std::shared_ptr<arcore::Frame>(_session->createFrame());
  if (!_session->update(frame.get())) {
    pwarn("AR session update failed, skipping frame");
    return nullptr;
  }
  ++_frameCount;

  std::shared_ptr<SVARFrame> arFrame = std::make_shared<SVARFrameARCore>(frame, _session);
  if (kDebugFrames) {
    pinfo("AR frame %d [timestamp %lld]", _frameCount, (long long) arFrame->getTimestampNs());
  }
  return arFrame;
}

#pragma mark - Anchors

std::shared_ptr<SVARAnchor> SVARSessionARCore::acquireAnchor(const SVPose &pose,
                                                             SVARAnchorAcquireStatus *outStatus) {
  float raw[7];
  pose.toRaw(raw);
  std::unique_ptr<arcore::Pose> pose_arc(_session->createPose(raw));

  arcore::AnchorAcquireStatus status;
  arcore::Anchor *anchor = _session->acquireNewAnchor(pose_arc.get(), &status);
  *outStatus = SVConvertAnchorAcquireStatus(status);
  if (!anchor) {
    pwarn("Failed to create anchor [status %s]", SVARAnchorAcquireStatusToString(*outStatus).c_str());
    return nullptr;
  }
  return std::make_shared<SVARAnchorARCore>(std::shared_ptr<arcore::Anchor>(anchor), _session);
}

std::shared_ptr<SVARAnchorTask> SVARSessionARCore::startHostCloudAnchor(const std::shared_ptr<SVARAnchor> &anchor,
                                                                        int ttlDays,
                                                                        SVARAnchorAcquireStatus *outStatus) {
  std::shared_ptr<SVARAnchorARCore> anchor_arc = std::dynamic_pointer_cast<SVARAnchorARCore>(anchor);
  if (!anchor_arc) {
    pwarn("Cannot host anchor %s: not an ARCore anchor", anchor->getId().c_str());
    *outStatus = SVARAnchorAcquireStatus::ErrorUnsupported;
    return nullptr;
  }

  arcore::AnchorAcquireStatus status;
  arcore::Anchor *cloudAnchor = _session->hostAndAcquireNewCloudAnchorWithTtl(anchor_arc->getAnchorInternal().get(),
                                                                              ttlDays, &status);
  *outStatus = SVConvertAnchorAcquireStatus(status);
  if (!cloudAnchor) {
    pwarn("Failed to host anchor %s [status %s]", anchor->getId().c_str(),
          SVARAnchorAcquireStatusToString(*outStatus).c_str());
    return nullptr;
  }

  pinfo("Hosting anchor %s for %d days", anchor->getId().c_str(), ttlDays);
  std::shared_ptr<SVARAnchor> hostedAnchor =
      std::make_shared<SVARAnchorARCore>(std::shared_ptr<arcore::Anchor>(cloudAnchor), _session);
  return std::make_shared<SVARCloudAnchorTask>(SVARAnchorTaskType::HostCloudAnchor, hostedAnchor);
}

std::shared_ptr<SVARAnchorTask> SVARSessionARCore::startResolveCloudAnchor(const std::string &cloudAnchorId,
                                                                           SVARAnchorAcquireStatus *outStatus) {
  arcore::AnchorAcquireStatus status;
  arcore::Anchor *cloudAnchor = _session->resolveAndAcquireNewCloudAnchor(cloudAnchorId.c_str(), &status);
  *outStatus = SVConvertAnchorAcquireStatus(status);
  if (!cloudAnchor) {
    pwarn("Failed to resolve cloud anchor %s [status %s]", cloudAnchorId.c_str(),
          SVARAnchorAcquireStatusToString(*outStatus).c_str());
    return nullptr;
  }

  pinfo("Resolving cloud anchor %s", cloudAnchorId.c_str());
  std::shared_ptr<SVARAnchor> resolvedAnchor =
      std::make_shared<SVARAnchorARCore>(std::shared_ptr<arcore::Anchor>(cloudAnchor), _session);
  return std::make_shared<SVARCloudAnchorTask>(SVARAnchorTaskType::ResolveCloudAnchor, resolvedAnchor);
}

#pragma mark - Geospatial

SVEarthTrackingState SVARSessionARCore::getEarthTrackingState() const {
  if (!getConfig().geospatialEnabled) {
    return SVEarthTrackingState::Stopped;
  }
  return SVEarthTrackingStateFromTrackingState(SVConvertTrackingState(_session->getEarthTrackingState()));
}

SVGeospatialPose SVARSessionARCore::getCameraGeospatialPose() const {
  SVGeospatialPose pose;
  if (!getConfig().geospatialEnabled) {
    return pose;
  }

  arcore::GeospatialPoseData data;
  if (!_session->getCameraGeospatialPose(&data)) {
    return pose;
  }
  pose.latitude = data.latitude;
  pose.longitude = data.longitude;
  pose.altitude = data.altitude;
  pose.eusQuaternion = SVQuaternion(data.quaternion[0], data.quaternion[1], data.quaternion[2], data.quaternion[3]);
  pose.horizontalAccuracy = data.horizontalAccuracy;
  pose.verticalAccuracy = data.verticalAccuracy;
  pose.orientationYawAccuracy = data.orientationYawAccuracy;
  return pose;
}

std::shared_ptr<SVARAnchorTask> SVARSessionARCore::startResolveGeospatialAnchor(const SVGeospatialAnchorRequest &request,
                                                                                SVARAnchorAcquireStatus *outStatus) {
  float quaternion[4] = { request.eusQuaternion.X, request.eusQuaternion.Y,
                          request.eusQuaternion.Z, request.eusQuaternion.W };

  arcore::AnchorAcquireStatus status;
  arcore::ResolveAnchorFuture *future = nullptr;
  SVARAnchorTaskType type;
  if (request.type == SVGeospatialAnchorType::Terrain) {
    type = SVARAnchorTaskType::ResolveTerrainAnchor;
    future = _session->resolveTerrainAnchor(request.latitude, request.longitude, request.altitude,
                                            quaternion, &status);
  } else {
    type = SVARAnchorTaskType::ResolveRooftopAnchor;
    future = _session->resolveRooftopAnchor(request.latitude, request.longitude, request.altitude,
                                            quaternion, &status);
  }

  *outStatus = SVConvertAnchorAcquireStatus(status);
  if (!future) {
    pwarn("Failed to start %s anchor resolve [status %s]",
          SVGeospatialAnchorTypeToString(request.type).c_str(),
          SVARAnchorAcquireStatusToString(*outStatus).c_str());
    return nullptr;
  }

  pinfo("Resolving %s anchor at (%f, %f)", SVGeospatialAnchorTypeToString(request.type).c_str(),
        request.latitude, request.longitude);
  return std::make_shared<SVARGeospatialAnchorTaskARCore>(type, std::unique_ptr<arcore::ResolveAnchorFuture>(future),
                                                          _session);
}
