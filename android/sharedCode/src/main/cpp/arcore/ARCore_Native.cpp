//
//  ARCore_Native.cpp
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

#include "ARCore_Native.h"
#include "SVLog.h"

namespace arcore {

#pragma mark - Conversions

    static AnchorAcquireStatus convertStatus(ArStatus status) {
        switch (status) {
            case AR_SUCCESS:
                return AnchorAcquireStatus::Success;
            case AR_ERROR_NOT_TRACKING:
                return AnchorAcquireStatus::ErrorNotTracking;
            case AR_ERROR_SESSION_PAUSED:
                return AnchorAcquireStatus::ErrorSessionPaused;
            case AR_ERROR_RESOURCE_EXHAUSTED:
                return AnchorAcquireStatus::ErrorResourceExhausted;
            case AR_ERROR_DEADLINE_EXCEEDED:
                return AnchorAcquireStatus::ErrorDeadlineExceeded;
            case AR_ERROR_CLOUD_ANCHORS_NOT_CONFIGURED:
                return AnchorAcquireStatus::ErrorCloudAnchorsNotConfigured;
            case AR_ERROR_ANCHOR_NOT_SUPPORTED_FOR_HOSTING:
                return AnchorAcquireStatus::ErrorAnchorNotSupportedForHosting;
            case AR_ERROR_ILLEGAL_STATE:
            case AR_ERROR_UNSUPPORTED_CONFIGURATION:
                return AnchorAcquireStatus::ErrorUnsupported;
            default:
                return AnchorAcquireStatus::ErrorUnknown;
        }
    }

    static TrackingState convertTrackingState(ArTrackingState state) {
        switch (state) {
            case AR_TRACKING_STATE_TRACKING:
                return TrackingState::Tracking;
            case AR_TRACKING_STATE_PAUSED:
                return TrackingState::Paused;
            default:
                return TrackingState::Stopped;
        }
    }

    static TrackableType convertTrackableType(ArTrackableType type) {
        switch (type) {
            case AR_TRACKABLE_PLANE:
                return TrackableType::Plane;
            case AR_TRACKABLE_POINT:
                return TrackableType::Point;
            case AR_TRACKABLE_DEPTH_POINT:
                return TrackableType::DepthPoint;
            case AR_TRACKABLE_INSTANT_PLACEMENT_POINT:
                return TrackableType::InstantPlacementPoint;
            case AR_TRACKABLE_AUGMENTED_IMAGE:
                return TrackableType::Image;
            default:
                return TrackableType::Unknown;
        }
    }

    static ArTrackableType convertTrackableType(TrackableType type) {
        switch (type) {
            case TrackableType::Plane:
                return AR_TRACKABLE_PLANE;
            case TrackableType::Point:
                return AR_TRACKABLE_POINT;
            case TrackableType::DepthPoint:
                return AR_TRACKABLE_DEPTH_POINT;
            case TrackableType::InstantPlacementPoint:
                return AR_TRACKABLE_INSTANT_PLACEMENT_POINT;
            case TrackableType::Image:
                return AR_TRACKABLE_AUGMENTED_IMAGE;
            default:
                return AR_TRACKABLE_BASE_TRACKABLE;
        }
    }

    static CloudAnchorState convertCloudAnchorState(ArCloudAnchorState state) {
        switch (state) {
            case AR_CLOUD_ANCHOR_STATE_NONE:
                return CloudAnchorState::None;
            case AR_CLOUD_ANCHOR_STATE_TASK_IN_PROGRESS:
                return CloudAnchorState::TaskInProgress;
            case AR_CLOUD_ANCHOR_STATE_SUCCESS:
                return CloudAnchorState::Success;
            case AR_CLOUD_ANCHOR_STATE_ERROR_NOT_AUTHORIZED:
                return CloudAnchorState::ErrorNotAuthorized;
            case AR_CLOUD_ANCHOR_STATE_ERROR_RESOURCE_EXHAUSTED:
                return CloudAnchorState::ErrorResourceExhausted;
            case AR_CLOUD_ANCHOR_STATE_ERROR_HOSTING_DATASET_PROCESSING_FAILED:
                return CloudAnchorState::ErrorHostingDatasetProcessingFailed;
            case AR_CLOUD_ANCHOR_STATE_ERROR_CLOUD_ID_NOT_FOUND:
                return CloudAnchorState::ErrorCloudIdNotFound;
            case AR_CLOUD_ANCHOR_STATE_ERROR_RESOLVING_SDK_VERSION_TOO_OLD:
                return CloudAnchorState::ErrorResolvingSdkVersionTooOld;
            case AR_CLOUD_ANCHOR_STATE_ERROR_RESOLVING_SDK_VERSION_TOO_NEW:
                return CloudAnchorState::ErrorResolvingSdkVersionTooNew;
            case AR_CLOUD_ANCHOR_STATE_ERROR_HOSTING_SERVICE_UNAVAILABLE:
                return CloudAnchorState::ErrorHostingServiceUnavailable;
            default:
                return CloudAnchorState::ErrorInternal;
        }
    }

    static FutureState convertFutureState(ArFutureState state) {
        switch (state) {
            case AR_FUTURE_STATE_PENDING:
                return FutureState::Pending;
            case AR_FUTURE_STATE_CANCELLED:
                return FutureState::Cancelled;
            default:
                return FutureState::Done;
        }
    }

    static ArAnchor *acquireAnchorFromTrackable(ArSession *session, ArTrackable *trackable, Pose *pose,
                                                AnchorAcquireStatus *outStatus) {
        ArAnchor *anchor = nullptr;
        ArStatus status = ArTrackable_acquireNewAnchor(session, trackable, ((PoseNative *) pose)->_pose, &anchor);
        *outStatus = convertStatus(status);
        if (status != AR_SUCCESS) {
            return nullptr;
        }
        return anchor;
    }

    static uint64_t hashPointer(const void *pointer) {
        // ARCore hands back the same handle for every acquire of one object
        return (uint64_t) (uintptr_t) pointer;
    }

    Trackable *wrapTrackable(ArSession *session, ArTrackable *trackable) {
        if (trackable == nullptr) {
            return nullptr;
        }
        ArTrackableType type = AR_TRACKABLE_NOT_VALID;
        ArTrackable_getType(session, trackable, &type);

        switch (type) {
            case AR_TRACKABLE_PLANE:
                return new PlaneNative(session, ArAsPlane(trackable));
            case AR_TRACKABLE_POINT:
                return new PointNative(session, ArAsPoint(trackable));
            case AR_TRACKABLE_INSTANT_PLACEMENT_POINT:
                return new InstantPlacementPointNative(session, reinterpret_cast<ArInstantPlacementPoint *>(trackable));
            default:
                return new TrackableNative(session, trackable);
        }
    }

#pragma mark - Config

    ConfigNative::~ConfigNative() {
        ArConfig_destroy(_config);
    }

#pragma mark - Pose

    PoseNative::~PoseNative() {
        ArPose_destroy(_pose);
    }

    void PoseNative::toMatrix(float *outMatrix) {
        ArPose_getMatrix(_session, _pose, outMatrix);
    }

    void PoseNative::getRaw(float *outRaw) {
        ArPose_getPoseRaw(_session, _pose, outRaw);
    }

#pragma mark - Anchor

    AnchorNative::~AnchorNative() {
        ArAnchor_release(_anchor);
    }

    uint64_t AnchorNative::getHashCode() {
        return hashPointer(_anchor);
    }

    uint64_t AnchorNative::getId() {
        return hashPointer(_anchor);
    }

    void AnchorNative::getPose(Pose *outPose) {
        ArAnchor_getPose(_session, _anchor, ((PoseNative *) outPose)->_pose);
    }

    TrackingState AnchorNative::getTrackingState() {
        ArTrackingState state = AR_TRACKING_STATE_STOPPED;
        ArAnchor_getTrackingState(_session, _anchor, &state);
        return convertTrackingState(state);
    }

    void AnchorNative::acquireCloudAnchorId(char **outCloudAnchorId) {
        ArAnchor_acquireCloudAnchorId(_session, _anchor, outCloudAnchorId);
    }

    CloudAnchorState AnchorNative::getCloudAnchorState() {
        ArCloudAnchorState state = AR_CLOUD_ANCHOR_STATE_NONE;
        ArAnchor_getCloudAnchorState(_session, _anchor, &state);
        return convertCloudAnchorState(state);
    }

    void AnchorNative::detach() {
        ArAnchor_detach(_session, _anchor);
    }

#pragma mark - Trackables

    TrackableListNative::~TrackableListNative() {
        ArTrackableList_destroy(_trackableList);
    }

    Trackable *TrackableListNative::acquireItem(int index) {
        ArTrackable *trackable = nullptr;
        ArTrackableList_acquireItem(_session, _trackableList, index, &trackable);
        return wrapTrackable(_session, trackable);
    }

    int TrackableListNative::size() {
        int32_t size = 0;
        ArTrackableList_getSize(_session, _trackableList, &size);
        return size;
    }

    TrackableNative::~TrackableNative() {
        ArTrackable_release(_trackable);
    }

    uint64_t TrackableNative::getHashCode() {
        return hashPointer(_trackable);
    }

    Anchor *TrackableNative::acquireAnchor(Pose *pose, AnchorAcquireStatus *outStatus) {
        ArAnchor *anchor = acquireAnchorFromTrackable(_session, _trackable, pose, outStatus);
        return anchor ? new AnchorNative(_session, anchor) : nullptr;
    }

    TrackingState TrackableNative::getTrackingState() {
        ArTrackingState state = AR_TRACKING_STATE_STOPPED;
        ArTrackable_getTrackingState(_session, _trackable, &state);
        return convertTrackingState(state);
    }

    TrackableType TrackableNative::getType() {
        ArTrackableType type = AR_TRACKABLE_NOT_VALID;
        ArTrackable_getType(_session, _trackable, &type);
        return convertTrackableType(type);
    }

    PlaneNative::~PlaneNative() {
        ArTrackable_release(ArAsTrackable(_plane));
    }

    uint64_t PlaneNative::getHashCode() {
        return hashPointer(ArAsTrackable(_plane));
    }

    Anchor *PlaneNative::acquireAnchor(Pose *pose, AnchorAcquireStatus *outStatus) {
        ArAnchor *anchor = acquireAnchorFromTrackable(_session, ArAsTrackable(_plane), pose, outStatus);
        return anchor ? new AnchorNative(_session, anchor) : nullptr;
    }

    TrackingState PlaneNative::getTrackingState() {
        ArTrackingState state = AR_TRACKING_STATE_STOPPED;
        ArTrackable_getTrackingState(_session, ArAsTrackable(_plane), &state);
        return convertTrackingState(state);
    }

    TrackableType PlaneNative::getType() {
        return TrackableType::Plane;
    }

    void PlaneNative::getCenterPose(Pose *outPose) {
        ArPlane_getCenterPose(_session, _plane, ((PoseNative *) outPose)->_pose);
    }

    float PlaneNative::getExtentX() {
        float extent = 0;
        ArPlane_getExtentX(_session, _plane, &extent);
        return extent;
    }

    float PlaneNative::getExtentZ() {
        float extent = 0;
        ArPlane_getExtentZ(_session, _plane, &extent);
        return extent;
    }

    Plane *PlaneNative::acquireSubsumedBy() {
        ArPlane *subsumingPlane = nullptr;
        ArPlane_acquireSubsumedBy(_session, _plane, &subsumingPlane);
        return subsumingPlane ? new PlaneNative(_session, subsumingPlane) : nullptr;
    }

    PlaneType PlaneNative::getPlaneType() {
        ArPlaneType type = AR_PLANE_HORIZONTAL_UPWARD_FACING;
        ArPlane_getType(_session, _plane, &type);
        switch (type) {
            case AR_PLANE_HORIZONTAL_DOWNWARD_FACING:
                return PlaneType::HorizontalDownward;
            case AR_PLANE_VERTICAL:
                return PlaneType::Vertical;
            default:
                return PlaneType::HorizontalUpward;
        }
    }

    bool PlaneNative::isPoseInExtents(const Pose *pose) {
        int32_t inExtents = 0;
        ArPlane_isPoseInExtents(_session, _plane, ((const PoseNative *) pose)->_pose, &inExtents);
        return inExtents != 0;
    }

    bool PlaneNative::isPoseInPolygon(const Pose *pose) {
        int32_t inPolygon = 0;
        ArPlane_isPoseInPolygon(_session, _plane, ((const PoseNative *) pose)->_pose, &inPolygon);
        return inPolygon != 0;
    }

    PointNative::~PointNative() {
        ArTrackable_release(ArAsTrackable(_point));
    }

    uint64_t PointNative::getHashCode() {
        return hashPointer(ArAsTrackable(_point));
    }

    Anchor *PointNative::acquireAnchor(Pose *pose, AnchorAcquireStatus *outStatus) {
        ArAnchor *anchor = acquireAnchorFromTrackable(_session, ArAsTrackable(_point), pose, outStatus);
        return anchor ? new AnchorNative(_session, anchor) : nullptr;
    }

    TrackingState PointNative::getTrackingState() {
        ArTrackingState state = AR_TRACKING_STATE_STOPPED;
        ArTrackable_getTrackingState(_session, ArAsTrackable(_point), &state);
        return convertTrackingState(state);
    }

    TrackableType PointNative::getType() {
        return TrackableType::Point;
    }

    void PointNative::getPose(Pose *outPose) {
        ArPoint_getPose(_session, _point, ((PoseNative *) outPose)->_pose);
    }

    PointOrientationMode PointNative::getOrientationMode() {
        ArPointOrientationMode mode = AR_POINT_ORIENTATION_INITIALIZED_TO_IDENTITY;
        ArPoint_getOrientationMode(_session, _point, &mode);
        if (mode == AR_POINT_ORIENTATION_ESTIMATED_SURFACE_NORMAL) {
            return PointOrientationMode::EstimatedSurfaceNormal;
        }
        return PointOrientationMode::InitializedToIdentity;
    }

    InstantPlacementPointNative::~InstantPlacementPointNative() {
        ArTrackable_release(reinterpret_cast<ArTrackable *>(_point));
    }

    uint64_t InstantPlacementPointNative::getHashCode() {
        return hashPointer(_point);
    }

    Anchor *InstantPlacementPointNative::acquireAnchor(Pose *pose, AnchorAcquireStatus *outStatus) {
        ArAnchor *anchor = acquireAnchorFromTrackable(_session, reinterpret_cast<ArTrackable *>(_point), pose, outStatus);
        return anchor ? new AnchorNative(_session, anchor) : nullptr;
    }

    TrackingState InstantPlacementPointNative::getTrackingState() {
        ArTrackingState state = AR_TRACKING_STATE_STOPPED;
        ArTrackable_getTrackingState(_session, reinterpret_cast<ArTrackable *>(_point), &state);
        return convertTrackingState(state);
    }

    TrackableType InstantPlacementPointNative::getType() {
        return TrackableType::InstantPlacementPoint;
    }

    void InstantPlacementPointNative::getPose(Pose *outPose) {
        ArInstantPlacementPoint_getPose(_session, _point, ((PoseNative *) outPose)->_pose);
    }

    InstantPlacementTrackingMethod InstantPlacementPointNative::getTrackingMethod() {
        ArInstantPlacementPointTrackingMethod method = AR_INSTANT_PLACEMENT_POINT_TRACKING_METHOD_NOT_TRACKING;
        ArInstantPlacementPoint_getTrackingMethod(_session, _point, &method);
        switch (method) {
            case AR_INSTANT_PLACEMENT_POINT_TRACKING_METHOD_FULL_TRACKING:
                return InstantPlacementTrackingMethod::FullTracking;
            case AR_INSTANT_PLACEMENT_POINT_TRACKING_METHOD_SCREENSPACE_WITH_APPROXIMATE_DISTANCE:
                return InstantPlacementTrackingMethod::ScreenspaceWithApproximateDistance;
            default:
                return InstantPlacementTrackingMethod::NotTracking;
        }
    }

#pragma mark - Camera and Frame

    CameraNative::~CameraNative() {
        ArCamera_release(_camera);
    }

    TrackingState CameraNative::getTrackingState() {
        ArTrackingState state = AR_TRACKING_STATE_STOPPED;
        ArCamera_getTrackingState(_session, _camera, &state);
        return convertTrackingState(state);
    }

    void CameraNative::getDisplayOrientedPose(Pose *outPose) {
        ArCamera_getDisplayOrientedPose(_session, _camera, ((PoseNative *) outPose)->_pose);
    }

    FrameNative::~FrameNative() {
        ArFrame_destroy(_frame);
    }

    int64_t FrameNative::getTimestampNs() {
        int64_t timestamp = 0;
        ArFrame_getTimestamp(_session, _frame, &timestamp);
        return timestamp;
    }

    Camera *FrameNative::acquireCamera() {
        ArCamera *camera = nullptr;
        ArFrame_acquireCamera(_session, _frame, &camera);
        return new CameraNative(_session, camera);
    }

    void FrameNative::hitTest(float x, float y, HitResultList *outList) {
        ArFrame_hitTest(_session, _frame, x, y, ((HitResultListNative *) outList)->_hitResultList);
    }

    void FrameNative::hitTestInstantPlacement(float x, float y, float approximateDistance, HitResultList *outList) {
        ArFrame_hitTestInstantPlacement(_session, _frame, x, y, approximateDistance,
                                        ((HitResultListNative *) outList)->_hitResultList);
    }

    void FrameNative::getUpdatedTrackables(TrackableList *outList, TrackableType type) {
        ArFrame_getUpdatedTrackables(_session, _frame, convertTrackableType(type),
                                     ((TrackableListNative *) outList)->_trackableList);
    }

    void FrameNative::getUpdatedTrackables(TrackableList *outList) {
        ArFrame_getUpdatedTrackables(_session, _frame, AR_TRACKABLE_BASE_TRACKABLE,
                                     ((TrackableListNative *) outList)->_trackableList);
    }

#pragma mark - Hit Results

    HitResultListNative::~HitResultListNative() {
        ArHitResultList_destroy(_hitResultList);
    }

    void HitResultListNative::getItem(int index, HitResult *outResult) {
        ArHitResultList_getItem(_session, _hitResultList, index, ((HitResultNative *) outResult)->_hitResult);
    }

    int HitResultListNative::size() {
        int32_t size = 0;
        ArHitResultList_getSize(_session, _hitResultList, &size);
        return size;
    }

    HitResultNative::~HitResultNative() {
        ArHitResult_destroy(_hitResult);
    }

    float HitResultNative::getDistance() {
        float distance = 0;
        ArHitResult_getDistance(_session, _hitResult, &distance);
        return distance;
    }

    void HitResultNative::getPose(Pose *outPose) {
        ArHitResult_getHitPose(_session, _hitResult, ((PoseNative *) outPose)->_pose);
    }

    Trackable *HitResultNative::acquireTrackable() {
        ArTrackable *trackable = nullptr;
        ArHitResult_acquireTrackable(_session, _hitResult, &trackable);
        return wrapTrackable(_session, trackable);
    }

    Anchor *HitResultNative::acquireAnchor(AnchorAcquireStatus *outStatus) {
        ArAnchor *anchor = nullptr;
        ArStatus status = ArHitResult_acquireNewAnchor(_session, _hitResult, &anchor);
        *outStatus = convertStatus(status);
        if (status != AR_SUCCESS) {
            return nullptr;
        }
        return new AnchorNative(_session, anchor);
    }

#pragma mark - Geospatial Futures

    TerrainAnchorFutureNative::~TerrainAnchorFutureNative() {
        ArFuture_release(reinterpret_cast<ArFuture *>(_future));
    }

    FutureState TerrainAnchorFutureNative::getState() {
        ArFutureState state = AR_FUTURE_STATE_PENDING;
        ArFuture_getState(_session, reinterpret_cast<ArFuture *>(_future), &state);
        return convertFutureState(state);
    }

    ResolveAnchorState TerrainAnchorFutureNative::getResultState() {
        ArTerrainAnchorState state = AR_TERRAIN_ANCHOR_STATE_NONE;
        ArResolveAnchorOnTerrainFuture_getResultTerrainAnchorState(_session, _future, &state);
        switch (state) {
            case AR_TERRAIN_ANCHOR_STATE_SUCCESS:
                return ResolveAnchorState::Success;
            case AR_TERRAIN_ANCHOR_STATE_ERROR_NOT_AUTHORIZED:
                return ResolveAnchorState::ErrorNotAuthorized;
            case AR_TERRAIN_ANCHOR_STATE_ERROR_UNSUPPORTED_LOCATION:
                return ResolveAnchorState::ErrorUnsupportedLocation;
            case AR_TERRAIN_ANCHOR_STATE_NONE:
                return ResolveAnchorState::None;
            default:
                return ResolveAnchorState::ErrorInternal;
        }
    }

    Anchor *TerrainAnchorFutureNative::acquireResultAnchor() {
        ArAnchor *anchor = nullptr;
        ArResolveAnchorOnTerrainFuture_acquireResultAnchor(_session, _future, &anchor);
        return anchor ? new AnchorNative(_session, anchor) : nullptr;
    }

    bool TerrainAnchorFutureNative::cancel() {
        int32_t cancelled = 0;
        ArFuture_cancel(_session, reinterpret_cast<ArFuture *>(_future), &cancelled);
        return cancelled != 0;
    }

    RooftopAnchorFutureNative::~RooftopAnchorFutureNative() {
        ArFuture_release(reinterpret_cast<ArFuture *>(_future));
    }

    FutureState RooftopAnchorFutureNative::getState() {
        ArFutureState state = AR_FUTURE_STATE_PENDING;
        ArFuture_getState(_session, reinterpret_cast<ArFuture *>(_future), &state);
        return convertFutureState(state);
    }

    ResolveAnchorState RooftopAnchorFutureNative::getResultState() {
        ArRooftopAnchorState state = AR_ROOFTOP_ANCHOR_STATE_NONE;
        ArResolveAnchorOnRooftopFuture_getResultRooftopAnchorState(_session, _future, &state);
        switch (state) {
            case AR_ROOFTOP_ANCHOR_STATE_SUCCESS:
                return ResolveAnchorState::Success;
            case AR_ROOFTOP_ANCHOR_STATE_ERROR_NOT_AUTHORIZED:
                return ResolveAnchorState::ErrorNotAuthorized;
            case AR_ROOFTOP_ANCHOR_STATE_ERROR_UNSUPPORTED_LOCATION:
                return ResolveAnchorState::ErrorUnsupportedLocation;
            case AR_ROOFTOP_ANCHOR_STATE_NONE:
                return ResolveAnchorState::None;
            default:
                return ResolveAnchorState::ErrorInternal;
        }
    }

    Anchor *RooftopAnchorFutureNative::acquireResultAnchor() {
        ArAnchor *anchor = nullptr;
        ArResolveAnchorOnRooftopFuture_acquireResultAnchor(_session, _future, &anchor);
        return anchor ? new AnchorNative(_session, anchor) : nullptr;
    }

    bool RooftopAnchorFutureNative::cancel() {
        int32_t cancelled = 0;
        ArFuture_cancel(_session, reinterpret_cast<ArFuture *>(_future), &cancelled);
        return cancelled != 0;
    }

#pragma mark - Session

    SessionNative::~SessionNative() {
        ArSession_destroy(_session);
    }

    ConfigStatus SessionNative::configure(Config *config) {
        ArStatus status = ArSession_configure(_session, ((ConfigNative *) config)->_config);
        if (status == AR_SUCCESS) {
            return ConfigStatus::Success;
        }
        else if (status == AR_ERROR_UNSUPPORTED_CONFIGURATION) {
            return ConfigStatus::UnsupportedConfiguration;
        }
        perr("ARCore configure failed with status %d", (int) status);
        return ConfigStatus::Error;
    }

    void SessionNative::setDisplayGeometry(int rotation, int width, int height) {
        ArSession_setDisplayGeometry(_session, rotation, width, height);
    }

    void SessionNative::setCameraTextureName(int32_t textureId) {
        ArSession_setCameraTextureName(_session, textureId);
    }

    bool SessionNative::pause() {
        return ArSession_pause(_session) == AR_SUCCESS;
    }

    bool SessionNative::resume() {
        ArStatus status = ArSession_resume(_session);
        if (status != AR_SUCCESS) {
            perr("ARCore resume failed with status %d", (int) status);
            return false;
        }
        return true;
    }

    bool SessionNative::update(Frame *frame) {
        return ArSession_update(_session, ((FrameNative *) frame)->_frame) == AR_SUCCESS;
    }

    Config *SessionNative::createConfig(LightingMode lightingMode, PlaneFindingMode planeFindingMode,
                                        UpdateMode updateMode, CloudAnchorMode cloudAnchorMode,
                                        FocusMode focusMode, DepthMode depthMode,
                                        InstantPlacementMode instantPlacementMode,
                                        GeospatialMode geospatialMode) {
        ArConfig *config = nullptr;
        ArConfig_create(_session, &config);

        switch (lightingMode) {
            case LightingMode::Disabled:
                ArConfig_setLightEstimationMode(_session, config, AR_LIGHT_ESTIMATION_MODE_DISABLED);
                break;
            case LightingMode::AmbientIntensity:
                ArConfig_setLightEstimationMode(_session, config, AR_LIGHT_ESTIMATION_MODE_AMBIENT_INTENSITY);
                break;
            case LightingMode::EnvironmentalHDR:
                ArConfig_setLightEstimationMode(_session, config, AR_LIGHT_ESTIMATION_MODE_ENVIRONMENTAL_HDR);
                break;
        }

        switch (planeFindingMode) {
            case PlaneFindingMode::Disabled:
                ArConfig_setPlaneFindingMode(_session, config, AR_PLANE_FINDING_MODE_DISABLED);
                break;
            case PlaneFindingMode::Horizontal:
                ArConfig_setPlaneFindingMode(_session, config, AR_PLANE_FINDING_MODE_HORIZONTAL);
                break;
            case PlaneFindingMode::Vertical:
                ArConfig_setPlaneFindingMode(_session, config, AR_PLANE_FINDING_MODE_VERTICAL);
                break;
            case PlaneFindingMode::HorizontalAndVertical:
                ArConfig_setPlaneFindingMode(_session, config, AR_PLANE_FINDING_MODE_HORIZONTAL_AND_VERTICAL);
                break;
        }

        ArConfig_setUpdateMode(_session, config, updateMode == UpdateMode::Blocking ?
                               AR_UPDATE_MODE_BLOCKING : AR_UPDATE_MODE_LATEST_CAMERA_IMAGE);
        ArConfig_setCloudAnchorMode(_session, config, cloudAnchorMode == CloudAnchorMode::Enabled ?
                                    AR_CLOUD_ANCHOR_MODE_ENABLED : AR_CLOUD_ANCHOR_MODE_DISABLED);
        ArConfig_setFocusMode(_session, config, focusMode == FocusMode::AUTO_FOCUS ?
                              AR_FOCUS_MODE_AUTO : AR_FOCUS_MODE_FIXED);

        switch (depthMode) {
            case DepthMode::Disabled:
                ArConfig_setDepthMode(_session, config, AR_DEPTH_MODE_DISABLED);
                break;
            case DepthMode::Automatic:
                ArConfig_setDepthMode(_session, config, AR_DEPTH_MODE_AUTOMATIC);
                break;
            case DepthMode::RawDepthOnly:
                ArConfig_setDepthMode(_session, config, AR_DEPTH_MODE_RAW_DEPTH_ONLY);
                break;
        }

        ArConfig_setInstantPlacementMode(_session, config, instantPlacementMode == InstantPlacementMode::LocalYUp ?
                                         AR_INSTANT_PLACEMENT_MODE_LOCAL_Y_UP : AR_INSTANT_PLACEMENT_MODE_DISABLED);
        ArConfig_setGeospatialMode(_session, config, geospatialMode == GeospatialMode::Enabled ?
                                   AR_GEOSPATIAL_MODE_ENABLED : AR_GEOSPATIAL_MODE_DISABLED);
        return new ConfigNative(config);
    }

    bool SessionNative::isDepthModeSupported(DepthMode depthMode) {
        ArDepthMode mode = AR_DEPTH_MODE_DISABLED;
        switch (depthMode) {
            case DepthMode::Disabled:
                return true;
            case DepthMode::Automatic:
                mode = AR_DEPTH_MODE_AUTOMATIC;
                break;
            case DepthMode::RawDepthOnly:
                mode = AR_DEPTH_MODE_RAW_DEPTH_ONLY;
                break;
        }
        int32_t supported = 0;
        ArSession_isDepthModeSupported(_session, mode, &supported);
        return supported != 0;
    }

    bool SessionNative::isGeospatialModeSupported(GeospatialMode mode) {
        if (mode == GeospatialMode::Disabled) {
            return true;
        }
        int32_t supported = 0;
        ArSession_isGeospatialModeSupported(_session, AR_GEOSPATIAL_MODE_ENABLED, &supported);
        return supported != 0;
    }

    ArEarth *SessionNative::acquireEarth() {
        ArEarth *earth = nullptr;
        ArSession_acquireEarth(_session, &earth);
        return earth;
    }

    TrackingState SessionNative::getEarthTrackingState() {
        ArEarth *earth = acquireEarth();
        if (!earth) {
            return TrackingState::Stopped;
        }
        ArTrackingState state = AR_TRACKING_STATE_STOPPED;
        ArTrackable_getTrackingState(_session, reinterpret_cast<ArTrackable *>(earth), &state);
        ArTrackable_release(reinterpret_cast<ArTrackable *>(earth));
        return convertTrackingState(state);
    }

    bool SessionNative::getCameraGeospatialPose(GeospatialPoseData *outPose) {
        ArEarth *earth = acquireEarth();
        if (!earth) {
            return false;
        }

        ArTrackingState state = AR_TRACKING_STATE_STOPPED;
        ArTrackable_getTrackingState(_session, reinterpret_cast<ArTrackable *>(earth), &state);
        if (state != AR_TRACKING_STATE_TRACKING) {
            ArTrackable_release(reinterpret_cast<ArTrackable *>(earth));
            return false;
        }

        ArGeospatialPose *pose = nullptr;
        ArGeospatialPose_create(_session, &pose);
        ArEarth_getCameraGeospatialPose(_session, earth, pose);

        ArGeospatialPose_getLatitudeLongitude(_session, pose, &outPose->latitude, &outPose->longitude);
        ArGeospatialPose_getAltitude(_session, pose, &outPose->altitude);
        ArGeospatialPose_getHorizontalAccuracy(_session, pose, &outPose->horizontalAccuracy);
        ArGeospatialPose_getVerticalAccuracy(_session, pose, &outPose->verticalAccuracy);
        ArGeospatialPose_getOrientationYawAccuracy(_session, pose, &outPose->orientationYawAccuracy);
        ArGeospatialPose_getEastUpSouthQuaternion(_session, pose, outPose->quaternion);

        ArGeospatialPose_destroy(pose);
        ArTrackable_release(reinterpret_cast<ArTrackable *>(earth));
        return true;
    }

    ResolveAnchorFuture *SessionNative::resolveTerrainAnchor(double latitude, double longitude,
                                                             double altitudeAboveTerrain, const float *eusQuaternion,
                                                             AnchorAcquireStatus *outStatus) {
        ArEarth *earth = acquireEarth();
        if (!earth) {
            *outStatus = AnchorAcquireStatus::ErrorUnsupported;
            return nullptr;
        }

        // No callback: the future is polled each frame
        ArResolveAnchorOnTerrainFuture *future = nullptr;
        ArStatus status = ArEarth_resolveAnchorOnTerrainAsync(_session, earth, latitude, longitude, altitudeAboveTerrain,
                                                              eusQuaternion, nullptr, nullptr, &future);
        ArTrackable_release(reinterpret_cast<ArTrackable *>(earth));

        *outStatus = convertStatus(status);
        if (status != AR_SUCCESS) {
            return nullptr;
        }
        return new TerrainAnchorFutureNative(_session, future);
    }

    ResolveAnchorFuture *SessionNative::resolveRooftopAnchor(double latitude, double longitude,
                                                             double altitudeAboveRooftop, const float *eusQuaternion,
                                                             AnchorAcquireStatus *outStatus) {
        ArEarth *earth = acquireEarth();
        if (!earth) {
            *outStatus = AnchorAcquireStatus::ErrorUnsupported;
            return nullptr;
        }

        ArResolveAnchorOnRooftopFuture *future = nullptr;
        ArStatus status = ArEarth_resolveAnchorOnRooftopAsync(_session, earth, latitude, longitude, altitudeAboveRooftop,
                                                              eusQuaternion, nullptr, nullptr, &future);
        ArTrackable_release(reinterpret_cast<ArTrackable *>(earth));

        *outStatus = convertStatus(status);
        if (status != AR_SUCCESS) {
            return nullptr;
        }
        return new RooftopAnchorFutureNative(_session, future);
    }

    Pose *SessionNative::createPose() {
        ArPose *pose = nullptr;
        ArPose_create(_session, nullptr, &pose);
        return new PoseNative(_session, pose);
    }

    Pose *SessionNative::createPose(const float *raw) {
        ArPose *pose = nullptr;
        ArPose_create(_session, raw, &pose);
        return new PoseNative(_session, pose);
    }

    TrackableList *SessionNative::createTrackableList() {
        ArTrackableList *list = nullptr;
        ArTrackableList_create(_session, &list);
        return new TrackableListNative(_session, list);
    }

    HitResultList *SessionNative::createHitResultList() {
        ArHitResultList *list = nullptr;
        ArHitResultList_create(_session, &list);
        return new HitResultListNative(_session, list);
    }

    Frame *SessionNative::createFrame() {
        ArFrame *frame = nullptr;
        ArFrame_create(_session, &frame);
        return new FrameNative(_session, frame);
    }

    HitResult *SessionNative::createHitResult() {
        ArHitResult *hitResult = nullptr;
        ArHitResult_create(_session, &hitResult);
        return new HitResultNative(_session, hitResult);
    }

    Anchor *SessionNative::acquireNewAnchor(const Pose *pose, AnchorAcquireStatus *outStatus) {
        ArAnchor *anchor = nullptr;
        ArStatus status = ArSession_acquireNewAnchor(_session, ((const PoseNative *) pose)->_pose, &anchor);
        *outStatus = convertStatus(status);
        if (status != AR_SUCCESS) {
            return nullptr;
        }
        return new AnchorNative(_session, anchor);
    }

    Anchor *SessionNative::hostAndAcquireNewCloudAnchorWithTtl(const Anchor *anchor, int ttlDays,
                                                               AnchorAcquireStatus *outStatus) {
        ArAnchor *cloudAnchor = nullptr;
        ArStatus status = ArSession_hostAndAcquireNewCloudAnchorWithTtl(_session, ((const AnchorNative *) anchor)->_anchor,
                                                                        ttlDays, &cloudAnchor);
        *outStatus = convertStatus(status);
        if (status != AR_SUCCESS) {
            return nullptr;
        }
        return new AnchorNative(_session, cloudAnchor);
    }

    Anchor *SessionNative::resolveAndAcquireNewCloudAnchor(const char *anchorId, AnchorAcquireStatus *outStatus) {
        ArAnchor *cloudAnchor = nullptr;
        ArStatus status = ArSession_resolveAndAcquireNewCloudAnchor(_session, anchorId, &cloudAnchor);
        *outStatus = convertStatus(status);
        if (status != AR_SUCCESS) {
            return nullptr;
        }
        return new AnchorNative(_session, cloudAnchor);
    }

}
