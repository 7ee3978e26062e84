//
//  ARCore_API.h
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

#ifndef ARCORE_API_h
#define ARCORE_API_h

#include <stdint.h>
#include <arcore_c_api.h>
#include <string>
#include <memory>

namespace arcore {

    class Anchor;
    class Trackable;
    class HitResultList;
    class HitResult;

    enum class AnchorAcquireStatus {
        Success,
        ErrorNotTracking,
        ErrorSessionPaused,
        ErrorResourceExhausted,
        ErrorDeadlineExceeded,
        ErrorCloudAnchorsNotConfigured,
        ErrorAnchorNotSupportedForHosting,
        ErrorUnsupported,
        ErrorUnknown
    };

    enum class ConfigStatus {
        Success,
        UnsupportedConfiguration,
        Error
    };

    enum class DepthMode {
        Disabled,
        Automatic,
        RawDepthOnly
    };

    enum class GeospatialMode {
        Disabled,
        Enabled
    };

    enum class InstantPlacementMode {
        Disabled,
        LocalYUp
    };

    struct GeospatialPoseData {
        double latitude;
        double longitude;
        double altitude;
        double horizontalAccuracy;
        double verticalAccuracy;
        double orientationYawAccuracy;
        float quaternion[4];
    };

    enum class CloudAnchorMode {
        Disabled,
        Enabled
    };

    enum class CloudAnchorState {
        None,
        TaskInProgress,
        Success,
        ErrorInternal,
        ErrorNotAuthorized,
        ErrorResourceExhausted,
        ErrorHostingDatasetProcessingFailed,
        ErrorCloudIdNotFound,
        ErrorResolvingSdkVersionTooOld,
        ErrorResolvingSdkVersionTooNew,
        ErrorHostingServiceUnavailable
    };

    enum class TrackingState {
        Tracking,
        Paused,
        Stopped
    };

    enum class TrackableType {
        Plane,
        Point,
        DepthPoint,
        InstantPlacementPoint,
        Image,
        Unknown
    };

    enum class PlaneType {
        HorizontalUpward,
        HorizontalDownward,
        Vertical
    };

    enum class PointOrientationMode {
        InitializedToIdentity,
        EstimatedSurfaceNormal
    };

    enum class InstantPlacementTrackingMethod {
        NotTracking,
        ScreenspaceWithApproximateDistance,
        FullTracking
    };

    enum class LightingMode {
        Disabled,
        AmbientIntensity,
        EnvironmentalHDR
    };

    enum class PlaneFindingMode {
        Disabled,
        Horizontal,
        Vertical,
        HorizontalAndVertical
    };

    enum class UpdateMode {
        Blocking,
        LatestCameraImage
    };

    enum class FocusMode {
        FIXED_FOCUS,
        AUTO_FOCUS
    };

    /*
     State of an asynchronous ARCore operation. Done covers both success
     and failure; the result state of the operation tells them apart.
     */
    enum class FutureState {
        Pending,
        Cancelled,
        Done
    };

    /*
     Result of a terrain or rooftop anchor resolve, once its future is done.
     */
    enum class ResolveAnchorState {
        None,
        Success,
        ErrorInternal,
        ErrorNotAuthorized,
        ErrorUnsupportedLocation
    };

    class Config {
    public:
        virtual ~Config() {}
    };

    class Pose {
    public:
        virtual ~Pose() {}
        virtual void toMatrix(float *outMatrix) = 0;
        virtual void getRaw(float *outRaw) = 0;
    };

    class Anchor {
    public:
        virtual ~Anchor() {}
        virtual uint64_t getHashCode() = 0;
        virtual uint64_t getId() = 0;
        virtual void getPose(Pose *outPose) = 0;
        virtual TrackingState getTrackingState() = 0;
        virtual void acquireCloudAnchorId(char **outCloudAnchorId) = 0;
        virtual CloudAnchorState getCloudAnchorState() = 0;
        virtual void detach() = 0;
    };

    class TrackableList {
    public:
        virtual ~TrackableList() {}
        virtual Trackable *acquireItem(int index) = 0;
        virtual int size() = 0;
    };

    class Trackable {
    public:
        virtual ~Trackable() {}
        virtual uint64_t getHashCode() = 0;
        virtual Anchor *acquireAnchor(Pose *pose, AnchorAcquireStatus *outStatus) = 0;
        virtual TrackingState getTrackingState() = 0;
        virtual TrackableType getType() = 0;
    };

    class Plane : public Trackable {
    public:
        virtual ~Plane() {}
        virtual void getCenterPose(Pose *outPose) = 0;
        virtual float getExtentX() = 0;
        virtual float getExtentZ() = 0;
        virtual Plane *acquireSubsumedBy() = 0;
        virtual PlaneType getPlaneType() = 0;
        virtual bool isPoseInExtents(const Pose *pose) = 0;
        virtual bool isPoseInPolygon(const Pose *pose) = 0;
    };

    class Point : public Trackable {
    public:
        virtual ~Point() {}
        virtual void getPose(Pose *outPose) = 0;
        virtual PointOrientationMode getOrientationMode() = 0;
    };

    class InstantPlacementPoint : public Trackable {
    public:
        virtual ~InstantPlacementPoint() {}
        virtual void getPose(Pose *outPose) = 0;
        virtual InstantPlacementTrackingMethod getTrackingMethod() = 0;
    };

    class Camera {
    public:
        virtual ~Camera() {}
        virtual TrackingState getTrackingState() = 0;
        virtual void getDisplayOrientedPose(Pose *outPose) = 0;
    };

    class Frame {
    public:
        virtual ~Frame() {}
        virtual int64_t getTimestampNs() = 0;
        virtual Camera *acquireCamera() = 0;
        virtual void hitTest(float x, float y, HitResultList *outList) = 0;
        virtual void hitTestInstantPlacement(float x, float y, float approximateDistance,
                                             HitResultList *outList) = 0;
        virtual void getUpdatedTrackables(TrackableList *outList, TrackableType type) = 0;
        virtual void getUpdatedTrackables(TrackableList *outList) = 0;
    };

    class HitResultList {
    public:
        virtual ~HitResultList() {}
        virtual void getItem(int index, HitResult *outResult) = 0;
        virtual int size() = 0;
    };

    class HitResult {
    public:
        virtual ~HitResult() {}
        virtual float getDistance() = 0;
        virtual void getPose(Pose *outPose) = 0;
        virtual Trackable *acquireTrackable() = 0;
        virtual Anchor *acquireAnchor(AnchorAcquireStatus *outStatus) = 0;
    };

    /*
     Polled handle to a terrain or rooftop anchor resolve. Releasing the
     future does not cancel the operation: call cancel() first.
     */
    class ResolveAnchorFuture {
    public:
        virtual ~ResolveAnchorFuture() {}
        virtual FutureState getState() = 0;
        virtual ResolveAnchorState getResultState() = 0;
        virtual Anchor *acquireResultAnchor() = 0;
        virtual bool cancel() = 0;
    };

    class Session {
    public:
        virtual ~Session() {}
        virtual ConfigStatus configure(Config *config) = 0;
        virtual void setDisplayGeometry(int rotation, int width, int height) = 0;
        virtual void setCameraTextureName(int32_t textureId) = 0;
        virtual bool pause() = 0;
        virtual bool resume() = 0;
        virtual bool update(Frame *frame) = 0;

        virtual Config *createConfig(LightingMode lightingMode, PlaneFindingMode planeFindingMode,
                                     UpdateMode updateMode, CloudAnchorMode cloudAnchorMode,
                                     FocusMode focusMode, DepthMode depthMode,
                                     InstantPlacementMode instantPlacementMode,
                                     GeospatialMode geospatialMode) = 0;

        virtual bool isDepthModeSupported(DepthMode depthMode) = 0;
        virtual bool isGeospatialModeSupported(GeospatialMode mode) = 0;
        virtual TrackingState getEarthTrackingState() = 0;
        virtual bool getCameraGeospatialPose(GeospatialPoseData *outPose) = 0;
        virtual ResolveAnchorFuture *resolveTerrainAnchor(double latitude, double longitude, double altitudeAboveTerrain,
                                                          const float *eusQuaternion, AnchorAcquireStatus *outStatus) = 0;
        virtual ResolveAnchorFuture *resolveRooftopAnchor(double latitude, double longitude, double altitudeAboveRooftop,
                                                          const float *eusQuaternion, AnchorAcquireStatus *outStatus) = 0;

        virtual Pose *createPose() = 0;
        virtual Pose *createPose(const float *raw) = 0;
        virtual TrackableList *createTrackableList() = 0;
        virtual HitResultList *createHitResultList() = 0;
        virtual Frame *createFrame() = 0;
        virtual HitResult *createHitResult() = 0;
        virtual Anchor *acquireNewAnchor(const Pose *pose, AnchorAcquireStatus *outStatus) = 0;
        virtual Anchor *hostAndAcquireNewCloudAnchorWithTtl(const Anchor *anchor, int ttlDays, AnchorAcquireStatus *outStatus) = 0;
        virtual Anchor *resolveAndAcquireNewCloudAnchor(const char *anchorId, AnchorAcquireStatus *outStatus) = 0;
        virtual ArSession *getRawSession() = 0;
    };
}

#endif /* ARCORE_API_h */
