//
//  ARCore_Native.h
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

#ifndef ARCORE_Native_h
#define ARCORE_Native_h

#include "ARCore_API.h"

/*
 Implementation of the arcore:: interfaces over the ARCore NDK. Every
 wrapper owns one reference to its ARCore object and releases it on
 destruction. Wrappers returned by create* and acquire* methods are owned
 by the caller.
 */
namespace arcore {

    class ConfigNative : public Config {
    public:
        ConfigNative(ArConfig *config) : _config(config) {}
        virtual ~ConfigNative();
        ArConfig *_config;
    };

    class PoseNative : public Pose {
    public:
        PoseNative(ArSession *session, ArPose *pose) : _session(session), _pose(pose) {}
        virtual ~PoseNative();
        void toMatrix(float *outMatrix);
        void getRaw(float *outRaw);

        ArSession *_session;
        ArPose *_pose;
    };

    class AnchorNative : public Anchor {
    public:
        AnchorNative(ArSession *session, ArAnchor *anchor) : _session(session), _anchor(anchor) {}
        virtual ~AnchorNative();
        uint64_t getHashCode();
        uint64_t getId();
        void getPose(Pose *outPose);
        TrackingState getTrackingState();
        void acquireCloudAnchorId(char **outCloudAnchorId);
        CloudAnchorState getCloudAnchorState();
        void detach();

        ArSession *_session;
        ArAnchor *_anchor;
    };

    class TrackableListNative : public TrackableList {
    public:
        TrackableListNative(ArSession *session, ArTrackableList *list) : _session(session), _trackableList(list) {}
        virtual ~TrackableListNative();
        Trackable *acquireItem(int index);
        int size();

        ArSession *_session;
        ArTrackableList *_trackableList;
    };

    /*
     Generic trackable, used for trackable types without their own
     wrapper (depth points, images).
     */
    class TrackableNative : public Trackable {
    public:
        TrackableNative(ArSession *session, ArTrackable *trackable) : _session(session), _trackable(trackable) {}
        virtual ~TrackableNative();
        uint64_t getHashCode();
        Anchor *acquireAnchor(Pose *pose, AnchorAcquireStatus *outStatus);
        TrackingState getTrackingState();
        TrackableType getType();

        ArSession *_session;
        ArTrackable *_trackable;
    };

    class PlaneNative : public Plane {
    public:
        PlaneNative(ArSession *session, ArPlane *plane) : _session(session), _plane(plane) {}
        virtual ~PlaneNative();
        uint64_t getHashCode();
        Anchor *acquireAnchor(Pose *pose, AnchorAcquireStatus *outStatus);
        TrackingState getTrackingState();
        TrackableType getType();
        void getCenterPose(Pose *outPose);
        float getExtentX();
        float getExtentZ();
        Plane *acquireSubsumedBy();
        PlaneType getPlaneType();
        bool isPoseInExtents(const Pose *pose);
        bool isPoseInPolygon(const Pose *pose);

        ArSession *_session;
        ArPlane *_plane;
    };

    class PointNative : public Point {
    public:
        PointNative(ArSession *session, ArPoint *point) : _session(session), _point(point) {}
        virtual ~PointNative();
        uint64_t getHashCode();
        Anchor *acquireAnchor(Pose *pose, AnchorAcquireStatus *outStatus);
        TrackingState getTrackingState();
        TrackableType getType();
        void getPose(Pose *outPose);
        PointOrientationMode getOrientationMode();

        ArSession *_session;
        ArPoint *_point;
    };

    class InstantPlacementPointNative : public InstantPlacementPoint {
    public:
        InstantPlacementPointNative(ArSession *session, ArInstantPlacementPoint *point) :
            _session(session), _point(point) {}
        virtual ~InstantPlacementPointNative();
        uint64_t getHashCode();
        Anchor *acquireAnchor(Pose *pose, AnchorAcquireStatus *outStatus);
        TrackingState getTrackingState();
        TrackableType getType();
        void getPose(Pose *outPose);
        InstantPlacementTrackingMethod getTrackingMethod();

        ArSession *_session;
        ArInstantPlacementPoint *_point;
    };

    class CameraNative : public Camera {
    public:
        CameraNative(ArSession *session, ArCamera *camera) : _session(session), _camera(camera) {}
        virtual ~CameraNative();
        TrackingState getTrackingState();
        void getDisplayOrientedPose(Pose *outPose);

        ArSession *_session;
        ArCamera *_camera;
    };

    class FrameNative : public Frame {
    public:
        FrameNative(ArSession *session, ArFrame *frame) : _session(session), _frame(frame) {}
        virtual ~FrameNative();
        int64_t getTimestampNs();
        Camera *acquireCamera();
        void hitTest(float x, float y, HitResultList *outList);
        void hitTestInstantPlacement(float x, float y, float approximateDistance, HitResultList *outList);
        void getUpdatedTrackables(TrackableList *outList, TrackableType type);
        void getUpdatedTrackables(TrackableList *outList);

        ArSession *_session;
        ArFrame *_frame;
    };

    class HitResultListNative : public HitResultList {
    public:
        HitResultListNative(ArSession *session, ArHitResultList *list) : _session(session), _hitResultList(list) {}
        virtual ~HitResultListNative();
        void getItem(int index, HitResult *outResult);
        int size();

        ArSession *_session;
        ArHitResultList *_hitResultList;
    };

    class HitResultNative : public HitResult {
    public:
        HitResultNative(ArSession *session, ArHitResult *hitResult) : _session(session), _hitResult(hitResult) {}
        virtual ~HitResultNative();
        float getDistance();
        void getPose(Pose *outPose);
        Trackable *acquireTrackable();
        Anchor *acquireAnchor(AnchorAcquireStatus *outStatus);

        ArSession *_session;
        ArHitResult *_hitResult;
    };

    class TerrainAnchorFutureNative : public ResolveAnchorFuture {
    public:
        TerrainAnchorFutureNative(ArSession *session, ArResolveAnchorOnTerrainFuture *future) :
            _session(session), _future(future) {}
        virtual ~TerrainAnchorFutureNative();
        FutureState getState();
        ResolveAnchorState getResultState();
        Anchor *acquireResultAnchor();
        bool cancel();

        ArSession *_session;
        ArResolveAnchorOnTerrainFuture *_future;
    };

    class RooftopAnchorFutureNative : public ResolveAnchorFuture {
    public:
        RooftopAnchorFutureNative(ArSession *session, ArResolveAnchorOnRooftopFuture *future) :
            _session(session), _future(future) {}
        virtual ~RooftopAnchorFutureNative();
        FutureState getState();
        ResolveAnchorState getResultState();
        Anchor *acquireResultAnchor();
        bool cancel();

        ArSession *_session;
        ArResolveAnchorOnRooftopFuture *_future;
    };

    class SessionNative : public Session {
    public:
        /*
         Takes ownership of the given ArSession, which is destroyed with
         this object.
         */
        SessionNative(ArSession *session) : _session(session) {}
        virtual ~SessionNative();

        ConfigStatus configure(Config *config);
        void setDisplayGeometry(int rotation, int width, int height);
        void setCameraTextureName(int32_t textureId);
        bool pause();
        bool resume();
        bool update(Frame *frame);

        Config *createConfig(LightingMode lightingMode, PlaneFindingMode planeFindingMode,
                             UpdateMode updateMode, CloudAnchorMode cloudAnchorMode,
                             FocusMode focusMode, DepthMode depthMode,
                             InstantPlacementMode instantPlacementMode,
                             GeospatialMode geospatialMode);

        bool isDepthModeSupported(DepthMode depthMode);
        bool isGeospatialModeSupported(GeospatialMode mode);
        TrackingState getEarthTrackingState();
        bool getCameraGeospatialPose(GeospatialPoseData *outPose);
        ResolveAnchorFuture *resolveTerrainAnchor(double latitude, double longitude, double altitudeAboveTerrain,
                                                  const float *eusQuaternion, AnchorAcquireStatus *outStatus);
        ResolveAnchorFuture *resolveRooftopAnchor(double latitude, double longitude, double altitudeAboveRooftop,
                                                  const float *eusQuaternion, AnchorAcquireStatus *outStatus);

        Pose *createPose();
        Pose *createPose(const float *raw);
        TrackableList *createTrackableList();
        HitResultList *createHitResultList();
        Frame *createFrame();
        HitResult *createHitResult();
        Anchor *acquireNewAnchor(const Pose *pose, AnchorAcquireStatus *outStatus);
        Anchor *hostAndAcquireNewCloudAnchorWithTtl(const Anchor *anchor, int ttlDays, AnchorAcquireStatus *outStatus);
        Anchor *resolveAndAcquireNewCloudAnchor(const char *anchorId, AnchorAcquireStatus *outStatus);
        ArSession *getRawSession() {
            return _session;
        }

    private:
        ArSession *_session;

        /*
         Returns the Earth trackable, or nullptr if geospatial mode is not
         enabled. The caller releases it with ArTrackable_release.
         */
        ArEarth *acquireEarth();
    };

    /*
     Wrap the given ARCore trackable in the matching arcore:: type. Takes
     ownership of the trackable reference.
     */
    Trackable *wrapTrackable(ArSession *session, ArTrackable *trackable);

}

#endif /* ARCORE_Native_h */
