//
//  SceneViewAR_JNI.cpp
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

#include "SceneViewAR_JNI.h"
#include "ARCore_Native.h"
#include "SVARSessionARCore.h"
#include "SVARScene.h"
#include "SVARFrame.h"
#include "SVNode.h"
#include "SVPlacementBehavior.h"
#include "SVHitResultBehavior.h"
#include "SVLog.h"
#include <stdexcept>

namespace {

/*
 Holds a global reference to a Java listener and releases it when the last
 copy of the callback goes away.
 */
class SVJavaAnchorTaskListener {
public:

    SVJavaAnchorTaskListener(JNIEnv *env, jobject listener) {
        env->GetJavaVM(&_vm);
        _listener = env->NewGlobalRef(listener);
    }

    ~SVJavaAnchorTaskListener() {
        JNIEnv *env = getEnv();
        if (env) {
            env->DeleteGlobalRef(_listener);
        }
    }

    void onComplete(std::shared_ptr<SVARAnchor> anchor, bool success) {
        JNIEnv *env = getEnv();
        if (!env) {
            perr("Anchor task completed on a thread without a JNI environment");
            return;
        }
        jclass cls = env->GetObjectClass(_listener);
        jmethodID method = env->GetMethodID(cls, "onAnchorTaskComplete", "(ZLjava/lang/String;)V");
        env->DeleteLocalRef(cls);
        if (method == nullptr) {
            perr("Anchor task listener is missing onAnchorTaskComplete");
            env->ExceptionClear();
            return;
        }

        std::string cloudAnchorId = anchor ? anchor->getCloudAnchorId() : "";
        jstring jCloudAnchorId = env->NewStringUTF(cloudAnchorId.c_str());
        env->CallVoidMethod(_listener, method, (jboolean) success, jCloudAnchorId);
        env->DeleteLocalRef(jCloudAnchorId);

        // Must not leave an exception pending inside the frame update
        if (env->ExceptionCheck()) {
            perr("Anchor task listener threw an exception");
            env->ExceptionDescribe();
            env->ExceptionClear();
        }
    }

private:

    JavaVM *_vm;
    jobject _listener;

    JNIEnv *getEnv() {
        JNIEnv *env = nullptr;
        if (_vm->GetEnv((void **) &env, JNI_VERSION_1_6) != JNI_OK) {
            return nullptr;
        }
        return env;
    }

};

SVAnchorTaskCallback createCallback(JNIEnv *env, jobject listener) {
    if (listener == nullptr) {
        return nullptr;
    }
    std::shared_ptr<SVJavaAnchorTaskListener> javaListener = std::make_shared<SVJavaAnchorTaskListener>(env, listener);
    return [javaListener](std::shared_ptr<SVARAnchor> anchor, bool success) {
        javaListener->onComplete(anchor, success);
    };
}

std::shared_ptr<SVHitResultBehavior> getHitResultBehavior(SV_REF(SVNode) nodeRef) {
    return std::dynamic_pointer_cast<SVHitResultBehavior>(SV_REF_GET(SVNode, nodeRef)->getTrackingBehavior());
}

std::shared_ptr<SVPlacementBehavior> getPlacementBehavior(SV_REF(SVNode) nodeRef) {
    return std::dynamic_pointer_cast<SVPlacementBehavior>(SV_REF_GET(SVNode, nodeRef)->getTrackingBehavior());
}

void throwIllegalState(JNIEnv *env, const char *message) {
    jclass cls = env->FindClass("java/lang/IllegalStateException");
    if (cls != nullptr) {
        env->ThrowNew(cls, message);
    }
}

}

extern "C" {

#pragma mark - Session

SV_METHOD(SV_REF(SVARScene), nativeCreateARScene)(JNIEnv *env, jclass clazz, jobject context) {
    ArSession *arSession = nullptr;
    ArStatus status = ArSession_create(env, context, &arSession);
    if (status != AR_SUCCESS) {
        perr("Failed to create ARCore session (status %d)", (int) status);
        return 0;
    }

    std::shared_ptr<arcore::Session> session_arc = std::make_shared<arcore::SessionNative>(arSession);
    std::shared_ptr<SVARSessionARCore> session = std::make_shared<SVARSessionARCore>(session_arc);
    return SV_REF_NEW(SVARScene, std::make_shared<SVARScene>(session));
}

SV_METHOD(void, nativeDestroyARScene)(JNIEnv *env, jclass clazz, SV_REF(SVARScene) sceneRef) {
    SV_REF_GET(SVARScene, sceneRef)->getSession()->close();
    SV_REF_DELETE(SVARScene, sceneRef);
}

SV_METHOD(jboolean, nativeConfigure)(JNIEnv *env, jclass clazz, SV_REF(SVARScene) sceneRef,
                                     jint planeFindingMode, jint depthMode, jboolean instantPlacement,
                                     jint lightEstimationMode, jboolean cloudAnchors, jboolean geospatial,
                                     jboolean autoFocus) {
    SVARSessionConfig config;
    config.planeFindingMode = (SVARPlaneFindingMode) planeFindingMode;
    config.depthMode = (SVARDepthMode) depthMode;
    config.instantPlacementEnabled = instantPlacement;
    config.lightEstimationMode = (SVARLightEstimationMode) lightEstimationMode;
    config.cloudAnchorEnabled = cloudAnchors;
    config.geospatialEnabled = geospatial;
    config.focusMode = autoFocus ? SVARFocusMode::Auto : SVARFocusMode::Fixed;
    return SV_REF_GET(SVARScene, sceneRef)->getSession()->configure(config);
}

SV_METHOD(jboolean, nativeResume)(JNIEnv *env, jclass clazz, SV_REF(SVARScene) sceneRef) {
    return SV_REF_GET(SVARScene, sceneRef)->getSession()->resume();
}

SV_METHOD(void, nativePause)(JNIEnv *env, jclass clazz, SV_REF(SVARScene) sceneRef) {
    SV_REF_GET(SVARScene, sceneRef)->getSession()->pause();
}

SV_METHOD(void, nativeSetDisplayGeometry)(JNIEnv *env, jclass clazz, SV_REF(SVARScene) sceneRef,
                                          jint rotation, jint width, jint height) {
    SV_REF_GET(SVARScene, sceneRef)->getSession()->setDisplayGeometry(rotation, width, height);
}

SV_METHOD(void, nativeSetCameraTextureName)(JNIEnv *env, jclass clazz, SV_REF(SVARScene) sceneRef,
                                            jint textureId) {
    std::shared_ptr<SVARSessionARCore> session =
        std::dynamic_pointer_cast<SVARSessionARCore>(SV_REF_GET(SVARScene, sceneRef)->getSession());
    session->setCameraTextureName(textureId);
}

SV_METHOD(jboolean, nativeOnFrame)(JNIEnv *env, jclass clazz, SV_REF(SVARScene) sceneRef) {
    return SV_REF_GET(SVARScene, sceneRef)->onFrame() != nullptr;
}

#pragma mark - Geospatial

SV_METHOD(jint, nativeGetEarthTrackingState)(JNIEnv *env, jclass clazz, SV_REF(SVARScene) sceneRef) {
    return (jint) SV_REF_GET(SVARScene, sceneRef)->getSession()->getEarthTrackingState();
}

SV_METHOD(jboolean, nativeGetCameraGeospatialPose)(JNIEnv *env, jclass clazz, SV_REF(SVARScene) sceneRef,
                                                   jdoubleArray outPose) {
    SVGeospatialPose pose = SV_REF_GET(SVARScene, sceneRef)->getSession()->getCameraGeospatialPose();
    if (!pose.isValid()) {
        return false;
    }
    jdouble values[10] = { pose.latitude, pose.longitude, pose.altitude,
                           pose.eusQuaternion.X, pose.eusQuaternion.Y, pose.eusQuaternion.Z, pose.eusQuaternion.W,
                           pose.horizontalAccuracy, pose.verticalAccuracy, pose.orientationYawAccuracy };
    env->SetDoubleArrayRegion(outPose, 0, 10, values);
    return true;
}

#pragma mark - Placement Nodes

SV_METHOD(SV_REF(SVNode), nativeCreatePlacementNode)(JNIEnv *env, jclass clazz, SV_REF(SVARScene) sceneRef,
                                                     jint placementMode, jfloat x, jfloat y, jfloat z) {
    std::shared_ptr<SVPlacementBehavior> behavior =
        std::make_shared<SVPlacementBehavior>(SVPlacementMode((SVPlacementModeType) placementMode), SVVector3f(x, y, z));
    std::shared_ptr<SVNode> node = std::make_shared<SVNode>(behavior);
    SV_REF_GET(SVARScene, sceneRef)->addNode(node);
    return SV_REF_NEW(SVNode, node);
}

SV_METHOD(SV_REF(SVNode), nativeCreateHitResultNode)(JNIEnv *env, jclass clazz, SV_REF(SVARScene) sceneRef,
                                                     jfloat xPx, jfloat yPx, jboolean plane, jboolean depth,
                                                     jboolean instant, jfloat instantDistance) {
    std::shared_ptr<SVHitResultBehavior> behavior =
        std::make_shared<SVHitResultBehavior>(xPx, yPx, SVARHitTestFilter::forFeatures(plane, depth, instant),
                                              instantDistance);
    std::shared_ptr<SVNode> node = std::make_shared<SVNode>(behavior);
    SV_REF_GET(SVARScene, sceneRef)->addNode(node);
    return SV_REF_NEW(SVNode, node);
}

SV_METHOD(void, nativeSetHitResultLocation)(JNIEnv *env, jclass clazz, SV_REF(SVNode) nodeRef,
                                            jfloat xPx, jfloat yPx) {
    getHitResultBehavior(nodeRef)->setLocation(xPx, yPx);
}

SV_METHOD(void, nativeSetHitResultUpdate)(JNIEnv *env, jclass clazz, SV_REF(SVNode) nodeRef, jboolean update) {
    getHitResultBehavior(nodeRef)->setUpdate(update);
}

SV_METHOD(void, nativeDestroyNode)(JNIEnv *env, jclass clazz, SV_REF(SVNode) nodeRef) {
    SV_REF_GET(SVNode, nodeRef)->destroy();
    SV_REF_DELETE(SVNode, nodeRef);
}

SV_METHOD(void, nativeSetAutoAnchor)(JNIEnv *env, jclass clazz, SV_REF(SVNode) nodeRef, jboolean autoAnchor) {
    getPlacementBehavior(nodeRef)->setAutoAnchor(autoAnchor);
}

SV_METHOD(void, nativeSetPlacementPosition)(JNIEnv *env, jclass clazz, SV_REF(SVNode) nodeRef,
                                            jfloat x, jfloat y, jfloat z) {
    getPlacementBehavior(nodeRef)->setPlacementPosition(SVVector3f(x, y, z));
}

SV_METHOD(jboolean, nativeIsTracking)(JNIEnv *env, jclass clazz, SV_REF(SVNode) nodeRef) {
    return SV_REF_GET(SVNode, nodeRef)->getTrackingBehavior()->isTracking();
}

SV_METHOD(jboolean, nativeIsAnchored)(JNIEnv *env, jclass clazz, SV_REF(SVNode) nodeRef) {
    return getPlacementBehavior(nodeRef)->isAnchored();
}

SV_METHOD(jboolean, nativeIsVisible)(JNIEnv *env, jclass clazz, SV_REF(SVNode) nodeRef) {
    return SV_REF_GET(SVNode, nodeRef)->isVisible();
}

SV_METHOD(void, nativeGetWorldTransform)(JNIEnv *env, jclass clazz, SV_REF(SVNode) nodeRef,
                                         jfloatArray outTransform) {
    SVMatrix4f transform = SV_REF_GET(SVNode, nodeRef)->getWorldTransform();
    env->SetFloatArrayRegion(outTransform, 0, 16, transform.getArray());
}

#pragma mark - Anchor Tasks

SV_METHOD(jint, nativeHostCloudAnchor)(JNIEnv *env, jclass clazz, SV_REF(SVARScene) sceneRef,
                                       SV_REF(SVNode) nodeRef, jint ttlDays, jobject listener) {
    try {
        return (jint) getPlacementBehavior(nodeRef)->hostCloudAnchor(SV_REF_GET(SVARScene, sceneRef)->getSession(),
                                                                      ttlDays, createCallback(env, listener));
    } catch (std::logic_error &e) {
        throwIllegalState(env, e.what());
        return (jint) SVARAnchorAcquireStatus::ErrorUnknown;
    }
}

SV_METHOD(jint, nativeResolveCloudAnchor)(JNIEnv *env, jclass clazz, SV_REF(SVARScene) sceneRef,
                                          SV_REF(SVNode) nodeRef, jstring jCloudAnchorId, jobject listener) {
    const char *cloudAnchorId_c = env->GetStringUTFChars(jCloudAnchorId, nullptr);
    std::string cloudAnchorId(cloudAnchorId_c);
    env->ReleaseStringUTFChars(jCloudAnchorId, cloudAnchorId_c);

    try {
        return (jint) getPlacementBehavior(nodeRef)->resolveCloudAnchor(SV_REF_GET(SVARScene, sceneRef)->getSession(),
                                                                         cloudAnchorId, createCallback(env, listener));
    } catch (std::logic_error &e) {
        throwIllegalState(env, e.what());
        return (jint) SVARAnchorAcquireStatus::ErrorUnknown;
    }
}

SV_METHOD(jint, nativeResolveGeospatialAnchor)(JNIEnv *env, jclass clazz, SV_REF(SVARScene) sceneRef,
                                               SV_REF(SVNode) nodeRef, jboolean rooftop,
                                               jdouble latitude, jdouble longitude, jdouble altitude,
                                               jfloat qx, jfloat qy, jfloat qz, jfloat qw, jobject listener) {
    std::shared_ptr<SVPlacementBehavior> behavior = getPlacementBehavior(nodeRef);
    const std::shared_ptr<SVARSession> &session = SV_REF_GET(SVARScene, sceneRef)->getSession();
    SVQuaternion rotation(qx, qy, qz, qw);

    try {
        if (rooftop) {
            return (jint) behavior->resolveRooftopAnchor(session, latitude, longitude, altitude, rotation,
                                                         createCallback(env, listener));
        } else {
            return (jint) behavior->resolveTerrainAnchor(session, latitude, longitude, altitude, rotation,
                                                         createCallback(env, listener));
        }
    } catch (std::logic_error &e) {
        throwIllegalState(env, e.what());
        return (jint) SVARAnchorAcquireStatus::ErrorUnknown;
    }
}

SV_METHOD(void, nativeCancelAnchorTask)(JNIEnv *env, jclass clazz, SV_REF(SVNode) nodeRef) {
    getPlacementBehavior(nodeRef)->cancelAnchorTask();
}

SV_METHOD(jint, nativeGetCloudAnchorState)(JNIEnv *env, jclass clazz, SV_REF(SVNode) nodeRef) {
    return (jint) getPlacementBehavior(nodeRef)->getCloudAnchorState();
}

}
