//
//  SVARSession.h
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

#ifndef SVARSession_h
#define SVARSession_h

#include <memory>
#include <string>
#include <vector>
#include "SVPose.h"
#include "SVARTracking.h"
#include "SVARSessionConfig.h"
#include "SVGeospatial.h"

class SVARAnchor;
class SVARAnchorTask;
class SVARFrame;

enum class SVARSessionState {
    Created,
    Resumed,
    Paused,
    Closed
};

/*
 Observer of session lifecycle and configuration changes. Every registered
 delegate is notified, synchronously, on the thread that made the change.
 */
class SVARSessionDelegate {
public:
    virtual ~SVARSessionDelegate() {}

    virtual void onSessionConfigured(const SVARSessionConfig &config) = 0;
    virtual void onSessionResumed() {}
    virtual void onSessionPaused() {}
};

/*
 Manages the device camera and motion tracking for AR. The public methods
 validate session state and configuration, then defer to the platform
 implementation through the protected hooks.
 */
class SVARSession {
public:

    SVARSession();
    virtual ~SVARSession() {}

    SVARSessionState getState() const {
        return _state;
    }
    bool isResumed() const {
        return _state == SVARSessionState::Resumed;
    }

    /*
     Apply the given configuration. Depth or geospatial modes the device
     does not support are disabled with a warning, and the remaining
     configuration still applies. Returns false if the platform rejected
     the configuration, in which case the previous one stays in effect.
     */
    bool configure(const SVARSessionConfig &config);

    /*
     The configuration currently in effect, after fallbacks.
     */
    const SVARSessionConfig &getConfig() const {
        return _config;
    }

    /*
     Start or restart the camera and tracking. Display geometry set while
     paused is applied here.
     */
    bool resume();

    /*
     Pause the session. No new frames will be created.
     */
    void pause();

    /*
     Release the session. A closed session cannot be resumed.
     */
    void close();

    /*
     Set the rotation and size of the display the camera image is shown on.
     Applied immediately while resumed, otherwise on the next resume.
     */
    void setDisplayGeometry(int rotation, int width, int height);
    int getDisplayWidth() const {
        return _displayWidth;
    }
    int getDisplayHeight() const {
        return _displayHeight;
    }

    /*
     Invoke each rendering frame. Updates the session with the latest AR
     data and returns it, or nullptr if the session is not resumed.
     */
    std::shared_ptr<SVARFrame> update();

    /*
     The frames produced by the last two calls to update().
     */
    const std::shared_ptr<SVARFrame> &getCurrentFrame() const {
        return _currentFrame;
    }
    const std::shared_ptr<SVARFrame> &getPreviousFrame() const {
        return _previousFrame;
    }

    void addDelegate(std::shared_ptr<SVARSessionDelegate> delegate);
    void removeDelegate(std::shared_ptr<SVARSessionDelegate> delegate);

    virtual bool isDepthModeSupported(SVARDepthMode mode) const = 0;
    virtual bool isGeospatialModeSupported() const = 0;

    /*
     Create a free anchor at the given world pose. On failure returns
     nullptr and writes the cause to outStatus.
     */
    std::shared_ptr<SVARAnchor> createAnchor(const SVPose &pose, SVARAnchorAcquireStatus *outStatus);

    /*
     Start hosting the given anchor on the cloud anchor service, keeping it
     for ttlDays (1 to 365). The returned task owns a new anchor that
     replaces the one passed in.
     */
    std::shared_ptr<SVARAnchorTask> hostCloudAnchor(const std::shared_ptr<SVARAnchor> &anchor, int ttlDays,
                                                    SVARAnchorAcquireStatus *outStatus);

    /*
     Start resolving the anchor with the given cloud identifier.
     */
    std::shared_ptr<SVARAnchorTask> resolveCloudAnchor(const std::string &cloudAnchorId,
                                                       SVARAnchorAcquireStatus *outStatus);

    /*
     Start resolving a terrain or rooftop anchor. Requires geospatial mode.
     */
    std::shared_ptr<SVARAnchorTask> resolveGeospatialAnchor(const SVGeospatialAnchorRequest &request,
                                                            SVARAnchorAcquireStatus *outStatus);

    virtual SVEarthTrackingState getEarthTrackingState() const {
        return SVEarthTrackingState::Stopped;
    }
    virtual SVGeospatialPose getCameraGeospatialPose() const {
        return SVGeospatialPose();
    }

protected:

    /*
     Platform hooks. Each is only invoked once the public method has
     validated the session state. closeSession() is invoked once, after a
     resumed session has been paused.
     */
    virtual bool applyConfig(const SVARSessionConfig &config) = 0;
    virtual bool resumeSession() = 0;
    virtual void pauseSession() = 0;
    virtual void closeSession() = 0;
    virtual void applyDisplayGeometry(int rotation, int width, int height) = 0;
    virtual std::shared_ptr<SVARFrame> updateFrame() = 0;

    virtual std::shared_ptr<SVARAnchor> acquireAnchor(const SVPose &pose, SVARAnchorAcquireStatus *outStatus) = 0;
    virtual std::shared_ptr<SVARAnchorTask> startHostCloudAnchor(const std::shared_ptr<SVARAnchor> &anchor, int ttlDays,
                                                                 SVARAnchorAcquireStatus *outStatus) = 0;
    virtual std::shared_ptr<SVARAnchorTask> startResolveCloudAnchor(const std::string &cloudAnchorId,
                                                                    SVARAnchorAcquireStatus *outStatus) = 0;
    virtual std::shared_ptr<SVARAnchorTask> startResolveGeospatialAnchor(const SVGeospatialAnchorRequest &request,
                                                                         SVARAnchorAcquireStatus *outStatus) {
        *outStatus = SVARAnchorAcquireStatus::ErrorUnsupported;
        return nullptr;
    }

private:

    SVARSessionState _state;
    SVARSessionConfig _config;

    int _displayRotation;
    int _displayWidth;
    int _displayHeight;
    bool _displayGeometryPending;

    std::shared_ptr<SVARFrame> _currentFrame;
    std::shared_ptr<SVARFrame> _previousFrame;

    std::vector<std::weak_ptr<SVARSessionDelegate>> _delegates;

    std::vector<std::shared_ptr<SVARSessionDelegate>> getDelegates();

};

#endif /* SVARSession_h */
