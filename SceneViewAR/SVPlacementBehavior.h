//
//  SVPlacementBehavior.h
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

#ifndef SVPlacementBehavior_h
#define SVPlacementBehavior_h

#include "SVAnchorBehavior.h"
#include "SVPlacementMode.h"
#include "SVVector3f.h"

class SVARHitTestResult;

/*
 Places an unanchored node at the real-world location behind a fixed
 screen-space point, using rate limited hit tests, until the node is
 anchored.

 The placement position is in normalized view coordinates: X and Y run
 from -1 to 1 (Y up), and |Z| is the approximate distance in meters used
 for instant placement (negative Z is forward from the camera).
 */
class SVPlacementBehavior : public SVAnchorBehavior {
public:

    SVPlacementBehavior(SVPlacementMode placementMode = SVPlacementMode(),
                        SVVector3f placementPosition = kDefaultPlacementPosition,
                        SVTrackingSettings settings = SVTrackingSettings());
    virtual ~SVPlacementBehavior() {}

    SVTrackingBehaviorType getType() const {
        return SVTrackingBehaviorType::Placement;
    }

    const SVPlacementMode &getPlacementMode() const {
        return _placementMode;
    }

    /*
     Change the placement mode. The session configuration the mode needs is
     applied on the next frame.
     */
    void setPlacementMode(SVPlacementMode placementMode);

    const SVVector3f &getPlacementPosition() const {
        return _placementPosition;
    }

    /*
     Change the placement position. Until a tracked pose is found the node
     sits at this position.
     */
    void setPlacementPosition(SVVector3f placementPosition);

    /*
     When set, the node is anchored at the first suitable hit result. When
     cleared, an anchored node is detached and follows the placement point
     again.
     */
    bool isAutoAnchor() const {
        return _autoAnchor;
    }
    void setAutoAnchor(bool autoAnchor);

    /*
     Throws std::invalid_argument unless rate is greater than zero.
     */
    void setMaxHitTestsPerSecond(float rate);

    void setAllowNonTrackingAnchorFallback(bool allow) {
        _settings.allowNonTrackingAnchorFallback = allow;
    }

    /*
     The most recent placement hit result, tracking or not, and the most
     recent one that was tracking.
     */
    const std::shared_ptr<SVARHitTestResult> &getLastHitResult() const {
        return _lastHitResult;
    }
    const std::shared_ptr<SVARHitTestResult> &getLastTrackingHitResult() const {
        return _lastTrackingHitResult;
    }

    /*
     Hit test the current frame at the placement position with the
     features enabled by the placement mode.
     */
    std::shared_ptr<SVARHitTestResult> hitTest(const SVARFrameContext &context);

    /*
     Feed a hit result to the node as if the placement loop had produced
     it: a tracking result moves the node, any result is forwarded to
     delegates.
     */
    void setHitResult(std::shared_ptr<SVARHitTestResult> hitResult);

    /*
     Anchor at the best available hit result: the latest if it is
     tracking, else the last tracking one, else (if allowed by the
     settings) the latest even if not tracking. Runs no new hit test.
     */
    std::shared_ptr<SVARAnchor> createAnchor(const std::shared_ptr<SVARSession> &session,
                                             SVARAnchorAcquireStatus *outStatus);

    void onARFrame(SVNode &node, const SVARFrameContext &context);

protected:

    bool keepsPosition() const {
        return _placementMode.isKeepPosition();
    }
    bool keepsRotation() const {
        return _placementMode.isKeepRotation();
    }
    void onAttach();

private:

    SVPlacementMode _placementMode;
    SVVector3f _placementPosition;
    bool _autoAnchor;
    bool _sessionConfigPending;

    bool _hasLastHitTest;
    int64_t _lastHitTestTimestampNs;

    std::shared_ptr<SVARHitTestResult> _lastHitResult;
    std::shared_ptr<SVARHitTestResult> _lastTrackingHitResult;

    bool isHitTestDue(int64_t timestampNs) const;
    void applyPlacementModeToSession(const std::shared_ptr<SVARSession> &session);

};

#endif /* SVPlacementBehavior_h */
