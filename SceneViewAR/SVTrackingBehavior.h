//
//  SVTrackingBehavior.h
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

#ifndef SVTrackingBehavior_h
#define SVTrackingBehavior_h

#include <memory>
#include <set>
#include <functional>
#include "SVPose.h"
#include "SVARTracking.h"
#include "SVTrackingSettings.h"

class SVNode;
class SVNodeDelegate;
struct SVARFrameContext;

enum class SVTrackingBehaviorType {
    Pose,       // Pose assigned by the application
    Trackable,  // Follows a plane, point, image or face
    Anchor,     // Pinned to an anchor
    Placement,  // Placed by hit tests until anchored
    HitResult   // Follows the hit test at a view location
};

/*
 Capability that reconciles a node's transform against the tracking
 subsystem. The base behavior holds a tracked pose, assigned directly by
 the application, and tracks the camera's tracking state. Subclasses
 derive the pose from trackables, anchors or hit tests.

 A behavior is attached to exactly one node, at the node's construction.
 */
class SVTrackingBehavior {
public:

    SVTrackingBehavior(SVTrackingSettings settings = SVTrackingSettings());
    virtual ~SVTrackingBehavior() {}

    virtual SVTrackingBehaviorType getType() const {
        return SVTrackingBehaviorType::Pose;
    }

    /*
     The node this behavior drives, or nullptr once the node is destroyed.
     */
    SVNode *getNode() const {
        return _node;
    }
    void attachToNode(SVNode *node);
    void detachFromNode(SVNode *node);

    const SVTrackingSettings &getSettings() const {
        return _settings;
    }

    /*
     Replace the settings. Throws std::invalid_argument, leaving the
     current settings in place, if maxHitTestsPerSecond is not positive.
     */
    void setSettings(SVTrackingSettings settings);

#pragma mark - Pose

    /*
     True while the behavior has a tracked pose.
     */
    bool isTracking() const {
        return _hasPose;
    }
    const SVPose &getPose() const {
        return _pose;
    }

    /*
     Assign the tracked pose. Assigning a pose equal in position and
     rotation to the current one does nothing. Otherwise the node is moved
     to the pose (smoothly if enabled) and delegates are notified.
     */
    void setPose(const SVPose &pose);

    /*
     Drop the tracked pose. The node keeps its last transform.
     */
    void clearPose();

#pragma mark - Camera Tracking

    SVARTrackingState getCameraTrackingState() const {
        return _cameraTrackingState;
    }

    /*
     Camera tracking states in which the node is visible. All states by
     default.
     */
    const std::set<SVARTrackingState> &getVisibleCameraTrackingStates() const {
        return _visibleCameraTrackingStates;
    }
    void setVisibleCameraTrackingStates(std::set<SVARTrackingState> states);

#pragma mark - Frame Update

    /*
     Tracking filter on the node's visibility. The node is effectively
     visible only when its base visibility is set and this returns true.
     */
    virtual bool isVisible() const;

    virtual void onARFrame(SVNode &node, const SVARFrameContext &context);

protected:

    SVTrackingSettings _settings;

    /*
     Pose components left untouched when the pose is applied to the node.
     */
    virtual bool keepsPosition() const {
        return false;
    }
    virtual bool keepsRotation() const {
        return false;
    }

    /*
     Invoked once the behavior is attached to its node.
     */
    virtual void onAttach() {}

    /*
     Invoked when the node is destroyed, after the behavior has been
     detached from it. Release tracking resources here.
     */
    virtual void onDetach() {}

    void dispatchToDelegates(const std::function<void(SVNodeDelegate &)> &fn);
    void updateNodeVisibility();

private:

    static void validateSettings(const SVTrackingSettings &settings);

    SVNode *_node;

    bool _hasPose;
    SVPose _pose;

    SVARTrackingState _cameraTrackingState;
    std::set<SVARTrackingState> _visibleCameraTrackingStates;

    void applyPoseToNode(bool smooth);
    void notifyTrackingChanged();

};

#endif /* SVTrackingBehavior_h */
