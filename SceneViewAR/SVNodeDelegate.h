//
//  SVNodeDelegate.h
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

#ifndef SVNodeDelegate_h
#define SVNodeDelegate_h

#include <memory>
#include "SVPose.h"
#include "SVARTracking.h"

class SVNode;
class SVARAnchor;
class SVARTrackable;
class SVARHitTestResult;

/*
 Receives tracking events for an SVNode. All methods are invoked on the
 frame thread, from within SVARScene::onFrame() or from the call that
 caused the change. Override only the events of interest.
 */
class SVNodeDelegate {
public:
    virtual ~SVNodeDelegate() {}

    /*
     The node's tracked pose changed. isTracking is false when the pose was
     cleared.
     */
    virtual void onTrackingChanged(SVNode &node, bool isTracking, const SVPose &pose) {}

    /*
     The node's anchor was set, replaced or detached (anchor is nullptr).
     */
    virtual void onAnchorChanged(SVNode &node, std::shared_ptr<SVARAnchor> anchor) {}

    /*
     The tracking state of the node's trackable or anchor changed.
     */
    virtual void onTrackingStateChanged(SVNode &node, SVARTrackingState state) {}

    /*
     The trackable bound to the node was reported updated by the frame.
     */
    virtual void onTrackableUpdated(SVNode &node, std::shared_ptr<SVARTrackable> trackable) {}

    /*
     A placement hit test completed. hitResult is nullptr when nothing was
     hit. isTracking reflects whether the node has a tracked pose.
     */
    virtual void onHitResult(SVNode &node, std::shared_ptr<SVARHitTestResult> hitResult, bool isTracking) {}

    virtual void onCameraTrackingChanged(SVNode &node, SVARTrackingState state) {}

    /*
     The node's effective visibility changed.
     */
    virtual void onVisibilityChanged(SVNode &node, bool visible) {}
};

#endif /* SVNodeDelegate_h */
