//
//  SVTrackableBehavior.h
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

#ifndef SVTrackableBehavior_h
#define SVTrackableBehavior_h

#include "SVTrackingBehavior.h"

class SVARTrackable;
class SVARAnchor;
class SVNode;

/*
 Binds a node to a trackable (plane, point, image or face): the node
 follows the trackable's center pose while it is tracking, and is only
 visible while the trackable is in one of the visible tracking states.
 */
class SVTrackableBehavior : public SVTrackingBehavior {
public:

    SVTrackableBehavior(std::shared_ptr<SVARTrackable> trackable = nullptr,
                        SVTrackingSettings settings = SVTrackingSettings());
    virtual ~SVTrackableBehavior() {}

    SVTrackingBehaviorType getType() const {
        return SVTrackingBehaviorType::Trackable;
    }

    const std::shared_ptr<SVARTrackable> &getTrackable() const {
        return _trackable;
    }

    /*
     Replace the bound trackable. If it changed, tracking state and pose are
     re-derived from the new trackable immediately.
     */
    void setTrackable(std::shared_ptr<SVARTrackable> trackable);

    /*
     Tracking state of the bound trackable as of the last update. Stopped
     when no trackable is bound.
     */
    SVARTrackingState getTrackingState() const {
        return _trackingState;
    }

    const std::set<SVARTrackingState> &getVisibleTrackingStates() const {
        return _visibleTrackingStates;
    }
    void setVisibleTrackingStates(std::set<SVARTrackingState> states);

    bool isVisible() const;

    /*
     Pin a new anchor to the trackable at the node's current pose. Fails
     with ErrorNotTracking unless the trackable is tracking; other causes
     are reported by the trackable.
     */
    std::shared_ptr<SVARAnchor> createAnchor(SVARAnchorAcquireStatus *outStatus);

    /*
     Create a new node anchored to the trackable at this node's pose.
     Returns nullptr and writes the cause to outStatus on failure.
     */
    std::shared_ptr<SVNode> createAnchoredNode(SVARAnchorAcquireStatus *outStatus);

    void onARFrame(SVNode &node, const SVARFrameContext &context);

private:

    std::shared_ptr<SVARTrackable> _trackable;
    SVARTrackingState _trackingState;
    std::set<SVARTrackingState> _visibleTrackingStates;

    void updateFromTrackable();
    void setTrackingState(SVARTrackingState state);

};

#endif /* SVTrackableBehavior_h */
