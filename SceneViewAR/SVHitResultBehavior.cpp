//
//  SVHitResultBehavior.cpp
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

#include "SVHitResultBehavior.h"
#include "SVNode.h"
#include "SVNodeDelegate.h"
#include "SVARFrameContext.h"
#include "SVLog.h"

static bool kDebugHitResult = false;

SVHitResultBehavior::SVHitResultBehavior(float x, float y, SVARHitTestFilter filter, float instantDistance,
                                         SVTrackingSettings settings) :
    SVTrackableBehavior(nullptr, settings),
    _x(x), _y(y),
    _filter(filter),
    _instantDistance(instantDistance),
    _update(true) {
}

void SVHitResultBehavior::setLocation(float x, float y) {
    _x = x;
    _y = y;
}

void SVHitResultBehavior::setHitResult(std::shared_ptr<SVARHitTestResult> hitResult) {
    _hitResult = hitResult;
    if (hitResult) {
        setTrackable(hitResult->getTrackable());
        setPose(hitResult->getHitPose());
    }

    SVNode *node = getNode();
    if (node) {
        bool tracking = isTracking();
        dispatchToDelegates([node, hitResult, tracking](SVNodeDelegate &delegate) {
            delegate.onHitResult(*node, hitResult, tracking);
        });
    }
}

void SVHitResultBehavior::onARFrame(SVNode &node, const SVARFrameContext &context) {
    SVTrackableBehavior::onARFrame(node, context);
    if (!_update || !context.frame) {
        return;
    }

    std::shared_ptr<SVARHitTestResult> hitResult = context.frame->findHitResult(_x, _y, _filter, _instantDistance);
    if (kDebugHitResult && !hitResult) {
        pinfo("No hit result at [%f, %f]", _x, _y);
    }
    setHitResult(hitResult);
}
