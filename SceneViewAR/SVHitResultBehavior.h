//
//  SVHitResultBehavior.h
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

#ifndef SVHitResultBehavior_h
#define SVHitResultBehavior_h

#include "SVTrackableBehavior.h"
#include "SVARHitTestResult.h"

/*
 Follows the surface under a fixed view location. Every frame, while
 updating is enabled, the behavior hit tests at (x, y) in view pixels
 through its filter and moves the node to the first accepted result. The
 hit trackable becomes the bound trackable, so tracking state and
 visibility follow it.
 */
class SVHitResultBehavior : public SVTrackableBehavior {
public:

    SVHitResultBehavior(float x, float y,
                        SVARHitTestFilter filter = SVARHitTestFilter::forFeatures(true, true, true),
                        float instantDistance = kDefaultPlacementDistance,
                        SVTrackingSettings settings = SVTrackingSettings());
    virtual ~SVHitResultBehavior() {}

    SVTrackingBehaviorType getType() const {
        return SVTrackingBehaviorType::HitResult;
    }

    float getX() const {
        return _x;
    }
    float getY() const {
        return _y;
    }
    void setLocation(float x, float y);

    const SVARHitTestFilter &getFilter() const {
        return _filter;
    }
    void setFilter(SVARHitTestFilter filter) {
        _filter = filter;
    }

    /*
     When false the node stays on the last hit result.
     */
    bool isUpdate() const {
        return _update;
    }
    void setUpdate(bool update) {
        _update = update;
    }

    const std::shared_ptr<SVARHitTestResult> &getHitResult() const {
        return _hitResult;
    }

    /*
     Store the result. A non-null result binds its trackable and moves the
     node to the hit pose. Delegates receive onHitResult in both cases.
     */
    void setHitResult(std::shared_ptr<SVARHitTestResult> hitResult);

    void onARFrame(SVNode &node, const SVARFrameContext &context);

private:

    float _x, _y;
    SVARHitTestFilter _filter;
    float _instantDistance;
    bool _update;
    std::shared_ptr<SVARHitTestResult> _hitResult;

};

#endif /* SVHitResultBehavior_h */
