//
//  SVARFrameARCore.h
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

#ifndef SVARFrameARCore_h
#define SVARFrameARCore_h

#include <memory>
#include <vector>
#include "SVARFrame.h"
#include "ARCore_API.h"

/*
 Frame produced by one ARCore session update. Each frame owns its own
 ARCore frame, so a previous frame stays readable after the next update.
 */
class SVARFrameARCore : public SVARFrame {
public:

    SVARFrameARCore(std::shared_ptr<arcore::Frame> frame, std::shared_ptr<arcore::Session> session);
    virtual ~SVARFrameARCore();

    int64_t getTimestampNs() const {
        return _timestampNs;
    }
    const std::shared_ptr<SVARCamera> &getCamera() const {
        return _camera;
    }

    std::vector<std::shared_ptr<SVARHitTestResult>> hitTest(float x, float y);
    std::vector<std::shared_ptr<SVARHitTestResult>> hitTestInstantPlacement(float x, float y,
                                                                             float approximateDistance);

    const std::vector<std::shared_ptr<SVARTrackable>> &getUpdatedTrackables() const {
        return _updatedTrackables;
    }

    arcore::Frame *getFrameInternal() {
        return _frame.get();
    }

private:

    std::shared_ptr<arcore::Frame> _frame;
    std::shared_ptr<arcore::Session> _session;
    std::shared_ptr<SVARCamera> _camera;
    int64_t _timestampNs;
    std::vector<std::shared_ptr<SVARTrackable>> _updatedTrackables;

    std::vector<std::shared_ptr<SVARHitTestResult>> convertHitResults(arcore::HitResultList *hitResultList);

};

#endif /* SVARFrameARCore_h */
