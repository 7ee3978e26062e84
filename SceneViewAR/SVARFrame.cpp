//
//  SVARFrame.cpp
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

#include "SVARFrame.h"
#include "SVARCamera.h"
#include "SVARHitTestResult.h"
#include "SVARPlane.h"
#include "SVARPoint.h"

std::vector<std::shared_ptr<SVARHitTestResult>> SVARFrame::hitTests(float x, float y,
                                                                    bool plane, bool depth, bool instantPlacement,
                                                                    float approximateDistance) {
    const std::shared_ptr<SVARCamera> &camera = getCamera();
    if (!camera || camera->getTrackingState() != SVARTrackingState::Tracking) {
        return {};
    }
    if (plane || depth) {
        std::vector<std::shared_ptr<SVARHitTestResult>> results = hitTest(x, y);
        if (!results.empty()) {
            return results;
        }
    }
    if (instantPlacement) {
        return hitTestInstantPlacement(x, y, approximateDistance);
    }
    return {};
}

std::shared_ptr<SVARHitTestResult> SVARFrame::findHitResult(float x, float y,
                                                            bool plane, bool depth, bool instantPlacement,
                                                            float approximateDistance) {
    return findHitResult(x, y, SVARHitTestFilter::forFeatures(plane, depth, instantPlacement),
                         approximateDistance);
}

std::shared_ptr<SVARHitTestResult> SVARFrame::findHitResult(float x, float y, const SVARHitTestFilter &filter,
                                                            float approximateDistance) {
    std::vector<std::shared_ptr<SVARHitTestResult>> results = hitTests(x, y,
                                                                       filter.isPlaneEnabled(),
                                                                       filter.isDepthEnabled(),
                                                                       filter.instantPlacementPoint,
                                                                       approximateDistance);
    if (results.empty()) {
        return nullptr;
    }
    SVPose cameraPose = getCamera()->getPose();

    for (std::shared_ptr<SVARHitTestResult> &result : results) {
        if (result->isValid(filter, cameraPose)) {
            return result;
        }
    }
    return nullptr;
}

bool SVARFrame::hasUpdatedTrackable(const std::shared_ptr<SVARTrackable> &trackable) const {
    if (!trackable) {
        return false;
    }
    for (const std::shared_ptr<SVARTrackable> &updated : getUpdatedTrackables()) {
        if (updated == trackable || updated->isSameTrackable(*trackable)) {
            return true;
        }
    }
    return false;
}

double SVARFrame::intervalSeconds(const SVARFrame *previous) const {
    int64_t previousTimestamp = previous ? previous->getTimestampNs() : 0;
    return (getTimestampNs() - previousTimestamp) / 1e9;
}

double SVARFrame::fps(const SVARFrame *previous) const {
    double interval = intervalSeconds(previous);
    if (interval <= 0) {
        return 0;
    }
    return 1.0 / interval;
}
