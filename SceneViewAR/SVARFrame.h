//
//  SVARFrame.h
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

#ifndef SVARFrame_h
#define SVARFrame_h

#include <stdint.h>
#include <memory>
#include <vector>

class SVARCamera;
class SVARTrackable;
class SVARHitTestResult;
struct SVARHitTestFilter;

/*
 The continual output of an SVARSession. Each frame carries the camera,
 the trackables updated since the previous frame, and access to hit tests
 against the world as seen in this frame.
 */
class SVARFrame {
public:

    SVARFrame() {}
    virtual ~SVARFrame() {}

    /*
     Get the timestamp, in nanoseconds.
     */
    virtual int64_t getTimestampNs() const = 0;

    /*
     Get the timestamp, in seconds.
     */
    double getTimestamp() const {
        return getTimestampNs() / 1e9;
    }

    virtual const std::shared_ptr<SVARCamera> &getCamera() const = 0;

    /*
     Perform a hit test on the given point in the viewport. The coordinate
     system is viewport pixels. Results are ordered nearest first.
     */
    virtual std::vector<std::shared_ptr<SVARHitTestResult>> hitTest(float x, float y) = 0;

    /*
     Perform an instant placement hit test on the given viewport point,
     creating a point at approximateDistance meters when nothing better is
     known.
     */
    virtual std::vector<std::shared_ptr<SVARHitTestResult>> hitTestInstantPlacement(float x, float y,
                                                                                     float approximateDistance) = 0;

    /*
     The trackables whose state or pose changed in this frame.
     */
    virtual const std::vector<std::shared_ptr<SVARTrackable>> &getUpdatedTrackables() const = 0;

    /*
     Hit test the viewport point against the enabled features. Plane and
     depth results are gathered first; an instant placement hit test runs
     only if those produced nothing. Returns nothing while the camera is not
     tracking.
     */
    std::vector<std::shared_ptr<SVARHitTestResult>> hitTests(float x, float y,
                                                             bool plane, bool depth, bool instantPlacement,
                                                             float approximateDistance);

    /*
     The first result of hitTests() that is usable for placement, or nullptr.
     */
    std::shared_ptr<SVARHitTestResult> findHitResult(float x, float y,
                                                     bool plane, bool depth, bool instantPlacement,
                                                     float approximateDistance);

    /*
     The first result of hitTests() that passes the given filter, or
     nullptr. The filter's enabled kinds decide which hit tests run.
     */
    std::shared_ptr<SVARHitTestResult> findHitResult(float x, float y, const SVARHitTestFilter &filter,
                                                     float approximateDistance);

    bool hasUpdatedTrackable(const std::shared_ptr<SVARTrackable> &trackable) const;

    /*
     Seconds elapsed since the given frame. With no previous frame the
     interval is measured from time zero.
     */
    double intervalSeconds(const SVARFrame *previous) const;

    /*
     Frame rate implied by the interval since the given frame.
     */
    double fps(const SVARFrame *previous) const;

};

#endif /* SVARFrame_h */
