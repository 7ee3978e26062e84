//
//  SVARHitTestResultARCore.h
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

#ifndef SVARHitTestResultARCore_h
#define SVARHitTestResultARCore_h

#include <memory>
#include "SVARHitTestResult.h"
#include "ARCore_API.h"

/*
 Hit test result that keeps the ARCore hit result alive, so that anchors
 are created through ARCore's hit result API rather than on the trackable.
 */
class SVARHitTestResultARCore : public SVARHitTestResult {
public:

    SVARHitTestResultARCore(std::shared_ptr<SVARTrackable> trackable, SVPose hitPose, float distance,
                            std::shared_ptr<arcore::HitResult> hitResult,
                            std::shared_ptr<arcore::Session> session) :
        SVARHitTestResult(trackable, hitPose, distance),
        _hitResult(hitResult),
        _session(session) {}
    virtual ~SVARHitTestResultARCore() {}

    std::shared_ptr<SVARAnchor> createAnchor(SVARAnchorAcquireStatus *outStatus);

private:

    std::shared_ptr<arcore::HitResult> _hitResult;
    std::shared_ptr<arcore::Session> _session;

};

#endif /* SVARHitTestResultARCore_h */
