//
//  SVARFrameARCore.cpp
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

#include "SVARFrameARCore.h"
#include "SVARCameraARCore.h"
#include "SVARHitTestResultARCore.h"
#include "SVARTrackableARCore.h"
#include "SVARUtilsARCore.h"
#include "SVLog.h"

static bool kDebugHitTest = false;

SVARFrameARCore::SVARFrameARCore(std::shared_ptr<arcore::Frame> frame, std::shared_ptr<arcore::Session> session) :
    _frame(frame),
    _session(session) {

    _timestampNs = _frame->getTimestampNs();
    _camera = std::make_shared<SVARCameraARCore>(_frame.get(), _session);

    std::unique_ptr<arcore::TrackableList> trackableList(_session->createTrackableList());
    _frame->getUpdatedTrackables(trackableList.get());

    int listSize = trackableList->size();
    for (int i = 0; i < listSize; i++) {
        std::shared_ptr<SVARTrackable> trackable = SVCreateTrackableARCore(trackableList->acquireItem(i), _session,
                                                                           SVPose::identity());
        if (trackable) {
            _updatedTrackables.push_back(trackable);
        }
    }
}

SVARFrameARCore::~SVARFrameARCore() {

}

std::vector<std::shared_ptr<SVARHitTestResult>> SVARFrameARCore::hitTest(float x, float y) {
    std::unique_ptr<arcore::HitResultList> hitResultList(_session->createHitResultList());
    _frame->hitTest(x, y, hitResultList.get());
    return convertHitResults(hitResultList.get());
}

std::vector<std::shared_ptr<SVARHitTestResult>> SVARFrameARCore::hitTestInstantPlacement(float x, float y,
                                                                                          float approximateDistance) {
    std::unique_ptr<arcore::HitResultList> hitResultList(_session->createHitResultList());
    _frame->hitTestInstantPlacement(x, y, approximateDistance, hitResultList.get());
    return convertHitResults(hitResultList.get());
}

std::vector<std::shared_ptr<SVARHitTestResult>> SVARFrameARCore::convertHitResults(arcore::HitResultList *hitResultList) {
    int listSize = hitResultList->size();
    std::vector<std::shared_ptr<SVARHitTestResult>> toReturn;

    for (int i = 0; i < listSize; i++) {
        std::shared_ptr<arcore::HitResult> hitResult = std::shared_ptr<arcore::HitResult>(_session->createHitResult());
        hitResultList->getItem(i, hitResult.get());

        std::unique_ptr<arcore::Pose> pose(_session->createPose());
        hitResult->getPose(pose.get());
        SVPose hitPose = SVConvertPose(pose.get());

        // Results without a trackable are kept: they still carry a pose and
        // can be anchored through the hit result
        std::shared_ptr<SVARTrackable> trackable = SVCreateTrackableARCore(hitResult->acquireTrackable(), _session,
                                                                           hitPose);
        float distance = hitResult->getDistance();
        toReturn.push_back(std::make_shared<SVARHitTestResultARCore>(trackable, hitPose, distance,
                                                                     hitResult, _session));
    }

    if (kDebugHitTest) {
        pinfo("Hit test returned %d results", listSize);
    }
    return toReturn;
}
