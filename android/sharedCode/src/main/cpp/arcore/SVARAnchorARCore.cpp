//
//  SVARAnchorARCore.cpp
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

#include "SVARAnchorARCore.h"
#include "SVARUtilsARCore.h"
#include "SVLog.h"

SVARAnchorARCore::SVARAnchorARCore(std::shared_ptr<arcore::Anchor> anchor, std::shared_ptr<arcore::Session> session) :
    _anchor(anchor),
    _session(session),
    _detached(false) {
}

SVARAnchorARCore::~SVARAnchorARCore() {

}

std::string SVARAnchorARCore::getId() const {
    return std::to_string(_anchor->getId());
}

SVPose SVARAnchorARCore::getPose() const {
    std::unique_ptr<arcore::Pose> pose(_session->createPose());
    _anchor->getPose(pose.get());
    return SVConvertPose(pose.get());
}

SVARTrackingState SVARAnchorARCore::getTrackingState() const {
    if (_detached) {
        return SVARTrackingState::Stopped;
    }
    return SVConvertTrackingState(_anchor->getTrackingState());
}

SVARCloudAnchorState SVARAnchorARCore::getCloudAnchorState() const {
    return SVConvertCloudAnchorState(_anchor->getCloudAnchorState());
}

std::string SVARAnchorARCore::getCloudAnchorId() const {
    char *cloudAnchorId = nullptr;
    _anchor->acquireCloudAnchorId(&cloudAnchorId);
    if (cloudAnchorId == nullptr) {
        return "";
    }
    std::string id(cloudAnchorId);
    ArString_release(cloudAnchorId);
    return id;
}

void SVARAnchorARCore::detach() {
    if (_detached) {
        return;
    }
    pinfo("Detaching anchor %s", getId().c_str());
    _anchor->detach();
    _detached = true;
}
