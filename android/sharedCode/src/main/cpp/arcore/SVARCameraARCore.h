//
//  SVARCameraARCore.h
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

#ifndef SVARCameraARCore_h
#define SVARCameraARCore_h

#include <memory>
#include "SVARCamera.h"
#include "ARCore_API.h"

/*
 Camera state of one ARCore frame. The tracking state and pose are read
 when the frame is created, so older frames keep the values they had.
 */
class SVARCameraARCore : public SVARCamera {
public:

    SVARCameraARCore(arcore::Frame *frame, std::shared_ptr<arcore::Session> session);
    virtual ~SVARCameraARCore() {}

    SVARTrackingState getTrackingState() const {
        return _trackingState;
    }
    SVPose getPose() const {
        return _pose;
    }

private:

    SVARTrackingState _trackingState;
    SVPose _pose;

};

#endif /* SVARCameraARCore_h */
