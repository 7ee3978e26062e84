//
//  SVARCamera.h
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

#ifndef SVARCamera_h
#define SVARCamera_h

#include "SVPose.h"
#include "SVARTracking.h"

/*
 The device camera as seen by the tracking subsystem for one frame.
 */
class SVARCamera {
public:

    SVARCamera() {}
    virtual ~SVARCamera() {}

    virtual SVARTrackingState getTrackingState() const = 0;

    /*
     The camera pose in world coordinates, oriented to the display.
     */
    virtual SVPose getPose() const = 0;

};

#endif /* SVARCamera_h */
