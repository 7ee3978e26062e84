//
//  SVARAnchor.h
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

#ifndef SVARAnchor_h
#define SVARAnchor_h

#include <string>
#include "SVPose.h"
#include "SVARTracking.h"

/*
 A fixed real-world pose pinned by the tracking subsystem. The subsystem
 owns the anchor; a node holds a reference to it and requests its release
 with detach(). After detach() the anchor stops tracking for good.
 */
class SVARAnchor {
public:

    SVARAnchor() {}
    virtual ~SVARAnchor() {}

    /*
     Unique identifier of the anchor within the session.
     */
    virtual std::string getId() const = 0;

    /*
     The latest pose of the anchor, in world coordinates.
     */
    virtual SVPose getPose() const = 0;

    virtual SVARTrackingState getTrackingState() const = 0;

    /*
     Cloud state of the anchor. Anchors that were never hosted or resolved
     report None.
     */
    virtual SVARCloudAnchorState getCloudAnchorState() const {
        return SVARCloudAnchorState::None;
    }

    /*
     The cloud identifier, empty until hosting succeeds.
     */
    virtual std::string getCloudAnchorId() const {
        return "";
    }

    /*
     Release the anchor. Pending cloud operations for this anchor are
     abandoned.
     */
    virtual void detach() = 0;

};

#endif /* SVARAnchor_h */
