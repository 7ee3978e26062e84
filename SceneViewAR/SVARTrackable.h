//
//  SVARTrackable.h
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

#ifndef SVARTrackable_h
#define SVARTrackable_h

#include <stdint.h>
#include <memory>
#include "SVPose.h"
#include "SVARTracking.h"

class SVARAnchor;

enum class SVARTrackableType {
    Plane,
    Point,
    DepthPoint,
    InstantPlacementPoint,
    AugmentedImage,
    AugmentedFace
};

/*
 A real-world feature detected by the tracking subsystem: a plane, point,
 image or face. Nodes hold trackables without owning the underlying
 feature, which the subsystem may stop tracking at any time.
 */
class SVARTrackable {
public:

    SVARTrackable() {}
    virtual ~SVARTrackable() {}

    /*
     Identity of the underlying feature. Two wrappers acquired on different
     frames for the same feature share a hash code.
     */
    virtual uint64_t getHashCode() const = 0;

    virtual SVARTrackableType getType() const = 0;
    virtual SVARTrackingState getTrackingState() const = 0;

    /*
     The pose of the center of the trackable, in world coordinates.
     */
    virtual SVPose getCenterPose() const = 0;

    /*
     Pin a new anchor to this trackable at the given world pose. On failure
     returns nullptr and writes the cause to outStatus.
     */
    virtual std::shared_ptr<SVARAnchor> acquireAnchor(const SVPose &pose,
                                                      SVARAnchorAcquireStatus *outStatus) = 0;

    bool isSameTrackable(const SVARTrackable &other) const {
        return getHashCode() == other.getHashCode();
    }

};

#endif /* SVARTrackable_h */
