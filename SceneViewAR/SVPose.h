//
//  SVPose.h
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

#ifndef SVPose_h
#define SVPose_h

#include <string>
#include "SVVector3f.h"
#include "SVQuaternion.h"
#include "SVMatrix4f.h"

/*
 A rigid real-world transform (position and orientation) reported by the
 tracking subsystem for the camera, a trackable, an anchor or a hit result.
 Poses are immutable snapshots; a new one arrives every frame.
 */
class SVPose {
public:

    static SVPose identity() {
        return SVPose();
    }

    /*
     Build a pose from ARCore's raw pose layout: the rotation quaternion
     (qx, qy, qz, qw) followed by the translation (tx, ty, tz).
     */
    static SVPose fromRaw(const float *raw);

    /*
     Build a pose from a rigid, column-major transform. Any scale in the
     matrix is discarded.
     */
    static SVPose fromMatrix(const SVMatrix4f &matrix);

    SVPose() {}
    SVPose(SVVector3f position, SVQuaternion rotation) :
        _position(position),
        _rotation(rotation) {}

    const SVVector3f &getPosition() const {
        return _position;
    }
    const SVQuaternion &getRotation() const {
        return _rotation;
    }

    /*
     Write the pose back into the raw 7 float layout used by fromRaw.
     */
    void toRaw(float *outRaw) const;
    SVMatrix4f toMatrix() const;

    /*
     The pose that results from applying the given pose in this pose's
     local frame (this * other).
     */
    SVPose compose(const SVPose &other) const;
    SVPose inverse() const;

    SVVector3f transformPoint(const SVVector3f &point) const;

    /*
     Axes of this pose expressed in world space.
     */
    SVVector3f getXAxis() const;
    SVVector3f getYAxis() const;
    SVVector3f getZAxis() const;

    /*
     Signed distance from the plane through this pose (normal along the
     pose's +Y axis) to the position of the given camera pose. Positive when
     the camera is on the side the plane faces.
     */
    float distanceToPlane(const SVPose &cameraPose) const;

    /*
     Equality within float tolerance on both position and rotation.
     */
    bool isEqual(const SVPose &other, float epsilon = 0.00001f) const;

    bool operator==(const SVPose &other) const {
        return _position == other._position && _rotation == other._rotation;
    }
    bool operator!=(const SVPose &other) const {
        return !(*this == other);
    }

    std::string toString() const;

private:

    SVVector3f _position;
    SVQuaternion _rotation;

};

#endif /* SVPose_h */
