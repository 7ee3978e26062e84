//
//  SVQuaternion.h
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

#ifndef SVQUATERNION_H_
#define SVQUATERNION_H_

#include <string>
#include "SVVector3f.h"

class SVMatrix4f;

/*
 Unit quaternion rotation. Components are public and follow the X, Y, Z, W
 ordering used by ARCore poses.
 */
class SVQuaternion {
public:
    float X;
    float Y;
    float Z;
    float W;

    SVQuaternion() noexcept : X(0), Y(0), Z(0), W(1) {}
    SVQuaternion(float x, float y, float z, float w) : X(x), Y(y), Z(z), W(w) {}

    /*
     Rotation of the given angle, in radians, around the given axis.
     */
    static SVQuaternion fromAngleAxis(float angle, const SVVector3f &axis);

    /*
     Rotation part of the given transform. The matrix is expected to be
     unscaled (a rigid transform).
     */
    static SVQuaternion fromMatrix(const SVMatrix4f &matrix);

    /*
     Spherical linear interpolation along the shortest arc, t in [0, 1].
     */
    static SVQuaternion slerp(const SVQuaternion &start, const SVQuaternion &end, float t);

    SVQuaternion operator*(const SVQuaternion &rhs) const;

    bool operator==(const SVQuaternion &rhs) const {
        return X == rhs.X && Y == rhs.Y && Z == rhs.Z && W == rhs.W;
    }
    bool operator!=(const SVQuaternion &rhs) const {
        return !(*this == rhs);
    }

    /*
     Equality within the given tolerance. A quaternion and its negation
     represent the same rotation and compare equal.
     */
    bool isEqual(const SVQuaternion &other, float epsilon = 0.00001f) const;

    float dot(const SVQuaternion &other) const;
    float norm() const;
    SVQuaternion normalize() const;
    SVQuaternion inverse() const;

    SVVector3f rotate(const SVVector3f &vector) const;
    SVMatrix4f getMatrix() const;

    std::string toString() const;
};

#endif /* SVQUATERNION_H_ */
