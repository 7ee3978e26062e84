//
//  SVPose.cpp
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

#include "SVPose.h"
#include <sstream>

SVPose SVPose::fromRaw(const float *raw) {
    return SVPose(SVVector3f(raw[4], raw[5], raw[6]),
                  SVQuaternion(raw[0], raw[1], raw[2], raw[3]).normalize());
}

SVPose SVPose::fromMatrix(const SVMatrix4f &matrix) {
    SVVector3f scale = matrix.extractScale();
    return SVPose(matrix.extractTranslation(), matrix.extractRotation(scale));
}

void SVPose::toRaw(float *outRaw) const {
    outRaw[0] = _rotation.X;
    outRaw[1] = _rotation.Y;
    outRaw[2] = _rotation.Z;
    outRaw[3] = _rotation.W;
    outRaw[4] = _position.x;
    outRaw[5] = _position.y;
    outRaw[6] = _position.z;
}

SVMatrix4f SVPose::toMatrix() const {
    return SVMatrix4f::fromTRS(_position, _rotation, SVVector3f(1, 1, 1));
}

SVPose SVPose::compose(const SVPose &other) const {
    return SVPose(_position + _rotation.rotate(other._position),
                  (_rotation * other._rotation).normalize());
}

SVPose SVPose::inverse() const {
    SVQuaternion inverseRotation = _rotation.inverse();
    return SVPose(-inverseRotation.rotate(_position), inverseRotation);
}

SVVector3f SVPose::transformPoint(const SVVector3f &point) const {
    return _position + _rotation.rotate(point);
}

SVVector3f SVPose::getXAxis() const {
    return _rotation.rotate(SVVector3f(1, 0, 0));
}

SVVector3f SVPose::getYAxis() const {
    return _rotation.rotate(SVVector3f(0, 1, 0));
}

SVVector3f SVPose::getZAxis() const {
    return _rotation.rotate(SVVector3f(0, 0, 1));
}

float SVPose::distanceToPlane(const SVPose &cameraPose) const {
    SVVector3f normal = getYAxis();
    return (cameraPose.getPosition() - _position).dot(normal);
}

bool SVPose::isEqual(const SVPose &other, float epsilon) const {
    return _position.isEqual(other._position, epsilon) &&
           _rotation.isEqual(other._rotation, epsilon);
}

std::string SVPose::toString() const {
    std::stringstream ss;
    ss << "[position: " << _position.toString() << ", rotation: " << _rotation.toString() << "]";
    return ss.str();
}
