//
//  SVVector3f.cpp
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

#include "SVVector3f.h"
#include <sstream>

bool SVVector3f::isEqual(const SVVector3f &other, float epsilon) const {
    return fabs(x - other.x) <= epsilon &&
           fabs(y - other.y) <= epsilon &&
           fabs(z - other.z) <= epsilon;
}

float SVVector3f::dot(const SVVector3f &vB) const {
    return x * vB.x + y * vB.y + z * vB.z;
}

SVVector3f SVVector3f::cross(const SVVector3f &vB) const {
    return SVVector3f(y * vB.z - z * vB.y,
                      z * vB.x - x * vB.z,
                      x * vB.y - y * vB.x);
}

float SVVector3f::magnitude() const {
    return sqrtf(x * x + y * y + z * z);
}

float SVVector3f::distance(const SVVector3f &vB) const {
    return (vB - *this).magnitude();
}

SVVector3f SVVector3f::normalize() const {
    float mag = magnitude();
    if (mag > 0) {
        return SVVector3f(x / mag, y / mag, z / mag);
    }
    return SVVector3f();
}

SVVector3f SVVector3f::interpolate(const SVVector3f &other, float t) const {
    return SVVector3f(x + (other.x - x) * t,
                      y + (other.y - y) * t,
                      z + (other.z - z) * t);
}

std::string SVVector3f::toString() const {
    std::stringstream ss;
    ss << "[x: " << x << ", y: " << y << ", z: " << z << "]";
    return ss.str();
}
