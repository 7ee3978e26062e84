//
//  SVVector3f.h
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

#ifndef SVVECTOR3F_H_
#define SVVECTOR3F_H_

#include <math.h>
#include <string>

class SVVector3f {
public:
    float x;
    float y;
    float z;

    SVVector3f() noexcept : x(0), y(0), z(0) {}
    SVVector3f(float x, float y, float z) : x(x), y(y), z(z) {}

    SVVector3f &operator*=(const float multiplier) {
        x *= multiplier;
        y *= multiplier;
        z *= multiplier;
        return *this;
    }

    SVVector3f &operator+=(const SVVector3f &rhs) {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }

    SVVector3f &operator-=(const SVVector3f &rhs) {
        x -= rhs.x;
        y -= rhs.y;
        z -= rhs.z;
        return *this;
    }

    SVVector3f operator+(const SVVector3f &vec) const {
        SVVector3f result = *this;
        result += vec;
        return result;
    }

    SVVector3f operator-(const SVVector3f &vec) const {
        SVVector3f result = *this;
        result -= vec;
        return result;
    }

    SVVector3f operator*(const float multiplier) const {
        SVVector3f result = *this;
        result *= multiplier;
        return result;
    }

    SVVector3f operator-() const {
        return SVVector3f(-x, -y, -z);
    }

    bool operator==(const SVVector3f &rhs) const {
        return x == rhs.x && y == rhs.y && z == rhs.z;
    }

    bool operator!=(const SVVector3f &rhs) const {
        return !(*this == rhs);
    }

    /*
     Equality within the given tolerance on each component.
     */
    bool isEqual(const SVVector3f &other, float epsilon = 0.00001f) const;

    float dot(const SVVector3f &vB) const;
    SVVector3f cross(const SVVector3f &vB) const;
    float magnitude() const;
    float distance(const SVVector3f &vB) const;
    SVVector3f normalize() const;

    /*
     Linear interpolation between this vector and the given vector, with
     t in [0, 1].
     */
    SVVector3f interpolate(const SVVector3f &other, float t) const;

    std::string toString() const;
};

#endif /* SVVECTOR3F_H_ */
