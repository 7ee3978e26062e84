//
//  SVQuaternion.cpp
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

#include "SVQuaternion.h"
#include "SVMatrix4f.h"
#include <math.h>
#include <sstream>

// Below this dot product the slerp falls back to a normalized lerp
static const float kSlerpLinearThreshold = 0.9995f;

SVQuaternion SVQuaternion::fromAngleAxis(float angle, const SVVector3f &axis) {
    SVVector3f n = axis.normalize();
    float s = sinf(angle / 2.0f);
    return SVQuaternion(n.x * s, n.y * s, n.z * s, cosf(angle / 2.0f));
}

SVQuaternion SVQuaternion::fromMatrix(const SVMatrix4f &matrix) {
    // Column-major: m[col * 4 + row]
    const float *m = matrix.getArray();
    float m00 = m[0], m01 = m[4], m02 = m[8];
    float m10 = m[1], m11 = m[5], m12 = m[9];
    float m20 = m[2], m21 = m[6], m22 = m[10];

    float trace = m00 + m11 + m22;
    SVQuaternion q;
    if (trace > 0) {
        float s = sqrtf(trace + 1.0f) * 2.0f;
        q.W = 0.25f * s;
        q.X = (m21 - m12) / s;
        q.Y = (m02 - m20) / s;
        q.Z = (m10 - m01) / s;
    } else if (m00 > m11 && m00 > m22) {
        float s = sqrtf(1.0f + m00 - m11 - m22) * 2.0f;
        q.W = (m21 - m12) / s;
        q.X = 0.25f * s;
        q.Y = (m01 + m10) / s;
        q.Z = (m02 + m20) / s;
    } else if (m11 > m22) {
        float s = sqrtf(1.0f + m11 - m00 - m22) * 2.0f;
        q.W = (m02 - m20) / s;
        q.X = (m01 + m10) / s;
        q.Y = 0.25f * s;
        q.Z = (m12 + m21) / s;
    } else {
        float s = sqrtf(1.0f + m22 - m00 - m11) * 2.0f;
        q.W = (m10 - m01) / s;
        q.X = (m02 + m20) / s;
        q.Y = (m12 + m21) / s;
        q.Z = 0.25f * s;
    }
    return q.normalize();
}

SVQuaternion SVQuaternion::slerp(const SVQuaternion &start, const SVQuaternion &end, float t) {
    SVQuaternion target = end;
    float cosTheta = start.dot(end);

    // Take the shortest arc
    if (cosTheta < 0) {
        target = SVQuaternion(-end.X, -end.Y, -end.Z, -end.W);
        cosTheta = -cosTheta;
    }

    if (cosTheta > kSlerpLinearThreshold) {
        return SVQuaternion(start.X + (target.X - start.X) * t,
                            start.Y + (target.Y - start.Y) * t,
                            start.Z + (target.Z - start.Z) * t,
                            start.W + (target.W - start.W) * t).normalize();
    }

    float theta = acosf(cosTheta);
    float sinTheta = sinf(theta);
    float a = sinf((1.0f - t) * theta) / sinTheta;
    float b = sinf(t * theta) / sinTheta;

    return SVQuaternion(start.X * a + target.X * b,
                        start.Y * a + target.Y * b,
                        start.Z * a + target.Z * b,
                        start.W * a + target.W * b);
}

SVQuaternion SVQuaternion::operator*(const SVQuaternion &rhs) const {
    return SVQuaternion(W * rhs.X + X * rhs.W + Y * rhs.Z - Z * rhs.Y,
                        W * rhs.Y - X * rhs.Z + Y * rhs.W + Z * rhs.X,
                        W * rhs.Z + X * rhs.Y - Y * rhs.X + Z * rhs.W,
                        W * rhs.W - X * rhs.X - Y * rhs.Y - Z * rhs.Z);
}

bool SVQuaternion::isEqual(const SVQuaternion &other, float epsilon) const {
    return fabs(fabs(dot(other)) - 1.0f) <= epsilon;
}

float SVQuaternion::dot(const SVQuaternion &other) const {
    return X * other.X + Y * other.Y + Z * other.Z + W * other.W;
}

float SVQuaternion::norm() const {
    return sqrtf(dot(*this));
}

SVQuaternion SVQuaternion::normalize() const {
    float n = norm();
    if (n == 0) {
        return SVQuaternion();
    }
    return SVQuaternion(X / n, Y / n, Z / n, W / n);
}

SVQuaternion SVQuaternion::inverse() const {
    float n2 = dot(*this);
    if (n2 == 0) {
        return SVQuaternion();
    }
    return SVQuaternion(-X / n2, -Y / n2, -Z / n2, W / n2);
}

SVVector3f SVQuaternion::rotate(const SVVector3f &v) const {
    SVVector3f u(X, Y, Z);
    SVVector3f t = u.cross(v) * 2.0f;
    return v + t * W + u.cross(t);
}

SVMatrix4f SVQuaternion::getMatrix() const {
    float xx = X * X, yy = Y * Y, zz = Z * Z;
    float xy = X * Y, xz = X * Z, yz = Y * Z;
    float wx = W * X, wy = W * Y, wz = W * Z;

    float m[16] = {
        1 - 2 * (yy + zz), 2 * (xy + wz),     2 * (xz - wy),     0,
        2 * (xy - wz),     1 - 2 * (xx + zz), 2 * (yz + wx),     0,
        2 * (xz + wy),     2 * (yz - wx),     1 - 2 * (xx + yy), 0,
        0,                 0,                 0,                 1
    };
    return SVMatrix4f(m);
}

std::string SVQuaternion::toString() const {
    std::stringstream ss;
    ss << "[x: " << X << ", y: " << Y << ", z: " << Z << ", w: " << W << "]";
    return ss.str();
}
