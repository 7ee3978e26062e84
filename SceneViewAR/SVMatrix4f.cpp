//
//  SVMatrix4f.cpp
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

#include "SVMatrix4f.h"
#include "SVQuaternion.h"
#include <math.h>
#include <string.h>
#include <sstream>

static const float kIdentity[16] = { 1, 0, 0, 0,
                                     0, 1, 0, 0,
                                     0, 0, 1, 0,
                                     0, 0, 0, 1 };

SVMatrix4f SVMatrix4f::identity() {
    return SVMatrix4f(kIdentity);
}

SVMatrix4f::SVMatrix4f() noexcept {
    memcpy(_mtx, kIdentity, sizeof(_mtx));
}

SVMatrix4f::SVMatrix4f(const float *matrix) {
    memcpy(_mtx, matrix, sizeof(_mtx));
}

SVMatrix4f SVMatrix4f::fromTRS(const SVVector3f &translation, const SVQuaternion &rotation,
                               const SVVector3f &scale) {
    SVMatrix4f result = rotation.getMatrix();
    for (int i = 0; i < 3; i++) {
        result[0 + i] *= scale.x;
        result[4 + i] *= scale.y;
        result[8 + i] *= scale.z;
    }
    result[12] = translation.x;
    result[13] = translation.y;
    result[14] = translation.z;
    return result;
}

SVMatrix4f SVMatrix4f::multiply(const SVMatrix4f &matrix) const {
    float result[16];
    for (int col = 0; col < 4; col++) {
        for (int row = 0; row < 4; row++) {
            float sum = 0;
            for (int k = 0; k < 4; k++) {
                sum += _mtx[k * 4 + row] * matrix._mtx[col * 4 + k];
            }
            result[col * 4 + row] = sum;
        }
    }
    return SVMatrix4f(result);
}

SVVector3f SVMatrix4f::multiply(const SVVector3f &v) const {
    return SVVector3f(_mtx[0] * v.x + _mtx[4] * v.y + _mtx[8]  * v.z + _mtx[12],
                      _mtx[1] * v.x + _mtx[5] * v.y + _mtx[9]  * v.z + _mtx[13],
                      _mtx[2] * v.x + _mtx[6] * v.y + _mtx[10] * v.z + _mtx[14]);
}

SVMatrix4f SVMatrix4f::invert() const {
    const float *m = _mtx;
    float inv[16];

    inv[0] = m[5]  * m[10] * m[15] - m[5]  * m[11] * m[14] - m[9]  * m[6]  * m[15] +
             m[9]  * m[7]  * m[14] + m[13] * m[6]  * m[11] - m[13] * m[7]  * m[10];
    inv[4] = -m[4]  * m[10] * m[15] + m[4]  * m[11] * m[14] + m[8]  * m[6]  * m[15] -
              m[8]  * m[7]  * m[14] - m[12] * m[6]  * m[11] + m[12] * m[7]  * m[10];
    inv[8] = m[4]  * m[9] * m[15] - m[4]  * m[11] * m[13] - m[8]  * m[5] * m[15] +
             m[8]  * m[7] * m[13] + m[12] * m[5] * m[11] - m[12] * m[7] * m[9];
    inv[12] = -m[4]  * m[9] * m[14] + m[4]  * m[10] * m[13] + m[8]  * m[5] * m[14] -
               m[8]  * m[6] * m[13] - m[12] * m[5] * m[10] + m[12] * m[6] * m[9];
    inv[1] = -m[1]  * m[10] * m[15] + m[1]  * m[11] * m[14] + m[9]  * m[2] * m[15] -
              m[9]  * m[3] * m[14] - m[13] * m[2] * m[11] + m[13] * m[3] * m[10];
    inv[5] = m[0]  * m[10] * m[15] - m[0]  * m[11] * m[14] - m[8]  * m[2] * m[15] +
             m[8]  * m[3] * m[14] + m[12] * m[2] * m[11] - m[12] * m[3] * m[10];
    inv[9] = -m[0]  * m[9] * m[15] + m[0]  * m[11] * m[13] + m[8]  * m[1] * m[15] -
              m[8]  * m[3] * m[13] - m[12] * m[1] * m[11] + m[12] * m[3] * m[9];
    inv[13] = m[0]  * m[9] * m[14] - m[0]  * m[10] * m[13] - m[8]  * m[1] * m[14] +
              m[8]  * m[2] * m[13] + m[12] * m[1] * m[10] - m[12] * m[2] * m[9];
    inv[2] = m[1]  * m[6] * m[15] - m[1]  * m[7] * m[14] - m[5]  * m[2] * m[15] +
             m[5]  * m[3] * m[14] + m[13] * m[2] * m[7] - m[13] * m[3] * m[6];
    inv[6] = -m[0]  * m[6] * m[15] + m[0]  * m[7] * m[14] + m[4]  * m[2] * m[15] -
              m[4]  * m[3] * m[14] - m[12] * m[2] * m[7] + m[12] * m[3] * m[6];
    inv[10] = m[0]  * m[5] * m[15] - m[0]  * m[7] * m[13] - m[4]  * m[1] * m[15] +
              m[4]  * m[3] * m[13] + m[12] * m[1] * m[7] - m[12] * m[3] * m[5];
    inv[14] = -m[0]  * m[5] * m[14] + m[0]  * m[6] * m[13] + m[4]  * m[1] * m[14] -
               m[4]  * m[2] * m[13] - m[12] * m[1] * m[6] + m[12] * m[2] * m[5];
    inv[3] = -m[1] * m[6] * m[11] + m[1] * m[7] * m[10] + m[5] * m[2] * m[11] -
              m[5] * m[3] * m[10] - m[9] * m[2] * m[7] + m[9] * m[3] * m[6];
    inv[7] = m[0] * m[6] * m[11] - m[0] * m[7] * m[10] - m[4] * m[2] * m[11] +
             m[4] * m[3] * m[10] + m[8] * m[2] * m[7] - m[8] * m[3] * m[6];
    inv[11] = -m[0] * m[5] * m[11] + m[0] * m[7] * m[9] + m[4] * m[1] * m[11] -
               m[4] * m[3] * m[9] - m[8] * m[1] * m[7] + m[8] * m[3] * m[5];
    inv[15] = m[0] * m[5] * m[10] - m[0] * m[6] * m[9] - m[4] * m[1] * m[10] +
              m[4] * m[2] * m[9] + m[8] * m[1] * m[6] - m[8] * m[2] * m[5];

    float det = m[0] * inv[0] + m[1] * inv[4] + m[2] * inv[8] + m[3] * inv[12];
    if (det == 0) {
        return identity();
    }

    det = 1.0f / det;
    for (int i = 0; i < 16; i++) {
        inv[i] *= det;
    }
    return SVMatrix4f(inv);
}

SVVector3f SVMatrix4f::extractTranslation() const {
    return SVVector3f(_mtx[12], _mtx[13], _mtx[14]);
}

SVVector3f SVMatrix4f::extractScale() const {
    return SVVector3f(SVVector3f(_mtx[0], _mtx[1], _mtx[2]).magnitude(),
                      SVVector3f(_mtx[4], _mtx[5], _mtx[6]).magnitude(),
                      SVVector3f(_mtx[8], _mtx[9], _mtx[10]).magnitude());
}

SVQuaternion SVMatrix4f::extractRotation(const SVVector3f &scale) const {
    float rotation[16];
    memcpy(rotation, _mtx, sizeof(rotation));

    const float sx = scale.x != 0 ? scale.x : 1;
    const float sy = scale.y != 0 ? scale.y : 1;
    const float sz = scale.z != 0 ? scale.z : 1;
    for (int i = 0; i < 3; i++) {
        rotation[0 + i] /= sx;
        rotation[4 + i] /= sy;
        rotation[8 + i] /= sz;
    }
    rotation[12] = 0;
    rotation[13] = 0;
    rotation[14] = 0;
    return SVQuaternion::fromMatrix(SVMatrix4f(rotation));
}

bool SVMatrix4f::isEqual(const SVMatrix4f &other, float epsilon) const {
    for (int i = 0; i < 16; i++) {
        if (fabs(_mtx[i] - other._mtx[i]) > epsilon) {
            return false;
        }
    }
    return true;
}

std::string SVMatrix4f::toString() const {
    std::stringstream ss;
    for (int row = 0; row < 4; row++) {
        ss << "[" << _mtx[row] << ", " << _mtx[4 + row] << ", " << _mtx[8 + row] << ", "
           << _mtx[12 + row] << "]";
        if (row < 3) {
            ss << "\n";
        }
    }
    return ss.str();
}
