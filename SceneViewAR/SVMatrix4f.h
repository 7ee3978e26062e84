//
//  SVMatrix4f.h
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

#ifndef SVMATRIX4F_H_
#define SVMATRIX4F_H_

#include <string>
#include "SVVector3f.h"

class SVQuaternion;

/*
 4x4 matrix stored column-major, matching the layout ARCore writes from
 ArPose_getMatrix.
 */
class SVMatrix4f {
public:

    static SVMatrix4f identity();

    SVMatrix4f() noexcept;
    SVMatrix4f(const float *matrix);

    /*
     Rigid transform composed as translation * rotation * scale.
     */
    static SVMatrix4f fromTRS(const SVVector3f &translation, const SVQuaternion &rotation,
                              const SVVector3f &scale);

    float &operator[](int index) {
        return _mtx[index];
    }
    const float &operator[](int index) const {
        return _mtx[index];
    }

    const float *getArray() const {
        return _mtx;
    }

    SVMatrix4f multiply(const SVMatrix4f &matrix) const;
    SVVector3f multiply(const SVVector3f &vector) const;

    SVMatrix4f operator*(const SVMatrix4f &matrix) const {
        return multiply(matrix);
    }
    SVVector3f operator*(const SVVector3f &vector) const {
        return multiply(vector);
    }

    /*
     General inverse. Returns identity if the matrix is singular.
     */
    SVMatrix4f invert() const;

    SVVector3f extractTranslation() const;
    SVVector3f extractScale() const;

    /*
     Rotation with the given scale divided out of the basis vectors.
     */
    SVQuaternion extractRotation(const SVVector3f &scale) const;

    bool isEqual(const SVMatrix4f &other, float epsilon = 0.00001f) const;

    std::string toString() const;

private:

    float _mtx[16];

};

#endif /* SVMATRIX4F_H_ */
