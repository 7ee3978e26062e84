//
//  SVVector2f.h
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

#ifndef SVVECTOR2F_H_
#define SVVECTOR2F_H_

#include <math.h>
#include <string>

/*
 Two component vector, used for screen-space points in viewport pixels.
 */
class SVVector2f {
public:
    float x;
    float y;

    SVVector2f() noexcept : x(0), y(0) {}
    SVVector2f(float x, float y) : x(x), y(y) {}

    /*
     Convert a normalized placement point to viewport pixels. The normalized
     point ranges from -1 to 1 on both axes with +Y pointing up, while pixel
     Y grows downward from the top-left corner, so Y is inverted here.
     */
    static SVVector2f fromNormalized(float nx, float ny, int viewportWidth, int viewportHeight) {
        return SVVector2f(viewportWidth  / 2.0f * (1.0f + nx),
                          viewportHeight / 2.0f * (1.0f - ny));
    }

    SVVector2f operator+(const SVVector2f &vec) const {
        return SVVector2f(x + vec.x, y + vec.y);
    }

    SVVector2f operator-(const SVVector2f &vec) const {
        return SVVector2f(x - vec.x, y - vec.y);
    }

    bool operator==(const SVVector2f &rhs) const {
        return x == rhs.x && y == rhs.y;
    }

    bool operator!=(const SVVector2f &rhs) const {
        return !(*this == rhs);
    }

    float distance(const SVVector2f &to) const {
        float dx = to.x - x;
        float dy = to.y - y;
        return sqrtf(dx * dx + dy * dy);
    }

    std::string toString() const {
        return "[" + std::to_string(x) + ", " + std::to_string(y) + "]";
    }
};

#endif /* SVVECTOR2F_H_ */
