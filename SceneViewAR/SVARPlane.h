//
//  SVARPlane.h
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

#ifndef SVARPlane_h
#define SVARPlane_h

#include <set>
#include "SVARTrackable.h"

enum class SVARPlaneType {
    HorizontalUpward,   // Floors, table tops
    HorizontalDownward, // Ceilings
    Vertical            // Walls
};

inline std::set<SVARPlaneType> SVARAllPlaneTypes() {
    return { SVARPlaneType::HorizontalUpward, SVARPlaneType::HorizontalDownward, SVARPlaneType::Vertical };
}

/*
 Trackable representing a planar surface.
 */
class SVARPlane : public SVARTrackable {
public:

    SVARPlane() {}
    virtual ~SVARPlane() {}

    SVARTrackableType getType() const {
        return SVARTrackableType::Plane;
    }

    virtual SVARPlaneType getPlaneType() const = 0;

    /*
     The width (X) and length (Z) of the plane's bounding rectangle, in
     meters.
     */
    virtual float getExtentX() const = 0;
    virtual float getExtentZ() const = 0;

    /*
     Whether the given pose, projected onto the plane, lies within the
     plane's bounding rectangle or boundary polygon respectively.
     */
    virtual bool isPoseInExtents(const SVPose &pose) const = 0;
    virtual bool isPoseInPolygon(const SVPose &pose) const = 0;

    /*
     The plane that merged this one, if any. Subsumed planes stop tracking.
     */
    virtual std::shared_ptr<SVARPlane> getSubsumedBy() const = 0;

};

#endif /* SVARPlane_h */
