//
//  SVARGeospatialAnchorTaskARCore.h
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

#ifndef SVARGeospatialAnchorTaskARCore_h
#define SVARGeospatialAnchorTaskARCore_h

#include <memory>
#include "SVARAnchorTask.h"
#include "ARCore_API.h"

/*
 Terrain or rooftop anchor resolve, backed by an ARCore future that is
 polled from getState(). The anchor becomes available once the future
 completes successfully.
 */
class SVARGeospatialAnchorTaskARCore : public SVARAnchorTask {
public:

    SVARGeospatialAnchorTaskARCore(SVARAnchorTaskType type, std::unique_ptr<arcore::ResolveAnchorFuture> future,
                                   std::shared_ptr<arcore::Session> session);
    virtual ~SVARGeospatialAnchorTaskARCore();

    SVARAnchorTaskType getType() const {
        return _type;
    }
    SVARAnchorTaskState getState();
    std::shared_ptr<SVARAnchor> getAnchor() const {
        return _anchor;
    }
    void cancel();

    SVGeospatialAnchorResolveState getResolveState() const {
        return _resolveState;
    }

private:

    SVARAnchorTaskType _type;
    std::unique_ptr<arcore::ResolveAnchorFuture> _future;
    std::shared_ptr<arcore::Session> _session;
    std::shared_ptr<SVARAnchor> _anchor;
    SVARAnchorTaskState _state;
    SVGeospatialAnchorResolveState _resolveState;

};

#endif /* SVARGeospatialAnchorTaskARCore_h */
