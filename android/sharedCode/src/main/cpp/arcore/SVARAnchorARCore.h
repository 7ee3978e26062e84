//
//  SVARAnchorARCore.h
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

#ifndef SVARAnchorARCore_h
#define SVARAnchorARCore_h

#include <memory>
#include "SVARAnchor.h"
#include "ARCore_API.h"

/*
 SVARAnchor backed by an ARCore anchor. Pose and state are read from ARCore
 on demand, so they always reflect the latest session update.
 */
class SVARAnchorARCore : public SVARAnchor {
public:

    SVARAnchorARCore(std::shared_ptr<arcore::Anchor> anchor, std::shared_ptr<arcore::Session> session);
    virtual ~SVARAnchorARCore();

    std::string getId() const;
    SVPose getPose() const;
    SVARTrackingState getTrackingState() const;
    SVARCloudAnchorState getCloudAnchorState() const;
    std::string getCloudAnchorId() const;
    void detach();

    bool isDetached() const {
        return _detached;
    }

    const std::shared_ptr<arcore::Anchor> &getAnchorInternal() const {
        return _anchor;
    }

private:

    std::shared_ptr<arcore::Anchor> _anchor;
    std::shared_ptr<arcore::Session> _session;
    bool _detached;

};

#endif /* SVARAnchorARCore_h */
