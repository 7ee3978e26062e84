//
//  SVARAnchorTask.h
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

#ifndef SVARAnchorTask_h
#define SVARAnchorTask_h

#include <memory>
#include <string>
#include "SVARAnchor.h"
#include "SVARTracking.h"
#include "SVGeospatial.h"

enum class SVARAnchorTaskType {
    HostCloudAnchor,
    ResolveCloudAnchor,
    ResolveTerrainAnchor,
    ResolveRooftopAnchor
};

enum class SVARAnchorTaskState {
    InProgress,
    Success,
    Failed,
    Cancelled
};

inline std::string SVARAnchorTaskTypeToString(SVARAnchorTaskType type) {
    switch (type) {
        case SVARAnchorTaskType::HostCloudAnchor: return "HOST_CLOUD_ANCHOR";
        case SVARAnchorTaskType::ResolveCloudAnchor: return "RESOLVE_CLOUD_ANCHOR";
        case SVARAnchorTaskType::ResolveTerrainAnchor: return "RESOLVE_TERRAIN_ANCHOR";
        case SVARAnchorTaskType::ResolveRooftopAnchor: return "RESOLVE_ROOFTOP_ANCHOR";
    }
    return "UNKNOWN";
}

/*
 An asynchronous anchor operation (cloud host or resolve, terrain or
 rooftop resolve) started on the session. Tasks are polled once per frame
 from the render thread; nothing completes behind the caller's back.
 */
class SVARAnchorTask {
public:

    SVARAnchorTask() {}
    virtual ~SVARAnchorTask() {}

    virtual SVARAnchorTaskType getType() const = 0;

    /*
     Poll the operation. Once a terminal state is returned it does not
     change again.
     */
    virtual SVARAnchorTaskState getState() = 0;

    /*
     The anchor produced by the operation. Cloud tasks expose the anchor
     being hosted or resolved from the start; geospatial tasks only once
     they succeed.
     */
    virtual std::shared_ptr<SVARAnchor> getAnchor() const = 0;

    /*
     Cloud identifier for cloud tasks, empty otherwise or until hosting
     succeeds.
     */
    virtual std::string getCloudAnchorId() const {
        return "";
    }

    /*
     Cancel the native operation. The anchor, if any, is not detached here;
     that is left to the owner of the task.
     */
    virtual void cancel() = 0;

    bool isDone() {
        return getState() != SVARAnchorTaskState::InProgress;
    }
    bool isSuccessful() {
        return getState() == SVARAnchorTaskState::Success;
    }

};

/*
 Cloud host and resolve tasks share one model: the session hands back an
 anchor immediately, and the anchor's cloud state reports progress until it
 reaches success or an error.
 */
class SVARCloudAnchorTask : public SVARAnchorTask {
public:

    SVARCloudAnchorTask(SVARAnchorTaskType type, std::shared_ptr<SVARAnchor> anchor) :
        _type(type), _anchor(anchor), _cancelled(false) {}
    virtual ~SVARCloudAnchorTask() {}

    SVARAnchorTaskType getType() const {
        return _type;
    }

    SVARAnchorTaskState getState() {
        if (_cancelled) {
            return SVARAnchorTaskState::Cancelled;
        }
        SVARCloudAnchorState state = _anchor->getCloudAnchorState();
        if (state == SVARCloudAnchorState::Success) {
            return SVARAnchorTaskState::Success;
        }
        else if (SVARCloudAnchorStateIsError(state)) {
            return SVARAnchorTaskState::Failed;
        }
        return SVARAnchorTaskState::InProgress;
    }

    std::shared_ptr<SVARAnchor> getAnchor() const {
        return _anchor;
    }

    std::string getCloudAnchorId() const {
        return _anchor->getCloudAnchorId();
    }

    SVARCloudAnchorState getCloudAnchorState() const {
        return _anchor->getCloudAnchorState();
    }

    /*
     The legacy cloud API has no cancel call: the operation stops when the
     anchor is detached.
     */
    void cancel() {
        _cancelled = true;
    }

private:

    SVARAnchorTaskType _type;
    std::shared_ptr<SVARAnchor> _anchor;
    bool _cancelled;

};

#endif /* SVARAnchorTask_h */
