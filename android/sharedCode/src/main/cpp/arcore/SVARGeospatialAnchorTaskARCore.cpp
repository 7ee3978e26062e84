//
//  SVARGeospatialAnchorTaskARCore.cpp
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

#include "SVARGeospatialAnchorTaskARCore.h"
#include "SVARAnchorARCore.h"
#include "SVLog.h"

static SVGeospatialAnchorResolveState convertResolveState(arcore::ResolveAnchorState state) {
    switch (state) {
        case arcore::ResolveAnchorState::Success:
            return SVGeospatialAnchorResolveState::Success;
        case arcore::ResolveAnchorState::ErrorNotAuthorized:
            return SVGeospatialAnchorResolveState::ErrorNotAuthorized;
        case arcore::ResolveAnchorState::ErrorUnsupportedLocation:
            return SVGeospatialAnchorResolveState::ErrorUnsupportedLocation;
        case arcore::ResolveAnchorState::None:
            return SVGeospatialAnchorResolveState::None;
        default:
            return SVGeospatialAnchorResolveState::ErrorInternal;
    }
}

SVARGeospatialAnchorTaskARCore::SVARGeospatialAnchorTaskARCore(SVARAnchorTaskType type,
                                                               std::unique_ptr<arcore::ResolveAnchorFuture> future,
                                                               std::shared_ptr<arcore::Session> session) :
    _type(type),
    _future(std::move(future)),
    _session(session),
    _state(SVARAnchorTaskState::InProgress),
    _resolveState(SVGeospatialAnchorResolveState::TaskInProgress) {
}

SVARGeospatialAnchorTaskARCore::~SVARGeospatialAnchorTaskARCore() {
    if (_state == SVARAnchorTaskState::InProgress) {
        _future->cancel();
    }
}

SVARAnchorTaskState SVARGeospatialAnchorTaskARCore::getState() {
    if (_state != SVARAnchorTaskState::InProgress) {
        return _state;
    }

    switch (_future->getState()) {
        case arcore::FutureState::Pending:
            break;
        case arcore::FutureState::Cancelled:
            _state = SVARAnchorTaskState::Cancelled;
            break;
        case arcore::FutureState::Done: {
            _resolveState = convertResolveState(_future->getResultState());
            if (_resolveState != SVGeospatialAnchorResolveState::Success) {
                pwarn("%s failed [state %s]", SVARAnchorTaskTypeToString(_type).c_str(),
                      SVGeospatialAnchorResolveStateToString(_resolveState).c_str());
                _state = SVARAnchorTaskState::Failed;
                break;
            }

            arcore::Anchor *anchor = _future->acquireResultAnchor();
            if (!anchor) {
                perr("%s succeeded without an anchor", SVARAnchorTaskTypeToString(_type).c_str());
                _state = SVARAnchorTaskState::Failed;
                break;
            }
            _anchor = std::make_shared<SVARAnchorARCore>(std::shared_ptr<arcore::Anchor>(anchor), _session);
            _state = SVARAnchorTaskState::Success;
            break;
        }
    }
    return _state;
}

void SVARGeospatialAnchorTaskARCore::cancel() {
    if (_state != SVARAnchorTaskState::InProgress) {
        return;
    }
    _future->cancel();
    _state = SVARAnchorTaskState::Cancelled;
}
