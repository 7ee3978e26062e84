//
//  SVARScene.h
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

#ifndef SVARScene_h
#define SVARScene_h

#include <memory>
#include "SVARFrameContext.h"

class SVNode;
class SVARSession;
class SVARFrame;

/*
 Root of an AR scene graph bound to one session. Each rendering frame,
 onFrame() updates the session and walks the node hierarchy parent before
 child, running every node's tracking behavior against the new frame.
 */
class SVARScene {
public:

    SVARScene(std::shared_ptr<SVARSession> session);
    virtual ~SVARScene();

    const std::shared_ptr<SVARSession> &getSession() const {
        return _session;
    }
    const std::shared_ptr<SVNode> &getRootNode() const {
        return _rootNode;
    }

    /*
     Node whose transform follows the camera pose each frame. Its transform
     is locked: application code cannot move it.
     */
    const std::shared_ptr<SVNode> &getCameraNode() const {
        return _cameraNode;
    }

    void addNode(std::shared_ptr<SVNode> node);

    /*
     Invoke each rendering frame. Returns the new frame, or nullptr if the
     session produced none (e.g. while paused), in which case no node is
     updated.

     A node whose update throws is logged and skipped for this frame; the
     rest of the hierarchy, including its children, is still updated.
     */
    std::shared_ptr<SVARFrame> onFrame();

    /*
     The context of the last frame delivered to the nodes.
     */
    const SVARFrameContext &getLastFrameContext() const {
        return _lastContext;
    }

private:

    std::shared_ptr<SVARSession> _session;
    std::shared_ptr<SVNode> _rootNode;
    std::shared_ptr<SVNode> _cameraNode;
    SVARFrameContext _lastContext;

    void updateCameraNode(const SVARFrameContext &context);
    void updateNode(const std::shared_ptr<SVNode> &node, const SVARFrameContext &context);

};

#endif /* SVARScene_h */
