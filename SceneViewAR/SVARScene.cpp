//
//  SVARScene.cpp
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

#include "SVARScene.h"
#include "SVNode.h"
#include "SVARSession.h"
#include "SVARFrame.h"
#include "SVARCamera.h"
#include "SVLog.h"
#include <exception>

SVARScene::SVARScene(std::shared_ptr<SVARSession> session) :
    _session(session) {
    _rootNode = std::make_shared<SVNode>();
    _rootNode->setName("root");

    _cameraNode = std::make_shared<SVNode>();
    _cameraNode->setName("camera");
    _cameraNode->setTransformLocked(true);
}

SVARScene::~SVARScene() {
    _rootNode->destroy();
}

void SVARScene::addNode(std::shared_ptr<SVNode> node) {
    _rootNode->addChildNode(node);
}

std::shared_ptr<SVARFrame> SVARScene::onFrame() {
    std::shared_ptr<SVARFrame> frame = _session->update();
    if (!frame) {
        return nullptr;
    }

    SVARFrameContext context;
    context.session = _session;
    context.frame = frame;
    context.previousFrame = _session->getPreviousFrame();
    _lastContext = context;

    updateCameraNode(context);
    updateNode(_rootNode, context);
    return frame;
}

void SVARScene::updateCameraNode(const SVARFrameContext &context) {
    const std::shared_ptr<SVARCamera> &camera = context.frame->getCamera();
    if (!camera || camera->getTrackingState() != SVARTrackingState::Tracking) {
        return;
    }
    SVPose pose = camera->getPose();
    _cameraNode->setTransformInternal(pose.getPosition(), pose.getRotation());
}

void SVARScene::updateNode(const std::shared_ptr<SVNode> &node, const SVARFrameContext &context) {
    try {
        node->onARFrame(context);
    } catch (std::exception &e) {
        perr("Failed to update node '%s': %s", node->getName().c_str(), e.what());
    }

    // Copy first: behaviors may add or remove nodes during the update
    std::vector<std::shared_ptr<SVNode>> children = node->getChildNodes();
    for (const std::shared_ptr<SVNode> &child : children) {
        updateNode(child, context);
    }
}
