//
//  SVARSceneTest.cpp
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

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>
#include "SVNode.h"
#include "SVARScene.h"
#include "SVAnchorBehavior.h"
#include "SVTrackingBehavior.h"
#include "SVARTestDoubles.h"

namespace {

/*
 Records the order in which nodes are updated, optionally failing.
 */
class SVRecordingBehavior : public SVTrackingBehavior {
public:

    SVRecordingBehavior(std::string name, std::vector<std::string> *log, bool fail = false) :
        _name(name), _log(log), _fail(fail) {}

    void onARFrame(SVNode &node, const SVARFrameContext &context) {
        SVTrackingBehavior::onARFrame(node, context);
        _log->push_back(_name);
        if (_fail) {
            throw std::runtime_error("update failed");
        }
    }

private:
    std::string _name;
    std::vector<std::string> *_log;
    bool _fail;
};

class SVARSceneTest : public ::testing::Test {
protected:

    void SetUp() {
        _session = std::make_shared<SVTestSession>();
        _session->configure(SVARSessionConfig());
        _session->resume();
        _scene = std::make_shared<SVARScene>(_session);
    }

    std::shared_ptr<SVNode> createNode(std::string name, bool fail = false) {
        std::shared_ptr<SVNode> node = std::make_shared<SVNode>(std::make_shared<SVRecordingBehavior>(name, &_log, fail));
        node->setName(name);
        return node;
    }

    std::shared_ptr<SVTestSession> _session;
    std::shared_ptr<SVARScene> _scene;
    std::vector<std::string> _log;
};

}

TEST_F(SVARSceneTest, ParentsAreUpdatedBeforeChildren) {
    std::shared_ptr<SVNode> a = createNode("a");
    std::shared_ptr<SVNode> b = createNode("b");
    std::shared_ptr<SVNode> a1 = createNode("a1");
    std::shared_ptr<SVNode> a2 = createNode("a2");
    a->addChildNode(a1);
    a->addChildNode(a2);
    _scene->addNode(a);
    _scene->addNode(b);

    ASSERT_NE(nullptr, _scene->onFrame());
    std::vector<std::string> expected = { "a", "a1", "a2", "b" };
    EXPECT_EQ(expected, _log);
}

TEST_F(SVARSceneTest, FailingNodeDoesNotStopTheFrame) {
    std::shared_ptr<SVNode> failing = createNode("failing", true);
    std::shared_ptr<SVNode> child = createNode("child");
    std::shared_ptr<SVNode> sibling = createNode("sibling");
    failing->addChildNode(child);
    _scene->addNode(failing);
    _scene->addNode(sibling);

    EXPECT_NO_THROW(_scene->onFrame());
    std::vector<std::string> expected = { "failing", "child", "sibling" };
    EXPECT_EQ(expected, _log);

    // The failing node is retried on the next frame
    _log.clear();
    _scene->onFrame();
    EXPECT_EQ(expected, _log);
}

TEST_F(SVARSceneTest, NoUpdatesWhilePaused) {
    _scene->addNode(createNode("a"));
    _session->pause();

    EXPECT_EQ(nullptr, _scene->onFrame());
    EXPECT_TRUE(_log.empty());

    _session->resume();
    EXPECT_NE(nullptr, _scene->onFrame());
    EXPECT_EQ(1u, _log.size());
}

TEST_F(SVARSceneTest, CameraNodeFollowsCamera) {
    _session->cameraPose = SVPose(SVVector3f(1, 1.5f, 2), SVQuaternion::fromAngleAxis(0.5f, SVVector3f(0, 1, 0)));
    _scene->onFrame();

    const std::shared_ptr<SVNode> &camera = _scene->getCameraNode();
    EXPECT_TRUE(camera->getPosition().isEqual(_session->cameraPose.getPosition()));
    EXPECT_TRUE(camera->getRotation().isEqual(_session->cameraPose.getRotation()));
    EXPECT_THROW(camera->setPosition(SVVector3f(0, 0, 0)), std::logic_error);

    // Not moved while the camera is not tracking
    SVVector3f tracked = camera->getPosition();
    _session->cameraTrackingState = SVARTrackingState::Paused;
    _session->cameraPose = SVPose(SVVector3f(5, 5, 5), SVQuaternion());
    _scene->onFrame();
    EXPECT_TRUE(camera->getPosition().isEqual(tracked));
}

TEST_F(SVARSceneTest, FrameContextCarriesPreviousFrame) {
    std::shared_ptr<SVARFrame> first = _scene->onFrame();
    std::shared_ptr<SVARFrame> second = _scene->onFrame();

    const SVARFrameContext &context = _scene->getLastFrameContext();
    EXPECT_EQ(second, context.frame);
    EXPECT_EQ(first, context.previousFrame);
    EXPECT_EQ(_session, context.session);
}

TEST_F(SVARSceneTest, DestroyingSceneReleasesAnchors) {
    std::shared_ptr<SVTestAnchor> anchor = std::make_shared<SVTestAnchor>("a", SVPose());
    std::shared_ptr<SVNode> node = std::make_shared<SVNode>(std::make_shared<SVAnchorBehavior>(anchor));
    _scene->addNode(node);
    _scene->onFrame();
    ASSERT_EQ(0, anchor->detachCount);

    _scene.reset();
    EXPECT_EQ(1, anchor->detachCount);
    EXPECT_EQ(nullptr, node->getParentNode());
}
