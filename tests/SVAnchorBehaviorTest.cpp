//
//  SVAnchorBehaviorTest.cpp
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
#include "SVNode.h"
#include "SVNodeDelegate.h"
#include "SVAnchorBehavior.h"
#include "SVARScene.h"
#include "SVARTestDoubles.h"

namespace {

class SVAnchorNodeDelegate : public SVNodeDelegate {
public:
    SVAnchorNodeDelegate() : anchorChangedCount(0) {}

    void onAnchorChanged(SVNode &node, std::shared_ptr<SVARAnchor> anchor) {
        anchorChangedCount++;
        lastAnchor = anchor;
    }

    int anchorChangedCount;
    std::shared_ptr<SVARAnchor> lastAnchor;
};

/*
 Records every completion of an anchor task.
 */
struct SVTaskResults {
    SVTaskResults() : count(0), success(false) {}

    SVAnchorTaskCallback callback() {
        return [this](std::shared_ptr<SVARAnchor> anchor, bool success) {
            this->count++;
            this->success = success;
            this->anchor = anchor;
        };
    }

    int count;
    bool success;
    std::shared_ptr<SVARAnchor> anchor;
};

class SVAnchorBehaviorTest : public ::testing::Test {
protected:

    void SetUp() {
        _session = std::make_shared<SVTestSession>();
        SVARSessionConfig config;
        config.cloudAnchorEnabled = true;
        config.geospatialEnabled = true;
        _session->configure(config);
        _session->resume();

        _scene = std::make_shared<SVARScene>(_session);

        SVTrackingSettings settings;
        settings.smoothPose = false;
        _behavior = std::make_shared<SVAnchorBehavior>(settings);
        _node = std::make_shared<SVNode>(_behavior);
        _scene->addNode(_node);

        _delegate = std::make_shared<SVAnchorNodeDelegate>();
        _node->addDelegate(_delegate);
    }

    std::shared_ptr<SVTestAnchor> createAnchor(std::string id, SVPose pose = SVPose()) {
        return std::make_shared<SVTestAnchor>(id, pose);
    }

    void runFrames(int count) {
        for (int i = 0; i < count; i++) {
            _scene->onFrame();
        }
    }

    std::shared_ptr<SVTestSession> _session;
    std::shared_ptr<SVARScene> _scene;
    std::shared_ptr<SVAnchorBehavior> _behavior;
    std::shared_ptr<SVNode> _node;
    std::shared_ptr<SVAnchorNodeDelegate> _delegate;
};

}

#pragma mark - Anchor Replacement

TEST_F(SVAnchorBehaviorTest, ReplacingAnchorDetachesPreviousExactlyOnce) {
    std::shared_ptr<SVTestAnchor> a = createAnchor("a");
    std::shared_ptr<SVTestAnchor> b = createAnchor("b");
    std::shared_ptr<SVTestAnchor> c = createAnchor("c");

    _behavior->setAnchor(a);
    _behavior->setAnchor(b);
    EXPECT_EQ(1, a->detachCount);
    EXPECT_EQ(0, b->detachCount);

    _behavior->setAnchor(b);
    EXPECT_EQ(0, b->detachCount);

    _behavior->setAnchor(c);
    EXPECT_EQ(1, a->detachCount);
    EXPECT_EQ(1, b->detachCount);
    EXPECT_EQ(c, _behavior->getAnchor());
    EXPECT_EQ(3, _delegate->anchorChangedCount);
}

TEST_F(SVAnchorBehaviorTest, DetachAnchorIsIdempotent) {
    std::shared_ptr<SVTestAnchor> anchor = createAnchor("a");
    _behavior->setAnchor(anchor);
    ASSERT_EQ(1, _delegate->anchorChangedCount);

    _behavior->detachAnchor();
    EXPECT_FALSE(_behavior->isAnchored());
    EXPECT_FALSE(_behavior->isTracking());
    EXPECT_EQ(2, _delegate->anchorChangedCount);
    EXPECT_EQ(nullptr, _delegate->lastAnchor);

    EXPECT_NO_THROW(_behavior->detachAnchor());
    EXPECT_FALSE(_behavior->isAnchored());
    EXPECT_EQ(2, _delegate->anchorChangedCount);
    EXPECT_EQ(1, anchor->detachCount);
}

TEST_F(SVAnchorBehaviorTest, NodeFollowsAnchorPose) {
    SVPose pose(SVVector3f(0, 0, -1), SVQuaternion());
    std::shared_ptr<SVTestAnchor> anchor = createAnchor("a", pose);
    _behavior->setAnchor(anchor);
    EXPECT_TRUE(_node->getPosition().isEqual(pose.getPosition()));

    anchor->pose = SVPose(SVVector3f(0.1f, 0, -1), SVQuaternion());
    runFrames(1);
    EXPECT_TRUE(_node->getPosition().isEqual(anchor->pose.getPosition()));

    _behavior->setUpdateAnchorPose(false);
    anchor->pose = SVPose(SVVector3f(2, 0, -1), SVQuaternion());
    runFrames(1);
    EXPECT_TRUE(_node->getPosition().isEqual(SVVector3f(0.1f, 0, -1)));
}

TEST_F(SVAnchorBehaviorTest, AnchorPoseIsStoredWhenNotTracking) {
    SVPose pose(SVVector3f(1, 2, 3), SVQuaternion());
    std::shared_ptr<SVTestAnchor> anchor = createAnchor("a", pose);
    anchor->trackingState = SVARTrackingState::Paused;

    _behavior->setAnchor(anchor);
    EXPECT_TRUE(_behavior->isTracking());
    EXPECT_EQ(pose, _behavior->getPose());
    EXPECT_TRUE(_node->getPosition().isEqual(SVVector3f(1, 2, 3)));

    // Not refreshed until the anchor tracks again
    anchor->pose = SVPose(SVVector3f(4, 5, 6), SVQuaternion());
    runFrames(1);
    EXPECT_EQ(pose, _behavior->getPose());

    anchor->trackingState = SVARTrackingState::Tracking;
    runFrames(1);
    EXPECT_EQ(anchor->pose, _behavior->getPose());
}

TEST_F(SVAnchorBehaviorTest, AnchorPoseUpdatesAreThrottled) {
    SVTrackingSettings settings = _behavior->getSettings();
    settings.anchorPoseUpdateInterval = 0.5;
    _behavior->setSettings(settings);
    _session->frameIntervalNs = 100000000;

    std::shared_ptr<SVTestAnchor> anchor = createAnchor("a");
    _behavior->setAnchor(anchor);
    runFrames(1);

    anchor->pose = SVPose(SVVector3f(1, 0, 0), SVQuaternion());
    runFrames(2);
    EXPECT_TRUE(_node->getPosition().isEqual(SVVector3f()));

    runFrames(3);
    EXPECT_TRUE(_node->getPosition().isEqual(SVVector3f(1, 0, 0)));
}

TEST_F(SVAnchorBehaviorTest, HiddenWhileAnchorIsNotTracking) {
    std::shared_ptr<SVTestAnchor> anchor = createAnchor("a");
    _behavior->setAnchor(anchor);
    runFrames(1);
    EXPECT_TRUE(_node->isVisible());

    anchor->trackingState = SVARTrackingState::Paused;
    runFrames(1);
    EXPECT_FALSE(_node->isVisible());
    EXPECT_EQ(SVARTrackingState::Paused, _behavior->getAnchorTrackingState());

    _behavior->setVisibleTrackingStates({ SVARTrackingState::Tracking, SVARTrackingState::Paused });
    EXPECT_TRUE(_node->isVisible());
}

TEST_F(SVAnchorBehaviorTest, AnchorAtCurrentPose) {
    _node->setPosition(SVVector3f(0, 0, -2));
    EXPECT_EQ(SVARAnchorAcquireStatus::Success, _behavior->anchor(_session));
    ASSERT_TRUE(_behavior->isAnchored());
    EXPECT_TRUE(_behavior->getAnchor()->getPose().getPosition().isEqual(SVVector3f(0, 0, -2)));

    _session->anchorSource.failureStatus = SVARAnchorAcquireStatus::ErrorResourceExhausted;
    std::shared_ptr<SVARAnchor> previous = _behavior->getAnchor();
    EXPECT_EQ(SVARAnchorAcquireStatus::ErrorResourceExhausted, _behavior->anchor(_session));
    EXPECT_EQ(previous, _behavior->getAnchor());
}

TEST_F(SVAnchorBehaviorTest, AnchoredCopyHasIndependentAnchor) {
    _node->setName("chair");
    _behavior->setAnchor(createAnchor("a", SVPose(SVVector3f(1, 0, 0), SVQuaternion())));

    SVARAnchorAcquireStatus status = SVARAnchorAcquireStatus::ErrorUnknown;
    std::shared_ptr<SVNode> copy = _behavior->createAnchoredCopy(_session, &status);
    ASSERT_NE(nullptr, copy);
    EXPECT_EQ("chair", copy->getName());

    std::shared_ptr<SVAnchorBehavior> copyBehavior =
        std::dynamic_pointer_cast<SVAnchorBehavior>(copy->getTrackingBehavior());
    ASSERT_NE(nullptr, copyBehavior);
    EXPECT_NE(_behavior->getAnchor(), copyBehavior->getAnchor());
    EXPECT_TRUE(copy->getPosition().isEqual(SVVector3f(1, 0, 0)));
}

#pragma mark - Cloud Anchors

TEST_F(SVAnchorBehaviorTest, HostCompletesOnceOnTerminalState) {
    std::shared_ptr<SVTestAnchor> local = createAnchor("local");
    _behavior->setAnchor(local);
    SVTaskResults results;

    EXPECT_EQ(SVARAnchorAcquireStatus::Success, _behavior->hostCloudAnchor(_session, 1, results.callback()));
    EXPECT_TRUE(_behavior->isCloudAnchorTaskInProgress());
    EXPECT_EQ(1, local->detachCount);
    EXPECT_EQ(_session->lastCloudAnchor, _behavior->getAnchor());
    EXPECT_EQ(SVARCloudAnchorState::TaskInProgress, _behavior->getCloudAnchorState());

    runFrames(3);
    EXPECT_EQ(0, results.count);
    EXPECT_TRUE(_behavior->isCloudAnchorTaskInProgress());

    _session->lastCloudAnchor->cloudAnchorState = SVARCloudAnchorState::Success;
    _session->lastCloudAnchor->cloudAnchorId = "ua-1234";
    runFrames(1);
    EXPECT_FALSE(_behavior->isCloudAnchorTaskInProgress());
    EXPECT_EQ(1, results.count);
    EXPECT_TRUE(results.success);
    EXPECT_EQ("ua-1234", _behavior->getCloudAnchorId());

    runFrames(3);
    EXPECT_EQ(1, results.count);
}

TEST_F(SVAnchorBehaviorTest, HostFailureIsReported) {
    _behavior->setAnchor(createAnchor("local"));
    SVTaskResults results;
    _behavior->hostCloudAnchor(_session, 30, results.callback());

    _session->lastCloudAnchor->cloudAnchorState = SVARCloudAnchorState::ErrorNotAuthorized;
    runFrames(1);

    EXPECT_EQ(1, results.count);
    EXPECT_FALSE(results.success);
    EXPECT_FALSE(_behavior->isAnchorTaskInProgress());
    EXPECT_EQ(SVARCloudAnchorState::ErrorNotAuthorized, _behavior->getCloudAnchorState());
}

TEST_F(SVAnchorBehaviorTest, HostRequiresAnchorAndNoTaskInProgress) {
    SVTaskResults results;
    EXPECT_THROW(_behavior->hostCloudAnchor(_session, 1, results.callback()), std::logic_error);

    _behavior->setAnchor(createAnchor("local"));
    _behavior->hostCloudAnchor(_session, 1, results.callback());
    EXPECT_THROW(_behavior->hostCloudAnchor(_session, 1, results.callback()), std::logic_error);
    EXPECT_THROW(_behavior->resolveCloudAnchor(_session, "id", results.callback()), std::logic_error);
    EXPECT_EQ(0, results.count);
}

TEST_F(SVAnchorBehaviorTest, HostWithCloudAnchorsDisabledNeverCompletes) {
    SVARSessionConfig config = _session->getConfig();
    config.cloudAnchorEnabled = false;
    _session->configure(config);

    _behavior->setAnchor(createAnchor("local"));
    SVTaskResults results;
    EXPECT_EQ(SVARAnchorAcquireStatus::ErrorCloudAnchorsNotConfigured,
              _behavior->hostCloudAnchor(_session, 1, results.callback()));
    EXPECT_FALSE(_behavior->isAnchorTaskInProgress());

    runFrames(2);
    EXPECT_EQ(0, results.count);
}

TEST_F(SVAnchorBehaviorTest, CancelledResolveNeverCompletes) {
    SVTaskResults results;
    EXPECT_EQ(SVARAnchorAcquireStatus::Success,
              _behavior->resolveCloudAnchor(_session, "ua-1234", results.callback()));
    EXPECT_TRUE(_behavior->isCloudAnchorTaskInProgress());
    std::shared_ptr<SVTestAnchor> resolving = _session->lastCloudAnchor;
    EXPECT_EQ(resolving, _behavior->getAnchor());

    runFrames(2);
    _behavior->cancelAnchorTask();
    EXPECT_FALSE(_behavior->isCloudAnchorTaskInProgress());
    EXPECT_FALSE(_behavior->isAnchored());
    EXPECT_EQ(1, resolving->detachCount);

    resolving->cloudAnchorState = SVARCloudAnchorState::Success;
    runFrames(3);
    EXPECT_EQ(0, results.count);

    // Nothing left to cancel
    _behavior->cancelAnchorTask();
    EXPECT_EQ(1, resolving->detachCount);
}

TEST_F(SVAnchorBehaviorTest, SetAnchorCancelsTaskWithoutCallback) {
    SVTaskResults results;
    _behavior->resolveCloudAnchor(_session, "ua-1234", results.callback());
    std::shared_ptr<SVTestAnchor> resolving = _session->lastCloudAnchor;

    std::shared_ptr<SVTestAnchor> manual = createAnchor("manual");
    _behavior->setAnchor(manual);
    EXPECT_FALSE(_behavior->isAnchorTaskInProgress());
    EXPECT_EQ(1, resolving->detachCount);

    resolving->cloudAnchorState = SVARCloudAnchorState::Success;
    runFrames(2);
    EXPECT_EQ(0, results.count);
    EXPECT_EQ(manual, _behavior->getAnchor());
}

#pragma mark - Geospatial Anchors

TEST_F(SVAnchorBehaviorTest, TerrainAnchorBecomesNodeAnchorOnSuccess) {
    SVTaskResults results;
    SVQuaternion rotation = SVQuaternion::fromAngleAxis(0.3f, SVVector3f(0, 1, 0));
    EXPECT_EQ(SVARAnchorAcquireStatus::Success,
              _behavior->resolveTerrainAnchor(_session, 37.42, -122.08, 1.5, rotation, results.callback()));

    ASSERT_EQ(1u, _session->geospatialRequests.size());
    const SVGeospatialAnchorRequest &request = _session->geospatialRequests[0];
    EXPECT_EQ(SVGeospatialAnchorType::Terrain, request.type);
    EXPECT_DOUBLE_EQ(37.42, request.latitude);
    EXPECT_DOUBLE_EQ(-122.08, request.longitude);
    EXPECT_DOUBLE_EQ(1.5, request.altitude);
    EXPECT_TRUE(request.eusQuaternion.isEqual(rotation));

    EXPECT_TRUE(_behavior->isAnchorTaskInProgress());
    EXPECT_FALSE(_behavior->isCloudAnchorTaskInProgress());
    EXPECT_FALSE(_behavior->isAnchored());

    runFrames(2);
    EXPECT_EQ(0, results.count);

    std::shared_ptr<SVTestAnchor> terrain = createAnchor("terrain", SVPose(SVVector3f(3, 0, 4), SVQuaternion()));
    _session->lastGeospatialTask->anchor = terrain;
    _session->lastGeospatialTask->state = SVARAnchorTaskState::Success;
    runFrames(1);

    EXPECT_EQ(1, results.count);
    EXPECT_TRUE(results.success);
    EXPECT_EQ(terrain, _behavior->getAnchor());
    EXPECT_TRUE(_node->getPosition().isEqual(SVVector3f(3, 0, 4)));
}

TEST_F(SVAnchorBehaviorTest, RooftopAnchorFailureLeavesNodeUnanchored) {
    SVTaskResults results;
    _behavior->resolveRooftopAnchor(_session, 48.85, 2.29, 0, SVQuaternion(), results.callback());
    EXPECT_EQ(SVARAnchorTaskType::ResolveRooftopAnchor, _behavior->getAnchorTask()->getType());

    _session->lastGeospatialTask->state = SVARAnchorTaskState::Failed;
    runFrames(1);

    EXPECT_EQ(1, results.count);
    EXPECT_FALSE(results.success);
    EXPECT_FALSE(_behavior->isAnchored());
    EXPECT_FALSE(_behavior->isAnchorTaskInProgress());
}

TEST_F(SVAnchorBehaviorTest, DestroyCancelsTaskAndDetachesAnchor) {
    _behavior->setAnchor(createAnchor("local"));
    SVTaskResults results;
    _behavior->hostCloudAnchor(_session, 1, results.callback());
    std::shared_ptr<SVTestAnchor> hosting = _session->lastCloudAnchor;

    _node->destroy();
    EXPECT_EQ(1, hosting->detachCount);
    EXPECT_FALSE(_behavior->isAnchorTaskInProgress());

    hosting->cloudAnchorState = SVARCloudAnchorState::Success;
    runFrames(2);
    EXPECT_EQ(0, results.count);
}
