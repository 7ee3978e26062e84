//
//  SVPlacementBehaviorTest.cpp
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
#include "SVPlacementBehavior.h"
#include "SVARScene.h"
#include "SVARTestDoubles.h"

namespace {

class SVHitResultDelegate : public SVNodeDelegate {
public:
    SVHitResultDelegate() : hitCount(0), emptyHitCount(0), lastTracking(false) {}

    void onHitResult(SVNode &node, std::shared_ptr<SVARHitTestResult> hitResult, bool isTracking) {
        hitCount++;
        if (!hitResult) {
            emptyHitCount++;
        }
        lastTracking = isTracking;
    }

    int hitCount;
    int emptyHitCount;
    bool lastTracking;
};

class SVPlacementBehaviorTest : public ::testing::Test {
protected:

    void SetUp() {
        _session = std::make_shared<SVTestSession>();
        _session->frameIntervalNs = 100000000;
        _session->configure(SVARSessionConfig());
        _session->resume();
        _session->setDisplayGeometry(0, 1080, 1920);

        _scene = std::make_shared<SVARScene>(_session);
    }

    void createNode(SVPlacementModeType type, SVTrackingSettings settings = SVTrackingSettings()) {
        settings.smoothPose = false;
        _behavior = std::make_shared<SVPlacementBehavior>(SVPlacementMode(type), kDefaultPlacementPosition, settings);
        _node = std::make_shared<SVNode>(_behavior);
        _scene->addNode(_node);
    }

    std::shared_ptr<SVTestPlane> createPlane(uint64_t hashCode, SVPose pose) {
        return std::make_shared<SVTestPlane>(hashCode, pose);
    }

    void runFrames(int count) {
        for (int i = 0; i < count; i++) {
            _scene->onFrame();
        }
    }

    std::shared_ptr<SVTestSession> _session;
    std::shared_ptr<SVARScene> _scene;
    std::shared_ptr<SVPlacementBehavior> _behavior;
    std::shared_ptr<SVNode> _node;
};

}

#pragma mark - Placement Loop

TEST_F(SVPlacementBehaviorTest, TrackingHitMovesNodeWithoutAnchoring) {
    createNode(SVPlacementModeType::PlaneHorizontalAndVertical);

    runFrames(4);
    EXPECT_FALSE(_behavior->isTracking());
    EXPECT_TRUE(_node->getPosition().isEqual(kDefaultPlacementPosition));

    SVPose pose(SVVector3f(0.2f, 0, -1.5f), SVQuaternion());
    _session->hits = { SVCreateTestHit(createPlane(1, pose), pose) };
    runFrames(1);
    EXPECT_TRUE(_behavior->isTracking());
    EXPECT_EQ(pose, _behavior->getPose());
    EXPECT_TRUE(_node->getPosition().isEqual(pose.getPosition()));

    for (int frame = 6; frame <= 10; frame++) {
        runFrames(1);
        EXPECT_FALSE(_behavior->isAnchored());
    }
}

TEST_F(SVPlacementBehaviorTest, AutoAnchorOnUpdateAfterTrackingHit) {
    createNode(SVPlacementModeType::PlaneHorizontalAndVertical);
    _behavior->setAutoAnchor(true);

    runFrames(4);
    EXPECT_FALSE(_behavior->isAnchored());

    SVPose pose(SVVector3f(0.2f, 0, -1.5f), SVQuaternion());
    std::shared_ptr<SVTestPlane> plane = createPlane(1, pose);
    _session->hits = { SVCreateTestHit(plane, pose) };
    runFrames(1);
    ASSERT_TRUE(_behavior->isTracking());

    runFrames(1);
    EXPECT_TRUE(_behavior->isAnchored());
    ASSERT_NE(nullptr, _behavior->getAnchor());
    ASSERT_EQ(1u, plane->anchorSource.anchors.size());
    EXPECT_EQ(plane->anchorSource.anchors[0], _behavior->getAnchor());
    EXPECT_EQ(pose, _behavior->getAnchor()->getPose());
}

TEST_F(SVPlacementBehaviorTest, AnchoredNodeStopsHitTesting) {
    createNode(SVPlacementModeType::PlaneHorizontalAndVertical);
    _behavior->setAutoAnchor(true);
    SVPose pose(SVVector3f(0, 0, -1), SVQuaternion());
    _session->hits = { SVCreateTestHit(createPlane(1, pose), pose) };

    runFrames(2);
    ASSERT_TRUE(_behavior->isAnchored());
    int hitTests = _session->countHitTests();

    runFrames(5);
    EXPECT_EQ(hitTests, _session->countHitTests());
}

TEST_F(SVPlacementBehaviorTest, FailedAutoAnchorIsRetried) {
    createNode(SVPlacementModeType::PlaneHorizontalAndVertical);
    _behavior->setAutoAnchor(true);

    SVPose pose(SVVector3f(0, 0, -1), SVQuaternion());
    std::shared_ptr<SVTestPlane> plane = createPlane(1, pose);
    plane->anchorSource.failureStatus = SVARAnchorAcquireStatus::ErrorResourceExhausted;
    _session->hits = { SVCreateTestHit(plane, pose) };

    runFrames(3);
    EXPECT_TRUE(_behavior->isTracking());
    EXPECT_FALSE(_behavior->isAnchored());

    plane->anchorSource.failureStatus = SVARAnchorAcquireStatus::Success;
    runFrames(1);
    EXPECT_TRUE(_behavior->isAnchored());
}

TEST_F(SVPlacementBehaviorTest, ClearingAutoAnchorDetaches) {
    createNode(SVPlacementModeType::PlaneHorizontalAndVertical);
    _behavior->setAutoAnchor(true);
    SVPose pose(SVVector3f(0, 0, -1), SVQuaternion());
    std::shared_ptr<SVTestPlane> plane = createPlane(1, pose);
    _session->hits = { SVCreateTestHit(plane, pose) };
    runFrames(2);
    ASSERT_TRUE(_behavior->isAnchored());

    _behavior->setAutoAnchor(false);
    EXPECT_FALSE(_behavior->isAnchored());
    EXPECT_EQ(1, plane->anchorSource.anchors[0]->detachCount);

    int hitTests = _session->countHitTests();
    runFrames(2);
    EXPECT_FALSE(_behavior->isAnchored());
    EXPECT_GT(_session->countHitTests(), hitTests);
}

TEST_F(SVPlacementBehaviorTest, NonTrackingHitKeepsLastPose) {
    createNode(SVPlacementModeType::PlaneHorizontalAndVertical);
    std::shared_ptr<SVHitResultDelegate> delegate = std::make_shared<SVHitResultDelegate>();
    _node->addDelegate(delegate);

    SVPose tracked(SVVector3f(0, 0, -1), SVQuaternion());
    _session->hits = { SVCreateTestHit(createPlane(1, tracked), tracked) };
    runFrames(1);

    SVPose stale(SVVector3f(3, 0, -3), SVQuaternion());
    std::shared_ptr<SVARHitTestResult> staleHit = SVCreateTestPlaneHit(2, stale, SVARTrackingState::Paused);
    _session->hits = { staleHit };
    runFrames(1);

    EXPECT_EQ(tracked, _behavior->getPose());
    EXPECT_EQ(staleHit, _behavior->getLastHitResult());
    EXPECT_EQ(tracked, _behavior->getLastTrackingHitResult()->getHitPose());
    EXPECT_EQ(2, delegate->hitCount);
    EXPECT_TRUE(delegate->lastTracking);

    // The last tracking hit is preferred for anchoring
    EXPECT_EQ(SVARAnchorAcquireStatus::Success, _behavior->anchor(_session));
    EXPECT_EQ(tracked, _behavior->getAnchor()->getPose());
}

TEST_F(SVPlacementBehaviorTest, NonTrackingFallbackIsOptIn) {
    createNode(SVPlacementModeType::Instant);

    SVPose pose(SVVector3f(0, 0, -2), SVQuaternion());
    std::shared_ptr<SVTestInstantPlacementPoint> point = std::make_shared<SVTestInstantPlacementPoint>(1, pose);
    point->trackingState = SVARTrackingState::Paused;
    point->anchorSource.requireTracking = false;
    _session->instantHits = { SVCreateTestHit(point, pose) };
    runFrames(1);
    ASSERT_NE(nullptr, _behavior->getLastHitResult());

    EXPECT_EQ(SVARAnchorAcquireStatus::ErrorNotTracking, _behavior->anchor(_session));
    EXPECT_FALSE(_behavior->isAnchored());

    _behavior->setAllowNonTrackingAnchorFallback(true);
    EXPECT_EQ(SVARAnchorAcquireStatus::Success, _behavior->anchor(_session));
    EXPECT_TRUE(_behavior->isAnchored());
}

TEST_F(SVPlacementBehaviorTest, EmptyHitTestIsReportedAndRetried) {
    createNode(SVPlacementModeType::PlaneHorizontalAndVertical);
    std::shared_ptr<SVHitResultDelegate> delegate = std::make_shared<SVHitResultDelegate>();
    _node->addDelegate(delegate);

    runFrames(3);
    EXPECT_EQ(3, delegate->hitCount);
    EXPECT_EQ(3, delegate->emptyHitCount);
    EXPECT_FALSE(delegate->lastTracking);
    EXPECT_EQ(nullptr, _behavior->getLastHitResult());
}

TEST_F(SVPlacementBehaviorTest, KeepRotationOnlyMovesPosition) {
    SVPlacementMode mode(SVPlacementModeType::PlaneHorizontalAndVertical);
    mode.setKeepRotation(true);
    createNode(SVPlacementModeType::PlaneHorizontalAndVertical);
    _behavior->setPlacementMode(mode);

    SVPose pose(SVVector3f(1, 0, -1), SVQuaternion::fromAngleAxis(1.0f, SVVector3f(0, 1, 0)));
    _session->hits = { SVCreateTestHit(createPlane(1, pose), pose) };
    runFrames(1);

    EXPECT_TRUE(_node->getPosition().isEqual(pose.getPosition()));
    EXPECT_TRUE(_node->getRotation().isEqual(SVQuaternion()));
}

#pragma mark - Rate Limiting

TEST_F(SVPlacementBehaviorTest, HitTestsAreRateLimited) {
    const float rate = 5.0f;
    SVTrackingSettings settings;
    settings.maxHitTestsPerSecond = rate;
    createNode(SVPlacementModeType::PlaneHorizontalAndVertical, settings);
    _session->frameIntervalNs = 16000000;

    runFrames(300);

    // Every 1 second window of frames
    const std::vector<std::shared_ptr<SVTestFrame>> &frames = _session->frames;
    for (size_t start = 0; start < frames.size(); start++) {
        int count = 0;
        for (size_t i = start; i < frames.size() && frames[i]->timestampNs - frames[start]->timestampNs < 1000000000; i++) {
            count += frames[i]->hitTestCount;
        }
        EXPECT_LE(count, (int) rate + 1);
    }
    EXPECT_GE(_session->countHitTests(), (int) rate * 4);
}

TEST_F(SVPlacementBehaviorTest, FirstHitTestIsNeverRateLimited) {
    SVTrackingSettings settings;
    settings.maxHitTestsPerSecond = 0.5f;
    createNode(SVPlacementModeType::PlaneHorizontalAndVertical, settings);

    runFrames(1);
    EXPECT_EQ(1, _session->countHitTests());
    runFrames(5);
    EXPECT_EQ(1, _session->countHitTests());
}

TEST_F(SVPlacementBehaviorTest, RateMustBePositive) {
    SVTrackingSettings settings;
    settings.maxHitTestsPerSecond = 0;
    EXPECT_THROW(std::make_shared<SVPlacementBehavior>(SVPlacementMode(), kDefaultPlacementPosition, settings),
                 std::invalid_argument);

    createNode(SVPlacementModeType::PlaneHorizontalAndVertical);
    EXPECT_THROW(_behavior->setMaxHitTestsPerSecond(-1), std::invalid_argument);
    EXPECT_NO_THROW(_behavior->setMaxHitTestsPerSecond(30));
}

TEST_F(SVPlacementBehaviorTest, SettingsWithZeroRateAreRejected) {
    createNode(SVPlacementModeType::PlaneHorizontalAndVertical);
    _behavior->setMaxHitTestsPerSecond(30);

    SVTrackingSettings settings = _behavior->getSettings();
    settings.maxHitTestsPerSecond = 0;
    settings.smoothSpeed = 1;
    EXPECT_THROW(_behavior->setSettings(settings), std::invalid_argument);
    EXPECT_FLOAT_EQ(30, _behavior->getSettings().maxHitTestsPerSecond);
    EXPECT_FLOAT_EQ(kDefaultSmoothSpeed, _behavior->getSettings().smoothSpeed);

    settings.maxHitTestsPerSecond = 5;
    EXPECT_NO_THROW(_behavior->setSettings(settings));
    EXPECT_FLOAT_EQ(5, _behavior->getSettings().maxHitTestsPerSecond);
}

#pragma mark - Placement Mode

TEST_F(SVPlacementBehaviorTest, PlacementModeConfiguresSessionOnNextFrame) {
    createNode(SVPlacementModeType::PlaneVertical);
    EXPECT_EQ(SVARPlaneFindingMode::HorizontalAndVertical, _session->getConfig().planeFindingMode);

    runFrames(1);
    EXPECT_EQ(SVARPlaneFindingMode::Vertical, _session->getConfig().planeFindingMode);
    EXPECT_EQ(SVARDepthMode::Disabled, _session->getConfig().depthMode);
    EXPECT_FALSE(_session->getConfig().instantPlacementEnabled);

    int applied = _session->applyConfigCount;
    runFrames(3);
    EXPECT_EQ(applied, _session->applyConfigCount);

    _behavior->setPlacementMode(SVPlacementMode(SVPlacementModeType::Depth));
    runFrames(1);
    EXPECT_EQ(SVARPlaneFindingMode::Disabled, _session->getConfig().planeFindingMode);
    EXPECT_EQ(SVARDepthMode::Automatic, _session->getConfig().depthMode);
}

TEST_F(SVPlacementBehaviorTest, DisabledModeNeverHitTests) {
    createNode(SVPlacementModeType::Disabled);
    runFrames(5);

    EXPECT_EQ(0, _session->countHitTests());
    EXPECT_TRUE(_node->getPosition().isEqual(kDefaultPlacementPosition));
}

TEST_F(SVPlacementBehaviorTest, InstantHitTestUsesPlacementPosition) {
    createNode(SVPlacementModeType::Instant);
    _behavior->setPlacementPosition(SVVector3f(0.5f, 0.5f, -3.0f));
    EXPECT_TRUE(_node->getPosition().isEqual(SVVector3f(0.5f, 0.5f, -3.0f)));

    runFrames(1);
    std::shared_ptr<SVTestFrame> frame = _session->getTestFrame();
    EXPECT_EQ(0, frame->hitTestCount);
    EXPECT_EQ(1, frame->instantHitTestCount);
    EXPECT_FLOAT_EQ(3.0f, frame->lastInstantDistance);
    EXPECT_FLOAT_EQ(810.0f, frame->lastHitPoint.x);
    EXPECT_FLOAT_EQ(480.0f, frame->lastHitPoint.y);
}
