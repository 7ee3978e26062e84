//
//  SVARSessionTest.cpp
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
#include "SVARTestDoubles.h"

namespace {

class SVTestSessionDelegate : public SVARSessionDelegate {
public:
    SVTestSessionDelegate() : configuredCount(0), resumedCount(0), pausedCount(0) {}

    void onSessionConfigured(const SVARSessionConfig &config) {
        configuredCount++;
        lastConfig = config;
    }
    void onSessionResumed() {
        resumedCount++;
    }
    void onSessionPaused() {
        pausedCount++;
    }

    int configuredCount;
    int resumedCount;
    int pausedCount;
    SVARSessionConfig lastConfig;
};

}

TEST(SVARSessionTest, UnsupportedDepthIsDisabledAndRestApplies) {
    std::shared_ptr<SVTestSession> session = std::make_shared<SVTestSession>();
    session->depthSupported = false;

    SVARSessionConfig config;
    config.planeFindingMode = SVARPlaneFindingMode::Vertical;
    config.depthMode = SVARDepthMode::Automatic;

    EXPECT_TRUE(session->configure(config));
    EXPECT_EQ(SVARDepthMode::Disabled, session->getConfig().depthMode);
    EXPECT_EQ(SVARPlaneFindingMode::Vertical, session->getConfig().planeFindingMode);
    EXPECT_EQ(SVARDepthMode::Disabled, session->lastAppliedConfig.depthMode);
}

TEST(SVARSessionTest, UnsupportedGeospatialIsDisabled) {
    std::shared_ptr<SVTestSession> session = std::make_shared<SVTestSession>();
    session->geospatialSupported = false;

    SVARSessionConfig config;
    config.geospatialEnabled = true;
    config.cloudAnchorEnabled = true;

    EXPECT_TRUE(session->configure(config));
    EXPECT_FALSE(session->getConfig().geospatialEnabled);
    EXPECT_TRUE(session->getConfig().cloudAnchorEnabled);
}

TEST(SVARSessionTest, RejectedConfigurationKeepsPrevious) {
    std::shared_ptr<SVTestSession> session = std::make_shared<SVTestSession>();
    SVARSessionConfig first;
    first.planeFindingMode = SVARPlaneFindingMode::Horizontal;
    ASSERT_TRUE(session->configure(first));

    session->acceptConfig = false;
    SVARSessionConfig second;
    second.planeFindingMode = SVARPlaneFindingMode::Vertical;

    EXPECT_FALSE(session->configure(second));
    EXPECT_EQ(SVARPlaneFindingMode::Horizontal, session->getConfig().planeFindingMode);
}

TEST(SVARSessionTest, EveryDelegateIsNotified) {
    std::shared_ptr<SVTestSession> session = std::make_shared<SVTestSession>();
    std::shared_ptr<SVTestSessionDelegate> first = std::make_shared<SVTestSessionDelegate>();
    std::shared_ptr<SVTestSessionDelegate> second = std::make_shared<SVTestSessionDelegate>();
    session->addDelegate(first);
    session->addDelegate(second);

    SVARSessionConfig config;
    config.instantPlacementEnabled = false;
    session->configure(config);
    session->resume();
    session->pause();

    for (const std::shared_ptr<SVTestSessionDelegate> &delegate : { first, second }) {
        EXPECT_EQ(1, delegate->configuredCount);
        EXPECT_FALSE(delegate->lastConfig.instantPlacementEnabled);
        EXPECT_EQ(1, delegate->resumedCount);
        EXPECT_EQ(1, delegate->pausedCount);
    }

    session->removeDelegate(first);
    session->configure(config);
    EXPECT_EQ(1, first->configuredCount);
    EXPECT_EQ(2, second->configuredCount);
}

TEST(SVARSessionTest, ReleasedDelegateIsSkipped) {
    std::shared_ptr<SVTestSession> session = std::make_shared<SVTestSession>();
    std::shared_ptr<SVTestSessionDelegate> delegate = std::make_shared<SVTestSessionDelegate>();
    session->addDelegate(delegate);
    delegate.reset();

    EXPECT_TRUE(session->configure(SVARSessionConfig()));
}

TEST(SVARSessionTest, FramesOnlyWhileResumed) {
    std::shared_ptr<SVTestSession> session = std::make_shared<SVTestSession>();
    EXPECT_EQ(nullptr, session->update());

    ASSERT_TRUE(session->resume());
    std::shared_ptr<SVARFrame> first = session->update();
    std::shared_ptr<SVARFrame> second = session->update();
    ASSERT_NE(nullptr, first);
    ASSERT_NE(nullptr, second);
    EXPECT_EQ(second, session->getCurrentFrame());
    EXPECT_EQ(first, session->getPreviousFrame());
    EXPECT_GT(second->getTimestampNs(), first->getTimestampNs());

    session->pause();
    EXPECT_EQ(nullptr, session->update());
    EXPECT_EQ(SVARSessionState::Paused, session->getState());
}

TEST(SVARSessionTest, ClosedSessionCannotResume) {
    std::shared_ptr<SVTestSession> session = std::make_shared<SVTestSession>();
    session->resume();
    session->update();
    session->close();

    EXPECT_EQ(SVARSessionState::Closed, session->getState());
    EXPECT_EQ(nullptr, session->getCurrentFrame());
    EXPECT_FALSE(session->resume());
    EXPECT_FALSE(session->configure(SVARSessionConfig()));
}

TEST(SVARSessionTest, CloseAfterResumePausesFirst) {
    std::shared_ptr<SVTestSession> session = std::make_shared<SVTestSession>();
    session->resume();
    session->close();
    EXPECT_EQ(1, session->pauseCount);
    EXPECT_EQ(1, session->closeCount);
    EXPECT_TRUE(session->pausedBeforeClose);

    // Closing again does nothing
    session->close();
    EXPECT_EQ(1, session->pauseCount);
    EXPECT_EQ(1, session->closeCount);
}

TEST(SVARSessionTest, AnchorsRequireResumedSession) {
    std::shared_ptr<SVTestSession> session = std::make_shared<SVTestSession>();
    SVARAnchorAcquireStatus status = SVARAnchorAcquireStatus::Success;

    EXPECT_EQ(nullptr, session->createAnchor(SVPose(), &status));
    EXPECT_EQ(SVARAnchorAcquireStatus::ErrorSessionPaused, status);

    session->resume();
    std::shared_ptr<SVARAnchor> anchor = session->createAnchor(SVPose(), &status);
    EXPECT_NE(nullptr, anchor);
    EXPECT_EQ(SVARAnchorAcquireStatus::Success, status);
}

TEST(SVARSessionTest, ResourceExhaustionIsReportedDistinctly) {
    std::shared_ptr<SVTestSession> session = std::make_shared<SVTestSession>();
    session->resume();
    session->anchorSource.failureStatus = SVARAnchorAcquireStatus::ErrorResourceExhausted;

    SVARAnchorAcquireStatus status = SVARAnchorAcquireStatus::Success;
    EXPECT_EQ(nullptr, session->createAnchor(SVPose(), &status));
    EXPECT_EQ(SVARAnchorAcquireStatus::ErrorResourceExhausted, status);
}

TEST(SVARSessionTest, CloudTasksRequireCloudAnchors) {
    std::shared_ptr<SVTestSession> session = std::make_shared<SVTestSession>();
    session->resume();
    std::shared_ptr<SVARAnchor> anchor = std::make_shared<SVTestAnchor>("a", SVPose());

    SVARAnchorAcquireStatus status = SVARAnchorAcquireStatus::Success;
    EXPECT_EQ(nullptr, session->hostCloudAnchor(anchor, 1, &status));
    EXPECT_EQ(SVARAnchorAcquireStatus::ErrorCloudAnchorsNotConfigured, status);

    status = SVARAnchorAcquireStatus::Success;
    EXPECT_EQ(nullptr, session->resolveCloudAnchor("cloud-id", &status));
    EXPECT_EQ(SVARAnchorAcquireStatus::ErrorCloudAnchorsNotConfigured, status);
}

TEST(SVARSessionTest, CloudAnchorTTLIsClamped) {
    std::shared_ptr<SVTestSession> session = std::make_shared<SVTestSession>();
    SVARSessionConfig config;
    config.cloudAnchorEnabled = true;
    session->configure(config);
    session->resume();
    std::shared_ptr<SVARAnchor> anchor = std::make_shared<SVTestAnchor>("a", SVPose());

    SVARAnchorAcquireStatus status = SVARAnchorAcquireStatus::ErrorUnknown;
    EXPECT_NE(nullptr, session->hostCloudAnchor(anchor, 1000, &status));
    EXPECT_EQ(365, session->lastTTLDays);

    EXPECT_NE(nullptr, session->hostCloudAnchor(anchor, 0, &status));
    EXPECT_EQ(1, session->lastTTLDays);
}

TEST(SVARSessionTest, GeospatialRequestsRequireGeospatialMode) {
    std::shared_ptr<SVTestSession> session = std::make_shared<SVTestSession>();
    session->resume();
    SVGeospatialAnchorRequest terrain(SVGeospatialAnchorType::Terrain, 37.4, -122.1, 1.0, SVQuaternion());

    SVARAnchorAcquireStatus status = SVARAnchorAcquireStatus::Success;
    EXPECT_EQ(nullptr, session->resolveGeospatialAnchor(terrain, &status));
    EXPECT_EQ(SVARAnchorAcquireStatus::ErrorUnsupported, status);
    EXPECT_EQ(SVEarthTrackingState::Stopped, session->getEarthTrackingState());

    SVARSessionConfig config;
    config.geospatialEnabled = true;
    session->configure(config);

    SVGeospatialAnchorRequest wgs84(SVGeospatialAnchorType::WGS84, 37.4, -122.1, 10.0, SVQuaternion());
    EXPECT_EQ(nullptr, session->resolveGeospatialAnchor(wgs84, &status));
    EXPECT_EQ(SVARAnchorAcquireStatus::ErrorUnsupported, status);

    EXPECT_NE(nullptr, session->resolveGeospatialAnchor(terrain, &status));
    EXPECT_EQ(SVARAnchorAcquireStatus::Success, status);
}
