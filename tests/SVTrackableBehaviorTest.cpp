//
//  SVTrackableBehaviorTest.cpp
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
#include "SVNode.h"
#include "SVNodeDelegate.h"
#include "SVTrackableBehavior.h"
#include "SVAnchorBehavior.h"
#include "SVARFrameContext.h"
#include "SVARTestDoubles.h"

namespace {

class SVTrackableNodeDelegate : public SVNodeDelegate {
public:
    SVTrackableNodeDelegate() : updatedCount(0), stateChangedCount(0) {}

    void onTrackableUpdated(SVNode &node, std::shared_ptr<SVARTrackable> trackable) {
        updatedCount++;
    }
    void onTrackingStateChanged(SVNode &node, SVARTrackingState state) {
        stateChangedCount++;
    }

    int updatedCount;
    int stateChangedCount;
};

SVARFrameContext createContext(const std::shared_ptr<SVTestSession> &session) {
    SVARFrameContext context;
    context.session = session;
    context.frame = session->update();
    context.previousFrame = session->getPreviousFrame();
    return context;
}

SVTrackingSettings unsmoothedSettings() {
    SVTrackingSettings settings;
    settings.smoothPose = false;
    return settings;
}

}

TEST(SVTrackableBehaviorTest, VisibleOnlyInVisibleTrackingStates) {
    std::shared_ptr<SVTestPlane> plane = std::make_shared<SVTestPlane>(1, SVPose());
    plane->trackingState = SVARTrackingState::Paused;
    std::shared_ptr<SVTrackableBehavior> behavior = std::make_shared<SVTrackableBehavior>(plane);
    SVNode node(behavior);

    EXPECT_FALSE(node.isVisible());

    behavior->setVisibleTrackingStates({ SVARTrackingState::Tracking, SVARTrackingState::Paused });
    EXPECT_TRUE(node.isVisible());

    node.setVisible(false);
    EXPECT_FALSE(node.isVisible());
}

TEST(SVTrackableBehaviorTest, FollowsTrackableWhenReportedUpdated) {
    std::shared_ptr<SVTestSession> session = std::make_shared<SVTestSession>();
    session->resume();

    SVPose initial(SVVector3f(0, 0, -1), SVQuaternion());
    std::shared_ptr<SVTestPlane> plane = std::make_shared<SVTestPlane>(1, initial);
    std::shared_ptr<SVTrackableBehavior> behavior = std::make_shared<SVTrackableBehavior>(plane, unsmoothedSettings());
    SVNode node(behavior);
    std::shared_ptr<SVTrackableNodeDelegate> delegate = std::make_shared<SVTrackableNodeDelegate>();
    node.addDelegate(delegate);

    EXPECT_TRUE(node.getPosition().isEqual(initial.getPosition()));

    // Moved, but not reported by the frame
    SVPose moved(SVVector3f(1, 0, -1), SVQuaternion());
    plane->centerPose = moved;
    node.onARFrame(createContext(session));
    EXPECT_TRUE(node.getPosition().isEqual(initial.getPosition()));
    EXPECT_EQ(0, delegate->updatedCount);

    session->updatedTrackables = { std::make_shared<SVTestPlane>(1, moved) };
    node.onARFrame(createContext(session));
    EXPECT_TRUE(node.getPosition().isEqual(moved.getPosition()));
    EXPECT_EQ(1, delegate->updatedCount);
}

TEST(SVTrackableBehaviorTest, TrackingLossHidesNodeAndKeepsPose) {
    std::shared_ptr<SVTestSession> session = std::make_shared<SVTestSession>();
    session->resume();
    session->updatedTrackables.clear();

    SVPose pose(SVVector3f(0, 0, -2), SVQuaternion());
    std::shared_ptr<SVTestPlane> plane = std::make_shared<SVTestPlane>(5, pose);
    std::shared_ptr<SVTrackableBehavior> behavior = std::make_shared<SVTrackableBehavior>(plane, unsmoothedSettings());
    SVNode node(behavior);
    std::shared_ptr<SVTrackableNodeDelegate> delegate = std::make_shared<SVTrackableNodeDelegate>();
    node.addDelegate(delegate);
    node.onARFrame(createContext(session));
    ASSERT_TRUE(node.isVisible());

    plane->trackingState = SVARTrackingState::Stopped;
    plane->centerPose = SVPose(SVVector3f(5, 5, 5), SVQuaternion());
    session->updatedTrackables = { plane };
    node.onARFrame(createContext(session));

    EXPECT_FALSE(node.isVisible());
    EXPECT_EQ(SVARTrackingState::Stopped, behavior->getTrackingState());
    EXPECT_EQ(1, delegate->stateChangedCount);
    EXPECT_TRUE(node.getPosition().isEqual(pose.getPosition()));
}

TEST(SVTrackableBehaviorTest, CreateAnchorRequiresTracking) {
    std::shared_ptr<SVTestPlane> plane = std::make_shared<SVTestPlane>(1, SVPose());
    std::shared_ptr<SVTrackableBehavior> behavior = std::make_shared<SVTrackableBehavior>(plane);
    SVNode node(behavior);

    SVARAnchorAcquireStatus status = SVARAnchorAcquireStatus::ErrorUnknown;
    std::shared_ptr<SVNode> anchored = behavior->createAnchoredNode(&status);
    ASSERT_NE(nullptr, anchored);
    EXPECT_EQ(SVARAnchorAcquireStatus::Success, status);

    std::shared_ptr<SVAnchorBehavior> anchorBehavior =
        std::dynamic_pointer_cast<SVAnchorBehavior>(anchored->getTrackingBehavior());
    ASSERT_NE(nullptr, anchorBehavior);
    EXPECT_TRUE(anchorBehavior->isAnchored());

    plane->trackingState = SVARTrackingState::Paused;
    EXPECT_EQ(nullptr, behavior->createAnchor(&status));
    EXPECT_EQ(SVARAnchorAcquireStatus::ErrorNotTracking, status);
}

TEST(SVTrackableBehaviorTest, SetTrackableRederivesStateImmediately) {
    SVPose poseA(SVVector3f(0, 0, -1), SVQuaternion());
    SVPose poseB(SVVector3f(2, 0, -3), SVQuaternion());
    std::shared_ptr<SVTestPlane> planeA = std::make_shared<SVTestPlane>(1, poseA);
    std::shared_ptr<SVTestPlane> planeB = std::make_shared<SVTestPlane>(2, poseB);
    planeB->trackingState = SVARTrackingState::Paused;

    std::shared_ptr<SVTrackableBehavior> behavior = std::make_shared<SVTrackableBehavior>(planeA, unsmoothedSettings());
    SVNode node(behavior);
    std::shared_ptr<SVTrackableNodeDelegate> delegate = std::make_shared<SVTrackableNodeDelegate>();
    node.addDelegate(delegate);
    ASSERT_TRUE(node.isVisible());

    // Paused trackable: hidden at once, pose kept
    behavior->setTrackable(planeB);
    EXPECT_EQ(planeB, behavior->getTrackable());
    EXPECT_EQ(SVARTrackingState::Paused, behavior->getTrackingState());
    EXPECT_FALSE(node.isVisible());
    EXPECT_EQ(1, delegate->stateChangedCount);
    EXPECT_TRUE(node.getPosition().isEqual(poseA.getPosition()));

    // Tracking trackable: visible and at its center pose
    std::shared_ptr<SVTestPlane> planeC = std::make_shared<SVTestPlane>(3, poseB);
    behavior->setTrackable(planeC);
    EXPECT_EQ(SVARTrackingState::Tracking, behavior->getTrackingState());
    EXPECT_TRUE(node.isVisible());
    EXPECT_EQ(2, delegate->stateChangedCount);
    EXPECT_TRUE(node.getPosition().isEqual(poseB.getPosition()));

    behavior->setTrackable(nullptr);
    EXPECT_EQ(SVARTrackingState::Stopped, behavior->getTrackingState());
    EXPECT_FALSE(node.isVisible());
    SVARAnchorAcquireStatus status = SVARAnchorAcquireStatus::Success;
    EXPECT_EQ(nullptr, behavior->createAnchor(&status));
    EXPECT_EQ(SVARAnchorAcquireStatus::ErrorNotTracking, status);
}

TEST(SVTrackableBehaviorTest, SameFeatureWrapperKeepsState) {
    SVPose pose(SVVector3f(0, 0, -1), SVQuaternion());
    std::shared_ptr<SVTestPlane> plane = std::make_shared<SVTestPlane>(1, pose);
    std::shared_ptr<SVTrackableBehavior> behavior = std::make_shared<SVTrackableBehavior>(plane, unsmoothedSettings());
    SVNode node(behavior);

    std::shared_ptr<SVTestPlane> wrapper = std::make_shared<SVTestPlane>(1, SVPose(SVVector3f(4, 0, 0), SVQuaternion()));
    behavior->setTrackable(wrapper);
    EXPECT_EQ(wrapper, behavior->getTrackable());
    EXPECT_TRUE(node.getPosition().isEqual(pose.getPosition()));
}

TEST(SVTrackableBehaviorTest, CreateAnchorReportsTrackableFailure) {
    std::shared_ptr<SVTestPlane> plane = std::make_shared<SVTestPlane>(1, SVPose());
    std::shared_ptr<SVTrackableBehavior> behavior = std::make_shared<SVTrackableBehavior>(plane);
    SVNode node(behavior);

    std::vector<SVARAnchorAcquireStatus> failures = {
        SVARAnchorAcquireStatus::ErrorSessionPaused,
        SVARAnchorAcquireStatus::ErrorResourceExhausted,
        SVARAnchorAcquireStatus::ErrorUnsupported
    };
    for (SVARAnchorAcquireStatus failure : failures) {
        plane->anchorSource.failureStatus = failure;
        SVARAnchorAcquireStatus status = SVARAnchorAcquireStatus::Success;
        EXPECT_EQ(nullptr, behavior->createAnchor(&status));
        EXPECT_EQ(failure, status);
        EXPECT_EQ(nullptr, behavior->createAnchoredNode(&status));
        EXPECT_EQ(failure, status);
    }
    EXPECT_TRUE(plane->anchorSource.anchors.empty());

    plane->anchorSource.failureStatus = SVARAnchorAcquireStatus::Success;
    SVARAnchorAcquireStatus status = SVARAnchorAcquireStatus::ErrorUnknown;
    EXPECT_NE(nullptr, behavior->createAnchor(&status));
    EXPECT_EQ(SVARAnchorAcquireStatus::Success, status);
}
