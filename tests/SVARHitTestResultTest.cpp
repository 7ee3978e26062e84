//
//  SVARHitTestResultTest.cpp
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

static const SVPose kCameraPose(SVVector3f(0, 1.5f, 0), SVQuaternion());

TEST(SVARHitTestResultTest, TypeReflectsTrackableAndPolygon) {
    std::shared_ptr<SVTestPlane> plane = std::make_shared<SVTestPlane>(1, SVPose());
    SVARHitTestResult planeHit(plane, SVPose(), 1.0f);
    EXPECT_EQ(SVARHitTestResultType::ExistingPlaneUsingExtent, planeHit.getType());

    plane->inPolygon = false;
    EXPECT_EQ(SVARHitTestResultType::ExistingPlane, planeHit.getType());

    SVARHitTestResult pointHit(std::make_shared<SVTestPoint>(2, SVPose()), SVPose(), 1.0f);
    EXPECT_EQ(SVARHitTestResultType::FeaturePoint, pointHit.getType());

    SVARHitTestResult empty(nullptr, SVPose(), 1.0f);
    EXPECT_EQ(SVARHitTestResultType::Unknown, empty.getType());
    EXPECT_FALSE(empty.isTracking());
}

TEST(SVARHitTestResultTest, FilterRejectsUnwantedPlaneTypes) {
    std::shared_ptr<SVTestPlane> wall = std::make_shared<SVTestPlane>(1, SVPose());
    wall->planeType = SVARPlaneType::Vertical;
    SVARHitTestResult hit(wall, SVPose(), 1.0f);

    SVARHitTestFilter filter;
    EXPECT_TRUE(hit.isValid(filter, kCameraPose));

    filter.planeTypes = { SVARPlaneType::HorizontalUpward };
    EXPECT_FALSE(hit.isValid(filter, kCameraPose));
}

TEST(SVARHitTestResultTest, FilterMinCameraDistance) {
    SVARHitTestResult hit(std::make_shared<SVTestPlane>(1, SVPose()), SVPose(), 1.5f);
    SVARHitTestFilter filter;
    filter.useMinCameraDistance = true;

    filter.minCameraDistance = 1.0f;
    EXPECT_TRUE(hit.isValid(filter, kCameraPose));

    filter.minCameraDistance = 2.0f;
    EXPECT_FALSE(hit.isValid(filter, kCameraPose));
}

TEST(SVARHitTestResultTest, FilterTrackingStatesAndKinds) {
    std::shared_ptr<SVTestDepthPoint> depthPoint = std::make_shared<SVTestDepthPoint>(1, SVPose());
    SVARHitTestResult hit(depthPoint, SVPose(), 1.0f);

    SVARHitTestFilter filter;
    EXPECT_TRUE(hit.isValid(filter, kCameraPose));

    filter.depthPoint = false;
    EXPECT_FALSE(hit.isValid(filter, kCameraPose));

    filter.depthPoint = true;
    depthPoint->trackingState = SVARTrackingState::Paused;
    EXPECT_FALSE(hit.isValid(filter, kCameraPose));

    filter.trackingStates = SVARAllTrackingStates();
    EXPECT_TRUE(hit.isValid(filter, kCameraPose));
}

TEST(SVARHitTestResultTest, CreateAnchorPinsToTrackableAtHitPose) {
    SVPose hitPose(SVVector3f(0.5f, 0, -1), SVQuaternion());
    std::shared_ptr<SVTestPlane> plane = std::make_shared<SVTestPlane>(1, SVPose());
    SVARHitTestResult hit(plane, hitPose, 1.0f);

    SVARAnchorAcquireStatus status = SVARAnchorAcquireStatus::ErrorUnknown;
    std::shared_ptr<SVARAnchor> anchor = hit.createAnchor(&status);
    ASSERT_NE(nullptr, anchor);
    EXPECT_EQ(SVARAnchorAcquireStatus::Success, status);
    EXPECT_EQ(hitPose, anchor->getPose());

    plane->trackingState = SVARTrackingState::Paused;
    EXPECT_EQ(nullptr, hit.createAnchor(&status));
    EXPECT_EQ(SVARAnchorAcquireStatus::ErrorNotTracking, status);

    SVARHitTestResult empty(nullptr, hitPose, 1.0f);
    EXPECT_EQ(nullptr, empty.createAnchor(&status));
    EXPECT_EQ(SVARAnchorAcquireStatus::ErrorUnsupported, status);
}
