//
//  SVARUtilsARCore.h
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

#ifndef SVARUtilsARCore_h
#define SVARUtilsARCore_h

#include "ARCore_API.h"
#include "SVPose.h"
#include "SVARTracking.h"
#include "SVARSessionConfig.h"
#include "SVARPlane.h"
#include "SVARPoint.h"
#include "SVGeospatial.h"

/*
 Conversions between ARCore wrapper types and SceneViewAR types.
 */

inline SVARTrackingState SVConvertTrackingState(arcore::TrackingState state) {
    switch (state) {
        case arcore::TrackingState::Tracking:
            return SVARTrackingState::Tracking;
        case arcore::TrackingState::Paused:
            return SVARTrackingState::Paused;
        default:
            return SVARTrackingState::Stopped;
    }
}

inline SVARAnchorAcquireStatus SVConvertAnchorAcquireStatus(arcore::AnchorAcquireStatus status) {
    switch (status) {
        case arcore::AnchorAcquireStatus::Success:
            return SVARAnchorAcquireStatus::Success;
        case arcore::AnchorAcquireStatus::ErrorNotTracking:
            return SVARAnchorAcquireStatus::ErrorNotTracking;
        case arcore::AnchorAcquireStatus::ErrorSessionPaused:
            return SVARAnchorAcquireStatus::ErrorSessionPaused;
        case arcore::AnchorAcquireStatus::ErrorResourceExhausted:
            return SVARAnchorAcquireStatus::ErrorResourceExhausted;
        case arcore::AnchorAcquireStatus::ErrorCloudAnchorsNotConfigured:
            return SVARAnchorAcquireStatus::ErrorCloudAnchorsNotConfigured;
        case arcore::AnchorAcquireStatus::ErrorAnchorNotSupportedForHosting:
        case arcore::AnchorAcquireStatus::ErrorUnsupported:
            return SVARAnchorAcquireStatus::ErrorUnsupported;
        default:
            return SVARAnchorAcquireStatus::ErrorUnknown;
    }
}

inline SVARCloudAnchorState SVConvertCloudAnchorState(arcore::CloudAnchorState state) {
    switch (state) {
        case arcore::CloudAnchorState::None:
            return SVARCloudAnchorState::None;
        case arcore::CloudAnchorState::TaskInProgress:
            return SVARCloudAnchorState::TaskInProgress;
        case arcore::CloudAnchorState::Success:
            return SVARCloudAnchorState::Success;
        case arcore::CloudAnchorState::ErrorNotAuthorized:
            return SVARCloudAnchorState::ErrorNotAuthorized;
        case arcore::CloudAnchorState::ErrorResourceExhausted:
            return SVARCloudAnchorState::ErrorResourceExhausted;
        case arcore::CloudAnchorState::ErrorHostingDatasetProcessingFailed:
            return SVARCloudAnchorState::ErrorDatasetProcessingFailed;
        case arcore::CloudAnchorState::ErrorCloudIdNotFound:
            return SVARCloudAnchorState::ErrorCloudIDNotFound;
        case arcore::CloudAnchorState::ErrorResolvingSdkVersionTooOld:
            return SVARCloudAnchorState::ErrorResolvingSDKVersionTooOld;
        case arcore::CloudAnchorState::ErrorResolvingSdkVersionTooNew:
            return SVARCloudAnchorState::ErrorResolvingSDKVersionTooNew;
        case arcore::CloudAnchorState::ErrorHostingServiceUnavailable:
            return SVARCloudAnchorState::ErrorHostingServiceUnavailable;
        default:
            return SVARCloudAnchorState::ErrorInternal;
    }
}

inline SVARPlaneType SVConvertPlaneType(arcore::PlaneType type) {
    switch (type) {
        case arcore::PlaneType::HorizontalDownward:
            return SVARPlaneType::HorizontalDownward;
        case arcore::PlaneType::Vertical:
            return SVARPlaneType::Vertical;
        default:
            return SVARPlaneType::HorizontalUpward;
    }
}

inline arcore::PlaneFindingMode SVConvertPlaneFindingMode(SVARPlaneFindingMode mode) {
    switch (mode) {
        case SVARPlaneFindingMode::Horizontal:
            return arcore::PlaneFindingMode::Horizontal;
        case SVARPlaneFindingMode::Vertical:
            return arcore::PlaneFindingMode::Vertical;
        case SVARPlaneFindingMode::HorizontalAndVertical:
            return arcore::PlaneFindingMode::HorizontalAndVertical;
        default:
            return arcore::PlaneFindingMode::Disabled;
    }
}

inline arcore::DepthMode SVConvertDepthMode(SVARDepthMode mode) {
    switch (mode) {
        case SVARDepthMode::Automatic:
            return arcore::DepthMode::Automatic;
        case SVARDepthMode::RawDepthOnly:
            return arcore::DepthMode::RawDepthOnly;
        default:
            return arcore::DepthMode::Disabled;
    }
}

inline arcore::LightingMode SVConvertLightingMode(SVARLightEstimationMode mode) {
    switch (mode) {
        case SVARLightEstimationMode::AmbientIntensity:
            return arcore::LightingMode::AmbientIntensity;
        case SVARLightEstimationMode::EnvironmentalHDR:
            return arcore::LightingMode::EnvironmentalHDR;
        default:
            return arcore::LightingMode::Disabled;
    }
}

/*
 Read the given ARCore pose into an SVPose.
 */
inline SVPose SVConvertPose(arcore::Pose *pose) {
    float raw[7];
    pose->getRaw(raw);
    return SVPose::fromRaw(raw);
}

#endif /* SVARUtilsARCore_h */
