//
//  SVARTracking.h
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

#ifndef SVARTracking_h
#define SVARTracking_h

#include <set>
#include <string>

/*
 Whether the tracking subsystem currently has a valid pose estimate for
 the camera, a trackable or an anchor.
 */
enum class SVARTrackingState {
    Tracking,   // Pose is valid and being updated
    Paused,     // Tracking lost for now, may resume
    Stopped     // Will never be tracked again
};

/*
 Result of asking the tracking subsystem for a new anchor. Each cause is
 reported distinctly so that callers can decide whether to retry.
 */
enum class SVARAnchorAcquireStatus {
    Success,
    ErrorNotTracking,               // The trackable or camera is not tracking
    ErrorSessionPaused,             // The session is paused or closed
    ErrorResourceExhausted,         // Too many anchors
    ErrorUnsupported,               // This trackable type cannot hold anchors
    ErrorCloudAnchorsNotConfigured, // Cloud task issued with cloud anchors disabled
    ErrorUnknown
};

/*
 State of a cloud anchor host or resolve operation, as reported by the
 anchor being hosted or resolved.
 */
enum class SVARCloudAnchorState {
    None,
    TaskInProgress,
    Success,
    ErrorInternal,
    ErrorNotAuthorized,
    ErrorServiceUnavailable,
    ErrorResourceExhausted,
    ErrorDatasetProcessingFailed,
    ErrorCloudIDNotFound,
    ErrorResolvingLocalizationNoMatch,
    ErrorResolvingSDKVersionTooOld,
    ErrorResolvingSDKVersionTooNew,
    ErrorHostingServiceUnavailable
};

inline std::set<SVARTrackingState> SVARAllTrackingStates() {
    return { SVARTrackingState::Tracking, SVARTrackingState::Paused, SVARTrackingState::Stopped };
}

inline bool SVARCloudAnchorStateIsError(SVARCloudAnchorState state) {
    return state != SVARCloudAnchorState::None &&
           state != SVARCloudAnchorState::TaskInProgress &&
           state != SVARCloudAnchorState::Success;
}

inline std::string SVARTrackingStateToString(SVARTrackingState state) {
    switch (state) {
        case SVARTrackingState::Tracking: return "TRACKING";
        case SVARTrackingState::Paused: return "PAUSED";
        case SVARTrackingState::Stopped: return "STOPPED";
    }
    return "UNKNOWN";
}

inline std::string SVARAnchorAcquireStatusToString(SVARAnchorAcquireStatus status) {
    switch (status) {
        case SVARAnchorAcquireStatus::Success: return "SUCCESS";
        case SVARAnchorAcquireStatus::ErrorNotTracking: return "ERROR_NOT_TRACKING";
        case SVARAnchorAcquireStatus::ErrorSessionPaused: return "ERROR_SESSION_PAUSED";
        case SVARAnchorAcquireStatus::ErrorResourceExhausted: return "ERROR_RESOURCE_EXHAUSTED";
        case SVARAnchorAcquireStatus::ErrorUnsupported: return "ERROR_UNSUPPORTED";
        case SVARAnchorAcquireStatus::ErrorCloudAnchorsNotConfigured: return "ERROR_CLOUD_ANCHORS_NOT_CONFIGURED";
        case SVARAnchorAcquireStatus::ErrorUnknown: return "ERROR_UNKNOWN";
    }
    return "UNKNOWN";
}

inline std::string SVARCloudAnchorStateToString(SVARCloudAnchorState state) {
    switch (state) {
        case SVARCloudAnchorState::None: return "NONE";
        case SVARCloudAnchorState::TaskInProgress: return "TASK_IN_PROGRESS";
        case SVARCloudAnchorState::Success: return "SUCCESS";
        case SVARCloudAnchorState::ErrorInternal: return "ERROR_INTERNAL";
        case SVARCloudAnchorState::ErrorNotAuthorized: return "ERROR_NOT_AUTHORIZED";
        case SVARCloudAnchorState::ErrorServiceUnavailable: return "ERROR_SERVICE_UNAVAILABLE";
        case SVARCloudAnchorState::ErrorResourceExhausted: return "ERROR_RESOURCE_EXHAUSTED";
        case SVARCloudAnchorState::ErrorDatasetProcessingFailed: return "ERROR_HOSTING_DATASET_PROCESSING_FAILED";
        case SVARCloudAnchorState::ErrorCloudIDNotFound: return "ERROR_CLOUD_ID_NOT_FOUND";
        case SVARCloudAnchorState::ErrorResolvingLocalizationNoMatch: return "ERROR_RESOLVING_LOCALIZATION_NO_MATCH";
        case SVARCloudAnchorState::ErrorResolvingSDKVersionTooOld: return "ERROR_RESOLVING_SDK_VERSION_TOO_OLD";
        case SVARCloudAnchorState::ErrorResolvingSDKVersionTooNew: return "ERROR_RESOLVING_SDK_VERSION_TOO_NEW";
        case SVARCloudAnchorState::ErrorHostingServiceUnavailable: return "ERROR_HOSTING_SERVICE_UNAVAILABLE";
    }
    return "UNKNOWN";
}

#endif /* SVARTracking_h */
