//
//  SVGeospatial.h
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

#ifndef SVGeospatial_h
#define SVGeospatial_h

#include <string>
#include "SVQuaternion.h"
#include "SVARTracking.h"

/*
 * Represents the Earth tracking state from the Geospatial API.
 */
enum class SVEarthTrackingState {
    Tracking,   // Earth is being tracked with VPS/GPS fusion
    Paused,     // Tracking is paused (e.g., app backgrounded)
    Stopped     // No tracking available
};

/*
 * Represents the type of geospatial anchor.
 */
enum class SVGeospatialAnchorType {
    WGS84,      // Absolute position on WGS84 ellipsoid
    Terrain,    // Relative to terrain surface
    Rooftop     // Relative to building rooftop
};

/*
 * Represents the resolve state for async geospatial anchors (terrain/rooftop).
 */
enum class SVGeospatialAnchorResolveState {
    None,
    Success,
    TaskInProgress,
    ErrorInternal,
    ErrorNotAuthorized,
    ErrorUnsupportedLocation
};

/*
 * Geospatial pose of the camera in Earth coordinates (WGS84, same as GPS).
 */
struct SVGeospatialPose {
    double latitude;        // Degrees (-90 to 90)
    double longitude;       // Degrees (-180 to 180)
    double altitude;        // Meters above WGS84 ellipsoid

    // Orientation in East-Up-South (EUS) coordinate system
    SVQuaternion eusQuaternion;

    double horizontalAccuracy;  // Meters
    double verticalAccuracy;    // Meters
    double orientationYawAccuracy;  // Degrees

    SVGeospatialPose() :
        latitude(0),
        longitude(0),
        altitude(0),
        horizontalAccuracy(0),
        verticalAccuracy(0),
        orientationYawAccuracy(0) {}

    bool isValid() const {
        return latitude != 0 || longitude != 0;
    }
};

/*
 * Parameters of a terrain or rooftop anchor request. The altitude is
 * relative to the terrain or rooftop, not to the ellipsoid.
 */
struct SVGeospatialAnchorRequest {
    SVGeospatialAnchorType type;
    double latitude;
    double longitude;
    double altitude;
    SVQuaternion eusQuaternion;

    SVGeospatialAnchorRequest(SVGeospatialAnchorType type, double latitude, double longitude,
                              double altitude, SVQuaternion eusQuaternion) :
        type(type),
        latitude(latitude),
        longitude(longitude),
        altitude(altitude),
        eusQuaternion(eusQuaternion) {}
};

inline SVEarthTrackingState SVEarthTrackingStateFromTrackingState(SVARTrackingState state) {
    switch (state) {
        case SVARTrackingState::Tracking: return SVEarthTrackingState::Tracking;
        case SVARTrackingState::Paused: return SVEarthTrackingState::Paused;
        case SVARTrackingState::Stopped: return SVEarthTrackingState::Stopped;
    }
    return SVEarthTrackingState::Stopped;
}

inline std::string SVEarthTrackingStateToString(SVEarthTrackingState state) {
    switch (state) {
        case SVEarthTrackingState::Tracking: return "TRACKING";
        case SVEarthTrackingState::Paused: return "PAUSED";
        case SVEarthTrackingState::Stopped: return "STOPPED";
    }
    return "UNKNOWN";
}

inline std::string SVGeospatialAnchorTypeToString(SVGeospatialAnchorType type) {
    switch (type) {
        case SVGeospatialAnchorType::WGS84: return "WGS84";
        case SVGeospatialAnchorType::Terrain: return "TERRAIN";
        case SVGeospatialAnchorType::Rooftop: return "ROOFTOP";
    }
    return "UNKNOWN";
}

inline std::string SVGeospatialAnchorResolveStateToString(SVGeospatialAnchorResolveState state) {
    switch (state) {
        case SVGeospatialAnchorResolveState::None: return "NONE";
        case SVGeospatialAnchorResolveState::Success: return "SUCCESS";
        case SVGeospatialAnchorResolveState::TaskInProgress: return "TASK_IN_PROGRESS";
        case SVGeospatialAnchorResolveState::ErrorInternal: return "ERROR_INTERNAL";
        case SVGeospatialAnchorResolveState::ErrorNotAuthorized: return "ERROR_NOT_AUTHORIZED";
        case SVGeospatialAnchorResolveState::ErrorUnsupportedLocation: return "ERROR_UNSUPPORTED_LOCATION";
    }
    return "UNKNOWN";
}

#endif /* SVGeospatial_h */
