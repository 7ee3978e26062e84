//
//  SVARSessionARCore.h
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

#ifndef SVARSessionARCore_h
#define SVARSessionARCore_h

#include <memory>
#include "SVARSession.h"
#include "ARCore_API.h"

/*
 SVARSession backed by an ARCore session. All methods must be invoked on
 the rendering thread that owns the ARCore session.
 */
class SVARSessionARCore : public SVARSession {
public:

  SVARSessionARCore(std::shared_ptr<arcore::Session> session);
  virtual ~SVARSessionARCore();

  /*
   The external OES texture ARCore writes the camera image into. Must be
   set before the first update.
   */
  void setCameraTextureName(int32_t textureId);

  bool isDepthModeSupported(SVARDepthMode mode) const;
  bool isGeospatialModeSupported() const;
  SVEarthTrackingState getEarthTrackingState() const;
  SVGeospatialPose getCameraGeospatialPose() const;

  const std::shared_ptr<arcore::Session> &getSessionInternal() const {
    return _session;
  }

protected:

  bool applyConfig(const SVARSessionConfig &config);
  bool resumeSession();
  void pauseSession();
  void closeSession();
  void applyDisplayGeometry(int rotation, int width, int height);
  std::shared_ptr<SVARFrame> updateFrame();

  std::shared_ptr<SVARAnchor> acquireAnchor(const SVPose &pose, SVARAnchorAcquireStatus *outStatus);
  std::shared_ptr<SVARAnchorTask> startHostCloudAnchor(const std::shared_ptr<SVARAnchor> &anchor, int ttlDays,
                                                       SVARAnchorAcquireStatus *outStatus);
  std::shared_ptr<SVARAnchorTask> startResolveCloudAnchor(const std::string &cloudAnchorId,
                                                          SVARAnchorAcquireStatus *outStatus);
  std::shared_ptr<SVARAnchorTask> startResolveGeospatialAnchor(const SVGeospatialAnchorRequest &request,
                                                               SVARAnchorAcquireStatus *outStatus);

private:

  std::shared_ptr<arcore::Session> _session;
  arcore::UpdateMode _updateMode;
  int _frameCount;

};

#endif /* SVARSessionARCore_h */
