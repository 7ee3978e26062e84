//
//  SVNode.h
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

#ifndef SVNode_h
#define SVNode_h

#include <memory>
#include <vector>
#include <string>
#include <functional>
#include "SVVector3f.h"
#include "SVQuaternion.h"
#include "SVMatrix4f.h"
#include "SVPose.h"

class SVNodeDelegate;
class SVTrackingBehavior;
struct SVARFrameContext;

/*
 A node in the AR scene graph. A node has a local transform relative to its
 parent and an optional tracking behavior that reconciles the transform
 against the tracking subsystem each frame (following a trackable, an
 anchor, or a placement hit test).
 */
class SVNode : public std::enable_shared_from_this<SVNode> {
public:

    /*
     Create a node driven by the given behavior. A node without a behavior
     is positioned manually.
     */
    SVNode(std::shared_ptr<SVTrackingBehavior> behavior = nullptr);
    virtual ~SVNode();

    const std::string &getName() const {
        return _name;
    }
    void setName(std::string name) {
        _name = name;
    }

    const std::shared_ptr<SVTrackingBehavior> &getTrackingBehavior() const {
        return _behavior;
    }

    /*
     Release the node's tracking resources (its anchor, if any) and detach
     it and its children from the scene graph. Called automatically when
     the node is deleted.
     */
    void destroy();

#pragma mark - Transform

    const SVVector3f &getPosition() const {
        return _position;
    }
    const SVQuaternion &getRotation() const {
        return _rotation;
    }
    const SVVector3f &getScale() const {
        return _scale;
    }

    /*
     Direct transform setters. These stop any smoothing in progress, and
     throw std::logic_error if the transform is locked.
     */
    void setPosition(SVVector3f position);
    void setRotation(SVQuaternion rotation);
    void setScale(SVVector3f scale);

    /*
     Move the node to the given position and rotation, either immediately
     or smoothly over the next frames at the node's smooth speed.
     */
    void transform(SVVector3f position, SVQuaternion rotation, bool smooth);

    /*
     Smoothing speed, in 1/s. Each frame covers (frame interval * speed) of
     the remaining distance, clamped to the whole distance.
     */
    float getSmoothSpeed() const {
        return _smoothSpeed;
    }
    void setSmoothSpeed(float speed) {
        _smoothSpeed = speed;
    }
    bool isSmoothing() const {
        return _smoothing;
    }
    const SVVector3f &getTargetPosition() const {
        return _smoothing ? _targetPosition : _position;
    }
    const SVQuaternion &getTargetRotation() const {
        return _smoothing ? _targetRotation : _rotation;
    }

    /*
     A locked transform is driven from outside the node (e.g. the camera).
     Mutating it throws std::logic_error.
     */
    bool isTransformLocked() const {
        return _transformLocked;
    }
    void setTransformLocked(bool locked) {
        _transformLocked = locked;
    }

    SVMatrix4f getTransform() const;

    /*
     The transform of this node in world space: the product of all ancestor
     transforms and this node's transform.
     */
    SVMatrix4f getWorldTransform() const;
    SVPose getWorldPose() const;

#pragma mark - Visibility

    /*
     The visibility set by the application, independent of tracking.
     */
    bool isBaseVisible() const {
        return _visible;
    }
    void setVisible(bool visible);

    /*
     Effective visibility: base visibility combined with the tracking
     behavior's tracking state filters.
     */
    bool isVisible() const;

    /*
     Recompute effective visibility, notifying delegates if it changed.
     */
    void updateVisibility();

#pragma mark - Hierarchy

    void addChildNode(std::shared_ptr<SVNode> node);
    void removeFromParentNode();
    void removeAllChildren();

    std::shared_ptr<SVNode> getParentNode() const {
        return _parent.lock();
    }
    const std::vector<std::shared_ptr<SVNode>> &getChildNodes() const {
        return _children;
    }

#pragma mark - Delegates

    void addDelegate(std::shared_ptr<SVNodeDelegate> delegate);
    void removeDelegate(std::shared_ptr<SVNodeDelegate> delegate);

    /*
     Invoke the given function on every live delegate.
     */
    void dispatchToDelegates(const std::function<void(SVNodeDelegate &)> &fn);

#pragma mark - Frame Update

    /*
     Run this node's tracking behavior for the given frame, then advance
     smoothing. Children are not visited; SVARScene walks the hierarchy.
     */
    void onARFrame(const SVARFrameContext &context);

    /*
     Advance smoothing by the given number of seconds.
     */
    void applySmoothing(double deltaSeconds);

private:

    std::string _name;
    std::shared_ptr<SVTrackingBehavior> _behavior;
    bool _destroyed;

    SVVector3f _position;
    SVQuaternion _rotation;
    SVVector3f _scale;

    bool _smoothing;
    float _smoothSpeed;
    SVVector3f _targetPosition;
    SVQuaternion _targetRotation;

    bool _transformLocked;

    bool _visible;
    bool _effectiveVisible;

    std::weak_ptr<SVNode> _parent;
    std::vector<std::shared_ptr<SVNode>> _children;

    std::vector<std::weak_ptr<SVNodeDelegate>> _delegates;

    void checkTransformUnlocked() const;

    /*
     Set the transform regardless of the lock, without touching smoothing.
     */
    void setTransformInternal(SVVector3f position, SVQuaternion rotation);

    friend class SVARScene;

};

#endif /* SVNode_h */
