//
//  SVNode.cpp
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

#include "SVNode.h"
#include "SVNodeDelegate.h"
#include "SVTrackingBehavior.h"
#include "SVTrackingSettings.h"
#include "SVARFrameContext.h"
#include <algorithm>
#include <stdexcept>

// Smoothing snaps to the target once within these tolerances
static const float kSmoothPositionEpsilon = 0.0001f;
static const float kSmoothRotationEpsilon = 0.00001f;

SVNode::SVNode(std::shared_ptr<SVTrackingBehavior> behavior) :
    _behavior(behavior),
    _destroyed(false),
    _scale(1, 1, 1),
    _smoothing(false),
    _smoothSpeed(kDefaultSmoothSpeed),
    _transformLocked(false),
    _visible(true),
    _effectiveVisible(true) {

    if (_behavior) {
        _behavior->attachToNode(this);
    }
    _effectiveVisible = isVisible();
}

SVNode::~SVNode() {
    if (_behavior && !_destroyed) {
        _behavior->detachFromNode(this);
    }
}

void SVNode::destroy() {
    if (_destroyed) {
        return;
    }
    _destroyed = true;
    if (_behavior) {
        _behavior->detachFromNode(this);
    }

    std::vector<std::shared_ptr<SVNode>> children = _children;
    for (std::shared_ptr<SVNode> &child : children) {
        child->destroy();
    }
    removeFromParentNode();
}

#pragma mark - Transform

void SVNode::checkTransformUnlocked() const {
    if (_transformLocked) {
        throw std::logic_error("Transform of node '" + _name + "' is locked");
    }
}

void SVNode::setPosition(SVVector3f position) {
    checkTransformUnlocked();
    _smoothing = false;
    _position = position;
}

void SVNode::setRotation(SVQuaternion rotation) {
    checkTransformUnlocked();
    _smoothing = false;
    _rotation = rotation;
}

void SVNode::setScale(SVVector3f scale) {
    checkTransformUnlocked();
    _scale = scale;
}

void SVNode::transform(SVVector3f position, SVQuaternion rotation, bool smooth) {
    checkTransformUnlocked();

    if (smooth && _smoothSpeed > 0) {
        _targetPosition = position;
        _targetRotation = rotation;
        _smoothing = !(_position.isEqual(position) && _rotation == rotation);
    }
    else {
        _smoothing = false;
        setTransformInternal(position, rotation);
    }
}

void SVNode::setTransformInternal(SVVector3f position, SVQuaternion rotation) {
    _position = position;
    _rotation = rotation;
}

void SVNode::applySmoothing(double deltaSeconds) {
    if (!_smoothing) {
        return;
    }

    float factor = (float) std::max(0.0, std::min(deltaSeconds * _smoothSpeed, 1.0));
    _position = _position.interpolate(_targetPosition, factor);
    _rotation = SVQuaternion::slerp(_rotation, _targetRotation, factor);

    if (_position.distance(_targetPosition) < kSmoothPositionEpsilon &&
        _rotation.isEqual(_targetRotation, kSmoothRotationEpsilon)) {
        _position = _targetPosition;
        _rotation = _targetRotation;
        _smoothing = false;
    }
}

SVMatrix4f SVNode::getTransform() const {
    return SVMatrix4f::fromTRS(_position, _rotation, _scale);
}

SVMatrix4f SVNode::getWorldTransform() const {
    std::shared_ptr<SVNode> parent = _parent.lock();
    if (!parent) {
        return getTransform();
    }
    return parent->getWorldTransform().multiply(getTransform());
}

SVPose SVNode::getWorldPose() const {
    return SVPose::fromMatrix(getWorldTransform());
}

#pragma mark - Visibility

void SVNode::setVisible(bool visible) {
    _visible = visible;
    updateVisibility();
}

bool SVNode::isVisible() const {
    return _visible && (!_behavior || _behavior->isVisible());
}

void SVNode::updateVisibility() {
    bool visible = isVisible();
    if (visible == _effectiveVisible) {
        return;
    }
    _effectiveVisible = visible;
    dispatchToDelegates([this, visible](SVNodeDelegate &delegate) {
        delegate.onVisibilityChanged(*this, visible);
    });
}

#pragma mark - Hierarchy

void SVNode::addChildNode(std::shared_ptr<SVNode> node) {
    if (!node || node.get() == this) {
        return;
    }
    node->removeFromParentNode();
    node->_parent = shared_from_this();
    _children.push_back(node);
}

void SVNode::removeFromParentNode() {
    std::shared_ptr<SVNode> parent = _parent.lock();
    if (!parent) {
        return;
    }
    _parent.reset();

    // The parent may hold the last reference to this node: keep it alive
    // until the erase is done
    std::shared_ptr<SVNode> self;
    std::vector<std::shared_ptr<SVNode>> &siblings = parent->_children;
    auto it = std::find_if(siblings.begin(), siblings.end(),
                           [this](const std::shared_ptr<SVNode> &node) {
                               return node.get() == this;
                           });
    if (it != siblings.end()) {
        self = *it;
        siblings.erase(it);
    }
}

void SVNode::removeAllChildren() {
    std::vector<std::shared_ptr<SVNode>> children = _children;
    for (std::shared_ptr<SVNode> &child : children) {
        child->removeFromParentNode();
    }
}

#pragma mark - Delegates

void SVNode::addDelegate(std::shared_ptr<SVNodeDelegate> delegate) {
    _delegates.push_back(delegate);
}

void SVNode::removeDelegate(std::shared_ptr<SVNodeDelegate> delegate) {
    _delegates.erase(std::remove_if(_delegates.begin(), _delegates.end(),
                                    [delegate](const std::weak_ptr<SVNodeDelegate> &candidate) {
                                        std::shared_ptr<SVNodeDelegate> locked = candidate.lock();
                                        return !locked || locked == delegate;
                                    }),
                     _delegates.end());
}

void SVNode::dispatchToDelegates(const std::function<void(SVNodeDelegate &)> &fn) {
    // Copy first: delegates may add or remove delegates while handling
    std::vector<std::shared_ptr<SVNodeDelegate>> delegates;
    for (std::weak_ptr<SVNodeDelegate> &delegate_w : _delegates) {
        std::shared_ptr<SVNodeDelegate> delegate = delegate_w.lock();
        if (delegate) {
            delegates.push_back(delegate);
        }
    }
    for (std::shared_ptr<SVNodeDelegate> &delegate : delegates) {
        fn(*delegate);
    }
}

#pragma mark - Frame Update

void SVNode::onARFrame(const SVARFrameContext &context) {
    if (_destroyed) {
        return;
    }
    if (_behavior) {
        _behavior->onARFrame(*this, context);
    }
    applySmoothing(context.getDeltaSeconds());
}
