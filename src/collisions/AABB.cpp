/* Copyright (c) 2025 Sentinel Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace SentinelEngine {

namespace {
float pointSegmentDistanceSquared(const Vector2D& p, const Vector2D& a, const Vector2D& b) {
    Vector2D ab = b - a;
    float lenSq = ab.lengthSquared();
    if (lenSq <= 0.0f) {
        return Vector2D::distanceSquared(p, a);
    }
    float t = std::clamp((p - a).dot(ab) / lenSq, 0.0f, 1.0f);
    return Vector2D::distanceSquared(p, a + ab * t);
}
} // namespace

bool AABB::intersects(const AABB& other) const {
    // Use non-strict separation so edge-touching is NOT a collision
    if (right() <= other.left() || other.right() <= left()) return false;
    if (bottom() <= other.top() || other.bottom() <= top()) return false;
    return true;
}

bool AABB::contains(const Vector2D& p) const {
    return p.getX() >= left() && p.getX() <= right() &&
           p.getY() >= top()  && p.getY() <= bottom();
}

Vector2D AABB::closestPoint(const Vector2D& p) const {
    return Vector2D{std::clamp(p.getX(), left(), right()),
                    std::clamp(p.getY(), top(), bottom())};
}

bool AABB::overlapsCircle(const Vector2D& c, float radius) const {
    return Vector2D::distanceSquared(c, closestPoint(c)) < radius * radius;
}

bool AABB::segmentIntersects(const Vector2D& a, const Vector2D& b) const {
    // Slab test over t in [0,1]
    float tMin = 0.0f;
    float tMax = 1.0f;
    const float origin[2] = {a.getX(), a.getY()};
    const float dir[2] = {b.getX() - a.getX(), b.getY() - a.getY()};
    const float lo[2] = {left(), top()};
    const float hi[2] = {right(), bottom()};

    for (int axis = 0; axis < 2; ++axis) {
        if (std::fabs(dir[axis]) < 1e-8f) {
            if (origin[axis] < lo[axis] || origin[axis] > hi[axis]) {
                return false;
            }
            continue;
        }
        float inv = 1.0f / dir[axis];
        float t1 = (lo[axis] - origin[axis]) * inv;
        float t2 = (hi[axis] - origin[axis]) * inv;
        if (t1 > t2) std::swap(t1, t2);
        tMin = std::max(tMin, t1);
        tMax = std::min(tMax, t2);
        if (tMin > tMax) {
            return false;
        }
    }
    return true;
}

float AABB::segmentDistanceSquared(const Vector2D& a, const Vector2D& b) const {
    if (segmentIntersects(a, b)) {
        return 0.0f;
    }

    // Disjoint convex shapes: the minimum is between a vertex of one and the other
    float best = std::min(Vector2D::distanceSquared(a, closestPoint(a)),
                          Vector2D::distanceSquared(b, closestPoint(b)));
    const Vector2D corners[4] = {Vector2D(left(), top()), Vector2D(right(), top()),
                                 Vector2D(left(), bottom()), Vector2D(right(), bottom())};
    for (const auto& corner : corners) {
        best = std::min(best, pointSegmentDistanceSquared(corner, a, b));
    }
    return best;
}

} // namespace SentinelEngine
