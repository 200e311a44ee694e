/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

namespace arp {
    namespace geometry {

        // Rigid world-space pose. Cameras look down their local -Z axis,
        // the same convention the tracking backends report poses in.
        class Pose {
        private:
            glm::quat m_orientation; // Unit quaternion
            glm::vec3 m_position;

        public:
            // Identity pose at the origin
            Pose();

            explicit Pose(const glm::vec3& position);

            Pose(const glm::quat& orientation, const glm::vec3& position);

            // Pitch about X, then yaw about Y, both in degrees
            static Pose fromPitchYawDegrees(const glm::vec3& position, float pitch_deg, float yaw_deg);

            glm::mat4 toMat4() const;

            // this * other: other is expressed in this pose's local frame
            Pose operator*(const Pose& other) const;

            Pose inv() const;

            const glm::quat& getOrientation() const { return m_orientation; }
            const glm::vec3& getPosition() const { return m_position; }

            glm::vec3 forward() const;
            glm::vec3 up() const;
            glm::vec3 right() const;

            // Same orientation, moved `distance` units along forward().
            // Equivalent to toMat4() * translate(0, 0, -distance).
            Pose translatedAlongForward(float distance) const;

            glm::vec3 transformPoint(const glm::vec3& point) const;
            glm::vec3 transformVector(const glm::vec3& vector) const;

            bool isApprox(const Pose& other, float eps = 1e-5f) const;
            bool hasIdentityOrientation(float eps = 1e-6f) const;
        };

    } // namespace geometry
} // namespace arp
