/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "geometry/pose.hpp"

namespace arp {
    namespace geometry {

        namespace {
            const glm::vec3 LOCAL_FORWARD{0.0f, 0.0f, -1.0f};
            const glm::vec3 LOCAL_UP{0.0f, 1.0f, 0.0f};
            const glm::vec3 LOCAL_RIGHT{1.0f, 0.0f, 0.0f};
        } // namespace

        Pose::Pose()
            : m_orientation(glm::identity<glm::quat>()),
              m_position(0.0f, 0.0f, 0.0f) {
        }

        Pose::Pose(const glm::vec3& position)
            : m_orientation(glm::identity<glm::quat>()),
              m_position(position) {
        }

        Pose::Pose(const glm::quat& orientation, const glm::vec3& position)
            : m_orientation(glm::normalize(orientation)),
              m_position(position) {
        }

        Pose Pose::fromPitchYawDegrees(const glm::vec3& position, float pitch_deg, float yaw_deg) {
            const glm::quat yaw = glm::angleAxis(glm::radians(yaw_deg), LOCAL_UP);
            const glm::quat pitch = glm::angleAxis(glm::radians(pitch_deg), LOCAL_RIGHT);
            return Pose(yaw * pitch, position);
        }

        glm::mat4 Pose::toMat4() const {
            glm::mat4 result = glm::mat4_cast(m_orientation);
            result[3] = glm::vec4(m_position, 1.0f);
            return result;
        }

        Pose Pose::operator*(const Pose& other) const {
            return Pose(m_orientation * other.m_orientation,
                        m_position + (m_orientation * other.m_position));
        }

        Pose Pose::inv() const {
            const glm::quat inverse_orientation = glm::conjugate(m_orientation);
            return Pose(inverse_orientation, -(inverse_orientation * m_position));
        }

        glm::vec3 Pose::forward() const {
            return m_orientation * LOCAL_FORWARD;
        }

        glm::vec3 Pose::up() const {
            return m_orientation * LOCAL_UP;
        }

        glm::vec3 Pose::right() const {
            return m_orientation * LOCAL_RIGHT;
        }

        Pose Pose::translatedAlongForward(float distance) const {
            return Pose(m_orientation, m_position + forward() * distance);
        }

        glm::vec3 Pose::transformPoint(const glm::vec3& point) const {
            return (m_orientation * point) + m_position;
        }

        glm::vec3 Pose::transformVector(const glm::vec3& vector) const {
            return m_orientation * vector;
        }

        bool Pose::isApprox(const Pose& other, float eps) const {
            if (glm::length(m_position - other.m_position) > eps) {
                return false;
            }
            // q and -q describe the same rotation
            const float d = glm::abs(glm::dot(m_orientation, other.m_orientation));
            return glm::abs(1.0f - d) <= eps;
        }

        bool Pose::hasIdentityOrientation(float eps) const {
            if (glm::abs(glm::abs(m_orientation.w) - 1.0f) > eps) {
                return false;
            }
            return glm::length(glm::vec3(m_orientation.x, m_orientation.y, m_orientation.z)) <= eps;
        }

    } // namespace geometry
} // namespace arp
