#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>
#include <gtest/gtest.h>
#include <numbers>
#include <random>

#include "geometry/pose.hpp"

constexpr int RANDOM_SEED = 8128;
using namespace arp::geometry;

class PoseTest : public ::testing::Test {
protected:
    void SetUp() override {
        rng.seed(RANDOM_SEED);
        angle_dist = std::uniform_real_distribution<float>(-std::numbers::pi, std::numbers::pi);
        translation_dist = std::uniform_real_distribution<float>(-10.0f, 10.0f);
    }

    bool matricesEqual(const glm::mat4& a, const glm::mat4& b, float tolerance = 1e-5f) {
        for (int i = 0; i < 4; ++i) {
            for (int j = 0; j < 4; ++j) {
                if (std::abs(a[i][j] - b[i][j]) > tolerance) {
                    return false;
                }
            }
        }
        return true;
    }

    bool vectorsEqual(const glm::vec3& a, const glm::vec3& b, float tolerance = 1e-5f) {
        return glm::length(a - b) < tolerance;
    }

    Pose generateRandomPose() {
        glm::quat q = glm::angleAxis(angle_dist(rng), glm::vec3(0, 0, 1)) *
                      glm::angleAxis(angle_dist(rng), glm::vec3(0, 1, 0)) *
                      glm::angleAxis(angle_dist(rng), glm::vec3(1, 0, 0));
        return Pose(q, glm::vec3(translation_dist(rng), translation_dist(rng), translation_dist(rng)));
    }

    std::mt19937 rng;
    std::uniform_real_distribution<float> angle_dist;
    std::uniform_real_distribution<float> translation_dist;
};

TEST_F(PoseTest, DefaultIsIdentity) {
    Pose pose;
    EXPECT_TRUE(pose.hasIdentityOrientation());
    EXPECT_TRUE(vectorsEqual(pose.getPosition(), glm::vec3(0.0f)));
    EXPECT_TRUE(matricesEqual(pose.toMat4(), glm::mat4(1.0f)));
}

TEST_F(PoseTest, MatrixRoundtripConversion) {
    for (int i = 0; i < 10; ++i) {
        Pose original = generateRandomPose();
        Pose reconstructed(original.toMat4());

        EXPECT_TRUE(original.isApprox(reconstructed, 1e-4f)) << "Test " << i << " failed: matrix roundtrip mismatch";
    }
}

TEST_F(PoseTest, InverseComposesToIdentity) {
    for (int i = 0; i < 10; ++i) {
        Pose pose = generateRandomPose();
        Pose identity = pose * pose.inv();

        EXPECT_TRUE(identity.hasIdentityOrientation(1e-4f)) << "Test " << i;
        EXPECT_TRUE(vectorsEqual(identity.getPosition(), glm::vec3(0.0f), 1e-4f)) << "Test " << i;
    }
}

TEST_F(PoseTest, CompositionMatchesMatrixProduct) {
    for (int i = 0; i < 10; ++i) {
        Pose a = generateRandomPose();
        Pose b = generateRandomPose();

        EXPECT_TRUE(matricesEqual((a * b).toMat4(), a.toMat4() * b.toMat4(), 1e-4f)) << "Test " << i;
    }
}

TEST_F(PoseTest, ForwardIsNegativeZ) {
    Pose pose;
    EXPECT_TRUE(vectorsEqual(pose.forward(), glm::vec3(0, 0, -1)));
    EXPECT_TRUE(vectorsEqual(pose.up(), glm::vec3(0, 1, 0)));
    EXPECT_TRUE(vectorsEqual(pose.right(), glm::vec3(1, 0, 0)));
}

TEST_F(PoseTest, PitchDownLooksAtFloor) {
    Pose pose = Pose::fromPitchYawDegrees(glm::vec3(0, 1.5f, 0), -90.0f, 0.0f);
    EXPECT_TRUE(vectorsEqual(pose.forward(), glm::vec3(0, -1, 0)));
    EXPECT_TRUE(vectorsEqual(pose.up(), glm::vec3(0, 0, -1)));
}

TEST_F(PoseTest, YawTurnsLeft) {
    Pose pose = Pose::fromPitchYawDegrees(glm::vec3(0.0f), 0.0f, 90.0f);
    EXPECT_TRUE(vectorsEqual(pose.forward(), glm::vec3(-1, 0, 0)));
}

// Moving along forward must match the camera-space translation (0, 0, -d)
TEST_F(PoseTest, TranslatedAlongForwardMatchesLocalTranslation) {
    for (int i = 0; i < 10; ++i) {
        Pose camera = generateRandomPose();
        Pose moved = camera.translatedAlongForward(0.2f);

        glm::mat4 expected = glm::translate(camera.toMat4(), glm::vec3(0.0f, 0.0f, -0.2f));

        EXPECT_TRUE(matricesEqual(moved.toMat4(), expected, 1e-4f)) << "Test " << i;
        EXPECT_NEAR(glm::length(moved.getPosition() - camera.getPosition()), 0.2f, 1e-5f);
    }
}

TEST_F(PoseTest, TransformPointAndVector) {
    Pose pose = Pose::fromPitchYawDegrees(glm::vec3(1, 2, 3), 0.0f, 90.0f);

    EXPECT_TRUE(vectorsEqual(pose.transformVector(glm::vec3(0, 0, -1)), glm::vec3(-1, 0, 0)));
    EXPECT_TRUE(vectorsEqual(pose.transformPoint(glm::vec3(0, 0, -1)), glm::vec3(0, 2, 3)));
    EXPECT_TRUE(vectorsEqual(pose.inv().transformPoint(glm::vec3(0, 2, 3)), glm::vec3(0, 0, -1), 1e-5f));
}

TEST_F(PoseTest, OrthonormalizesScaledMatrix) {
    glm::mat4 m = glm::rotate(glm::mat4(1.0f), 0.7f, glm::vec3(0, 1, 0));
    m = glm::scale(m, glm::vec3(2.0f));
    m[3] = glm::vec4(4, 5, 6, 1);

    Pose pose(m);
    EXPECT_NEAR(glm::length(pose.getOrientation()), 1.0f, 1e-5f);
    EXPECT_TRUE(vectorsEqual(pose.getPosition(), glm::vec3(4, 5, 6)));
    EXPECT_TRUE(pose.isApprox(Pose(glm::angleAxis(0.7f, glm::vec3(0, 1, 0)), glm::vec3(4, 5, 6)), 1e-4f));
}

TEST_F(PoseTest, QuaternionSignDoesNotMatter) {
    glm::quat q = glm::angleAxis(1.0f, glm::normalize(glm::vec3(1, 2, 3)));
    Pose a(q, glm::vec3(1.0f));
    Pose b(-q, glm::vec3(1.0f));
    EXPECT_TRUE(a.isApprox(b));
}
