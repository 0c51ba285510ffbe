#include <gtest/gtest.h>

#include <Eigen/Dense>
#include <cmath>
#include <numbers>

#include "sdc-sim/src/Environment/EarthConstants.hpp"
#include "sdc-sim/src/Environment/FrameTransforms.hpp"
#include "sdc-sim/src/Environment/ReferenceFrame.hpp"
#include "sdc-sim/src/Environment/SiderealTime.hpp"
#include "sdc-sim/src/Rotation/RotationMatrix.hpp"
#include "sdc-sim/src/Utils/Errors.hpp"

using namespace sdc_sim;

namespace
{

constexpr double kPi = std::numbers::pi;

double maxAbsDifference(const Eigen::Matrix3d& a, const Eigen::Matrix3d& b)
{
  return (a - b).cwiseAbs().maxCoeff();
}

}  // namespace

// ============================================================================
// Frame Metadata
// ============================================================================

TEST(ReferenceFrameTest, MetadataTable)
{
  EXPECT_EQ(frameInfo(FrameId::ECI).name, "ECI");
  EXPECT_TRUE(frameInfo(FrameId::ECI).inertial);
  EXPECT_EQ(frameInfo(FrameId::ECEF).description, "Earth-Centered Earth-Fixed");
  EXPECT_FALSE(frameInfo(FrameId::ECEF).inertial);
  EXPECT_EQ(toString(FrameId::LVLH), "LVLH");
  EXPECT_EQ(toString(FrameId::Body), "Body");
}

TEST(ReferenceFrameTest, MetadataIsCompileTimeData)
{
  static_assert(frameInfo(FrameId::ECI).inertial);
  static_assert(toString(FrameId::ECEF) == "ECEF");
  SUCCEED();
}

// ============================================================================
// ECI / ECEF
// ============================================================================

TEST(FrameTransformsTest, EcefAlignedWithEciAtEpoch)
{
  EXPECT_LT(maxAbsDifference(eciToEcef(0.0), Eigen::Matrix3d::Identity()),
            1e-15);
}

TEST(FrameTransformsTest, EcefIsIdentityAfterOneSiderealRotation)
{
  double const siderealDay = 2.0 * kPi / earth::kEarthRotationRate;
  EXPECT_LT(
    maxAbsDifference(eciToEcef(siderealDay), Eigen::Matrix3d::Identity()),
    1e-12);
}

TEST(FrameTransformsTest, EcefIsPureZRotation)
{
  Eigen::Matrix3d const r = eciToEcef(1234.5);
  EXPECT_TRUE(isValidRotation(r));
  EXPECT_DOUBLE_EQ(r(2, 2), 1.0);
  EXPECT_DOUBLE_EQ(r(0, 2), 0.0);
  EXPECT_DOUBLE_EQ(r(2, 0), 0.0);
}

TEST(FrameTransformsTest, EcefComponentsOfFixedInertialPoint)
{
  // After a quarter rotation the inertial X axis appears at -Y in ECEF
  double const quarterDay = 0.5 * kPi / earth::kEarthRotationRate;
  Eigen::Vector3d const ecef =
    transformVector(eciToEcef(quarterDay), Eigen::Vector3d::UnitX());
  EXPECT_NEAR(ecef.x(), 0.0, 1e-12);
  EXPECT_NEAR(ecef.y(), -1.0, 1e-12);
}

TEST(FrameTransformsTest, EcefToEciIsInverse)
{
  double const t = 5000.0;
  EXPECT_LT(maxAbsDifference(ecefToEci(t) * eciToEcef(t),
                             Eigen::Matrix3d::Identity()),
            1e-15);
  EXPECT_LT(maxAbsDifference(ecefToEci(t), eciToEcef(t).transpose()), 1e-15);
}

TEST(FrameTransformsTest, GmstMatrixMatchesClosedForm)
{
  double const gmst = 0.8;
  Eigen::Matrix3d expected;
  expected << std::cos(gmst), std::sin(gmst), 0.0, -std::sin(gmst),
    std::cos(gmst), 0.0, 0.0, 0.0, 1.0;
  EXPECT_LT(maxAbsDifference(eciToEcefFromGmst(gmst), expected), 1e-15);
  EXPECT_LT(maxAbsDifference(ecefToEciFromGmst(gmst), expected.transpose()),
            1e-15);
}

// ============================================================================
// LVLH
// ============================================================================

TEST(FrameTransformsTest, LvlhColumnsForEquatorialOrbit)
{
  Eigen::Matrix3d const basis =
    eciToLvlh(Coordinate{7000.0, 0.0, 0.0}, Velocity{0.0, 7.5, 0.0});

  EXPECT_LT(maxAbsDifference(basis, Eigen::Matrix3d::Identity()), 1e-15);
}

TEST(FrameTransformsTest, LvlhBasisIsOrthonormalAndRightHanded)
{
  Coordinate const r{-2100.0, 6100.0, 1500.0};
  Velocity const v{-5.2, -1.9, 4.4};
  Eigen::Matrix3d const basis = eciToLvlh(r, v);

  EXPECT_LT(maxAbsDifference(basis.transpose() * basis,
                             Eigen::Matrix3d::Identity()),
            1e-14);
  EXPECT_NEAR(basis.determinant(), 1.0, 1e-14);
  EXPECT_NEAR((basis.col(0) - r / r.norm()).norm(), 0.0, 1e-15);

  Eigen::Vector3d const h = r.cross(v);
  EXPECT_NEAR((basis.col(2) - h / h.norm()).norm(), 0.0, 1e-15);
}

TEST(FrameTransformsTest, LvlhTransposeMapsPositionToRadialAxis)
{
  Coordinate const r{-2100.0, 6100.0, 1500.0};
  Velocity const v{-5.2, -1.9, 4.4};
  Eigen::Vector3d const lvlh = eciToLvlh(r, v).transpose() * r;

  EXPECT_NEAR(lvlh.x(), r.norm(), 1e-9);
  EXPECT_NEAR(lvlh.y(), 0.0, 1e-9);
  EXPECT_NEAR(lvlh.z(), 0.0, 1e-9);
}

TEST(FrameTransformsTest, LvlhDegenerateInputsThrow)
{
  EXPECT_THROW(eciToLvlh(Coordinate{}, Velocity{0.0, 7.5, 0.0}),
               DegenerateGeometry);
  EXPECT_THROW(
    eciToLvlh(Coordinate{7000.0, 0.0, 0.0}, Velocity{3.0, 0.0, 0.0}),
    DegenerateGeometry);
  EXPECT_THROW(eciToLvlh(Coordinate{7000.0, 0.0, 0.0}, Velocity{}),
               DegenerateGeometry);
}

// ============================================================================
// Generic Transformations
// ============================================================================

TEST(FrameTransformsTest, TransformTensorPreservesEigenvalues)
{
  Eigen::Matrix3d const inertia = Eigen::Vector3d{100.0, 120.0, 50.0}.asDiagonal();
  Eigen::Matrix3d const r = eulerSequenceToMatrix({0.3, 0.5, -0.2}, "321");
  Eigen::Matrix3d const rotated = transformTensor(r, inertia);

  EXPECT_NEAR(rotated.trace(), inertia.trace(), 1e-12);
  EXPECT_NEAR(rotated.determinant(), inertia.determinant(), 1e-6);
  EXPECT_LT(maxAbsDifference(rotated, rotated.transpose()), 1e-12);
}

// ============================================================================
// Sidereal Time
// ============================================================================

TEST(SiderealTimeTest, AngleAdvancesAtEarthRate)
{
  EXPECT_NEAR(greenwichSiderealAngle(100.0), 100.0 * earth::kEarthRotationRate,
              1e-15);
  EXPECT_NEAR(greenwichSiderealAngle(0.0, 1.0), 1.0, 1e-15);
}

TEST(SiderealTimeTest, AngleIsWrapped)
{
  double const siderealDay = 2.0 * kPi / earth::kEarthRotationRate;
  double const angle = greenwichSiderealAngle(1.5 * siderealDay);
  EXPECT_GE(angle, 0.0);
  EXPECT_LT(angle, 2.0 * kPi);
  EXPECT_NEAR(angle, kPi, 1e-9);
}

TEST(SiderealTimeTest, GmstAtJ2000)
{
  // 18h 41m 50.54841s = 280.46061837 deg
  double const expected = 280.46061837 * kPi / 180.0;
  EXPECT_NEAR(gmstFromJulianDate(earth::kJ2000JulianDate), expected, 1e-8);
}

TEST(SiderealTimeTest, AddSecondsToJulianDate)
{
  EXPECT_DOUBLE_EQ(addSecondsToJulianDate(2451545.0, 43200.0), 2451545.5);
}
