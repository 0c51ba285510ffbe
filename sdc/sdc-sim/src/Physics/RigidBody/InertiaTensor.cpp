// Ticket: 0003_rigid_body_dynamics

#include "sdc-sim/src/Physics/RigidBody/InertiaTensor.hpp"

#include <stdexcept>
#include <string>

#include "sdc-sim/src/Environment/FrameTransforms.hpp"
#include "sdc-sim/src/Utils/Errors.hpp"

namespace sdc_sim
{

namespace
{

// Asymmetry allowed relative to the largest entry
constexpr double kSymmetryTolerance = 1e-9;

}  // namespace

InertiaTensor::InertiaTensor(const Eigen::Matrix3d& matrix) : matrix_{matrix}
{
  if (!matrix_.allFinite())
  {
    throw SingularInertia{"Inertia tensor contains non-finite entries"};
  }

  double const scale = matrix_.cwiseAbs().maxCoeff();
  if ((matrix_ - matrix_.transpose()).cwiseAbs().maxCoeff() >
      kSymmetryTolerance * scale)
  {
    throw SingularInertia{"Inertia tensor must be symmetric"};
  }

  Eigen::LLT<Eigen::Matrix3d> const llt{matrix_};
  if (llt.info() != Eigen::Success)
  {
    throw SingularInertia{"Inertia tensor must be positive definite"};
  }

  inverse_ = llt.solve(Eigen::Matrix3d::Identity());
}

InertiaTensor InertiaTensor::axisymmetric(double transverse, double spin)
{
  return diagonal(transverse, transverse, spin);
}

InertiaTensor InertiaTensor::diagonal(double ixx, double iyy, double izz)
{
  Eigen::Matrix3d const matrix = Eigen::Vector3d{ixx, iyy, izz}.asDiagonal();
  return InertiaTensor{matrix};
}

InertiaTensor InertiaTensor::fromBox(double mass,
                                     const Eigen::Vector3d& dimensions)
{
  if (mass <= 0.0)
  {
    throw std::invalid_argument{"Box mass must be positive, got " +
                                std::to_string(mass)};
  }
  if ((dimensions.array() <= 0.0).any())
  {
    throw std::invalid_argument{"Box dimensions must be positive"};
  }

  Eigen::Vector3d const sq = dimensions.cwiseProduct(dimensions);
  double const k = mass / 12.0;
  return diagonal(k * (sq.y() + sq.z()), k * (sq.x() + sq.z()),
                  k * (sq.x() + sq.y()));
}

InertiaTensor InertiaTensor::fromArray(std::span<const double> values)
{
  if (values.size() != 9)
  {
    throw InvalidDimension{"Inertia tensor requires 9 values, got " +
                           std::to_string(values.size())};
  }
  using RowMajor = Eigen::Matrix<double, 3, 3, Eigen::RowMajor>;
  Eigen::Matrix3d const matrix = Eigen::Map<const RowMajor>{values.data()};
  return InertiaTensor{matrix};
}

Eigen::Vector3d InertiaTensor::principalMoments() const
{
  Eigen::SelfAdjointEigenSolver<Eigen::Matrix3d> const solver{
    matrix_, Eigen::EigenvaluesOnly};
  return solver.eigenvalues();
}

InertiaTensor InertiaTensor::transformed(const Eigen::Matrix3d& rotation) const
{
  Eigen::Matrix3d rotated = transformTensor(rotation, matrix_);
  // Remove roundoff asymmetry introduced by the product
  rotated = 0.5 * (rotated + rotated.transpose()).eval();
  return InertiaTensor{rotated};
}

}  // namespace sdc_sim
