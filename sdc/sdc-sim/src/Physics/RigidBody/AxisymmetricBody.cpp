// Ticket: 0003_rigid_body_dynamics

#include "sdc-sim/src/Physics/RigidBody/AxisymmetricBody.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>
#include <string>

#include "sdc-sim/src/Physics/RigidBody/RigidBodyDynamics.hpp"
#include "sdc-sim/src/Utils/Errors.hpp"

namespace sdc_sim
{

namespace
{

// Moments closer than this fraction of the larger one count as equal
constexpr double kSphericalTolerance = 1e-12;

}  // namespace

std::string_view toString(BodyShape shape)
{
  switch (shape)
  {
    case BodyShape::Prolate:
      return "prolate";
    case BodyShape::Oblate:
      return "oblate";
    case BodyShape::Spherical:
      return "spherical";
  }
  return "unknown";
}

AxisymmetricBody::AxisymmetricBody(double transverseInertia,
                                   double spinInertia)
  : transverse_{transverseInertia}, spin_{spinInertia}
{
  if (!(transverse_ > 0.0) || !(spin_ > 0.0) || !std::isfinite(transverse_) ||
      !std::isfinite(spin_))
  {
    throw SingularInertia{
      "Axisymmetric body requires positive finite moments, got I_t = " +
      std::to_string(transverse_) + ", I_s = " + std::to_string(spin_)};
  }
}

BodyShape AxisymmetricBody::shape() const
{
  double const scale = std::max(transverse_, spin_);
  if (std::abs(spin_ - transverse_) <= kSphericalTolerance * scale)
  {
    return BodyShape::Spherical;
  }
  return spin_ > transverse_ ? BodyShape::Prolate : BodyShape::Oblate;
}

double AxisymmetricBody::nutationRate(const AngularVelocity& initial) const
{
  if (shape() == BodyShape::Spherical)
  {
    return 0.0;
  }
  return initial.spin() * (spin_ - transverse_) / transverse_;
}

AngularVelocity AxisymmetricBody::solution(const AngularVelocity& initial,
                                           double t) const
{
  double const amplitude = initial.transverse();
  double const phase = std::atan2(initial.y(), initial.x());
  double const angle = nutationRate(initial) * t + phase;

  return AngularVelocity{amplitude * std::cos(angle),
                         amplitude * std::sin(angle),
                         initial.spin()};
}

NutationParameters AxisymmetricBody::parameters(
  const AngularVelocity& initial) const
{
  Eigen::Matrix3d const inertiaMatrix = inertia().matrix();

  NutationParameters params;
  params.amplitude = initial.transverse();
  params.nutationRate = nutationRate(initial);
  params.spinRate = initial.spin();
  params.phase = std::atan2(initial.y(), initial.x());
  params.nutationPeriod =
    params.nutationRate == 0.0
      ? std::numeric_limits<double>::infinity()
      : 2.0 * std::numbers::pi / std::abs(params.nutationRate);
  params.angularMomentumMagnitude =
    angularMomentum(initial, inertiaMatrix).norm();
  params.kineticEnergy = kineticEnergy(initial, inertiaMatrix);
  return params;
}

NutationHistory AxisymmetricBody::sample(const AngularVelocity& initial,
                                         double t0,
                                         double t1,
                                         std::size_t count) const
{
  if (count < 2)
  {
    throw std::invalid_argument{"Sampling requires at least 2 points"};
  }
  if (!(t1 > t0))
  {
    throw std::invalid_argument{"Sampling interval must satisfy t1 > t0"};
  }

  NutationHistory history;
  history.times.reserve(count);
  history.angularVelocities.reserve(count);

  double const dt = (t1 - t0) / static_cast<double>(count - 1);
  for (std::size_t i = 0; i < count; ++i)
  {
    double const t = (i + 1 == count) ? t1 : t0 + dt * static_cast<double>(i);
    history.times.push_back(t);
    history.angularVelocities.push_back(solution(initial, t));
  }
  return history;
}

InertiaTensor AxisymmetricBody::inertia() const
{
  return InertiaTensor::axisymmetric(transverse_, spin_);
}

AngularVelocity axisymmetricAnalyticalSolution(const AngularVelocity& initial,
                                               double transverseInertia,
                                               double spinInertia,
                                               double t)
{
  return AxisymmetricBody{transverseInertia, spinInertia}.solution(initial, t);
}

}  // namespace sdc_sim
