// Ticket: 0004_orbital_mechanics

#include "sdc-sim/src/Physics/Orbit/OrbitalMechanics.hpp"

#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>
#include <string>

#include "sdc-sim/src/Rotation/RotationMatrix.hpp"
#include "sdc-sim/src/Utils/Errors.hpp"
#include "sdc-sim/src/Utils/utils.hpp"

namespace sdc_sim
{

namespace
{

constexpr double kTwoPi = 2.0 * std::numbers::pi;
constexpr double kInfinity = std::numeric_limits<double>::infinity();

// |h| below this fraction of |r||v| counts as rectilinear
constexpr double kRectilinearTolerance = 1e-12;

void requirePositiveMu(double mu)
{
  if (!(mu > 0.0))
  {
    throw std::invalid_argument{
      "Gravitational parameter must be positive, got " + std::to_string(mu)};
  }
}

}  // namespace

OrbitalElements cartesianToElements(const Coordinate& position,
                                    const Velocity& velocity,
                                    double mu,
                                    const ElementTolerances& tolerances)
{
  requirePositiveMu(mu);

  double const r = position.norm();
  if (r == 0.0)
  {
    throw DegenerateInput{"Cannot compute elements for a zero position"};
  }

  double const v = velocity.norm();
  Eigen::Vector3d const h = position.cross(velocity);
  double const hNorm = h.norm();
  if (hNorm <= kRectilinearTolerance * r * v)
  {
    throw DegenerateGeometry{
      "Cannot compute elements for rectilinear motion (zero angular "
      "momentum)"};
  }

  double const rDotV = position.dot(velocity);
  Eigen::Vector3d const eVec =
    ((v * v - mu / r) * position - rDotV * velocity) / mu;
  double const e = eVec.norm();

  OrbitalElements elements;
  elements.eccentricity = e;

  double const energy = 0.5 * v * v - mu / r;
  elements.semiMajorAxis =
    std::abs(energy) < tolerances.parabolicEnergy ? kInfinity
                                                  : -mu / (2.0 * energy);

  elements.inclination = std::atan2(std::hypot(h.x(), h.y()), h.z());

  // Node vector n = z x h
  Eigen::Vector3d const n{-h.y(), h.x(), 0.0};
  double const nNorm = n.norm();
  bool const equatorial = nNorm <= tolerances.equatorial * hNorm;
  bool const circular = e < tolerances.circular;

  // Signed angles in the orbit plane take their sine from the component of
  // the cross product along h
  Eigen::Vector3d const hHat = h / hNorm;

  if (!equatorial)
  {
    elements.raan = wrapTwoPi(std::atan2(n.y(), n.x()));
  }

  if (!equatorial && !circular)
  {
    elements.argumentOfPerigee =
      wrapTwoPi(std::atan2(n.cross(eVec).dot(hHat), n.dot(eVec)));
  }

  if (!circular)
  {
    double const sinComponent = eVec.cross(position).dot(hHat);
    elements.trueAnomaly =
      wrapTwoPi(std::atan2(sinComponent, eVec.dot(position)));
  }

  return elements;
}

CartesianState elementsToCartesian(const OrbitalElements& elements, double mu)
{
  requirePositiveMu(mu);

  double const a = elements.semiMajorAxis;
  double const e = elements.eccentricity;
  double const nu = elements.trueAnomaly;

  if (!std::isfinite(a))
  {
    throw DegenerateInput{
      "Parabolic elements (infinite semi-major axis) do not define a state"};
  }
  if (e < 0.0)
  {
    throw DegenerateInput{"Eccentricity must be non-negative"};
  }

  double const p = a * (1.0 - e * e);
  if (!(p > 0.0))
  {
    throw DegenerateInput{"Semi-latus rectum must be positive, got " +
                          std::to_string(p)};
  }

  double const denominator = 1.0 + e * std::cos(nu);
  if (!(denominator > 0.0))
  {
    throw DegenerateInput{"True anomaly lies beyond the hyperbolic asymptote"};
  }

  // Perifocal frame: P toward periapsis, Q 90 deg ahead in the orbit plane
  double const radius = p / denominator;
  Eigen::Vector3d const rPerifocal{
    radius * std::cos(nu), radius * std::sin(nu), 0.0};
  double const speedScale = std::sqrt(mu / p);
  Eigen::Vector3d const vPerifocal{
    -speedScale * std::sin(nu), speedScale * (e + std::cos(nu)), 0.0};

  Eigen::Matrix3d const perifocalToInertial = eulerSequenceToMatrix(
    {elements.raan, elements.inclination, elements.argumentOfPerigee}, "313");

  CartesianState state;
  state.position = perifocalToInertial * rPerifocal;
  state.velocity = perifocalToInertial * vPerifocal;
  return state;
}

Eigen::VectorXd twoBodyDynamics(const Eigen::VectorXd& state, double mu)
{
  CartesianState const current = CartesianState::fromStateVector(state);

  double const r = current.position.norm();
  if (r == 0.0)
  {
    throw DegenerateInput{"Two-body acceleration undefined at r = 0"};
  }

  Eigen::VectorXd derivative(CartesianState::kStateSize);
  derivative.head<3>() = current.velocity;
  derivative.tail<3>() = -mu / (r * r * r) * current.position;
  return derivative;
}

double orbitalPeriod(double semiMajorAxis, double mu)
{
  requirePositiveMu(mu);
  if (!std::isfinite(semiMajorAxis) || semiMajorAxis <= 0.0)
  {
    return kInfinity;
  }
  return kTwoPi * std::sqrt(semiMajorAxis * semiMajorAxis * semiMajorAxis / mu);
}

double meanMotion(double semiMajorAxis, double mu)
{
  requirePositiveMu(mu);
  if (!std::isfinite(semiMajorAxis) || semiMajorAxis <= 0.0)
  {
    return 0.0;
  }
  return std::sqrt(mu / (semiMajorAxis * semiMajorAxis * semiMajorAxis));
}

double specificEnergy(const Coordinate& position,
                      const Velocity& velocity,
                      double mu)
{
  double const r = position.norm();
  if (r == 0.0)
  {
    throw DegenerateInput{"Specific energy undefined at r = 0"};
  }
  return 0.5 * velocity.squaredNorm() - mu / r;
}

Eigen::Vector3d specificAngularMomentum(const Coordinate& position,
                                        const Velocity& velocity)
{
  return position.cross(velocity);
}

double periapsisRadius(const OrbitalElements& elements)
{
  if (!std::isfinite(elements.semiMajorAxis))
  {
    throw DegenerateInput{"Periapsis radius needs a finite semi-major axis"};
  }
  return elements.semiMajorAxis * (1.0 - elements.eccentricity);
}

double apoapsisRadius(const OrbitalElements& elements)
{
  if (elements.eccentricity >= 1.0 || !std::isfinite(elements.semiMajorAxis))
  {
    return kInfinity;
  }
  return elements.semiMajorAxis * (1.0 + elements.eccentricity);
}

double altitude(const Coordinate& position)
{
  return position.norm() - earth::kEarthRadius;
}

double circularVelocity(double radius, double mu)
{
  if (!(radius > 0.0))
  {
    throw DegenerateInput{"Circular velocity needs a positive radius"};
  }
  return std::sqrt(mu / radius);
}

double escapeVelocity(double radius, double mu)
{
  if (!(radius > 0.0))
  {
    throw DegenerateInput{"Escape velocity needs a positive radius"};
  }
  return std::sqrt(2.0 * mu / radius);
}

OrbitSummary orbitSummary(const Coordinate& position,
                          const Velocity& velocity,
                          double mu)
{
  OrbitSummary summary;
  summary.elements = cartesianToElements(position, velocity, mu);
  summary.type = classifyOrbit(summary.elements.eccentricity);
  summary.specificEnergy = specificEnergy(position, velocity, mu);
  summary.angularMomentum = specificAngularMomentum(position, velocity).norm();
  summary.period = orbitalPeriod(summary.elements.semiMajorAxis, mu);
  return summary;
}

}  // namespace sdc_sim
