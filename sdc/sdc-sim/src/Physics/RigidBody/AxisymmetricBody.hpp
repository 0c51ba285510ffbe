// Ticket: 0003_rigid_body_dynamics

#ifndef SDC_SIM_AXISYMMETRIC_BODY_HPP
#define SDC_SIM_AXISYMMETRIC_BODY_HPP

#include <cstddef>
#include <string_view>
#include <vector>

#include "sdc-sim/src/DataTypes/AngularVelocity.hpp"
#include "sdc-sim/src/Physics/RigidBody/InertiaTensor.hpp"

namespace sdc_sim
{

/// Mass distribution of an axisymmetric body relative to its symmetry axis
enum class BodyShape
{
  Prolate,   ///< I_s > I_t
  Oblate,    ///< I_s < I_t
  Spherical  ///< I_s == I_t, no nutation
};

std::string_view toString(BodyShape shape);

/**
 * @brief Closed-form quantities of torque-free axisymmetric motion
 */
struct NutationParameters
{
  double amplitude{0.0};       ///< A = sqrt(w1_0^2 + w2_0^2) [rad/s]
  double nutationRate{0.0};    ///< Omega_n = w3_0 (I_s - I_t) / I_t [rad/s]
  double spinRate{0.0};        ///< w3, constant [rad/s]
  double phase{0.0};           ///< atan2(w2_0, w1_0) [rad]
  double nutationPeriod{0.0};  ///< 2 pi / |Omega_n|, +inf without nutation [s]
  double angularMomentumMagnitude{0.0};  ///< |I w| [kg m^2/s]
  double kineticEnergy{0.0};             ///< 1/2 w^T I w [J]
};

/// Analytical angular-velocity history on a uniform time grid
struct NutationHistory
{
  std::vector<double> times;
  std::vector<AngularVelocity> angularVelocities;
};

/**
 * @brief Torque-free rigid body with inertia diag(I_t, I_t, I_s)
 *
 * Body Z is the symmetry axis. In body axes the transverse rate traces a
 * circle of radius A at the nutation rate Omega_n while the spin rate stays
 * constant:
 *
 *   w1(t) = A cos(Omega_n t + phi0)
 *   w2(t) = A sin(Omega_n t + phi0)
 *   w3(t) = w3_0
 *
 * The solution is exact and serves as the oracle for numerical integration.
 */
class AxisymmetricBody
{
public:
  /**
   * @param transverseInertia I_t [kg m^2]
   * @param spinInertia I_s [kg m^2]
   * @throws SingularInertia if either moment is not positive
   */
  AxisymmetricBody(double transverseInertia, double spinInertia);

  [[nodiscard]] BodyShape shape() const;

  /**
   * @brief Body-frame nutation rate Omega_n = w3_0 (I_s - I_t) / I_t
   *
   * Exactly zero for spherical bodies.
   */
  [[nodiscard]] double nutationRate(const AngularVelocity& initial) const;

  /// Angular velocity at time t from the initial rate at t = 0
  [[nodiscard]] AngularVelocity solution(const AngularVelocity& initial,
                                         double t) const;

  [[nodiscard]] NutationParameters parameters(
    const AngularVelocity& initial) const;

  /**
   * @brief Evaluate the solution on count evenly spaced times in [t0, t1]
   * @throws std::invalid_argument if count < 2 or t1 <= t0
   */
  [[nodiscard]] NutationHistory sample(const AngularVelocity& initial,
                                       double t0,
                                       double t1,
                                       std::size_t count) const;

  [[nodiscard]] InertiaTensor inertia() const;

  [[nodiscard]] double transverseInertia() const
  {
    return transverse_;
  }

  [[nodiscard]] double spinInertia() const
  {
    return spin_;
  }

private:
  double transverse_;
  double spin_;
};

/**
 * @brief Free-function form of AxisymmetricBody::solution()
 * @throws SingularInertia if either moment is not positive
 */
AngularVelocity axisymmetricAnalyticalSolution(const AngularVelocity& initial,
                                               double transverseInertia,
                                               double spinInertia,
                                               double t);

}  // namespace sdc_sim

#endif  // SDC_SIM_AXISYMMETRIC_BODY_HPP
