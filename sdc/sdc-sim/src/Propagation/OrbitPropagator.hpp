// Ticket: 0006_propagation

#ifndef SDC_SIM_ORBIT_PROPAGATOR_HPP
#define SDC_SIM_ORBIT_PROPAGATOR_HPP

#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "sdc-sim/src/Physics/Integration/Integrator.hpp"
#include "sdc-sim/src/Physics/Orbit/CartesianState.hpp"
#include "sdc-sim/src/Physics/Orbit/OrbitalElements.hpp"
#include "sdc-sim/src/Propagation/Trajectory.hpp"

namespace sdc_sim
{

/**
 * @brief Propagates a two-body orbit with a pluggable integrator
 *
 * The integrator is not owned and must outlive the propagator. Logging
 * follows AttitudePropagator; specific energy and |h| are checked after
 * every successful run when Config::checkConservation is set.
 */
class OrbitPropagator
{
public:
  struct Config
  {
    bool checkConservation{true};
    double driftTolerance{1e-6};
  };

  /**
   * @throws std::invalid_argument if mu is not positive
   */
  OrbitPropagator(double mu, const Integrator& integrator);

  /**
   * @param logger nullptr selects logging::defaultLogger()
   * @throws std::invalid_argument if mu is not positive or driftTolerance is
   *         negative
   */
  OrbitPropagator(double mu,
                  const Integrator& integrator,
                  const Config& config,
                  std::shared_ptr<spdlog::logger> logger = nullptr);

  /**
   * @brief Integrate the two-body equations from t0 to tEnd
   * @throws DegenerateInput if the initial position is zero
   */
  [[nodiscard]] OrbitTrajectory propagate(
    const CartesianState& initial,
    double t0,
    double tEnd,
    const std::vector<double>& evaluationTimes = {}) const;

  /**
   * @brief Convert elements to a state at t0 and propagate
   * @throws DegenerateInput for elements that do not define a state
   */
  [[nodiscard]] OrbitTrajectory propagate(
    const OrbitalElements& elements,
    double t0,
    double tEnd,
    const std::vector<double>& evaluationTimes = {}) const;

  [[nodiscard]] double mu() const
  {
    return mu_;
  }

private:
  double mu_;
  const Integrator& integrator_;
  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace sdc_sim

#endif  // SDC_SIM_ORBIT_PROPAGATOR_HPP
