#ifndef SDC_SIM_UTILS_ERRORS_HPP
#define SDC_SIM_UTILS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sdc_sim
{

/**
 * @brief Error taxonomy for the dynamics core
 *
 * Validation failures derive from std::invalid_argument. IntegrationFailure
 * is raised only by IntegrationResult::throwIfFailed() and derives from
 * std::runtime_error.
 */

/// Wrong number of components for a vector, matrix or packed state
class InvalidDimension : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

/// Zero vector or quaternion where a direction is required
class DegenerateInput : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

/// Geometric configuration without a defined frame (collinear r and v)
class DegenerateGeometry : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

/// Inertia tensor that cannot be inverted or is not positive definite
class SingularInertia : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

/// Matrix that fails the orthogonality or determinant check
class InvalidRotation : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

/// Euler-angle ordering that is unknown or not implemented for the operation
class UnsupportedSequence : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

/// Numerical integration did not reach the requested end time
class IntegrationFailure : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

}  // namespace sdc_sim

#endif  // SDC_SIM_UTILS_ERRORS_HPP
