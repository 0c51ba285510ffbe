// Ticket: 0003_rigid_body_dynamics

#ifndef SDC_SIM_INERTIA_TENSOR_HPP
#define SDC_SIM_INERTIA_TENSOR_HPP

#include <Eigen/Dense>
#include <span>

namespace sdc_sim
{

/**
 * @brief Body-frame inertia tensor [kg m^2] with cached inverse
 *
 * The wrapped matrix is always symmetric positive definite, so the inverse
 * exists and is computed once at construction.
 */
class InertiaTensor
{
public:
  /**
   * @brief Validate and wrap a full 3x3 tensor
   * @throws SingularInertia if the matrix is not finite, not symmetric or not
   *         positive definite
   */
  explicit InertiaTensor(const Eigen::Matrix3d& matrix);

  /**
   * @brief diag(I_t, I_t, I_s) with the symmetry axis along body Z
   * @param transverse Transverse moment I_t [kg m^2]
   * @param spin Spin-axis moment I_s [kg m^2]
   */
  static InertiaTensor axisymmetric(double transverse, double spin);

  static InertiaTensor diagonal(double ixx, double iyy, double izz);

  /**
   * @brief Uniform solid box about its centroid
   *
   * Ixx = m (b^2 + c^2) / 12 and cyclic, for dimensions (a, b, c) along
   * (x, y, z).
   *
   * @param mass Mass [kg]
   * @param dimensions Edge lengths [m]
   * @throws std::invalid_argument if mass or any dimension is not positive
   */
  static InertiaTensor fromBox(double mass, const Eigen::Vector3d& dimensions);

  /**
   * @brief Build from 9 row-major values
   * @throws InvalidDimension if values does not hold exactly 9 entries
   */
  static InertiaTensor fromArray(std::span<const double> values);

  [[nodiscard]] const Eigen::Matrix3d& matrix() const
  {
    return matrix_;
  }

  [[nodiscard]] const Eigen::Matrix3d& inverse() const
  {
    return inverse_;
  }

  /// Principal moments in ascending order
  [[nodiscard]] Eigen::Vector3d principalMoments() const;

  /**
   * @brief Tensor expressed in a rotated frame: R I R^T
   * @param rotation Rotation from the current frame to the new frame
   */
  [[nodiscard]] InertiaTensor transformed(const Eigen::Matrix3d& rotation) const;

  // Rule of Zero
  InertiaTensor(const InertiaTensor&) = default;
  InertiaTensor(InertiaTensor&&) noexcept = default;
  InertiaTensor& operator=(const InertiaTensor&) = default;
  InertiaTensor& operator=(InertiaTensor&&) noexcept = default;
  ~InertiaTensor() = default;

private:
  Eigen::Matrix3d matrix_;
  Eigen::Matrix3d inverse_;
};

}  // namespace sdc_sim

#endif  // SDC_SIM_INERTIA_TENSOR_HPP
