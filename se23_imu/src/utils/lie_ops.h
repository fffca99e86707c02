/*
 * OpenVINS: An Open Platform for Visual-Inertial Research
 * Copyright (C) 2018-2023 Patrick Geneva
 * Copyright (C) 2018-2023 Guoquan Huang
 * Copyright (C) 2018-2023 OpenVINS Contributors
 * Copyright (C) 2018-2019 Kevin Eckenhoff
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#ifndef SE23_IMU_LIE_OPS_H
#define SE23_IMU_LIE_OPS_H

/*
 * @section Summary
 * This file contains the common utility functions for operating on SO(3), the extended pose group SE_2(3), and the
 * non-group "IE3" matrices that appear when integrating inertial measurements.
 *
 * An element of SE_2(3) is stored as a 5x5 matrix:
 * @f[
 *  \mathbf{X} = \begin{bmatrix} \mathbf{C} & \mathbf{v} & \mathbf{r} \\ \mathbf{0} & 1 & 0 \\ \mathbf{0} & 0 & 1 \end{bmatrix}
 * @f]
 * and its tangent vector is always ordered as rotation, velocity, position:
 * @f[
 *  \boldsymbol\xi = \begin{bmatrix} \boldsymbol\phi \\ \boldsymbol\nu \\ \boldsymbol\rho \end{bmatrix}
 * @f]
 *
 * An IE3 matrix shares this block layout but carries a free scalar @f$c@f$ at entry (3,4).
 * These are closed under multiplication and have an exact inverse and adjoint, but are not poses.
 *
 * The SE_2(3) left Jacobian follows equations (7.85)-(7.86) of [State Estimation for
 * Robotics](http://asrl.utias.utoronto.ca/~tdb/bib/barfoot_ser17.pdf) by Timothy D. Barfoot, extended with a second translation-like
 * block for velocity.
 */

#include <Eigen/Eigen>
#include <cmath>

namespace se23_imu {

/// Below this angle the closed-form SO(3) coefficients are replaced by their Taylor series
const double SMALL_ANGLE_SERIES = 0.1;

/// Below this angle the SO(3) Jacobians use a second order expansion
const double SMALL_ANGLE_JACOBIAN = 1e-5;

/**
 * @brief Skew-symmetric matrix from a given 3x1 vector
 *
 * This is based on equation 6 in [Indirect Kalman Filter for 3D Attitude Estimation](http://mars.cs.umn.edu/tr/reports/Trawny05b.pdf):
 * \f{align*}{
 *  \lfloor\mathbf{v}\times\rfloor =
 *  \begin{bmatrix}
 *  0 & -v_3 & v_2 \\ v_3 & 0 & -v_1 \\ -v_2 & v_1 & 0
 *  \end{bmatrix}
 * @f}
 *
 * @param[in] w 3x1 vector to be made a skew-symmetric
 * @return 3x3 skew-symmetric matrix
 */
inline Eigen::Matrix<double, 3, 3> skew_x(const Eigen::Matrix<double, 3, 1> &w) {
  Eigen::Matrix<double, 3, 3> w_x;
  w_x << 0, -w(2), w(1), w(2), 0, -w(0), -w(1), w(0), 0;
  return w_x;
}

/**
 * @brief Returns vector portion of skew-symmetric
 * @param[in] w_x skew-symmetric matrix
 * @return 3x1 vector portion of skew
 */
inline Eigen::Matrix<double, 3, 1> vee(const Eigen::Matrix<double, 3, 3> &w_x) {
  Eigen::Matrix<double, 3, 1> w;
  w << w_x(2, 1), w_x(0, 2), w_x(1, 0);
  return w;
}

/**
 * @brief SO(3) matrix exponential
 *
 * This formula ends up being the [Rodrigues formula](https://en.wikipedia.org/wiki/Rodrigues%27_rotation_formula).
 * \f{align*}{
 * \exp(\mathbf{v}) &=
 * \mathbf{I}
 * +\frac{\sin{\theta}}{\theta}\lfloor\mathbf{v}\times\rfloor
 * +\frac{1-\cos{\theta}}{\theta^2}\lfloor\mathbf{v}\times\rfloor^2 \\
 * \mathrm{where}&\quad \theta^2 = \mathbf{v}^\top\mathbf{v}
 * @f}
 *
 * @param[in] w 3x1 vector in R(3) we will take the exponential of
 * @return SO(3) rotation matrix
 */
inline Eigen::Matrix<double, 3, 3> exp_so3(const Eigen::Matrix<double, 3, 1> &w) {
  Eigen::Matrix<double, 3, 3> w_x = skew_x(w);
  double theta = w.norm();
  double A, B;
  if (theta < 1e-7) {
    A = 1;
    B = 0.5;
  } else {
    A = sin(theta) / theta;
    double s_half = sin(0.5 * theta);
    B = 2.0 * s_half * s_half / (theta * theta);
  }
  return Eigen::Matrix<double, 3, 3>::Identity() + A * w_x + B * w_x * w_x;
}

/**
 * @brief SO(3) matrix logarithm
 *
 * This definition was taken from "Lie Groups for 2D and 3D Transformations" by Ethan Eade equation 17 & 18.
 * The handling around theta=pi and theta=0 follows GTSAM (https://github.com/borglab/gtsam/issues/746).
 *
 * @param[in] R 3x3 SO(3) rotation matrix
 * @return 3x1 in the R(3) space [omegax, omegay, omegaz]
 */
inline Eigen::Matrix<double, 3, 1> log_so3(const Eigen::Matrix<double, 3, 3> &R) {

  // note switch to base 1
  double R11 = R(0, 0), R12 = R(0, 1), R13 = R(0, 2);
  double R21 = R(1, 0), R22 = R(1, 1), R23 = R(1, 2);
  double R31 = R(2, 0), R32 = R(2, 1), R33 = R(2, 2);

  const double tr = R.trace();
  Eigen::Vector3d omega;

  // when trace == -1, i.e., when theta = +-pi, +-3pi, +-5pi, etc.
  if (tr + 1.0 < 1e-10) {
    if (std::abs(R33 + 1.0) > 1e-5)
      omega = (M_PI / sqrt(2.0 + 2.0 * R33)) * Eigen::Vector3d(R13, R23, 1.0 + R33);
    else if (std::abs(R22 + 1.0) > 1e-5)
      omega = (M_PI / sqrt(2.0 + 2.0 * R22)) * Eigen::Vector3d(R12, 1.0 + R22, R32);
    else
      omega = (M_PI / sqrt(2.0 + 2.0 * R11)) * Eigen::Vector3d(1.0 + R11, R21, R31);
  } else {
    double magnitude;
    const double tr_3 = tr - 3.0; // always negative
    if (tr_3 < -1e-7) {
      double theta = acos((tr - 1.0) / 2.0);
      magnitude = theta / (2.0 * sin(theta));
    } else {
      // when theta near 0, +-2pi, +-4pi, etc. (trace near 3.0)
      magnitude = 0.5 - tr_3 / 12.0;
    }
    omega = magnitude * Eigen::Vector3d(R32 - R23, R13 - R31, R21 - R12);
  }
  return omega;
}

/**
 * @brief Computes left Jacobian of SO(3)
 *
 * The left Jacobian of SO(3) is defined equation (7.77b) in [State Estimation for
 * Robotics](http://asrl.utias.utoronto.ca/~tdb/bib/barfoot_ser17.pdf) by Timothy D. Barfoot @cite Barfoot2017.
 * \f{align*}{
 * J_l(\boldsymbol\theta) = \frac{\sin\theta}{\theta}\mathbf I + \Big(1-\frac{\sin\theta}{\theta}\Big)\mathbf a \mathbf a^\top +
 * \frac{1-\cos\theta}{\theta}\lfloor \mathbf a \times\rfloor \f}
 *
 * @param w axis-angle
 * @return The left Jacobian of SO(3)
 */
inline Eigen::Matrix<double, 3, 3> Jl_so3(const Eigen::Matrix<double, 3, 1> &w) {
  double theta = w.norm();
  Eigen::Matrix<double, 3, 3> w_x = skew_x(w);
  if (theta < SMALL_ANGLE_JACOBIAN) {
    return Eigen::Matrix<double, 3, 3>::Identity() + 0.5 * w_x + w_x * w_x / 6.0;
  }
  Eigen::Matrix<double, 3, 1> a = w / theta;
  // 1-cos(theta) written with the half angle so it keeps its precision near the series cut-off
  double s_half = sin(0.5 * theta);
  return sin(theta) / theta * Eigen::Matrix<double, 3, 3>::Identity() + (1 - sin(theta) / theta) * a * a.transpose() +
         (2.0 * s_half * s_half / theta) * skew_x(a);
}

/**
 * @brief Computes right Jacobian of SO(3), related to the left by Jl(-w)=Jr(w).
 * @param w axis-angle
 * @return The right Jacobian of SO(3)
 */
inline Eigen::Matrix<double, 3, 3> Jr_so3(const Eigen::Matrix<double, 3, 1> &w) { return Jl_so3(-w); }

/**
 * @brief Computes the inverse of the left Jacobian of SO(3)
 *
 * \f{align*}{
 * J_l^{-1}(\boldsymbol\phi) = \mathbf I - \frac{1}{2}\lfloor\boldsymbol\phi\times\rfloor +
 * \Big(\frac{1}{\theta^2} - \frac{1+\cos\theta}{2\theta\sin\theta}\Big)\lfloor\boldsymbol\phi\times\rfloor^2
 * \f}
 *
 * The closed form is singular as theta goes to zero, so we switch to its series there.
 *
 * @param w axis-angle
 * @return The inverse left Jacobian of SO(3)
 */
inline Eigen::Matrix<double, 3, 3> Jl_inv_so3(const Eigen::Matrix<double, 3, 1> &w) {
  double theta = w.norm();
  Eigen::Matrix<double, 3, 3> w_x = skew_x(w);
  if (theta < SMALL_ANGLE_JACOBIAN) {
    return Eigen::Matrix<double, 3, 3>::Identity() - 0.5 * w_x + w_x * w_x / 12.0;
  }
  double coeff = 1.0 / (theta * theta) - (1.0 + cos(theta)) / (2.0 * theta * sin(theta));
  return Eigen::Matrix<double, 3, 3>::Identity() - 0.5 * w_x + coeff * w_x * w_x;
}

/**
 * @brief Scalar coefficients shared by the N matrix and the SE_2(3) left Jacobian
 *
 * \f{align*}{
 * a_1 &= \frac{\theta - \sin\theta}{\theta^3} \\
 * a_2 &= \frac{\theta^2 + 2\cos\theta - 2}{2\theta^4} \\
 * a_3 &= \frac{2\theta - 3\sin\theta + \theta\cos\theta}{2\theta^5}
 * \f}
 *
 * All three lose precision quickly as theta shrinks, so below @ref SMALL_ANGLE_SERIES a 4th order Taylor series is used.
 *
 * @param theta Rotation angle
 * @param a1 First coefficient
 * @param a2 Second coefficient
 * @param a3 Third coefficient
 */
inline void so3_series_coeffs(double theta, double &a1, double &a2, double &a3) {
  if (theta < SMALL_ANGLE_SERIES) {
    double t2 = theta * theta;
    double t4 = t2 * t2;
    a1 = 1.0 / 6.0 - t2 / 120.0 + t4 / 5040.0;
    a2 = 1.0 / 24.0 - t2 / 720.0 + t4 / 40320.0;
    a3 = 1.0 / 120.0 - t2 / 2520.0 + t4 / 120960.0;
    return;
  }
  double t2 = theta * theta;
  double t4 = t2 * t2;
  double s = sin(theta);
  double c = cos(theta);
  a1 = (theta - s) / (t2 * theta);
  a2 = (t2 + 2.0 * c - 2.0) / (2.0 * t4);
  a3 = (2.0 * theta - 3.0 * s + theta * c) / (2.0 * t4 * theta);
}

/**
 * @brief The N matrix that maps a constant body acceleration into the position increment
 *
 * \f{align*}{
 * \mathbf N(\boldsymbol\phi) = \mathbf I + 2a_1\lfloor\boldsymbol\phi\times\rfloor + 2a_2\lfloor\boldsymbol\phi\times\rfloor^2
 * \f}
 *
 * so that @f$\Delta\mathbf r = \frac{\Delta t^2}{2}\mathbf N(\Delta t\boldsymbol\omega)\mathbf a@f$.
 *
 * @param w axis-angle
 * @return 3x3 N matrix
 */
inline Eigen::Matrix<double, 3, 3> form_N(const Eigen::Matrix<double, 3, 1> &w) {
  double a1, a2, a3;
  so3_series_coeffs(w.norm(), a1, a2, a3);
  Eigen::Matrix<double, 3, 3> w_x = skew_x(w);
  return Eigen::Matrix<double, 3, 3>::Identity() + 2.0 * a1 * w_x + 2.0 * a2 * w_x * w_x;
}

/**
 * @brief Splits an SE_2(3) (or IE3) matrix into its rotation, velocity and position
 * @param X 5x5 matrix
 * @param C Rotation block
 * @param v Velocity column
 * @param r Position column
 */
inline void se23_components(const Eigen::Matrix<double, 5, 5> &X, Eigen::Matrix3d &C, Eigen::Vector3d &v, Eigen::Vector3d &r) {
  C = X.block(0, 0, 3, 3);
  v = X.block(0, 3, 3, 1);
  r = X.block(0, 4, 3, 1);
}

/**
 * @brief Builds an SE_2(3) matrix from its rotation, velocity and position
 * @param C Rotation block
 * @param v Velocity column
 * @param r Position column
 * @return 5x5 SE_2(3) matrix
 */
inline Eigen::Matrix<double, 5, 5> se23_from_components(const Eigen::Matrix3d &C, const Eigen::Vector3d &v, const Eigen::Vector3d &r) {
  Eigen::Matrix<double, 5, 5> X = Eigen::Matrix<double, 5, 5>::Identity();
  X.block(0, 0, 3, 3) = C;
  X.block(0, 3, 3, 1) = v;
  X.block(0, 4, 3, 1) = r;
  return X;
}

/**
 * @brief Hat operator for SE_2(3)
 * @param xi 9x1 tangent vector [phi, nu, rho]
 * @return 5x5 Lie algebra element
 */
inline Eigen::Matrix<double, 5, 5> hat_se23(const Eigen::Matrix<double, 9, 1> &xi) {
  Eigen::Matrix<double, 5, 5> mat = Eigen::Matrix<double, 5, 5>::Zero();
  mat.block(0, 0, 3, 3) = skew_x(xi.block(0, 0, 3, 1));
  mat.block(0, 3, 3, 1) = xi.block(3, 0, 3, 1);
  mat.block(0, 4, 3, 1) = xi.block(6, 0, 3, 1);
  return mat;
}

/**
 * @brief SE_2(3) matrix exponential
 *
 * \f{align*}{
 * \exp(\boldsymbol\xi) = \begin{bmatrix} \exp(\boldsymbol\phi) & \mathbf J_l(\boldsymbol\phi)\boldsymbol\nu &
 * \mathbf J_l(\boldsymbol\phi)\boldsymbol\rho \\ \mathbf 0 & 1 & 0 \\ \mathbf 0 & 0 & 1\end{bmatrix}
 * \f}
 *
 * @param xi 9x1 tangent vector [phi, nu, rho]
 * @return 5x5 SE_2(3) matrix
 */
inline Eigen::Matrix<double, 5, 5> exp_se23(const Eigen::Matrix<double, 9, 1> &xi) {
  Eigen::Vector3d phi = xi.block(0, 0, 3, 1);
  Eigen::Matrix3d J = Jl_so3(phi);
  return se23_from_components(exp_so3(phi), J * xi.block(3, 0, 3, 1), J * xi.block(6, 0, 3, 1));
}

/**
 * @brief SE_2(3) matrix logarithm
 * @param X 5x5 SE_2(3) matrix
 * @return 9x1 tangent vector [phi, nu, rho]
 */
inline Eigen::Matrix<double, 9, 1> log_se23(const Eigen::Matrix<double, 5, 5> &X) {
  Eigen::Matrix3d C;
  Eigen::Vector3d v, r;
  se23_components(X, C, v, r);
  Eigen::Vector3d phi = log_so3(C);
  Eigen::Matrix3d J_inv = Jl_inv_so3(phi);
  Eigen::Matrix<double, 9, 1> xi;
  xi.block(0, 0, 3, 1) = phi;
  xi.block(3, 0, 3, 1) = J_inv * v;
  xi.block(6, 0, 3, 1) = J_inv * r;
  return xi;
}

/**
 * @brief Inverse of an SE_2(3) matrix
 * @param X 5x5 SE_2(3) matrix
 * @return Its inverse
 */
inline Eigen::Matrix<double, 5, 5> Inv_se23(const Eigen::Matrix<double, 5, 5> &X) {
  Eigen::Matrix3d C;
  Eigen::Vector3d v, r;
  se23_components(X, C, v, r);
  return se23_from_components(C.transpose(), -C.transpose() * v, -C.transpose() * r);
}

/**
 * @brief Adjoint of an SE_2(3) matrix
 *
 * \f{align*}{
 * \mathrm{Ad}(\mathbf X) = \begin{bmatrix} \mathbf C & \mathbf 0 & \mathbf 0 \\ \lfloor\mathbf v\times\rfloor\mathbf C & \mathbf C & \mathbf 0 \\
 * \lfloor\mathbf r\times\rfloor\mathbf C & \mathbf 0 & \mathbf C \end{bmatrix}
 * \f}
 *
 * @param X 5x5 SE_2(3) matrix
 * @return 9x9 adjoint
 */
inline Eigen::Matrix<double, 9, 9> Ad_se23(const Eigen::Matrix<double, 5, 5> &X) {
  Eigen::Matrix3d C;
  Eigen::Vector3d v, r;
  se23_components(X, C, v, r);
  Eigen::Matrix<double, 9, 9> Ad = Eigen::Matrix<double, 9, 9>::Zero();
  Ad.block(0, 0, 3, 3) = C;
  Ad.block(3, 3, 3, 3) = C;
  Ad.block(6, 6, 3, 3) = C;
  Ad.block(3, 0, 3, 3) = skew_x(v) * C;
  Ad.block(6, 0, 3, 3) = skew_x(r) * C;
  return Ad;
}

/**
 * @brief The Q block of the SE(3) left Jacobian, see Barfoot equation (7.86)
 * @param phi Rotation part of the tangent vector
 * @param rho Translation-like part of the tangent vector (velocity or position)
 * @return 3x3 coupling block
 */
inline Eigen::Matrix3d Jl_Q_block(const Eigen::Vector3d &phi, const Eigen::Vector3d &rho) {
  double a1, a2, a3;
  so3_series_coeffs(phi.norm(), a1, a2, a3);
  Eigen::Matrix3d px = skew_x(phi);
  Eigen::Matrix3d rx = skew_x(rho);
  Eigen::Matrix3d pxrx = px * rx;
  Eigen::Matrix3d rxpx = rx * px;
  Eigen::Matrix3d pxrxpx = px * rx * px;
  return 0.5 * rx + a1 * (pxrx + rxpx + pxrxpx) + a2 * (px * pxrx + rxpx * px - 3.0 * pxrxpx) + a3 * (pxrxpx * px + px * pxrxpx);
}

/**
 * @brief Computes left Jacobian of SE_2(3)
 *
 * \f{align*}{
 * \mathcal J_l(\boldsymbol\xi) = \begin{bmatrix} \mathbf J & \mathbf 0 & \mathbf 0 \\ \mathbf Q(\boldsymbol\phi,\boldsymbol\nu) & \mathbf J &
 * \mathbf 0 \\ \mathbf Q(\boldsymbol\phi,\boldsymbol\rho) & \mathbf 0 & \mathbf J \end{bmatrix}
 * \f}
 *
 * @param xi 9x1 tangent vector [phi, nu, rho]
 * @return 9x9 left Jacobian
 */
inline Eigen::Matrix<double, 9, 9> Jl_se23(const Eigen::Matrix<double, 9, 1> &xi) {
  Eigen::Vector3d phi = xi.block(0, 0, 3, 1);
  Eigen::Matrix3d J = Jl_so3(phi);
  Eigen::Matrix<double, 9, 9> Jac = Eigen::Matrix<double, 9, 9>::Zero();
  Jac.block(0, 0, 3, 3) = J;
  Jac.block(3, 3, 3, 3) = J;
  Jac.block(6, 6, 3, 3) = J;
  Jac.block(3, 0, 3, 3) = Jl_Q_block(phi, xi.block(3, 0, 3, 1));
  Jac.block(6, 0, 3, 3) = Jl_Q_block(phi, xi.block(6, 0, 3, 1));
  return Jac;
}

/**
 * @brief Computes the inverse of the left Jacobian of SE_2(3)
 * @param xi 9x1 tangent vector [phi, nu, rho]
 * @return 9x9 inverse left Jacobian
 */
inline Eigen::Matrix<double, 9, 9> Jl_inv_se23(const Eigen::Matrix<double, 9, 1> &xi) {
  Eigen::Vector3d phi = xi.block(0, 0, 3, 1);
  Eigen::Matrix3d J_inv = Jl_inv_so3(phi);
  Eigen::Matrix<double, 9, 9> Jac = Eigen::Matrix<double, 9, 9>::Zero();
  Jac.block(0, 0, 3, 3) = J_inv;
  Jac.block(3, 3, 3, 3) = J_inv;
  Jac.block(6, 6, 3, 3) = J_inv;
  Jac.block(3, 0, 3, 3) = -J_inv * Jl_Q_block(phi, xi.block(3, 0, 3, 1)) * J_inv;
  Jac.block(6, 0, 3, 3) = -J_inv * Jl_Q_block(phi, xi.block(6, 0, 3, 1)) * J_inv;
  return Jac;
}

/**
 * @brief The "time machine" that carries the elapsed time of an increment
 *
 * The IMU increment is not an element of SE_2(3) since its (3,4) entry is dt.
 * It does factor as @f$\mathbf U = \mathbf T(\Delta t)\exp(\boldsymbol\nu)@f$ with this matrix on the left.
 *
 * @param dt Elapsed time
 * @return 5x5 time matrix
 */
inline Eigen::Matrix<double, 5, 5> time_machine(double dt) {
  Eigen::Matrix<double, 5, 5> T = Eigen::Matrix<double, 5, 5>::Identity();
  T(3, 4) = dt;
  return T;
}

/**
 * @brief Exact inverse of an IE3 matrix
 *
 * \f{align*}{
 * \begin{bmatrix} \mathbf C & \mathbf v & \mathbf r \\ \mathbf 0 & 1 & c \\ \mathbf 0 & 0 & 1 \end{bmatrix}^{-1} =
 * \begin{bmatrix} \mathbf C^\top & -\mathbf C^\top\mathbf v & \mathbf C^\top(c\mathbf v - \mathbf r) \\ \mathbf 0 & 1 & -c \\
 * \mathbf 0 & 0 & 1 \end{bmatrix}
 * \f}
 *
 * @param X 5x5 IE3 matrix
 * @return Its inverse
 */
inline Eigen::Matrix<double, 5, 5> ie3_inv(const Eigen::Matrix<double, 5, 5> &X) {
  Eigen::Matrix3d C;
  Eigen::Vector3d v, r;
  se23_components(X, C, v, r);
  double c = X(3, 4);
  Eigen::Matrix<double, 5, 5> X_inv = se23_from_components(C.transpose(), -C.transpose() * v, C.transpose() * (c * v - r));
  X_inv(3, 4) = -c;
  return X_inv;
}

/**
 * @brief Exact adjoint of an IE3 matrix
 *
 * This is the 9x9 matrix such that @f$\mathbf X \boldsymbol\xi^\wedge \mathbf X^{-1} = (\mathrm{Ad}(\mathbf X)\boldsymbol\xi)^\wedge@f$:
 * \f{align*}{
 * \mathrm{Ad}(\mathbf X) = \begin{bmatrix} \mathbf C & \mathbf 0 & \mathbf 0 \\ \lfloor\mathbf v\times\rfloor\mathbf C & \mathbf C & \mathbf 0 \\
 * -\lfloor(c\mathbf v - \mathbf r)\times\rfloor\mathbf C & -c\mathbf C & \mathbf C \end{bmatrix}
 * \f}
 *
 * With c=0 this reduces to @ref Ad_se23().
 *
 * @param X 5x5 IE3 matrix
 * @return 9x9 adjoint
 */
inline Eigen::Matrix<double, 9, 9> ie3_adj(const Eigen::Matrix<double, 5, 5> &X) {
  Eigen::Matrix3d C;
  Eigen::Vector3d v, r;
  se23_components(X, C, v, r);
  double c = X(3, 4);
  Eigen::Matrix<double, 9, 9> Ad = Eigen::Matrix<double, 9, 9>::Zero();
  Ad.block(0, 0, 3, 3) = C;
  Ad.block(3, 3, 3, 3) = C;
  Ad.block(6, 6, 3, 3) = C;
  Ad.block(3, 0, 3, 3) = skew_x(v) * C;
  Ad.block(6, 0, 3, 3) = -skew_x(c * v - r) * C;
  Ad.block(6, 3, 3, 3) = -c * C;
  return Ad;
}

/**
 * @brief Checks that the matrix is a proper rotation (orthonormal with determinant +1)
 * @param C 3x3 matrix
 * @param tol Tolerance on both checks
 * @return True if it is a valid rotation
 */
inline bool is_valid_rotation(const Eigen::Matrix3d &C, double tol = 1e-9) {
  return (C * C.transpose() - Eigen::Matrix3d::Identity()).norm() < tol && std::abs(C.determinant() - 1.0) < tol;
}

/**
 * @brief Construct rotation matrix from given roll
 * @param t roll angle
 * @return 3x3 rotation matrix
 */
inline Eigen::Matrix<double, 3, 3> rot_x(double t) {
  Eigen::Matrix<double, 3, 3> r;
  double ct = cos(t);
  double st = sin(t);
  r << 1.0, 0.0, 0.0, 0.0, ct, -st, 0.0, st, ct;
  return r;
}

/**
 * @brief Construct rotation matrix from given pitch
 * @param t pitch angle
 * @return 3x3 rotation matrix
 */
inline Eigen::Matrix<double, 3, 3> rot_y(double t) {
  Eigen::Matrix<double, 3, 3> r;
  double ct = cos(t);
  double st = sin(t);
  r << ct, 0.0, st, 0.0, 1.0, 0.0, -st, 0.0, ct;
  return r;
}

/**
 * @brief Construct rotation matrix from given yaw
 * @param t yaw angle
 * @return 3x3 rotation matrix
 */
inline Eigen::Matrix<double, 3, 3> rot_z(double t) {
  Eigen::Matrix<double, 3, 3> r;
  double ct = cos(t);
  double st = sin(t);
  r << ct, -st, 0.0, st, ct, 0.0, 0.0, 0.0, 1.0;
  return r;
}

} // namespace se23_imu

#endif /* SE23_IMU_LIE_OPS_H */
