#include <arm_ik/dls_solver.hpp>
#include <gtest/gtest.h>

using namespace arm_ik;

TEST(GaussJordan, InvertsWithRowSwap)
{
  Eigen::MatrixXd A(3, 3);
  A << 0, 2, 1,
       1, 0, 0,
       3, 1, 4;

  auto inv = invertGaussJordan(A);
  ASSERT_TRUE(inv.has_value());
  EXPECT_TRUE((A * (*inv)).isApprox(Eigen::MatrixXd::Identity(3, 3), 1e-12));
}

TEST(GaussJordan, SingularReturnsNothing)
{
  Eigen::MatrixXd A(2, 2);
  A << 1, 2,
       2, 4;
  EXPECT_FALSE(invertGaussJordan(A).has_value());
}

TEST(GaussJordan, NonSquareThrows)
{
  EXPECT_THROW(invertGaussJordan(Eigen::MatrixXd::Zero(2, 3)), StructuralError);
}

TEST(DampedLeastSquares, IdentityJacobianShrinksStep)
{
  DampedLeastSquares dls(0.5);
  Eigen::Vector3d e(1.0, 0.0, -2.0);

  auto dq = dls.solve(Eigen::MatrixXd::Identity(3, 3), e);
  ASSERT_TRUE(dq.has_value());
  // (I + 0.25 I)^-1 e
  EXPECT_TRUE(dq->isApprox(e / 1.25, 1e-12));
}

TEST(DampedLeastSquares, MatchesClosedForm)
{
  Eigen::MatrixXd J(3, 4);
  J << 0.1, 0.2, 0.0, -0.3,
       0.0, 0.4, 0.1,  0.2,
       0.3, 0.0, 0.2,  0.1;
  Eigen::Vector3d e(0.05, -0.02, 0.01);
  const double lambda = 0.2;

  DampedLeastSquares dls(lambda);
  auto dq = dls.solve(J, e);
  ASSERT_TRUE(dq.has_value());

  Eigen::MatrixXd A = J * J.transpose() + lambda * lambda * Eigen::MatrixXd::Identity(3, 3);
  Eigen::VectorXd expected = J.transpose() * A.ldlt().solve(e);
  EXPECT_TRUE(dq->isApprox(expected, 1e-10));
}

TEST(DampedLeastSquares, ZeroJacobianWithTinyDampingIsSingular)
{
  DampedLeastSquares dls(1e-7);
  auto dq = dls.solve(Eigen::MatrixXd::Zero(3, 2), Eigen::Vector3d(1.0, 0.0, 0.0));
  EXPECT_FALSE(dq.has_value());
}

TEST(DampedLeastSquares, RejectsBadArguments)
{
  EXPECT_THROW(DampedLeastSquares(0.0), ConfigurationError);
  EXPECT_THROW(DampedLeastSquares(-0.1), ConfigurationError);
  EXPECT_THROW(DampedLeastSquares(0.1, 0.0), ConfigurationError);

  DampedLeastSquares dls(0.1);
  EXPECT_THROW(dls.solve(Eigen::MatrixXd::Zero(3, 2), Eigen::VectorXd::Zero(6)),
               StructuralError);
}
