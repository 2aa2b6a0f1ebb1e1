#include <gtest/gtest.h>
#include "eigupdate/normalizer.hpp"
#include <cmath>

using namespace eigupdate;

// ---- eigenvalue_vector ----

TEST(Normalizer, DiagonalMatrixToVector) {
    Eigen::MatrixXd E = Eigen::Vector3d(4.0, -1.0, 2.5).asDiagonal();
    Eigen::VectorXd e = eigenvalue_vector(E);
    ASSERT_EQ(e.size(), 3);
    EXPECT_DOUBLE_EQ(e(0), 4.0);
    EXPECT_DOUBLE_EQ(e(1), -1.0);
    EXPECT_DOUBLE_EQ(e(2), 2.5);
}

TEST(Normalizer, ColumnAndRowVectorsPassThrough) {
    Eigen::MatrixXd col(3, 1);
    col << 1.0, 2.0, 3.0;
    Eigen::MatrixXd row(1, 3);
    row << 1.0, 2.0, 3.0;
    Eigen::MatrixXd scalar(1, 1);
    scalar << 7.0;

    EXPECT_EQ(eigenvalue_vector(col), Eigen::Vector3d(1.0, 2.0, 3.0));
    EXPECT_EQ(eigenvalue_vector(row), Eigen::Vector3d(1.0, 2.0, 3.0));
    ASSERT_EQ(eigenvalue_vector(scalar).size(), 1);
    EXPECT_DOUBLE_EQ(eigenvalue_vector(scalar)(0), 7.0);
}

TEST(Normalizer, NonVectorNonSquareThrows) {
    Eigen::MatrixXd E = Eigen::MatrixXd::Zero(2, 3);
    EXPECT_THROW(eigenvalue_vector(E), UpdateError);
}

// ---- Sorting ----

TEST(Normalizer, SortsAndPermutesConsistently) {
    Eigen::MatrixXd V = Eigen::MatrixXd::Identity(3, 3);
    Eigen::VectorXd E(3), t(3);
    E << 3.0, 1.0, 2.0;
    t << 30.0, 10.0, 20.0;

    SortedSpectrum s = normalize_spectrum(V, E, t, 1e-12);

    EXPECT_EQ(s.permutation, (std::vector<int>{1, 2, 0}));
    EXPECT_EQ(s.lambda, Eigen::Vector3d(1.0, 2.0, 3.0));
    EXPECT_EQ(s.t, Eigen::Vector3d(10.0, 20.0, 30.0));
    for (int i = 0; i < 3; i++) {
        EXPECT_EQ(s.V.col(i), V.col(s.permutation[i])) << "Column " << i;
    }
}

TEST(Normalizer, EqualEigenvaluesKeepInputOrder) {
    Eigen::MatrixXd V = Eigen::MatrixXd::Identity(4, 4);
    Eigen::VectorXd E(4), t(4);
    E << 2.0, 1.0, 2.0, 2.0;
    t << 0.1, 0.2, 0.3, 0.4;

    SortedSpectrum s = normalize_spectrum(V, E, t, 1e-12);
    EXPECT_EQ(s.permutation, (std::vector<int>{1, 0, 2, 3}));
    EXPECT_DOUBLE_EQ(s.t(1), 0.1);
    EXPECT_DOUBLE_EQ(s.t(3), 0.4);
}

TEST(Normalizer, ReducedBasisKeepsRowCount) {
    Eigen::MatrixXd V = Eigen::MatrixXd::Identity(5, 2);
    Eigen::VectorXd E(2), t(2);
    E << 2.0, 1.0;
    t << 1.0, 1.0;

    SortedSpectrum s = normalize_spectrum(V, E, t, 1e-12);
    EXPECT_EQ(s.V.rows(), 5);
    EXPECT_EQ(s.V.cols(), 2);
    EXPECT_DOUBLE_EQ(s.V(1, 0), 1.0);
}

// ---- Cleanup ----

TEST(Normalizer, TinyEigenvaluesSnapToZero) {
    Eigen::MatrixXd V = Eigen::MatrixXd::Identity(3, 3);
    Eigen::VectorXd E(3), t(3);
    E << 1e-14, 4.0, -1e-13;
    t << 1.0, 2.0, 2.0;

    SortedSpectrum s = normalize_spectrum(V, E, t, 1e-12);

    // tol = r * acc * sqrt(max|lambda|) = 3 * 1e-12 * 2
    EXPECT_NEAR(s.cleanup_tolerance, 6e-12, 1e-24);
    EXPECT_DOUBLE_EQ(s.max_abs_lambda, 4.0);
    EXPECT_DOUBLE_EQ(s.t_norm, 3.0);
    EXPECT_EQ(s.lambda(0), 0.0);
    EXPECT_EQ(s.lambda(1), 0.0);
    EXPECT_EQ(s.lambda(2), 4.0);
}

TEST(Normalizer, SnappedValuesBecomeRepeated) {
    Eigen::MatrixXd V = Eigen::MatrixXd::Identity(3, 3);
    Eigen::VectorXd E(3), t(3);
    E << 2e-13, 1.0, -3e-13;
    t << 1.0, 1.0, 1.0;

    SortedSpectrum s = normalize_spectrum(V, E, t, 1e-12);
    EXPECT_EQ(s.lambda(0), 0.0);
    EXPECT_EQ(s.lambda(0), s.lambda(1));
    EXPECT_EQ(s.permutation, (std::vector<int>{2, 0, 1}));
}

// ---- Shape checks ----

TEST(Normalizer, ShapeMismatchThrows) {
    Eigen::MatrixXd V = Eigen::MatrixXd::Identity(3, 3);
    Eigen::VectorXd E3 = Eigen::VectorXd::Ones(3);
    Eigen::VectorXd E2 = Eigen::VectorXd::Ones(2);
    Eigen::VectorXd t3 = Eigen::VectorXd::Ones(3);
    Eigen::VectorXd t4 = Eigen::VectorXd::Ones(4);

    try {
        normalize_spectrum(V, E2, t3, 1e-12);
        FAIL() << "Expected UpdateError";
    } catch (const UpdateError& e) {
        EXPECT_EQ(e.stage(), UpdateError::Stage::PRECONDITION);
        EXPECT_NE(std::string(e.what()).find("E has 2"), std::string::npos);
    }
    EXPECT_THROW(normalize_spectrum(V, E3, t4, 1e-12), UpdateError);
}
