#ifndef INTENTNN_MATRIX_H
#define INTENTNN_MATRIX_H

#include <vector>
#include <functional>
#include <stdexcept>
#include <random>
#include <cmath>

/**
 * @brief Dense row-major matrix used for weights, gradients and activations
 *
 * Storage is a single contiguous buffer so that snapshots and binary
 * checkpoints are plain copies. Element access through operator() is
 * unchecked.
 */
class Matrix {
private:
    size_t rows;
    size_t cols;
    std::vector<double> data;

public:
    // Constructors
    Matrix();
    Matrix(size_t rows, size_t cols);
    Matrix(size_t rows, size_t cols, double value);
    Matrix(const std::vector<std::vector<double>>& values);

    // Arithmetic operations
    Matrix operator+(const Matrix& other) const;
    Matrix operator-(const Matrix& other) const;
    Matrix operator*(const Matrix& other) const;  // Matrix multiplication
    Matrix operator*(double scalar) const;

    // Compound assignment operators
    Matrix& operator+=(const Matrix& other);
    Matrix& operator*=(double scalar);

    // Element-wise operations
    Matrix hadamard(const Matrix& other) const;

    Matrix transpose() const;

    /**
     * @brief Add a (1 × cols) row vector to every row
     */
    Matrix addRowVector(const Matrix& row) const;

    // Reductions
    Matrix sumCols() const;  // Sum along columns (returns row vector)
    double squaredNorm() const;
    size_t argmaxRow(size_t i) const;  // First maximum wins ties

    Matrix apply(std::function<double(double)> func) const;

    // Initialization methods
    void fill(double value);
    void zeros();
    void randomNormal(std::mt19937& gen, double mean = 0.0, double stddev = 1.0);
    void xavierInit(std::mt19937& gen, size_t fan_in, size_t fan_out);

    // Getters
    size_t getRows() const { return rows; }
    size_t getCols() const { return cols; }
    size_t size() const { return data.size(); }

    // Unchecked access
    double& operator()(size_t i, size_t j) { return data[i * cols + j]; }
    double operator()(size_t i, size_t j) const { return data[i * cols + j]; }

    // Raw buffer, row-major
    double* raw() { return data.data(); }
    const double* raw() const { return data.data(); }

    bool sameShape(const Matrix& other) const;

    static Matrix zeros(size_t rows, size_t cols);
};

#endif // INTENTNN_MATRIX_H
