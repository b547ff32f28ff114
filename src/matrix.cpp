#include "intentnn/matrix.h"
#include <algorithm>
#include <cmath>
#include <random>

Matrix::Matrix() : rows(0), cols(0) {}

Matrix::Matrix(size_t rows, size_t cols)
    : rows(rows), cols(cols), data(rows * cols, 0.0) {}

Matrix::Matrix(size_t rows, size_t cols, double value)
    : rows(rows), cols(cols), data(rows * cols, value) {}

Matrix::Matrix(const std::vector<std::vector<double>>& values)
    : rows(values.size()), cols(values.empty() ? 0 : values[0].size())
{
    data.reserve(rows * cols);
    for (const auto& row : values) {
        if (row.size() != cols) {
            throw std::invalid_argument("All rows must have the same length");
        }
        data.insert(data.end(), row.begin(), row.end());
    }
}

Matrix Matrix::operator+(const Matrix& other) const {
    if (!sameShape(other)) {
        throw std::invalid_argument("Matrix dimensions must match for addition");
    }
    Matrix result(rows, cols);
    for (size_t k = 0; k < data.size(); ++k) {
        result.data[k] = data[k] + other.data[k];
    }
    return result;
}

Matrix Matrix::operator-(const Matrix& other) const {
    if (!sameShape(other)) {
        throw std::invalid_argument("Matrix dimensions must match for subtraction");
    }
    Matrix result(rows, cols);
    for (size_t k = 0; k < data.size(); ++k) {
        result.data[k] = data[k] - other.data[k];
    }
    return result;
}

// Matrix multiplication, i-k-j order keeps the inner loop contiguous
Matrix Matrix::operator*(const Matrix& other) const {
    if (cols != other.rows) {
        throw std::invalid_argument("Matrix dimensions incompatible for multiplication");
    }

    Matrix result(rows, other.cols);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t k = 0; k < cols; ++k) {
            double a = data[i * cols + k];
            if (a == 0.0) continue;
            const double* b_row = &other.data[k * other.cols];
            double* r_row = &result.data[i * other.cols];
            for (size_t j = 0; j < other.cols; ++j) {
                r_row[j] += a * b_row[j];
            }
        }
    }
    return result;
}

Matrix Matrix::operator*(double scalar) const {
    Matrix result(rows, cols);
    for (size_t k = 0; k < data.size(); ++k) {
        result.data[k] = data[k] * scalar;
    }
    return result;
}

Matrix& Matrix::operator+=(const Matrix& other) {
    if (!sameShape(other)) {
        throw std::invalid_argument("Matrix dimensions must match for addition");
    }
    for (size_t k = 0; k < data.size(); ++k) {
        data[k] += other.data[k];
    }
    return *this;
}

Matrix& Matrix::operator*=(double scalar) {
    for (double& x : data) {
        x *= scalar;
    }
    return *this;
}

Matrix Matrix::hadamard(const Matrix& other) const {
    if (!sameShape(other)) {
        throw std::invalid_argument("Matrix dimensions must match for Hadamard product");
    }
    Matrix result(rows, cols);
    for (size_t k = 0; k < data.size(); ++k) {
        result.data[k] = data[k] * other.data[k];
    }
    return result;
}

Matrix Matrix::transpose() const {
    Matrix result(cols, rows);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            result.data[j * rows + i] = data[i * cols + j];
        }
    }
    return result;
}

Matrix Matrix::addRowVector(const Matrix& row) const {
    if (row.rows != 1 || row.cols != cols) {
        throw std::invalid_argument("Row vector width must match matrix columns");
    }
    Matrix result(*this);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            result.data[i * cols + j] += row.data[j];
        }
    }
    return result;
}

Matrix Matrix::sumCols() const {
    Matrix result(1, cols);
    for (size_t i = 0; i < rows; ++i) {
        for (size_t j = 0; j < cols; ++j) {
            result.data[j] += data[i * cols + j];
        }
    }
    return result;
}

double Matrix::squaredNorm() const {
    double total = 0.0;
    for (double x : data) {
        total += x * x;
    }
    return total;
}

size_t Matrix::argmaxRow(size_t i) const {
    if (i >= rows || cols == 0) {
        throw std::out_of_range("Matrix row index out of bounds");
    }
    size_t best = 0;
    for (size_t j = 1; j < cols; ++j) {
        if (data[i * cols + j] > data[i * cols + best]) {
            best = j;
        }
    }
    return best;
}

Matrix Matrix::apply(std::function<double(double)> func) const {
    Matrix result(rows, cols);
    for (size_t k = 0; k < data.size(); ++k) {
        result.data[k] = func(data[k]);
    }
    return result;
}

void Matrix::fill(double value) {
    std::fill(data.begin(), data.end(), value);
}

void Matrix::zeros() {
    fill(0.0);
}

void Matrix::randomNormal(std::mt19937& gen, double mean, double stddev) {
    std::normal_distribution<> dis(mean, stddev);
    for (double& x : data) {
        x = dis(gen);
    }
}

// Xavier/Glorot uniform initialization
void Matrix::xavierInit(std::mt19937& gen, size_t fan_in, size_t fan_out) {
    double limit = std::sqrt(6.0 / static_cast<double>(fan_in + fan_out));
    std::uniform_real_distribution<> dis(-limit, limit);
    for (double& x : data) {
        x = dis(gen);
    }
}

bool Matrix::sameShape(const Matrix& other) const {
    return (rows == other.rows && cols == other.cols);
}

Matrix Matrix::zeros(size_t rows, size_t cols) {
    return Matrix(rows, cols, 0.0);
}
