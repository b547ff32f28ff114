#ifndef INTENTNN_ERRORS_H
#define INTENTNN_ERRORS_H

#include <stdexcept>
#include <string>

/**
 * @file errors.h
 * @brief Failure taxonomy of the training and evaluation pipeline
 *
 * None of these are retried anywhere in the library. Callers either fix the
 * input upstream or abandon the run.
 */

/**
 * @brief Base class for all pipeline failures
 */
class IntentError : public std::runtime_error {
public:
    explicit IntentError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Bad input data: unknown intent label, empty text, malformed rows,
 * or tokenizer output that breaks the fixed-length contract
 */
class EncodingError : public IntentError {
public:
    explicit EncodingError(const std::string& message) : IntentError(message) {}
};

/**
 * @brief Non-finite loss or gradient during forward/backward
 */
class NumericalDivergenceError : public IntentError {
public:
    explicit NumericalDivergenceError(const std::string& message) : IntentError(message) {}
};

/**
 * @brief Invalid or incomplete configuration, detected before training starts
 */
class ConfigurationError : public IntentError {
public:
    explicit ConfigurationError(const std::string& message) : IntentError(message) {}
};

/**
 * @brief Missing, corrupt or inconsistent checkpoint (weights or label mapping)
 */
class CheckpointError : public IntentError {
public:
    explicit CheckpointError(const std::string& message) : IntentError(message) {}
};

#endif // INTENTNN_ERRORS_H
