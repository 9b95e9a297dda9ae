#pragma once

/// @file include/adjarr/errors.hpp
/// @brief Exception types raised by the adjusted-array engine.
///
/// # Error kinds
/// - ConfigurationError      — bad construction input (mask shape, missing
///                             value, dtype/adjustment mismatch). Raised by
///                             constructors and factories, never deferred.
/// - WindowLengthNotPositive — traverse(w) with w <= 0.
/// - WindowLengthTooLong     — traverse(w) with w > rows.
/// - AdjustmentError         — malformed or out-of-bounds adjustment region.
/// - DtypeError              — a window or array was read as the wrong dtype.
///
/// All errors are fatal to the call that raised them. Nothing is retried.

#include <stdexcept>
#include <string>

namespace adjarr {

/// Base class of every error raised by adjarr.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigurationError : public Error {
public:
    using Error::Error;
};

class WindowLengthNotPositive : public Error {
public:
    using Error::Error;
};

class WindowLengthTooLong : public Error {
public:
    using Error::Error;
};

class AdjustmentError : public Error {
public:
    using Error::Error;
};

class DtypeError : public Error {
public:
    using Error::Error;
};

}  // namespace adjarr
