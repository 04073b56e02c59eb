#pragma once

#include <stdexcept>
#include <string>

namespace transcode {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Open, read, write, fsync or rename failure.
class IoError : public Error {
public:
    using Error::Error;
};

// Encoding name that cannot be resolved to a usable codec.
class LookupError : public Error {
public:
    using Error::Error;
};

// Argument value outside its domain (newline style, chunk size).
class ValueError : public Error {
public:
    using Error::Error;
};

// Conversion cannot be completed even with replacement.
class ConversionError : public ValueError {
public:
    using ValueError::ValueError;
};

} // namespace transcode
