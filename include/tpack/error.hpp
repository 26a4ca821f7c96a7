#pragma once
#include <stdexcept>
#include <string>

namespace tpack {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Bad request to build a package
class InvalidInput : public Error {
public:
  using Error::Error;
};

// Header buffer of the wrong width or with undecodable fields
class MalformedHeader : public Error {
public:
  using Error::Error;
};

// Boundary table disagrees with the payload
class LengthMismatch : public Error {
public:
  using Error::Error;
};

// Raised by channel implementations, propagated untouched by the protocol
class ChannelFailure : public Error {
public:
  using Error::Error;
};

} // namespace tpack
