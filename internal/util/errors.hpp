#pragma once

#include <stdexcept>

namespace install::util {

/*
  Failures raised inside the manager.

  Orchestrator entry points turn these into log lines and status records;
  none of them reach the host. Catch Error to handle all of them at once.
*/
class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// request fails basic validation (identity / url / package name)
class MalformedRequest : public Error {
 public:
  using Error::Error;
};

// downloaded bytes do not match the declared digest
class ValidationFailure : public Error {
 public:
  using Error::Error;
};

// event arrived that the current state has no transition for
class InvalidState : public Error {
 public:
  using Error::Error;
};

class NotFound : public Error {
 public:
  using Error::Error;
};

} // namespace install::util
