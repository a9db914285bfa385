#pragma once

#include <stdexcept>
#include <string>

namespace claimctl::util {

/*
  Central error types.

  The CLI prints every one of these as "error: <message>".
  Nothing in the claim core catches or rewrites them.
*/

// Raw input has the wrong shape (missing name, unknown access mode).
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Inputs parsed but conflict with each other.
class BuildError : public std::runtime_error {
 public:
  explicit BuildError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  A capacity literal does not match the quantity grammar.

  Derives from BuildError so a failed parse during construction reaches
  callers of the builder unchanged yet still as a build failure.
*/
class ParseError : public BuildError {
 public:
  explicit ParseError(const std::string& msg) : BuildError(msg) {
  }
};

class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace claimctl::util
