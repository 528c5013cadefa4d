// Vidsample - Error types
// Every failure the library reports derives from vidsample::Error.

#pragma once

#include <stdexcept>
#include <string>

namespace vidsample {

enum class ErrorKind {
  SourceUnavailable,
  Configuration,
  Collaborator,
};

const char* toString(ErrorKind kind);

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& what)
      : std::runtime_error(what), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

// Video reference cannot be opened: missing file, failed download,
// unsupported format.
class SourceUnavailable : public Error {
public:
  explicit SourceUnavailable(const std::string& what)
      : Error(ErrorKind::SourceUnavailable, what) {}
};

// Invalid sampling or output parameters. Raised before any frame is read.
class ConfigurationError : public Error {
public:
  explicit ConfigurationError(const std::string& what)
      : Error(ErrorKind::Configuration, what) {}
};

// Persistence failures (directory creation, image encoding).
class CollaboratorFailure : public Error {
public:
  explicit CollaboratorFailure(const std::string& what)
      : Error(ErrorKind::Collaborator, what) {}
};

} // namespace vidsample
