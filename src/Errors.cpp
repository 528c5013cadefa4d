#include "vidsample/Errors.h"

namespace vidsample {

const char* toString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::SourceUnavailable: return "source unavailable";
    case ErrorKind::Configuration: return "configuration error";
    case ErrorKind::Collaborator: return "collaborator failure";
  }
  return "unknown error";
}

} // namespace vidsample
