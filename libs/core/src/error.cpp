#include "doco/core/error.h"

namespace doco::core {

kj::StringPtr describe(const kj::Exception& exception) {
  kj::StringPtr description = exception.getDescription();
  if (description.size() > 0) {
    return description;
  }
  switch (exception.getType()) {
  case kj::Exception::Type::FAILED:
    return "failed"_kj;
  case kj::Exception::Type::OVERLOADED:
    return "overloaded"_kj;
  case kj::Exception::Type::DISCONNECTED:
    return "disconnected"_kj;
  case kj::Exception::Type::UNIMPLEMENTED:
    return "unimplemented"_kj;
  }
  return "unknown error"_kj;
}

} // namespace doco::core
