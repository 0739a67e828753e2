#include "session/session.h"

#include "doco/core/error.h"
#include "doco/core/http_util.h"
#include "doco/core/json.h"

#include <kj/debug.h>

namespace doco::gateway {

Session::Session(kj::String token, kj::Date expiry) : token_(kj::mv(token)), expiry_(expiry) {}

kj::Maybe<kj::StringPtr> Session::get(kj::StringPtr key) const {
  KJ_IF_SOME(value, values_.find(key)) {
    return value.asPtr();
  }
  return kj::none;
}

bool Session::exists(kj::StringPtr key) const {
  return values_.find(key) != kj::none;
}

void Session::put(kj::StringPtr key, kj::StringPtr value) {
  values_.upsert(kj::str(key), kj::str(value),
                 [](kj::String& existing, kj::String&& replacement) {
                   existing = kj::mv(replacement);
                 });
  status_ = SessionStatus::Modified;
}

void Session::remove(kj::StringPtr key) {
  if (values_.erase(key)) {
    status_ = SessionStatus::Modified;
  }
}

void Session::destroy() {
  values_.clear();
  status_ = SessionStatus::Destroyed;
}

kj::String Session::encode() const {
  return core::JsonBuilder::object()
      .put("deadline", core::unix_seconds(expiry_))
      .put_object("values",
                  [this](core::JsonBuilder& values) {
                    for (auto& entry : values_) {
                      values.put(entry.key, entry.value.asPtr());
                    }
                  })
      .build();
}

kj::Own<Session> Session::decode(kj::StringPtr token, kj::StringPtr data) {
  auto doc = core::JsonDocument::parse(data);
  auto root = doc.root();
  if (!root.is_object()) {
    core::ValidationException("session data is not an object").throwException();
  }

  int64_t deadline = 0;
  KJ_IF_SOME(value, root.get("deadline")) {
    deadline = value.get_int();
  } else {
    core::ValidationException("session data has no deadline").throwException();
  }

  auto session = kj::heap<Session>(kj::str(token), kj::UNIX_EPOCH + deadline * kj::SECONDS);
  KJ_IF_SOME(values, root.get("values")) {
    values.for_each_object([&](kj::StringPtr key, const core::JsonValue& value) {
      session->values_.insert(kj::str(key), kj::str(value.get_string()));
    });
  }
  return session;
}

} // namespace doco::gateway
