#include "doco/proxy/config_template.h"

#include "doco/core/error.h"

#include <kj/vector.h>

namespace doco::proxy {

namespace {

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_key_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

// Returns the key of a "{{ .key }}" action body, or none when the body is not a field reference.
kj::Maybe<kj::StringPtr> parse_field(kj::StringPtr body, kj::String& storage) {
  size_t begin = 0;
  size_t end = body.size();
  while (begin < end && is_space(body[begin])) {
    ++begin;
  }
  while (end > begin && is_space(body[end - 1])) {
    --end;
  }
  if (end - begin < 2 || body[begin] != '.') {
    return kj::none;
  }
  for (size_t i = begin + 1; i < end; ++i) {
    if (!is_key_char(body[i])) {
      return kj::none;
    }
  }
  storage = kj::str(body.slice(begin + 1, end));
  return storage.asPtr();
}

} // namespace

kj::String render_template(kj::StringPtr text, const TemplateValues& values) {
  kj::Vector<char> out(text.size() + 64);
  size_t pos = 0;

  while (pos < text.size()) {
    kj::StringPtr rest = text.slice(pos);
    KJ_IF_SOME(open, rest.find("{{"_kj)) {
      out.addAll(rest.slice(0, open));
      size_t action_start = pos + open;
      kj::StringPtr after_open = text.slice(action_start + 2);

      KJ_IF_SOME(close, after_open.find("}}"_kj)) {
        kj::String key_storage;
        KJ_IF_SOME(key, parse_field(kj::heapString(after_open.slice(0, close)), key_storage)) {
          KJ_IF_SOME(value, values.find(key)) {
            out.addAll(value);
          } else {
            core::TemplateException(kj::str("no value for key '", key, "'"), action_start)
                .throwException();
          }
        } else {
          core::TemplateException("malformed template action", action_start).throwException();
        }
        pos = action_start + 2 + close + 2;
      } else {
        core::TemplateException("unterminated template action", action_start).throwException();
      }
    } else {
      out.addAll(rest);
      break;
    }
  }

  out.add('\0');
  return kj::String(out.releaseAsArray());
}

} // namespace doco::proxy
