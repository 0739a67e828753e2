#include "doco/core/json.h"

#include <cstdlib>
#include <kj/debug.h>

namespace doco::core {

// ============================================================================
// JsonDocument
// ============================================================================

JsonDocument::JsonDocument() : doc_(nullptr) {}

JsonDocument::JsonDocument(yyjson_doc* doc) : doc_(doc) {}

JsonDocument::~JsonDocument() noexcept {
  if (doc_ != nullptr) {
    yyjson_doc_free(doc_);
  }
}

JsonDocument::JsonDocument(JsonDocument&& other) noexcept : doc_(other.doc_) {
  other.doc_ = nullptr;
}

JsonDocument& JsonDocument::operator=(JsonDocument&& other) noexcept {
  if (this != &other) {
    if (doc_ != nullptr) {
      yyjson_doc_free(doc_);
    }
    doc_ = other.doc_;
    other.doc_ = nullptr;
  }
  return *this;
}

JsonDocument JsonDocument::parse(kj::StringPtr str) {
  yyjson_read_err err;
  yyjson_doc* doc = yyjson_read_opts(const_cast<char*>(str.cStr()), str.size(), 0, nullptr, &err);
  if (doc == nullptr) {
    KJ_FAIL_REQUIRE("JSON parse error", err.pos, err.msg != nullptr ? err.msg : "unknown error");
  }
  return JsonDocument(doc);
}

JsonValue JsonDocument::root() const {
  if (doc_ == nullptr) {
    return JsonValue(nullptr);
  }
  return JsonValue(yyjson_doc_get_root(doc_));
}

// ============================================================================
// JsonValue
// ============================================================================

bool JsonValue::is_null() const {
  return val_ == nullptr || yyjson_is_null(val_);
}

bool JsonValue::is_bool() const {
  return val_ != nullptr && yyjson_is_bool(val_);
}

bool JsonValue::is_number() const {
  return val_ != nullptr && yyjson_is_num(val_);
}

bool JsonValue::is_string() const {
  return val_ != nullptr && yyjson_is_str(val_);
}

bool JsonValue::is_array() const {
  return val_ != nullptr && yyjson_is_arr(val_);
}

bool JsonValue::is_object() const {
  return val_ != nullptr && yyjson_is_obj(val_);
}

bool JsonValue::get_bool(bool default_val) const {
  return is_bool() ? yyjson_get_bool(val_) : default_val;
}

int64_t JsonValue::get_int(int64_t default_val) const {
  if (val_ == nullptr) {
    return default_val;
  }
  if (yyjson_is_sint(val_)) {
    return yyjson_get_sint(val_);
  }
  if (yyjson_is_uint(val_)) {
    return static_cast<int64_t>(yyjson_get_uint(val_));
  }
  if (yyjson_is_real(val_)) {
    return static_cast<int64_t>(yyjson_get_real(val_));
  }
  return default_val;
}

double JsonValue::get_double(double default_val) const {
  if (val_ == nullptr) {
    return default_val;
  }
  if (yyjson_is_real(val_)) {
    return yyjson_get_real(val_);
  }
  if (yyjson_is_sint(val_)) {
    return static_cast<double>(yyjson_get_sint(val_));
  }
  if (yyjson_is_uint(val_)) {
    return static_cast<double>(yyjson_get_uint(val_));
  }
  return default_val;
}

kj::StringPtr JsonValue::get_string(kj::StringPtr default_val) const {
  if (!is_string()) {
    return default_val;
  }
  // yyjson keeps parsed strings NUL-terminated.
  return kj::StringPtr(yyjson_get_str(val_), yyjson_get_len(val_));
}

size_t JsonValue::size() const {
  if (is_array()) {
    return yyjson_arr_size(val_);
  }
  if (is_object()) {
    return yyjson_obj_size(val_);
  }
  return 0;
}

kj::Maybe<JsonValue> JsonValue::get(kj::StringPtr key) const {
  if (!is_object()) {
    return kj::none;
  }
  yyjson_val* found = yyjson_obj_getn(val_, key.cStr(), key.size());
  if (found == nullptr) {
    return kj::none;
  }
  return JsonValue(found);
}

kj::Maybe<JsonValue> JsonValue::at(size_t index) const {
  if (!is_array()) {
    return kj::none;
  }
  yyjson_val* found = yyjson_arr_get(val_, index);
  if (found == nullptr) {
    return kj::none;
  }
  return JsonValue(found);
}

void JsonValue::for_each_object(
    kj::FunctionParam<void(kj::StringPtr, const JsonValue&)> callback) const {
  if (!is_object()) {
    return;
  }
  yyjson_obj_iter iter;
  yyjson_obj_iter_init(val_, &iter);
  yyjson_val* key;
  while ((key = yyjson_obj_iter_next(&iter)) != nullptr) {
    JsonValue value(yyjson_obj_iter_get_val(key));
    callback(kj::StringPtr(yyjson_get_str(key), yyjson_get_len(key)), value);
  }
}

void JsonValue::for_each_array(kj::FunctionParam<void(const JsonValue&)> callback) const {
  if (!is_array()) {
    return;
  }
  size_t idx, max;
  yyjson_val* element;
  yyjson_arr_foreach(val_, idx, max, element) {
    callback(JsonValue(element));
  }
}

// ============================================================================
// JsonBuilder
// ============================================================================

struct JsonBuilder::Impl {
  yyjson_mut_doc* doc = nullptr;
  yyjson_mut_val* current = nullptr;
  bool is_object = true;

  ~Impl() noexcept {
    if (doc != nullptr) {
      yyjson_mut_doc_free(doc);
    }
  }
};

JsonBuilder::JsonBuilder(Type type) : impl_(kj::heap<Impl>()) {
  impl_->is_object = type == Type::Object;
  impl_->doc = yyjson_mut_doc_new(nullptr);
  KJ_REQUIRE(impl_->doc != nullptr, "failed to allocate JSON document");
  impl_->current = impl_->is_object ? yyjson_mut_obj(impl_->doc) : yyjson_mut_arr(impl_->doc);
}

JsonBuilder::~JsonBuilder() noexcept = default;

JsonBuilder::JsonBuilder(JsonBuilder&& other) noexcept : impl_(kj::mv(other.impl_)) {}

JsonBuilder& JsonBuilder::operator=(JsonBuilder&& other) noexcept {
  if (this != &other) {
    impl_ = kj::mv(other.impl_);
  }
  return *this;
}

JsonBuilder JsonBuilder::object() {
  return JsonBuilder(Type::Object);
}

JsonBuilder JsonBuilder::array() {
  return JsonBuilder(Type::Array);
}

yyjson_mut_val* JsonBuilder::key_val(kj::StringPtr key) {
  return yyjson_mut_strncpy(impl_->doc, key.cStr(), key.size());
}

void JsonBuilder::add_member(kj::StringPtr key, yyjson_mut_val* value) {
  if (!impl_->is_object) {
    return;
  }
  yyjson_mut_val* k = key_val(key);
  if (k != nullptr && value != nullptr) {
    yyjson_mut_obj_add(impl_->current, k, value);
  }
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, const char* value) {
  return put(key, kj::StringPtr(value));
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, kj::StringPtr value) {
  add_member(key, yyjson_mut_strncpy(impl_->doc, value.cStr(), value.size()));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, bool value) {
  add_member(key, yyjson_mut_bool(impl_->doc, value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, int64_t value) {
  add_member(key, yyjson_mut_sint(impl_->doc, value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, uint64_t value) {
  add_member(key, yyjson_mut_uint(impl_->doc, value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, double value) {
  add_member(key, yyjson_mut_real(impl_->doc, value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, std::nullptr_t) {
  add_member(key, yyjson_mut_null(impl_->doc));
  return *this;
}

JsonBuilder& JsonBuilder::put_object(kj::StringPtr key,
                                     kj::FunctionParam<void(JsonBuilder&)> builder) {
  if (!impl_->is_object) {
    return *this;
  }
  yyjson_mut_val* nested = yyjson_mut_obj(impl_->doc);
  yyjson_mut_val* saved = impl_->current;
  impl_->current = nested;
  builder(*this);
  impl_->current = saved;
  add_member(key, nested);
  return *this;
}

JsonBuilder& JsonBuilder::put_array(kj::StringPtr key,
                                    kj::FunctionParam<void(JsonBuilder&)> builder) {
  if (!impl_->is_object) {
    return *this;
  }
  yyjson_mut_val* nested = yyjson_mut_arr(impl_->doc);
  yyjson_mut_val* saved = impl_->current;
  impl_->current = nested;
  impl_->is_object = false;
  builder(*this);
  impl_->current = saved;
  impl_->is_object = true;
  add_member(key, nested);
  return *this;
}

JsonBuilder& JsonBuilder::add(kj::StringPtr value) {
  if (!impl_->is_object) {
    yyjson_mut_arr_append(impl_->current,
                          yyjson_mut_strncpy(impl_->doc, value.cStr(), value.size()));
  }
  return *this;
}

JsonBuilder& JsonBuilder::add(int64_t value) {
  if (!impl_->is_object) {
    yyjson_mut_arr_append(impl_->current, yyjson_mut_sint(impl_->doc, value));
  }
  return *this;
}

JsonBuilder& JsonBuilder::add(double value) {
  if (!impl_->is_object) {
    yyjson_mut_arr_append(impl_->current, yyjson_mut_real(impl_->doc, value));
  }
  return *this;
}

JsonBuilder& JsonBuilder::add_object(kj::FunctionParam<void(JsonBuilder&)> builder) {
  if (impl_->is_object) {
    return *this;
  }
  yyjson_mut_val* nested = yyjson_mut_obj(impl_->doc);
  yyjson_mut_val* saved = impl_->current;
  impl_->current = nested;
  impl_->is_object = true;
  builder(*this);
  impl_->current = saved;
  impl_->is_object = false;
  yyjson_mut_arr_append(impl_->current, nested);
  return *this;
}

kj::String JsonBuilder::build(bool pretty) const {
  if (impl_->doc == nullptr || impl_->current == nullptr) {
    return kj::str(""_kj);
  }
  yyjson_mut_doc_set_root(impl_->doc, impl_->current);
  size_t len = 0;
  yyjson_write_flag flags = pretty ? YYJSON_WRITE_PRETTY : 0;
  yyjson_write_err err;
  char* json = yyjson_mut_write_opts(impl_->doc, flags, nullptr, &len, &err);
  KJ_REQUIRE(json != nullptr, "JSON write error", err.msg != nullptr ? err.msg : "unknown error");
  kj::String result = kj::heapString(json, len);
  std::free(json);
  return result;
}

} // namespace doco::core
