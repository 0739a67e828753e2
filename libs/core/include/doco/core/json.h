#pragma once

#include <cstdint>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>
#include <yyjson.h>

namespace doco::core {

class JsonValue;

/**
 * @brief Immutable JSON document (yyjson_doc owner)
 *
 * Parses JSON text and exposes the root value. Values obtained from a document are views
 * and must not outlive it.
 */
class JsonDocument {
public:
  JsonDocument();
  ~JsonDocument() noexcept;

  JsonDocument(JsonDocument&& other) noexcept;
  JsonDocument& operator=(JsonDocument&& other) noexcept;
  KJ_DISALLOW_COPY(JsonDocument);

  /**
   * @brief Parse JSON text
   * @throws kj::Exception when the text is not valid JSON
   */
  static JsonDocument parse(kj::StringPtr str);

  [[nodiscard]] JsonValue root() const;

private:
  explicit JsonDocument(yyjson_doc* doc);

  yyjson_doc* doc_;
};

/**
 * @brief Non-owning view of a value inside a JsonDocument
 */
class JsonValue {
public:
  explicit JsonValue(yyjson_val* val = nullptr) : val_(val) {}

  [[nodiscard]] bool is_null() const;
  [[nodiscard]] bool is_bool() const;
  [[nodiscard]] bool is_number() const;
  [[nodiscard]] bool is_string() const;
  [[nodiscard]] bool is_array() const;
  [[nodiscard]] bool is_object() const;

  [[nodiscard]] bool get_bool(bool default_val = false) const;
  [[nodiscard]] int64_t get_int(int64_t default_val = 0) const;
  [[nodiscard]] double get_double(double default_val = 0.0) const;
  [[nodiscard]] kj::StringPtr get_string(kj::StringPtr default_val = ""_kj) const;

  /**
   * @brief Number of elements (array) or members (object); 0 otherwise
   */
  [[nodiscard]] size_t size() const;

  [[nodiscard]] kj::Maybe<JsonValue> get(kj::StringPtr key) const;
  [[nodiscard]] kj::Maybe<JsonValue> at(size_t index) const;

  void for_each_object(kj::FunctionParam<void(kj::StringPtr, const JsonValue&)> callback) const;
  void for_each_array(kj::FunctionParam<void(const JsonValue&)> callback) const;

private:
  yyjson_val* val_;
};

/**
 * @brief Builder for JSON objects and arrays on top of the yyjson mutable API
 *
 * put() only applies to object builders and add() only to array builders; calls on the
 * wrong kind are ignored.
 */
class JsonBuilder {
public:
  static JsonBuilder object();
  static JsonBuilder array();

  ~JsonBuilder() noexcept;
  JsonBuilder(JsonBuilder&& other) noexcept;
  JsonBuilder& operator=(JsonBuilder&& other) noexcept;
  KJ_DISALLOW_COPY(JsonBuilder);

  JsonBuilder& put(kj::StringPtr key, const char* value);
  JsonBuilder& put(kj::StringPtr key, kj::StringPtr value);
  JsonBuilder& put(kj::StringPtr key, bool value);
  JsonBuilder& put(kj::StringPtr key, int64_t value);
  JsonBuilder& put(kj::StringPtr key, uint64_t value);
  JsonBuilder& put(kj::StringPtr key, double value);
  JsonBuilder& put(kj::StringPtr key, std::nullptr_t);

  JsonBuilder& put_object(kj::StringPtr key, kj::FunctionParam<void(JsonBuilder&)> builder);
  JsonBuilder& put_array(kj::StringPtr key, kj::FunctionParam<void(JsonBuilder&)> builder);

  JsonBuilder& add(kj::StringPtr value);
  JsonBuilder& add(int64_t value);
  JsonBuilder& add(double value);
  JsonBuilder& add_object(kj::FunctionParam<void(JsonBuilder&)> builder);

  /**
   * @brief Serialize the document
   * @param pretty Indent with four spaces
   */
  [[nodiscard]] kj::String build(bool pretty = false) const;

private:
  enum class Type { Object, Array };
  explicit JsonBuilder(Type type);
  yyjson_mut_val* key_val(kj::StringPtr key);
  void add_member(kj::StringPtr key, yyjson_mut_val* value);

  struct Impl;
  kj::Own<Impl> impl_;
};

} // namespace doco::core
