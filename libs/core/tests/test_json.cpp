#include "doco/core/json.h"

#include <kj/string.h>
#include <kj/test.h>

using namespace doco::core;

namespace {

KJ_TEST("JSON: Parse simple object") {
  auto doc = JsonDocument::parse(R"({"name": "blob.txt", "size": 42, "public": true})"_kj);
  auto root = doc.root();

  KJ_EXPECT(root.is_object());
  KJ_EXPECT(root.size() == 3);

  KJ_IF_SOME(name, root.get("name")) {
    KJ_EXPECT(name.is_string());
    KJ_EXPECT(name.get_string() == "blob.txt");
  } else {
    KJ_FAIL_EXPECT("name not found");
  }
  KJ_IF_SOME(size, root.get("size")) {
    KJ_EXPECT(size.get_int() == 42);
    KJ_EXPECT(size.get_double() == 42.0);
  } else {
    KJ_FAIL_EXPECT("size not found");
  }
  KJ_IF_SOME(flag, root.get("public")) {
    KJ_EXPECT(flag.get_bool());
  } else {
    KJ_FAIL_EXPECT("public not found");
  }
  KJ_EXPECT(root.get("missing") == kj::none);
}

KJ_TEST("JSON: Defaults on type mismatch") {
  auto doc = JsonDocument::parse(R"({"n": "text", "s": 7})"_kj);
  auto root = doc.root();

  KJ_IF_SOME(n, root.get("n")) {
    KJ_EXPECT(n.get_int(-1) == -1);
    KJ_EXPECT(!n.is_number());
  } else {
    KJ_FAIL_EXPECT("n not found");
  }
  KJ_IF_SOME(s, root.get("s")) {
    KJ_EXPECT(s.get_string("fallback") == "fallback");
  } else {
    KJ_FAIL_EXPECT("s not found");
  }
}

KJ_TEST("JSON: Arrays and iteration") {
  auto doc = JsonDocument::parse(R"({"items": [1, 2, 3], "meta": {"a": "x", "b": "y"}})"_kj);
  auto root = doc.root();

  KJ_IF_SOME(items, root.get("items")) {
    KJ_EXPECT(items.is_array());
    KJ_EXPECT(items.size() == 3);
    int64_t sum = 0;
    items.for_each_array([&](const JsonValue& v) { sum += v.get_int(); });
    KJ_EXPECT(sum == 6);
    KJ_EXPECT(items.at(3) == kj::none);
  } else {
    KJ_FAIL_EXPECT("items not found");
  }

  KJ_IF_SOME(meta, root.get("meta")) {
    kj::String keys;
    meta.for_each_object(
        [&](kj::StringPtr key, const JsonValue& value) { keys = kj::str(keys, key, value.get_string()); });
    KJ_EXPECT(keys == "axby");
  } else {
    KJ_FAIL_EXPECT("meta not found");
  }
}

KJ_TEST("JSON: Parse error") {
  KJ_EXPECT_THROW_MESSAGE("JSON", JsonDocument::parse("{not json"_kj));
}

KJ_TEST("JSON: Build nested object") {
  auto json = JsonBuilder::object()
                  .put("err", "blob not found: a.txt")
                  .put("ok", false)
                  .put("count", static_cast<int64_t>(3))
                  .put("ratio", 0.5)
                  .put("missing", nullptr)
                  .put_object("data", [](JsonBuilder& b) { b.put("user_id", "u1"); })
                  .put_array("tags", [](JsonBuilder& b) {
                    b.add("a"_kj).add(static_cast<int64_t>(2));
                  })
                  .build();

  auto doc = JsonDocument::parse(json);
  auto root = doc.root();
  KJ_IF_SOME(err, root.get("err")) {
    KJ_EXPECT(err.get_string() == "blob not found: a.txt");
  } else {
    KJ_FAIL_EXPECT("err missing", json);
  }
  KJ_IF_SOME(missing, root.get("missing")) {
    KJ_EXPECT(missing.is_null());
  } else {
    KJ_FAIL_EXPECT("null member missing", json);
  }
  KJ_IF_SOME(data, root.get("data")) {
    KJ_IF_SOME(user, data.get("user_id")) {
      KJ_EXPECT(user.get_string() == "u1");
    } else {
      KJ_FAIL_EXPECT("user_id missing", json);
    }
  } else {
    KJ_FAIL_EXPECT("data missing", json);
  }
  KJ_IF_SOME(tags, root.get("tags")) {
    KJ_EXPECT(tags.size() == 2);
  } else {
    KJ_FAIL_EXPECT("tags missing", json);
  }
}

KJ_TEST("JSON: Empty object") {
  KJ_EXPECT(JsonBuilder::object().build() == "{}");
  KJ_EXPECT(JsonBuilder::array().build() == "[]");
}

KJ_TEST("JSON: Escaping") {
  auto json = JsonBuilder::object().put("msg", "say \"hi\"\n").build();
  auto doc = JsonDocument::parse(json);
  KJ_IF_SOME(msg, doc.root().get("msg")) {
    KJ_EXPECT(msg.get_string() == "say \"hi\"\n");
  } else {
    KJ_FAIL_EXPECT("msg missing");
  }
}

} // namespace
