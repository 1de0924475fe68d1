#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <yyjson.h>

namespace tf::json {

class Document {
public:
  Document() = default;
  explicit Document(yyjson_doc *doc) : doc_(doc) {}
  Document(Document &&other) noexcept : doc_(other.doc_) { other.doc_ = nullptr; }
  Document &operator=(Document &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  Document(Document const &) = delete;
  Document &operator=(Document const &) = delete;

  ~Document() { reset(); }

  // Comments and trailing commas are accepted so hand-edited pipeline files
  // stay forgiving.
  static constexpr yyjson_read_flag kReadFlags =
      YYJSON_READ_ALLOW_COMMENTS | YYJSON_READ_ALLOW_TRAILING_COMMAS;

  static Document parse(std::string_view payload, std::string *error = nullptr) {
    yyjson_read_err err{};
    auto *doc = yyjson_read_opts(const_cast<char *>(payload.data()),
                                 payload.size(), kReadFlags, nullptr, &err);
    if (!doc && error) {
      *error = describe(err);
    }
    return Document(doc);
  }

  static Document read_file(std::filesystem::path const &path,
                            std::string *error = nullptr) {
    yyjson_read_err err{};
    auto *doc =
        yyjson_read_file(path.string().c_str(), kReadFlags, nullptr, &err);
    if (!doc && error) {
      *error = describe(err);
    }
    return Document(doc);
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_val *root() const noexcept {
    return doc_ ? yyjson_doc_get_root(doc_) : nullptr;
  }

private:
  static std::string describe(yyjson_read_err const &err) {
    std::string message = err.msg ? err.msg : "unknown error";
    message += " at byte ";
    message += std::to_string(err.pos);
    return message;
  }

  void reset() {
    if (doc_) {
      yyjson_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_doc *doc_ = nullptr;
};

// Typed member lookups. Each returns nullopt when the member is absent or has
// a different type; callers decide whether that is an error.
inline std::optional<std::string> string_member(yyjson_val *object,
                                                char const *key) {
  auto *value = object ? yyjson_obj_get(object, key) : nullptr;
  if (value == nullptr || !yyjson_is_str(value)) {
    return std::nullopt;
  }
  return std::string(yyjson_get_str(value), yyjson_get_len(value));
}

inline std::optional<bool> bool_member(yyjson_val *object, char const *key) {
  auto *value = object ? yyjson_obj_get(object, key) : nullptr;
  if (value == nullptr || !yyjson_is_bool(value)) {
    return std::nullopt;
  }
  return yyjson_get_bool(value);
}

inline std::optional<std::int64_t> int_member(yyjson_val *object,
                                              char const *key) {
  auto *value = object ? yyjson_obj_get(object, key) : nullptr;
  if (value == nullptr || !yyjson_is_int(value)) {
    return std::nullopt;
  }
  if (yyjson_is_uint(value)) {
    return static_cast<std::int64_t>(yyjson_get_uint(value));
  }
  return yyjson_get_sint(value);
}

inline bool has_member(yyjson_val *object, char const *key) {
  return object && yyjson_obj_get(object, key) != nullptr;
}

} // namespace tf::json
