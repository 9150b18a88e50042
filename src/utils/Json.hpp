#pragma once

#include <cstdlib>
#include <string>
#include <string_view>

#include <yyjson.h>

namespace jp::json {

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

  // On failure the returned document is invalid and `error` (when given)
  // holds yyjson's message and byte position.
  static Document parse(std::string_view payload, yyjson_read_err *error = nullptr) {
    return Document(yyjson_read_opts(const_cast<char *>(payload.data()), payload.size(),
                                     static_cast<yyjson_read_flag>(0), nullptr, error));
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_val *root() const noexcept {
    return doc_ ? yyjson_doc_get_root(doc_) : nullptr;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_doc *doc_ = nullptr;
};

// Builder for payloads written back out (tests, diagnostics).
class MutableDocument {
public:
  MutableDocument() : doc_(yyjson_mut_doc_new(nullptr)) {}
  MutableDocument(MutableDocument const &) = delete;
  MutableDocument &operator=(MutableDocument const &) = delete;

  ~MutableDocument() {
    if (doc_) {
      yyjson_mut_doc_free(doc_);
    }
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_mut_doc *doc() const noexcept { return doc_; }

  void set_root(yyjson_mut_val *value) {
    if (doc_) {
      yyjson_mut_doc_set_root(doc_, value);
    }
  }

  std::string write(char const *fallback) const {
    if (!doc_) {
      return fallback;
    }
    char *json = yyjson_mut_write(doc_, 0, nullptr);
    std::string result = json ? json : fallback;
    std::free(json);
    return result;
  }

private:
  yyjson_mut_doc *doc_ = nullptr;
};

// Returns the string value of `key`, or an empty view when the member is
// missing or not a string.
inline std::string_view get_string(yyjson_val *object, char const *key) {
  if (object == nullptr || !yyjson_is_obj(object)) {
    return {};
  }
  yyjson_val *value = yyjson_obj_get(object, key);
  if (value == nullptr || !yyjson_is_str(value)) {
    return {};
  }
  return std::string_view(yyjson_get_str(value), yyjson_get_len(value));
}

} // namespace jp::json
