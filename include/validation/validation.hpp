#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace vexdoc::validation {

// Upper bounds applied to caller-supplied input before any document is built.
constexpr std::size_t kMaxStringLength = 1000;
constexpr std::size_t kMaxAuthorLength = 200;
constexpr std::size_t kMaxIdLength = 500;
constexpr std::size_t kMinMergeDocuments = 2;
constexpr std::size_t kMaxMergeDocuments = 20;

constexpr std::string_view kDangerousChars = ";&|`$(){}[]<>'\"\\";

class ValidationError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Empty values pass every check except validate_required.
void validate_required(std::string_view name, std::string_view value);
void validate_string_length(std::string_view name, std::string_view value, std::size_t max_length);
void validate_dangerous_chars(std::string_view name, std::string_view value);
void validate_document_count(std::size_t count);

[[nodiscard]] bool contains_dangerous_chars(std::string_view value);

// "products[3]"
std::string indexed_field(std::string_view name, std::size_t index);

}  // namespace vexdoc::validation
