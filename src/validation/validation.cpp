#include "validation/validation.hpp"

#include <string>

namespace vexdoc::validation {

void validate_required(std::string_view name, std::string_view value) {
  if (value.empty()) {
    throw ValidationError(std::string(name) + " is required");
  }
}

void validate_string_length(std::string_view name, std::string_view value, std::size_t max_length) {
  if (value.size() > max_length) {
    throw ValidationError(std::string(name) + " exceeds maximum length of " + std::to_string(max_length) +
                          " characters");
  }
}

void validate_dangerous_chars(std::string_view name, std::string_view value) {
  if (contains_dangerous_chars(value)) {
    throw ValidationError(std::string(name) + " contains potentially dangerous characters");
  }
}

void validate_document_count(std::size_t count) {
  if (count < kMinMergeDocuments) {
    throw ValidationError("at least " + std::to_string(kMinMergeDocuments) +
                          " VEX documents are required for merging");
  }
  if (count > kMaxMergeDocuments) {
    throw ValidationError("maximum of " + std::to_string(kMaxMergeDocuments) +
                          " documents can be merged at once");
  }
}

bool contains_dangerous_chars(std::string_view value) {
  return value.find_first_of(kDangerousChars) != std::string_view::npos;
}

std::string indexed_field(std::string_view name, std::size_t index) {
  return std::string(name) + '[' + std::to_string(index) + ']';
}

}  // namespace vexdoc::validation
