#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "vex/document.hpp"

namespace vexdoc::vex {

constexpr const char* kDefaultAuthor = "vexdoc-mcp-server";
constexpr const char* kValidationErrorPrefix = "validation error: ";
constexpr const char* kStatementValidationPrefix = "statement validation failed: ";

struct CreateInput {
  std::string product;
  std::string vulnerability;
  std::string status;
  std::string justification{};
  std::string impact_statement{};
  std::string action_statement{};
  std::string author{};
};

struct MergeInput {
  std::vector<nlohmann::json> documents;
  std::string author{};
  std::string author_role{};
  std::string id{};
  std::vector<std::string> products{};
  std::vector<std::string> vulnerabilities{};
};

// Builds and merges VEX documents. Holds no per-call state, so one instance
// can serve concurrent callers. Failures are reported as VexError.
class Client {
 public:
  explicit Client(std::string default_author = kDefaultAuthor);

  [[nodiscard]] Document create_statement(const CreateInput& input) const;
  [[nodiscard]] Document merge_documents(const MergeInput& input) const;

  [[nodiscard]] const std::string& default_author() const { return default_author_; }

 private:
  [[nodiscard]] const std::string& author_or_default(const std::string& author) const;

  std::string default_author_;
};

}  // namespace vexdoc::vex
