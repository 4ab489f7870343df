#include "vex/client.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>

#include "core/timestamp.hpp"
#include "validation/validation.hpp"
#include "vex/merge.hpp"

namespace vexdoc::vex {
namespace {

using validation::ValidationError;

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::vector<std::string> normalize_filter(const std::vector<std::string>& entries) {
  std::vector<std::string> normalized;
  normalized.reserve(entries.size());
  for (const auto& entry : entries) {
    auto trimmed = trim(entry);
    if (!trimmed.empty()) {
      normalized.push_back(std::move(trimmed));
    }
  }
  return normalized;
}

void check_text(std::string_view name, const std::string& value, std::size_t max_length) {
  validation::validate_string_length(name, value, max_length);
  validation::validate_dangerous_chars(name, value);
}

void validate_create_input(const CreateInput& input) {
  validation::validate_required("product", input.product);
  check_text("product", input.product, validation::kMaxStringLength);

  validation::validate_required("vulnerability", input.vulnerability);
  check_text("vulnerability", input.vulnerability, validation::kMaxStringLength);

  validation::validate_required("status", input.status);

  validation::validate_string_length("justification", input.justification, validation::kMaxStringLength);
  check_text("impact_statement", input.impact_statement, validation::kMaxStringLength);
  check_text("action_statement", input.action_statement, validation::kMaxStringLength);
  check_text("author", input.author, validation::kMaxAuthorLength);
}

void validate_merge_input(const MergeInput& input, const std::vector<std::string>& products,
                          const std::vector<std::string>& vulnerabilities) {
  validation::validate_document_count(input.documents.size());
  check_text("author", input.author, validation::kMaxAuthorLength);
  check_text("author_role", input.author_role, validation::kMaxAuthorLength);
  check_text("id", input.id, validation::kMaxIdLength);

  for (std::size_t i = 0; i < products.size(); ++i) {
    check_text(validation::indexed_field("products", i), products[i], validation::kMaxStringLength);
  }
  for (std::size_t i = 0; i < vulnerabilities.size(); ++i) {
    check_text(validation::indexed_field("vulnerabilities", i), vulnerabilities[i],
               validation::kMaxStringLength);
  }
}

// A cheap shape check before full parsing so the error names the document.
void precheck_structure(const nlohmann::json& document, std::size_t position) {
  const auto label = "document " + std::to_string(position);
  if (!document.is_object()) {
    throw VexError(label + " must be a valid JSON object");
  }
  if (!document.contains("@context")) {
    throw VexError(label + " must be a valid VEX document with @context");
  }
  if (!document.contains("statements")) {
    throw VexError(label + " must be a valid VEX document with statements");
  }
}

}  // namespace

Client::Client(std::string default_author) : default_author_(std::move(default_author)) {
  if (default_author_.empty()) {
    default_author_ = kDefaultAuthor;
  }
}

Document Client::create_statement(const CreateInput& input) const {
  try {
    validate_create_input(input);
  } catch (const ValidationError& ex) {
    throw VexError(std::string(kValidationErrorPrefix) + ex.what());
  }

  Statement statement;
  statement.vulnerability.name = input.vulnerability;
  statement.products.push_back(Product{.id = input.product});
  statement.status = parse_status(input.status);
  if (!input.justification.empty()) {
    statement.justification = parse_justification(input.justification);
  }
  statement.impact_statement = input.impact_statement;
  statement.action_statement = input.action_statement;

  try {
    statement.validate();
  } catch (const VexError& ex) {
    throw VexError(std::string(kStatementValidationPrefix) + ex.what());
  }

  Document document;
  document.id = "vex-" + std::to_string(core::unix_timestamp_now_ns());
  document.author = author_or_default(input.author);
  document.version = 1;
  document.timestamp = core::rfc3339_now_utc();
  document.statements.push_back(std::move(statement));
  return document;
}

Document Client::merge_documents(const MergeInput& input) const {
  const auto products = normalize_filter(input.products);
  const auto vulnerabilities = normalize_filter(input.vulnerabilities);

  try {
    validate_merge_input(input, products, vulnerabilities);
  } catch (const ValidationError& ex) {
    throw VexError(std::string(kValidationErrorPrefix) + ex.what());
  }

  for (std::size_t i = 0; i < input.documents.size(); ++i) {
    precheck_structure(input.documents[i], i + 1);
  }

  std::vector<Document> parsed;
  parsed.reserve(input.documents.size());
  for (std::size_t i = 0; i < input.documents.size(); ++i) {
    try {
      parsed.push_back(parse_document(input.documents[i]));
    } catch (const VexError& ex) {
      throw VexError("failed to parse document " + std::to_string(i + 1) + ": " + ex.what());
    }
  }

  Document merged;
  merged.id = "merged-vex-" + std::to_string(core::unix_timestamp_now_ns());
  merged.author = default_author_;
  merged.version = 1;
  merged.statements = merge_statements(parsed);

  if (!input.id.empty()) {
    merged.id = input.id;
  }
  if (!input.author.empty()) {
    merged.author = input.author;
  }
  if (!input.author_role.empty()) {
    merged.author_role = input.author_role;
  }

  merged.statements = filter_statements(std::move(merged.statements), products, vulnerabilities);
  merged.timestamp = core::rfc3339_now_utc();
  return merged;
}

const std::string& Client::author_or_default(const std::string& author) const {
  return author.empty() ? default_author_ : author;
}

}  // namespace vexdoc::vex
