#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace vexdoc::vex {

constexpr const char* kOpenVexContext = "https://openvex.dev/ns/v0.2.0";
constexpr std::string_view kOpenVexContextPrefix = "https://openvex.dev/ns";

class VexError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class Status : std::uint8_t {
  not_affected,
  affected,
  fixed,
  under_investigation,
};

constexpr std::array<Status, 4> kAllStatuses{Status::not_affected, Status::affected, Status::fixed,
                                             Status::under_investigation};

namespace justification {
constexpr const char* kComponentNotPresent = "component_not_present";
constexpr const char* kVulnerableCodeNotPresent = "vulnerable_code_not_present";
constexpr const char* kVulnerableCodeNotInExecutePath = "vulnerable_code_not_in_execute_path";
constexpr const char* kVulnerableCodeCannotBeControlledByAdversary =
    "vulnerable_code_cannot_be_controlled_by_adversary";
constexpr const char* kInlineMitigationsAlreadyExist = "inline_mitigations_already_exist";
}  // namespace justification

constexpr std::array<const char*, 5> kAllJustifications{
    justification::kComponentNotPresent, justification::kVulnerableCodeNotPresent,
    justification::kVulnerableCodeNotInExecutePath, justification::kVulnerableCodeCannotBeControlledByAdversary,
    justification::kInlineMitigationsAlreadyExist};

// Merged statements with disagreeing justifications carry them all behind
// this prefix, comma separated.
constexpr const char* kMultipleJustificationsPrefix = "multiple justifications: ";

const char* to_string(Status status);
Status parse_status(std::string_view value);
// Returns the canonical vocabulary entry for a justification label.
std::string parse_justification(std::string_view value);

// Accepts a single label or the combined form and returns the distinct
// labels in order. Every part must be a vocabulary entry.
std::vector<std::string> parse_justification_labels(std::string_view value);
std::string combine_justifications(const std::vector<std::string>& labels);

struct Vulnerability {
  std::string id{};
  std::string name{};
  std::string description{};
  std::vector<std::string> aliases{};
};

// The component identifier (usually a PURL) is carried in `id`.
struct Product {
  std::string id{};
  std::vector<std::string> subcomponents{};
};

struct Statement {
  std::string id{};
  Vulnerability vulnerability{};
  std::string timestamp{};
  std::vector<Product> products{};
  Status status{Status::under_investigation};
  std::string status_notes{};
  std::string justification{};
  std::string impact_statement{};
  std::string action_statement{};

  // Throws VexError when the status-dependent field rules are broken.
  void validate() const;
};

struct Document {
  std::string context{kOpenVexContext};
  std::string id{};
  std::string author{};
  std::string author_role{};
  std::string timestamp{};
  std::string last_updated{};
  int version{1};
  std::string tooling{};
  std::vector<Statement> statements{};
};

void to_json(nlohmann::json& out, const Vulnerability& vulnerability);
void to_json(nlohmann::json& out, const Product& product);
void to_json(nlohmann::json& out, const Statement& statement);
void to_json(nlohmann::json& out, const Document& document);

Document parse_document(const nlohmann::json& value);
Document parse_document_bytes(std::string_view bytes);

std::string serialize_document(const Document& document, int indent = 2);

}  // namespace vexdoc::vex
