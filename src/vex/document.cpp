#include "vex/document.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace vexdoc::vex {
namespace {

constexpr std::int64_t kMaxVersion = std::numeric_limits<int>::max();

std::string quoted(std::string_view value) {
  return '"' + std::string(value) + '"';
}

std::string_view trim_spaces(std::string_view value) {
  while (!value.empty() && value.front() == ' ') {
    value.remove_prefix(1);
  }
  while (!value.empty() && value.back() == ' ') {
    value.remove_suffix(1);
  }
  return value;
}

std::string optional_string(const nlohmann::json& object, const char* key, const std::string& where) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return {};
  }
  if (!it->is_string()) {
    throw VexError(where + ": " + key + " must be a string");
  }
  return it->get<std::string>();
}

std::vector<std::string> optional_string_array(const nlohmann::json& object, const char* key,
                                               const std::string& where) {
  std::vector<std::string> values;
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return values;
  }
  if (!it->is_array()) {
    throw VexError(where + ": " + key + " must be an array of strings");
  }
  values.reserve(it->size());
  for (const auto& item : *it) {
    if (!item.is_string()) {
      throw VexError(where + ": " + key + " must be an array of strings");
    }
    values.push_back(item.get<std::string>());
  }
  return values;
}

Vulnerability parse_vulnerability(const nlohmann::json& value, const std::string& where) {
  Vulnerability vulnerability;

  // OpenVEX 0.0.x carried the vulnerability as a bare identifier string.
  if (value.is_string()) {
    vulnerability.name = value.get<std::string>();
    return vulnerability;
  }
  if (!value.is_object()) {
    throw VexError(where + ": vulnerability must be an object");
  }

  vulnerability.id = optional_string(value, "@id", where);
  vulnerability.name = optional_string(value, "name", where);
  vulnerability.description = optional_string(value, "description", where);
  vulnerability.aliases = optional_string_array(value, "aliases", where);
  return vulnerability;
}

std::string component_id(const nlohmann::json& value, const std::string& where) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (!value.is_object()) {
    throw VexError(where + ": component must be an object or an identifier string");
  }
  return optional_string(value, "@id", where);
}

Product parse_product(const nlohmann::json& value, const std::string& where) {
  Product product;
  product.id = component_id(value, where);

  if (value.is_object()) {
    const auto subcomponents_it = value.find("subcomponents");
    if (subcomponents_it != value.end() && !subcomponents_it->is_null()) {
      if (!subcomponents_it->is_array()) {
        throw VexError(where + ": subcomponents must be an array");
      }
      for (const auto& subcomponent : *subcomponents_it) {
        product.subcomponents.push_back(component_id(subcomponent, where));
      }
    }
  }

  if (product.id.empty()) {
    throw VexError(where + ": product @id is required");
  }
  return product;
}

Statement parse_statement(const nlohmann::json& value, const std::string& where) {
  if (!value.is_object()) {
    throw VexError(where + " must be an object");
  }

  Statement statement;
  statement.id = optional_string(value, "@id", where);
  statement.timestamp = optional_string(value, "timestamp", where);

  const auto vulnerability_it = value.find("vulnerability");
  if (vulnerability_it == value.end()) {
    throw VexError(where + ": vulnerability is required");
  }
  statement.vulnerability = parse_vulnerability(*vulnerability_it, where);
  if (statement.vulnerability.name.empty()) {
    throw VexError(where + ": vulnerability name is required");
  }

  const auto products_it = value.find("products");
  if (products_it == value.end() || !products_it->is_array() || products_it->empty()) {
    throw VexError(where + ": products must be a non-empty array");
  }
  for (const auto& product : *products_it) {
    statement.products.push_back(parse_product(product, where));
  }

  const auto status = optional_string(value, "status", where);
  if (status.empty()) {
    throw VexError(where + ": status is required");
  }
  statement.status = parse_status(status);

  const auto justification = optional_string(value, "justification", where);
  if (!justification.empty()) {
    statement.justification = combine_justifications(parse_justification_labels(justification));
  }

  statement.status_notes = optional_string(value, "status_notes", where);
  statement.impact_statement = optional_string(value, "impact_statement", where);
  statement.action_statement = optional_string(value, "action_statement", where);
  return statement;
}

void put_if_not_empty(nlohmann::json& out, const char* key, const std::string& value) {
  if (!value.empty()) {
    out[key] = value;
  }
}

}  // namespace

const char* to_string(Status status) {
  switch (status) {
    case Status::not_affected:
      return "not_affected";
    case Status::affected:
      return "affected";
    case Status::fixed:
      return "fixed";
    case Status::under_investigation:
      return "under_investigation";
  }
  return "unknown";
}

Status parse_status(std::string_view value) {
  for (const auto status : kAllStatuses) {
    if (value == to_string(status)) {
      return status;
    }
  }
  throw VexError("invalid status: " + std::string(value));
}

std::string parse_justification(std::string_view value) {
  for (const auto* label : kAllJustifications) {
    if (value == label) {
      return label;
    }
  }
  throw VexError("invalid justification: " + std::string(value));
}

std::vector<std::string> parse_justification_labels(std::string_view value) {
  const std::string_view prefix = kMultipleJustificationsPrefix;
  if (value.substr(0, prefix.size()) != prefix) {
    return {parse_justification(value)};
  }

  std::vector<std::string> labels;
  auto rest = value.substr(prefix.size());
  while (true) {
    const auto comma = rest.find(',');
    auto label = parse_justification(trim_spaces(rest.substr(0, comma)));
    if (std::find(labels.begin(), labels.end(), label) == labels.end()) {
      labels.push_back(std::move(label));
    }
    if (comma == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(comma + 1);
  }
  return labels;
}

std::string combine_justifications(const std::vector<std::string>& labels) {
  if (labels.empty()) {
    return {};
  }
  if (labels.size() == 1) {
    return labels.front();
  }

  std::string combined = kMultipleJustificationsPrefix;
  for (std::size_t i = 0; i < labels.size(); ++i) {
    if (i > 0) {
      combined += ", ";
    }
    combined += labels[i];
  }
  return combined;
}

void Statement::validate() const {
  if (vulnerability.name.empty()) {
    throw VexError("vulnerability name is required");
  }
  if (products.empty()) {
    throw VexError("at least one product is required");
  }

  const auto status_label = quoted(to_string(status));
  switch (status) {
    case Status::not_affected:
      if (justification.empty() && impact_statement.empty()) {
        throw VexError("either justification or impact statement must be defined when using status " + status_label);
      }
      if (!action_statement.empty()) {
        throw VexError("action statement is not allowed when using status " + status_label);
      }
      return;
    case Status::affected:
      if (action_statement.empty()) {
        throw VexError("action statement must be set when using status " + status_label);
      }
      if (!justification.empty()) {
        throw VexError("justification is not allowed when using status " + status_label);
      }
      if (!impact_statement.empty()) {
        throw VexError("impact statement is not allowed when using status " + status_label);
      }
      return;
    case Status::fixed:
    case Status::under_investigation:
      if (!justification.empty()) {
        throw VexError("justification is not allowed when using status " + status_label);
      }
      if (!impact_statement.empty()) {
        throw VexError("impact statement is not allowed when using status " + status_label);
      }
      if (!action_statement.empty()) {
        throw VexError("action statement is not allowed when using status " + status_label);
      }
      return;
  }
}

void to_json(nlohmann::json& out, const Vulnerability& vulnerability) {
  out = nlohmann::json::object();
  put_if_not_empty(out, "@id", vulnerability.id);
  out["name"] = vulnerability.name;
  put_if_not_empty(out, "description", vulnerability.description);
  if (!vulnerability.aliases.empty()) {
    out["aliases"] = vulnerability.aliases;
  }
}

void to_json(nlohmann::json& out, const Product& product) {
  out = nlohmann::json{{"@id", product.id}};
  if (!product.subcomponents.empty()) {
    nlohmann::json subcomponents = nlohmann::json::array();
    for (const auto& subcomponent : product.subcomponents) {
      subcomponents.push_back({{"@id", subcomponent}});
    }
    out["subcomponents"] = std::move(subcomponents);
  }
}

void to_json(nlohmann::json& out, const Statement& statement) {
  out = nlohmann::json::object();
  put_if_not_empty(out, "@id", statement.id);
  out["vulnerability"] = statement.vulnerability;
  put_if_not_empty(out, "timestamp", statement.timestamp);
  out["products"] = statement.products;
  out["status"] = to_string(statement.status);
  put_if_not_empty(out, "status_notes", statement.status_notes);
  put_if_not_empty(out, "justification", statement.justification);
  put_if_not_empty(out, "impact_statement", statement.impact_statement);
  put_if_not_empty(out, "action_statement", statement.action_statement);
}

void to_json(nlohmann::json& out, const Document& document) {
  out = nlohmann::json{{"@context", document.context},
                       {"@id", document.id},
                       {"author", document.author},
                       {"timestamp", document.timestamp},
                       {"version", document.version},
                       {"statements", document.statements}};
  put_if_not_empty(out, "role", document.author_role);
  put_if_not_empty(out, "last_updated", document.last_updated);
  put_if_not_empty(out, "tooling", document.tooling);
}

Document parse_document(const nlohmann::json& value) {
  if (!value.is_object()) {
    throw VexError("VEX document must be a JSON object");
  }

  const std::string where = "document";
  Document document;

  const auto context_it = value.find("@context");
  if (context_it == value.end() || !context_it->is_string() ||
      context_it->get_ref<const std::string&>().rfind(kOpenVexContextPrefix, 0) != 0) {
    throw VexError("missing or unsupported @context; expected an OpenVEX context");
  }
  document.context = context_it->get<std::string>();
  document.id = optional_string(value, "@id", where);
  document.author = optional_string(value, "author", where);
  document.author_role = optional_string(value, "role", where);
  document.timestamp = optional_string(value, "timestamp", where);
  document.last_updated = optional_string(value, "last_updated", where);
  document.tooling = optional_string(value, "tooling", where);

  const auto version_it = value.find("version");
  if (version_it != value.end() && !version_it->is_null()) {
    if (!version_it->is_number_integer()) {
      throw VexError("document: version must be an integer");
    }
    const bool in_range = version_it->is_number_unsigned()
                              ? version_it->get<std::uint64_t>() <= static_cast<std::uint64_t>(kMaxVersion)
                              : version_it->get<std::int64_t>() >= 0 && version_it->get<std::int64_t>() <= kMaxVersion;
    if (!in_range) {
      throw VexError("document: version out of range");
    }
    document.version = version_it->get<int>();
  }

  const auto statements_it = value.find("statements");
  if (statements_it == value.end() || !statements_it->is_array()) {
    throw VexError("document: statements must be an array");
  }

  document.statements.reserve(statements_it->size());
  std::size_t index = 0;
  for (const auto& statement : *statements_it) {
    ++index;
    document.statements.push_back(parse_statement(statement, "statement " + std::to_string(index)));
  }

  return document;
}

Document parse_document_bytes(std::string_view bytes) {
  nlohmann::json value;
  try {
    value = nlohmann::json::parse(bytes.begin(), bytes.end());
  } catch (const nlohmann::json::parse_error& ex) {
    throw VexError(std::string("invalid JSON: ") + ex.what());
  }
  return parse_document(value);
}

std::string serialize_document(const Document& document, int indent) {
  return nlohmann::json(document).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace vexdoc::vex
