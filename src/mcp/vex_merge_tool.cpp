#include "mcp/vex_tools.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "mcp/arguments.hpp"
#include "validation/validation.hpp"
#include "vex/document.hpp"

namespace vexdoc::mcp {

namespace {

vex::MergeInput parse_merge_input(const nlohmann::json& arguments) {
  if (!arguments.is_object()) {
    throw std::invalid_argument("arguments must be an object");
  }

  const auto documents_it = arguments.find("documents");
  if (documents_it == arguments.end() || documents_it->is_null()) {
    throw std::invalid_argument("documents field is required");
  }
  if (!documents_it->is_array()) {
    throw std::invalid_argument("documents must be an array");
  }

  vex::MergeInput input;
  input.documents.reserve(documents_it->size());
  std::size_t position = 0;
  for (const auto& document : *documents_it) {
    ++position;
    if (!document.is_object()) {
      throw std::invalid_argument("document " + std::to_string(position) + " must be a valid JSON object");
    }
    input.documents.push_back(document);
  }

  input.author = optional_string_argument(arguments, "author");
  input.author_role = optional_string_argument(arguments, "author_role");
  input.id = optional_string_argument(arguments, "id");
  input.products = optional_string_list(arguments, "products");
  input.vulnerabilities = optional_string_list(arguments, "vulnerabilities");
  return input;
}

}  // namespace

nlohmann::json merge_vex_documents_schema() {
  return nlohmann::json{
      {"type", "object"},
      {"properties",
       {{"documents",
         {{"type", "array"},
          {"minItems", validation::kMinMergeDocuments},
          {"maxItems", validation::kMaxMergeDocuments},
          {"description",
           "VEX documents to merge from different sources (vendors, teams, previous assessments). Each must be "
           "a complete OpenVEX document."},
          {"items",
           {{"type", "object"},
            {"description",
             "OpenVEX document. Must include @context and a statements array with vulnerability "
             "assessments."}}}}},
        {"author",
         {{"type", "string"},
          {"description", "Analyst, team, or organization responsible for the merged document"}}},
        {"author_role",
         {{"type", "string"},
          {"description", "Role of the person creating the merged document (e.g., 'Security Engineer')"}}},
        {"id",
         {{"type", "string"},
          {"description", "Identifier for the merged document. Generated when omitted."}}},
        {"products",
         {{"type", "array"},
          {"description", "Only keep statements for these product identifiers (PURL)."},
          {"items", {{"type", "string"}}}}},
        {"vulnerabilities",
         {{"type", "array"},
          {"description", "Only keep statements for these vulnerability identifiers."},
          {"items", {{"type", "string"}}}}}}},
      {"required", nlohmann::json::array({"documents"})}};
}

ToolResult execute_merge_vex_documents(const vex::Client& client, const nlohmann::json& arguments) {
  try {
    const auto document = client.merge_documents(parse_merge_input(arguments));
    return ToolResult::text("VEX documents merged successfully:\n\n" + vex::serialize_document(document));
  } catch (const std::invalid_argument& ex) {
    return ToolResult::error(std::string("Error: ") + ex.what());
  } catch (const vex::VexError& ex) {
    return ToolResult::error(std::string("Error: ") + ex.what());
  }
}

Tool make_merge_vex_documents_tool(std::shared_ptr<const vex::Client> client) {
  return Tool{.name = kMergeVexDocumentsTool,
              .description =
                  "Merge and consolidate multiple VEX documents into a unified security assessment report. "
                  "Statements for the same vulnerability and product are reconciled into one; supports filtering "
                  "by products or vulnerabilities.",
              .input_schema = merge_vex_documents_schema(),
              .handler = [client = std::move(client)](const nlohmann::json& arguments) {
                return execute_merge_vex_documents(*client, arguments);
              }};
}

}  // namespace vexdoc::mcp
