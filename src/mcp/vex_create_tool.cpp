#include "mcp/vex_tools.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "mcp/arguments.hpp"
#include "mcp/server.hpp"
#include "vex/document.hpp"

namespace vexdoc::mcp {

namespace {

vex::CreateInput parse_create_input(const nlohmann::json& arguments) {
  if (!arguments.is_object()) {
    throw std::invalid_argument("arguments must be an object");
  }

  return vex::CreateInput{.product = optional_string_argument(arguments, "product"),
                          .vulnerability = optional_string_argument(arguments, "vulnerability"),
                          .status = optional_string_argument(arguments, "status"),
                          .justification = optional_string_argument(arguments, "justification"),
                          .impact_statement = optional_string_argument(arguments, "impact_statement"),
                          .action_statement = optional_string_argument(arguments, "action_statement"),
                          .author = optional_string_argument(arguments, "author")};
}

}  // namespace

nlohmann::json create_vex_statement_schema() {
  std::vector<std::string> statuses;
  for (const auto status : vex::kAllStatuses) {
    statuses.emplace_back(vex::to_string(status));
  }
  const std::vector<std::string> justifications(vex::kAllJustifications.begin(), vex::kAllJustifications.end());

  return nlohmann::json{
      {"type", "object"},
      {"properties",
       {{"product",
         {{"type", "string"},
          {"description",
           "Software product identifier using PURL (Package URL) format, e.g., pkg:npm/lodash@4.17.21, "
           "pkg:docker/nginx@1.20.1"}}},
        {"vulnerability",
         {{"type", "string"},
          {"description",
           "Security vulnerability identifier from CVE, GHSA, or other vulnerability databases (e.g., "
           "CVE-2023-1234, GHSA-xxxx-xxxx-xxxx)"}}},
        {"status",
         {{"type", "string"},
          {"enum", statuses},
          {"description",
           "Assessment of how the vulnerability affects this product: not_affected (product is safe), affected "
           "(vulnerable), fixed (patched), under_investigation (being analyzed)"}}},
        {"justification",
         {{"type", "string"},
          {"enum", justifications},
          {"description",
           "Technical reason why a product is not affected by the vulnerability (required when "
           "status=not_affected unless an impact statement is given)"}}},
        {"impact_statement",
         {{"type", "string"},
          {"description",
           "Explanation of why the vulnerability cannot be exploited in this product context (used with "
           "status=not_affected)"}}},
        {"action_statement",
         {{"type", "string"},
          {"description",
           "Recommended remediation for affected products, such as version upgrades or configuration changes "
           "(required with status=affected)"}}},
        {"author",
         {{"type", "string"},
          {"description", "Analyst, team, or organization responsible for this assessment"}}}}},
      {"required", {"product", "vulnerability", "status"}}};
}

ToolResult execute_create_vex_statement(const vex::Client& client, const nlohmann::json& arguments) {
  try {
    const auto document = client.create_statement(parse_create_input(arguments));
    return ToolResult::text("VEX statement created successfully:\n\n" + vex::serialize_document(document));
  } catch (const std::invalid_argument& ex) {
    return ToolResult::error(std::string("Error: ") + ex.what());
  } catch (const vex::VexError& ex) {
    return ToolResult::error(std::string("Error: ") + ex.what());
  }
}

Tool make_create_vex_statement_tool(std::shared_ptr<const vex::Client> client) {
  return Tool{.name = kCreateVexStatementTool,
              .description =
                  "Generate VEX (Vulnerability Exploitability eXchange) statements to document security "
                  "vulnerability assessments for software products. Creates OpenVEX-compliant JSON documents "
                  "that specify whether products are affected by specific vulnerabilities.",
              .input_schema = create_vex_statement_schema(),
              .handler = [client = std::move(client)](const nlohmann::json& arguments) {
                return execute_create_vex_statement(*client, arguments);
              }};
}

void register_vex_tools(Server& server, const std::shared_ptr<const vex::Client>& client) {
  server.register_tool(make_create_vex_statement_tool(client));
  server.register_tool(make_merge_vex_documents_tool(client));
}

}  // namespace vexdoc::mcp
