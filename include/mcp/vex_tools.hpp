#pragma once

#include <memory>

#include <nlohmann/json.hpp>

#include "mcp/tools.hpp"
#include "vex/client.hpp"

namespace vexdoc::mcp {

class Server;

constexpr const char* kCreateVexStatementTool = "create_vex_statement";
constexpr const char* kMergeVexDocumentsTool = "merge_vex_documents";

nlohmann::json create_vex_statement_schema();
nlohmann::json merge_vex_documents_schema();

// Argument decoding and domain failures come back as isError results.
// Unexpected exceptions propagate to the caller.
ToolResult execute_create_vex_statement(const vex::Client& client, const nlohmann::json& arguments);
ToolResult execute_merge_vex_documents(const vex::Client& client, const nlohmann::json& arguments);

Tool make_create_vex_statement_tool(std::shared_ptr<const vex::Client> client);
Tool make_merge_vex_documents_tool(std::shared_ptr<const vex::Client> client);

// Registers both VEX tools on the server, sharing one client.
void register_vex_tools(Server& server, const std::shared_ptr<const vex::Client>& client);

}  // namespace vexdoc::mcp
