#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "vex/client.hpp"
#include "vex/document.hpp"
#include "vex/merge.hpp"

using vexdoc::vex::Client;
using vexdoc::vex::CreateInput;
using vexdoc::vex::Document;
using vexdoc::vex::MergeInput;
using vexdoc::vex::Statement;
using vexdoc::vex::Status;
using vexdoc::vex::VexError;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

template <typename Fn>
std::string error_of(Fn&& fn) {
  try {
    fn();
  } catch (const VexError& ex) {
    return ex.what();
  }
  return {};
}

nlohmann::json make_statement(const std::string& vulnerability, const std::string& product, const std::string& status,
                              const std::string& justification = {}) {
  nlohmann::json statement{{"vulnerability", {{"name", vulnerability}}},
                           {"products", nlohmann::json::array({{{"@id", product}}})},
                           {"status", status}};
  if (!justification.empty()) {
    statement["justification"] = justification;
  }
  return statement;
}

nlohmann::json make_document(const std::string& id, const std::vector<nlohmann::json>& statements) {
  return nlohmann::json{{"@context", vexdoc::vex::kOpenVexContext},
                        {"@id", id},
                        {"author", "author-" + id},
                        {"version", 1},
                        {"timestamp", "2023-01-01T00:00:00Z"},
                        {"statements", statements}};
}

CreateInput lodash_not_affected() {
  return CreateInput{.product = "pkg:npm/lodash@4.17.21",
                     .vulnerability = "CVE-2023-1234",
                     .status = "not_affected",
                     .justification = "component_not_present"};
}

int test_create_not_affected_with_justification() {
  const Client client("test-author");
  const Document document = client.create_statement(lodash_not_affected());

  if (document.context != vexdoc::vex::kOpenVexContext) {
    return fail("test_create_not_affected_with_justification", "unexpected @context");
  }
  if (document.id.rfind("vex-", 0) != 0 || document.version != 1) {
    return fail("test_create_not_affected_with_justification", "unexpected id or version");
  }
  if (document.timestamp.empty() || document.timestamp.back() != 'Z') {
    return fail("test_create_not_affected_with_justification", "timestamp must be RFC 3339 UTC");
  }
  if (document.author != "test-author") {
    return fail("test_create_not_affected_with_justification", "default author not applied");
  }
  if (document.statements.size() != 1) {
    return fail("test_create_not_affected_with_justification", "expected exactly one statement");
  }

  const Statement& statement = document.statements.front();
  if (statement.vulnerability.name != "CVE-2023-1234" || statement.products.size() != 1 ||
      statement.products.front().id != "pkg:npm/lodash@4.17.21") {
    return fail("test_create_not_affected_with_justification", "statement subject mismatch");
  }
  if (statement.status != Status::not_affected || statement.justification != "component_not_present") {
    return fail("test_create_not_affected_with_justification", "status or justification mismatch");
  }
  return 0;
}

int test_create_accepts_every_justification() {
  const Client client;
  for (const auto* justification : vexdoc::vex::kAllJustifications) {
    auto input = lodash_not_affected();
    input.justification = justification;
    const auto document = client.create_statement(input);
    if (document.statements.size() != 1 || document.statements.front().justification != justification) {
      std::cerr << "  justification: " << justification << '\n';
      return fail("test_create_accepts_every_justification", "justification not carried into statement");
    }
  }
  return 0;
}

int test_create_other_statuses() {
  const Client client;

  const auto impact_only = client.create_statement(CreateInput{
      .product = "pkg:npm/express@4.18.0",
      .vulnerability = "CVE-2023-5678",
      .status = "not_affected",
      .impact_statement = "The vulnerable code path is not reachable in our deployment"});
  if (impact_only.statements.front().impact_statement.empty()) {
    return fail("test_create_other_statuses", "impact statement dropped");
  }

  const auto affected = client.create_statement(CreateInput{.product = "pkg:npm/axios@0.21.0",
                                                            .vulnerability = "CVE-2023-9999",
                                                            .status = "affected",
                                                            .action_statement = "Update to version 1.0.0 or later",
                                                            .author = "security-team"});
  if (affected.statements.front().status != Status::affected ||
      affected.statements.front().action_statement != "Update to version 1.0.0 or later" ||
      affected.author != "security-team") {
    return fail("test_create_other_statuses", "affected statement mismatch");
  }

  const auto fixed = client.create_statement(
      CreateInput{.product = "pkg:npm/react@17.0.0", .vulnerability = "CVE-2023-1111", .status = "fixed"});
  const auto investigating = client.create_statement(CreateInput{
      .product = "pkg:npm/vue@3.0.0", .vulnerability = "CVE-2023-2222", .status = "under_investigation"});
  if (fixed.statements.front().status != Status::fixed ||
      investigating.statements.front().status != Status::under_investigation) {
    return fail("test_create_other_statuses", "status mapping mismatch");
  }

  if (Client("").default_author() != vexdoc::vex::kDefaultAuthor) {
    return fail("test_create_other_statuses", "empty default author should fall back");
  }
  return 0;
}

int test_create_not_affected_requires_justification_or_impact() {
  const Client client;
  auto input = lodash_not_affected();
  input.justification.clear();

  const auto error = error_of([&] { (void)client.create_statement(input); });
  if (!contains(error, "justification")) {
    return fail("test_create_not_affected_requires_justification_or_impact", "error must mention justification");
  }
  if (error.rfind(vexdoc::vex::kStatementValidationPrefix, 0) != 0) {
    return fail("test_create_not_affected_requires_justification_or_impact", "missing statement validation prefix");
  }
  return 0;
}

int test_create_rejections() {
  const Client client;
  struct Case {
    const char* label;
    CreateInput input;
    const char* expected;
  };

  auto base = lodash_not_affected();
  auto missing_product = base;
  missing_product.product.clear();
  auto missing_vulnerability = base;
  missing_vulnerability.vulnerability.clear();
  auto missing_status = base;
  missing_status.status.clear();
  auto long_product = base;
  long_product.product = std::string(1001, 'a');
  auto dangerous_product = base;
  dangerous_product.product = "pkg:npm/lodash@4.17.21;malicious";
  auto dangerous_author = base;
  dangerous_author.author = "$(whoami)";
  auto dangerous_vulnerability = base;
  dangerous_vulnerability.vulnerability = "CVE-2023-1234`id`";
  auto long_author = base;
  long_author.author = std::string(201, 'a');
  auto invalid_status = base;
  invalid_status.status = "invalid_status";
  auto invalid_justification = base;
  invalid_justification.justification = "invalid_justification";
  auto affected_without_action =
      CreateInput{.product = "pkg:npm/axios@0.21.0", .vulnerability = "CVE-2023-9999", .status = "affected"};
  auto fixed_with_justification = base;
  fixed_with_justification.status = "fixed";

  const std::vector<Case> cases{
      {"missing product", missing_product, "validation error: product is required"},
      {"missing vulnerability", missing_vulnerability, "vulnerability is required"},
      {"missing status", missing_status, "status is required"},
      {"product too long", long_product, "exceeds maximum length"},
      {"dangerous product", dangerous_product, "dangerous characters"},
      {"dangerous author", dangerous_author, "author contains potentially dangerous characters"},
      {"dangerous vulnerability", dangerous_vulnerability, "vulnerability contains potentially dangerous characters"},
      {"author too long", long_author, "author exceeds maximum length of 200"},
      {"invalid status", invalid_status, "invalid status: invalid_status"},
      {"invalid justification", invalid_justification, "invalid justification"},
      {"affected without action", affected_without_action, "action statement must be set"},
      {"fixed with justification", fixed_with_justification, "justification is not allowed"},
  };

  for (const auto& test_case : cases) {
    const auto error = error_of([&] { (void)client.create_statement(test_case.input); });
    if (!contains(error, test_case.expected)) {
      std::cerr << "  case: " << test_case.label << " got: " << error << '\n';
      return fail("test_create_rejections", "unexpected error message");
    }
  }
  return 0;
}

int test_parse_document_rejects_malformed_input() {
  auto missing_context = make_document("doc", {make_statement("CVE-1", "pkg:a", "fixed")});
  missing_context.erase("@context");
  if (!contains(error_of([&] { (void)vexdoc::vex::parse_document(missing_context); }), "@context")) {
    return fail("test_parse_document_rejects_malformed_input", "missing @context accepted");
  }

  auto foreign_context = make_document("doc", {make_statement("CVE-1", "pkg:a", "fixed")});
  foreign_context["@context"] = "https://cyclonedx.org/schema";
  if (error_of([&] { (void)vexdoc::vex::parse_document(foreign_context); }).empty()) {
    return fail("test_parse_document_rejects_malformed_input", "non-OpenVEX context accepted");
  }

  auto bad_statements = make_document("doc", {});
  bad_statements["statements"] = "none";
  if (!contains(error_of([&] { (void)vexdoc::vex::parse_document(bad_statements); }), "statements")) {
    return fail("test_parse_document_rejects_malformed_input", "non-array statements accepted");
  }

  const auto bad_status = make_document("doc", {make_statement("CVE-1", "pkg:a", "maybe")});
  if (!contains(error_of([&] { (void)vexdoc::vex::parse_document(bad_status); }), "invalid status")) {
    return fail("test_parse_document_rejects_malformed_input", "unknown status accepted");
  }

  if (!contains(error_of([] { (void)vexdoc::vex::parse_document_bytes("{not json"); }), "invalid JSON")) {
    return fail("test_parse_document_rejects_malformed_input", "broken JSON accepted");
  }
  return 0;
}

int test_parse_document_accepts_legacy_vulnerability_string() {
  auto legacy = make_document("doc", {});
  legacy["statements"] = nlohmann::json::array(
      {{{"vulnerability", "CVE-2022-0001"}, {"products", {"pkg:npm/a@1"}}, {"status", "fixed"}}});

  const auto document = vexdoc::vex::parse_document(legacy);
  if (document.statements.size() != 1 || document.statements.front().vulnerability.name != "CVE-2022-0001" ||
      document.statements.front().products.front().id != "pkg:npm/a@1") {
    return fail("test_parse_document_accepts_legacy_vulnerability_string", "legacy statement not decoded");
  }
  return 0;
}

int test_parse_document_version_range() {
  auto huge = make_document("doc", {make_statement("CVE-1", "pkg:x", "fixed")});
  huge["version"] = std::int64_t{1} << 40;
  if (!contains(error_of([&] { (void)vexdoc::vex::parse_document(huge); }), "version out of range")) {
    return fail("test_parse_document_version_range", "64-bit version accepted");
  }

  auto unsigned_huge = huge;
  unsigned_huge["version"] = std::uint64_t{18446744073709551615ULL};
  if (!contains(error_of([&] { (void)vexdoc::vex::parse_document(unsigned_huge); }), "version out of range")) {
    return fail("test_parse_document_version_range", "unsigned version accepted");
  }

  auto negative = huge;
  negative["version"] = -1;
  if (!contains(error_of([&] { (void)vexdoc::vex::parse_document(negative); }), "version out of range")) {
    return fail("test_parse_document_version_range", "negative version accepted");
  }

  auto largest = huge;
  largest["version"] = std::numeric_limits<int>::max();
  if (vexdoc::vex::parse_document(largest).version != std::numeric_limits<int>::max()) {
    return fail("test_parse_document_version_range", "largest int version not kept");
  }
  return 0;
}

int test_created_document_round_trip() {
  const Client client;
  const auto created = client.create_statement(lodash_not_affected());
  const auto text = vexdoc::vex::serialize_document(created);
  const auto reparsed = vexdoc::vex::parse_document_bytes(text);

  if (reparsed.statements.size() != created.statements.size()) {
    return fail("test_created_document_round_trip", "statement count changed");
  }
  if (reparsed.statements.front().status != created.statements.front().status ||
      reparsed.statements.front().justification != created.statements.front().justification) {
    return fail("test_created_document_round_trip", "statement values changed");
  }
  if (reparsed.id != created.id || reparsed.author != created.author) {
    return fail("test_created_document_round_trip", "metadata changed");
  }

  const auto wire = nlohmann::json::parse(text);
  if (wire.contains("role") || wire["statements"][0].contains("action_statement")) {
    return fail("test_created_document_round_trip", "empty optional fields must be omitted");
  }
  return 0;
}

int test_merge_combines_and_overrides_metadata() {
  const Client client("test-author");
  MergeInput input{
      .documents = {make_document("doc1", {make_statement("CVE-2023-1234", "pkg:npm/lodash@4.17.21", "not_affected",
                                                          "component_not_present")}),
                    make_document("doc2", {make_statement("CVE-2023-0001", "pkg:npm/express@4.18.0", "fixed")})},
      .author = "merger",
      .author_role = "Security Engineer",
      .id = "merged-doc"};

  const auto merged = client.merge_documents(input);
  if (merged.id != "merged-doc" || merged.author != "merger" || merged.author_role != "Security Engineer") {
    return fail("test_merge_combines_and_overrides_metadata", "metadata overrides not applied");
  }
  if (merged.statements.size() != 2) {
    return fail("test_merge_combines_and_overrides_metadata", "expected two statements");
  }
  if (merged.statements[0].vulnerability.name != "CVE-2023-0001" ||
      merged.statements[1].vulnerability.name != "CVE-2023-1234") {
    return fail("test_merge_combines_and_overrides_metadata", "statements not sorted by vulnerability");
  }
  if (merged.timestamp.empty() || merged.timestamp == "2023-01-01T00:00:00Z") {
    return fail("test_merge_combines_and_overrides_metadata", "timestamp not refreshed");
  }

  input.id.clear();
  input.author.clear();
  const auto defaults = client.merge_documents(input);
  if (defaults.id.rfind("merged-vex-", 0) != 0 || defaults.author != "test-author") {
    return fail("test_merge_combines_and_overrides_metadata", "default id or author not applied");
  }
  return 0;
}

int test_merge_is_order_independent_without_conflicts() {
  const Client client;
  const auto a = make_document("a", {make_statement("CVE-2023-0002", "pkg:npm/b@1", "fixed"),
                                     make_statement("CVE-2023-0001", "pkg:npm/a@1", "under_investigation")});
  const auto b = make_document("b", {make_statement("CVE-2023-0003", "pkg:npm/c@1", "not_affected",
                                                    "vulnerable_code_not_present")});

  const auto ab = client.merge_documents(MergeInput{.documents = {a, b}});
  const auto ba = client.merge_documents(MergeInput{.documents = {b, a}});

  if (nlohmann::json(ab.statements) != nlohmann::json(ba.statements)) {
    return fail("test_merge_is_order_independent_without_conflicts", "statement sets differ by input order");
  }
  if (ab.statements.size() != 3) {
    return fail("test_merge_is_order_independent_without_conflicts", "expected three statements");
  }
  return 0;
}

int test_merge_status_precedence() {
  const Client client;
  struct Case {
    const char* first;
    const char* second;
    Status expected;
  };
  const std::vector<Case> cases{{"affected", "fixed", Status::fixed},
                                {"fixed", "affected", Status::fixed},
                                {"under_investigation", "not_affected", Status::not_affected},
                                {"affected", "under_investigation", Status::under_investigation},
                                {"not_affected", "fixed", Status::fixed}};

  for (const auto& test_case : cases) {
    const auto merged = client.merge_documents(
        MergeInput{.documents = {make_document("one", {make_statement("CVE-2023-1", "pkg:npm/x@1", test_case.first)}),
                                 make_document("two", {make_statement("CVE-2023-1", "pkg:npm/x@1",
                                                                      test_case.second)})}});
    if (merged.statements.size() != 1 || merged.statements.front().status != test_case.expected) {
      std::cerr << "  case: " << test_case.first << " vs " << test_case.second << '\n';
      return fail("test_merge_status_precedence", "conflict resolved to the wrong status");
    }
  }

  if (vexdoc::vex::status_rank(Status::fixed) >= vexdoc::vex::status_rank(Status::not_affected) ||
      vexdoc::vex::status_rank(Status::under_investigation) >= vexdoc::vex::status_rank(Status::affected)) {
    return fail("test_merge_status_precedence", "precedence table out of order");
  }
  return 0;
}

int test_merge_justifications() {
  const Client client;
  const auto same = client.merge_documents(MergeInput{
      .documents = {make_document("one", {make_statement("CVE-1", "pkg:x", "not_affected", "component_not_present")}),
                    make_document("two", {make_statement("CVE-1", "pkg:x", "not_affected", "component_not_present")})}});
  if (same.statements.size() != 1 || same.statements.front().justification != "component_not_present") {
    return fail("test_merge_justifications", "single distinct justification not kept");
  }

  const auto different = client.merge_documents(MergeInput{
      .documents = {
          make_document("one", {make_statement("CVE-1", "pkg:x", "not_affected", "component_not_present")}),
          make_document("two", {make_statement("CVE-1", "pkg:x", "not_affected", "vulnerable_code_not_present")})}});
  if (different.statements.size() != 1 ||
      different.statements.front().justification !=
          "multiple justifications: component_not_present, vulnerable_code_not_present") {
    return fail("test_merge_justifications", "distinct justifications not combined");
  }
  return 0;
}

int test_merge_accepts_previously_merged_documents() {
  const Client client;
  const auto first = client.merge_documents(MergeInput{
      .documents = {
          make_document("one", {make_statement("CVE-1", "pkg:x", "not_affected", "component_not_present")}),
          make_document("two", {make_statement("CVE-1", "pkg:x", "not_affected", "vulnerable_code_not_present")})}});
  const auto wire = nlohmann::json::parse(vexdoc::vex::serialize_document(first));

  const auto again = client.merge_documents(MergeInput{
      .documents = {wire, make_document("three", {make_statement("CVE-1", "pkg:x", "not_affected",
                                                                 "inline_mitigations_already_exist")}),
                    make_document("four", {make_statement("CVE-1", "pkg:x", "not_affected", "component_not_present")})}});
  if (again.statements.size() != 1 ||
      again.statements.front().justification !=
          "multiple justifications: component_not_present, vulnerable_code_not_present, "
          "inline_mitigations_already_exist") {
    return fail("test_merge_accepts_previously_merged_documents", "combined justification not carried forward");
  }

  const auto reparsed = vexdoc::vex::parse_document(wire);
  if (reparsed.statements.front().justification != first.statements.front().justification) {
    return fail("test_merge_accepts_previously_merged_documents", "combined justification changed on parse");
  }

  const auto bogus = make_document(
      "bogus", {make_statement("CVE-1", "pkg:x", "not_affected", "multiple justifications: component_not_present, bogus")});
  if (!contains(error_of([&] { (void)vexdoc::vex::parse_document(bogus); }), "invalid justification: bogus")) {
    return fail("test_merge_accepts_previously_merged_documents", "unknown part of a combined justification accepted");
  }
  return 0;
}

int test_merge_document_count_bounds() {
  const Client client;
  const auto document = make_document("doc", {make_statement("CVE-1", "pkg:x", "fixed")});

  if (!contains(error_of([&] { (void)client.merge_documents(MergeInput{.documents = {document}}); }), "least 2")) {
    return fail("test_merge_document_count_bounds", "single document accepted");
  }

  const std::vector<nlohmann::json> twenty_one(21, document);
  if (!contains(error_of([&] { (void)client.merge_documents(MergeInput{.documents = twenty_one}); }), "maximum")) {
    return fail("test_merge_document_count_bounds", "21 documents accepted");
  }

  const std::vector<nlohmann::json> twenty(20, document);
  if (!error_of([&] { (void)client.merge_documents(MergeInput{.documents = twenty}); }).empty()) {
    return fail("test_merge_document_count_bounds", "20 documents rejected");
  }
  if (!error_of([&] { (void)client.merge_documents(MergeInput{.documents = {document, document}}); }).empty()) {
    return fail("test_merge_document_count_bounds", "2 documents rejected");
  }
  return 0;
}

int test_merge_structure_and_parse_failures() {
  const Client client;
  const auto good = make_document("good", {make_statement("CVE-1", "pkg:x", "fixed")});

  auto no_context = good;
  no_context.erase("@context");
  const auto context_error =
      error_of([&] { (void)client.merge_documents(MergeInput{.documents = {good, no_context}}); });
  if (!contains(context_error, "document 2") || !contains(context_error, "@context")) {
    return fail("test_merge_structure_and_parse_failures", "missing @context not reported with index");
  }

  auto no_statements = good;
  no_statements.erase("statements");
  const auto statements_error =
      error_of([&] { (void)client.merge_documents(MergeInput{.documents = {no_statements, good}}); });
  if (!contains(statements_error, "document 1") || !contains(statements_error, "statements")) {
    return fail("test_merge_structure_and_parse_failures", "missing statements not reported with index");
  }

  const auto bad_status = make_document("bad", {make_statement("CVE-1", "pkg:x", "broken")});
  const auto parse_error =
      error_of([&] { (void)client.merge_documents(MergeInput{.documents = {good, bad_status}}); });
  if (!contains(parse_error, "failed to parse document 2")) {
    return fail("test_merge_structure_and_parse_failures", "parse failure not reported with index");
  }
  return 0;
}

int test_merge_filters() {
  const Client client;
  const auto one = make_document("one", {make_statement("CVE-1", "pkg:a", "fixed"),
                                         make_statement("CVE-2", "pkg:b", "fixed")});
  const auto two = make_document("two", {make_statement("CVE-1", "pkg:b", "affected"),
                                         make_statement("CVE-3", "pkg:a", "under_investigation")});

  const auto by_product = client.merge_documents(MergeInput{.documents = {one, two}, .products = {" pkg:a ", ""}});
  if (by_product.statements.size() != 2) {
    return fail("test_merge_filters", "product filter kept the wrong statements");
  }
  for (const auto& statement : by_product.statements) {
    if (statement.products.front().id != "pkg:a") {
      return fail("test_merge_filters", "product filter leaked another product");
    }
  }

  const auto by_vulnerability = client.merge_documents(MergeInput{.documents = {one, two}, .vulnerabilities = {"CVE-1"}});
  if (by_vulnerability.statements.size() != 2) {
    return fail("test_merge_filters", "vulnerability filter kept the wrong statements");
  }

  const auto both = client.merge_documents(
      MergeInput{.documents = {one, two}, .products = {"pkg:b"}, .vulnerabilities = {"CVE-1"}});
  if (both.statements.size() != 1 || both.statements.front().products.front().id != "pkg:b" ||
      both.statements.front().vulnerability.name != "CVE-1") {
    return fail("test_merge_filters", "combined filters must both apply");
  }

  const auto error =
      error_of([&] { (void)client.merge_documents(MergeInput{.documents = {one, two}, .products = {"pkg:a|b"}}); });
  if (!contains(error, "products[0] contains potentially dangerous characters")) {
    return fail("test_merge_filters", "dangerous filter entry accepted");
  }
  return 0;
}

int test_merge_splits_multi_product_statements() {
  const Client client;
  auto shared = make_statement("CVE-9", "pkg:a", "affected");
  shared["products"].push_back(nlohmann::json{{"@id", "pkg:b"}});
  shared["action_statement"] = "upgrade";

  const auto merged = client.merge_documents(MergeInput{
      .documents = {make_document("one", {shared}), make_document("two", {make_statement("CVE-9", "pkg:b", "fixed")})}});

  if (merged.statements.size() != 2) {
    return fail("test_merge_splits_multi_product_statements", "expected one statement per product");
  }
  if (merged.statements[0].products.front().id != "pkg:a" || merged.statements[0].status != Status::affected ||
      merged.statements[0].action_statement != "upgrade") {
    return fail("test_merge_splits_multi_product_statements", "unique product statement altered");
  }
  if (merged.statements[1].products.front().id != "pkg:b" || merged.statements[1].status != Status::fixed) {
    return fail("test_merge_splits_multi_product_statements", "conflicting product not resolved to fixed");
  }
  return 0;
}

int test_merge_keeps_unique_multi_product_statements() {
  const Client client;
  auto shared = make_statement("CVE-7", "pkg:a", "affected");
  shared["products"].push_back(nlohmann::json{{"@id", "pkg:b"}});
  shared["action_statement"] = "upgrade";
  const auto one = make_document("one", {shared});
  const auto two = make_document("two", {make_statement("CVE-8", "pkg:a", "fixed")});

  const auto merged = client.merge_documents(MergeInput{.documents = {one, two}});
  if (merged.statements.size() != 2 || merged.statements[0].products.size() != 2 ||
      merged.statements[0].products[1].id != "pkg:b") {
    return fail("test_merge_keeps_unique_multi_product_statements", "uncontested statement was split");
  }

  const auto filtered = client.merge_documents(MergeInput{.documents = {one, two}, .products = {"pkg:b"}});
  if (filtered.statements.size() != 1 || filtered.statements.front().products.size() != 2) {
    return fail("test_merge_keeps_unique_multi_product_statements", "product filter dropped sibling products");
  }
  return 0;
}

int test_merge_metadata_limits() {
  const Client client;
  const auto document = make_document("doc", {make_statement("CVE-1", "pkg:x", "fixed")});

  MergeInput long_author{.documents = {document, document}, .author = std::string(201, 'a')};
  if (!contains(error_of([&] { (void)client.merge_documents(long_author); }), "exceeds maximum length")) {
    return fail("test_merge_metadata_limits", "long author accepted");
  }

  MergeInput long_id{.documents = {document, document}, .id = std::string(501, 'i')};
  if (!contains(error_of([&] { (void)client.merge_documents(long_id); }), "id exceeds maximum length of 500")) {
    return fail("test_merge_metadata_limits", "long id accepted");
  }

  MergeInput dangerous_role{.documents = {document, document}, .author_role = "admin; rm"};
  if (!contains(error_of([&] { (void)client.merge_documents(dangerous_role); }), "author_role")) {
    return fail("test_merge_metadata_limits", "dangerous role accepted");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_create_not_affected_with_justification(); rc != 0) return rc;
  if (int rc = test_create_accepts_every_justification(); rc != 0) return rc;
  if (int rc = test_create_other_statuses(); rc != 0) return rc;
  if (int rc = test_create_not_affected_requires_justification_or_impact(); rc != 0) return rc;
  if (int rc = test_create_rejections(); rc != 0) return rc;
  if (int rc = test_parse_document_rejects_malformed_input(); rc != 0) return rc;
  if (int rc = test_parse_document_accepts_legacy_vulnerability_string(); rc != 0) return rc;
  if (int rc = test_parse_document_version_range(); rc != 0) return rc;
  if (int rc = test_created_document_round_trip(); rc != 0) return rc;
  if (int rc = test_merge_combines_and_overrides_metadata(); rc != 0) return rc;
  if (int rc = test_merge_is_order_independent_without_conflicts(); rc != 0) return rc;
  if (int rc = test_merge_status_precedence(); rc != 0) return rc;
  if (int rc = test_merge_justifications(); rc != 0) return rc;
  if (int rc = test_merge_accepts_previously_merged_documents(); rc != 0) return rc;
  if (int rc = test_merge_document_count_bounds(); rc != 0) return rc;
  if (int rc = test_merge_structure_and_parse_failures(); rc != 0) return rc;
  if (int rc = test_merge_filters(); rc != 0) return rc;
  if (int rc = test_merge_splits_multi_product_statements(); rc != 0) return rc;
  if (int rc = test_merge_keeps_unique_multi_product_statements(); rc != 0) return rc;
  if (int rc = test_merge_metadata_limits(); rc != 0) return rc;

  std::cout << "[PASS] vex unit tests\n";
  return 0;
}
