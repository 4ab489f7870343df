#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <string>
#include <vector>

#include "vex/document.hpp"

namespace vexdoc::vex {

// Conflict precedence, strongest first. A claim that a product is fixed wins
// over any other claim for the same vulnerability and component.
constexpr std::array<Status, 4> kStatusPrecedence{Status::fixed, Status::not_affected, Status::under_investigation,
                                                  Status::affected};

// Lower rank means higher precedence.
std::size_t status_rank(Status status);

struct StatementKey {
  std::string vulnerability;
  std::string component;

  bool operator==(const StatementKey&) const = default;
  auto operator<=>(const StatementKey&) const = default;
};

StatementKey key_of(const Statement& statement);

// Groups statements by (vulnerability, component) and resolves each group
// into one statement, sorted by key. A multi-product statement is split per
// product only when one of its keys is claimed by another statement.
std::vector<Statement> merge_statements(const std::vector<Document>& documents);

// Resolves one group of statements that share a key.
Statement resolve_conflict(const std::vector<Statement>& group);

// Empty filter lists keep everything.
std::vector<Statement> filter_statements(std::vector<Statement> statements, const std::vector<std::string>& products,
                                         const std::vector<std::string>& vulnerabilities);

}  // namespace vexdoc::vex
