#include "vex/merge.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <set>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace vexdoc::vex {
namespace {

std::vector<Statement> split_by_product(const Statement& statement) {
  if (statement.products.size() <= 1) {
    return {statement};
  }

  std::vector<Statement> split;
  split.reserve(statement.products.size());
  for (const auto& product : statement.products) {
    Statement single = statement;
    single.products = {product};
    split.push_back(std::move(single));
  }
  return split;
}

std::string merge_justifications(const std::vector<Statement>& group) {
  std::vector<std::string> distinct;
  for (const auto& statement : group) {
    if (statement.justification.empty()) {
      continue;
    }
    for (auto& label : parse_justification_labels(statement.justification)) {
      if (std::find(distinct.begin(), distinct.end(), label) == distinct.end()) {
        distinct.push_back(std::move(label));
      }
    }
  }
  return combine_justifications(distinct);
}

}  // namespace

std::size_t status_rank(Status status) {
  const auto it = std::find(kStatusPrecedence.begin(), kStatusPrecedence.end(), status);
  return static_cast<std::size_t>(std::distance(kStatusPrecedence.begin(), it));
}

StatementKey key_of(const Statement& statement) {
  return StatementKey{.vulnerability = statement.vulnerability.name,
                      .component = statement.products.empty() ? std::string{} : statement.products.front().id};
}

Statement resolve_conflict(const std::vector<Statement>& group) {
  if (group.empty()) {
    throw std::invalid_argument("cannot resolve an empty statement group");
  }
  if (group.size() == 1) {
    return group.front();
  }

  const auto winner = std::min_element(group.begin(), group.end(), [](const Statement& a, const Statement& b) {
    return status_rank(a.status) < status_rank(b.status);
  });

  Statement merged = *winner;
  merged.justification = merge_justifications(group);
  return merged;
}

std::vector<Statement> merge_statements(const std::vector<Document>& documents) {
  // Number of statements naming each (vulnerability, component) key.
  std::map<StatementKey, std::size_t> claims;
  for (const auto& document : documents) {
    for (const auto& statement : document.statements) {
      std::set<StatementKey> keys;
      for (const auto& single : split_by_product(statement)) {
        keys.insert(key_of(single));
      }
      for (const auto& key : keys) {
        ++claims[key];
      }
    }
  }

  const auto conflicts = [&](const Statement& statement) {
    return std::any_of(statement.products.begin(), statement.products.end(), [&](const Product& product) {
      return claims.at(StatementKey{.vulnerability = statement.vulnerability.name, .component = product.id}) > 1;
    });
  };

  // Statements without a contested key keep all their products.
  std::map<StatementKey, std::vector<Statement>> groups;
  for (const auto& document : documents) {
    for (const auto& statement : document.statements) {
      if (!conflicts(statement)) {
        groups[key_of(statement)].push_back(statement);
        continue;
      }
      for (auto& single : split_by_product(statement)) {
        auto key = key_of(single);
        groups[std::move(key)].push_back(std::move(single));
      }
    }
  }

  std::vector<Statement> merged;
  merged.reserve(groups.size());
  for (const auto& [_, group] : groups) {
    merged.push_back(resolve_conflict(group));
  }
  return merged;
}

std::vector<Statement> filter_statements(std::vector<Statement> statements, const std::vector<std::string>& products,
                                         const std::vector<std::string>& vulnerabilities) {
  const std::unordered_set<std::string> product_set(products.begin(), products.end());
  const std::unordered_set<std::string> vulnerability_set(vulnerabilities.begin(), vulnerabilities.end());

  const auto rejected = [&](const Statement& statement) {
    if (!product_set.empty()) {
      const bool any_product = std::any_of(statement.products.begin(), statement.products.end(),
                                           [&](const Product& product) { return product_set.count(product.id) > 0; });
      if (!any_product) {
        return true;
      }
    }
    return !vulnerability_set.empty() && vulnerability_set.count(statement.vulnerability.name) == 0;
  };

  statements.erase(std::remove_if(statements.begin(), statements.end(), rejected), statements.end());
  return statements;
}

}  // namespace vexdoc::vex
