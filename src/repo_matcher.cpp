#include "repo_matcher.hpp"
#include "errors.hpp"

#include <algorithm>
#include <sstream>

namespace omb {

namespace {

std::vector<NamePattern> compile(const std::vector<std::string> &sources,
                                 const char *what) {
  std::vector<NamePattern> out;
  out.reserve(sources.size());
  for (const auto &src : sources) {
    try {
      out.push_back({src, std::regex(src, std::regex::ECMAScript)});
    } catch (const std::regex_error &e) {
      throw ConfigurationError(std::string("Invalid ") + what + " pattern '" +
                               src + "': " + e.what());
    }
  }
  return out;
}

bool any_search(const std::vector<NamePattern> &patterns,
                const std::string &name) {
  return std::any_of(patterns.begin(), patterns.end(),
                     [&](const NamePattern &p) {
                       return std::regex_search(name, p.regex);
                     });
}

} // namespace

MatchRuleSet::MatchRuleSet(const std::vector<std::string> &include_patterns,
                           std::set<std::string> include_names,
                           bool exclude_archived,
                           const std::vector<std::string> &exclude_patterns,
                           std::set<std::string> exclude_names)
    : include_patterns_(compile(include_patterns, "include")),
      include_names_(std::move(include_names)),
      exclude_archived_(exclude_archived),
      exclude_patterns_(compile(exclude_patterns, "exclude")),
      exclude_names_(std::move(exclude_names)) {}

RepositoryMatcher::RepositoryMatcher(MatchRuleSet rules)
    : rules_(std::move(rules)) {}

bool RepositoryMatcher::is_included(const std::string &name) const {
  if (rules_.include_all()) {
    return true;
  }
  return rules_.include_names().count(name) > 0 ||
         any_search(rules_.include_patterns(), name);
}

bool RepositoryMatcher::is_excluded(const std::string &name) const {
  return rules_.exclude_names().count(name) > 0 ||
         any_search(rules_.exclude_patterns(), name);
}

MatchResult RepositoryMatcher::evaluate(
    const std::vector<RepositoryDescriptor> &repositories) const {
  MatchResult result;
  std::set<std::string> seen;
  for (const auto &repo : repositories) {
    seen.insert(repo.name);
    if (rules_.exclude_archived() && repo.archived) {
      result.archived.push_back(repo.name);
      continue;
    }
    if (!is_included(repo.name)) {
      continue;
    }
    if (is_excluded(repo.name)) {
      result.excluded.push_back(repo.name);
      continue;
    }
    result.selected.push_back(repo);
  }
  std::sort(result.excluded.begin(), result.excluded.end());
  std::sort(result.archived.begin(), result.archived.end());
  for (const auto &name : rules_.include_names()) {
    if (seen.count(name) == 0) {
      result.missing_names.push_back(name);
    }
  }
  return result;
}

std::vector<RepositoryDescriptor> RepositoryMatcher::select(
    const std::vector<RepositoryDescriptor> &repositories) const {
  return evaluate(repositories).selected;
}

std::string format_columns(const std::vector<std::string> &names,
                           std::size_t columns) {
  if (names.empty()) {
    return {};
  }
  if (columns == 0) {
    columns = 1;
  }
  std::size_t width = 0;
  for (const auto &n : names) {
    width = std::max(width, n.size());
  }
  width += 2;
  std::ostringstream oss;
  for (std::size_t i = 0; i < names.size(); ++i) {
    bool last_in_row = (i + 1) % columns == 0 || i + 1 == names.size();
    oss << "  " << names[i];
    if (!last_in_row) {
      oss << std::string(width - names[i].size(), ' ');
    } else if (i + 1 != names.size()) {
      oss << '\n';
    }
  }
  return oss.str();
}

} // namespace omb
