/**
 * @file repo_matcher.hpp
 * @brief Rule-based selection of repositories to back up.
 */

#ifndef ORGMIRRORBACKUP_REPO_MATCHER_HPP
#define ORGMIRRORBACKUP_REPO_MATCHER_HPP

#include "models.hpp"

#include <regex>
#include <set>
#include <string>
#include <vector>

namespace omb {

/// Compiled regular expression kept next to its source text.
struct NamePattern {
  std::string source;
  std::regex regex;
};

/**
 * Selection rules for one organization.
 *
 * Patterns are searched (not anchored) against the repository name and are
 * case sensitive. Exclusion rules always take precedence over inclusion.
 */
class MatchRuleSet {
public:
  MatchRuleSet() = default;

  /**
   * Compile a rule set.
   *
   * @throws ConfigurationError When any pattern fails to compile.
   */
  MatchRuleSet(const std::vector<std::string> &include_patterns,
               std::set<std::string> include_names, bool exclude_archived,
               const std::vector<std::string> &exclude_patterns,
               std::set<std::string> exclude_names);

  const std::vector<NamePattern> &include_patterns() const {
    return include_patterns_;
  }
  const std::set<std::string> &include_names() const { return include_names_; }
  bool exclude_archived() const { return exclude_archived_; }
  const std::vector<NamePattern> &exclude_patterns() const {
    return exclude_patterns_;
  }
  const std::set<std::string> &exclude_names() const { return exclude_names_; }

  /// True when neither include patterns nor include names are configured.
  bool include_all() const {
    return include_patterns_.empty() && include_names_.empty();
  }

private:
  std::vector<NamePattern> include_patterns_;
  std::set<std::string> include_names_;
  bool exclude_archived_{false};
  std::vector<NamePattern> exclude_patterns_;
  std::set<std::string> exclude_names_;
};

/// Selection outcome together with the diagnostics logged by the caller.
struct MatchResult {
  std::vector<RepositoryDescriptor> selected;
  std::vector<std::string> excluded;      ///< Removed by exclude rules, sorted
  std::vector<std::string> archived;      ///< Removed as archived, sorted
  std::vector<std::string> missing_names; ///< Exact includes not listed
};

/** Pure, deterministic repository filter. */
class RepositoryMatcher {
public:
  explicit RepositoryMatcher(MatchRuleSet rules);

  /// Order-preserving subset of @p repositories that should be backed up.
  std::vector<RepositoryDescriptor>
  select(const std::vector<RepositoryDescriptor> &repositories) const;

  /// Same as select() but also reports what was dropped and why.
  MatchResult evaluate(const std::vector<RepositoryDescriptor> &repositories) const;

  /// True when @p name passes the include rules.
  bool is_included(const std::string &name) const;

  /// True when @p name is hit by an exclude rule.
  bool is_excluded(const std::string &name) const;

  const MatchRuleSet &rules() const { return rules_; }

private:
  MatchRuleSet rules_;
};

/**
 * Lay out @p names in fixed-width columns for compact log output.
 *
 * @param names Entries to format.
 * @param columns Number of entries per line.
 * @return Multi-line string, empty when @p names is empty.
 */
std::string format_columns(const std::vector<std::string> &names,
                           std::size_t columns = 3);

} // namespace omb

#endif // ORGMIRRORBACKUP_REPO_MATCHER_HPP
