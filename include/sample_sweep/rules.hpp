#pragma once
#include <set>
#include <string>
#include <vector>
#include <optional>
#include "sample_sweep/types.hpp"
#include "sample_sweep/siblings.hpp"

namespace sample_sweep {
    // Per-run lookup data for classify(); built once from the scan.
    struct ClassificationContext {
        EffectiveThresholds thresholds;
        VideoSiblingGroups siblings;
        // Relative paths of directories holding at least one protected item.
        std::set<std::string> protected_ancestors;
    };

    EffectiveThresholds resolve_thresholds(const Configuration& config);

    std::optional<std::string> find_pattern_match(const std::string& name, const std::string& relative,
                                                  const std::vector<std::string>& patterns);

    // True when `name` carries "sample", "samples" or one of `extra_tokens`
    // delimited by '.', '_', '-', whitespace or the name boundaries. Extra tokens
    // may themselves contain separators ("proof-sample").
    bool has_sample_token(const std::string& name, const std::vector<std::string>& extra_tokens);

    ClassificationContext build_context(const std::vector<CandidateItem>& items, const Configuration& config);

    // Applies the rules in precedence order; the first match decides. No I/O.
    Verdict classify(const CandidateItem& item, const Configuration& config, const ClassificationContext& context);

    std::string rule_name(RuleId rule);
    std::string describe_rules(const std::vector<RuleId>& rules);
}
