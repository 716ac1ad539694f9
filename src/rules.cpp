#include <array>
#include <cctype>
#include <algorithm>
#include <string_view>
#include <fmt/core.h>
#include "sample_sweep/utils.hpp"
#include "sample_sweep/rules.hpp"

namespace sample_sweep {

    namespace {
        constexpr std::array<std::string_view, 2> kSampleTokens = {"sample", "samples"};
        constexpr std::array<std::string_view, 6> kImageExtensions = {
            ".jpg", ".jpeg", ".png", ".bmp", ".gif", ".webp"};
        constexpr std::array<std::string_view, 4> kJunkExtraExtensions = {
            ".url", ".webloc", ".lnk", ".website"};
        constexpr std::string_view kReadmeSuffix = "readme.txt";

        template <std::size_t N>
        bool matches_extension(const std::string& extension, const std::array<std::string_view, N>& allowed) {
            return std::any_of(allowed.begin(), allowed.end(), [&](std::string_view item) {
                return extension == item;
            });
        }

        bool is_token_separator(char c) {
            return c == '.' || c == '_' || c == '-' || std::isspace(static_cast<unsigned char>(c));
        }

        // True when `token` occurs in `name` bounded by separators or the name ends.
        bool contains_bounded_token(const std::string& name, const std::string& token) {
            if (token.empty()) {
                return false;
            }
            for (auto pos = name.find(token); pos != std::string::npos; pos = name.find(token, pos + 1)) {
                const auto end = pos + token.size();
                const bool starts = pos == 0 || is_token_separator(name[pos - 1]);
                const bool ends = end == name.size() || is_token_separator(name[end]);
                if (starts && ends) {
                    return true;
                }
            }
            return false;
        }

        // Relative paths of every directory above `relative`, outermost first.
        std::vector<std::string> ancestor_paths(const std::string& relative) {
            std::vector<std::string> ancestors;
            std::string::size_type slash = relative.find('/');
            while (slash != std::string::npos) {
                ancestors.push_back(relative.substr(0, slash));
                slash = relative.find('/', slash + 1);
            }
            return ancestors;
        }

        std::string last_component(const std::string& relative) {
            const auto slash = relative.rfind('/');
            return slash == std::string::npos ? relative : relative.substr(slash + 1);
        }

        // Rule 2 or 3 for a directory known only by its relative path.
        std::optional<std::string> directory_match(const std::string& relative, const Configuration& config) {
            const std::string name = last_component(relative);
            if (auto pattern = find_pattern_match(name, relative, config.deny_patterns)) {
                return fmt::format("deny pattern '{}'", *pattern);
            }
            if (has_sample_token(name, config.junk_tokens)) {
                return std::string("sample name");
            }
            return std::nullopt;
        }

        Verdict keep_verdict(RuleId rule, std::string detail) {
            return Verdict{Disposition::Keep, {rule}, std::move(detail)};
        }

        Verdict remove_verdict(std::vector<RuleId> rules, std::string detail) {
            return Verdict{Disposition::Remove, std::move(rules), std::move(detail)};
        }

        // Structural matches (deny, name, inherited) on directories are bulk
        // removals and yield to protected content below them.
        Verdict gate_structural(const CandidateItem& item, const ClassificationContext& context, Verdict verdict) {
            if (item.kind == ItemKind::Directory &&
                context.protected_ancestors.count(item.relative) > 0) {
                return keep_verdict(RuleId::ProtectedDescendant,
                            verdict.detail + "; kept because it contains protected items");
            }
            return verdict;
        }

        Verdict gate_toggles(const CandidateItem& item, const Configuration& config, Verdict verdict) {
            if (verdict.disposition != Disposition::Remove) {
                return verdict;
            }
            if (item.kind == ItemKind::File && !config.remove_files) {
                return keep_verdict(RuleId::RemovalDisabled, verdict.detail + "; file removal is disabled");
            }
            if (item.kind == ItemKind::Directory && !config.remove_directories) {
                return keep_verdict(RuleId::RemovalDisabled, verdict.detail + "; directory removal is disabled");
            }
            return verdict;
        }

        std::optional<Verdict> size_rules(const CandidateItem& item, const Configuration& config,
                                          const ClassificationContext& context) {
            const EffectiveThresholds& thresholds = context.thresholds;

            if (is_video_file(item, config)) {
                std::vector<RuleId> fired;
                std::vector<std::string> details;
                if (item.size_bytes < thresholds.video_threshold_bytes) {
                    fired.push_back(RuleId::VideoSize);
                    details.push_back(fmt::format("video {} below {}", format_megabytes(item.size_bytes),
                                                  format_megabytes(thresholds.video_threshold_bytes)));
                }
                if (config.relative_size_enabled) {
                    if (auto largest = context.siblings.comparable_max(item)) {
                        const auto percent = static_cast<std::uintmax_t>(thresholds.relative_percent);
                        if (item.size_bytes * 100 < percent * *largest) {
                            fired.push_back(RuleId::RelativeSize);
                            details.push_back(fmt::format("video below {}% of largest sibling ({})",
                                                          thresholds.relative_percent, format_megabytes(*largest)));
                        }
                    }
                }
                if (!fired.empty()) {
                    std::string detail = details.front();
                    for (std::size_t index = 1; index < details.size(); ++index) {
                        detail += "; " + details[index];
                    }
                    return remove_verdict(std::move(fired), std::move(detail));
                }
                return std::nullopt;
            }

            if (is_audio_file(item, config) && thresholds.audio_threshold_bytes > 0 &&
                item.size_bytes < thresholds.audio_threshold_bytes) {
                return remove_verdict({RuleId::AudioSize},
                                      fmt::format("audio {} below {}", format_megabytes(item.size_bytes),
                                                  format_megabytes(thresholds.audio_threshold_bytes)));
            }

            return std::nullopt;
        }

        std::optional<Verdict> extra_rules(const CandidateItem& item, const Configuration& config) {
            const std::string lowered = to_lowercase(item.name);
            if (config.image_samples && matches_extension(item.extension, kImageExtensions) &&
                lowered.find("sample") != std::string::npos) {
                return remove_verdict({RuleId::ImageSample}, "sample image");
            }
            if (config.junk_extras) {
                if (matches_extension(item.extension, kJunkExtraExtensions)) {
                    return remove_verdict({RuleId::JunkExtra}, "junk extra " + item.extension);
                }
                if (lowered.size() >= kReadmeSuffix.size() &&
                    lowered.compare(lowered.size() - kReadmeSuffix.size(), kReadmeSuffix.size(), kReadmeSuffix) == 0) {
                    return remove_verdict({RuleId::JunkExtra}, "junk extra readme");
                }
            }
            return std::nullopt;
        }
    }

    EffectiveThresholds resolve_thresholds(const Configuration& config) {
        EffectiveThresholds thresholds;
        thresholds.video_threshold_bytes = config.video_threshold_bytes;
        thresholds.audio_threshold_bytes = config.audio_threshold_bytes;
        thresholds.relative_percent = config.relative_percent;

        if (config.category.empty()) {
            return thresholds;
        }
        auto it = config.category_overrides.find(to_lowercase(config.category));
        if (it == config.category_overrides.end()) {
            return thresholds;
        }

        const CategoryOverride& override_value = it->second;
        if (override_value.video_threshold_bytes) {
            thresholds.video_threshold_bytes = *override_value.video_threshold_bytes;
        }
        if (override_value.audio_threshold_bytes) {
            thresholds.audio_threshold_bytes = *override_value.audio_threshold_bytes;
        }
        if (override_value.relative_percent) {
            thresholds.relative_percent = *override_value.relative_percent;
        }
        thresholds.category_override = true;
        return thresholds;
    }

    std::optional<std::string> find_pattern_match(const std::string& name, const std::string& relative,
                                                  const std::vector<std::string>& patterns) {
        for (const auto& pattern : patterns) {
            if (glob_match(pattern, name) || glob_match(pattern, relative)) {
                return pattern;
            }
        }
        return std::nullopt;
    }

    bool has_sample_token(const std::string& name, const std::vector<std::string>& extra_tokens) {
        const std::string lowered = to_lowercase(name);
        for (std::string_view token : kSampleTokens) {
            if (contains_bounded_token(lowered, std::string(token))) {
                return true;
            }
        }
        return std::any_of(extra_tokens.begin(), extra_tokens.end(), [&](const std::string& token) {
            return contains_bounded_token(lowered, to_lowercase(token));
        });
    }

    ClassificationContext build_context(const std::vector<CandidateItem>& items, const Configuration& config) {
        ClassificationContext context;
        context.thresholds = resolve_thresholds(config);
        context.siblings = group_video_siblings(items, config);

        for (const auto& item : items) {
            if (!find_pattern_match(item.name, item.relative, config.protected_patterns)) {
                continue;
            }
            for (auto& ancestor : ancestor_paths(item.relative)) {
                context.protected_ancestors.insert(std::move(ancestor));
            }
        }
        return context;
    }

    Verdict classify(const CandidateItem& item, const Configuration& config, const ClassificationContext& context) {
        if (auto pattern = find_pattern_match(item.name, item.relative, config.protected_patterns)) {
            return keep_verdict(RuleId::Protected, fmt::format("protected pattern '{}'", *pattern));
        }
        // Everything below a protected directory is protected with it.
        for (const auto& ancestor : ancestor_paths(item.relative)) {
            if (auto pattern = find_pattern_match(last_component(ancestor), ancestor, config.protected_patterns)) {
                return keep_verdict(RuleId::Protected,
                                    fmt::format("inside protected '{}' (pattern '{}')", ancestor, *pattern));
            }
        }

        if (auto pattern = find_pattern_match(item.name, item.relative, config.deny_patterns)) {
            Verdict verdict = remove_verdict({RuleId::Deny}, fmt::format("deny pattern '{}'", *pattern));
            return gate_toggles(item, config, gate_structural(item, context, std::move(verdict)));
        }

        if (has_sample_token(item.name, config.junk_tokens)) {
            Verdict verdict = remove_verdict({RuleId::NamePattern}, "sample name");
            return gate_toggles(item, config, gate_structural(item, context, std::move(verdict)));
        }

        // Anything below a matching directory that survived because of the
        // protected veto is removed individually.
        if (config.remove_directories) {
            for (const auto& ancestor : ancestor_paths(item.relative)) {
                if (auto reason = directory_match(ancestor, config)) {
                    Verdict verdict = remove_verdict({RuleId::InheritedMatch},
                                                     fmt::format("inside '{}' ({})", ancestor, *reason));
                    return gate_toggles(item, config, gate_structural(item, context, std::move(verdict)));
                }
            }
        }

        if (item.kind == ItemKind::File) {
            if (auto verdict = size_rules(item, config, context)) {
                return gate_toggles(item, config, std::move(*verdict));
            }
            if (auto verdict = extra_rules(item, config)) {
                return gate_toggles(item, config, std::move(*verdict));
            }
        }

        return keep_verdict(RuleId::NoMatch, "no rule matched");
    }

    std::string rule_name(RuleId rule) {
        switch (rule) {
            case RuleId::Protected: return "Protected";
            case RuleId::ProtectedDescendant: return "ProtectedDescendant";
            case RuleId::Deny: return "Deny";
            case RuleId::NamePattern: return "NamePattern";
            case RuleId::InheritedMatch: return "InheritedMatch";
            case RuleId::VideoSize: return "VideoSize";
            case RuleId::RelativeSize: return "RelativeSize";
            case RuleId::AudioSize: return "AudioSize";
            case RuleId::ImageSample: return "ImageSample";
            case RuleId::JunkExtra: return "JunkExtra";
            case RuleId::RemovalDisabled: return "RemovalDisabled";
            case RuleId::NoMatch: return "NoMatch";
        }
        return "Unknown";
    }

    std::string describe_rules(const std::vector<RuleId>& rules) {
        std::string joined;
        for (RuleId rule : rules) {
            if (!joined.empty()) {
                joined += "+";
            }
            joined += rule_name(rule);
        }
        return joined;
    }
}
