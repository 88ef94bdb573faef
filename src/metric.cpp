#include "benchkit/metric.h"

#include "benchkit/log.h"

#include <regex>
#include <string>

namespace benchkit {

void Metric::write_params(boost::json::object &) const {}

Scores Metric::evaluate(const Instance &instance, const std::vector<Attempt> &attempts) const {
    if (instance.scores_for(name()) != nullptr)
        log::warn("metric '{}' already evaluated on instance '{}'; scores will be overwritten", name(), instance.id());

    Scores values;
    values.reserve(attempts.size());
    for (const auto &attempt : attempts)
        values.push_back(score(instance, attempt));

    log::debug("instance '{}' evaluated on metric '{}'", instance.id(), name());
    return values;
}

std::string whole_word_pattern(std::string_view text) {
    static constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";
    std::string pattern = R"(\b)";
    pattern.reserve(text.size() * 2 + 4);
    for (char ch : text) {
        if (kSpecial.find(ch) != std::string_view::npos)
            pattern.push_back('\\');
        pattern.push_back(ch);
    }
    pattern += R"(\b)";
    return pattern;
}

Score ExactMatchMetric::score(const Instance &instance, const Attempt &attempt) const {
    if (!attempt.response())
        return std::nullopt;
    const auto truth = instance.ground_truth();
    if (!truth)
        return std::nullopt;
    const std::regex re(whole_word_pattern(*truth), std::regex::ECMAScript | std::regex::icase);
    return ScoreValue{std::regex_search(*attempt.response(), re)};
}

Score RuntimeMetric::score(const Instance &, const Attempt &attempt) const {
    if (!attempt.is_success() || !attempt.runtime())
        return std::nullopt;
    return ScoreValue{*attempt.runtime()};
}

Score StatusMetric::score(const Instance &, const Attempt &attempt) const {
    return ScoreValue{std::string(to_string(attempt.status()))};
}

} // namespace benchkit
