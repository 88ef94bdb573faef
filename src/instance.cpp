#include "benchkit/instance.h"

#include "benchkit/errors.h"

#include <fmt/format.h>

#include <utility>

namespace benchkit {

Instance::Instance(std::string id) : id_(std::move(id)) {
    if (id_.empty())
        throw ConsistencyError("instance id must not be empty");
}

const Scores *Instance::scores_for(std::string_view metric_name) const {
    auto it = scores_.find(std::string(metric_name));
    if (it == scores_.end())
        return nullptr;
    return &it->second;
}

std::vector<std::optional<std::string>> Instance::responses() const {
    std::vector<std::optional<std::string>> out;
    out.reserve(attempts_.size());
    for (const auto &a : attempts_)
        out.push_back(a.response());
    return out;
}

std::vector<std::optional<double>> Instance::runtimes() const {
    std::vector<std::optional<double>> out;
    out.reserve(attempts_.size());
    for (const auto &a : attempts_)
        out.push_back(a.runtime());
    return out;
}

std::vector<AttemptStatus> Instance::statuses() const {
    std::vector<AttemptStatus> out;
    out.reserve(attempts_.size());
    for (const auto &a : attempts_)
        out.push_back(a.status());
    return out;
}

UsageCounters Instance::total_usage() const {
    UsageCounters total;
    for (const auto &a : attempts_) {
        for (const auto &[key, value] : a.usage())
            total[key] += value;
    }
    return total;
}

std::unique_ptr<Instance> Instance::with_attempts(std::vector<Attempt> attempts) const {
    auto copy       = clone();
    copy->attempts_ = std::move(attempts);
    return copy;
}

std::unique_ptr<Instance> Instance::with_scores(std::map<std::string, Scores> scores) const {
    for (const auto &[name, values] : scores) {
        if (values.size() != attempts_.size()) {
            throw ConsistencyError(fmt::format("instance '{}': metric '{}' has {} scores for {} attempts", id_, name, values.size(),
                                               attempts_.size()));
        }
    }
    auto copy     = clone();
    copy->scores_ = std::move(scores);
    return copy;
}

std::unique_ptr<Instance> Instance::cleared() const {
    auto copy = clone();
    copy->attempts_.clear();
    copy->scores_.clear();
    return copy;
}

QaInstance::QaInstance(std::string id, std::string question, std::string answer)
    : Instance(std::move(id)), question_(std::move(question)), answer_(std::move(answer)) {}

void QaInstance::write_fields(boost::json::object &out) const {
    out["question"] = question_;
    out["answer"]   = answer_;
}

std::unique_ptr<Instance> QaInstance::from_fields(const boost::json::object &fields) {
    const auto *id       = fields.if_contains("id");
    const auto *question = fields.if_contains("question");
    const auto *answer   = fields.if_contains("answer");
    if (id == nullptr || !id->is_string())
        throw ArtifactCorruptedError("QaInstance record has no string `id`");
    if (question == nullptr || !question->is_string() || answer == nullptr || !answer->is_string()) {
        throw ArtifactCorruptedError(fmt::format("QaInstance '{}' needs string `question` and `answer` fields",
                                                 std::string_view(id->as_string())));
    }
    return std::make_unique<QaInstance>(std::string(id->as_string()), std::string(question->as_string()),
                                        std::string(answer->as_string()));
}

std::unique_ptr<Instance> QaInstance::clone() const { return std::unique_ptr<Instance>(new QaInstance(*this)); }

ListSource::ListSource(InstanceList instances) : instances_(std::move(instances)) {
    index_by_id_.reserve(instances_.size());
    for (std::size_t i = 0; i < instances_.size(); ++i) {
        if (!instances_[i])
            throw ConsistencyError(fmt::format("instance source entry {} is null", i));
        if (!index_by_id_.emplace(instances_[i]->id(), i).second)
            throw ConsistencyError(fmt::format("duplicate instance id '{}'", instances_[i]->id()));
    }
}

InstancePtr ListSource::get(std::size_t index) const {
    if (index >= instances_.size())
        throw ConfigurationError(fmt::format("instance index {} out of range (source has {})", index, instances_.size()));
    return instances_[index];
}

InstancePtr ListSource::get(std::string_view id) const {
    auto it = index_by_id_.find(std::string(id));
    if (it == index_by_id_.end())
        throw ConfigurationError(fmt::format("unknown instance id '{}'", id));
    return instances_[it->second];
}

} // namespace benchkit
