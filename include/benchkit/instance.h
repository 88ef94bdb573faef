#pragma once

#include "benchkit/types.h"

#include <boost/json.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace benchkit {

// One labeled unit of benchmark work plus everything recorded about it.
//
// Instances are immutable once a stage holds them. The derivation helpers
// (`with_attempts`, `with_scores`, `cleared`) deep-copy through `clone()` and
// return a fresh, exclusively owned object; the source is never touched.
//
// Concrete types provide a ground truth, a stable registry tag used by the
// artifact codec, and their own JSON fields.
class Instance {
  public:
    explicit Instance(std::string id);
    virtual ~Instance() = default;

    Instance &operator=(const Instance &) = delete;

    const std::string                    &id() const { return id_; }
    const std::vector<Attempt>           &attempts() const { return attempts_; }
    const std::map<std::string, Scores>  &scores() const { return scores_; }
    const Scores                         *scores_for(std::string_view metric_name) const;

    std::vector<std::optional<std::string>> responses() const;
    std::vector<std::optional<double>>      runtimes() const;
    std::vector<AttemptStatus>              statuses() const;
    UsageCounters                           total_usage() const;

    virtual std::string_view           type_tag() const     = 0;
    virtual std::optional<std::string> ground_truth() const = 0;
    virtual void                       write_fields(boost::json::object &out) const = 0;

    std::unique_ptr<Instance> with_attempts(std::vector<Attempt> attempts) const;
    std::unique_ptr<Instance> with_scores(std::map<std::string, Scores> scores) const;
    // Copy without attempts and scores.
    std::unique_ptr<Instance> cleared() const;

  protected:
    Instance(const Instance &) = default;

    virtual std::unique_ptr<Instance> clone() const = 0;

  private:
    std::string                   id_;
    std::vector<Attempt>          attempts_;
    std::map<std::string, Scores> scores_;
};

using InstancePtr  = std::shared_ptr<const Instance>;
using InstanceList = std::vector<InstancePtr>;

// Question/answer instance: the ground truth is the expected answer text.
class QaInstance final : public Instance {
  public:
    static constexpr std::string_view kTypeTag = "QaInstance";

    QaInstance(std::string id, std::string question, std::string answer);

    const std::string &question() const { return question_; }
    const std::string &answer() const { return answer_; }

    std::string_view           type_tag() const override { return kTypeTag; }
    std::optional<std::string> ground_truth() const override { return answer_; }
    void                       write_fields(boost::json::object &out) const override;

    static std::unique_ptr<Instance> from_fields(const boost::json::object &fields);

  protected:
    std::unique_ptr<Instance> clone() const override;

  private:
    std::string question_;
    std::string answer_;
};

// Indexable source of unexecuted instances. Only this contract is consumed;
// how instances are fetched is up to the implementation.
class InstanceSource {
  public:
    virtual ~InstanceSource() = default;

    virtual std::size_t size() const                      = 0;
    virtual InstancePtr get(std::size_t index) const      = 0;
    virtual InstancePtr get(std::string_view id) const    = 0;
};

class ListSource final : public InstanceSource {
  public:
    explicit ListSource(InstanceList instances);

    std::size_t size() const override { return instances_.size(); }
    InstancePtr get(std::size_t index) const override;
    InstancePtr get(std::string_view id) const override;

  private:
    InstanceList                                 instances_;
    std::unordered_map<std::string, std::size_t> index_by_id_;
};

} // namespace benchkit
