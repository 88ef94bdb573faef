#pragma once

#include <optional>
#include <string>
#include <vector>

namespace benchkit {

struct SpecOptions {
    std::string                name; // generated when empty
    std::vector<std::string>   instance_ids;
    int                        n_attempts = 1;
    std::optional<int>         n_instance;
    std::optional<double>      timeout_s;
    std::optional<std::string> logs_filepath;
    std::optional<double>      execution_time_s;
    std::optional<double>      evaluation_time_s;
};

// Configuration and bookkeeping for one benchmark run. Validated on
// construction; every update returns a new value.
class Spec {
  public:
    Spec();
    explicit Spec(SpecOptions options);

    const std::string                &name() const { return options_.name; }
    const std::vector<std::string>   &instance_ids() const { return options_.instance_ids; }
    int                               n_attempts() const { return options_.n_attempts; }
    const std::optional<int>         &n_instance() const { return options_.n_instance; }
    const std::optional<double>      &timeout() const { return options_.timeout_s; }
    const std::optional<std::string> &logs_filepath() const { return options_.logs_filepath; }
    const std::optional<double>      &execution_time() const { return options_.execution_time_s; }
    const std::optional<double>      &evaluation_time() const { return options_.evaluation_time_s; }

    const SpecOptions &options() const { return options_; }

    [[nodiscard]] Spec with_execution_time(double seconds) const;
    [[nodiscard]] Spec with_evaluation_time(double seconds) const;

    friend bool operator==(const Spec &lhs, const Spec &rhs);

  private:
    SpecOptions options_;
};

std::string generate_benchmark_name();

} // namespace benchkit
