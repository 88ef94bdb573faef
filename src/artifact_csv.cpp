#include "benchkit/artifact.h"

#include "benchkit/log.h"

#include <fmt/format.h>

#include <fstream>
#include <map>
#include <stdexcept>
#include <type_traits>
#include <vector>

namespace benchkit {

namespace {

// Header columns in first-seen order plus one sparse row per instance.
struct Table {
    std::vector<std::string>                        columns;
    std::map<std::string, std::size_t>              index;
    std::vector<std::map<std::size_t, std::string>> rows;

    std::size_t column(const std::string &name) {
        auto it = index.find(name);
        if (it == index.end()) {
            it = index.emplace(name, columns.size()).first;
            columns.push_back(name);
        }
        return it->second;
    }

    void set(std::map<std::size_t, std::string> &row, const std::string &name, std::string value) {
        row[column(name)] = std::move(value);
    }
};

std::string score_cell(const Score &score) {
    if (!score)
        return {};
    return std::visit(
        [](const auto &v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>)
                return v ? "true" : "false";
            else if constexpr (std::is_same_v<T, double>)
                return fmt::format("{}", v);
            else
                return v;
        },
        *score);
}

// Metric columns must not overwrite the attempt's own columns.
bool collides(const Attempt &attempt, const std::string &metric) {
    return metric == "response" || metric == "status" || metric == "runtime" || attempt.usage().count(metric) != 0;
}

void append_line(std::string &out, const std::vector<std::string> &cells) {
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (i != 0)
            out.push_back(',');
        out += csv_escape(cells[i]);
    }
    out += "\r\n";
}

} // namespace

std::string csv_escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos)
        return std::string(field);
    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char ch : field) {
        if (ch == '"')
            out.push_back('"');
        out.push_back(ch);
    }
    out.push_back('"');
    return out;
}

std::string to_csv(const StageBase &stage) {
    Table table;
    table.column("id");
    table.column("ground_truth");

    for (const auto &instance : stage.instances()) {
        auto &row = table.rows.emplace_back();
        table.set(row, "id", instance->id());
        table.set(row, "ground_truth", instance->ground_truth().value_or(""));

        const auto &attempts = instance->attempts();
        for (std::size_t i = 0; i < attempts.size(); ++i) {
            const Attempt    &attempt = attempts[i];
            const std::string prefix  = fmt::format("attempt_{}_", i + 1);
            table.set(row, prefix + "response", attempt.response().value_or(""));
            table.set(row, prefix + "status", std::string(to_string(attempt.status())));
            table.set(row, prefix + "runtime", attempt.runtime() ? fmt::format("{:.2f}", *attempt.runtime()) : std::string());
            for (const auto &[counter, value] : attempt.usage())
                table.set(row, prefix + counter, fmt::format("{}", value));
        }

        for (const auto &[metric, scores] : instance->scores()) {
            for (std::size_t i = 0; i < scores.size(); ++i) {
                std::string name = fmt::format("attempt_{}_{}", i + 1, metric);
                if (i < attempts.size() && collides(attempts[i], metric))
                    name += "_score";
                table.set(row, name, score_cell(scores[i]));
            }
        }
    }

    std::string out;
    append_line(out, table.columns);
    for (const auto &row : table.rows) {
        std::vector<std::string> cells(table.columns.size());
        for (const auto &[column, value] : row)
            cells[column] = value;
        append_line(out, cells);
    }
    return out;
}

void write_csv(const StageBase &stage, const std::string &path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::runtime_error(fmt::format("cannot open '{}' for writing", path));
    out << to_csv(stage);
    out.flush();
    if (!out)
        throw std::runtime_error(fmt::format("failed writing '{}'", path));
    log::info("wrote {} rows to {}", stage.instances().size(), path);
}

} // namespace benchkit
