#pragma once

#include "checks.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Outcome of one round of checks: check name -> error text, or nullopt when
// the check passed.
struct Evaluation {
    std::map<std::string, std::optional<std::string>> results;

    bool ok() const;
    std::vector<std::string> failing_checks() const;

    // Failing checks only, or every check with "OK" for the passing ones
    // when full is set.
    nlohmann::json to_json(bool full) const;
};

class HealthRegistry {
public:
    // Throws std::invalid_argument when the name is already registered in
    // the same category.
    void add_liveness_check(const std::string& name, Check check);
    void add_readiness_check(const std::string& name, Check check);

    Evaluation evaluate_liveness() const;
    Evaluation evaluate_readiness() const;
    // Readiness and liveness together: a process that is not live is not
    // ready either. A name present in both categories reports its failure
    // if either check fails.
    Evaluation evaluate_ready() const;

    std::vector<std::string> liveness_check_names() const;
    std::vector<std::string> readiness_check_names() const;

private:
    std::map<std::string, Check> liveness_checks_;
    std::map<std::string, Check> readiness_checks_;

    static void add_check(std::map<std::string, Check>& checks, const char* category,
                          const std::string& name, Check check);
    using CheckList = std::vector<std::pair<std::string, const Check*>>;

    static void collect(const std::map<std::string, Check>& checks, CheckList& out);
    static Evaluation evaluate(const CheckList& checks);
};
