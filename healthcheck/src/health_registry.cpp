#include "health_registry.hpp"
#include <future>
#include <stdexcept>
#include <spdlog/spdlog.h>

bool Evaluation::ok() const {
    for (const auto& [name, error] : results) {
        if (error) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> Evaluation::failing_checks() const {
    std::vector<std::string> names;
    for (const auto& [name, error] : results) {
        if (error) {
            names.push_back(name);
        }
    }
    return names;
}

nlohmann::json Evaluation::to_json(bool full) const {
    nlohmann::json body = nlohmann::json::object();
    for (const auto& [name, error] : results) {
        if (error) {
            body[name] = *error;
        } else if (full) {
            body[name] = "OK";
        }
    }
    return body;
}

void HealthRegistry::add_check(std::map<std::string, Check>& checks, const char* category,
                               const std::string& name, Check check) {
    if (!checks.emplace(name, std::move(check)).second) {
        throw std::invalid_argument(std::string("duplicate ") + category + " check: " + name);
    }
}

void HealthRegistry::add_liveness_check(const std::string& name, Check check) {
    add_check(liveness_checks_, "liveness", name, std::move(check));
}

void HealthRegistry::add_readiness_check(const std::string& name, Check check) {
    add_check(readiness_checks_, "readiness", name, std::move(check));
}

void HealthRegistry::collect(const std::map<std::string, Check>& checks, CheckList& out) {
    for (const auto& entry : checks) {
        out.emplace_back(entry.first, &entry.second);
    }
}

Evaluation HealthRegistry::evaluate_liveness() const {
    CheckList checks;
    collect(liveness_checks_, checks);
    return evaluate(checks);
}

Evaluation HealthRegistry::evaluate_readiness() const {
    CheckList checks;
    collect(readiness_checks_, checks);
    return evaluate(checks);
}

Evaluation HealthRegistry::evaluate_ready() const {
    CheckList checks;
    collect(readiness_checks_, checks);
    collect(liveness_checks_, checks);
    return evaluate(checks);
}

Evaluation HealthRegistry::evaluate(const CheckList& checks) {
    // All checks run at once; the slowest timeout bounds the round.
    std::vector<std::pair<std::string, std::future<std::optional<std::string>>>> pending;
    for (const auto& entry : checks) {
        const Check* check = entry.second;
        pending.emplace_back(entry.first, std::async(std::launch::async, [check]() -> std::optional<std::string> {
            try {
                (*check)();
                return std::nullopt;
            } catch (const std::exception& e) {
                return std::string(e.what());
            }
        }));
    }

    Evaluation evaluation;
    for (auto& [name, result] : pending) {
        auto error = result.get();
        auto& slot = evaluation.results[name];
        if (error) {
            spdlog::warn("Health check {} failed: {}", name, *error);
            slot = std::move(error);
        }
    }

    spdlog::debug("Evaluated {} checks, {} failing", evaluation.results.size(),
                  evaluation.failing_checks().size());
    return evaluation;
}

std::vector<std::string> HealthRegistry::liveness_check_names() const {
    std::vector<std::string> names;
    for (const auto& entry : liveness_checks_) {
        names.push_back(entry.first);
    }
    return names;
}

std::vector<std::string> HealthRegistry::readiness_check_names() const {
    std::vector<std::string> names;
    for (const auto& entry : readiness_checks_) {
        names.push_back(entry.first);
    }
    return names;
}
