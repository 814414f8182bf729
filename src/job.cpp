#include "job.hpp"
#include <algorithm>
#include <format>

namespace {

bool isIdentifierStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool isIdentifierChar(char c) {
    return isIdentifierStart(c) || (c >= '0' && c <= '9') || c == '$';
}

bool isIdentifier(std::string_view part) {
    if (part.empty() || !isIdentifierStart(part.front())) {
        return false;
    }
    return std::all_of(part.begin(), part.end(), isIdentifierChar);
}

} // namespace

std::string_view objectKindName(ObjectKind kind) {
    return kind == ObjectKind::Table ? "table" : "schema";
}

std::optional<ObjectKind> parseObjectKind(std::string_view name) {
    if (name == "table") {
        return ObjectKind::Table;
    }
    if (name == "schema") {
        return ObjectKind::Schema;
    }
    return std::nullopt;
}

bool isValidObjectName(std::string_view name) {
    const auto dot = name.find('.');
    if (dot == std::string_view::npos) {
        return isIdentifier(name);
    }
    return isIdentifier(name.substr(0, dot)) && isIdentifier(name.substr(dot + 1));
}

std::string JobContext::label() const {
    return std::format("{}:{}", jobId, objectName);
}

std::size_t AggregateResult::succeeded() const {
    return static_cast<std::size_t>(
        std::count_if(outcomes.begin(), outcomes.end(), [](const JobOutcome& o) { return o.success; }));
}

std::string AggregateResult::summary(const std::string& moveType) const {
    std::string text = std::format("{}: {} attempted, {} succeeded, {} failed, {} skipped",
                                   moveType, attempted(), succeeded(), failed(), skipped);
    for (const auto& outcome : outcomes) {
        if (!outcome.success) {
            text += std::format("\n  job {} ({}) failed in state {}: {}",
                                outcome.jobId, outcome.objectName, outcome.finalState, outcome.error);
        }
    }
    return text;
}
