#include "routing/SessionAffinity.hpp"

#include <trantor/utils/Logger.h>

#include <cctype>
#include <set>

namespace llmgate::routing {
namespace {

std::set<std::string> tokenSet(std::string_view text) {
    std::set<std::string> tokens;
    std::string current;
    for (char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            if (!current.empty()) {
                tokens.insert(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (!current.empty()) {
        tokens.insert(std::move(current));
    }
    return tokens;
}

}  // namespace

SessionAffinity::SessionAffinity(cache::SharedCache &cache) : cache_(cache) {}

AffinityDecision SessionAffinity::observe(const std::string &sessionId,
                                          const std::string &prompt,
                                          double threshold,
                                          std::chrono::seconds ttl) {
    AffinityDecision decision;
    if (sessionId.empty()) {
        return decision;
    }

    try {
        const auto previous = cache_.get(promptKey(sessionId));
        cache_.set(promptKey(sessionId), prompt, ttl);
        if (!previous.has_value()) {
            return decision;
        }

        decision.similarity = similarity(*previous, prompt);
        if (decision.similarity > threshold) {
            if (auto backend = cache_.get(backendKey(sessionId)); backend.has_value() && !backend->empty()) {
                decision.pinnedBackend = std::move(*backend);
            }
        }
    } catch (const std::exception &ex) {
        LOG_WARN << "Session affinity lookup failed for session " << sessionId << ": " << ex.what();
        return AffinityDecision{};
    }
    return decision;
}

void SessionAffinity::pin(const std::string &sessionId, const std::string &backend, std::chrono::seconds ttl) {
    if (sessionId.empty()) {
        return;
    }
    try {
        cache_.set(backendKey(sessionId), backend, ttl);
    } catch (const std::exception &ex) {
        LOG_WARN << "Session affinity pin failed for session " << sessionId << ": " << ex.what();
    }
}

void SessionAffinity::release(const std::string &sessionId) {
    try {
        cache_.erase(backendKey(sessionId));
    } catch (const std::exception &ex) {
        LOG_WARN << "Session affinity release failed for session " << sessionId << ": " << ex.what();
    }
}

double SessionAffinity::similarity(std::string_view lhs, std::string_view rhs) {
    const auto left = tokenSet(lhs);
    const auto right = tokenSet(rhs);
    if (left.empty() || right.empty()) {
        return 0.0;
    }

    std::size_t shared = 0;
    for (const auto &token : left) {
        shared += right.count(token);
    }
    const auto unionSize = left.size() + right.size() - shared;
    return static_cast<double>(shared) / static_cast<double>(unionSize);
}

std::string SessionAffinity::promptKey(const std::string &sessionId) {
    return "session:" + sessionId + ":last_prompt";
}

std::string SessionAffinity::backendKey(const std::string &sessionId) {
    return "session:" + sessionId + ":model";
}

}  // namespace llmgate::routing
