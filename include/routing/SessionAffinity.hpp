#pragma once

#include "cache/SharedCache.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace llmgate::routing {

struct AffinityDecision {
    double similarity{0.0};
    // Set only when the prompt correlates with the previous one and a backend is pinned.
    std::optional<std::string> pinnedBackend;
};

// Remembers each session's last prompt and serving backend in the shared cache. Advisory only:
// cache failures degrade to "no affinity".
class SessionAffinity {
   public:
    explicit SessionAffinity(cache::SharedCache &cache);

    // Compares `prompt` with the session's previous prompt, then stores `prompt` as the new last prompt.
    AffinityDecision observe(const std::string &sessionId,
                             const std::string &prompt,
                             double threshold,
                             std::chrono::seconds ttl);

    void pin(const std::string &sessionId, const std::string &backend, std::chrono::seconds ttl);
    void release(const std::string &sessionId);

    // Jaccard index of the lowercase whitespace-separated token sets; 0 when either side is empty.
    static double similarity(std::string_view lhs, std::string_view rhs);

    static std::string promptKey(const std::string &sessionId);
    static std::string backendKey(const std::string &sessionId);

   private:
    cache::SharedCache &cache_;
};

}  // namespace llmgate::routing
