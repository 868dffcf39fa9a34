#include "consistency_checker.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>

namespace memweave {

const char* commit_status_to_string(CommitStatus s) {
    switch (s) {
        case CommitStatus::Committed:        return "committed";
        case CommitStatus::SkippedDuplicate: return "skipped_duplicate";
        case CommitStatus::Flagged:          return "flagged";
        case CommitStatus::Rejected:         return "rejected";
    }
    return "rejected";
}

std::mutex& NamespaceLocks::for_namespace(const std::string& ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = locks_[ns];
    if (!slot) slot = std::make_unique<std::mutex>();
    return *slot;
}

static CommitResult rejected(ErrorKind kind, const std::string& message) {
    CommitResult r;
    r.status = CommitStatus::Rejected;
    r.error = kind;
    r.message = message;
    return r;
}

static bool same_source(const SourceRef& a, const SourceRef& b) {
    return a.type == b.type && a.role == b.role && a.lang == b.lang &&
           a.content == b.content && a.node_ids == b.node_ids;
}

ConsistencyChecker::ConsistencyChecker(GraphStore& store, Embedder& embedder,
                                       HybridRetriever& retriever, NliClassifier& nli,
                                       const CheckerConfig& config,
                                       const PerspectiveRules& rules)
    : store_(store), embedder_(embedder), retriever_(retriever), nli_(nli),
      config_(config), rules_(rules) {}

std::string ConsistencyChecker::adjusted_text(const MemoryNode& candidate) const {
    const SourceRef* source = primary_chat_source(candidate);
    if (!source) return candidate.text;
    return rules_.adjust(candidate.text, source->role, source->lang);
}

CommitResult ConsistencyChecker::check_and_commit(MemoryNode candidate, const std::string& ns,
                                                  const std::atomic<bool>* cancel) {
    if (candidate.id.empty()) candidate.id = generate_id();
    uint64_t now = epoch_seconds();
    if (candidate.created_at == 0) candidate.created_at = now;
    if (candidate.updated_at == 0) candidate.updated_at = candidate.created_at;
    candidate.status = NodeStatus::Activated;
    candidate.conflict_with.clear();

    std::string violation = validate_node(candidate);
    if (!violation.empty()) {
        std::cerr << "[checker] Rejected candidate (ns=" << ns << "): " << violation << "\n";
        return rejected(ErrorKind::InvariantViolation, violation);
    }

    bool degraded = false;

    // 1. Perspective adjustment and embeddings
    std::string adjusted = adjusted_text(candidate);
    bool need_node_embedding = candidate.embedding.empty();
    bool need_query_embedding = adjusted != candidate.text;
    Embedding query;
    if (need_node_embedding || need_query_embedding) {
        std::vector<std::string> texts;
        if (need_node_embedding) texts.push_back(candidate.text);
        if (need_query_embedding) texts.push_back(adjusted);
        try {
            auto vectors = embedder_.embed_batch(texts);
            if (vectors.size() != texts.size()) {
                throw CollaboratorError(ErrorKind::MalformedResponse,
                                        "embedder returned " + std::to_string(vectors.size()) +
                                        " vectors for " + std::to_string(texts.size()) + " texts");
            }
            if (need_node_embedding) candidate.embedding = vectors.front();
            query = need_query_embedding ? vectors.back() : candidate.embedding;
        } catch (const CollaboratorError& e) {
            std::cerr << "[checker] Embedding failed (ns=" << ns << ", op=check_and_commit): "
                      << e.what() << "\n";
            if (need_node_embedding) {
                return rejected(ErrorKind::CollaboratorUnavailable,
                                std::string("no embedding: ") + e.what());
            }
            query = candidate.embedding;
            degraded = true;
        }
    } else {
        query = candidate.embedding;
    }
    if (cancel && cancel->load()) return rejected(ErrorKind::Cancelled, "cancelled");

    // 2. Neighbors in the candidate's memory type
    ParsedTaskGoal goal;
    if (!candidate.key.empty()) goal.keys.push_back(candidate.key);
    goal.tags.assign(candidate.tags.begin(), candidate.tags.end());
    goal.goal_type = GoalType::Other;

    auto recall = retriever_.retrieve(goal, query, candidate.memory_type, config_.top_k,
                                      ns, cancel);
    switch (recall.status) {
        case RetrievalStatus::Cancelled:
            return rejected(ErrorKind::Cancelled, "cancelled");
        case RetrievalStatus::Unavailable:
            return on_collaborator_failure(candidate, ns, "neighbor retrieval unavailable",
                                           recall.error);
        case RetrievalStatus::Degraded:
            degraded = true;
            break;
        case RetrievalStatus::Ok:
        case RetrievalStatus::NoMatches:
            break;
    }

    std::vector<MemoryNode> neighbors;
    for (auto& node : recall.nodes) {
        if (node.id != candidate.id) neighbors.push_back(std::move(node));
    }
    if (neighbors.empty()) return commit(candidate, ns, degraded);

    // 3. NLI against neighbor texts, each in the perspective of its own source
    std::vector<std::string> targets;
    targets.reserve(neighbors.size());
    for (const auto& n : neighbors) targets.push_back(adjusted_text(n));
    auto batch = nli_.compare_one_to_many(adjusted, targets);
    if (!batch.ok()) {
        if (!config_.fail_open) {
            std::cerr << "[checker] NLI failed (ns=" << ns << "), rejecting: "
                      << batch.error_message << "\n";
            return rejected(ErrorKind::CollaboratorUnavailable,
                            "NLI failed: " + batch.error_message);
        }
        std::cerr << "[checker] NLI failed (ns=" << ns << "), continuing degraded: "
                  << batch.error_message << "\n";
        degraded = true;
    }
    if (cancel && cancel->load()) return rejected(ErrorKind::Cancelled, "cancelled");

    // 4. Decide. Labels that could not be classified are Unrelated.
    size_t n = std::min(batch.results.size(), neighbors.size());
    for (size_t i = 0; i < n; ++i) {
        if (batch.results[i] == NliResult::Duplicate) {
            return skip(candidate, neighbors[i], ns, degraded);
        }
    }
    for (size_t i = 0; i < n; ++i) {
        if (batch.results[i] == NliResult::Contradiction) {
            return flag(candidate, neighbors[i], ns, degraded);
        }
    }
    return commit(candidate, ns, degraded);
}

CommitResult ConsistencyChecker::commit(MemoryNode& candidate, const std::string& ns,
                                        bool degraded) {
    try {
        if (!store_.add_node(candidate, ns)) {
            std::cerr << "[checker] Store rejected node " << candidate.id
                      << " (ns=" << ns << ")\n";
            return rejected(ErrorKind::InvariantViolation,
                            "store rejected node (dimension mismatch or duplicate id)");
        }
    } catch (const CollaboratorError& e) {
        std::cerr << "[checker] Store unavailable (ns=" << ns << ", op=add_node): "
                  << e.what() << "\n";
        return rejected(ErrorKind::CollaboratorUnavailable, e.what());
    }
    CommitResult r;
    r.status = CommitStatus::Committed;
    r.node_id = candidate.id;
    r.degraded = degraded;
    if (degraded) r.message = "committed without a complete consistency check";
    return r;
}

CommitResult ConsistencyChecker::flag(MemoryNode& candidate, const MemoryNode& existing,
                                      const std::string& ns, bool degraded) {
    candidate.conflict_with = existing.id;
    MemoryEdge edge{candidate.id, existing.id, RelationType::Contradicts, 1.0};
    try {
        if (!store_.commit_artifact(candidate, {edge}, ns)) {
            std::cerr << "[checker] Store rejected flagged node " << candidate.id
                      << " (ns=" << ns << ")\n";
            return rejected(ErrorKind::InvariantViolation, "store rejected flagged node");
        }
    } catch (const CollaboratorError& e) {
        std::cerr << "[checker] Store unavailable (ns=" << ns << ", op=commit_artifact): "
                  << e.what() << "\n";
        return rejected(ErrorKind::CollaboratorUnavailable, e.what());
    }
    std::cerr << "[checker] " << candidate.id << " contradicts " << existing.id
              << " (ns=" << ns << ")\n";
    CommitResult r;
    r.status = CommitStatus::Flagged;
    r.node_id = candidate.id;
    r.existing_id = existing.id;
    r.degraded = degraded;
    r.message = "contradicts: " + existing.text;
    return r;
}

CommitResult ConsistencyChecker::skip(const MemoryNode& candidate, const MemoryNode& existing,
                                      const std::string& ns, bool degraded) {
    CommitResult r;
    r.status = CommitStatus::SkippedDuplicate;
    r.existing_id = existing.id;
    r.degraded = degraded;
    r.message = "duplicate of: " + existing.text;
    if (!config_.merge_provenance || candidate.sources.empty()) return r;

    try {
        auto current = store_.get_node(existing.id, ns);
        if (!current) return r;
        bool changed = false;
        for (const auto& src : candidate.sources) {
            bool known = std::any_of(current->sources.begin(), current->sources.end(),
                                     [&](const SourceRef& s) { return same_source(s, src); });
            if (!known) {
                current->sources.push_back(src);
                changed = true;
            }
        }
        if (changed) {
            current->updated_at = std::max(current->updated_at, candidate.updated_at);
            if (!store_.update_node(*current, ns)) {
                std::cerr << "[checker] Provenance merge rejected for " << existing.id
                          << " (ns=" << ns << ")\n";
            }
        }
    } catch (const CollaboratorError& e) {
        std::cerr << "[checker] Provenance merge failed (ns=" << ns << ", op=update_node): "
                  << e.what() << "\n";
    }
    return r;
}

CommitResult ConsistencyChecker::on_collaborator_failure(MemoryNode& candidate,
                                                         const std::string& ns,
                                                         const std::string& what,
                                                         ErrorKind kind) {
    if (kind == ErrorKind::None) kind = ErrorKind::CollaboratorUnavailable;
    if (!config_.fail_open) {
        std::cerr << "[checker] " << what << " (ns=" << ns << "), rejecting\n";
        return rejected(ErrorKind::CollaboratorUnavailable, what);
    }
    std::cerr << "[checker] " << what << " (ns=" << ns << "), committing degraded\n";
    auto r = commit(candidate, ns, true);
    if (r.status == CommitStatus::Committed) r.error = kind;
    return r;
}

} // namespace memweave
