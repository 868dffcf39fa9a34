#pragma once
#include "memory.hpp"
#include "errors.hpp"
#include "config.hpp"
#include "graph_store.hpp"
#include "embedder.hpp"
#include "retriever.hpp"
#include "nli.hpp"
#include "perspective.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace memweave {

enum class CommitStatus { Committed, SkippedDuplicate, Flagged, Rejected };

const char* commit_status_to_string(CommitStatus s);

struct CommitResult {
    CommitStatus status = CommitStatus::Rejected;
    std::string node_id;       // id of the written node (Committed / Flagged)
    std::string existing_id;   // the duplicate or the conflicting node
    bool degraded = false;     // written without a full consistency check
    ErrorKind error = ErrorKind::None;
    std::string message;
};

// One mutex per namespace. Writers hold the namespace's lock around
// check_and_commit so concurrent writes to the same namespace serialize.
class NamespaceLocks {
public:
    std::mutex& for_namespace(const std::string& ns);

private:
    std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<std::mutex>> locks_;
};

// Decides whether a candidate fact is a duplicate, a contradiction or new,
// and writes it accordingly. The text of existing nodes is never modified.
class ConsistencyChecker {
public:
    ConsistencyChecker(GraphStore& store, Embedder& embedder, HybridRetriever& retriever,
                       NliClassifier& nli, const CheckerConfig& config,
                       const PerspectiveRules& rules);

    // The candidate gets an id and timestamps when it has none, and is
    // embedded when its embedding is empty. Not safe to call concurrently
    // for the same namespace; see NamespaceLocks.
    CommitResult check_and_commit(MemoryNode candidate, const std::string& ns,
                                  const std::atomic<bool>* cancel = nullptr);

    // Candidate text rewritten to third person for comparison.
    std::string adjusted_text(const MemoryNode& candidate) const;

private:
    CommitResult commit(MemoryNode& candidate, const std::string& ns, bool degraded);
    CommitResult flag(MemoryNode& candidate, const MemoryNode& existing,
                      const std::string& ns, bool degraded);
    CommitResult skip(const MemoryNode& candidate, const MemoryNode& existing,
                      const std::string& ns, bool degraded);
    // Fail-open commits degraded; fail-closed rejects.
    CommitResult on_collaborator_failure(MemoryNode& candidate, const std::string& ns,
                                         const std::string& what, ErrorKind kind);

    GraphStore& store_;
    Embedder& embedder_;
    HybridRetriever& retriever_;
    NliClassifier& nli_;
    CheckerConfig config_;
    const PerspectiveRules& rules_;
};

} // namespace memweave
