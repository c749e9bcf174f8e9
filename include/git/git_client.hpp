#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "git/repositories.hpp"
#include "update_error.hpp"

namespace updatectrl {

class ExecutionContext;

namespace git {

struct PullResult {
  fs::path repo;
  std::optional<Error> error;
};

struct MultiPullSummary {
  // Sorted by repository path regardless of completion order.
  std::vector<PullResult> results;
  // Set when nothing could be attempted (e.g. git is not installed).
  std::optional<Error> aborted;

  std::size_t succeeded() const;
  std::size_t failed() const;
  // nullopt when every repository updated.
  std::optional<Error> to_error() const;
};

class IGitClient {
public:
  virtual ~IGitClient() = default;

  virtual std::optional<Error> pull(const fs::path &repo,
                                    const ExecutionContext &ctx) = 0;
  // Updates every repository independently; one failure never stops the
  // others. An empty set returns immediately without touching git.
  virtual MultiPullSummary multi_pull(const Repositories &repos,
                                      const ExecutionContext &ctx) = 0;
};

// Lifetime: owned by the entrypoint next to the ExecutionContext that
// borrows it.
class GitClient : public IGitClient {
public:
  // `max_concurrency` 0 means one worker per CPU, capped at kMaxWorkers.
  GitClient(std::optional<fs::path> git_binary, std::size_t max_concurrency);

  static constexpr std::size_t kMaxWorkers = 8;

  std::optional<Error> pull(const fs::path &repo,
                            const ExecutionContext &ctx) override;
  MultiPullSummary multi_pull(const Repositories &repos,
                              const ExecutionContext &ctx) override;

  std::size_t worker_count(std::size_t jobs) const;

private:
  std::optional<fs::path> git_binary_;
  std::size_t max_concurrency_;
};

} // namespace git

using git::IGitClient;

} // namespace updatectrl
