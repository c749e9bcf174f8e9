#include "git/git_client.hpp"

#include <algorithm>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <fmt/format.h>
#include <mutex>
#include <thread>
#include <utility>

#include "execution_context.hpp"
#include "my_error_codes.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace updatectrl::git {

std::size_t MultiPullSummary::succeeded() const {
  return static_cast<std::size_t>(
      std::count_if(results.begin(), results.end(),
                    [](const PullResult &r) { return !r.error; }));
}

std::size_t MultiPullSummary::failed() const {
  return results.size() - succeeded();
}

std::optional<Error> MultiPullSummary::to_error() const {
  if (aborted) {
    return aborted;
  }
  std::vector<std::string> failed_repos;
  for (const auto &r : results) {
    if (r.error) {
      failed_repos.push_back(r.repo.string());
    }
  }
  if (failed_repos.empty()) {
    return std::nullopt;
  }
  return make_error(
      my_errors::GIT::PULL_FAILED,
      fmt::format("{} of {} repositories failed to update: {}",
                  failed_repos.size(), results.size(),
                  stringutil::join(failed_repos, ", ")));
}

GitClient::GitClient(std::optional<fs::path> git_binary,
                     std::size_t max_concurrency)
    : git_binary_(std::move(git_binary)), max_concurrency_(max_concurrency) {}

std::size_t GitClient::worker_count(std::size_t jobs) const {
  std::size_t workers = max_concurrency_;
  if (workers == 0) {
    workers = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    workers = std::min(workers, kMaxWorkers);
  }
  return std::max<std::size_t>(1, std::min(workers, jobs));
}

std::optional<Error> GitClient::pull(const fs::path &repo,
                                     const ExecutionContext &ctx) {
  if (!git_binary_) {
    return requirement_missing("git");
  }

  auto result = ctx.execute(*git_binary_)
                    .args({"-C", repo.string(), "pull", "--ff-only"})
                    .env("GIT_TERMINAL_PROMPT", "0")
                    .output_checked();
  if (result.error) {
    ctx.output().line(fmt::format("  FAILED   {}", repo.string()));
    BOOST_LOG_SEV(app_logger(), trivial::warning)
        << "git pull failed for " << repo.string() << ": "
        << result.error->what;
    return result.error;
  }

  if (!result.dry_run) {
    const bool up_to_date =
        result.stdout_data.find("Already up to date") != std::string::npos ||
        result.stdout_data.find("Already up-to-date") != std::string::npos;
    ctx.output().line(fmt::format("  {} {}",
                                  up_to_date ? "Up-to-date" : "Updated   ",
                                  repo.string()));
  }
  return std::nullopt;
}

MultiPullSummary GitClient::multi_pull(const Repositories &repos,
                                       const ExecutionContext &ctx) {
  MultiPullSummary summary;
  if (repos.empty()) {
    return summary;
  }
  if (!git_binary_) {
    summary.aborted = requirement_missing("git");
    return summary;
  }

  auto paths = repos.paths();
  const std::size_t workers = worker_count(paths.size());
  BOOST_LOG_SEV(app_logger(), trivial::debug)
      << "Pulling " << paths.size() << " repositories with " << workers
      << " workers";

  std::mutex results_mutex;
  {
    boost::asio::thread_pool pool(workers);
    for (const auto &path : paths) {
      boost::asio::post(pool, [this, &ctx, &summary, &results_mutex, path]() {
        PullResult r{path, std::nullopt};
        try {
          r.error = pull(path, ctx);
        } catch (const std::exception &ex) {
          r.error = make_error(my_errors::GENERAL::UNEXPECTED_RESULT,
                               fmt::format("pulling {} threw: {}",
                                           path.string(), ex.what()));
        }
        std::lock_guard<std::mutex> lock(results_mutex);
        summary.results.push_back(std::move(r));
      });
    }
    pool.join();
  }

  std::sort(summary.results.begin(), summary.results.end(),
            [](const PullResult &a, const PullResult &b) {
              return a.repo < b.repo;
            });
  return summary;
}

} // namespace updatectrl::git
