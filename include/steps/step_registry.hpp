#pragma once

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "steps/step.hpp"
#include "util/my_logging.hpp"

namespace updatectrl::steps {

/**
 * Ordered collection of the known update steps. The registration order is
 * the order in which steps run.
 */
class StepRegistry {
private:
  std::vector<IStep::Ptr> steps_;

public:
  /**
   * Register a step.
   * @throws std::invalid_argument on a null step or a duplicate name
   */
  void add(IStep::Ptr step) {
    if (!step) {
      throw std::invalid_argument("cannot register a null step");
    }
    const std::string name = step->name();
    if (contains(name)) {
      throw std::invalid_argument("step '" + name + "' registered twice");
    }
    steps_.push_back(std::move(step));
    BOOST_LOG_SEV(app_logger(), trivial::trace) << "Registered step: " << name;
  }

  const std::vector<IStep::Ptr> &steps() const { return steps_; }

  std::vector<std::string> names() const {
    std::vector<std::string> out;
    out.reserve(steps_.size());
    for (const auto &s : steps_) {
      out.push_back(s->name());
    }
    return out;
  }

  bool contains(const std::string &name) const {
    return std::any_of(steps_.begin(), steps_.end(),
                       [&](const IStep::Ptr &s) { return s->name() == name; });
  }

  /**
   * Steps to run, in registration order. A non-empty `only` keeps just the
   * listed steps; `disable` then removes steps from that selection.
   */
  std::vector<IStep::Ptr> select(const std::vector<std::string> &only,
                                 const std::vector<std::string> &disable) const {
    auto listed = [](const std::vector<std::string> &names,
                     const std::string &name) {
      return std::find(names.begin(), names.end(), name) != names.end();
    };
    std::vector<IStep::Ptr> out;
    for (const auto &s : steps_) {
      const std::string name = s->name();
      if (!only.empty() && !listed(only, name)) {
        continue;
      }
      if (listed(disable, name)) {
        continue;
      }
      out.push_back(s);
    }
    return out;
  }

  // Names from `names` that match no registered step.
  std::vector<std::string> unknown(const std::vector<std::string> &names) const {
    std::vector<std::string> out;
    for (const auto &n : names) {
      if (!contains(n)) {
        out.push_back(n);
      }
    }
    return out;
  }
};

} // namespace updatectrl::steps
