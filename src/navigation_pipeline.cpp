#include "waypoint/navigation_pipeline.hpp"

#include <algorithm>
#include <vector>

#include "waypoint/logging.hpp"

namespace waypoint {

std::string NavigationFailure::message() const {
  switch (kind) {
    case NavigationFailureKind::Redirected:
      return "Redirected from \"" + from.fullPath + "\" to \"" + to.fullPath +
             "\", which is the current location";
    case NavigationFailureKind::Aborted:
      return "Navigation aborted from \"" + from.fullPath + "\" to \"" +
             to.fullPath + "\" by a navigation guard";
    case NavigationFailureKind::Cancelled:
      return "Navigation cancelled from \"" + from.fullPath + "\" to \"" +
             to.fullPath + "\" by a newer navigation";
    case NavigationFailureKind::Duplicated:
      return "Avoided redundant navigation to current location \"" +
             to.fullPath + "\"";
  }
  return "Navigation failure";
}

NavigationResult NavigationResult::makeSuccess(ResolvedLocation to,
                                               ResolvedLocation from,
                                               uint64_t generation,
                                               uint32_t redirects) {
  NavigationResult result;
  result.state_ = NavigationState::Confirmed;
  result.to_ = std::move(to);
  result.from_ = std::move(from);
  result.generation_ = generation;
  result.redirects_ = redirects;
  return result;
}

NavigationResult NavigationResult::makeFailure(NavigationFailure failure,
                                               uint64_t generation,
                                               uint32_t redirects) {
  NavigationResult result;
  switch (failure.kind) {
    case NavigationFailureKind::Redirected:
      result.state_ = NavigationState::Redirected;
      break;
    case NavigationFailureKind::Cancelled:
      result.state_ = NavigationState::Cancelled;
      break;
    case NavigationFailureKind::Aborted:
    case NavigationFailureKind::Duplicated:
      result.state_ = NavigationState::Aborted;
      break;
  }
  result.to_ = failure.to;
  result.from_ = failure.from;
  result.failure_ = std::move(failure);
  result.generation_ = generation;
  result.redirects_ = redirects;
  return result;
}

NavigationResult NavigationResult::makeError(std::shared_ptr<const WaypointError> error,
                                             ResolvedLocation to,
                                             ResolvedLocation from,
                                             uint64_t generation,
                                             uint32_t redirects) {
  NavigationResult result;
  result.state_ = NavigationState::Failed;
  result.error_ = std::move(error);
  result.to_ = std::move(to);
  result.from_ = std::move(from);
  result.generation_ = generation;
  result.redirects_ = redirects;
  return result;
}

/**
 * @brief One navigation in flight
 *
 * Owned by the guard callbacks it hands out, so a guard that answers later
 * keeps the run alive. The pipeline is reached through a raw pointer only
 * after checking the shared liveness flag.
 */
class NavigationRun : public std::enable_shared_from_this<NavigationRun> {
 public:
  NavigationRun(NavigationPipeline& pipeline, uint64_t generation,
                NavigationTrigger trigger, PopInfo pop)
      : pipeline_(&pipeline),
        alive_(pipeline.alive_),
        generation_(generation),
        trigger_(trigger),
        pop_(pop),
        from_(pipeline.current_.get()) {}

  Completion<NavigationResult> completion() const { return completion_; }

  void start(const RawLocation& target) {
    if (resolveTarget(target)) {
      pump();
    }
  }

 private:
  bool pipelineGone() const { return alive_.expired(); }

  bool isStale() const {
    return pipelineGone() || pipeline_->generation_ != generation_;
  }

  /**
   * @brief Resolve a target and queue its guards
   * @return False if the navigation settled instead
   */
  bool resolveTarget(const RawLocation& raw) {
    std::optional<Result<ResolvedLocation, MatchNotFoundError>> resolved;
    try {
      resolved.emplace(pipeline_->matcher_.resolve(raw));
    } catch (const MissingParamError& e) {
      to_ = unmatched(raw);
      fail(std::make_shared<MissingParamError>(e));
      return false;
    }

    if (resolved->isError()) {
      to_ = unmatched(raw);
      fail(std::make_shared<MatchNotFoundError>(resolved->error()));
      return false;
    }

    ResolvedLocation location = std::move(*resolved).value();
    if (!requested_) {
      requested_ = location.fullPath;
    } else {
      location.redirectedFrom = requested_;
    }
    to_ = std::move(location);

    RecordPtr leaf = to_.leaf();
    if (leaf && leaf->redirect) {
      WPT_LOG_DEBUG("Route '{}' redirects to {}", leaf->path,
                    leaf->redirect->describe());
      if (!registerHop()) {
        return false;
      }
      return resolveTarget(*leaf->redirect);
    }

    if (trigger_ != NavigationTrigger::Pop && !raw.force &&
        isSameLocation(to_, from_)) {
      settleFailure(hops_ > 0 ? NavigationFailureKind::Redirected
                              : NavigationFailureKind::Duplicated);
      return false;
    }

    buildQueue();
    return true;
  }

  static ResolvedLocation unmatched(const RawLocation& raw) {
    ResolvedLocation location;
    location.path = raw.name ? std::string{} : parseUrl(raw.path).path;
    location.fullPath = raw.describe();
    return location;
  }

  bool registerHop() {
    if (hops_ >= pipeline_->maxRedirects_) {
      WPT_LOG_WARN("Redirect limit of {} reached navigating to {}",
                   pipeline_->maxRedirects_, to_.fullPath);
      fail(std::make_shared<RedirectLoopError>(hops_));
      return false;
    }
    ++hops_;
    return true;
  }

  static bool inChain(const RecordChain& chain, const RecordPtr& record) {
    return std::find(chain.begin(), chain.end(), record) != chain.end();
  }

  void buildQueue() {
    queue_ = pipeline_->beforeEach_.snapshot();

    const RecordChain& leaving = from_.matched;
    for (auto it = leaving.rbegin(); it != leaving.rend(); ++it) {
      if (!inChain(to_.matched, *it)) {
        queue_.insert(queue_.end(), (*it)->beforeLeave.begin(),
                      (*it)->beforeLeave.end());
      }
    }

    for (const auto& record : to_.matched) {
      if (!inChain(from_.matched, record)) {
        queue_.insert(queue_.end(), record->beforeEnter.begin(),
                      record->beforeEnter.end());
      }
    }

    auto resolveGuards = pipeline_->beforeResolve_.snapshot();
    queue_.insert(queue_.end(), resolveGuards.begin(), resolveGuards.end());
    next_ = 0;
  }

  /**
   * @brief Run guards until one answers later or the navigation settles
   */
  void pump() {
    while (!settled_) {
      if (isStale()) {
        cancel();
        return;
      }
      if (next_ >= queue_.size()) {
        confirm();
        return;
      }

      Guard guard = queue_[next_++];
      uint64_t token = ++stepToken_;
      syncResult_.reset();
      invoking_ = true;

      try {
        guard(to_, from_, [self = shared_from_this(), token](GuardResult result) {
          self->answer(token, std::move(result));
        });
      } catch (...) {
        if (answeredToken_ != token) {
          answeredToken_ = token;
          syncResult_ = GuardResult::fail(std::current_exception());
        } else {
          WPT_LOG_WARN("Guard threw after answering; exception ignored");
        }
      }
      invoking_ = false;

      if (!syncResult_) {
        return;
      }
      GuardResult result = std::move(*syncResult_);
      syncResult_.reset();
      if (!apply(std::move(result))) {
        return;
      }
    }
  }

  void answer(uint64_t token, GuardResult result) {
    if (settled_ || token != stepToken_ || answeredToken_ == token) {
      WPT_LOG_WARN("Ignoring extra answer from a navigation guard (generation {})",
                   generation_);
      return;
    }
    answeredToken_ = token;

    if (invoking_) {
      syncResult_ = std::move(result);
      return;
    }
    if (apply(std::move(result))) {
      pump();
    }
  }

  /**
   * @return True if the next guard should run
   */
  bool apply(GuardResult result) {
    if (isStale()) {
      cancel();
      return false;
    }

    switch (result.action()) {
      case GuardAction::Continue:
        return true;

      case GuardAction::Abort:
        WPT_LOG_DEBUG("Navigation to {} aborted by a guard", to_.fullPath);
        restorePop();
        settleFailure(NavigationFailureKind::Aborted);
        return false;

      case GuardAction::Redirect: {
        if (!registerHop()) {
          return false;
        }
        WPT_LOG_DEBUG("Guard redirected {} to {} (hop {})", to_.fullPath,
                      result.redirectTarget()->describe(), hops_);
        return resolveTarget(*result.redirectTarget());
      }

      case GuardAction::Error: {
        std::string details = "Navigation guard failed";
        try {
          if (result.error()) {
            std::rethrow_exception(result.error());
          }
        } catch (const std::exception& e) {
          details = e.what();
        } catch (...) {
          details = "Navigation guard threw a non-standard exception";
        }
        fail(std::make_shared<GuardError>(details, result.error()));
        return false;
      }
    }
    return false;
  }

  void markSettled() {
    settled_ = true;
    if (!pipelineGone()) {
      pipeline_->settledGeneration_ =
          std::max(pipeline_->settledGeneration_, generation_);
    }
  }

  void confirm() {
    if (isStale()) {
      cancel();
      return;
    }
    markSettled();

    nlohmann::json state = {{"generation", generation_}};
    if (trigger_ == NavigationTrigger::Push) {
      pipeline_->history_.push(to_.fullPath, state);
    } else if (trigger_ == NavigationTrigger::Replace) {
      pipeline_->history_.replace(to_.fullPath, state);
    }

    pipeline_->current_.set(to_);
    WPT_LOG_DEBUG("Navigation {} confirmed: {} -> {}", generation_,
                  from_.fullPath, to_.fullPath);

    for (const auto& hook : pipeline_->afterEach_.snapshot()) {
      try {
        hook(to_, from_);
      } catch (const std::exception& e) {
        WPT_LOG_WARN("afterEach hook failed: {}", e.what());
      } catch (...) {
        WPT_LOG_WARN("afterEach hook threw a non-standard exception");
      }
    }

    completion_.resolve(
        NavigationResult::makeSuccess(to_, from_, generation_, hops_));
  }

  void cancel() {
    markSettled();
    WPT_LOG_DEBUG("Navigation {} to {} superseded", generation_, to_.fullPath);
    completion_.resolve(NavigationResult::makeFailure(
        NavigationFailure{NavigationFailureKind::Cancelled, from_, to_},
        generation_, hops_));
  }

  void settleFailure(NavigationFailureKind kind) {
    if (isStale()) {
      cancel();
      return;
    }
    markSettled();
    completion_.resolve(NavigationResult::makeFailure(
        NavigationFailure{kind, from_, to_}, generation_, hops_));
  }

  void fail(std::shared_ptr<const WaypointError> error) {
    if (isStale()) {
      cancel();
      return;
    }
    markSettled();
    WPT_LOG_ERROR("Navigation {} to {} failed: {}", generation_, to_.fullPath,
                  error->what());

    for (const auto& handler : pipeline_->onError_.snapshot()) {
      try {
        handler(*error);
      } catch (const std::exception& e) {
        WPT_LOG_WARN("onError handler failed: {}", e.what());
      } catch (...) {
        WPT_LOG_WARN("onError handler threw a non-standard exception");
      }
    }
    restorePop();

    completion_.resolve(
        NavigationResult::makeError(std::move(error), to_, from_, generation_, hops_));
  }

  void restorePop() {
    if (trigger_ != NavigationTrigger::Pop || pop_.delta == 0 || pipelineGone()) {
      return;
    }
    ++pipeline_->suppressedPops_;
    pipeline_->history_.go(-pop_.delta);
  }

  NavigationPipeline* pipeline_;
  std::weak_ptr<bool> alive_;
  uint64_t generation_;
  NavigationTrigger trigger_;
  PopInfo pop_;

  ResolvedLocation from_;
  ResolvedLocation to_;
  std::optional<std::string> requested_;
  uint32_t hops_ = 0;

  std::vector<Guard> queue_;
  size_t next_ = 0;
  uint64_t stepToken_ = 0;
  uint64_t answeredToken_ = 0;
  bool invoking_ = false;
  std::optional<GuardResult> syncResult_;
  bool settled_ = false;

  Completion<NavigationResult> completion_;
};

NavigationPipeline::NavigationPipeline(MatcherRegistry& matcher,
                                       HistoryAdapter& history,
                                       CurrentRoute& current,
                                       const RouterOptions& options)
    : matcher_(matcher),
      history_(history),
      current_(current),
      maxRedirects_(options.maxRedirects),
      alive_(std::make_shared<bool>(true)) {}

NavigationPipeline::~NavigationPipeline() = default;

Completion<NavigationResult> NavigationPipeline::navigate(RawLocation target,
                                                          NavigationTrigger trigger,
                                                          PopInfo pop) {
  uint64_t generation = ++generation_;
  WPT_LOG_DEBUG("Navigation {} started towards {}", generation, target.describe());

  auto run = std::make_shared<NavigationRun>(*this, generation, trigger, pop);
  Completion<NavigationResult> completion = run->completion();
  run->start(target);
  return completion;
}

bool NavigationPipeline::consumeSuppressedPop() noexcept {
  if (suppressedPops_ == 0) {
    return false;
  }
  --suppressedPops_;
  return true;
}

}  // namespace waypoint
