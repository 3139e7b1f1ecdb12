#include "waypoint/router.hpp"

#include "waypoint/logging.hpp"

namespace waypoint {

namespace {

RouterOptions validated(RouterOptions options) {
  options.validate();
  return options;
}

}  // namespace

Router::Router(HistoryAdapter& history, RouterOptions options)
    : options_(validated(std::move(options))),
      history_(history),
      matcher_(options_),
      pipeline_(matcher_, history_, current_, options_) {
  logging::Logger::getInstance().setLogLevel(options_.logLevel);

  unlisten_ = history_.listen(
      [this](const std::string& to, const std::string& /*from*/, PopInfo info) {
        handlePop(to, info);
      });
}

Router::~Router() {
  if (unlisten_) {
    unlisten_();
  }
}

Result<RecordId, CompileError> Router::addRoute(const RouteDefinition& definition) {
  return matcher_.addRoute(definition);
}

Result<RecordId, CompileError> Router::addRoute(std::string_view parentName,
                                                const RouteDefinition& definition) {
  RecordPtr parent = matcher_.matchByName(parentName);
  if (!parent) {
    throw ParentNotFoundError(parentName);
  }
  return matcher_.addRoute(definition, parent->id);
}

Completion<NavigationResult> Router::push(RawLocation target) {
  return pipeline_.navigate(std::move(target), NavigationTrigger::Push);
}

Completion<NavigationResult> Router::replace(RawLocation target) {
  return pipeline_.navigate(std::move(target), NavigationTrigger::Replace);
}

Completion<NavigationResult> Router::go(int delta) {
  if (delta == 0) {
    const ResolvedLocation& here = current_.get();
    return Completion<NavigationResult>::resolved(NavigationResult::makeFailure(
        NavigationFailure{NavigationFailureKind::Duplicated, here, here},
        pipeline_.latestGeneration(), 0));
  }

  // A newer traversal takes over the pending one
  if (pendingTraversal_) {
    Completion<NavigationResult> previous = *pendingTraversal_;
    pendingTraversal_.reset();
    const ResolvedLocation& here = current_.get();
    previous.resolve(NavigationResult::makeFailure(
        NavigationFailure{NavigationFailureKind::Cancelled, here, here},
        pipeline_.latestGeneration(), 0));
  }

  Completion<NavigationResult> traversal;
  pendingTraversal_ = traversal;
  history_.go(delta);
  return traversal;
}

void Router::handlePop(const std::string& to, PopInfo info) {
  if (pipeline_.consumeSuppressedPop()) {
    WPT_LOG_TRACE("Ignoring pop to {} caused by position restore", to);
    return;
  }

  Completion<NavigationResult> navigation =
      pipeline_.navigate(RawLocation(to), NavigationTrigger::Pop, info);

  if (pendingTraversal_) {
    Completion<NavigationResult> traversal = *pendingTraversal_;
    pendingTraversal_.reset();
    navigation.then(
        [traversal](const NavigationResult& result) { traversal.resolve(result); });
  }
}

Completion<NavigationResult> Router::start() {
  if (started_) {
    return ready_;
  }
  started_ = true;

  std::string initial = history_.current();
  WPT_LOG_INFO("Starting router at {}", initial);

  Completion<NavigationResult> ready = ready_;
  pipeline_.navigate(RawLocation(initial), NavigationTrigger::Replace)
      .then([ready](const NavigationResult& result) { ready.resolve(result); });
  return ready_;
}

}  // namespace waypoint
