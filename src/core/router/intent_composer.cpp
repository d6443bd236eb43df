#include "intentmesh/core/router/intent_composer.hpp"
#include "intentmesh/core/strategies/exponential_backoff.hpp"
#include "intentmesh/core/strategies/fixed_backoff.hpp"
#include "intentmesh/core/util/logger.hpp"
#include <algorithm>
#include <future>
#include <thread>

namespace intentmesh {

std::shared_ptr<const IBackoffStrategy> RetryOptions::makeBackoff() const {
    if (backoff) return backoff;
    if (exponentialBackoff) return std::make_shared<ExponentialBackoff>(retryDelay, maxDelay);
    return std::make_shared<FixedBackoff>(retryDelay);
}

/*──────────── Composition ───────────*/
bool Composition::anyFailed() const {
    return std::any_of(results.begin(), results.end(), [](const Outcome& o) { return !o.ok(); });
}

nlohmann::json Composition::toJson() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& o : results) list.push_back(o.toJson());

    nlohmann::json j{ {"type", toString(strategy)}, {"results", std::move(list)} };
    if (finalResult) j["final"] = *finalResult;
    return j;
}

namespace {

    Error firstFailure(const Composition& c) {
        for (const auto& o : c.results)
            if (!o.ok()) return o.effect.error();
        return makeError(FabricErr::Internal, "composition failed");
    }

}

/*──────────── IntentComposer ───────────*/
IntentComposer::IntentComposer(IntentRouter& router, const PluginPipeline& pipeline,
                               RetryOptions retry, size_t branchThreads)
    : router_(router),
      pipeline_(pipeline),
      retry_(std::move(retry)),
      branches_(branchThreads, "IntentComposer") {}

IntentComposer::~IntentComposer() {
    branches_.join();
}

Result<Composition> IntentComposer::composeIntents(const std::vector<Intent>& intents,
                                                   CompositionStrategy strategy,
                                                   const CompositionOptions& opts) {
    auto arranged = pipeline_.runCompose(intents, toString(strategy));
    if (!arranged) return arranged.error();

    switch (strategy) {
    case CompositionStrategy::Sequential:  return sequential(arranged.value());
    case CompositionStrategy::Parallel:    return parallel(arranged.value());
    case CompositionStrategy::Conditional: return conditional(arranged.value(), opts);
    case CompositionStrategy::Pipeline:    return pipeline(arranged.value());
    case CompositionStrategy::FanOut:      return fanOut(arranged.value(), opts);
    }
    return makeError(FabricErr::UnsupportedCompositionPattern);
}

Result<Composition> IntentComposer::composeIntents(const std::vector<Intent>& intents,
                                                   std::string_view strategy,
                                                   const CompositionOptions& opts) {
    auto parsed = parseStrategy(strategy);
    if (!parsed) {
        LOG_WARN("[IntentComposer] unsupported composition pattern '" + std::string(strategy) + "'");
        return makeError(FabricErr::UnsupportedCompositionPattern, std::string(strategy));
    }
    return composeIntents(intents, *parsed, opts);
}

Result<Composition> IntentComposer::composeComposite(const CompositeIntent& composite,
                                                     const CompositionOptions& opts) {
    return composeIntents(composite.intents(), composite.strategy(), opts);
}

Result<Composition> IntentComposer::sequential(const std::vector<Intent>& intents) {
    Composition c;
    c.strategy = CompositionStrategy::Sequential;
    for (const auto& intent : intents) {
        Outcome o = router_.process(intent);
        if (!o.ok()) return o.effect.error();
        c.results.push_back(std::move(o));
    }
    return c;
}

Result<Composition> IntentComposer::conditional(const std::vector<Intent>& intents,
                                                const CompositionOptions& opts) {
    Composition c;
    c.strategy = CompositionStrategy::Conditional;
    for (const auto& intent : intents) {
        Outcome o = router_.process(intent);
        if (!o.ok()) return o.effect.error();
        c.results.push_back(std::move(o));

        if (!opts.condition) continue;
        try {
            if (!opts.condition(c.results)) {
                LOG_DEBUG("[IntentComposer] condition stopped composition after " +
                          std::to_string(c.results.size()) + " step(s)");
                break;
            }
        }
        catch (const std::exception& ex) {
            LOG_ERROR("[IntentComposer] condition threw: " + std::string(ex.what()));
            return makeError(FabricErr::Internal, std::string("condition: ") + ex.what());
        }
    }
    return c;
}

Result<Composition> IntentComposer::pipeline(const std::vector<Intent>& intents) {
    Composition c;
    c.strategy = CompositionStrategy::Pipeline;

    nlohmann::json context;   // null before the first step
    nlohmann::json merged = nlohmann::json::object();
    for (const auto& intent : intents) {
        nlohmann::json payload = intent.payload().is_object()
            ? intent.payload()
            : nlohmann::json{ {"value", intent.payload()} };
        payload["context"] = context;

        Outcome o = router_.process(intent.withPayload(std::move(payload)));
        if (!o.ok()) return o.effect.error();

        context = o.effect.value();
        if (context.is_object()) merged.update(context);
        else merged["result"] = context;
        c.results.push_back(std::move(o));
    }
    c.finalResult = std::move(merged);
    return c;
}

std::vector<Outcome> IntentComposer::runBranches(std::vector<std::function<Outcome()>> branches) {
    std::vector<Outcome> out;
    out.reserve(branches.size());

    // nested composition from inside a branch runs inline instead of waiting on its own pool
    if (branches_.isWorkerThread()) {
        for (auto& b : branches) out.push_back(b());
        return out;
    }

    std::vector<std::future<Outcome>> pending;
    pending.reserve(branches.size());
    for (auto& b : branches) pending.push_back(branches_.add(std::move(b)));
    for (auto& f : pending) out.push_back(f.get());
    return out;
}

Result<Composition> IntentComposer::parallel(const std::vector<Intent>& intents) {
    std::vector<std::function<Outcome()>> branches;
    for (const auto& intent : intents) {
        branches.push_back([this, &intent]() -> Outcome {
            try {
                return router_.process(intent);
            }
            catch (const std::exception& ex) {
                return Outcome{ intent.id(), "", makeError(FabricErr::Internal, ex.what()) };
            }
        });
    }

    Composition c;
    c.strategy = CompositionStrategy::Parallel;
    c.results = runBranches(std::move(branches));
    return c;
}

Result<Composition> IntentComposer::fanOut(const std::vector<Intent>& intents,
                                           const CompositionOptions& opts) {
    std::vector<std::function<Outcome()>> branches;
    for (const auto& intent : intents) {
        std::vector<std::string> targets = opts.targets;
        if (targets.empty()) {
            auto resolved = router_.resolveTargets(intent);
            if (!resolved) {
                Error err = resolved.error();
                branches.push_back([id = intent.id(), err]() { return Outcome{ id, "", err }; });
                continue;
            }
            for (const auto& m : resolved.value()) targets.push_back(m.id);
        }

        for (const auto& target : targets) {
            branches.push_back([this, &intent, target]() -> Outcome {
                try {
                    return router_.processTo(intent, target);
                }
                catch (const std::exception& ex) {
                    return Outcome{ intent.id(), target, makeError(FabricErr::Internal, ex.what()) };
                }
            });
        }
    }

    Composition c;
    c.strategy = CompositionStrategy::FanOut;
    c.results = runBranches(std::move(branches));
    LOG_DEBUG("[IntentComposer] fan_out reached " + std::to_string(c.results.size()) + " target(s)");
    return c;
}

/*──────────── retry overlay ───────────*/
Result<Composition> IntentComposer::retry(const std::function<Result<Composition>()>& attempt,
                                          const RetryOptions& retry) {
    auto backoff = retry.makeBackoff();
    Error last = makeError(FabricErr::Internal, "no attempt made");

    for (uint32_t n = 0; n <= retry.maxRetries; ++n) {
        if (n > 0) {
            auto delay = backoff->nextDelay(n);
            LOG_INFO("[IntentComposer] retry " + std::to_string(n) + "/" + std::to_string(retry.maxRetries) +
                     " in " + std::to_string(delay.count()) + " ms (" + last.describe() + ")");
            std::this_thread::sleep_for(delay);
        }

        auto r = attempt();
        if (r && !r.value().anyFailed()) return r;
        last = r ? firstFailure(r.value()) : r.error();
    }

    LOG_WARN("[IntentComposer] giving up after " + std::to_string(retry.maxRetries) + " retries: " +
             last.describe());
    return wrapError(FabricErr::MaxRetriesExceeded, std::move(last));
}

Result<Composition> IntentComposer::composeWithRetry(const std::vector<Intent>& intents,
                                                     const CompositionOptions& opts) {
    return composeWithRetry(intents, retry_, opts);
}

Result<Composition> IntentComposer::composeWithRetry(const std::vector<Intent>& intents,
                                                     const RetryOptions& retry,
                                                     const CompositionOptions& opts) {
    return IntentComposer::retry([&] { return composeIntents(intents, retry.strategy, opts); }, retry);
}

}
