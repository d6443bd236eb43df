/**
 * @file intent_composer.hpp
 * @brief IntentComposer: multi-intent composition strategies and the retry overlay.
 *
 * Fail-fast strategies (sequential, conditional, pipeline) stop at the first
 * failed intent and return its error. Fail-isolated strategies (parallel,
 * fan_out) run every branch as its own task and report each outcome in its
 * own slot, in input order.
 */
#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include "intentmesh/core/interfaces/IBackoffStrategy.hpp"
#include "intentmesh/core/intent/intent.hpp"
#include "intentmesh/core/pipeline/plugin_pipeline.hpp"
#include "intentmesh/core/router/intent_router.hpp"
#include "intentmesh/core/util/result.hpp"
#include "intentmesh/core/util/thread_pool.hpp"

namespace intentmesh {

    /**
     * @struct RetryOptions
     * @brief Settings for the retry overlay.
     */
    struct RetryOptions {
        uint32_t                  maxRetries{ 3 };          ///< Extra attempts after the first
        std::chrono::milliseconds retryDelay{ 1'000 };
        bool                      exponentialBackoff{ true };
        std::chrono::milliseconds maxDelay{ 10'000 };
        CompositionStrategy       strategy{ CompositionStrategy::Sequential };
        std::shared_ptr<const IBackoffStrategy> backoff;    ///< Overrides the two settings above

        /**
         * @brief The custom strategy if set, else exponential or fixed from retryDelay/maxDelay.
         */
        std::shared_ptr<const IBackoffStrategy> makeBackoff() const;
    };

    /**
     * @struct Composition
     * @brief Outcome of a composition: one entry per intent (or per target for fan_out).
     */
    struct Composition {
        CompositionStrategy           strategy{ CompositionStrategy::Sequential };
        std::vector<Outcome>          results;
        std::optional<nlohmann::json> finalResult;   ///< Merged pipeline result

        bool anyFailed() const;

        /**
         * @brief `{type, results}` plus `final` for pipeline.
         */
        nlohmann::json toJson() const;
    };

    /**
     * @struct CompositionOptions
     * @brief Per-call settings.
     */
    struct CompositionOptions {
        /// conditional: called after each step with the results so far; false stops the run.
        std::function<bool(const std::vector<Outcome>&)> condition;
        /// fan_out: explicit target ids. Empty means every target the intent routes to.
        std::vector<std::string> targets;
    };

    /**
     * @class IntentComposer
     * @brief Executes intent lists through an IntentRouter.
     */
    class IntentComposer {
    public:
        /**
         * @param branchThreads Workers for parallel and fan_out branches (0 = hardware concurrency)
         */
        IntentComposer(IntentRouter& router, const PluginPipeline& pipeline,
                       RetryOptions retry = {}, size_t branchThreads = 0);
        ~IntentComposer();

        IntentComposer(const IntentComposer&) = delete;
        IntentComposer& operator=(const IntentComposer&) = delete;

        /**
         * @brief Run composition plugins, then execute @p intents with @p strategy.
         */
        Result<Composition> composeIntents(const std::vector<Intent>& intents,
                                           CompositionStrategy strategy,
                                           const CompositionOptions& opts = {});

        /**
         * @brief As above with a strategy name.
         * @return UnsupportedCompositionPattern for an unknown name
         */
        Result<Composition> composeIntents(const std::vector<Intent>& intents,
                                           std::string_view strategy,
                                           const CompositionOptions& opts = {});

        /**
         * @brief Execute a composite intent with its own strategy.
         */
        Result<Composition> composeComposite(const CompositeIntent& composite,
                                             const CompositionOptions& opts = {});

        /**
         * @brief composeIntents() with the configured retry settings and strategy.
         */
        Result<Composition> composeWithRetry(const std::vector<Intent>& intents,
                                             const CompositionOptions& opts = {});

        Result<Composition> composeWithRetry(const std::vector<Intent>& intents,
                                             const RetryOptions& retry,
                                             const CompositionOptions& opts = {});

        /**
         * @brief Call @p attempt up to 1 + maxRetries times, sleeping between attempts.
         *
         * An attempt fails if it returns an error or any of its results failed.
         * Blocks the calling thread.
         * @return The first successful composition, or MaxRetriesExceeded whose
         *         cause is the last failure
         */
        static Result<Composition> retry(const std::function<Result<Composition>()>& attempt,
                                         const RetryOptions& retry);

        const RetryOptions& retryOptions() const { return retry_; }

    private:
        Result<Composition> sequential(const std::vector<Intent>& intents);
        Result<Composition> parallel(const std::vector<Intent>& intents);
        Result<Composition> conditional(const std::vector<Intent>& intents, const CompositionOptions& opts);
        Result<Composition> pipeline(const std::vector<Intent>& intents);
        Result<Composition> fanOut(const std::vector<Intent>& intents, const CompositionOptions& opts);

        std::vector<Outcome> runBranches(std::vector<std::function<Outcome()>> branches);

        IntentRouter&         router_;
        const PluginPipeline& pipeline_;
        RetryOptions          retry_;
        ThreadPool            branches_;
    };

}
