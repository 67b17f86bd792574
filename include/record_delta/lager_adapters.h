// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

// lager_adapters.h - Adapters for using record deltas with lager stores
//
// This header provides:
// 1. ApplyDelta<T> / delta_reducer<T>() - a store whose actions are deltas of
//    its root record model
// 2. delta_middleware() - store enhancer reporting the delta produced by each
//    reduction, only when the model actually changed
//
// Example usage:
//   auto store = lager::make_store<ApplyDelta<Inventory>>(
//       Inventory{},
//       lager::with_manual_event_loop{},
//       lager::with_reducer(delta_reducer<Inventory>()),
//       delta_middleware<Inventory>([](const Delta<Inventory>& d) {
//           print_changes(collect_changes(d));
//       }));
//
//   store.dispatch(ApplyDelta<Inventory>{*diff(store.get(), edited)});

#pragma once

#include <record_delta/record_delta_config.h>
#include <record_delta/delta.h>
#include <record_delta/diff.h>
#include <record_delta/merge.h>

#include <lager/store.hpp>

#include <functional>
#include <type_traits>
#include <utility>

namespace record_delta {

// ============================================================
// Part 1: delta actions
// ============================================================

/// Action carrying a delta of the store's model
template <RootRecord T>
struct ApplyDelta {
    Delta<T> delta;
};

/// Reducer merging ApplyDelta actions into the model
template <RootRecord T>
[[nodiscard]] auto delta_reducer() {
    return [](T model, const ApplyDelta<T>& action) -> T {
        return merge(std::move(model), action.delta);
    };
}

// ============================================================
// Part 2: delta_middleware - Store enhancer
// ============================================================

namespace detail {

template <RootRecord T, typename Callback>
void report_delta(const Callback& on_delta, const T& old_model, const T& new_model) {
    if (auto d = diff(old_model, new_model)) {
        on_delta(*d);
    }
}

} // namespace detail

/// @brief Store enhancer calling on_delta(const Delta<T>&) after every
///        reduction that changed the model.
///
/// Works with reducers returning either the model or a (model, effect) pair.
template <RootRecord T, typename Callback>
[[nodiscard]] auto delta_middleware(Callback on_delta) {
    return [on_delta = std::move(on_delta)](auto next) {
        return [on_delta, next](auto action, auto&& model, auto&& reducer, auto&& loop, auto&& deps, auto&& tags) {
            auto wrapped_reducer = [original_reducer = std::forward<decltype(reducer)>(reducer),
                                    on_delta](auto&& state, auto&& act) {
                T old_state = state;
                auto result = original_reducer(std::forward<decltype(state)>(state), std::forward<decltype(act)>(act));

                if constexpr (requires { result.first; }) {
                    detail::report_delta(on_delta, old_state, result.first);
                } else {
                    detail::report_delta(on_delta, old_state, result);
                }

                return result;
            };

            return next(action, std::forward<decltype(model)>(model), std::move(wrapped_reducer),
                        std::forward<decltype(loop)>(loop), std::forward<decltype(deps)>(deps),
                        std::forward<decltype(tags)>(tags));
        };
    };
}

} // namespace record_delta
