#pragma once

#include "reactive/CombinedProvider.h"
#include "reactive/RebindableProvider.h"
#include "reactive/ResultCell.h"
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace SPC {

/**
 * @brief Factory helpers for the observables used by the controller
 */
namespace DataProviders {

/**
 * @brief Provider that always holds Success(value)
 */
template <typename T> std::shared_ptr<ResultCell<T>> createInMemoryProvider(std::string id, T value) {
    return ResultCell<T>::create(std::move(id), AsyncResult<T>::success(std::move(value)));
}

/**
 * @brief Rebindable provider initially bound to base through transform
 */
template <typename In, typename Out>
std::shared_ptr<RebindableProvider<In, Out>>
transformNested(std::string id, std::shared_ptr<IObservable<In>> base,
                typename RebindableProvider<In, Out>::Transform transform) {
    auto provider = std::make_shared<RebindableProvider<In, Out>>(std::move(id));
    provider->setBaseProvider(std::move(base), std::move(transform));
    return provider;
}

/**
 * @brief Value type carried by an observable pointer (ResultCell, provider, ...)
 */
template <typename Ptr>
using ObservedType = typename std::decay_t<decltype(std::declval<Ptr &>()->getCurrent())>::ValueType;

/**
 * @brief Combine two observables into one that recomputes when either changes
 *
 * Accepts any shared_ptr to an observable; the result type is deduced from
 * the combiner.
 */
template <typename PtrA, typename PtrB, typename Fn>
auto combineWith(std::string id, PtrA first, PtrB second, Fn &&combiner) {
    using A = ObservedType<PtrA>;
    using B = ObservedType<PtrB>;
    using R = std::decay_t<std::invoke_result_t<Fn, const A &, const B &>>;
    return CombinedProvider<A, B, R>::create(std::move(id), std::shared_ptr<IObservable<A>>(std::move(first)),
                                             std::shared_ptr<IObservable<B>>(std::move(second)),
                                             std::forward<Fn>(combiner));
}

}  // namespace DataProviders

}  // namespace SPC
