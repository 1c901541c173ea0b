#pragma once
/**
 * @file
 *
 * Compile-time rules for what may cross from a caller into a cache
 * computation, and the type-erased owning holder for such a
 * computation.
 *
 * A computation may run on a worker thread after the caller's frame
 * has returned, so it has to own everything it touches. The type
 * system cannot see through a lambda's captures; what it can reject
 * are the callable and argument types that are borrows by
 * construction: lvalues, `std::reference_wrapper`, object pointers,
 * member pointers and non-owning views such as `std::string_view` and
 * `std::span`.
 */

#include "memo/util/error.hh"

#include <concepts>
#include <functional>
#include <memory>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>

namespace memo {

namespace detail {

template<typename T>
struct is_reference_wrapper : std::false_type
{};

template<typename T>
struct is_reference_wrapper<std::reference_wrapper<T>> : std::true_type
{};

template<typename T>
struct is_span : std::false_type
{};

template<typename T, size_t N>
struct is_span<std::span<T, N>> : std::true_type
{};

template<typename T>
struct is_string_view : std::false_type
{};

template<typename C, typename Traits>
struct is_string_view<std::basic_string_view<C, Traits>> : std::true_type
{};

} // namespace detail

/**
 * Types that refer to data they do not own.
 */
template<typename T>
concept Borrowing = (std::is_pointer_v<T> && std::is_object_v<std::remove_pointer_t<T>>)
                    || std::is_member_pointer_v<T> || detail::is_reference_wrapper<T>::value
                    || detail::is_span<T>::value || detail::is_string_view<T>::value;

/**
 * A key or value type that can be handed to another thread and
 * outlive its creator: an owning object type. References, raw
 * pointers (including function pointers) and views are rejected.
 */
template<typename T>
concept Transferable = std::is_object_v<T> && !std::is_pointer_v<std::remove_cv_t<T>>
                       && !Borrowing<std::remove_cv_t<T>> && std::move_constructible<T>;

/**
 * A callable that may be submitted as a cache computation producing a
 * `V`. `F` is the deduced type of a forwarding reference, so it is an
 * lvalue reference exactly when the caller passed a named object that
 * it keeps: the callable has to be handed over (a temporary or
 * `std::move`).
 */
template<typename F, typename V>
concept SelfContainedComputation =
    !std::is_lvalue_reference_v<F> && !Borrowing<std::remove_cvref_t<F>>
    && std::move_constructible<std::remove_cvref_t<F>> && std::invocable<std::remove_cvref_t<F> &>
    && std::convertible_to<std::invoke_result_t<std::remove_cvref_t<F> &>, V>;

/**
 * An owned, move-only, run-once computation producing a `V`.
 */
template<typename V>
class Computation
{
    struct Base
    {
        virtual ~Base() = default;
        virtual V run() = 0;
    };

    template<typename F>
    struct Impl : Base
    {
        F f;

        explicit Impl(F && f)
            : f(std::move(f))
        {
        }

        V run() override
        {
            return std::invoke(f);
        }
    };

    std::unique_ptr<Base> impl;

public:

    template<typename F>
        requires(!std::is_same_v<std::remove_cvref_t<F>, Computation>) && SelfContainedComputation<F, V>
    Computation(F && f)
        : impl(std::make_unique<Impl<std::remove_cvref_t<F>>>(std::move(f)))
    {
    }

    Computation(Computation && other) = default;
    Computation & operator=(Computation && other) = default;

    Computation(const Computation &) = delete;
    Computation & operator=(const Computation &) = delete;

    /**
     * Run the computation. The callable and everything it owns is
     * destroyed when this returns or throws.
     */
    V operator()()
    {
        if (!impl)
            throw Error("computation has already been run");
        auto f = std::move(impl);
        return f->run();
    }

    explicit operator bool() const
    {
        return (bool) impl;
    }
};

/**
 * Bind `f` to `args` by value, like `std::thread` does, and return a
 * self-contained callable. The result is suitable for
 * `Cache::getOrInsertWith()`:
 *
 *   cache.getOrInsertWith(key, makeComputation(loadUser, userId, std::string(name)));
 *
 * Arguments that are borrows (`std::ref`, pointers, views) are
 * rejected; convert them to an owning type first.
 */
template<typename F, typename... Args>
    requires(!Borrowing<std::decay_t<F>>) && (!Borrowing<std::decay_t<Args>> && ...)
            && std::move_constructible<std::decay_t<F>> && (std::move_constructible<std::decay_t<Args>> && ...)
            && std::invocable<std::decay_t<F>, std::decay_t<Args>...>
auto makeComputation(F && f, Args &&... args)
{
    return [f = std::decay_t<F>(std::forward<F>(f)),
            ... args = std::decay_t<Args>(std::forward<Args>(args))]() mutable {
        return std::invoke(std::move(f), std::move(args)...);
    };
}

} // namespace memo
