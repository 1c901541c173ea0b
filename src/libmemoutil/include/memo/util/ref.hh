#pragma once
///@file

#include <memory>
#include <stdexcept>

namespace memo {

/**
 * A simple non-nullable reference-counted pointer. Actually a wrapper
 * around std::shared_ptr that prevents null constructions.
 */
template<typename T>
class ref
{
private:

    std::shared_ptr<T> p;

    void assertNonNull()
    {
        if (!p)
            throw std::invalid_argument("null pointer cast to ref");
    }

public:

    using element_type = T;

    explicit ref(const std::shared_ptr<T> & p)
        : p(p)
    {
        assertNonNull();
    }

    explicit ref(std::shared_ptr<T> && p)
        : p(std::move(p))
    {
        assertNonNull();
    }

    T * operator->() const
    {
        return &*p;
    }

    T & operator*() const
    {
        return *p;
    }

    std::shared_ptr<T> get_ptr() const &
    {
        return p;
    }

    std::shared_ptr<T> get_ptr() &&
    {
        return std::move(p);
    }

    operator std::shared_ptr<T>() const &
    {
        return p;
    }

    operator std::shared_ptr<T>() &&
    {
        return std::move(p);
    }

    template<typename T2>
    operator ref<T2>() const
    {
        return ref<T2>((std::shared_ptr<T2>) p);
    }

    bool operator==(const ref<T> & other) const
    {
        return p == other.p;
    }

    bool operator!=(const ref<T> & other) const
    {
        return p != other.p;
    }

    long use_count() const
    {
        return p.use_count();
    }
};

template<typename T, typename... Args>
inline ref<T> make_ref(Args &&... args)
{
    auto p = std::make_shared<T>(std::forward<Args>(args)...);
    return ref<T>(std::move(p));
}

} // namespace memo
