#pragma once
///@file

#include "memo/cache/store.hh"

#include <gmock/gmock.h>

namespace memo::testing {

/**
 * A gmock `Store` that by default forwards every call to an
 * `LRUStore`, so tests only need to set expectations on the calls they
 * care about.
 */
template<typename K, typename V>
class MockStore : public Store<K, V>
{
public:

    LRUStore<K, V> real;

    MockStore(size_t capacity = 100)
        : real(capacity)
    {
        using ::testing::_;
        using ::testing::Invoke;

        ON_CALL(*this, lookup(_)).WillByDefault(Invoke(&real, &LRUStore<K, V>::lookup));
        ON_CALL(*this, insert(_, _)).WillByDefault(Invoke(&real, &LRUStore<K, V>::insert));
        ON_CALL(*this, remove(_)).WillByDefault(Invoke(&real, &LRUStore<K, V>::remove));
        ON_CALL(*this, removeIf(_)).WillByDefault(Invoke(&real, &LRUStore<K, V>::removeIf));
        ON_CALL(*this, clear()).WillByDefault(Invoke(&real, &LRUStore<K, V>::clear));
        ON_CALL(*this, size()).WillByDefault(Invoke(&real, &LRUStore<K, V>::size));
        ON_CALL(*this, capacity()).WillByDefault(Invoke(&real, &LRUStore<K, V>::capacity));
    }

    MOCK_METHOD(std::optional<V>, lookup, (const K & key), (override));
    MOCK_METHOD(void, insert, (const K & key, const V & value), (override));
    MOCK_METHOD(bool, remove, (const K & key), (override));
    MOCK_METHOD(size_t, removeIf, (fun<bool(const K &, const V &)> pred), (override));
    MOCK_METHOD(void, clear, (), (override));
    MOCK_METHOD(size_t, size, (), (override));
    MOCK_METHOD(size_t, capacity, (), (override));
};

} // namespace memo::testing
