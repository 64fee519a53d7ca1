#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

/// owns every syntax node and runtime object for the whole run, nothing is collected early.
/// nodes are kept in one pool through their common base, runtime objects in a pool per type.
template<typename T>
class gc
{
  public:
    static auto track(std::unique_ptr<T> obj) -> T*
    {
        auto& pool = get_pool();
        pool.push_back(std::move(obj));
        return pool.back().get();
    }

  private:
    static auto get_pool() -> std::vector<std::unique_ptr<T>>&
    {
        static std::vector<std::unique_ptr<T>> pool = []()
        {
            std::vector<std::unique_ptr<T>> initial;
            constexpr auto initial_capacity = std::size_t {256};
            initial.reserve(initial_capacity);
            return initial;
        }();
        return pool;
    }
};

template<typename T, typename... Args>
    requires std::derived_from<T, struct expression>
auto make(Args&&... args) -> T*
{
    auto node = std::make_unique<T>(std::forward<Args>(args)...);
    T* raw = node.get();
    gc<expression>::track(std::move(node));
    return raw;
}

template<typename T, typename... Args>
auto make(Args&&... args) -> T*
{
    return gc<T>::track(std::make_unique<T>(std::forward<Args>(args)...));
}
