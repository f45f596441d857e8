#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace lb {

// Functor template for zero-storage static deleters in unique_ptr
template <auto func>
using Ftor = std::integral_constant<decltype(func), func>;

template <typename T, auto func>
using UniquePtr = std::unique_ptr<T, Ftor<func>>;

template <typename T>
using AllocatedPtr = UniquePtr<T, &std::free>;

using ErrString = std::optional<std::string>;
using Uint8View = std::basic_string_view<uint8_t>;
using Uint8Vector = std::vector<uint8_t>;

template <typename K, typename V>
using HashMap = std::unordered_map<K, V>;

// Convenient struct to tie a value and its mutex together
template <typename T, typename Mutex = std::mutex>
struct WithMtx {
    T val;
    Mutex mtx;
};

} // namespace lb
