#pragma once

#include <array>
#include <chrono>
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
#include <unordered_set>
#include <vector>

namespace shroud {

// Functor template for zero-storage static deleters in unique_ptr
template <auto Func>
using Ftor = std::integral_constant<decltype(Func), Func>;

template <typename T, auto Func>
using UniquePtr = std::unique_ptr<T, Ftor<Func>>;

using Uint8View = std::basic_string_view<uint8_t>;
using Uint8Vector = std::vector<uint8_t>;
template <size_t S>
using Uint8Array = std::array<uint8_t, S>;
template <typename K, typename V>
using HashMap = std::unordered_map<K, V>;
template <typename K>
using HashSet = std::unordered_set<K>;

using Micros = std::chrono::microseconds;
using Millis = std::chrono::milliseconds;
using Secs = std::chrono::seconds;

// Convenient struct to tie a value and its mutex together
template <typename T, typename Mutex = std::mutex>
struct WithMtx {
    T val;
    Mutex mtx;
};

} // namespace shroud
