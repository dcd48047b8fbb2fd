#ifndef TCELL_TRAITS_HPP
#define TCELL_TRAITS_HPP

#include <type_traits>

namespace tcell {

// Forward declarations for tcell types
template<typename Q> class TCellOwner;
template<typename Q, typename T> class TCell;
template<typename Q, typename T> class Ref;
template<typename Q, typename T> class RefMut;

template<typename T, typename = void>
struct is_sync;

// ============================================================================
// Send Trait - Can transfer ownership across thread boundaries
// ============================================================================

// Default: types are NOT Send
template<typename T, typename = void>
struct is_send : std::false_type {};

// Primitives are Send
template<typename T>
struct is_send<T, std::enable_if_t<std::is_arithmetic_v<T>>> : std::true_type {};

// const T& is Send if T is Sync
template<typename T>
struct is_send<const T&> : is_sync<T> {};

// T& is Send if T is Send
template<typename T>
struct is_send<T&> : is_send<T> {};

// The owner carries no data; moving it to another thread moves the domain
template<typename Q>
struct is_send<TCellOwner<Q>> : std::true_type {};

// TCell<Q, T> is Send if T is Send
template<typename Q, typename T>
struct is_send<TCell<Q, T>> : is_send<T> {};

// Guards point into the owner's borrow counter
template<typename Q, typename T>
struct is_send<Ref<Q, T>> : std::false_type {};

template<typename Q, typename T>
struct is_send<RefMut<Q, T>> : std::false_type {};

// ============================================================================
// Sync Trait - Can safely share &T across threads
// ============================================================================

// Default: types are NOT Sync
template<typename T, typename>
struct is_sync : std::false_type {};

// Primitives are Sync
template<typename T>
struct is_sync<T, std::enable_if_t<std::is_arithmetic_v<T>>> : std::true_type {};

template<typename T>
struct is_sync<const T&> : is_sync<T> {};

// T& is never Sync
template<typename T>
struct is_sync<T&> : std::false_type {};

// TCellOwner<Q> is NOT Sync: get() on a shared owner updates no lock, and
// the guard counter is unsynchronized
template<typename Q>
struct is_sync<TCellOwner<Q>> : std::false_type {};

// TCell<Q, T> is Sync if T is Send + Sync: readers on several threads see
// the same T, and a writer on one thread may hand it over
template<typename Q, typename T>
struct is_sync<TCell<Q, T>> : std::bool_constant<
    is_send<T>::value && is_sync<T>::value
> {};

// ============================================================================
// Helper constexpr variables (C++17 compatible)
// ============================================================================

template<typename T>
inline constexpr bool Send = is_send<T>::value;

template<typename T>
inline constexpr bool Sync = is_sync<T>::value;

template<typename T>
inline constexpr bool ThreadSafe = Send<T> && Sync<T>;

} // namespace tcell

#endif // TCELL_TRAITS_HPP
