#ifndef TCELL_UNSAFE_CELL_HPP
#define TCELL_UNSAFE_CELL_HPP

#include <utility>

// UnsafeCell<T> - raw interior-mutability storage for TCell
//
// Holds one value and hands out a mutable pointer through a const
// reference. It performs no checks of any kind; TCellOwner is the only
// code that calls get().
//
// Safety:
// - Callers MUST NOT create two mutable references to the same value
// - Returned pointers MUST NOT outlive the UnsafeCell

// @safe
namespace tcell {

template<typename T>
class UnsafeCell {
private:
    mutable T value;

public:
    constexpr UnsafeCell() : value() {}
    constexpr explicit UnsafeCell(T val) : value(std::move(val)) {}

    // Construct the value in place (for values that cannot be moved)
    template<typename... Args>
    constexpr explicit UnsafeCell(std::in_place_t, Args&&... args)
        : value(std::forward<Args>(args)...) {}

    // @lifetime: (&'a) -> *mut T where return: 'a
    T* get() const {
        return &value;
    }

    // No copy or move - the address of the value is its identity
    UnsafeCell(const UnsafeCell&) = delete;
    UnsafeCell& operator=(const UnsafeCell&) = delete;
    UnsafeCell(UnsafeCell&&) = delete;
    UnsafeCell& operator=(UnsafeCell&&) = delete;
};

} // namespace tcell

#endif // TCELL_UNSAFE_CELL_HPP
