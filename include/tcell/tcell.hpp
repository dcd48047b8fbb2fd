#ifndef TCELL_TCELL_HPP
#define TCELL_TCELL_HPP

#include <utility>
#include "error.hpp"
#include "unsafe_cell.hpp"

// TCell<Q, T> - cell whose contents are borrowed through TCellOwner<Q>
//
// Guarantees:
// - Stores no borrow state; all checking happens on the owner
// - Contents are reachable only through a TCellOwner with the same marker
//   type Q (a cell of another domain does not compile)
// - Zero overhead - the marker is a type parameter, not a field
//
// Many cells may share one marker and are then governed by the same owner.
// A cell does not remember which owner instance created it: when that
// owner is destroyed, the next TCellOwner<Q> can borrow it again.
//
// A cell cannot be copied or moved, so it cannot live in a growing
// std::vector. Hold cells inside nodes owned by shared_ptr/unique_ptr, or
// build a non-movable value in place:
//   auto node = std::make_shared<TCell<Q, int>>(owner, 1);
//   TCell<Q, Node> outer(owner, std::in_place, owner, 5);

// @safe
namespace tcell {

template<typename Q>
class TCellOwner;

// @safe - Cell owned, for borrowing purposes, by TCellOwner<Q>
template<typename Q, typename T>
class TCell {
private:
    UnsafeCell<T> value;

    friend class TCellOwner<Q>;

    // @lifetime: (&'a) -> *mut T where return: 'a
    T* as_ptr() const { return value.get(); }

public:
    using marker_type = Q;
    using value_type = T;

    // @safe - The owner is evidence that the domain exists; it is not kept
    // Throws ReleasedOwnerError if the owner was moved from or released
    TCell(const TCellOwner<Q>& owner, T val) : value(std::move(val)) {
        if (!owner.is_live()) {
            throw ReleasedOwnerError();
        }
    }

    // @safe - Build the value in place, e.g. a node that embeds other cells
    template<typename... Args>
    TCell(const TCellOwner<Q>& owner, std::in_place_t, Args&&... args)
        : value(std::in_place, std::forward<Args>(args)...) {
        if (!owner.is_live()) {
            throw ReleasedOwnerError();
        }
    }

    // No copy or move - the cell's address is its identity
    TCell(const TCell&) = delete;
    TCell& operator=(const TCell&) = delete;
    TCell(TCell&&) = delete;
    TCell& operator=(TCell&&) = delete;
};

// @safe - Helper function to create a TCell
template<typename Q, typename T>
TCell<Q, T> make_tcell(const TCellOwner<Q>& owner, T value) {
    return TCell<Q, T>(owner, std::move(value));
}

} // namespace tcell

#endif // TCELL_TCELL_HPP
