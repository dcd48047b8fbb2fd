#ifndef TCELL_ALL_HPP
#define TCELL_ALL_HPP

// tcell - many cells, one borrowing authority
//
// A TCellOwner<Q> is the only way to read or write the contents of any
// TCell<Q, T>. At most one owner per marker type Q is alive at a time, so
// holding the owner is proof that nobody else can borrow those cells.

#include "tcell/error.hpp"
#include "tcell/registry.hpp"
#include "tcell/unsafe_cell.hpp"
#include "tcell/tcell.hpp"
#include "tcell/owner.hpp"
#include "tcell/traits.hpp"

#endif // TCELL_ALL_HPP
