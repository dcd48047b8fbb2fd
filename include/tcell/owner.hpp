#ifndef TCELL_OWNER_HPP
#define TCELL_OWNER_HPP

#include <cassert>
#include <cstdint>
#include <tuple>
#include <typeindex>
#include <utility>
#include "error.hpp"
#include "registry.hpp"
#include "tcell.hpp"

// TCellOwner<Q> - the single borrowing authority for all TCell<Q, T>
//
// Guarantees:
// - At most one live owner per marker type Q in the process
//   (constructing a second one throws DuplicateDomainError)
// - get() is const, get_mut*() are non-const: a const TCellOwner& can
//   only read, and a writer must hold the owner exclusively
// - get_mut2()/get_mut3() reject overlapping cells (AliasedBorrowError)
// - One domain-wide borrow counter backs the Ref/RefMut guards; there is
//   no per-cell bookkeeping
//
// Not thread-safe: share an owner across threads only behind your own lock.
//
// Usage:
//   struct Marker {};  // any complete type
//   TCellOwner<Marker> owner;
//   TCell<Marker, int> c1(owner, 100);
//   TCell<Marker, int> c2(owner, 200);
//   owner.get_mut(c1) += 1;
//   auto [a, b] = owner.get_mut2(c1, c2);

// @safe
namespace tcell {

template<typename Q, typename T>
class Ref;

template<typename Q, typename T>
class RefMut;

template<typename Q>
class TCellOwner {
private:
    bool live_;
    mutable int borrow_state_;  // 0 = unborrowed, >0 = # readers, <0 = # writers

    template<typename, typename> friend class Ref;
    template<typename, typename> friend class RefMut;

    static std::type_index marker() { return std::type_index(typeid(Q)); }

    void check_live() const {
        if (!live_) {
            throw ReleasedOwnerError();
        }
    }

    void check_readable() const {
        check_live();
        if (borrow_state_ < 0) {
            throw BorrowConflictError("already mutably borrowed");
        }
    }

    void check_writable() const {
        check_live();
        if (borrow_state_ > 0) {
            throw BorrowConflictError("already immutably borrowed");
        }
        if (borrow_state_ < 0) {
            throw BorrowConflictError("already mutably borrowed");
        }
    }

    void add_reader() const {
        check_readable();
        borrow_state_++;
    }

    void remove_reader() const {
        assert(borrow_state_ > 0);
        borrow_state_--;
    }

    void add_writers(int count) const {
        check_writable();
        borrow_state_ = -count;
    }

    void remove_writer() const {
        assert(borrow_state_ < 0);
        borrow_state_++;
    }

    // True when the storage of the two cells overlaps. Identity is the
    // address range, never the value.
    template<typename T, typename U>
    static bool overlaps(const TCell<Q, T>& a, const TCell<Q, U>& b) {
        auto pa = reinterpret_cast<std::uintptr_t>(&a);
        auto pb = reinterpret_cast<std::uintptr_t>(&b);
        return pa < pb + sizeof(b) && pb < pa + sizeof(a);
    }

    template<typename T, typename U, typename V>
    static bool overlaps(const TCell<Q, T>& a, const TCell<Q, U>& b, const TCell<Q, V>& c) {
        return overlaps(a, b) || overlaps(b, c) || overlaps(c, a);
    }

public:
    using marker_type = Q;

    // @safe - Create the singleton owner for Q
    // Throws DuplicateDomainError if another live owner for Q exists
    TCellOwner() : live_(false), borrow_state_(0) {
        if (!DomainRegistry::instance().register_domain(marker())) {
            throw DuplicateDomainError(marker_name<Q>());
        }
        live_ = true;
    }

    // Factory method (Rust-style)
    static TCellOwner<Q> new_() {
        return TCellOwner<Q>();
    }

    // @safe - Transfers the domain; other becomes absent
    // Throws BorrowConflictError if other has outstanding guards
    TCellOwner(TCellOwner&& other) : live_(other.live_), borrow_state_(0) {
        if (other.borrow_state_ != 0) {
            throw BorrowConflictError("cannot move owner while borrowed");
        }
        other.live_ = false;
    }

    ~TCellOwner() {
#ifdef TCELL_DEBUG
        assert(borrow_state_ == 0 && "TCellOwner<Q> dropped while borrowed");
#endif
        if (live_) {
            DomainRegistry::instance().unregister_domain(marker());
        }
    }

    // @safe - Give up the domain before the end of scope. Idempotent.
    // Throws BorrowConflictError if guards are outstanding
    void release() {
        if (!live_) {
            return;
        }
        if (borrow_state_ != 0) {
            throw BorrowConflictError("cannot release owner while borrowed");
        }
        live_ = false;
        DomainRegistry::instance().unregister_domain(marker());
    }

    bool is_live() const { return live_; }

    // Whether any live owner for Q exists in the process
    static bool exists() {
        return DomainRegistry::instance().is_registered(marker());
    }

    // Current guard count: 0 = none, >0 = readers, <0 = writers
    int borrow_state() const { return borrow_state_; }

    // @safe - Borrow contents immutably. Many cells may be read at once.
    // @lifetime: (&'a, &'a) -> &'a T
    template<typename T>
    const T& get(const TCell<Q, T>& cell) const {
        check_readable();
        return *cell.as_ptr();
    }

    // @safe - Borrow contents mutably. Requires exclusive access to the owner.
    // @lifetime: (&'a mut, &'a) -> &'a mut T
    template<typename T>
    T& get_mut(const TCell<Q, T>& cell) {
        check_writable();
        return *cell.as_ptr();
    }

    // @safe - Borrow two cells mutably
    // Throws AliasedBorrowError if the cells overlap
    // @lifetime: (&'a mut, &'a, &'a) -> (&'a mut T, &'a mut U)
    template<typename T, typename U>
    std::tuple<T&, U&> get_mut2(const TCell<Q, T>& c1, const TCell<Q, U>& c2) {
        check_live();
        if (overlaps(c1, c2)) {
            throw AliasedBorrowError("get_mut2()");
        }
        check_writable();
        return std::tuple<T&, U&>(*c1.as_ptr(), *c2.as_ptr());
    }

    // @safe - Borrow three cells mutably
    // Throws AliasedBorrowError if any pair of cells overlaps
    // @lifetime: (&'a mut, &'a, &'a, &'a) -> (&'a mut T, &'a mut U, &'a mut V)
    template<typename T, typename U, typename V>
    std::tuple<T&, U&, V&> get_mut3(const TCell<Q, T>& c1, const TCell<Q, U>& c2,
                                    const TCell<Q, V>& c3) {
        check_live();
        if (overlaps(c1, c2, c3)) {
            throw AliasedBorrowError("get_mut3()");
        }
        check_writable();
        return std::tuple<T&, U&, V&>(*c1.as_ptr(), *c2.as_ptr(), *c3.as_ptr());
    }

    // Apply f to the contents of cell and return its result
    template<typename T, typename F>
    decltype(auto) ro(const TCell<Q, T>& cell, F&& f) const {
        return std::forward<F>(f)(get(cell));
    }

    template<typename T, typename F>
    decltype(auto) rw(const TCell<Q, T>& cell, F&& f) {
        return std::forward<F>(f)(get_mut(cell));
    }

    // Guarded borrows. The guard keeps the domain counter raised until it
    // is destroyed, so conflicting borrows throw BorrowConflictError.

    // @lifetime: (&'a, &'a) -> Ref<'a, T>
    template<typename T>
    Ref<Q, T> borrow(const TCell<Q, T>& cell) const {
        add_reader();
        return Ref<Q, T>(*this, cell.as_ptr());
    }

    // @lifetime: (&'a mut, &'a) -> RefMut<'a, T>
    template<typename T>
    RefMut<Q, T> borrow_mut(const TCell<Q, T>& cell) {
        add_writers(1);
        return RefMut<Q, T>(*this, cell.as_ptr());
    }

    template<typename T, typename U>
    std::tuple<RefMut<Q, T>, RefMut<Q, U>> borrow_mut2(const TCell<Q, T>& c1,
                                                       const TCell<Q, U>& c2) {
        check_live();
        if (overlaps(c1, c2)) {
            throw AliasedBorrowError("borrow_mut2()");
        }
        add_writers(2);
        return std::tuple<RefMut<Q, T>, RefMut<Q, U>>(
            RefMut<Q, T>(*this, c1.as_ptr()), RefMut<Q, U>(*this, c2.as_ptr()));
    }

    template<typename T, typename U, typename V>
    std::tuple<RefMut<Q, T>, RefMut<Q, U>, RefMut<Q, V>> borrow_mut3(
        const TCell<Q, T>& c1, const TCell<Q, U>& c2, const TCell<Q, V>& c3) {
        check_live();
        if (overlaps(c1, c2, c3)) {
            throw AliasedBorrowError("borrow_mut3()");
        }
        add_writers(3);
        return std::tuple<RefMut<Q, T>, RefMut<Q, U>, RefMut<Q, V>>(
            RefMut<Q, T>(*this, c1.as_ptr()), RefMut<Q, U>(*this, c2.as_ptr()),
            RefMut<Q, V>(*this, c3.as_ptr()));
    }

    // Not copyable: a copy would be a second owner for Q
    TCellOwner(const TCellOwner&) = delete;
    TCellOwner& operator=(const TCellOwner&) = delete;
    TCellOwner& operator=(TCellOwner&&) = delete;
};

// Ref<Q, T> - RAII guard for an immutable borrow through TCellOwner<Q>
template<typename Q, typename T>
class Ref {
private:
    const TCellOwner<Q>* owner;
    const T* value;

    friend class TCellOwner<Q>;
    Ref(const TCellOwner<Q>& o, const T* v) : owner(&o), value(v) {}

public:
    ~Ref() {
        if (owner) {
            owner->remove_reader();
        }
    }

    Ref(Ref&& other) noexcept : owner(other.owner), value(other.value) {
        other.owner = nullptr;
    }

    Ref(const Ref&) = delete;
    Ref& operator=(const Ref&) = delete;
    Ref& operator=(Ref&&) = delete;

    const T& operator*() const { return *value; }
    const T* operator->() const { return value; }
};

// RefMut<Q, T> - RAII guard for a mutable borrow through TCellOwner<Q>
template<typename Q, typename T>
class RefMut {
private:
    const TCellOwner<Q>* owner;
    T* value;

    friend class TCellOwner<Q>;
    RefMut(const TCellOwner<Q>& o, T* v) : owner(&o), value(v) {}

public:
    ~RefMut() {
        if (owner) {
            owner->remove_writer();
        }
    }

    RefMut(RefMut&& other) noexcept : owner(other.owner), value(other.value) {
        other.owner = nullptr;
    }

    RefMut(const RefMut&) = delete;
    RefMut& operator=(const RefMut&) = delete;
    RefMut& operator=(RefMut&&) = delete;

    T& operator*() const { return *value; }
    T* operator->() const { return value; }
};

} // namespace tcell

#endif // TCELL_OWNER_HPP
