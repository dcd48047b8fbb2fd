// Test suite for TCellOwner<Q> - singleton ownership of a marker domain

#include "tcell/owner.hpp"
#include <iostream>
#include <cassert>
#include <string>
#include <utility>

using namespace tcell;

// @safe
void test_owner_singleton() {
    std::cout << "Testing TCellOwner singleton..." << std::endl;

    struct Marker {};
    TCellOwner<Marker> owner1;

    try {
        TCellOwner<Marker> owner2;
        assert(false && "Should have thrown - second owner for the same marker");
    } catch (const DuplicateDomainError& e) {
        assert(e.marker_name().find("Marker") != std::string::npos);
        assert(std::string(e.what()).find("Marker") != std::string::npos);
        std::cout << "  ✓ Correctly rejected second owner: " << e.what() << std::endl;
    }

    // The failed construction must not have unregistered the first owner
    assert(owner1.is_live());
    assert(TCellOwner<Marker>::exists());

    std::cout << "✓ TCellOwner singleton enforced" << std::endl;
}

// @safe
void test_owner_recreate_after_drop() {
    std::cout << "Testing TCellOwner re-creation after drop..." << std::endl;

    struct Marker {};
    {
        TCellOwner<Marker> owner1;
        assert(TCellOwner<Marker>::exists());
    }
    assert(!TCellOwner<Marker>::exists());

    TCellOwner<Marker> owner2;
    assert(owner2.is_live());

    std::cout << "✓ TCellOwner can be re-created after drop" << std::endl;
}

// @safe
void test_owner_distinct_markers() {
    std::cout << "Testing TCellOwner with distinct markers..." << std::endl;

    struct Marker1 {};
    struct Marker2 {};
    TCellOwner<Marker1> owner1;
    TCellOwner<Marker2> owner2;

    TCell<Marker1, int> c1(owner1, 1);
    TCell<Marker2, int> c2(owner2, 2);
    owner1.get_mut(c1) += 10;
    owner2.get_mut(c2) += 20;

    assert(owner1.get(c1) == 11);
    assert(owner2.get(c2) == 22);

    std::cout << "✓ Owners of distinct markers coexist" << std::endl;
}

// @safe
void test_owner_usable_after_duplicate() {
    std::cout << "Testing TCellOwner after rejected duplicate..." << std::endl;

    struct Marker {};
    TCellOwner<Marker> owner;
    TCell<Marker, int> cell(owner, 7);

    try {
        auto dup = TCellOwner<Marker>::new_();
        assert(false && "Should have thrown - duplicate owner via new_()");
    } catch (const BorrowError&) {
        std::cout << "  ✓ new_() rejected duplicate owner" << std::endl;
    }

    owner.get_mut(cell) *= 6;
    assert(owner.get(cell) == 42);

    std::cout << "✓ Original owner still usable" << std::endl;
}

// @safe
void test_owner_release() {
    std::cout << "Testing TCellOwner release..." << std::endl;

    struct Marker {};
    TCellOwner<Marker> owner;
    TCell<Marker, int> cell(owner, 5);

    owner.release();
    assert(!owner.is_live());
    assert(!TCellOwner<Marker>::exists());

    // Releasing twice is a no-op
    owner.release();

    try {
        owner.get(cell);
        assert(false && "Should have thrown - borrow through released owner");
    } catch (const ReleasedOwnerError&) {
        std::cout << "  ✓ Released owner refuses to borrow" << std::endl;
    }

    // A released owner is no longer proof that the domain exists
    try {
        TCell<Marker, int> late(owner, 2);
        assert(false && "Should have thrown - cell built from released owner");
    } catch (const ReleasedOwnerError&) {
        std::cout << "  ✓ Released owner refuses to create cells" << std::endl;
    }
    try {
        auto late = make_tcell(owner, std::string("late"));
        assert(false && "Should have thrown - make_tcell with released owner");
    } catch (const ReleasedOwnerError&) {
    }

    // Being absent is reported before any aliasing
    try {
        owner.get_mut2(cell, cell);
        assert(false && "Should have thrown - get_mut2 through released owner");
    } catch (const ReleasedOwnerError&) {
        std::cout << "  ✓ Released owner checked before aliasing" << std::endl;
    }
    try {
        owner.get_mut3(cell, cell, cell);
        assert(false && "Should have thrown - get_mut3 through released owner");
    } catch (const ReleasedOwnerError&) {
    }
    try {
        owner.borrow_mut2(cell, cell);
        assert(false && "Should have thrown - borrow_mut2 through released owner");
    } catch (const ReleasedOwnerError&) {
    }
    try {
        owner.borrow_mut3(cell, cell, cell);
        assert(false && "Should have thrown - borrow_mut3 through released owner");
    } catch (const ReleasedOwnerError&) {
    }
    assert(owner.borrow_state() == 0);

    // The cell outlives its first owner and is reachable from the next one
    TCellOwner<Marker> next;
    assert(next.get(cell) == 5);
    next.get_mut(cell) = 6;
    assert(next.get(cell) == 6);

    std::cout << "✓ TCellOwner release works" << std::endl;
}

// @safe
void test_owner_move() {
    std::cout << "Testing TCellOwner move..." << std::endl;

    struct Marker {};
    TCellOwner<Marker> owner;
    TCell<Marker, std::string> cell(owner, "hello");

    TCellOwner<Marker> moved(std::move(owner));
    assert(moved.is_live());
    assert(!owner.is_live());
    assert(TCellOwner<Marker>::exists());

    moved.get_mut(cell) += " world";
    assert(moved.get(cell) == "hello world");

    try {
        owner.get_mut(cell);
        assert(false && "Should have thrown - borrow through moved-from owner");
    } catch (const ReleasedOwnerError&) {
        std::cout << "  ✓ Moved-from owner refuses to borrow" << std::endl;
    }

    try {
        TCell<Marker, int> late(owner, std::in_place, 1);
        assert(false && "Should have thrown - cell built from moved-from owner");
    } catch (const ReleasedOwnerError&) {
        std::cout << "  ✓ Moved-from owner refuses to create cells" << std::endl;
    }

    // Moving while a guard is outstanding would leave the guard dangling
    {
        auto ref = moved.borrow(cell);
        try {
            TCellOwner<Marker> again(std::move(moved));
            assert(false && "Should have thrown - move while borrowed");
        } catch (const BorrowConflictError&) {
            std::cout << "  ✓ Move while borrowed rejected" << std::endl;
        }
        assert(moved.is_live());
    }

    std::cout << "✓ TCellOwner move works" << std::endl;
}

// @safe
void test_owner_moved_from_destruction() {
    std::cout << "Testing destruction of moved-from owner..." << std::endl;

    struct Marker {};
    TCellOwner<Marker> outer = TCellOwner<Marker>::new_();
    {
        TCellOwner<Marker> inner(std::move(outer));
    }
    // inner unregistered; the moved-from outer must not touch the registry
    assert(!TCellOwner<Marker>::exists());

    TCellOwner<Marker> fresh;
    assert(fresh.is_live());

    std::cout << "✓ Moved-from owner destructs cleanly" << std::endl;
}

int main() {
    std::cout << "\n=== TCellOwner<Q> Test Suite ===" << std::endl;

    test_owner_singleton();
    test_owner_recreate_after_drop();
    test_owner_distinct_markers();
    test_owner_usable_after_duplicate();
    test_owner_release();
    test_owner_move();
    test_owner_moved_from_destruction();

    std::cout << "\n✅ All TCellOwner tests passed!" << std::endl;
    return 0;
}
