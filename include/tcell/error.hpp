#ifndef TCELL_ERROR_HPP
#define TCELL_ERROR_HPP

#include <stdexcept>
#include <string>

// Errors raised by TCellOwner
//
// Every error here is a usage error: correct code never sees one. They are
// thrown at the point of violation, like a Rust panic, and nothing is
// returned to the caller.

namespace tcell {

// Base for every borrow-rule violation
class BorrowError : public std::runtime_error {
public:
    explicit BorrowError(const std::string& what) : std::runtime_error(what) {}
};

// A second live TCellOwner was requested for a marker type
class DuplicateDomainError : public BorrowError {
private:
    std::string marker_;

public:
    explicit DuplicateDomainError(const std::string& marker)
        : BorrowError("TCellOwner<" + marker + ">: illegal to create two "
                      "owner instances with the same marker type"),
          marker_(marker) {}

    const std::string& marker_name() const { return marker_; }
};

// get_mut2()/get_mut3() was given the same cell twice
class AliasedBorrowError : public BorrowError {
public:
    explicit AliasedBorrowError(const char* call)
        : BorrowError(std::string("TCellOwner: illegal to borrow same TCell twice with ") + call) {}
};

// A borrow conflicts with an outstanding Ref/RefMut guard
class BorrowConflictError : public BorrowError {
public:
    explicit BorrowConflictError(const char* reason)
        : BorrowError(std::string("TCellOwner: ") + reason) {}
};

// A borrow was issued through a moved-from or released owner
class ReleasedOwnerError : public BorrowError {
public:
    ReleasedOwnerError() : BorrowError("TCellOwner: owner was moved from or released") {}
};

} // namespace tcell

#endif // TCELL_ERROR_HPP
