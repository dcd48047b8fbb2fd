// Demonstration of tcell with a shared, mutable graph
// Nodes are referenced from several places and mutated through one owner

#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <tcell/tcell_all.hpp>

struct GraphMarker {};

using Owner = tcell::TCellOwner<GraphMarker>;

template<typename T>
using GCell = tcell::TCell<GraphMarker, T>;

struct Node {
    std::string name;
    GCell<int> weight;
    GCell<std::vector<std::shared_ptr<Node>>> edges;

    Node(const Owner& owner, std::string n, int w)
        : name(std::move(n)), weight(owner, w), edges(owner, std::vector<std::shared_ptr<Node>>{}) {}
};

std::shared_ptr<Node> make_node(const Owner& owner, const std::string& name, int weight) {
    return std::make_shared<Node>(owner, name, weight);
}

// Example 1: Many holders, one writer
void shared_nodes_example() {
    std::cout << "\n=== Shared Nodes Example ===" << std::endl;

    Owner owner;
    auto a = make_node(owner, "a", 1);
    auto b = make_node(owner, "b", 2);
    auto c = make_node(owner, "c", 3);

    // a -> b, a -> c, b -> c, c -> a; the cycle is cleared at the end
    owner.get_mut(a->edges).push_back(b);
    owner.get_mut(a->edges).push_back(c);
    owner.get_mut(b->edges).push_back(c);
    owner.get_mut(c->edges).push_back(a);

    // Every node adds its weight to each successor, reached through edges
    // held by other nodes
    for (const auto& node : {a, b, c}) {
        int w = owner.get(node->weight);
        std::vector<std::shared_ptr<Node>> targets = owner.get(node->edges);
        for (const auto& target : targets) {
            owner.get_mut(target->weight) += w;
        }
    }

    for (const auto& node : {a, b, c}) {
        std::cout << node->name << " weight = " << owner.get(node->weight) << std::endl;
    }

    owner.get_mut(c->edges).clear();
}

// Example 2: Swapping values between two nodes at once
void swap_example() {
    std::cout << "\n=== Disjoint Mutable Borrow Example ===" << std::endl;

    Owner owner;
    auto x = make_node(owner, "x", 10);
    auto y = make_node(owner, "y", 20);

    {
        auto [wx, wy] = owner.get_mut2(x->weight, y->weight);
        std::swap(wx, wy);
    }
    std::cout << "x = " << owner.get(x->weight) << ", y = " << owner.get(y->weight) << std::endl;

    try {
        owner.get_mut2(x->weight, x->weight);
    } catch (const tcell::AliasedBorrowError& e) {
        std::cout << "Rejected: " << e.what() << std::endl;
    }
}

// Example 3: Only one owner per marker
void singleton_example() {
    std::cout << "\n=== Singleton Owner Example ===" << std::endl;

    Owner owner;
    try {
        Owner second;
    } catch (const tcell::DuplicateDomainError& e) {
        std::cout << "Rejected: " << e.what() << std::endl;
    }

    owner.release();
    Owner again;
    std::cout << "New owner after release: " << (again.is_live() ? "live" : "absent") << std::endl;
}

int main() {
    shared_nodes_example();
    swap_example();
    singleton_example();
    return 0;
}
