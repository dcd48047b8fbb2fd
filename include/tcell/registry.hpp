#ifndef TCELL_REGISTRY_HPP
#define TCELL_REGISTRY_HPP

#include <cstddef>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_set>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

// DomainRegistry - process-wide set of marker types with a live owner
//
// TCellOwner registers its marker on construction and removes it on
// destruction. The lock is held only for the set operation itself; borrow
// calls never touch the registry.

namespace tcell {

class DomainRegistry {
private:
    mutable std::mutex mtx_;
    std::unordered_set<std::type_index> live_;

    DomainRegistry() = default;

public:
    // The single registry of the process
    static DomainRegistry& instance() {
        static DomainRegistry registry;
        return registry;
    }

    // Insert the marker. Returns false if it was already present.
    bool register_domain(std::type_index marker) {
        std::lock_guard<std::mutex> lock(mtx_);
        return live_.insert(marker).second;
    }

    // Remove the marker; removing an absent marker is a no-op
    void unregister_domain(std::type_index marker) {
        std::lock_guard<std::mutex> lock(mtx_);
        live_.erase(marker);
    }

    bool is_registered(std::type_index marker) const {
        std::lock_guard<std::mutex> lock(mtx_);
        return live_.count(marker) != 0;
    }

    std::size_t live_domains() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return live_.size();
    }

    DomainRegistry(const DomainRegistry&) = delete;
    DomainRegistry& operator=(const DomainRegistry&) = delete;
    DomainRegistry(DomainRegistry&&) = delete;
    DomainRegistry& operator=(DomainRegistry&&) = delete;
};

// Readable name of a marker type, for diagnostics
template<typename Q>
std::string marker_name() {
    const char* raw = typeid(Q).name();
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(raw, nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
        return std::string(demangled.get());
    }
#endif
    return std::string(raw);
}

} // namespace tcell

#endif // TCELL_REGISTRY_HPP
