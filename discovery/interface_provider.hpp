#pragma once

// ============================================================
// interface_provider.hpp -- Active network interface lookup
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <vector>
#include <mutex>

struct InterfaceInfo {
    std::string name;
    std::string address;    // IPv4 dotted quad
    std::string broadcast;  // directed broadcast, or 255.255.255.255

    bool operator==(const InterfaceInfo& o) const {
        return name == o.name && address == o.address && broadcast == o.broadcast;
    }
    bool operator!=(const InterfaceInfo& o) const { return !(*this == o); }
};

class InterfaceProvider {
public:
    virtual ~InterfaceProvider() = default;

    // Currently active interface. Returns false when none is usable.
    virtual bool active(InterfaceInfo& out) = 0;
};

// getifaddrs()-based lookup: first up, non-loopback IPv4 interface,
// or the one named `pinned` when set.
class SystemInterfaceProvider : public InterfaceProvider {
public:
    explicit SystemInterfaceProvider(std::string pinned = "");

    bool active(InterfaceInfo& out) override;

    static std::vector<InterfaceInfo> list();

private:
    std::string pinned_;
};

// Fixed answer that can be swapped at runtime (loopback runs, tests)
class StaticInterfaceProvider : public InterfaceProvider {
public:
    StaticInterfaceProvider() = default;
    explicit StaticInterfaceProvider(InterfaceInfo info) : info_(std::move(info)), up_(true) {}

    bool active(InterfaceInfo& out) override {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!up_) return false;
        out = info_;
        return true;
    }

    void set(InterfaceInfo info) {
        std::lock_guard<std::mutex> lk(mutex_);
        info_ = std::move(info);
        up_ = true;
    }

    void set_down() {
        std::lock_guard<std::mutex> lk(mutex_);
        up_ = false;
    }

private:
    std::mutex    mutex_;
    InterfaceInfo info_;
    bool          up_{false};
};
