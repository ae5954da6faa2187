// In-memory LinkBackend used by the tests. Records every wiring call and models
// freed owners, dead callbacks, one-shot firing and external disconnects.
#pragma once

#include "dynconn/link_backend.hpp"

#include <algorithm>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

struct FakeSignal {
    int owner = 0; // 0 = null signal
    std::string name;

    bool operator==(const FakeSignal &o) const { return owner == o.owner && name == o.name; }
};

struct FakeCallable {
    int id = 0; // 0 = null callable

    bool operator==(const FakeCallable &o) const { return id == o.id; }
};

class FakeLinkBackend : public LinkBackend<FakeSignal, FakeCallable> {
public:
    struct Wire {
        FakeSignal source;
        FakeCallable target;
        uint32_t flags;
    };

    std::set<int> live_owners;
    std::set<int> dead_callables;
    std::vector<Wire> wires;
    std::vector<std::string> calls;
    // callable id of every invocation, in order
    std::vector<int> invocations;
    int bad_disconnects = 0;
    int max_wires = 0;

    FakeSignal make_signal(int owner, const std::string &name) {
        live_owners.insert(owner);
        FakeSignal s;
        s.owner = owner;
        s.name = name;
        return s;
    }

    static FakeCallable make_callable(int id) {
        FakeCallable c;
        c.id = id;
        return c;
    }

    // Freeing an object drops every connection it takes part in, like Godot does.
    void free_owner(int owner) {
        live_owners.erase(owner);
        drop_wires_if([owner](const Wire &w) { return w.source.owner == owner; });
    }

    void kill_callable(int id) {
        dead_callables.insert(id);
        drop_wires_if([id](const Wire &w) { return w.target.id == id; });
    }

    bool has_live_owner(const FakeSignal &source) const override {
        return source.owner != 0 && live_owners.count(source.owner) > 0;
    }

    bool is_invokable(const FakeCallable &target) const override {
        return target.id != 0 && dead_callables.count(target.id) == 0;
    }

    bool is_connected(const FakeSignal &source, const FakeCallable &target) const override {
        return find(source, target) != wires.end();
    }

    void connect(const FakeSignal &source, const FakeCallable &target, uint32_t flags) override {
        calls.push_back("connect " + describe(source, target));
        Wire w;
        w.source = source;
        w.target = target;
        w.flags = flags;
        wires.push_back(w);
        max_wires = std::max(max_wires, (int)wires.size());
    }

    void disconnect(const FakeSignal &source, const FakeCallable &target) override {
        calls.push_back("disconnect " + describe(source, target));
        auto it = find(source, target);
        if (it == wires.end()) {
            ++bad_disconnects;
            return;
        }
        wires.erase(it);
    }

    // Emits `source`: invokes every wired callback and drops one-shot wires.
    void emit(const FakeSignal &source) {
        std::vector<Wire> kept;
        for (const Wire &w : wires) {
            if (w.source == source) {
                invocations.push_back(w.target.id);
                if (w.flags & LINK_ONE_SHOT) continue;
            }
            kept.push_back(w);
        }
        wires = kept;
    }

    // Disconnects behind the handle's back.
    void sever(const FakeSignal &source, const FakeCallable &target) {
        auto it = find(source, target);
        if (it != wires.end()) wires.erase(it);
    }

    const Wire *wire_for(const FakeSignal &source, const FakeCallable &target) const {
        auto it = find(source, target);
        return it == wires.end() ? nullptr : &*it;
    }

private:
    template <typename Pred>
    void drop_wires_if(Pred pred) {
        wires.erase(std::remove_if(wires.begin(), wires.end(), pred), wires.end());
    }

    std::vector<Wire>::const_iterator find(const FakeSignal &source, const FakeCallable &target) const {
        return std::find_if(wires.begin(), wires.end(), [&](const Wire &w) {
            return w.source == source && w.target == target;
        });
    }

    std::vector<Wire>::iterator find(const FakeSignal &source, const FakeCallable &target) {
        return std::find_if(wires.begin(), wires.end(), [&](const Wire &w) {
            return w.source == source && w.target == target;
        });
    }

    static std::string describe(const FakeSignal &source, const FakeCallable &target) {
        return std::to_string(source.owner) + "." + source.name + " -> " + std::to_string(target.id);
    }
};
