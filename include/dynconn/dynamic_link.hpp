// DynamicLink: holds one mutable source -> target link and keeps at most one of
// them wired into the backend. Every mutation funnels through set_link_or_null().
#ifndef DYNCONN_DYNAMIC_LINK_HPP
#define DYNCONN_DYNAMIC_LINK_HPP

#include "dynconn/link_backend.hpp"

#include <cstdint>
#include <memory>

enum LinkError {
    LINK_OK = 0,
    LINK_ERR_INVALID_SOURCE,
    LINK_ERR_INVALID_TARGET,
    LINK_ERR_INVALID_FLAGS,
};

// Passed as `flags` to keep the flags already stored on the link.
constexpr int64_t LINK_KEEP_FLAGS = -1;

inline const char *link_error_to_string(LinkError err) {
    switch (err) {
        case LINK_OK: return "ok";
        case LINK_ERR_INVALID_SOURCE: return "source is null or its owner is gone";
        case LINK_ERR_INVALID_TARGET: return "target is not invokable";
        case LINK_ERR_INVALID_FLAGS: return "flags must be non-negative";
    }
    return "unknown";
}

template <typename SourceT, typename TargetT>
class DynamicLink {
public:
    typedef LinkBackend<SourceT, TargetT> Backend;

    // `backend` is borrowed and must outlive the link.
    explicit DynamicLink(Backend *backend, uint32_t flags = 0) : backend(backend), flags(flags) {
        remove_link();
    }

    ~DynamicLink() {
        remove_link();
    }

    DynamicLink(const DynamicLink &) = delete;
    DynamicLink &operator=(const DynamicLink &) = delete;

    // Builds an empty link and then applies the strict set_link(). The link is
    // returned even when that fails, in which case it stays empty.
    static std::unique_ptr<DynamicLink> create(Backend *backend, const SourceT &source, const TargetT &target, uint32_t flags = 0, LinkError *r_error = nullptr) {
        std::unique_ptr<DynamicLink> link = std::make_unique<DynamicLink>(backend);
        LinkError err = link->set_link(source, target, flags);
        if (r_error) *r_error = err;
        return link;
    }

    bool is_pair_valid(const SourceT &p_source, const TargetT &p_target) const {
        return backend->has_live_owner(p_source) && backend->is_invokable(p_target);
    }

    // Any negative `p_flags` keeps the stored flags.
    void set_link_or_null(const SourceT &p_source, const TargetT &p_target, int64_t p_flags = LINK_KEEP_FLAGS) {
        if (p_flags >= 0) flags = (uint32_t)p_flags;
        // A one-shot link that already fired, or one cut from outside, is no
        // longer connected and must not be disconnected again.
        if (is_pair_valid(source, target) && backend->is_connected(source, target)) {
            backend->disconnect(source, target);
        }
        if (is_pair_valid(p_source, p_target)) {
            backend->connect(p_source, p_target, flags);
        }
        source = p_source;
        target = p_target;
    }

    LinkError set_link(const SourceT &p_source, const TargetT &p_target, int64_t p_flags = LINK_KEEP_FLAGS) {
        LinkError err = check_pair(p_source, p_target);
        if (err != LINK_OK) return err;
        set_link_or_null(p_source, p_target, p_flags);
        return LINK_OK;
    }

    void remove_link() {
        set_link_or_null(SourceT(), TargetT());
    }

    void set_source_or_null(const SourceT &p_source) {
        set_link_or_null(p_source, target);
    }

    // Only the new source is checked; the stored target may still be empty.
    LinkError set_source(const SourceT &p_source) {
        if (!backend->has_live_owner(p_source)) return LINK_ERR_INVALID_SOURCE;
        set_link_or_null(p_source, target);
        return LINK_OK;
    }

    void set_target_or_null(const TargetT &p_target) {
        set_link_or_null(source, p_target);
    }

    LinkError set_target(const TargetT &p_target) {
        if (!backend->is_invokable(p_target)) return LINK_ERR_INVALID_TARGET;
        set_link_or_null(source, p_target);
        return LINK_OK;
    }

    // Rewires the stored pair so the new flags take effect immediately.
    LinkError set_flags(int64_t p_flags) {
        if (p_flags < 0) return LINK_ERR_INVALID_FLAGS;
        set_link_or_null(source, target, p_flags);
        return LINK_OK;
    }

    const SourceT &get_source() const { return source; }
    const TargetT &get_target() const { return target; }
    uint32_t get_flags() const { return flags; }

    // The stored pair is wireable. Says nothing about whether it is wired.
    bool is_valid() const {
        return is_pair_valid(source, target);
    }

    bool is_link_active() const {
        return is_valid() && backend->is_connected(source, target);
    }

private:
    LinkError check_pair(const SourceT &p_source, const TargetT &p_target) const {
        if (!backend->has_live_owner(p_source)) return LINK_ERR_INVALID_SOURCE;
        if (!backend->is_invokable(p_target)) return LINK_ERR_INVALID_TARGET;
        return LINK_OK;
    }

    Backend *backend = nullptr;
    SourceT source;
    TargetT target;
    uint32_t flags = 0;
};

#endif // DYNCONN_DYNAMIC_LINK_HPP
