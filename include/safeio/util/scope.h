// Stand-ins for std::experimental::scope_exit / scope_fail, which are not shipped by the toolchains we build with.
#ifndef SAFEIO_UTIL_SCOPE_H
#define SAFEIO_UTIL_SCOPE_H

#include <exception>
#include <utility>

namespace safeio {
    /**
     * Runs the callable when the guard leaves scope, unless release() was called first.
     */
    template<class F>
    class scope_exit {
    public:
        explicit scope_exit(F &&f) noexcept : fn_(std::move(f)), active_(true) {
        }

        scope_exit(scope_exit &&other) noexcept : fn_(std::move(other.fn_)), active_(other.active_) { other.release(); }

        scope_exit(const scope_exit &) = delete;

        scope_exit &operator=(const scope_exit &) = delete;

        scope_exit &operator=(scope_exit &&) = delete;

        ~scope_exit() {
            if (active_) { fn_(); }
        }

        void release() noexcept { active_ = false; }

    private:
        F fn_;
        bool active_;
    };

    /**
     * Runs the callable only when the scope is left by an exception.
     * The callable must not throw; it runs while another exception is propagating.
     */
    template<class F>
    class scope_fail {
    public:
        explicit scope_fail(F &&f) noexcept
            : fn_(std::move(f)), uncaught_on_entry_(std::uncaught_exceptions()), active_(true) {
        }

        scope_fail(const scope_fail &) = delete;

        scope_fail &operator=(const scope_fail &) = delete;

        ~scope_fail() {
            if (active_ && std::uncaught_exceptions() > uncaught_on_entry_) { fn_(); }
        }

        void release() noexcept { active_ = false; }

    private:
        F fn_;
        int uncaught_on_entry_;
        bool active_;
    };

    template<class F>
    scope_exit<F> make_scope_exit(F &&f) { return scope_exit<F>(std::forward<F>(f)); }
} // namespace safeio
#endif  // SAFEIO_UTIL_SCOPE_H
