#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>
#include <vector>

namespace zw::tui {

template <typename Signature>
class Signal;

/**
 * @brief List of callbacks invoked synchronously on emit
 *
 * For void handlers every subscriber runs. For bool handlers emission stops
 * at the first subscriber returning true, and emit reports whether one did.
 * Handlers may connect or disconnect while the signal is being emitted;
 * the change takes effect from the next emission.
 */
template <typename R, typename... Args>
class Signal<R(Args...)> {
    static_assert(std::is_void_v<R> || std::is_same_v<R, bool>,
                  "Signal handlers return void or bool");

public:
    using Handler = std::function<R(Args...)>;
    using Connection = size_t;

    Connection connect(Handler handler) {
        handlers_.emplace_back(next_id_, std::move(handler));
        return next_id_++;
    }

    bool disconnect(Connection id) {
        auto it = std::find_if(handlers_.begin(), handlers_.end(),
                               [id](const auto& entry) { return entry.first == id; });
        if (it == handlers_.end()) {
            return false;
        }
        handlers_.erase(it);
        return true;
    }

    R emit(Args... args) const {
        auto snapshot = handlers_;
        if constexpr (std::is_void_v<R>) {
            for (const auto& [id, handler] : snapshot) {
                handler(args...);
            }
        } else {
            for (const auto& [id, handler] : snapshot) {
                if (handler(args...)) {
                    return true;
                }
            }
            return false;
        }
    }

    size_t size() const { return handlers_.size(); }
    bool empty() const { return handlers_.empty(); }

private:
    std::vector<std::pair<Connection, Handler>> handlers_;
    Connection next_id_ = 1;
};

} // namespace zw::tui
