#ifndef REDISKIT_CORE_OP_RESULT_HPP
#define REDISKIT_CORE_OP_RESULT_HPP

#include <cstddef>
#include <exception>
#include <utility>
#include <variant>

namespace rediskit::core {

// terminal outcome of an operation: Success(value) or Failure(cause)
template <typename T>
class OpResult {
   public:
    static OpResult success(T value) { return OpResult(std::in_place_index<0>, std::move(value)); }
    static OpResult failure(std::exception_ptr cause) {
        return OpResult(std::in_place_index<1>, std::move(cause));
    }

    [[nodiscard]] bool is_success() const noexcept { return state_.index() == 0; }

    // rethrows the cause of a failure
    const T& get() const& {
        if (!is_success()) {
            std::rethrow_exception(std::get<1>(state_));
        }
        return std::get<0>(state_);
    }

    T get() && {
        if (!is_success()) {
            std::rethrow_exception(std::get<1>(state_));
        }
        return std::move(std::get<0>(state_));
    }

    [[nodiscard]] std::exception_ptr cause() const noexcept {
        return is_success() ? nullptr : std::get<1>(state_);
    }

   private:
    template <std::size_t I, typename V>
    OpResult(std::in_place_index_t<I> index, V&& value) : state_(index, std::forward<V>(value)) {}

    std::variant<T, std::exception_ptr> state_;
};

}  // namespace rediskit::core

#endif
