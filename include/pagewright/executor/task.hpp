#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include <boost/core/demangle.hpp>

#include "pagewright/core/error.hpp"

namespace pagewright::executor {

namespace detail {

template <typename R>
struct unwrap_result {
    using type = R;
    static constexpr bool is_result = false;
};

template <typename T>
struct unwrap_result<std::expected<T, Error>> {
    using type = T;
    static constexpr bool is_result = true;
};

template <typename F, typename Resource>
using operation_return_t = std::remove_cvref_t<std::invoke_result_t<F&, Resource&>>;

/// Value type an operation produces: `T` for operations returning either
/// `T` or `Result<T>`.
template <typename F, typename Resource>
using operation_value_t = typename unwrap_result<operation_return_t<F, Resource>>::type;

template <typename F>
struct is_nullable : std::is_pointer<F> {};

template <typename Sig>
struct is_nullable<std::function<Sig>> : std::true_type {};

template <typename Sig>
struct is_nullable<std::move_only_function<Sig>> : std::true_type {};

template <typename F>
inline constexpr bool is_nullable_v = is_nullable<std::remove_cvref_t<F>>::value;

/// Runs `op` against `resource`, turning a thrown exception into a tagged
/// failure. Errors returned through Result pass through untouched.
template <typename Resource, typename F>
auto invoke_operation(F& op, Resource& resource) -> Result<operation_value_t<F, Resource>> {
    using R = operation_return_t<F, Resource>;

    try {
        if constexpr (unwrap_result<R>::is_result) {
            return std::invoke(op, resource);
        } else if constexpr (std::is_void_v<R>) {
            std::invoke(op, resource);
            return Result<void>{};
        } else {
            return std::invoke(op, resource);
        }
    } catch (const std::exception& e) {
        return std::unexpected(make_error(ErrorCode::OperationFailed, e.what(),
                                          boost::core::demangle(typeid(e).name())));
    } catch (...) {
        return std::unexpected(make_error(ErrorCode::OperationFailed,
                                          "Operation threw a non-standard exception"));
    }
}

} // namespace detail

/// One unit of work for the worker: an operation over the owned resource
/// paired with a single-use reply slot.
///
/// The reply is any callable accepting `Result<T>`; it is invoked exactly
/// once, either with the operation's outcome (`run`) or with the reason the
/// task never ran (`abandon`).
template <typename Resource>
class Task {
public:
    template <typename F, typename Reply>
    Task(F op, Reply reply)
        : impl_(std::make_unique<Model<F, Reply>>(std::move(op), std::move(reply))) {}

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    void run(Resource& resource) { impl_->run(resource); }
    void abandon(Error error) { impl_->abandon(std::move(error)); }

    [[nodiscard]] auto sequence() const noexcept -> uint64_t { return sequence_; }
    void set_sequence(uint64_t sequence) noexcept { sequence_ = sequence; }

private:
    struct Concept {
        virtual ~Concept() = default;
        virtual void run(Resource& resource) = 0;
        virtual void abandon(Error error) = 0;
    };

    template <typename F, typename Reply>
    struct Model final : Concept {
        Model(F o, Reply r) : op(std::move(o)), reply(std::move(r)) {}

        void run(Resource& resource) override {
            reply(detail::invoke_operation(op, resource));
        }

        void abandon(Error error) override {
            reply(std::unexpected(std::move(error)));
        }

        F op;
        Reply reply;
    };

    std::unique_ptr<Concept> impl_;
    uint64_t sequence_ = 0;
};

/// Reply slot backed by a promise; the submitter reads the paired future.
template <typename T>
class PromiseReply {
public:
    explicit PromiseReply(std::promise<Result<T>> promise) : promise_(std::move(promise)) {}

    void operator()(Result<T> result) { promise_.set_value(std::move(result)); }

private:
    std::promise<Result<T>> promise_;
};

} // namespace pagewright::executor
