#pragma once

#include <memory>
#include <type_traits>
#include <arcspin/result.hpp>

namespace arcspin {
namespace base {

// Context type for ObjectFactory - compile-time marker that the create
// protocol is implemented on purpose
struct ObjectFactoryContext {};

// ObjectFactory - enforces the create protocol for shared_ptr objects
//
//   1. Header declares the interface type (e.g., FrameDriver)
//   2. Cpp defines a private subclass (e.g., FrameDriverImpl) with init()
//   3. createImpl() builds the Impl, calls init(), returns Result<Ptr>
//
// Subclass must implement one of (checked in order):
//   1. static Result<Ptr> createImpl(ContextType&, Args...)
//   2. static Result<Ptr> createImpl(Args...)
//   3. static Result<Ptr> createImpl()
//
// Example:
//   // frame-driver.h
//   class FrameDriver : public Object, public ObjectFactory<FrameDriver> {
//   public:
//       static Result<Ptr> createImpl(int durationMs);
//       virtual Result<void> advance(double deltaMs) = 0;
//   };
//
//   // frame-driver.cpp
//   Result<FrameDriver::Ptr> FrameDriver::createImpl(int durationMs) {
//       auto impl = std::shared_ptr<FrameDriverImpl>(new FrameDriverImpl());
//       if (auto res = impl->setDuration(durationMs); !res)
//           return Err<Ptr>("Failed to create FrameDriver", res);
//       return Ok(Ptr(std::move(impl)));
//   }
//
template<typename T, typename ContextT = ObjectFactoryContext>
class ObjectFactory {
public:
    using ContextType = ContextT;
    using Type = T;
    using Ptr = std::shared_ptr<T>;
    using FactoryType = ObjectFactory<Type, ContextType>;

private:
    // SFINAE: check for static Result<Ptr> createImpl(ContextType&, Args...)
    template<typename FType, typename... Args>
    struct HasCreateImplWithContext {
    private:
        template<typename F>
        static auto check(F*) -> decltype(
            F::Type::createImpl(std::declval<typename F::ContextType&>(),
                               std::declval<Args>()...),
            std::true_type{});
        template<typename>
        static std::false_type check(...);
    public:
        static constexpr bool value =
            std::is_same_v<decltype(check<FType>(nullptr)), std::true_type>;
    };

    // SFINAE: check for static Result<Ptr> createImpl(Args...)
    template<typename FType, typename... Args>
    struct HasCreateImpl {
    private:
        template<typename F>
        static auto check(F*) -> decltype(
            F::Type::createImpl(std::declval<Args>()...),
            std::true_type{});
        template<typename>
        static std::false_type check(...);
    public:
        static constexpr bool value =
            std::is_same_v<decltype(check<FType>(nullptr)), std::true_type>;
    };

public:
    template<typename... Args>
    static Result<Ptr> create(Args&&... args) {
        ContextType context;

        if constexpr (HasCreateImplWithContext<FactoryType, Args...>::value) {
            return Type::createImpl(context, std::forward<Args>(args)...);

        } else if constexpr (HasCreateImpl<FactoryType, Args...>::value) {
            return Type::createImpl(std::forward<Args>(args)...);

        } else {
            // clang-format off
            static_assert(sizeof(T) == 0,
                "ObjectFactory: No createImpl found.\n"
                "Subclass must implement one of (checked in order):\n"
                "  1. static Result<Ptr> createImpl(ContextType&, Args...)\n"
                "  2. static Result<Ptr> createImpl(Args...)\n"
                "  3. static Result<Ptr> createImpl()\n");
            // clang-format on
            return Err<Ptr>("unreachable");
        }
    }
};

// ThreadSingleton context type
struct ThreadSingletonContext {};

// ThreadSingleton - one instance per thread
//
// Subclass must implement static Result<Ptr> createImpl().
//
// instance() returns Result<Ptr> - if creation fails, the error is cached
// per-thread and returned on all subsequent calls from that thread.
//
template<typename T, typename ContextT = ThreadSingletonContext>
class ThreadSingleton {
public:
    using ContextType = ContextT;
    using Type = T;
    using Ptr = std::shared_ptr<T>;

    static Result<Ptr> instance() {
        static thread_local Result<Ptr> _instance = []() -> Result<Ptr> {
            auto result = Type::createImpl();
            if (!result) {
                return Err<Ptr>("ThreadSingleton creation failed", result);
            }
            return result;
        }();
        return _instance;
    }

protected:
    ThreadSingleton() = default;
};

} // namespace base
} // namespace arcspin
