#pragma once

#include <algorithm>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

#include "Base.hpp"
#include "Error.hpp"

namespace Cosmos
{
    template<typename E>
    struct ErrorValue
    {
        E value;

        constexpr explicit ErrorValue(const E& e) : value(e) {}
        constexpr explicit ErrorValue(E&& e) : value(std::move(e)) {}
    };

    template<typename E>
    constexpr ErrorValue<std::decay_t<E>> Err(E&& e)
    {
        return ErrorValue<std::decay_t<E>>(std::forward<E>(e));
    }

    namespace internal
    {
        template<typename T, typename E>
        struct VariantStorage
        {
            static constexpr std::size_t size = std::max(sizeof(T), sizeof(E));
            static constexpr std::size_t alignment = std::max(alignof(T), alignof(E));

            alignas(alignment) std::uint8_t data[size];

            template<typename U>
            U* as() noexcept
            {
                return std::launder(reinterpret_cast<U*>(&data));
            }

            template<typename U>
            const U* as() const noexcept
            {
                return std::launder(reinterpret_cast<const U*>(&data));
            }
        };
    }

    /**
     * Value-or-error return type used by every fallible Cosmos operation.
     * Expected non-results (an already registered address, an absent key) are
     * modelled in T, never in E.
     */
    template<typename T, typename E>
    class Result
    {
        static_assert(!std::is_reference_v<T>, "T cannot be a reference type");
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");

    public:
        using ValueType = T;
        using ErrorType = E;

        Result(const T& value) : m_hasValue(true)
        {
            ::new(ValPtr()) T(value);
        }

        Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>) : m_hasValue(true)
        {
            ::new(ValPtr()) T(std::move(value));
        }

        Result(const ErrorValue<E>& err) : m_hasValue(false)
        {
            ::new(ErrPtr()) E(err.value);
        }

        Result(ErrorValue<E>&& err) : m_hasValue(false)
        {
            ::new(ErrPtr()) E(std::move(err.value));
        }

        Result(const Result& other) : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
                ::new(ValPtr()) T(*other.ValPtr());
            else
                ::new(ErrPtr()) E(*other.ErrPtr());
        }

        Result(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
            : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
                ::new(ValPtr()) T(std::move(*other.ValPtr()));
            else
                ::new(ErrPtr()) E(std::move(*other.ErrPtr()));
        }

        ~Result()
        {
            Destroy();
        }

        Result& operator=(const Result& other)
        {
            if (this != &other)
            {
                Result copy(other);
                *this = std::move(copy);
            }
            return *this;
        }

        Result& operator=(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
        {
            if (this != &other)
            {
                Destroy();
                m_hasValue = other.m_hasValue;
                if (m_hasValue)
                    ::new(ValPtr()) T(std::move(*other.ValPtr()));
                else
                    ::new(ErrPtr()) E(std::move(*other.ErrPtr()));
            }
            return *this;
        }

        COSMOS_NODISCARD bool HasValue() const noexcept { return m_hasValue; }
        COSMOS_NODISCARD bool IsOk() const noexcept { return m_hasValue; }
        COSMOS_NODISCARD bool IsErr() const noexcept { return !m_hasValue; }
        COSMOS_NODISCARD explicit operator bool() const noexcept { return m_hasValue; }

        T& Value() &
        {
            COSMOS_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return *ValPtr();
        }

        const T& Value() const&
        {
            COSMOS_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return *ValPtr();
        }

        T&& Value() &&
        {
            COSMOS_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return std::move(*ValPtr());
        }

        const E& Error() const&
        {
            COSMOS_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return *ErrPtr();
        }

        E&& Error() &&
        {
            COSMOS_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return std::move(*ErrPtr());
        }

        T& operator*() & { return Value(); }
        const T& operator*() const& { return Value(); }
        T* operator->() noexcept { return ValPtr(); }
        const T* operator->() const noexcept { return ValPtr(); }

        template<typename U>
        COSMOS_NODISCARD T ValueOr(U&& defaultValue) const&
        {
            return m_hasValue ? *ValPtr() : static_cast<T>(std::forward<U>(defaultValue));
        }

    private:
        void Destroy()
        {
            if (m_hasValue)
            {
                if constexpr (!std::is_trivially_destructible_v<T>)
                    ValPtr()->~T();
            }
            else
            {
                if constexpr (!std::is_trivially_destructible_v<E>)
                    ErrPtr()->~E();
            }
        }

        T* ValPtr() noexcept { return m_storage.template as<T>(); }
        const T* ValPtr() const noexcept { return m_storage.template as<T>(); }
        E* ErrPtr() noexcept { return m_storage.template as<E>(); }
        const E* ErrPtr() const noexcept { return m_storage.template as<E>(); }

        internal::VariantStorage<T, E> m_storage;
        bool m_hasValue;
    };

    template<typename E>
    class Result<void, E>
    {
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");
        static_assert(std::is_copy_constructible_v<E>, "E must be copy constructible");

    public:
        using ValueType = void;
        using ErrorType = E;

        Result() noexcept : m_error(), m_hasValue(true) {}

        Result(const ErrorValue<E>& err) : m_error(err.value), m_hasValue(false) {}
        Result(ErrorValue<E>&& err) : m_error(std::move(err.value)), m_hasValue(false) {}

        COSMOS_NODISCARD bool HasValue() const noexcept { return m_hasValue; }
        COSMOS_NODISCARD bool IsOk() const noexcept { return m_hasValue; }
        COSMOS_NODISCARD bool IsErr() const noexcept { return !m_hasValue; }
        COSMOS_NODISCARD explicit operator bool() const noexcept { return m_hasValue; }

        const E& Error() const&
        {
            COSMOS_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return m_error;
        }

    private:
        E m_error;
        bool m_hasValue;
    };

    template<typename T, typename E>
    COSMOS_NODISCARD bool operator==(const Result<T, E>& lhs, const ErrorValue<E>& rhs)
    {
        return lhs.IsErr() && lhs.Error() == rhs.value;
    }

    inline Result<void, Error> Ok()
    {
        return Result<void, Error>();
    }

    template<typename T>
    inline auto Ok(T&& value) -> Result<std::decay_t<T>, Error>
    {
        return Result<std::decay_t<T>, Error>(std::forward<T>(value));
    }
}
