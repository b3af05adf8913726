#pragma once

#include <algorithm>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

#include "Base.hpp"

namespace Lanescan
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
     * Value-or-error without exceptions. Build operations return Result so a
     * failed build can hand its payload (e.g. the caller's entries) back.
     */
    template<typename T, typename E>
    class Result
    {
        static_assert(!std::is_reference_v<T>, "T cannot be a reference type");
        static_assert(!std::is_reference_v<E>, "E cannot be a reference type");

    public:
        using ValueType = T;
        using ErrorType = E;

        Result(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>) : m_hasValue(true)
        {
            ConstructValue(value);
        }

        Result(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>) : m_hasValue(true)
        {
            ConstructValue(std::move(value));
        }

        Result(const ErrorValue<E>& err) noexcept(std::is_nothrow_copy_constructible_v<E>) : m_hasValue(false)
        {
            ConstructError(err.value);
        }

        Result(ErrorValue<E>&& err) noexcept(std::is_nothrow_move_constructible_v<E>) : m_hasValue(false)
        {
            ConstructError(std::move(err.value));
        }

        Result(const Result& other) : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
            {
                ConstructValue(*other.ValPtr());
            }
            else
            {
                ConstructError(*other.ErrPtr());
            }
        }

        Result(Result&& other) noexcept(std::is_nothrow_move_constructible_v<T> && std::is_nothrow_move_constructible_v<E>)
            : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
            {
                ConstructValue(std::move(*other.ValPtr()));
            }
            else
            {
                ConstructError(std::move(*other.ErrPtr()));
            }
        }

        ~Result()
        {
            Destroy();
        }

        Result& operator=(const Result& other)
        {
            if (this != &other)
            {
                Destroy();
                m_hasValue = other.m_hasValue;
                if (m_hasValue)
                {
                    ConstructValue(*other.ValPtr());
                }
                else
                {
                    ConstructError(*other.ErrPtr());
                }
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
                {
                    ConstructValue(std::move(*other.ValPtr()));
                }
                else
                {
                    ConstructError(std::move(*other.ErrPtr()));
                }
            }
            return *this;
        }

        [[nodiscard]] bool HasValue() const noexcept { return m_hasValue; }
        [[nodiscard]] bool IsOk() const noexcept { return m_hasValue; }
        [[nodiscard]] bool IsErr() const noexcept { return !m_hasValue; }
        [[nodiscard]] explicit operator bool() const noexcept { return m_hasValue; }

        T& Value() &
        {
            LANESCAN_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return *ValPtr();
        }

        const T& Value() const&
        {
            LANESCAN_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return *ValPtr();
        }

        T&& Value() &&
        {
            LANESCAN_ASSERT(m_hasValue, "Called Value() on Result containing error");
            return std::move(*ValPtr());
        }

        E& Error() &
        {
            LANESCAN_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return *ErrPtr();
        }

        const E& Error() const&
        {
            LANESCAN_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return *ErrPtr();
        }

        E&& Error() &&
        {
            LANESCAN_ASSERT(!m_hasValue, "Called Error() on Result containing value");
            return std::move(*ErrPtr());
        }

        T& operator*() & { return Value(); }
        const T& operator*() const& { return Value(); }
        T&& operator*() && { return std::move(*this).Value(); }

        T* operator->() noexcept
        {
            LANESCAN_ASSERT(m_hasValue, "Called operator-> on Result containing error");
            return ValPtr();
        }

        const T* operator->() const noexcept
        {
            LANESCAN_ASSERT(m_hasValue, "Called operator-> on Result containing error");
            return ValPtr();
        }

    private:
        template<typename... Args>
        void ConstructValue(Args&&... args)
        {
            ::new(ValPtr()) T(std::forward<Args>(args)...);
        }

        template<typename... Args>
        void ConstructError(Args&&... args)
        {
            ::new(ErrPtr()) E(std::forward<Args>(args)...);
        }

        void Destroy() noexcept
        {
            if (m_hasValue)
            {
                if constexpr (!std::is_trivially_destructible_v<T>)
                {
                    ValPtr()->~T();
                }
            }
            else
            {
                if constexpr (!std::is_trivially_destructible_v<E>)
                {
                    ErrPtr()->~E();
                }
            }
        }

        T* ValPtr() noexcept { return m_storage.template as<T>(); }
        const T* ValPtr() const noexcept { return m_storage.template as<T>(); }
        E* ErrPtr() noexcept { return m_storage.template as<E>(); }
        const E* ErrPtr() const noexcept { return m_storage.template as<E>(); }

        internal::VariantStorage<T, E> m_storage;
        bool m_hasValue;
    };
}
