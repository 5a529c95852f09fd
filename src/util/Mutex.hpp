//------------------------------------------------------------------------------
/*
    This file is part of chainrelay.
    Copyright (c) 2024, the chainrelay developers.

    Permission to use, copy, modify, and distribute this software for any
    purpose with or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL,  DIRECT,  INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#pragma once

#include <mutex>
#include <type_traits>
#include <utility>

namespace util {

template <typename ProtectedDataType, typename MutexType>
class Mutex;

/**
 * @brief Grants access to the data guarded by a @ref Mutex for as long as the lock is alive.
 *
 * @tparam ProtectedDataType The guarded data type, const-qualified for read only access
 * @tparam LockType The lock type, e.g. std::lock_guard or std::shared_lock
 * @tparam MutexType The mutex type
 */
template <typename ProtectedDataType, template <typename> typename LockType, typename MutexType>
class Lock {
    LockType<MutexType> lock_;
    ProtectedDataType& data_;

public:
    ProtectedDataType&
    operator*() const
    {
        return data_;
    }

    ProtectedDataType*
    operator->() const
    {
        return &data_;
    }

    ProtectedDataType&
    get() const
    {
        return data_;
    }

private:
    friend class Mutex<std::remove_const_t<ProtectedDataType>, MutexType>;

    Lock(MutexType& mutex, ProtectedDataType& data) : lock_(mutex), data_(data)
    {
    }
};

/**
 * @brief Data bundled with the mutex that guards it. The data is only reachable through @ref lock().
 *
 * @tparam ProtectedDataType The guarded data type
 * @tparam MutexType The mutex type
 */
template <typename ProtectedDataType, typename MutexType = std::mutex>
class Mutex {
    mutable MutexType mutex_;
    ProtectedDataType data_;

public:
    Mutex() = default;

    explicit Mutex(ProtectedDataType data) : data_(std::move(data))
    {
    }

    template <template <typename> typename LockType = std::lock_guard>
    Lock<ProtectedDataType const, LockType, MutexType>
    lock() const
    {
        return {mutex_, data_};
    }

    template <template <typename> typename LockType = std::lock_guard>
    Lock<ProtectedDataType, LockType, MutexType>
    lock()
    {
        return {mutex_, data_};
    }
};

}  // namespace util
