/*
 * Copyright (C) by Olivier Goffart <ogoffart@woboq.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY
 * or FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License
 * for more details.
 */

#pragma once

#include "asserts.h"

#include <new>
#include <optional>
#include <utility>

namespace CDC {

/**
 * A Result of type T, or an Error
 *
 * T and Error must be distinct types, the converting constructors
 * would be ambiguous otherwise.
 */
template <typename T, typename Error>
class Result
{
    union {
        T _result;
        Error _error;
    };
    bool _isError;

    void destroy()
    {
        if (_isError)
            _error.~Error();
        else
            _result.~T();
    }

public:
    Result(T value)
        : _result(std::move(value))
        , _isError(false)
    {
    }

    Result(Error error)
        : _error(std::move(error))
        , _isError(true)
    {
    }

    Result(Result &&other)
        : _isError(other._isError)
    {
        if (_isError) {
            new (&_error) Error(std::move(other._error));
        } else {
            new (&_result) T(std::move(other._result));
        }
    }

    Result(const Result &other)
        : _isError(other._isError)
    {
        if (_isError) {
            new (&_error) Error(other._error);
        } else {
            new (&_result) T(other._result);
        }
    }

    Result &operator=(Result &&other)
    {
        if (&other != this) {
            destroy();
            _isError = other._isError;
            if (_isError) {
                new (&_error) Error(std::move(other._error));
            } else {
                new (&_result) T(std::move(other._result));
            }
        }
        return *this;
    }

    Result &operator=(const Result &other)
    {
        if (&other != this) {
            destroy();
            _isError = other._isError;
            if (_isError) {
                new (&_error) Error(other._error);
            } else {
                new (&_result) T(other._result);
            }
        }
        return *this;
    }

    ~Result()
    {
        destroy();
    }

    explicit operator bool() const { return !_isError; }

    const T &operator*() const &
    {
        CD_ASSERT(!_isError);
        return _result;
    }
    T &operator*() &
    {
        CD_ASSERT(!_isError);
        return _result;
    }
    T operator*() &&
    {
        CD_ASSERT(!_isError);
        return std::move(_result);
    }

    const T *operator->() const
    {
        CD_ASSERT(!_isError);
        return &_result;
    }

    const Error &error() const &
    {
        CD_ASSERT(_isError);
        return _error;
    }
    Error error() &&
    {
        CD_ASSERT(_isError);
        return std::move(_error);
    }
};

/**
 * Success without a value, or an Error
 */
template <typename Error>
class Result<void, Error>
{
    std::optional<Error> _error;

public:
    Result() = default;

    Result(Error error)
        : _error(std::move(error))
    {
    }

    explicit operator bool() const { return !_error.has_value(); }

    const Error &error() const &
    {
        CD_ASSERT(_error.has_value());
        return *_error;
    }
    Error error() &&
    {
        CD_ASSERT(_error.has_value());
        return std::move(*_error);
    }
};

} // namespace CDC
