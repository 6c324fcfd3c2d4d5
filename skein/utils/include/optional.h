//--------------------------------------------------------------------------------------------------------------------//
//                                                                                                                    //
//                                 Skein: Distributed Execution for Dataframe Queries                                 //
//                                                                                                                    //
//                                                                                                                    //
//  (c) 2021 - 2026, Skein team                                                                                       //
//  Created by the Skein team first on 10/19/2026                                                                     //
//  License: Apache 2.0                                                                                               //
//--------------------------------------------------------------------------------------------------------------------//

#ifndef SKEIN_OPTIONAL_H
#define SKEIN_OPTIONAL_H

#include <stdexcept>
#include <utility>

namespace skein {
    //! class mimicking optional of C++17, used for values which may be unknown (e.g. size estimates).
    //! \tparam T
    template<typename T> class option {
    private:
        T _data;
        bool _isNone;
    public:
        option() : _data(), _isNone(true)  {}
        option(const T& value) : _data(value), _isNone(false)   {}
        option(T&& value) : _data(std::move(value)), _isNone(false) {}
        option(const option& other) : _data(other._data), _isNone(other._isNone)    {}
        option& operator = (const option& other) { _data = other._data; _isNone = other._isNone; return *this; }
        option& operator = (const T& value) {_data = value; _isNone = false; return *this;}

        bool has_value() const { return !_isNone; }
        T value() const {
            if(_isNone)
                throw std::runtime_error("accessing empty option");
            return _data;
        }

        T value_or(const T& alternative) const { return _isNone ? alternative : _data; }

        static const option none;

        bool operator == (const T& other) const {
            if(_isNone)
                return false;
            return _data == other;
        }

        bool operator != (const T& other) const {
            return !(*this == other);
        }

        bool operator == (const option<T>& other) const {
            if(_isNone || other._isNone)
                return _isNone == other._isNone;
            return _data == other._data;
        }

        bool operator != (const option<T>& other) const {
            return !(*this == other);
        }
    };

    template<typename T> const option<T> option<T>::none=option();

    template<typename T> inline bool operator == (const T& lhs, const option<T>& rhs) {
        return rhs == lhs;
    }

    template<typename T> inline bool operator != (const T& lhs, const option<T>& rhs) {
        return rhs != lhs;
    }
}
#endif //SKEIN_OPTIONAL_H
