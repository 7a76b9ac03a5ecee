#pragma once

#include "exceptions.hpp"
#include "utils/string.hpp"
#include <boost/lexical_cast.hpp>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace cfgval {

// --------------------------------------------------------------------------------
// Type names used in conversion error messages

template<typename T> std::string typeName()
{
    if constexpr (std::is_same_v<T, std::string>)
        return "str";
    else if constexpr (std::is_same_v<T, bool>)
        return "bool";
    else if constexpr (std::is_integral_v<T>)
        return "int";
    else if constexpr (std::is_floating_point_v<T>)
        return "float";
    else
        return "value";
}

// --------------------------------------------------------------------------------
// Scalar conversion

// Accepts the words of truth and falsehood understood in configuration files.
// Comparison is case-insensitive, surrounding whitespace is ignored.
[[nodiscard]] bool parseBool(const std::string &str);

// Numeric conversion is strict: surrounding whitespace is ignored, anything
// else that is not part of the number ("42abc") is rejected.
template<typename T> T fromString(const std::string &str)
{
    if constexpr (std::is_same_v<T, std::string>) {
        return str;
    } else {
        try {
            return boost::lexical_cast<T>(utils::string::trim(str));
        } catch (const boost::bad_lexical_cast &) {
            throw ParseError(str, typeName<T>());
        }
    }
}

template<> inline bool fromString<bool>(const std::string &str)
{
    return parseBool(str);
}

// --------------------------------------------------------------------------------
// Converter interface

// Turns one textual element into a T. Implementations are stateless so a
// single instance can be shared by any number of settings.
template<typename T> class Converter {
public:
    using value_type = T;

    virtual ~Converter() = default;

    // Throws ParseError if `text` is not a valid T
    virtual T parse(const std::string &text) const = 0;

    virtual std::string typeName() const = 0;

    T operator()(const std::string &text) const { return parse(text); }
};

template<typename T> using ConverterPtr = std::shared_ptr<const Converter<T>>;


template<typename T> class ScalarConverter final : public Converter<T> {
public:
    T parse(const std::string &text) const override { return fromString<T>(text); }
    std::string typeName() const override { return cfgval::typeName<T>(); }
};


// Adapts any callable. std::invalid_argument and std::out_of_range thrown by
// the callable (std::stoi and friends) are reported as ParseError.
template<typename T> class FunctionConverter final : public Converter<T> {
public:
    using Function = std::function<T(const std::string &)>;

    FunctionConverter(Function fn, std::string name)
        : fn_(std::move(fn)), name_(std::move(name))
    {
        if (!fn_)
            throw std::invalid_argument("FunctionConverter requires a callable");
    }

    T parse(const std::string &text) const override
    {
        try {
            return fn_(text);
        } catch (const std::invalid_argument &) {
            throw ParseError(text, name_);
        } catch (const std::out_of_range &) {
            throw ParseError(text, name_);
        }
    }

    std::string typeName() const override { return name_; }

private:
    Function fn_;
    std::string name_;
};


template<typename T> [[nodiscard]] ConverterPtr<T> makeConverter()
{
    return std::make_shared<const ScalarConverter<T>>();
}

template<typename T>
[[nodiscard]] ConverterPtr<T> makeConverter(std::function<T(const std::string &)> fn, std::string name)
{
    return std::make_shared<const FunctionConverter<T>>(std::move(fn), std::move(name));
}

} // namespace cfgval
