#pragma once

#include "converter.hpp"
#include "setting.hpp"
#include "text_value.hpp"
#include "utils/string.hpp"
#include <algorithm>
#include <initializer_list>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace cfgval {

// --------------------------------------------------------------------------------
// Insertion-ordered map

template<typename K, typename V> class OrderedMap {
public:
    using value_type = std::pair<K, V>;
    using container_type = std::vector<value_type>;
    using const_iterator = typename container_type::const_iterator;

    OrderedMap() = default;
    OrderedMap(std::initializer_list<value_type> init)
    {
        for (const auto &kv: init)
            insert_or_assign(kv.first, kv.second);
    }

    // An existing key keeps its position and gets the new value
    void insert_or_assign(K key, V value)
    {
        auto it = std::find_if(items_.begin(), items_.end(), [&key](const auto &kv) { return kv.first == key; });
        if (it != items_.end())
            it->second = std::move(value);
        else
            items_.emplace_back(std::move(key), std::move(value));
    }

    const_iterator find(const K &key) const
    {
        return std::find_if(items_.begin(), items_.end(), [&key](const auto &kv) { return kv.first == key; });
    }

    const V &at(const K &key) const
    {
        const auto it = find(key);
        if (it == items_.end())
            throw std::out_of_range("OrderedMap::at: key not found");
        return it->second;
    }

    bool contains(const K &key) const { return find(key) != items_.end(); }
    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    const_iterator begin() const { return items_.begin(); }
    const_iterator end() const { return items_.end(); }

    bool operator==(const OrderedMap &other) const { return items_ == other.items_; }
    bool operator!=(const OrderedMap &other) const { return !(*this == other); }

private:
    container_type items_;
};

// --------------------------------------------------------------------------------
// List converter

// Converts every element of a setting's list view with the element converter
template<typename T> class TypedListConverter {
public:
    explicit TypedListConverter(ConverterPtr<T> element)
        : element_(std::move(element))
    {
        if (!element_)
            throw std::invalid_argument("TypedListConverter requires an element converter");
    }

    // Throws IncompleteValueError for append-pending settings, ParseError for bad elements
    std::vector<T> operator()(const Setting &setting) const
    {
        std::vector<T> result;
        for (const auto &elem: setting.toList())
            result.push_back(element_->parse(utils::string::trim(elem)));
        return result;
    }

    std::string describe() const { return "typed_list(" + element_->typeName() + ")"; }

private:
    ConverterPtr<T> element_;
};

// --------------------------------------------------------------------------------
// Dict converters

// Map is std::map<K, V> or OrderedMap<K, V>
template<typename K, typename V, typename Map> class BasicTypedDictConverter {
public:
    using result_type = Map;

    BasicTypedDictConverter(std::string kind, ConverterPtr<K> key, ConverterPtr<V> value, V defaultForEmpty)
        : kind_(std::move(kind)), key_(std::move(key)), value_(std::move(value)), default_(std::move(defaultForEmpty))
    {
        if (!key_ || !value_)
            throw std::invalid_argument(kind_ + " requires key and value converters");
    }

    // An empty value means "use the default", it is not handed to the value converter
    Map operator()(const KeyValueList &mapping) const
    {
        Map result;
        for (const auto &[key, value]: mapping) {
            const std::string text = utils::string::trim(value);
            K converted_key = key_->parse(utils::string::trim(key));
            result.insert_or_assign(std::move(converted_key), text.empty() ? default_ : value_->parse(text));
        }
        return result;
    }

    Map operator()(const Setting &setting) const { return (*this)(setting.toDict()); }

    std::string describe() const { return kind_ + "(" + key_->typeName() + ", " + value_->typeName() + ")"; }

    const V &defaultValue() const { return default_; }

private:
    std::string kind_;
    ConverterPtr<K> key_;
    ConverterPtr<V> value_;
    V default_;
};

template<typename K, typename V> using TypedDictConverter = BasicTypedDictConverter<K, V, std::map<K, V>>;

template<typename K, typename V> using TypedOrderedDictConverter = BasicTypedDictConverter<K, V, OrderedMap<K, V>>;

// --------------------------------------------------------------------------------
// Factories

template<typename T> [[nodiscard]] TypedListConverter<T> typedList(ConverterPtr<T> element)
{
    return TypedListConverter<T>(std::move(element));
}

template<typename K, typename V>
[[nodiscard]] TypedDictConverter<K, V> typedDict(ConverterPtr<K> key, ConverterPtr<V> value, V defaultForEmpty)
{
    return TypedDictConverter<K, V>("typed_dict", std::move(key), std::move(value), std::move(defaultForEmpty));
}

template<typename K, typename V>
[[nodiscard]] TypedOrderedDictConverter<K, V> typedOrderedDict(ConverterPtr<K> key, ConverterPtr<V> value,
                                                               V defaultForEmpty)
{
    return TypedOrderedDictConverter<K, V>("typed_ordered_dict", std::move(key), std::move(value),
                                           std::move(defaultForEmpty));
}

// --------------------------------------------------------------------------------
// Prebuilt list converters

inline const TypedListConverter<std::string> strList = typedList(makeConverter<std::string>());
inline const TypedListConverter<long> intList = typedList(makeConverter<long>());
inline const TypedListConverter<double> floatList = typedList(makeConverter<double>());
inline const TypedListConverter<bool> boolList = typedList(makeConverter<bool>());

} // namespace cfgval
