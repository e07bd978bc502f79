#include <plume/toml_value.hpp>
#include <sstream>

namespace plume {

template<typename T>
static std::string toml_text(const T& v) {
    std::ostringstream ss;
    ss << v;
    return ss.str();
}

Value value_from_toml(const toml::node& node) {
    if (auto tbl = node.as_table()) {
        Value::Table entries;
        for (const auto& [key, val] : *tbl) {
            entries.emplace(std::string(key.str()), value_from_toml(val));
        }
        return Value::table(std::move(entries));
    }
    if (auto arr = node.as_array()) {
        Value::List items;
        items.reserve(arr->size());
        for (const auto& elem : *arr) {
            items.push_back(value_from_toml(elem));
        }
        return Value::list(std::move(items));
    }
    if (auto s = node.as_string()) {
        return Value::string(s->get());
    }
    if (auto i = node.as_integer()) {
        return Value::integer(i->get());
    }
    if (auto f = node.as_floating_point()) {
        return Value::floating(f->get());
    }
    if (auto b = node.as_boolean()) {
        return Value::boolean(b->get());
    }
    if (auto d = node.as_date()) {
        const toml::date& td = d->get();
        return Value::date(Date{td.year, td.month, td.day});
    }
    if (auto t = node.as_time()) {
        return Value::string(toml_text(t->get()));
    }
    if (auto dt = node.as_date_time()) {
        return Value::string(toml_text(dt->get()));
    }
    return Value::string("");
}

} // namespace plume
