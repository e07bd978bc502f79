#pragma once

#include <plume/result.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace plume {

// Calendar date, no time zone or locale attached
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    // Strict "YYYY-MM-DD" with range checks (leap years included)
    static Result<Date> parse(const std::string& text);

    // ISO-8601, zero padded: 2026-01-15
    std::string to_string() const;

    bool operator==(const Date& o) const {
        return year == o.year && month == o.month && day == o.day;
    }
    bool operator!=(const Date& o) const { return !(*this == o); }
};

// Immutable tagged variant holding template data. Composite payloads are
// shared, so copies are cheap and never duplicate the tree.
class Value {
public:
    enum class Kind {
        String,
        Integer,
        Float,
        Boolean,
        Date,
        List,
        Table
    };

    using List = std::vector<Value>;
    using Table = std::map<std::string, Value>;

    // Defaults to an empty table
    Value();

    static Value string(std::string s);
    static Value integer(std::int64_t i);
    static Value floating(double d);
    static Value boolean(bool b);
    static Value date(Date d);
    static Value list(List items);
    static Value table(Table entries);

    Kind kind() const { return kind_; }

    bool is_string() const { return kind_ == Kind::String; }
    bool is_integer() const { return kind_ == Kind::Integer; }
    bool is_float() const { return kind_ == Kind::Float; }
    bool is_boolean() const { return kind_ == Kind::Boolean; }
    bool is_date() const { return kind_ == Kind::Date; }
    bool is_list() const { return kind_ == Kind::List; }
    bool is_table() const { return kind_ == Kind::Table; }
    bool is_scalar() const { return !is_list() && !is_table(); }

    // Accessors throw std::bad_variant_access on a kind mismatch
    const std::string& as_string() const;
    std::int64_t as_integer() const;
    double as_float() const;
    bool as_boolean() const;
    const Date& as_date() const;
    const List& as_list() const;
    const Table& as_table() const;

    // Table child by key, nullptr if absent or not a table
    const Value* find(const std::string& key) const;

    // Element count for lists and tables, 0 for scalars
    std::size_t size() const;

    // Placeholder text for scalars; TypeMismatch for lists and tables.
    // `path` is only used to label the error.
    Result<std::string> to_display_string(const std::string& path = "") const;

    bool operator==(const Value& o) const;
    bool operator!=(const Value& o) const { return !(*this == o); }

private:
    using Storage = std::variant<std::string,
                                 std::int64_t,
                                 double,
                                 bool,
                                 Date,
                                 std::shared_ptr<const List>,
                                 std::shared_ptr<const Table>>;

    Value(Kind k, Storage s) : kind_(k), data_(std::move(s)) {}

    Kind kind_;
    Storage data_;
};

const char* kind_name(Value::Kind k);

// Canonical, locale-independent float text: shortest round-trip decimal in
// fixed notation ("1.5", "1", "0.1"); "NaN", "inf", "-inf" for non-finite.
std::string format_float(double d);

} // namespace plume
