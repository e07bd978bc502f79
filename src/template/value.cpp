#include <plume/value.hpp>
#include <charconv>
#include <cmath>
#include <cstdio>

namespace plume {

// ---------------------------------------------------------------------------
// Date
// ---------------------------------------------------------------------------

static bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static int days_in_month(int y, int m) {
    static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) return 29;
    return days[m - 1];
}

Result<Date> Date::parse(const std::string& text) {
    auto bad = [&]() {
        return PlumeError{PlumeError::Parse,
            "invalid date '" + text + "'", "expected YYYY-MM-DD"};
    };

    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return bad();
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (text[i] < '0' || text[i] > '9') return bad();
    }

    Date d;
    d.year = std::stoi(text.substr(0, 4));
    d.month = std::stoi(text.substr(5, 2));
    d.day = std::stoi(text.substr(8, 2));
    if (d.month < 1 || d.month > 12) return bad();
    if (d.day < 1 || d.day > days_in_month(d.year, d.month)) return bad();
    return Result<Date>::ok(d);
}

std::string Date::to_string() const {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
    return buf;
}

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

Value::Value()
    : kind_(Kind::Table),
      data_(std::in_place_type<std::shared_ptr<const Table>>,
            std::make_shared<const Table>()) {}

Value Value::string(std::string s) {
    return Value(Kind::String, Storage(std::in_place_type<std::string>, std::move(s)));
}

Value Value::integer(std::int64_t i) {
    return Value(Kind::Integer, Storage(std::in_place_type<std::int64_t>, i));
}

Value Value::floating(double d) {
    return Value(Kind::Float, Storage(std::in_place_type<double>, d));
}

Value Value::boolean(bool b) {
    return Value(Kind::Boolean, Storage(std::in_place_type<bool>, b));
}

Value Value::date(Date d) {
    return Value(Kind::Date, Storage(std::in_place_type<Date>, d));
}

Value Value::list(List items) {
    return Value(Kind::List, Storage(std::in_place_type<std::shared_ptr<const List>>,
                                     std::make_shared<const List>(std::move(items))));
}

Value Value::table(Table entries) {
    return Value(Kind::Table, Storage(std::in_place_type<std::shared_ptr<const Table>>,
                                      std::make_shared<const Table>(std::move(entries))));
}

const std::string& Value::as_string() const {
    return std::get<std::string>(data_);
}

std::int64_t Value::as_integer() const {
    return std::get<std::int64_t>(data_);
}

double Value::as_float() const {
    return std::get<double>(data_);
}

bool Value::as_boolean() const {
    return std::get<bool>(data_);
}

const Date& Value::as_date() const {
    return std::get<Date>(data_);
}

const Value::List& Value::as_list() const {
    return *std::get<std::shared_ptr<const List>>(data_);
}

const Value::Table& Value::as_table() const {
    return *std::get<std::shared_ptr<const Table>>(data_);
}

const Value* Value::find(const std::string& key) const {
    if (!is_table()) return nullptr;
    const auto& tbl = as_table();
    auto it = tbl.find(key);
    if (it == tbl.end()) return nullptr;
    return &it->second;
}

std::size_t Value::size() const {
    if (is_list()) return as_list().size();
    if (is_table()) return as_table().size();
    return 0;
}

Result<std::string> Value::to_display_string(const std::string& path) const {
    switch (kind_) {
    case Kind::String:  return Result<std::string>::ok(as_string());
    case Kind::Integer: return Result<std::string>::ok(std::to_string(as_integer()));
    case Kind::Float:   return Result<std::string>::ok(format_float(as_float()));
    case Kind::Boolean: return Result<std::string>::ok(as_boolean() ? "true" : "false");
    case Kind::Date:    return Result<std::string>::ok(as_date().to_string());
    case Kind::List:
    case Kind::Table:
        break;
    }
    return PlumeError::type_mismatch(path, "scalar", kind_name(kind_));
}

bool Value::operator==(const Value& o) const {
    if (kind_ != o.kind_) return false;
    switch (kind_) {
    case Kind::List:  return as_list() == o.as_list();
    case Kind::Table: return as_table() == o.as_table();
    default:          return data_ == o.data_;
    }
}

const char* kind_name(Value::Kind k) {
    switch (k) {
    case Value::Kind::String:  return "String";
    case Value::Kind::Integer: return "Integer";
    case Value::Kind::Float:   return "Float";
    case Value::Kind::Boolean: return "Boolean";
    case Value::Kind::Date:    return "Date";
    case Value::Kind::List:    return "List";
    case Value::Kind::Table:   return "Table";
    }
    return "Unknown";
}

std::string format_float(double d) {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";
    if (d == 0.0) return "0";

    // Shortest round-trip digits, then laid out in fixed notation so large
    // values print as 100000000000000000000000 rather than 99999999999999991611392
    char buf[64];
    auto r = std::to_chars(buf, buf + sizeof(buf), d, std::chars_format::scientific);
    if (r.ec != std::errc()) {
        std::snprintf(buf, sizeof(buf), "%.17g", d);
        return buf;
    }
    std::string sci(buf, r.ptr);

    std::string out;
    size_t i = 0;
    if (sci[i] == '-') {
        out += '-';
        ++i;
    }
    size_t e = sci.find('e', i);
    std::string digits;
    for (size_t k = i; k < e; ++k) {
        if (sci[k] != '.') digits += sci[k];
    }
    int exp = std::stoi(sci.substr(e + 1));

    // Position of the decimal point relative to the first digit
    int point = exp + 1;
    int n = static_cast<int>(digits.size());
    if (point >= n) {
        out += digits;
        out.append(static_cast<size_t>(point - n), '0');
    } else if (point <= 0) {
        out += "0.";
        out.append(static_cast<size_t>(-point), '0');
        out += digits;
    } else {
        out += digits.substr(0, static_cast<size_t>(point));
        out += '.';
        out += digits.substr(static_cast<size_t>(point));
    }
    return out;
}

} // namespace plume
