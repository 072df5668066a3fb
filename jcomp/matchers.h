#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "errors.h"
#include "json.h"
#include "pointer.h"

// =============================================================================
// jcomp matchers
//
// A Matcher is a flexible expectation used by response assertions: it is
// "equal" to any actual value it accepts.  Matchers are created by name from
// a MatcherRegistry, the same way generators are:
//
//   auto m = registry.construct("AnyNumberGreaterThan", {5}, json::object());
//   m->matches(7);   // true
//
// Inside a document a composed matcher is stored as a plain descriptor
//
//   {"$matcher": "AnyNumberGreaterThan", "$args": [5], "$kwargs": {}}
//
// so it survives copies made by references; deep_match() turns descriptors
// back into matchers while comparing an expected tree with an actual one.
// =============================================================================

namespace jcomp {

class Matcher {
public:
    virtual ~Matcher() = default;

    virtual bool matches(const json& value) const = 0;

    /** Human readable form, e.g. "<Any Number>". */
    virtual std::string repr() const = 0;
};

class MatcherRegistry;

/** Outcome of deep_match(): `pointer` and `reason` describe the first mismatch. */
struct MatchResult {
    bool        ok = true;
    std::string pointer;
    std::string reason;

    explicit operator bool() const noexcept { return ok; }
};

class MatcherRegistry {
public:
    using Factory = std::function<std::shared_ptr<const Matcher>(
        const json& args, const json& kwargs, const MatcherRegistry& registry)>;

    static constexpr const char* DESCRIPTOR_KEY = "$matcher";
    static constexpr const char* ARGS_KEY       = "$args";
    static constexpr const char* KWARGS_KEY     = "$kwargs";

    static MatcherRegistry with_builtins() {
        MatcherRegistry registry;
        registry.add_builtins();
        return registry;
    }

    // ---- registration ----

    void add(const std::string& name, Factory factory, bool override = false) {
        if (name.empty()) {
            throw InvalidOperationError("Matcher name must not be empty.");
        }
        if (!override && factories_.count(name)) {
            throw InvalidOperationError("Matcher \"" + name + "\" already registered!");
        }
        factories_[name] = std::move(factory);
    }

    bool remove(const std::string& name) { return factories_.erase(name) > 0; }

    bool contains(const std::string& name) const { return factories_.count(name) != 0; }

    void add_builtins();

    // ---- construction ----

    /** Throws InvalidOperationError for unknown names or invalid arguments. */
    std::shared_ptr<const Matcher> construct(const std::string& name,
                                             const json& args = json::array(),
                                             const json& kwargs = json::object()) const {
        auto it = factories_.find(name);
        if (it == factories_.end()) {
            throw InvalidOperationError("Failed to find matcher with name \"" + name + "\"!");
        }
        if (!args.is_array() || !kwargs.is_object()) {
            throw InvalidOperationError("Matcher \"" + name
                                        + "\" expects an array of arguments and an object of named arguments.");
        }
        return it->second(args, kwargs, *this);
    }

    static json descriptor(const std::string& name, const json& args, const json& kwargs) {
        return json{ { DESCRIPTOR_KEY, name }, { ARGS_KEY, args }, { KWARGS_KEY, kwargs } };
    }

    static bool is_descriptor(const json& value) {
        return value.is_object() && value.contains(DESCRIPTOR_KEY) && value[DESCRIPTOR_KEY].is_string();
    }

    std::shared_ptr<const Matcher> from_descriptor(const json& value) const {
        if (!is_descriptor(value)) {
            throw InvalidOperationError("Value " + value.dump() + " is not a matcher descriptor.");
        }
        return construct(value[DESCRIPTOR_KEY].get<std::string>(),
                         value.contains(ARGS_KEY) ? value[ARGS_KEY] : json::array(),
                         value.contains(KWARGS_KEY) ? value[KWARGS_KEY] : json::object());
    }

    // ---- comparison ----

    /**
     * Compare `expected` with `actual`.  Descriptors in `expected` act as
     * matchers; objects need identical key sets and arrays identical sizes.
     */
    MatchResult deep_match(const json& expected, const json& actual) const {
        return match_at(expected, actual, Pointer{});
    }

private:
    std::map<std::string, Factory> factories_;

    MatchResult match_at(const json& expected, const json& actual, const Pointer& at) const {
        if (is_descriptor(expected)) {
            auto matcher = from_descriptor(expected);
            if (matcher->matches(actual)) return {};
            return { false, at.rfc(), actual.dump() + " does not match " + matcher->repr() };
        }
        if (expected.is_object()) {
            if (!actual.is_object()) {
                return { false, at.rfc(), "expected an object, got " + std::string(actual.type_name()) };
            }
            for (const auto& item : expected.items()) {
                if (!actual.contains(item.key())) {
                    return { false, at.child(item.key()).rfc(), "key is missing" };
                }
                MatchResult r = match_at(item.value(), actual[item.key()], at.child(item.key()));
                if (!r) return r;
            }
            for (const auto& item : actual.items()) {
                if (!expected.contains(item.key())) {
                    return { false, at.child(item.key()).rfc(), "unexpected key" };
                }
            }
            return {};
        }
        if (expected.is_array()) {
            if (!actual.is_array()) {
                return { false, at.rfc(), "expected an array, got " + std::string(actual.type_name()) };
            }
            if (expected.size() != actual.size()) {
                return { false, at.rfc(), "expected " + std::to_string(expected.size())
                                          + " element(s), got " + std::to_string(actual.size()) };
            }
            for (std::size_t i = 0; i < expected.size(); ++i) {
                MatchResult r = match_at(expected[i], actual[i], at.child(i));
                if (!r) return r;
            }
            return {};
        }
        if (expected != actual) {
            return { false, at.rfc(), actual.dump() + " != " + expected.dump() };
        }
        return {};
    }
};

namespace matchers {

/** Named argument `name`, else positional argument `index`, else null. */
inline json argument(const json& args, const json& kwargs, const char* name, std::size_t index) {
    if (kwargs.contains(name)) return kwargs[name];
    return index < args.size() ? args[index] : json();
}

inline json require_number(const json& args, const json& kwargs, const char* matcher,
                           const char* name = "number", std::size_t index = 0) {
    json number = argument(args, kwargs, name, index);
    if (!number.is_number()) {
        throw InvalidOperationError(std::string(matcher) + " initialized with invalid \"" + name
                                    + "\" parameter: " + number.dump());
    }
    return number;
}

inline std::string require_text(const json& args, const json& kwargs, const char* matcher,
                                const char* name, std::size_t index) {
    json text = argument(args, kwargs, name, index);
    if (!text.is_string()) {
        throw InvalidOperationError(std::string(matcher) + " initialized with invalid \"" + name
                                    + "\" parameter: " + text.dump());
    }
    return text.get<std::string>();
}

inline bool optional_flag(const json& args, const json& kwargs, const char* matcher,
                          const char* name, std::size_t index, bool fallback) {
    json flag = argument(args, kwargs, name, index);
    if (flag.is_null()) return fallback;
    if (!flag.is_boolean()) {
        throw InvalidOperationError(std::string(matcher) + " initialized with invalid \"" + name
                                    + "\" parameter: " + flag.dump());
    }
    return flag.get<bool>();
}

/** Non-negative list size; -1 when the argument is absent or null and not required. */
inline long list_size(const json& args, const json& kwargs, const char* matcher,
                      const char* name, std::size_t index, bool required) {
    json size = argument(args, kwargs, name, index);
    if (size.is_null() && !required) return -1;
    if (!size.is_number_integer() || size.get<long>() < 0) {
        throw InvalidOperationError(std::string(matcher) + " initialized with invalid \"" + name
                                    + "\" parameter: " + size.dump());
    }
    return size.get<long>();
}

inline std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// ---------------------------------------------------------------------------
// Dates
// ---------------------------------------------------------------------------
namespace dates {

using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

inline TimePoint now() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

// Days since 1970-01-01 in the proleptic Gregorian calendar.
inline long long days_from_civil(long long year, unsigned month, unsigned day) {
    year -= month <= 2;
    const long long era = (year >= 0 ? year : year - 399) / 400;
    const auto      yoe = static_cast<unsigned>(year - era * 400);
    const unsigned  doy = (153 * (month > 2 ? month - 3 : month + 9) + 2) / 5 + day - 1;
    const unsigned  doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<long long>(doe) - 719468;
}

inline unsigned days_in_month(long long year, unsigned month) {
    static const unsigned days[] = { 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31 };
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return month == 2 && leap ? 29 : days[month - 1];
}

/**
 * Parse "YYYY-MM-DD", optionally followed by "THH:MM[:SS[.ffffff]]" and a
 * "Z" or "+HH:MM" offset.  A time without an offset is taken as UTC.
 */
inline std::optional<TimePoint> parse_iso(const std::string& text) {
    static const std::regex iso(
        R"(^(\d{4})-(\d{2})-(\d{2})(?:[T ](\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{1,6}))?)?(Z|[+-]\d{2}:?\d{2})?)?$)");
    std::smatch m;
    if (!std::regex_match(text, m, iso)) return std::nullopt;

    auto field = [&m](std::size_t i) { return m[i].matched ? std::stol(m[i].str()) : 0L; };
    const long year = field(1), month = field(2), day = field(3);
    const long hour = field(4), minute = field(5), second = field(6);
    if (month < 1 || month > 12 || day < 1
        || day > static_cast<long>(days_in_month(year, static_cast<unsigned>(month)))
        || hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }

    long long micros = 0;
    if (m[7].matched) {
        std::string fraction = m[7].str();
        fraction.resize(6, '0');
        micros = std::stoll(fraction);
    }

    long long offset_minutes = 0;
    if (m[8].matched && m[8].str() != "Z") {
        const std::string zone = m[8].str();
        const long zone_hours   = std::stol(zone.substr(1, 2));
        const long zone_minutes = std::stol(zone.substr(zone.size() - 2));
        if (zone_hours > 23 || zone_minutes > 59) return std::nullopt;
        offset_minutes = (zone[0] == '-' ? -1 : 1) * (zone_hours * 60 + zone_minutes);
    }

    const long long seconds = days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * 86400
                            + hour * 3600 + minute * 60 + second - offset_minutes * 60;
    return TimePoint(std::chrono::microseconds(seconds * 1000000 + micros));
}

/** "now", an offset from `reference` such as "+2d" or "-1.5h", or an ISO date. */
inline std::optional<TimePoint> resolve(const std::string& expression, TimePoint reference) {
    if (expression == "now") return reference;

    static const std::regex offset(R"(^([+-])(\d+\.?\d*)(ms|us|y|w|d|h|m|s)$)");
    std::smatch m;
    if (!std::regex_match(expression, m, offset)) return parse_iso(expression);

    static const std::map<std::string, double> unit_micros{
        { "y", 365 * 86400e6 }, { "w", 7 * 86400e6 }, { "d", 86400e6 }, { "h", 3600e6 },
        { "m", 60e6 }, { "s", 1e6 }, { "ms", 1e3 }, { "us", 1.0 } };
    double amount = std::stod(m[2].str()) * unit_micros.at(m[3].str());
    if (m[1].str() == "-") amount = -amount;
    return reference + std::chrono::microseconds(std::llround(amount));
}

inline std::string require_expression(const json& args, const json& kwargs, const char* matcher,
                                      const char* name, std::size_t index, const char* fallback) {
    json date = argument(args, kwargs, name, index);
    if (date.is_null() && fallback) date = fallback;
    if (!date.is_string() || !resolve(date.get<std::string>(), now())) {
        throw InvalidOperationError(std::string(matcher) + " initialized with invalid \"" + name
                                    + "\" parameter: " + date.dump());
    }
    return date.get<std::string>();
}

} // namespace dates

// ---------------------------------------------------------------------------
// Generic and text
// ---------------------------------------------------------------------------
class Anything : public Matcher {
public:
    bool matches(const json& value) const override { return !value.is_null(); }
    std::string repr() const override { return "<Any>"; }
};

class AnyText : public Matcher {
public:
    bool matches(const json& value) const override { return value.is_string(); }
    std::string repr() const override { return "<Any Text>"; }
};

class AnyTextLike : public Matcher {
public:
    explicit AnyTextLike(const std::string& pattern, bool case_sensitive = false)
        : pattern_(pattern)
        , regex_(pattern, case_sensitive ? std::regex::ECMAScript : std::regex::ECMAScript | std::regex::icase)
    {
    }

    bool matches(const json& value) const override {
        return value.is_string() && std::regex_search(value.get_ref<const std::string&>(), regex_);
    }

    std::string repr() const override { return "<Any Text Like \"" + pattern_ + "\">"; }

private:
    std::string pattern_;
    std::regex  regex_;
};

/** Text containing `substring`; case-insensitive unless asked otherwise. */
class AnyTextWith : public Matcher {
public:
    AnyTextWith(std::string substring, bool case_sensitive)
        : substring_(std::move(substring))
        , case_sensitive_(case_sensitive)
    {
    }

    bool matches(const json& value) const override {
        if (!value.is_string()) return false;
        const auto& text = value.get_ref<const std::string&>();
        if (case_sensitive_) return text.find(substring_) != std::string::npos;
        return lowercase(text).find(lowercase(substring_)) != std::string::npos;
    }

    std::string repr() const override { return "<Any Text With \"" + substring_ + "\">"; }

private:
    std::string substring_;
    bool        case_sensitive_;
};

// ---------------------------------------------------------------------------
// Numbers and bools
// ---------------------------------------------------------------------------
class AnyNumber : public Matcher {
public:
    bool matches(const json& value) const override { return value.is_number(); }
    std::string repr() const override { return "<Any Number>"; }
};

class AnyNumberGreaterThan : public Matcher {
public:
    explicit AnyNumberGreaterThan(double number) : number_(number) {}

    bool matches(const json& value) const override {
        return value.is_number() && value.get<double>() > number_;
    }

    std::string repr() const override { return "<Any Number Greater Than (" + json(number_).dump() + ")>"; }

private:
    double number_;
};

class AnyNumberLessThan : public Matcher {
public:
    explicit AnyNumberLessThan(double number) : number_(number) {}

    bool matches(const json& value) const override {
        return value.is_number() && value.get<double>() < number_;
    }

    std::string repr() const override { return "<Any Number Less Than (" + json(number_).dump() + ")>"; }

private:
    double number_;
};

/** Number within [min, max], both ends inclusive. */
class AnyNumberInRange : public Matcher {
public:
    AnyNumberInRange(json min, json max)
        : min_(std::move(min))
        , max_(std::move(max))
    {
        if (min_.get<double>() > max_.get<double>()) {
            throw InvalidOperationError("Invalid matcher range limits! \"min_number\" must not exceed \"max_number\", but "
                                        + min_.dump() + " > " + max_.dump() + " was given.");
        }
    }

    bool matches(const json& value) const override {
        if (!value.is_number()) return false;
        const double number = value.get<double>();
        return min_.get<double>() <= number && number <= max_.get<double>();
    }

    std::string repr() const override {
        return "<Any Number In Range from " + min_.dump() + " to " + max_.dump() + ">";
    }

private:
    json min_;
    json max_;
};

class AnyBool : public Matcher {
public:
    bool matches(const json& value) const override { return value.is_boolean(); }
    std::string repr() const override { return "<Any Bool>"; }
};

// ---------------------------------------------------------------------------
// Dicts
// ---------------------------------------------------------------------------
class AnyDict : public Matcher {
public:
    bool matches(const json& value) const override { return value.is_object(); }
    std::string repr() const override { return "<Any Dict>"; }
};

class AnyNonEmptyDict : public Matcher {
public:
    bool matches(const json& value) const override { return value.is_object() && !value.empty(); }
    std::string repr() const override { return "<Any Non-Empty Dict>"; }
};

// ---------------------------------------------------------------------------
// Lists
// ---------------------------------------------------------------------------
class AnyList : public Matcher {
public:
    bool matches(const json& value) const override { return value.is_array(); }
    std::string repr() const override { return "<Any List>"; }
};

/**
 * Array whose size satisfies a rule and whose items all deep_match() an
 * expected tree.  The matcher owns a copy of the registry it was built
 * from, so it stays usable after that registry is gone.
 */
class ListMatcher : public Matcher {
public:
    enum class Size { any, equal, greater, less, between };

    bool matches(const json& value) const override {
        if (!value.is_array()) return false;
        const auto count = static_cast<long>(value.size());
        switch (rule_) {
            case Size::any:     break;
            case Size::equal:   if (count != low_) return false; break;
            case Size::greater: if (count <= low_) return false; break;
            case Size::less:    if (count >= low_) return false; break;
            case Size::between: if (count < low_ || count > high_) return false; break;
        }
        if (!has_item_) return true;
        for (const auto& element : value) {
            if (!registry_->deep_match(item_, element)) return false;
        }
        return true;
    }

protected:
    ListMatcher(std::shared_ptr<const MatcherRegistry> registry, std::optional<json> item,
                Size rule, long low, long high = 0)
        : registry_(std::move(registry))
        , has_item_(item.has_value())
        , item_(item ? std::move(*item) : json())
        , rule_(rule)
        , low_(low)
        , high_(high)
    {
        // Unknown matcher names fail here rather than on the first match.
        if (has_item_ && MatcherRegistry::is_descriptor(item_)) {
            registry_->from_descriptor(item_);
        }
    }

    std::string item_repr() const {
        return MatcherRegistry::is_descriptor(item_) ? registry_->from_descriptor(item_)->repr() : item_.dump();
    }

    std::shared_ptr<const MatcherRegistry> registry_;
    bool                                   has_item_;
    json                                   item_;
    Size                                   rule_;
    long                                   low_;
    long                                   high_;
};

/** Array, optionally of an exact size, optionally with every item matching `item`. */
class AnyListOf : public ListMatcher {
public:
    AnyListOf(std::shared_ptr<const MatcherRegistry> registry, std::optional<json> item, long size)
        : AnyListOf(std::move(registry), std::move(item), size, size < 0 ? Size::any : Size::equal, "Any List Of")
    {
    }

    std::string repr() const override {
        std::string out = "<" + title_;
        if (rule_ != Size::any) out += " " + std::to_string(low_) + " item(s)";
        if (has_item_) out += (rule_ != Size::any ? " of " : " ") + item_repr();
        return out + ">";
    }

protected:
    AnyListOf(std::shared_ptr<const MatcherRegistry> registry, std::optional<json> item, long size,
              Size rule, std::string title)
        : ListMatcher(std::move(registry), std::move(item), rule, size)
        , title_(std::move(title))
    {
    }

private:
    std::string title_;
};

class AnyListLongerThan : public AnyListOf {
public:
    AnyListLongerThan(std::shared_ptr<const MatcherRegistry> registry, std::optional<json> item, long size)
        : AnyListOf(std::move(registry), std::move(item), size, Size::greater, "Any List Longer Than")
    {
    }
};

class AnyListShorterThan : public AnyListOf {
public:
    AnyListShorterThan(std::shared_ptr<const MatcherRegistry> registry, std::optional<json> item, long size)
        : AnyListOf(std::move(registry), std::move(item), size, Size::less, "Any List Shorter Than")
    {
    }
};

/** Array of min_size..max_size items (inclusive), optionally matching `item`. */
class AnyListOfRange : public ListMatcher {
public:
    AnyListOfRange(std::shared_ptr<const MatcherRegistry> registry, std::optional<json> item,
                   long min_size, long max_size)
        : ListMatcher(std::move(registry), std::move(item), Size::between, min_size, max_size)
    {
        if (min_size >= max_size) {
            throw InvalidOperationError("Invalid matcher range limits! \"min_size\" must be less than \"max_size\", but "
                                        + std::to_string(min_size) + " >= " + std::to_string(max_size)
                                        + " was given.");
        }
    }

    std::string repr() const override {
        std::string out = "<Any List Of Range of " + std::to_string(low_) + " to " + std::to_string(high_) + " items";
        if (has_item_) out += " of " + item_repr();
        return out + ">";
    }
};

/** Array whose every item matches `matcher` (a descriptor or a plain value). */
class AnyListOfMatchers : public ListMatcher {
public:
    AnyListOfMatchers(std::shared_ptr<const MatcherRegistry> registry, json matcher, long size)
        : ListMatcher(std::move(registry), std::move(matcher), size < 0 ? Size::any : Size::equal, size)
    {
    }

    std::string repr() const override {
        return "<Any List Of Matchers (" + item_repr() + ") of "
             + (rule_ == Size::any ? std::string("any number") : std::to_string(low_)) + " item(s)>";
    }

protected:
    AnyListOfMatchers(std::shared_ptr<const MatcherRegistry> registry, json matcher, long size, Size rule)
        : ListMatcher(std::move(registry), std::move(matcher), size < 0 ? Size::any : rule, size)
    {
    }
};

class AnyListOfMatchersLongerThan : public AnyListOfMatchers {
public:
    AnyListOfMatchersLongerThan(std::shared_ptr<const MatcherRegistry> registry, json matcher, long size)
        : AnyListOfMatchers(std::move(registry), std::move(matcher), size, Size::greater)
    {
    }
};

class AnyListOfMatchersShorterThan : public AnyListOfMatchers {
public:
    AnyListOfMatchersShorterThan(std::shared_ptr<const MatcherRegistry> registry, json matcher, long size)
        : AnyListOfMatchers(std::move(registry), std::move(matcher), size, Size::less)
    {
    }
};

// ---------------------------------------------------------------------------
// Dates (ISO 8601 strings)
// ---------------------------------------------------------------------------
class AnyDate : public Matcher {
public:
    bool matches(const json& value) const override {
        return value.is_string() && dates::parse_iso(value.get_ref<const std::string&>()).has_value();
    }
    std::string repr() const override { return "<Any Date>"; }
};

/** Date strictly before `date`; "now" and offsets are evaluated on every match. */
class AnyDateBefore : public Matcher {
public:
    explicit AnyDateBefore(std::string date) : date_(std::move(date)) {}

    bool matches(const json& value) const override {
        if (!value.is_string()) return false;
        auto actual = dates::parse_iso(value.get_ref<const std::string&>());
        auto limit  = dates::resolve(date_, dates::now());
        return actual && limit && *actual < *limit;
    }

    std::string repr() const override { return "<Any Date Before " + date_ + ">"; }

private:
    std::string date_;
};

class AnyDateAfter : public Matcher {
public:
    explicit AnyDateAfter(std::string date) : date_(std::move(date)) {}

    bool matches(const json& value) const override {
        if (!value.is_string()) return false;
        auto actual = dates::parse_iso(value.get_ref<const std::string&>());
        auto limit  = dates::resolve(date_, dates::now());
        return actual && limit && *actual > *limit;
    }

    std::string repr() const override { return "<Any Date After " + date_ + ">"; }

private:
    std::string date_;
};

/** Date within [date_from, date_to], both ends inclusive. */
class AnyDateInRange : public Matcher {
public:
    AnyDateInRange(std::string date_from, std::string date_to)
        : from_(std::move(date_from))
        , to_(std::move(date_to))
    {
        const auto reference = dates::now();
        auto from = dates::resolve(from_, reference);
        auto to   = dates::resolve(to_, reference);
        if (!from || !to) {
            throw InvalidOperationError("AnyDateInRange initialized with invalid limits: \"" + from_ + "\", \"" + to_ + "\"");
        }
        if (*from > *to) {
            throw InvalidOperationError("Invalid matcher range limits! \"date_from\" must be less than \"date_to\", "
                                        "but given " + from_ + " > " + to_ + "!");
        }
    }

    bool matches(const json& value) const override {
        if (!value.is_string()) return false;
        auto actual = dates::parse_iso(value.get_ref<const std::string&>());
        if (!actual) return false;
        const auto reference = dates::now();
        auto from = dates::resolve(from_, reference);
        auto to   = dates::resolve(to_, reference);
        return from && to && *from <= *actual && *actual <= *to;
    }

    std::string repr() const override { return "<Any Date In Range between " + from_ + " and " + to_ + ">"; }

private:
    std::string from_;
    std::string to_;
};

} // namespace matchers

inline void MatcherRegistry::add_builtins() {
    using namespace matchers;

    // Registries handed to list matchers are snapshots of this one.
    auto snapshot = [](const MatcherRegistry& registry) {
        return std::make_shared<const MatcherRegistry>(registry);
    };
    auto optional_item = [](const json& args, const json& kwargs, std::size_t index) -> std::optional<json> {
        if (kwargs.contains("item")) return kwargs["item"];
        if (index < args.size() && !args[index].is_null()) return args[index];
        return std::nullopt;
    };
    auto require_matcher = [](const json& args, const json& kwargs, const char* matcher) {
        if (!kwargs.contains("matcher") && args.empty()) {
            throw InvalidOperationError(std::string(matcher) + " requires a \"matcher\" parameter.");
        }
        return argument(args, kwargs, "matcher", 0);
    };

    add("Anything", [](const json&, const json&, const MatcherRegistry&) {
        return std::make_shared<const Anything>();
    });

    add("AnyText", [](const json&, const json&, const MatcherRegistry&) {
        return std::make_shared<const AnyText>();
    });
    add("AnyTextLike", [](const json& args, const json& kwargs, const MatcherRegistry&) {
        const std::string pattern = require_text(args, kwargs, "AnyTextLike", "pattern", 0);
        const bool case_sensitive = optional_flag(args, kwargs, "AnyTextLike", "case_sensitive", 1, false);
        try {
            return std::make_shared<const AnyTextLike>(pattern, case_sensitive);
        } catch (const std::regex_error& err) {
            throw InvalidOperationError("AnyTextLike pattern " + json(pattern).dump() + " is invalid: " + err.what());
        }
    });
    add("AnyTextWith", [](const json& args, const json& kwargs, const MatcherRegistry&) {
        return std::make_shared<const AnyTextWith>(
            require_text(args, kwargs, "AnyTextWith", "substring", 0),
            optional_flag(args, kwargs, "AnyTextWith", "case_sensitive", 1, false));
    });

    add("AnyNumber", [](const json&, const json&, const MatcherRegistry&) {
        return std::make_shared<const AnyNumber>();
    });
    add("AnyNumberGreaterThan", [](const json& args, const json& kwargs, const MatcherRegistry&) {
        return std::make_shared<const AnyNumberGreaterThan>(
            require_number(args, kwargs, "AnyNumberGreaterThan").get<double>());
    });
    add("AnyNumberLessThan", [](const json& args, const json& kwargs, const MatcherRegistry&) {
        return std::make_shared<const AnyNumberLessThan>(
            require_number(args, kwargs, "AnyNumberLessThan").get<double>());
    });
    add("AnyNumberInRange", [](const json& args, const json& kwargs, const MatcherRegistry&) {
        return std::make_shared<const AnyNumberInRange>(
            require_number(args, kwargs, "AnyNumberInRange", "min_number", 0),
            require_number(args, kwargs, "AnyNumberInRange", "max_number", 1));
    });

    add("AnyBool", [](const json&, const json&, const MatcherRegistry&) {
        return std::make_shared<const AnyBool>();
    });

    add("AnyDict", [](const json&, const json&, const MatcherRegistry&) {
        return std::make_shared<const AnyDict>();
    });
    add("AnyNonEmptyDict", [](const json&, const json&, const MatcherRegistry&) {
        return std::make_shared<const AnyNonEmptyDict>();
    });

    add("AnyList", [](const json&, const json&, const MatcherRegistry&) {
        return std::make_shared<const AnyList>();
    });
    add("AnyListOf", [=](const json& args, const json& kwargs, const MatcherRegistry& registry) {
        return std::make_shared<const AnyListOf>(
            snapshot(registry), optional_item(args, kwargs, 1),
            list_size(args, kwargs, "AnyListOf", "size", 0, false));
    });
    add("AnyListLongerThan", [=](const json& args, const json& kwargs, const MatcherRegistry& registry) {
        return std::make_shared<const AnyListLongerThan>(
            snapshot(registry), optional_item(args, kwargs, 1),
            list_size(args, kwargs, "AnyListLongerThan", "size", 0, true));
    });
    add("AnyListShorterThan", [=](const json& args, const json& kwargs, const MatcherRegistry& registry) {
        return std::make_shared<const AnyListShorterThan>(
            snapshot(registry), optional_item(args, kwargs, 1),
            list_size(args, kwargs, "AnyListShorterThan", "size", 0, true));
    });
    add("AnyListOfRange", [=](const json& args, const json& kwargs, const MatcherRegistry& registry) {
        return std::make_shared<const AnyListOfRange>(
            snapshot(registry), optional_item(args, kwargs, 2),
            list_size(args, kwargs, "AnyListOfRange", "min_size", 0, true),
            list_size(args, kwargs, "AnyListOfRange", "max_size", 1, true));
    });
    add("AnyListOfMatchers", [=](const json& args, const json& kwargs, const MatcherRegistry& registry) {
        return std::make_shared<const AnyListOfMatchers>(
            snapshot(registry), require_matcher(args, kwargs, "AnyListOfMatchers"),
            list_size(args, kwargs, "AnyListOfMatchers", "size", 1, false));
    });
    add("AnyListOfMatchersLongerThan", [=](const json& args, const json& kwargs, const MatcherRegistry& registry) {
        return std::make_shared<const AnyListOfMatchersLongerThan>(
            snapshot(registry), require_matcher(args, kwargs, "AnyListOfMatchersLongerThan"),
            list_size(args, kwargs, "AnyListOfMatchersLongerThan", "size", 1, true));
    });
    add("AnyListOfMatchersShorterThan", [=](const json& args, const json& kwargs, const MatcherRegistry& registry) {
        return std::make_shared<const AnyListOfMatchersShorterThan>(
            snapshot(registry), require_matcher(args, kwargs, "AnyListOfMatchersShorterThan"),
            list_size(args, kwargs, "AnyListOfMatchersShorterThan", "size", 1, true));
    });

    add("AnyDate", [](const json&, const json&, const MatcherRegistry&) {
        return std::make_shared<const AnyDate>();
    });
    add("AnyDateBefore", [](const json& args, const json& kwargs, const MatcherRegistry&) {
        return std::make_shared<const AnyDateBefore>(
            dates::require_expression(args, kwargs, "AnyDateBefore", "date", 0, "now"));
    });
    add("AnyDateAfter", [](const json& args, const json& kwargs, const MatcherRegistry&) {
        return std::make_shared<const AnyDateAfter>(
            dates::require_expression(args, kwargs, "AnyDateAfter", "date", 0, "now"));
    });
    add("AnyDateInRange", [](const json& args, const json& kwargs, const MatcherRegistry&) {
        return std::make_shared<const AnyDateInRange>(
            dates::require_expression(args, kwargs, "AnyDateInRange", "date_from", 0, nullptr),
            dates::require_expression(args, kwargs, "AnyDateInRange", "date_to", 1, nullptr));
    });
}

} // namespace jcomp
