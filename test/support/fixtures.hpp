#pragma once

#include "verity/core/descriptor.hpp"
#include "verity/core/log.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace verity::test_support {

struct bounded {
    int val = 0;
};

struct ranged {
    int64_t n = 0;
};

struct tag_list {
    std::vector<std::string> items;
};

struct address {
    std::string city;
    std::string zip;
};

struct profile {
    std::string name;
    uint8_t age = 0;
    std::optional<std::string> email;
    std::vector<std::optional<address>> addresses;
    std::map<std::string, int> scores;
};

struct date_range {
    int start = 0;
    int end = 0;
};

struct amount {
    int cents = 0;
};

struct order {
    std::string sku;
    amount price;
    std::vector<amount> discounts;
};

struct strict_point {
    int x = 0;
    int y = 0;
};

struct counter {
    int64_t count = 0;
};

// Captures log lines for the duration of a test.
class log_capture {
public:
    explicit log_capture(log_level level = log_level::debug) : previous_(current_log_level()) {
        set_log_level(level);
        set_log_sink([this](log_level lvl, std::string_view component, std::string_view message) {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.push_back(line{lvl, std::string(component), std::string(message)});
        });
    }

    ~log_capture() {
        set_log_sink({});
        set_log_level(previous_);
    }

    log_capture(const log_capture&) = delete;
    log_capture& operator=(const log_capture&) = delete;

    struct line {
        log_level level;
        std::string component;
        std::string message;
    };

    [[nodiscard]] const std::vector<line>& lines() const noexcept { return lines_; }

    [[nodiscard]] size_t count(log_level level) const {
        size_t n = 0;
        for (const auto& l : lines_) {
            if (l.level == level) {
                ++n;
            }
        }
        return n;
    }

private:
    log_level previous_;
    std::mutex mutex_;
    std::vector<line> lines_;
};

} // namespace verity::test_support

namespace verity {

template <> struct validation_traits<test_support::bounded> {
    static const type_descriptor<test_support::bounded>& describe() {
        using test_support::bounded;
        static const auto d = type_descriptor<bounded>("bounded").field(
            "val", &bounded::val, rules<int>().minimum(0).maximum(1000));
        return d;
    }
};

template <> struct validation_traits<test_support::ranged> {
    static const type_descriptor<test_support::ranged>& describe() {
        using test_support::ranged;
        static const auto d = type_descriptor<ranged>("ranged").field(
            "n", &ranged::n, rules<int64_t>().minimum(0).maximum(2000));
        return d;
    }
};

template <> struct validation_traits<test_support::tag_list> {
    static const type_descriptor<test_support::tag_list>& describe() {
        using test_support::tag_list;
        static const auto d = type_descriptor<tag_list>("tag_list").field(
            "items", &tag_list::items,
            rules<std::vector<std::string>>().unique_items().items(rules<std::string>().min_length(1)));
        return d;
    }
};

template <> struct validation_traits<test_support::address> {
    static const type_descriptor<test_support::address>& describe() {
        using test_support::address;
        static const auto d = type_descriptor<address>("address")
                                  .field("city", &address::city, rules<std::string>().min_length(1))
                                  .field("zip", &address::zip, rules<std::string>().pattern("[0-9]{5}"));
        return d;
    }
};

template <> struct validation_traits<test_support::profile> {
    static const type_descriptor<test_support::profile>& describe() {
        using test_support::address;
        using test_support::profile;
        static const auto d =
            type_descriptor<profile>("profile")
                .field("name", &profile::name, rules<std::string>().min_length(1).max_length(8))
                .rename("userName")
                .field("age", &profile::age, rules<uint8_t>().maximum(150))
                .field("email", &profile::email, rules<std::string>().pattern(".+@.+"))
                .field("addresses", &profile::addresses,
                       rules<std::vector<std::optional<address>>>().max_items(3))
                .field("scores", &profile::scores,
                       rules<std::map<std::string, int>>().max_properties(3).values(
                           rules<int>().minimum(0)));
        return d;
    }
};

template <> struct validation_traits<test_support::date_range> {
    static const type_descriptor<test_support::date_range>& describe() {
        using test_support::date_range;
        static const auto d =
            type_descriptor<date_range>("date_range")
                .field("start", &date_range::start, rules<int>().minimum(0))
                .field("end", &date_range::end)
                .rule([](const date_range& r) -> std::optional<constraint_error> {
                    if (r.start > r.end) {
                        return custom_error("start must not be after end.", "date_range_order");
                    }
                    return std::nullopt;
                });
        return d;
    }
};

template <> struct validation_traits<test_support::amount> {
    static const type_descriptor<test_support::amount>& describe() {
        using test_support::amount;
        static const auto d = type_descriptor<amount>::newtype(
            "amount", &amount::cents, rules<int>().minimum(0).multiple_of(5));
        return d;
    }
};

template <> struct validation_traits<test_support::order> {
    static const type_descriptor<test_support::order>& describe() {
        using test_support::amount;
        using test_support::order;
        static const auto d =
            type_descriptor<order>("order")
                .field("sku", &order::sku, rules<std::string>().pattern("^[A-Z]{3}-[0-9]+$"))
                .field("price", &order::price)
                .field("discounts", &order::discounts, rules<std::vector<amount>>().max_items(2));
        return d;
    }
};

template <> struct validation_traits<test_support::strict_point> {
    static const type_descriptor<test_support::strict_point>& describe() {
        using test_support::strict_point;
        static const auto d = type_descriptor<strict_point>("strict_point")
                                  .field("x", &strict_point::x)
                                  .field("y", &strict_point::y)
                                  .deny_unknown_fields();
        return d;
    }
};

template <> struct validation_traits<test_support::counter> {
    static const type_descriptor<test_support::counter>& describe() {
        using test_support::counter;
        static const auto d = type_descriptor<counter>("counter").field("count", &counter::count);
        return d;
    }
};

} // namespace verity
