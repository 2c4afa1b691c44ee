// Validates a shipment document read from a file (or stdin) and prints the
// outcome. Usage: validate_document [--yaml] [--schema] [path]
// VERITY_CATALOG may name a message catalog used to localize rule failures.

#include "verity/core/config.hpp"
#include "verity/core/descriptor.hpp"
#include "verity/core/localization.hpp"
#include "verity/core/log.hpp"
#include "verity/core/pipeline.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace verity;

struct parcel {
    std::string label;
    double weight_kg = 0;
};

struct shipment {
    std::string id;
    std::string destination;
    std::optional<std::string> contact;
    std::vector<parcel> parcels;
    std::map<std::string, std::string> tags;
};

namespace verity {

template <> struct validation_traits<parcel> {
    static const type_descriptor<parcel>& describe() {
        static const auto d = type_descriptor<parcel>("parcel")
                                  .field("label", &parcel::label, rules<std::string>().min_length(1).max_length(32))
                                  .field("weight_kg", &parcel::weight_kg,
                                         rules<double>().exclusive_minimum(0).maximum(70))
                                  .rename("weightKg");
        return d;
    }
};

template <> struct validation_traits<shipment> {
    static const type_descriptor<shipment>& describe() {
        static const auto d =
            type_descriptor<shipment>("shipment")
                .field("id", &shipment::id, rules<std::string>().pattern("^SH-[0-9]{6}$"))
                .field("destination", &shipment::destination,
                       rules<std::string>().enumerate({"NO", "SE", "DK", "FI"}))
                .field("contact", &shipment::contact, rules<std::string>().pattern(".+@.+"))
                .field("parcels", &shipment::parcels, rules<std::vector<parcel>>().min_items(1).max_items(20))
                .field("tags", &shipment::tags, rules<std::map<std::string, std::string>>().max_properties(8))
                .rule([](const shipment& s) -> std::optional<constraint_error> {
                    double total = 0;
                    for (const auto& p : s.parcels) {
                        total += p.weight_kg;
                    }
                    if (total > 500) {
                        return custom_error("total weight must not exceed {cap} kg.", "shipment_overweight",
                                            {{"cap", "500"}});
                    }
                    return std::nullopt;
                });
        return d;
    }
};

} // namespace verity

static std::optional<std::string> read_input(const char* path) {
    if (!path) {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

static std::optional<ftl_catalog> load_catalog() {
    const char* path = std::getenv("VERITY_CATALOG");
    if (!path) {
        return std::nullopt;
    }
    auto source = read_input(path);
    if (!source) {
        log(log_level::warn, "example", std::string("cannot read catalog ") + path);
        return std::nullopt;
    }
    auto catalog = ftl_catalog::parse(*source);
    if (!catalog) {
        log(log_level::warn, "example", std::string(path) + ": " + catalog.error().message());
        return std::nullopt;
    }
    return std::move(*catalog);
}

int main(int argc, char** argv) {
    const auto options = pipeline_options::from_env();
    set_log_level(options.level);

    input_format format = input_format::json;
    const char* path = nullptr;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--yaml") {
            format = input_format::yaml;
        } else if (arg == "--schema") {
            std::cout << to_string(generate_schema<shipment>(schema_detail::full)) << "\n";
            return 0;
        } else {
            path = argv[i];
        }
    }

    auto input = read_input(path);
    if (!input) {
        std::cerr << "cannot read " << path << "\n";
        return 2;
    }

    auto shipped = decode_and_validate<shipment>(*input, options, schema_cache::global(), format);
    if (shipped) {
        std::cout << "ok: " << shipped->id << " with " << shipped->parcels.size() << " parcel(s)\n";
        return 0;
    }

    const auto& err = shipped.error();
    if (err.errors()) {
        if (auto catalog = load_catalog()) {
            std::cout << to_string(translate(*err.errors(), *catalog)) << "\n";
            return 1;
        }
    }
    std::cout << err.to_string() << "\n";
    if (!err.detail().empty()) {
        log(log_level::info, "example", err.detail());
    }
    return 1;
}
